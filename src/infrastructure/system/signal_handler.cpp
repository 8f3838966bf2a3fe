// EN: SignalHandler - self-pipe signal delivery and ordered cleanup callbacks under a time budget.
// FR: SignalHandler - réception des signaux par self-pipe et callbacks de nettoyage ordonnés sous budget de temps.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <tuple>
#include <vector>

namespace FGL {

namespace {

// EN: Byte written by the destructor to stop the watcher; never a real signal number
// FR: Octet écrit par le destructeur pour arrêter le watcher; jamais un vrai numéro de signal
constexpr unsigned char kStopWatcher = 0;

void setFlags(int fd, int fd_flags, int status_flags) {
    if (fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | fd_flags) == -1 ||
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | status_flags) == -1) {
        throw std::system_error(errno, std::generic_category(), "fcntl on signal pipe");
    }
}

} // namespace

volatile std::sig_atomic_t SignalHandler::signal_pipe_fd_ = -1;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::SignalHandler() {
    stats_.created_at = std::chrono::system_clock::now();
}

SignalHandler::~SignalHandler() {
    if (!initialized_.load()) {
        return;
    }

    sigaction(SIGINT, &previous_sigint_, nullptr);
    sigaction(SIGTERM, &previous_sigterm_, nullptr);
    signal_pipe_fd_ = -1;

    ssize_t written;
    do {
        written = write(pipe_write_fd_, &kStopWatcher, 1);
    } while (written == -1 && errno == EINTR);

    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
    close(pipe_read_fd_);
    close(pipe_write_fd_);
}

void SignalHandler::configure(const SignalHandlerConfig& config) {
    if (shutting_down_.load()) {
        LOG_WARN("signal_handler", "Cannot configure during shutdown");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_DEBUG("signal_handler", "Signal handlers already installed");
        return;
    }
    if (!enabled_.load()) {
        LOG_WARN("signal_handler", "SignalHandler is disabled, handlers not installed");
        return;
    }

    int fds[2];
    if (pipe(fds) == -1) {
        throw std::system_error(errno, std::generic_category(), "Cannot create signal pipe");
    }
    pipe_read_fd_ = fds[0];
    pipe_write_fd_ = fds[1];
    setFlags(pipe_read_fd_, FD_CLOEXEC, 0);
    setFlags(pipe_write_fd_, FD_CLOEXEC, O_NONBLOCK);
    signal_pipe_fd_ = pipe_write_fd_;

    struct sigaction action {};
    action.sa_handler = &SignalHandler::onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &action, &previous_sigint_) == -1) {
        throw std::system_error(errno, std::generic_category(), "Cannot install SIGINT handler");
    }
    if (sigaction(SIGTERM, &action, &previous_sigterm_) == -1) {
        const int saved = errno;
        sigaction(SIGINT, &previous_sigint_, nullptr);
        throw std::system_error(saved, std::generic_category(), "Cannot install SIGTERM handler");
    }

    watcher_thread_ = std::thread(&SignalHandler::watchPipe, this);
    initialized_ = true;
    LOG_INFO("signal_handler", "SIGINT and SIGTERM will cancel running pipelines");
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    if (shutting_down_.load()) {
        LOG_WARN("signal_handler", "Cannot register cleanup callback during shutdown: " + name);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_[name] = std::move(callback);
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_.erase(name);
    stats_.cleanup_callbacks_registered = cleanup_callbacks_.size();
}

void SignalHandler::triggerShutdown(int signal_number) {
    handleSignal(signal_number);
}

bool SignalHandler::waitForShutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return shutdown_done_.wait_for(lock, timeout, [this]() { return shutdown_complete_; });
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load() && !shutdown_complete_) {
        LOG_WARN("signal_handler", "Cannot reset during shutdown");
        return;
    }

    cleanup_callbacks_.clear();
    shutdown_complete_ = false;
    shutdown_requested_ = false;
    shutting_down_ = false;
    stats_ = SignalHandlerStats{};
    stats_.created_at = std::chrono::system_clock::now();
}

void SignalHandler::onSignal(int signal_number) {
    const int saved_errno = errno;
    const int fd = signal_pipe_fd_;
    if (fd >= 0) {
        const unsigned char byte = static_cast<unsigned char>(signal_number);
        // EN: A full pipe already holds a pending wake-up
        // FR: Un pipe plein contient déjà un réveil en attente
        std::ignore = write(fd, &byte, 1);
    }
    errno = saved_errno;
}

std::string SignalHandler::signalName(int signal_number) {
    switch (signal_number) {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default:      return "signal " + std::to_string(signal_number);
    }
}

void SignalHandler::watchPipe() {
    for (;;) {
        unsigned char byte = 0;
        const ssize_t got = read(pipe_read_fd_, &byte, 1);
        if (got == -1 && errno == EINTR) {
            continue;
        }
        if (got <= 0 || byte == kStopWatcher) {
            return;
        }
        if (enabled_.load()) {
            handleSignal(byte);
        }
    }
}

void SignalHandler::handleSignal(int signal_number) {
    shutdown_requested_ = true;
    bool log_details = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.signals_received;
        ++stats_.signal_counts[signal_number];
        log_details = config_.log_signal_details;
    }

    if (shutting_down_.exchange(true)) {
        LOG_WARN("signal_handler", "Signal received during shutdown, ignoring: " + signalName(signal_number));
        return;
    }

    if (log_details) {
        LOG_INFO("signal_handler", "Received signal: " + signalName(signal_number) + " - cancelling running pipelines");
    }

    const auto started = std::chrono::steady_clock::now();
    runCleanupCallbacks();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    LOG_INFO("signal_handler", "Shutdown sequence finished in " + std::to_string(elapsed.count()) + "ms");
    Logger::getInstance().flush();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.successful_shutdowns;
        stats_.last_shutdown_duration = elapsed;
        shutdown_complete_ = true;
    }
    shutdown_done_.notify_all();
}

void SignalHandler::runCleanupCallbacks() {
    std::vector<std::pair<std::string, CleanupCallback>> pending;
    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.assign(cleanup_callbacks_.begin(), cleanup_callbacks_.end());
        deadline = std::chrono::steady_clock::now() + config_.shutdown_timeout;
    }

    for (const auto& [name, callback] : pending) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("signal_handler", "Cleanup timeout reached, skipping " + name + " and later callbacks");
            return;
        }

        try {
            callback();
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.failed_callbacks;
            }
            LOG_ERROR("signal_handler", "Cleanup callback failed: " + name + " - " + e.what());
        }
    }
}

} // namespace FGL
