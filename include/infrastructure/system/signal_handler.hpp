// EN: Signal Handler for Forgeline - SIGINT/SIGTERM cancel in-flight runs through named cleanup callbacks
// FR: Gestionnaire de signaux pour Forgeline - SIGINT/SIGTERM annulent les exécutions via des callbacks nommés

#pragma once

#include <signal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace FGL {

using CleanupCallback = std::function<void()>;

struct SignalHandlerConfig {
    // EN: Budget for the whole callback sequence; callbacks not started by then are skipped
    // FR: Budget de toute la séquence de callbacks; ceux non démarrés à temps sont sautés
    std::chrono::milliseconds shutdown_timeout{5000};
    bool log_signal_details{true};
};

struct SignalHandlerStats {
    std::chrono::system_clock::time_point created_at;
    size_t signals_received{0};
    size_t cleanup_callbacks_registered{0};
    size_t successful_shutdowns{0};
    size_t failed_callbacks{0};
    std::chrono::milliseconds last_shutdown_duration{0};
    std::unordered_map<int, size_t> signal_counts;
};

// EN: The installed handler only writes the signal number to a self-pipe. A watcher thread reads
// the pipe and runs the cleanup callbacks in name order, once per shutdown.
// FR: Le handler installé écrit seulement le numéro du signal dans un self-pipe. Un thread de
// surveillance lit le pipe et exécute les callbacks par ordre de nom, une fois par arrêt.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    void configure(const SignalHandlerConfig& config);

    // EN: Installs SIGINT/SIGTERM handlers and starts the watcher. Throws std::system_error on failure.
    // FR: Installe les handlers SIGINT/SIGTERM et démarre le watcher. Lance std::system_error en cas d'échec.
    void initialize();

    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Runs the shutdown sequence on the calling thread as if signal_number had arrived
    // FR: Exécute la séquence d'arrêt sur le thread appelant comme si signal_number était reçu
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const { return shutdown_requested_.load(); }
    bool isShuttingDown() const { return shutting_down_.load(); }
    bool waitForShutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    SignalHandlerStats getStats() const;

    // EN: Forget callbacks, statistics and shutdown state. Installed handlers stay in place.
    // FR: Oublie callbacks, statistiques et état d'arrêt. Les handlers installés restent en place.
    void reset();

    void setEnabled(bool enabled) { enabled_ = enabled; }

    ~SignalHandler();

private:
    SignalHandler();
    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    static void onSignal(int signal_number);
    static std::string signalName(int signal_number);

    void watchPipe();
    void handleSignal(int signal_number);
    void runCleanupCallbacks();

    mutable std::mutex mutex_;
    std::condition_variable shutdown_done_;
    SignalHandlerConfig config_;
    SignalHandlerStats stats_;
    std::map<std::string, CleanupCallback> cleanup_callbacks_;
    bool shutdown_complete_{false};

    std::atomic<bool> initialized_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutting_down_{false};

    int pipe_read_fd_{-1};
    int pipe_write_fd_{-1};
    struct sigaction previous_sigint_{};
    struct sigaction previous_sigterm_{};
    std::thread watcher_thread_;

    // EN: Write end used from signal context
    // FR: Extrémité d'écriture utilisée en contexte de signal
    static volatile std::sig_atomic_t signal_pipe_fd_;
};

} // namespace FGL
