// EN: Run number allocator implementation - persistent counter file guarded by flock
// FR: Implémentation de l'allocateur de numéros - fichier compteur persistant protégé par flock

#include "orchestrator/pipeline_engine.hpp"
#include "core/errors.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace FGL {
namespace Orchestrator {

namespace {

// EN: File descriptor closed (and its flock released) on scope exit
// FR: Descripteur fermé (et son flock libéré) en sortie de portée
class LockedFile {
public:
    explicit LockedFile(const std::string& path) : fd_(open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
        if (fd_ < 0) {
            throw PipelineError(ErrorKind::INTERNAL, "Cannot open run counter " + path + ": " + std::strerror(errno));
        }
        while (flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                int err = errno;
                close(fd_);
                throw PipelineError(ErrorKind::INTERNAL, "Cannot lock run counter " + path + ": " + std::strerror(err));
            }
        }
    }

    ~LockedFile() {
        flock(fd_, LOCK_UN);
        close(fd_);
    }

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;

    uint64_t read() const {
        char buf[32] = {0};
        ssize_t n = pread(fd_, buf, sizeof(buf) - 1, 0);
        if (n <= 0) {
            return 0;
        }
        try {
            return std::stoull(std::string(buf, static_cast<size_t>(n)));
        } catch (const std::exception&) {
            throw PipelineError(ErrorKind::INTERNAL, "Run counter file is corrupted");
        }
    }

    void write(uint64_t value) const {
        std::string text = std::to_string(value) + "\n";
        if (ftruncate(fd_, 0) != 0 ||
            pwrite(fd_, text.data(), text.size(), 0) != static_cast<ssize_t>(text.size()) ||
            fsync(fd_) != 0) {
            throw PipelineError(ErrorKind::INTERNAL, std::string("Cannot write run counter: ") + std::strerror(errno));
        }
    }

private:
    int fd_;
};

} // namespace

RunNumberAllocator::RunNumberAllocator(std::string state_directory)
    : state_directory_(std::move(state_directory)) {
    if (!state_directory_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(state_directory_, ec);
        if (ec) {
            throw ConfigurationError("Cannot create state directory " + state_directory_ + ": " + ec.message());
        }
    }
}

std::string RunNumberAllocator::counterPath() const {
    return (std::filesystem::path(state_directory_) / "run_number").string();
}

uint64_t RunNumberAllocator::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_directory_.empty()) {
        return ++last_;
    }

    LockedFile file(counterPath());
    uint64_t value = std::max(file.read(), last_) + 1;
    file.write(value);
    last_ = value;
    return value;
}

uint64_t RunNumberAllocator::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_directory_.empty()) {
        return last_;
    }
    LockedFile file(counterPath());
    return std::max(file.read(), last_);
}

} // namespace Orchestrator
} // namespace FGL
