// EN: POSIX process runner implementation - fork/exec with pipes, output limits and process group kill
// FR: Implémentation POSIX de l'exécuteur - fork/exec avec pipes, limites de sortie et kill du groupe

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>

extern char** environ;

namespace FGL {

namespace {

void appendLimited(std::string& dst, const char* src, ssize_t n, std::size_t limit, bool& truncated) {
    if (n <= 0) {
        return;
    }
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<std::size_t>(n)) {
        truncated = true;
    }
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// EN: Pipe pair closed on scope exit
// FR: Paire de pipes fermée en sortie de portée
struct PipePair {
    int fds[2] = {-1, -1};
    bool open() { return pipe(fds) == 0; }
    ~PipePair() { closeFd(fds[0]); closeFd(fds[1]); }
};

// EN: Drain whatever is readable without blocking; returns false once the pipe hit EOF.
// FR: Vide ce qui est lisible sans bloquer; retourne false une fois la fin du pipe atteinte.
bool drain(int& fd, std::string& dst, std::size_t limit, bool& truncated) {
    if (fd < 0) {
        return false;
    }
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            appendLimited(dst, buf, n, limit, truncated);
            continue;
        }
        if (n == 0) {
            closeFd(fd);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// EN: Write as much of the stdin payload as the pipe accepts; closes fd once everything is
// written or the child stopped reading.
// FR: Écrit autant de la charge stdin que le pipe accepte; ferme fd une fois tout écrit ou
// quand l'enfant a cessé de lire.
void feed(int& fd, const std::string& payload, std::size_t& offset) {
    while (fd >= 0 && offset < payload.size()) {
        ssize_t written = write(fd, payload.data() + offset, payload.size() - offset);
        if (written > 0) {
            offset += static_cast<std::size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        break;
    }
    closeFd(fd);
}

} // namespace

PosixProcessRunner::PosixProcessRunner() {
    // EN: A child closing stdin early must surface as EPIPE, not kill us
    // FR: Un enfant fermant stdin tôt doit donner EPIPE, pas nous tuer
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { signal(SIGPIPE, SIG_IGN); });
}

std::string PosixProcessRunner::describe(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        if (argv[i].find(' ') != std::string::npos) {
            oss << '"' << argv[i] << '"';
        } else {
            oss << argv[i];
        }
    }
    return oss.str();
}

std::string PosixProcessRunner::resolveExecutable(const std::string& program,
                                                  const std::map<std::string, std::string>& env) {
    if (program.find('/') != std::string::npos) {
        return program;
    }

    std::string path;
    auto it = env.find("PATH");
    if (it != env.end()) {
        path = it->second;
    } else if (const char* inherited = getenv("PATH")) {
        path = inherited;
    } else {
        path = "/usr/local/bin:/usr/bin:/bin";
    }

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

ProcessResult PosixProcessRunner::run(const ProcessSpec& spec, const CancellationToken& cancellation) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error_message = "empty command";
        return result;
    }

    std::string executable = resolveExecutable(spec.argv[0], spec.env);
    if (executable.empty()) {
        result.error_message = "executable not found: " + spec.argv[0];
        result.exit_code = 127;
        return result;
    }

    // EN: Everything the child needs is prepared before fork (no allocation after fork)
    // FR: Tout ce dont l'enfant a besoin est préparé avant fork (pas d'allocation après fork)
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> envs;
    if (spec.inherit_environment) {
        for (char** env = environ; env && *env; ++env) {
            std::string entry(*env);
            std::string key = entry.substr(0, entry.find('='));
            if (spec.env.find(key) == spec.env.end()) {
                envs.push_back(std::move(entry));
            }
        }
    }
    for (const auto& [key, value] : spec.env) {
        envs.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envs.size() + 1);
    for (auto& entry : envs) envp.push_back(entry.data());
    envp.push_back(nullptr);

    PipePair in_pipe, out_pipe, err_pipe;
    if (!in_pipe.open() || !out_pipe.open() || !err_pipe.open()) {
        result.error_message = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error_message = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        setsid();
        signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe.fds[0], STDIN_FILENO);
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);
        close(in_pipe.fds[0]);
        close(in_pipe.fds[1]);
        close(out_pipe.fds[0]);
        close(out_pipe.fds[1]);
        close(err_pipe.fds[0]);
        close(err_pipe.fds[1]);

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            _exit(127);
        }

        execve(executable.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    closeFd(in_pipe.fds[0]);
    closeFd(out_pipe.fds[1]);
    closeFd(err_pipe.fds[1]);

    // EN: stdin is fed from the poll loop so a child that never reads cannot outlive the timeout
    // FR: stdin est alimenté depuis la boucle de poll pour qu'un enfant qui ne lit pas respecte le timeout
    std::size_t stdin_offset = 0;
    fcntl(in_pipe.fds[1], F_SETFL, O_NONBLOCK);
    fcntl(out_pipe.fds[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe.fds[0], F_SETFL, O_NONBLOCK);
    feed(in_pipe.fds[1], spec.stdin_data, stdin_offset);

    const bool has_timeout = spec.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    int status = 0;
    bool exited = false;

    while (!exited) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (out_pipe.fds[0] >= 0) fds[nfds++] = {out_pipe.fds[0], POLLIN, 0};
        if (err_pipe.fds[0] >= 0) fds[nfds++] = {err_pipe.fds[0], POLLIN, 0};
        if (in_pipe.fds[1] >= 0) fds[nfds++] = {in_pipe.fds[1], POLLOUT, 0};
        if (nfds > 0) {
            poll(fds, nfds, 20);
        } else {
            usleep(20000);
        }

        feed(in_pipe.fds[1], spec.stdin_data, stdin_offset);
        drain(out_pipe.fds[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
        drain(err_pipe.fds[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
            break;
        }

        bool timed_out = has_timeout && std::chrono::steady_clock::now() >= deadline;
        bool cancelled = cancellation.isCancelled();
        if (timed_out || cancelled) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            result.timed_out = timed_out;
            result.cancelled = cancelled;
            LOG_WARN("process", "Killed process group of '" + spec.argv[0] + "' (" +
                     (timed_out ? "timeout" : "cancelled: " + cancellation.reason()) + ")");
            break;
        }
    }

    // EN: Collect whatever the child wrote before exiting
    // FR: Récupère ce que l'enfant a écrit avant de sortir
    drain(out_pipe.fds[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
    drain(err_pipe.fds[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

    if (result.timed_out) {
        result.exit_code = 124;
    } else if (result.cancelled) {
        result.exit_code = 130;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    return result;
}

} // namespace FGL
