// EN: Environment Provisioner implementation - docker run/exec/rm through the process runner
// FR: Implémentation du provisionneur - docker run/exec/rm via l'exécuteur de processus

#include "orchestrator/environment_provisioner.hpp"
#include "core/errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace FGL {
namespace Orchestrator {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string firstLine(const std::string& s) {
    std::string t = trim(s);
    return t.substr(0, t.find('\n'));
}

// EN: Lexically normalized path without trailing separator
// FR: Chemin normalisé lexicalement sans séparateur final
std::string normalizePath(const std::string& path) {
    std::string normalized = std::filesystem::path(path).lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string sanitizeName(const std::string& hint) {
    std::string out;
    for (char c : hint) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '.' || c == '-') {
            out.push_back(static_cast<char>(std::tolower(uc)));
        } else {
            out.push_back('-');
        }
    }
    if (out.empty()) out = "stage";
    return out.substr(0, 40);
}

std::string lastErrorLine(const ProcessResult& result) {
    if (!result.error_message.empty()) return result.error_message;
    std::string err = trim(result.stderr_text);
    auto pos = err.rfind('\n');
    return pos == std::string::npos ? err : err.substr(pos + 1);
}

} // namespace

PullPolicy pullPolicyFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "always") return PullPolicy::ALWAYS;
    if (lower == "if-missing" || lower == "if_missing" || lower == "missing") return PullPolicy::IF_MISSING;
    if (lower == "never") return PullPolicy::NEVER;
    throw ConfigurationError("Unknown pull policy: " + name);
}

std::string pullPolicyToString(PullPolicy policy) {
    switch (policy) {
        case PullPolicy::ALWAYS: return "always";
        case PullPolicy::IF_MISSING: return "if-missing";
        case PullPolicy::NEVER: return "never";
    }
    return "unknown";
}

DockerEnvironmentProvisioner::DockerEnvironmentProvisioner(std::shared_ptr<ProcessRunner> runner,
                                                           DockerProvisionerOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
    if (!runner_) {
        throw ConfigurationError("DockerEnvironmentProvisioner requires a process runner");
    }
    for (auto& allowed : options_.allowed_mounts) {
        allowed = normalizePath(allowed);
    }
}

bool DockerEnvironmentProvisioner::isMountAllowed(const std::string& host_path) const {
    if (host_path.empty() || host_path.front() != '/') {
        return false;
    }
    const std::string candidate = normalizePath(host_path);
    for (const auto& allowed : options_.allowed_mounts) {
        if (candidate == allowed) return true;
        if (allowed == "/") return true;
        if (candidate.size() > allowed.size() &&
            candidate.compare(0, allowed.size(), allowed) == 0 &&
            candidate[allowed.size()] == '/') {
            return true;
        }
    }
    return false;
}

void DockerEnvironmentProvisioner::checkMounts(const EnvironmentSpec& spec) const {
    for (const auto& mount : spec.mounts) {
        if (!isMountAllowed(mount.host_path)) {
            throw ProvisionError("Mount not granted by provisioner allow-list: " + mount.host_path);
        }
        std::error_code ec;
        if (!std::filesystem::exists(mount.host_path, ec)) {
            throw ProvisionError("Mount source unavailable: " + mount.host_path);
        }
        if (mount.container_path.empty() || mount.container_path.front() != '/') {
            throw ProvisionError("Mount target must be an absolute path: '" + mount.container_path + "'");
        }
    }
}

ProcessResult DockerEnvironmentProvisioner::runDocker(std::vector<std::string> args,
                                                      std::chrono::milliseconds timeout,
                                                      const CancellationToken& cancellation,
                                                      const std::map<std::string, std::string>& env,
                                                      const std::string& stdin_data) {
    ProcessSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(options_.docker_binary);
    for (auto& arg : args) spec.argv.push_back(std::move(arg));
    spec.env = env;
    spec.stdin_data = stdin_data;
    spec.timeout = timeout;

    LOG_DEBUG("provisioner", "exec: " + PosixProcessRunner::describe(spec.argv));
    return runner_->run(spec, cancellation);
}

void DockerEnvironmentProvisioner::ensureImage(const std::string& image, const CancellationToken& cancellation) {
    if (options_.pull_policy != PullPolicy::ALWAYS) {
        auto inspect = runDocker({"image", "inspect", "--format", "{{.Id}}", image},
                                 options_.control_timeout, cancellation);
        if (inspect.cancelled) {
            throw RunCancelledError("Image check cancelled: " + cancellation.reason());
        }
        if (inspect.succeeded()) {
            return;
        }
        if (options_.pull_policy == PullPolicy::NEVER) {
            throw ProvisionError("Image not present locally and pull policy is 'never': " + image);
        }
    }

    LOG_INFO("provisioner", "Pulling image " + image);
    auto pull = runDocker({"pull", image}, options_.pull_timeout, cancellation);
    if (pull.cancelled) {
        throw RunCancelledError("Image pull cancelled: " + cancellation.reason());
    }
    if (!pull.succeeded()) {
        throw ProvisionError("Cannot obtain image " + image + ": " + lastErrorLine(pull));
    }
}

std::string DockerEnvironmentProvisioner::generateName(const std::string& name_hint) {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq = ++sequence_;
    }
    std::ostringstream oss;
    oss << "fgl-" << sanitizeName(name_hint) << "-" << std::hex << std::setw(6) << std::setfill('0')
        << (generator() & 0xffffff) << seq;
    return oss.str();
}

std::vector<std::string> DockerEnvironmentProvisioner::buildRunCommand(const EnvironmentSpec& spec,
                                                                       const std::string& name) const {
    std::vector<std::string> args = {"run", "-d", "--name", name, "--label", "forgeline.managed=true"};

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    for (const auto& mount : spec.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path + ":" + mount.container_path + (mount.read_only ? ":ro" : ""));
    }
    if (!spec.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_dir);
    }
    for (const auto& [key, value] : spec.env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // EN: The container idles until released; stage commands arrive through docker exec
    // FR: Le conteneur attend jusqu'à sa libération; les commandes arrivent via docker exec
    if (spec.entrypoint && !spec.entrypoint->empty()) {
        args.push_back("--entrypoint");
        args.push_back(spec.entrypoint->front());
        args.push_back(spec.image);
        args.insert(args.end(), spec.entrypoint->begin() + 1, spec.entrypoint->end());
    } else {
        args.push_back("--entrypoint");
        args.push_back("sh");
        args.push_back(spec.image);
        args.push_back("-c");
        args.push_back(options_.idle_command);
    }
    return args;
}

void DockerEnvironmentProvisioner::removeContainer(const std::string& name) {
    auto result = runDocker({"rm", "-f", name}, options_.control_timeout, CancellationToken());
    if (!result.succeeded() && result.stderr_text.find("No such container") == std::string::npos) {
        LOG_WARN("provisioner", "Cleanup of half-created container " + name + " failed: " + lastErrorLine(result));
    }
}

EnvironmentHandle DockerEnvironmentProvisioner::acquire(const EnvironmentSpec& spec, const std::string& name_hint,
                                                        const CancellationToken& cancellation) {
    if (spec.image.empty()) {
        throw ProvisionError("Environment for '" + name_hint + "' has no image");
    }
    if (cancellation.isCancelled()) {
        throw RunCancelledError("Acquire cancelled: " + cancellation.reason());
    }

    checkMounts(spec);
    ensureImage(spec.image, cancellation);

    const std::string name = generateName(name_hint);
    auto result = runDocker(buildRunCommand(spec, name), options_.control_timeout, cancellation);

    if (result.cancelled) {
        // EN: The container may exist even though docker run was interrupted
        // FR: Le conteneur peut exister même si docker run a été interrompu
        removeContainer(name);
        throw RunCancelledError("Acquire cancelled: " + cancellation.reason());
    }
    if (!result.succeeded()) {
        throw ProvisionError("docker run failed for image " + spec.image + ": " + lastErrorLine(result));
    }

    EnvironmentHandle handle;
    handle.id = firstLine(result.stdout_text);
    handle.name = name;
    handle.spec = spec;
    if (handle.id.empty()) {
        removeContainer(name);
        throw ProvisionError("docker run returned no container id for " + name);
    }

    LOG_INFO_META("provisioner", "Environment acquired",
                  (std::unordered_map<std::string, std::string>{
                      {"environment", name}, {"image", spec.image}, {"id", handle.id.substr(0, 12)}}));
    return handle;
}

CommandResult DockerEnvironmentProvisioner::execute(const EnvironmentHandle& handle, const CommandRequest& request,
                                                    const CancellationToken& cancellation) {
    std::vector<std::string> args = {"exec"};
    if (!request.stdin_data.empty()) {
        args.push_back("-i");
    }
    // EN: "-e NAME" without a value makes docker copy it from its own environment
    // FR: "-e NAME" sans valeur fait copier la variable depuis l'environnement de docker
    for (const auto& entry : request.env) {
        args.push_back("-e");
        args.push_back(entry.first);
    }
    if (!request.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(request.working_dir);
    }
    args.push_back(handle.id);
    args.insert(args.end(), request.argv.begin(), request.argv.end());

    auto result = runDocker(std::move(args), request.timeout, cancellation, request.env, request.stdin_data);

    CommandResult out;
    out.exit_code = result.exit_code;
    out.stdout_text = std::move(result.stdout_text);
    out.stderr_text = result.error_message.empty() ? std::move(result.stderr_text) : result.error_message;
    out.timed_out = result.timed_out;
    out.cancelled = result.cancelled;
    return out;
}

void DockerEnvironmentProvisioner::release(const EnvironmentHandle& handle) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (released_.count(handle.id) > 0) {
                return;
            }
        }

        // EN: Fresh token: release must run even when the stage was cancelled
        // FR: Jeton neuf: la libération doit s'exécuter même si l'étape a été annulée
        auto result = runDocker({"rm", "-f", handle.id}, options_.control_timeout, CancellationToken());
        bool gone = result.succeeded() || result.stderr_text.find("No such container") != std::string::npos;

        if (gone) {
            std::lock_guard<std::mutex> lock(mutex_);
            released_.insert(handle.id);
            LOG_INFO_META("provisioner", "Environment released",
                          (std::unordered_map<std::string, std::string>{{"environment", handle.name}}));
        } else {
            LOG_ERROR("provisioner", "docker rm failed for " + handle.name + ": " + lastErrorLine(result));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("provisioner", "Release of " + handle.name + " failed: " + e.what());
    }
}

// EN: ScopedEnvironment
// FR: ScopedEnvironment

ScopedEnvironment::ScopedEnvironment(EnvironmentProvisioner& provisioner, const EnvironmentSpec& spec,
                                     const std::string& name_hint, CancellationToken cancellation)
    : provisioner_(provisioner),
      cancellation_(std::move(cancellation)),
      handle_(provisioner_.acquire(spec, name_hint, cancellation_)) {}

ScopedEnvironment::~ScopedEnvironment() {
    release();
}

CommandResult ScopedEnvironment::execute(const CommandRequest& request) {
    if (released_) {
        throw ProvisionError("Environment " + handle_.name + " was already released");
    }
    if (cancellation_.isCancelled()) {
        throw RunCancelledError("Stage cancelled: " + cancellation_.reason());
    }
    auto result = provisioner_.execute(handle_, request, cancellation_);
    if (result.cancelled) {
        throw RunCancelledError("Command cancelled: " + cancellation_.reason());
    }
    return result;
}

void ScopedEnvironment::release() noexcept {
    if (released_) {
        return;
    }
    released_ = true;
    provisioner_.release(handle_);
}

} // namespace Orchestrator
} // namespace FGL
