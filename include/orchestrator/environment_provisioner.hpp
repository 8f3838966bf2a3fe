// EN: Environment Provisioner for Forgeline - Ephemeral container per stage with scoped release
// FR: Provisionneur d'environnement pour Forgeline - Conteneur éphémère par étape avec libération garantie

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/cancellation.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace FGL {
namespace Orchestrator {

// EN: Handle on an acquired environment. Owned by exactly one ScopedEnvironment.
// FR: Handle sur un environnement acquis. Possédé par exactement un ScopedEnvironment.
struct EnvironmentHandle {
    std::string id;
    std::string name;
    EnvironmentSpec spec;
};

// EN: Command executed inside an environment. env carries secret values; they are
// exported to the runtime's own process, never written on a command line.
// FR: Commande exécutée dans un environnement. env porte les valeurs secrètes; elles sont
// exportées vers le processus du runtime, jamais écrites sur une ligne de commande.
struct CommandRequest {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string stdin_data;
    std::string working_dir;
    std::chrono::milliseconds timeout{0};
};

struct CommandResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool cancelled = false;

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// EN: Abstract container runtime boundary
// FR: Frontière abstraite du runtime de conteneurs
class EnvironmentProvisioner {
public:
    virtual ~EnvironmentProvisioner() = default;

    // EN: Create an environment; throws ProvisionError (image or mount unavailable)
    // or RunCancelledError.
    // FR: Crée un environnement; lance ProvisionError (image ou montage indisponible)
    // ou RunCancelledError.
    virtual EnvironmentHandle acquire(const EnvironmentSpec& spec, const std::string& name_hint,
                                      const CancellationToken& cancellation) = 0;

    // EN: Idempotent; succeeds even if the environment already exited
    // FR: Idempotent; réussit même si l'environnement est déjà terminé
    virtual void release(const EnvironmentHandle& handle) noexcept = 0;

    virtual CommandResult execute(const EnvironmentHandle& handle, const CommandRequest& request,
                                  const CancellationToken& cancellation) = 0;
};

enum class PullPolicy {
    ALWAYS = 0,
    IF_MISSING = 1,
    NEVER = 2
};

// EN: Throws ConfigurationError for unknown names
// FR: Lance ConfigurationError pour les noms inconnus
PullPolicy pullPolicyFromString(const std::string& name);
std::string pullPolicyToString(PullPolicy policy);

struct DockerProvisionerOptions {
    std::string docker_binary = "docker";
    PullPolicy pull_policy = PullPolicy::IF_MISSING;
    std::vector<std::string> allowed_mounts;        // EN: Host paths a stage may mount / FR: Chemins hôte montables
    std::string idle_command = "trap 'exit 0' TERM; while :; do sleep 1; done";
    std::chrono::milliseconds pull_timeout{600000};
    std::chrono::milliseconds control_timeout{60000};
};

// EN: Docker CLI implementation. Containers are started detached with an idle command,
// commands run through "docker exec", release is "docker rm -f".
// FR: Implémentation via la CLI Docker. Les conteneurs sont lancés détachés avec une commande
// d'attente, les commandes passent par "docker exec", la libération par "docker rm -f".
class DockerEnvironmentProvisioner : public EnvironmentProvisioner {
public:
    DockerEnvironmentProvisioner(std::shared_ptr<ProcessRunner> runner, DockerProvisionerOptions options);

    EnvironmentHandle acquire(const EnvironmentSpec& spec, const std::string& name_hint,
                              const CancellationToken& cancellation) override;
    void release(const EnvironmentHandle& handle) noexcept override;
    CommandResult execute(const EnvironmentHandle& handle, const CommandRequest& request,
                          const CancellationToken& cancellation) override;

    // EN: True if host_path equals or lies below one of the allowed paths (component-wise)
    // FR: Vrai si host_path est égal ou sous un des chemins autorisés (par composant)
    bool isMountAllowed(const std::string& host_path) const;

    const DockerProvisionerOptions& options() const { return options_; }

private:
    void checkMounts(const EnvironmentSpec& spec) const;
    void ensureImage(const std::string& image, const CancellationToken& cancellation);
    std::vector<std::string> buildRunCommand(const EnvironmentSpec& spec, const std::string& name) const;
    std::string generateName(const std::string& name_hint);
    void removeContainer(const std::string& name);
    ProcessResult runDocker(std::vector<std::string> args, std::chrono::milliseconds timeout,
                            const CancellationToken& cancellation,
                            const std::map<std::string, std::string>& env = {},
                            const std::string& stdin_data = "");

    std::shared_ptr<ProcessRunner> runner_;
    DockerProvisionerOptions options_;
    std::mutex mutex_;
    std::set<std::string> released_;
    uint64_t sequence_ = 0;
};

// EN: RAII scope over one environment: acquire in the constructor, exactly one release
// on every exit path (normal return, exception, cancellation).
// FR: Portée RAII sur un environnement: acquisition dans le constructeur, exactement une
// libération sur chaque chemin de sortie (retour normal, exception, annulation).
class ScopedEnvironment {
public:
    ScopedEnvironment(EnvironmentProvisioner& provisioner, const EnvironmentSpec& spec,
                      const std::string& name_hint, CancellationToken cancellation);
    ~ScopedEnvironment();

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;
    ScopedEnvironment(ScopedEnvironment&&) = delete;
    ScopedEnvironment& operator=(ScopedEnvironment&&) = delete;

    const EnvironmentHandle& handle() const { return handle_; }
    const CancellationToken& cancellation() const { return cancellation_; }

    // EN: Run a command; throws RunCancelledError once the stage token has fired
    // FR: Lance une commande; lance RunCancelledError une fois le jeton de l'étape déclenché
    CommandResult execute(const CommandRequest& request);

    // EN: Release now (idempotent)
    // FR: Libère maintenant (idempotent)
    void release() noexcept;
    bool released() const { return released_; }

private:
    EnvironmentProvisioner& provisioner_;
    CancellationToken cancellation_;
    EnvironmentHandle handle_;
    bool released_ = false;
};

} // namespace Orchestrator
} // namespace FGL
