// EN: Registry Publisher for Forgeline - Authenticates and pushes the artifact tags
// FR: Publication vers le registre pour Forgeline - Authentifie et pousse les tags de l'artefact

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "orchestrator/environment_provisioner.hpp"
#include "orchestrator/secret_resolver.hpp"

namespace FGL {
namespace Orchestrator {

struct RegistryCredentials {
    std::string username;
    std::string password;
};

// EN: Abstract registry boundary. Every failure is a PublishError (transient).
// FR: Frontière abstraite du registre. Chaque échec est une PublishError (transitoire).
class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    virtual void authenticate(ScopedEnvironment& environment, const std::string& registry_url,
                              const RegistryCredentials& credentials) = 0;

    // EN: Push artifact as repository:tag and return the digest the registry holds for it
    // FR: Pousse l'artefact en dépôt:tag et retourne le digest détenu par le registre
    virtual std::string push(ScopedEnvironment& environment, const Artifact& artifact, const std::string& tag) = 0;
};

// EN: docker login/tag/push run inside the publish environment. The password goes through
// stdin and the username through the exec environment.
// FR: docker login/tag/push exécutés dans l'environnement de publication. Le mot de passe passe
// par stdin et l'utilisateur par l'environnement d'exec.
class DockerRegistryClient : public RegistryClient {
public:
    explicit DockerRegistryClient(std::string docker_binary = "docker");

    void authenticate(ScopedEnvironment& environment, const std::string& registry_url,
                      const RegistryCredentials& credentials) override;
    std::string push(ScopedEnvironment& environment, const Artifact& artifact, const std::string& tag) override;

private:
    std::string docker_binary_;
};

class RegistryPublisher {
public:
    RegistryPublisher(std::shared_ptr<RegistryClient> client, std::string registry_url);
    virtual ~RegistryPublisher() = default;

    // EN: Authenticate with the stage's credentials, push each tag and check the digest
    // FR: Authentifie avec les identifiants de l'étape, pousse chaque tag et vérifie le digest
    virtual PublishAck publish(ScopedEnvironment& environment, const Artifact& artifact,
                               const PublishAction& action, const SecretBundle& secrets);

    // EN: action.tags, or [version tag, "latest"] when empty
    // FR: action.tags, ou [tag de version, "latest"] si vide
    static std::vector<std::string> effectiveTags(const PublishAction& action, const Artifact& artifact);

    const std::string& registryUrl() const { return registry_url_; }

private:
    std::shared_ptr<RegistryClient> client_;
    std::string registry_url_;
};

} // namespace Orchestrator
} // namespace FGL
