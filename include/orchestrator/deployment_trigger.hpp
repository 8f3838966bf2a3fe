// EN: Deployment Trigger for Forgeline - Idempotent "force new deployment" on the target service
// FR: Déclencheur de déploiement pour Forgeline - "Forcer un nouveau déploiement" idempotent sur le service cible

#pragma once

#include <memory>
#include <string>

#include "core/cancellation.hpp"
#include "http/http_client.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/secret_resolver.hpp"

namespace FGL {
namespace Orchestrator {

struct DeploymentRequest {
    std::string cluster;
    std::string service;
    std::string region;
    std::string image_ref;
    bool force_new_deployment = true;
    std::string client_token;
    std::string auth_token;
    // EN: Stage token; cancels backoff sleeps and in-flight requests
    // FR: Jeton d'étape; annule les attentes de backoff et les requêtes en cours
    CancellationToken cancellation;
};

// EN: Abstract deployment service boundary. Returns once the request is accepted.
// FR: Frontière abstraite du service de déploiement. Retourne une fois la requête acceptée.
class DeploymentService {
public:
    virtual ~DeploymentService() = default;

    virtual DeploymentAck updateService(const DeploymentRequest& request) = 0;
};

// EN: JSON API: POST {endpoint}/v1/clusters/{cluster}/services/{service}:update
// FR: API JSON: POST {endpoint}/v1/clusters/{cluster}/services/{service}:update
class HttpDeploymentService : public DeploymentService {
public:
    HttpDeploymentService(std::shared_ptr<Http::HttpClient> client, std::string endpoint);

    DeploymentAck updateService(const DeploymentRequest& request) override;

    void setRetryConfig(const RetryConfig& config) { retry_config_ = config; }

private:
    DeploymentAck sendOnce(const DeploymentRequest& request);

    std::shared_ptr<Http::HttpClient> client_;
    std::string endpoint_;
    RetryConfig retry_config_;
};

// EN: Which image the service is asked to run
// FR: Quelle image le service doit exécuter
enum class ImageReference {
    LATEST = 0,     // EN: Redeploy the service's configured :latest / FR: Redéploie le :latest configuré
    VERSION = 1     // EN: Pin the run's version tag / FR: Fige le tag de version de l'exécution
};

// EN: Throws ConfigurationError for unknown names
// FR: Lance ConfigurationError pour les noms inconnus
ImageReference imageReferenceFromString(const std::string& name);
std::string imageReferenceToString(ImageReference reference);

class DeploymentTrigger {
public:
    DeploymentTrigger(std::shared_ptr<DeploymentService> service, ImageReference reference = ImageReference::LATEST);
    virtual ~DeploymentTrigger() = default;

    // EN: Throws TriggerError on authorization failure or unknown target, RunCancelledError once
    // cancellation fired
    // FR: Lance TriggerError sur échec d'autorisation ou cible inconnue, RunCancelledError une fois
    // l'annulation déclenchée
    virtual DeploymentAck trigger(const DeploymentTarget& target, const Artifact& artifact,
                                  const TriggerAction& action, const SecretBundle& secrets,
                                  const CancellationToken& cancellation);

    // EN: Stable token derived from cluster, service and digest
    // FR: Jeton stable dérivé du cluster, du service et du digest
    static std::string clientToken(const DeploymentTarget& target, const Artifact& artifact);

    ImageReference imageReference() const { return reference_; }

private:
    std::shared_ptr<DeploymentService> service_;
    ImageReference reference_;
};

} // namespace Orchestrator
} // namespace FGL
