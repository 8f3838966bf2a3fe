// EN: Deployment Trigger implementation
// FR: Implémentation du déclencheur de déploiement

#include "orchestrator/deployment_trigger.hpp"
#include "core/errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace FGL {
namespace Orchestrator {

namespace {

std::string urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// EN: 64-bit FNV-1a
// FR: FNV-1a 64 bits
uint64_t fnv1a(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace

ImageReference imageReferenceFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "latest") return ImageReference::LATEST;
    if (lower == "version") return ImageReference::VERSION;
    throw ConfigurationError("Unknown deploy.image_reference: " + name);
}

std::string imageReferenceToString(ImageReference reference) {
    return reference == ImageReference::VERSION ? "version" : "latest";
}

// EN: HttpDeploymentService
// FR: HttpDeploymentService

HttpDeploymentService::HttpDeploymentService(std::shared_ptr<Http::HttpClient> client, std::string endpoint)
    : client_(std::move(client)),
      endpoint_(std::move(endpoint)),
      retry_config_(ErrorRecoveryUtils::createHttpRetryConfig()) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    if (!client_) {
        throw ConfigurationError("HttpDeploymentService requires an HTTP client");
    }
    if (endpoint_.empty()) {
        throw ConfigurationError("HttpDeploymentService requires an endpoint");
    }
}

DeploymentAck HttpDeploymentService::updateService(const DeploymentRequest& request) {
    // EN: The client token makes resending safe, so transport and 5xx failures are retried here
    // FR: Le jeton client rend le renvoi sûr, les échecs de transport et 5xx sont donc réessayés ici
    RetryConfig config = retry_config_;
    config.cancellation = request.cancellation;

    try {
        return ErrorRecoveryManager::getInstance().executeWithRetry(
            "deploy:" + request.cluster + "/" + request.service, config,
            [&]() { return sendOnce(request); });
    } catch (const TriggerError&) {
        throw;
    } catch (const RunCancelledError&) {
        throw;
    } catch (const PipelineError& e) {
        if (request.cancellation.isCancelled()) {
            throw RunCancelledError("Deployment of " + request.cluster + "/" + request.service +
                                    " interrupted: " + request.cancellation.reason());
        }
        throw TriggerError(std::string("Deployment service unavailable: ") + e.what());
    }
}

DeploymentAck HttpDeploymentService::sendOnce(const DeploymentRequest& request) {
    const std::string url = endpoint_ + "/v1/clusters/" + urlEncode(request.cluster) + "/services/" +
                            urlEncode(request.service) + ":update";

    nlohmann::json body;
    body["cluster"] = request.cluster;
    body["service"] = request.service;
    body["region"] = request.region;
    body["image"] = request.image_ref;
    body["forceNewDeployment"] = request.force_new_deployment;
    body["clientToken"] = request.client_token;

    std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"},
        {"Idempotency-Key", request.client_token}
    };
    if (!request.auth_token.empty()) {
        headers["Authorization"] = "Bearer " + request.auth_token;
    }

    Http::HttpResponse response;
    try {
        response = client_->post(url, headers, body.dump(), request.cancellation);
    } catch (const Http::HttpTransportError& e) {
        throw PipelineError(ErrorKind::INTERNAL, std::string("transport error: ") + e.what(), true);
    }

    if (response.status == 401 || response.status == 403) {
        throw TriggerError("Deployment not authorized for " + request.cluster + "/" + request.service +
                           " (HTTP " + std::to_string(response.status) + ")");
    }
    if (response.status == 404) {
        throw TriggerError("Deployment target not found: " + request.cluster + "/" + request.service);
    }
    if (response.status == 429 || response.status >= 500) {
        throw PipelineError(ErrorKind::INTERNAL, "HTTP " + std::to_string(response.status), true);
    }

    DeploymentAck ack;
    ack.image_ref = request.image_ref;
    ack.client_token = request.client_token;

    // EN: 409 means a deployment with this client token is already in progress
    // FR: 409 signifie qu'un déploiement avec ce jeton client est déjà en cours
    if (response.status == 409) {
        ack.accepted = true;
    } else if (response.isSuccess()) {
        ack.accepted = true;
    } else {
        throw TriggerError("Deployment request rejected (HTTP " + std::to_string(response.status) + ")");
    }

    nlohmann::json parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        ack.deployment_id = parsed.value("deploymentId", std::string());
    }
    return ack;
}

// EN: DeploymentTrigger
// FR: DeploymentTrigger

DeploymentTrigger::DeploymentTrigger(std::shared_ptr<DeploymentService> service, ImageReference reference)
    : service_(std::move(service)), reference_(reference) {
    if (!service_) {
        throw ConfigurationError("DeploymentTrigger requires a deployment service");
    }
}

std::string DeploymentTrigger::clientToken(const DeploymentTarget& target, const Artifact& artifact) {
    std::ostringstream oss;
    oss << "fgl-" << std::hex << std::setw(16) << std::setfill('0')
        << fnv1a(target.cluster + "|" + target.service + "|" + artifact.digest());
    return oss.str();
}

DeploymentAck DeploymentTrigger::trigger(const DeploymentTarget& target, const Artifact& artifact,
                                         const TriggerAction& action, const SecretBundle& secrets,
                                         const CancellationToken& cancellation) {
    if (target.cluster.empty() || target.service.empty()) {
        throw TriggerError("Deployment target is incomplete (cluster and service are required)");
    }

    DeploymentRequest request;
    request.cluster = target.cluster;
    request.service = target.service;
    request.region = target.region;
    request.image_ref = reference_ == ImageReference::VERSION ? artifact.imageRef() : artifact.imageRef("latest");
    request.force_new_deployment = true;
    request.client_token = clientToken(target, artifact);
    request.cancellation = cancellation;
    if (!action.token_secret.empty()) {
        request.auth_token = secrets.value(action.token_secret);
    }

    DeploymentAck ack = service_->updateService(request);
    if (!ack.accepted) {
        throw TriggerError("Deployment request for " + target.cluster + "/" + target.service + " was not accepted");
    }

    LOG_INFO_META("deployer", "Deployment accepted",
                  (std::unordered_map<std::string, std::string>{
                      {"cluster", target.cluster}, {"service", target.service},
                      {"image", ack.image_ref}, {"deployment_id", ack.deployment_id},
                      {"client_token", ack.client_token}}));
    return ack;
}

} // namespace Orchestrator
} // namespace FGL
