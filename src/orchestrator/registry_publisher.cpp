// EN: Registry Publisher implementation
// FR: Implémentation de la publication vers le registre

#include "orchestrator/registry_publisher.hpp"
#include "core/errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace FGL {
namespace Orchestrator {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string describeFailure(const CommandResult& result) {
    std::string err = trim(result.stderr_text);
    auto pos = err.rfind('\n');
    if (pos != std::string::npos) err = err.substr(pos + 1);
    return "exit " + std::to_string(result.exit_code) + (err.empty() ? "" : ": " + Logger::getInstance().redact(err));
}

} // namespace

DockerRegistryClient::DockerRegistryClient(std::string docker_binary) : docker_binary_(std::move(docker_binary)) {}

void DockerRegistryClient::authenticate(ScopedEnvironment& environment, const std::string& registry_url,
                                        const RegistryCredentials& credentials) {
    CommandRequest request;
    std::string script = "exec " + docker_binary_ + " login --username \"$FGL_REGISTRY_USERNAME\" --password-stdin";
    if (!registry_url.empty()) {
        script += " \"$0\"";
    }
    request.argv = {"sh", "-c", script, registry_url.empty() ? "sh" : registry_url};
    request.env["FGL_REGISTRY_USERNAME"] = credentials.username;
    request.stdin_data = credentials.password;

    auto result = environment.execute(request);
    if (!result.succeeded()) {
        throw PublishError("Registry login to '" + registry_url + "' failed (" + describeFailure(result) + ")");
    }
    LOG_INFO("publisher", "Authenticated to registry " + (registry_url.empty() ? std::string("(default)") : registry_url));
}

std::string DockerRegistryClient::push(ScopedEnvironment& environment, const Artifact& artifact, const std::string& tag) {
    const std::string target = artifact.imageRef(tag);

    if (tag != artifact.versionTag()) {
        auto tagged = environment.execute(CommandRequest{{docker_binary_, "tag", artifact.imageRef(), target}, {}, "", "", {}});
        if (!tagged.succeeded()) {
            throw PublishError("docker tag " + target + " failed (" + describeFailure(tagged) + ")");
        }
    }

    auto pushed = environment.execute(CommandRequest{{docker_binary_, "push", target}, {}, "", "", {}});
    if (!pushed.succeeded()) {
        throw PublishError("docker push " + target + " failed (" + describeFailure(pushed) + ")");
    }

    auto inspected = environment.execute(
        CommandRequest{{docker_binary_, "image", "inspect", "--format", "{{.Id}}", target}, {}, "", "", {}});
    std::string digest = trim(inspected.stdout_text);
    if (!inspected.succeeded() || digest.empty()) {
        throw PublishError("Could not read digest of pushed image " + target);
    }
    return digest;
}

RegistryPublisher::RegistryPublisher(std::shared_ptr<RegistryClient> client, std::string registry_url)
    : client_(std::move(client)), registry_url_(std::move(registry_url)) {
    if (!client_) {
        throw ConfigurationError("RegistryPublisher requires a registry client");
    }
}

std::vector<std::string> RegistryPublisher::effectiveTags(const PublishAction& action, const Artifact& artifact) {
    std::vector<std::string> tags = action.tags.empty()
        ? std::vector<std::string>{artifact.versionTag(), "latest"}
        : action.tags;
    // EN: Keep first occurrence order, drop duplicates
    // FR: Garde l'ordre de première occurrence, retire les doublons
    std::vector<std::string> unique;
    for (const auto& tag : tags) {
        if (!tag.empty() && std::find(unique.begin(), unique.end(), tag) == unique.end()) {
            unique.push_back(tag);
        }
    }
    return unique;
}

PublishAck RegistryPublisher::publish(ScopedEnvironment& environment, const Artifact& artifact,
                                      const PublishAction& action, const SecretBundle& secrets) {
    if (!action.username_secret.empty() || !action.password_secret.empty()) {
        RegistryCredentials credentials;
        credentials.username = action.username_secret.empty() ? "" : secrets.value(action.username_secret);
        credentials.password = action.password_secret.empty() ? "" : secrets.value(action.password_secret);
        client_->authenticate(environment, registry_url_, credentials);
    }

    PublishAck ack;
    for (const auto& tag : effectiveTags(action, artifact)) {
        std::string digest = client_->push(environment, artifact, tag);
        if (digest != artifact.digest()) {
            throw PublishError("Registry digest " + digest + " for " + artifact.imageRef(tag) +
                               " differs from built digest " + artifact.digest());
        }
        ack.pushed_refs.push_back(artifact.imageRef(tag));
        ack.digest = digest;

        LOG_INFO_META("publisher", "Tag pushed",
                      (std::unordered_map<std::string, std::string>{
                          {"image", artifact.imageRef(tag)}, {"digest", digest}}));
    }
    return ack;
}

} // namespace Orchestrator
} // namespace FGL
