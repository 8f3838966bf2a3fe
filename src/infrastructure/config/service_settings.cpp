// EN: ServiceSettings - the Forgeline configuration schema and its typed snapshot.
// FR: ServiceSettings - le schéma de configuration Forgeline et son instantané typé.

#include "infrastructure/config/service_settings.hpp"

#include <utility>

namespace FGL {

namespace {

using Kind = ConfigManager::ValueKind;

ConfigManager::ValidationRule rule(const std::string& key, Kind kind, const std::string& description,
                                   std::vector<std::string> allowed = {}) {
    ConfigManager::ValidationRule r;
    r.key = key;
    r.kind = kind;
    r.description = description;
    r.allowed_values = std::move(allowed);
    return r;
}

ConfigManager::ValidationRule ranged(const std::string& key, double min, double max, const std::string& description) {
    ConfigManager::ValidationRule r = rule(key, Kind::INTEGER, description);
    r.min_value = min;
    r.max_value = max;
    return r;
}

template<typename T>
void read(const ConfigManager& config, const char* section, const char* key, T& field) {
    field = config.get(section, key).asOrDefault<T>(field);
}

} // namespace

std::vector<ConfigManager::ValidationRule> ServiceSettings::validationRules() {
    return {
        rule("logging.level", Kind::TEXT, "Minimum log level", {"debug", "info", "warn", "error"}),
        rule("logging.file", Kind::TEXT, "NDJSON log file"),
        rule("provisioner.docker_binary", Kind::TEXT, "Docker CLI path"),
        rule("provisioner.pull_policy", Kind::TEXT, "Image pull policy", {"always", "if-missing", "never"}),
        rule("provisioner.allowed_mounts", Kind::LIST, "Host paths stages may mount"),
        rule("provisioner.idle_command", Kind::TEXT, "Entrypoint keeping stage containers alive"),
        rule("registry.url", Kind::TEXT, "Registry URL override"),
        rule("deploy.endpoint", Kind::TEXT, "Deployment service endpoint"),
        rule("deploy.image_reference", Kind::TEXT, "Image tag handed to the service", {"latest", "version"}),
        ranged("deploy.timeout_ms", 100, 600000, "Deployment call timeout"),
        rule("secrets.backend", Kind::TEXT, "Secret store backend", {"env", "http"}),
        rule("secrets.endpoint", Kind::TEXT, "Parameter store endpoint"),
        rule("secrets.auth_token", Kind::TEXT, "Parameter store bearer token"),
        rule("secrets.prefix", Kind::TEXT, "Environment variable prefix of the env backend"),
        rule("engine.state_directory", Kind::TEXT, "Run counter directory"),
        rule("engine.reports_directory", Kind::TEXT, "Run report directory"),
        rule("engine.supersede_previous", Kind::BOOLEAN, "Cancel older runs on the same branch"),
        ranged("engine.max_history", 1, 10000, "Finished reports kept in memory"),
    };
}

ServiceSettings ServiceSettings::fromConfig(const ConfigManager& config) {
    ServiceSettings s;

    read(config, "logging", "level", s.logging.level);
    read(config, "logging", "file", s.logging.file);

    read(config, "provisioner", "docker_binary", s.provisioner.docker_binary);
    read(config, "provisioner", "pull_policy", s.provisioner.pull_policy);
    read(config, "provisioner", "allowed_mounts", s.provisioner.allowed_mounts);
    read(config, "provisioner", "idle_command", s.provisioner.idle_command);

    read(config, "registry", "url", s.registry.url);

    read(config, "deploy", "endpoint", s.deploy.endpoint);
    read(config, "deploy", "image_reference", s.deploy.image_reference);
    read(config, "deploy", "timeout_ms", s.deploy.timeout_ms);

    read(config, "secrets", "backend", s.secrets.backend);
    read(config, "secrets", "endpoint", s.secrets.endpoint);
    read(config, "secrets", "auth_token", s.secrets.auth_token);
    read(config, "secrets", "prefix", s.secrets.prefix);

    read(config, "engine", "state_directory", s.engine.state_directory);
    read(config, "engine", "reports_directory", s.engine.reports_directory);
    read(config, "engine", "supersede_previous", s.engine.supersede_previous);
    read(config, "engine", "max_history", s.engine.max_history);

    return s;
}

std::vector<std::string> ServiceSettings::consistencyErrors() const {
    std::vector<std::string> errors;
    if (secrets.backend == "http" && secrets.endpoint.empty()) {
        errors.push_back("secrets.endpoint is required when secrets.backend is http");
    }
    return errors;
}

} // namespace FGL
