// EN: Pipeline Utils implementation - YAML pipeline loading, validation and report persistence
// FR: Implémentation Pipeline Utils - Chargement YAML du pipeline, validation et persistance des rapports

#include "orchestrator/pipeline_engine.hpp"
#include "core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

namespace FGL {
namespace Orchestrator {

namespace {

std::string scalarOr(const YAML::Node& node, const std::string& key, const std::string& fallback = "") {
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        return fallback;
    }
    if (!child.IsScalar()) {
        throw ConfigurationError("'" + key + "' must be a scalar");
    }
    return child.as<std::string>();
}

std::vector<std::string> stringList(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> out;
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        return out;
    }
    if (child.IsScalar()) {
        out.push_back(child.as<std::string>());
        return out;
    }
    if (!child.IsSequence()) {
        throw ConfigurationError("'" + key + "' must be a list");
    }
    for (const auto& item : child) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

std::map<std::string, std::string> stringMap(const YAML::Node& node, const std::string& key) {
    std::map<std::string, std::string> out;
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        return out;
    }
    if (!child.IsMap()) {
        throw ConfigurationError("'" + key + "' must be a mapping");
    }
    for (const auto& entry : child) {
        out[entry.first.as<std::string>()] = entry.second.IsNull() ? "" : entry.second.as<std::string>();
    }
    return out;
}

EnvironmentSpec parseEnvironment(const YAML::Node& node) {
    EnvironmentSpec spec;
    if (!node || node.IsNull()) {
        return spec;
    }
    spec.image = scalarOr(node, "image");
    spec.working_dir = scalarOr(node, "working_dir");
    spec.env = stringMap(node, "env");
    spec.labels = stringMap(node, "labels");

    if (node["entrypoint"]) {
        spec.entrypoint = stringList(node, "entrypoint");
    }

    if (const YAML::Node mounts = node["mounts"]) {
        if (!mounts.IsSequence()) {
            throw ConfigurationError("'mounts' must be a list");
        }
        for (const auto& m : mounts) {
            MountRequest mount;
            mount.host_path = scalarOr(m, "host");
            mount.container_path = scalarOr(m, "container", mount.host_path);
            mount.read_only = m["read_only"] ? m["read_only"].as<bool>() : false;
            spec.mounts.push_back(std::move(mount));
        }
    }
    return spec;
}

RetryPolicy parseRetry(const YAML::Node& node) {
    RetryPolicy policy;
    if (!node || node.IsNull()) {
        return policy;
    }
    if (node["max_attempts"]) {
        int attempts = node["max_attempts"].as<int>();
        policy.max_attempts = attempts < 0 ? 0 : static_cast<size_t>(attempts);
    }
    if (node["initial_backoff_ms"]) policy.initial_backoff = std::chrono::milliseconds(node["initial_backoff_ms"].as<long>());
    if (node["backoff_multiplier"]) policy.backoff_multiplier = node["backoff_multiplier"].as<double>();
    if (node["max_backoff_ms"]) policy.max_backoff = std::chrono::milliseconds(node["max_backoff_ms"].as<long>());
    if (node["timeout_ms"]) policy.timeout = std::chrono::milliseconds(node["timeout_ms"].as<long>());
    if (node["retry_provisioning"]) policy.retry_provisioning = node["retry_provisioning"].as<bool>();
    return policy;
}

StageAction parseAction(const std::string& type, const YAML::Node& stage) {
    if (type == "build") {
        BuildAction action;
        const YAML::Node build = stage["build"];
        if (build) {
            action.context_dir = scalarOr(build, "context", ".");
            action.dockerfile = scalarOr(build, "dockerfile", "Dockerfile");
            action.build_args = stringMap(build, "args");
            action.secret_build_args = stringList(build, "secret_args");
        }
        return action;
    }
    if (type == "publish") {
        PublishAction action;
        const YAML::Node publish = stage["publish"];
        if (publish) {
            action.tags = stringList(publish, "tags");
            action.username_secret = scalarOr(publish, "username_secret");
            action.password_secret = scalarOr(publish, "password_secret");
        }
        return action;
    }
    if (type == "trigger" || type == "deploy") {
        TriggerAction action;
        const YAML::Node trigger = stage["trigger"];
        if (trigger) {
            action.token_secret = scalarOr(trigger, "token_secret");
        }
        return action;
    }
    throw ConfigurationError("Unknown action type '" + type + "'");
}

PipelineDefinition parseDefinition(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigurationError("Pipeline document must be a mapping");
    }

    PipelineDefinition definition;
    definition.name = scalarOr(root, "name", "pipeline");
    definition.repository = scalarOr(root, "repository");
    definition.registry_url = scalarOr(root, "registry");

    if (const YAML::Node target = root["target"]) {
        definition.target.cluster = scalarOr(target, "cluster");
        definition.target.service = scalarOr(target, "service");
        definition.target.region = scalarOr(target, "region");
    }

    if (const YAML::Node credentials = root["credentials"]) {
        if (!credentials.IsSequence()) {
            throw ConfigurationError("'credentials' must be a list");
        }
        for (const auto& c : credentials) {
            Credential credential;
            credential.name = scalarOr(c, "name");
            credential.store_key = scalarOr(c, "store_key", credential.name);
            credential.secret_type = secretTypeFromString(scalarOr(c, "type", "String"));
            for (const auto& stage : stringList(c, "scope")) {
                credential.scope.insert(stage);
            }
            definition.credentials.push_back(std::move(credential));
        }
    }

    const YAML::Node stages = root["stages"];
    if (!stages || !stages.IsSequence()) {
        throw ConfigurationError("'stages' must be a list");
    }
    for (const auto& s : stages) {
        StageSpec stage;
        stage.name = scalarOr(s, "name");
        try {
            stage.action = parseAction(scalarOr(s, "action"), s);
            stage.environment = parseEnvironment(s["environment"]);
            stage.secret_scopes = stringList(s, "secrets");
            stage.retry = parseRetry(s["retry"]);
        } catch (const ConfigurationError& e) {
            throw ConfigurationError("Stage '" + stage.name + "': " + e.what());
        }
        definition.stages.push_back(std::move(stage));
    }
    return definition;
}

std::string iso8601(std::chrono::system_clock::time_point tp) {
    if (tp.time_since_epoch().count() == 0) {
        return "";
    }
    return PipelineUtils::formatTimestamp(tp);
}

} // namespace

// EN: PipelineUtils implementation
// FR: Implémentation PipelineUtils
PipelineDefinition PipelineUtils::loadPipelineFromYAML(const std::string& filepath) {
    try {
        return parseDefinition(YAML::LoadFile(filepath));
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("Cannot read pipeline file: " + filepath);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed pipeline file " + filepath + ": " + e.what());
    }
}

PipelineDefinition PipelineUtils::loadPipelineFromString(const std::string& yaml_content) {
    try {
        return parseDefinition(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed pipeline: ") + e.what());
    }
}

bool PipelineUtils::isValidStageName(const std::string& name) {
    return !name.empty() && name.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-") == std::string::npos;
}

std::vector<std::string> PipelineUtils::validateStages(const PipelineDefinition& definition) {
    std::vector<std::string> errors;

    if (definition.repository.empty()) {
        errors.push_back("repository is required");
    }
    if (definition.stages.empty()) {
        errors.push_back("pipeline has no stages");
    }

    std::set<std::string> credential_names;
    for (const auto& credential : definition.credentials) {
        if (credential.name.empty()) {
            errors.push_back("credential without a name");
        } else if (!credential_names.insert(credential.name).second) {
            errors.push_back("duplicate credential '" + credential.name + "'");
        }
    }

    std::set<std::string> stage_names;
    bool build_seen = false;
    for (const auto& stage : definition.stages) {
        const std::string label = "stage '" + stage.name + "'";
        const std::string action = actionTypeName(stage.action);

        if (!isValidStageName(stage.name)) {
            errors.push_back("invalid stage name '" + stage.name + "'");
        } else if (!stage_names.insert(stage.name).second) {
            errors.push_back("duplicate stage name '" + stage.name + "'");
        }
        if (stage.environment.image.empty()) {
            errors.push_back(label + ": environment.image is required");
        }
        if (stage.retry.max_attempts < 1) {
            errors.push_back(label + ": retry.max_attempts must be at least 1");
        }
        if (stage.retry.backoff_multiplier < 1.0) {
            errors.push_back(label + ": retry.backoff_multiplier must be >= 1.0");
        }
        if (stage.retry.timeout.count() < 0) {
            errors.push_back(label + ": retry.timeout_ms must not be negative");
        }

        std::set<std::string> scopes(stage.secret_scopes.begin(), stage.secret_scopes.end());
        for (const auto& scope : stage.secret_scopes) {
            if (credential_names.count(scope) == 0) {
                errors.push_back(label + ": secret scope names unknown credential '" + scope + "'");
            }
        }

        // EN: Secrets used by an action must be declared in the stage's scopes
        // FR: Les secrets utilisés par une action doivent être déclarés dans les portées de l'étape
        std::vector<std::string> used;
        if (const auto* build = std::get_if<BuildAction>(&stage.action)) {
            used = build->secret_build_args;
            if (build_seen) {
                errors.push_back(label + ": only one build stage is allowed per run");
            }
            build_seen = true;
        } else if (const auto* publish = std::get_if<PublishAction>(&stage.action)) {
            if (!build_seen) {
                errors.push_back(label + ": publish stage must come after a build stage");
            }
            if (!publish->username_secret.empty()) used.push_back(publish->username_secret);
            if (!publish->password_secret.empty()) used.push_back(publish->password_secret);
        } else if (const auto* trigger = std::get_if<TriggerAction>(&stage.action)) {
            if (!build_seen) {
                errors.push_back(label + ": trigger stage must come after a build stage");
            }
            if (definition.target.cluster.empty() || definition.target.service.empty()) {
                errors.push_back(label + ": trigger requires target.cluster and target.service");
            }
            if (!trigger->token_secret.empty()) used.push_back(trigger->token_secret);
        }
        for (const auto& secret : used) {
            if (scopes.count(secret) == 0) {
                errors.push_back(label + ": " + action + " uses secret '" + secret + "' not listed in its secrets");
            }
        }
    }

    return errors;
}

nlohmann::json PipelineUtils::reportToJson(const RunReport& report) {
    nlohmann::json j;
    j["run_number"] = report.run_number;
    j["run_id"] = report.run_id;
    j["pipeline"] = report.pipeline_name;
    j["status"] = runStatusToString(report.status);
    j["trigger"] = {
        {"repository_url", report.trigger.repository_url},
        {"branch", report.trigger.branch},
        {"commit", report.trigger.commit}
    };
    j["start_time"] = iso8601(report.start_time);
    j["end_time"] = iso8601(report.end_time);
    j["duration_ms"] = report.duration.count();
    if (!report.error_message.empty()) {
        j["error"] = report.error_message;
    }

    j["stages"] = nlohmann::json::array();
    for (const auto& stage : report.stages) {
        nlohmann::json s = {
            {"name", stage.name},
            {"action", stage.action},
            {"status", stageStatusToString(stage.status)},
            {"last_phase", stagePhaseToString(stage.last_phase)},
            {"attempts", stage.attempts},
            {"duration_ms", stage.duration.count()}
        };
        if (stage.error_kind) {
            s["error_kind"] = errorKindToString(*stage.error_kind);
            s["error"] = stage.error_message;
        }
        j["stages"].push_back(std::move(s));
    }

    if (report.artifact) {
        j["artifact"] = {
            {"repository", report.artifact->repository()},
            {"version_tag", report.artifact->versionTag()},
            {"image", report.artifact->imageRef()},
            {"digest", report.artifact->digest()}
        };
    }
    if (report.publish) {
        j["publish"] = {{"pushed", report.publish->pushed_refs}, {"digest", report.publish->digest}};
    }
    if (report.deployment) {
        j["deployment"] = {
            {"deployment_id", report.deployment->deployment_id},
            {"image", report.deployment->image_ref},
            {"client_token", report.deployment->client_token},
            {"accepted", report.deployment->accepted}
        };
    }
    return j;
}

std::string PipelineUtils::reportFileName(uint64_t run_number) {
    return "run-" + std::to_string(run_number) + ".json";
}

std::string PipelineUtils::saveReport(const RunReport& report, const std::string& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        LOG_ERROR("engine", "Cannot create reports directory " + directory + ": " + ec.message());
        return "";
    }

    const std::filesystem::path target = std::filesystem::path(directory) / reportFileName(report.run_number);
    const std::filesystem::path temp = target.string() + ".tmp";
    {
        std::ofstream out(temp);
        if (!out) {
            LOG_ERROR("engine", "Cannot open " + temp.string());
            return "";
        }
        out << Logger::getInstance().redact(reportToJson(report).dump(2)) << '\n';
        if (!out) {
            LOG_ERROR("engine", "Cannot write " + temp.string());
            return "";
        }
    }
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        LOG_ERROR("engine", "Cannot move report into place: " + ec.message());
        return "";
    }
    return target.string();
}

std::string PipelineUtils::formatDuration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    if (ms < 60000) {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << "s";
    } else {
        oss << (ms / 60000) << "m " << std::setw(2) << std::setfill('0') << ((ms / 1000) % 60) << "s";
    }
    return oss.str();
}

std::string PipelineUtils::formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace Orchestrator
} // namespace FGL
