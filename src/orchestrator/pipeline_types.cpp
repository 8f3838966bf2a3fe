// EN: Pipeline data model helpers - enum names and lookups
// FR: Helpers du modèle de données - noms d'énumérations et recherches

#include "orchestrator/pipeline_types.hpp"

#include <algorithm>
#include <cctype>

namespace FGL {
namespace Orchestrator {

namespace {

struct ActionNameVisitor {
    std::string operator()(const BuildAction&) const { return "build"; }
    std::string operator()(const PublishAction&) const { return "publish"; }
    std::string operator()(const TriggerAction&) const { return "trigger"; }
};

} // namespace

std::string actionTypeName(const StageAction& action) {
    return std::visit(ActionNameVisitor{}, action);
}

const Credential* PipelineDefinition::findCredential(const std::string& credential_name) const {
    auto it = std::find_if(credentials.begin(), credentials.end(),
                           [&](const Credential& c) { return c.name == credential_name; });
    return it == credentials.end() ? nullptr : &(*it);
}

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::PENDING: return "Pending";
        case RunStatus::RUNNING: return "Running";
        case RunStatus::SUCCEEDED: return "Succeeded";
        case RunStatus::FAILED: return "Failed";
        case RunStatus::ABORTED: return "Aborted";
    }
    return "Unknown";
}

std::string stagePhaseToString(StagePhase phase) {
    switch (phase) {
        case StagePhase::ACQUIRING: return "Acquiring";
        case StagePhase::SECRET_RESOLVING: return "SecretResolving";
        case StagePhase::EXECUTING: return "Executing";
        case StagePhase::RELEASING: return "Releasing";
        case StagePhase::DONE: return "Done";
    }
    return "Unknown";
}

std::string stageStatusToString(StageStatus status) {
    switch (status) {
        case StageStatus::PENDING: return "Pending";
        case StageStatus::RUNNING: return "Running";
        case StageStatus::SUCCEEDED: return "Succeeded";
        case StageStatus::FAILED: return "Failed";
        case StageStatus::SKIPPED: return "Skipped";
        case StageStatus::ABORTED: return "Aborted";
    }
    return "Unknown";
}

std::string secretTypeToString(SecretType type) {
    return type == SecretType::SECURE_STRING ? "SecureString" : "String";
}

SecretType secretTypeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.empty() || lower == "string") {
        return SecretType::STRING;
    }
    if (lower == "securestring" || lower == "secure_string") {
        return SecretType::SECURE_STRING;
    }
    throw ConfigurationError("Unknown secret type: " + name);
}

std::string pipelineEventTypeToString(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::RUN_STARTED: return "run_started";
        case PipelineEventType::RUN_FINISHED: return "run_finished";
        case PipelineEventType::STAGE_STARTED: return "stage_started";
        case PipelineEventType::STAGE_PHASE: return "stage_phase";
        case PipelineEventType::STAGE_RETRYING: return "stage_retrying";
        case PipelineEventType::STAGE_FINISHED: return "stage_finished";
    }
    return "unknown";
}

} // namespace Orchestrator
} // namespace FGL
