// EN: Pipeline data model for Forgeline - Stages, actions, credentials, artifacts and run reports
// FR: Modèle de données du pipeline pour Forgeline - Étapes, actions, identifiants, artefacts et rapports

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "core/errors.hpp"

namespace FGL {
namespace Orchestrator {

// EN: Status of a pipeline run
// FR: Statut d'une exécution de pipeline
enum class RunStatus {
    PENDING = 0,        // EN: Created, not started / FR: Créée, non démarrée
    RUNNING = 1,        // EN: Stages executing / FR: Étapes en cours
    SUCCEEDED = 2,      // EN: All stages succeeded / FR: Toutes les étapes ont réussi
    FAILED = 3,         // EN: A stage failed / FR: Une étape a échoué
    ABORTED = 4         // EN: Cancelled externally / FR: Annulée de l'extérieur
};

// EN: Phase of a stage inside the executor loop
// FR: Phase d'une étape dans la boucle de l'exécuteur
enum class StagePhase {
    ACQUIRING = 0,
    SECRET_RESOLVING = 1,
    EXECUTING = 2,
    RELEASING = 3,
    DONE = 4
};

enum class StageStatus {
    PENDING = 0,
    RUNNING = 1,
    SUCCEEDED = 2,
    FAILED = 3,
    SKIPPED = 4,        // EN: Not run because an earlier stage failed / FR: Non lancée car une étape précédente a échoué
    ABORTED = 5
};

// EN: Host path mounted into the environment
// FR: Chemin hôte monté dans l'environnement
struct MountRequest {
    std::string host_path;
    std::string container_path;
    bool read_only = false;
};

// EN: What a stage needs from its ephemeral environment
// FR: Ce dont une étape a besoin de son environnement éphémère
struct EnvironmentSpec {
    std::string image;
    std::vector<MountRequest> mounts;
    std::string working_dir;
    std::optional<std::vector<std::string>> entrypoint;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> labels;
};

// EN: Stage actions
// FR: Actions d'étape
struct BuildAction {
    std::string context_dir = ".";
    std::string dockerfile = "Dockerfile";
    std::map<std::string, std::string> build_args;
    std::vector<std::string> secret_build_args;     // EN: Credential names forwarded as build args / FR: Noms d'identifiants transmis en build args
};

struct PublishAction {
    std::vector<std::string> tags;                  // EN: Empty means [run number, "latest"] / FR: Vide signifie [numéro d'exécution, "latest"]
    std::string username_secret;
    std::string password_secret;
};

struct TriggerAction {
    std::string token_secret;                       // EN: Optional bearer token credential / FR: Identifiant de jeton bearer optionnel
};

using StageAction = std::variant<BuildAction, PublishAction, TriggerAction>;

// EN: "build", "publish" or "trigger"
// FR: "build", "publish" ou "trigger"
std::string actionTypeName(const StageAction& action);

// EN: Retry and timeout policy of a stage. max_attempts counts the first attempt.
// FR: Politique de retry et de timeout d'une étape. max_attempts compte la première tentative.
struct RetryPolicy {
    size_t max_attempts = 1;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{30000};
    std::chrono::milliseconds timeout{0};           // EN: 0 disables the stage timeout / FR: 0 désactive le timeout
    bool retry_provisioning = false;                // EN: Treat ProvisionError as transient / FR: Traite ProvisionError comme transitoire
};

struct StageSpec {
    std::string name;
    EnvironmentSpec environment;
    StageAction action;
    std::vector<std::string> secret_scopes;
    RetryPolicy retry;
};

enum class SecretType {
    STRING = 0,
    SECURE_STRING = 1
};

// EN: Credential declaration. The value never lives here, only where to find it.
// FR: Déclaration d'identifiant. La valeur n'est jamais ici, seulement où la trouver.
struct Credential {
    std::string name;
    std::set<std::string> scope;                    // EN: Stage names allowed to read it / FR: Noms d'étapes autorisées
    SecretType secret_type = SecretType::STRING;
    std::string store_key;
};

struct DeploymentTarget {
    std::string cluster;
    std::string service;
    std::string region;
};

// EN: Source control event that starts a run
// FR: Événement de contrôle de source qui démarre une exécution
struct PushEvent {
    std::string repository_url;
    std::string branch;
    std::string commit;
};

// EN: Immutable image produced by the Build stage. Identity is the content digest.
// FR: Image immuable produite par l'étape Build. L'identité est le digest du contenu.
class Artifact {
public:
    Artifact(std::string repository, std::string version_tag, std::string digest)
        : repository_(std::move(repository)),
          version_tag_(std::move(version_tag)),
          digest_(std::move(digest)) {}

    const std::string& repository() const { return repository_; }
    const std::string& versionTag() const { return version_tag_; }
    const std::string& digest() const { return digest_; }

    std::string imageRef() const { return repository_ + ":" + version_tag_; }
    std::string imageRef(const std::string& tag) const { return repository_ + ":" + tag; }

    bool operator==(const Artifact& other) const { return digest_ == other.digest_; }
    bool operator!=(const Artifact& other) const { return !(*this == other); }

private:
    std::string repository_;
    std::string version_tag_;
    std::string digest_;
};

struct PublishAck {
    std::vector<std::string> pushed_refs;
    std::string digest;
};

struct DeploymentAck {
    std::string deployment_id;
    std::string image_ref;
    std::string client_token;
    bool accepted = false;
};

struct StageResult {
    std::string name;
    std::string action;
    StageStatus status = StageStatus::PENDING;
    StagePhase last_phase = StagePhase::ACQUIRING;
    size_t attempts = 0;
    std::chrono::milliseconds duration{0};
    std::optional<ErrorKind> error_kind;
    std::string error_message;                      // EN: Already redacted / FR: Déjà masqué
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
};

// EN: Final report of a run; this is what gets persisted as run-<n>.json
// FR: Rapport final d'une exécution; c'est ce qui est persisté en run-<n>.json
struct RunReport {
    uint64_t run_number = 0;
    std::string run_id;
    std::string pipeline_name;
    PushEvent trigger;
    RunStatus status = RunStatus::PENDING;
    std::vector<StageResult> stages;
    std::optional<Artifact> artifact;
    std::optional<PublishAck> publish;
    std::optional<DeploymentAck> deployment;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds duration{0};
    std::string error_message;

    bool isSuccess() const { return status == RunStatus::SUCCEEDED; }
};

// EN: Whole pipeline as loaded from YAML
// FR: Pipeline complet tel que chargé depuis le YAML
struct PipelineDefinition {
    std::string name;
    std::string repository;         // EN: Image repository, e.g. registry.example.com/app / FR: Dépôt d'images
    std::string registry_url;
    DeploymentTarget target;
    std::vector<Credential> credentials;
    std::vector<StageSpec> stages;

    const Credential* findCredential(const std::string& name) const;
};

// EN: Events emitted to observers of a run
// FR: Événements émis vers les observateurs d'une exécution
enum class PipelineEventType {
    RUN_STARTED = 0,
    RUN_FINISHED = 1,
    STAGE_STARTED = 2,
    STAGE_PHASE = 3,
    STAGE_RETRYING = 4,
    STAGE_FINISHED = 5
};

struct PipelineEvent {
    PipelineEventType type;
    uint64_t run_number = 0;
    std::string run_id;
    std::string stage;
    std::optional<StagePhase> phase;
    std::optional<StageStatus> stage_status;
    std::optional<RunStatus> run_status;
    size_t attempt = 0;
    std::chrono::milliseconds duration{0};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

using PipelineEventCallback = std::function<void(const PipelineEvent&)>;

std::string runStatusToString(RunStatus status);
std::string stagePhaseToString(StagePhase phase);
std::string stageStatusToString(StageStatus status);
std::string secretTypeToString(SecretType type);
std::string pipelineEventTypeToString(PipelineEventType type);

// EN: Parse "String"/"SecureString" (case-insensitive); throws ConfigurationError otherwise
// FR: Parse "String"/"SecureString" (insensible à la casse); lance ConfigurationError sinon
SecretType secretTypeFromString(const std::string& name);

} // namespace Orchestrator
} // namespace FGL
