// EN: Pipeline Executor for Forgeline - Runs the ordered stage list of one run with fail-fast semantics
// FR: Exécuteur de pipeline pour Forgeline - Exécute la liste ordonnée d'étapes d'une exécution en fail-fast

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator/artifact_builder.hpp"
#include "orchestrator/deployment_trigger.hpp"
#include "orchestrator/environment_provisioner.hpp"
#include "orchestrator/pipeline_execution_context.hpp"
#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/registry_publisher.hpp"
#include "orchestrator/secret_resolver.hpp"

namespace FGL {
namespace Orchestrator {

// EN: Collaborators of the executor; all are required
// FR: Collaborateurs de l'exécuteur; tous sont requis
struct PipelineComponents {
    std::shared_ptr<EnvironmentProvisioner> provisioner;
    std::shared_ptr<SecretStore> secret_store;
    std::shared_ptr<ArtifactBuilder> builder;
    std::shared_ptr<RegistryPublisher> publisher;
    std::shared_ptr<DeploymentTrigger> trigger;
};

// EN: Stateless across runs: one executor may serve several runs in parallel.
// FR: Sans état entre exécutions: un exécuteur peut servir plusieurs exécutions en parallèle.
class PipelineExecutor {
public:
    explicit PipelineExecutor(PipelineComponents components);

    // EN: Execute every stage in order. Never throws for stage failures; the outcome is in
    // the report (Succeeded, Failed or Aborted).
    // FR: Exécute chaque étape dans l'ordre. Ne lance pas d'exception pour les échecs d'étape;
    // le résultat est dans le rapport (Succeeded, Failed ou Aborted).
    RunReport execute(const PipelineRunContext& context);

    void registerEventCallback(PipelineEventCallback callback);

private:
    // EN: State carried from one stage to the next within a run
    // FR: État transmis d'une étape à la suivante dans une exécution
    struct RunState {
        std::optional<Artifact> artifact;
        std::optional<PublishAck> publish;
        std::optional<DeploymentAck> deployment;
    };

    StageResult runStage(const StageSpec& stage, const PipelineRunContext& context,
                         const SecretResolver& resolver, RunState& state);

    void runAttempt(const StageSpec& stage, const PipelineRunContext& context, const SecretResolver& resolver,
                    const CancellationToken& stage_token, RunState& state, StageResult& result);

    // EN: One overload per StageAction alternative, selected with std::visit
    // FR: Une surcharge par alternative de StageAction, choisie avec std::visit
    void runAction(const BuildAction& action, ScopedEnvironment& environment, const PipelineRunContext& context,
                   const SecretBundle& secrets, RunState& state);
    void runAction(const PublishAction& action, ScopedEnvironment& environment, const PipelineRunContext& context,
                   const SecretBundle& secrets, RunState& state);
    void runAction(const TriggerAction& action, ScopedEnvironment& environment, const PipelineRunContext& context,
                   const SecretBundle& secrets, RunState& state);

    void enterPhase(const PipelineRunContext& context, StageResult& result, StagePhase phase,
                    const CancellationToken& stage_token);

    void emit(const PipelineRunContext& context, PipelineEventType type, const StageResult* stage,
              std::optional<RunStatus> run_status = std::nullopt, const std::string& message = "",
              std::chrono::milliseconds duration = std::chrono::milliseconds(0));

    PipelineComponents components_;
    std::mutex callbacks_mutex_;
    std::vector<PipelineEventCallback> callbacks_;
};

} // namespace Orchestrator
} // namespace FGL
