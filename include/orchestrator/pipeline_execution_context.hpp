// EN: Pipeline run context for Forgeline - Immutable per-run values handed to every stage
// FR: Contexte d'exécution pour Forgeline - Valeurs immuables par exécution transmises à chaque étape

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/cancellation.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace FGL {
namespace Orchestrator {

// EN: Explicit run context. Everything a stage may read about its run lives here;
// only the cancellation token changes state during the run.
// FR: Contexte explicite d'exécution. Tout ce qu'une étape peut lire de son exécution est ici;
// seul le jeton d'annulation change d'état pendant l'exécution.
class PipelineRunContext {
public:
    PipelineRunContext(uint64_t run_number, std::string run_id, PushEvent trigger,
                       std::shared_ptr<const PipelineDefinition> definition,
                       CancellationToken cancellation = CancellationToken());

    uint64_t runNumber() const { return run_number_; }
    const std::string& runId() const { return run_id_; }
    const PushEvent& trigger() const { return trigger_; }
    const PipelineDefinition& definition() const { return *definition_; }
    std::shared_ptr<const PipelineDefinition> definitionPtr() const { return definition_; }

    // EN: Version tag of the artifact built by this run ("42" for run 42)
    // FR: Tag de version de l'artefact construit par cette exécution ("42" pour l'exécution 42)
    std::string versionTag() const { return std::to_string(run_number_); }

    const CancellationToken& cancellation() const { return cancellation_; }

    // EN: Move the run to Aborted at the next checkpoint; running commands are killed
    // FR: Passe l'exécution à Aborted au prochain point de contrôle; les commandes en cours sont tuées
    void requestCancellation(const std::string& reason = "cancellation requested") const;
    bool isCancellationRequested() const { return cancellation_.isCancelled(); }

private:
    const uint64_t run_number_;
    const std::string run_id_;
    const PushEvent trigger_;
    const std::shared_ptr<const PipelineDefinition> definition_;
    CancellationToken cancellation_;
};

} // namespace Orchestrator
} // namespace FGL
