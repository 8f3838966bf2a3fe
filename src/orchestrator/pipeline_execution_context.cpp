// EN: Pipeline run context implementation
// FR: Implémentation du contexte d'exécution

#include "orchestrator/pipeline_execution_context.hpp"
#include "core/errors.hpp"
#include "infrastructure/logging/logger.hpp"

namespace FGL {
namespace Orchestrator {

PipelineRunContext::PipelineRunContext(uint64_t run_number, std::string run_id, PushEvent trigger,
                                       std::shared_ptr<const PipelineDefinition> definition,
                                       CancellationToken cancellation)
    : run_number_(run_number),
      run_id_(std::move(run_id)),
      trigger_(std::move(trigger)),
      definition_(std::move(definition)),
      cancellation_(std::move(cancellation)) {
    if (!definition_) {
        throw ConfigurationError("PipelineRunContext requires a pipeline definition");
    }
}

void PipelineRunContext::requestCancellation(const std::string& reason) const {
    if (!cancellation_.isCancelled()) {
        LOG_WARN_META("executor", "Run cancellation requested",
                      (std::unordered_map<std::string, std::string>{
                          {"run_number", std::to_string(run_number_)}, {"reason", reason}}));
    }
    // EN: The token is a shared handle, cancelling a copy cancels the run
    // FR: Le jeton est un handle partagé, annuler une copie annule l'exécution
    CancellationToken token = cancellation_;
    token.cancel(reason);
}

} // namespace Orchestrator
} // namespace FGL
