// EN: Pipeline Executor implementation - stage loop, phases, retries, timeouts and fail-fast
// FR: Implémentation de l'exécuteur - boucle d'étapes, phases, retries, timeouts et fail-fast

#include "orchestrator/pipeline_executor.hpp"
#include "core/errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/error_recovery.hpp"

#include <algorithm>

namespace FGL {
namespace Orchestrator {

namespace {

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

void throwIfCancelled(const CancellationToken& token, const std::string& where) {
    if (token.isCancelled()) {
        throw RunCancelledError("Cancelled before " + where + ": " + token.reason());
    }
}

RetryConfig retryConfigFor(const RetryPolicy& policy, const CancellationToken& token) {
    RetryConfig config;
    config.max_attempts = std::max<size_t>(1, policy.max_attempts);
    config.initial_delay = policy.initial_backoff;
    config.max_delay = policy.max_backoff;
    config.backoff_multiplier = policy.backoff_multiplier;
    config.recoverable_errors = {RecoverableErrorType::TRANSIENT_PIPELINE};
    config.cancellation = token;
    return config;
}

// EN: Rethrows the in-flight error with live secrets masked, keeping kind and transience.
// Called while the stage's SecretBundle still holds its values in the redactor.
// FR: Relance l'erreur en cours avec les secrets vivants masqués, en gardant type et transience.
// Appelée pendant que le SecretBundle de l'étape garde ses valeurs dans le masqueur.
void rethrowRedacted(const std::exception& error) {
    const std::string masked = Logger::getInstance().redact(error.what());
    if (masked == error.what()) {
        throw;
    }
    if (const auto* pipeline_error = dynamic_cast<const PipelineError*>(&error)) {
        throw PipelineError(pipeline_error->kind(), masked, pipeline_error->isTransient());
    }
    throw PipelineError(ErrorKind::INTERNAL, masked);
}

} // namespace

PipelineExecutor::PipelineExecutor(PipelineComponents components) : components_(std::move(components)) {
    if (!components_.provisioner || !components_.secret_store || !components_.builder ||
        !components_.publisher || !components_.trigger) {
        throw ConfigurationError("PipelineExecutor requires provisioner, secret store, builder, publisher and trigger");
    }
}

void PipelineExecutor::registerEventCallback(PipelineEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

RunReport PipelineExecutor::execute(const PipelineRunContext& context) {
    ScopedCorrelationId correlation(context.runId());
    const auto& definition = context.definition();
    const auto run_start = std::chrono::steady_clock::now();

    RunReport report;
    report.run_number = context.runNumber();
    report.run_id = context.runId();
    report.pipeline_name = definition.name;
    report.trigger = context.trigger();
    report.start_time = std::chrono::system_clock::now();
    report.status = RunStatus::RUNNING;

    emit(context, PipelineEventType::RUN_STARTED, nullptr, RunStatus::RUNNING,
         "branch " + context.trigger().branch + " at " + context.trigger().commit);

    SecretResolver resolver(definition.credentials, components_.secret_store);
    RunState state;

    for (const auto& stage : definition.stages) {
        if (report.status != RunStatus::RUNNING) {
            StageResult skipped;
            skipped.name = stage.name;
            skipped.action = actionTypeName(stage.action);
            skipped.status = StageStatus::SKIPPED;
            report.stages.push_back(std::move(skipped));
            continue;
        }

        if (context.isCancellationRequested()) {
            report.status = RunStatus::ABORTED;
            report.error_message = Logger::getInstance().redact(context.cancellation().reason());
            StageResult skipped;
            skipped.name = stage.name;
            skipped.action = actionTypeName(stage.action);
            skipped.status = StageStatus::SKIPPED;
            report.stages.push_back(std::move(skipped));
            continue;
        }

        StageResult result = runStage(stage, context, resolver, state);
        if (result.status == StageStatus::FAILED) {
            report.status = RunStatus::FAILED;
            report.error_message = "Stage '" + result.name + "' failed: " + result.error_message;
        } else if (result.status == StageStatus::ABORTED) {
            report.status = RunStatus::ABORTED;
            report.error_message = result.error_message;
        }
        report.stages.push_back(std::move(result));
    }

    if (report.status == RunStatus::RUNNING) {
        report.status = RunStatus::SUCCEEDED;
    }

    report.artifact = state.artifact;
    report.publish = state.publish;
    report.deployment = state.deployment;
    report.end_time = std::chrono::system_clock::now();
    report.duration = elapsedSince(run_start);

    emit(context, PipelineEventType::RUN_FINISHED, nullptr, report.status, report.error_message, report.duration);
    return report;
}

StageResult PipelineExecutor::runStage(const StageSpec& stage, const PipelineRunContext& context,
                                       const SecretResolver& resolver, RunState& state) {
    const auto stage_start = std::chrono::steady_clock::now();

    StageResult result;
    result.name = stage.name;
    result.action = actionTypeName(stage.action);
    result.status = StageStatus::RUNNING;
    result.start_time = std::chrono::system_clock::now();

    emit(context, PipelineEventType::STAGE_STARTED, &result);

    // EN: The stage timeout bounds every attempt and every backoff of this stage
    // FR: Le timeout d'étape borne chaque tentative et chaque backoff de cette étape
    const CancellationToken& run_token = context.cancellation();
    const CancellationToken stage_token = stage.retry.timeout.count() > 0
        ? run_token.withDeadline(stage.retry.timeout)
        : run_token;

    RetryConfig retry_config = retryConfigFor(stage.retry, stage_token);
    retry_config.on_retry = [&](const RetryAttempt& attempt) {
        result.attempts = attempt.attempt_number;
        emit(context, PipelineEventType::STAGE_RETRYING, &result, std::nullopt, attempt.error_message, attempt.delay);
    };

    AutoRetryGuard guard("stage:" + stage.name, retry_config);
    try {
        guard.execute([&]() { runAttempt(stage, context, resolver, stage_token, state, result); });
        result.attempts = guard.getContext().attemptsMade();
        result.status = StageStatus::SUCCEEDED;
        result.last_phase = StagePhase::DONE;
    } catch (const std::exception& e) {
        result.attempts = guard.getContext().attemptsMade();
        const auto* pipeline_error = dynamic_cast<const PipelineError*>(&e);

        if (run_token.isCancelled()) {
            result.status = StageStatus::ABORTED;
            result.error_kind = ErrorKind::CANCELLED;
            result.error_message = Logger::getInstance().redact(run_token.reason());
        } else if (stage_token.deadlineExceeded()) {
            StageTimeoutError timeout("Stage '" + stage.name + "' exceeded its timeout of " +
                                      std::to_string(stage.retry.timeout.count()) + "ms");
            result.status = StageStatus::FAILED;
            result.error_kind = timeout.kind();
            result.error_message = timeout.what();
        } else {
            result.status = StageStatus::FAILED;
            result.error_kind = pipeline_error ? pipeline_error->kind() : ErrorKind::INTERNAL;
            result.error_message = Logger::getInstance().redact(e.what());
        }

        LOG_ERROR_META("executor", "Stage failed",
                       (std::unordered_map<std::string, std::string>{
                           {"stage", stage.name},
                           {"phase", stagePhaseToString(result.last_phase)},
                           {"error_kind", errorKindToString(*result.error_kind)},
                           {"error", result.error_message}}));
    }

    result.end_time = std::chrono::system_clock::now();
    result.duration = elapsedSince(stage_start);
    emit(context, PipelineEventType::STAGE_FINISHED, &result, std::nullopt, result.error_message, result.duration);
    return result;
}

void PipelineExecutor::runAttempt(const StageSpec& stage, const PipelineRunContext& context,
                                  const SecretResolver& resolver, const CancellationToken& stage_token,
                                  RunState& state, StageResult& result) {
    enterPhase(context, result, StagePhase::ACQUIRING, stage_token);

    EnvironmentSpec spec = stage.environment;
    spec.labels["forgeline.run"] = context.versionTag();
    spec.labels["forgeline.stage"] = stage.name;

    // EN: Released by its destructor if anything below throws
    // FR: Libéré par son destructeur si la suite lance une exception
    std::optional<ScopedEnvironment> environment;
    try {
        environment.emplace(*components_.provisioner, spec, stage.name, stage_token);
    } catch (const ProvisionError& e) {
        if (stage.retry.retry_provisioning && !e.isTransient()) {
            throw ProvisionError(e.what(), true);
        }
        throw;
    }

    enterPhase(context, result, StagePhase::SECRET_RESOLVING, stage_token);
    SecretBundle secrets = resolver.resolve(stage.name, stage.secret_scopes, stage_token);

    try {
        enterPhase(context, result, StagePhase::EXECUTING, stage_token);
        std::visit([&](const auto& action) { runAction(action, *environment, context, secrets, state); },
                   stage.action);

        // EN: An action that ignored the token still fails the stage once it overran
        // FR: Une action qui a ignoré le jeton fait quand même échouer l'étape si elle a débordé
        if (stage_token.deadlineExceeded()) {
            throw StageTimeoutError("Stage '" + stage.name + "' exceeded its timeout of " +
                                    std::to_string(stage.retry.timeout.count()) + "ms");
        }

        enterPhase(context, result, StagePhase::RELEASING, CancellationToken());
        environment->release();
    } catch (const std::exception& e) {
        rethrowRedacted(e);
    }
}

void PipelineExecutor::runAction(const BuildAction& action, ScopedEnvironment& environment,
                                 const PipelineRunContext& context, const SecretBundle& secrets, RunState& state) {
    if (state.artifact) {
        throw ConfigurationError("A run produces exactly one artifact; a second build stage is not allowed");
    }
    state.artifact = components_.builder->build(environment, context, action, secrets);
}

void PipelineExecutor::runAction(const PublishAction& action, ScopedEnvironment& environment,
                                 const PipelineRunContext&, const SecretBundle& secrets, RunState& state) {
    if (!state.artifact) {
        throw ConfigurationError("Publish stage has no artifact: no earlier build stage succeeded");
    }
    state.publish = components_.publisher->publish(environment, *state.artifact, action, secrets);
}

void PipelineExecutor::runAction(const TriggerAction& action, ScopedEnvironment& environment,
                                 const PipelineRunContext& context, const SecretBundle& secrets, RunState& state) {
    if (!state.artifact) {
        throw ConfigurationError("Trigger stage has no artifact: no earlier build stage succeeded");
    }
    state.deployment = components_.trigger->trigger(context.definition().target, *state.artifact, action, secrets,
                                                    environment.cancellation());
}

void PipelineExecutor::enterPhase(const PipelineRunContext& context, StageResult& result, StagePhase phase,
                                  const CancellationToken& stage_token) {
    result.last_phase = phase;
    emit(context, PipelineEventType::STAGE_PHASE, &result);
    throwIfCancelled(stage_token, stagePhaseToString(phase));
}

void PipelineExecutor::emit(const PipelineRunContext& context, PipelineEventType type, const StageResult* stage,
                            std::optional<RunStatus> run_status, const std::string& message,
                            std::chrono::milliseconds duration) {
    PipelineEvent event;
    event.type = type;
    event.run_number = context.runNumber();
    event.run_id = context.runId();
    event.run_status = run_status;
    event.duration = duration;
    event.message = message;
    event.timestamp = std::chrono::system_clock::now();
    if (stage) {
        event.stage = stage->name;
        event.phase = stage->last_phase;
        event.stage_status = stage->status;
        event.attempt = stage->attempts;
    }

    // EN: One structured line per transition
    // FR: Une ligne structurée par transition
    std::unordered_map<std::string, std::string> metadata = {
        {"event", pipelineEventTypeToString(type)},
        {"run_number", std::to_string(event.run_number)},
        {"duration_ms", std::to_string(duration.count())}
    };
    if (stage) {
        metadata["stage"] = stage->name;
        metadata["phase"] = stagePhaseToString(stage->last_phase);
        metadata["status"] = stageStatusToString(stage->status);
    } else if (run_status) {
        metadata["status"] = runStatusToString(*run_status);
    }
    if (type == PipelineEventType::STAGE_RETRYING) {
        metadata["attempt"] = std::to_string(event.attempt);
        LOG_WARN_META("executor", message, metadata);
    } else {
        LOG_INFO_META("executor", message.empty() ? pipelineEventTypeToString(type) : message, metadata);
    }

    std::vector<PipelineEventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LOG_ERROR("executor", std::string("Event callback failed: ") + e.what());
        }
    }
}

} // namespace Orchestrator
} // namespace FGL
