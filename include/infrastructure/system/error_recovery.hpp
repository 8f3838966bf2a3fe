// EN: Error Recovery system for Forgeline - Auto-retry with exponential backoff on transient failures
// FR: Système de récupération d'erreurs pour Forgeline - Auto-retry avec exponential backoff sur échecs transitoires

#pragma once

#include "core/cancellation.hpp"
#include "core/errors.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace FGL {

// EN: Error types that can be recovered from
// FR: Types d'erreurs qui peuvent être récupérés
enum class RecoverableErrorType {
    TRANSIENT_PIPELINE,     // EN: PipelineError flagged transient / FR: PipelineError marquée transitoire
    NETWORK_TIMEOUT,        // EN: Network timeout error / FR: Erreur de timeout réseau
    CONNECTION_REFUSED,     // EN: Connection refused / FR: Connexion refusée
    HTTP_5XX,               // EN: HTTP 5xx server errors / FR: Erreurs serveur HTTP 5xx
    HTTP_429,               // EN: HTTP 429 rate limit / FR: HTTP 429 limite de débit
    TEMPORARY_FAILURE,      // EN: Temporary service failure / FR: Échec temporaire du service
    PERMANENT               // EN: Never retried / FR: Jamais réessayée
};

std::string recoverableErrorTypeToString(RecoverableErrorType type);

struct RetryAttempt;

// EN: Retry strategy configuration. max_attempts counts every attempt, the first one included.
// FR: Configuration de la stratégie de retry. max_attempts compte toutes les tentatives, la première incluse.
struct RetryConfig {
    size_t max_attempts{3};
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier{2.0};
    double jitter_factor{0.1};                      // EN: Jitter factor (0-1) / FR: Facteur de jitter (0-1)
    bool enable_jitter{true};
    std::unordered_set<RecoverableErrorType> recoverable_errors;
    CancellationToken cancellation;                 // EN: Interrupts backoff sleeps / FR: Interrompt les attentes de backoff
    std::function<void(const RetryAttempt&)> on_retry; // EN: Called before each backoff / FR: Appelé avant chaque backoff
};

// EN: Failed attempt information for monitoring and logging
// FR: Information de tentative échouée pour monitoring et logging
struct RetryAttempt {
    size_t attempt_number{0};                        // EN: 1-based / FR: Base 1
    std::chrono::milliseconds delay{0};              // EN: Delay before the next attempt / FR: Délai avant la tentative suivante
    std::chrono::system_clock::time_point timestamp;
    std::string error_message;
    RecoverableErrorType error_type{RecoverableErrorType::PERMANENT};
};

// EN: Retry statistics for monitoring
// FR: Statistiques de retry pour monitoring
struct RetryStatistics {
    std::chrono::system_clock::time_point created_at;
    size_t total_operations{0};
    size_t successful_operations{0};
    size_t failed_operations{0};
    size_t total_retries{0};
    std::unordered_map<RecoverableErrorType, size_t> error_counts;
    std::vector<RetryAttempt> recent_attempts;
};

// EN: Retry context for tracking individual operations
// FR: Contexte de retry pour suivre les opérations individuelles
class RetryContext {
public:
    explicit RetryContext(const std::string& operation_name, const RetryConfig& config = {});

    // EN: Record a failed attempt
    // FR: Enregistre une tentative échouée
    void recordAttempt(RecoverableErrorType error_type, const std::string& error_message);
    void recordSuccess() { succeeded_ = true; }

    // EN: Number of failed attempts so far
    // FR: Nombre de tentatives échouées jusqu'ici
    size_t getCurrentAttempt() const { return current_attempt_; }

    // EN: Attempts actually made (failures plus the successful one)
    // FR: Tentatives réellement effectuées (échecs plus la réussite)
    size_t attemptsMade() const { return current_attempt_ + (succeeded_ ? 1 : 0); }

    bool canRetry() const;

    std::chrono::milliseconds getNextDelay() const;

    const std::string& getOperationName() const { return operation_name_; }
    const std::vector<RetryAttempt>& getAttempts() const { return attempts_; }
    const RetryConfig& getConfig() const { return config_; }

    void reset();

private:
    RetryConfig config_;
    std::string operation_name_;
    size_t current_attempt_{0};
    bool succeeded_{false};
    std::vector<RetryAttempt> attempts_;
    mutable std::mt19937 jitter_generator_;

    std::chrono::milliseconds calculateDelayWithJitter(std::chrono::milliseconds base_delay) const;
};

// EN: Error Recovery Manager - Runs operations with retries and exponential backoff.
// Non-recoverable errors and exhaustion rethrow the original exception unchanged.
// FR: Gestionnaire de récupération d'erreurs - Exécute les opérations avec retries et backoff exponentiel.
// Les erreurs non récupérables et l'épuisement relancent l'exception d'origine inchangée.
class ErrorRecoveryManager {
    friend class AutoRetryGuard;

public:
    static ErrorRecoveryManager& getInstance();

    void configure(const RetryConfig& config);
    RetryConfig getDefaultConfig() const;

    template<typename Func>
    auto executeWithRetry(const std::string& operation_name, Func&& func) -> decltype(func());

    template<typename Func>
    auto executeWithRetry(const std::string& operation_name, const RetryConfig& config,
                          Func&& func) -> decltype(func());

    bool isRecoverable(const std::exception& error, const RetryConfig& config) const;

    // EN: Add custom error classifier (consulted for exceptions that are not PipelineError)
    // FR: Ajoute un classificateur d'erreur (consulté pour les exceptions hors PipelineError)
    void addErrorClassifier(std::function<RecoverableErrorType(const std::exception&)> classifier);

    RecoverableErrorType classifyError(const std::exception& error) const;

    RetryStatistics getStatistics() const;
    void resetStatistics();
    void setDetailedLogging(bool enabled);

private:
    ErrorRecoveryManager();
    ErrorRecoveryManager(const ErrorRecoveryManager&) = delete;
    ErrorRecoveryManager& operator=(const ErrorRecoveryManager&) = delete;

    template<typename Func>
    auto executeWithRetryInternal(RetryContext& context, Func&& func) -> decltype(func());

    // EN: Decide what to do with a failed attempt; returns false to rethrow
    // FR: Décide du sort d'une tentative échouée; retourne false pour relancer
    bool handleFailure(RetryContext& context, const std::exception& error);

    void updateStatistics(const RetryContext& context, bool success);
    void logRetryAttempt(const RetryContext& context, const RetryAttempt& attempt) const;

    mutable std::mutex mutex_;
    RetryConfig default_config_;
    RetryStatistics statistics_;
    std::vector<std::function<RecoverableErrorType(const std::exception&)>> error_classifiers_;
    std::atomic<bool> detailed_logging_{true};
};

// EN: RAII helper owning a retry context; attempts stay readable after execute()
// FR: Helper RAII possédant un contexte de retry; les tentatives restent lisibles après execute()
class AutoRetryGuard {
public:
    explicit AutoRetryGuard(const std::string& operation_name);
    AutoRetryGuard(const std::string& operation_name, const RetryConfig& config);
    ~AutoRetryGuard();

    template<typename Func>
    auto execute(Func&& func) -> decltype(func());

    const RetryContext& getContext() const { return context_; }

private:
    RetryContext context_;
    ErrorRecoveryManager& manager_;
};

namespace ErrorRecoveryUtils {

    // EN: Configuration for HTTP operations
    // FR: Configuration pour les opérations HTTP
    RetryConfig createHttpRetryConfig();

    // EN: Classify HTTP status codes
    // FR: Classifie les codes de statut HTTP
    RecoverableErrorType classifyHttpError(int status_code);

} // namespace ErrorRecoveryUtils

} // namespace FGL

// EN: Template implementations
// FR: Implémentations des templates

template<typename Func>
auto FGL::ErrorRecoveryManager::executeWithRetry(const std::string& operation_name, Func&& func)
    -> decltype(func()) {
    RetryContext context(operation_name, getDefaultConfig());
    return executeWithRetryInternal(context, std::forward<Func>(func));
}

template<typename Func>
auto FGL::ErrorRecoveryManager::executeWithRetry(const std::string& operation_name, const RetryConfig& config,
                                                 Func&& func) -> decltype(func()) {
    RetryContext context(operation_name, config);
    return executeWithRetryInternal(context, std::forward<Func>(func));
}

template<typename Func>
auto FGL::ErrorRecoveryManager::executeWithRetryInternal(RetryContext& context, Func&& func)
    -> decltype(func()) {
    while (true) {
        try {
            if constexpr (std::is_void_v<decltype(func())>) {
                func();
                context.recordSuccess();
                updateStatistics(context, true);
                return;
            } else {
                auto result = func();
                context.recordSuccess();
                updateStatistics(context, true);
                return result;
            }
        } catch (const std::exception& e) {
            if (!handleFailure(context, e)) {
                throw;
            }
        }

        // EN: Sleep before retry; cancellation aborts the wait
        // FR: Dort avant le retry; l'annulation interrompt l'attente
        if (!context.getConfig().cancellation.sleepFor(context.getNextDelay())) {
            updateStatistics(context, false);
            throw RunCancelledError("Retry of '" + context.getOperationName() + "' interrupted: " +
                                    context.getConfig().cancellation.reason());
        }
    }
}

template<typename Func>
auto FGL::AutoRetryGuard::execute(Func&& func) -> decltype(func()) {
    context_.reset();
    return manager_.executeWithRetryInternal(context_, std::forward<Func>(func));
}
