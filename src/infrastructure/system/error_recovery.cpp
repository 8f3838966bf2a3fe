// EN: Error recovery for Forgeline - classification of failed attempts, capped exponential backoff and retry statistics
// FR: Récupération d'erreurs pour Forgeline - classification des échecs, backoff exponentiel plafonné et statistiques

#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <iterator>

namespace FGL {

namespace {

constexpr size_t kRecentAttemptLimit = 100;

// EN: Message fragments of foreign exceptions (curl, system_error...) mapped to a retry class.
// First match wins.
// FR: Fragments de message d'exceptions étrangères (curl, system_error...) associés à une classe de retry.
// La première correspondance gagne.
struct MessagePattern {
    const char* fragment;
    RecoverableErrorType type;
};

constexpr MessagePattern kMessagePatterns[] = {
    {"timed out", RecoverableErrorType::NETWORK_TIMEOUT},
    {"timeout", RecoverableErrorType::NETWORK_TIMEOUT},
    {"connection refused", RecoverableErrorType::CONNECTION_REFUSED},
    {"connection reset", RecoverableErrorType::CONNECTION_REFUSED},
    {"too many requests", RecoverableErrorType::HTTP_429},
    {"429", RecoverableErrorType::HTTP_429},
    {"service unavailable", RecoverableErrorType::TEMPORARY_FAILURE},
    {"temporarily unavailable", RecoverableErrorType::TEMPORARY_FAILURE},
};

const std::unordered_set<RecoverableErrorType>& retryableByDefault() {
    static const std::unordered_set<RecoverableErrorType> types = {
        RecoverableErrorType::TRANSIENT_PIPELINE,
        RecoverableErrorType::NETWORK_TIMEOUT,
        RecoverableErrorType::CONNECTION_REFUSED,
        RecoverableErrorType::HTTP_5XX,
        RecoverableErrorType::HTTP_429,
        RecoverableErrorType::TEMPORARY_FAILURE,
    };
    return types;
}

RecoverableErrorType classifyByMessage(const std::exception& error) {
    std::string text = error.what();
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& pattern : kMessagePatterns) {
        if (text.find(pattern.fragment) != std::string::npos) {
            return pattern.type;
        }
    }
    return RecoverableErrorType::PERMANENT;
}

} // namespace

std::string recoverableErrorTypeToString(RecoverableErrorType type) {
    switch (type) {
        case RecoverableErrorType::TRANSIENT_PIPELINE: return "TRANSIENT_PIPELINE";
        case RecoverableErrorType::NETWORK_TIMEOUT:    return "NETWORK_TIMEOUT";
        case RecoverableErrorType::CONNECTION_REFUSED: return "CONNECTION_REFUSED";
        case RecoverableErrorType::HTTP_5XX:           return "HTTP_5XX";
        case RecoverableErrorType::HTTP_429:           return "HTTP_429";
        case RecoverableErrorType::TEMPORARY_FAILURE:  return "TEMPORARY_FAILURE";
        case RecoverableErrorType::PERMANENT:          return "PERMANENT";
    }
    return "PERMANENT";
}

RetryContext::RetryContext(const std::string& operation_name, const RetryConfig& config)
    : config_(config), operation_name_(operation_name), jitter_generator_(std::random_device{}()) {
    if (config_.recoverable_errors.empty()) {
        config_.recoverable_errors = retryableByDefault();
    }
    config_.max_attempts = std::max<size_t>(config_.max_attempts, 1);
}

void RetryContext::recordAttempt(RecoverableErrorType error_type, const std::string& error_message) {
    ++current_attempt_;

    RetryAttempt attempt;
    attempt.attempt_number = current_attempt_;
    attempt.timestamp = std::chrono::system_clock::now();
    attempt.error_type = error_type;
    attempt.error_message = error_message;
    attempt.delay = getNextDelay();
    attempts_.push_back(std::move(attempt));
}

bool RetryContext::canRetry() const {
    return current_attempt_ < config_.max_attempts;
}

// EN: initial_delay * multiplier^(failures - 1), capped at max_delay, then jittered
// FR: initial_delay * multiplicateur^(échecs - 1), plafonné à max_delay, puis bruité
std::chrono::milliseconds RetryContext::getNextDelay() const {
    if (current_attempt_ == 0) {
        return std::chrono::milliseconds::zero();
    }

    const double exponent = static_cast<double>(current_attempt_ - 1);
    const double uncapped = static_cast<double>(config_.initial_delay.count()) *
                            std::pow(config_.backoff_multiplier, exponent);
    const double capped = std::min(uncapped, static_cast<double>(config_.max_delay.count()));
    const std::chrono::milliseconds base(static_cast<long long>(capped));

    return config_.enable_jitter ? calculateDelayWithJitter(base) : base;
}

std::chrono::milliseconds RetryContext::calculateDelayWithJitter(std::chrono::milliseconds base_delay) const {
    if (config_.jitter_factor <= 0.0 || base_delay.count() <= 0) {
        return base_delay;
    }

    const double spread = std::min(config_.jitter_factor, 1.0);
    std::uniform_real_distribution<double> scale(1.0 - spread, 1.0 + spread);
    const double jittered = static_cast<double>(base_delay.count()) * scale(jitter_generator_);
    return std::chrono::milliseconds(static_cast<long long>(std::max(jittered, 0.0)));
}

void RetryContext::reset() {
    attempts_.clear();
    current_attempt_ = 0;
    succeeded_ = false;
}

ErrorRecoveryManager& ErrorRecoveryManager::getInstance() {
    static ErrorRecoveryManager instance;
    return instance;
}

ErrorRecoveryManager::ErrorRecoveryManager() {
    default_config_.recoverable_errors = retryableByDefault();
    statistics_.created_at = std::chrono::system_clock::now();
    error_classifiers_.emplace_back(&classifyByMessage);
}

void ErrorRecoveryManager::configure(const RetryConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        default_config_ = config;
    }
    LOG_DEBUG("error_recovery", "Default retry policy: " + std::to_string(config.max_attempts) + " attempts, " +
              std::to_string(config.initial_delay.count()) + "ms to " + std::to_string(config.max_delay.count()) + "ms");
}

RetryConfig ErrorRecoveryManager::getDefaultConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_config_;
}

bool ErrorRecoveryManager::isRecoverable(const std::exception& error, const RetryConfig& config) const {
    const RecoverableErrorType type = classifyError(error);
    if (type == RecoverableErrorType::PERMANENT) {
        return false;
    }
    const auto& allowed = config.recoverable_errors.empty() ? retryableByDefault() : config.recoverable_errors;
    return allowed.count(type) > 0;
}

void ErrorRecoveryManager::addErrorClassifier(std::function<RecoverableErrorType(const std::exception&)> classifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_classifiers_.insert(error_classifiers_.begin(), std::move(classifier));
}

// EN: A PipelineError decides for itself through isTransient(); classifiers only see foreign exceptions
// FR: Une PipelineError décide seule via isTransient(); les classificateurs ne voient que les exceptions étrangères
RecoverableErrorType ErrorRecoveryManager::classifyError(const std::exception& error) const {
    if (const auto* pipeline_error = dynamic_cast<const PipelineError*>(&error)) {
        return pipeline_error->isTransient() ? RecoverableErrorType::TRANSIENT_PIPELINE
                                             : RecoverableErrorType::PERMANENT;
    }

    decltype(error_classifiers_) classifiers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        classifiers = error_classifiers_;
    }

    for (const auto& classifier : classifiers) {
        const RecoverableErrorType type = classifier(error);
        if (type != RecoverableErrorType::PERMANENT) {
            return type;
        }
    }
    return RecoverableErrorType::PERMANENT;
}

bool ErrorRecoveryManager::handleFailure(RetryContext& context, const std::exception& error) {
    context.recordAttempt(classifyError(error), Logger::getInstance().redact(error.what()));

    const bool retry = isRecoverable(error, context.getConfig()) &&
                       !context.getConfig().cancellation.isCancelled();
    if (retry && !context.canRetry()) {
        LOG_WARN("error_recovery", "Retry exhausted for operation '" + context.getOperationName() +
                 "' after " + std::to_string(context.getCurrentAttempt()) + " attempts");
    }
    if (!retry || !context.canRetry()) {
        updateStatistics(context, false);
        return false;
    }

    const RetryAttempt& attempt = context.getAttempts().back();
    if (detailed_logging_.load()) {
        logRetryAttempt(context, attempt);
    }
    if (context.getConfig().on_retry) {
        context.getConfig().on_retry(attempt);
    }
    return true;
}

RetryStatistics ErrorRecoveryManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_;
}

void ErrorRecoveryManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    statistics_ = RetryStatistics{};
    statistics_.created_at = std::chrono::system_clock::now();
}

void ErrorRecoveryManager::setDetailedLogging(bool enabled) {
    detailed_logging_.store(enabled);
}

void ErrorRecoveryManager::updateStatistics(const RetryContext& context, bool success) {
    const auto& failures = context.getAttempts();

    std::lock_guard<std::mutex> lock(mutex_);
    ++statistics_.total_operations;
    ++(success ? statistics_.successful_operations : statistics_.failed_operations);

    // EN: Every failure except a final, unretried one led to another attempt
    // FR: Chaque échec sauf un dernier non réessayé a mené à une nouvelle tentative
    if (!failures.empty()) {
        statistics_.total_retries += success ? failures.size() : failures.size() - 1;
    }

    for (const auto& failure : failures) {
        ++statistics_.error_counts[failure.error_type];
    }

    auto& recent = statistics_.recent_attempts;
    recent.insert(recent.end(), failures.begin(), failures.end());
    if (recent.size() > kRecentAttemptLimit) {
        recent.erase(recent.begin(), std::next(recent.begin(), static_cast<std::ptrdiff_t>(recent.size() - kRecentAttemptLimit)));
    }
}

void ErrorRecoveryManager::logRetryAttempt(const RetryContext& context, const RetryAttempt& attempt) const {
    LOG_WARN_META("error_recovery",
                  "Retry attempt " + std::to_string(attempt.attempt_number) + " for operation '" +
                      context.getOperationName() + "' failed, next try in " +
                      std::to_string(attempt.delay.count()) + "ms - Error: " + attempt.error_message,
                  (LogMetadata{
                      {"operation", context.getOperationName()},
                      {"attempt", std::to_string(attempt.attempt_number)},
                      {"error_type", recoverableErrorTypeToString(attempt.error_type)},
                  }));
}

AutoRetryGuard::AutoRetryGuard(const std::string& operation_name)
    : AutoRetryGuard(operation_name, ErrorRecoveryManager::getInstance().getDefaultConfig()) {
}

AutoRetryGuard::AutoRetryGuard(const std::string& operation_name, const RetryConfig& config)
    : context_(operation_name, config), manager_(ErrorRecoveryManager::getInstance()) {
}

AutoRetryGuard::~AutoRetryGuard() = default;

namespace ErrorRecoveryUtils {

// EN: Used by the secret store and deployment service clients
// FR: Utilisée par les clients du magasin de secrets et du service de déploiement
RetryConfig createHttpRetryConfig() {
    RetryConfig config;
    config.max_attempts = 3;
    config.initial_delay = std::chrono::milliseconds(500);
    config.max_delay = std::chrono::seconds(10);
    config.backoff_multiplier = 2.0;
    config.enable_jitter = true;
    config.jitter_factor = 0.2;
    config.recoverable_errors = retryableByDefault();
    return config;
}

RecoverableErrorType classifyHttpError(int status_code) {
    switch (status_code) {
        case 429:
            return RecoverableErrorType::HTTP_429;
        case 502:
        case 503:
        case 504:
            return RecoverableErrorType::TEMPORARY_FAILURE;
        default:
            return status_code >= 500 && status_code <= 599 ? RecoverableErrorType::HTTP_5XX
                                                            : RecoverableErrorType::PERMANENT;
    }
}

} // namespace ErrorRecoveryUtils

} // namespace FGL
