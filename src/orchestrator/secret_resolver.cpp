// EN: Secret Resolver implementation - environment and HTTP stores, scope checks, redaction
// FR: Implémentation du résolveur de secrets - magasins environnement et HTTP, portées, masquage

#include "orchestrator/secret_resolver.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace FGL {
namespace Orchestrator {

// EN: SecretValue
// FR: SecretValue

SecretValue::~SecretValue() {
    wipe();
}

SecretValue::SecretValue(SecretValue&& other) : value_(other.value_) {
    other.wipe();
}

SecretValue& SecretValue::operator=(SecretValue&& other) {
    if (this != &other) {
        wipe();
        value_.assign(other.value_);
        other.wipe();
    }
    return *this;
}

void SecretValue::wipe() noexcept {
    volatile char* p = value_.empty() ? nullptr : &value_[0];
    for (size_t i = 0; p && i < value_.size(); ++i) {
        p[i] = '\0';
    }
    value_.clear();
}

// EN: EnvironmentSecretStore
// FR: EnvironmentSecretStore

EnvironmentSecretStore::EnvironmentSecretStore(std::string prefix) : prefix_(std::move(prefix)) {}

std::string EnvironmentSecretStore::variableName(const std::string& store_key) const {
    std::string name = prefix_;
    for (char c : store_key) {
        unsigned char uc = static_cast<unsigned char>(c);
        name.push_back(std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_');
    }
    return name;
}

SecretValue EnvironmentSecretStore::fetch(const Credential& credential, const CancellationToken&) {
    const std::string key = credential.store_key.empty() ? credential.name : credential.store_key;
    const char* value = std::getenv(variableName(key).c_str());
    if (value == nullptr || *value == '\0') {
        throw SecretNotFoundError("Secret '" + credential.name + "' not found in environment (" +
                                  variableName(key) + ")");
    }
    return SecretValue(value);
}

// EN: HttpSecretStore
// FR: HttpSecretStore

HttpSecretStore::HttpSecretStore(std::shared_ptr<Http::HttpClient> client, std::string endpoint,
                                 std::string auth_token)
    : client_(std::move(client)),
      endpoint_(std::move(endpoint)),
      auth_token_(std::move(auth_token)),
      retry_config_(ErrorRecoveryUtils::createHttpRetryConfig()) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    if (!client_) {
        throw ConfigurationError("HttpSecretStore requires an HTTP client");
    }
    if (endpoint_.empty()) {
        throw ConfigurationError("HttpSecretStore requires an endpoint");
    }
}

SecretValue HttpSecretStore::fetch(const Credential& credential, const CancellationToken& cancellation) {
    RetryConfig config = retry_config_;
    config.cancellation = cancellation;

    try {
        return ErrorRecoveryManager::getInstance().executeWithRetry(
            "secret_fetch:" + credential.name, config,
            [&]() { return fetchOnce(credential, cancellation); });
    } catch (const PipelineError& e) {
        if (cancellation.isCancelled() && e.kind() == ErrorKind::INTERNAL) {
            throw RunCancelledError("Fetch of secret '" + credential.name + "' interrupted: " + cancellation.reason());
        }
        throw;
    }
}

SecretValue HttpSecretStore::fetchOnce(const Credential& credential, const CancellationToken& cancellation) {
    const std::string key = credential.store_key.empty() ? credential.name : credential.store_key;

    nlohmann::json body;
    body["Name"] = key;
    body["WithDecryption"] = credential.secret_type == SecretType::SECURE_STRING;

    std::map<std::string, std::string> headers = {{"Content-Type", "application/json"}};
    if (!auth_token_.empty()) {
        headers["Authorization"] = "Bearer " + auth_token_;
    }

    Http::HttpResponse response;
    try {
        response = client_->post(endpoint_ + "/GetParameter", headers, body.dump(), cancellation);
    } catch (const Http::HttpTransportError& e) {
        throw PipelineError(ErrorKind::INTERNAL, "Secret store unreachable: " + std::string(e.what()), true);
    }

    if (response.status == 404) {
        throw SecretNotFoundError("Secret '" + credential.name + "' not found in store (" + key + ")");
    }
    if (response.status == 401 || response.status == 403) {
        throw AccessDeniedError("Secret store denied access to '" + credential.name + "' (HTTP " +
                                std::to_string(response.status) + ")");
    }
    if (response.status == 429 || response.status >= 500) {
        throw PipelineError(ErrorKind::INTERNAL,
                            "Secret store unavailable (HTTP " + std::to_string(response.status) + ")", true);
    }
    if (response.status != 200) {
        throw PipelineError(ErrorKind::INTERNAL,
                            "Unexpected secret store reply (HTTP " + std::to_string(response.status) + ")");
    }

    nlohmann::json parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw PipelineError(ErrorKind::INTERNAL, "Malformed secret store reply for '" + credential.name + "'");
    }
    auto parameter = parsed.find("Parameter");
    if (parameter == parsed.end() || !parameter->is_object() || !parameter->contains("Value") ||
        !(*parameter)["Value"].is_string()) {
        throw SecretNotFoundError("Secret store reply for '" + credential.name + "' has no value");
    }
    return SecretValue((*parameter)["Value"].get<std::string>());
}

// EN: SecretBundle
// FR: SecretBundle

SecretBundle::~SecretBundle() {
    unregisterAll();
}

SecretBundle::SecretBundle(SecretBundle&& other) noexcept : values_(std::move(other.values_)) {
    other.values_.clear();
}

SecretBundle& SecretBundle::operator=(SecretBundle&& other) noexcept {
    if (this != &other) {
        unregisterAll();
        values_ = std::move(other.values_);
        other.values_.clear();
    }
    return *this;
}

void SecretBundle::add(const std::string& name, SecretValue value) {
    auto& logger = Logger::getInstance();
    logger.registerSecret(value.reveal());

    auto it = values_.find(name);
    if (it != values_.end()) {
        logger.unregisterSecret(it->second.reveal());
        it->second = std::move(value);
    } else {
        values_.emplace(name, std::move(value));
    }
}

const std::string& SecretBundle::value(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw AccessDeniedError("Secret '" + name + "' was not resolved for this stage");
    }
    return it->second.reveal();
}

std::vector<std::string> SecretBundle::names() const {
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& entry : values_) {
        out.push_back(entry.first);
    }
    return out;
}

void SecretBundle::unregisterAll() noexcept {
    try {
        auto& logger = Logger::getInstance();
        for (const auto& entry : values_) {
            logger.unregisterSecret(entry.second.reveal());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("secrets", std::string("Failed to unregister secrets: ") + e.what());
    }
    values_.clear();
}

// EN: SecretResolver
// FR: SecretResolver

SecretResolver::SecretResolver(std::vector<Credential> credentials, std::shared_ptr<SecretStore> store)
    : credentials_(std::move(credentials)), store_(std::move(store)) {
    if (!store_) {
        throw ConfigurationError("SecretResolver requires a secret store");
    }
}

SecretBundle SecretResolver::resolve(const std::string& stage_name, const std::vector<std::string>& scopes,
                                     const CancellationToken& cancellation) const {
    SecretBundle bundle;

    for (const auto& name : scopes) {
        if (bundle.has(name)) {
            continue;
        }
        if (cancellation.isCancelled()) {
            throw RunCancelledError("Secret resolution for stage '" + stage_name + "' interrupted: " +
                                    cancellation.reason());
        }

        auto it = std::find_if(credentials_.begin(), credentials_.end(),
                               [&](const Credential& c) { return c.name == name; });
        if (it == credentials_.end()) {
            throw SecretNotFoundError("Stage '" + stage_name + "' requested unknown credential '" + name + "'");
        }
        if (it->scope.count(stage_name) == 0) {
            throw AccessDeniedError("Credential '" + name + "' is not scoped to stage '" + stage_name + "'");
        }

        SecretValue value = store_->fetch(*it, cancellation);
        if (value.empty()) {
            throw SecretNotFoundError("Credential '" + name + "' resolved to an empty value");
        }
        bundle.add(name, std::move(value));

        LOG_DEBUG_META("secrets", "Credential resolved",
                       (std::unordered_map<std::string, std::string>{
                           {"stage", stage_name}, {"credential", name},
                           {"type", secretTypeToString(it->secret_type)}}));
    }

    return bundle;
}

} // namespace Orchestrator
} // namespace FGL
