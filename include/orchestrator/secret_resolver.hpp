// EN: Secret Resolver for Forgeline - Scoped, lazy credential resolution with log redaction
// FR: Résolveur de secrets pour Forgeline - Résolution paresseuse et restreinte avec masquage des logs

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/cancellation.hpp"
#include "http/http_client.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace FGL {
namespace Orchestrator {

// EN: Opaque secret value. Move-only; the buffer is wiped on destruction.
// FR: Valeur secrète opaque. Déplaçable uniquement; le buffer est effacé à la destruction.
class SecretValue {
public:
    SecretValue() = default;
    explicit SecretValue(std::string value) : value_(std::move(value)) {}
    ~SecretValue();

    SecretValue(const SecretValue&) = delete;
    SecretValue& operator=(const SecretValue&) = delete;
    SecretValue(SecretValue&& other);
    SecretValue& operator=(SecretValue&& other);

    const std::string& reveal() const { return value_; }
    bool empty() const { return value_.empty(); }

private:
    void wipe() noexcept;

    std::string value_;
};

// EN: Abstract secret store boundary
// FR: Frontière abstraite du magasin de secrets
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // EN: Throws SecretNotFoundError, AccessDeniedError, a transient PipelineError, or
    // RunCancelledError once cancellation fired
    // FR: Lance SecretNotFoundError, AccessDeniedError, une PipelineError transitoire, ou
    // RunCancelledError une fois l'annulation déclenchée
    virtual SecretValue fetch(const Credential& credential, const CancellationToken& cancellation) = 0;
};

// EN: Reads FGL_SECRET_<STORE_KEY> from the process environment (key upper-cased, non
// alphanumerics replaced by '_')
// FR: Lit FGL_SECRET_<STORE_KEY> dans l'environnement du processus (clé en majuscules,
// caractères non alphanumériques remplacés par '_')
class EnvironmentSecretStore : public SecretStore {
public:
    explicit EnvironmentSecretStore(std::string prefix = "FGL_SECRET_");

    SecretValue fetch(const Credential& credential, const CancellationToken& cancellation) override;

    std::string variableName(const std::string& store_key) const;

private:
    std::string prefix_;
};

// EN: Parameter-store style JSON API: POST {endpoint}/GetParameter
// {"Name": key, "WithDecryption": bool} -> {"Parameter": {"Value": "..."}}
// FR: API JSON de type parameter store: POST {endpoint}/GetParameter
// {"Name": clé, "WithDecryption": bool} -> {"Parameter": {"Value": "..."}}
class HttpSecretStore : public SecretStore {
public:
    HttpSecretStore(std::shared_ptr<Http::HttpClient> client, std::string endpoint, std::string auth_token = "");

    SecretValue fetch(const Credential& credential, const CancellationToken& cancellation) override;

    void setRetryConfig(const RetryConfig& config) { retry_config_ = config; }

private:
    SecretValue fetchOnce(const Credential& credential, const CancellationToken& cancellation);

    std::shared_ptr<Http::HttpClient> client_;
    std::string endpoint_;
    std::string auth_token_;
    RetryConfig retry_config_;
};

// EN: Secrets resolved for one stage. Values are registered with the log redactor for
// the lifetime of the bundle.
// FR: Secrets résolus pour une étape. Les valeurs sont enregistrées auprès du masqueur de
// logs pendant la durée de vie du bundle.
class SecretBundle {
public:
    SecretBundle() = default;
    ~SecretBundle();

    SecretBundle(const SecretBundle&) = delete;
    SecretBundle& operator=(const SecretBundle&) = delete;
    SecretBundle(SecretBundle&& other) noexcept;
    SecretBundle& operator=(SecretBundle&& other) noexcept;

    void add(const std::string& name, SecretValue value);

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    // EN: Throws AccessDeniedError if the stage did not resolve this credential
    // FR: Lance AccessDeniedError si l'étape n'a pas résolu cet identifiant
    const std::string& value(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    void unregisterAll() noexcept;

    std::map<std::string, SecretValue> values_;
};

// EN: Resolves the credentials a stage declared, checking each credential's scope
// FR: Résout les identifiants déclarés par une étape, en vérifiant la portée de chacun
class SecretResolver {
public:
    SecretResolver(std::vector<Credential> credentials, std::shared_ptr<SecretStore> store);

    // EN: Throws SecretNotFoundError (unknown or missing) or AccessDeniedError (out of scope)
    // FR: Lance SecretNotFoundError (inconnu ou absent) ou AccessDeniedError (hors portée)
    SecretBundle resolve(const std::string& stage_name, const std::vector<std::string>& scopes,
                         const CancellationToken& cancellation = CancellationToken()) const;

    const std::vector<Credential>& credentials() const { return credentials_; }

private:
    std::vector<Credential> credentials_;
    std::shared_ptr<SecretStore> store_;
};

} // namespace Orchestrator
} // namespace FGL
