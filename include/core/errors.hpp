// EN: Error taxonomy for Forgeline - Every stage failure is reported as a typed PipelineError
// FR: Taxonomie d'erreurs pour Forgeline - Chaque échec d'étape est signalé par une PipelineError typée

#pragma once

#include <stdexcept>
#include <string>

namespace FGL {

// EN: Error categories used for retry decisions and run reports
// FR: Catégories d'erreurs utilisées pour les décisions de retry et les rapports d'exécution
enum class ErrorKind {
    PROVISION = 0,          // EN: Environment could not be created / FR: Environnement non créé
    SECRET_NOT_FOUND = 1,   // EN: Credential missing / FR: Identifiant manquant
    ACCESS_DENIED = 2,      // EN: Credential not granted / FR: Identifiant non accordé
    BUILD = 3,              // EN: Broken build / FR: Build cassé
    PUBLISH = 4,            // EN: Registry push failure / FR: Échec de push vers le registre
    TRIGGER = 5,            // EN: Deployment request rejected / FR: Requête de déploiement rejetée
    TIMEOUT = 6,            // EN: Stage exceeded its timeout / FR: Étape hors délai
    CANCELLED = 7,          // EN: Run cancelled externally / FR: Exécution annulée de l'extérieur
    CONFIGURATION = 8,      // EN: Invalid pipeline or configuration / FR: Pipeline ou configuration invalide
    INTERNAL = 9            // EN: Unexpected failure / FR: Échec inattendu
};

// EN: Convert error kind to its report name (e.g. "PublishError")
// FR: Convertit le type d'erreur en nom de rapport (ex: "PublishError")
std::string errorKindToString(ErrorKind kind);

// EN: Base class of all pipeline errors
// FR: Classe de base de toutes les erreurs de pipeline
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message, bool transient = false)
        : std::runtime_error(message), kind_(kind), transient_(transient) {}

    ErrorKind kind() const noexcept { return kind_; }

    // EN: Transient errors are eligible for retry under the stage retry policy
    // FR: Les erreurs transitoires sont éligibles au retry selon la politique de l'étape
    bool isTransient() const noexcept { return transient_; }

private:
    ErrorKind kind_;
    bool transient_;
};

class ProvisionError : public PipelineError {
public:
    explicit ProvisionError(const std::string& message, bool transient = false)
        : PipelineError(ErrorKind::PROVISION, message, transient) {}
};

class SecretNotFoundError : public PipelineError {
public:
    explicit SecretNotFoundError(const std::string& message)
        : PipelineError(ErrorKind::SECRET_NOT_FOUND, message) {}
};

class AccessDeniedError : public PipelineError {
public:
    explicit AccessDeniedError(const std::string& message)
        : PipelineError(ErrorKind::ACCESS_DENIED, message) {}
};

class BuildError : public PipelineError {
public:
    explicit BuildError(const std::string& message)
        : PipelineError(ErrorKind::BUILD, message) {}
};

// EN: Network publish is transient-failure-prone, so PublishError is retryable
// FR: Le push réseau est sujet aux échecs transitoires, PublishError est donc réessayable
class PublishError : public PipelineError {
public:
    explicit PublishError(const std::string& message)
        : PipelineError(ErrorKind::PUBLISH, message, true) {}
};

class TriggerError : public PipelineError {
public:
    explicit TriggerError(const std::string& message)
        : PipelineError(ErrorKind::TRIGGER, message) {}
};

class StageTimeoutError : public PipelineError {
public:
    explicit StageTimeoutError(const std::string& message)
        : PipelineError(ErrorKind::TIMEOUT, message) {}
};

class RunCancelledError : public PipelineError {
public:
    explicit RunCancelledError(const std::string& message)
        : PipelineError(ErrorKind::CANCELLED, message) {}
};

class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError(ErrorKind::CONFIGURATION, message) {}
};

} // namespace FGL
