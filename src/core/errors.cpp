// EN: Error taxonomy helpers
// FR: Utilitaires de la taxonomie d'erreurs

#include "core/errors.hpp"

namespace FGL {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PROVISION:        return "ProvisionError";
        case ErrorKind::SECRET_NOT_FOUND: return "SecretNotFoundError";
        case ErrorKind::ACCESS_DENIED:    return "AccessDeniedError";
        case ErrorKind::BUILD:            return "BuildError";
        case ErrorKind::PUBLISH:          return "PublishError";
        case ErrorKind::TRIGGER:          return "TriggerError";
        case ErrorKind::TIMEOUT:          return "StageTimeoutError";
        case ErrorKind::CANCELLED:        return "RunCancelledError";
        case ErrorKind::CONFIGURATION:    return "ConfigurationError";
        case ErrorKind::INTERNAL:         return "InternalError";
        default:                          return "UnknownError";
    }
}

} // namespace FGL
