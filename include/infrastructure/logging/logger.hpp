#pragma once

#include "infrastructure/logging/secret_redactor.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FGL {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: "debug", "INFO", "warning"... Unknown names give INFO.
// FR: "debug", "INFO", "warning"... Les noms inconnus donnent INFO.
LogLevel logLevelFromString(const std::string& name);
std::string logLevelToString(LogLevel level);

using LogMetadata = std::unordered_map<std::string, std::string>;

// EN: Process-wide NDJSON logger. Every line carries timestamp, level, module, thread and the
// calling thread's correlation id (the run id while a pipeline runs). Live secrets never reach an output.
// FR: Logger NDJSON du processus. Chaque ligne porte horodatage, niveau, module, thread et l'ID de
// corrélation du thread appelant (l'ID d'exécution pendant un pipeline). Les secrets vivants n'atteignent aucune sortie.
class Logger {
public:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        LogMetadata metadata;
    };

    // EN: Extra destination called with every redacted entry (tests, collectors)
    // FR: Destination supplémentaire appelée avec chaque entrée masquée (tests, collecteurs)
    using Sink = std::function<void(const LogEntry& entry, const std::string& ndjson)>;

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Appends to filename and turns console output off. On failure console output stays on.
    // FR: Ajoute à filename et coupe la console. En cas d'échec la console reste active.
    void setOutputFile(const std::string& filename);
    void setConsoleOutput(bool enabled);
    void setSink(Sink sink);

    void setCorrelationId(const std::string& correlation_id);
    std::string getCorrelationId() const;

    // EN: Added to every entry unless the entry sets the same key
    // FR: Ajoutée à chaque entrée sauf si l'entrée définit la même clé
    void addGlobalMetadata(const std::string& key, const std::string& value);

    void registerSecret(const std::string& value) { redactor_.add(value); }
    void unregisterSecret(const std::string& value) { redactor_.remove(value); }
    std::string redact(const std::string& text) const { return redactor_.apply(text); }

    void log(LogLevel level, const std::string& module, const std::string& message,
             const LogMetadata& metadata = {});

    void flush();

    // EN: Random 8-4-4-4-12 hex identifier
    // FR: Identifiant hexadécimal aléatoire 8-4-4-4-12
    std::string generateCorrelationId();

    // EN: Level INFO, console on, no file, sink, metadata or secrets
    // FR: Niveau INFO, console active, sans fichier, récepteur, métadonnées ni secrets
    void reset();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string toNdjson(const LogEntry& entry) const;

    mutable std::mutex mutex_;
    LogLevel threshold_ = LogLevel::INFO;
    bool console_output_ = true;
    std::unique_ptr<std::ofstream> file_;
    Sink sink_;
    LogMetadata global_metadata_;
    SecretRedactor redactor_;
};

// EN: Binds a correlation id to the current thread and restores the previous one on exit
// FR: Lie un ID de corrélation au thread courant et restaure le précédent en sortie
class ScopedCorrelationId {
public:
    explicit ScopedCorrelationId(const std::string& correlation_id);
    ~ScopedCorrelationId();

    ScopedCorrelationId(const ScopedCorrelationId&) = delete;
    ScopedCorrelationId& operator=(const ScopedCorrelationId&) = delete;

private:
    std::string previous_;
};

#define LOG_DEBUG(module, message) FGL::Logger::getInstance().log(FGL::LogLevel::DEBUG, module, message)
#define LOG_INFO(module, message) FGL::Logger::getInstance().log(FGL::LogLevel::INFO, module, message)
#define LOG_WARN(module, message) FGL::Logger::getInstance().log(FGL::LogLevel::WARN, module, message)
#define LOG_ERROR(module, message) FGL::Logger::getInstance().log(FGL::LogLevel::ERROR, module, message)

#define LOG_DEBUG_META(module, message, metadata) FGL::Logger::getInstance().log(FGL::LogLevel::DEBUG, module, message, metadata)
#define LOG_INFO_META(module, message, metadata) FGL::Logger::getInstance().log(FGL::LogLevel::INFO, module, message, metadata)
#define LOG_WARN_META(module, message, metadata) FGL::Logger::getInstance().log(FGL::LogLevel::WARN, module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) FGL::Logger::getInstance().log(FGL::LogLevel::ERROR, module, message, metadata)

} // namespace FGL
