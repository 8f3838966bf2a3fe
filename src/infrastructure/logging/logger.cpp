// EN: Logger - one redacted NDJSON object per line, to console, file and an optional sink.
// FR: Logger - un objet NDJSON masqué par ligne, vers la console, un fichier et un récepteur optionnel.

#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

namespace FGL {

namespace {

thread_local std::string tls_correlation_id;

const std::string& currentThreadId() {
    thread_local const std::string id = [] {
        std::ostringstream out;
        out << std::this_thread::get_id();
        return out.str();
    }();
    return id;
}

// EN: 2024-05-01T12:30:45.123Z
std::string iso8601(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char stamp[32];
    const size_t len = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(stamp + len, sizeof(stamp) - len, ".%03dZ", static_cast<int>(millis));
    return stamp;
}

} // namespace

LogLevel logLevelFromString(const std::string& name) {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::setOutputFile(const std::string& filename) {
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    file_ = std::move(file);
    console_output_ = false;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    tls_correlation_id = correlation_id;
}

std::string Logger::getCorrelationId() const {
    return tls_correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const LogMetadata& metadata) {
    LogEntry entry;
    std::string line;
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }

        entry.timestamp = std::chrono::system_clock::now();
        entry.level = level;
        entry.module = module;
        entry.correlation_id = tls_correlation_id;
        entry.thread_id = currentThreadId();
        entry.message = redactor_.apply(message);
        for (const auto& [key, value] : metadata) {
            entry.metadata.emplace(key, redactor_.apply(value));
        }
        for (const auto& [key, value] : global_metadata_) {
            entry.metadata.emplace(key, value);
        }

        line = toNdjson(entry);
        if (file_) {
            *file_ << line << std::endl;
        }
        if (console_output_) {
            std::cout << line << std::endl;
        }
        sink = sink_;
    }

    // EN: The sink runs unlocked and may log in turn
    // FR: Le récepteur s'exécute sans verrou et peut journaliser à son tour
    if (sink) {
        sink(entry, line);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        file_->flush();
    }
    std::cout.flush();
}

std::string Logger::generateCorrelationId() {
    thread_local std::mt19937_64 generator(std::random_device{}());
    const uint64_t high = generator();
    const uint64_t low = generator();

    char id[37];
    std::snprintf(id, sizeof(id), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%012" PRIx64,
                  high >> 32, (high >> 16) & 0xffff, high & 0xffff, low >> 48, low & 0xffffffffffffULL);
    return id;
}

void Logger::reset() {
    redactor_.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = LogLevel::INFO;
    console_output_ = true;
    file_.reset();
    sink_ = nullptr;
    global_metadata_.clear();
}

std::string Logger::toNdjson(const LogEntry& entry) const {
    nlohmann::json line = {
        {"timestamp", iso8601(entry.timestamp)},
        {"level", logLevelToString(entry.level)},
        {"module", entry.module},
        {"message", entry.message},
        {"thread_id", entry.thread_id},
    };
    if (!entry.correlation_id.empty()) {
        line["correlation_id"] = entry.correlation_id;
    }

    // EN: Metadata never replaces the fields above
    // FR: Les métadonnées ne remplacent jamais les champs ci-dessus
    for (const auto& [key, value] : entry.metadata) {
        line.emplace(key, value);
    }
    return line.dump();
}

ScopedCorrelationId::ScopedCorrelationId(const std::string& correlation_id)
    : previous_(tls_correlation_id) {
    tls_correlation_id = correlation_id;
}

ScopedCorrelationId::~ScopedCorrelationId() {
    tls_correlation_id = previous_;
}

} // namespace FGL
