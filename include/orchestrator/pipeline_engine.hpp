#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_executor.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace FGL {
namespace Orchestrator {

// EN: Strictly increasing run numbers. With a state directory the counter lives in
// <dir>/run_number, guarded by flock so that concurrent processes never share a number.
// FR: Numéros d'exécution strictement croissants. Avec un répertoire d'état le compteur est
// dans <dir>/run_number, protégé par flock pour que deux processus ne partagent jamais un numéro.
class RunNumberAllocator {
public:
    explicit RunNumberAllocator(std::string state_directory = "");

    uint64_t next();

    // EN: Last allocated number (0 if none)
    // FR: Dernier numéro alloué (0 si aucun)
    uint64_t current() const;

    const std::string& stateDirectory() const { return state_directory_; }

private:
    std::string counterPath() const;

    std::string state_directory_;
    mutable std::mutex mutex_;
    uint64_t last_{0};
};

// EN: Handle returned by startRun; the future yields the final report
// FR: Handle retourné par startRun; le future fournit le rapport final
struct RunHandle {
    uint64_t run_number = 0;
    std::string run_id;
    std::shared_future<RunReport> report;
};

// EN: Run engine: one definition, many runs. Each run executes on its own thread and
// independent runs may overlap.
// FR: Moteur d'exécution: une définition, plusieurs exécutions. Chaque exécution tourne sur
// son propre thread et des exécutions indépendantes peuvent se chevaucher.
class PipelineEngine {
public:
    struct Config {
        std::string state_directory;             // EN: Run counter location (empty: in memory) / FR: Emplacement du compteur (vide: en mémoire)
        std::string reports_directory;           // EN: run-<n>.json location (empty: not persisted) / FR: Emplacement de run-<n>.json (vide: non persisté)
        bool supersede_previous = true;          // EN: New run on a branch aborts the older one / FR: Une nouvelle exécution sur une branche annule l'ancienne
        size_t max_history = 50;                 // EN: Finished reports kept in memory / FR: Rapports terminés gardés en mémoire
    };

    // EN: Throws ConfigurationError when the definition does not validate
    // FR: Lance ConfigurationError si la définition n'est pas valide
    PipelineEngine(PipelineDefinition definition, PipelineComponents components, Config config);
    PipelineEngine(PipelineDefinition definition, PipelineComponents components);
    ~PipelineEngine();

    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    // EN: Start a run for a push event and return immediately
    // FR: Démarre une exécution pour un événement push et retourne immédiatement
    RunHandle startRun(const PushEvent& event);

    // EN: Blocking variant of startRun
    // FR: Variante bloquante de startRun
    RunReport executeRun(const PushEvent& event);

    bool cancelRun(uint64_t run_number, const std::string& reason = "cancelled by operator");
    size_t cancelAll(const std::string& reason = "engine shutdown");

    std::optional<RunStatus> getRunStatus(uint64_t run_number) const;
    std::vector<uint64_t> getActiveRuns() const;

    // EN: Finished runs, oldest first
    // FR: Exécutions terminées, de la plus ancienne à la plus récente
    std::vector<RunReport> getHistory() const;

    void waitAll();

    void registerEventCallback(PipelineEventCallback callback);

    const PipelineDefinition& definition() const;
    const Config& getConfig() const;

private:
    class PipelineEngineImpl;
    std::unique_ptr<PipelineEngineImpl> impl_;
};

// EN: Utility functions for pipeline management
// FR: Fonctions utilitaires pour la gestion de pipeline
namespace PipelineUtils {

    // EN: Pipeline definition files; throw ConfigurationError on malformed input
    // FR: Fichiers de définition de pipeline; lancent ConfigurationError sur entrée malformée
    PipelineDefinition loadPipelineFromYAML(const std::string& filepath);
    PipelineDefinition loadPipelineFromString(const std::string& yaml_content);

    // EN: Structural checks; returns one message per problem (empty when valid)
    // FR: Vérifications structurelles; retourne un message par problème (vide si valide)
    std::vector<std::string> validateStages(const PipelineDefinition& definition);

    bool isValidStageName(const std::string& name);

    // EN: Run report persistence
    // FR: Persistance des rapports d'exécution
    nlohmann::json reportToJson(const RunReport& report);
    std::string reportFileName(uint64_t run_number);

    // EN: Writes <directory>/run-<n>.json; returns the path, or an empty string on failure
    // FR: Écrit <répertoire>/run-<n>.json; retourne le chemin, ou une chaîne vide en cas d'échec
    std::string saveReport(const RunReport& report, const std::string& directory);

    // EN: Time and duration utilities
    // FR: Utilitaires de temps et de durée
    std::string formatDuration(std::chrono::milliseconds duration);
    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);

} // namespace PipelineUtils

} // namespace Orchestrator
} // namespace FGL
