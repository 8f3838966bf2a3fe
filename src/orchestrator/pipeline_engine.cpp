#include "orchestrator/pipeline_engine.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <sstream>

namespace FGL {
namespace Orchestrator {

class PipelineEngine::PipelineEngineImpl {
public:
    PipelineEngineImpl(PipelineDefinition definition, PipelineComponents components, Config config)
        : definition_(std::make_shared<const PipelineDefinition>(std::move(definition))),
          executor_(std::move(components)),
          config_(std::move(config)),
          allocator_(config_.state_directory) {
        auto errors = PipelineUtils::validateStages(*definition_);
        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "Invalid pipeline '" << definition_->name << "':";
            for (const auto& error : errors) {
                oss << "\n  - " << error;
            }
            throw ConfigurationError(oss.str());
        }

        executor_.registerEventCallback([this](const PipelineEvent& event) {
            if (event.type == PipelineEventType::RUN_STARTED) {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = statuses_.find(event.run_number);
                if (it != statuses_.end()) {
                    it->second = RunStatus::RUNNING;
                }
            }
        });
    }

    RunHandle startRun(const PushEvent& event) {
        const uint64_t run_number = allocator_.next();
        const std::string run_id = Logger::getInstance().generateCorrelationId();
        CancellationToken token;
        auto context = std::make_shared<PipelineRunContext>(run_number, run_id, event, definition_, token);

        std::lock_guard<std::mutex> lock(mutex_);
        pruneFinishedLocked();

        if (config_.supersede_previous) {
            for (auto& [number, run] : active_) {
                if (run.branch == event.branch && statuses_.count(number) > 0) {
                    LOG_WARN_META("engine", "Superseding older run",
                                  (std::unordered_map<std::string, std::string>{
                                      {"run_number", std::to_string(number)},
                                      {"superseded_by", std::to_string(run_number)},
                                      {"branch", event.branch}}));
                    run.token.cancel("superseded by run #" + std::to_string(run_number));
                }
            }
        }

        statuses_[run_number] = RunStatus::PENDING;
        auto future = std::async(std::launch::async, [this, context]() { return runTask(context); }).share();
        active_[run_number] = ActiveRun{event.branch, token, future};

        LOG_INFO_META("engine", "Run scheduled",
                      (std::unordered_map<std::string, std::string>{
                          {"run_number", std::to_string(run_number)}, {"run_id", run_id},
                          {"branch", event.branch}, {"commit", event.commit}}));
        return RunHandle{run_number, run_id, future};
    }

    bool cancelRun(uint64_t run_number, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(run_number);
        if (it == active_.end() || statuses_.count(run_number) == 0) {
            return false;
        }
        it->second.token.cancel(reason);
        return true;
    }

    size_t cancelAll(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t cancelled = 0;
        for (auto& [number, run] : active_) {
            if (statuses_.count(number) > 0) {
                run.token.cancel(reason);
                ++cancelled;
            }
        }
        if (cancelled > 0) {
            LOG_WARN("engine", "Cancelled " + std::to_string(cancelled) + " in-flight run(s): " + reason);
        }
        return cancelled;
    }

    std::optional<RunStatus> getRunStatus(uint64_t run_number) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = statuses_.find(run_number);
        if (it != statuses_.end()) {
            return it->second;
        }
        for (const auto& report : history_) {
            if (report.run_number == run_number) {
                return report.status;
            }
        }
        return std::nullopt;
    }

    std::vector<uint64_t> getActiveRuns() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<uint64_t> runs;
        for (const auto& entry : statuses_) {
            runs.push_back(entry.first);
        }
        return runs;
    }

    std::vector<RunReport> getHistory() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<RunReport>(history_.begin(), history_.end());
    }

    void waitAll() {
        std::vector<std::shared_future<RunReport>> futures;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : active_) {
                futures.push_back(entry.second.future);
            }
        }
        for (auto& future : futures) {
            future.wait();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        pruneFinishedLocked();
    }

    void registerEventCallback(PipelineEventCallback callback) {
        executor_.registerEventCallback(std::move(callback));
    }

    const PipelineDefinition& definition() const { return *definition_; }
    const Config& config() const { return config_; }

private:
    struct ActiveRun {
        std::string branch;
        CancellationToken token;
        std::shared_future<RunReport> future;
    };

    RunReport runTask(const std::shared_ptr<PipelineRunContext>& context) {
        RunReport report;
        try {
            report = executor_.execute(*context);
        } catch (const std::exception& e) {
            report.run_number = context->runNumber();
            report.run_id = context->runId();
            report.pipeline_name = definition_->name;
            report.trigger = context->trigger();
            report.status = RunStatus::FAILED;
            report.error_message = Logger::getInstance().redact(e.what());
            report.end_time = std::chrono::system_clock::now();
            LOG_ERROR("engine", "Run #" + std::to_string(context->runNumber()) + " crashed: " + report.error_message);
        }

        if (!config_.reports_directory.empty()) {
            std::string path = PipelineUtils::saveReport(report, config_.reports_directory);
            if (path.empty()) {
                LOG_ERROR("engine", "Could not persist report of run #" + std::to_string(report.run_number));
            } else {
                LOG_DEBUG("engine", "Report written to " + path);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        statuses_.erase(report.run_number);
        history_.push_back(report);
        while (history_.size() > std::max<size_t>(1, config_.max_history)) {
            history_.pop_front();
        }
        return report;
    }

    // EN: Forget finished runs; their reports are in history_
    // FR: Oublie les exécutions terminées; leurs rapports sont dans history_
    void pruneFinishedLocked() {
        for (auto it = active_.begin(); it != active_.end();) {
            if (statuses_.count(it->first) == 0 &&
                it->second.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it = active_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::shared_ptr<const PipelineDefinition> definition_;
    PipelineExecutor executor_;
    Config config_;
    RunNumberAllocator allocator_;

    mutable std::mutex mutex_;
    std::map<uint64_t, ActiveRun> active_;
    std::map<uint64_t, RunStatus> statuses_;    // EN: Runs not finished yet / FR: Exécutions non terminées
    std::deque<RunReport> history_;
};

PipelineEngine::PipelineEngine(PipelineDefinition definition, PipelineComponents components, Config config)
    : impl_(std::make_unique<PipelineEngineImpl>(std::move(definition), std::move(components), std::move(config))) {}

PipelineEngine::PipelineEngine(PipelineDefinition definition, PipelineComponents components)
    : PipelineEngine(std::move(definition), std::move(components), Config{}) {}

PipelineEngine::~PipelineEngine() {
    impl_->cancelAll("engine shutdown");
    impl_->waitAll();
}

RunHandle PipelineEngine::startRun(const PushEvent& event) {
    return impl_->startRun(event);
}

RunReport PipelineEngine::executeRun(const PushEvent& event) {
    return startRun(event).report.get();
}

bool PipelineEngine::cancelRun(uint64_t run_number, const std::string& reason) {
    return impl_->cancelRun(run_number, reason);
}

size_t PipelineEngine::cancelAll(const std::string& reason) {
    return impl_->cancelAll(reason);
}

std::optional<RunStatus> PipelineEngine::getRunStatus(uint64_t run_number) const {
    return impl_->getRunStatus(run_number);
}

std::vector<uint64_t> PipelineEngine::getActiveRuns() const {
    return impl_->getActiveRuns();
}

std::vector<RunReport> PipelineEngine::getHistory() const {
    return impl_->getHistory();
}

void PipelineEngine::waitAll() {
    impl_->waitAll();
}

void PipelineEngine::registerEventCallback(PipelineEventCallback callback) {
    impl_->registerEventCallback(std::move(callback));
}

const PipelineDefinition& PipelineEngine::definition() const {
    return impl_->definition();
}

const PipelineEngine::Config& PipelineEngine::getConfig() const {
    return impl_->config();
}

} // namespace Orchestrator
} // namespace FGL
