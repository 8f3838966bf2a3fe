// EN: fglctl - command line entry point. Loads the configuration and a pipeline definition,
// wires the Docker, secret store and deployment backends, then runs one push event.
// FR: fglctl - point d'entrée en ligne de commande. Charge la configuration et une définition
// de pipeline, branche Docker, le magasin de secrets et le déploiement, puis exécute un push.

#include "core/errors.hpp"
#include "http/http_client.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/service_settings.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/artifact_builder.hpp"
#include "orchestrator/deployment_trigger.hpp"
#include "orchestrator/environment_provisioner.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/registry_publisher.hpp"
#include "orchestrator/secret_resolver.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitSucceeded = 0;
constexpr int kExitFailed = 1;
constexpr int kExitAborted = 2;
constexpr int kExitUsage = 64;

using namespace FGL;
using namespace FGL::Orchestrator;

void printUsage() {
    std::cout << "Usage: fglctl COMMAND [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  run        Run the pipeline for one push event" << std::endl;
    std::cout << "  validate   Check a pipeline definition and exit" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --pipeline FILE    Pipeline definition (YAML)" << std::endl;
    std::cout << "  --config FILE      Forgeline configuration (YAML)" << std::endl;
    std::cout << "  --branch NAME      Pushed branch" << std::endl;
    std::cout << "  --commit SHA       Pushed commit" << std::endl;
    std::cout << "  --repo-url URL     Source repository URL" << std::endl;
    std::cout << "  --log-file FILE    Also write NDJSON logs to FILE" << std::endl;
    std::cout << "  --log-level LEVEL  debug, info, warn or error" << std::endl;
    std::cout << "  -h, --help         Show this help" << std::endl;
    std::cout << "  -v, --version      Show version" << std::endl;
}

// EN: "--name value" pairs after the command; returns false on a dangling or unknown option
// FR: Paires "--nom valeur" après la commande; retourne false sur option orpheline ou inconnue
bool parseOptions(int argc, char* argv[], std::map<std::string, std::string>& options) {
    static const std::vector<std::string> known = {
        "--pipeline", "--config", "--branch", "--commit", "--repo-url", "--log-file", "--log-level"};

    for (int i = 2; i < argc; ++i) {
        std::string name = argv[i];
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            std::cerr << "Unknown option: " << name << std::endl;
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << name << std::endl;
            return false;
        }
        options[name] = argv[++i];
    }
    return true;
}

void configureLogging(const ServiceSettings& settings, const std::map<std::string, std::string>& options) {
    auto& logger = Logger::getInstance();
    std::string level = settings.logging.level;
    std::string file = settings.logging.file;

    auto it = options.find("--log-level");
    if (it != options.end()) {
        level = it->second;
    }
    it = options.find("--log-file");
    if (it != options.end()) {
        file = it->second;
    }

    logger.setLogLevel(logLevelFromString(level));
    if (!file.empty()) {
        logger.setOutputFile(file);
    }
}

bool hasTriggerStage(const PipelineDefinition& definition) {
    return std::any_of(definition.stages.begin(), definition.stages.end(), [](const StageSpec& stage) {
        return std::holds_alternative<TriggerAction>(stage.action);
    });
}

// EN: Used when the pipeline never deploys and no endpoint is configured
// FR: Utilisé quand le pipeline ne déploie jamais et qu'aucun endpoint n'est configuré
class UnconfiguredDeploymentService : public DeploymentService {
public:
    DeploymentAck updateService(const DeploymentRequest&) override {
        throw TriggerError("deploy.endpoint is not configured");
    }
};

PipelineComponents buildComponents(const ServiceSettings& settings, const PipelineDefinition& definition) {
    auto runner = std::make_shared<PosixProcessRunner>();

    DockerProvisionerOptions provisioner_options;
    provisioner_options.docker_binary = settings.provisioner.docker_binary;
    provisioner_options.pull_policy = pullPolicyFromString(settings.provisioner.pull_policy);
    provisioner_options.allowed_mounts = settings.provisioner.allowed_mounts;
    if (!settings.provisioner.idle_command.empty()) {
        provisioner_options.idle_command = settings.provisioner.idle_command;
    }

    auto http_client = std::make_shared<Http::HttpClient>(5000, settings.deploy.timeout_ms);

    std::shared_ptr<SecretStore> secret_store;
    if (settings.secrets.backend == "http") {
        secret_store = std::make_shared<HttpSecretStore>(http_client, settings.secrets.endpoint,
                                                         settings.secrets.auth_token);
    } else {
        secret_store = std::make_shared<EnvironmentSecretStore>(settings.secrets.prefix);
    }

    const std::string registry_url = settings.registry.url.empty() ? definition.registry_url : settings.registry.url;

    std::shared_ptr<DeploymentService> deployment_service;
    if (!settings.deploy.endpoint.empty()) {
        deployment_service = std::make_shared<HttpDeploymentService>(http_client, settings.deploy.endpoint);
    } else if (hasTriggerStage(definition)) {
        throw ConfigurationError("deploy.endpoint is required by pipeline '" + definition.name + "'");
    } else {
        deployment_service = std::make_shared<UnconfiguredDeploymentService>();
    }

    PipelineComponents components;
    components.provisioner = std::make_shared<DockerEnvironmentProvisioner>(runner, provisioner_options);
    components.secret_store = secret_store;
    components.builder = std::make_shared<ArtifactBuilder>(provisioner_options.docker_binary);
    components.publisher = std::make_shared<RegistryPublisher>(
        std::make_shared<DockerRegistryClient>(provisioner_options.docker_binary), registry_url);
    components.trigger = std::make_shared<DeploymentTrigger>(
        deployment_service, imageReferenceFromString(settings.deploy.image_reference));
    return components;
}

PipelineEngine::Config engineConfig(const ServiceSettings& settings) {
    PipelineEngine::Config config;
    config.state_directory = settings.engine.state_directory;
    config.reports_directory = settings.engine.reports_directory;
    config.supersede_previous = settings.engine.supersede_previous;
    config.max_history = static_cast<size_t>(settings.engine.max_history);
    return config;
}

void printReport(const RunReport& report) {
    std::cout << "Run #" << report.run_number << " " << runStatusToString(report.status)
              << " in " << PipelineUtils::formatDuration(report.duration) << std::endl;
    for (const auto& stage : report.stages) {
        std::cout << "  " << stage.name << " [" << stage.action << "] "
                  << stageStatusToString(stage.status);
        if (stage.attempts > 1) {
            std::cout << " after " << stage.attempts << " attempts";
        }
        if (!stage.error_message.empty()) {
            std::cout << ": " << stage.error_message;
        }
        std::cout << std::endl;
    }
    if (report.artifact) {
        std::cout << "  artifact " << report.artifact->imageRef() << " " << report.artifact->digest() << std::endl;
    }
    if (report.deployment) {
        std::cout << "  deployment " << report.deployment->deployment_id << " -> "
                  << report.deployment->image_ref << std::endl;
    }
}

int commandValidate(const std::map<std::string, std::string>& options) {
    auto it = options.find("--pipeline");
    if (it == options.end()) {
        std::cerr << "validate requires --pipeline FILE" << std::endl;
        return kExitUsage;
    }

    PipelineDefinition definition = PipelineUtils::loadPipelineFromYAML(it->second);
    auto errors = PipelineUtils::validateStages(definition);
    if (!errors.empty()) {
        std::cerr << "Pipeline '" << definition.name << "' is invalid:" << std::endl;
        for (const auto& error : errors) {
            std::cerr << "  - " << error << std::endl;
        }
        return kExitUsage;
    }

    std::cout << "Pipeline '" << definition.name << "' is valid (" << definition.stages.size()
              << " stages)" << std::endl;
    return kExitSucceeded;
}

int commandRun(const ServiceSettings& settings, const std::map<std::string, std::string>& options) {
    for (const char* required : {"--pipeline", "--branch", "--commit"}) {
        if (options.count(required) == 0) {
            std::cerr << "run requires " << required << std::endl;
            return kExitUsage;
        }
    }

    PipelineDefinition definition = PipelineUtils::loadPipelineFromYAML(options.at("--pipeline"));

    PushEvent event;
    event.branch = options.at("--branch");
    event.commit = options.at("--commit");
    auto repo_it = options.find("--repo-url");
    event.repository_url = repo_it != options.end() ? repo_it->second : definition.repository;

    PipelineComponents components = buildComponents(settings, definition);
    PipelineEngine engine(std::move(definition), std::move(components), engineConfig(settings));

    // EN: SIGINT/SIGTERM abort the run; the callback is dropped before the engine goes away
    // FR: SIGINT/SIGTERM annulent l'exécution; le callback est retiré avant la destruction du moteur
    struct SignalRegistration {
        explicit SignalRegistration(PipelineEngine& engine) {
            auto& signals = SignalHandler::getInstance();
            signals.initialize();
            signals.registerCleanupCallback("engine", [&engine]() { engine.cancelAll("interrupted by signal"); });
        }
        ~SignalRegistration() { SignalHandler::getInstance().unregisterCleanupCallback("engine"); }
    } registration(engine);

    RunReport report = engine.executeRun(event);

    printReport(report);
    Logger::getInstance().flush();

    switch (report.status) {
        case RunStatus::SUCCEEDED:
            return kExitSucceeded;
        case RunStatus::ABORTED:
            return kExitAborted;
        default:
            return kExitFailed;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return kExitUsage;
    }

    std::string command = argv[1];
    if (command == "--version" || command == "-v") {
        std::cout << "fglctl " << kVersion << std::endl;
        std::cout << "Build: " << __DATE__ << " " << __TIME__ << std::endl;
        return kExitSucceeded;
    }
    if (command == "--help" || command == "-h") {
        printUsage();
        return kExitSucceeded;
    }
    if (command != "run" && command != "validate") {
        std::cerr << "Unknown command: " << command << std::endl;
        printUsage();
        return kExitUsage;
    }

    std::map<std::string, std::string> options;
    if (!parseOptions(argc, argv, options)) {
        return kExitUsage;
    }

    auto& config = ConfigManager::getInstance();
    auto config_it = options.find("--config");
    if (config_it != options.end() && !config.loadFromFile(config_it->second)) {
        std::cerr << "Cannot load configuration " << config_it->second << std::endl;
        return kExitUsage;
    }
    config.loadEnvironmentOverrides("FGL_");
    config.addValidationRules(ServiceSettings::validationRules());

    std::vector<std::string> config_errors;
    const ServiceSettings settings = ServiceSettings::fromConfig(config);
    if (config.validate(config_errors)) {
        config_errors = settings.consistencyErrors();
    }
    if (!config_errors.empty()) {
        for (const auto& error : config_errors) {
            std::cerr << "Configuration error: " << error << std::endl;
        }
        return kExitUsage;
    }

    configureLogging(settings, options);

    try {
        if (command == "validate") {
            return commandValidate(options);
        }
        return commandRun(settings, options);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "fglctl: " << Logger::getInstance().redact(e.what()) << std::endl;
        return kExitFailed;
    }
}
