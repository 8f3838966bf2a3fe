#pragma once

#include "infrastructure/config/config_manager.hpp"

#include <string>
#include <vector>

namespace FGL {

// EN: Typed view of forgeline.yaml. Every field has the default used when the key is absent.
// FR: Vue typée de forgeline.yaml. Chaque champ porte la valeur par défaut utilisée si la clé manque.
struct ServiceSettings {
    struct Logging {
        std::string level = "info";
        std::string file;
    };

    struct Provisioner {
        std::string docker_binary = "docker";
        std::string pull_policy = "if-missing";
        std::vector<std::string> allowed_mounts;
        std::string idle_command;
    };

    struct Registry {
        std::string url;
    };

    struct Deploy {
        std::string endpoint;
        std::string image_reference = "latest";
        int timeout_ms = 30000;
    };

    struct Secrets {
        std::string backend = "env";
        std::string endpoint;
        std::string auth_token;
        std::string prefix = "FGL_SECRET_";
    };

    struct Engine {
        std::string state_directory;
        std::string reports_directory;
        bool supersede_previous = true;
        int max_history = 50;
    };

    Logging logging;
    Provisioner provisioner;
    Registry registry;
    Deploy deploy;
    Secrets secrets;
    Engine engine;

    // EN: Rules fglctl registers before reading the settings
    // FR: Règles enregistrées par fglctl avant la lecture des réglages
    static std::vector<ConfigManager::ValidationRule> validationRules();

    // EN: Reads every known key. Keys of the wrong kind keep their default.
    // FR: Lit toutes les clés connues. Une clé du mauvais type garde sa valeur par défaut.
    static ServiceSettings fromConfig(const ConfigManager& config);

    // EN: Cross-key checks that single rules cannot express (http backend without endpoint)
    // FR: Contrôles croisés qu'une règle seule ne peut exprimer (backend http sans endpoint)
    std::vector<std::string> consistencyErrors() const;
};

} // namespace FGL
