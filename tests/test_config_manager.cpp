// EN: Unit tests for the ConfigManager - YAML loading, typed values, environment overrides and validation
// FR: Tests unitaires du ConfigManager - chargement YAML, valeurs typées, surcharges d'environnement et validation

#include <gtest/gtest.h>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/service_settings.hpp"
#include "test_fakes.hpp"

#include <cstdlib>
#include <filesystem>
#include <random>

using namespace FGL;
using namespace FGL::Testing;

namespace {

const char* kServiceConfig = R"(
logging:
  level: debug
  file: ""
provisioner:
  docker_binary: docker
  pull_policy: if-missing
  allowed_mounts:
    - /var/run/docker.sock
    - /srv/forgeline/src
deploy:
  endpoint: ${FGL_TEST_DEPLOY_HOST}/v1/deployments
  timeout_ms: 30000
  port: "8080"
engine:
  supersede_previous: true
  max_history: 50
  backoff:
    multiplier: 2.5
)";

} // namespace

// EN: Test fixture resetting the singleton and the environment around each test
// FR: Fixture de test réinitialisant le singleton et l'environnement autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("FGL_TEST_DEPLOY_HOST");
        unsetenv("FGLTEST_ENGINE__MAX_HISTORY");
        unsetenv("FGLTEST_PROVISIONER__ALLOWED_MOUNTS");
        unsetenv("FGLTEST_NOSEPARATOR");
    }

    LogCapture capture_;
};

TEST_F(ConfigManagerTest, LoadsTypedValues) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "debug");
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "");
    EXPECT_EQ(config.get("deploy", "timeout_ms").as<int>(), 30000);
    EXPECT_TRUE(config.get("engine", "supersede_previous").as<bool>());
    EXPECT_EQ(config.get("provisioner", "allowed_mounts").as<std::vector<std::string>>().size(), 2u);
    EXPECT_DOUBLE_EQ(config.get("engine", "backoff.multiplier").as<double>(), 2.5);
}

TEST_F(ConfigManagerTest, QuotedScalarsStayStrings) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    ConfigValue port = config.get("deploy", "port");
    EXPECT_FALSE(port.tryAs<int>().has_value());
    EXPECT_EQ(port.as<std::string>(), "8080");
}

TEST_F(ConfigManagerTest, TypeMismatchFallsBackToDefault) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    EXPECT_EQ(config.get("logging", "level").asOrDefault<int>(7), 7);
    EXPECT_EQ(config.get("missing", "key").asOrDefault<std::string>("fallback"), "fallback");
    EXPECT_FALSE(config.get("missing", "key").isValid());
    EXPECT_THROW(config.get("logging", "level").as<int>(), std::bad_variant_access);
    EXPECT_THROW(config.get("missing", "key").as<int>(), std::runtime_error);
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentReferences) {
    setenv("FGL_TEST_DEPLOY_HOST", "https://deploy.internal", 1);
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    EXPECT_EQ(config.get("deploy", "endpoint").as<std::string>(), "https://deploy.internal/v1/deployments");
}

TEST_F(ConfigManagerTest, UnsetReferencesAreLeftInPlace) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    EXPECT_EQ(config.get("deploy", "endpoint").as<std::string>(), "${FGL_TEST_DEPLOY_HOST}/v1/deployments");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesUseDoubleUnderscore) {
    setenv("FGLTEST_ENGINE__MAX_HISTORY", "10", 1);
    setenv("FGLTEST_PROVISIONER__ALLOWED_MOUNTS", "/a,/b,/c", 1);
    setenv("FGLTEST_NOSEPARATOR", "ignored", 1);

    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    EXPECT_EQ(config.loadEnvironmentOverrides("FGLTEST_"), 2u);
    EXPECT_EQ(config.get("engine", "max_history").as<int>(), 10);
    EXPECT_EQ(config.get("provisioner", "allowed_mounts").as<std::vector<std::string>>(),
              (std::vector<std::string>{"/a", "/b", "/c"}));
    EXPECT_TRUE(capture_.contains("Environment override applied: engine.max_history"));
}

TEST_F(ConfigManagerTest, ValidationReportsEveryViolation) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
logging:
  level: chatty
deploy:
  timeout_ms: 5
engine:
  supersede_previous: maybe
)"));

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.kind = ConfigManager::ValueKind::TEXT;
    level.allowed_values = {"debug", "info", "warn", "error"};

    ConfigManager::ValidationRule timeout;
    timeout.key = "deploy.timeout_ms";
    timeout.kind = ConfigManager::ValueKind::INTEGER;
    timeout.min_value = 100;
    timeout.max_value = 600000;

    ConfigManager::ValidationRule supersede;
    supersede.key = "engine.supersede_previous";
    supersede.kind = ConfigManager::ValueKind::BOOLEAN;

    ConfigManager::ValidationRule state_dir;
    state_dir.key = "engine.state_directory";
    state_dir.kind = ConfigManager::ValueKind::TEXT;
    state_dir.required = true;

    config.addValidationRules({level, timeout, supersede, state_dir});

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0], "Configuration logging.level must be one of: debug, info, warn, error");
    EXPECT_NE(errors[1].find("deploy.timeout_ms must be >="), std::string::npos);
    EXPECT_EQ(errors[2], "Configuration engine.supersede_previous must be a boolean");
    EXPECT_EQ(errors[3], "Required configuration missing: engine.state_directory");
}

TEST_F(ConfigManagerTest, ValidConfigurationPasses) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));

    ConfigManager::ValidationRule history;
    history.key = "engine.max_history";
    history.kind = ConfigManager::ValueKind::INTEGER;
    history.min_value = 1;
    history.max_value = 10000;
    config.addValidationRules({history});

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigManagerTest, MalformedYamlIsRejected) {
    auto& config = ConfigManager::getInstance();
    EXPECT_FALSE(config.loadFromString("logging: [unterminated"));
    EXPECT_FALSE(config.loadFromFile("/nonexistent/forgeline.yaml"));
}

TEST_F(ConfigManagerTest, SaveAndReloadKeepsValues) {
    std::mt19937 gen(std::random_device{}());
    auto path = std::filesystem::temp_directory_path() / ("fgl_config_test_" + std::to_string(gen()) + ".yaml");

    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));
    config.set("engine", "state_directory", ConfigValue("/var/lib/forgeline"));
    ASSERT_TRUE(config.saveToFile(path.string()));

    config.reset();
    ASSERT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.get("engine", "state_directory").as<std::string>(), "/var/lib/forgeline");
    EXPECT_EQ(config.get("engine", "max_history").as<int>(), 50);
    EXPECT_EQ(config.getSectionNames(),
              (std::vector<std::string>{"deploy", "engine", "logging", "provisioner"}));

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_F(ConfigManagerTest, SectionAccessAndMacros) {
    CONFIG_SET_SECTION("secrets", "backend", "env");
    EXPECT_EQ(CONFIG_GET_SECTION("secrets", "backend").as<std::string>(), "env");

    auto& config = ConfigManager::getInstance();
    EXPECT_TRUE(config.has("secrets", "backend"));
    config.remove("secrets", "backend");
    EXPECT_FALSE(config.has("secrets", "backend"));
    EXPECT_TRUE(config.getSection("secrets").empty());
}

TEST_F(ConfigManagerTest, SavedTextThatLooksNumericReloadsAsText) {
    std::mt19937 gen(std::random_device{}());
    auto path = std::filesystem::temp_directory_path() / ("fgl_config_quoted_" + std::to_string(gen()) + ".yaml");

    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(kServiceConfig));
    ASSERT_TRUE(config.saveToFile(path.string()));
    config.reset();
    ASSERT_TRUE(config.loadFromFile(path.string()));

    EXPECT_EQ(config.get("deploy", "port").as<std::string>(), "8080");
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_F(ConfigManagerTest, DumpListsSectionsInOrder) {
    auto& config = ConfigManager::getInstance();
    config.set("engine", "max_history", ConfigValue(5));
    config.set("deploy", "endpoint", ConfigValue("https://deploy.internal"));

    EXPECT_EQ(config.dump(), "[deploy]\n  endpoint = https://deploy.internal\n\n[engine]\n  max_history = 5\n\n");
}

// EN: Typed Forgeline settings read through the ConfigManager
// FR: Réglages Forgeline typés lus via le ConfigManager
TEST_F(ConfigManagerTest, ServiceSettingsUseDefaultsForMissingKeys) {
    ServiceSettings settings = ServiceSettings::fromConfig(ConfigManager::getInstance());

    EXPECT_EQ(settings.logging.level, "info");
    EXPECT_EQ(settings.provisioner.docker_binary, "docker");
    EXPECT_EQ(settings.provisioner.pull_policy, "if-missing");
    EXPECT_EQ(settings.deploy.image_reference, "latest");
    EXPECT_EQ(settings.deploy.timeout_ms, 30000);
    EXPECT_EQ(settings.secrets.backend, "env");
    EXPECT_EQ(settings.secrets.prefix, "FGL_SECRET_");
    EXPECT_TRUE(settings.engine.supersede_previous);
    EXPECT_EQ(settings.engine.max_history, 50);
    EXPECT_TRUE(settings.consistencyErrors().empty());
}

TEST_F(ConfigManagerTest, ServiceSettingsReadShippedConfiguration) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromFile(std::string(FGL_CONFIG_DIR) + "/forgeline.yaml"));
    config.addValidationRules(ServiceSettings::validationRules());

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors)) << (errors.empty() ? "" : errors.front());

    ServiceSettings settings = ServiceSettings::fromConfig(config);
    EXPECT_EQ(settings.provisioner.allowed_mounts,
              (std::vector<std::string>{"/var/run/docker.sock", "/srv/forgeline/src"}));
    EXPECT_EQ(settings.engine.state_directory, "/var/lib/forgeline");
    EXPECT_EQ(settings.engine.max_history, 50);
}

TEST_F(ConfigManagerTest, ServiceSettingsRulesRejectUnknownBackend) {
    auto& config = ConfigManager::getInstance();
    config.set("secrets", "backend", ConfigValue("vault"));
    config.set("engine", "max_history", ConfigValue(0));
    config.addValidationRules(ServiceSettings::validationRules());

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Configuration secrets.backend must be one of: env, http");
    EXPECT_NE(errors[1].find("engine.max_history must be >="), std::string::npos);
}

TEST_F(ConfigManagerTest, HttpSecretBackendNeedsEndpoint) {
    auto& config = ConfigManager::getInstance();
    config.set("secrets", "backend", ConfigValue("http"));

    auto errors = ServiceSettings::fromConfig(config).consistencyErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "secrets.endpoint is required when secrets.backend is http");

    config.set("secrets", "endpoint", ConfigValue("https://secrets.internal"));
    EXPECT_TRUE(ServiceSettings::fromConfig(config).consistencyErrors().empty());
}
