// EN: Unit tests for the Secret Resolver - scope checks, stores, bundles and redaction
// FR: Tests unitaires du résolveur de secrets - portées, magasins, bundles et masquage

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "orchestrator/secret_resolver.hpp"
#include "test_fakes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>

using namespace FGL;
using namespace FGL::Orchestrator;
using namespace FGL::Testing;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

// EN: Test fixture with the sample pipeline's credentials
// FR: Fixture de test avec les identifiants du pipeline d'exemple
class SecretResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<FakeSecretStore>(sampleSecrets());
        resolver_ = std::make_unique<SecretResolver>(sampleDefinition().credentials, store_);
    }

    LogCapture capture_;
    std::shared_ptr<FakeSecretStore> store_;
    std::unique_ptr<SecretResolver> resolver_;
};

TEST_F(SecretResolverTest, ResolvesOnlyRequestedCredentials) {
    SecretBundle bundle = resolver_->resolve("publish", {"registry_user", "registry_password"});

    EXPECT_EQ(bundle.size(), 2u);
    EXPECT_EQ(bundle.value("registry_user"), "ci-bot");
    EXPECT_EQ(bundle.value("registry_password"), "hunter2-registry");
    EXPECT_THAT(bundle.names(), ElementsAre("registry_password", "registry_user"));
    EXPECT_EQ(store_->fetchCount("npm_token"), 0);
    EXPECT_EQ(store_->fetchCount("deploy_token"), 0);
}

TEST_F(SecretResolverTest, EmptyScopeFetchesNothing) {
    SecretBundle bundle = resolver_->resolve("publish", {});
    EXPECT_TRUE(bundle.empty());
    EXPECT_EQ(store_->fetchCount("registry_user"), 0);
}

TEST_F(SecretResolverTest, DuplicateNamesAreFetchedOnce) {
    SecretBundle bundle = resolver_->resolve("build", {"npm_token", "npm_token"});
    EXPECT_EQ(bundle.size(), 1u);
    EXPECT_EQ(store_->fetchCount("npm_token"), 1);
}

TEST_F(SecretResolverTest, OutOfScopeCredentialIsDenied) {
    try {
        resolver_->resolve("build", {"registry_password"});
        FAIL() << "expected AccessDeniedError";
    } catch (const AccessDeniedError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ACCESS_DENIED);
        EXPECT_THAT(e.what(), HasSubstr("not scoped to stage 'build'"));
    }
    EXPECT_EQ(store_->fetchCount("registry_password"), 0);
}

TEST_F(SecretResolverTest, UnknownCredentialIsNotFound) {
    EXPECT_THROW(resolver_->resolve("build", {"aws_key"}), SecretNotFoundError);
}

TEST_F(SecretResolverTest, MissingStoreValueIsNotFound) {
    auto empty_store = std::make_shared<FakeSecretStore>();
    SecretResolver resolver(sampleDefinition().credentials, empty_store);
    EXPECT_THROW(resolver.resolve("deploy", {"deploy_token"}), SecretNotFoundError);
}

TEST_F(SecretResolverTest, EmptyValueIsNotFound) {
    store_->set("/ci/deploy/token", "");
    EXPECT_THROW(resolver_->resolve("deploy", {"deploy_token"}), SecretNotFoundError);
}

TEST_F(SecretResolverTest, BundleValuesAreRedactedWhileAlive) {
    auto& logger = Logger::getInstance();
    {
        SecretBundle bundle = resolver_->resolve("deploy", {"deploy_token"});
        EXPECT_EQ(logger.redact("Authorization: Bearer dpl-5e1b77"), "Authorization: Bearer ***");
        LOG_INFO("test", "token is dpl-5e1b77");
    }
    EXPECT_EQ(logger.redact("dpl-5e1b77"), "dpl-5e1b77");
    EXPECT_FALSE(capture_.contains("dpl-5e1b77"));
    EXPECT_TRUE(capture_.contains("token is ***"));
}

TEST_F(SecretResolverTest, MovedBundleKeepsRedactionUntilDestroyed) {
    auto& logger = Logger::getInstance();
    SecretBundle outer;
    {
        SecretBundle inner = resolver_->resolve("build", {"npm_token"});
        outer = std::move(inner);
    }
    EXPECT_EQ(logger.redact("npm-7f3a9c"), "***");
    EXPECT_EQ(outer.value("npm_token"), "npm-7f3a9c");
}

TEST_F(SecretResolverTest, UnresolvedNameIsDeniedByBundle) {
    SecretBundle bundle = resolver_->resolve("build", {"npm_token"});
    EXPECT_FALSE(bundle.has("deploy_token"));
    EXPECT_THROW(bundle.value("deploy_token"), AccessDeniedError);
}

TEST_F(SecretResolverTest, CancelledResolutionFetchesNothing) {
    CancellationToken token;
    token.cancel("cancelled by operator");

    EXPECT_THROW(resolver_->resolve("publish", {"registry_user"}, token), RunCancelledError);
    EXPECT_EQ(store_->fetchCount("registry_user"), 0);
}

TEST_F(SecretResolverTest, ResolverRequiresStore) {
    EXPECT_THROW(SecretResolver(sampleDefinition().credentials, nullptr), ConfigurationError);
}

TEST(SecretValueTest, MoveLeavesSourceEmpty) {
    SecretValue a("s3cr3t");
    SecretValue b(std::move(a));
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(b.reveal(), "s3cr3t");

    SecretValue c;
    c = std::move(b);
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(c.reveal(), "s3cr3t");
}

// EN: Environment-backed store
// FR: Magasin adossé à l'environnement
TEST(EnvironmentSecretStoreTest, ReadsNormalizedVariable) {
    EnvironmentSecretStore store;
    EXPECT_EQ(store.variableName("/ci/npm/token"), "FGL_SECRET__CI_NPM_TOKEN");

    setenv("FGL_SECRET__CI_NPM_TOKEN", "npm-7f3a9c", 1);
    Credential credential{"npm_token", {"build"}, SecretType::SECURE_STRING, "/ci/npm/token"};
    EXPECT_EQ(store.fetch(credential, CancellationToken()).reveal(), "npm-7f3a9c");
    unsetenv("FGL_SECRET__CI_NPM_TOKEN");

    EXPECT_THROW(store.fetch(credential, CancellationToken()), SecretNotFoundError);
}

TEST(EnvironmentSecretStoreTest, FallsBackToCredentialName) {
    EnvironmentSecretStore store("FGLTEST_");
    setenv("FGLTEST_DEPLOY_TOKEN", "dpl-5e1b77", 1);
    EXPECT_EQ(store.fetch(Credential{"deploy_token", {"deploy"}, SecretType::STRING, ""}, CancellationToken()).reveal(), "dpl-5e1b77");
    unsetenv("FGLTEST_DEPLOY_TOKEN");
}

// EN: Parameter-store HTTP backend against a scripted client
// FR: Backend HTTP de type parameter store contre un client scripté
class HttpSecretStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<ScriptedHttpClient>();
        store_ = std::make_unique<HttpSecretStore>(client_, "https://secrets.internal/", "svc-token");

        RetryConfig fast;
        fast.max_attempts = 3;
        fast.initial_delay = std::chrono::milliseconds(1);
        fast.max_delay = std::chrono::milliseconds(2);
        fast.enable_jitter = false;
        store_->setRetryConfig(fast);
    }

    LogCapture capture_;
    std::shared_ptr<ScriptedHttpClient> client_;
    std::unique_ptr<HttpSecretStore> store_;
    CancellationToken token_;
    Credential credential_{"registry_password", {"publish"}, SecretType::SECURE_STRING, "/ci/registry/password"};
};

TEST_F(HttpSecretStoreTest, FetchesParameterValue) {
    client_->respond(200, R"({"Parameter": {"Name": "/ci/registry/password", "Value": "hunter2-registry"}})");

    EXPECT_EQ(store_->fetch(credential_, token_).reveal(), "hunter2-registry");

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "https://secrets.internal/GetParameter");
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer svc-token");
    ASSERT_TRUE(requests[0].body.has_value());
    auto body = nlohmann::json::parse(*requests[0].body);
    EXPECT_EQ(body["Name"], "/ci/registry/password");
    EXPECT_EQ(body["WithDecryption"], true);
}

TEST_F(HttpSecretStoreTest, NotFoundAndDeniedAreNotRetried) {
    client_->respond(404);
    EXPECT_THROW(store_->fetch(credential_, token_), SecretNotFoundError);

    client_->respond(403);
    EXPECT_THROW(store_->fetch(credential_, token_), AccessDeniedError);

    EXPECT_EQ(client_->requests().size(), 2u);
}

TEST_F(HttpSecretStoreTest, UnavailableStoreIsRetried) {
    client_->respond(503);
    client_->failTransport("Connection refused");
    client_->respond(200, R"({"Parameter": {"Value": "hunter2-registry"}})");

    EXPECT_EQ(store_->fetch(credential_, token_).reveal(), "hunter2-registry");
    EXPECT_EQ(client_->requests().size(), 3u);
}

TEST_F(HttpSecretStoreTest, PersistentOutageIsTransientError) {
    client_->respond(503);
    client_->repeatLast();

    try {
        store_->fetch(credential_, token_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_TRUE(e.isTransient());
    }
    EXPECT_EQ(client_->requests().size(), 3u);
}

TEST_F(HttpSecretStoreTest, CancelledFetchStopsRetrying) {
    client_->respond(503);
    client_->repeatLast();
    token_.cancel("superseded by run #8");

    try {
        store_->fetch(credential_, token_);
        FAIL() << "expected RunCancelledError";
    } catch (const RunCancelledError& e) {
        EXPECT_THAT(e.what(), HasSubstr("superseded by run #8"));
    }
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(HttpSecretStoreTest, RequestCarriesTheStageToken) {
    client_->respond(200, R"({"Parameter": {"Value": "hunter2-registry"}})");
    CancellationToken stage = token_.withDeadline(std::chrono::seconds(5));

    store_->fetch(credential_, stage);
    stage.cancel("stage over");

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(requests[0].cancellation.isCancelled());
    EXPECT_TRUE(requests[0].cancellation.remaining().has_value());
}

TEST_F(HttpSecretStoreTest, MalformedReplyIsRejected) {
    client_->respond(200, "not json");
    EXPECT_THROW(store_->fetch(credential_, token_), PipelineError);

    client_->respond(200, R"({"Parameter": {}})");
    EXPECT_THROW(store_->fetch(credential_, token_), SecretNotFoundError);
}

TEST(HttpSecretStoreConstructionTest, RequiresClientAndEndpoint) {
    EXPECT_THROW(HttpSecretStore(nullptr, "https://secrets.internal"), ConfigurationError);
    EXPECT_THROW(HttpSecretStore(std::make_shared<ScriptedHttpClient>(), "/"), ConfigurationError);
}
