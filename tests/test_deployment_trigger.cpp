// EN: Unit tests for the Deployment Trigger and the HTTP deployment service
// FR: Tests unitaires du déclencheur de déploiement et du service de déploiement HTTP

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "orchestrator/deployment_trigger.hpp"
#include "test_fakes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <regex>

using namespace FGL;
using namespace FGL::Orchestrator;
using namespace FGL::Testing;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

const std::string kDigest = "sha256:b5bb9d8014a0f9b1d61e21e796d78dcc";

DeploymentAck acceptedAck(const std::string& id) {
    DeploymentAck ack;
    ack.deployment_id = id;
    ack.accepted = true;
    return ack;
}

} // namespace

// EN: Trigger logic against a mocked deployment service
// FR: Logique de déclenchement contre un service de déploiement mocké
class DeploymentTriggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<::testing::StrictMock<MockDeploymentService>>();
        store_ = std::make_shared<FakeSecretStore>(sampleSecrets());
        bundle_ = SecretResolver(sampleDefinition().credentials, store_).resolve("deploy", {"deploy_token"});
    }

    LogCapture capture_;
    std::shared_ptr<::testing::StrictMock<MockDeploymentService>> service_;
    std::shared_ptr<FakeSecretStore> store_;
    SecretBundle bundle_;
    CancellationToken token_;
    DeploymentTarget target_{"production", "webapp", "eu-west-1"};
    Artifact artifact_{"registry.example.com/team/webapp", "42", kDigest};
};

TEST_F(DeploymentTriggerTest, ForcesRedeployOfLatestByDefault) {
    DeploymentRequest sent;
    EXPECT_CALL(*service_, updateService(_)).WillOnce(DoAll(SaveArg<0>(&sent), Return(acceptedAck("dep-1"))));

    DeploymentTrigger trigger(service_);
    DeploymentAck ack = trigger.trigger(target_, artifact_, TriggerAction{"deploy_token"}, bundle_, token_);

    EXPECT_EQ(ack.deployment_id, "dep-1");
    EXPECT_EQ(sent.cluster, "production");
    EXPECT_EQ(sent.service, "webapp");
    EXPECT_EQ(sent.region, "eu-west-1");
    EXPECT_EQ(sent.image_ref, "registry.example.com/team/webapp:latest");
    EXPECT_TRUE(sent.force_new_deployment);
    EXPECT_EQ(sent.auth_token, "dpl-5e1b77");
    EXPECT_EQ(sent.client_token, DeploymentTrigger::clientToken(target_, artifact_));
    EXPECT_TRUE(capture_.contains("Deployment accepted"));
    EXPECT_FALSE(capture_.contains("dpl-5e1b77"));
}

TEST_F(DeploymentTriggerTest, VersionReferencePinsRunTag) {
    EXPECT_CALL(*service_, updateService(Field(&DeploymentRequest::image_ref, "registry.example.com/team/webapp:42")))
        .WillOnce(Return(acceptedAck("dep-2")));

    DeploymentTrigger trigger(service_, ImageReference::VERSION);
    trigger.trigger(target_, artifact_, TriggerAction{"deploy_token"}, bundle_, token_);
}

TEST_F(DeploymentTriggerTest, TokenIsOptional) {
    EXPECT_CALL(*service_, updateService(Field(&DeploymentRequest::auth_token, "")))
        .WillOnce(Return(acceptedAck("dep-3")));

    DeploymentTrigger trigger(service_);
    trigger.trigger(target_, artifact_, TriggerAction{}, SecretBundle(), token_);
}

TEST_F(DeploymentTriggerTest, IncompleteTargetIsTriggerError) {
    DeploymentTrigger trigger(service_);
    EXPECT_THROW(trigger.trigger(DeploymentTarget{"", "webapp", ""}, artifact_, TriggerAction{}, bundle_, token_),
                 TriggerError);
    EXPECT_THROW(trigger.trigger(DeploymentTarget{"production", "", ""}, artifact_, TriggerAction{}, bundle_, token_),
                 TriggerError);
}

TEST_F(DeploymentTriggerTest, UnacceptedRequestIsTriggerError) {
    EXPECT_CALL(*service_, updateService(_)).WillOnce(Return(DeploymentAck{}));

    DeploymentTrigger trigger(service_);
    EXPECT_THROW(trigger.trigger(target_, artifact_, TriggerAction{"deploy_token"}, bundle_, token_), TriggerError);
}

TEST_F(DeploymentTriggerTest, ClientTokenIsStablePerDigest) {
    const std::string token = DeploymentTrigger::clientToken(target_, artifact_);

    EXPECT_TRUE(std::regex_match(token, std::regex("fgl-[0-9a-f]{16}")));
    EXPECT_EQ(token, DeploymentTrigger::clientToken(target_, Artifact{"other/repo", "43", kDigest}));
    EXPECT_NE(token, DeploymentTrigger::clientToken(target_, Artifact{"registry.example.com/team/webapp", "42",
                                                                      "sha256:different"}));
    EXPECT_NE(token, DeploymentTrigger::clientToken(DeploymentTarget{"staging", "webapp", "eu-west-1"}, artifact_));
}

TEST(ImageReferenceTest, Names) {
    EXPECT_EQ(imageReferenceFromString("latest"), ImageReference::LATEST);
    EXPECT_EQ(imageReferenceFromString("Version"), ImageReference::VERSION);
    EXPECT_EQ(imageReferenceToString(ImageReference::VERSION), "version");
    EXPECT_THROW(imageReferenceFromString("digest"), ConfigurationError);
}

TEST(DeploymentTriggerConstructionTest, RequiresService) {
    EXPECT_THROW(DeploymentTrigger(nullptr), ConfigurationError);
}

TEST_F(DeploymentTriggerTest, RequestCarriesTheCancellationToken) {
    DeploymentRequest sent;
    EXPECT_CALL(*service_, updateService(_)).WillOnce(DoAll(SaveArg<0>(&sent), Return(acceptedAck("dep-2"))));

    DeploymentTrigger trigger(service_);
    trigger.trigger(target_, artifact_, TriggerAction{"deploy_token"}, bundle_, token_);

    token_.cancel("superseded by run #5");
    EXPECT_TRUE(sent.cancellation.isCancelled());
}

// EN: HTTP deployment API against a scripted client
// FR: API de déploiement HTTP contre un client scripté
class HttpDeploymentServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorRecoveryManager::getInstance().setDetailedLogging(false);
        client_ = std::make_shared<ScriptedHttpClient>();
        service_ = std::make_unique<HttpDeploymentService>(client_, "https://deploy.internal/");

        RetryConfig fast = ErrorRecoveryUtils::createHttpRetryConfig();
        fast.initial_delay = std::chrono::milliseconds(1);
        fast.max_delay = std::chrono::milliseconds(2);
        fast.enable_jitter = false;
        service_->setRetryConfig(fast);

        request_.cluster = "production";
        request_.service = "web app";
        request_.region = "eu-west-1";
        request_.image_ref = "registry.example.com/team/webapp:latest";
        request_.client_token = "fgl-00112233aabbccdd";
        request_.auth_token = "dpl-5e1b77";
    }

    LogCapture capture_;
    std::shared_ptr<ScriptedHttpClient> client_;
    std::unique_ptr<HttpDeploymentService> service_;
    DeploymentRequest request_;
};

TEST_F(HttpDeploymentServiceTest, PostsUpdateRequest) {
    client_->respond(202, R"({"deploymentId": "ecs-svc/123"})");

    DeploymentAck ack = service_->updateService(request_);

    EXPECT_TRUE(ack.accepted);
    EXPECT_EQ(ack.deployment_id, "ecs-svc/123");
    EXPECT_EQ(ack.client_token, "fgl-00112233aabbccdd");

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "https://deploy.internal/v1/clusters/production/services/web%20app:update");
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer dpl-5e1b77");
    EXPECT_EQ(requests[0].headers.at("Idempotency-Key"), "fgl-00112233aabbccdd");

    ASSERT_TRUE(requests[0].body.has_value());
    auto body = nlohmann::json::parse(*requests[0].body);
    EXPECT_EQ(body["image"], "registry.example.com/team/webapp:latest");
    EXPECT_EQ(body["forceNewDeployment"], true);
    EXPECT_EQ(body["clientToken"], "fgl-00112233aabbccdd");
}

TEST_F(HttpDeploymentServiceTest, ConflictMeansAlreadyInProgress) {
    client_->respond(409, "");
    DeploymentAck ack = service_->updateService(request_);
    EXPECT_TRUE(ack.accepted);
    EXPECT_EQ(ack.deployment_id, "");
}

TEST_F(HttpDeploymentServiceTest, AuthorizationFailureIsNotRetried) {
    client_->respond(403);
    try {
        service_->updateService(request_);
        FAIL() << "expected TriggerError";
    } catch (const TriggerError& e) {
        EXPECT_THAT(e.what(), HasSubstr("not authorized"));
        EXPECT_FALSE(e.isTransient());
    }
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(HttpDeploymentServiceTest, UnknownTargetIsTriggerError) {
    client_->respond(404);
    try {
        service_->updateService(request_);
        FAIL() << "expected TriggerError";
    } catch (const TriggerError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Deployment target not found: production/web app"));
    }
}

TEST_F(HttpDeploymentServiceTest, TransientFailuresAreRetriedWithSameToken) {
    client_->respond(503);
    client_->failTransport("Connection reset by peer");
    client_->respond(200, R"({"deploymentId": "dep-9"})");

    DeploymentAck ack = service_->updateService(request_);

    EXPECT_EQ(ack.deployment_id, "dep-9");
    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 3u);
    for (const auto& request : requests) {
        EXPECT_EQ(request.headers.at("Idempotency-Key"), "fgl-00112233aabbccdd");
    }
}

TEST_F(HttpDeploymentServiceTest, PersistentOutageBecomesTriggerError) {
    client_->respond(502);
    client_->repeatLast();

    try {
        service_->updateService(request_);
        FAIL() << "expected TriggerError";
    } catch (const TriggerError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Deployment service unavailable: HTTP 502"));
    }
    EXPECT_EQ(client_->requests().size(), 3u);
}

TEST_F(HttpDeploymentServiceTest, CancellationStopsRetries) {
    client_->respond(503);
    client_->repeatLast();
    request_.cancellation.cancel("cancelled by operator");

    try {
        service_->updateService(request_);
        FAIL() << "expected RunCancelledError";
    } catch (const RunCancelledError& e) {
        EXPECT_THAT(e.what(), HasSubstr("cancelled by operator"));
    }
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(HttpDeploymentServiceTest, RequestCarriesTheDeadline) {
    client_->respond(202, "");
    request_.cancellation = CancellationToken().withDeadline(std::chrono::seconds(5));

    service_->updateService(request_);

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_TRUE(requests[0].cancellation.remaining().has_value());
    EXPECT_LE(*requests[0].cancellation.remaining(), std::chrono::milliseconds(5000));
}

TEST_F(HttpDeploymentServiceTest, UnexpectedStatusIsRejected) {
    client_->respond(400, R"({"message": "bad image"})");
    EXPECT_THROW(service_->updateService(request_), TriggerError);
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST(HttpDeploymentServiceConstructionTest, RequiresClientAndEndpoint) {
    EXPECT_THROW(HttpDeploymentService(nullptr, "https://deploy.internal"), ConfigurationError);
    EXPECT_THROW(HttpDeploymentService(std::make_shared<ScriptedHttpClient>(), ""), ConfigurationError);
}
