// EN: Unit tests for the pipeline data model - artifacts, names and error kinds
// FR: Tests unitaires du modèle de données - artefacts, noms et types d'erreurs

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "orchestrator/pipeline_types.hpp"

using namespace FGL;
using namespace FGL::Orchestrator;

TEST(ArtifactTest, IdentityIsTheDigest) {
    Artifact built("registry.example.com/team/webapp", "12", "sha256:aa11");
    Artifact latest("registry.example.com/team/webapp", "latest", "sha256:aa11");
    Artifact rebuilt("registry.example.com/team/webapp", "12", "sha256:bb22");

    EXPECT_EQ(built, latest);
    EXPECT_NE(built, rebuilt);
}

TEST(ArtifactTest, ImageReferences) {
    Artifact artifact("registry.example.com/team/webapp", "12", "sha256:aa11");

    EXPECT_EQ(artifact.imageRef(), "registry.example.com/team/webapp:12");
    EXPECT_EQ(artifact.imageRef("latest"), "registry.example.com/team/webapp:latest");
    EXPECT_EQ(artifact.versionTag(), "12");
}

TEST(StageActionTest, ActionTypeNames) {
    EXPECT_EQ(actionTypeName(BuildAction{}), "build");
    EXPECT_EQ(actionTypeName(PublishAction{}), "publish");
    EXPECT_EQ(actionTypeName(TriggerAction{}), "trigger");
}

TEST(StageActionTest, DefaultsMatchDocumentedBehaviour) {
    BuildAction build;
    EXPECT_EQ(build.context_dir, ".");
    EXPECT_EQ(build.dockerfile, "Dockerfile");

    RetryPolicy retry;
    EXPECT_EQ(retry.max_attempts, 1u);
    EXPECT_EQ(retry.timeout.count(), 0);
    EXPECT_FALSE(retry.retry_provisioning);
}

TEST(PipelineDefinitionTest, FindCredential) {
    PipelineDefinition definition;
    definition.credentials.push_back(Credential{"npm_token", {"build"}, SecretType::SECURE_STRING, "/ci/npm"});

    const Credential* found = definition.findCredential("npm_token");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->store_key, "/ci/npm");
    EXPECT_EQ(definition.findCredential("missing"), nullptr);
}

TEST(EnumNamesTest, StatusAndPhaseNames) {
    EXPECT_EQ(runStatusToString(RunStatus::ABORTED), "Aborted");
    EXPECT_EQ(runStatusToString(RunStatus::SUCCEEDED), "Succeeded");
    EXPECT_EQ(stageStatusToString(StageStatus::SKIPPED), "Skipped");
    EXPECT_EQ(stagePhaseToString(StagePhase::SECRET_RESOLVING), "SecretResolving");
    EXPECT_EQ(stagePhaseToString(StagePhase::RELEASING), "Releasing");
    EXPECT_EQ(pipelineEventTypeToString(PipelineEventType::STAGE_RETRYING), "stage_retrying");
}

TEST(EnumNamesTest, SecretTypes) {
    EXPECT_EQ(secretTypeFromString("String"), SecretType::STRING);
    EXPECT_EQ(secretTypeFromString(""), SecretType::STRING);
    EXPECT_EQ(secretTypeFromString("SecureString"), SecretType::SECURE_STRING);
    EXPECT_EQ(secretTypeFromString("securestring"), SecretType::SECURE_STRING);
    EXPECT_EQ(secretTypeToString(SecretType::SECURE_STRING), "SecureString");
    EXPECT_THROW(secretTypeFromString("Certificate"), ConfigurationError);
}

TEST(ErrorTaxonomyTest, KindsAndTransience) {
    PublishError publish("registry 503");
    BuildError build("compile error");
    ProvisionError provision("image pull failed", true);

    EXPECT_EQ(publish.kind(), ErrorKind::PUBLISH);
    EXPECT_TRUE(publish.isTransient());
    EXPECT_FALSE(build.isTransient());
    EXPECT_TRUE(provision.isTransient());
    EXPECT_FALSE(ProvisionError("no such image").isTransient());

    EXPECT_EQ(errorKindToString(ErrorKind::TIMEOUT), "StageTimeoutError");
    EXPECT_EQ(errorKindToString(ErrorKind::CANCELLED), "RunCancelledError");
    EXPECT_EQ(errorKindToString(ErrorKind::ACCESS_DENIED), "AccessDeniedError");
    EXPECT_STREQ(build.what(), "compile error");
}
