// EN: Artifact Builder implementation - docker build, image inspect and latest tag
// FR: Implémentation du constructeur d'artefact - docker build, image inspect et tag latest

#include "orchestrator/artifact_builder.hpp"
#include "core/errors.hpp"
#include "infrastructure/logging/logger.hpp"

namespace FGL {
namespace Orchestrator {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string tail(const std::string& text, size_t max_chars = 400) {
    std::string t = trim(text);
    return t.size() <= max_chars ? t : "..." + t.substr(t.size() - max_chars);
}

} // namespace

ArtifactBuilder::ArtifactBuilder(std::string docker_binary) : docker_binary_(std::move(docker_binary)) {}

std::vector<std::string> ArtifactBuilder::buildCommand(const PipelineRunContext& context, const BuildAction& action,
                                                       const std::string& image_ref) const {
    std::vector<std::string> argv = {docker_binary_, "build", "-t", image_ref};

    if (!action.dockerfile.empty()) {
        argv.push_back("-f");
        argv.push_back(action.dockerfile);
    }
    argv.push_back("--label");
    argv.push_back("forgeline.commit=" + context.trigger().commit);
    argv.push_back("--label");
    argv.push_back("forgeline.run=" + context.versionTag());

    for (const auto& [key, value] : action.build_args) {
        argv.push_back("--build-arg");
        argv.push_back(key + "=" + value);
    }
    // EN: Without '=' docker reads the value from its environment
    // FR: Sans '=' docker lit la valeur dans son environnement
    for (const auto& name : action.secret_build_args) {
        argv.push_back("--build-arg");
        argv.push_back(name);
    }

    argv.push_back(action.context_dir.empty() ? "." : action.context_dir);
    return argv;
}

Artifact ArtifactBuilder::build(ScopedEnvironment& environment, const PipelineRunContext& context,
                                const BuildAction& action, const SecretBundle& secrets) {
    const std::string repository = context.definition().repository;
    if (repository.empty()) {
        throw BuildError("Pipeline has no image repository");
    }
    const std::string image_ref = repository + ":" + context.versionTag();
    const std::string context_dir = action.context_dir.empty() ? "." : action.context_dir;

    auto check = environment.execute(CommandRequest{{"test", "-d", context_dir}, {}, "", "", {}});
    if (!check.succeeded()) {
        throw BuildError("Build context '" + context_dir + "' not found in environment");
    }

    CommandRequest build_request;
    build_request.argv = buildCommand(context, action, image_ref);
    for (const auto& name : action.secret_build_args) {
        build_request.env[name] = secrets.value(name);
    }

    LOG_INFO_META("builder", "Building image",
                  (std::unordered_map<std::string, std::string>{
                      {"image", image_ref}, {"commit", context.trigger().commit}}));

    auto built = environment.execute(build_request);
    if (!built.succeeded()) {
        throw BuildError("docker build failed for " + image_ref + " (exit " + std::to_string(built.exit_code) +
                         "): " + Logger::getInstance().redact(tail(built.stderr_text)));
    }

    auto inspected = environment.execute(
        CommandRequest{{docker_binary_, "image", "inspect", "--format", "{{.Id}}", image_ref}, {}, "", "", {}});
    std::string digest = trim(inspected.stdout_text);
    if (!inspected.succeeded() || digest.empty()) {
        throw BuildError("Could not read digest of " + image_ref);
    }

    const std::string latest_ref = repository + ":latest";
    auto tagged = environment.execute(CommandRequest{{docker_binary_, "tag", image_ref, latest_ref}, {}, "", "", {}});
    if (!tagged.succeeded()) {
        throw BuildError("docker tag " + latest_ref + " failed: " + tail(tagged.stderr_text));
    }

    Artifact artifact(repository, context.versionTag(), digest);
    LOG_INFO_META("builder", "Artifact built",
                  (std::unordered_map<std::string, std::string>{
                      {"image", artifact.imageRef()}, {"digest", artifact.digest()}}));
    return artifact;
}

} // namespace Orchestrator
} // namespace FGL
