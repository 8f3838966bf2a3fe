// EN: Artifact Builder for Forgeline - Builds the versioned image inside the stage environment
// FR: Constructeur d'artefact pour Forgeline - Construit l'image versionnée dans l'environnement de l'étape

#pragma once

#include <string>
#include <vector>

#include "orchestrator/environment_provisioner.hpp"
#include "orchestrator/pipeline_execution_context.hpp"
#include "orchestrator/secret_resolver.hpp"

namespace FGL {
namespace Orchestrator {

class ArtifactBuilder {
public:
    explicit ArtifactBuilder(std::string docker_binary = "docker");
    virtual ~ArtifactBuilder() = default;

    // EN: Build {repository}:{run number}, read its digest and tag it {repository}:latest.
    // Throws BuildError on missing context, failed build or empty digest.
    // FR: Construit {dépôt}:{numéro}, lit son digest et le tague {dépôt}:latest.
    // Lance BuildError si le contexte manque, si le build échoue ou si le digest est vide.
    virtual Artifact build(ScopedEnvironment& environment, const PipelineRunContext& context,
                           const BuildAction& action, const SecretBundle& secrets);

    // EN: docker build argv for the given action (secret build args carry no value)
    // FR: argv de docker build pour l'action donnée (les build args secrets n'ont pas de valeur)
    std::vector<std::string> buildCommand(const PipelineRunContext& context, const BuildAction& action,
                                          const std::string& image_ref) const;

private:
    std::string docker_binary_;
};

} // namespace Orchestrator
} // namespace FGL
