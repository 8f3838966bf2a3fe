// EN: Process runner for Forgeline - Runs external commands (docker CLI) with capture, timeout and cancellation
// FR: Exécuteur de processus pour Forgeline - Lance des commandes externes (CLI docker) avec capture, timeout et annulation

#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace FGL {

// EN: Description of a command to run. argv[0] is looked up in PATH when it has no '/'.
// FR: Description d'une commande à lancer. argv[0] est cherché dans PATH s'il n'a pas de '/'.
struct ProcessSpec {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;   // EN: Added to (or replacing) the inherited environment / FR: Ajouté à l'environnement hérité
    bool inherit_environment{true};
    std::string cwd;
    std::string stdin_data;                   // EN: Written then stdin is closed / FR: Écrit puis stdin est fermé
    std::chrono::milliseconds timeout{0};     // EN: 0 means no timeout / FR: 0 signifie sans timeout
    std::size_t max_output_bytes{1024 * 1024};
};

struct ProcessResult {
    int exit_code{-1};
    bool timed_out{false};
    bool cancelled{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;                // EN: Spawn failure description / FR: Description d'échec de lancement

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled && error_message.empty(); }
};

// EN: Abstract command execution seam so that docker-backed components can be tested without docker.
// FR: Point d'abstraction d'exécution pour tester les composants docker sans docker.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessSpec& spec, const CancellationToken& cancellation) = 0;
};

// EN: fork/exec implementation. The child gets its own process group, which is killed on
// timeout or cancellation.
// FR: Implémentation fork/exec. L'enfant a son propre groupe de processus, tué sur timeout
// ou annulation.
class PosixProcessRunner : public ProcessRunner {
public:
    PosixProcessRunner();

    ProcessResult run(const ProcessSpec& spec, const CancellationToken& cancellation) override;

    // EN: Render argv for logs, quoting arguments containing spaces
    // FR: Rend argv pour les logs, en citant les arguments contenant des espaces
    static std::string describe(const std::vector<std::string>& argv);

private:
    static std::string resolveExecutable(const std::string& program, const std::map<std::string, std::string>& env);
};

} // namespace FGL
