// EN: Minimal libcurl client used by the secret store and deployment service backends.
// FR : Client libcurl minimal utilisé par les backends magasin de secrets et service de déploiement.

#pragma once

#include "core/cancellation.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace FGL {
namespace Http {

using Headers = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string url;
    Headers headers;
    std::optional<std::string> body;
    // EN: Aborts the transfer once fired; its deadline also bounds the curl timeout
    // FR: Interrompt le transfert une fois déclenché; son échéance borne aussi le timeout curl
    CancellationToken cancellation;
};

// EN: Received response. Header names are lower-cased.
// FR : Réponse reçue. Les noms de headers sont en minuscules.
struct HttpResponse {
    int status = 0;
    Headers headers;
    std::string body;
    long elapsed_ms = 0;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

// EN: No HTTP status was received (DNS, connect, timeout).
// FR : Aucun statut HTTP reçu (DNS, connexion, timeout).
class HttpTransportError : public std::runtime_error {
  public:
    explicit HttpTransportError(const std::string& message) : std::runtime_error(message) {}
};

// EN: perform() is the only virtual so services can run against a scripted client in tests.
// FR : perform() est la seule méthode virtuelle pour tester les services avec un client scripté.
class HttpClient {
  public:
    HttpClient(int connectTimeoutMs, int totalTimeoutMs);
    virtual ~HttpClient() = default;

    // EN: Throws HttpTransportError when no response was received.
    // FR : Lance HttpTransportError si aucune réponse n'est reçue.
    virtual HttpResponse perform(const HttpRequest& request);

    HttpResponse post(const std::string& url, const Headers& headers, const std::string& body,
                      const CancellationToken& cancellation = CancellationToken());

  private:
    long connectTimeoutMs_;
    long totalTimeoutMs_;
};

}  // namespace Http
}  // namespace FGL
