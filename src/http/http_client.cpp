// EN: HttpClient over the libcurl easy interface. One easy handle per request.
// FR : HttpClient sur l'interface easy de libcurl. Un handle easy par requête.

#include "http/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>

#include <curl/curl.h>

namespace FGL {
namespace Http {

namespace {

struct Transfer {
    std::string body;
    Headers headers;
};

size_t onBody(char* data, size_t size, size_t count, void* userdata) {
    const size_t length = size * count;
    static_cast<Transfer*>(userdata)->body.append(data, length);
    return length;
}

std::string trimmed(const std::string& text) {
    const char* blanks = " \t\r\n";
    const size_t first = text.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, text.find_last_not_of(blanks) - first + 1);
}

// EN: Called once per header line, status line and blank terminator included
// FR : Appelé pour chaque ligne d'en-tête, ligne de statut et terminateur vide compris
size_t onHeader(char* data, size_t size, size_t count, void* userdata) {
    const size_t length = size * count;
    const std::string line(data, length);
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return length;
    }

    std::string name = trimmed(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static_cast<Transfer*>(userdata)->headers[name] = trimmed(line.substr(colon + 1));
    return length;
}

// EN: Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
// FR : Une valeur non nulle interrompt le transfert avec CURLE_ABORTED_BY_CALLBACK
int onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<CancellationToken*>(userdata)->isCancelled() ? 1 : 0;
}

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

HttpClient::HttpClient(int connectTimeoutMs, int totalTimeoutMs)
    : connectTimeoutMs_(connectTimeoutMs), totalTimeoutMs_(totalTimeoutMs) {
    static std::once_flag global_init;
    std::call_once(global_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpClient::perform(const HttpRequest& request) {
    if (request.cancellation.isCancelled()) {
        throw HttpTransportError(request.method + " " + request.url + ": interrupted (" +
                                 request.cancellation.reason() + ")");
    }

    std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        throw HttpTransportError("curl_easy_init failed for " + request.url);
    }
    CURL* easy = handle.get();

    Transfer transfer;
    CancellationToken cancellation = request.cancellation;
    std::unique_ptr<curl_slist, HeaderListDeleter> header_list;
    for (const auto& [name, value] : request.headers) {
        curl_slist* grown = curl_slist_append(header_list.get(), (name + ": " + value).c_str());
        if (!grown) {
            throw HttpTransportError("Cannot build headers for " + request.url);
        }
        header_list.release();
        header_list.reset(grown);
    }

    curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, connectTimeoutMs_);
    long timeout_ms = totalTimeoutMs_;
    if (const auto left = cancellation.remaining()) {
        timeout_ms = std::min(timeout_ms, std::max(1L, static_cast<long>(left->count())));
    }
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(easy, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(easy, CURLOPT_XFERINFODATA, &cancellation);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, &transfer);
    if (request.body) {
        curl_easy_setopt(easy, CURLOPT_POSTFIELDS, request.body->data());
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body->size()));
    }

    char detail[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, detail);

    const auto started = std::chrono::steady_clock::now();
    const CURLcode code = curl_easy_perform(easy);

    HttpResponse response;
    response.elapsed_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());

    if (code == CURLE_ABORTED_BY_CALLBACK) {
        throw HttpTransportError(request.method + " " + request.url + ": interrupted (" +
                                 cancellation.reason() + ")");
    }
    if (code != CURLE_OK) {
        throw HttpTransportError(request.method + " " + request.url + ": " +
                                 (detail[0] != '\0' ? detail : curl_easy_strerror(code)));
    }

    long status = 0;
    curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);
    response.headers = std::move(transfer.headers);
    response.body = std::move(transfer.body);
    return response;
}

HttpResponse HttpClient::post(const std::string& url, const Headers& headers, const std::string& body,
                              const CancellationToken& cancellation) {
    return perform(HttpRequest{"POST", url, headers, body, cancellation});
}

}  // namespace Http
}  // namespace FGL
