#include "backend/backend_client.hpp"

#include <chrono>
#include <utility>
#include <curl/curl.h>
#include "core/logging/logger.hpp"

namespace bridge::backend {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

size_t write_body(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<char*>(contents), total);
    return total;
}

std::string describe(const CURLcode code, const char* error_buffer) {
    if (error_buffer[0] != '\0') {
        return error_buffer;
    }
    return curl_easy_strerror(code);
}

}  // namespace

CurlGlobalScope::CurlGlobalScope() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}

CurlGlobalScope::~CurlGlobalScope() {
    if (ok_) {
        curl_global_cleanup();
    }
}

CurlBackendClient::CurlBackendClient(BackendConfig config) : config_(std::move(config)) {}

core::errors::Result<json> CurlBackendClient::post(const std::string& path, const json& body) {
    const std::string url = config_.base_url + path;
    const std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        return BridgeError{ErrorCategory::Internal, "Failed to initialise HTTP client.",
                           "curl_init_failed"};
    }

    std::string response;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout_ms));
    // Worker threads: no SIGALRM-based DNS timeouts.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_DEBUG("Backend POST " + url + " body=" + payload);
    const auto started = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();

    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    const std::string failure = res == CURLE_OK ? "" : describe(res, error_buffer);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return BridgeError{ErrorCategory::BackendUnreachable,
                           "Backend timed out after " + std::to_string(elapsed_ms) +
                               " ms: " + failure,
                           "backend_timeout",
                           "Check that the backend service at " + config_.base_url +
                               " is responsive."};
    }
    if (res != CURLE_OK) {
        return BridgeError{ErrorCategory::BackendUnreachable,
                           "Backend unreachable: " + failure, "backend_unreachable",
                           "Start the backend service at " + config_.base_url + "."};
    }

    json parsed = json::parse(response, nullptr, false);
    if (parsed.is_discarded()) {
        return BridgeError{ErrorCategory::BackendMalformedResponse,
                           "Backend returned malformed response: HTTP " +
                               std::to_string(status) + ", " +
                               std::to_string(response.size()) + " bytes",
                           "backend_malformed_response"};
    }

    if (status >= 400) {
        LOG_WARN("Backend " + url + " replied HTTP " + std::to_string(status) +
                 "; passing body through");
    }
    LOG_DEBUG("Backend reply HTTP " + std::to_string(status) + " in " +
              std::to_string(elapsed_ms) + " ms");
    return parsed;
}

}  // namespace bridge::backend
