#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::backend {

struct BackendConfig {
    std::string base_url = "http://127.0.0.1:5000";
    std::uint32_t timeout_ms = 30000;
    std::uint32_t connect_timeout_ms = 2000;
};

// One POST per call, no retries. Implementations must be safe to call from
// several worker threads at once.
class BackendClient {
public:
    virtual ~BackendClient() = default;

    // Success carries the parsed reply body whatever the HTTP status was.
    virtual core::errors::Result<nlohmann::json> post(const std::string& path,
                                                      const nlohmann::json& body) = 0;
};

class CurlBackendClient : public BackendClient {
public:
    explicit CurlBackendClient(BackendConfig config);

    core::errors::Result<nlohmann::json> post(const std::string& path,
                                              const nlohmann::json& body) override;

private:
    BackendConfig config_;
};

// Owns curl_global_init/curl_global_cleanup for the process. Create one
// before any worker thread starts issuing requests.
class CurlGlobalScope {
public:
    CurlGlobalScope();
    ~CurlGlobalScope();

    CurlGlobalScope(const CurlGlobalScope&) = delete;
    CurlGlobalScope& operator=(const CurlGlobalScope&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
};

}  // namespace bridge::backend
