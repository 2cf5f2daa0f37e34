#pragma once
// ============================================================================
// VIGIL - REST Client
// ============================================================================
// Blocking HTTPS client for public market data endpoints
// One connection per request; every stage is bounded by request_timeout
// ============================================================================

#include "vigil/core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace vigil::network {

// ============================================================================
// HTTP Types
// ============================================================================

struct HttpResponse {
    int status_code = 0;            // -1 = transport failure, body holds the error
    std::map<std::string, std::string> headers;
    std::string body;
    Timestamp received_at;

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool is_rate_limited() const { return status_code == 429 || status_code == 418; }
};

// ============================================================================
// REST Client Configuration
// ============================================================================

struct RestClientConfig {
    std::string base_url = "https://api.binance.com";
    std::chrono::milliseconds request_timeout{10000};
    bool verify_tls = true;
    std::string user_agent = "vigil/1.0";
};

// ============================================================================
// REST Client Interface (for mocking)
// ============================================================================

class IRestClient {
public:
    virtual ~IRestClient() = default;

    [[nodiscard]] virtual HttpResponse get(std::string_view path,
                                           const std::map<std::string, std::string>& params = {}) = 0;
};

// ============================================================================
// REST Client Implementation
// ============================================================================

class RestClient final : public IRestClient {
public:
    explicit RestClient(const RestClientConfig& config);
    ~RestClient() override;

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    [[nodiscard]] HttpResponse get(std::string_view path,
                                   const std::map<std::string, std::string>& params = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// key=value&key=value with RFC 3986 escaping
[[nodiscard]] std::string build_query_string(const std::map<std::string, std::string>& params);

}  // namespace vigil::network
