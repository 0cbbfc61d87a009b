#pragma once

/**
 * HttpPersonalizationClient - PersonalizationClient over HTTP POST + JSON
 *
 * Uses libcurl with a reusable easy handle (serialized by a mutex).
 * Transport failures, non-2xx answers and unparseable bodies all yield
 * nullopt; the caller simply proceeds without advice.
 *
 * Environment:
 *   ECON_PERSONALIZATION_URL   overrides the endpoint
 *   ECON_PERSONALIZATION_KEY   sent as "Authorization: Bearer <key>"
 */

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "personalization_client.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace econ {
namespace personalization {

struct HttpClientConfig {
    std::string endpoint;
    std::string api_key;
    long connect_timeout_s = config::personalization::CONNECT_TIMEOUT_S;
    long request_timeout_s = config::personalization::REQUEST_TIMEOUT_S;
};

struct HttpStats {
    uint64_t requests = 0;
    uint64_t failures = 0;
    uint32_t last_latency_ms = 0;
    long last_http_code = 0;
};

class HttpPersonalizationClient : public PersonalizationClient {
public:
    // Throws std::runtime_error when curl cannot be initialized
    explicit HttpPersonalizationClient(HttpClientConfig config, logging::AsyncLogger* logger = nullptr);
    ~HttpPersonalizationClient() override;

    HttpPersonalizationClient(const HttpPersonalizationClient&) = delete;
    HttpPersonalizationClient& operator=(const HttpPersonalizationClient&) = delete;

    std::optional<PersonalizationAdvice> request(const PersonalizationContext& context) override;

    const std::string& endpoint() const { return config_.endpoint; }
    HttpStats stats() const;

private:
    HttpClientConfig config_;
    logging::AsyncLogger* logger_;
    CURL* curl_ = nullptr;

    mutable std::mutex mutex_;
    HttpStats stats_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

} // namespace personalization
} // namespace econ
