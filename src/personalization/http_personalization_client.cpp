#include "../../include/personalization/http_personalization_client.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace econ {
namespace personalization {

namespace LogCategory = logging::LogCategory;

HttpPersonalizationClient::HttpPersonalizationClient(HttpClientConfig config, logging::AsyncLogger* logger)
    : config_(std::move(config)), logger_(logger) {
    if (const char* url = std::getenv("ECON_PERSONALIZATION_URL")) {
        config_.endpoint = url;
    }
    if (const char* key = std::getenv("ECON_PERSONALIZATION_KEY")) {
        config_.api_key = key;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, config_.connect_timeout_s);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, config_.request_timeout_s);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    // Reuse connections
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
}

HttpPersonalizationClient::~HttpPersonalizationClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

size_t HttpPersonalizationClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpStats HttpPersonalizationClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::optional<PersonalizationAdvice> HttpPersonalizationClient::request(const PersonalizationContext& context) {
    if (config_.endpoint.empty())
        return std::nullopt;

    std::string body = context_to_json(context).dump();
    std::string response_body;

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.requests++;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth_header;
    if (!config_.api_key.empty()) {
        auth_header = "Authorization: Bearer " + config_.api_key;
        headers = curl_slist_append(headers, auth_header.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl_);
    auto end = std::chrono::steady_clock::now();
    stats_.last_latency_ms =
        static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        stats_.failures++;
        ECON_LOGF_WARN(logger_, LogCategory::Personalization, "request for %s failed: %s", context.player.c_str(),
                       curl_easy_strerror(res));
        return std::nullopt;
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    stats_.last_http_code = http_code;
    if (http_code < 200 || http_code >= 300) {
        stats_.failures++;
        ECON_LOGF_WARN(logger_, LogCategory::Personalization, "request for %s: HTTP %ld", context.player.c_str(),
                       http_code);
        return std::nullopt;
    }

    nlohmann::json parsed = nlohmann::json::parse(response_body, nullptr, false);
    if (parsed.is_discarded()) {
        stats_.failures++;
        ECON_LOGF_WARN(logger_, LogCategory::Personalization, "unparseable response for %s",
                       context.player.c_str());
        return std::nullopt;
    }
    return advice_from_json(parsed);
}

} // namespace personalization
} // namespace econ
