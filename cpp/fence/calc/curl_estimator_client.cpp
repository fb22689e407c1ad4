#include "fence/calc/curl_estimator_client.h"
#include "fence/calc/estimate_json.h"
#include "fence/core/logging.h"

#include <curl/curl.h>

#include <mutex>
#include <string>
#include <utility>

namespace fence {

namespace {

std::once_flag gCurlInitOnce;

size_t appendBody(void* data, size_t size, size_t count, void* user) {
    auto* body = static_cast<std::string*>(user);
    body->append(static_cast<const char*>(data), size * count);
    return size * count;
}

EstimateReply postJson(const std::string& url, const std::string& payload, long timeoutMs) {
    EstimateReply reply{};
    CURL* h = curl_easy_init();
    if (!h) {
        reply.detail = "curl_easy_init failed";
        return reply;
    }

    std::string response;
    struct curl_slist* hdrs = nullptr;
    hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
    hdrs = curl_slist_append(hdrs, "Accept: application/json");

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(h);
    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(h);

    if (rc != CURLE_OK) {
        reply.detail = curl_easy_strerror(rc);
        return reply;
    }
    if (code >= 400) {
        reply.detail = "HTTP " + std::to_string(code);
        return reply;
    }
    if (decodeEstimateReply(response, reply) != FenceError::Ok) {
        FENCE_LOG_DEBUG("estimator: unusable reply (%s)", reply.detail.c_str());
    }
    return reply;
}

} // namespace

CurlEstimatorClient::CurlEstimatorClient(std::string url, long timeoutMs)
    : url_(std::move(url)), timeoutMs_(timeoutMs > 0 ? timeoutMs : 10000) {
    std::call_once(gCurlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::future<EstimateReply> CurlEstimatorClient::submit(const EstimateRequest& request) {
    std::string payload = encodeEstimateRequest(request);
    FENCE_LOG_DEBUG("estimator: request %llu, %zu segments, %zu bytes",
        static_cast<unsigned long long>(request.token), request.segments.size(), payload.size());
    return std::async(std::launch::async,
        [url = url_, body = std::move(payload), timeout = timeoutMs_]() {
            return postJson(url, body, timeout);
        });
}

} // namespace fence
