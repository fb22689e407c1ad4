#pragma once

#include "fence/calc/estimator_client.h"

#include <string>

namespace fence {

// POSTs the JSON request to an HTTP endpoint with libcurl on a worker thread.
class CurlEstimatorClient : public EstimatorClient {
public:
    CurlEstimatorClient(std::string url, long timeoutMs);

    std::future<EstimateReply> submit(const EstimateRequest& request) override;

    const std::string& url() const { return url_; }

private:
    std::string url_;
    long timeoutMs_;
};

} // namespace fence
