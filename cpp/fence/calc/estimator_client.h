#pragma once

#include "fence/calc/calculation_types.h"

#include <future>

namespace fence {

// Remote material/cost estimator. submit() must not block the caller; the
// returned future is polled from the engine thread.
class EstimatorClient {
public:
    virtual ~EstimatorClient() = default;
    virtual std::future<EstimateReply> submit(const EstimateRequest& request) = 0;
};

} // namespace fence
