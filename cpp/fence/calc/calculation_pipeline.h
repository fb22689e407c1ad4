#pragma once

#include "fence/calc/calculation_types.h"
#include "fence/calc/estimator_client.h"
#include "fence/config/engine_config.h"

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fence {

class SegmentStore;

// Debounced estimate requests. Time only advances through tick(); the engine
// feeds it the host clock. Replies older than the latest dispatched request
// are dropped.
class CalculationPipeline {
public:
    CalculationPipeline(const CalculationOptions& options, const FallbackPricing& pricing);

    void setClient(std::shared_ptr<EstimatorClient> client) { client_ = std::move(client); }
    EstimatorClient* client() const { return client_.get(); }
    void setOptions(const CalculationOptions& options, const FallbackPricing& pricing);

    // (Re)arms the debounce window; any earlier pending schedule is replaced.
    void schedule(double nowMs);
    bool isScheduled() const noexcept { return scheduled_; }

    // Dispatches when due, then applies any finished reply. Returns true when
    // result() changed.
    bool tick(double nowMs, const SegmentStore& store, const std::string& fenceType, const std::string& color);
    // Dispatches immediately, ignoring the debounce window.
    bool flush(const SegmentStore& store, const std::string& fenceType, const std::string& color);

    const CalculationResult& result() const noexcept { return result_; }
    std::uint64_t latestToken() const noexcept { return latestToken_; }
    std::size_t inFlightCount() const noexcept { return inFlight_.size(); }
    std::uint32_t discardedReplies() const noexcept { return discarded_; }

    void reset();

private:
    struct InFlight {
        std::uint64_t token;
        Measurements measurements;
        std::future<EstimateReply> future;
    };

    bool dispatch(const SegmentStore& store, const std::string& fenceType, const std::string& color);
    bool drain();
    void publishFallback(std::uint64_t token, const Measurements& m, const char* reason);

    CalculationOptions options_;
    FallbackPricing pricing_;
    std::shared_ptr<EstimatorClient> client_;

    bool scheduled_{false};
    double dueAtMs_{0.0};
    std::uint64_t latestToken_{0};
    std::uint32_t discarded_{0};
    std::vector<InFlight> inFlight_;
    CalculationResult result_{};
};

} // namespace fence
