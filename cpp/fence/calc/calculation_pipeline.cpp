#include "fence/calc/calculation_pipeline.h"
#include "fence/calc/fallback_estimator.h"
#include "fence/core/logging.h"
#include "fence/scene/segment_store.h"

#include <chrono>
#include <exception>

namespace fence {

CalculationPipeline::CalculationPipeline(const CalculationOptions& options, const FallbackPricing& pricing)
    : options_(options), pricing_(pricing) {}

void CalculationPipeline::setOptions(const CalculationOptions& options, const FallbackPricing& pricing) {
    options_ = options;
    pricing_ = pricing;
}

void CalculationPipeline::reset() {
    scheduled_ = false;
    dueAtMs_ = 0.0;
    // Replies still in flight are orphaned by bumping the token.
    latestToken_++;
    result_ = CalculationResult{};
}

void CalculationPipeline::schedule(double nowMs) {
    scheduled_ = true;
    dueAtMs_ = nowMs + options_.debounceMs;
}

bool CalculationPipeline::tick(double nowMs, const SegmentStore& store, const std::string& fenceType, const std::string& color) {
    bool changed = false;
    if (scheduled_ && nowMs >= dueAtMs_) {
        changed = dispatch(store, fenceType, color);
    }
    if (drain()) changed = true;
    return changed;
}

bool CalculationPipeline::flush(const SegmentStore& store, const std::string& fenceType, const std::string& color) {
    bool changed = dispatch(store, fenceType, color);
    if (drain()) changed = true;
    return changed;
}

bool CalculationPipeline::dispatch(const SegmentStore& store, const std::string& fenceType, const std::string& color) {
    scheduled_ = false;
    const std::uint64_t token = ++latestToken_;
    const Measurements measurements = measureSegments(store.segments());

    if (store.empty()) {
        result_ = CalculationResult{};
        result_.source = CalculationSource::Empty;
        result_.requestToken = token;
        return true;
    }

    if (!client_) {
        publishFallback(token, measurements, "no estimator configured");
        return true;
    }

    EstimateRequest request{};
    request.token = token;
    request.fenceType = fenceType;
    request.color = color;
    request.segments.reserve(store.size());
    for (const Segment& s : store.segments()) {
        request.segments.push_back(EstimateSegment{s.path, s.styleId, s.colorId, s.length, s.isGate, store.gridSize()});
    }

    std::future<EstimateReply> future = client_->submit(request);
    if (!future.valid()) {
        publishFallback(token, measurements, "estimator returned no future");
        return true;
    }
    inFlight_.push_back(InFlight{token, measurements, std::move(future)});
    return false;
}

bool CalculationPipeline::drain() {
    bool changed = false;
    for (auto it = inFlight_.begin(); it != inFlight_.end();) {
        if (it->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        EstimateReply reply{};
        try {
            reply = it->future.get();
        } catch (const std::exception& e) {
            reply.status = FenceError::EstimatorUnavailable;
            reply.detail = e.what();
        }

        const std::uint64_t token = it->token;
        const Measurements measurements = it->measurements;
        it = inFlight_.erase(it);

        if (token < latestToken_) {
            discarded_++;
            FENCE_LOG_DEBUG("calculation: dropped stale reply %llu (latest %llu)",
                static_cast<unsigned long long>(token), static_cast<unsigned long long>(latestToken_));
            continue;
        }

        if (reply.status != FenceError::Ok) {
            publishFallback(token, measurements, reply.detail.empty() ? toString(reply.status) : reply.detail.c_str());
        } else {
            result_.measurements = measurements;
            result_.materials = reply.materials;
            result_.cost = reply.cost;
            result_.source = CalculationSource::Service;
            result_.requestToken = token;
        }
        changed = true;
    }
    return changed;
}

void CalculationPipeline::publishFallback(std::uint64_t token, const Measurements& m, const char* reason) {
    FENCE_LOG_WARN("calculation: estimator failed (%s), using local fallback", reason);
    (void)reason;
    result_.measurements = m;
    computeFallbackEstimate(m, pricing_, result_.materials, result_.cost);
    result_.source = CalculationSource::Fallback;
    result_.requestToken = token;
}

} // namespace fence
