#pragma once

#include <gtest/gtest.h>
#include "fence/calc/estimator_client.h"
#include "fence/engine.h"
#include "tests/test_accessors.h"

#include <cstdint>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

namespace engine_test {

using fence::FenceEngine;
using fence::Point2;
using fence::SegmentId;

// Engine clock under test control.
struct ManualClock {
    double nowMs = 0.0;
    FenceEngine::Clock fn() {
        return [this] { return nowMs; };
    }
};

// Estimator double. Replies are either answered immediately or parked in a
// promise the test fulfils later.
class FakeEstimatorClient : public fence::EstimatorClient {
public:
    enum class Mode { Succeed, Fail, Throw, Hold };

    explicit FakeEstimatorClient(Mode mode = Mode::Succeed) : mode(mode) {}

    std::future<fence::EstimateReply> submit(const fence::EstimateRequest& request) override {
        requests.push_back(request);
        std::promise<fence::EstimateReply> promise;
        std::future<fence::EstimateReply> future = promise.get_future();
        switch (mode) {
            case Mode::Succeed:
                promise.set_value(reply);
                break;
            case Mode::Fail: {
                fence::EstimateReply failed{};
                failed.status = fence::FenceError::EstimatorUnavailable;
                failed.detail = "HTTP 503";
                promise.set_value(failed);
                break;
            }
            case Mode::Throw:
                promise.set_exception(std::make_exception_ptr(std::runtime_error("connection reset")));
                break;
            case Mode::Hold:
                held.push_back(std::move(promise));
                break;
        }
        return future;
    }

    Mode mode;
    fence::EstimateReply reply = serviceReply();
    std::vector<fence::EstimateRequest> requests;
    std::vector<std::promise<fence::EstimateReply>> held;

    static fence::EstimateReply serviceReply() {
        fence::EstimateReply r{};
        r.status = fence::FenceError::Ok;
        r.materials = fence::Materials{3, 4, 12, 0};
        r.cost = fence::CostBreakdown{300.0, 100.0, 0.0, 400.0, 40.0};
        return r;
    }
};

// Draws a straight segment through the world-space draw API.
inline SegmentId drawSegment(FenceEngine& engine, const std::vector<Point2>& points) {
    engine.beginDraw(points.front().x, points.front().y);
    for (std::size_t i = 1; i + 1 < points.size(); ++i) {
        engine.appendVertex(points[i].x, points[i].y);
    }
    engine.continueDraw(points.back().x, points.back().y);
    return engine.finishDraw(points.back().x, points.back().y);
}

inline std::vector<FenceEngine::EngineEvent> drainEvents(FenceEngine& engine) {
    return engine.pollEvents(4096);
}

inline std::size_t countEvents(const std::vector<FenceEngine::EngineEvent>& events, fence::protocol::EventType type) {
    std::size_t n = 0;
    for (const auto& ev : events) {
        if (ev.type == static_cast<std::uint16_t>(type)) n++;
    }
    return n;
}

} // namespace engine_test

class FenceEngineTest : public ::testing::Test {
protected:
    engine_test::ManualClock clock;
    fence::FenceEngine engine;

    void SetUp() override {
        engine.setClock(clock.fn());
    }
};
