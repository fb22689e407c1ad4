#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "fence/calc/curl_estimator_client.h"
#include "fence/calc/estimate_json.h"

#include <chrono>

using namespace fence;

namespace {

const char* kReplyBody = R"({
    "success": true,
    "materials": {"panels": 2, "posts": 3, "hardware": 8, "gates": 1},
    "cost_breakdown": {
        "material_cost": 150.0,
        "labor_cost": 80.0,
        "gate_cost": 150.0,
        "total_cost": 380.0,
        "cost_per_foot": 38.0
    }
})";

} // namespace

TEST(EstimateJsonTest, RequestCarriesSegmentFields) {
    EstimateRequest req{};
    req.token = 7;
    req.fenceType = "wood-privacy";
    req.color = "cedar";
    req.segments.push_back(EstimateSegment{{Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}}, "wood-privacy", "cedar", 10.0, true, 20.0f});

    const nlohmann::json body = nlohmann::json::parse(encodeEstimateRequest(req));
    EXPECT_EQ(body.at("fence_type"), "wood-privacy");
    EXPECT_EQ(body.at("color"), "cedar");
    ASSERT_EQ(body.at("segments").size(), 1u);
    const auto& seg = body.at("segments")[0];
    EXPECT_EQ(seg.at("style"), "wood-privacy");
    EXPECT_EQ(seg.at("isGate"), true);
    EXPECT_DOUBLE_EQ(seg.at("length").get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(seg.at("scale").get<double>(), 20.0);
    ASSERT_EQ(seg.at("path").size(), 2u);
    EXPECT_DOUBLE_EQ(seg.at("path")[1].at("x").get<double>(), 200.0);
}

TEST(EstimateJsonTest, DecodesBareReply) {
    EstimateReply reply{};
    ASSERT_EQ(decodeEstimateReply(kReplyBody, reply), FenceError::Ok);
    EXPECT_EQ(reply.status, FenceError::Ok);
    EXPECT_EQ(reply.materials.panels, 2u);
    EXPECT_EQ(reply.materials.gates, 1u);
    EXPECT_DOUBLE_EQ(reply.cost.totalCost, 380.0);
    EXPECT_DOUBLE_EQ(reply.cost.costPerFoot, 38.0);
}

TEST(EstimateJsonTest, DecodesMessageWrappedReply) {
    const std::string wrapped = std::string(R"({"message": )") + kReplyBody + "}";
    EstimateReply reply{};
    ASSERT_EQ(decodeEstimateReply(wrapped, reply), FenceError::Ok);
    EXPECT_EQ(reply.materials.hardware, 8u);
}

TEST(EstimateJsonTest, RejectsFailuresAndMalformedBodies) {
    EstimateReply reply{};
    EXPECT_EQ(decodeEstimateReply("not json", reply), FenceError::InvalidEncoding);
    EXPECT_EQ(decodeEstimateReply(R"({"success": false})", reply), FenceError::EstimatorUnavailable);
    EXPECT_EQ(decodeEstimateReply(R"({"success": true, "materials": {}})", reply), FenceError::InvalidEncoding);

    const std::string missingCost = R"({"success": true,
        "materials": {"panels": 1, "posts": 2, "hardware": 4, "gates": 0},
        "cost_breakdown": {"material_cost": "lots"}})";
    EXPECT_EQ(decodeEstimateReply(missingCost, reply), FenceError::InvalidEncoding);
    EXPECT_NE(reply.status, FenceError::Ok);
}

TEST(CurlEstimatorClientTest, UnreachableEndpointReportsFailure) {
    CurlEstimatorClient client("http://127.0.0.1:9/estimate", 2000);
    EstimateRequest req{};
    req.token = 1;
    req.segments.push_back(EstimateSegment{{Point2{0.0f, 0.0f}, Point2{20.0f, 0.0f}}, "chain-link", "gray", 1.0, false, 20.0f});

    std::future<EstimateReply> future = client.submit(req);
    ASSERT_TRUE(future.valid());
    ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    const EstimateReply reply = future.get();
    EXPECT_NE(reply.status, FenceError::Ok);
    EXPECT_FALSE(reply.detail.empty());
}
