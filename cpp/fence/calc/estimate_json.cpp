#include "fence/calc/estimate_json.h"

#include <nlohmann/json.hpp>

#include <cmath>

namespace fence {

namespace {

using json = nlohmann::json;

bool readCount(const json& obj, const char* key, std::uint32_t& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return false;
    const double v = it->get<double>();
    if (!std::isfinite(v) || v < 0.0) return false;
    out = static_cast<std::uint32_t>(std::llround(v));
    return true;
}

bool readMoney(const json& obj, const char* key, double& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return false;
    out = it->get<double>();
    return std::isfinite(out);
}

} // namespace

std::string encodeEstimateRequest(const EstimateRequest& request) {
    json segments = json::array();
    for (const EstimateSegment& s : request.segments) {
        json path = json::array();
        for (const Point2& p : s.path) {
            path.push_back({{"x", p.x}, {"y", p.y}});
        }
        segments.push_back({
            {"path", std::move(path)},
            {"style", s.style},
            {"color", s.color},
            {"length", s.length},
            {"isGate", s.isGate},
            {"scale", s.scale},
        });
    }
    json body = {
        {"segments", std::move(segments)},
        {"fence_type", request.fenceType},
        {"color", request.color},
    };
    return body.dump();
}

FenceError decodeEstimateReply(const std::string& body, EstimateReply& out) {
    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        out.status = FenceError::InvalidEncoding;
        out.detail = "reply is not a JSON object";
        return out.status;
    }

    const json* root = &parsed;
    const auto message = parsed.find("message");
    if (message != parsed.end() && message->is_object()) root = &*message;

    const auto success = root->find("success");
    if (success == root->end() || !success->is_boolean() || !success->get<bool>()) {
        out.status = FenceError::EstimatorUnavailable;
        out.detail = "estimator reported failure";
        return out.status;
    }

    const auto materials = root->find("materials");
    const auto cost = root->find("cost_breakdown");
    if (materials == root->end() || !materials->is_object() || cost == root->end() || !cost->is_object()) {
        out.status = FenceError::InvalidEncoding;
        out.detail = "reply lacks materials or cost_breakdown";
        return out.status;
    }

    EstimateReply reply{};
    const bool ok = readCount(*materials, "panels", reply.materials.panels)
        && readCount(*materials, "posts", reply.materials.posts)
        && readCount(*materials, "hardware", reply.materials.hardware)
        && readCount(*materials, "gates", reply.materials.gates)
        && readMoney(*cost, "material_cost", reply.cost.materialCost)
        && readMoney(*cost, "labor_cost", reply.cost.laborCost)
        && readMoney(*cost, "gate_cost", reply.cost.gateCost)
        && readMoney(*cost, "total_cost", reply.cost.totalCost)
        && readMoney(*cost, "cost_per_foot", reply.cost.costPerFoot);
    if (!ok) {
        out.status = FenceError::InvalidEncoding;
        out.detail = "reply has missing or non-numeric fields";
        return out.status;
    }

    reply.status = FenceError::Ok;
    out = std::move(reply);
    return FenceError::Ok;
}

} // namespace fence
