#include "fence/config/engine_config.h"
#include "fence/core/logging.h"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace fence {

namespace {

using json = nlohmann::json;

// Each reader returns false when the key is present with the wrong type.
bool readFloat(const json& obj, const char* key, float& out) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number()) return false;
    out = it->get<float>();
    return true;
}

bool readDouble(const json& obj, const char* key, double& out) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number()) return false;
    out = it->get<double>();
    return true;
}

bool readBool(const json& obj, const char* key, bool& out) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_boolean()) return false;
    out = it->get<bool>();
    return true;
}

bool readString(const json& obj, const char* key, std::string& out) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool readFloatList(const json& obj, const char* key, std::vector<float>& out) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_array()) return false;
    std::vector<float> values;
    for (const auto& v : *it) {
        if (!v.is_number()) return false;
        values.push_back(v.get<float>());
    }
    out = std::move(values);
    return true;
}

bool readSection(const json& root, const char* key, const json*& out) {
    out = nullptr;
    const auto it = root.find(key);
    if (it == root.end()) return true;
    if (!it->is_object()) return false;
    out = &*it;
    return true;
}

bool parseSnap(const json& obj, SnapOptions& s) {
    return readFloat(obj, "gridSize", s.gridSize)
        && readBool(obj, "gridEnabled", s.gridEnabled)
        && readBool(obj, "magneticEnabled", s.magneticEnabled)
        && readFloat(obj, "snapTolerance", s.snapTolerancePx)
        && readFloatList(obj, "angleConstraints", s.angleConstraintsDeg)
        && readFloat(obj, "angleThreshold", s.angleThresholdDeg)
        && readFloatList(obj, "lengthConstraints", s.lengthConstraintsFt)
        && readFloat(obj, "lengthThreshold", s.lengthThresholdFt);
}

bool parseViewport(const json& obj, ViewportOptions& v) {
    return readFloat(obj, "width", v.viewWidth)
        && readFloat(obj, "height", v.viewHeight)
        && readFloat(obj, "minZoom", v.minZoom)
        && readFloat(obj, "maxZoom", v.maxZoom)
        && readFloat(obj, "zoomStep", v.zoomStep)
        && readFloat(obj, "wheelStep", v.wheelStep)
        && readFloat(obj, "fitPadding", v.fitPadding)
        && readFloat(obj, "fitMaxZoom", v.fitMaxZoom);
}

bool parseCalculation(const json& obj, CalculationOptions& c) {
    double timeout = static_cast<double>(c.timeoutMs);
    if (!readDouble(obj, "debounceMs", c.debounceMs)
        || !readString(obj, "estimatorUrl", c.estimatorUrl)
        || !readDouble(obj, "timeoutMs", timeout)) {
        return false;
    }
    c.timeoutMs = static_cast<long>(timeout);
    return true;
}

bool parsePricing(const json& obj, FallbackPricing& p) {
    return readDouble(obj, "panelLength", p.panelLengthFt)
        && readDouble(obj, "hardwarePerPanel", p.hardwarePerPanel)
        && readDouble(obj, "materialPerFoot", p.materialPerFt)
        && readDouble(obj, "laborPerFoot", p.laborPerFt)
        && readDouble(obj, "perGate", p.perGate);
}

bool parseEdit(const json& obj, EditOptions& e) {
    return readFloat(obj, "pasteOffsetX", e.pasteOffsetX)
        && readFloat(obj, "pasteOffsetY", e.pasteOffsetY)
        && readFloat(obj, "pickTolerance", e.pickTolerancePx)
        && readBool(obj, "showDimensions", e.showDimensions);
}

bool parseStyles(const json& arr, std::vector<StyleEntry>& out) {
    if (!arr.is_array()) return false;
    std::vector<StyleEntry> styles;
    for (const auto& item : arr) {
        if (!item.is_object()) return false;
        StyleEntry entry{};
        if (!readString(item, "id", entry.id) || entry.id.empty()) return false;
        if (!readString(item, "name", entry.name)
            || !readString(item, "height", entry.height)
            || !readString(item, "color", entry.defaultSwatch)) {
            return false;
        }
        styles.push_back(std::move(entry));
    }
    out = std::move(styles);
    return true;
}

bool parseColors(const json& arr, std::vector<ColorEntry>& out) {
    if (!arr.is_array()) return false;
    std::vector<ColorEntry> colors;
    for (const auto& item : arr) {
        if (!item.is_object()) return false;
        ColorEntry entry{};
        if (!readString(item, "id", entry.id) || entry.id.empty()) return false;
        if (!readString(item, "name", entry.name) || !readString(item, "swatch", entry.swatch)) return false;
        colors.push_back(std::move(entry));
    }
    out = std::move(colors);
    return true;
}

bool isSane(const EngineConfig& c) {
    if (!(c.snap.gridSize > 0.0f) || c.snap.snapTolerancePx < 0.0f) return false;
    if (c.history.limit == 0 || c.history.limit > kMaxHistoryLimit) return false;
    if (!(c.viewport.minZoom > 0.0f) || c.viewport.maxZoom < c.viewport.minZoom) return false;
    if (!(c.viewport.zoomStep > 1.0f)) return false;
    if (c.calculation.debounceMs < 0.0) return false;
    if (!(c.pricing.panelLengthFt > 0.0)) return false;
    return true;
}

} // namespace

const StyleEntry* EngineConfig::findStyle(const std::string& id) const {
    const auto it = std::find_if(styles.begin(), styles.end(), [&](const StyleEntry& s) { return s.id == id; });
    return it == styles.end() ? nullptr : &*it;
}

const ColorEntry* EngineConfig::findColor(const std::string& id) const {
    const auto it = std::find_if(colors.begin(), colors.end(), [&](const ColorEntry& c) { return c.id == id; });
    return it == colors.end() ? nullptr : &*it;
}

std::string EngineConfig::colorSwatch(const std::string& id) const {
    const ColorEntry* color = findColor(id);
    return color ? color->swatch : std::string("#ffffff");
}

EngineConfig defaultEngineConfig() {
    EngineConfig config{};
    config.styles = {
        {"vinyl-privacy", "Vinyl Privacy", "6'", "#ffffff"},
        {"vinyl-semi-privacy", "Vinyl Semi-Privacy", "6'", "#ffffff"},
        {"vinyl-picket", "Vinyl Picket", "4'", "#ffffff"},
        {"aluminum-privacy", "Aluminum Privacy", "6'", "#c0c0c0"},
        {"aluminum-picket", "Aluminum Picket", "4'", "#c0c0c0"},
        {"wood-privacy", "Wood Privacy", "6'", "#8b4513"},
        {"wood-picket", "Wood Picket", "4'", "#8b4513"},
        {"chain-link", "Chain Link", "4'", "#808080"},
    };
    config.colors = {
        {"white", "White", "#ffffff"},
        {"sandstone", "Sandstone", "#d2b48c"},
        {"khaki", "Khaki", "#f4f4f4"},
        {"brown", "Chestnut Brown", "#8b4513"},
        {"cedar", "Weathered Cedar", "#a0522d"},
        {"black", "Black", "#000000"},
        {"gray", "Gray", "#808080"},
        {"green", "Green", "#228b22"},
    };
    return config;
}

FenceError parseEngineConfig(const std::string& text, EngineConfig& inOut) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        FENCE_LOG_WARN("config: document is not a JSON object");
        return FenceError::InvalidConfig;
    }

    EngineConfig next = inOut;
    const json* section = nullptr;
    bool ok = true;

    ok = ok && readSection(root, "snap", section) && (!section || parseSnap(*section, next.snap));
    if (ok) {
        double limit = static_cast<double>(next.history.limit);
        ok = readSection(root, "history", section) && (!section || readDouble(*section, "limit", limit));
        // Anything above the cap is clamped; NaN and values below 1 fail.
        if (ok && !(limit >= 1.0)) ok = false;
        if (ok) {
            next.history.limit = static_cast<std::size_t>(
                std::min(limit, static_cast<double>(kMaxHistoryLimit)));
        }
    }
    ok = ok && readSection(root, "viewport", section) && (!section || parseViewport(*section, next.viewport));
    ok = ok && readSection(root, "calculation", section) && (!section || parseCalculation(*section, next.calculation));
    ok = ok && readSection(root, "pricing", section) && (!section || parsePricing(*section, next.pricing));
    ok = ok && readSection(root, "edit", section) && (!section || parseEdit(*section, next.edit));
    if (ok) {
        const auto styles = root.find("styles");
        if (styles != root.end()) ok = parseStyles(*styles, next.styles);
    }
    if (ok) {
        const auto colors = root.find("colors");
        if (colors != root.end()) ok = parseColors(*colors, next.colors);
    }
    ok = ok && readString(root, "defaultStyle", next.defaultStyleId)
        && readString(root, "defaultColor", next.defaultColorId);

    if (!ok || !isSane(next)) {
        FENCE_LOG_WARN("config: rejected, keeping previous values");
        return FenceError::InvalidConfig;
    }
    inOut = std::move(next);
    return FenceError::Ok;
}

} // namespace fence
