#pragma once

#include "fence/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fence {

struct StyleEntry {
    std::string id;
    std::string name;
    std::string height;      // display height, e.g. "6'"
    std::string defaultSwatch;
};

struct ColorEntry {
    std::string id;
    std::string name;
    std::string swatch;      // "#rrggbb"
};

struct SnapOptions {
    float gridSize{kDefaultGridSize};
    bool gridEnabled{true};
    bool magneticEnabled{true};
    float snapTolerancePx{kDefaultSnapTolerancePx};
    std::vector<float> angleConstraintsDeg{0.0f, 45.0f, 90.0f, 135.0f, 180.0f, 225.0f, 270.0f, 315.0f};
    float angleThresholdDeg{15.0f};
    std::vector<float> lengthConstraintsFt{4.0f, 6.0f, 8.0f, 10.0f, 12.0f, 16.0f, 20.0f};
    float lengthThresholdFt{2.0f};
};

struct HistoryOptions {
    std::size_t limit{kDefaultHistoryLimit};
};

struct ViewportOptions {
    float viewWidth{1000.0f};
    float viewHeight{600.0f};
    float minZoom{0.1f};
    float maxZoom{5.0f};
    float zoomStep{1.2f};
    float wheelStep{0.1f};
    float fitPadding{50.0f};
    float fitMaxZoom{2.0f};
};

struct CalculationOptions {
    double debounceMs{kDefaultDebounceMs};
    std::string estimatorUrl{};
    long timeoutMs{10000};
};

struct FallbackPricing {
    double panelLengthFt{8.0};
    double hardwarePerPanel{4.0};
    double materialPerFt{15.0};
    double laborPerFt{8.0};
    double perGate{150.0};
};

struct EditOptions {
    float pasteOffsetX{40.0f};
    float pasteOffsetY{40.0f};
    float pickTolerancePx{10.0f};
    bool showDimensions{false};
};

struct EngineConfig {
    SnapOptions snap{};
    HistoryOptions history{};
    ViewportOptions viewport{};
    CalculationOptions calculation{};
    FallbackPricing pricing{};
    EditOptions edit{};
    std::vector<StyleEntry> styles{};
    std::vector<ColorEntry> colors{};
    std::string defaultStyleId{"vinyl-privacy"};
    std::string defaultColorId{"white"};

    const StyleEntry* findStyle(const std::string& id) const;
    const ColorEntry* findColor(const std::string& id) const;
    // Swatch for a color id; white when the id is not in the catalog.
    std::string colorSwatch(const std::string& id) const;
};

EngineConfig defaultEngineConfig();

// Overlays the fields present in `json` onto `inOut`. On any parse or type
// error `inOut` is left as it was.
FenceError parseEngineConfig(const std::string& json, EngineConfig& inOut);

} // namespace fence
