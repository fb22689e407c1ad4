#pragma once

#include <cstdint>

namespace fence::protocol {

// =============================================================================
// Input
// =============================================================================

enum class InputModifier : std::uint32_t {
    Shift = 1 << 0,
    Ctrl = 1 << 1,
    Alt = 1 << 2,
    Meta = 1 << 3,
};

inline bool hasModifier(std::uint32_t modifiers, InputModifier m) {
    return (modifiers & static_cast<std::uint32_t>(m)) != 0;
}

enum class InputKind : std::uint16_t {
    PointerDown = 1,
    PointerMove = 2,
    PointerUp = 3,
    PointerLeave = 4,
    KeyDown = 5,
    KeyUp = 6,
    Wheel = 7,
    // Adds an interior vertex to the active draft (double-click style gesture).
    AppendVertex = 8,
};

enum class Key : std::uint16_t {
    None = 0,
    Escape,
    Enter,
    Delete,
    Backspace,
    Tab,
    Space,
    Shift,
    KeyA,
    KeyC,
    KeyD,
    KeyG,
    KeyV,
    KeyY,
    KeyZ,
};

// Pointer coordinates are in screen space; the engine maps them to world
// space through the viewport. `delta` is used only by Wheel (negative = in).
struct InputEvent {
    InputKind kind;
    float x;
    float y;
    Key key;
    std::uint32_t modifiers;
    float delta;
};

inline InputEvent pointerEvent(InputKind kind, float x, float y, std::uint32_t modifiers = 0) {
    return InputEvent{kind, x, y, Key::None, modifiers, 0.0f};
}

inline InputEvent keyEvent(InputKind kind, Key key, std::uint32_t modifiers = 0) {
    return InputEvent{kind, 0.0f, 0.0f, key, modifiers, 0.0f};
}

inline InputEvent wheelEvent(float x, float y, float delta, std::uint32_t modifiers = 0) {
    return InputEvent{InputKind::Wheel, x, y, Key::None, modifiers, delta};
}

// =============================================================================
// Tools
// =============================================================================

enum class Tool : std::uint32_t {
    Fence = 0,
    Gate = 1,
    Select = 2,
    Pan = 3,
};

// =============================================================================
// Event Structures
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    SegmentCreated = 2,
    SegmentDeleted = 3,
    SegmentChanged = 4,
    SelectionChanged = 5,
    HistoryChanged = 6,
    ViewportChanged = 7,
    DraftChanged = 8,
    CalculationUpdated = 9,
    LoadFailed = 10,
    SceneReplaced = 11,
};

struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
};

} // namespace fence::protocol
