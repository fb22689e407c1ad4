// FenceEngine input routing: maps screen-space pointer, key and wheel events
// onto the tool state machine and the direct operations.

#include "fence/engine.h"
#include "fence/core/logging.h"
#include "fence/internal/engine_state.h"

namespace fence {

using protocol::InputEvent;
using protocol::InputKind;
using protocol::InputModifier;
using protocol::Key;

bool FenceEngine::handleInput(const InputEvent& ev) {
    switch (ev.kind) {
        case InputKind::PointerDown:
            return handlePointerDown(ev);
        case InputKind::PointerMove:
            return handlePointerMove(ev);
        case InputKind::PointerUp:
            return handlePointerUp(ev);
        case InputKind::PointerLeave:
            if (isDrawing()) {
                cancelDraw();
                return true;
            }
            state().interactionSession_.endPan();
            return false;
        case InputKind::KeyDown:
            return handleKeyDown(ev);
        case InputKind::KeyUp:
            return handleKeyUp(ev);
        case InputKind::Wheel: {
            const float step = state().config.viewport.wheelStep;
            zoomAt(ev.x, ev.y, ev.delta > 0.0f ? -step : step);
            return true;
        }
        case InputKind::AppendVertex: {
            if (!isDrawing()) return false;
            const Point2 world = screenToWorld(ev.x, ev.y);
            appendVertex(world.x, world.y);
            return true;
        }
    }
    FENCE_LOG_DEBUG("input: unknown kind %u", static_cast<unsigned>(ev.kind));
    return false;
}

bool FenceEngine::handlePointerDown(const InputEvent& ev) {
    EngineState& s = state();
    const Point2 world = screenToWorld(ev.x, ev.y);
    switch (s.tool_) {
        case Tool::Fence:
        case Tool::Gate:
            beginDraw(world.x, world.y);
            return true;
        case Tool::Select:
            selectAt(world.x, world.y, ev.modifiers);
            return true;
        case Tool::Pan:
            s.interactionSession_.beginPan(Point2{ev.x, ev.y});
            return true;
    }
    return false;
}

bool FenceEngine::handlePointerMove(const InputEvent& ev) {
    EngineState& s = state();
    if (s.tool_ == Tool::Pan) {
        float dx = 0.0f;
        float dy = 0.0f;
        if (!s.interactionSession_.updatePan(Point2{ev.x, ev.y}, dx, dy)) return false;
        panBy(dx, dy);
        return true;
    }

    const Point2 world = screenToWorld(ev.x, ev.y);
    if (isDrawing()) {
        continueDraw(world.x, world.y);
        return true;
    }
    if (s.tool_ == Tool::Fence || s.tool_ == Tool::Gate) {
        const bool hadTarget = s.interactionSession_.lastSnap().hasTarget;
        s.interactionSession_.probeHover(world);
        if (hadTarget || s.interactionSession_.lastSnap().hasTarget) recordDraftChanged();
        return true;
    }
    return false;
}

bool FenceEngine::handlePointerUp(const InputEvent& ev) {
    EngineState& s = state();
    if (s.tool_ == Tool::Pan) {
        if (!s.interactionSession_.isPanning()) return false;
        s.interactionSession_.endPan();
        return true;
    }
    if (!isDrawing()) return false;
    const Point2 world = screenToWorld(ev.x, ev.y);
    finishDraw(world.x, world.y);
    return true;
}

bool FenceEngine::handleKeyDown(const InputEvent& ev) {
    EngineState& s = state();
    const bool command = protocol::hasModifier(ev.modifiers, InputModifier::Ctrl)
        || protocol::hasModifier(ev.modifiers, InputModifier::Meta);

    if (command) {
        switch (ev.key) {
            case Key::KeyZ:
                return protocol::hasModifier(ev.modifiers, InputModifier::Shift) ? redo() : undo();
            case Key::KeyY:
                return redo();
            case Key::KeyC:
                return copySelected() > 0;
            case Key::KeyV:
                return !paste().empty();
            case Key::KeyA:
                selectAll();
                return true;
            case Key::KeyD:
                return !duplicateSelected().empty();
            case Key::KeyG:
                setGridSnapEnabled(!s.config.snap.gridEnabled);
                return true;
            default:
                return false;
        }
    }

    switch (ev.key) {
        case Key::Delete:
        case Key::Backspace:
            return deleteSelected() > 0;
        case Key::Escape:
            clearSelection();
            cancelDraw();
            return true;
        case Key::Tab:
            cycleSelection();
            return true;
        case Key::Enter:
            if (!isDrawing()) return false;
            confirmDraw();
            return true;
        case Key::Space:
            setTool(s.tool_ == Tool::Pan ? s.toolBeforePan_ : Tool::Pan);
            return true;
        case Key::Shift:
            setPrecisionMode(true);
            return true;
        default:
            return false;
    }
}

bool FenceEngine::handleKeyUp(const InputEvent& ev) {
    if (ev.key == Key::Shift) {
        setPrecisionMode(false);
        return true;
    }
    return false;
}

} // namespace fence
