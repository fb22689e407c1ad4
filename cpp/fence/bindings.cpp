#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "fence/engine.h"

#ifdef EMSCRIPTEN
using fence::FenceEngine;

EMSCRIPTEN_BINDINGS(fence_engine_module) {
    emscripten::enum_<fence::protocol::Tool>("Tool")
        .value("Fence", fence::protocol::Tool::Fence)
        .value("Gate", fence::protocol::Tool::Gate)
        .value("Select", fence::protocol::Tool::Select)
        .value("Pan", fence::protocol::Tool::Pan);

    emscripten::enum_<fence::protocol::InputKind>("InputKind")
        .value("PointerDown", fence::protocol::InputKind::PointerDown)
        .value("PointerMove", fence::protocol::InputKind::PointerMove)
        .value("PointerUp", fence::protocol::InputKind::PointerUp)
        .value("PointerLeave", fence::protocol::InputKind::PointerLeave)
        .value("KeyDown", fence::protocol::InputKind::KeyDown)
        .value("KeyUp", fence::protocol::InputKind::KeyUp)
        .value("Wheel", fence::protocol::InputKind::Wheel)
        .value("AppendVertex", fence::protocol::InputKind::AppendVertex);

    emscripten::enum_<fence::protocol::Key>("Key")
        .value("None", fence::protocol::Key::None)
        .value("Escape", fence::protocol::Key::Escape)
        .value("Enter", fence::protocol::Key::Enter)
        .value("Delete", fence::protocol::Key::Delete)
        .value("Backspace", fence::protocol::Key::Backspace)
        .value("Tab", fence::protocol::Key::Tab)
        .value("Space", fence::protocol::Key::Space)
        .value("Shift", fence::protocol::Key::Shift)
        .value("KeyA", fence::protocol::Key::KeyA)
        .value("KeyC", fence::protocol::Key::KeyC)
        .value("KeyD", fence::protocol::Key::KeyD)
        .value("KeyG", fence::protocol::Key::KeyG)
        .value("KeyV", fence::protocol::Key::KeyV)
        .value("KeyY", fence::protocol::Key::KeyY)
        .value("KeyZ", fence::protocol::Key::KeyZ);

    emscripten::enum_<fence::DrawState>("DrawState")
        .value("Idle", fence::DrawState::Idle)
        .value("Drawing", fence::DrawState::Drawing);

    emscripten::enum_<fence::CalculationSource>("CalculationSource")
        .value("None", fence::CalculationSource::None)
        .value("Empty", fence::CalculationSource::Empty)
        .value("Service", fence::CalculationSource::Service)
        .value("Fallback", fence::CalculationSource::Fallback);

    emscripten::enum_<fence::FenceError>("FenceError")
        .value("Ok", fence::FenceError::Ok)
        .value("InvalidMagic", fence::FenceError::InvalidMagic)
        .value("UnsupportedVersion", fence::FenceError::UnsupportedVersion)
        .value("BufferTruncated", fence::FenceError::BufferTruncated)
        .value("InvalidPayloadSize", fence::FenceError::InvalidPayloadSize)
        .value("ChecksumMismatch", fence::FenceError::ChecksumMismatch)
        .value("InvalidEncoding", fence::FenceError::InvalidEncoding)
        .value("InvalidGeometry", fence::FenceError::InvalidGeometry)
        .value("DuplicateId", fence::FenceError::DuplicateId)
        .value("UnknownSegment", fence::FenceError::UnknownSegment)
        .value("InvalidOperation", fence::FenceError::InvalidOperation)
        .value("InvalidConfig", fence::FenceError::InvalidConfig)
        .value("EstimatorUnavailable", fence::FenceError::EstimatorUnavailable);

    emscripten::value_object<fence::Point2>("Point2")
        .field("x", &fence::Point2::x)
        .field("y", &fence::Point2::y);

    emscripten::value_object<fence::protocol::InputEvent>("InputEvent")
        .field("kind", &fence::protocol::InputEvent::kind)
        .field("x", &fence::protocol::InputEvent::x)
        .field("y", &fence::protocol::InputEvent::y)
        .field("key", &fence::protocol::InputEvent::key)
        .field("modifiers", &fence::protocol::InputEvent::modifiers)
        .field("delta", &fence::protocol::InputEvent::delta);

    emscripten::value_object<fence::protocol::EngineEvent>("EngineEvent")
        .field("type", &fence::protocol::EngineEvent::type)
        .field("flags", &fence::protocol::EngineEvent::flags)
        .field("a", &fence::protocol::EngineEvent::a)
        .field("b", &fence::protocol::EngineEvent::b)
        .field("c", &fence::protocol::EngineEvent::c);

    emscripten::value_object<fence::DraftDimensions>("DraftDimensions")
        .field("active", &fence::DraftDimensions::active)
        .field("startX", &fence::DraftDimensions::startX)
        .field("startY", &fence::DraftDimensions::startY)
        .field("endX", &fence::DraftDimensions::endX)
        .field("endY", &fence::DraftDimensions::endY)
        .field("previewLengthFt", &fence::DraftDimensions::previewLengthFt)
        .field("totalLengthFt", &fence::DraftDimensions::totalLengthFt)
        .field("angleDeg", &fence::DraftDimensions::angleDeg);

    emscripten::value_object<fence::Materials>("Materials")
        .field("panels", &fence::Materials::panels)
        .field("posts", &fence::Materials::posts)
        .field("hardware", &fence::Materials::hardware)
        .field("gates", &fence::Materials::gates);

    emscripten::value_object<fence::CostBreakdown>("CostBreakdown")
        .field("materialCost", &fence::CostBreakdown::materialCost)
        .field("laborCost", &fence::CostBreakdown::laborCost)
        .field("gateCost", &fence::CostBreakdown::gateCost)
        .field("totalCost", &fence::CostBreakdown::totalCost)
        .field("costPerFoot", &fence::CostBreakdown::costPerFoot);

    emscripten::value_object<fence::Measurements>("Measurements")
        .field("totalLengthFt", &fence::Measurements::totalLengthFt)
        .field("segmentCount", &fence::Measurements::segmentCount)
        .field("gateCount", &fence::Measurements::gateCount)
        .field("cornerCount", &fence::Measurements::cornerCount);

    emscripten::register_vector<fence::protocol::EngineEvent>("EngineEventList");
    emscripten::register_vector<std::uint32_t>("SegmentIdList");

    emscripten::class_<FenceEngine>("FenceEngine")
        .constructor<>()
        .function("loadConfigJson", &FenceEngine::loadConfigJson)
        .function("setGridSnapEnabled", &FenceEngine::setGridSnapEnabled)
        .function("setMagneticSnapEnabled", &FenceEngine::setMagneticSnapEnabled)
        .function("setShowDimensions", &FenceEngine::setShowDimensions)
        .function("handleInput", &FenceEngine::handleInput)
        .function("setTool", &FenceEngine::setTool)
        .function("getTool", &FenceEngine::getTool)
        .function("setPrecisionMode", &FenceEngine::setPrecisionMode)
        .function("isPrecisionMode", &FenceEngine::isPrecisionMode)
        .function("setActiveStyle", &FenceEngine::setActiveStyle)
        .function("setActiveColor", &FenceEngine::setActiveColor)
        .function("getActiveStyle", emscripten::optional_override([](const FenceEngine& self) {
            return self.getActiveStyle();
        }))
        .function("getActiveColor", emscripten::optional_override([](const FenceEngine& self) {
            return self.getActiveColor();
        }))
        .function("beginDraw", &FenceEngine::beginDraw)
        .function("continueDraw", &FenceEngine::continueDraw)
        .function("appendVertex", &FenceEngine::appendVertex)
        .function("finishDraw", &FenceEngine::finishDraw)
        .function("confirmDraw", &FenceEngine::confirmDraw)
        .function("applyPrecisionInput", &FenceEngine::applyPrecisionInput)
        .function("cancelDraw", &FenceEngine::cancelDraw)
        .function("isDrawing", &FenceEngine::isDrawing)
        .function("getDrawState", &FenceEngine::getDrawState)
        .function("getDraftDimensions", &FenceEngine::getDraftDimensions)
        .function("pickAt", &FenceEngine::pickAt)
        .function("selectAt", &FenceEngine::selectAt)
        .function("setSelection", emscripten::optional_override([](FenceEngine& self, std::uintptr_t idsPtr, std::uint32_t count, int mode) {
            const auto* ids = reinterpret_cast<const fence::SegmentId*>(idsPtr);
            self.setSelection(ids, count, static_cast<FenceEngine::SelectionMode>(mode));
        }))
        .function("clearSelection", &FenceEngine::clearSelection)
        .function("selectAll", &FenceEngine::selectAll)
        .function("cycleSelection", &FenceEngine::cycleSelection)
        .function("getSelection", &FenceEngine::getSelection)
        .function("deleteSelected", &FenceEngine::deleteSelected)
        .function("copySelected", &FenceEngine::copySelected)
        .function("paste", &FenceEngine::paste)
        .function("duplicateSelected", &FenceEngine::duplicateSelected)
        .function("restyleSelected", &FenceEngine::restyleSelected)
        .function("clearScene", &FenceEngine::clearScene)
        .function("undo", &FenceEngine::undo)
        .function("redo", &FenceEngine::redo)
        .function("canUndo", &FenceEngine::canUndo)
        .function("canRedo", &FenceEngine::canRedo)
        .function("getHistorySize", &FenceEngine::getHistorySize)
        .function("getHistoryCursor", &FenceEngine::getHistoryCursor)
        .function("zoomIn", &FenceEngine::zoomIn)
        .function("zoomOut", &FenceEngine::zoomOut)
        .function("zoomAt", &FenceEngine::zoomAt)
        .function("zoomFit", &FenceEngine::zoomFit)
        .function("panBy", &FenceEngine::panBy)
        .function("setViewSize", &FenceEngine::setViewSize)
        .function("getZoom", &FenceEngine::getZoom)
        .function("getPanX", &FenceEngine::getPanX)
        .function("getPanY", &FenceEngine::getPanY)
        .function("screenToWorld", &FenceEngine::screenToWorld)
        .function("worldToScreen", &FenceEngine::worldToScreen)
        .function("tick", emscripten::optional_override([](FenceEngine& self) { self.tick(); }))
        .function("calculateNow", &FenceEngine::calculateNow)
        .function("isCalculationPending", &FenceEngine::isCalculationPending)
        .function("getMaterials", emscripten::optional_override([](const FenceEngine& self) {
            return self.getCalculation().materials;
        }))
        .function("getCost", emscripten::optional_override([](const FenceEngine& self) {
            return self.getCalculation().cost;
        }))
        .function("getMeasurements", emscripten::optional_override([](const FenceEngine& self) {
            return self.getCalculation().measurements;
        }))
        .function("getCalculationSource", emscripten::optional_override([](const FenceEngine& self) {
            return self.getCalculation().source;
        }))
        .function("serializeShareToken", &FenceEngine::serializeShareToken)
        .function("loadShareToken", &FenceEngine::loadShareToken)
        .function("getSegmentCount", &FenceEngine::getSegmentCount)
        .function("getTotalLengthFt", &FenceEngine::getTotalLengthFt)
        .function("getLastError", &FenceEngine::getLastError)
        .function("getGeneration", &FenceEngine::getGeneration)
        .function("pollEvents", &FenceEngine::pollEvents)
        .function("ackResync", &FenceEngine::ackResync);
}
#endif
