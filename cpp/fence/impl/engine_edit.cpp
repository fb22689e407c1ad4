// FenceEngine drawing, selection, edit and history operations

#include "fence/engine.h"
#include "fence/core/logging.h"
#include "fence/internal/engine_state.h"

#include <algorithm>
#include <utility>

namespace fence {

// ---- Tools --------------------------------------------------------------------

void FenceEngine::setTool(Tool tool) {
    EngineState& s = state();
    if (s.tool_ == tool) return;
    // Switching tools abandons the draft and any pan drag.
    s.interactionSession_.cancelDraft();
    s.interactionSession_.endPan();
    if (tool == Tool::Pan) s.toolBeforePan_ = s.tool_;
    s.tool_ = tool;
}

FenceEngine::Tool FenceEngine::getTool() const {
    return state().tool_;
}

void FenceEngine::setPrecisionMode(bool enabled) {
    state().interactionSession_.setPrecisionMode(enabled);
}

bool FenceEngine::isPrecisionMode() const {
    return state().interactionSession_.isPrecisionMode();
}

void FenceEngine::setActiveStyle(const std::string& styleId) {
    state().activeStyleId_ = styleId;
    if (!state().selectionManager_.isEmpty()) {
        restyleSelected(state().activeStyleId_, state().activeColorId_);
    }
}

void FenceEngine::setActiveColor(const std::string& colorId) {
    state().activeColorId_ = colorId;
    if (!state().selectionManager_.isEmpty()) {
        restyleSelected(state().activeStyleId_, state().activeColorId_);
    }
}

const std::string& FenceEngine::getActiveStyle() const {
    return state().activeStyleId_;
}

const std::string& FenceEngine::getActiveColor() const {
    return state().activeColorId_;
}

// ---- Drawing ------------------------------------------------------------------

void FenceEngine::beginDraw(float x, float y) {
    EngineState& s = state();
    s.interactionSession_.beginDraft(Point2{x, y}, s.tool_ == Tool::Gate, s.activeStyleId_, s.activeColorId_);
}

void FenceEngine::continueDraw(float x, float y) {
    state().interactionSession_.updateDraft(Point2{x, y});
}

void FenceEngine::appendVertex(float x, float y) {
    state().interactionSession_.appendDraftPoint(Point2{x, y});
}

SegmentId FenceEngine::finishDraw(float x, float y) {
    return state().interactionSession_.commitDraft(Point2{x, y});
}

SegmentId FenceEngine::confirmDraw() {
    return state().interactionSession_.commitDraftAtPreview();
}

SegmentId FenceEngine::applyPrecisionInput(double lengthFt, double angleDeg) {
    const SegmentId id = state().interactionSession_.commitDraftPrecise(lengthFt, angleDeg);
    if (id == kInvalidSegmentId && isDrawing()) setError(FenceError::InvalidOperation);
    return id;
}

void FenceEngine::cancelDraw() {
    state().interactionSession_.cancelDraft();
}

bool FenceEngine::isDrawing() const {
    return state().interactionSession_.isDraftActive();
}

DrawState FenceEngine::getDrawState() const {
    return state().interactionSession_.state();
}

DraftDimensions FenceEngine::getDraftDimensions() const {
    return state().interactionSession_.getDraftDimensions();
}

// ---- Selection ----------------------------------------------------------------

SegmentId FenceEngine::pickAt(float x, float y) const {
    const EngineState& s = state();
    const PickResult hit = s.pickSystem_.pick(x, y, s.config.edit.pickTolerancePx, s.viewport_.zoom(), s.segmentStore_);
    return hit.id;
}

void FenceEngine::selectAt(float x, float y, std::uint32_t modifiers) {
    if (state().selectionManager_.selectByPick(pickAt(x, y), modifiers)) recordSelectionChanged();
}

void FenceEngine::setSelection(const SegmentId* ids, std::uint32_t count, SelectionMode mode) {
    if (state().selectionManager_.setSelection(ids, count, mode)) recordSelectionChanged();
}

void FenceEngine::clearSelection() {
    if (state().selectionManager_.clearSelection()) recordSelectionChanged();
}

void FenceEngine::selectAll() {
    if (state().selectionManager_.selectAll()) recordSelectionChanged();
}

void FenceEngine::cycleSelection() {
    if (state().selectionManager_.cycle()) recordSelectionChanged();
}

std::vector<SegmentId> FenceEngine::getSelection() const {
    return state().selectionManager_.getOrderedCopy();
}

bool FenceEngine::isSelected(SegmentId id) const {
    return state().selectionManager_.isSelected(id);
}

// ---- Edits --------------------------------------------------------------------

std::size_t FenceEngine::deleteSelected() {
    EngineState& s = state();
    const std::vector<SegmentId> ids = s.selectionManager_.getOrderedCopy();
    if (ids.empty()) return 0;

    const std::size_t removed = s.segmentStore_.removeMany(ids);
    for (SegmentId id : ids) recordSegmentDeleted(id);
    if (s.selectionManager_.clearSelection()) recordSelectionChanged();
    if (removed > 0) onSceneMutated(true);
    return removed;
}

std::size_t FenceEngine::copySelected() {
    EngineState& s = state();
    const auto& ids = s.selectionManager_.getOrdered();
    if (ids.empty()) return 0;
    s.clipboard_.clear();
    for (SegmentId id : ids) {
        if (const Segment* seg = s.segmentStore_.get(id)) s.clipboard_.push_back(*seg);
    }
    return s.clipboard_.size();
}

std::vector<SegmentId> FenceEngine::paste() {
    EngineState& s = state();
    std::vector<SegmentId> created;
    if (s.clipboard_.empty()) return created;

    const float dx = s.config.edit.pasteOffsetX;
    const float dy = s.config.edit.pasteOffsetY;
    for (Segment& copy : s.clipboard_) {
        Segment seg = copy;
        seg.id = s.segmentStore_.allocateId();
        for (Point2& p : seg.path) {
            p.x += dx;
            p.y += dy;
        }
        const FenceError err = s.segmentStore_.insert(seg);
        if (err != FenceError::Ok) {
            setError(err);
            continue;
        }
        // Repeated pastes keep stepping away from the previous copy.
        copy.path = seg.path;
        created.push_back(seg.id);
        recordSegmentCreated(seg.id);
    }
    if (!created.empty()) onSceneMutated(true);
    return created;
}

std::vector<SegmentId> FenceEngine::duplicateSelected() {
    if (copySelected() == 0) return {};
    return paste();
}

std::size_t FenceEngine::restyleSelected(const std::string& styleId, const std::string& colorId) {
    EngineState& s = state();
    std::size_t changed = 0;
    for (SegmentId id : s.selectionManager_.getOrdered()) {
        const Segment* seg = s.segmentStore_.get(id);
        if (!seg || (seg->styleId == styleId && seg->colorId == colorId)) continue;
        if (s.segmentStore_.restyle(id, styleId, colorId) == FenceError::Ok) {
            recordSegmentChanged(id);
            changed++;
        }
    }
    if (changed > 0) onSceneMutated(true);
    return changed;
}

void FenceEngine::clearScene() {
    EngineState& s = state();
    s.interactionSession_.cancelDraft();
    if (s.segmentStore_.empty()) return;
    for (const Segment& seg : s.segmentStore_.segments()) recordSegmentDeleted(seg.id);
    s.segmentStore_.clear();
    onSceneMutated(true);
}

// ---- History ------------------------------------------------------------------

bool FenceEngine::undo() {
    EngineState& s = state();
    s.interactionSession_.cancelDraft();
    const HistoryEntry* entry = s.historyManager_.undo();
    if (!entry) return false;
    restoreSegments(entry->segments);
    return true;
}

bool FenceEngine::redo() {
    EngineState& s = state();
    s.interactionSession_.cancelDraft();
    const HistoryEntry* entry = s.historyManager_.redo();
    if (!entry) return false;
    restoreSegments(entry->segments);
    return true;
}

bool FenceEngine::canUndo() const {
    return state().historyManager_.canUndo();
}

bool FenceEngine::canRedo() const {
    return state().historyManager_.canRedo();
}

std::size_t FenceEngine::getHistorySize() const {
    return state().historyManager_.getHistorySize();
}

std::size_t FenceEngine::getHistoryCursor() const {
    return state().historyManager_.getCursor();
}

} // namespace fence
