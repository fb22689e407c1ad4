#pragma once

#include "fence/calc/calculation_types.h"
#include "fence/calc/estimator_client.h"
#include "fence/config/engine_config.h"
#include "fence/core/types.h"
#include "fence/interaction/interaction_session.h"
#include "fence/protocol/protocol_types.h"
#include "fence/render/render.h"
#include "fence/scene/segment.h"
#include "fence/scene/selection_manager.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fence {

struct EngineState;
class SegmentStore;
class Viewport;

// Owns the scene, its history and every interaction component. One instance
// per drawing surface; the host constructs it and routes input through
// handleInput() or the direct operations below.
class FenceEngine {
    friend class InteractionSession;
    friend class FenceEngineTestAccessor;
public:
    using Clock = std::function<double()>;
    using EngineEvent = protocol::EngineEvent;
    using EventType = protocol::EventType;
    using Tool = protocol::Tool;
    using SelectionMode = SelectionManager::Mode;

    FenceEngine();
    explicit FenceEngine(const EngineConfig& config);
    ~FenceEngine();

    FenceEngine(const FenceEngine&) = delete;
    FenceEngine& operator=(const FenceEngine&) = delete;

    // ---- Configuration -----------------------------------------------------
    const EngineConfig& config() const;
    FenceError loadConfigJson(const std::string& json);
    void setGridSnapEnabled(bool enabled);
    void setMagneticSnapEnabled(bool enabled);
    void setShowDimensions(bool enabled);
    // Replaces the host clock used for debounce scheduling (milliseconds).
    void setClock(Clock clock);
    void setEstimatorClient(std::shared_ptr<EstimatorClient> client);

    // ---- Input ---------------------------------------------------------------
    // Single entry point for pointer/keyboard/wheel input in screen space.
    bool handleInput(const protocol::InputEvent& ev);

    void setTool(Tool tool);
    Tool getTool() const;
    void setPrecisionMode(bool enabled);
    bool isPrecisionMode() const;
    // Also restyles the current selection, if any.
    void setActiveStyle(const std::string& styleId);
    void setActiveColor(const std::string& colorId);
    const std::string& getActiveStyle() const;
    const std::string& getActiveColor() const;

    // ---- Drawing (world coordinates) -----------------------------------------
    void beginDraw(float x, float y);
    void continueDraw(float x, float y);
    void appendVertex(float x, float y);
    SegmentId finishDraw(float x, float y);
    SegmentId confirmDraw();
    SegmentId applyPrecisionInput(double lengthFt, double angleDeg);
    void cancelDraw();
    bool isDrawing() const;
    DrawState getDrawState() const;
    DraftDimensions getDraftDimensions() const;

    // ---- Selection -----------------------------------------------------------
    SegmentId pickAt(float x, float y) const;
    void selectAt(float x, float y, std::uint32_t modifiers);
    void setSelection(const SegmentId* ids, std::uint32_t count, SelectionMode mode);
    void clearSelection();
    void selectAll();
    void cycleSelection();
    std::vector<SegmentId> getSelection() const;
    bool isSelected(SegmentId id) const;

    // ---- Edits (each pushes exactly one history entry when it changes the scene)
    std::size_t deleteSelected();
    std::size_t copySelected();
    std::vector<SegmentId> paste();
    std::vector<SegmentId> duplicateSelected();
    std::size_t restyleSelected(const std::string& styleId, const std::string& colorId);
    void clearScene();

    // ---- History -------------------------------------------------------------
    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;
    std::size_t getHistorySize() const;
    std::size_t getHistoryCursor() const;

    // ---- Viewport ------------------------------------------------------------
    void zoomIn();
    void zoomOut();
    void zoomAt(float screenX, float screenY, float delta);
    void zoomFit();
    void panBy(float dx, float dy);
    void setViewSize(float width, float height);
    float getZoom() const;
    float getPanX() const;
    float getPanY() const;
    Point2 screenToWorld(float x, float y) const;
    Point2 worldToScreen(float x, float y) const;

    // ---- Calculation ---------------------------------------------------------
    // Advances the debounce clock and applies finished estimator replies.
    void tick(double nowMs);
    void tick();
    // Skips the debounce window and dispatches now.
    void calculateNow();
    const CalculationResult& getCalculation() const;
    bool isCalculationPending() const;

    // ---- Sharing -------------------------------------------------------------
    std::string serializeShareToken() const;
    // Replaces the scene on success; leaves it untouched on failure.
    FenceError loadShareToken(const std::string& token);

    // ---- Queries -------------------------------------------------------------
    const std::vector<Segment>& getSegments() const;
    const Segment* getSegment(SegmentId id) const;
    std::size_t getSegmentCount() const;
    double getTotalLengthFt() const;
    RenderScene buildRenderScene() const;
    FenceError getLastError() const;
    std::uint32_t getGeneration() const;

    // ---- Events --------------------------------------------------------------
    std::vector<EngineEvent> pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

private:
    EngineState& state() { return *state_; }
    const EngineState& state() const { return *state_; }

    double now() const;
    void applyConfig();

    // Called by InteractionSession when a draft completes.
    SegmentId commitDraftSegment(std::vector<Point2> path, bool isGate, const std::string& styleId, const std::string& colorId);
    // Bookkeeping after every scene change: index, selection, history, calc.
    void onSceneMutated(bool pushHistory);
    void restoreSegments(const std::vector<Segment>& segments);
    void setError(FenceError err) const;

    // Input helpers
    bool handlePointerDown(const protocol::InputEvent& ev);
    bool handlePointerMove(const protocol::InputEvent& ev);
    bool handlePointerUp(const protocol::InputEvent& ev);
    bool handleKeyDown(const protocol::InputEvent& ev);
    bool handleKeyUp(const protocol::InputEvent& ev);

    // Event recording
    void clearEventState();
    void recordSegmentCreated(SegmentId id);
    void recordSegmentDeleted(SegmentId id);
    void recordSegmentChanged(SegmentId id);
    void recordSceneReplaced();
    void recordSelectionChanged();
    void recordHistoryChanged();
    void recordViewportChanged();
    void recordDraftChanged();
    void recordCalculationUpdated();
    bool pushEvent(const EngineEvent& ev);
    void flushPendingEvents();

    std::unique_ptr<EngineState> state_;
};

} // namespace fence
