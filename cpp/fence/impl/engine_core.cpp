// FenceEngine construction, configuration and scene bookkeeping

#include "fence/engine.h"
#include "fence/core/logging.h"
#include "fence/core/util.h"
#include "fence/internal/engine_state.h"

#ifndef EMSCRIPTEN
#include "fence/calc/curl_estimator_client.h"
#endif

#include <memory>
#include <utility>

namespace fence {

EngineState::EngineState(FenceEngine& engine, const EngineConfig& cfg)
    : config(cfg),
      segmentStore_(cfg.snap.gridSize),
      pickSystem_(),
      selectionManager_(segmentStore_),
      historyManager_(cfg.history.limit),
      viewport_(cfg.viewport),
      calculation_(cfg.calculation, cfg.pricing),
      interactionSession_(engine, segmentStore_, pickSystem_),
      clock_([] { return emscripten_get_now(); }),
      activeStyleId_(cfg.defaultStyleId),
      activeColorId_(cfg.defaultColorId) {
    eventQueue_.resize(kMaxEvents);
}

FenceEngine::FenceEngine()
    : FenceEngine(defaultEngineConfig()) {}

FenceEngine::FenceEngine(const EngineConfig& config)
    : state_(std::make_unique<EngineState>(*this, config)) {
    applyConfig();
    state().historyManager_.reset(state().segmentStore_.segments());
}

FenceEngine::~FenceEngine() = default;

const EngineConfig& FenceEngine::config() const {
    return state().config;
}

void FenceEngine::applyConfig() {
    EngineState& s = state();
    s.interactionSession_.snapOptions = s.config.snap;
    s.segmentStore_.setGridSize(s.config.snap.gridSize);
    s.historyManager_.setLimit(s.config.history.limit);
    s.viewport_.setOptions(s.config.viewport);
    s.calculation_.setOptions(s.config.calculation, s.config.pricing);
    const std::string& url = s.config.calculation.estimatorUrl;
    if (url.empty()) return;
#ifndef EMSCRIPTEN
    // Native builds talk to the estimator directly. A client installed by the
    // host is kept unless it is a libcurl client for another endpoint.
    const auto* current = dynamic_cast<const CurlEstimatorClient*>(s.calculation_.client());
    if (!s.calculation_.client() || (current && current->url() != url)) {
        s.calculation_.setClient(std::make_shared<CurlEstimatorClient>(url, s.config.calculation.timeoutMs));
        FENCE_LOG_DEBUG("engine: estimator endpoint %s", url.c_str());
    }
#else
    if (!s.calculation_.client()) {
        FENCE_LOG_DEBUG("engine: estimator url set, host must install a client");
    }
#endif
}

FenceError FenceEngine::loadConfigJson(const std::string& json) {
    const double gridBefore = state().config.snap.gridSize;
    const FenceError err = parseEngineConfig(json, state().config);
    if (err != FenceError::Ok) {
        setError(err);
        return err;
    }
    applyConfig();
    if (state().config.snap.gridSize != gridBefore) {
        // Lengths are derived from the grid, so the estimate is stale.
        state().calculation_.schedule(now());
    }
    recordViewportChanged();
    setError(FenceError::Ok);
    return FenceError::Ok;
}

void FenceEngine::setGridSnapEnabled(bool enabled) {
    state().config.snap.gridEnabled = enabled;
    state().interactionSession_.snapOptions.gridEnabled = enabled;
}

void FenceEngine::setMagneticSnapEnabled(bool enabled) {
    state().config.snap.magneticEnabled = enabled;
    state().interactionSession_.snapOptions.magneticEnabled = enabled;
}

void FenceEngine::setShowDimensions(bool enabled) {
    if (state().config.edit.showDimensions == enabled) return;
    state().config.edit.showDimensions = enabled;
    recordViewportChanged();
}

void FenceEngine::setClock(Clock clock) {
    if (clock) state().clock_ = std::move(clock);
}

void FenceEngine::setEstimatorClient(std::shared_ptr<EstimatorClient> client) {
    state().calculation_.setClient(std::move(client));
}

double FenceEngine::now() const {
    return state().clock_();
}

void FenceEngine::setError(FenceError err) const {
    state().lastError = err;
}

FenceError FenceEngine::getLastError() const {
    return state().lastError;
}

std::uint32_t FenceEngine::getGeneration() const {
    return state().generation;
}

void FenceEngine::onSceneMutated(bool pushHistory) {
    EngineState& s = state();
    s.generation++;
    s.pickSystem_.rebuild(s.segmentStore_);
    if (s.selectionManager_.prune()) recordSelectionChanged();
    if (pushHistory) {
        s.historyManager_.pushSnapshot(s.segmentStore_.segments());
        recordHistoryChanged();
    }
    s.calculation_.schedule(now());
}

void FenceEngine::restoreSegments(const std::vector<Segment>& segments) {
    EngineState& s = state();
    const FenceError err = s.segmentStore_.replaceAll(segments);
    if (err != FenceError::Ok) {
        // History entries are copies of validated scenes.
        FENCE_LOG_ERROR("engine: history restore rejected (%s)", toString(err));
        setError(err);
        return;
    }
    if (s.selectionManager_.clearSelection()) recordSelectionChanged();
    recordSceneReplaced();
    onSceneMutated(false);
    recordHistoryChanged();
}

SegmentId FenceEngine::commitDraftSegment(std::vector<Point2> path, bool isGate, const std::string& styleId, const std::string& colorId) {
    SegmentId id = kInvalidSegmentId;
    const FenceError err = state().segmentStore_.create(std::move(path), styleId, colorId, isGate, id);
    if (err != FenceError::Ok) {
        setError(err);
        return kInvalidSegmentId;
    }
    recordSegmentCreated(id);
    onSceneMutated(true);
    FENCE_LOG_DEBUG("engine: committed %s %u", isGate ? "gate" : "fence", id);
    return id;
}

// ---- Queries ----------------------------------------------------------------

const std::vector<Segment>& FenceEngine::getSegments() const {
    return state().segmentStore_.segments();
}

const Segment* FenceEngine::getSegment(SegmentId id) const {
    return state().segmentStore_.get(id);
}

std::size_t FenceEngine::getSegmentCount() const {
    return state().segmentStore_.size();
}

double FenceEngine::getTotalLengthFt() const {
    return state().segmentStore_.totalLengthFt();
}

RenderScene FenceEngine::buildRenderScene() const {
    const EngineState& s = state();
    return fence::buildRenderScene(s.segmentStore_, s.selectionManager_, s.interactionSession_, s.viewport_, s.config);
}

} // namespace fence
