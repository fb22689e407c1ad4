#include "fence/scene/selection_manager.h"
#include "fence/protocol/protocol_types.h"
#include "fence/scene/segment_store.h"

#include <algorithm>

namespace fence {

SelectionManager::SelectionManager(const SegmentStore& store)
    : store_(store) {}

bool SelectionManager::setSelection(const SegmentId* ids, std::uint32_t count, Mode mode) {
    bool changed = false;

    auto applyInsert = [&](SegmentId id) {
        if (set_.insert(id).second) changed = true;
    };
    auto applyErase = [&](SegmentId id) {
        if (set_.erase(id) > 0) changed = true;
    };

    if (mode == Mode::Replace) {
        // Replacing with the identical set is not a change.
        std::unordered_set<SegmentId> next;
        for (std::uint32_t i = 0; i < count; i++) {
            if (store_.contains(ids[i])) next.insert(ids[i]);
        }
        if (next != set_) {
            set_ = std::move(next);
            changed = true;
        }
    } else {
        for (std::uint32_t i = 0; i < count; i++) {
            const SegmentId id = ids[i];
            if (!store_.contains(id)) continue;

            switch (mode) {
                case Mode::Replace:
                case Mode::Add:
                    applyInsert(id);
                    break;
                case Mode::Remove:
                    applyErase(id);
                    break;
                case Mode::Toggle:
                    if (isSelected(id)) {
                        applyErase(id);
                    } else {
                        applyInsert(id);
                    }
                    break;
            }
        }
    }

    if (changed) {
        rebuildOrder();
        generation_++;
    }
    return changed;
}

bool SelectionManager::clearSelection() {
    if (set_.empty()) return false;
    set_.clear();
    ordered_.clear();
    generation_++;
    return true;
}

bool SelectionManager::selectByPick(SegmentId id, std::uint32_t modifiers) {
    Mode mode = Mode::Replace;
    if (protocol::hasModifier(modifiers, protocol::InputModifier::Shift)) {
        mode = Mode::Add; // Shift adds
    } else if (protocol::hasModifier(modifiers, protocol::InputModifier::Ctrl)
        || protocol::hasModifier(modifiers, protocol::InputModifier::Meta)) {
        mode = Mode::Toggle; // Ctrl/Meta toggles
    }

    if (id == kInvalidSegmentId) {
        if (mode == Mode::Replace) return clearSelection();
        return false;
    }
    if (!store_.contains(id)) return false;

    return setSelection(&id, 1, mode);
}

bool SelectionManager::selectAll() {
    std::vector<SegmentId> ids;
    ids.reserve(store_.size());
    for (const auto& s : store_.segments()) ids.push_back(s.id);
    return setSelection(ids.data(), static_cast<std::uint32_t>(ids.size()), Mode::Replace);
}

bool SelectionManager::cycle() {
    const auto& segments = store_.segments();
    if (segments.empty()) return false;

    std::size_t next = 0;
    if (set_.size() == 1) {
        const SegmentId current = *set_.begin();
        const auto it = std::find_if(segments.begin(), segments.end(),
            [&](const Segment& s) { return s.id == current; });
        if (it != segments.end()) {
            next = (static_cast<std::size_t>(it - segments.begin()) + 1) % segments.size();
        }
    }
    const SegmentId id = segments[next].id;
    return setSelection(&id, 1, Mode::Replace);
}

bool SelectionManager::prune() {
    bool changed = false;
    for (auto it = set_.begin(); it != set_.end();) {
        if (!store_.contains(*it)) {
            it = set_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }
    if (changed) {
        rebuildOrder();
        generation_++;
    }
    return changed;
}

void SelectionManager::rebuildOrder() {
    ordered_.clear();
    ordered_.reserve(set_.size());
    // Store order keeps the result deterministic.
    for (const auto& s : store_.segments()) {
        if (set_.find(s.id) != set_.end()) {
            ordered_.push_back(s.id);
        }
    }
}

} // namespace fence
