#pragma once

#include "fence/core/types.h"

#include <cstdint>
#include <unordered_set>
#include <vector>

namespace fence {

class SegmentStore;

// Selected segment ids. Mutators return true when the selection changed so the
// caller can queue a SelectionChanged event.
class SelectionManager {
public:
    enum class Mode : std::uint32_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

    explicit SelectionManager(const SegmentStore& store);

    bool setSelection(const SegmentId* ids, std::uint32_t count, Mode mode);
    bool clearSelection();
    // Shift adds, Ctrl/Meta toggles, otherwise replaces. A miss (id 0) clears
    // only in replace mode.
    bool selectByPick(SegmentId id, std::uint32_t modifiers);
    bool selectAll();
    // Advances a single selection to the next segment in store order.
    bool cycle();
    // Drops ids that no longer exist in the store.
    bool prune();

    const std::vector<SegmentId>& getOrdered() const { return ordered_; }
    std::vector<SegmentId> getOrderedCopy() const { return ordered_; }
    std::uint32_t getGeneration() const { return generation_; }
    bool isEmpty() const { return set_.empty(); }
    std::size_t size() const { return set_.size(); }
    bool isSelected(SegmentId id) const { return set_.find(id) != set_.end(); }

private:
    void rebuildOrder();

    const SegmentStore& store_;
    std::unordered_set<SegmentId> set_;
    std::vector<SegmentId> ordered_;
    std::uint32_t generation_ = 0;
};

} // namespace fence
