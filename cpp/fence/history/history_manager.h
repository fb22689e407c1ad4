#pragma once

#include "fence/core/types.h"
#include "fence/history/history_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fence {

// Linear snapshot history. entries_[cursor_] always mirrors the live scene;
// entries_[0] is the oldest reachable state.
class HistoryManager {
public:
    explicit HistoryManager(std::size_t limit = kDefaultHistoryLimit);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Both return the entry to restore, or nullptr when out of range.
    const HistoryEntry* undo();
    const HistoryEntry* redo();

    // Starts a fresh history whose only entry is `current`.
    void reset(const std::vector<Segment>& current);
    // Drops redo states, appends `current` and evicts the oldest entry when
    // the limit is exceeded.
    void pushSnapshot(const std::vector<Segment>& current);

    void clear();
    void setLimit(std::size_t limit);
    std::size_t getLimit() const noexcept { return limit_; }
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    const HistoryEntry* current() const;

private:
    void evictOverflow();

    std::vector<HistoryEntry> history_;
    std::size_t cursor_ = 0;
    std::size_t limit_;
    std::uint32_t historyGeneration_ = 0;
};

} // namespace fence
