#include "fence/history/history_manager.h"
#include "fence/core/logging.h"

#include <algorithm>

namespace fence {

HistoryManager::HistoryManager(std::size_t limit)
    : limit_(std::clamp<std::size_t>(limit, 1, kMaxHistoryLimit)) {}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    historyGeneration_++;
}

bool HistoryManager::canUndo() const noexcept {
    return !history_.empty() && cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return !history_.empty() && cursor_ + 1 < history_.size();
}

const HistoryEntry* HistoryManager::current() const {
    if (history_.empty()) return nullptr;
    return &history_[cursor_];
}

void HistoryManager::reset(const std::vector<Segment>& current) {
    history_.clear();
    history_.push_back(HistoryEntry{current});
    cursor_ = 0;
    historyGeneration_++;
}

void HistoryManager::pushSnapshot(const std::vector<Segment>& current) {
    if (!history_.empty() && cursor_ + 1 < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1), history_.end());
    }
    history_.push_back(HistoryEntry{current});
    cursor_ = history_.size() - 1;
    evictOverflow();
    historyGeneration_++;
}

const HistoryEntry* HistoryManager::undo() {
    if (!canUndo()) return nullptr;
    cursor_--;
    historyGeneration_++;
    return &history_[cursor_];
}

const HistoryEntry* HistoryManager::redo() {
    if (!canRedo()) return nullptr;
    cursor_++;
    historyGeneration_++;
    return &history_[cursor_];
}

void HistoryManager::setLimit(std::size_t limit) {
    limit_ = std::clamp<std::size_t>(limit, 1, kMaxHistoryLimit);
    evictOverflow();
}

void HistoryManager::evictOverflow() {
    if (history_.size() <= limit_) return;
    const std::size_t excess = history_.size() - limit_;
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(excess));
    cursor_ = cursor_ >= excess ? cursor_ - excess : 0;
    FENCE_LOG_DEBUG("history: evicted %zu oldest entries", excess);
}

} // namespace fence
