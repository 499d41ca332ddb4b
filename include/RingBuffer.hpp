#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace livegate {

/**
 * @brief Fixed-capacity ring buffer with a drop-oldest policy
 *
 * Holds the most recent entries of a session for diagnostics. Not thread-safe;
 * owned by a single session.
 */
template<typename T>
class HistoryRing {
public:
    explicit HistoryRing(size_t capacity = 10) : slots_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("History ring capacity must be > 0");
        }
    }

    /// Append an entry, overwriting the oldest one when full.
    void push(T item) {
        slots_[write_index_] = std::move(item);
        write_index_ = (write_index_ + 1) % slots_.size();
        if (size_ < slots_.size()) {
            size_++;
        } else {
            total_dropped_++;
        }
        total_written_++;
    }

    /// Most recent entry, or nullptr when empty.
    const T* latest() const {
        if (size_ == 0) return nullptr;
        size_t idx = (write_index_ + slots_.size() - 1) % slots_.size();
        return &slots_[idx];
    }

    /**
     * @brief Copy of the held entries, oldest first
     * @param max_entries Only the newest max_entries entries (0 = all)
     */
    std::vector<T> snapshot(size_t max_entries = 0) const {
        size_t count = (max_entries == 0 || max_entries > size_) ? size_ : max_entries;
        std::vector<T> out;
        out.reserve(count);
        size_t start = (write_index_ + slots_.size() - count) % slots_.size();
        for (size_t i = 0; i < count; ++i) {
            out.push_back(slots_[(start + i) % slots_.size()]);
        }
        return out;
    }

    void clear() {
        for (auto& slot : slots_) slot = T{};
        write_index_ = 0;
        size_ = 0;
        total_written_ = 0;
        total_dropped_ = 0;
    }

    size_t capacity() const { return slots_.size(); }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    uint64_t get_total_written() const { return total_written_; }
    uint64_t get_total_dropped() const { return total_dropped_; }

private:
    std::vector<T> slots_;
    size_t write_index_ = 0;
    size_t size_ = 0;

    // Statistics
    uint64_t total_written_ = 0;
    uint64_t total_dropped_ = 0;
};

} // namespace livegate
