#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace undostack {

/**
 * @brief One undo/redo unit stored on the past or future stack.
 *
 * A single push produces an entry holding one value. A group produces one
 * entry holding every value pushed while it was open, in push order.
 */
template <typename T>
struct HistoryEntry {
    std::vector<T> values;
    bool group = false;
    std::string label;
    // Unique per commit; 0 is never assigned.
    unsigned long long serial = 0;
    std::chrono::steady_clock::time_point timestamp;

    bool is_group() const { return group; }
    std::size_t size() const { return values.size(); }
};

} // namespace undostack
