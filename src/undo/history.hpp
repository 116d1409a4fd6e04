#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "../utility/logger.hpp"
#include "history_config.hpp"
#include "history_entry.hpp"
#include "history_error.hpp"
#include "restorable.hpp"

namespace undostack {

/**
 * @brief Linear undo/redo history of values of type T.
 *
 * The past stack holds recorded states, most recent last. undo() moves the
 * top entry to the future stack and restores the entry that becomes the
 * new top; redo() moves it back and restores it. Any commit while redo
 * entries exist discards them.
 *
 * Two recording modes sit on top of push():
 * - buffer: start_buffer()/finish_buffer() bracket a continuous interaction
 *   and record the pre-interaction value only if the value changed;
 * - group: pushes between start_group()/finish_group() are committed as one
 *   entry and undone/redone together.
 *
 * Misuse never throws. The call is dropped, last_error() reports why, and a
 * diagnostic is emitted when the config is verbose.
 *
 * Not thread-safe. Use one instance per undo domain.
 */
template <std::equality_comparable T>
class History {
  public:
    using Entry = HistoryEntry<T>;

    explicit History(HistoryConfig config = {}) : m_config(config) {}

    const HistoryConfig &config() const { return m_config; }

    void set_verbose(bool verbose) { m_config.verbose = verbose; }

    /**
     * @brief Set the maximum number of entries kept on the past stack.
     * @param n Maximum number of entries (0 means unbounded).
     */
    void set_max_size(std::size_t n) {
        m_config.max_size = n;
        trim();
    }

    /**
     * @brief Route diagnostics to a handler instead of the logger.
     */
    void set_diagnostic_handler(DiagnosticHandler handler) {
        m_diagnostics = std::move(handler);
    }

    /**
     * @brief Record a value. Appends to the open group if there is one,
     * otherwise commits it and clears the redo history.
     * @param value The value to record (will be moved).
     */
    void push(T value);

    /**
     * @brief Undo the last entry.
     * @param target Receives the entry that becomes the top of the past
     * stack, or the baseline when the past stack empties.
     * @return True if target was restored.
     */
    bool undo(IRestorable<T> &target);

    /**
     * @brief Redo the next entry.
     * @param target Receives the redone entry.
     * @return True if target was restored.
     */
    bool redo(IRestorable<T> &target);

    /**
     * @brief Begin a continuous interaction.
     * @param current The value before the interaction starts.
     * @return False if a buffer or group is already open.
     */
    bool start_buffer(T current);

    /**
     * @brief End the interaction opened by start_buffer().
     * @param final_value The value after the interaction.
     * @return True if the snapshot differed and was committed.
     */
    bool finish_buffer(T final_value);

    bool buffer_is_empty() const { return !m_buffer.has_value(); }

    /**
     * @brief The snapshot taken by start_buffer(), or nullptr.
     */
    const T *buffer() const { return m_buffer ? &*m_buffer : nullptr; }

    /**
     * @brief Collect the following pushes into one entry.
     * @param label Optional display name of the group.
     * @return False if a group or buffer is already open.
     */
    bool start_group(std::string label = {});

    /**
     * @brief Commit the open group as a single entry.
     * @return True if a non-empty group was committed.
     */
    bool finish_group();

    /**
     * @brief Reopen the group on top of the past stack so further pushes
     * extend it. finish_group() commits it again if it was extended, and
     * otherwise puts it back unchanged.
     * @return False if the last entry is not a group or something is open.
     */
    bool reopen_group();

    bool group_is_open() const { return m_group.has_value(); }

    /**
     * @brief Restored when undo empties the past stack.
     */
    void set_baseline(T value) { m_baseline = std::move(value); }
    void clear_baseline() { m_baseline.reset(); }
    const T *baseline() const { return m_baseline ? &*m_baseline : nullptr; }

    /**
     * @brief Drop both stacks, the open buffer and the open group.
     */
    void clear();

    bool can_undo() const { return !m_past.empty(); }
    bool can_redo() const { return !m_future.empty(); }
    bool is_empty() const { return m_past.empty() && m_future.empty(); }

    std::size_t past_size() const { return m_past.size(); }
    std::size_t future_size() const { return m_future.size(); }

    /**
     * @brief Past entries, oldest first.
     */
    const std::vector<Entry> &past_entries() const { return m_past; }

    /**
     * @brief Future entries, the next one to redo last.
     */
    const std::vector<Entry> &future_entries() const { return m_future; }

    /**
     * @brief Incremented by every commit, undo, redo and clear. Reopening a
     * group does not change it until the group is committed again.
     */
    unsigned long long state_version() const { return m_state_version; }

    /**
     * @brief Remember the current position as the saved one.
     */
    void mark_saved() { m_saved_serial = top_serial(); }

    /**
     * @brief True if the top of the past stack is the entry that was on top
     * at the last mark_saved() (or both are empty).
     */
    bool is_at_saved_state() const { return top_serial() == m_saved_serial; }

    /**
     * @brief Misuse raised by the most recent call, if any.
     */
    std::optional<HistoryError> last_error() const { return m_last_error; }

  private:
    bool record(T value);
    void commit(Entry entry);
    void restore(const Entry &entry, IRestorable<T> &target) const;
    bool close_group();
    void close_open_group(const char *operation);
    void report(HistoryError error, const std::string &message);
    void trace(const std::string &message) const;
    void trim();

    unsigned long long top_serial() const {
        return m_past.empty() ? 0 : m_past.back().serial;
    }

  private:
    HistoryConfig m_config;
    DiagnosticHandler m_diagnostics;
    std::vector<Entry> m_past;
    std::vector<Entry> m_future;
    std::optional<T> m_buffer;
    std::optional<Entry> m_group;
    // Value count of a group taken back by reopen_group().
    std::optional<std::size_t> m_reopened_size;
    std::optional<T> m_baseline;
    std::optional<HistoryError> m_last_error;
    unsigned long long m_next_serial = 1;
    unsigned long long m_saved_serial = 0;
    unsigned long long m_state_version = 0;
};

template <std::equality_comparable T>
void History<T>::push(T value) {
    m_last_error.reset();
    record(std::move(value));
}

template <std::equality_comparable T>
bool History<T>::undo(IRestorable<T> &target) {
    m_last_error.reset();
    close_open_group("undo");

    if (m_past.empty()) {
        report(HistoryError::EmptyUndo, "no value to undo");
        return false;
    }

    m_future.push_back(std::move(m_past.back()));
    m_past.pop_back();
    ++m_state_version;

    if (!m_past.empty()) {
        restore(m_past.back(), target);
        return true;
    }
    if (m_baseline) {
        target.restore(*m_baseline);
        return true;
    }
    trace("undo reached the start of history, no baseline to restore");
    return false;
}

template <std::equality_comparable T>
bool History<T>::redo(IRestorable<T> &target) {
    m_last_error.reset();
    close_open_group("redo");

    if (m_future.empty()) {
        report(HistoryError::EmptyRedo, "no value to redo");
        return false;
    }

    m_past.push_back(std::move(m_future.back()));
    m_future.pop_back();
    trim();
    ++m_state_version;

    restore(m_past.back(), target);
    return true;
}

template <std::equality_comparable T>
bool History<T>::start_buffer(T current) {
    m_last_error.reset();
    if (m_group) {
        report(HistoryError::NestingViolation,
               "can't open a buffer while a group is open");
        return false;
    }
    if (m_buffer) {
        report(HistoryError::Reentry,
               "buffer already open, keeping the first snapshot");
        return false;
    }
    trace("initiating undo buffer");
    m_buffer = std::move(current);
    return true;
}

template <std::equality_comparable T>
bool History<T>::finish_buffer(T final_value) {
    m_last_error.reset();
    if (!m_buffer) {
        report(HistoryError::UnmatchedClose,
               "buffer is empty and can't be committed");
        return false;
    }

    T snapshot = std::move(*m_buffer);
    m_buffer.reset();

    if (snapshot == final_value) {
        trace("skipping commit, values don't differ");
        return false;
    }
    return record(std::move(snapshot));
}

template <std::equality_comparable T>
bool History<T>::start_group(std::string label) {
    m_last_error.reset();
    if (m_group) {
        report(HistoryError::Reentry,
               "can't open new group before closing current one");
        return false;
    }
    if (m_buffer) {
        report(HistoryError::NestingViolation,
               "can't open a group while a buffer is open");
        return false;
    }
    Entry entry;
    entry.group = true;
    entry.label = std::move(label);
    m_group = std::move(entry);
    return true;
}

template <std::equality_comparable T>
bool History<T>::finish_group() {
    m_last_error.reset();
    if (!m_group) {
        report(HistoryError::UnmatchedClose, "no open groups to close");
        return false;
    }

    return close_group();
}

template <std::equality_comparable T>
bool History<T>::reopen_group() {
    m_last_error.reset();
    if (m_group) {
        report(HistoryError::Reentry, "a group is already open");
        return false;
    }
    if (m_buffer) {
        report(HistoryError::NestingViolation,
               "can't reopen a group while a buffer is open");
        return false;
    }
    if (m_past.empty() || !m_past.back().is_group()) {
        report(HistoryError::NoGroupToReopen, "last value is not a group");
        return false;
    }

    m_group = std::move(m_past.back());
    m_past.pop_back();
    m_reopened_size = m_group->values.size();
    return true;
}

template <std::equality_comparable T>
void History<T>::clear() {
    m_last_error.reset();
    m_past.clear();
    m_future.clear();
    m_buffer.reset();
    m_group.reset();
    m_reopened_size.reset();
    m_saved_serial = 0;
    ++m_state_version;
}

template <std::equality_comparable T>
bool History<T>::record(T value) {
    if (m_group) {
        if (m_config.skip_duplicates && !m_group->values.empty() &&
            m_group->values.back() == value) {
            trace("skipping push, value matches the last grouped value");
            return false;
        }
        m_group->values.push_back(std::move(value));
        return true;
    }

    if (m_config.skip_duplicates && !m_past.empty() &&
        !m_past.back().is_group() && m_past.back().values.back() == value) {
        trace("skipping push, value matches the top of the stack");
        return false;
    }

    Entry entry;
    entry.values.push_back(std::move(value));
    commit(std::move(entry));
    return true;
}

template <std::equality_comparable T>
void History<T>::commit(Entry entry) {
    entry.serial = m_next_serial++;
    entry.timestamp = std::chrono::steady_clock::now();
    m_past.push_back(std::move(entry));
    m_future.clear();
    trim();
    ++m_state_version;
}

// Group values are restored in push order for both undo and redo.
template <std::equality_comparable T>
void History<T>::restore(const Entry &entry, IRestorable<T> &target) const {
    for (const auto &value : entry.values) {
        target.restore(value);
    }
}

// A reopened group that gained no values goes back untouched: same serial,
// same timestamp, redo history kept.
template <std::equality_comparable T>
bool History<T>::close_group() {
    Entry entry = std::move(*m_group);
    m_group.reset();
    std::optional<std::size_t> reopened_size = m_reopened_size;
    m_reopened_size.reset();

    if (reopened_size && entry.values.size() == *reopened_size) {
        trace("reopened group unchanged, restoring it as it was");
        m_past.push_back(std::move(entry));
        return false;
    }
    if (entry.values.empty()) {
        trace("discarding empty group");
        return false;
    }
    commit(std::move(entry));
    return true;
}

template <std::equality_comparable T>
void History<T>::close_open_group(const char *operation) {
    if (!m_group) {
        return;
    }
    report(HistoryError::NestingViolation,
           fmt::format("{} called with an open group, group closed "
                       "implicitly",
                       operation));
    close_group();
}

template <std::equality_comparable T>
void History<T>::report(HistoryError error, const std::string &message) {
    m_last_error = error;
    if (!m_config.verbose) {
        return;
    }
    if (m_diagnostics) {
        m_diagnostics(error, message);
    } else {
        LOG_WARN(fmt::format("UndoStack: {}: {}", to_string(error), message));
    }
}

template <std::equality_comparable T>
void History<T>::trace(const std::string &message) const {
    if (m_config.verbose) {
        LOG_DEBUG(fmt::format("UndoStack: {}", message));
    }
}

template <std::equality_comparable T>
void History<T>::trim() {
    if (m_config.max_size > 0 && m_past.size() > m_config.max_size) {
        m_past.erase(m_past.begin(),
                     m_past.begin() + (m_past.size() - m_config.max_size));
    }
}

} // namespace undostack
