#pragma once

#include <string>
#include <utility>
#include <vector>

#include "undo/history.hpp"
#include "undo/restorable.hpp"

/**
 * @brief Restorable that remembers every value it was asked to restore.
 */
class RecordingTarget : public undostack::IRestorable<int> {
  public:
    void restore(const int &value) override {
        m_value = value;
        m_restored.push_back(value);
    }

    int value() const { return m_value; }
    void set(int value) { m_value = value; }
    const std::vector<int> &restored() const { return m_restored; }
    std::size_t restore_count() const { return m_restored.size(); }

  private:
    int m_value = 0;
    std::vector<int> m_restored;
};

/**
 * @brief Flatten a stack into the values of each entry.
 */
inline std::vector<std::vector<int>>
values_of(const std::vector<undostack::HistoryEntry<int>> &entries) {
    std::vector<std::vector<int>> out;
    for (const auto &entry : entries) {
        out.push_back(entry.values);
    }
    return out;
}

/**
 * @brief Collects diagnostics from a History instance.
 */
struct DiagnosticLog {
    std::vector<std::pair<undostack::HistoryError, std::string>> messages;

    undostack::DiagnosticHandler handler() {
        return [this](undostack::HistoryError error,
                      const std::string &message) {
            messages.emplace_back(error, message);
        };
    }
};
