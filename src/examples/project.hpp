#pragma once

#include <chrono>
#include <string>

#include <fmt/format.h>

#include "../undo/history.hpp"
#include "../undo/restorable.hpp"

namespace examples {

/**
 * @brief The recorded state of the demo project.
 */
struct ProjectState {
    int a = 0;
    float b = 0.0f;

    bool operator==(const ProjectState &) const = default;
};

/**
 * @brief Demo application object owning a ProjectState.
 */
class Project : public undostack::IRestorable<ProjectState> {
  public:
    explicit Project(ProjectState state) : m_state(state) {}

    void restore(const ProjectState &value) override { m_state = value; }

    const ProjectState &state() const { return m_state; }
    void set_a(int a) { m_state.a = a; }
    void set_b(float b) { m_state.b = b; }

  private:
    ProjectState m_state;
};

/**
 * @brief Formats how long ago an entry was committed.
 */
inline std::string
format_age(const std::chrono::steady_clock::time_point &timestamp) {
    auto now = std::chrono::steady_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::seconds>(now - timestamp);

    if (duration.count() < 60) {
        return fmt::format("{}s ago", duration.count());
    } else if (duration.count() < 3600) {
        return fmt::format("{}m ago", duration.count() / 60);
    } else {
        return fmt::format("{}h ago", duration.count() / 3600);
    }
}

/**
 * @brief Prints the past entries (most recent first) and a summary line.
 */
inline void print_history(const undostack::History<ProjectState> &history);

} // namespace examples

template <>
struct fmt::formatter<examples::ProjectState> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const examples::ProjectState &state, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "Project {{ a: {}, b: {} }}", state.a,
                              state.b);
    }
};

inline void
examples::print_history(const undostack::History<ProjectState> &history) {
    const auto &past = history.past_entries();
    for (auto it = past.rbegin(); it != past.rend(); ++it) {
        const char *kind = it->is_group() ? "group" : "value";
        std::string name = it->label.empty() ? kind : it->label;
        fmt::print("  [{}] {} ({} value(s), last {})\n",
                   format_age(it->timestamp), name, it->size(),
                   it->values.back());
    }
    fmt::print("  Past: {} | Future: {}\n", history.past_size(),
               history.future_size());
}
