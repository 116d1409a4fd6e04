#include <initializer_list>

#include <fmt/format.h>

#include "../undostack.hpp"
#include "project.hpp"

using examples::Project;
using examples::ProjectState;

namespace {

// Simulates a slider drag that passes through several values.
void drag(undostack::History<ProjectState> &history, Project &proj,
          std::initializer_list<float> positions) {
    history.start_buffer(proj.state());
    for (float b : positions) {
        proj.set_b(b);
        fmt::print("  dragging: {}\n", proj.state());
    }
    bool recorded = history.finish_buffer(proj.state());
    fmt::print("  released, recorded: {}, past entries: {}\n", recorded,
               history.past_size());
}

} // namespace

int main() {
    undostack::HistoryConfig config;
    config.verbose = true;
    undostack::History<ProjectState> history(config);

    Project proj(ProjectState{1, 0.5f});
    fmt::print("{}\n", proj.state());

    fmt::print("\nDrag with a net change:\n");
    drag(history, proj, {0.6f, 0.8f, 0.9f});

    fmt::print("\nDrag that returns to where it started:\n");
    drag(history, proj, {0.7f, 0.3f, 0.9f});

    // A second start_buffer while one is open is rejected.
    history.start_buffer(proj.state());
    history.start_buffer(proj.state());
    history.finish_buffer(proj.state());

    fmt::print("\nRecorded pre-drag value: {}\n",
               history.past_entries().back().values.front());
    return 0;
}
