#include <fmt/format.h>

#include "../undostack.hpp"
#include "project.hpp"

using examples::Project;
using examples::ProjectState;

int main() {
    undostack::HistoryConfig config;
    config.verbose = true;
    undostack::History<ProjectState> history(config);

    Project proj(ProjectState{5, 1.0f});
    history.set_baseline(proj.state());
    fmt::print("{}\n", proj.state());

    // Every edit is recorded right after it is made.
    proj.set_a(50);
    proj.set_b(10.0f);
    history.push(proj.state());
    fmt::print("{}\n", proj.state());

    proj.set_a(2000000);
    history.push(proj.state());
    fmt::print("{}\n", proj.state());

    proj.set_b(1000000.0f);
    history.push(proj.state());
    fmt::print("{}\n", proj.state());

    proj.set_a(555);
    proj.set_b(222.0f);
    history.push(proj.state());
    fmt::print("{}\n", proj.state());

    fmt::print("\nHistory:\n");
    examples::print_history(history);

    for (int i = 0; i < 4; ++i) {
        fmt::print("\nPerforming undo ...\n");
        history.undo(proj);
        fmt::print("{}\n", proj.state());
    }

    // Back at the baseline; this one only emits a diagnostic.
    fmt::print("\n");
    history.undo(proj);

    fmt::print("\nPerforming redo all the way...\n");
    while (history.can_redo()) {
        history.redo(proj);
    }
    fmt::print("Final value: {}\n\n", proj.state());
    return 0;
}
