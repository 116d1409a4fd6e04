#include <fmt/format.h>

#include "../undostack.hpp"
#include "project.hpp"

using examples::Project;
using examples::ProjectState;

int main() {
    undostack::History<ProjectState> history;

    Project proj(ProjectState{5, 1.0f});
    history.push(proj.state());
    fmt::print("{}\n", proj.state());

    // All four edits become one undo unit.
    history.start_group("Edit everything");

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
    history.finish_group();
    fmt::print("{}\n", proj.state());

    fmt::print("\nHistory:\n");
    examples::print_history(history);

    fmt::print("\nPerforming single undo, value will match the initial one\n");
    history.undo(proj);
    fmt::print("{}\n", proj.state());

    fmt::print(
        "\nPerforming single redo, value will go all the way to the final "
        "one\n");
    history.redo(proj);
    fmt::print("{}\n\n", proj.state());
    return 0;
}
