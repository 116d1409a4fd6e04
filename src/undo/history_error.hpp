#pragma once

#include <functional>
#include <string>

namespace undostack {

/**
 * @brief Misuse conditions detected by History.
 *
 * None of them is fatal: the offending call becomes a no-op with respect
 * to the stacks and the condition is reported through the diagnostic
 * channel when it is enabled.
 */
enum class HistoryError {
    Reentry,          ///< start_buffer/start_group while already open
    UnmatchedClose,   ///< finish_buffer/finish_group with nothing open
    NestingViolation, ///< buffer inside group, group inside buffer
    EmptyUndo,        ///< undo with an empty past stack
    EmptyRedo,        ///< redo with an empty future stack
    NoGroupToReopen,  ///< reopen_group when the last entry is not a group
};

const char *to_string(HistoryError error);

/// Receives misuse diagnostics when verbose output is enabled.
using DiagnosticHandler =
    std::function<void(HistoryError, const std::string &)>;

} // namespace undostack
