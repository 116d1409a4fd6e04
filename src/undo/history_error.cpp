#include "history_error.hpp"

namespace undostack {

const char *to_string(HistoryError error) {
    switch (error) {
    case HistoryError::Reentry:
        return "Reentry";
    case HistoryError::UnmatchedClose:
        return "UnmatchedClose";
    case HistoryError::NestingViolation:
        return "NestingViolation";
    case HistoryError::EmptyUndo:
        return "EmptyUndo";
    case HistoryError::EmptyRedo:
        return "EmptyRedo";
    case HistoryError::NoGroupToReopen:
        return "NoGroupToReopen";
    default:
        return "Unknown";
    }
}

} // namespace undostack
