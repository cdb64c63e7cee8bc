/**
 * @file Types.cpp
 * @brief Names for pipeline enums
 */

#include "treemerge/Types.hpp"

namespace treemerge {

std::string to_string(PathClassification c) {
    switch (c) {
        case PathClassification::OnlyInA: return "only_in_a";
        case PathClassification::OnlyInB: return "only_in_b";
        case PathClassification::InBoth:  return "in_both";
    }
    return "unknown";
}

std::string to_string(ConflictDecision d) {
    switch (d) {
        case ConflictDecision::Skip:      return "skip";
        case ConflictDecision::Overwrite: return "overwrite";
    }
    return "unknown";
}

std::string to_string(OperationKind op) {
    switch (op) {
        case OperationKind::Copy:      return "copy";
        case OperationKind::Overwrite: return "overwrite";
        case OperationKind::Skip:      return "skip";
    }
    return "unknown";
}

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::AccessError:           return "access_error";
        case FailureKind::SourceUnreadable:      return "source_unreadable";
        case FailureKind::DestinationUnwritable: return "destination_unwritable";
        case FailureKind::OutOfSpace:            return "out_of_space";
        case FailureKind::InterruptedCopy:       return "interrupted_copy";
        case FailureKind::Cancelled:             return "cancelled";
    }
    return "unknown";
}

std::string to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Succeeded: return "succeeded";
        case OutcomeKind::Skipped:   return "skipped";
        case OutcomeKind::Failed:    return "failed";
        case OutcomeKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace treemerge
