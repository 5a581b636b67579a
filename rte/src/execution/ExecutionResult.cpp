#include "execution/ExecutionResult.h"

namespace RTE {

const char *toString(ExecutionState state) {
    switch (state) {
    case ExecutionState::Pending:
        return "pending";
    case ExecutionState::Running:
        return "running";
    case ExecutionState::CompletedSuccess:
        return "passed";
    case ExecutionState::CompletedFailure:
        return "failed";
    case ExecutionState::TimedOut:
        return "timed_out";
    case ExecutionState::Canceled:
        return "canceled";
    }
    return "unknown";
}

}  // namespace RTE
