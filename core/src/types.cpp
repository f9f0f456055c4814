#include "bbhunt/types.h"

namespace bbhunt {

const char* runstatus_to_str(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCESS: return "success";
        case RunStatus::ERROR:   return "error";
    }
    return "error";
}

const char* failure_to_str(FailureKind k) {
    switch (k) {
        case FailureKind::NONE:                   return "none";
        case FailureKind::NOT_FOUND:              return "not_found";
        case FailureKind::NO_TARGET:              return "no_target";
        case FailureKind::ADMISSION_DENIED:       return "admission_denied";
        case FailureKind::CAPABILITY_UNAVAILABLE: return "capability_unavailable";
        case FailureKind::EXECUTION_ERROR:        return "execution_error";
        case FailureKind::DISPATCH_ERROR:         return "dispatch_error";
    }
    return "none";
}

const char* phase_to_str(RunPhase p) {
    switch (p) {
        case RunPhase::RESOLVING:          return "resolving";
        case RunPhase::ADMITTING:          return "admitting";
        case RunPhase::DISPATCH_LOCAL:     return "dispatch_local";
        case RunPhase::DISPATCH_CONTAINER: return "dispatch_container";
        case RunPhase::COMPLETED:          return "completed";
        case RunPhase::FAILED:             return "failed";
    }
    return "failed";
}

const char* dispatch_to_str(DispatchMode m) {
    switch (m) {
        case DispatchMode::NONE:      return "none";
        case DispatchMode::LOCAL:     return "local";
        case DispatchMode::CONTAINER: return "container";
    }
    return "none";
}

} // namespace bbhunt
