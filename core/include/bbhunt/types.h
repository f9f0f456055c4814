#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace bbhunt {

// Outcome tag of a plugin run. Callers branch on this, never on payload shape.
enum class RunStatus {
    SUCCESS,
    ERROR,
};

// Classification of a failed run (NONE for successful runs).
enum class FailureKind {
    NONE,
    NOT_FOUND,
    NO_TARGET,
    ADMISSION_DENIED,
    CAPABILITY_UNAVAILABLE,
    EXECUTION_ERROR,
    DISPATCH_ERROR,
};

// Orchestrator state machine, one instance per run() call.
enum class RunPhase {
    RESOLVING,
    ADMITTING,
    DISPATCH_LOCAL,
    DISPATCH_CONTAINER,
    COMPLETED,
    FAILED,
};

enum class DispatchMode {
    NONE,
    LOCAL,
    CONTAINER,
};

struct RunResult {
    RunStatus status{RunStatus::SUCCESS};
    std::string message;
    std::string payload_json{"{}"}; // plugin-specific, opaque to the core

    // Filled by the orchestrator; plugins leave these alone.
    FailureKind failure{FailureKind::NONE};
    RunPhase phase{RunPhase::COMPLETED};
    DispatchMode dispatch{DispatchMode::NONE};
    int64_t elapsed_ms{0};

    bool ok() const { return status == RunStatus::SUCCESS; }

    // Inline so plugin shared objects need no bbhunt_core symbols.
    static RunResult success(std::string message, std::string payload_json = "{}") {
        RunResult r;
        r.status = RunStatus::SUCCESS;
        r.message = std::move(message);
        r.payload_json = payload_json.empty() ? "{}" : std::move(payload_json);
        return r;
    }

    static RunResult error(std::string message, std::string payload_json = "{}") {
        RunResult r;
        r.status = RunStatus::ERROR;
        r.message = std::move(message);
        r.payload_json = payload_json.empty() ? "{}" : std::move(payload_json);
        r.phase = RunPhase::FAILED;
        return r;
    }
};

const char* runstatus_to_str(RunStatus s);
const char* failure_to_str(FailureKind k);
const char* phase_to_str(RunPhase p);
const char* dispatch_to_str(DispatchMode m);

} // namespace bbhunt
