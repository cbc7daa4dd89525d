/**
 * Wasmbox Result Decoder
 *
 * Maps a RawOutcome to the caller-facing result. Plain mode is an
 * identity mapping; call mode reads the harness frame out of stdout and
 * settles the call in exactly one terminal state.
 */
#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "runtime/sandbox_process.hpp"
#include "runtime/call_protocol.hpp"

namespace wasmbox::runtime {

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    Termination termination = Termination::EXITED;
    std::chrono::milliseconds elapsed{0};

    bool timed_out() const { return termination == Termination::TIMED_OUT; }
};

// Call lifecycle: PENDING -> DISPATCHED -> one of the terminal states
enum class CallState {
    PENDING,
    DISPATCHED,
    SUCCEEDED,   // result frame with valid JSON
    RAISED,      // error frame with a valid {type, message}
    TIMED_OUT,   // deadline hit, partial output ignored
    CRASHED      // no frame, malformed or unserializable result, output overflow
};

const char* call_state_to_string(CallState state);

enum class CallError {
    NONE,
    USER_EXCEPTION,
    TIMED_OUT,
    CRASH_EXIT,
    MALFORMED_CALL_PAYLOAD,
    OUTPUT_LIMIT_EXCEEDED
};

const char* call_error_to_string(CallError error);

// Exception raised inside the sandbox; no traceback is reconstructed
struct UserException {
    std::string type;
    std::string message;
};

struct FunctionCallResult {
    ExecutionResult execution;   // stdout has the harness frame removed
    CallState state = CallState::PENDING;
    CallError error = CallError::NONE;
    std::optional<nlohmann::json> value;
    std::optional<UserException> exception;
    std::string detail;          // why a call CRASHED

    bool succeeded() const { return state == CallState::SUCCEEDED; }
    // The callee ran and raised, as opposed to crashing or timing out
    bool is_error() const { return state == CallState::RAISED; }
};

ExecutionResult decode(const RawOutcome& outcome);

FunctionCallResult decode_call(const RawOutcome& outcome, const CallProtocol& protocol);

} // namespace wasmbox::runtime
