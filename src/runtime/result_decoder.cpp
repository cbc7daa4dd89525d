#include "runtime/result_decoder.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace wasmbox::runtime {

const char* call_state_to_string(CallState state) {
    switch (state) {
        case CallState::PENDING:    return "PENDING";
        case CallState::DISPATCHED: return "DISPATCHED";
        case CallState::SUCCEEDED:  return "SUCCEEDED";
        case CallState::RAISED:     return "RAISED";
        case CallState::TIMED_OUT:  return "TIMED_OUT";
        case CallState::CRASHED:    return "CRASHED";
        default: return "UNKNOWN";
    }
}

const char* call_error_to_string(CallError error) {
    switch (error) {
        case CallError::NONE:                   return "NONE";
        case CallError::USER_EXCEPTION:         return "USER_EXCEPTION";
        case CallError::TIMED_OUT:              return "TIMED_OUT";
        case CallError::CRASH_EXIT:             return "CRASH_EXIT";
        case CallError::MALFORMED_CALL_PAYLOAD: return "MALFORMED_CALL_PAYLOAD";
        case CallError::OUTPUT_LIMIT_EXCEEDED:  return "OUTPUT_LIMIT_EXCEEDED";
        default: return "UNKNOWN";
    }
}

ExecutionResult decode(const RawOutcome& outcome) {
    ExecutionResult result;
    result.stdout_text = outcome.stdout_data;
    result.stderr_text = outcome.stderr_data;
    result.exit_code = outcome.exit_code;
    result.termination = outcome.termination;
    result.elapsed = outcome.elapsed;
    return result;
}

constexpr size_t DETAIL_TEXT_MAX = 64;

static std::string truncate(std::string text, size_t max) {
    if (text.size() > max) {
        text.resize(max);
        text += "...";
    }
    return text;
}

static FunctionCallResult crashed(FunctionCallResult result, CallError error, std::string detail) {
    result.state = CallState::CRASHED;
    result.error = error;
    result.detail = std::move(detail);
    return result;
}

FunctionCallResult decode_call(const RawOutcome& outcome, const CallProtocol& protocol) {
    FunctionCallResult result;
    result.execution = decode(outcome);

    if (outcome.termination == Termination::TIMED_OUT) {
        result.state = CallState::TIMED_OUT;
        result.error = CallError::TIMED_OUT;
        return result;
    }

    if (outcome.termination == Termination::OUTPUT_LIMIT) {
        return crashed(std::move(result), CallError::OUTPUT_LIMIT_EXCEEDED,
                       "captured output exceeded the configured limit");
    }

    auto frame = extract_frame(outcome.stdout_data, protocol);
    if (!frame) {
        return crashed(std::move(result), CallError::CRASH_EXIT,
                       "no result frame in output (exit code " +
                       std::to_string(outcome.exit_code) + ")");
    }
    result.execution.stdout_text = frame->user_output;

    // Payload text is guest-controlled; details carry its size, not its content
    json payload;
    try {
        payload = json::parse(frame->payload);
    } catch (const json::parse_error& e) {
        spdlog::warn("Malformed call payload ({} bytes, error at byte {})",
            frame->payload.size(), e.byte);
        return crashed(std::move(result), CallError::MALFORMED_CALL_PAYLOAD,
                       "cannot parse call payload (" + std::to_string(frame->payload.size()) +
                       " bytes, error at byte " + std::to_string(e.byte) + ")");
    }

    if (frame->kind == FrameKind::RESULT) {
        if (outcome.exit_code != 0) {
            spdlog::warn("Call produced a result but exited with code {}", outcome.exit_code);
        }
        result.state = CallState::SUCCEEDED;
        result.value = std::move(payload);
        return result;
    }

    auto type = payload.find("type");
    auto message = payload.find("message");
    if (!payload.is_object() || type == payload.end() || !type->is_string() ||
        message == payload.end() || !message->is_string()) {
        return crashed(std::move(result), CallError::MALFORMED_CALL_PAYLOAD,
                       "error payload is not a {type, message} object (" +
                       std::to_string(frame->payload.size()) + " bytes)");
    }

    if (frame->kind == FrameKind::UNSERIALIZABLE) {
        return crashed(std::move(result), CallError::MALFORMED_CALL_PAYLOAD,
                       "return value is not JSON-serializable (" +
                       truncate(type->get<std::string>(), DETAIL_TEXT_MAX) + ")");
    }

    result.state = CallState::RAISED;
    result.error = CallError::USER_EXCEPTION;
    result.exception = UserException{type->get<std::string>(), message->get<std::string>()};
    return result;
}

} // namespace wasmbox::runtime
