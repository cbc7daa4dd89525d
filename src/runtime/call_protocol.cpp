#include "runtime/call_protocol.hpp"
#include "runtime/errors.hpp"
#include <fmt/core.h>

#include <random>
#include <cstdint>

using json = nlohmann::json;

namespace wasmbox::runtime {

// Appended after the user's source. Every injected value arrives as a
// quoted literal; arguments pass through json.loads, the function is
// looked up by name in the module globals. A return value json.dumps
// rejects gets its own frame, never the user-exception one.
static constexpr const char* CALL_HARNESS = R"PY(

# ---- wasmbox call harness ----
def __wasmbox_call():
    import json as _json
    import sys as _sys
    _ok, _err, _bad, _end = {ok}, {err}, {bad}, {end}
    _name = {name}
    try:
        _args = _json.loads({args})
        _kwargs = _json.loads({kwargs})
        _fn = globals().get(_name)
        if _fn is None:
            raise NameError("name '%s' is not defined" % _name)
        _result = _fn(*_args, **_kwargs)
    except Exception as _e:
        _frame = _err + _json.dumps({{"type": type(_e).__name__, "message": str(_e)}})
    else:
        try:
            _frame = _ok + _json.dumps(_result, allow_nan=False)
        except Exception as _e:
            _frame = _bad + _json.dumps({{"type": type(_e).__name__, "message": str(_e)}})
    _sys.stdout.write("\n" + _frame + "\n" + _end + "\n")
    _sys.stdout.flush()


__wasmbox_call()
)PY";

// ============================================================================
// CallProtocol
// ============================================================================

CallProtocol CallProtocol::generate() {
    std::random_device rd;
    std::uniform_int_distribution<uint64_t> dist;
    return CallProtocol(fmt::format("{:016x}{:016x}", dist(rd), dist(rd)));
}

CallProtocol::CallProtocol(std::string nonce)
    : nonce_(std::move(nonce))
    , ok_marker_("__WASMBOX_OK_" + nonce_ + "__")
    , error_marker_("__WASMBOX_ERR_" + nonce_ + "__")
    , unserializable_marker_("__WASMBOX_BAD_" + nonce_ + "__")
    , end_marker_("__WASMBOX_END_" + nonce_ + "__") {}

// ============================================================================
// Encoding
// ============================================================================

std::string quote_literal(const std::string& text) {
    try {
        // JSON string escapes (\" \\ \n \uXXXX ...) are all valid in Python
        return json(text).dump();
    } catch (const json::type_error& e) {
        throw InvalidCallSpec(std::string("cannot encode literal: ") + e.what());
    }
}

std::string encode_json_literal(const json& value) {
    std::string text;
    try {
        // ensure_ascii turns astral characters into \uXXXX pairs inside the
        // JSON text; json.loads reassembles them, Python never sees surrogates
        text = value.dump(-1, ' ', true);
    } catch (const json::type_error& e) {
        throw InvalidCallSpec(std::string("cannot serialize argument: ") + e.what());
    }
    return quote_literal(text);
}

std::string render_call_program(const std::string& code, const CallSpec& spec,
                                 const CallProtocol& protocol) {
    if (!spec.args.is_array()) {
        throw InvalidCallSpec("positional arguments must be a JSON array");
    }
    if (!spec.kwargs.is_object()) {
        throw InvalidCallSpec("keyword arguments must be a JSON object");
    }

    std::string program = code;
    if (!program.empty() && program.back() != '\n') {
        program += '\n';
    }

    program += fmt::format(fmt::runtime(CALL_HARNESS),
        fmt::arg("ok", quote_literal(protocol.ok_marker())),
        fmt::arg("err", quote_literal(protocol.error_marker())),
        fmt::arg("bad", quote_literal(protocol.unserializable_marker())),
        fmt::arg("end", quote_literal(protocol.end_marker())),
        fmt::arg("name", quote_literal(spec.function_name)),
        fmt::arg("args", encode_json_literal(spec.args)),
        fmt::arg("kwargs", encode_json_literal(spec.kwargs)));

    return program;
}

// ============================================================================
// Decoding
// ============================================================================

static size_t last_before(const std::string& text, const std::string& needle, size_t limit) {
    if (needle.size() > limit) {
        return std::string::npos;
    }
    return text.rfind(needle, limit - needle.size());
}

std::optional<CallFrame> extract_frame(const std::string& stdout_text,
                                       const CallProtocol& protocol) {
    const std::string& end = protocol.end_marker();

    size_t end_pos = stdout_text.rfind(end);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    // The harness frame is the last thing written
    if (stdout_text.find_first_not_of(" \t\r\n", end_pos + end.size()) != std::string::npos) {
        return std::nullopt;
    }

    if (end_pos == 0 || stdout_text[end_pos - 1] != '\n') {
        return std::nullopt;
    }
    size_t body_end = end_pos - 1;

    // Last result marker of any kind before the end marker
    struct Candidate {
        FrameKind kind;
        const std::string& marker;
    };
    const Candidate candidates[] = {
        {FrameKind::RESULT, protocol.ok_marker()},
        {FrameKind::ERROR, protocol.error_marker()},
        {FrameKind::UNSERIALIZABLE, protocol.unserializable_marker()},
    };

    CallFrame frame;
    size_t marker_pos = std::string::npos;
    size_t marker_len = 0;
    for (const auto& candidate : candidates) {
        size_t pos = last_before(stdout_text, candidate.marker, body_end);
        if (pos != std::string::npos && (marker_pos == std::string::npos || pos > marker_pos)) {
            frame.kind = candidate.kind;
            marker_pos = pos;
            marker_len = candidate.marker.size();
        }
    }
    if (marker_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t payload_start = marker_pos + marker_len;
    frame.payload = stdout_text.substr(payload_start, body_end - payload_start);

    frame.user_output = stdout_text.substr(0, marker_pos);
    if (!frame.user_output.empty() && frame.user_output.back() == '\n') {
        frame.user_output.pop_back();
    }

    return frame;
}

} // namespace wasmbox::runtime
