/**
 * Wasmbox Call Protocol
 *
 * Marshals one function call through the sandbox's stdio. The harness
 * appended to the user's source decodes arguments from embedded JSON
 * string literals, calls the function, and writes a single frame as the
 * last thing on stdout:
 *
 *   \n<OK marker><json value>\n<END marker>\n
 *   \n<ERR marker>{"type": ..., "message": ...}\n<END marker>\n
 *   \n<BAD marker>{"type": ..., "message": ...}\n<END marker>\n
 *
 * The BAD frame means the function returned but its value could not be
 * encoded as JSON.
 *
 * Markers carry a random per-call nonce so ordinary program output (or
 * output replayed from another call) cannot forge a frame.
 */
#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace wasmbox::runtime {

struct CallSpec {
    std::string function_name = "f";
    nlohmann::json args = nlohmann::json::array();     // positional arguments
    nlohmann::json kwargs = nlohmann::json::object();  // keyword arguments
};

class CallProtocol {
public:
    // Fresh 128-bit nonce from std::random_device
    static CallProtocol generate();

    explicit CallProtocol(std::string nonce);

    const std::string& nonce() const { return nonce_; }
    const std::string& ok_marker() const { return ok_marker_; }
    const std::string& error_marker() const { return error_marker_; }
    const std::string& unserializable_marker() const { return unserializable_marker_; }
    const std::string& end_marker() const { return end_marker_; }

private:
    std::string nonce_;
    std::string ok_marker_;
    std::string error_marker_;
    std::string unserializable_marker_;
    std::string end_marker_;
};

enum class FrameKind {
    RESULT,          // function returned a JSON value
    ERROR,           // function raised
    UNSERIALIZABLE   // function returned a value json.dumps rejected
};

struct CallFrame {
    FrameKind kind;
    std::string payload;       // JSON text between marker and end marker
    std::string user_output;   // stdout preceding the frame
};

// A double-quoted literal valid in both JSON and Python source.
// Throws InvalidCallSpec on invalid UTF-8.
std::string quote_literal(const std::string& text);

// Serialize value as ASCII-only JSON and quote it, ready for json.loads()
std::string encode_json_literal(const nlohmann::json& value);

// User source followed by the call harness
std::string render_call_program(const std::string& code, const CallSpec& spec,
                                 const CallProtocol& protocol);

// Locate the harness frame at the end of stdout. nullopt when no
// complete frame terminates the stream.
std::optional<CallFrame> extract_frame(const std::string& stdout_text,
                                       const CallProtocol& protocol);

} // namespace wasmbox::runtime
