/**
 * Wasmbox Engine Configuration
 *
 * Installation state (where wasmtime and rustpython.wasm live) plus
 * per-run defaults. Resolved once at startup and handed to the Engine
 * by value; nothing here is read from global state after that.
 *
 * Precedence: built-in defaults < JSON config file < WASMBOX_* environment.
 */
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <utility>
#include <string_view>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace wasmbox::runtime {

// Limits enforced by wasmtime itself (0 = not set)
struct ResourceLimits {
    uint64_t max_memory_bytes = 0;   // -W max-memory-size=
    uint64_t fuel = 0;               // -W fuel=
};

struct EngineConfig {
    std::string runtime_path;                            // empty = locate wasmtime
    std::string module_path;                             // empty = bundled module
    std::vector<std::string> interpreter_args = {"-"};   // "-" = program on stdin
    std::vector<std::string> runtime_flags;              // extra wasmtime flags
    std::chrono::milliseconds default_timeout{30000};    // 0 = no deadline
    size_t max_output_bytes = 16 * 1024 * 1024;          // stdout + stderr
    ResourceLimits limits;
    std::string log_level;                               // empty = leave logger as is

    // Overlay keys present in j onto base (defaults when omitted)
    static EngineConfig from_json(const nlohmann::json& j);
    static EngineConfig from_json(const nlohmann::json& j, EngineConfig base);

    nlohmann::json to_json() const;
};

// One KEY=VALUE line of a .env file. Blank lines, comments and lines
// without a key or value yield nullopt; matching quotes are stripped.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(std::string_view line);

// Export every pair in path whose key is not already set. False when the
// file cannot be opened.
bool load_dotenv_file(const std::filesystem::path& path);

// First .env found in the working directory or next to the executable
void load_dotenv();

// Overlay WASMBOX_* environment variables onto config
void apply_environment(EngineConfig& config);

// Defaults, then config_file (if non-empty), then environment
EngineConfig load_config(const std::string& config_file = "");

} // namespace wasmbox::runtime
