/**
 * Wasmbox Errors
 *
 * Configuration-level failures. These are raised before any sandbox
 * process is spawned; per-call failures (timeouts, crashes, decode
 * errors, user exceptions) are reported as values instead.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace wasmbox::runtime {

struct WasmboxError : std::runtime_error {
    explicit WasmboxError(const std::string& msg) : std::runtime_error(msg) {}
};

// The wasmtime executable could not be located
struct RuntimeNotFound : WasmboxError {
    explicit RuntimeNotFound(const std::string& msg) : WasmboxError(msg) {}
};

// The interpreter module (rustpython.wasm) is absent
struct InterpreterModuleMissing : WasmboxError {
    explicit InterpreterModuleMissing(const std::string& path)
        : WasmboxError("Interpreter module not found at: " + path), path(path) {}

    std::string path;
};

struct PlatformNotSupported : WasmboxError {
    explicit PlatformNotSupported(const std::string& msg) : WasmboxError(msg) {}
};

struct InvalidConfiguration : WasmboxError {
    explicit InvalidConfiguration(const std::string& msg) : WasmboxError(msg) {}
};

// Arguments that cannot be marshalled (kwargs not an object, invalid UTF-8)
struct InvalidCallSpec : WasmboxError {
    explicit InvalidCallSpec(const std::string& msg) : WasmboxError(msg) {}
};

// Host-side failure to set up the sandbox process (pipe, fork)
struct SpawnError : WasmboxError {
    explicit SpawnError(const std::string& msg) : WasmboxError(msg) {}
};

} // namespace wasmbox::runtime
