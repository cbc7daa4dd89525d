/**
 * Wasmbox Engine
 *
 * Public surface: run untrusted Python inside RustPython on wasmtime and
 * return its captured output, or call one function and return its decoded
 * JSON result.
 *
 * Runtime and module paths are resolved once at construction; a missing
 * runtime or module throws there, before any sandbox is spawned. Every
 * call then spawns its own SandboxProcess and tears it down, so an Engine
 * holds no mutable state and may be shared across threads.
 */
#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "runtime/config.hpp"
#include "runtime/locator.hpp"
#include "runtime/invocation.hpp"
#include "runtime/result_decoder.hpp"

namespace wasmbox::runtime {

class Engine {
public:
    // Throws PlatformNotSupported, RuntimeNotFound, InterpreterModuleMissing
    explicit Engine(EngineConfig config = EngineConfig{});

    // Run code; returns stdout, stderr and exit code. A negative timeout
    // throws InvalidConfiguration.
    ExecutionResult execute(const std::string& code,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;
    ExecutionResult execute(const ExecutionRequest& request) const;

    // Define code, then call function_name(*args, **kwargs). Throws
    // InvalidCallSpec when args is not an array or kwargs not an object.
    FunctionCallResult execute_call(const std::string& code,
                                    const std::string& function_name,
                                    const nlohmann::json& args = nlohmann::json::array(),
                                    const nlohmann::json& kwargs = nlohmann::json::object(),
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;
    FunctionCallResult execute_call(const ExecutionRequest& request, const CallSpec& spec) const;

    const EngineConfig& config() const { return config_; }
    const RuntimePaths& paths() const { return paths_; }

private:
    EngineConfig config_;
    RuntimePaths paths_;
};

} // namespace wasmbox::runtime
