/**
 * Wasmbox Runtime Locator
 *
 * Resolves the wasmtime executable and the prebuilt interpreter module.
 * Read-only filesystem and PATH lookups; throws RuntimeNotFound or
 * InterpreterModuleMissing when either is absent.
 */
#pragma once
#include <string>
#include <optional>
#include "runtime/config.hpp"

namespace wasmbox::runtime {

constexpr const char* RUNTIME_EXECUTABLE = "wasmtime";
constexpr const char* RUNTIME_INSTALL_HINT =
    "Install wasmtime with: curl https://wasmtime.dev/install.sh -sSf | bash "
    "(or set WASMBOX_RUNTIME to the wasmtime executable)";

struct RuntimePaths {
    std::string runtime;   // absolute path of the wasmtime executable
    std::string module;    // absolute path of rustpython.wasm
};

// $HOME/.wasmtime/bin/wasmtime, where the official installer puts it
std::string default_runtime_path();

// Module path compiled in by the build (WASMBOX_DEFAULT_MODULE_PATH)
std::string default_module_path();

// Search each PATH entry for an executable regular file called name
std::optional<std::string> find_in_path(const std::string& name);

// Explicit path (a bare name is looked up on PATH), else the installer
// location, else wasmtime on PATH
std::optional<std::string> try_find_runtime(const std::string& explicit_path = "");

// Throws PlatformNotSupported on anything but Linux
void check_platform();

RuntimePaths locate_runtime(const EngineConfig& config);

} // namespace wasmbox::runtime
