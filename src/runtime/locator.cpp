#include "runtime/locator.hpp"
#include "runtime/errors.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <unistd.h>
#include <filesystem>

#ifndef WASMBOX_DEFAULT_MODULE_PATH
#define WASMBOX_DEFAULT_MODULE_PATH "rustpython.wasm"
#endif

namespace fs = std::filesystem;

namespace wasmbox::runtime {

static bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::string default_runtime_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return "";
    }
    return (fs::path(home) / ".wasmtime" / "bin" / RUNTIME_EXECUTABLE).string();
}

std::string default_module_path() {
    return WASMBOX_DEFAULT_MODULE_PATH;
}

std::optional<std::string> find_in_path(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string path_list(path_env);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) {
            end = path_list.size();
        }

        // An empty entry means the current directory
        std::string dir = path_list.substr(start, end - start);
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable_file(candidate)) {
            return fs::absolute(candidate).string();
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::optional<std::string> try_find_runtime(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        if (explicit_path.find('/') == std::string::npos) {
            return find_in_path(explicit_path);
        }
        if (is_executable_file(explicit_path)) {
            return fs::absolute(explicit_path).string();
        }
        return std::nullopt;
    }

    std::string installed = default_runtime_path();
    if (!installed.empty() && is_executable_file(installed)) {
        return installed;
    }

    return find_in_path(RUNTIME_EXECUTABLE);
}

void check_platform() {
#if !defined(__linux__)
    throw PlatformNotSupported(
        "wasmbox only supports Linux hosts. Hint: on Windows, use WSL (Windows Subsystem for Linux).");
#endif
}

RuntimePaths locate_runtime(const EngineConfig& config) {
    check_platform();

    RuntimePaths paths;

    auto runtime = try_find_runtime(config.runtime_path);
    if (!runtime) {
        std::string where = config.runtime_path.empty()
            ? default_runtime_path() + " or PATH"
            : config.runtime_path;
        spdlog::error("wasmtime not found (looked in {})", where);
        throw RuntimeNotFound("wasmtime executable not found (looked in " + where + "). " +
                              RUNTIME_INSTALL_HINT);
    }
    paths.runtime = *runtime;

    std::string module = config.module_path.empty() ? default_module_path() : config.module_path;
    std::error_code ec;
    if (!fs::is_regular_file(module, ec)) {
        spdlog::error("Interpreter module missing: {}", module);
        throw InterpreterModuleMissing(module);
    }
    paths.module = fs::absolute(module).string();

    spdlog::debug("Resolved runtime={} module={}", paths.runtime, paths.module);
    return paths;
}

} // namespace wasmbox::runtime
