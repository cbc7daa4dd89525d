#include "runtime/invocation.hpp"
#include "runtime/errors.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace wasmbox::runtime {

// Host variables the wasmtime process itself may need. The guest sees
// none of them unless granted through env_grants.
static const char* const RUNTIME_ENV_PASSTHROUGH[] = {
    "PATH", "HOME", "TMPDIR", "LANG", "LC_ALL", "XDG_CACHE_HOME"
};

static std::vector<std::string> build_runtime_env() {
    std::vector<std::string> env;
    for (const char* name : RUNTIME_ENV_PASSTHROUGH) {
        if (const char* value = std::getenv(name)) {
            env.push_back(std::string(name) + "=" + value);
        }
    }
    return env;
}

static std::vector<std::string> build_args(const RuntimePaths& paths, const EngineConfig& config,
                                           const ExecutionRequest& request) {
    std::vector<std::string> args;
    args.push_back(paths.runtime);
    args.push_back("run");

    for (const auto& grant : request.dir_grants) {
        args.push_back("--dir=" + grant.host + "::" + grant.guest);
    }
    for (const auto& [key, value] : request.env_grants) {
        args.push_back("--env=" + key + "=" + value);
    }

    uint64_t max_memory = request.limits.max_memory_bytes
        ? request.limits.max_memory_bytes : config.limits.max_memory_bytes;
    if (max_memory) {
        args.push_back("-W");
        args.push_back("max-memory-size=" + std::to_string(max_memory));
    }

    uint64_t fuel = request.limits.fuel ? request.limits.fuel : config.limits.fuel;
    if (fuel) {
        args.push_back("-W");
        args.push_back("fuel=" + std::to_string(fuel));
    }

    for (const auto& flag : config.runtime_flags) {
        args.push_back(flag);
    }

    args.push_back(paths.module);

    for (const auto& arg : config.interpreter_args) {
        args.push_back(arg);
    }

    return args;
}

Invocation build_invocation(const RuntimePaths& paths, const EngineConfig& config,
                            const ExecutionRequest& request) {
    Invocation invocation;
    invocation.argv = build_args(paths, config, request);
    invocation.stdin_payload = request.code;
    invocation.env = build_runtime_env();
    invocation.working_directory = request.working_directory;
    invocation.timeout = request.timeout.value_or(config.default_timeout);
    if (invocation.timeout.count() < 0) {
        throw InvalidConfiguration("timeout must not be negative, got " +
                                   std::to_string(invocation.timeout.count()) + "ms");
    }
    invocation.max_output_bytes = config.max_output_bytes;

    spdlog::debug("Built invocation ({} bytes of source, {} args)",
        invocation.stdin_payload.size(), invocation.argv.size());
    return invocation;
}

Invocation build_invocation_for_call(const RuntimePaths& paths, const EngineConfig& config,
                                     const ExecutionRequest& request, const CallSpec& spec) {
    Invocation invocation = build_invocation(paths, config, request);

    CallProtocol protocol = CallProtocol::generate();
    invocation.stdin_payload = render_call_program(request.code, spec, protocol);
    invocation.protocol = std::move(protocol);

    spdlog::debug("Built call invocation for {}() ({} positional, {} keyword)",
        spec.function_name, spec.args.size(), spec.kwargs.size());
    return invocation;
}

} // namespace wasmbox::runtime
