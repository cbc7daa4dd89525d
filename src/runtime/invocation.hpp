/**
 * Wasmbox Invocation Builder
 *
 * Turns an ExecutionRequest (and, in call mode, a CallSpec) into the exact
 * argv, stdin and environment for one wasmtime run. By default the guest
 * gets no preopened directories, no environment and no network.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include "runtime/config.hpp"
#include "runtime/locator.hpp"
#include "runtime/call_protocol.hpp"

namespace wasmbox::runtime {

// Explicit host directory grant (--dir host::guest)
struct DirGrant {
    std::string host;
    std::string guest;
};

struct ExecutionRequest {
    std::string code;
    std::string working_directory;                   // cwd of the wasmtime process
    std::vector<DirGrant> dir_grants;
    std::map<std::string, std::string> env_grants;   // visible inside the guest
    ResourceLimits limits;                           // non-zero fields override config
    std::optional<std::chrono::milliseconds> timeout;
};

struct Invocation {
    std::vector<std::string> argv;       // argv[0] is the runtime executable
    std::string stdin_payload;
    std::vector<std::string> env;        // KEY=VALUE for the runtime process
    std::string working_directory;
    std::chrono::milliseconds timeout{0};
    size_t max_output_bytes = 0;
    std::optional<CallProtocol> protocol;  // set in call mode only
};

// Program text goes to stdin verbatim. A timeout of 0 means no deadline;
// a negative one throws InvalidConfiguration.
Invocation build_invocation(const RuntimePaths& paths, const EngineConfig& config,
                            const ExecutionRequest& request);

// stdin carries the user's source followed by the call harness
Invocation build_invocation_for_call(const RuntimePaths& paths, const EngineConfig& config,
                                     const ExecutionRequest& request, const CallSpec& spec);

} // namespace wasmbox::runtime
