#include "runtime/engine.hpp"
#include "runtime/sandbox_process.hpp"
#include "util/logger.hpp"
#include <spdlog/spdlog.h>

namespace wasmbox::runtime {

Engine::Engine(EngineConfig config)
    : config_(std::move(config)) {
    if (!config_.log_level.empty()) {
        util::init_logger();
        util::set_log_level(util::log_level_from_string(config_.log_level));
    }

    paths_ = locate_runtime(config_);
    spdlog::info("Engine ready (runtime={}, module={})", paths_.runtime, paths_.module);
}

ExecutionResult Engine::execute(const std::string& code,
                                std::optional<std::chrono::milliseconds> timeout) const {
    ExecutionRequest request;
    request.code = code;
    request.timeout = timeout;
    return execute(request);
}

ExecutionResult Engine::execute(const ExecutionRequest& request) const {
    Invocation invocation = build_invocation(paths_, config_, request);
    return decode(run(invocation));
}

FunctionCallResult Engine::execute_call(const std::string& code,
                                        const std::string& function_name,
                                        const nlohmann::json& args,
                                        const nlohmann::json& kwargs,
                                        std::optional<std::chrono::milliseconds> timeout) const {
    ExecutionRequest request;
    request.code = code;
    request.timeout = timeout;

    CallSpec spec;
    spec.function_name = function_name;
    spec.args = args;
    spec.kwargs = kwargs;

    return execute_call(request, spec);
}

FunctionCallResult Engine::execute_call(const ExecutionRequest& request, const CallSpec& spec) const {
    Invocation invocation = build_invocation_for_call(paths_, config_, request, spec);

    spdlog::debug("Call {}(): {} -> {}", spec.function_name,
        call_state_to_string(CallState::PENDING), call_state_to_string(CallState::DISPATCHED));

    RawOutcome outcome = run(invocation);
    FunctionCallResult result = decode_call(outcome, *invocation.protocol);

    if (result.state == CallState::CRASHED) {
        spdlog::warn("Call {}() crashed ({}): {}", spec.function_name,
            call_error_to_string(result.error), result.detail);
    } else {
        spdlog::debug("Call {}(): {} -> {}", spec.function_name,
            call_state_to_string(CallState::DISPATCHED), call_state_to_string(result.state));
    }
    return result;
}

} // namespace wasmbox::runtime
