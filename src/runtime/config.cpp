#include "runtime/config.hpp"
#include "runtime/errors.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace wasmbox::runtime {

// ============================================================================
// JSON
// ============================================================================

EngineConfig EngineConfig::from_json(const json& j) {
    return from_json(j, EngineConfig{});
}

EngineConfig EngineConfig::from_json(const json& j, EngineConfig base) {
    if (!j.is_object()) {
        throw InvalidConfiguration("configuration must be a JSON object");
    }

    try {
        base.runtime_path = j.value("runtime", base.runtime_path);
        base.module_path = j.value("module", base.module_path);
        base.interpreter_args = j.value("interpreter_args", base.interpreter_args);
        base.runtime_flags = j.value("runtime_flags", base.runtime_flags);
        if (j.contains("timeout_ms")) {
            base.default_timeout = std::chrono::milliseconds(j.at("timeout_ms").get<uint64_t>());
        }
        base.max_output_bytes = j.value("max_output_bytes", base.max_output_bytes);
        base.limits.max_memory_bytes = j.value("max_memory_bytes", base.limits.max_memory_bytes);
        base.limits.fuel = j.value("fuel", base.limits.fuel);
        base.log_level = j.value("log_level", base.log_level);
    } catch (const json::exception& e) {
        throw InvalidConfiguration(std::string("invalid configuration value: ") + e.what());
    }

    return base;
}

json EngineConfig::to_json() const {
    json j;
    j["runtime"] = runtime_path;
    j["module"] = module_path;
    j["interpreter_args"] = interpreter_args;
    j["runtime_flags"] = runtime_flags;
    j["timeout_ms"] = default_timeout.count();
    j["max_output_bytes"] = max_output_bytes;
    j["max_memory_bytes"] = limits.max_memory_bytes;
    j["fuel"] = limits.fuel;
    j["log_level"] = log_level;
    return j;
}

// ============================================================================
// Environment
// ============================================================================

static std::string_view trim(std::string_view text) {
    constexpr std::string_view SPACE = " \t\r\n";
    size_t first = text.find_first_not_of(SPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(SPACE);
    return text.substr(first, last - first + 1);
}

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view key = trim(line.substr(0, eq));
    std::string_view value = trim(line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }

    if (key.empty() || value.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::string(key), std::string(value));
}

bool load_dotenv_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (auto pair = parse_dotenv_line(line)) {
            // overwrite = 0: the real environment wins
            setenv(pair->first.c_str(), pair->second.c_str(), 0);
        }
    }
    spdlog::debug("Loaded environment from {}", path.string());
    return true;
}

void load_dotenv() {
    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path() / ".env",
    };

    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        search_paths.push_back(exe.parent_path() / ".env");
    }

    for (const auto& path : search_paths) {
        if (std::filesystem::is_regular_file(path, ec) && load_dotenv_file(path)) {
            return;
        }
    }
}

static uint64_t parse_unsigned(const char* name, const char* value) {
    try {
        size_t pos = 0;
        std::string text(value);
        if (text.empty() || text[0] == '-') {
            throw std::invalid_argument(text);
        }
        unsigned long long parsed = std::stoull(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument(text);
        }
        return parsed;
    } catch (const std::exception&) {
        throw InvalidConfiguration(std::string(name) + " must be a non-negative integer, got '" +
                                   value + "'");
    }
}

void apply_environment(EngineConfig& config) {
    if (const char* v = std::getenv("WASMBOX_RUNTIME")) {
        config.runtime_path = v;
    }
    if (const char* v = std::getenv("WASMBOX_MODULE")) {
        config.module_path = v;
    }
    if (const char* v = std::getenv("WASMBOX_TIMEOUT_MS")) {
        config.default_timeout = std::chrono::milliseconds(parse_unsigned("WASMBOX_TIMEOUT_MS", v));
    }
    if (const char* v = std::getenv("WASMBOX_MAX_OUTPUT_BYTES")) {
        config.max_output_bytes = parse_unsigned("WASMBOX_MAX_OUTPUT_BYTES", v);
    }
    if (const char* v = std::getenv("WASMBOX_LOG_LEVEL")) {
        config.log_level = v;
    }
}

EngineConfig load_config(const std::string& config_file) {
    load_dotenv();

    EngineConfig config;

    if (!config_file.empty()) {
        std::ifstream in(config_file);
        if (!in) {
            throw InvalidConfiguration("cannot open configuration file: " + config_file);
        }
        try {
            config = EngineConfig::from_json(json::parse(in), config);
        } catch (const json::parse_error& e) {
            throw InvalidConfiguration("cannot parse " + config_file + ": " + e.what());
        }
        spdlog::debug("Loaded configuration from {}", config_file);
    }

    apply_environment(config);
    return config;
}

} // namespace wasmbox::runtime
