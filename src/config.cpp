// =============================================================================
// config.cpp - TOML-subset loader and validation
// =============================================================================

#include "dataswap/config.hpp"
#include "dataswap/errors.hpp"

#include <fstream>
#include <sstream>

namespace dataswap {

// Simple TOML parser (sections, key = value, comments)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

long long to_integer(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw Error(ErrorCode::InvalidConfig,
                    "expected integer for '" + key + "', got '" + value + "'");
    }
}

uint32_t to_bps(const std::string& key, const std::string& value) {
    long long v = to_integer(key, value);
    if (v < 0 || v > static_cast<long long>(BPS_DENOMINATOR)) {
        throw Error(ErrorCode::InvalidConfig, key + " must be within 0..10000 bps");
    }
    return static_cast<uint32_t>(v);
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw Error(ErrorCode::InvalidConfig, "Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw Error(ErrorCode::InvalidConfig,
                            "unterminated section header on line " + std::to_string(line_no));
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw Error(ErrorCode::InvalidConfig,
                        "expected key = value on line " + std::to_string(line_no));
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "engine") {
            if (key == "fee_bps") config.engine.fee_bps = to_bps(key, value);
            else if (key == "ratio_tolerance_bps") config.engine.ratio_tolerance_bps = to_bps(key, value);
            else if (key == "lock_timeout_ms") config.engine.lock_timeout_ms = static_cast<int>(to_integer(key, value));
            else if (key == "max_slippage_bps") config.engine.max_slippage_bps = to_bps(key, value);
            else if (key == "default_trade_limit") config.engine.default_trade_limit = static_cast<size_t>(to_integer(key, value));
            else if (key == "max_trade_limit") config.engine.max_trade_limit = static_cast<size_t>(to_integer(key, value));
        }
        else if (current_section == "store") {
            if (key == "backend") config.store.backend = value;
            else if (key == "path") config.store.path = value;
        }
        else if (current_section == "settlement") {
            if (key == "type") config.settlement.type = value;
            else if (key == "url") config.settlement.url = value;
            else if (key == "timeout_ms") config.settlement.timeout_ms = static_cast<int>(to_integer(key, value));
            else if (key == "api_key") config.settlement.api_key = value;
        }
        else if (current_section == "log") {
            if (key == "level") config.log.level = value;
            else if (key == "pattern") config.log.pattern = value;
        }
    }

    return config;
}

void Config::validate() const {
    if (engine.fee_bps >= BPS_DENOMINATOR) {
        throw Error(ErrorCode::InvalidConfig, "engine.fee_bps must be below 10000");
    }
    if (engine.lock_timeout_ms <= 0) {
        throw Error(ErrorCode::InvalidConfig, "engine.lock_timeout_ms must be positive");
    }
    if (engine.max_slippage_bps > pricing::MAX_SLIPPAGE_BPS) {
        throw Error(ErrorCode::InvalidConfig, "engine.max_slippage_bps must not exceed 5000");
    }
    if (engine.default_trade_limit == 0 || engine.max_trade_limit == 0 ||
        engine.default_trade_limit > engine.max_trade_limit) {
        throw Error(ErrorCode::InvalidConfig,
                    "engine trade limits must satisfy 0 < default_trade_limit <= max_trade_limit");
    }
    if (store.backend != "memory" && store.backend != "sqlite") {
        throw Error(ErrorCode::InvalidConfig, "unknown store.backend: " + store.backend);
    }
    if (store.backend == "sqlite" && store.path.empty()) {
        throw Error(ErrorCode::InvalidConfig, "store.path is required for the sqlite backend");
    }
    if (settlement.type != "null" && settlement.type != "http") {
        throw Error(ErrorCode::InvalidConfig, "unknown settlement.type: " + settlement.type);
    }
    if (settlement.type == "http" && settlement.url.empty()) {
        throw Error(ErrorCode::InvalidConfig, "settlement.url is required for http settlement");
    }
    if (settlement.timeout_ms <= 0) {
        throw Error(ErrorCode::InvalidConfig, "settlement.timeout_ms must be positive");
    }
    if (log.level != "trace" && log.level != "debug" && log.level != "info" &&
        log.level != "warn" && log.level != "error" && log.level != "critical" &&
        log.level != "off") {
        throw Error(ErrorCode::InvalidConfig, "unknown log.level: " + log.level);
    }
}

} // namespace dataswap
