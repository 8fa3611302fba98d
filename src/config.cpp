// =============================================================================
// config.cpp - EngineConfig loading (JSON and TOML-lite)
// =============================================================================

#include "cpswap/config.hpp"
#include "cpswap/log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpswap {

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

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

uint64_t parse_u64(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789_") != std::string::npos) {
        throw std::invalid_argument("Invalid integer for " + key + ": " + value);
    }
    uint64_t out = 0;
    for (char c : value) {
        if (c == '_') continue;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (out > (U64_MAX - digit) / 10) {
            throw std::invalid_argument("Integer out of range for " + key + ": " + value);
        }
        out = out * 10 + digit;
    }
    return out;
}

// nlohmann converts negative and fractional numbers to uint64_t silently
uint64_t json_u64(const nlohmann::json& j, const char* key, uint64_t fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw std::invalid_argument(std::string("Expected a non-negative integer for ") + key + ": " +
                                    v.dump());
    }
    return v.get<uint64_t>();
}

template <typename T>
T require(std::optional<T> parsed, const std::string& key, const std::string& value) {
    if (!parsed) {
        throw std::invalid_argument("Unknown value for " + key + ": " + value);
    }
    return *parsed;
}

void apply_policy_key(PolicyConfig& policy, const std::string& key, const std::string& value) {
    if (key == "preset") {
        if (value == "naive") policy = PolicyConfig::naive();
        else if (value == "hardened") policy = PolicyConfig::hardened();
        else throw std::invalid_argument("Unknown policy preset: " + value);
    }
    else if (key == "issuance") policy.issuance = require(parse_issuance_policy(value), key, value);
    else if (key == "fee_routing") policy.fee_routing = require(parse_fee_routing(value), key, value);
    else if (key == "burn_authority") policy.burn_authority = require(parse_burn_authority(value), key, value);
    else if (key == "swap_math") policy.swap_math = require(parse_swap_math(value), key, value);
    else log::warn("Ignoring unknown policy key: " + key);
}

void validate(const EngineConfig& config) {
    if (!log::parse_level(config.log_level)) {
        throw std::invalid_argument("Unknown log level: " + config.log_level);
    }
    if (config.precision_scale == 0) {
        throw std::invalid_argument("precision_scale must be positive");
    }
    if (config.bootstrap_lp_amount == 0) {
        throw std::invalid_argument("bootstrap_lp_amount must be positive");
    }
}

}  // namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (ends_with(path, ".json")) {
        return from_json_string(buffer.str());
    }
    return from_toml(buffer.str());
}

EngineConfig EngineConfig::from_toml(std::string_view content) {
    EngineConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw std::invalid_argument("Malformed section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") config.log_level = value;
            else if (key == "bootstrap_lp_amount") config.bootstrap_lp_amount = parse_u64(key, value);
            else if (key == "precision_scale") config.precision_scale = parse_u64(key, value);
            else log::warn("Ignoring unknown general key: " + key);
        }
        else if (current_section == "policy") {
            apply_policy_key(config.policy, key, value);
        }
        else {
            log::warn("Ignoring key outside known sections: " + key);
        }
    }

    validate(config);
    return config;
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    EngineConfig config;
    try {
        config.log_level = j.value("log_level", config.log_level);
        config.bootstrap_lp_amount = json_u64(j, "bootstrap_lp_amount", config.bootstrap_lp_amount);
        config.precision_scale = json_u64(j, "precision_scale", config.precision_scale);

        if (j.contains("policy")) {
            const auto& p = j.at("policy");
            // Preset first so individual keys override it
            if (p.contains("preset")) {
                apply_policy_key(config.policy, "preset", p.at("preset").get<std::string>());
            }
            for (const char* key : {"issuance", "fee_routing", "burn_authority", "swap_math"}) {
                if (p.contains(key)) {
                    apply_policy_key(config.policy, key, p.at(key).get<std::string>());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed config: ") + e.what());
    }

    validate(config);
    return config;
}

void EngineConfig::apply_log_level() const {
    auto level = log::parse_level(log_level);
    if (!level) {
        throw std::invalid_argument("Unknown log level: " + log_level);
    }
    log::set_level(*level);
}

EngineConfig EngineConfig::from_json_string(std::string_view content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content.begin(), content.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Config is not valid JSON: ") + e.what());
    }
    return from_json(j);
}

nlohmann::json EngineConfig::to_json() const {
    return nlohmann::json{
        {"log_level", log_level},
        {"bootstrap_lp_amount", bootstrap_lp_amount},
        {"precision_scale", precision_scale},
        {"policy", {
            {"issuance", to_string(policy.issuance)},
            {"fee_routing", to_string(policy.fee_routing)},
            {"burn_authority", to_string(policy.burn_authority)},
            {"swap_math", to_string(policy.swap_math)},
        }},
    };
}

}  // namespace cpswap
