#ifndef CPSWAP_CONFIG_HPP
#define CPSWAP_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "policy.hpp"
#include "pool_math.hpp"

namespace cpswap {

// =============================================================================
// Engine Configuration
//
// File formats:
//   *.json  {"policy": {"issuance": "naive", ...}, "log_level": "debug", ...}
//   other   [general] / [policy] sections with `key = value` lines
// =============================================================================

struct EngineConfig {
    PolicyConfig policy;
    uint64_t bootstrap_lp_amount = pool_math::DEFAULT_BOOTSTRAP_LP;
    uint64_t precision_scale = pool_math::DEFAULT_PRECISION_SCALE;
    std::string log_level = "info";

    // Throws std::runtime_error if the file cannot be read,
    // std::invalid_argument on unknown names or malformed values
    static EngineConfig from_file(std::string_view path);
    static EngineConfig from_toml(std::string_view content);
    static EngineConfig from_json(const nlohmann::json& j);
    static EngineConfig from_json_string(std::string_view content);

    nlohmann::json to_json() const;

    // Sets the process-wide log filter; the engine never touches it
    void apply_log_level() const;

    // Builder methods
    EngineConfig& with_policy(const PolicyConfig& p) {
        policy = p;
        return *this;
    }

    EngineConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    EngineConfig& with_bootstrap_lp_amount(uint64_t amount) {
        bootstrap_lp_amount = amount;
        return *this;
    }

    EngineConfig& with_precision_scale(uint64_t scale) {
        precision_scale = scale;
        return *this;
    }
};

} // namespace cpswap

#endif // CPSWAP_CONFIG_HPP
