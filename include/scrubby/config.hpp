#pragma once

#include "types.hpp"
#include "detectors.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace scrubby
{

    inline constexpr std::uint64_t kDefaultIntervalMs = 750;
    inline constexpr std::uint64_t kMinIntervalMs = 100;

    struct AppConfig
    {
        std::optional<bool> stable_placeholders;
        std::optional<bool> json_report;
        std::optional<std::uint64_t> interval_ms;
        DetectorConfig detectors{DetectorConfig::defaults()};
        bool has_rule_overrides{false}; // a [detectors] table was present
    };

    /**
     * ConfigLoader loads the TOML config file and applies environment
     * overrides (SCRUBBY_STABLE_PLACEHOLDERS, SCRUBBY_JSON_REPORT,
     * SCRUBBY_INTERVAL_MS). Unknown keys and out-of-range values are errors.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AppConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AppConfig> from_string(const std::string &toml_content);

        /** Serialize the effective config for --verbose diagnostics */
        static nlohmann::json to_json(const AppConfig &cfg);

        /** Accepts true/false, 1/0, yes/no (case-insensitive) */
        static Result<bool> parse_bool(const std::string &value);

    private:
        static Result<void> apply_env_overrides(AppConfig &cfg);
    };

} // namespace scrubby
