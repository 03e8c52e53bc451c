#include "scrubby/config.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>

namespace scrubby
{
    namespace
    {
        constexpr std::array<std::string_view, 4> kTopLevelKeys = {
            "stable_placeholders", "json_report", "interval_ms", "detectors"};

        constexpr std::array<std::string_view, 4> kDetectorKeys = {
            "enabled", "token_min_length", "token_entropy_threshold", "allow_list"};

        template <std::size_t N>
        bool is_known(const std::array<std::string_view, N> &keys, std::string_view key)
        {
            return std::find(keys.begin(), keys.end(), key) != keys.end();
        }

        Result<std::uint64_t> checked_interval(std::int64_t value)
        {
            if (value < static_cast<std::int64_t>(kMinIntervalMs))
            {
                return std::unexpected(ScrubbyError::config(
                    std::format("interval_ms must be >= {} (got {})", kMinIntervalMs, value)));
            }
            return static_cast<std::uint64_t>(value);
        }

        Result<void> parse_detectors(const toml::table &tbl, DetectorConfig &cfg)
        {
            for (auto &&[key, value] : tbl)
            {
                if (!is_known(kDetectorKeys, key.str()))
                    return std::unexpected(ScrubbyError::config(std::format("Unknown config key 'detectors.{}'", key.str())));
            }

            if (auto node = tbl["enabled"])
            {
                auto arr = node.as_array();
                if (!arr)
                    return std::unexpected(ScrubbyError::config("detectors.enabled must be an array of strings"));
                cfg.enabled.fill(false);
                for (const auto &elem : *arr)
                {
                    auto name = elem.value<std::string>();
                    if (!name)
                        return std::unexpected(ScrubbyError::config("detectors.enabled must be an array of strings"));
                    auto kind = kind_from_name(*name);
                    if (!kind)
                        return std::unexpected(ScrubbyError::config(std::format("Unknown detector '{}'", *name)));
                    cfg.enabled[kind_index(*kind)] = true;
                }
            }

            if (auto node = tbl["token_min_length"])
            {
                auto len = node.value<std::int64_t>();
                if (!len || *len < 8)
                    return std::unexpected(ScrubbyError::config("detectors.token_min_length must be an integer >= 8"));
                cfg.token.min_length = static_cast<std::size_t>(*len);
            }

            if (auto node = tbl["token_entropy_threshold"])
            {
                auto threshold = node.value<double>();
                if (!threshold || *threshold <= 0.0 || *threshold > 8.0)
                    return std::unexpected(ScrubbyError::config("detectors.token_entropy_threshold must be a number in (0, 8]"));
                cfg.token.entropy_threshold = *threshold;
            }

            if (auto node = tbl["allow_list"])
            {
                auto arr = node.as_array();
                if (!arr)
                    return std::unexpected(ScrubbyError::config("detectors.allow_list must be an array of strings"));
                for (const auto &elem : *arr)
                {
                    auto word = elem.value<std::string>();
                    if (!word)
                        return std::unexpected(ScrubbyError::config("detectors.allow_list must be an array of strings"));
                    cfg.token.allow_list.push_back(*word);
                }
            }
            return {};
        }

        Result<void> parse_toml(const toml::table &tbl, AppConfig &cfg)
        {
            for (auto &&[key, value] : tbl)
            {
                if (!is_known(kTopLevelKeys, key.str()))
                    return std::unexpected(ScrubbyError::config(std::format("Unknown config key '{}'", key.str())));
            }

            if (auto node = tbl["stable_placeholders"])
            {
                auto v = node.value<bool>();
                if (!v)
                    return std::unexpected(ScrubbyError::config("stable_placeholders must be a boolean"));
                cfg.stable_placeholders = *v;
            }

            if (auto node = tbl["json_report"])
            {
                auto v = node.value<bool>();
                if (!v)
                    return std::unexpected(ScrubbyError::config("json_report must be a boolean"));
                cfg.json_report = *v;
            }

            if (auto node = tbl["interval_ms"])
            {
                auto v = node.value<std::int64_t>();
                if (!v)
                    return std::unexpected(ScrubbyError::config("interval_ms must be an integer"));
                auto interval = checked_interval(*v);
                if (!interval)
                    return std::unexpected(interval.error());
                cfg.interval_ms = *interval;
            }

            if (auto node = tbl["detectors"])
            {
                auto detectors = node.as_table();
                if (!detectors)
                    return std::unexpected(ScrubbyError::config("[detectors] must be a table"));
                auto res = parse_detectors(*detectors, cfg.detectors);
                if (!res)
                    return res;
                cfg.has_rule_overrides = true;
            }
            return {};
        }

    } // namespace

    Result<AppConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ScrubbyError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        spdlog::debug("loading config from {}", path);
        return from_string(buffer.str());
    }

    Result<AppConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AppConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto res = parse_toml(tbl, cfg);
            if (!res)
                return std::unexpected(res.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ScrubbyError::config(std::format("Failed to parse TOML: {}", e.description())));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<bool> ConfigLoader::parse_bool(const std::string &value)
    {
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true" || v == "1" || v == "yes")
            return true;
        if (v == "false" || v == "0" || v == "no")
            return false;
        return std::unexpected(ScrubbyError::config(std::format("Invalid boolean '{}'", value)));
    }

    Result<void> ConfigLoader::apply_env_overrides(AppConfig &cfg)
    {
        if (const char *stable = std::getenv("SCRUBBY_STABLE_PLACEHOLDERS"))
        {
            auto v = parse_bool(stable);
            if (!v)
                return std::unexpected(v.error());
            cfg.stable_placeholders = *v;
        }
        if (const char *json = std::getenv("SCRUBBY_JSON_REPORT"))
        {
            auto v = parse_bool(json);
            if (!v)
                return std::unexpected(v.error());
            cfg.json_report = *v;
        }
        if (const char *interval = std::getenv("SCRUBBY_INTERVAL_MS"))
        {
            std::string_view text(interval);
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size())
                return std::unexpected(ScrubbyError::config(std::format("Invalid SCRUBBY_INTERVAL_MS '{}'", text)));
            auto checked = checked_interval(value);
            if (!checked)
                return std::unexpected(checked.error());
            cfg.interval_ms = *checked;
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AppConfig &cfg)
    {
        nlohmann::json j;
        j["stable_placeholders"] = cfg.stable_placeholders.value_or(false);
        j["json_report"] = cfg.json_report.value_or(false);
        j["interval_ms"] = cfg.interval_ms.value_or(kDefaultIntervalMs);

        nlohmann::json enabled = nlohmann::json::array();
        for (auto kind : kDetectorPriority)
        {
            if (cfg.detectors.is_enabled(kind))
                enabled.push_back(std::string(kind_name(kind)));
        }
        j["detectors"] = {
            {"enabled", enabled},
            {"token_min_length", cfg.detectors.token.min_length},
            {"token_entropy_threshold", cfg.detectors.token.entropy_threshold},
            {"allow_list_size", cfg.detectors.token.allow_list.size()}};
        j["has_rule_overrides"] = cfg.has_rule_overrides;
        return j;
    }

} // namespace scrubby
