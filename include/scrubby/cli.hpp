#pragma once

#include "config.hpp"
#include "feature_gate.hpp"
#include "scrubber.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scrubby::cli
{

    enum ExitCode : int
    {
        kExitOk = 0,
        kExitUsage = 1,
        kExitReadFailure = 2,
        kExitWriteOrLocked = 3
    };

    enum class InputMode
    {
        Clipboard,
        Watch,
        Stdin,
        File
    };

    /** Parsed command line, before entitlements are applied */
    struct CliOptions
    {
        InputMode mode{InputMode::Clipboard};
        std::string file_path;
        std::optional<std::uint64_t> interval_ms;
        bool json{false};
        bool stable{false};
        std::string config_path;
        bool device_id{false};
        bool license_status{false};
        bool verbose{false};
    };

    /** What a run will actually do once the license tier is applied */
    struct RunPlan
    {
        InputMode mode{InputMode::Clipboard};
        ScrubOptions scrub;
        bool json_report{false};
        std::uint64_t interval_ms{kDefaultIntervalMs};
        std::vector<std::string> warnings;
        std::optional<std::string> refusal; // set when a locked input mode was requested
    };

    /**
     * Read --config when the license allows custom rules. A locked config is
     * never opened, so a broken file cannot fail a free-tier run.
     */
    Result<std::optional<AppConfig>> load_config(const CliOptions &options, const Entitlements &entitlements);

    /**
     * Combine command line, optional config and entitlements. Locked output
     * options fall back to the free behaviour with a warning, locked input modes
     * are refused.
     */
    RunPlan plan_run(const CliOptions &options, const std::optional<AppConfig> &config, const Entitlements &entitlements);

    int run(int argc, char *argv[]);

} // namespace scrubby::cli
