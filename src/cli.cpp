#include "scrubby/cli.hpp"
#include "scrubby/clipboard.hpp"
#include "scrubby/device_id.hpp"
#include "scrubby/license_validator.hpp"
#include "scrubby/logging.hpp"
#include "scrubby/report.hpp"
#include "scrubby/watch.hpp"
#include <atomic>
#include <csignal>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace scrubby::cli
{

	namespace
	{
		std::atomic<bool> g_stop{false};

		void handle_stop_signal(int)
		{
			g_stop.store(true);
		}

		std::string locked_warning(std::string_view option, const Entitlements &ent)
		{
			return std::format("{} requires a paid license ({}); continuing with the free behaviour", option, ent.reason);
		}

		Result<std::string> read_input(const RunPlan &plan, const std::string &file_path)
		{
			if (plan.mode == InputMode::Stdin)
			{
				std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
				if (std::cin.bad())
					return std::unexpected(ScrubbyError::io("Failed to read standard input"));
				return text;
			}

			std::ifstream file(file_path, std::ios::binary);
			if (!file.is_open())
				return std::unexpected(ScrubbyError::io("Unable to open input file: " + file_path));
			std::stringstream buffer;
			buffer << file.rdbuf();
			if (file.bad())
				return std::unexpected(ScrubbyError::io("Failed to read input file: " + file_path));
			return buffer.str();
		}

		void print_report(std::ostream &out, const ScrubResult &result, bool json_report)
		{
			if (json_report)
				out << summary_to_json(result.summary).dump() << std::endl;
			else
				out << format_summary(result.summary) << std::endl;
		}

		int print_license_status(const Entitlements &ent, const std::string &device_id)
		{
			std::cout << "License: " << state_name(ent.state);
			if (ent.failure)
				std::cout << " (" << failure_name(*ent.failure) << ")";
			std::cout << "\n";
			if (ent.licensee)
				std::cout << "Licensee: " << *ent.licensee << "\n";
			std::cout << "Reason: " << ent.reason << "\n";
			std::cout << "Device: " << device_id << "\n";
			std::cout << "Features:";
			for (const auto &name : ent.features.names())
				std::cout << " " << name;
			std::cout << std::endl;
			return kExitOk;
		}

		int run_stream(const RunPlan &plan, const std::string &file_path)
		{
			auto input = read_input(plan, file_path);
			if (!input)
			{
				std::cerr << input.error().what() << std::endl;
				return kExitReadFailure;
			}

			Scrubber scrubber(plan.scrub);
			auto result = scrubber.scrub(*input);
			std::cout << result.text();
			std::cout.flush();
			print_report(std::cerr, result, plan.json_report);
			return kExitOk;
		}

		int run_clipboard(const RunPlan &plan)
		{
			auto clipboard = CommandClipboard::detect();
			if (!clipboard)
			{
				std::cerr << clipboard.error().what() << std::endl;
				return kExitReadFailure;
			}

			auto text = (*clipboard)->read();
			if (!text)
			{
				std::cerr << text.error().what() << std::endl;
				return kExitReadFailure;
			}

			Scrubber scrubber(plan.scrub);
			auto result = scrubber.scrub(*text);
			if (!result.redaction.spans_replaced.empty())
			{
				if (auto written = (*clipboard)->write(result.text()); !written)
				{
					std::cerr << written.error().what() << std::endl;
					return kExitWriteOrLocked;
				}
			}
			print_report(std::cout, result, plan.json_report);
			return kExitOk;
		}

		int run_watch(const RunPlan &plan)
		{
			auto clipboard = CommandClipboard::detect();
			if (!clipboard)
			{
				std::cerr << clipboard.error().what() << std::endl;
				return kExitReadFailure;
			}

			g_stop.store(false);
			std::signal(SIGINT, handle_stop_signal);
			std::signal(SIGTERM, handle_stop_signal);

			WatchOptions options;
			options.interval = std::chrono::milliseconds(plan.interval_ms);
			bool json_report = plan.json_report;
			WatchLoop loop(**clipboard, plan.scrub, options,
						   [json_report](const ScrubResult &result)
						   { print_report(std::cout, result, json_report); });

			std::cerr << "Watching clipboard every " << plan.interval_ms << " ms (Ctrl+C to stop)" << std::endl;
			loop.run(g_stop);
			return kExitOk;
		}
	}

	Result<std::optional<AppConfig>> load_config(const CliOptions &options, const Entitlements &ent)
	{
		if (options.config_path.empty() || !FeatureGate::require(ent, Feature::CustomRules))
			return std::optional<AppConfig>{};

		auto loaded = ConfigLoader::load(options.config_path);
		if (!loaded)
			return std::unexpected(loaded.error());
		spdlog::debug("config: {}", ConfigLoader::to_json(*loaded).dump());
		return std::optional<AppConfig>{std::move(*loaded)};
	}

	RunPlan plan_run(const CliOptions &options, const std::optional<AppConfig> &config, const Entitlements &ent)
	{
		RunPlan plan;
		plan.mode = options.mode;

		bool want_stable = options.stable;
		bool want_json = options.json;
		if (config || !options.config_path.empty())
		{
			if (!FeatureGate::require(ent, Feature::CustomRules))
			{
				plan.warnings.push_back(locked_warning("--config", ent));
			}
			else if (config)
			{
				want_stable = want_stable || config->stable_placeholders.value_or(false);
				want_json = want_json || config->json_report.value_or(false);
				if (config->interval_ms)
					plan.interval_ms = *config->interval_ms;
				plan.scrub.detectors = config->detectors;
			}
		}
		if (options.interval_ms)
			plan.interval_ms = *options.interval_ms;

		if (want_stable)
		{
			if (FeatureGate::require(ent, Feature::StablePlaceholders))
				plan.scrub.placeholders = PlaceholderMode::Stable;
			else
				plan.warnings.push_back(locked_warning("--stable", ent));
		}

		if (want_json)
		{
			if (FeatureGate::require(ent, Feature::JsonReport))
				plan.json_report = true;
			else
				plan.warnings.push_back(locked_warning("--json", ent));
		}

		if (plan.mode == InputMode::Stdin || plan.mode == InputMode::File)
		{
			if (auto allowed = FeatureGate::require(ent, Feature::FileStdinInput); !allowed)
				plan.refusal = allowed.error().what();
		}

		return plan;
	}

	int run(int argc, char *argv[])
	{
		CLI::App app{"Scrubby - offline clipboard sanitizer"};

		CliOptions options;
		bool clipboard_flag = false;
		bool watch_flag = false;
		bool stdin_flag = false;
		std::uint64_t interval_ms = 0;

		auto clip_opt = app.add_flag("--clipboard", clipboard_flag, "Sanitize the clipboard once (default)");
		auto watch_opt = app.add_flag("--watch", watch_flag, "Keep sanitizing the clipboard as it changes (experimental)");
		auto interval_opt = app.add_option("--interval-ms", interval_ms, "Watch polling interval in milliseconds")
								->check(CLI::Range(kMinIntervalMs, std::numeric_limits<std::uint64_t>::max()));
		auto stdin_opt = app.add_flag("--stdin", stdin_flag, "Sanitize standard input to standard output");
		auto file_opt = app.add_option("--file", options.file_path, "Sanitize a file to standard output");
		app.add_flag("--json", options.json, "Emit the report as JSON");
		app.add_flag("--stable", options.stable, "Numbered placeholders that repeat for repeated values");
		app.add_option("--config", options.config_path, "Path to config TOML");
		app.add_flag("--device-id", options.device_id, "Print this machine's device id and exit");
		app.add_flag("--license-status", options.license_status, "Print the license state and exit");
		app.add_flag("--verbose", options.verbose, "Debug logging on stderr");

		clip_opt->excludes(watch_opt)->excludes(stdin_opt)->excludes(file_opt);
		watch_opt->excludes(stdin_opt)->excludes(file_opt);
		stdin_opt->excludes(file_opt);
		interval_opt->needs(watch_opt);

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::ParseError &e)
		{
			return app.exit(e) == 0 ? kExitOk : kExitUsage;
		}

		if (watch_flag)
			options.mode = InputMode::Watch;
		else if (stdin_flag)
			options.mode = InputMode::Stdin;
		else if (!options.file_path.empty())
			options.mode = InputMode::File;
		if (*interval_opt)
			options.interval_ms = interval_ms;

		logging::init(options.verbose);

		auto device_id = current_device_id();
		if (options.device_id)
		{
			std::cout << device_id << std::endl;
			return kExitOk;
		}

		LicenseValidator validator(TrustAnchor::embedded(), device_id);
		auto entitlements = FeatureGate::evaluate(validator.check());
		spdlog::debug("license state: {} ({})", state_name(entitlements.state), entitlements.reason);

		if (options.license_status)
			return print_license_status(entitlements, device_id);

		auto config = load_config(options, entitlements);
		if (!config)
		{
			std::cerr << config.error().what() << std::endl;
			return kExitUsage;
		}

		auto plan = plan_run(options, *config, entitlements);
		for (const auto &warning : plan.warnings)
			spdlog::warn("{}", warning);
		if (plan.refusal)
		{
			std::cerr << *plan.refusal << std::endl;
			return kExitWriteOrLocked;
		}

		switch (plan.mode)
		{
		case InputMode::Stdin:
		case InputMode::File:
			return run_stream(plan, options.file_path);
		case InputMode::Watch:
			return run_watch(plan);
		case InputMode::Clipboard:
			break;
		}
		return run_clipboard(plan);
	}

} // namespace scrubby::cli
