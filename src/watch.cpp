#include "scrubby/watch.hpp"
#include <algorithm>
#include <thread>
#include <spdlog/spdlog.h>

namespace scrubby
{

    namespace
    {
        constexpr std::chrono::milliseconds kSleepSlice{50};
    }

    std::string_view step_name(WatchStep step)
    {
        switch (step)
        {
        case WatchStep::Unchanged:
            return "unchanged";
        case WatchStep::Clean:
            return "clean";
        case WatchStep::Written:
            return "written";
        case WatchStep::StaleWrite:
            return "stale-write";
        case WatchStep::ReadFailed:
            return "read-failed";
        case WatchStep::WriteFailed:
            return "write-failed";
        }
        return "unknown";
    }

    WatchLoop::WatchLoop(Clipboard &clipboard, ScrubOptions scrub_options, WatchOptions options, ReportFn report)
        : clipboard_(clipboard),
          scrubber_(std::move(scrub_options)),
          options_(options),
          report_(std::move(report))
    {
    }

    WatchStep WatchLoop::poll_once()
    {
        auto current = clipboard_.read();
        if (!current)
        {
            spdlog::warn("watch: {}", current.error().what());
            return WatchStep::ReadFailed;
        }

        if ((last_seen_ && *last_seen_ == *current) || (last_written_ && *last_written_ == *current))
            return WatchStep::Unchanged;
        last_seen_ = *current;

        auto result = scrubber_.scrub(*current);
        if (result.redaction.spans_replaced.empty())
            return WatchStep::Clean;

        auto again = clipboard_.read();
        if (!again)
        {
            spdlog::warn("watch: {}", again.error().what());
            return WatchStep::ReadFailed;
        }
        if (*again != *current)
        {
            spdlog::debug("watch: clipboard changed during scrub, discarding write");
            return WatchStep::StaleWrite;
        }

        if (auto written = clipboard_.write(result.text()); !written)
        {
            spdlog::warn("watch: {}", written.error().what());
            last_seen_.reset(); // retry on the next poll
            return WatchStep::WriteFailed;
        }

        last_written_ = result.text();
        last_seen_ = result.text();
        spdlog::debug("watch: replaced {} spans", result.redaction.spans_replaced.size());
        if (report_)
            report_(result);
        return WatchStep::Written;
    }

    std::size_t WatchLoop::run(const std::atomic<bool> &stop)
    {
        std::size_t iterations = 0;
        while (!stop.load())
        {
            if (options_.max_iterations && iterations >= *options_.max_iterations)
                break;
            poll_once();
            ++iterations;
            sleep_interruptible(stop);
        }
        spdlog::debug("watch: stopped after {} iterations", iterations);
        return iterations;
    }

    void WatchLoop::sleep_interruptible(const std::atomic<bool> &stop) const
    {
        auto remaining = options_.interval;
        while (remaining.count() > 0 && !stop.load())
        {
            auto slice = std::min(remaining, kSleepSlice);
            std::this_thread::sleep_for(slice);
            remaining -= slice;
        }
    }

} // namespace scrubby
