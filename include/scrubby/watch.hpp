#pragma once

#include "clipboard.hpp"
#include "scrubber.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace scrubby
{

    struct WatchOptions
    {
        std::chrono::milliseconds interval{750};
        std::optional<std::size_t> max_iterations; // unbounded when absent
    };

    enum class WatchStep
    {
        Unchanged,   // same text as the previous poll or our own last write
        Clean,       // nothing to redact
        Written,     // redacted text written back
        StaleWrite,  // clipboard changed while scrubbing, write discarded
        ReadFailed,
        WriteFailed
    };

    std::string_view step_name(WatchStep step);

    /**
     * Experimental polling loop. Each iteration holds no state across polls
     * other than the last text seen and the last text written. A write is
     * only issued when the clipboard still holds the text that was scrubbed.
     */
    class WatchLoop
    {
    public:
        using ReportFn = std::function<void(const ScrubResult &)>;

        WatchLoop(Clipboard &clipboard, ScrubOptions scrub_options, WatchOptions options, ReportFn report = {});

        /** One poll; exposed for tests */
        WatchStep poll_once();

        /** Poll until stop is set or max_iterations is reached; returns iterations run */
        std::size_t run(const std::atomic<bool> &stop);

    private:
        void sleep_interruptible(const std::atomic<bool> &stop) const;

        Clipboard &clipboard_;
        Scrubber scrubber_;
        WatchOptions options_;
        ReportFn report_;
        std::optional<std::string> last_seen_;
        std::optional<std::string> last_written_;
    };

} // namespace scrubby
