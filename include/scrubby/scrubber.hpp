#pragma once

#include "detectors.hpp"
#include "placeholder.hpp"
#include "redactor.hpp"
#include "report.hpp"
#include <string_view>

namespace scrubby
{

    struct ScrubOptions
    {
        PlaceholderMode placeholders{PlaceholderMode::Ephemeral};
        DetectorConfig detectors{DetectorConfig::defaults()};
    };

    struct ScrubResult
    {
        RedactionResult redaction;
        Summary summary;

        const std::string &text() const { return redaction.text; }
    };

    /**
     * Detection, placeholder allocation and redaction for one text buffer.
     * Each call gets a fresh allocator, so stable indices never leak between
     * calls.
     */
    class Scrubber
    {
    public:
        Scrubber();
        explicit Scrubber(ScrubOptions options);

        ScrubResult scrub(std::string_view input) const;

        const ScrubOptions &options() const { return options_; }

    private:
        ScrubOptions options_;
        DetectorRegistry registry_;
    };

} // namespace scrubby
