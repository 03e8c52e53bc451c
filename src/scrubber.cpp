#include "scrubby/scrubber.hpp"
#include <spdlog/spdlog.h>

namespace scrubby
{

    Scrubber::Scrubber() : Scrubber(ScrubOptions{}) {}

    Scrubber::Scrubber(ScrubOptions options)
        : options_(std::move(options)), registry_(options_.detectors) {}

    ScrubResult Scrubber::scrub(std::string_view input) const
    {
        auto spans = registry_.detect(input);
        PlaceholderAllocator allocator(options_.placeholders);

        ScrubResult result;
        result.redaction = Redactor::redact(input, spans, allocator);
        result.summary = Summary::from_counts(result.redaction.counts);

        spdlog::debug("scrubbed {} bytes: {} replacements ({} emails, {} ips, {} uuids, {} jwts, {} tokens)",
                      input.size(), result.summary.total(), result.summary.emails, result.summary.ips,
                      result.summary.uuids, result.summary.jwts, result.summary.tokens);
        return result;
    }

} // namespace scrubby
