#pragma once

#include "detectors.hpp"
#include "placeholder.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace scrubby
{

    using KindCounts = std::array<std::size_t, kDetectorKindCount>;

    struct RedactionResult
    {
        std::string text;
        KindCounts counts{};
        std::vector<Span> spans_replaced;

        std::size_t count(DetectorKind kind) const { return counts[kind_index(kind)]; }
        std::size_t total() const;
    };

    /**
     * Replaces resolved spans with placeholders in one forward pass. Spans must
     * be sorted and non-overlapping (the output of DetectorRegistry::detect);
     * a span that starts before the previous one ended, or runs past the
     * input, is skipped.
     */
    class Redactor
    {
    public:
        static RedactionResult redact(std::string_view input,
                                      const std::vector<Span> &spans,
                                      PlaceholderAllocator &allocator);
    };

} // namespace scrubby
