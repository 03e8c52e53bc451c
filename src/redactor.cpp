#include "scrubby/redactor.hpp"
#include <numeric>

namespace scrubby
{

    std::size_t RedactionResult::total() const
    {
        return std::accumulate(counts.begin(), counts.end(), std::size_t{0});
    }

    RedactionResult Redactor::redact(std::string_view input,
                                     const std::vector<Span> &spans,
                                     PlaceholderAllocator &allocator)
    {
        RedactionResult result;
        result.text.reserve(input.size());

        std::size_t cursor = 0;
        for (const auto &span : spans)
        {
            if (span.start < cursor || span.end > input.size() || span.start >= span.end)
                continue;

            result.text.append(input.substr(cursor, span.start - cursor));
            result.text += allocator.assign(span).render();
            ++result.counts[kind_index(span.kind)];
            result.spans_replaced.push_back(span);
            cursor = span.end;
        }
        result.text.append(input.substr(cursor));
        return result;
    }

} // namespace scrubby
