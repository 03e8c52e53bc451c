#include "scrubby/placeholder.hpp"
#include <format>

namespace scrubby
{

    namespace
    {
        std::string lower_ascii(std::string_view s)
        {
            std::string out(s);
            for (auto &ch : out)
            {
                if (ch >= 'A' && ch <= 'Z')
                    ch = static_cast<char>(ch - 'A' + 'a');
            }
            return out;
        }
    }

    std::string_view placeholder_label(DetectorKind kind)
    {
        switch (kind)
        {
        case DetectorKind::Email:
            return "EMAIL";
        case DetectorKind::IPv4:
            return "IP";
        case DetectorKind::IPv6:
            return "IPV6";
        case DetectorKind::UUID:
            return "UUID";
        case DetectorKind::JWT:
            return "JWT";
        case DetectorKind::Token:
            return "TOKEN";
        }
        return "REDACTED";
    }

    std::string normalize_value(DetectorKind kind, std::string_view value)
    {
        switch (kind)
        {
        case DetectorKind::Email:
        case DetectorKind::UUID:
            return lower_ascii(value);

        case DetectorKind::IPv4:
            if (auto octets = detectors::parse_ipv4(value))
                return std::format("{}.{}.{}.{}", (*octets)[0], (*octets)[1], (*octets)[2], (*octets)[3]);
            return std::string(value);

        case DetectorKind::IPv6:
            if (auto groups = detectors::parse_ipv6(value))
            {
                std::string out;
                for (std::size_t i = 0; i < groups->size(); ++i)
                {
                    if (i > 0)
                        out += ':';
                    out += std::format("{:x}", (*groups)[i]);
                }
                return out;
            }
            return lower_ascii(value);

        case DetectorKind::JWT:
        case DetectorKind::Token:
            break;
        }
        return std::string(value);
    }

    std::string PlaceholderAssignment::render() const
    {
        if (index == 0)
            return std::format("<{}>", placeholder_label(kind));
        return std::format("<{}_{}>", placeholder_label(kind), index);
    }

    PlaceholderAllocator::PlaceholderAllocator(PlaceholderMode mode) : mode_(mode) {}

    PlaceholderAssignment PlaceholderAllocator::assign(const Span &span)
    {
        if (mode_ == PlaceholderMode::Ephemeral)
            return PlaceholderAssignment{span.kind, 0, std::nullopt};

        auto key = normalize_value(span.kind, span.text);
        auto &indices = indices_[kind_index(span.kind)];
        auto it = indices.try_emplace(key, indices.size() + 1).first;
        return PlaceholderAssignment{span.kind, it->second, std::move(key)};
    }

    std::size_t PlaceholderAllocator::distinct_values(DetectorKind kind) const
    {
        return indices_[kind_index(kind)].size();
    }

} // namespace scrubby
