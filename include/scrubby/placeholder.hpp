#pragma once

#include "detectors.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace scrubby
{

    enum class PlaceholderMode
    {
        Ephemeral, // <EMAIL> for every email
        Stable     // <EMAIL_1>, <EMAIL_2>... consistent per value within a session
    };

    /** Upper-case label used inside placeholders: EMAIL, IP, IPV6, UUID, JWT, TOKEN */
    std::string_view placeholder_label(DetectorKind kind);

    /**
     * Normalized form used as the stable key: lower-case email and UUID, IPv4
     * without leading zeros, IPv6 expanded to eight lower-case groups. JWT and
     * Token values are case-sensitive and kept verbatim.
     */
    std::string normalize_value(DetectorKind kind, std::string_view value);

    struct PlaceholderAssignment
    {
        DetectorKind kind{DetectorKind::Token};
        std::size_t index{0}; // 0 in ephemeral mode
        std::optional<std::string> stable_key;

        std::string render() const;
    };

    /**
     * Hands out placeholders for matched spans. In stable mode it keeps a
     * per-kind map from normalized value to a 1-based index assigned in order
     * of first appearance. The map lives only as long as the allocator.
     */
    class PlaceholderAllocator
    {
    public:
        explicit PlaceholderAllocator(PlaceholderMode mode = PlaceholderMode::Ephemeral);

        PlaceholderAssignment assign(const Span &span);

        PlaceholderMode mode() const { return mode_; }

        /** Distinct values seen for a kind (always 0 in ephemeral mode) */
        std::size_t distinct_values(DetectorKind kind) const;

    private:
        PlaceholderMode mode_;
        std::array<std::unordered_map<std::string, std::size_t>, kDetectorKindCount> indices_;
    };

} // namespace scrubby
