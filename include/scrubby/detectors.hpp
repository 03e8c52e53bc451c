#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace scrubby
{

    /**
     * Closed set of detector kinds. Declaration order is the fixed priority
     * order used as the last tie-break during overlap resolution.
     */
    enum class DetectorKind : std::uint8_t
    {
        Email = 0,
        IPv4 = 1,
        IPv6 = 2,
        UUID = 3,
        JWT = 4,
        Token = 5
    };

    inline constexpr std::size_t kDetectorKindCount = 6;

    inline constexpr std::array<DetectorKind, kDetectorKindCount> kDetectorPriority = {
        DetectorKind::Email,
        DetectorKind::IPv4,
        DetectorKind::IPv6,
        DetectorKind::UUID,
        DetectorKind::JWT,
        DetectorKind::Token};

    constexpr std::size_t kind_index(DetectorKind kind)
    {
        return static_cast<std::size_t>(kind);
    }

    /** Structural kinds take precedence over the Token heuristic */
    constexpr bool is_structural(DetectorKind kind)
    {
        return kind != DetectorKind::Token;
    }

    /** Lower-case config name: "email", "ipv4", "ipv6", "uuid", "jwt", "token" */
    std::string_view kind_name(DetectorKind kind);

    std::optional<DetectorKind> kind_from_name(std::string_view name);

    /**
     * A match over the input, in byte offsets. `end` is exclusive.
     */
    struct Span
    {
        std::size_t start{0};
        std::size_t end{0};
        std::string text;
        DetectorKind kind{DetectorKind::Token};

        std::size_t length() const { return end - start; }

        bool overlaps(const Span &other) const
        {
            return start < other.end && other.start < end;
        }

        bool operator==(const Span &) const = default;
    };

    /**
     * Parameters of the high-entropy Token heuristic.
     *
     * Defaults: runs of at least 32 characters from [A-Za-z0-9_-] whose Shannon
     * entropy is at least 3.5 bits per character. A run equal to an allow-list
     * entry (case-insensitive), or made up solely of allow-list words joined by
     * '_', '-' or camelCase humps, is never a Token.
     */
    struct TokenHeuristic
    {
        std::size_t min_length{32};
        double entropy_threshold{3.5};
        std::vector<std::string> allow_list;

        static TokenHeuristic defaults();
        static const std::vector<std::string> &default_allow_list();
    };

    struct DetectorConfig
    {
        std::array<bool, kDetectorKindCount> enabled{true, true, true, true, true, true};
        TokenHeuristic token{TokenHeuristic::defaults()};

        static DetectorConfig defaults();

        bool is_enabled(DetectorKind kind) const { return enabled[kind_index(kind)]; }
    };

    /** Shannon entropy in bits per byte over the byte distribution of `s` */
    double shannon_entropy(std::string_view s) noexcept;

    namespace detectors
    {
        std::vector<Span> match_email(std::string_view text) noexcept;
        std::vector<Span> match_ipv4(std::string_view text) noexcept;
        std::vector<Span> match_ipv6(std::string_view text) noexcept;
        std::vector<Span> match_uuid(std::string_view text) noexcept;
        std::vector<Span> match_jwt(std::string_view text) noexcept;

        /**
         * High-entropy runs. `allow_list` must hold lower-case words. Parts of
         * a run covered by `claimed` are skipped and the rest of the run is
         * tested on its own. Placeholder bodies such as `<TOKEN_3>` never match.
         */
        std::vector<Span> match_token(
            std::string_view text,
            const TokenHeuristic &heuristic,
            const std::unordered_set<std::string> &allow_list,
            const std::vector<Span> &claimed) noexcept;

        /** Parse IPv6 text form into eight 16-bit groups */
        std::optional<std::array<std::uint16_t, 8>> parse_ipv6(std::string_view text) noexcept;

        /** Parse dotted-quad IPv4 (1-3 digits per octet, each <= 255) */
        std::optional<std::array<std::uint8_t, 4>> parse_ipv4(std::string_view text) noexcept;
    } // namespace detectors

    /**
     * Resolve overlapping candidates: structural beats Token, then the longer
     * span, then the earlier start, then kind priority. The result is
     * non-overlapping and sorted by start offset.
     */
    std::vector<Span> resolve_overlaps(std::vector<Span> candidates) noexcept;

    /**
     * Runs the enabled detectors in priority order and resolves overlaps.
     */
    class DetectorRegistry
    {
    public:
        DetectorRegistry();
        explicit DetectorRegistry(DetectorConfig config);

        /** Every candidate from every enabled detector, unresolved */
        std::vector<Span> candidates(std::string_view text) const noexcept;

        /** Final non-overlapping spans in start order */
        std::vector<Span> detect(std::string_view text) const noexcept;

        const DetectorConfig &config() const { return config_; }

    private:
        std::vector<Span> run_detector(DetectorKind kind,
                                       std::string_view text,
                                       const std::vector<Span> &claimed) const noexcept;

        DetectorConfig config_;
        std::unordered_set<std::string> allow_list_;
    };

} // namespace scrubby
