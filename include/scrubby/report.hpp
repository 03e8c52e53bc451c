#pragma once

#include "redactor.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace scrubby
{

    /**
     * User-facing per-category counts. IPv4 and IPv6 are reported together.
     */
    struct Summary
    {
        std::size_t emails{0};
        std::size_t ips{0};
        std::size_t uuids{0};
        std::size_t jwts{0};
        std::size_t tokens{0};

        static Summary from_counts(const KindCounts &counts);

        std::size_t total() const { return emails + ips + uuids + jwts + tokens; }

        bool operator==(const Summary &) const = default;
    };

    /** Multi-line text summary printed after a clipboard run */
    std::string format_summary(const Summary &summary);

    /** Structured report: {"emails":N,"ips":N,"jwts":N,"safe_to_paste":true,"tokens":N,"uuids":N} */
    nlohmann::json summary_to_json(const Summary &summary);

} // namespace scrubby
