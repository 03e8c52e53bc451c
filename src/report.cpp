#include "scrubby/report.hpp"
#include <format>

namespace scrubby
{

    Summary Summary::from_counts(const KindCounts &counts)
    {
        Summary s;
        s.emails = counts[kind_index(DetectorKind::Email)];
        s.ips = counts[kind_index(DetectorKind::IPv4)] + counts[kind_index(DetectorKind::IPv6)];
        s.uuids = counts[kind_index(DetectorKind::UUID)];
        s.jwts = counts[kind_index(DetectorKind::JWT)];
        s.tokens = counts[kind_index(DetectorKind::Token)];
        return s;
    }

    std::string format_summary(const Summary &summary)
    {
        return std::format(
            "Scrubby cleaned your clipboard:\n"
            "- Emails: {}\n"
            "- IPs: {}\n"
            "- UUIDs: {}\n"
            "- JWTs: {}\n"
            "- Tokens: {}\n"
            "Safe to paste.",
            summary.emails, summary.ips, summary.uuids, summary.jwts, summary.tokens);
    }

    nlohmann::json summary_to_json(const Summary &summary)
    {
        return nlohmann::json{{"emails", summary.emails},
                              {"ips", summary.ips},
                              {"uuids", summary.uuids},
                              {"jwts", summary.jwts},
                              {"tokens", summary.tokens},
                              {"safe_to_paste", true}};
    }

} // namespace scrubby
