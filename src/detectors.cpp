#include "scrubby/detectors.hpp"
#include "scrubby/placeholder.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <utility>

namespace scrubby
{

    namespace
    {
        // ASCII-only classification; bytes >= 0x80 never belong to a match
        constexpr bool is_digit(unsigned char c) { return c >= '0' && c <= '9'; }
        constexpr bool is_lower(unsigned char c) { return c >= 'a' && c <= 'z'; }
        constexpr bool is_upper(unsigned char c) { return c >= 'A' && c <= 'Z'; }
        constexpr bool is_alpha(unsigned char c) { return is_lower(c) || is_upper(c); }
        constexpr bool is_alnum(unsigned char c) { return is_alpha(c) || is_digit(c); }
        constexpr bool is_word(unsigned char c) { return is_alnum(c) || c == '_'; }
        constexpr bool is_b64url(unsigned char c) { return is_word(c) || c == '-'; }

        constexpr bool is_hex(unsigned char c)
        {
            return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        constexpr bool is_email_local(unsigned char c)
        {
            return is_alnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
        }

        constexpr bool is_email_domain(unsigned char c)
        {
            return is_alnum(c) || c == '.' || c == '-';
        }

        constexpr bool is_ipv6_char(unsigned char c)
        {
            return is_hex(c) || c == ':' || c == '.';
        }

        unsigned char at(std::string_view text, std::size_t i)
        {
            return static_cast<unsigned char>(text[i]);
        }

        Span make_span(std::string_view text, std::size_t start, std::size_t end, DetectorKind kind)
        {
            return Span{start, end, std::string(text.substr(start, end - start)), kind};
        }

        int hex_value(unsigned char c)
        {
            if (is_digit(c))
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return c - 'A' + 10;
        }

        std::string to_lower(std::string_view s)
        {
            std::string out(s);
            for (auto &ch : out)
            {
                if (is_upper(static_cast<unsigned char>(ch)))
                    ch = static_cast<char>(ch - 'A' + 'a');
            }
            return out;
        }

        // Split an identifier-like run on '_', '-' and lower/digit -> upper transitions
        std::vector<std::string> identifier_segments(std::string_view run)
        {
            std::vector<std::string> segments;
            std::string current;
            for (std::size_t i = 0; i < run.size(); ++i)
            {
                unsigned char c = at(run, i);
                if (c == '_' || c == '-')
                {
                    if (!current.empty())
                        segments.push_back(to_lower(current));
                    current.clear();
                    continue;
                }
                if (is_upper(c) && !current.empty() && !is_upper(static_cast<unsigned char>(current.back())))
                {
                    segments.push_back(to_lower(current));
                    current.clear();
                }
                current.push_back(static_cast<char>(c));
            }
            if (!current.empty())
                segments.push_back(to_lower(current));
            return segments;
        }

        bool is_allow_listed(std::string_view run, const std::unordered_set<std::string> &allow_list)
        {
            if (allow_list.empty())
                return false;
            if (allow_list.contains(to_lower(run)))
                return true;
            auto segments = identifier_segments(run);
            if (segments.empty())
                return false;
            return std::all_of(segments.begin(), segments.end(), [&](const std::string &seg) {
                return allow_list.contains(seg);
            });
        }

        constexpr bool is_separator(unsigned char c) { return c == '-' || c == '_'; }

        // [start, end) reads LABEL or LABEL_n inside angle brackets, as placeholders are rendered
        bool is_placeholder_body(std::string_view text, std::size_t start, std::size_t end)
        {
            if (start == 0 || end >= text.size() || text[start - 1] != '<' || text[end] != '>')
                return false;

            std::string_view body = text.substr(start, end - start);
            for (auto kind : kDetectorPriority)
            {
                auto label = placeholder_label(kind);
                if (!body.starts_with(label))
                    continue;
                auto index = body.substr(label.size());
                if (index.empty())
                    return true;
                if (index.size() >= 2 && index[0] == '_' &&
                    std::all_of(index.begin() + 1, index.end(), [](char c) { return is_digit(static_cast<unsigned char>(c)); }))
                    return true;
            }
            return false;
        }

        // Position just past an IPv4 octet at `i`, or npos when there is none
        std::size_t scan_octet(std::string_view text, std::size_t i, std::uint8_t &value)
        {
            std::size_t j = i;
            unsigned total = 0;
            while (j < text.size() && is_digit(at(text, j)) && j - i < 4)
            {
                total = total * 10 + (at(text, j) - '0');
                ++j;
            }
            std::size_t digits = j - i;
            if (digits == 0 || digits > 3 || total > 255)
                return std::string_view::npos;
            value = static_cast<std::uint8_t>(total);
            return j;
        }

        // End of a dotted quad starting at `i`, or npos
        std::size_t scan_dotted_quad(std::string_view text, std::size_t i, std::array<std::uint8_t, 4> &octets)
        {
            std::size_t j = i;
            for (std::size_t k = 0; k < 4; ++k)
            {
                if (k > 0)
                {
                    if (j >= text.size() || text[j] != '.')
                        return std::string_view::npos;
                    ++j;
                }
                j = scan_octet(text, j, octets[k]);
                if (j == std::string_view::npos)
                    return j;
            }
            return j;
        }

        bool parse_ipv6_groups(std::string_view part, bool allow_ipv4_tail,
                               std::vector<std::uint16_t> &groups)
        {
            if (part.empty())
                return true;
            std::size_t pos = 0;
            while (true)
            {
                std::size_t colon = part.find(':', pos);
                std::string_view group = part.substr(pos, colon == std::string_view::npos ? std::string_view::npos : colon - pos);
                bool last = colon == std::string_view::npos;
                if (group.empty())
                    return false;

                if (group.find('.') != std::string_view::npos)
                {
                    std::array<std::uint8_t, 4> octets{};
                    if (!last || !allow_ipv4_tail)
                        return false;
                    if (scan_dotted_quad(group, 0, octets) != group.size())
                        return false;
                    groups.push_back(static_cast<std::uint16_t>((octets[0] << 8) | octets[1]));
                    groups.push_back(static_cast<std::uint16_t>((octets[2] << 8) | octets[3]));
                }
                else
                {
                    if (group.size() > 4)
                        return false;
                    unsigned value = 0;
                    for (unsigned char c : group)
                    {
                        if (!is_hex(c))
                            return false;
                        value = (value << 4) | static_cast<unsigned>(hex_value(c));
                    }
                    groups.push_back(static_cast<std::uint16_t>(value));
                }

                if (last)
                    return true;
                pos = colon + 1;
            }
        }

        // Candidates such as `a::b` in source code parse as IPv6; require some substance
        bool plausible_ipv6(std::string_view text)
        {
            if (text.find("::") == std::string_view::npos)
                return true;
            std::size_t explicit_groups = 0;
            bool in_group = false;
            for (unsigned char c : text)
            {
                if (c == ':')
                {
                    in_group = false;
                }
                else if (!in_group)
                {
                    in_group = true;
                    ++explicit_groups;
                }
            }
            bool has_digit = std::any_of(text.begin(), text.end(), [](char c) {
                return is_digit(static_cast<unsigned char>(c));
            });
            return explicit_groups >= 3 || has_digit;
        }

        bool matches_uuid_at(std::string_view text, std::size_t i)
        {
            static constexpr std::size_t kUuidLength = 36;
            if (i + kUuidLength > text.size())
                return false;
            for (std::size_t k = 0; k < kUuidLength; ++k)
            {
                unsigned char c = at(text, i + k);
                bool dash_slot = k == 8 || k == 13 || k == 18 || k == 23;
                if (dash_slot ? c != '-' : !is_hex(c))
                    return false;
            }
            return true;
        }

        std::size_t b64url_run_end(std::string_view text, std::size_t i)
        {
            while (i < text.size() && is_b64url(at(text, i)))
                ++i;
            return i;
        }

    } // namespace

    std::string_view kind_name(DetectorKind kind)
    {
        switch (kind)
        {
        case DetectorKind::Email:
            return "email";
        case DetectorKind::IPv4:
            return "ipv4";
        case DetectorKind::IPv6:
            return "ipv6";
        case DetectorKind::UUID:
            return "uuid";
        case DetectorKind::JWT:
            return "jwt";
        case DetectorKind::Token:
            return "token";
        }
        return "unknown";
    }

    std::optional<DetectorKind> kind_from_name(std::string_view name)
    {
        for (auto kind : kDetectorPriority)
        {
            if (kind_name(kind) == name)
                return kind;
        }
        return std::nullopt;
    }

    TokenHeuristic TokenHeuristic::defaults()
    {
        return TokenHeuristic{32, 3.5, default_allow_list()};
    }

    const std::vector<std::string> &TokenHeuristic::default_allow_list()
    {
        static const std::vector<std::string> words = {
            "abstract", "access", "account", "action", "adapter", "address", "admin", "after",
            "algorithm", "allocator", "analysis", "application", "argument", "array", "async",
            "attribute", "authentication", "authorization", "background", "backup", "base",
            "before", "buffer", "build", "builder", "cache", "callback", "channel", "check",
            "class", "client", "cluster", "collection", "command", "common", "component",
            "configuration", "config", "connection", "consumer", "container", "content",
            "context", "controller", "converter", "create", "customer", "data", "database",
            "default", "delete", "dependency", "deployment", "descriptor", "details", "device",
            "dispatcher", "document", "domain", "element", "endpoint", "engine", "entity",
            "environment", "error", "event", "exception", "executor", "factory", "feature",
            "field", "file", "filter", "format", "from", "function", "generator", "get",
            "handler", "helper", "identifier", "implementation", "index", "information",
            "initialize", "input", "instance", "integration", "interface", "internal", "item",
            "iterator", "kubernetes", "list", "listener", "loader", "local", "logger", "manager",
            "mapper", "message", "metadata", "method", "middleware", "model", "module",
            "monitor", "name", "namespace", "network", "node", "notification", "object",
            "observer", "operation", "option", "order", "output", "package", "parameter",
            "parser", "password", "path", "payment", "permission", "pipeline", "policy", "pool",
            "processor", "producer", "profile", "property", "provider", "proxy", "publisher",
            "query", "queue", "reader", "record", "reference", "registry", "remove", "renderer",
            "repository", "request", "resolver", "resource", "response", "result", "router",
            "runner", "scheduler", "schema", "service", "session", "set", "settings", "singleton",
            "source", "state", "statement", "storage", "store", "strategy", "stream", "string",
            "subscriber", "subscription", "system", "table", "task", "template", "test", "thread",
            "timeout", "token", "transaction", "transformer", "type", "update", "user", "util",
            "utils", "validation", "validator", "value", "version", "view", "visitor", "worker",
            "writer"};
        return words;
    }

    DetectorConfig DetectorConfig::defaults()
    {
        return DetectorConfig{};
    }

    double shannon_entropy(std::string_view s) noexcept
    {
        if (s.empty())
            return 0.0;
        std::array<std::size_t, 256> counts{};
        for (unsigned char c : s)
            ++counts[c];
        const double len = static_cast<double>(s.size());
        double entropy = 0.0;
        for (auto c : counts)
        {
            if (c == 0)
                continue;
            double p = static_cast<double>(c) / len;
            entropy -= p * std::log2(p);
        }
        return entropy;
    }

    namespace detectors
    {

        std::vector<Span> match_email(std::string_view text) noexcept
        {
            std::vector<Span> out;
            std::size_t last_end = 0;

            for (std::size_t at_pos = text.find('@'); at_pos != std::string_view::npos;
                 at_pos = text.find('@', at_pos + 1))
            {
                std::size_t ls = at_pos;
                while (ls > last_end && is_email_local(at(text, ls - 1)))
                    --ls;
                while (ls < at_pos && !is_word(at(text, ls)))
                    ++ls;
                if (ls == at_pos)
                    continue;

                std::size_t de = at_pos + 1;
                while (de < text.size() && is_email_domain(at(text, de)))
                    ++de;

                // Rightmost ".tld" with >= 2 letters followed by a word boundary
                std::size_t end = std::string_view::npos;
                for (std::size_t d = de; d-- > at_pos + 2;)
                {
                    if (text[d] != '.')
                        continue;
                    std::size_t t = d + 1;
                    while (t < text.size() && is_alpha(at(text, t)))
                        ++t;
                    if (t - (d + 1) < 2)
                        continue;
                    if (t < text.size() && is_word(at(text, t)))
                        continue;
                    end = t;
                    break;
                }
                if (end == std::string_view::npos)
                    continue;

                out.push_back(make_span(text, ls, end, DetectorKind::Email));
                last_end = end;
            }
            return out;
        }

        std::vector<Span> match_ipv4(std::string_view text) noexcept
        {
            std::vector<Span> out;
            std::size_t i = 0;
            while (i < text.size())
            {
                if (!is_digit(at(text, i)))
                {
                    ++i;
                    continue;
                }

                bool bounded = i == 0 || !(is_word(at(text, i - 1)) || text[i - 1] == '.');
                if (bounded)
                {
                    std::array<std::uint8_t, 4> octets{};
                    std::size_t end = scan_dotted_quad(text, i, octets);
                    bool ok = end != std::string_view::npos;
                    if (ok && end < text.size() && is_word(at(text, end)))
                        ok = false;
                    if (ok && end + 1 < text.size() && text[end] == '.' && is_digit(at(text, end + 1)))
                        ok = false;
                    if (ok)
                    {
                        out.push_back(make_span(text, i, end, DetectorKind::IPv4));
                        i = end;
                        continue;
                    }
                }

                while (i < text.size() && is_digit(at(text, i)))
                    ++i;
            }
            return out;
        }

        std::optional<std::array<std::uint16_t, 8>> parse_ipv6(std::string_view text) noexcept
        {
            if (text.size() < 2)
                return std::nullopt;

            std::size_t gap = text.find("::");
            if (gap != std::string_view::npos && text.find("::", gap + 1) != std::string_view::npos)
                return std::nullopt;

            std::vector<std::uint16_t> head;
            std::vector<std::uint16_t> tail;
            if (gap == std::string_view::npos)
            {
                if (!parse_ipv6_groups(text, true, head) || head.size() != 8)
                    return std::nullopt;
            }
            else
            {
                if (!parse_ipv6_groups(text.substr(0, gap), false, head))
                    return std::nullopt;
                if (!parse_ipv6_groups(text.substr(gap + 2), true, tail))
                    return std::nullopt;
                if (head.size() + tail.size() > 7)
                    return std::nullopt;
            }

            std::array<std::uint16_t, 8> groups{};
            std::copy(head.begin(), head.end(), groups.begin());
            std::copy(tail.begin(), tail.end(), groups.end() - static_cast<std::ptrdiff_t>(tail.size()));
            return groups;
        }

        std::optional<std::array<std::uint8_t, 4>> parse_ipv4(std::string_view text) noexcept
        {
            std::array<std::uint8_t, 4> octets{};
            if (scan_dotted_quad(text, 0, octets) != text.size())
                return std::nullopt;
            return octets;
        }

        std::vector<Span> match_ipv6(std::string_view text) noexcept
        {
            std::vector<Span> out;
            std::size_t i = 0;
            while (i < text.size())
            {
                if (!is_ipv6_char(at(text, i)))
                {
                    ++i;
                    continue;
                }

                std::size_t s = i;
                std::size_t e = i;
                while (e < text.size() && is_ipv6_char(at(text, e)))
                    ++e;
                i = e;

                if (s > 0 && is_word(at(text, s - 1)))
                    continue;
                if (e < text.size() && is_word(at(text, e)))
                    continue;

                while (s < e && text[s] == '.')
                    ++s;
                if (e - s >= 2 && text[s] == ':' && text[s + 1] != ':')
                    ++s;
                while (e > s && text[e - 1] == '.')
                    --e;
                if (e - s >= 2 && text[e - 1] == ':' && text[e - 2] != ':')
                    --e;
                if (e - s < 2)
                    continue;

                std::string_view candidate = text.substr(s, e - s);
                if (candidate.find(':') == std::string_view::npos)
                    continue;
                if (!plausible_ipv6(candidate) || !parse_ipv6(candidate))
                    continue;

                out.push_back(make_span(text, s, e, DetectorKind::IPv6));
            }
            return out;
        }

        std::vector<Span> match_uuid(std::string_view text) noexcept
        {
            std::vector<Span> out;
            std::size_t i = 0;
            while (i < text.size())
            {
                bool bounded = i == 0 || !is_word(at(text, i - 1));
                if (bounded && is_hex(at(text, i)) && matches_uuid_at(text, i))
                {
                    std::size_t end = i + 36;
                    if (end == text.size() || !is_word(at(text, end)))
                    {
                        out.push_back(make_span(text, i, end, DetectorKind::UUID));
                        i = end;
                        continue;
                    }
                }
                ++i;
            }
            return out;
        }

        std::vector<Span> match_jwt(std::string_view text) noexcept
        {
            std::vector<Span> out;
            for (std::size_t i = text.find("eyJ"); i != std::string_view::npos; i = text.find("eyJ", i + 1))
            {
                if (i > 0 && (is_b64url(at(text, i - 1)) || text[i - 1] == '.'))
                    continue;

                std::size_t header_end = b64url_run_end(text, i);
                if (header_end >= text.size() || text[header_end] != '.')
                    continue;
                std::size_t payload_end = b64url_run_end(text, header_end + 1);
                if (payload_end == header_end + 1 || payload_end >= text.size() || text[payload_end] != '.')
                    continue;
                std::size_t sig_end = b64url_run_end(text, payload_end + 1);
                if (sig_end == payload_end + 1)
                    continue;
                if (sig_end + 1 < text.size() && text[sig_end] == '.' && is_b64url(at(text, sig_end + 1)))
                    continue;

                out.push_back(make_span(text, i, sig_end, DetectorKind::JWT));
                i = sig_end - 1;
            }
            return out;
        }

        std::vector<Span> match_token(
            std::string_view text,
            const TokenHeuristic &heuristic,
            const std::unordered_set<std::string> &allow_list,
            const std::vector<Span> &claimed) noexcept
        {
            std::vector<Span> out;

            // Separators left at a cut next to a claimed span are not part of the piece
            auto consider = [&](std::size_t s, std::size_t e, bool cut_front, bool cut_back) {
                while (cut_front && s < e && is_separator(at(text, s)))
                    ++s;
                while (cut_back && e > s && is_separator(at(text, e - 1)))
                    --e;

                std::string_view run = text.substr(s, e - s);
                if (run.size() < heuristic.min_length)
                    return;
                if (shannon_entropy(run) < heuristic.entropy_threshold)
                    return;
                if (is_allow_listed(run, allow_list))
                    return;
                if (is_placeholder_body(text, s, e))
                    return;
                out.push_back(make_span(text, s, e, DetectorKind::Token));
            };

            std::size_t i = 0;
            while (i < text.size())
            {
                if (!is_b64url(at(text, i)))
                {
                    ++i;
                    continue;
                }
                std::size_t s = i;
                i = b64url_run_end(text, i);

                std::vector<std::pair<std::size_t, std::size_t>> cuts;
                for (const auto &span : claimed)
                {
                    if (span.start < i && s < span.end)
                        cuts.emplace_back(span.start, span.end);
                }
                std::sort(cuts.begin(), cuts.end());

                std::size_t from = s;
                for (const auto &[cut_start, cut_end] : cuts)
                {
                    if (cut_start > from)
                        consider(from, cut_start, from != s, true);
                    from = std::max(from, cut_end);
                }
                if (from < i)
                    consider(from, i, from != s, false);
            }
            return out;
        }

    } // namespace detectors

    std::vector<Span> resolve_overlaps(std::vector<Span> candidates) noexcept
    {
        std::sort(candidates.begin(), candidates.end(), [](const Span &a, const Span &b) {
            if (is_structural(a.kind) != is_structural(b.kind))
                return is_structural(a.kind);
            if (a.length() != b.length())
                return a.length() > b.length();
            if (a.start != b.start)
                return a.start < b.start;
            return kind_index(a.kind) < kind_index(b.kind);
        });

        // accepted spans keyed by start; they never overlap each other
        std::map<std::size_t, std::size_t> taken;
        std::vector<Span> resolved;
        for (auto &span : candidates)
        {
            if (span.length() == 0)
                continue;
            auto next = taken.lower_bound(span.start);
            if (next != taken.end() && next->first < span.end)
                continue;
            if (next != taken.begin() && std::prev(next)->second > span.start)
                continue;
            taken.emplace(span.start, span.end);
            resolved.push_back(std::move(span));
        }

        std::sort(resolved.begin(), resolved.end(), [](const Span &a, const Span &b) {
            return a.start < b.start;
        });
        return resolved;
    }

    DetectorRegistry::DetectorRegistry() : DetectorRegistry(DetectorConfig::defaults()) {}

    DetectorRegistry::DetectorRegistry(DetectorConfig config) : config_(std::move(config))
    {
        for (const auto &word : config_.token.allow_list)
            allow_list_.insert(to_lower(word));
    }

    std::vector<Span> DetectorRegistry::run_detector(DetectorKind kind,
                                                     std::string_view text,
                                                     const std::vector<Span> &claimed) const noexcept
    {
        switch (kind)
        {
        case DetectorKind::Email:
            return detectors::match_email(text);
        case DetectorKind::IPv4:
            return detectors::match_ipv4(text);
        case DetectorKind::IPv6:
            return detectors::match_ipv6(text);
        case DetectorKind::UUID:
            return detectors::match_uuid(text);
        case DetectorKind::JWT:
            return detectors::match_jwt(text);
        case DetectorKind::Token:
            return detectors::match_token(text, config_.token, allow_list_, claimed);
        }
        return {};
    }

    std::vector<Span> DetectorRegistry::candidates(std::string_view text) const noexcept
    {
        std::vector<Span> all;
        for (auto kind : kDetectorPriority)
        {
            if (!config_.is_enabled(kind))
                continue;
            // Token runs last in priority order, so `all` holds only structural spans here
            auto found = run_detector(kind, text, all);
            all.insert(all.end(),
                       std::make_move_iterator(found.begin()),
                       std::make_move_iterator(found.end()));
        }
        return all;
    }

    std::vector<Span> DetectorRegistry::detect(std::string_view text) const noexcept
    {
        return resolve_overlaps(candidates(text));
    }

} // namespace scrubby
