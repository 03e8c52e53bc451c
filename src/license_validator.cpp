#include "scrubby/license_validator.hpp"
#include "scrubby/json_canonicalization.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>

#ifndef SCRUBBY_PUBLIC_KEY_B64
#define SCRUBBY_PUBLIC_KEY_B64 ""
#endif

namespace scrubby
{

    namespace
    {
        constexpr std::array<std::string_view, 3> kKnownPlans = {"pro", "team", "lifetime"};

        std::optional<int> parse_digits(std::string_view text, std::size_t pos, std::size_t len)
        {
            if (pos + len > text.size())
                return std::nullopt;
            for (std::size_t i = pos; i < pos + len; ++i)
            {
                if (text[i] < '0' || text[i] > '9')
                    return std::nullopt;
            }
            int value = 0;
            auto first = text.data() + pos;
            auto last = first + len;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last)
                return std::nullopt;
            return value;
        }

        Result<std::string> required_string(const toml::table &tbl, std::string_view key)
        {
            auto value = tbl[key].value<std::string>();
            if (!value || value->empty())
            {
                return std::unexpected(ScrubbyError::parsing(
                    std::format("License field '{}' is missing or not a string", key)));
            }
            return *value;
        }

#ifdef SCRUBBY_DEV_OVERRIDE
        bool dev_override_requested()
        {
            const char *v = std::getenv("SCRUBBY_LICENSE");
            return v && std::string_view(v) == "DEV";
        }
#endif
    }

    std::string_view state_name(LicenseState state)
    {
        switch (state)
        {
        case LicenseState::NoLicenseFile:
            return "NoLicenseFile";
        case LicenseState::Valid:
            return "Valid";
        case LicenseState::Invalid:
            return "Invalid";
        case LicenseState::DevOverride:
            return "DevOverride";
        }
        return "Unknown";
    }

    std::string_view failure_name(LicenseFailure failure)
    {
        switch (failure)
        {
        case LicenseFailure::Missing:
            return "Missing";
        case LicenseFailure::Parse:
            return "ParseError";
        case LicenseFailure::SignatureInvalid:
            return "SignatureInvalid";
        case LicenseFailure::DeviceMismatch:
            return "DeviceMismatch";
        case LicenseFailure::Expired:
            return "Expired";
        }
        return "Unknown";
    }

    // ============================================================================
    // TrustAnchor / LicenseOutcome
    // ============================================================================

    TrustAnchor TrustAnchor::embedded()
    {
        const std::string b64 = SCRUBBY_PUBLIC_KEY_B64;
        if (b64.empty())
            return TrustAnchor{};
        auto anchor = from_base64(b64);
        if (!anchor)
        {
            spdlog::error("embedded license public key is unusable: {}", anchor.error().what());
            return TrustAnchor{};
        }
        return *anchor;
    }

    Result<TrustAnchor> TrustAnchor::from_base64(const std::string &b64)
    {
        auto key = crypto::public_key_from_base64(b64);
        if (!key)
            return std::unexpected(key.error());
        return TrustAnchor{*key, true};
    }

    LicenseOutcome::LicenseOutcome(LicenseState state, std::optional<LicenseFailure> failure, std::string message,
                                   std::optional<License> license)
        : state_(state), failure_(failure), message_(std::move(message)), license_(std::move(license))
    {
    }

    LicenseOutcome LicenseOutcome::no_license(std::string message)
    {
        return LicenseOutcome{LicenseState::NoLicenseFile, LicenseFailure::Missing, std::move(message), std::nullopt};
    }

    LicenseOutcome LicenseOutcome::valid(License license)
    {
        auto message = std::format("licensed to {} ({})", license.email, license.plan);
        return LicenseOutcome{LicenseState::Valid, std::nullopt, std::move(message), std::move(license)};
    }

    LicenseOutcome LicenseOutcome::invalid(LicenseFailure failure, std::string message)
    {
        return LicenseOutcome{LicenseState::Invalid, failure, std::move(message), std::nullopt};
    }

    LicenseOutcome LicenseOutcome::dev_override()
    {
        return LicenseOutcome{LicenseState::DevOverride, std::nullopt, "developer override (debug build)", std::nullopt};
    }

    // ============================================================================
    // LicenseValidator
    // ============================================================================

    LicenseValidator::LicenseValidator(TrustAnchor anchor, std::string device_id)
        : anchor_(anchor), device_id_(std::move(device_id)) {}

    std::filesystem::path LicenseValidator::default_path()
    {
        if (const char *explicit_path = std::getenv("SCRUBBY_LICENSE_PATH"); explicit_path && *explicit_path)
            return std::filesystem::path(explicit_path);

        std::filesystem::path base;
        if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
            base = xdg;
        else if (const char *home = std::getenv("HOME"); home && *home)
            base = std::filesystem::path(home) / ".config";
        else
            return {};

        return base / "scrubby" / "license.toml";
    }

    Result<License> LicenseValidator::parse_toml(const std::string &content)
    {
        toml::table tbl;
        try
        {
            tbl = toml::parse(content);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ScrubbyError::parsing(std::format("License parse error: {}", e.description())));
        }

        License license;
        for (auto [key, field] : std::array<std::pair<std::string_view, std::string *>, 5>{{
                 {"email", &license.email},
                 {"plan", &license.plan},
                 {"device_id", &license.device_id},
                 {"issued_at", &license.issued_at},
                 {"signature", &license.signature_b64},
             }})
        {
            auto value = required_string(tbl, key);
            if (!value)
                return std::unexpected(value.error());
            *field = std::move(*value);
        }

        if (auto node = tbl["expires_at"])
        {
            auto value = node.value<std::string>();
            if (!value)
                return std::unexpected(ScrubbyError::parsing("License field 'expires_at' is not a string"));
            license.expires_at = *value;
        }

        if (auto issued = parse_timestamp(license.issued_at, false); !issued)
            return std::unexpected(issued.error());
        if (license.expires_at)
        {
            if (auto expiry = parse_timestamp(*license.expires_at, true); !expiry)
                return std::unexpected(expiry.error());
        }

        if (std::find(kKnownPlans.begin(), kKnownPlans.end(), license.plan) == kKnownPlans.end())
            return std::unexpected(ScrubbyError::parsing(std::format("Unsupported license plan '{}'", license.plan)));

        return license;
    }

    Result<std::string> LicenseValidator::canonical_payload(const License &license)
    {
        nlohmann::json payload = {
            {"email", license.email},
            {"plan", license.plan},
            {"device_id", license.device_id},
            {"issued_at", license.issued_at}};
        if (license.expires_at)
            payload["expires_at"] = *license.expires_at;
        return json::RFC8785Canonicalizer::canonicalize(payload);
    }

    Result<LicenseValidator::Clock::time_point> LicenseValidator::parse_timestamp(std::string_view text, bool end_of_day)
    {
        auto bad = [&] {
            return std::unexpected(ScrubbyError::parsing(std::format("Invalid license timestamp '{}'", text)));
        };

        if (text.size() != 10 && text.size() != 20)
            return bad();
        if (text[4] != '-' || text[7] != '-')
            return bad();

        auto year = parse_digits(text, 0, 4);
        auto month = parse_digits(text, 5, 2);
        auto day = parse_digits(text, 8, 2);
        if (!year || !month || !day)
            return bad();

        std::chrono::year_month_day ymd{std::chrono::year{*year},
                                        std::chrono::month{static_cast<unsigned>(*month)},
                                        std::chrono::day{static_cast<unsigned>(*day)}};
        if (!ymd.ok())
            return bad();

        Clock::time_point tp = std::chrono::sys_days{ymd};
        if (text.size() == 10)
            return end_of_day ? tp + std::chrono::days{1} : tp;

        if (text[10] != 'T' || text[13] != ':' || text[16] != ':' || text[19] != 'Z')
            return bad();
        auto hour = parse_digits(text, 11, 2);
        auto minute = parse_digits(text, 14, 2);
        auto second = parse_digits(text, 17, 2);
        if (!hour || !minute || !second || *hour > 23 || *minute > 59 || *second > 59)
            return bad();

        return tp + std::chrono::hours{*hour} + std::chrono::minutes{*minute} + std::chrono::seconds{*second};
    }

    LicenseOutcome LicenseValidator::verify(const std::string &content, Clock::time_point now) const
    {
        auto parsed = parse_toml(content);
        if (!parsed)
            return LicenseOutcome::invalid(LicenseFailure::Parse, parsed.error().what());

        if (!anchor_.configured)
        {
            return LicenseOutcome::invalid(LicenseFailure::SignatureInvalid,
                                           "No license public key is embedded in this build");
        }

        auto canonical = canonical_payload(*parsed);
        if (!canonical)
            return LicenseOutcome::invalid(LicenseFailure::Parse, canonical.error().what());

        auto signature = crypto::signature_from_base64(parsed->signature_b64);
        if (!signature)
        {
            return LicenseOutcome::invalid(LicenseFailure::SignatureInvalid,
                                           std::format("Invalid license signature encoding: {}", signature.error().what()));
        }

        crypto::Bytes message(canonical->begin(), canonical->end());
        if (!crypto::Ed25519KeyPair::verify(message, *signature, anchor_.public_key))
            return LicenseOutcome::invalid(LicenseFailure::SignatureInvalid, "License signature verification failed");

        // Fields below are covered by the signature
        if (parsed->device_id != device_id_)
            return LicenseOutcome::invalid(LicenseFailure::DeviceMismatch, "License is not valid for this device");

        if (parsed->expires_at)
        {
            auto expiry = parse_timestamp(*parsed->expires_at, true);
            if (!expiry)
                return LicenseOutcome::invalid(LicenseFailure::Parse, expiry.error().what());
            if (now >= *expiry)
                return LicenseOutcome::invalid(LicenseFailure::Expired,
                                               std::format("License expired at {}", *parsed->expires_at));
        }

        return LicenseOutcome::valid(std::move(*parsed));
    }

    LicenseOutcome LicenseValidator::verify_file(const std::filesystem::path &path, Clock::time_point now) const
    {
        if (path.empty())
            return LicenseOutcome::no_license("No license file found; running in free mode");

        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if (status.type() == std::filesystem::file_type::not_found)
            return LicenseOutcome::no_license("No license file found; running in free mode");
        if (ec)
        {
            return LicenseOutcome::invalid(LicenseFailure::Missing,
                                           std::format("Cannot access license file {}: {}", path.string(), ec.message()));
        }
        if (status.type() != std::filesystem::file_type::regular)
        {
            return LicenseOutcome::invalid(LicenseFailure::Missing,
                                           std::format("License path is not a regular file: {}", path.string()));
        }

        std::ifstream file(path);
        std::stringstream buffer;
        if (file.is_open())
            buffer << file.rdbuf();
        if (!file.is_open() || file.bad())
        {
            return LicenseOutcome::invalid(LicenseFailure::Missing,
                                           std::format("Failed to read license file: {}", path.string()));
        }

        auto outcome = verify(buffer.str(), now);
        if (outcome.is_valid())
            spdlog::info("license verified: {}", outcome.message());
        else
            spdlog::warn("license rejected ({}): {}", failure_name(*outcome.failure()), outcome.message());
        return outcome;
    }

    LicenseOutcome LicenseValidator::check(Clock::time_point now) const
    {
#ifdef SCRUBBY_DEV_OVERRIDE
        if (dev_override_requested())
        {
            spdlog::warn("SCRUBBY_LICENSE=DEV: developer override active, signature not checked");
            return LicenseOutcome::dev_override();
        }
#endif
        return verify_file(default_path(), now);
    }

} // namespace scrubby
