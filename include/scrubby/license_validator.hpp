#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scrubby
{

    enum class LicenseState
    {
        NoLicenseFile,
        Valid,
        Invalid,
        DevOverride // only reachable in builds defining SCRUBBY_DEV_OVERRIDE
    };

    enum class LicenseFailure
    {
        Missing,
        Parse,
        SignatureInvalid,
        DeviceMismatch,
        Expired
    };

    std::string_view state_name(LicenseState state);
    std::string_view failure_name(LicenseFailure failure);

    /**
     * Fields of a license file. Nothing here is trustworthy until the
     * signature has been verified over canonical_payload().
     */
    struct License
    {
        std::string email;
        std::string plan;
        std::string device_id;
        std::string issued_at;                 // YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ
        std::optional<std::string> expires_at; // same formats, absent = perpetual
        std::string signature_b64;
    };

    /**
     * Ed25519 public key the verifier trusts. The release key is baked in at
     * build time through SCRUBBY_PUBLIC_KEY_B64.
     */
    struct TrustAnchor
    {
        crypto::Ed25519PublicKey public_key{};
        bool configured{false};

        static TrustAnchor embedded();
        static Result<TrustAnchor> from_base64(const std::string &b64);
    };

    /**
     * Result of a license check. Outcomes that grant paid features are only
     * minted by LicenseValidator after the signature has been verified.
     */
    class LicenseOutcome
    {
    public:
        static LicenseOutcome no_license(std::string message);
        static LicenseOutcome invalid(LicenseFailure failure, std::string message);

        LicenseState state() const { return state_; }
        const std::optional<LicenseFailure> &failure() const { return failure_; }
        const std::string &message() const { return message_; }
        const std::optional<License> &license() const { return license_; } // set only when Valid

        bool is_valid() const { return state_ == LicenseState::Valid; }

    private:
        friend class LicenseValidator;

        LicenseOutcome(LicenseState state, std::optional<LicenseFailure> failure, std::string message,
                       std::optional<License> license);

        static LicenseOutcome valid(License license);
        static LicenseOutcome dev_override();

        LicenseState state_;
        std::optional<LicenseFailure> failure_;
        std::string message_;
        std::optional<License> license_;
    };

    /**
     * Offline license verification:
     * parse -> signature -> device binding -> expiry. Every failure yields an
     * Invalid outcome with a reason; nothing here aborts the caller.
     */
    class LicenseValidator
    {
    public:
        using Clock = std::chrono::system_clock;

        LicenseValidator(TrustAnchor anchor, std::string device_id);

        /** $SCRUBBY_LICENSE_PATH, else $XDG_CONFIG_HOME or ~/.config + scrubby/license.toml */
        static std::filesystem::path default_path();

        /** Parse license data from TOML content */
        static Result<License> parse_toml(const std::string &content);

        /** RFC 8785 JSON of every field except the signature */
        static Result<std::string> canonical_payload(const License &license);

        /**
         * Parse YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ. With `end_of_day` a bare
         * date means the first instant of the following UTC day.
         */
        static Result<Clock::time_point> parse_timestamp(std::string_view text, bool end_of_day);

        LicenseOutcome verify(const std::string &content, Clock::time_point now) const;

        LicenseOutcome verify_file(const std::filesystem::path &path, Clock::time_point now) const;

        /** Startup check against default_path() (and the debug override, where compiled in) */
        LicenseOutcome check(Clock::time_point now = Clock::now()) const;

        const std::string &device_id() const { return device_id_; }

    private:
        TrustAnchor anchor_;
        std::string device_id_;
    };

} // namespace scrubby
