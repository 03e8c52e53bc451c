#include "scrubby/feature_gate.hpp"
#include <array>
#include <format>

namespace scrubby
{

    namespace
    {
        constexpr std::array<Feature, 8> kAllFeatures = {
            Feature::ClipboardSanitize,
            Feature::WatchMode,
            Feature::TextSummary,
            Feature::DeviceIdQuery,
            Feature::StablePlaceholders,
            Feature::JsonReport,
            Feature::CustomRules,
            Feature::FileStdinInput};

        constexpr std::uint32_t kFreeBits =
            static_cast<std::uint32_t>(Feature::ClipboardSanitize) |
            static_cast<std::uint32_t>(Feature::WatchMode) |
            static_cast<std::uint32_t>(Feature::TextSummary) |
            static_cast<std::uint32_t>(Feature::DeviceIdQuery);

        constexpr std::uint32_t kPaidBits =
            kFreeBits |
            static_cast<std::uint32_t>(Feature::StablePlaceholders) |
            static_cast<std::uint32_t>(Feature::JsonReport) |
            static_cast<std::uint32_t>(Feature::CustomRules) |
            static_cast<std::uint32_t>(Feature::FileStdinInput);

        bool grants_paid(LicenseState state)
        {
            switch (state)
            {
            case LicenseState::Valid:
                return true;
            case LicenseState::DevOverride:
#ifdef SCRUBBY_DEV_OVERRIDE
                return true;
#else
                return false;
#endif
            case LicenseState::NoLicenseFile:
            case LicenseState::Invalid:
                return false;
            }
            return false;
        }
    }

    std::string_view feature_name(Feature feature)
    {
        switch (feature)
        {
        case Feature::ClipboardSanitize:
            return "clipboard";
        case Feature::WatchMode:
            return "watch";
        case Feature::TextSummary:
            return "text-summary";
        case Feature::DeviceIdQuery:
            return "device-id";
        case Feature::StablePlaceholders:
            return "stable-placeholders";
        case Feature::JsonReport:
            return "json-report";
        case Feature::CustomRules:
            return "config";
        case Feature::FileStdinInput:
            return "file-stdin";
        }
        return "unknown";
    }

    FeatureSet FeatureSet::free_tier()
    {
        return FeatureSet(kFreeBits);
    }

    FeatureSet FeatureSet::paid_tier()
    {
        return FeatureSet(kPaidBits);
    }

    std::vector<std::string> FeatureSet::names() const
    {
        std::vector<std::string> out;
        for (auto feature : kAllFeatures)
        {
            if (has(feature))
                out.emplace_back(feature_name(feature));
        }
        return out;
    }

    Entitlements FeatureGate::evaluate(const LicenseOutcome &outcome)
    {
        bool paid = grants_paid(outcome.state());
        std::optional<std::string> licensee;
        if (outcome.is_valid() && outcome.license())
            licensee = outcome.license()->email;

        return Entitlements{
            paid ? FeatureSet::paid_tier() : FeatureSet::free_tier(),
            outcome.state(),
            outcome.failure(),
            outcome.message(),
            std::move(licensee)};
    }

    Result<void> FeatureGate::require(const Entitlements &entitlements, Feature feature)
    {
        if (entitlements.features.has(feature))
            return {};

        std::string why = entitlements.failure
                              ? std::format("{}: {}", failure_name(*entitlements.failure), entitlements.reason)
                              : entitlements.reason;
        return std::unexpected(ScrubbyError::feature_locked(
            std::format("'{}' is a Pro feature and requires a valid license ({})", feature_name(feature), why)));
    }

} // namespace scrubby
