#pragma once

#include "types.hpp"
#include "license_validator.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scrubby
{

    enum class Feature : std::uint32_t
    {
        // free
        ClipboardSanitize = 1u << 0,
        WatchMode = 1u << 1,
        TextSummary = 1u << 2,
        DeviceIdQuery = 1u << 3,
        // paid
        StablePlaceholders = 1u << 4,
        JsonReport = 1u << 5,
        CustomRules = 1u << 6,
        FileStdinInput = 1u << 7
    };

    std::string_view feature_name(Feature feature);

    /**
     * Immutable set of entitlements. Built once at startup by FeatureGate and
     * only read afterwards.
     */
    class FeatureSet
    {
    public:
        static FeatureSet free_tier();
        static FeatureSet paid_tier();

        bool has(Feature feature) const
        {
            return (bits_ & static_cast<std::uint32_t>(feature)) != 0;
        }

        std::uint32_t bits() const { return bits_; }

        std::vector<std::string> names() const;

        bool operator==(const FeatureSet &) const = default;

    private:
        explicit constexpr FeatureSet(std::uint32_t bits) : bits_(bits) {}

        std::uint32_t bits_;
    };

    struct Entitlements
    {
        FeatureSet features;
        LicenseState state;
        std::optional<LicenseFailure> failure;
        std::string reason;
        std::optional<std::string> licensee;

        bool is_paid() const { return features == FeatureSet::paid_tier(); }
    };

    class FeatureGate
    {
    public:
        /** Pure mapping from a verification outcome to entitlements */
        static Entitlements evaluate(const LicenseOutcome &outcome);

        /** FeatureLocked error naming the feature and the license reason */
        static Result<void> require(const Entitlements &entitlements, Feature feature);
    };

} // namespace scrubby
