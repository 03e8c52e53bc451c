#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace scrubby
{

    /**
     * Error categories for Scrubby operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        ClipboardError,
        FeatureLocked,
        InvalidInput,
        IOError,
        ParsingError
    };

    /**
     * Scrubby error with code and message
     */
    class ScrubbyError : public std::runtime_error
    {
    public:
        ErrorCode code;

        ScrubbyError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static ScrubbyError config(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::ConfigError, msg);
        }

        static ScrubbyError crypto(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::CryptoError, msg);
        }

        static ScrubbyError clipboard(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::ClipboardError, msg);
        }

        static ScrubbyError feature_locked(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::FeatureLocked, msg);
        }

        static ScrubbyError invalid_input(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::InvalidInput, msg);
        }

        static ScrubbyError io(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::IOError, msg);
        }

        static ScrubbyError parsing(const std::string &msg)
        {
            return ScrubbyError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ScrubbyError>;

} // namespace scrubby
