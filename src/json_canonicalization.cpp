#include "scrubby/json_canonicalization.hpp"
#include <algorithm>
#include <format>
#include <vector>

namespace scrubby::json
{

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        auto res = serialize_value(value, output);
        if (!res)
            return std::unexpected(res.error());
        return output;
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output)
    {
        using value_t = nlohmann::json::value_t;

        switch (value.type())
        {
        case value_t::null:
            output += "null";
            return {};

        case value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case value_t::number_integer:
            output += std::to_string(value.get<int64_t>());
            return {};

        case value_t::number_unsigned:
            output += std::to_string(value.get<uint64_t>());
            return {};

        case value_t::string:
            serialize_string(value.get_ref<const std::string &>(), output);
            return {};

        case value_t::array:
        {
            output += '[';
            bool first = true;
            for (const auto &item : value)
            {
                if (!first)
                    output += ',';
                first = false;
                auto res = serialize_value(item, output);
                if (!res)
                    return res;
            }
            output += ']';
            return {};
        }

        case value_t::object:
        {
            // Byte order; equal to JCS UTF-16 order for the ASCII keys of license payloads
            std::vector<std::string> keys;
            keys.reserve(value.size());
            for (auto it = value.begin(); it != value.end(); ++it)
                keys.push_back(it.key());
            std::sort(keys.begin(), keys.end());

            output += '{';
            bool first = true;
            for (const auto &key : keys)
            {
                if (!first)
                    output += ',';
                first = false;
                serialize_string(key, output);
                output += ':';
                auto res = serialize_value(value.at(key), output);
                if (!res)
                    return res;
            }
            output += '}';
            return {};
        }

        case value_t::number_float:
            return std::unexpected(ScrubbyError::invalid_input("Floating point values are not canonicalized"));

        default:
            return std::unexpected(ScrubbyError::invalid_input("Unsupported JSON value type"));
        }
    }

    void RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        output += '"';
        for (unsigned char ch : str)
        {
            switch (ch)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (ch < 0x20)
                    output += std::format("\\u{:04x}", static_cast<int>(ch));
                else
                    output += static_cast<char>(ch);
                break;
            }
        }
        output += '"';
    }

} // namespace scrubby::json
