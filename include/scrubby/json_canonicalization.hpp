#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace scrubby::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS), restricted to the value types
     * license payloads use: objects, arrays, strings, integers, booleans, null.
     *
     * Keys are sorted by UTF-8 byte order, no insignificant whitespace is
     * emitted and strings use the minimal escape set. Floating point numbers
     * are rejected because their JCS form is not needed for signed payloads.
     */
    class RFC8785Canonicalizer
    {
    public:
        /** Canonicalize a JSON value; returns InvalidInput for floats */
        static Result<std::string> canonicalize(const nlohmann::json &value);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output);
        static void serialize_string(const std::string &str, std::string &output);
    };

} // namespace scrubby::json
