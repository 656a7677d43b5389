#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Primitives.hpp>
#include <JNAV/Serialization/Core/ParseError.hpp>
#include <JNAV/Serialization/JSON/JsonTypes.hpp>
#include <JNAV/Utilities/Expected.hpp>

#include <span>
#include <string_view>

namespace JNAV::Serialization
{
    /// @brief JSON decoding configuration.
    struct JsonParseOptions
    {
        bool     allowComments {false};
        bool     allowTrailingCommas {false};
        bool     trackLocation {false};
        UIntSize maxDepth {256};
    };

    /// @brief Decodes JSON text into a `JsonDocument` of generic `JsonValue`s.
    ///
    /// Any JSON value is accepted at the top level, including scalars and `null`. Whitespace
    /// (and comments, when enabled) may surround the value; anything else after it is an error.
    class JNAV_API JsonParser
    {
    public:
        static JNAV::Utilities::Expected<JsonDocument, ParseError>
        Parse(std::string_view input, const JsonParseOptions& options = {});

        static JNAV::Utilities::Expected<JsonDocument, ParseError>
        Parse(std::span<const JNAV::Byte> input, const JsonParseOptions& options = {});
    };
}// namespace JNAV::Serialization
