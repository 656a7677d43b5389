#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Primitives.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <version>

#if defined(__cpp_lib_format)
#include <format>
#endif

namespace JNAV::Serialization
{
    /// @brief Structured decoder error codes.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidToken,
        InvalidNumber,
        InvalidStringEscape,
        InvalidUnicodeEscape,
        DepthExceeded,
        TrailingCharacters,
        OutOfMemory,
    };

    /// @brief Byte offset and optional line/column position for parse errors.
    struct ParseLocation
    {
        UIntSize offset {0};
        UIntSize line {0};
        UIntSize column {0};

        /// @brief True when line/column were tracked for this location.
        [[nodiscard]] constexpr bool HasLineInfo() const noexcept { return line != 0; }
    };

    /// @brief Parsing error payload with code, location, and message.
    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::None};
        ParseLocation  location {};
        std::string    message {};
    };

    [[nodiscard]] JNAV_API std::string_view ToString(ParseErrorCode code) noexcept;

    /// @brief Renders "<message> (<code>) at line L, column C" or "... at offset N".
    [[nodiscard]] JNAV_API std::string Describe(const ParseError& error);

    JNAV_API std::ostream& operator<<(std::ostream& os, const ParseError& error);
}// namespace JNAV::Serialization

#if defined(__cpp_lib_format)
namespace std
{
    template<typename CharT>
    struct formatter<JNAV::Serialization::ParseError, CharT> : public std::formatter<std::string_view, CharT>
    {
        template<typename FormatContext>
        auto format(const JNAV::Serialization::ParseError& error, FormatContext& ctx) const
        {
            const std::string text = JNAV::Serialization::Describe(error);
            return std::formatter<std::string_view, CharT>::format(std::string_view {text}, ctx);
        }
    };
}// namespace std
#endif// __cpp_lib_format
