/// @file Error.hpp
/// @brief Error payload produced by document parsing, node building, navigation, and coercion.
#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Primitives.hpp>
#include <JNAV/Serialization/Core/ParseError.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <version>

#if defined(__cpp_lib_format)
#include <format>
#endif

namespace JNAV::Navigation
{
    /// @brief Which stage of the pipeline produced an error.
    enum class ErrorCategory : UInt8
    {
        None,
        Format,
        Decode,
        Build,
        Navigation,
        Coercion,
    };

    /// @brief Specific failure reason.
    enum class ErrorCode : UInt8
    {
        None,
        NotObjectOrArray,
        DecodeFailed,
        UnsupportedType,
        KeyNotFound,
        IndexOutOfRange,
        NotMap,
        NotArray,
        NotNumber,
        NotBoolean,
        NotString,
        NumberOutOfRange,
    };

    /// @brief Structured error carried by `Expected` results and by Error nodes.
    struct JNAV_API Error
    {
        ErrorCategory                   category {ErrorCategory::None};
        ErrorCode                       code {ErrorCode::None};
        std::string                     message {};
        /// Decoder failure details; only meaningful for `ErrorCategory::Decode`.
        JNAV::Serialization::ParseError parse {};

        [[nodiscard]] bool IsNone() const noexcept { return code == ErrorCode::None; }

        [[nodiscard]] static Error Format();
        [[nodiscard]] static Error Decode(JNAV::Serialization::ParseError parseError);
        [[nodiscard]] static Error UnsupportedType();
        [[nodiscard]] static Error KeyNotFound(std::string_view key);
        [[nodiscard]] static Error IndexOutOfRange(Int64 index);
        [[nodiscard]] static Error NotMap(ErrorCategory category);
        [[nodiscard]] static Error NotArray(ErrorCategory category);
        [[nodiscard]] static Error NotNumber();
        [[nodiscard]] static Error NotBoolean();
        [[nodiscard]] static Error NotString();
        [[nodiscard]] static Error NumberOutOfRange(F64 value, std::string_view target);
    };

    [[nodiscard]] JNAV_API bool operator==(const Error& lhs, const Error& rhs) noexcept;

    [[nodiscard]] JNAV_API std::string_view ToString(ErrorCategory category) noexcept;
    [[nodiscard]] JNAV_API std::string_view ToString(ErrorCode code) noexcept;

    /// @brief Renders "[<category>] <message>", followed by the decoder details for Decode errors.
    [[nodiscard]] JNAV_API std::string Describe(const Error& error);

    JNAV_API std::ostream& operator<<(std::ostream& os, const Error& error);
}// namespace JNAV::Navigation

#if defined(__cpp_lib_format)
namespace std
{
    template<typename CharT>
    struct formatter<JNAV::Navigation::Error, CharT> : public std::formatter<std::string_view, CharT>
    {
        template<typename FormatContext>
        auto format(const JNAV::Navigation::Error& error, FormatContext& ctx) const
        {
            const std::string text = JNAV::Navigation::Describe(error);
            return std::formatter<std::string_view, CharT>::format(std::string_view {text}, ctx);
        }
    };
}// namespace std
#endif// __cpp_lib_format
