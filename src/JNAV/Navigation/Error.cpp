#include <JNAV/Navigation/Error.hpp>

#include <charconv>
#include <ostream>

namespace JNAV::Navigation
{
    namespace
    {
        [[nodiscard]] Error MakeError(ErrorCategory category, ErrorCode code, std::string message)
        {
            Error error;
            error.category = category;
            error.code     = code;
            error.message  = std::move(message);
            return error;
        }

        [[nodiscard]] std::string FormatNumber(F64 value)
        {
            char       buffer[32];
            const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
            return std::string(buffer, result.ptr);
        }
    }// namespace

    Error Error::Format()
    {
        return MakeError(ErrorCategory::Format, ErrorCode::NotObjectOrArray, "not a JSON object or array");
    }

    Error Error::Decode(JNAV::Serialization::ParseError parseError)
    {
        Error error = MakeError(ErrorCategory::Decode, ErrorCode::DecodeFailed, parseError.message);
        error.parse = std::move(parseError);
        return error;
    }

    Error Error::UnsupportedType()
    {
        return MakeError(ErrorCategory::Build, ErrorCode::UnsupportedType, "unsupported data type");
    }

    Error Error::KeyNotFound(std::string_view key)
    {
        std::string message = "key `";
        message += key;
        message += "` not exist";
        return MakeError(ErrorCategory::Navigation, ErrorCode::KeyNotFound, std::move(message));
    }

    Error Error::IndexOutOfRange(Int64 index)
    {
        return MakeError(ErrorCategory::Navigation, ErrorCode::IndexOutOfRange, "index `" + std::to_string(index) + "` out of range");
    }

    Error Error::NotMap(ErrorCategory category)
    {
        return MakeError(category, ErrorCode::NotMap, "node is not map");
    }

    Error Error::NotArray(ErrorCategory category)
    {
        return MakeError(category, ErrorCode::NotArray, "node is not array");
    }

    Error Error::NotNumber()
    {
        return MakeError(ErrorCategory::Coercion, ErrorCode::NotNumber, "node is not number");
    }

    Error Error::NotBoolean()
    {
        return MakeError(ErrorCategory::Coercion, ErrorCode::NotBoolean, "node is not boolean");
    }

    Error Error::NotString()
    {
        return MakeError(ErrorCategory::Coercion, ErrorCode::NotString, "node is not string");
    }

    Error Error::NumberOutOfRange(F64 value, std::string_view target)
    {
        std::string message = "number `" + FormatNumber(value) + "` out of range for ";
        message += target;
        return MakeError(ErrorCategory::Coercion, ErrorCode::NumberOutOfRange, std::move(message));
    }

    bool operator==(const Error& lhs, const Error& rhs) noexcept
    {
        return lhs.category == rhs.category && lhs.code == rhs.code && lhs.message == rhs.message &&
               lhs.parse.code == rhs.parse.code && lhs.parse.location.offset == rhs.parse.location.offset;
    }

    std::string_view ToString(ErrorCategory category) noexcept
    {
        switch (category)
        {
            case ErrorCategory::None: return "None";
            case ErrorCategory::Format: return "Format";
            case ErrorCategory::Decode: return "Decode";
            case ErrorCategory::Build: return "Build";
            case ErrorCategory::Navigation: return "Navigation";
            case ErrorCategory::Coercion: return "Coercion";
        }
        return "Unknown";
    }

    std::string_view ToString(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::None: return "None";
            case ErrorCode::NotObjectOrArray: return "NotObjectOrArray";
            case ErrorCode::DecodeFailed: return "DecodeFailed";
            case ErrorCode::UnsupportedType: return "UnsupportedType";
            case ErrorCode::KeyNotFound: return "KeyNotFound";
            case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
            case ErrorCode::NotMap: return "NotMap";
            case ErrorCode::NotArray: return "NotArray";
            case ErrorCode::NotNumber: return "NotNumber";
            case ErrorCode::NotBoolean: return "NotBoolean";
            case ErrorCode::NotString: return "NotString";
            case ErrorCode::NumberOutOfRange: return "NumberOutOfRange";
        }
        return "Unknown";
    }

    std::string Describe(const Error& error)
    {
        std::string text = "[";
        text += ToString(error.category);
        text += "] ";
        if (error.category == ErrorCategory::Decode)
            text += JNAV::Serialization::Describe(error.parse);
        else
            text += error.message;
        return text;
    }

    std::ostream& operator<<(std::ostream& os, const Error& error)
    {
        return os << Describe(error);
    }
}// namespace JNAV::Navigation
