#include <JNAV/Serialization/Core/ParseError.hpp>

#include <ostream>

namespace JNAV::Serialization
{
    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None: return "None";
            case ParseErrorCode::UnexpectedEnd: return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter: return "UnexpectedCharacter";
            case ParseErrorCode::InvalidToken: return "InvalidToken";
            case ParseErrorCode::InvalidNumber: return "InvalidNumber";
            case ParseErrorCode::InvalidStringEscape: return "InvalidStringEscape";
            case ParseErrorCode::InvalidUnicodeEscape: return "InvalidUnicodeEscape";
            case ParseErrorCode::DepthExceeded: return "DepthExceeded";
            case ParseErrorCode::TrailingCharacters: return "TrailingCharacters";
            case ParseErrorCode::OutOfMemory: return "OutOfMemory";
        }
        return "Unknown";
    }

    std::string Describe(const ParseError& error)
    {
        std::string text = error.message;
        text += " (";
        text += ToString(error.code);
        text += ")";
        if (error.location.HasLineInfo())
        {
            text += " at line ";
            text += std::to_string(error.location.line);
            text += ", column ";
            text += std::to_string(error.location.column);
        }
        else
        {
            text += " at offset ";
            text += std::to_string(error.location.offset);
        }
        return text;
    }

    std::ostream& operator<<(std::ostream& os, const ParseError& error)
    {
        return os << Describe(error);
    }
}// namespace JNAV::Serialization
