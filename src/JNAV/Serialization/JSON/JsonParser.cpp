#include <JNAV/Serialization/JSON/JsonParser.hpp>

#include <JNAV/Serialization/Core/InputCursor.hpp>

#include <charconv>
#include <new>
#include <utility>

namespace JNAV::Serialization
{
    namespace
    {
        template<class T>
        using ParseResult = JNAV::Utilities::Expected<T, ParseError>;

        struct JsonParseContext
        {
            InputCursor      cursor;
            JsonParseOptions options;
            UIntSize         depth {0};
        };

        [[nodiscard]] ParseError MakeError(const JsonParseContext& ctx, ParseErrorCode code, const char* message)
        {
            ParseError err;
            err.code     = code;
            err.location = ctx.cursor.Location();
            err.message  = message;
            return err;
        }

        template<class T>
        [[nodiscard]] ParseResult<T> Fail(const JsonParseContext& ctx, ParseErrorCode code, const char* message)
        {
            return ParseResult<T>(JNAV::Utilities::Unexpected<ParseError>(MakeError(ctx, code, message)));
        }

        template<class T, class U>
        [[nodiscard]] ParseResult<T> Forward(ParseResult<U>&& failed)
        {
            return ParseResult<T>(JNAV::Utilities::Unexpected<ParseError>(std::move(failed).ErrorUnsafe()));
        }

        [[nodiscard]] bool IsDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        [[nodiscard]] bool IsHexDigit(char c) noexcept
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        [[nodiscard]] UInt32 HexValue(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return static_cast<UInt32>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<UInt32>(c - 'a' + 10);
            return static_cast<UInt32>(c - 'A' + 10);
        }

        bool DecodeHex4(const char* digits, UInt32& out) noexcept
        {
            out = 0;
            for (int i = 0; i < 4; ++i)
            {
                const char c = digits[i];
                if (!IsHexDigit(c))
                    return false;
                out = static_cast<UInt32>((out << 4) | HexValue(c));
            }
            return true;
        }

        void AppendUtf8(std::string& out, UInt32 codepoint)
        {
            if (codepoint <= 0x7F)
            {
                out.push_back(static_cast<char>(codepoint));
            }
            else if (codepoint <= 0x7FF)
            {
                out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
            else if (codepoint <= 0xFFFF)
            {
                out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
        }

        constexpr UInt32 kReplacementCharacter = 0xFFFD;

        [[nodiscard]] bool IsContinuation(unsigned char c, unsigned char low = 0x80, unsigned char high = 0xBF) noexcept
        {
            return c >= low && c <= high;
        }

        /// Length of the well-formed UTF-8 sequence at `p`, or 0 when the bytes are not one.
        [[nodiscard]] UIntSize Utf8SequenceLength(const char* p, UIntSize remaining) noexcept
        {
            const auto byte = [p](UIntSize i) { return static_cast<unsigned char>(p[i]); };
            const unsigned char lead = byte(0);

            if (lead >= 0xC2 && lead <= 0xDF)
                return remaining >= 2 && IsContinuation(byte(1)) ? 2 : 0;
            if (lead >= 0xE0 && lead <= 0xEF)
            {
                if (remaining < 3)
                    return 0;
                const unsigned char low  = lead == 0xE0 ? 0xA0 : 0x80;
                const unsigned char high = lead == 0xED ? 0x9F : 0xBF;
                return IsContinuation(byte(1), low, high) && IsContinuation(byte(2)) ? 3 : 0;
            }
            if (lead >= 0xF0 && lead <= 0xF4)
            {
                if (remaining < 4)
                    return 0;
                const unsigned char low  = lead == 0xF0 ? 0x90 : 0x80;
                const unsigned char high = lead == 0xF4 ? 0x8F : 0xBF;
                return IsContinuation(byte(1), low, high) && IsContinuation(byte(2)) && IsContinuation(byte(3)) ? 4 : 0;
            }
            return 0;
        }

        /// True when a number `from_chars` could not represent is too small rather than too large.
        [[nodiscard]] bool IsUnderflow(const char* start, const char* end) noexcept
        {
            const char* p = start;
            if (p < end && *p == '-')
                ++p;

            // Decimal exponent of the first significant digit.
            Int64 magnitude   = 0;
            bool  significant = false;
            while (p < end && IsDigit(*p))
            {
                if (significant)
                    ++magnitude;
                else if (*p != '0')
                    significant = true;
                ++p;
            }
            if (p < end && *p == '.')
            {
                ++p;
                while (p < end && IsDigit(*p))
                {
                    if (significant)
                        break;
                    --magnitude;
                    if (*p != '0')
                        significant = true;
                    ++p;
                }
                while (p < end && IsDigit(*p))
                    ++p;
            }

            if (p < end && (*p == 'e' || *p == 'E'))
            {
                ++p;
                bool negative = false;
                if (p < end && (*p == '+' || *p == '-'))
                    negative = *p++ == '-';

                constexpr Int64 exponentLimit = 1'000'000'000;
                Int64           exponent      = 0;
                while (p < end && IsDigit(*p))
                {
                    if (exponent < exponentLimit)
                        exponent = exponent * 10 + (*p - '0');
                    ++p;
                }
                magnitude += negative ? -exponent : exponent;
            }
            return magnitude < 0;
        }

        ParseResult<void> SkipComment(JsonParseContext& ctx)
        {
            const char next = ctx.cursor.Peek(1);
            if (next == '/')
            {
                ctx.cursor.Advance(2);
                while (!ctx.cursor.IsEof())
                {
                    const char c = ctx.cursor.Peek();
                    if (c == '\n' || c == '\r')
                        break;
                    ctx.cursor.Advance();
                }
                return {};
            }
            if (next == '*')
            {
                ctx.cursor.Advance(2);
                while (!ctx.cursor.IsEof())
                {
                    if (ctx.cursor.Peek() == '*' && ctx.cursor.Peek(1) == '/')
                    {
                        ctx.cursor.Advance(2);
                        return {};
                    }
                    ctx.cursor.Advance();
                }
                return Fail<void>(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated comment");
            }
            return Fail<void>(ctx, ParseErrorCode::InvalidToken, "Invalid comment token");
        }

        ParseResult<void> SkipWhitespaceAndComments(JsonParseContext& ctx)
        {
            while (true)
            {
                ctx.cursor.SkipWhitespace();
                if (!ctx.options.allowComments || ctx.cursor.Peek() != '/')
                    return {};
                auto commentResult = SkipComment(ctx);
                if (!commentResult.HasValue())
                    return commentResult;
            }
        }

        ParseResult<std::string> ParseString(JsonParseContext& ctx)
        {
            if (ctx.cursor.Peek() != '"')
                return Fail<std::string>(ctx, ParseErrorCode::InvalidToken, "Expected string");
            ctx.cursor.Advance();

            std::string out;
            while (true)
            {
                if (ctx.cursor.IsEof())
                    return Fail<std::string>(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated string");

                const char c = ctx.cursor.Peek();
                if (c == '"')
                {
                    ctx.cursor.Advance();
                    return ParseResult<std::string>(std::move(out));
                }
                if (static_cast<unsigned char>(c) < 0x20)
                    return Fail<std::string>(ctx, ParseErrorCode::InvalidToken, "Control character in string");
                if (static_cast<unsigned char>(c) >= 0x80)
                {
                    // Ill-formed UTF-8 is replaced byte by byte with U+FFFD.
                    const UIntSize length = Utf8SequenceLength(ctx.cursor.CurrentPtr(), ctx.cursor.Remaining());
                    if (length == 0)
                    {
                        AppendUtf8(out, kReplacementCharacter);
                        ctx.cursor.Advance();
                    }
                    else
                    {
                        out.append(ctx.cursor.CurrentPtr(), length);
                        ctx.cursor.Advance(length);
                    }
                    continue;
                }
                if (c != '\\')
                {
                    out.push_back(c);
                    ctx.cursor.Advance();
                    continue;
                }

                const char esc = ctx.cursor.Peek(1);
                switch (esc)
                {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        if (ctx.cursor.Remaining() < 6)
                            return Fail<std::string>(ctx, ParseErrorCode::UnexpectedEnd, "Truncated unicode escape");
                        UInt32 codepoint = 0;
                        if (!DecodeHex4(ctx.cursor.CurrentPtr() + 2, codepoint))
                            return Fail<std::string>(ctx, ParseErrorCode::InvalidUnicodeEscape, "Invalid unicode escape");

                        UIntSize consumed = 6;
                        if (codepoint >= 0xD800 && codepoint <= 0xDFFF)
                        {
                            // Unpaired surrogates decode to U+FFFD; a following escape is decoded on its own.
                            UInt32 low = 0;
                            if (codepoint <= 0xDBFF && ctx.cursor.Remaining() >= 12 && ctx.cursor.Peek(6) == '\\' &&
                                ctx.cursor.Peek(7) == 'u' && DecodeHex4(ctx.cursor.CurrentPtr() + 8, low) && low >= 0xDC00 &&
                                low <= 0xDFFF)
                            {
                                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                                consumed  = 12;
                            }
                            else
                            {
                                codepoint = kReplacementCharacter;
                            }
                        }
                        AppendUtf8(out, codepoint);
                        ctx.cursor.Advance(consumed);
                        continue;
                    }
                    case '\0':
                        if (ctx.cursor.Remaining() < 2)
                            return Fail<std::string>(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated escape");
                        return Fail<std::string>(ctx, ParseErrorCode::InvalidStringEscape, "Invalid escape");
                    default:
                        return Fail<std::string>(ctx, ParseErrorCode::InvalidStringEscape, "Invalid escape");
                }
                ctx.cursor.Advance(2);
            }
        }

        ParseResult<F64> ParseNumber(JsonParseContext& ctx)
        {
            const char* start = ctx.cursor.CurrentPtr();
            const char* end   = ctx.cursor.EndPtr();
            const char* p     = start;

            if (*p == '-')
                ++p;
            if (p >= end)
                return Fail<F64>(ctx, ParseErrorCode::UnexpectedEnd, "Unexpected end in number");
            if (*p == '0')
            {
                ++p;
            }
            else
            {
                if (!IsDigit(*p))
                    return Fail<F64>(ctx, ParseErrorCode::InvalidNumber, "Invalid number");
                while (p < end && IsDigit(*p))
                    ++p;
            }

            if (p < end && *p == '.')
            {
                ++p;
                if (p >= end || !IsDigit(*p))
                    return Fail<F64>(ctx, ParseErrorCode::InvalidNumber, "Invalid fraction");
                while (p < end && IsDigit(*p))
                    ++p;
            }

            if (p < end && (*p == 'e' || *p == 'E'))
            {
                ++p;
                if (p < end && (*p == '+' || *p == '-'))
                    ++p;
                if (p >= end || !IsDigit(*p))
                    return Fail<F64>(ctx, ParseErrorCode::InvalidNumber, "Invalid exponent");
                while (p < end && IsDigit(*p))
                    ++p;
            }

            F64        value  = 0.0;
            const auto result = std::from_chars(start, p, value, std::chars_format::general);
            if (result.ec == std::errc::result_out_of_range && result.ptr == p && IsUnderflow(start, p))
                value = *start == '-' ? -0.0 : 0.0;
            else if (result.ec == std::errc::result_out_of_range)
                return Fail<F64>(ctx, ParseErrorCode::InvalidNumber, "Number out of range");
            else if (result.ec != std::errc {} || result.ptr != p)
                return Fail<F64>(ctx, ParseErrorCode::InvalidNumber, "Invalid number");

            ctx.cursor.Advance(static_cast<UIntSize>(p - start));
            return ParseResult<F64>(value);
        }

        ParseResult<JsonValue> ParseLiteral(JsonParseContext& ctx, std::string_view literal, JsonValue value)
        {
            if (ctx.cursor.Remaining() < literal.size() || std::string_view {ctx.cursor.CurrentPtr(), literal.size()} != literal)
                return Fail<JsonValue>(ctx, ParseErrorCode::InvalidToken, "Invalid literal");
            ctx.cursor.Advance(literal.size());
            return ParseResult<JsonValue>(std::move(value));
        }

        ParseResult<JsonValue> ParseValue(JsonParseContext& ctx);

        ParseResult<JsonValue> ParseArray(JsonParseContext& ctx)
        {
            if (ctx.depth >= ctx.options.maxDepth)
                return Fail<JsonValue>(ctx, ParseErrorCode::DepthExceeded, "Array nesting too deep");
            ++ctx.depth;

            ctx.cursor.Advance();
            auto skipResult = SkipWhitespaceAndComments(ctx);
            if (!skipResult.HasValue())
                return Forward<JsonValue>(std::move(skipResult));

            JsonArray array;
            if (ctx.cursor.Peek() == ']')
            {
                ctx.cursor.Advance();
                --ctx.depth;
                return ParseResult<JsonValue>(JsonValue::MakeArray(std::move(array)));
            }

            while (true)
            {
                auto valueResult = ParseValue(ctx);
                if (!valueResult.HasValue())
                    return valueResult;
                array.values.push_back(std::move(valueResult).ValueUnsafe());

                auto postResult = SkipWhitespaceAndComments(ctx);
                if (!postResult.HasValue())
                    return Forward<JsonValue>(std::move(postResult));

                const char next = ctx.cursor.Peek();
                if (next == ',')
                {
                    ctx.cursor.Advance();
                    auto commaResult = SkipWhitespaceAndComments(ctx);
                    if (!commaResult.HasValue())
                        return Forward<JsonValue>(std::move(commaResult));
                    if (ctx.cursor.Peek() == ']')
                    {
                        if (!ctx.options.allowTrailingCommas)
                            return Fail<JsonValue>(ctx, ParseErrorCode::InvalidToken, "Trailing comma in array");
                        ctx.cursor.Advance();
                        break;
                    }
                    continue;
                }
                if (next == ']')
                {
                    ctx.cursor.Advance();
                    break;
                }
                if (ctx.cursor.IsEof())
                    return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated array");
                return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedCharacter, "Expected ',' or ']'");
            }

            --ctx.depth;
            return ParseResult<JsonValue>(JsonValue::MakeArray(std::move(array)));
        }

        ParseResult<JsonValue> ParseObject(JsonParseContext& ctx)
        {
            if (ctx.depth >= ctx.options.maxDepth)
                return Fail<JsonValue>(ctx, ParseErrorCode::DepthExceeded, "Object nesting too deep");
            ++ctx.depth;

            ctx.cursor.Advance();
            auto skipResult = SkipWhitespaceAndComments(ctx);
            if (!skipResult.HasValue())
                return Forward<JsonValue>(std::move(skipResult));

            JsonObject object;
            if (ctx.cursor.Peek() == '}')
            {
                ctx.cursor.Advance();
                --ctx.depth;
                return ParseResult<JsonValue>(JsonValue::MakeObject(std::move(object)));
            }

            while (true)
            {
                auto keyResult = ParseString(ctx);
                if (!keyResult.HasValue())
                    return Forward<JsonValue>(std::move(keyResult));

                auto colonResult = SkipWhitespaceAndComments(ctx);
                if (!colonResult.HasValue())
                    return Forward<JsonValue>(std::move(colonResult));
                if (ctx.cursor.Peek() != ':')
                    return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedCharacter, "Expected ':'");
                ctx.cursor.Advance();

                auto valueResult = ParseValue(ctx);
                if (!valueResult.HasValue())
                    return valueResult;

                object.Set(std::move(keyResult).ValueUnsafe(), std::move(valueResult).ValueUnsafe());

                auto postResult = SkipWhitespaceAndComments(ctx);
                if (!postResult.HasValue())
                    return Forward<JsonValue>(std::move(postResult));

                const char next = ctx.cursor.Peek();
                if (next == ',')
                {
                    ctx.cursor.Advance();
                    auto commaResult = SkipWhitespaceAndComments(ctx);
                    if (!commaResult.HasValue())
                        return Forward<JsonValue>(std::move(commaResult));
                    if (ctx.cursor.Peek() == '}')
                    {
                        if (!ctx.options.allowTrailingCommas)
                            return Fail<JsonValue>(ctx, ParseErrorCode::InvalidToken, "Trailing comma in object");
                        ctx.cursor.Advance();
                        break;
                    }
                    continue;
                }
                if (next == '}')
                {
                    ctx.cursor.Advance();
                    break;
                }
                if (ctx.cursor.IsEof())
                    return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated object");
                return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedCharacter, "Expected ',' or '}'");
            }

            --ctx.depth;
            return ParseResult<JsonValue>(JsonValue::MakeObject(std::move(object)));
        }

        ParseResult<JsonValue> ParseValue(JsonParseContext& ctx)
        {
            auto skipResult = SkipWhitespaceAndComments(ctx);
            if (!skipResult.HasValue())
                return Forward<JsonValue>(std::move(skipResult));

            const char c = ctx.cursor.Peek();
            switch (c)
            {
                case 'n': return ParseLiteral(ctx, "null", JsonValue::MakeNull());
                case 't': return ParseLiteral(ctx, "true", JsonValue::MakeBool(true));
                case 'f': return ParseLiteral(ctx, "false", JsonValue::MakeBool(false));
                case '{': return ParseObject(ctx);
                case '[': return ParseArray(ctx);
                case '"': {
                    auto stringResult = ParseString(ctx);
                    if (!stringResult.HasValue())
                        return Forward<JsonValue>(std::move(stringResult));
                    return ParseResult<JsonValue>(JsonValue::MakeString(std::move(stringResult).ValueUnsafe()));
                }
                default: break;
            }
            if (c == '-' || IsDigit(c))
            {
                auto numberResult = ParseNumber(ctx);
                if (!numberResult.HasValue())
                    return Forward<JsonValue>(std::move(numberResult));
                return ParseResult<JsonValue>(JsonValue::MakeNumber(numberResult.ValueUnsafe()));
            }
            if (ctx.cursor.IsEof())
                return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedEnd, "Unexpected end of input");
            return Fail<JsonValue>(ctx, ParseErrorCode::UnexpectedCharacter, "Unexpected token");
        }
    }// namespace

    const JsonValue* JsonObject::Find(std::string_view key) const noexcept
    {
        const auto it = m_index.find(key);
        if (it == m_index.end())
            return nullptr;
        return &m_members[it->second].value;
    }

    bool JsonObject::Set(std::string key, JsonValue value)
    {
        const auto it = m_index.find(std::string_view {key});
        if (it != m_index.end())
        {
            m_members[it->second].value = std::move(value);
            return false;
        }
        m_index.emplace(key, m_members.size());
        m_members.push_back(JsonMember {std::move(key), std::move(value)});
        return true;
    }

    JNAV::Utilities::Expected<JsonDocument, ParseError>
    JsonParser::Parse(std::string_view input, const JsonParseOptions& options)
    {
        JsonParseContext ctx {InputCursor(input, options.trackLocation), options, 0};

        try
        {
            auto valueResult = ParseValue(ctx);
            if (!valueResult.HasValue())
                return Forward<JsonDocument>(std::move(valueResult));

            auto tailResult = SkipWhitespaceAndComments(ctx);
            if (!tailResult.HasValue())
                return Forward<JsonDocument>(std::move(tailResult));

            if (!ctx.cursor.IsEof())
                return Fail<JsonDocument>(ctx, ParseErrorCode::TrailingCharacters, "Trailing characters after JSON");

            return ParseResult<JsonDocument>(JsonDocument(std::move(valueResult).ValueUnsafe()));
        } catch (const std::bad_alloc&)
        {
            return Fail<JsonDocument>(ctx, ParseErrorCode::OutOfMemory, "Allocation failed");
        }
    }

    JNAV::Utilities::Expected<JsonDocument, ParseError>
    JsonParser::Parse(std::span<const JNAV::Byte> input, const JsonParseOptions& options)
    {
        return Parse(std::string_view {reinterpret_cast<const char*>(input.data()), input.size()}, options);
    }
}// namespace JNAV::Serialization
