#pragma once

#include <JNAV/Defines.hpp>
#include <JNAV/Primitives.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace JNAV::Serialization
{
    class JsonValue;
    struct JsonMember;

    /// @brief JSON array container.
    struct JsonArray
    {
        std::vector<JsonValue> values;

        [[nodiscard]] UIntSize Size() const noexcept { return values.size(); }
    };

    /// @brief JSON object container.
    ///
    /// Members keep document order. Keys are unique: a repeated key replaces the earlier value in place.
    class JNAV_API JsonObject
    {
    public:
        [[nodiscard]] const JsonValue* Find(std::string_view key) const noexcept;
        [[nodiscard]] bool             Contains(std::string_view key) const noexcept { return Find(key) != nullptr; }

        /// @brief Inserts or replaces `key`. Returns false when an existing member was replaced.
        bool Set(std::string key, JsonValue value);

        [[nodiscard]] const std::vector<JsonMember>& Members() const noexcept { return m_members; }
        [[nodiscard]] UIntSize                       Size() const noexcept { return m_members.size(); }

    private:
        struct KeyHash
        {
            using is_transparent = void;

            [[nodiscard]] UIntSize operator()(std::string_view key) const noexcept
            {
                return std::hash<std::string_view> {}(key);
            }
        };

        std::vector<JsonMember>                                                   m_members;
        std::unordered_map<std::string, UIntSize, KeyHash, std::equal_to<>> m_index;
    };

    /// @brief Generic decoded JSON value: the decoder's output and the node builder's input.
    class JsonValue
    {
    public:
        enum class Type : UInt8
        {
            Null,
            Bool,
            Number,
            String,
            Array,
            Object,
        };

        JsonValue() noexcept = default;

        static JsonValue MakeNull() noexcept
        {
            return JsonValue {};
        }

        static JsonValue MakeBool(bool value) noexcept
        {
            JsonValue v;
            v.m_storage.emplace<bool>(value);
            return v;
        }

        static JsonValue MakeNumber(F64 value) noexcept
        {
            JsonValue v;
            v.m_storage.emplace<F64>(value);
            return v;
        }

        static JsonValue MakeString(std::string value)
        {
            JsonValue v;
            v.m_storage.emplace<std::string>(std::move(value));
            return v;
        }

        static JsonValue MakeArray(JsonArray value);
        static JsonValue MakeObject(JsonObject value);

        [[nodiscard]] Type GetType() const noexcept { return static_cast<Type>(m_storage.index()); }

        [[nodiscard]] bool IsNull() const noexcept { return GetType() == Type::Null; }
        [[nodiscard]] bool IsBool() const noexcept { return GetType() == Type::Bool; }
        [[nodiscard]] bool IsNumber() const noexcept { return GetType() == Type::Number; }
        [[nodiscard]] bool IsString() const noexcept { return GetType() == Type::String; }
        [[nodiscard]] bool IsArray() const noexcept { return GetType() == Type::Array; }
        [[nodiscard]] bool IsObject() const noexcept { return GetType() == Type::Object; }

        // Accessors require the matching type; check with Is*() or GetType() first.
        [[nodiscard]] bool               AsBool() const noexcept { return *std::get_if<bool>(&m_storage); }
        [[nodiscard]] F64                AsNumber() const noexcept { return *std::get_if<F64>(&m_storage); }
        [[nodiscard]] const std::string& AsString() const noexcept { return *std::get_if<std::string>(&m_storage); }
        [[nodiscard]] const JsonArray&   AsArray() const noexcept { return *std::get_if<JsonArray>(&m_storage); }
        [[nodiscard]] const JsonObject&  AsObject() const noexcept { return *std::get_if<JsonObject>(&m_storage); }

    private:
        // Alternative order mirrors Type.
        std::variant<std::monostate, bool, F64, std::string, JsonArray, JsonObject> m_storage {};
    };

    /// @brief Name/value member for JSON objects.
    struct JsonMember
    {
        std::string name {};
        JsonValue   value {};
    };

    inline JsonValue JsonValue::MakeArray(JsonArray value)
    {
        JsonValue v;
        v.m_storage.emplace<JsonArray>(std::move(value));
        return v;
    }

    inline JsonValue JsonValue::MakeObject(JsonObject value)
    {
        JsonValue v;
        v.m_storage.emplace<JsonObject>(std::move(value));
        return v;
    }

    /// @brief Decoded JSON document owning its root value.
    class JsonDocument
    {
    public:
        JsonDocument() = default;

        explicit JsonDocument(JsonValue root) noexcept
            : m_root(std::move(root))
        {
        }

        JsonDocument(JsonDocument&&) noexcept            = default;
        JsonDocument& operator=(JsonDocument&&) noexcept = default;
        JsonDocument(const JsonDocument&)                = delete;
        JsonDocument& operator=(const JsonDocument&)     = delete;

        [[nodiscard]] JsonValue&       Root() noexcept { return m_root; }
        [[nodiscard]] const JsonValue& Root() const noexcept { return m_root; }

    private:
        JsonValue m_root {};
    };
}// namespace JNAV::Serialization
