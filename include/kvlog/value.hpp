/**
 * @file value.hpp
 * @brief Tagged value used for format arguments and field pairs
 * @brief 用于格式化参数和字段对的带标签值
 *
 * Every argument of a logging call is converted to a Value at the call
 * site. The classifier then decides, per position, whether the Value is a
 * printf substitution, a field key, a field value or the record's error.
 *
 * 日志调用的每个参数都在调用处转换为 Value。随后由分类器按位置
 * 决定该 Value 是 printf 替换参数、字段键、字段值还是记录的错误。
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "kvlog/error.hpp"

namespace kvlog {

/**
 * @brief Heterogeneous log argument
 * @brief 异构日志参数
 *
 * Conversion rules / 转换规则:
 * - nullptr                       -> Null
 * - bool                          -> Bool
 * - char                          -> String of one character
 * - signed / unsigned integers    -> Int / Uint
 * - enums                         -> Int or Uint of the underlying value
 * - floating point                -> Double
 * - anything convertible to string_view -> String
 * - kvlog::Error                  -> Error
 * - std::exception and derived    -> Error(what())
 * - any other type with an fmt formatter -> String(fmt::to_string(v))
 */
class Value {
public:
    /**
     * @brief Value kind
     * @brief 值类型
     */
    enum class Kind : uint8_t { Null = 0, Bool, Int, Uint, Double, String, Error };

    Value() noexcept = default;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value>>>
    Value(T&& v)  // NOLINT(google-explicit-constructor)
        : m_data(Convert(std::forward<T>(v))) {}

    Kind GetKind() const noexcept { return static_cast<Kind>(m_data.index()); }

    bool IsNull() const noexcept { return GetKind() == Kind::Null; }
    bool IsString() const noexcept { return GetKind() == Kind::String; }
    bool IsError() const noexcept { return GetKind() == Kind::Error; }

    bool AsBool() const { return std::get<bool>(m_data); }
    int64_t AsInt() const { return std::get<int64_t>(m_data); }
    uint64_t AsUint() const { return std::get<uint64_t>(m_data); }
    double AsDouble() const { return std::get<double>(m_data); }
    const std::string& AsString() const { return std::get<std::string>(m_data); }
    const Error& AsError() const { return std::get<Error>(m_data); }

    /**
     * @brief Plain text form ("null", "true", "42", message of an error)
     * @brief 纯文本形式
     */
    std::string ToString() const;

    /**
     * @brief Append the JSON encoding of this value
     * @brief 追加该值的 JSON 编码
     */
    void AppendJson(std::string& out) const;

    /**
     * @brief Push this value into a printf argument store
     * @brief 将该值压入 printf 参数存储
     */
    template <typename Store>
    void PushTo(Store& store) const {
        std::visit(
            [&store](const auto& v) {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::monostate>) {
                    store.push_back(std::string_view("<nil>"));
                } else if constexpr (std::is_same_v<V, Error>) {
                    store.push_back(v.IsNil() ? std::string("<nil>") : v.Message());
                } else {
                    store.push_back(v);
                }
            },
            m_data);
    }

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.m_data == rhs.m_data; }
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    using Storage =
        std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, Error>;

    template <typename T>
    static Storage Convert(T&& v) {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::nullptr_t>) {
            return std::monostate{};
        } else if constexpr (std::is_same_v<D, bool>) {
            return v;
        } else if constexpr (std::is_same_v<D, char>) {
            return std::string(1, v);
        } else if constexpr (std::is_enum_v<D>) {
            return Convert(static_cast<std::underlying_type_t<D>>(v));
        } else if constexpr (std::is_integral_v<D> && std::is_signed_v<D>) {
            return static_cast<int64_t>(v);
        } else if constexpr (std::is_integral_v<D>) {
            return static_cast<uint64_t>(v);
        } else if constexpr (std::is_floating_point_v<D>) {
            return static_cast<double>(v);
        } else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
            const char* text = v;
            if (text == nullptr) {
                return std::monostate{};
            }
            return std::string(text);
        } else if constexpr (std::is_convertible_v<const D&, std::string_view>) {
            return std::string(std::string_view(v));
        } else if constexpr (std::is_same_v<D, Error>) {
            return std::forward<T>(v);
        } else if constexpr (std::is_base_of_v<std::exception, D>) {
            return Error::FromException(v);
        } else {
            static_assert(fmt::is_formattable<D>::value,
                          "kvlog::Value: type has no fmt formatter");
            return fmt::to_string(v);
        }
    }

    Storage m_data;
};

/// Flat argument list of a logging call / 日志调用的扁平参数列表
using ValueList = std::vector<Value>;

/**
 * @brief One key/value attribute of a record
 * @brief 记录的一个键值属性
 */
struct Field {
    std::string key;
    Value value;
};

/// Ordered fields of a record / 记录的有序字段
using FieldList = std::vector<Field>;

/**
 * @brief Build a ValueList from a parameter pack
 * @brief 从参数包构建 ValueList
 */
template <typename... Args>
ValueList MakeValues(Args&&... args) {
    ValueList values;
    values.reserve(sizeof...(Args));
    (values.emplace_back(std::forward<Args>(args)), ...);
    return values;
}

}  // namespace kvlog
