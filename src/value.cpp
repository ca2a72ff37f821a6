/**
 * @file value.cpp
 * @brief Value text and JSON encoding
 * @brief Value 的文本与 JSON 编码
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/value.hpp"

#include <cmath>
#include <iterator>

#include "kvlog/format.hpp"

namespace kvlog {

std::string Value::ToString() const {
    switch (GetKind()) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return AsBool() ? "true" : "false";
        case Kind::Int:
            return fmt::to_string(AsInt());
        case Kind::Uint:
            return fmt::to_string(AsUint());
        case Kind::Double:
            return fmt::to_string(AsDouble());
        case Kind::String:
            return AsString();
        case Kind::Error:
            return AsError().IsNil() ? "null" : AsError().Message();
    }
    return {};
}

void Value::AppendJson(std::string& out) const {
    switch (GetKind()) {
        case Kind::Null:
            out += "null";
            break;
        case Kind::Bool:
            out += AsBool() ? "true" : "false";
            break;
        case Kind::Int:
            fmt::format_to(std::back_inserter(out), "{}", AsInt());
            break;
        case Kind::Uint:
            fmt::format_to(std::back_inserter(out), "{}", AsUint());
            break;
        case Kind::Double: {
            const double d = AsDouble();
            // JSON has no NaN or Inf literals / JSON 没有 NaN 与 Inf 字面量
            if (std::isnan(d)) {
                out += "\"NaN\"";
            } else if (std::isinf(d)) {
                out += d > 0 ? "\"+Inf\"" : "\"-Inf\"";
            } else {
                fmt::format_to(std::back_inserter(out), "{}", d);
            }
            break;
        }
        case Kind::String:
            JsonFormat::AppendString(out, AsString());
            break;
        case Kind::Error:
            if (AsError().IsNil()) {
                out += "null";
            } else {
                JsonFormat::AppendString(out, AsError().Message());
            }
            break;
    }
}

}  // namespace kvlog
