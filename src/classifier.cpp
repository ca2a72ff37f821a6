/**
 * @file classifier.cpp
 * @brief Argument classifier implementation
 * @brief 参数分类器实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/classifier.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/args.h>
#include <fmt/printf.h>

namespace kvlog {

namespace {

// Text used by the print family, nil values print as "<nil>"
std::string PrintText(const Value& value) {
    if (value.IsNull()) {
        return "<nil>";
    }
    if (value.IsError() && value.AsError().IsNil()) {
        return "<nil>";
    }
    return value.ToString();
}

}  // namespace

size_t CountPlaceholders(std::string_view message) noexcept {
    return static_cast<size_t>(std::count(message.begin(), message.end(), '%'));
}

FormatSplit SplitFormatArgs(std::string_view message, ValueList args) {
    FormatSplit split;
    const size_t placeholders = CountPlaceholders(message);

    if (placeholders == 0) {
        split.fieldArgs = std::move(args);
        return split;
    }
    if (placeholders >= args.size()) {
        split.formatArgs = std::move(args);
        return split;
    }

    split.formatArgs.assign(std::make_move_iterator(args.begin()),
                            std::make_move_iterator(args.begin() + placeholders));
    split.fieldArgs.assign(std::make_move_iterator(args.begin() + placeholders),
                           std::make_move_iterator(args.end()));
    return split;
}

std::string RenderMessage(std::string_view message, const ValueList& formatArgs) {
    if (formatArgs.empty()) {
        return std::string(message);
    }

    fmt::dynamic_format_arg_store<fmt::printf_context> store;
    store.reserve(formatArgs.size(), 0);
    for (const auto& arg : formatArgs) {
        arg.PushTo(store);
    }

    try {
        return fmt::vsprintf(fmt::string_view(message.data(), message.size()), store);
    } catch (const fmt::format_error&) {
        // Malformed format, log it as is / 格式错误，原样记录
        return std::string(message);
    }
}

std::optional<Error> ExtractError(ValueList& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (!fields[i].IsError()) {
            continue;
        }
        Error err = fields[i].AsError();
        // Odd index is a value slot, its key goes with it
        // 奇数下标是值位置，其键一并移除
        const size_t first = (i % 2 == 1) ? i - 1 : i;
        fields.erase(fields.begin() + static_cast<std::ptrdiff_t>(first),
                     fields.begin() + static_cast<std::ptrdiff_t>(i + 1));
        return err;
    }
    return std::nullopt;
}

FieldList BuildFields(const ValueList& fields) {
    FieldList result;
    result.reserve((fields.size() + 1) / 2);
    for (size_t i = 0; i < fields.size(); i += 2) {
        if (i + 1 < fields.size()) {
            result.push_back(Field{fields[i].ToString(), fields[i + 1]});
        } else {
            result.push_back(Field{fields[i].ToString(), Value()});
        }
    }
    return result;
}

std::string Sprint(const ValueList& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0 && !values[i - 1].IsString() && !values[i].IsString()) {
            out += ' ';
        }
        out += PrintText(values[i]);
    }
    return out;
}

std::string Sprintln(const ValueList& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += PrintText(values[i]);
    }
    out += '\n';
    return out;
}

}  // namespace kvlog
