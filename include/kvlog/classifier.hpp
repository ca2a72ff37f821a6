/**
 * @file classifier.hpp
 * @brief Argument classifier: format arguments, fields and embedded errors
 * @brief 参数分类器：格式化参数、字段与内嵌错误
 *
 * A formatted call such as
 *
 * @code
 * logger.Infof("copied %d of %d", done, total, "path", path, "error", err);
 * @endcode
 *
 * passes one flat argument list. The classifier splits it into the two
 * printf substitutions, the field pairs path/error, and pulls err out of
 * the fields so it can become the record's dedicated "error" attribute.
 *
 * 格式化调用只传入一个扁平参数列表。分类器将其拆分为两个 printf
 * 替换参数与字段对 path/error，并把 err 从字段中取出，作为记录专用的
 * "error" 属性。
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kvlog/error.hpp"
#include "kvlog/value.hpp"

namespace kvlog {

/**
 * @brief Result of splitting the arguments of a formatted call
 * @brief 格式化调用参数拆分结果
 */
struct FormatSplit {
    ValueList formatArgs;  ///< printf substitutions / printf 替换参数
    ValueList fieldArgs;   ///< Flat key/value list / 扁平键值列表
};

/**
 * @brief Number of '%' characters in a message
 * @brief 消息中 '%' 字符的数量
 *
 * Every '%' counts, including both characters of "%%".
 * 每个 '%' 都计数，"%%" 计为两个。
 */
size_t CountPlaceholders(std::string_view message) noexcept;

/**
 * @brief Split the arguments of a formatted call
 * @brief 拆分格式化调用的参数
 *
 * With n = CountPlaceholders(message):
 * - 0 < n <= args.size(): the first n arguments are substitutions, the rest are fields
 * - n == 0: every argument is a field and the message stays verbatim
 * - n > args.size(): every argument is a substitution
 */
FormatSplit SplitFormatArgs(std::string_view message, ValueList args);

/**
 * @brief printf-style rendering of a message
 * @brief 以 printf 风格渲染消息
 *
 * Without arguments the message is returned unchanged, so a literal '%'
 * is never interpreted. Malformed formats degrade to the raw message.
 * 无参数时原样返回消息，字面 '%' 不会被解释。格式错误时退化为原始消息。
 */
std::string RenderMessage(std::string_view message, const ValueList& formatArgs);

/**
 * @brief Remove and return the first error in a field list
 * @brief 移除并返回字段列表中的第一个错误
 *
 * The scan runs left to right and stops at the first Value holding an
 * Error. When that Value sits in a value slot its key is removed too.
 * Later errors stay in place as ordinary field values.
 *
 * 从左到右扫描，遇到第一个持有 Error 的 Value 即停止。若其位于值位置，
 * 则其键一并移除。之后的错误作为普通字段值保留。
 */
std::optional<Error> ExtractError(ValueList& fields);

/**
 * @brief Pair a flat key/value list
 * @brief 将扁平键值列表配对
 *
 * Keys use Value::ToString. An unpaired trailing key gets a null value.
 * 键使用 Value::ToString。末尾未配对的键取 null 值。
 */
FieldList BuildFields(const ValueList& fields);

/**
 * @brief Concatenate values, spaces only between two non-string operands
 * @brief 拼接值，仅在两个非字符串操作数之间加空格
 */
std::string Sprint(const ValueList& values);

/**
 * @brief Concatenate values separated by spaces, with a trailing newline
 * @brief 以空格分隔拼接值，并追加换行
 */
std::string Sprintln(const ValueList& values);

}  // namespace kvlog
