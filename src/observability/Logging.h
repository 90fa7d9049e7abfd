#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
using Fields = std::unordered_map<std::string, FieldValue>;

enum class LogLevel { DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

void set_log_level(LogLevel level);
LogLevel log_level();

// "abcdef...wxyz" for long secrets, "***" otherwise.
std::string mask_secret(const std::string& secret);

}
