#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace acp::runtime::config {
class RuntimeConfig;
}

namespace acp::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
// Token units rendered as a decimal string, e.g. 12500000 at 6 decimals
// becomes "12.5".
LogField AmountField(std::string_view key, std::uint64_t units, std::uint32_t decimals);

void InitializeLogging(const acp::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace acp::observability

#define ACP_LOG_DEBUG(message, ...) ::acp::observability::LogDebug((message), ##__VA_ARGS__)
#define ACP_LOG_INFO(message, ...) ::acp::observability::LogInfo((message), ##__VA_ARGS__)
#define ACP_LOG_WARN(message, ...) ::acp::observability::LogWarn((message), ##__VA_ARGS__)
#define ACP_LOG_ERROR(message, ...) ::acp::observability::LogError((message), ##__VA_ARGS__)
