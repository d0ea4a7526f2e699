#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace market::runtime::config {
class RuntimeConfig;
}

namespace market::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, util::Duration value);
LogField TimeField(std::string_view key, util::TimePoint value);

void InitializeLogging(const market::runtime::config::RuntimeConfig& config);
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

inline void LogCritical(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::critical, message, fields);
}

} // namespace market::observability

#define MARKET_LOG_DEBUG(message, ...) ::market::observability::LogDebug((message), ##__VA_ARGS__)
#define MARKET_LOG_INFO(message, ...) ::market::observability::LogInfo((message), ##__VA_ARGS__)
#define MARKET_LOG_WARN(message, ...) ::market::observability::LogWarn((message), ##__VA_ARGS__)
#define MARKET_LOG_ERROR(message, ...) ::market::observability::LogError((message), ##__VA_ARGS__)
#define MARKET_LOG_CRITICAL(message, ...) ::market::observability::LogCritical((message), ##__VA_ARGS__)
