#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace photosift::runtime::config {
class RuntimeConfig;
}

namespace photosift::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// "key=value key2=value2"; values with spaces or quotes are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// stdout, plus logging.file when set. Safe to call again with another config.
void InitializeLogging(const photosift::runtime::config::RuntimeConfig& config);
void FlushLogging();
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

} // namespace photosift::observability

#define PHOTOSIFT_LOG_DEBUG(message, ...) ::photosift::observability::LogDebug((message), ##__VA_ARGS__)
#define PHOTOSIFT_LOG_INFO(message, ...) ::photosift::observability::LogInfo((message), ##__VA_ARGS__)
#define PHOTOSIFT_LOG_WARN(message, ...) ::photosift::observability::LogWarn((message), ##__VA_ARGS__)
#define PHOTOSIFT_LOG_ERROR(message, ...) ::photosift::observability::LogError((message), ##__VA_ARGS__)
