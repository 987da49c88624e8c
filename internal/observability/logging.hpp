#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace upgrader::runtime::config {
class RuntimeConfig;
}

namespace upgrader::model {
struct StepKey;
}

namespace upgrader::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Expands to file_id=.. upgrader_id=.. when serialized.
LogField StepField(const upgrader::model::StepKey& key);

void InitializeLogging(const upgrader::runtime::config::RuntimeConfig& config);
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

} // namespace upgrader::observability

#define UPGRADER_LOG_DEBUG(message, ...) ::upgrader::observability::LogDebug((message), ##__VA_ARGS__)
#define UPGRADER_LOG_INFO(message, ...) ::upgrader::observability::LogInfo((message), ##__VA_ARGS__)
#define UPGRADER_LOG_WARN(message, ...) ::upgrader::observability::LogWarn((message), ##__VA_ARGS__)
#define UPGRADER_LOG_ERROR(message, ...) ::upgrader::observability::LogError((message), ##__VA_ARGS__)
