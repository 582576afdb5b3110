#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace migrator::runtime::config {
class RuntimeConfig;
}

namespace migrator::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

/*
  Transfer log file name:

      <YYYY-MM-DD_HH-MM-SS>_<source>_to_<destination>.log

  Path separators in either name are replaced so the result is one file.
*/
std::string TransferLogFileName(std::string_view source, std::string_view destination, util::TimePoint started_at);

/*
  Console sink always; the transfer log file sink when log_file is set.
*/
void InitializeLogging(const migrator::runtime::config::RuntimeConfig& config,
                       const std::optional<std::filesystem::path>& log_file = std::nullopt);
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

} // namespace migrator::observability

#define MIGRATOR_LOG_DEBUG(message, ...) ::migrator::observability::LogDebug((message), ##__VA_ARGS__)
#define MIGRATOR_LOG_INFO(message, ...) ::migrator::observability::LogInfo((message), ##__VA_ARGS__)
#define MIGRATOR_LOG_WARN(message, ...) ::migrator::observability::LogWarn((message), ##__VA_ARGS__)
#define MIGRATOR_LOG_ERROR(message, ...) ::migrator::observability::LogError((message), ##__VA_ARGS__)
