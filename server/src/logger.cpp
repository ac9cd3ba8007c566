/*
 * 설명: 구조화 로그 레코드를 만들고 싱크로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/logger_test.cpp
 */
#include "wallet/logger.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "wallet/api_response.hpp"

namespace wallet {
namespace {
constexpr std::array<std::string_view, 4> kReservedKeys{"timestamp", "level", "service", "message"};

bool IsReserved(const std::string& key) {
  for (auto reserved : kReservedKeys) {
    if (key == reserved) {
      return true;
    }
  }
  return false;
}

void WriteToConsole(const LogRecord& record, const nlohmann::json& line) {
  if (record.level == LogLevel::kError) {
    std::cerr << DumpJson(line) << std::endl;
  } else {
    std::cout << DumpJson(line) << std::endl;
  }
}

void OpenForAppend(std::ofstream& file, const std::filesystem::path& path) {
  file.open(path, std::ios::out | std::ios::app);
  if (!file) {
    throw std::runtime_error("cannot open log file " + path.string());
  }
}
}  // namespace

std::string ErrorLogPath(const std::string& combined_path) {
  std::filesystem::path path(combined_path);
  auto name = path.stem().string() + "-error" + path.extension().string();
  return (path.parent_path() / name).string();
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Logger::Logger(std::string service, LogLevel min_level)
    : service_(std::move(service)), min_level_(min_level), sink_(WriteToConsole) {}

void Logger::Debug(std::string_view message, const nlohmann::json& fields) const {
  Log(LogLevel::kDebug, message, fields);
}

void Logger::Info(std::string_view message, const nlohmann::json& fields) const {
  Log(LogLevel::kInfo, message, fields);
}

void Logger::Warn(std::string_view message, const nlohmann::json& fields) const {
  Log(LogLevel::kWarn, message, fields);
}

void Logger::Error(std::string_view message, const nlohmann::json& fields) const {
  Log(LogLevel::kError, message, fields);
}

void Logger::Log(LogLevel level, std::string_view message, const nlohmann::json& fields) const {
  if (static_cast<int>(level) < static_cast<int>(min_level_.load())) {
    return;
  }
  LogRecord record{level, std::string(message), fields.is_object() ? fields : nlohmann::json::object()};

  nlohmann::json line;
  line["timestamp"] = CurrentTimestamp();
  line["level"] = ToString(level);
  line["service"] = service_;
  line["message"] = record.message;
  for (const auto& item : record.fields.items()) {
    if (!IsReserved(item.key())) {
      line[item.key()] = item.value();
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sink_(record, line);
  if (combined_file_.is_open()) {
    auto text = DumpJson(line);
    combined_file_ << text << '\n' << std::flush;
    if (level == LogLevel::kError && error_file_.is_open()) {
      error_file_ << text << '\n' << std::flush;
    }
  }
}

void Logger::OpenLogFiles(const std::string& combined_path) {
  std::filesystem::path combined(combined_path);
  std::filesystem::path error(ErrorLogPath(combined_path));
  std::error_code ec;
  if (combined.has_parent_path()) {
    std::filesystem::create_directories(combined.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create log directory " + combined.parent_path().string() + ": " +
                               ec.message());
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  combined_file_.close();
  error_file_.close();
  OpenForAppend(combined_file_, combined);
  try {
    OpenForAppend(error_file_, error);
  } catch (const std::runtime_error&) {
    combined_file_.close();
    throw;
  }
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = sink ? std::move(sink) : Sink(WriteToConsole);
}

std::string Logger::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

}  // namespace wallet
