/*
 * 설명: 서비스 전역 구조화 로그(JSON 한 줄)와 요청 추적 ID를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/logger_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wallet {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::string_view ToString(LogLevel level);
LogLevel ParseLogLevel(std::string_view text);

// logs/wallet-service.log -> logs/wallet-service-error.log
std::string ErrorLogPath(const std::string& combined_path);

struct LogRecord {
  LogLevel level;
  std::string message;
  nlohmann::json fields;
};

class Logger {
 public:
  using Sink = std::function<void(const LogRecord&, const nlohmann::json&)>;

  explicit Logger(std::string service, LogLevel min_level = LogLevel::kInfo);

  void Debug(std::string_view message, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Info(std::string_view message, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Warn(std::string_view message, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Error(std::string_view message, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Log(LogLevel level, std::string_view message, const nlohmann::json& fields) const;

  // 기본 싱크는 stdout(error는 stderr)에 JSON 한 줄을 쓴다.
  void SetSink(Sink sink);
  // 싱크와 별도로 combined_path에 모든 레코드를, <stem>-error<ext>에 error 레코드를 덧붙인다.
  // 디렉터리를 만들거나 파일을 열 수 없으면 std::runtime_error를 던진다.
  void OpenLogFiles(const std::string& combined_path);
  void SetLevel(LogLevel level) { min_level_.store(level); }
  LogLevel Level() const { return min_level_.load(); }

  std::string NextTraceId();

 private:
  std::string service_;
  std::atomic<LogLevel> min_level_;
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex mutex_;
  Sink sink_;
  mutable std::ofstream combined_file_;
  mutable std::ofstream error_file_;
};

}  // namespace wallet
