#include "dmk/log.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>
#endif

namespace dmk::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::string g_app_name = "dmk";
std::filesystem::path g_root_path;
bool g_console = true;

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

std::string format_now(const char* fmt) {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level + "] " + std::string(msg);
  if (g_console) {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& root) {
  g_app_name = app_name;
  g_root_path = root;
  const std::filesystem::path log_dir = g_root_path / "build" / "logs";
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  if (ec) {
    log_line("WARN", "log dir unavailable; file logging disabled: " + ec.message());
    return;
  }
  const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
  g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
  log_line("INFO", "log init");
#if defined(_WIN32)
  log_line("INFO", "platform: windows");
#elif defined(__linux__)
  log_line("INFO", "platform: linux");
#else
  log_line("INFO", "platform: unknown");
#endif
#ifdef DMK_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_console(bool enabled) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_console = enabled;
}

void debug(std::string_view msg) {
#ifdef DMK_DEBUG
  log_line("DEBUG", msg);
#else
  (void)msg;
#endif
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

namespace {
void signal_handler(int sig) {
  log_line("ERROR", std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}

#if defined(_WIN32)
LONG WINAPI exception_filter(EXCEPTION_POINTERS*) {
  log_line("ERROR", "unhandled exception");
  return EXCEPTION_EXECUTE_HANDLER;
}
#endif
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
#if defined(_WIN32)
  SetUnhandledExceptionFilter(exception_filter);
#endif
}

} // namespace dmk::log
