#include "courtline/log.h"

#include <atomic>
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

namespace courtline::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::string g_app_name = "courtline";
std::filesystem::path g_root_path;
std::atomic<bool> g_verbose{false};

std::string format_now(const char* pattern) {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level + "] " + std::string(msg);
  // stdout carries command output (JSON), so the console copy goes to stderr.
  std::cerr << line << "\n";
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& root) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    g_root_path = root;
    const std::filesystem::path log_dir = g_root_path / "build" / "logs";
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    if (!ec) {
      const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
      g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
    }
  }
  log_line("INFO", "log init");
#ifdef COURTLINE_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
#ifdef COURTLINE_GIT_HASH
  log_line("INFO", std::string("git: ") + COURTLINE_GIT_HASH);
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_verbose(bool verbose) {
  g_verbose.store(verbose);
}

bool verbose() {
  return g_verbose.load();
}

void debug(std::string_view msg) {
  if (!g_verbose.load()) return;
  log_line("DEBUG", msg);
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
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace courtline::log
