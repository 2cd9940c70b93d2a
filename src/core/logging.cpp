#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>

#include "../control/config.hpp"
#include "crypto.hpp"
#include "string_utils.hpp"

namespace accord::logging {

namespace {

std::once_flag g_backend_once;
std::atomic<quill::Logger*> g_logger{nullptr};
std::mutex g_logger_mutex;

quill::LogLevel parse_level(std::string_view level) {
  auto lower = core::to_lower(level);
  if (lower == "debug") {
    return quill::LogLevel::Debug;
  } else if (lower == "warning" || lower == "warn") {
    return quill::LogLevel::Warning;
  } else if (lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

// Base UUID v4, generated once per thread
std::string generate_base_uuid() {
  std::mt19937 rng(std::random_device{}() ^
                   static_cast<uint32_t>(
                       std::chrono::steady_clock::now().time_since_epoch().count()));
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 4) {
    uint32_t v = dist(rng);
    bytes[i] = static_cast<uint8_t>(v & 0xFF);
    bytes[i + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    bytes[i + 2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    bytes[i + 3] = static_cast<uint8_t>((v >> 24) & 0xFF);
  }
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    fmt::format_to(std::back_inserter(out), "{:02x}", bytes[i]);
  }
  return out;
}

bool is_hex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // namespace

void init_logging_system() {
  std::call_once(g_backend_once, [] { quill::Backend::start(); });
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  init_logging_system();
  std::filesystem::create_directories(log_config.output);

  quill::RotatingFileSinkConfig config;
  config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
  config.set_max_backup_files(log_config.rotation.max_files);
  config.set_open_mode('a');

  std::string log_path = fmt::format("{}/accord.log", log_config.output);

  std::lock_guard lock(g_logger_mutex);
  quill::Logger* logger = nullptr;
  if (log_config.format == "json") {
    auto sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
    logger = quill::Frontend::create_or_get_logger("accord_json", std::move(sink));
  } else {
    auto sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
    logger = quill::Frontend::create_or_get_logger("accord", std::move(sink));
  }

  logger->set_log_level(parse_level(log_config.level));
  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    return logger;
  }

  init_logging_system();
  std::lock_guard lock(g_logger_mutex);
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    return logger;
  }
  auto sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("accord_console");
  auto* logger = quill::Frontend::create_or_get_logger("accord_console", std::move(sink));
  g_logger.store(logger, std::memory_order_release);
  return logger;
}

std::string generate_request_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;
  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_request_id(std::string_view request_id) {
  size_t hash_pos = request_id.rfind('#');
  if (hash_pos == std::string_view::npos) {
    return false;
  }

  std::string_view uuid = request_id.substr(0, hash_pos);
  std::string_view counter = request_id.substr(hash_pos + 1);

  if (uuid.size() != 36 || uuid[8] != '-' || uuid[13] != '-' || uuid[18] != '-' ||
      uuid[23] != '-') {
    return false;
  }
  if (uuid[14] != '4') {
    return false;
  }
  char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(uuid[19])));
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b') {
    return false;
  }
  for (size_t i = 0; i < uuid.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23)
      continue;
    if (!is_hex(uuid[i]))
      return false;
  }

  if (counter.empty()) {
    return false;
  }
  return std::all_of(counter.begin(), counter.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string token_fingerprint(std::string_view token) {
  return core::sha256_hex(token).substr(0, 12);
}

}  // namespace accord::logging
