#include "logging.hpp"

#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/JsonConsoleSink.h>
#include <quill/sinks/JsonFileSink.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#include "../control/config.hpp"

namespace regmock::logging {

static std::atomic<quill::Logger*> g_current_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

static quill::PatternFormatterOptions make_pattern() {
  // Timestamped, leveled line: 2025-01-01T12:00:00.123Z [INFO] message
  return quill::PatternFormatterOptions{"%(time) [%(log_level)] %(message)",
                                        "%Y-%m-%dT%H:%M:%S.%QmsZ", quill::Timezone::GmtTime};
}

quill::Logger* init_service_logger(const control::LogConfig& log_config) {
  std::shared_ptr<quill::Sink> sink;
  bool json = log_config.format == "json";

  if (!log_config.file.empty()) {
    std::filesystem::path log_path{log_config.file};
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }

    quill::FileSinkConfig config;
    config.set_open_mode('a');

    if (json) {
      sink = quill::Frontend::create_or_get_sink<quill::JsonFileSink>(
          log_config.file, config, quill::FileEventNotifier{});
    } else {
      sink = quill::Frontend::create_or_get_sink<quill::FileSink>(
          log_config.file, config, quill::FileEventNotifier{});
    }
  } else if (json) {
    sink = quill::Frontend::create_or_get_sink<quill::JsonConsoleSink>("regmock_json_console");
  } else {
    sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("regmock_console");
  }

  quill::Logger* logger = quill::Frontend::create_or_get_logger(
      fmt::format("regmock:{}", log_config.file.empty() ? "console" : log_config.file),
      std::move(sink), make_pattern());

  std::string level_lower = log_config.level;
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (level_lower == "debug") {
    logger->set_log_level(quill::LogLevel::Debug);
  } else if (level_lower == "info") {
    logger->set_log_level(quill::LogLevel::Info);
  } else if (level_lower == "warning" || level_lower == "warn") {
    logger->set_log_level(quill::LogLevel::Warning);
  } else if (level_lower == "error") {
    logger->set_log_level(quill::LogLevel::Error);
  } else {
    logger->set_log_level(quill::LogLevel::Info);
  }

  g_current_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_current_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger.load(std::memory_order_acquire);
}

// Generate base UUID v4 (called once per thread)
static std::string generate_base_uuid() {
  std::mt19937 rng(std::random_device{}() ^
                   std::chrono::steady_clock::now().time_since_epoch().count());
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> uuid_bytes{};
  for (size_t i = 0; i < 16; i += 4) {
    uint32_t random_val = dist(rng);
    uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
    uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
    uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
    uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
  }

  // Version 4, RFC4122 variant
  uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
  uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');

  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(uuid_bytes[i]);
  }

  return oss.str();
}

std::string generate_request_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

}  // namespace regmock::logging
