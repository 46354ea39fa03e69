//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/log/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <iostream>

namespace arcvault {
namespace {
constexpr std::array<const char*, 4> kSubsystems = {"storage", "integrity", "archive", "app"};
constexpr size_t                     kMaxLogSize = 1024 * 1024 * 10;
constexpr size_t                     kMaxLogFiles = 3;
}  // namespace

void Logger::Init(const std::filesystem::path& log_dir, spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(_mtx);
  std::error_code             ec;
  std::filesystem::create_directories(log_dir, ec);

  _sinks.clear();
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_level(level);
  _sinks.push_back(console_sink);

  if (!ec) {
    try {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          (log_dir / "arcvault.log").string(), kMaxLogSize, kMaxLogFiles);
      file_sink->set_level(level);
      _sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "[Logger] Failed to open log file: " << e.what() << std::endl;
    }
  } else {
    std::cerr << "[Logger] Failed to create log directory " << log_dir << ": " << ec.message()
              << std::endl;
  }
  _level = level;

  // Re-register with the new sinks
  for (const auto* name : kSubsystems) {
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, _sinks.begin(), _sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
  }
}

void Logger::Shutdown() {
  std::lock_guard<std::mutex> lock(_mtx);
  for (const auto* name : kSubsystems) {
    spdlog::drop(name);
  }
  _sinks.clear();
}

auto Logger::Get(const std::string& name) -> std::shared_ptr<spdlog::logger> {
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  std::lock_guard<std::mutex> lock(_mtx);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  return MakeLogger(name);
}

auto Logger::MakeLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
  std::shared_ptr<spdlog::logger> logger;
  if (_sinks.empty()) {
    logger = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  } else {
    logger = std::make_shared<spdlog::logger>(name, _sinks.begin(), _sinks.end());
  }
  logger->set_level(_level);
  spdlog::register_logger(logger);
  return logger;
}

auto Logger::LevelFromString(const std::string& level) -> spdlog::level::level_enum {
  auto parsed = spdlog::level::from_str(level);
  // from_str() maps unknown names to "off"
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}
};  // namespace arcvault
