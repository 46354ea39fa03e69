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

#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arcvault {
/**
 * @brief Named spdlog loggers for each subsystem. Init() attaches a console and a rotating file
 * sink; before Init() every logger writes to the console only.
 */
class Logger {
 public:
  static void Init(const std::filesystem::path& log_dir,
                   spdlog::level::level_enum    level = spdlog::level::info);
  static void Shutdown();

  static auto Get(const std::string& name) -> std::shared_ptr<spdlog::logger>;

  static auto Storage() -> std::shared_ptr<spdlog::logger> { return Get("storage"); }
  static auto Integrity() -> std::shared_ptr<spdlog::logger> { return Get("integrity"); }
  static auto Archive() -> std::shared_ptr<spdlog::logger> { return Get("archive"); }
  static auto App() -> std::shared_ptr<spdlog::logger> { return Get("app"); }

  static auto LevelFromString(const std::string& level) -> spdlog::level::level_enum;

 private:
  static auto MakeLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

  inline static std::mutex                    _mtx;
  inline static std::vector<spdlog::sink_ptr> _sinks;
  inline static spdlog::level::level_enum     _level = spdlog::level::info;
};
};  // namespace arcvault
