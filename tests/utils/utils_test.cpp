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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

#include "concurrency/thread_pool.hpp"
#include "type/hash_type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/id/id_generator.hpp"
#include "utils/log/logger.hpp"
#include "utils/queue/queue.hpp"

namespace arcvault {
TEST(ConcurrentQueueTest, TryPushDropsOldestWhenFull) {
  ConcurrentBlockingQueue<int> queue(2);
  EXPECT_TRUE(queue.TryPush(1));
  EXPECT_TRUE(queue.TryPush(2));
  EXPECT_FALSE(queue.TryPush(3));
  EXPECT_EQ(queue.size(), 2u);
  EXPECT_EQ(queue.pop(), 2);
  EXPECT_EQ(queue.TryPop().value_or(-1), 3);
  EXPECT_FALSE(queue.TryPop().has_value());
  EXPECT_FALSE(queue.PopFor(std::chrono::milliseconds(5)).has_value());
}

TEST(ThreadPoolTest, FailingTaskDoesNotStopWorker) {
  ThreadPool       pool(2, "test");
  std::atomic<int> done{0};
  pool.Submit([] { throw std::runtime_error("task failed"); });
  for (int i = 0; i < 10; ++i) {
    pool.Submit([&done] { done.fetch_add(1); });
  }
  pool.WaitIdle();
  EXPECT_EQ(done.load(), 10);
  EXPECT_EQ(pool.Pending(), 0u);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewTasks) {
  ThreadPool       pool(1, "test");
  std::atomic<int> done{0};
  for (int i = 0; i < 5; ++i) {
    pool.Submit([&done] {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      done.fetch_add(1);
    });
  }
  pool.Shutdown();
  EXPECT_EQ(done.load(), 5);
  EXPECT_THROW(pool.Submit([] {}), std::runtime_error);
  EXPECT_NO_THROW(pool.Shutdown());
  EXPECT_THROW(ThreadPool(0, "empty"), std::invalid_argument);
}

TEST(Checksum64Test, HexRoundTripAndFileDigest) {
  const std::string data = "arc vault checksum payload";
  auto              sum  = Checksum64::Compute(data.data(), data.size());
  auto              hex  = sum.ToString();
  EXPECT_EQ(hex.size(), 16u);
  EXPECT_EQ(Checksum64::FromString(hex), sum);
  EXPECT_THROW(Checksum64::FromString("abc"), std::invalid_argument);

  auto path = std::filesystem::temp_directory_path() / EntityID::Generate("checksum");
  {
    std::ofstream out(path, std::ios::binary);
    out << data;
  }
  EXPECT_EQ(Checksum64::ComputeFile(path), sum);
  std::filesystem::remove(path);
  EXPECT_THROW(Checksum64::ComputeFile(path), std::runtime_error);
}

TEST(EntityIdTest, IdsAreUniqueAndPrefixed) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(EntityID::Generate("card"));
  }
  EXPECT_EQ(ids.size(), 1000u);
  EXPECT_EQ(ids.begin()->rfind("card_", 0), 0u);
}

TEST(TimeProviderTest, IsoTimestampsAreUtcWithMillis) {
  TimeProvider::Refresh();
  static const std::regex kIso{R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)"};
  EXPECT_TRUE(std::regex_match(TimeProvider::NowIso(), kIso));
  auto first = TimeProvider::NowMillis();
  EXPECT_GE(TimeProvider::NowMillis(), first);
}

TEST(LoggerTest, LevelNamesAndNamedLoggers) {
  EXPECT_EQ(Logger::LevelFromString("debug"), spdlog::level::debug);
  EXPECT_EQ(Logger::LevelFromString("off"), spdlog::level::off);
  EXPECT_EQ(Logger::LevelFromString("nonsense"), spdlog::level::info);
  auto storage = Logger::Storage();
  ASSERT_NE(storage, nullptr);
  EXPECT_EQ(storage->name(), "storage");
  EXPECT_EQ(Logger::Storage(), storage);
}
}  // namespace arcvault
