#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "rf_logger/error.hpp"
#include "rf_logger/sinks/callback_sink.hpp"
#include "rf_logger/sinks/file_sink.hpp"
#include "rf_logger/sync_writer.hpp"
#include "test_fs_util.hpp"

using rf_logger::LogErrc;
using rf_logger::SyncWriter;

namespace
{

constexpr int kThreads = 8;
constexpr int kPerThread = 500;

// "T<t>-<i>-" followed by 64 copies of thread t's fill character.
void write_from_threads(SyncWriter& writer)
{
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
        [&writer, t]
        {
          for (int i = 0; i < kPerThread; ++i)
          {
            std::string line = "T" + std::to_string(t) + "-" + std::to_string(i) + "-";
            line.append(64, static_cast<char>('a' + t));
            EXPECT_FALSE(writer.WriteLine(line));
          }
        });
  }
  for (auto& th : threads)
  {
    th.join();
  }
}

// Every line present once, whole, and in per-thread order.
void expect_all_lines(const std::vector<std::string>& lines)
{
  ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));

  std::set<std::string> unique(lines.begin(), lines.end());
  EXPECT_EQ(unique.size(), lines.size());

  std::map<int, int> next;
  for (const auto& line : lines)
  {
    ASSERT_EQ(line[0], 'T');
    size_t dash = line.find('-');
    size_t dash2 = line.find('-', dash + 1);
    ASSERT_NE(dash2, std::string::npos) << line;
    int t = std::stoi(line.substr(1, dash - 1));
    int i = std::stoi(line.substr(dash + 1, dash2 - dash - 1));
    // each tail is one thread's fill character, so no partial writes
    EXPECT_EQ(line.substr(dash2 + 1), std::string(64, static_cast<char>('a' + t))) << line;
    EXPECT_EQ(i, next[t]);
    next[t] = i + 1;
  }
}

}  // namespace

TEST(SyncWriter, WritesThroughToSink)
{
  std::vector<std::string> lines;
  SyncWriter writer(std::make_unique<rf_logger::CallbackSink>(
      [&](std::string_view line)
      {
        lines.emplace_back(line);
        return std::error_code();
      }));

  EXPECT_FALSE(writer.WriteLine("one"));
  EXPECT_FALSE(writer.Submit("two"));
  EXPECT_EQ(lines, (std::vector<std::string>{"one", "two"}));
}

TEST(SyncWriter, ReturnsSinkError)
{
  SyncWriter writer(std::make_unique<rf_logger::CallbackSink>(
      [](std::string_view) { return std::make_error_code(std::errc::no_space_on_device); }));

  EXPECT_EQ(writer.WriteLine("x"), std::errc::no_space_on_device);
}

TEST(SyncWriter, RejectsAfterShutdown)
{
  int calls = 0;
  SyncWriter writer(std::make_unique<rf_logger::CallbackSink>(
      [&](std::string_view)
      {
        ++calls;
        return std::error_code();
      }));

  EXPECT_EQ(writer.Shutdown(std::chrono::milliseconds(0)), 0u);
  EXPECT_EQ(writer.WriteLine("late"), LogErrc::kShutDown);
  EXPECT_EQ(writer.Flush(), LogErrc::kShutDown);
  EXPECT_EQ(calls, 0);
}

TEST(SyncWriter, SubmitAndCloseWritesThenCloses)
{
  std::vector<std::string> lines;
  SyncWriter writer(std::make_unique<rf_logger::CallbackSink>(
      [&](std::string_view line)
      {
        lines.emplace_back(line);
        return std::error_code();
      }));

  EXPECT_FALSE(writer.SubmitAndClose("final", std::chrono::milliseconds(100)));
  EXPECT_EQ(lines, (std::vector<std::string>{"final"}));
  EXPECT_EQ(writer.Submit("after"), LogErrc::kShutDown);
}

TEST(SyncWriter, ConcurrentLinesNeverInterleave)
{
  rf_logger_test::TempDir tmp;
  ASSERT_TRUE(tmp.Valid());

  auto sink = std::make_unique<rf_logger::FileSink>(tmp.Path(), "mt", 1 << 20, 3);
  ASSERT_FALSE(sink->Open());
  SyncWriter writer(std::move(sink));

  write_from_threads(writer);
  writer.Shutdown(std::chrono::milliseconds(0));

  expect_all_lines(rf_logger_test::read_lines(tmp.File("mt.log")));
}

TEST(SyncWriter, ConcurrentLinesSurviveRotation)
{
  rf_logger_test::TempDir tmp;
  ASSERT_TRUE(tmp.Valid());

  // 4000 lines of about 72 bytes: some 17 rotations, all backups kept.
  constexpr size_t kMaxSize = 16 * 1024;
  auto sink = std::make_unique<rf_logger::FileSink>(tmp.Path(), "mt", kMaxSize, 64);
  ASSERT_FALSE(sink->Open());
  const rf_logger::FileSink* file_sink = sink.get();
  SyncWriter writer(std::move(sink));

  write_from_threads(writer);
  uint64_t rotations = file_sink->RotationCount();
  EXPECT_EQ(file_sink->RotationFailures(), 0u);
  writer.Shutdown(std::chrono::milliseconds(0));

  EXPECT_GT(rotations, 0u);
  EXPECT_FALSE(rf_logger_test::file_exists(tmp.File("mt." + std::to_string(rotations + 1) + ".log")));

  // Oldest backup first, active file last.
  std::vector<std::string> lines;
  std::vector<std::string> files;
  for (uint64_t n = rotations; n >= 1; --n)
  {
    files.push_back(tmp.File("mt." + std::to_string(n) + ".log"));
  }
  files.push_back(tmp.File("mt.log"));
  for (const auto& path : files)
  {
    ASSERT_TRUE(rf_logger_test::file_exists(path)) << path;
    EXPECT_LE(rf_logger_test::file_size(path), kMaxSize) << path;
    auto part = rf_logger_test::read_lines(path);
    lines.insert(lines.end(), part.begin(), part.end());
  }

  expect_all_lines(lines);
}
