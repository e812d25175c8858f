#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rf_logger/rotation_policy.hpp"
#include "test_fs_util.hpp"

using rf_logger::plan_rotation;
using rf_logger::RotationPlan;

namespace
{

std::vector<std::string> rename_pairs(const RotationPlan& plan)
{
  std::vector<std::string> out;
  for (const auto& op : plan.renames)
  {
    out.push_back(op.from + "->" + op.to);
  }
  return out;
}

}  // namespace

TEST(RotationPolicy, ShouldRotateIsStrictlyGreater)
{
  static_assert(!rf_logger::should_rotate(90, 10, 100));
  static_assert(rf_logger::should_rotate(90, 11, 100));
  static_assert(!rf_logger::should_rotate(0, 100, 100));
  static_assert(rf_logger::should_rotate(0, 101, 100));

  EXPECT_TRUE(rf_logger::should_rotate(60, 45, 100));
}

TEST(RotationPolicy, PathNames)
{
  EXPECT_EQ(rf_logger::active_path("logs/app"), "logs/app.log");
  EXPECT_EQ(rf_logger::backup_path("logs/app", 1), "logs/app.1.log");
  EXPECT_EQ(rf_logger::backup_path("logs/app", 12), "logs/app.12.log");
}

TEST(RotationPolicy, FirstRotationOnlyMovesActive)
{
  RotationPlan plan = plan_rotation("d/t", {}, 3);
  EXPECT_TRUE(plan.removals.empty());
  EXPECT_EQ(rename_pairs(plan), (std::vector<std::string>{"d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, FullSetDropsOldestAndShifts)
{
  RotationPlan plan = plan_rotation("d/t", {1, 2, 3}, 3);
  EXPECT_EQ(plan.removals, (std::vector<std::string>{"d/t.3.log"}));
  EXPECT_EQ(rename_pairs(plan),
            (std::vector<std::string>{"d/t.2.log->d/t.3.log", "d/t.1.log->d/t.2.log",
                                      "d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, PartialSetShiftsWithoutRemoval)
{
  RotationPlan plan = plan_rotation("d/t", {1}, 3);
  EXPECT_TRUE(plan.removals.empty());
  EXPECT_EQ(rename_pairs(plan),
            (std::vector<std::string>{"d/t.1.log->d/t.2.log", "d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, MaxFilesOneKeepsSingleBackup)
{
  RotationPlan plan = plan_rotation("d/t", {1}, 1);
  EXPECT_EQ(plan.removals, (std::vector<std::string>{"d/t.1.log"}));
  EXPECT_EQ(rename_pairs(plan), (std::vector<std::string>{"d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, GapsAreCompacted)
{
  // .1 and .4 on disk: .1 -> .2, .4 -> .3
  RotationPlan plan = plan_rotation("d/t", {4, 1}, 5);
  EXPECT_TRUE(plan.removals.empty());
  EXPECT_EQ(rename_pairs(plan),
            (std::vector<std::string>{"d/t.4.log->d/t.3.log", "d/t.1.log->d/t.2.log",
                                      "d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, TailAfterGapMovedLowestFirst)
{
  RotationPlan plan = plan_rotation("d/t", {3, 5, 6}, 5);
  EXPECT_TRUE(plan.removals.empty());
  EXPECT_EQ(rename_pairs(plan),
            (std::vector<std::string>{"d/t.5.log->d/t.3.log", "d/t.6.log->d/t.4.log",
                                      "d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, SuffixesBeyondLimitRemovedHighestFirst)
{
  RotationPlan plan = plan_rotation("d/t", {1, 2, 3, 7, 9}, 2);
  EXPECT_EQ(plan.removals, (std::vector<std::string>{"d/t.9.log", "d/t.7.log", "d/t.3.log",
                                                     "d/t.2.log"}));
  EXPECT_EQ(rename_pairs(plan),
            (std::vector<std::string>{"d/t.1.log->d/t.2.log", "d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, DuplicateSuffixesIgnored)
{
  RotationPlan plan = plan_rotation("d/t", {2, 1, 2, 1}, 4);
  EXPECT_TRUE(plan.removals.empty());
  EXPECT_EQ(rename_pairs(plan),
            (std::vector<std::string>{"d/t.2.log->d/t.3.log", "d/t.1.log->d/t.2.log",
                                      "d/t.log->d/t.1.log"}));
}

TEST(RotationPolicy, ListBackupsParsesOnlyNumberedFiles)
{
  rf_logger_test::TempDir dir;
  ASSERT_TRUE(dir.Valid());

  for (const char* name : {"app.log", "app.1.log", "app.3.log", "app.12.log", "app.01.log",
                           "app.x.log", "app.2.log.gz", "app..log", "other.1.log",
                           "app.1.2.log", "apps.4.log"})
  {
    rf_logger_test::write_file(dir.File(name), "x");
  }

  EXPECT_EQ(rf_logger::list_backups(dir.Path(), "app"), (std::vector<size_t>{1, 3, 12}));
}

TEST(RotationPolicy, ListBackupsMissingDirectory)
{
  EXPECT_TRUE(rf_logger::list_backups("/nonexistent/rf_logger_dir", "app").empty());
}
