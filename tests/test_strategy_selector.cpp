#include <gtest/gtest.h>

#include "core/strategy/strategy_selector.hpp"
#include "test_utils.hpp"

using namespace ftool::core;
using ftool::infra::ErrorCode;
using ftool::test::FakeProbe;
using ftool::test::TempDir;
using ftool::test::write_file;

class StrategySelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(tmp / "a.txt", "0123456789");
        write_file(tmp / "tree" / "one", std::string(40, 'x'));
        write_file(tmp / "tree" / "sub" / "two", std::string(2, 'y'));
        std::filesystem::create_directories(tmp / "out");
    }

    auto select(Verb verb, const std::filesystem::path& source,
                std::optional<std::filesystem::path> destination = std::nullopt,
                std::size_t entry_count = 1) {
        return selector.select(PlanInput{
            .verb = verb,
            .source = source,
            .destination = std::move(destination),
            .entry_count = entry_count,
        });
    }

    TempDir tmp;
    ftool::infra::Config config;
    FakeProbe probe;
    StrategySelector selector{config, probe};
};

TEST_F(StrategySelectorTest, MoveOnSameDeviceRenames)
{
    auto plan = select(Verb::Move, tmp / "a.txt", tmp / "out");
    ASSERT_TRUE(plan);
    EXPECT_EQ(plan->strategy, Strategy::AtomicRename);
    EXPECT_EQ(plan->resolved_target_path, tmp / "out" / "a.txt");
    EXPECT_EQ(plan->size_bytes, 10u);
    EXPECT_FALSE(plan->is_directory);
}

TEST_F(StrategySelectorTest, MoveAcrossDevicesCopiesThenDeletes)
{
    probe.foreign_root = tmp / "out";
    auto plan = select(Verb::Move, tmp / "a.txt", tmp / "out");
    ASSERT_TRUE(plan);
    EXPECT_EQ(plan->strategy, Strategy::CopyThenDelete);
}

TEST_F(StrategySelectorTest, CopyIgnoresDevices)
{
    auto same = select(Verb::Copy, tmp / "a.txt", tmp / "out");
    ASSERT_TRUE(same);
    EXPECT_EQ(same->strategy, Strategy::BufferedCopy);

    probe.foreign_root = tmp / "out";
    auto other = select(Verb::Copy, tmp / "a.txt", tmp / "out");
    ASSERT_TRUE(other);
    EXPECT_EQ(other->strategy, Strategy::BufferedCopy);
}

TEST_F(StrategySelectorTest, RenameStaysInParent)
{
    auto plan = select(Verb::Rename, tmp / "a.txt", std::filesystem::path("b.txt"));
    ASSERT_TRUE(plan);
    EXPECT_EQ(plan->strategy, Strategy::AtomicRename);
    EXPECT_EQ(plan->resolved_target_path, tmp / "b.txt");
}

TEST_F(StrategySelectorTest, RemoveIsSoftDeleteWithoutProgress)
{
    auto plan = select(Verb::Remove, tmp / "tree", std::nullopt, 50);
    ASSERT_TRUE(plan);
    EXPECT_EQ(plan->strategy, Strategy::SoftDelete);
    EXPECT_EQ(plan->resolved_target_path, tmp / "tree");
    EXPECT_FALSE(plan->report_progress);
}

TEST_F(StrategySelectorTest, DirectorySizeIsRecursiveSum)
{
    auto plan = select(Verb::Copy, tmp / "tree", tmp / "out");
    ASSERT_TRUE(plan);
    EXPECT_TRUE(plan->is_directory);
    EXPECT_EQ(plan->size_bytes, 42u);
}

TEST_F(StrategySelectorTest, BackupPicksFirstFreeSuffix)
{
    write_file(tmp / "report.txt", "r");
    auto first = select(Verb::Backup, tmp / "report.txt");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->strategy, Strategy::CopyOnly);
    EXPECT_EQ(first->resolved_target_path, tmp / "report.txt.bak");

    write_file(tmp / "report.txt.bak", "1");
    write_file(tmp / "report.txt.bak2", "2");
    auto third = select(Verb::Backup, tmp / "report.txt");
    ASSERT_TRUE(third);
    EXPECT_EQ(third->resolved_target_path, tmp / "report.txt.bak3");
}

TEST_F(StrategySelectorTest, ProgressForLargeFilesOrBigBatches)
{
    config.large_file_threshold = 5;
    auto large = select(Verb::Copy, tmp / "a.txt", tmp / "out");
    ASSERT_TRUE(large);
    EXPECT_TRUE(large->report_progress);

    config.large_file_threshold = 1000;
    auto small = select(Verb::Copy, tmp / "a.txt", tmp / "out");
    ASSERT_TRUE(small);
    EXPECT_FALSE(small->report_progress);

    auto batch = select(Verb::Copy, tmp / "a.txt", tmp / "out", config.multi_entry_threshold);
    ASSERT_TRUE(batch);
    EXPECT_TRUE(batch->report_progress);
}

TEST_F(StrategySelectorTest, ChildInheritsVerbAndProgress)
{
    auto parent = select(Verb::Move, tmp / "tree", tmp / "out", 10);
    ASSERT_TRUE(parent);

    auto child = selector.select_child(*parent, tmp / "tree" / "sub", tmp / "out" / "tree" / "sub");
    ASSERT_TRUE(child);
    EXPECT_EQ(child->verb, Verb::Move);
    EXPECT_TRUE(child->is_directory);
    EXPECT_EQ(child->report_progress, parent->report_progress);
    EXPECT_EQ(child->size_bytes, 2u);
}

TEST_F(StrategySelectorTest, ProbeFailurePropagates)
{
    probe.fail_device = true;
    auto plan = select(Verb::Move, tmp / "a.txt", tmp / "out");
    ASSERT_FALSE(plan);
    EXPECT_EQ(plan.error().code, ErrorCode::IoError);
}
