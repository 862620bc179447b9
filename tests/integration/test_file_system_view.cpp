/**
 * Integration Tests for the Incremental File System View
 *
 * Drives a table through commits, compactions, cleans, replaces, rollbacks
 * and restores. After every step the incrementally synced view must answer
 * exactly like a view rebuilt from a fresh listing.
 */

#include <gtest/gtest.h>
#include <quarry/file_naming.h>
#include <quarry/file_system_view.h>

#include "../test_utils.h"

namespace quarry {
namespace {

using ViewPtr = std::unique_ptr<IncrementalTimelineSyncFileSystemView>;

class FileSystemViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs_ = std::make_shared<MemoryFileSystem>();
        table_ = std::make_unique<test::TestTable>(fs_, "/table");
        ASSERT_STATUS_OK(table_->Init());
        ASSERT_STATUS_OK(table_->AddPartition("p1"));
        ASSERT_STATUS_OK(table_->AddPartition("p2"));
    }

    std::shared_ptr<TableMetadata> Listing() {
        return std::make_shared<FileSystemBackedTableMetadata>(fs_, "/table");
    }

    Status OpenView(ViewPtr* view, bool incremental = true) {
        FileSystemViewOptions options;
        options.incremental_sync_enabled = incremental;
        return IncrementalTimelineSyncFileSystemView::Create(table_->MetaClient(), Listing(),
                                                             options, view);
    }

    void LoadAll(IncrementalTimelineSyncFileSystemView* view) {
        std::vector<FileSlice> slices;
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p2", &slices));
    }

    WriteStat Base(const std::string& partition, const std::string& file_id,
                   const std::string& instant) {
        WriteStat stat;
        EXPECT_STATUS_OK(table_->WriteBaseFile(partition, file_id, instant,
                                               {{"k-" + file_id, partition, 1, "v"}}, &stat));
        return stat;
    }

    WriteStat Log(const std::string& partition, const std::string& file_id,
                  const std::string& base_instant, const std::string& instant) {
        WriteStat stat;
        EXPECT_STATUS_OK(table_->AppendDataBlock(partition, file_id, base_instant, instant,
                                                 {{"k-" + file_id, partition, 2, "v" + instant}},
                                                 &stat));
        return stat;
    }

    void CommitStats(const std::string& action, const std::string& requested,
                     const std::string& completed,
                     const std::map<std::string, std::vector<WriteStat>>& stats) {
        CommitMetadata metadata;
        metadata.partition_to_write_stats = stats;
        ASSERT_STATUS_OK(table_->Commit(action, requested, completed, metadata));
    }

    void SyncAndCompare(IncrementalTimelineSyncFileSystemView* view, bool expect_incremental) {
        ASSERT_STATUS_OK(view->Sync());
        if (expect_incremental) {
            EXPECT_TRUE(view->IsPartitionLoaded("p1"));
            EXPECT_TRUE(view->IsPartitionLoaded("p2"));
        }
        ExpectSameAsFreshView(view);
    }

    void ExpectSameAsFreshView(IncrementalTimelineSyncFileSystemView* view) {
        ViewPtr fresh;
        ASSERT_STATUS_OK(OpenView(&fresh));

        for (const std::string partition : {"p1", "p2"}) {
            SCOPED_TRACE("partition " + partition);
            std::vector<FileSlice> expected, actual;
            ASSERT_STATUS_OK(fresh->GetLatestFileSlices(partition, &expected));
            ASSERT_STATUS_OK(view->GetLatestFileSlices(partition, &actual));
            EXPECT_EQ(actual, expected);

            for (bool include_pending : {true, false}) {
                ASSERT_STATUS_OK(
                    fresh->GetLatestFileSlicesBeforeOrOn(partition, "999", include_pending, &expected));
                ASSERT_STATUS_OK(
                    view->GetLatestFileSlicesBeforeOrOn(partition, "999", include_pending, &actual));
                EXPECT_EQ(actual, expected);
            }

            ASSERT_STATUS_OK(fresh->GetLatestMergedFileSlicesBeforeOrOn(partition, "999", &expected));
            ASSERT_STATUS_OK(view->GetLatestMergedFileSlicesBeforeOrOn(partition, "999", &actual));
            EXPECT_EQ(actual, expected);

            std::vector<BaseFile> expected_base, actual_base;
            ASSERT_STATUS_OK(fresh->GetLatestBaseFiles(partition, &expected_base));
            ASSERT_STATUS_OK(view->GetLatestBaseFiles(partition, &actual_base));
            EXPECT_EQ(actual_base, expected_base);

            std::vector<FileGroup> expected_groups, actual_groups;
            ASSERT_STATUS_OK(fresh->GetAllFileGroups(partition, &expected_groups));
            ASSERT_STATUS_OK(view->GetAllFileGroups(partition, &actual_groups));
            EXPECT_EQ(actual_groups, expected_groups);
        }

        auto expected_ops = fresh->GetPendingCompactionOperations();
        auto actual_ops = view->GetPendingCompactionOperations();
        ASSERT_EQ(actual_ops.size(), expected_ops.size());
        for (size_t i = 0; i < actual_ops.size(); ++i) {
            EXPECT_EQ(actual_ops[i].first, expected_ops[i].first);
            EXPECT_EQ(actual_ops[i].second.file_id, expected_ops[i].second.file_id);
        }
        EXPECT_EQ(view->GetPendingLogCompactionOperations().size(),
                  fresh->GetPendingLogCompactionOperations().size());
    }

    std::string Path(const std::string& partition, const std::string& file_id,
                     const std::string& instant) {
        return table_->BaseFilePath(partition, file_id, instant);
    }

    std::shared_ptr<MemoryFileSystem> fs_;
    std::unique_ptr<test::TestTable> table_;
};

TEST_F(FileSystemViewTest, IncrementalSyncMatchesFullRebuildThroughLifecycle) {
    // 010: initial insert.
    CommitStats(actions::kCommit, "010", "011",
                {{"p1", {Base("p1", "fg1", "010"), Base("p1", "fg2", "010")}},
                 {"p2", {Base("p2", "fg3", "010")}}});

    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    LoadAll(view.get());
    ExpectSameAsFreshView(view.get());

    // 020: updates land in logs.
    {
        SCOPED_TRACE("deltacommit 020");
        CommitStats(actions::kDeltaCommit, "020", "021",
                    {{"p1", {Log("p1", "fg1", "010", "020")}}});
        SyncAndCompare(view.get(), true);
    }

    // 030: compaction of fg1 scheduled.
    {
        SCOPED_TRACE("schedule compaction 030");
        CompactionPlan plan;
        CompactionOperation op;
        op.partition_path = "p1";
        op.file_id = "fg1";
        op.base_instant_time = "010";
        op.data_file_path = GetFileName(Path("p1", "fg1", "010"));
        op.delta_file_paths = {GetFileName(table_->LogFilePath("p1", "fg1", "010"))};
        plan.operations.push_back(op);
        ASSERT_STATUS_OK(table_->ScheduleCompaction("030", plan));
        SyncAndCompare(view.get(), true);

        std::vector<FileSlice> slices;
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
        ASSERT_EQ(slices.size(), 2u);
        EXPECT_EQ(slices[0].GetFileId(), "fg1");
        EXPECT_EQ(slices[0].GetBaseInstantTime(), "030");
        EXPECT_TRUE(slices[0].IsEmpty());

        ASSERT_STATUS_OK(view->GetLatestFileSlicesBeforeOrOn("p1", "030", false, &slices));
        EXPECT_EQ(slices[0].GetBaseInstantTime(), "010");
        EXPECT_EQ(slices[0].GetLogFiles().size(), 1u);
        ASSERT_EQ(view->GetPendingCompactionOperations().size(), 1u);
    }

    // 040: writes after the compaction was scheduled go to the new slice.
    {
        SCOPED_TRACE("deltacommit 040");
        CommitStats(actions::kDeltaCommit, "040", "041",
                    {{"p1", {Log("p1", "fg1", "030", "040"), Log("p1", "fg2", "010", "040")}}});
        SyncAndCompare(view.get(), true);

        std::vector<FileSlice> merged;
        ASSERT_STATUS_OK(view->GetLatestMergedFileSlicesBeforeOrOn("p1", "040", &merged));
        ASSERT_EQ(merged.size(), 2u);
        EXPECT_EQ(merged[0].GetBaseInstantTime(), "010");
        ASSERT_TRUE(merged[0].GetBaseFile().has_value());
        EXPECT_EQ(merged[0].GetLogFiles().size(), 2u);
    }

    // 030 completes at 050.
    {
        SCOPED_TRACE("complete compaction 030");
        CommitMetadata metadata;
        metadata.partition_to_write_stats["p1"] = {Base("p1", "fg1", "030")};
        ASSERT_STATUS_OK(table_->CompleteCompaction("030", "050", metadata));
        SyncAndCompare(view.get(), true);
        EXPECT_TRUE(view->GetPendingCompactionOperations().empty());

        std::vector<BaseFile> base_files;
        ASSERT_STATUS_OK(view->GetLatestBaseFiles("p1", &base_files));
        ASSERT_EQ(base_files.size(), 2u);
        EXPECT_EQ(base_files[0].commit_time, "030");
    }

    // 060: clean removes the slice replaced by compaction.
    {
        SCOPED_TRACE("clean 060");
        std::string old_base = Path("p1", "fg1", "010");
        std::string old_log = table_->LogFilePath("p1", "fg1", "010");
        ASSERT_STATUS_OK(fs_->RemoveFile(old_base));
        ASSERT_STATUS_OK(fs_->RemoveFile(old_log));

        CleanMetadata clean;
        clean.earliest_commit_to_retain = "030";
        PartitionCleanStat stat;
        stat.partition_path = "p1";
        stat.success_delete_files = {GetFileName(old_base), GetFileName(old_log)};
        clean.partition_metadata["p1"] = stat;
        ASSERT_STATUS_OK(table_->Clean("060", "061", clean));
        SyncAndCompare(view.get(), true);

        std::vector<FileGroup> groups;
        ASSERT_STATUS_OK(view->GetAllFileGroups("p1", &groups));
        ASSERT_EQ(groups.size(), 2u);
        EXPECT_EQ(groups[0].GetAllFileSlices().size(), 1u);
    }

    // 070: clustering replaces fg2 with fg4.
    {
        SCOPED_TRACE("replacecommit 070");
        ReplaceCommitMetadata replace;
        replace.partition_to_write_stats["p1"] = {Base("p1", "fg4", "070")};
        replace.partition_to_replace_file_ids["p1"] = {"fg2"};
        ASSERT_STATUS_OK(table_->ReplaceCommit("070", "071", replace));
        SyncAndCompare(view.get(), true);

        std::vector<FileSlice> slices;
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
        ASSERT_EQ(slices.size(), 2u);
        EXPECT_EQ(slices[0].GetFileId(), "fg1");
        EXPECT_EQ(slices[1].GetFileId(), "fg4");

        std::vector<FileGroup> replaced;
        ASSERT_STATUS_OK(view->GetReplacedFileGroupsBeforeOrOn("070", "p1", &replaced));
        ASSERT_EQ(replaced.size(), 1u);
        EXPECT_EQ(replaced[0].GetFileId(), "fg2");
        ASSERT_STATUS_OK(view->GetReplacedFileGroupsBeforeOrOn("065", "p1", &replaced));
        EXPECT_TRUE(replaced.empty());

        // Before the replace, fg2 is still part of the table.
        ASSERT_STATUS_OK(view->GetLatestFileSlicesBeforeOrOn("p1", "065", true, &slices));
        EXPECT_EQ(slices.size(), 2u);
    }

    // 080 is committed, then rolled back by 090.
    {
        SCOPED_TRACE("rollback 090");
        CommitStats(actions::kDeltaCommit, "080", "081",
                    {{"p1", {Log("p1", "fg4", "070", "080")}}});
        SyncAndCompare(view.get(), true);

        std::string log_path = table_->LogFilePath("p1", "fg4", "070");
        ASSERT_STATUS_OK(fs_->RemoveFile(log_path));
        ASSERT_STATUS_OK(table_->MetaClient()->DeleteInstant(
            Instant(InstantState::kCompleted, actions::kDeltaCommit, "080")));

        RollbackMetadata rollback;
        rollback.commits_rollback = {"080"};
        PartitionRollbackStat stat;
        stat.partition_path = "p1";
        stat.success_delete_files = {log_path};
        rollback.partition_metadata["p1"] = stat;
        ASSERT_STATUS_OK(table_->Rollback("090", "091", rollback));
        SyncAndCompare(view.get(), true);

        std::vector<FileSlice> slices;
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
        ASSERT_EQ(slices.size(), 2u);
        EXPECT_TRUE(slices[1].GetLogFiles().empty());
    }

    // 110 restores the table to before 070.
    {
        SCOPED_TRACE("restore 110");
        CommitStats(actions::kCommit, "100", "101", {{"p2", {Base("p2", "fg5", "100")}}});
        SyncAndCompare(view.get(), true);

        std::string fg4_base = Path("p1", "fg4", "070");
        std::string fg5_base = Path("p2", "fg5", "100");
        ASSERT_STATUS_OK(fs_->RemoveFile(fg4_base));
        ASSERT_STATUS_OK(fs_->RemoveFile(fg5_base));
        ASSERT_STATUS_OK(table_->MetaClient()->DeleteInstant(
            Instant(InstantState::kCompleted, actions::kCommit, "100")));
        ASSERT_STATUS_OK(table_->MetaClient()->DeleteInstant(
            Instant(InstantState::kCompleted, actions::kReplaceCommit, "070")));

        RestoreMetadata restore;
        RollbackMetadata undo_100;
        undo_100.commits_rollback = {"100"};
        undo_100.partition_metadata["p2"] = PartitionRollbackStat{"p2", {fg5_base}, {}};
        RollbackMetadata undo_070;
        undo_070.commits_rollback = {"070"};
        undo_070.partition_metadata["p1"] = PartitionRollbackStat{"p1", {fg4_base}, {}};
        restore.restore_metadata["100"] = {undo_100};
        restore.restore_metadata["070"] = {undo_070};
        restore.restore_instant_info = {{"100", actions::kCommit},
                                        {"070", actions::kReplaceCommit}};
        ASSERT_STATUS_OK(table_->Restore("110", "111", restore));
        SyncAndCompare(view.get(), true);

        std::vector<FileSlice> slices;
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
        ASSERT_EQ(slices.size(), 2u);
        EXPECT_EQ(slices[0].GetFileId(), "fg1");
        EXPECT_EQ(slices[1].GetFileId(), "fg2");
        ASSERT_STATUS_OK(view->GetLatestFileSlices("p2", &slices));
        ASSERT_EQ(slices.size(), 1u);
        EXPECT_EQ(slices[0].GetFileId(), "fg3");
    }
}

TEST_F(FileSystemViewTest, UncommittedFilesAreHidden) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    ASSERT_STATUS_OK(table_->StartInstant(actions::kCommit, "020"));
    Base("p1", "fg1", "020");
    Base("p1", "fg9", "020");

    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    std::vector<FileSlice> slices;
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices[0].GetBaseInstantTime(), "010");

    // The raw group still knows about the inflight file.
    std::vector<FileGroup> groups;
    ASSERT_STATUS_OK(view->GetAllFileGroups("p1", &groups));
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].GetAllRawFileSlices().size(), 2u);
    EXPECT_TRUE(groups[1].GetAllFileSlices().empty());
}

TEST_F(FileSystemViewTest, UnloadedPartitionsAreSkippedBySync) {
    CommitStats(actions::kCommit, "010", "011",
                {{"p1", {Base("p1", "fg1", "010")}}, {"p2", {Base("p2", "fg2", "010")}}});
    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    std::vector<FileSlice> slices;
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));

    CommitStats(actions::kCommit, "020", "021", {{"p2", {Base("p2", "fg3", "020")}}});
    ASSERT_STATUS_OK(view->Sync());
    EXPECT_TRUE(view->IsPartitionLoaded("p1"));
    EXPECT_FALSE(view->IsPartitionLoaded("p2"));

    ASSERT_STATUS_OK(view->GetLatestFileSlices("p2", &slices));
    EXPECT_EQ(slices.size(), 2u);
    EXPECT_EQ(view->GetLoadedPartitions(), (std::vector<std::string>{"p1", "p2"}));
}

TEST_F(FileSystemViewTest, LostPendingCompactionForcesRebuild) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    CompactionPlan plan;
    plan.operations.push_back(CompactionOperation{"p1", "fg1", "010", "", {}});
    ASSERT_STATUS_OK(table_->ScheduleCompaction("020", plan));

    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    LoadAll(view.get());
    ASSERT_EQ(view->GetPendingCompactionOperations().size(), 1u);

    ASSERT_STATUS_OK(table_->MetaClient()->DeleteInstant(
        Instant(InstantState::kRequested, actions::kCompaction, "020")));
    ASSERT_STATUS_OK(view->Sync());

    EXPECT_FALSE(view->IsPartitionLoaded("p1"));
    EXPECT_TRUE(view->GetPendingCompactionOperations().empty());
    ExpectSameAsFreshView(view.get());
}

TEST_F(FileSystemViewTest, FailedRefreshKeepsPreviousState) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    CompactionPlan plan;
    plan.operations.push_back(CompactionOperation{"p1", "fg1", "010", "", {}});
    ASSERT_STATUS_OK(table_->ScheduleCompaction("020", plan));

    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    LoadAll(view.get());
    std::vector<FileSlice> before;
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &before));

    Instant broken;
    ASSERT_STATUS_OK(table_->MetaClient()->CreateRequestedInstant(actions::kCompaction, "030",
                                                                  "{broken", &broken));
    EXPECT_TRUE(view->Refresh().IsCorruption());

    EXPECT_TRUE(view->IsPartitionLoaded("p1"));
    EXPECT_EQ(view->GetPendingCompactionOperations().size(), 1u);
    EXPECT_EQ(view->GetTimeline().LastInstant()->GetRequestedTime(), "020");
    std::vector<FileSlice> after;
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &after));
    EXPECT_EQ(after, before);
}

TEST_F(FileSystemViewTest, FailedFallbackBlocksQueriesUntilRebuilt) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    LoadAll(view.get());

    // 020 applies incrementally, then the unreadable plan at 030 fails both
    // the incremental pass and the rebuild behind it.
    CommitStats(actions::kDeltaCommit, "020", "021", {{"p1", {Log("p1", "fg1", "010", "020")}}});
    Instant broken;
    ASSERT_STATUS_OK(table_->MetaClient()->CreateRequestedInstant(actions::kCompaction, "030",
                                                                  "{broken", &broken));
    EXPECT_TRUE(view->Sync().IsCorruption());

    std::vector<FileSlice> slices;
    EXPECT_TRUE(view->GetLatestFileSlices("p1", &slices).IsAborted());
    EXPECT_TRUE(view->GetLatestFileSlicesBeforeOrOn("p1", "999", true, &slices).IsAborted());
    EXPECT_TRUE(view->GetPendingCompactionOperations().empty());
    EXPECT_FALSE(view->IsPartitionLoaded("p1"));

    // Still unreadable: the view stays blocked.
    EXPECT_TRUE(view->Sync().IsCorruption());
    EXPECT_TRUE(view->GetLatestFileSlices("p1", &slices).IsAborted());

    ASSERT_STATUS_OK(table_->MetaClient()->DeleteInstant(broken));
    ASSERT_STATUS_OK(view->Sync());
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices[0].GetLogFiles().size(), 1u);
    ExpectSameAsFreshView(view.get());
}

TEST_F(FileSystemViewTest, PendingCommitsAreVisibleWhenIncluded) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    ASSERT_STATUS_OK(table_->StartInstant(actions::kDeltaCommit, "020"));
    Log("p1", "fg1", "010", "020");

    FileSystemViewOptions options;
    options.include_pending_commits = true;
    ViewPtr view;
    ASSERT_STATUS_OK(IncrementalTimelineSyncFileSystemView::Create(table_->MetaClient(), Listing(),
                                                                   options, &view));
    std::vector<FileSlice> slices;
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices[0].GetLogFiles().size(), 1u);
    EXPECT_EQ(view->GetTimeline().LastInstant()->GetRequestedTime(), "020");

    // A second inflight commit writes a new base; sync rebuilds to see it.
    ASSERT_STATUS_OK(table_->StartInstant(actions::kCommit, "030"));
    Base("p1", "fg1", "030");
    ASSERT_STATUS_OK(view->Sync());
    ASSERT_STATUS_OK(view->GetLatestFileSlices("p1", &slices));
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices[0].GetBaseInstantTime(), "030");
}

TEST_F(FileSystemViewTest, DisabledIncrementalSyncRebuilds) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view, false));
    LoadAll(view.get());

    CommitStats(actions::kDeltaCommit, "020", "021", {{"p1", {Log("p1", "fg1", "010", "020")}}});
    ASSERT_STATUS_OK(view->Sync());
    EXPECT_FALSE(view->IsPartitionLoaded("p1"));
    ExpectSameAsFreshView(view.get());
}

TEST_F(FileSystemViewTest, RefreshAlwaysRebuilds) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    LoadAll(view.get());

    ASSERT_STATUS_OK(view->Refresh());
    EXPECT_TRUE(view->GetLoadedPartitions().empty());
    EXPECT_EQ(view->GetTimeline().CountInstants(), 1u);
}

TEST_F(FileSystemViewTest, LogCompactionIsTrackedUntilFinished) {
    CommitStats(actions::kDeltaCommit, "010", "011", {{"p1", {Log("p1", "fg1", "000", "010")}}});
    CommitStats(actions::kDeltaCommit, "020", "021", {{"p1", {Log("p1", "fg1", "000", "020")}}});

    CompactionPlan plan;
    CompactionOperation op;
    op.partition_path = "p1";
    op.file_id = "fg1";
    op.base_instant_time = "000";
    op.delta_file_paths = {GetFileName(table_->LogFilePath("p1", "fg1", "000"))};
    plan.operations.push_back(op);
    ASSERT_STATUS_OK(table_->ScheduleLogCompaction("030", plan));

    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    LoadAll(view.get());
    auto log_ops = view->GetPendingLogCompactionOperations();
    ASSERT_EQ(log_ops.size(), 1u);
    EXPECT_EQ(log_ops[0].first, "030");
    EXPECT_TRUE(view->GetPendingCompactionOperations().empty());

    WriteStat stat;
    ASSERT_STATUS_OK(table_->AppendDataBlock("p1", "fg1", "000", "030",
                                             {{"k-fg1", "p1", 3, "compacted"}}, &stat,
                                             {"010", "020"}));
    Instant inflight;
    ASSERT_STATUS_OK(table_->MetaClient()->TransitionToInflight(
        Instant(InstantState::kRequested, actions::kLogCompaction, "030"), "", &inflight));
    CommitMetadata metadata;
    metadata.partition_to_write_stats["p1"] = {stat};
    std::string json;
    ASSERT_STATUS_OK(metadata.ToJson(&json));
    Instant completed;
    ASSERT_STATUS_OK(table_->MetaClient()->SaveAsComplete(inflight, "031", json, &completed));
    EXPECT_EQ(completed.GetAction(), actions::kDeltaCommit);

    SyncAndCompare(view.get(), true);
    EXPECT_TRUE(view->GetPendingLogCompactionOperations().empty());
}

TEST_F(FileSystemViewTest, ConflictingPendingCompactionsFailCreate) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    CompactionPlan plan;
    plan.operations.push_back(CompactionOperation{"p1", "fg1", "010", "", {}});
    ASSERT_STATUS_OK(table_->ScheduleCompaction("020", plan));
    ASSERT_STATUS_OK(table_->ScheduleCompaction("030", plan));

    ViewPtr view;
    auto status = OpenView(&view);
    EXPECT_TRUE(status.IsInvalidArgument());
    EXPECT_EQ(view, nullptr);
}

TEST_F(FileSystemViewTest, ClosedViewRejectsCalls) {
    CommitStats(actions::kCommit, "010", "011", {{"p1", {Base("p1", "fg1", "010")}}});
    ViewPtr view;
    ASSERT_STATUS_OK(OpenView(&view));
    view->Close();

    std::vector<FileSlice> slices;
    EXPECT_TRUE(view->GetLatestFileSlices("p1", &slices).IsInvalidArgument());
    EXPECT_TRUE(view->Sync().IsInvalidArgument());
    EXPECT_TRUE(view->Refresh().IsInvalidArgument());
    EXPECT_TRUE(view->GetTimeline().Empty());
}

TEST_F(FileSystemViewTest, CreateNeedsProviderAndMetadata) {
    ViewPtr view;
    EXPECT_TRUE(IncrementalTimelineSyncFileSystemView::Create(nullptr, Listing(),
                                                              FileSystemViewOptions(), &view)
                    .IsInvalidArgument());
    EXPECT_TRUE(IncrementalTimelineSyncFileSystemView::Create(table_->MetaClient(), nullptr,
                                                              FileSystemViewOptions(), &view)
                    .IsInvalidArgument());
}

TEST_F(FileSystemViewTest, ListsNestedPartitions) {
    ASSERT_STATUS_OK(table_->AddPartition("region=us/day=1"));
    ASSERT_STATUS_OK(table_->AddPartition("region=us/day=2"));
    ASSERT_STATUS_OK(table_->AddPartition("region=eu/day=1"));
    ASSERT_STATUS_OK(fs_->CreateDirectory("/table/not_a_partition"));

    FileSystemBackedTableMetadata listing(fs_, "/table");
    std::vector<std::string> partitions;
    ASSERT_STATUS_OK(listing.GetAllPartitionPaths(&partitions));
    EXPECT_EQ(partitions, (std::vector<std::string>{"p1", "p2", "region=eu/day=1",
                                                    "region=us/day=1", "region=us/day=2"}));

    ASSERT_STATUS_OK(listing.GetPartitionPathWithPathPrefixes({"region=us", "region=us/day=1"},
                                                              &partitions));
    EXPECT_EQ(partitions, (std::vector<std::string>{"region=us/day=1", "region=us/day=2"}));

    ASSERT_STATUS_OK(listing.GetPartitionPathWithPathPrefixes({"missing"}, &partitions));
    EXPECT_TRUE(partitions.empty());
}

TEST_F(FileSystemViewTest, PartitionListingSkipsMarkerFile) {
    Base("p1", "fg1", "010");
    FileSystemBackedTableMetadata listing(fs_, "/table");

    std::map<std::string, std::vector<FileInfo>> files;
    ASSERT_STATUS_OK(listing.GetAllFilesInPartitions({"p1", "p2", "absent"}, &files));
    ASSERT_EQ(files.size(), 3u);
    ASSERT_EQ(files["p1"].size(), 1u);
    EXPECT_EQ(files["p1"][0].FileName(), GetFileName(Path("p1", "fg1", "010")));
    EXPECT_TRUE(files["p2"].empty());
    EXPECT_TRUE(files["absent"].empty());
}

}  // namespace
}  // namespace quarry
