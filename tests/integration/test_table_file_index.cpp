/************************************************************************
Integration Tests for the Table File Index

Eager and lazy listing, time travel, incremental partition pruning and the
spillable slice cache, all over an in-memory table.
**************************************************************************/

#include <gtest/gtest.h>
#include <quarry/table_file_index.h>

#include "../test_utils.h"

namespace quarry {
namespace {

using SliceMap = std::map<PartitionPath, std::vector<FileSlice>>;

class TableFileIndexTest : public test::QuarryTestBase {
protected:
    void SetUp() override {
        test::QuarryTestBase::SetUp();
        InitTable(test::DefaultTestConfig());
    }

    void InitTable(const TableConfig& config) {
        fs_ = std::make_shared<MemoryFileSystem>();
        table_ = std::make_unique<test::TestTable>(fs_, "/table", config);
        ASSERT_STATUS_OK(table_->Init());
    }

    WriteStat Base(const std::string& partition, const std::string& file_id,
                   const std::string& instant) {
        WriteStat stat;
        EXPECT_STATUS_OK(table_->AddPartition(partition));
        EXPECT_STATUS_OK(table_->WriteBaseFile(partition, file_id, instant,
                                               {{"k-" + file_id, partition, 1, "v"}}, &stat));
        return stat;
    }

    WriteStat Log(const std::string& partition, const std::string& file_id,
                  const std::string& base_instant, const std::string& instant) {
        WriteStat stat;
        EXPECT_STATUS_OK(table_->AppendDataBlock(partition, file_id, base_instant, instant,
                                                 {{"k-" + file_id, partition, 2, "w"}}, &stat));
        return stat;
    }

    void CommitStats(const std::string& action, const std::string& requested,
                     const std::string& completed,
                     const std::map<std::string, std::vector<WriteStat>>& stats) {
        CommitMetadata metadata;
        metadata.partition_to_write_stats = stats;
        ASSERT_STATUS_OK(table_->Commit(action, requested, completed, metadata));
    }

    // region=us: fg1 base at 010 plus a log at 020. region=eu: fg2 base at 010.
    void WriteTwoPartitions() {
        CommitStats(actions::kCommit, "010", "011",
                    {{"region=us", {Base("region=us", "fg1", "010")}},
                     {"region=eu", {Base("region=eu", "fg2", "010")}}});
        CommitStats(actions::kDeltaCommit, "020", "021",
                    {{"region=us", {Log("region=us", "fg1", "010", "020")}}});
    }

    Status OpenIndex(const FileIndexOptions& options, std::unique_ptr<TableFileIndex>* index) {
        return TableFileIndex::Create(table_->MetaClient(), nullptr, options, index);
    }

    static const std::vector<FileSlice>& SlicesOf(const SliceMap& slices,
                                                  const std::string& path) {
        for (const auto& entry : slices) {
            if (entry.first.path == path) return entry.second;
        }
        static const std::vector<FileSlice> empty;
        return empty;
    }

    std::shared_ptr<MemoryFileSystem> fs_;
    std::unique_ptr<test::TestTable> table_;
};

TEST_F(TableFileIndexTest, EagerIndexCachesEverythingUpFront) {
    WriteTwoPartitions();
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &index));

    EXPECT_TRUE(index->AreAllFileSlicesCached());
    EXPECT_TRUE(index->ShouldReadAsPartitionedTable());
    EXPECT_EQ(index->GetQueryType(), QueryType::kSnapshot);
    EXPECT_EQ(index->GetPartitionColumns(), std::vector<std::string>{"region"});

    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    ASSERT_EQ(partitions.size(), 2u);
    EXPECT_EQ(partitions[0].path, "region=eu");
    EXPECT_EQ(partitions[0].values, std::vector<std::string>{"eu"});
    EXPECT_EQ(partitions[1].path, "region=us");

    size_t count = 0;
    ASSERT_STATUS_OK(index->GetFileSlicesCount(&count));
    EXPECT_EQ(count, 2u);

    SliceMap slices;
    ASSERT_STATUS_OK(index->GetAllInputFileSlices(&slices));
    const auto& us = SlicesOf(slices, "region=us");
    ASSERT_EQ(us.size(), 1u);
    ASSERT_TRUE(us[0].GetBaseFile().has_value());
    EXPECT_EQ(us[0].GetLogFiles().size(), 1u);

    int64_t expected_size = 0;
    for (const auto& entry : slices) {
        for (const auto& slice : entry.second) expected_size += slice.GetTotalFileSize();
    }
    int64_t size = 0;
    ASSERT_STATUS_OK(index->GetTotalCachedFilesSize(&size));
    EXPECT_EQ(size, expected_size);
    EXPECT_GT(size, 0);

    auto latest = index->GetLatestCompletedInstant();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->GetRequestedTime(), "020");
}

TEST_F(TableFileIndexTest, PredicatePrunesPartitions) {
    WriteTwoPartitions();
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &index));

    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(index->ListPartitions(
        [](const PartitionPath& p) { return p.values.size() == 1 && p.values[0] == "us"; },
        &partitions));
    ASSERT_EQ(partitions.size(), 1u);

    SliceMap slices;
    ASSERT_STATUS_OK(index->GetFileSlices(partitions, &slices));
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_EQ(slices.begin()->second[0].GetFileId(), "fg1");
}

TEST_F(TableFileIndexTest, LazyIndexLoadsOnDemand) {
    WriteTwoPartitions();
    FileIndexOptions options;
    options.list_lazily = true;
    std::unique_ptr<TableFileIndex> lazy;
    ASSERT_STATUS_OK(OpenIndex(options, &lazy));
    EXPECT_FALSE(lazy->AreAllFileSlicesCached());

    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(lazy->ListPartitions(nullptr, &partitions));
    SliceMap slices;
    ASSERT_STATUS_OK(lazy->GetFileSlices({partitions[0]}, &slices));
    EXPECT_FALSE(lazy->AreAllFileSlicesCached());

    ASSERT_STATUS_OK(lazy->GetAllInputFileSlices(&slices));
    EXPECT_TRUE(lazy->AreAllFileSlicesCached());

    std::unique_ptr<TableFileIndex> eager;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &eager));
    SliceMap eager_slices;
    ASSERT_STATUS_OK(eager->GetAllInputFileSlices(&eager_slices));
    EXPECT_EQ(slices, eager_slices);
}

TEST_F(TableFileIndexTest, QueryPathsRestrictListing) {
    WriteTwoPartitions();
    FileIndexOptions options;
    options.query_paths = {"/table/region=us"};
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(options, &index));

    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    ASSERT_EQ(partitions.size(), 1u);
    EXPECT_EQ(partitions[0].path, "region=us");
}

TEST_F(TableFileIndexTest, ReadOptimizedKeepsBaseFilesOnly) {
    WriteTwoPartitions();
    CommitStats(actions::kDeltaCommit, "030", "031",
                {{"region=eu", {Log("region=eu", "fg3", "030", "030")}}});

    FileIndexOptions options;
    options.query_type = QueryType::kReadOptimized;
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(options, &index));

    SliceMap slices;
    ASSERT_STATUS_OK(index->GetAllInputFileSlices(&slices));
    const auto& us = SlicesOf(slices, "region=us");
    ASSERT_EQ(us.size(), 1u);
    EXPECT_TRUE(us[0].GetLogFiles().empty());
    const auto& eu = SlicesOf(slices, "region=eu");
    ASSERT_EQ(eu.size(), 1u);
    EXPECT_EQ(eu[0].GetFileId(), "fg2");
}

TEST_F(TableFileIndexTest, TimeTravelPicksOlderSlice) {
    WriteTwoPartitions();
    CommitStats(actions::kCommit, "030", "031", {{"region=eu", {Base("region=eu", "fg2", "030")}}});

    FileIndexOptions options;
    options.specified_query_instant = "020";
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(options, &index));
    SliceMap slices;
    ASSERT_STATUS_OK(index->GetAllInputFileSlices(&slices));
    EXPECT_EQ(SlicesOf(slices, "region=eu")[0].GetBaseInstantTime(), "010");

    std::unique_ptr<TableFileIndex> latest;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &latest));
    ASSERT_STATUS_OK(latest->GetAllInputFileSlices(&slices));
    EXPECT_EQ(SlicesOf(slices, "region=eu")[0].GetBaseInstantTime(), "030");
}

TEST_F(TableFileIndexTest, TimeTravelPastInflightCommitFails) {
    WriteTwoPartitions();
    ASSERT_STATUS_OK(table_->StartInstant(actions::kCommit, "040"));

    FileIndexOptions options;
    options.specified_query_instant = "050";
    std::unique_ptr<TableFileIndex> index;
    auto status = OpenIndex(options, &index);
    EXPECT_TRUE(status.IsInvalidArgument());
    EXPECT_NE(status.message().find("first incomplete commit"), std::string::npos);

    // Earlier instants are fine.
    options.specified_query_instant = "030";
    ASSERT_STATUS_OK(OpenIndex(options, &index));

    // Including pending commits skips the check.
    options.specified_query_instant = "050";
    options.include_pending_commits = true;
    ASSERT_STATUS_OK(OpenIndex(options, &index));
}

TEST_F(TableFileIndexTest, ValidateInstantRequiresKnownInstant) {
    WriteTwoPartitions();
    FileIndexOptions options;
    options.validate_instant = true;
    options.specified_query_instant = "015";
    std::unique_ptr<TableFileIndex> index;
    EXPECT_TRUE(OpenIndex(options, &index).IsInvalidArgument());

    options.specified_query_instant = "010";
    ASSERT_STATUS_OK(OpenIndex(options, &index));

    options.specified_query_instant.reset();
    ASSERT_STATUS_OK(OpenIndex(options, &index));
}

TEST_F(TableFileIndexTest, PendingCompactionIsMergedIntoPreviousSlice) {
    WriteTwoPartitions();
    CompactionPlan plan;
    plan.operations.push_back(CompactionOperation{"region=us", "fg1", "010", "", {}});
    ASSERT_STATUS_OK(table_->ScheduleCompaction("030", plan));
    CommitStats(actions::kDeltaCommit, "040", "041",
                {{"region=us", {Log("region=us", "fg1", "030", "040")}}});

    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &index));
    SliceMap slices;
    ASSERT_STATUS_OK(index->GetAllInputFileSlices(&slices));
    const auto& us = SlicesOf(slices, "region=us");
    ASSERT_EQ(us.size(), 1u);
    EXPECT_EQ(us[0].GetBaseInstantTime(), "010");
    ASSERT_TRUE(us[0].GetBaseFile().has_value());
    ASSERT_EQ(us[0].GetLogFiles().size(), 2u);
    EXPECT_EQ(us[0].GetLogFiles()[1].base_instant, "030");
}

TEST_F(TableFileIndexTest, IncrementalQueryListsWrittenPartitions) {
    WriteTwoPartitions();
    CommitStats(actions::kCommit, "030", "031", {{"region=ap", {Base("region=ap", "fg3", "030")}}});

    FileIndexOptions options;
    options.query_type = QueryType::kIncremental;
    options.incremental_start_time = "021";
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(options, &index));
    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    ASSERT_EQ(partitions.size(), 1u);
    EXPECT_EQ(partitions[0].path, "region=ap");

    // Completion-time range (011, 021] covers only the delta commit.
    options.incremental_start_time = "011";
    options.incremental_end_time = "021";
    ASSERT_STATUS_OK(OpenIndex(options, &index));
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    ASSERT_EQ(partitions.size(), 1u);
    EXPECT_EQ(partitions[0].path, "region=us");

    // Starting before the timeline falls back to a full listing.
    options.incremental_start_time = "005";
    options.incremental_end_time.reset();
    ASSERT_STATUS_OK(OpenIndex(options, &index));
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    EXPECT_EQ(partitions.size(), 3u);
}

TEST_F(TableFileIndexTest, IncrementalQueryOnRequestedTimeForOlderTables) {
    WriteTwoPartitions();
    CommitStats(actions::kCommit, "030", "031", {{"region=ap", {Base("region=ap", "fg3", "030")}}});

    FileIndexOptions options;
    options.query_type = QueryType::kIncremental;
    options.incremental_table_version = TableVersion::kSix;
    options.incremental_start_time = "015";
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(options, &index));
    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    ASSERT_EQ(partitions.size(), 2u);
    EXPECT_EQ(partitions[0].path, "region=ap");
    EXPECT_EQ(partitions[1].path, "region=us");
}

TEST_F(TableFileIndexTest, IncrementalQueryNeedsStartTime) {
    FileIndexOptions options;
    options.query_type = QueryType::kIncremental;
    std::unique_ptr<TableFileIndex> index;
    EXPECT_TRUE(OpenIndex(options, &index).IsInvalidArgument());
    EXPECT_TRUE(
        TableFileIndex::Create(nullptr, nullptr, FileIndexOptions(), &index).IsInvalidArgument());
}

TEST_F(TableFileIndexTest, SpilledCacheServesSameSlices) {
    WriteTwoPartitions();
    auto scratch = std::make_shared<MemoryFileSystem>();
    FileIndexOptions options;
    options.use_spillable_map = true;
    options.spillable_memory_bytes = 0;
    options.spill_directory = "/spill";
    options.spill_file_system = scratch;
    std::unique_ptr<TableFileIndex> spilled;
    ASSERT_STATUS_OK(OpenIndex(options, &spilled));

    std::unique_ptr<TableFileIndex> in_memory;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &in_memory));

    SliceMap expected, actual;
    ASSERT_STATUS_OK(in_memory->GetAllInputFileSlices(&expected));
    ASSERT_STATUS_OK(spilled->GetAllInputFileSlices(&actual));
    EXPECT_EQ(actual, expected);

    std::vector<FileInfo> spill_files;
    ASSERT_STATUS_OK(scratch->ListFiles("/spill", &spill_files));
    EXPECT_EQ(spill_files.size(), 1u);
    bool on_table_storage = true;
    ASSERT_STATUS_OK(fs_->FileExists("/spill", &on_table_storage));
    EXPECT_FALSE(on_table_storage);

    spilled->Close();
    ASSERT_STATUS_OK(scratch->ListFiles("/spill", &spill_files));
    EXPECT_TRUE(spill_files.empty());
}

TEST_F(TableFileIndexTest, SpillDefaultsToLocalScratch) {
    WriteTwoPartitions();
    const std::string spill_directory = test_path_ + "/spill";
    FileIndexOptions options;
    options.use_spillable_map = true;
    options.spillable_memory_bytes = 0;
    options.spill_directory = spill_directory;
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(options, &index));

    std::shared_ptr<FileSystem> local(FileSystem::CreateLocal());
    std::vector<FileInfo> spill_files;
    ASSERT_STATUS_OK(local->ListFiles(spill_directory, &spill_files));
    EXPECT_EQ(spill_files.size(), 1u);
    bool on_table_storage = true;
    ASSERT_STATUS_OK(fs_->FileExists(spill_directory, &on_table_storage));
    EXPECT_FALSE(on_table_storage);

    index->Close();
}

TEST_F(TableFileIndexTest, PendingCommitsExposeInflightSlices) {
    WriteTwoPartitions();
    // fg2 is rewritten by a commit that has not completed yet.
    ASSERT_STATUS_OK(table_->StartInstant(actions::kCommit, "030"));
    Base("region=eu", "fg2", "030");

    std::unique_ptr<TableFileIndex> committed_only;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &committed_only));
    SliceMap slices;
    ASSERT_STATUS_OK(committed_only->GetAllInputFileSlices(&slices));
    ASSERT_EQ(SlicesOf(slices, "region=eu").size(), 1u);
    EXPECT_EQ(SlicesOf(slices, "region=eu")[0].GetBaseInstantTime(), "010");

    FileIndexOptions options;
    options.include_pending_commits = true;
    std::unique_ptr<TableFileIndex> with_pending;
    ASSERT_STATUS_OK(OpenIndex(options, &with_pending));
    ASSERT_STATUS_OK(with_pending->GetAllInputFileSlices(&slices));
    const auto& eu = SlicesOf(slices, "region=eu");
    ASSERT_EQ(eu.size(), 1u);
    EXPECT_EQ(eu[0].GetBaseInstantTime(), "030");
    ASSERT_TRUE(eu[0].GetBaseFile().has_value());
    EXPECT_EQ(eu[0].GetBaseFile()->commit_time, "030");
    EXPECT_EQ(SlicesOf(slices, "region=us")[0].GetBaseInstantTime(), "010");
}

TEST_F(TableFileIndexTest, RefreshSeesNewCommits) {
    WriteTwoPartitions();
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &index));

    CommitStats(actions::kCommit, "030", "031", {{"region=ap", {Base("region=ap", "fg3", "030")}}});
    size_t count = 0;
    ASSERT_STATUS_OK(index->GetFileSlicesCount(&count));
    EXPECT_EQ(count, 2u);

    ASSERT_STATUS_OK(index->Refresh());
    ASSERT_STATUS_OK(index->GetFileSlicesCount(&count));
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(index->GetLatestCompletedInstant()->GetRequestedTime(), "030");
}

TEST_F(TableFileIndexTest, LazyListingRejectsUnparsablePartitions) {
    TableConfig config = test::DefaultTestConfig();
    config.partition_fields = {"region", "day"};
    InitTable(config);
    CommitStats(actions::kCommit, "010", "011",
                {{"us/1", {Base("us/1", "fg1", "010")}}, {"oops", {Base("oops", "fg2", "010")}}});

    FileIndexOptions options;
    options.list_lazily = true;
    std::unique_ptr<TableFileIndex> lazy;
    ASSERT_STATUS_OK(OpenIndex(options, &lazy));
    SliceMap slices;
    auto status = lazy->GetAllInputFileSlices(&slices);
    EXPECT_TRUE(status.IsInvalidArgument());
    EXPECT_NE(status.message().find("oops"), std::string::npos);

    std::unique_ptr<TableFileIndex> eager;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &eager));
    ASSERT_STATUS_OK(eager->GetAllInputFileSlices(&slices));
    EXPECT_EQ(slices.size(), 2u);
    EXPECT_FALSE(eager->ShouldReadAsPartitionedTable());
}

TEST_F(TableFileIndexTest, NonPartitionedTable) {
    TableConfig config = test::DefaultTestConfig();
    config.partition_fields.clear();
    InitTable(config);
    WriteStat stat;
    ASSERT_STATUS_OK(table_->WriteBaseFile("", "fg1", "010", {{"k1", "", 1, "v"}}, &stat));
    CommitStats(actions::kCommit, "010", "011", {{"", {stat}}});

    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &index));
    EXPECT_FALSE(index->ShouldReadAsPartitionedTable());

    std::vector<PartitionPath> partitions;
    ASSERT_STATUS_OK(index->ListPartitions(nullptr, &partitions));
    ASSERT_EQ(partitions.size(), 1u);
    EXPECT_EQ(partitions[0].path, "");
    EXPECT_TRUE(partitions[0].values.empty());

    size_t count = 0;
    ASSERT_STATUS_OK(index->GetFileSlicesCount(&count));
    EXPECT_EQ(count, 1u);
}

TEST_F(TableFileIndexTest, ClosedIndexRejectsQueries) {
    WriteTwoPartitions();
    std::unique_ptr<TableFileIndex> index;
    ASSERT_STATUS_OK(OpenIndex(FileIndexOptions(), &index));
    index->Close();

    SliceMap slices;
    EXPECT_TRUE(index->GetAllInputFileSlices(&slices).IsInvalidArgument());
}

TEST(PartitionValuesTest, ParsesHiveAndPlainSegments) {
    EXPECT_EQ(ParsePartitionColumnValues({"region", "day"}, "region=us/day=1"),
              (std::vector<std::string>{"us", "1"}));
    EXPECT_EQ(ParsePartitionColumnValues({"region", "day"}, "us/1"),
              (std::vector<std::string>{"us", "1"}));
    EXPECT_EQ(ParsePartitionColumnValues({"date"}, "2024/01/02"),
              (std::vector<std::string>{"2024/01/02"}));
    EXPECT_TRUE(ParsePartitionColumnValues({"region", "day"}, "us").empty());
    EXPECT_TRUE(ParsePartitionColumnValues({}, "us").empty());
    EXPECT_TRUE(ParsePartitionColumnValues({"region"}, "").empty());
}

TEST(PartitionValuesTest, QueryTypeNames) {
    EXPECT_STREQ(QueryTypeToString(QueryType::kSnapshot), "SNAPSHOT");
    EXPECT_STREQ(QueryTypeToString(QueryType::kIncremental), "INCREMENTAL");
    EXPECT_STREQ(QueryTypeToString(QueryType::kReadOptimized), "READ_OPTIMIZED");
}

}  // namespace
}  // namespace quarry
