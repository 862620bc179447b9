/************************************************************************
Unit Tests for Table Configuration and Merge Mode Inference
**************************************************************************/

#include <gtest/gtest.h>
#include <quarry/table_config.h>

#include "../test_utils.h"

namespace quarry {
namespace {

Status Infer(TableVersion version, std::optional<RecordMergeMode> mode,
             const std::string& payload, const std::string& strategy,
             std::vector<std::string> ordering, MergingBehavior* behavior) {
    return InferMergingBehavior(version, mode, payload, strategy, ordering, behavior);
}

TEST(MergeInferenceTest, NothingSetFollowsOrderingFields) {
    MergingBehavior behavior;
    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, "", "", {}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kCommitTimeOrdering);
    EXPECT_EQ(behavior.payload_class, kOverwriteWithLatestPayload);
    EXPECT_EQ(behavior.strategy_id, kCommitTimeStrategyId);

    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, "", "", {"ts"}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kEventTimeOrdering);
    EXPECT_EQ(behavior.payload_class, kDefaultRecordPayload);
    EXPECT_EQ(behavior.strategy_id, kEventTimeStrategyId);
}

TEST(MergeInferenceTest, BlankOrderingFieldsDoNotCount) {
    MergingBehavior behavior;
    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, "", "", {""}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kCommitTimeOrdering);
}

TEST(MergeInferenceTest, StrategyIdDecidesMode) {
    MergingBehavior behavior;
    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, "", kEventTimeStrategyId, {},
                           &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kEventTimeOrdering);

    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, "", "my-merger-id", {},
                           &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kCustom);
    EXPECT_EQ(behavior.strategy_id, "my-merger-id");
}

TEST(MergeInferenceTest, CustomModeNeedsPayloadOrStrategy) {
    MergingBehavior behavior;
    auto status = Infer(TableVersion::kEight, RecordMergeMode::kCustom, "", "", {}, &behavior);
    EXPECT_TRUE(status.IsInvalidArgument());

    status = Infer(TableVersion::kEight, std::nullopt, "", kPayloadBasedStrategyId, {},
                   &behavior);
    EXPECT_TRUE(status.IsInvalidArgument());
}

TEST(MergeInferenceTest, ContradictionsAreRejected) {
    MergingBehavior behavior;
    auto status = Infer(TableVersion::kEight, RecordMergeMode::kCommitTimeOrdering, "",
                        kEventTimeStrategyId, {}, &behavior);
    EXPECT_TRUE(status.IsInvalidArgument());

    status = Infer(TableVersion::kEight, RecordMergeMode::kEventTimeOrdering,
                   kOverwriteWithLatestPayload, "", {}, &behavior);
    EXPECT_TRUE(status.IsInvalidArgument());
}

TEST(MergeInferenceTest, CustomPayloadBecomesCustomMode) {
    MergingBehavior behavior;
    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, "com.acme.MyPayload",
                           kPayloadBasedStrategyId, {}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kCustom);
    EXPECT_EQ(behavior.payload_class, "com.acme.MyPayload");
    EXPECT_EQ(behavior.strategy_id, kPayloadBasedStrategyId);
}

// Version 6 resolves from the payload class alone; version 8 checks it
// against the strategy id.
TEST(MergeInferenceTest, VersionSixIgnoresStrategyId) {
    MergingBehavior behavior;
    ASSERT_STATUS_OK(Infer(TableVersion::kSix, std::nullopt, kDefaultRecordPayload,
                           kCommitTimeStrategyId, {"ts"}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kEventTimeOrdering);
    EXPECT_EQ(behavior.strategy_id, kEventTimeStrategyId);

    auto status = Infer(TableVersion::kEight, std::nullopt, kDefaultRecordPayload,
                        kCommitTimeStrategyId, {"ts"}, &behavior);
    EXPECT_TRUE(status.IsInvalidArgument());
}

TEST(MergeInferenceTest, VersionEightPayloadStrategyIsCustom) {
    MergingBehavior behavior;
    ASSERT_STATUS_OK(Infer(TableVersion::kEight, std::nullopt, kDefaultRecordPayload,
                           kPayloadBasedStrategyId, {}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kCustom);

    ASSERT_STATUS_OK(Infer(TableVersion::kSix, std::nullopt, kDefaultRecordPayload,
                           kPayloadBasedStrategyId, {}, &behavior));
    EXPECT_EQ(behavior.mode, RecordMergeMode::kEventTimeOrdering);
}

TEST(SplitOrderingFieldsTest, TrimsAndDropsBlanks) {
    EXPECT_EQ(SplitOrderingFields(" ts , ,seq"), (std::vector<std::string>{"ts", "seq"}));
    EXPECT_TRUE(SplitOrderingFields("").empty());
}

/************************************************************************
Persistence
**************************************************************************/

TEST(TableConfigTest, SaveAndLoad) {
    std::shared_ptr<FileSystem> fs = FileSystem::CreateMemory();
    TableConfig config = test::DefaultTestConfig();
    config.type = TableType::kCopyOnWrite;
    config.partition_fields = {"region", "day"};
    ASSERT_STATUS_OK(config.Save(fs.get(), "/t"));

    TableConfig loaded;
    ASSERT_STATUS_OK(TableConfig::Load(fs.get(), "/t", &loaded));
    EXPECT_EQ(loaded.name, config.name);
    EXPECT_EQ(loaded.type, TableType::kCopyOnWrite);
    EXPECT_EQ(loaded.partition_fields, config.partition_fields);
    EXPECT_EQ(loaded.ordering_fields, std::vector<std::string>{"ts"});
    EXPECT_EQ(loaded.merge_mode, RecordMergeMode::kCommitTimeOrdering);
    EXPECT_EQ(loaded.base_file_format, "ARROW");
}

TEST(TableConfigTest, PartialConfigIsInferredOnLoad) {
    TableConfig config;
    ASSERT_STATUS_OK(TableConfig::FromJson(
        R"({"quarry.table.name": "t", "quarry.table.version": 6,
            "quarry.table.ordering.fields": "ts",
            "quarry.compaction.payload.class": "DefaultRecordPayload"})",
        &config));
    EXPECT_EQ(config.version, TableVersion::kSix);
    EXPECT_EQ(config.merge_mode, RecordMergeMode::kEventTimeOrdering);
    EXPECT_EQ(config.merge_strategy_id, kEventTimeStrategyId);
}

TEST(TableConfigTest, RejectsBadDocuments) {
    TableConfig config;
    EXPECT_TRUE(TableConfig::FromJson("not json", &config).IsCorruption());
    EXPECT_TRUE(TableConfig::FromJson(R"({"quarry.table.version": 7})", &config)
                    .IsNotSupported());
    EXPECT_TRUE(TableConfig::FromJson(R"({"quarry.record.merge.mode": "LATEST"})", &config)
                    .IsInvalidArgument());
}

}  // namespace
}  // namespace quarry
