/**
 * Test Utilities Implementation
 */

#include "test_utils.h"

#include <ctime>
#include <cstdlib>
#include <filesystem>

#include "quarry/arrow_serialization.h"
#include "quarry/file_naming.h"

namespace fs = std::filesystem;

namespace quarry {
namespace test {

//==============================================================================
// QuarryTestBase
//==============================================================================

void QuarryTestBase::SetUp() {
    test_path_ = "/tmp/quarry_test_" + std::to_string(std::time(nullptr)) + "_" +
                 std::to_string(rand());
    fs::create_directories(test_path_);
}

void QuarryTestBase::TearDown() {
    if (!test_path_.empty() && fs::exists(test_path_)) {
        fs::remove_all(test_path_);
    }
}

//==============================================================================
// Test data
//==============================================================================

std::shared_ptr<arrow::Schema> TestSchema() {
    return arrow::schema({
        arrow::field(kRecordKeyField, arrow::utf8()),
        arrow::field(kPartitionPathField, arrow::utf8()),
        arrow::field("ts", arrow::int64()),
        arrow::field("value", arrow::utf8()),
    });
}

std::shared_ptr<arrow::RecordBatch> MakeBatch(const std::vector<TestRow>& rows) {
    arrow::StringBuilder keys;
    arrow::StringBuilder partitions;
    arrow::Int64Builder ts;
    arrow::StringBuilder values;
    for (const auto& row : rows) {
        EXPECT_TRUE(keys.Append(row.key).ok());
        EXPECT_TRUE(partitions.Append(row.partition).ok());
        EXPECT_TRUE(ts.Append(row.ts).ok());
        EXPECT_TRUE(values.Append(row.value).ok());
    }
    std::shared_ptr<arrow::Array> key_array;
    std::shared_ptr<arrow::Array> partition_array;
    std::shared_ptr<arrow::Array> ts_array;
    std::shared_ptr<arrow::Array> value_array;
    EXPECT_TRUE(keys.Finish(&key_array).ok());
    EXPECT_TRUE(partitions.Finish(&partition_array).ok());
    EXPECT_TRUE(ts.Finish(&ts_array).ok());
    EXPECT_TRUE(values.Finish(&value_array).ok());
    return arrow::RecordBatch::Make(TestSchema(), static_cast<int64_t>(rows.size()),
                                    {key_array, partition_array, ts_array, value_array});
}

std::string ValueOf(const LogRecord& record) {
    if (!record.batch) return "";
    auto column = record.batch->GetColumnByName("value");
    if (!column || column->IsNull(record.row)) return "";
    auto scalar = column->GetScalar(record.row);
    return scalar.ok() ? scalar.ValueOrDie()->ToString() : "";
}

std::string CellOf(const std::shared_ptr<arrow::Table>& table, const std::string& name,
                   int64_t row) {
    auto column = table->GetColumnByName(name);
    if (!column) return "";
    auto scalar = column->GetScalar(row);
    if (!scalar.ok() || !scalar.ValueOrDie()->is_valid) return "";
    return scalar.ValueOrDie()->ToString();
}

ScanCallbacks CollectedRecords::Callbacks() {
    ScanCallbacks callbacks;
    callbacks.on_record = [this](const LogRecord& record) {
        values[record.record_key] = ValueOf(record);
        ordering[record.record_key] = record.ordering_value;
        return Status::OK();
    };
    callbacks.on_delete = [this](const DeleteRecord& del) {
        deletes.insert(del.record_key);
        return Status::OK();
    };
    return callbacks;
}

//==============================================================================
// TestTable
//==============================================================================

TableConfig DefaultTestConfig() {
    TableConfig config;
    config.name = "test_table";
    config.type = TableType::kMergeOnRead;
    config.version = TableVersion::kEight;
    config.partition_fields = {"region"};
    config.record_key_fields = {kRecordKeyField};
    config.ordering_fields = {"ts"};
    return config;
}

TestTable::TestTable(std::shared_ptr<FileSystem> fs, std::string base_path, TableConfig config)
    : fs_(std::move(fs)), base_path_(std::move(base_path)), config_(std::move(config)) {}

Status TestTable::Init() {
    std::unique_ptr<TableMetaClient> client;
    auto status = TableMetaClient::Create(fs_, base_path_, config_, &client);
    if (!status.ok()) return status;
    meta_client_ = std::move(client);
    return Status::OK();
}

Status TestTable::AddPartition(const std::string& partition) {
    std::string dir = ConstructAbsolutePath(base_path_, partition);
    auto status = fs_->CreateDirectory(dir);
    if (!status.ok()) return status;
    FileOperations ops(fs_);
    return ops.WriteFile(ConstructAbsolutePath(dir, kPartitionMetafile), std::string("{}"));
}

std::string TestTable::BaseFilePath(const std::string& partition, const std::string& file_id,
                                    const std::string& instant) const {
    return ConstructAbsolutePath(ConstructAbsolutePath(base_path_, partition),
                                 MakeBaseFileName(file_id, kTestWriteToken, instant));
}

std::string TestTable::LogFilePath(const std::string& partition, const std::string& file_id,
                                   const std::string& base_instant, int version) const {
    return ConstructAbsolutePath(ConstructAbsolutePath(base_path_, partition),
                                 MakeLogFileName(file_id, base_instant, version, kTestWriteToken));
}

Status TestTable::WriteBaseFile(const std::string& partition, const std::string& file_id,
                                const std::string& instant, const std::vector<TestRow>& rows,
                                WriteStat* stat) {
    std::string path = BaseFilePath(partition, file_id, instant);
    auto table_result = arrow::Table::FromRecordBatches(TestSchema(), {MakeBatch(rows)});
    if (!table_result.ok()) {
        return Status::InternalError(table_result.status().ToString());
    }
    auto status = fs_->CreateDirectory(GetParentPath(path));
    if (!status.ok()) return status;
    status = WriteArrowFile(fs_.get(), path, table_result.ValueOrDie());
    if (!status.ok()) return status;

    FileInfo info;
    status = fs_->GetFileInfo(path, &info);
    if (!status.ok()) return status;

    if (stat) {
        stat->file_id = file_id;
        stat->path = ConstructAbsolutePath(partition, GetFileName(path));
        stat->num_writes = static_cast<int64_t>(rows.size());
        stat->file_size_in_bytes = static_cast<int64_t>(info.size);
    }
    return Status::OK();
}

Status TestTable::OpenLogWriter(const std::string& partition, const std::string& file_id,
                                const std::string& base_instant,
                                std::unique_ptr<LogFormatWriter>* writer) const {
    return LogFormatWriter::Open(fs_, LogFilePath(partition, file_id, base_instant), writer);
}

void TestTable::FillLogStat(const std::string& partition, const std::string& file_id,
                            const std::string& base_instant, WriteStat* stat) const {
    if (!stat) return;
    std::string path = LogFilePath(partition, file_id, base_instant);
    FileInfo info;
    if (fs_->GetFileInfo(path, &info).ok()) {
        stat->file_size_in_bytes = static_cast<int64_t>(info.size);
    }
    stat->file_id = file_id;
    stat->path = ConstructAbsolutePath(partition, GetFileName(path));
    stat->prev_commit = base_instant;
}

Status TestTable::AppendDataBlock(const std::string& partition, const std::string& file_id,
                                  const std::string& base_instant, const std::string& instant,
                                  const std::vector<TestRow>& rows, WriteStat* stat,
                                  const std::vector<std::string>& compacted_instants) {
    std::unique_ptr<LogFormatWriter> writer;
    auto status = OpenLogWriter(partition, file_id, base_instant, &writer);
    if (!status.ok()) return status;

    LogBlockHeader header;
    header[HeaderKey::kInstantTime] = instant;
    if (!compacted_instants.empty()) {
        std::string joined;
        for (const auto& compacted : compacted_instants) {
            if (!joined.empty()) joined += ",";
            joined += compacted;
        }
        header[HeaderKey::kCompactedBlockTimes] = joined;
    }
    status = writer->AppendDataBlock(header, MakeBatch(rows));
    if (!status.ok()) return status;
    status = writer->Close();
    if (!status.ok()) return status;

    FillLogStat(partition, file_id, base_instant, stat);
    if (stat) stat->num_writes = static_cast<int64_t>(rows.size());
    return Status::OK();
}

Status TestTable::AppendDeleteBlock(const std::string& partition, const std::string& file_id,
                                    const std::string& base_instant, const std::string& instant,
                                    const std::vector<DeleteRecord>& deletes, WriteStat* stat) {
    std::unique_ptr<LogFormatWriter> writer;
    auto status = OpenLogWriter(partition, file_id, base_instant, &writer);
    if (!status.ok()) return status;

    LogBlockHeader header;
    header[HeaderKey::kInstantTime] = instant;
    status = writer->AppendDeleteBlock(header, deletes);
    if (!status.ok()) return status;
    status = writer->Close();
    if (!status.ok()) return status;

    FillLogStat(partition, file_id, base_instant, stat);
    if (stat) stat->num_deletes = static_cast<int64_t>(deletes.size());
    return Status::OK();
}

Status TestTable::AppendRollbackBlock(const std::string& partition, const std::string& file_id,
                                      const std::string& base_instant, const std::string& instant,
                                      const std::string& target_instant) {
    std::unique_ptr<LogFormatWriter> writer;
    auto status = OpenLogWriter(partition, file_id, base_instant, &writer);
    if (!status.ok()) return status;
    status = writer->AppendRollbackBlock(instant, target_instant);
    if (!status.ok()) return status;
    return writer->Close();
}

Status TestTable::CompleteInstant(const std::string& action, const std::string& requested_time,
                                  const std::string& completion_time, const std::string& content,
                                  Instant* instant) {
    Instant requested;
    auto status = meta_client_->CreateRequestedInstant(action, requested_time, "", &requested);
    if (!status.ok()) return status;
    Instant inflight;
    status = meta_client_->TransitionToInflight(requested, "", &inflight);
    if (!status.ok()) return status;
    Instant completed;
    status = meta_client_->SaveAsComplete(inflight, completion_time, content, &completed);
    if (!status.ok()) return status;
    if (instant) *instant = completed;
    return Status::OK();
}

Status TestTable::Commit(const std::string& action, const std::string& requested_time,
                         const std::string& completion_time, const CommitMetadata& metadata) {
    std::string json;
    auto status = metadata.ToJson(&json);
    if (!status.ok()) return status;
    return CompleteInstant(action, requested_time, completion_time, json);
}

Status TestTable::ReplaceCommit(const std::string& requested_time,
                                const std::string& completion_time,
                                const ReplaceCommitMetadata& metadata) {
    std::string json;
    auto status = metadata.ToJson(&json);
    if (!status.ok()) return status;
    return CompleteInstant(actions::kReplaceCommit, requested_time, completion_time, json);
}

Status TestTable::Clean(const std::string& requested_time, const std::string& completion_time,
                        const CleanMetadata& metadata) {
    std::string json;
    auto status = metadata.ToJson(&json);
    if (!status.ok()) return status;
    return CompleteInstant(actions::kClean, requested_time, completion_time, json);
}

Status TestTable::Rollback(const std::string& requested_time, const std::string& completion_time,
                           const RollbackMetadata& metadata) {
    std::string json;
    auto status = metadata.ToJson(&json);
    if (!status.ok()) return status;
    return CompleteInstant(actions::kRollback, requested_time, completion_time, json);
}

Status TestTable::Restore(const std::string& requested_time, const std::string& completion_time,
                          const RestoreMetadata& metadata) {
    std::string json;
    auto status = metadata.ToJson(&json);
    if (!status.ok()) return status;
    return CompleteInstant(actions::kRestore, requested_time, completion_time, json);
}

Status TestTable::StartInstant(const std::string& action, const std::string& requested_time) {
    Instant requested;
    auto status = meta_client_->CreateRequestedInstant(action, requested_time, "", &requested);
    if (!status.ok()) return status;
    Instant inflight;
    return meta_client_->TransitionToInflight(requested, "", &inflight);
}

Status TestTable::ScheduleCompaction(const std::string& requested_time,
                                     const CompactionPlan& plan) {
    std::string json;
    auto status = plan.ToJson(&json);
    if (!status.ok()) return status;
    Instant requested;
    return meta_client_->CreateRequestedInstant(actions::kCompaction, requested_time, json,
                                                &requested);
}

Status TestTable::ScheduleLogCompaction(const std::string& requested_time,
                                        const CompactionPlan& plan) {
    std::string json;
    auto status = plan.ToJson(&json);
    if (!status.ok()) return status;
    Instant requested;
    return meta_client_->CreateRequestedInstant(actions::kLogCompaction, requested_time, json,
                                                &requested);
}

Status TestTable::CompleteCompaction(const std::string& requested_time,
                                     const std::string& completion_time,
                                     const CommitMetadata& metadata) {
    std::string json;
    auto status = metadata.ToJson(&json);
    if (!status.ok()) return status;
    Instant inflight;
    status = meta_client_->TransitionToInflight(
        Instant(InstantState::kRequested, actions::kCompaction, requested_time), "", &inflight);
    if (!status.ok()) return status;
    Instant completed;
    return meta_client_->SaveAsComplete(inflight, completion_time, json, &completed);
}

Status TestTable::GetTimeline(Timeline* timeline) const {
    return meta_client_->ReloadActiveTimeline(timeline);
}

} // namespace test
} // namespace quarry
