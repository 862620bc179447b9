/************************************************************************
Copyright 2024 Quarry Contributors

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
**************************************************************************/


#include "quarry/file_slice_reader.h"

#include <map>
#include <vector>

#include "quarry/arrow_serialization.h"
#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(FileSliceReader);

FileSliceReader::FileSliceReader(std::shared_ptr<FileSystem> fs, FileSliceReaderOptions options)
    : fs_(std::move(fs)), options_(std::move(options)) {}

Status FileSliceReader::LoadBaseFile(const FileSlice& slice,
                                     std::map<std::string, LogRecord>* records) {
    const BaseFile& base_file = *slice.GetBaseFile();
    std::shared_ptr<arrow::Table> table;
    auto status = ReadArrowFile(fs_.get(), base_file.path, &table);
    if (!status.ok()) return status;

    arrow::TableBatchReader reader(*table);
    while (true) {
        std::shared_ptr<arrow::RecordBatch> raw;
        auto read_status = reader.ReadNext(&raw);
        if (!read_status.ok()) {
            return Status::Corruption("Failed to read base file " + base_file.path + ": " +
                                      read_status.ToString());
        }
        if (!raw) break;

        std::shared_ptr<arrow::RecordBatch> batch;
        status = ProjectRecordBatch(raw, options_.reader_schema, &batch);
        if (!status.ok()) return status;

        auto key_column = batch->GetColumnByName(kRecordKeyField);
        if (!key_column || key_column->type_id() != arrow::Type::STRING) {
            return Status::InvalidArgument("Base file " + base_file.path + " has no string column " +
                                           kRecordKeyField);
        }
        auto keys = std::static_pointer_cast<arrow::StringArray>(key_column);

        std::shared_ptr<arrow::Int64Array> ordering;
        if (!options_.ordering_field.empty()) {
            auto column = raw->GetColumnByName(options_.ordering_field);
            if (column) {
                std::shared_ptr<arrow::Array> evolved;
                status = EvolveColumn(column, arrow::field(options_.ordering_field, arrow::int64()),
                                      raw->num_rows(), &evolved);
                if (!status.ok()) return status;
                ordering = std::static_pointer_cast<arrow::Int64Array>(evolved);
            }
        }

        for (int64_t row = 0; row < batch->num_rows(); ++row) {
            if (keys->IsNull(row)) continue;
            LogRecord record;
            record.record_key = keys->GetString(row);
            record.partition_path = slice.GetPartitionPath();
            record.instant_time = base_file.commit_time;
            if (ordering && !ordering->IsNull(row)) {
                record.ordering_value = ordering->Value(row);
            }
            record.batch = batch;
            record.row = row;
            (*records)[record.record_key] = std::move(record);
        }
    }
    return Status::OK();
}

Status FileSliceReader::Read(const FileSlice& slice, std::shared_ptr<arrow::Table>* table) {
    if (!options_.reader_schema) {
        return Status::InvalidArgument("File slice reader needs a reader schema");
    }
    if (!options_.merger) {
        return Status::InvalidArgument("File slice reader needs a record merger");
    }

    last_scan_ = ScanResult();
    std::map<std::string, LogRecord> records;
    if (slice.GetBaseFile()) {
        auto status = LoadBaseFile(slice, &records);
        if (!status.ok()) return status;
    }

    if (!slice.GetLogFiles().empty()) {
        LogScanOptions scan;
        scan.fs = fs_;
        for (const auto& log_file : slice.GetLogFiles()) {
            scan.log_file_paths.push_back(log_file.path);
        }
        scan.reader_schema = options_.reader_schema;
        scan.target_schema = options_.reader_schema;
        scan.latest_instant_time = options_.latest_instant_time;
        scan.merger = options_.merger;
        scan.merge_props = options_.merge_props;
        scan.ordering_field = options_.ordering_field;
        scan.partition_name = slice.GetPartitionPath();
        scan.completed_instants = options_.completed_instants;
        scan.variant = options_.variant;

        // Log records are newer than every base row of the slice.
        auto overlay = [&](const LogRecord& newer) -> Status {
            auto it = records.find(newer.record_key);
            if (it == records.end()) {
                if (!newer.is_delete) records.emplace(newer.record_key, newer);
                return Status::OK();
            }
            LogRecord merged;
            auto status = options_.merger->Merge(it->second, newer, options_.merge_props, &merged);
            if (!status.ok()) return status;
            if (merged.is_delete) {
                records.erase(it);
            } else {
                it->second = std::move(merged);
            }
            return Status::OK();
        };

        ScanCallbacks callbacks;
        callbacks.on_record = overlay;
        callbacks.on_delete = [&](const DeleteRecord& del) {
            return overlay(LogRecord::FromDelete(del, slice.GetBaseInstantTime()));
        };

        LogRecordScanner scanner(std::move(scan));
        auto status = scanner.Scan(callbacks, &last_scan_);
        if (!status.ok()) return status;
    }

    std::vector<std::shared_ptr<arrow::RecordBatch>> rows;
    rows.reserve(records.size());
    for (const auto& entry : records) {
        std::shared_ptr<arrow::RecordBatch> row = entry.second.batch->Slice(entry.second.row, 1);
        std::shared_ptr<arrow::RecordBatch> projected;
        auto status = ProjectRecordBatch(row, options_.reader_schema, &projected);
        if (!status.ok()) return status;
        rows.push_back(std::move(projected));
    }

    auto table_result = arrow::Table::FromRecordBatches(options_.reader_schema, rows);
    if (!table_result.ok()) {
        return Status::InternalError("Failed to assemble slice table: " +
                                     table_result.status().ToString());
    }
    auto combined = table_result.ValueOrDie()->CombineChunks();
    if (!combined.ok()) {
        return Status::InternalError("Failed to combine slice table: " +
                                     combined.status().ToString());
    }
    *table = combined.ValueOrDie();

    QUARRY_LOG_DEBUG(FileSliceReader) << "Read slice " << slice.ToString() << ": "
                                      << (*table)->num_rows() << " rows, "
                                      << last_scan_.total_log_blocks << " log blocks";
    return Status::OK();
}

} // namespace quarry
