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


#include "quarry/log_record_scanner.h"

#include <algorithm>
#include <deque>

#include <arrow/compute/cast.h>

#include "quarry/arrow_serialization.h"
#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(LogScanner);

//==============================================================================
// InstantRange / KeySpec
//==============================================================================

InstantRange InstantRange::OpenClosed(const std::string& start, const std::string& end) {
    InstantRange range;
    range.type = InstantRangeType::kOpenClosed;
    range.start = start;
    range.end = end;
    return range;
}

InstantRange InstantRange::ClosedClosed(const std::string& start, const std::string& end) {
    InstantRange range;
    range.type = InstantRangeType::kClosedClosed;
    range.start = start;
    range.end = end;
    return range;
}

InstantRange InstantRange::ExactMatch(std::set<std::string> instants) {
    InstantRange range;
    range.type = InstantRangeType::kExactMatch;
    range.instants = std::move(instants);
    return range;
}

bool InstantRange::IsInRange(const std::string& instant) const {
    switch (type) {
        case InstantRangeType::kExactMatch:
            return instants.count(instant) > 0;
        case InstantRangeType::kOpenClosed:
            if (!start.empty() && instant <= start) return false;
            return end.empty() || instant <= end;
        case InstantRangeType::kClosedClosed:
            if (!start.empty() && instant < start) return false;
            return end.empty() || instant <= end;
    }
    return false;
}

bool KeySpec::Matches(const std::string& record_key) const {
    for (const auto& key : keys) {
        if (full_key ? record_key == key : record_key.compare(0, key.size(), key) == 0) {
            return true;
        }
    }
    return false;
}

//==============================================================================
// Scan state
//==============================================================================

namespace {

// Column mapping from one on-write schema to the target schema.
struct Projection {
    std::vector<int> source_index;  // -1 when the column is missing
    std::vector<bool> needs_cast;
};

}  // namespace

struct LogRecordScanner::ScanState {
    ScanResult* result = nullptr;
    size_t total_files = 0;

    // Front is newest; drained from the back.
    std::deque<std::shared_ptr<LogBlock>> queue;

    std::map<std::string, LogRecord> records;
    std::unordered_map<std::string, Projection> projections;
};

LogRecordScanner::LogRecordScanner(LogScanOptions options) : options_(std::move(options)) {}

bool LogRecordScanner::IsUncommitted(const std::string& instant_time) const {
    if (options_.allow_inflight_instants) return false;
    return !options_.completed_instants.ContainsOrBeforeTimelineStarts(instant_time) ||
           options_.inflight_instants.ContainsInstant(instant_time);
}

bool LogRecordScanner::IsAboveCeiling(const std::string& instant_time) const {
    return !options_.latest_instant_time.empty() && instant_time > options_.latest_instant_time;
}

bool LogRecordScanner::IsOutOfRange(const std::string& instant_time) const {
    return options_.instant_range && !options_.instant_range->IsInRange(instant_time);
}

//==============================================================================
// Entry points
//==============================================================================

Status LogRecordScanner::Scan(const ScanCallbacks& callbacks, ScanResult* result) {
    if (!options_.fs) {
        return Status::InvalidArgument("Log scan needs a file system");
    }

    std::vector<LogFile> log_files;
    log_files.reserve(options_.log_file_paths.size());
    for (const auto& path : options_.log_file_paths) {
        LogFile log_file;
        auto status = LogFile::FromPath(path, 0, &log_file);
        if (!status.ok()) return status;
        log_files.push_back(std::move(log_file));
    }

    LogReaderOptions reader_options;
    reader_options.read_blocks_lazily = options_.read_blocks_lazily;
    reader_options.reverse = options_.reverse_reader;

    LogFormatReader reader(options_.fs, std::move(log_files), reader_options);
    return Scan(&reader, options_.log_file_paths.size(), callbacks, result);
}

Status LogRecordScanner::Scan(LogBlockSource* source, size_t total_files,
                              const ScanCallbacks& callbacks, ScanResult* result) {
    if (!options_.merger) {
        auto close_status = source->Close();
        if (!close_status.ok()) return close_status;
        return Status::InvalidArgument("Log scan needs a record merger");
    }

    *result = ScanResult();
    ScanState state;
    state.result = result;
    state.total_files = total_files;

    Status status = options_.variant == ScanVariant::kSinglePass ? ScanSinglePass(source, &state)
                                                                  : ScanTwoPass(source, &state);
    result->total_log_files = static_cast<int64_t>(source->FilesOpened());

    if (status.ok()) {
        for (const auto& [key, record] : state.records) {
            if (record.is_delete) {
                if (callbacks.on_delete) status = callbacks.on_delete(record.ToDeleteRecord());
            } else if (callbacks.on_record) {
                status = callbacks.on_record(record);
            }
            if (!status.ok()) break;
        }
    }

    auto close_status = source->Close();
    if (!status.ok()) {
        QUARRY_LOG_ERROR(LogScanner) << "Log scan failed: " << status.ToString();
        return status;
    }
    if (!close_status.ok()) return close_status;

    result->progress = 1.0;
    return Status::OK();
}

//==============================================================================
// Single pass
//==============================================================================

Status LogRecordScanner::ScanSinglePass(LogBlockSource* source, ScanState* state) {
    ScanResult* result = state->result;

    while (true) {
        std::shared_ptr<LogBlock> block;
        auto status = source->Next(&block);
        if (!status.ok()) return status;
        if (!block) break;

        const LogFile* log_file = source->CurrentLogFile();
        const std::string path = log_file ? log_file->path : std::string();
        const std::string instant_time = block->GetInstantTime();
        ++result->total_log_blocks;

        if (block->IsDataOrDeleteBlock()) {
            if (IsUncommitted(instant_time) || IsAboveCeiling(instant_time) ||
                IsOutOfRange(instant_time)) {
                continue;
            }
        }

        switch (block->GetType()) {
            case LogBlockType::kArrowData:
            case LogBlockType::kDelete:
                QUARRY_LOG_DEBUG(LogScanner) << "Queued " << LogBlockTypeToString(block->GetType())
                                             << " block from " << path << " at " << instant_time;
                state->queue.push_front(block);
                break;

            case LogBlockType::kCommand: {
                CommandType command;
                status = block->GetCommandType(&command);
                if (!status.ok()) return status;

                // Only ROLLBACK parses successfully.
                const std::string target = block->GetTargetInstantTime();
                size_t before = state->queue.size();
                state->queue.erase(
                    std::remove_if(state->queue.begin(), state->queue.end(),
                                   [&target](const std::shared_ptr<LogBlock>& queued) {
                                       return queued->GetType() == LogBlockType::kCorrupt ||
                                              queued->GetInstantTime() == target;
                                   }),
                    state->queue.end());
                size_t rolled_back = before - state->queue.size();
                result->total_rollbacks += static_cast<int64_t>(rolled_back);
                if (rolled_back == 0) {
                    QUARRY_LOG_WARN(LogScanner) << "Rollback of " << target
                                                << " matched no blocks in " << path;
                }
                break;
            }

            case LogBlockType::kCorrupt:
                QUARRY_LOG_INFO(LogScanner) << "Found a corrupt block in " << path;
                ++result->total_corrupt_blocks;
                state->queue.push_front(block);
                break;
        }
    }

    for (auto it = state->queue.rbegin(); it != state->queue.rend(); ++it) {
        if ((*it)->IsDataOrDeleteBlock()) {
            result->valid_block_instants.push_back((*it)->GetInstantTime());
        }
    }
    result->total_log_files = static_cast<int64_t>(source->FilesOpened());
    return ProcessQueuedBlocks(state);
}

//==============================================================================
// Two pass
//==============================================================================

Status LogRecordScanner::ScanTwoPass(LogBlockSource* source, ScanState* state) {
    ScanResult* result = state->result;

    std::unordered_map<std::string, std::vector<std::shared_ptr<LogBlock>>> instant_blocks;
    std::vector<std::string> ordered_instants;

    while (true) {
        std::shared_ptr<LogBlock> block;
        auto status = source->Next(&block);
        if (!status.ok()) return status;
        if (!block) break;

        const LogFile* log_file = source->CurrentLogFile();
        const std::string path = log_file ? log_file->path : std::string();
        const std::string instant_time = block->GetInstantTime();
        ++result->total_log_blocks;

        if (block->GetType() == LogBlockType::kCorrupt) {
            QUARRY_LOG_INFO(LogScanner) << "Found a corrupt block in " << path;
            ++result->total_corrupt_blocks;
            continue;
        }
        if (block->IsDataOrDeleteBlock() && IsAboveCeiling(instant_time)) {
            continue;
        }
        if (block->GetType() != LogBlockType::kCommand &&
            (IsUncommitted(instant_time) || IsOutOfRange(instant_time))) {
            continue;
        }

        if (block->GetType() == LogBlockType::kCommand) {
            CommandType command;
            status = block->GetCommandType(&command);
            if (!status.ok()) return status;

            ++result->total_rollbacks;
            const std::string target = block->GetTargetInstantTime();
            ordered_instants.erase(
                std::remove(ordered_instants.begin(), ordered_instants.end(), target),
                ordered_instants.end());
            instant_blocks.erase(target);
            continue;
        }

        auto& blocks = instant_blocks[instant_time];
        if (blocks.empty()) {
            ordered_instants.push_back(instant_time);
        }
        blocks.push_back(block);
    }

    // Original instant -> instant of the log-compacted block that supersedes it.
    std::unordered_map<std::string, std::string> compacted_into;
    std::set<std::string> included;

    auto enqueue = [&](const std::string& instant_time) -> Status {
        auto it = instant_blocks.find(instant_time);
        if (it == instant_blocks.end() || it->second.empty()) {
            return Status::Corruption(
                "Data corrupted while writing. Found zero blocks for an instant " + instant_time);
        }
        for (auto block = it->second.rbegin(); block != it->second.rend(); ++block) {
            state->queue.push_back(*block);
        }
        included.insert(instant_time);
        result->valid_block_instants.push_back(instant_time);
        return Status::OK();
    };

    for (auto it = ordered_instants.rbegin(); it != ordered_instants.rend(); ++it) {
        const std::string& instant_time = *it;
        auto blocks = instant_blocks.find(instant_time);
        if (blocks == instant_blocks.end() || blocks->second.empty()) {
            return Status::Corruption(
                "Data corrupted while writing. Found zero blocks for an instant " + instant_time);
        }

        const auto& first_block = blocks->second.front();
        if (first_block->HasHeader(HeaderKey::kCompactedBlockTimes)) {
            auto final_it = compacted_into.find(instant_time);
            const std::string final_instant =
                final_it == compacted_into.end() ? instant_time : final_it->second;
            for (const auto& original : first_block->GetCompactedBlockTimes()) {
                compacted_into[original] = final_instant;
            }
            continue;
        }

        auto mapped = compacted_into.find(instant_time);
        if (mapped == compacted_into.end()) {
            auto status = enqueue(instant_time);
            if (!status.ok()) return status;
            continue;
        }
        if (included.count(mapped->second) > 0) {
            continue;
        }
        auto status = enqueue(mapped->second);
        if (!status.ok()) return status;
    }

    result->total_log_files = static_cast<int64_t>(source->FilesOpened());
    if (options_.skip_processing) {
        state->queue.clear();
        return Status::OK();
    }
    return ProcessQueuedBlocks(state);
}

//==============================================================================
// Drain
//==============================================================================

Status LogRecordScanner::ProcessQueuedBlocks(ScanState* state) {
    while (!state->queue.empty()) {
        std::shared_ptr<LogBlock> block = state->queue.back();
        state->queue.pop_back();

        Status status;
        switch (block->GetType()) {
            case LogBlockType::kArrowData:
                status = ProcessDataBlock(*block, state);
                break;
            case LogBlockType::kDelete:
                status = ProcessDeleteBlock(*block, state);
                break;
            case LogBlockType::kCorrupt:
                QUARRY_LOG_WARN(LogScanner) << "Found a corrupt block which was not rolled back in "
                                            << block->GetLocation().path;
                break;
            case LogBlockType::kCommand:
                break;
        }
        if (!status.ok()) return status;
    }

    if (state->total_files > 0) {
        size_t seen = std::max<size_t>(state->result->total_log_files, 1);
        double progress = static_cast<double>(seen - 1) / static_cast<double>(state->total_files);
        state->result->progress = std::max(state->result->progress, progress);
    }
    return Status::OK();
}

Status LogRecordScanner::ProjectBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                                      std::shared_ptr<arrow::RecordBatch>* projected,
                                      ScanState* state) {
    const auto& target = options_.target_schema;
    if (!target || batch->schema()->Equals(*target)) {
        *projected = batch;
        return Status::OK();
    }

    const std::string schema_key = batch->schema()->ToString();
    auto cached = state->projections.find(schema_key);
    if (cached == state->projections.end()) {
        Projection projection;
        for (const auto& field : target->fields()) {
            int index = batch->schema()->GetFieldIndex(field->name());
            projection.source_index.push_back(index);
            projection.needs_cast.push_back(
                index >= 0 && !batch->schema()->field(index)->type()->Equals(field->type()));
        }
        cached = state->projections.emplace(schema_key, std::move(projection)).first;
    }
    const Projection& projection = cached->second;

    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.reserve(target->num_fields());
    for (int i = 0; i < target->num_fields(); ++i) {
        int index = projection.source_index[i];
        if (index >= 0 && !projection.needs_cast[i]) {
            columns.push_back(batch->column(index));
            continue;
        }
        std::shared_ptr<arrow::Array> column;
        auto status = EvolveColumn(index < 0 ? nullptr : batch->column(index), target->field(i),
                                   batch->num_rows(), &column);
        if (!status.ok()) return status;
        columns.push_back(std::move(column));
    }
    *projected = arrow::RecordBatch::Make(target, batch->num_rows(), std::move(columns));
    return Status::OK();
}

Status LogRecordScanner::ProcessDataBlock(const LogBlock& block, ScanState* state) {
    std::shared_ptr<arrow::RecordBatch> raw;
    auto status = block.GetRecordBatch(&raw);
    if (!status.ok()) return status;

    std::shared_ptr<arrow::RecordBatch> batch;
    status = ProjectBatch(raw, &batch, state);
    if (!status.ok()) return status;

    auto key_column = batch->GetColumnByName(options_.record_key_field);
    if (!key_column || key_column->type_id() != arrow::Type::STRING) {
        return Status::InvalidArgument("Data block at " + block.GetLocation().path +
                                       " has no string column " + options_.record_key_field);
    }
    auto keys = std::static_pointer_cast<arrow::StringArray>(key_column);

    std::shared_ptr<arrow::StringArray> partitions;
    if (!options_.partition_name) {
        auto column = batch->GetColumnByName(options_.partition_field);
        if (column && column->type_id() == arrow::Type::STRING) {
            partitions = std::static_pointer_cast<arrow::StringArray>(column);
        }
    }

    std::shared_ptr<arrow::Int64Array> ordering;
    if (!options_.ordering_field.empty()) {
        auto column = batch->GetColumnByName(options_.ordering_field);
        if (column) {
            if (column->type_id() != arrow::Type::INT64) {
                auto cast = arrow::compute::Cast(*column, arrow::int64());
                if (!cast.ok()) {
                    return Status::InvalidArgument("Ordering field " + options_.ordering_field +
                                                   " is not integral: " +
                                                   cast.status().ToString());
                }
                column = *cast;
            }
            ordering = std::static_pointer_cast<arrow::Int64Array>(column);
        }
    }

    const std::string instant_time = block.GetInstantTime();
    for (int64_t row = 0; row < batch->num_rows(); ++row) {
        if (keys->IsNull(row)) {
            return Status::InvalidArgument("Null record key in data block at " +
                                           block.GetLocation().path);
        }
        LogRecord record;
        record.record_key = keys->GetString(row);
        if (options_.key_spec && !options_.key_spec->Matches(record.record_key)) {
            continue;
        }
        if (options_.partition_name) {
            record.partition_path = *options_.partition_name;
        } else if (partitions && !partitions->IsNull(row)) {
            record.partition_path = partitions->GetString(row);
        }
        if (ordering && !ordering->IsNull(row)) {
            record.ordering_value = ordering->Value(row);
        }
        record.instant_time = instant_time;
        record.batch = batch;
        record.row = row;

        ++state->result->total_log_records;
        status = MergeRecord(std::move(record), state);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

Status LogRecordScanner::ProcessDeleteBlock(const LogBlock& block, ScanState* state) {
    std::vector<DeleteRecord> deletes;
    auto status = block.GetDeleteRecords(&deletes);
    if (!status.ok()) return status;

    const std::string instant_time = block.GetInstantTime();
    for (const auto& del : deletes) {
        if (options_.key_spec && !options_.key_spec->Matches(del.record_key)) {
            continue;
        }
        status = MergeRecord(LogRecord::FromDelete(del, instant_time), state);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

Status LogRecordScanner::MergeRecord(LogRecord record, ScanState* state) {
    auto it = state->records.find(record.record_key);
    if (it == state->records.end()) {
        state->records.emplace(record.record_key, std::move(record));
        return Status::OK();
    }

    LogRecord merged;
    auto status = options_.merger->Merge(it->second, record, options_.merge_props, &merged);
    if (!status.ok()) return status;
    it->second = std::move(merged);
    return Status::OK();
}

} // namespace quarry
