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

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <arrow/api.h>

#include "quarry/file_system.h"
#include "quarry/log_format.h"
#include "quarry/log_record.h"
#include "quarry/record_merger.h"
#include "quarry/status.h"
#include "quarry/timeline.h"

namespace quarry {

enum class InstantRangeType {
    kOpenClosed,    // (start, end]
    kClosedClosed,  // [start, end]
    kExactMatch,    // one of a fixed set
};

/**
 * @brief Filter on the owning instant of a log block
 *
 * An empty start or end leaves that side unbounded.
 */
struct InstantRange {
    InstantRangeType type = InstantRangeType::kOpenClosed;
    std::string start;
    std::string end;
    std::set<std::string> instants;

    static InstantRange OpenClosed(const std::string& start, const std::string& end);
    static InstantRange ClosedClosed(const std::string& start, const std::string& end);
    static InstantRange ExactMatch(std::set<std::string> instants);

    bool IsInRange(const std::string& instant) const;
};

// Restricts a scan to record keys, matched fully or by prefix.
struct KeySpec {
    std::vector<std::string> keys;
    bool full_key = true;

    bool Matches(const std::string& record_key) const;
};

enum class ScanVariant {
    kSinglePass,  // undo-queue over the forward block stream
    kTwoPass,     // instant grouping, log-compaction aware
};

struct LogScanOptions {
    std::shared_ptr<FileSystem> fs;
    std::string base_path;
    std::vector<std::string> log_file_paths;
    std::shared_ptr<arrow::Schema> reader_schema;

    // Data and delete blocks above this instant are ignored; empty means no ceiling.
    std::string latest_instant_time;
    std::optional<InstantRange> instant_range;

    std::shared_ptr<RecordMerger> merger;
    MergeProps merge_props;

    std::string record_key_field = kRecordKeyField;
    std::string partition_field = kPartitionPathField;
    std::string ordering_field;
    std::optional<std::string> partition_name;

    bool allow_inflight_instants = false;
    ScanVariant variant = ScanVariant::kSinglePass;

    // Records are projected to this schema before merging when set.
    std::shared_ptr<arrow::Schema> target_schema;
    std::optional<KeySpec> key_spec;

    // Completed commits and compactions; blocks of other instants are uncommitted.
    Timeline completed_instants;
    Timeline inflight_instants;

    bool read_blocks_lazily = true;
    bool reverse_reader = false;

    // Two-pass only: resolve blocks without merging records.
    bool skip_processing = false;
};

struct ScanCallbacks {
    std::function<Status(const LogRecord&)> on_record;
    std::function<Status(const DeleteRecord&)> on_delete;
};

struct ScanResult {
    int64_t total_log_files = 0;
    int64_t total_log_blocks = 0;
    int64_t total_log_records = 0;
    int64_t total_rollbacks = 0;
    int64_t total_corrupt_blocks = 0;
    // Instants whose blocks were queued for merging, in queue order.
    std::vector<std::string> valid_block_instants;
    double progress = 0.0;
};

/**
 * @brief Reconstructs the final records of one file group's log files
 *
 * Blocks are filtered, rolled back and (two-pass) collapsed through their
 * log-compaction chains, then drained oldest first through the merger.
 * Callbacks fire once per final key, after the drain. The scanner keeps no
 * state between scans.
 *
 * Example:
 *   LogScanOptions options;
 *   options.fs = fs;
 *   options.log_file_paths = {slice_log_path};
 *   options.merger = std::make_shared<CommitTimeOrderingMerger>();
 *   options.completed_instants = timeline.GetCommitsAndCompactionTimeline()
 *                                    .FilterCompletedInstants();
 *   LogRecordScanner scanner(options);
 *   ScanResult result;
 *   auto status = scanner.Scan(callbacks, &result);
 */
class LogRecordScanner {
public:
    explicit LogRecordScanner(LogScanOptions options);

    Status Scan(const ScanCallbacks& callbacks, ScanResult* result);

    // Scan blocks from an already opened source of total_files files.
    Status Scan(LogBlockSource* source, size_t total_files,
                const ScanCallbacks& callbacks, ScanResult* result);

    const LogScanOptions& GetOptions() const { return options_; }

private:
    struct ScanState;

    bool IsUncommitted(const std::string& instant_time) const;
    bool IsAboveCeiling(const std::string& instant_time) const;
    bool IsOutOfRange(const std::string& instant_time) const;

    Status ScanSinglePass(LogBlockSource* source, ScanState* state);
    Status ScanTwoPass(LogBlockSource* source, ScanState* state);

    Status ProcessQueuedBlocks(ScanState* state);
    Status ProcessDataBlock(const LogBlock& block, ScanState* state);
    Status ProcessDeleteBlock(const LogBlock& block, ScanState* state);
    Status MergeRecord(LogRecord record, ScanState* state);

    Status ProjectBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                        std::shared_ptr<arrow::RecordBatch>* projected, ScanState* state);

    LogScanOptions options_;
};

} // namespace quarry
