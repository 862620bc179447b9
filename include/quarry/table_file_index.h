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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "quarry/file_group.h"
#include "quarry/file_system_view.h"
#include "quarry/spillable_map.h"
#include "quarry/status.h"
#include "quarry/table_config.h"
#include "quarry/table_meta_client.h"
#include "quarry/timeline.h"

namespace quarry {

enum class QueryType {
    kSnapshot,
    kIncremental,
    kReadOptimized,
};

const char* QueryTypeToString(QueryType type);

/**
 * @brief Relative partition path with its parsed partition column values
 */
struct PartitionPath {
    std::string path;
    std::vector<std::string> values;

    bool operator==(const PartitionPath& other) const {
        return path == other.path && values == other.values;
    }
    bool operator<(const PartitionPath& other) const {
        if (path != other.path) return path < other.path;
        return values < other.values;
    }
};

/**
 * @brief Parse partition column values out of a relative partition path
 *
 * Segments of the form "col=value" yield value, other segments are taken
 * as-is. A single partition column takes the whole path when it has more
 * segments than columns. Any other count mismatch yields no values.
 */
std::vector<std::string> ParsePartitionColumnValues(const std::vector<std::string>& columns,
                                                    const std::string& partition_path);

using PartitionPredicate = std::function<bool(const PartitionPath&)>;

struct FileIndexOptions {
    QueryType query_type = QueryType::kSnapshot;

    // Absolute paths under the base path to restrict listing to. Empty means
    // the whole table.
    std::vector<std::string> query_paths;

    std::optional<std::string> specified_query_instant;
    bool include_pending_commits = false;
    bool validate_instant = false;

    // Eager indexes list every partition and its file slices up front.
    bool list_lazily = false;

    std::optional<std::string> incremental_start_time;
    std::optional<std::string> incremental_end_time;
    // Overrides the table version when choosing requested or completion time ranges.
    std::optional<TableVersion> incremental_table_version;

    bool use_spillable_map = false;
    size_t spillable_memory_bytes = 100 * 1024 * 1024;
    std::string spill_directory = "/tmp/quarry_spill";
    // Scratch storage for spilled slices. Null uses the local file system,
    // never the table's storage.
    std::shared_ptr<FileSystem> spill_file_system;
};

/**
 * @brief Query-shaped index over the latest file slices of a table
 *
 * Partitions are cached in full: once a partition is loaded, every slice of
 * it is in the cache. The index is not thread-safe.
 */
class TableFileIndex {
public:
    /**
     * @brief Create an index and run the first refresh
     *
     * @param meta_client Table handle; its timeline is reloaded on refresh.
     * @param table_metadata Listing source. Null uses a file-system walk.
     */
    static Status Create(std::shared_ptr<TableMetaClient> meta_client,
                         std::shared_ptr<TableMetadata> table_metadata,
                         const FileIndexOptions& options,
                         std::unique_ptr<TableFileIndex>* index);

    ~TableFileIndex();

    // Reload the timeline and drop every cached partition.
    Status Refresh();

    // Query partitions matching the predicate. A null predicate matches all.
    Status ListPartitions(const PartitionPredicate& predicate,
                          std::vector<PartitionPath>* partitions);

    Status GetFileSlices(const std::vector<PartitionPath>& partitions,
                         std::map<PartitionPath, std::vector<FileSlice>>* slices);
    Status GetAllInputFileSlices(std::map<PartitionPath, std::vector<FileSlice>>* slices);
    Status GetFileSlicesCount(size_t* count);

    // Bytes of base and log files in the cached partitions.
    Status GetTotalCachedFilesSize(int64_t* size) const;

    std::optional<Instant> GetLatestCompletedInstant() const;
    bool ShouldReadAsPartitionedTable() const;

    QueryType GetQueryType() const { return options_.query_type; }
    const std::string& GetBasePath() const { return meta_client_->GetBasePath(); }
    const std::vector<std::string>& GetPartitionColumns() const { return partition_columns_; }

    bool AreAllFileSlicesCached() const;

    void Close();

private:
    TableFileIndex(std::shared_ptr<TableMetaClient> meta_client,
                   std::shared_ptr<TableMetadata> table_metadata,
                   const FileIndexOptions& options);

    Status DoRefresh();
    Status ResetCache();

    Status GetAllQueryPartitionPaths(std::vector<PartitionPath>* partitions);
    Status ListPartitionPaths(const std::vector<std::string>& relative_paths,
                              std::vector<PartitionPath>* partitions);
    Status ListWrittenPartitions(const Timeline& timeline, std::vector<std::string>* partitions);
    Status ConvertToPartitionPath(const std::string& path, PartitionPath* partition) const;

    Status EnsurePreloadedPartitions(const std::vector<PartitionPath>& partitions);
    Status LoadFileSlicesForPartitions(const std::vector<PartitionPath>& partitions);

    Status ValidateTimestampAsOf(const std::string& instant) const;
    Status Validate(const Timeline& active_timeline,
                    const std::optional<std::string>& query_instant) const;

    Timeline GetActiveTimeline() const;
    bool IsPartitionedTable() const { return !partition_columns_.empty(); }
    bool IsBeforeTimelineStarts() const;
    Timeline FindInstantsInRange() const;

    std::shared_ptr<TableMetaClient> meta_client_;
    std::shared_ptr<TableMetadata> table_metadata_;
    FileIndexOptions options_;
    std::vector<std::string> partition_columns_;
    bool is_completion_time_based_query_ = false;

    Timeline timeline_;
    std::unique_ptr<IncrementalTimelineSyncFileSystemView> view_;

    // Always all query partitions, or unset until first listed.
    std::optional<std::vector<PartitionPath>> cached_partition_paths_;
    std::unique_ptr<SpillableFileSliceMap> cached_file_slices_;
};

} // namespace quarry
