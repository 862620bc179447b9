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


#include "quarry/table_file_index.h"

#include <algorithm>
#include <chrono>
#include <limits>
#include <set>

#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(FileIndex);

const char* QueryTypeToString(QueryType type) {
    switch (type) {
        case QueryType::kSnapshot:
            return "SNAPSHOT";
        case QueryType::kIncremental:
            return "INCREMENTAL";
        case QueryType::kReadOptimized:
            return "READ_OPTIMIZED";
    }
    return "UNKNOWN";
}

std::vector<std::string> ParsePartitionColumnValues(const std::vector<std::string>& columns,
                                                    const std::string& partition_path) {
    if (columns.empty() || partition_path.empty()) return {};

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= partition_path.size()) {
        size_t slash = partition_path.find('/', start);
        if (slash == std::string::npos) slash = partition_path.size();
        segments.push_back(partition_path.substr(start, slash - start));
        start = slash + 1;
    }

    if (segments.size() != columns.size()) {
        if (columns.size() == 1) {
            return {partition_path};
        }
        return {};
    }

    std::vector<std::string> values;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        std::string hive_prefix = columns[i] + "=";
        if (segment.compare(0, hive_prefix.size(), hive_prefix) == 0) {
            values.push_back(segment.substr(hive_prefix.size()));
        } else {
            values.push_back(segment);
        }
    }
    return values;
}

//==============================================================================
// Lifecycle
//==============================================================================

TableFileIndex::TableFileIndex(std::shared_ptr<TableMetaClient> meta_client,
                               std::shared_ptr<TableMetadata> table_metadata,
                               const FileIndexOptions& options)
    : meta_client_(std::move(meta_client)), table_metadata_(std::move(table_metadata)),
      options_(options) {
    const TableConfig& config = meta_client_->GetTableConfig();
    partition_columns_ = config.partition_fields;
    TableVersion version = options_.incremental_table_version.value_or(config.version);
    is_completion_time_based_query_ = static_cast<int>(version) >= static_cast<int>(TableVersion::kEight);
}

TableFileIndex::~TableFileIndex() {
    Close();
}

Status TableFileIndex::Create(std::shared_ptr<TableMetaClient> meta_client,
                              std::shared_ptr<TableMetadata> table_metadata,
                              const FileIndexOptions& options,
                              std::unique_ptr<TableFileIndex>* index) {
    if (!meta_client) {
        return Status::InvalidArgument("File index needs a table meta client");
    }
    if (!table_metadata) {
        table_metadata = std::make_shared<FileSystemBackedTableMetadata>(
            meta_client->GetFileSystem(), meta_client->GetBasePath());
    }
    if (options.query_type == QueryType::kIncremental && !options.incremental_start_time) {
        return Status::InvalidArgument("Incremental queries need a start time");
    }

    std::unique_ptr<TableFileIndex> created(
        new TableFileIndex(std::move(meta_client), std::move(table_metadata), options));
    auto status = created->DoRefresh();
    if (!status.ok()) return status;
    *index = std::move(created);
    return Status::OK();
}

Status TableFileIndex::Refresh() {
    return DoRefresh();
}

void TableFileIndex::Close() {
    if (view_) {
        view_->Close();
        view_.reset();
    }
    cached_partition_paths_.reset();
    if (cached_file_slices_) {
        auto status = cached_file_slices_->Clear();
        if (!status.ok()) {
            QUARRY_LOG_WARN(FileIndex) << "Failed to clear cached file slices: "
                                       << status.ToString();
        }
        cached_file_slices_.reset();
    }
}

Status TableFileIndex::ResetCache() {
    if (cached_file_slices_) {
        auto status = cached_file_slices_->Clear();
        if (!status.ok()) return status;
    }
    size_t budget = options_.use_spillable_map ? options_.spillable_memory_bytes
                                               : std::numeric_limits<size_t>::max();
    std::shared_ptr<FileSystem> scratch = options_.spill_file_system;
    if (!scratch) {
        scratch = std::shared_ptr<FileSystem>(FileSystem::CreateLocal());
    }
    cached_file_slices_.reset(
        new SpillableFileSliceMap(budget, options_.spill_directory, std::move(scratch)));
    return Status::OK();
}

Status TableFileIndex::DoRefresh() {
    auto start = std::chrono::steady_clock::now();

    table_metadata_->Reset();
    auto status = meta_client_->ReloadActiveTimeline(&timeline_);
    if (!status.ok()) return status;

    if (view_) {
        view_->Close();
        view_.reset();
    }
    FileSystemViewOptions view_options;
    view_options.include_pending_commits = options_.include_pending_commits;
    status = IncrementalTimelineSyncFileSystemView::Create(meta_client_, table_metadata_,
                                                           view_options, &view_);
    if (!status.ok()) return status;

    cached_partition_paths_.reset();
    status = ResetCache();
    if (!status.ok()) return status;

    if (!options_.list_lazily) {
        std::vector<PartitionPath> partitions;
        status = GetAllQueryPartitionPaths(&partitions);
        if (!status.ok()) return status;
        status = EnsurePreloadedPartitions(partitions);
        if (!status.ok()) return status;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    QUARRY_LOG_INFO(FileIndex) << "Refresh table " << meta_client_->GetTableConfig().name
                               << ", spent: " << elapsed.count() << " ms";
    return Status::OK();
}

//==============================================================================
// Partition listing
//==============================================================================

Status TableFileIndex::ConvertToPartitionPath(const std::string& path,
                                              PartitionPath* partition) const {
    partition->path = path;
    partition->values = ParsePartitionColumnValues(partition_columns_, path);
    if (options_.list_lazily && partition->values.size() != partition_columns_.size()) {
        return Status::InvalidArgument(
            "Failed to parse partition column values from the partition-path: " + path +
            ", likely non-encoded slashes being used in partition column's values."
            " Switching listing mode to eager works around this");
    }
    return Status::OK();
}

Status TableFileIndex::ListWrittenPartitions(const Timeline& timeline,
                                             std::vector<std::string>* partitions) {
    std::set<std::string> written;
    for (const auto& instant : timeline.FilterCompletedInstants().GetInstants()) {
        CommitMetadata metadata;
        auto status = meta_client_->ReadCommitMetadata(instant, &metadata);
        if (!status.ok()) return status;
        for (const auto& partition : metadata.GetWrittenPartitions()) {
            written.insert(partition);
        }
    }
    partitions->assign(written.begin(), written.end());
    return Status::OK();
}

Status TableFileIndex::ListPartitionPaths(const std::vector<std::string>& relative_paths,
                                          std::vector<PartitionPath>* partitions) {
    std::vector<std::string> matched;
    if (IsPartitionedTable()) {
        Status status;
        if (options_.query_type == QueryType::kIncremental && options_.incremental_start_time &&
            !IsBeforeTimelineStarts()) {
            status = ListWrittenPartitions(FindInstantsInRange(), &matched);
        } else {
            status = table_metadata_->GetPartitionPathWithPathPrefixes(relative_paths, &matched);
        }
        if (!status.ok()) return status;
    } else {
        matched.push_back("");
    }

    partitions->clear();
    for (const auto& path : matched) {
        PartitionPath partition;
        auto status = ConvertToPartitionPath(path, &partition);
        if (!status.ok()) return status;
        partitions->push_back(std::move(partition));
    }
    return Status::OK();
}

Status TableFileIndex::GetAllQueryPartitionPaths(std::vector<PartitionPath>* partitions) {
    if (!cached_partition_paths_) {
        std::vector<std::string> relative_paths;
        if (options_.query_paths.empty()) {
            relative_paths.push_back("");
        }
        for (const auto& path : options_.query_paths) {
            relative_paths.push_back(GetRelativePartitionPath(GetBasePath(), path));
        }
        std::vector<PartitionPath> listed;
        auto status = ListPartitionPaths(relative_paths, &listed);
        if (!status.ok()) return status;
        cached_partition_paths_ = std::move(listed);
    }
    *partitions = *cached_partition_paths_;
    return Status::OK();
}

Status TableFileIndex::ListPartitions(const PartitionPredicate& predicate,
                                      std::vector<PartitionPath>* partitions) {
    std::vector<PartitionPath> all;
    auto status = GetAllQueryPartitionPaths(&all);
    if (!status.ok()) return status;

    partitions->clear();
    for (auto& partition : all) {
        if (!predicate || predicate(partition)) {
            partitions->push_back(std::move(partition));
        }
    }
    return Status::OK();
}

//==============================================================================
// File slices
//==============================================================================

Timeline TableFileIndex::GetActiveTimeline() const {
    // Pending compactions stay visible: log files written during a compaction
    // carry the compaction instant as their base instant.
    Timeline timeline = timeline_.GetCommitsAndCompactionTimeline();
    if (options_.include_pending_commits) {
        return timeline;
    }
    return timeline.FilterCompletedAndCompactionInstants();
}

bool TableFileIndex::IsBeforeTimelineStarts() const {
    if (is_completion_time_based_query_) {
        return timeline_.IsBeforeTimelineStartsByCompletionTime(*options_.incremental_start_time);
    }
    return timeline_.IsBeforeTimelineStarts(*options_.incremental_start_time);
}

Timeline TableFileIndex::FindInstantsInRange() const {
    std::string end = options_.incremental_end_time.value_or(
        std::to_string(std::numeric_limits<int64_t>::max()));
    if (is_completion_time_based_query_) {
        return timeline_.GetWriteTimeline().FindInstantsInRangeByCompletionTime(
            *options_.incremental_start_time, end);
    }
    return timeline_.GetWriteTimeline().FindInstantsInRange(*options_.incremental_start_time, end);
}

Status TableFileIndex::ValidateTimestampAsOf(const std::string& instant) const {
    auto first_incomplete = timeline_.GetCommitsTimeline().FilterInflightsAndRequested().FirstInstant();
    if (first_incomplete && instant >= first_incomplete->GetRequestedTime()) {
        return Status::InvalidArgument("Time travel's timestamp '" + instant +
                                       "' must be earlier than the first incomplete commit "
                                       "timestamp '" + first_incomplete->GetRequestedTime() + "'");
    }
    return Status::OK();
}

Status TableFileIndex::Validate(const Timeline& active_timeline,
                                const std::optional<std::string>& query_instant) const {
    if (options_.validate_instant && query_instant &&
        !active_timeline.ContainsInstant(*query_instant)) {
        return Status::InvalidArgument("Query instant (" + *query_instant +
                                       ") not found in the timeline");
    }
    return Status::OK();
}

Status TableFileIndex::LoadFileSlicesForPartitions(const std::vector<PartitionPath>& partitions) {
    if (partitions.empty()) return Status::OK();

    if (options_.specified_query_instant && !options_.include_pending_commits) {
        auto status = ValidateTimestampAsOf(*options_.specified_query_instant);
        if (!status.ok()) return status;
    }

    Timeline active_timeline = GetActiveTimeline();
    std::optional<std::string> query_instant = options_.specified_query_instant;
    if (!query_instant) {
        auto latest = active_timeline.LastInstant();
        if (latest) query_instant = latest->GetRequestedTime();
    }
    auto status = Validate(active_timeline, query_instant);
    if (!status.ok()) return status;

    for (const auto& partition : partitions) {
        std::vector<FileSlice> slices;
        if (query_instant) {
            // Slices under an inflight compaction are merged with the slice before it.
            status = view_->GetLatestMergedFileSlicesBeforeOrOn(partition.path, *query_instant,
                                                                &slices);
        } else {
            status = view_->GetLatestFileSlices(partition.path, &slices);
        }
        if (!status.ok()) return status;

        if (options_.query_type == QueryType::kReadOptimized) {
            std::vector<FileSlice> base_only;
            for (const auto& slice : slices) {
                if (!slice.GetBaseFile()) continue;
                FileSlice stripped(slice.GetFileGroupId(), slice.GetBaseInstantTime());
                stripped.SetBaseFile(*slice.GetBaseFile());
                base_only.push_back(std::move(stripped));
            }
            slices = std::move(base_only);
        }

        status = cached_file_slices_->Put(partition.path, slices);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

Status TableFileIndex::EnsurePreloadedPartitions(const std::vector<PartitionPath>& partitions) {
    if (!view_ || !cached_file_slices_) {
        return Status::InvalidArgument("File index is closed");
    }
    std::vector<PartitionPath> missing;
    for (const auto& partition : partitions) {
        if (!cached_file_slices_->Contains(partition.path)) {
            missing.push_back(partition);
        }
    }
    return LoadFileSlicesForPartitions(missing);
}

bool TableFileIndex::AreAllFileSlicesCached() const {
    if (!cached_partition_paths_ || !cached_file_slices_) return false;
    return std::all_of(cached_partition_paths_->begin(), cached_partition_paths_->end(),
                       [this](const PartitionPath& partition) {
                           return cached_file_slices_->Contains(partition.path);
                       });
}

Status TableFileIndex::GetFileSlices(const std::vector<PartitionPath>& partitions,
                                     std::map<PartitionPath, std::vector<FileSlice>>* slices) {
    auto status = EnsurePreloadedPartitions(partitions);
    if (!status.ok()) return status;

    slices->clear();
    for (const auto& partition : partitions) {
        std::vector<FileSlice> partition_slices;
        status = cached_file_slices_->Get(partition.path, &partition_slices);
        if (!status.ok()) return status;
        (*slices)[partition] = std::move(partition_slices);
    }
    return Status::OK();
}

Status TableFileIndex::GetAllInputFileSlices(
    std::map<PartitionPath, std::vector<FileSlice>>* slices) {
    std::vector<PartitionPath> partitions;
    auto status = GetAllQueryPartitionPaths(&partitions);
    if (!status.ok()) return status;
    return GetFileSlices(partitions, slices);
}

Status TableFileIndex::GetFileSlicesCount(size_t* count) {
    std::map<PartitionPath, std::vector<FileSlice>> slices;
    auto status = GetAllInputFileSlices(&slices);
    if (!status.ok()) return status;

    *count = 0;
    for (const auto& entry : slices) {
        *count += entry.second.size();
    }
    return Status::OK();
}

Status TableFileIndex::GetTotalCachedFilesSize(int64_t* size) const {
    *size = 0;
    if (!cached_file_slices_) return Status::OK();

    for (const auto& key : cached_file_slices_->Keys()) {
        std::vector<FileSlice> slices;
        auto status = cached_file_slices_->Get(key, &slices);
        if (!status.ok()) return status;
        for (const auto& slice : slices) {
            if (slice.GetBaseFile()) *size += slice.GetBaseFile()->size;
            for (const auto& log_file : slice.GetLogFiles()) {
                if (log_file.size > 0) *size += log_file.size;
            }
        }
    }
    return Status::OK();
}

std::optional<Instant> TableFileIndex::GetLatestCompletedInstant() const {
    return timeline_.GetCommitsAndCompactionTimeline().FilterCompletedInstants().LastInstant();
}

bool TableFileIndex::ShouldReadAsPartitionedTable() const {
    if (partition_columns_.empty()) return false;
    if (options_.list_lazily || !cached_partition_paths_) return true;
    return std::all_of(cached_partition_paths_->begin(), cached_partition_paths_->end(),
                       [](const PartitionPath& partition) { return !partition.values.empty(); });
}

} // namespace quarry
