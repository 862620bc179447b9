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
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "quarry/file_group.h"
#include "quarry/file_system.h"
#include "quarry/status.h"
#include "quarry/table_meta_client.h"
#include "quarry/timeline.h"
#include "quarry/timeline_diff.h"
#include "quarry/timeline_metadata.h"

namespace quarry {

/**
 * @brief Source of partition and file listings
 *
 * Partition paths are relative to the table base path; "" is the base path
 * of a non-partitioned table.
 */
class TableMetadata {
public:
    virtual ~TableMetadata() = default;

    virtual Status GetAllPartitionPaths(std::vector<std::string>* partitions) = 0;

    // Partitions at or below any of the relative prefixes.
    virtual Status GetPartitionPathWithPathPrefixes(const std::vector<std::string>& prefixes,
                                                    std::vector<std::string>* partitions) = 0;

    virtual Status GetAllFilesInPartition(const std::string& partition_path,
                                          std::vector<FileInfo>* files) = 0;

    virtual Status GetAllFilesInPartitions(const std::vector<std::string>& partition_paths,
                                           std::map<std::string, std::vector<FileInfo>>* files);

    // Drop anything cached between syncs.
    virtual void Reset() {}
};

// Lists partitions by walking the base path for partition marker files.
class FileSystemBackedTableMetadata : public TableMetadata {
public:
    FileSystemBackedTableMetadata(std::shared_ptr<FileSystem> fs, std::string base_path);

    Status GetAllPartitionPaths(std::vector<std::string>* partitions) override;
    Status GetPartitionPathWithPathPrefixes(const std::vector<std::string>& prefixes,
                                            std::vector<std::string>* partitions) override;
    Status GetAllFilesInPartition(const std::string& partition_path,
                                  std::vector<FileInfo>* files) override;

    const std::string& GetBasePath() const { return base_path_; }

private:
    Status CollectPartitions(const std::string& directory, std::vector<std::string>* partitions);

    std::shared_ptr<FileSystem> fs_;
    std::string base_path_;
};

using PendingCompactionEntry = std::pair<std::string, CompactionOperation>;

/**
 * @brief Read interface over a table's file groups as of a pinned timeline
 */
class FileSystemViewStore {
public:
    virtual ~FileSystemViewStore() = default;

    virtual Status GetLatestFileSlices(const std::string& partition,
                                       std::vector<FileSlice>* slices) = 0;
    virtual Status GetLatestFileSlicesBeforeOrOn(const std::string& partition,
                                                 const std::string& max_instant,
                                                 bool include_pending_compaction,
                                                 std::vector<FileSlice>* slices) = 0;
    // Slices under pending compaction are merged with the slice before it.
    virtual Status GetLatestMergedFileSlicesBeforeOrOn(const std::string& partition,
                                                       const std::string& max_instant,
                                                       std::vector<FileSlice>* slices) = 0;
    virtual Status GetLatestBaseFiles(const std::string& partition,
                                      std::vector<BaseFile>* base_files) = 0;
    virtual Status GetAllFileGroups(const std::string& partition,
                                    std::vector<FileGroup>* groups) = 0;
    virtual Status GetReplacedFileGroupsBeforeOrOn(const std::string& max_instant,
                                                   const std::string& partition,
                                                   std::vector<FileGroup>* groups) = 0;

    virtual std::vector<PendingCompactionEntry> GetPendingCompactionOperations() const = 0;
    virtual std::vector<PendingCompactionEntry> GetPendingLogCompactionOperations() const = 0;

    virtual Timeline GetTimeline() const = 0;

    virtual Status Sync() = 0;
    virtual void Close() = 0;
};

struct FileSystemViewOptions {
    bool incremental_sync_enabled = true;
    // Slices of requested and inflight commits count as committed. Sync always
    // rebuilds in this mode since timeline diffs only follow completed instants.
    bool include_pending_commits = false;
};

/**
 * @brief File-system view that follows the timeline incrementally
 *
 * Partitions are built from a listing the first time they are queried. Sync()
 * reloads the timeline and applies each new instant's metadata to the loaded
 * partitions only; any failure or unsafe timeline change falls back to a
 * clear-and-rebuild. All cached state is guarded by one reader/writer lock and
 * every partition's file groups are replaced as a whole.
 */
class IncrementalTimelineSyncFileSystemView : public FileSystemViewStore {
public:
    static Status Create(std::shared_ptr<TimelineProvider> provider,
                         std::shared_ptr<TableMetadata> table_metadata,
                         const FileSystemViewOptions& options,
                         std::unique_ptr<IncrementalTimelineSyncFileSystemView>* view);

    ~IncrementalTimelineSyncFileSystemView() override = default;

    Status GetLatestFileSlices(const std::string& partition,
                               std::vector<FileSlice>* slices) override;
    Status GetLatestFileSlicesBeforeOrOn(const std::string& partition,
                                         const std::string& max_instant,
                                         bool include_pending_compaction,
                                         std::vector<FileSlice>* slices) override;
    Status GetLatestMergedFileSlicesBeforeOrOn(const std::string& partition,
                                               const std::string& max_instant,
                                               std::vector<FileSlice>* slices) override;
    Status GetLatestBaseFiles(const std::string& partition,
                              std::vector<BaseFile>* base_files) override;
    Status GetAllFileGroups(const std::string& partition,
                            std::vector<FileGroup>* groups) override;
    Status GetReplacedFileGroupsBeforeOrOn(const std::string& max_instant,
                                           const std::string& partition,
                                           std::vector<FileGroup>* groups) override;

    std::vector<PendingCompactionEntry> GetPendingCompactionOperations() const override;
    std::vector<PendingCompactionEntry> GetPendingLogCompactionOperations() const override;

    Timeline GetTimeline() const override;

    // Incremental when safe, full rebuild otherwise.
    Status Sync() override;
    // Always a full rebuild on the reloaded timeline.
    Status Refresh();
    void Close() override;

    bool IsPartitionLoaded(const std::string& partition) const;
    std::vector<std::string> GetLoadedPartitions() const;

private:
    enum class DeltaApplyMode { kAdd, kRemove };

    IncrementalTimelineSyncFileSystemView(std::shared_ptr<TimelineProvider> provider,
                                          std::shared_ptr<TableMetadata> table_metadata,
                                          const FileSystemViewOptions& options);

    // Everything below expects the write lock to be held unless noted.
    // Replaces the cached state only when every plan and replace document was
    // read and applied; on failure the previous state is kept.
    Status Init(const Timeline& visible_timeline);
    void Clear();
    Timeline VisibleTimeline(const Timeline& active_timeline) const;
    Status CheckUsable() const;
    Status MaySyncIncrementally();
    Status RunIncrementalSync(const Timeline& timeline, const TimelineDiffResult& diff);

    Status ReadPendingOperations(const Instant& instant, bool log_compaction,
                                 std::vector<PendingCompactionEntry>* ops);
    Status AddPendingCompactionOperations(const std::vector<PendingCompactionEntry>& ops);
    void RemovePendingCompactionOperations(const std::vector<PendingCompactionEntry>& ops);
    void AddPendingLogCompactionOperations(const std::vector<PendingCompactionEntry>& ops);
    void RemovePendingLogCompactionOperations(const std::vector<PendingCompactionEntry>& ops);
    void AddReplacedFileGroups(const ReplaceCommitMetadata& metadata, const Instant& instant);
    void RemoveReplacedFileIdsAtInstants(const std::set<std::string>& instants);

    Status AddPendingCompactionInstant(const Timeline& timeline, const Instant& instant);
    Status AddPendingLogCompactionInstant(const Instant& instant);
    Status AddCommitInstant(const Timeline& timeline, const Instant& instant);
    Status AddReplaceInstant(const Timeline& timeline, const Instant& instant);
    Status AddCleanInstant(const Timeline& timeline, const Instant& instant);
    Status AddRollbackInstant(const Timeline& timeline, const Instant& instant);
    Status AddRestoreInstant(const Timeline& timeline, const Instant& instant);

    void UpdatePartitionWriteFileGroups(
        const std::map<std::string, std::vector<WriteStat>>& partition_to_write_stats,
        const Timeline& timeline, const Instant& instant);
    void RemoveFileSlicesForPartition(const Timeline& timeline, const Instant& instant,
                                      const std::string& partition,
                                      const std::vector<std::string>& paths);
    void ApplyDeltaFileSlicesToPartitionView(const std::string& partition,
                                             const std::vector<FileGroup>& delta_groups,
                                             DeltaApplyMode mode);

    PendingCompactionLookup MakePendingCompactionLookup() const;
    std::optional<std::string> PendingCompactionInstant(const FileGroupId& id) const;
    bool IsFileSliceAfterPendingCompaction(const FileSlice& slice) const;
    std::optional<FileSlice> FilterBaseFileAfterPendingCompaction(const FileSlice& slice,
                                                                  bool include_empty) const;
    FileSlice FetchMergedFileSlice(const FileGroup& group, const FileSlice& slice) const;
    bool IsFileGroupReplaced(const FileGroupId& id) const;
    bool IsFileGroupReplacedBeforeOrOn(const FileGroupId& id, const std::string& instant) const;

    // Takes the locks itself. Builds the partition from a listing if needed and
    // runs fn under the read lock.
    Status WithPartition(const std::string& partition,
                         const std::function<void(const std::vector<FileGroup>&)>& fn);
    Status EnsurePartitionLoaded(const std::string& partition);

    std::shared_ptr<TimelineProvider> provider_;
    std::shared_ptr<TableMetadata> table_metadata_;
    FileSystemViewOptions options_;

    mutable std::shared_mutex lock_;
    Timeline visible_timeline_;
    std::map<std::string, std::vector<FileGroup>> partition_to_file_groups_;
    std::map<FileGroupId, PendingCompactionEntry> pending_compaction_;
    std::map<FileGroupId, PendingCompactionEntry> pending_log_compaction_;
    std::map<FileGroupId, Instant> replaced_file_groups_;
    bool closed_ = false;
    // Set when a rebuild failed after an incremental sync was partly applied.
    // Queries fail until a Sync or Refresh rebuilds the view.
    std::optional<Status> rebuild_failure_;
};

} // namespace quarry
