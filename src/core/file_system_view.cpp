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


#include "quarry/file_system_view.h"

#include <algorithm>
#include <mutex>

#include "quarry/file_naming.h"
#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(FileSystemView);

//==============================================================================
// Table metadata
//==============================================================================

Status TableMetadata::GetAllFilesInPartitions(
    const std::vector<std::string>& partition_paths,
    std::map<std::string, std::vector<FileInfo>>* files) {
    files->clear();
    for (const auto& partition : partition_paths) {
        std::vector<FileInfo> partition_files;
        auto status = GetAllFilesInPartition(partition, &partition_files);
        if (!status.ok()) return status;
        (*files)[partition] = std::move(partition_files);
    }
    return Status::OK();
}

FileSystemBackedTableMetadata::FileSystemBackedTableMetadata(std::shared_ptr<FileSystem> fs,
                                                             std::string base_path)
    : fs_(std::move(fs)), base_path_(std::move(base_path)) {}

Status FileSystemBackedTableMetadata::CollectPartitions(const std::string& directory,
                                                        std::vector<std::string>* partitions) {
    std::vector<FileInfo> children;
    auto status = fs_->ListFiles(directory, &children);
    if (status.IsNotFound()) return Status::OK();
    if (!status.ok()) return status;

    for (const auto& child : children) {
        if (!child.is_directory && child.FileName() == kPartitionMetafile) {
            partitions->push_back(GetRelativePartitionPath(base_path_, directory));
            return Status::OK();
        }
    }
    for (const auto& child : children) {
        if (!child.is_directory || child.FileName() == kMetaFolderName) continue;
        status = CollectPartitions(child.path, partitions);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

Status FileSystemBackedTableMetadata::GetAllPartitionPaths(std::vector<std::string>* partitions) {
    partitions->clear();
    auto status = CollectPartitions(base_path_, partitions);
    if (!status.ok()) return status;
    std::sort(partitions->begin(), partitions->end());
    return Status::OK();
}

Status FileSystemBackedTableMetadata::GetPartitionPathWithPathPrefixes(
    const std::vector<std::string>& prefixes, std::vector<std::string>* partitions) {
    partitions->clear();
    for (const auto& prefix : prefixes) {
        auto status = CollectPartitions(ConstructAbsolutePath(base_path_, prefix), partitions);
        if (!status.ok()) return status;
    }
    std::sort(partitions->begin(), partitions->end());
    partitions->erase(std::unique(partitions->begin(), partitions->end()), partitions->end());
    return Status::OK();
}

Status FileSystemBackedTableMetadata::GetAllFilesInPartition(const std::string& partition_path,
                                                             std::vector<FileInfo>* files) {
    files->clear();
    std::vector<FileInfo> children;
    auto status = fs_->ListFiles(ConstructAbsolutePath(base_path_, partition_path), &children);
    if (status.IsNotFound()) return Status::OK();
    if (!status.ok()) return status;

    for (auto& child : children) {
        if (child.is_directory || child.FileName() == kPartitionMetafile) continue;
        files->push_back(std::move(child));
    }
    return Status::OK();
}

//==============================================================================
// Construction and lifecycle
//==============================================================================

IncrementalTimelineSyncFileSystemView::IncrementalTimelineSyncFileSystemView(
    std::shared_ptr<TimelineProvider> provider, std::shared_ptr<TableMetadata> table_metadata,
    const FileSystemViewOptions& options)
    : provider_(std::move(provider)), table_metadata_(std::move(table_metadata)),
      options_(options) {}

Status IncrementalTimelineSyncFileSystemView::Create(
    std::shared_ptr<TimelineProvider> provider, std::shared_ptr<TableMetadata> table_metadata,
    const FileSystemViewOptions& options,
    std::unique_ptr<IncrementalTimelineSyncFileSystemView>* view) {
    if (!provider || !table_metadata) {
        return Status::InvalidArgument("File system view needs a timeline provider and table metadata");
    }

    Timeline timeline;
    auto status = provider->ReloadActiveTimeline(&timeline);
    if (!status.ok()) return status;

    std::unique_ptr<IncrementalTimelineSyncFileSystemView> created(
        new IncrementalTimelineSyncFileSystemView(std::move(provider), std::move(table_metadata),
                                                  options));
    {
        std::unique_lock<std::shared_mutex> lock(created->lock_);
        status = created->Init(created->VisibleTimeline(timeline));
        if (!status.ok()) return status;
    }
    *view = std::move(created);
    return Status::OK();
}

void IncrementalTimelineSyncFileSystemView::Clear() {
    partition_to_file_groups_.clear();
    pending_compaction_.clear();
    pending_log_compaction_.clear();
    replaced_file_groups_.clear();
}

Timeline IncrementalTimelineSyncFileSystemView::VisibleTimeline(
    const Timeline& active_timeline) const {
    if (options_.include_pending_commits) {
        return active_timeline.GetCommitsAndCompactionTimeline();
    }
    return active_timeline.FilterCompletedAndCompactionInstants();
}

Status IncrementalTimelineSyncFileSystemView::CheckUsable() const {
    if (closed_) {
        return Status::InvalidArgument("File system view is closed");
    }
    if (rebuild_failure_) {
        return Status::Aborted("File system view needs a rebuild after a failed sync: " +
                               rebuild_failure_->ToString());
    }
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::Init(const Timeline& visible_timeline) {
    std::vector<PendingCompactionEntry> compaction_ops;
    for (const auto& instant : visible_timeline.FilterPendingCompactionTimeline().GetInstants()) {
        std::vector<PendingCompactionEntry> ops;
        auto status = ReadPendingOperations(instant, false, &ops);
        if (!status.ok()) return status;
        compaction_ops.insert(compaction_ops.end(), ops.begin(), ops.end());
    }

    std::vector<PendingCompactionEntry> log_compaction_ops;
    for (const auto& instant :
         visible_timeline.FilterPendingLogCompactionTimeline().GetInstants()) {
        std::vector<PendingCompactionEntry> ops;
        auto status = ReadPendingOperations(instant, true, &ops);
        if (!status.ok()) return status;
        log_compaction_ops.insert(log_compaction_ops.end(), ops.begin(), ops.end());
    }

    std::vector<std::pair<Instant, ReplaceCommitMetadata>> replaces;
    Timeline replace_commits =
        visible_timeline.FilterByActions({actions::kReplaceCommit}).FilterCompletedInstants();
    for (const auto& instant : replace_commits.GetInstants()) {
        ReplaceCommitMetadata metadata;
        auto status = provider_->ReadReplaceCommitMetadata(instant, &metadata);
        if (!status.ok()) return status;
        replaces.emplace_back(instant, std::move(metadata));
    }

    // Conflicting compaction plans are the only failure left; stage them
    // against an empty map and restore the old one if they clash.
    std::map<FileGroupId, PendingCompactionEntry> previous_compaction;
    previous_compaction.swap(pending_compaction_);
    auto status = AddPendingCompactionOperations(compaction_ops);
    if (!status.ok()) {
        pending_compaction_.swap(previous_compaction);
        return status;
    }

    partition_to_file_groups_.clear();
    pending_log_compaction_.clear();
    replaced_file_groups_.clear();
    AddPendingLogCompactionOperations(log_compaction_ops);
    for (const auto& replace : replaces) {
        AddReplacedFileGroups(replace.second, replace.first);
    }
    visible_timeline_ = visible_timeline;
    rebuild_failure_.reset();

    QUARRY_LOG_INFO(FileSystemView) << "Initialized view with " << visible_timeline.CountInstants()
                                    << " visible instants, " << pending_compaction_.size()
                                    << " pending compaction operations";
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::Sync() {
    std::unique_lock<std::shared_mutex> lock(lock_);
    if (closed_) {
        return Status::InvalidArgument("File system view is closed");
    }
    auto status = MaySyncIncrementally();
    table_metadata_->Reset();
    return status;
}

Status IncrementalTimelineSyncFileSystemView::Refresh() {
    std::unique_lock<std::shared_mutex> lock(lock_);
    if (closed_) {
        return Status::InvalidArgument("File system view is closed");
    }
    Timeline reloaded;
    auto status = provider_->ReloadActiveTimeline(&reloaded);
    if (!status.ok()) return status;
    table_metadata_->Reset();
    return Init(VisibleTimeline(reloaded));
}

void IncrementalTimelineSyncFileSystemView::Close() {
    std::unique_lock<std::shared_mutex> lock(lock_);
    Clear();
    visible_timeline_ = Timeline();
    rebuild_failure_.reset();
    closed_ = true;
}

Status IncrementalTimelineSyncFileSystemView::MaySyncIncrementally() {
    Timeline old_timeline = visible_timeline_;
    Timeline reloaded;
    auto status = provider_->ReloadActiveTimeline(&reloaded);
    if (!status.ok()) return status;
    Timeline new_timeline = VisibleTimeline(reloaded);

    bool partly_applied = false;
    if (options_.incremental_sync_enabled && !options_.include_pending_commits &&
        !rebuild_failure_) {
        TimelineDiffResult diff =
            TimelineDiffHelper::GetNewInstantsForIncrementalSync(old_timeline, new_timeline);
        if (diff.can_sync_incrementally) {
            QUARRY_LOG_INFO(FileSystemView) << "Doing incremental sync: " << diff.ToString();
            status = RunIncrementalSync(new_timeline, diff);
            if (status.ok()) {
                visible_timeline_ = new_timeline;
                QUARRY_LOG_INFO(FileSystemView) << "Finished incremental sync";
                return Status::OK();
            }
            QUARRY_LOG_ERROR(FileSystemView)
                << "Incremental sync failed, reverting to complete sync: " << status.ToString();
            partly_applied = true;
        }
    }

    if (partly_applied) {
        Clear();
    }
    status = Init(new_timeline);
    if (!status.ok() && (partly_applied || rebuild_failure_)) {
        // The cached state no longer matches any timeline.
        Clear();
        rebuild_failure_ = status;
        QUARRY_LOG_ERROR(FileSystemView) << "Complete sync failed: " << status.ToString();
    }
    return status;
}

Status IncrementalTimelineSyncFileSystemView::RunIncrementalSync(const Timeline& timeline,
                                                                 const TimelineDiffResult& diff) {
    for (const auto& instant : diff.finished_compaction_instants) {
        QUARRY_LOG_INFO(FileSystemView) << "Removing completed compaction instant "
                                        << instant.ToString();
        std::vector<PendingCompactionEntry> ops;
        auto status = ReadPendingOperations(instant, false, &ops);
        if (!status.ok()) return status;
        RemovePendingCompactionOperations(ops);
    }

    for (const auto& instant : diff.finished_or_removed_log_compaction_instants) {
        QUARRY_LOG_INFO(FileSystemView) << "Removing completed log compaction instant "
                                        << instant.ToString();
        std::vector<PendingCompactionEntry> ops;
        auto status = ReadPendingOperations(instant, true, &ops);
        if (!status.ok()) return status;
        RemovePendingLogCompactionOperations(ops);
    }

    for (const auto& instant : diff.new_instants) {
        const std::string& action = instant.GetAction();
        if (!instant.IsCompleted() && action != actions::kCompaction &&
            action != actions::kLogCompaction) {
            continue;
        }

        Status status;
        if (action == actions::kCommit || action == actions::kDeltaCommit) {
            status = AddCommitInstant(timeline, instant);
        } else if (action == actions::kRestore) {
            status = AddRestoreInstant(timeline, instant);
        } else if (action == actions::kClean) {
            status = AddCleanInstant(timeline, instant);
        } else if (action == actions::kCompaction) {
            status = AddPendingCompactionInstant(timeline, instant);
        } else if (action == actions::kLogCompaction) {
            status = AddPendingLogCompactionInstant(instant);
        } else if (action == actions::kRollback) {
            status = AddRollbackInstant(timeline, instant);
        } else if (action == actions::kReplaceCommit) {
            status = AddReplaceInstant(timeline, instant);
        }
        if (!status.ok()) return status;
    }
    return Status::OK();
}

//==============================================================================
// Bookkeeping
//==============================================================================

Status IncrementalTimelineSyncFileSystemView::ReadPendingOperations(
    const Instant& instant, bool log_compaction, std::vector<PendingCompactionEntry>* ops) {
    CompactionPlan plan;
    auto status = log_compaction
                      ? provider_->ReadLogCompactionPlan(instant.GetRequestedTime(), &plan)
                      : provider_->ReadCompactionPlan(instant.GetRequestedTime(), &plan);
    if (!status.ok()) return status;

    ops->clear();
    for (const auto& op : plan.operations) {
        ops->emplace_back(instant.GetRequestedTime(), op);
    }
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::AddPendingCompactionOperations(
    const std::vector<PendingCompactionEntry>& ops) {
    for (const auto& entry : ops) {
        FileGroupId id{entry.second.partition_path, entry.second.file_id};
        auto it = pending_compaction_.find(id);
        if (it != pending_compaction_.end() && it->second.first != entry.first) {
            return Status::InvalidArgument("Duplicate file group " + id.ToString() +
                                           " in pending compactions " + it->second.first +
                                           " and " + entry.first);
        }
        pending_compaction_[id] = entry;
    }
    return Status::OK();
}

void IncrementalTimelineSyncFileSystemView::RemovePendingCompactionOperations(
    const std::vector<PendingCompactionEntry>& ops) {
    for (const auto& entry : ops) {
        FileGroupId id{entry.second.partition_path, entry.second.file_id};
        if (pending_compaction_.erase(id) == 0) {
            QUARRY_LOG_WARN(FileSystemView) << "File group " << id.ToString()
                                            << " was not pending compaction";
        }
    }
}

void IncrementalTimelineSyncFileSystemView::AddPendingLogCompactionOperations(
    const std::vector<PendingCompactionEntry>& ops) {
    for (const auto& entry : ops) {
        pending_log_compaction_[FileGroupId{entry.second.partition_path, entry.second.file_id}] =
            entry;
    }
}

void IncrementalTimelineSyncFileSystemView::RemovePendingLogCompactionOperations(
    const std::vector<PendingCompactionEntry>& ops) {
    for (const auto& entry : ops) {
        FileGroupId id{entry.second.partition_path, entry.second.file_id};
        if (pending_log_compaction_.erase(id) == 0) {
            QUARRY_LOG_WARN(FileSystemView) << "File group " << id.ToString()
                                            << " was not pending log compaction";
        }
    }
}

void IncrementalTimelineSyncFileSystemView::AddReplacedFileGroups(
    const ReplaceCommitMetadata& metadata, const Instant& instant) {
    for (const auto& [partition, file_ids] : metadata.partition_to_replace_file_ids) {
        QUARRY_LOG_INFO(FileSystemView) << "For partition (" << partition << ") of instant ("
                                        << instant.ToString() << "), excluding "
                                        << file_ids.size() << " file groups";
        for (const auto& file_id : file_ids) {
            replaced_file_groups_[FileGroupId{partition, file_id}] = instant;
        }
    }
}

void IncrementalTimelineSyncFileSystemView::RemoveReplacedFileIdsAtInstants(
    const std::set<std::string>& instants) {
    for (auto it = replaced_file_groups_.begin(); it != replaced_file_groups_.end();) {
        if (instants.count(it->second.GetRequestedTime()) > 0) {
            it = replaced_file_groups_.erase(it);
        } else {
            ++it;
        }
    }
}

//==============================================================================
// Per-action application
//==============================================================================

Status IncrementalTimelineSyncFileSystemView::AddPendingCompactionInstant(
    const Timeline& timeline, const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing pending compaction instant " << instant.ToString();
    std::vector<PendingCompactionEntry> ops;
    auto status = ReadPendingOperations(instant, false, &ops);
    if (!status.ok()) return status;
    status = AddPendingCompactionOperations(ops);
    if (!status.ok()) return status;

    std::map<std::string, std::vector<FileGroup>> partition_to_groups;
    for (const auto& [compaction_instant, op] : ops) {
        FileGroup group(FileGroupId{op.partition_path, op.file_id}, timeline);
        group.AddNewFileSliceAtInstant(compaction_instant);
        partition_to_groups[op.partition_path].push_back(std::move(group));
    }
    for (const auto& [partition, groups] : partition_to_groups) {
        if (partition_to_file_groups_.count(partition) > 0) {
            ApplyDeltaFileSlicesToPartitionView(partition, groups, DeltaApplyMode::kAdd);
        }
    }
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::AddPendingLogCompactionInstant(
    const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing pending log compaction instant "
                                    << instant.ToString();
    std::vector<PendingCompactionEntry> ops;
    auto status = ReadPendingOperations(instant, true, &ops);
    if (!status.ok()) return status;
    AddPendingLogCompactionOperations(ops);
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::AddCommitInstant(const Timeline& timeline,
                                                               const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing committed instant " << instant.ToString();
    CommitMetadata metadata;
    auto status = provider_->ReadCommitMetadata(instant, &metadata);
    if (!status.ok()) return status;
    UpdatePartitionWriteFileGroups(metadata.partition_to_write_stats, timeline, instant);
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::AddReplaceInstant(const Timeline& timeline,
                                                                const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing replace instant " << instant.ToString();
    ReplaceCommitMetadata metadata;
    auto status = provider_->ReadReplaceCommitMetadata(instant, &metadata);
    if (!status.ok()) return status;
    UpdatePartitionWriteFileGroups(metadata.partition_to_write_stats, timeline, instant);
    AddReplacedFileGroups(metadata, instant);
    return Status::OK();
}

// Clean metadata lists file names; they are qualified with the partition path.
Status IncrementalTimelineSyncFileSystemView::AddCleanInstant(const Timeline& timeline,
                                                              const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing cleaner instant " << instant.ToString();
    CleanMetadata metadata;
    auto status = provider_->ReadCleanMetadata(instant, &metadata);
    if (!status.ok()) return status;

    const std::string& base_path = provider_->GetBasePath();
    for (const auto& [partition, stat] : metadata.partition_metadata) {
        std::string partition_dir = ConstructAbsolutePath(base_path, stat.partition_path);
        std::vector<std::string> full_paths;
        for (const auto& file_name : stat.success_delete_files) {
            full_paths.push_back(ConstructAbsolutePath(partition_dir, file_name));
        }
        RemoveFileSlicesForPartition(timeline, instant, partition, full_paths);
    }
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::AddRollbackInstant(const Timeline& timeline,
                                                                 const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing rollback instant " << instant.ToString();
    RollbackMetadata metadata;
    auto status = provider_->ReadRollbackMetadata(instant, &metadata);
    if (!status.ok()) return status;

    for (const auto& [partition, stat] : metadata.partition_metadata) {
        RemoveFileSlicesForPartition(timeline, instant, partition, stat.success_delete_files);
    }
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::AddRestoreInstant(const Timeline& timeline,
                                                                const Instant& instant) {
    QUARRY_LOG_INFO(FileSystemView) << "Syncing restore instant " << instant.ToString();
    RestoreMetadata metadata;
    auto status = provider_->ReadRestoreMetadata(instant, &metadata);
    if (!status.ok()) return status;

    std::map<std::string, std::vector<std::string>> partition_files;
    for (const auto& [restored_instant, rollbacks] : metadata.restore_metadata) {
        for (const auto& rollback : rollbacks) {
            for (const auto& [partition, stat] : rollback.partition_metadata) {
                auto& files = partition_files[partition];
                files.insert(files.end(), stat.success_delete_files.begin(),
                             stat.success_delete_files.end());
            }
        }
    }
    for (const auto& [partition, files] : partition_files) {
        RemoveFileSlicesForPartition(timeline, instant, partition, files);
    }

    std::set<std::string> rolled_back_replaces;
    for (const auto& info : metadata.restore_instant_info) {
        if (info.action == actions::kReplaceCommit) {
            rolled_back_replaces.insert(info.commit_time);
        }
    }
    RemoveReplacedFileIdsAtInstants(rolled_back_replaces);
    return Status::OK();
}

void IncrementalTimelineSyncFileSystemView::UpdatePartitionWriteFileGroups(
    const std::map<std::string, std::vector<WriteStat>>& partition_to_write_stats,
    const Timeline& timeline, const Instant& instant) {
    const std::string& base_path = provider_->GetBasePath();
    for (const auto& [partition, stats] : partition_to_write_stats) {
        if (partition_to_file_groups_.count(partition) == 0) {
            QUARRY_LOG_WARN(FileSystemView) << "Skipping partition (" << partition
                                            << ") when syncing instant (" << instant.ToString()
                                            << ") as it is not loaded";
            continue;
        }
        std::vector<FileInfo> files;
        for (const auto& stat : stats) {
            FileInfo info;
            info.path = ConstructAbsolutePath(base_path, stat.path);
            info.size = static_cast<size_t>(stat.file_size_in_bytes);
            info.is_regular_file = true;
            files.push_back(std::move(info));
        }
        auto groups =
            BuildFileGroups(partition, files, timeline.FilterCompletedAndCompactionInstants());
        ApplyDeltaFileSlicesToPartitionView(partition, groups, DeltaApplyMode::kAdd);
    }
}

void IncrementalTimelineSyncFileSystemView::RemoveFileSlicesForPartition(
    const Timeline& timeline, const Instant& instant, const std::string& partition,
    const std::vector<std::string>& paths) {
    if (partition_to_file_groups_.count(partition) == 0) {
        QUARRY_LOG_WARN(FileSystemView) << "Skipping partition (" << partition
                                        << ") when syncing instant (" << instant.ToString()
                                        << ") as it is not loaded";
        return;
    }
    QUARRY_LOG_INFO(FileSystemView) << "Removing file slices for partition (" << partition
                                    << ") for instant (" << instant.ToString() << ")";
    std::vector<FileInfo> files;
    for (const auto& path : paths) {
        FileInfo info;
        info.path = path;
        info.is_regular_file = true;
        files.push_back(std::move(info));
    }
    auto groups = BuildFileGroups(partition, files, timeline.FilterCompletedAndCompactionInstants());
    ApplyDeltaFileSlicesToPartitionView(partition, groups, DeltaApplyMode::kRemove);
}

void IncrementalTimelineSyncFileSystemView::ApplyDeltaFileSlicesToPartitionView(
    const std::string& partition, const std::vector<FileGroup>& delta_groups,
    DeltaApplyMode mode) {
    if (delta_groups.empty()) {
        QUARRY_LOG_INFO(FileSystemView) << "No delta file groups for partition: " << partition;
        return;
    }

    // Metadata paths may lack the scheme or authority of listed paths.
    std::map<std::string, BaseFile> view_base_files;
    std::map<std::string, LogFile> view_log_files;
    for (const auto& group : partition_to_file_groups_[partition]) {
        for (const auto& slice : group.GetAllRawFileSlices()) {
            if (slice.GetBaseFile()) {
                view_base_files[GetPathWithoutSchemeAndAuthority(slice.GetBaseFile()->path)] =
                    *slice.GetBaseFile();
            }
            for (const auto& log_file : slice.GetLogFiles()) {
                view_log_files[GetPathWithoutSchemeAndAuthority(log_file.path)] = log_file;
            }
        }
    }

    for (const auto& group : delta_groups) {
        for (const auto& slice : group.GetAllRawFileSlices()) {
            if (slice.GetBaseFile()) {
                std::string key = GetPathWithoutSchemeAndAuthority(slice.GetBaseFile()->path);
                if (mode == DeltaApplyMode::kAdd) {
                    view_base_files[key] = *slice.GetBaseFile();
                } else {
                    view_base_files.erase(key);
                }
            }
            for (const auto& log_file : slice.GetLogFiles()) {
                std::string key = GetPathWithoutSchemeAndAuthority(log_file.path);
                if (mode == DeltaApplyMode::kAdd) {
                    view_log_files[key] = log_file;
                } else {
                    view_log_files.erase(key);
                }
            }
        }
    }

    std::vector<BaseFile> base_files;
    for (auto& entry : view_base_files) base_files.push_back(std::move(entry.second));
    std::vector<LogFile> log_files;
    for (auto& entry : view_log_files) log_files.push_back(std::move(entry.second));

    partition_to_file_groups_[partition] =
        BuildFileGroups(partition, base_files, log_files, delta_groups.front().GetTimeline(),
                        MakePendingCompactionLookup());
}

//==============================================================================
// Queries
//==============================================================================

PendingCompactionLookup IncrementalTimelineSyncFileSystemView::MakePendingCompactionLookup() const {
    return [this](const FileGroupId& id) { return PendingCompactionInstant(id); };
}

std::optional<std::string> IncrementalTimelineSyncFileSystemView::PendingCompactionInstant(
    const FileGroupId& id) const {
    auto it = pending_compaction_.find(id);
    if (it == pending_compaction_.end()) return std::nullopt;
    return it->second.first;
}

bool IncrementalTimelineSyncFileSystemView::IsFileSliceAfterPendingCompaction(
    const FileSlice& slice) const {
    auto instant = PendingCompactionInstant(slice.GetFileGroupId());
    return instant && *instant == slice.GetBaseInstantTime();
}

// The base file of a slice at a pending compaction instant is unfinished output.
std::optional<FileSlice> IncrementalTimelineSyncFileSystemView::FilterBaseFileAfterPendingCompaction(
    const FileSlice& slice, bool include_empty) const {
    if (!IsFileSliceAfterPendingCompaction(slice)) {
        return slice;
    }
    FileSlice transformed(slice.GetFileGroupId(), slice.GetBaseInstantTime());
    for (const auto& log_file : slice.GetLogFiles()) {
        transformed.AddLogFile(log_file);
    }
    if (transformed.IsEmpty() && !include_empty) {
        return std::nullopt;
    }
    return transformed;
}

FileSlice IncrementalTimelineSyncFileSystemView::FetchMergedFileSlice(
    const FileGroup& group, const FileSlice& slice) const {
    if (!IsFileSliceAfterPendingCompaction(slice)) {
        return slice;
    }
    auto previous = group.GetLatestFileSliceBefore(slice.GetBaseInstantTime());
    if (!previous) {
        return slice;
    }
    FileSlice merged(previous->GetFileGroupId(), previous->GetBaseInstantTime());
    if (previous->GetBaseFile()) {
        merged.SetBaseFile(*previous->GetBaseFile());
    }
    for (const auto& log_file : previous->GetLogFiles()) {
        merged.AddLogFile(log_file);
    }
    for (const auto& log_file : slice.GetLogFiles()) {
        merged.AddLogFile(log_file);
    }
    return merged;
}

bool IncrementalTimelineSyncFileSystemView::IsFileGroupReplaced(const FileGroupId& id) const {
    return replaced_file_groups_.count(id) > 0;
}

bool IncrementalTimelineSyncFileSystemView::IsFileGroupReplacedBeforeOrOn(
    const FileGroupId& id, const std::string& instant) const {
    auto it = replaced_file_groups_.find(id);
    return it != replaced_file_groups_.end() && it->second.GetRequestedTime() <= instant;
}

Status IncrementalTimelineSyncFileSystemView::EnsurePartitionLoaded(const std::string& partition) {
    std::unique_lock<std::shared_mutex> lock(lock_);
    auto status = CheckUsable();
    if (!status.ok()) return status;
    if (partition_to_file_groups_.count(partition) > 0) {
        return Status::OK();
    }

    std::vector<FileInfo> files;
    status = table_metadata_->GetAllFilesInPartition(partition, &files);
    if (!status.ok()) return status;

    partition_to_file_groups_[partition] =
        BuildFileGroups(partition, files, visible_timeline_.GetCommitsAndCompactionTimeline(),
                        MakePendingCompactionLookup());
    QUARRY_LOG_DEBUG(FileSystemView) << "Loaded partition (" << partition << ") with "
                                     << partition_to_file_groups_[partition].size()
                                     << " file groups";
    return Status::OK();
}

Status IncrementalTimelineSyncFileSystemView::WithPartition(
    const std::string& partition, const std::function<void(const std::vector<FileGroup>&)>& fn) {
    while (true) {
        {
            std::shared_lock<std::shared_mutex> lock(lock_);
            auto it = partition_to_file_groups_.find(partition);
            if (it != partition_to_file_groups_.end()) {
                fn(it->second);
                return Status::OK();
            }
        }
        auto status = EnsurePartitionLoaded(partition);
        if (!status.ok()) return status;
    }
}

Status IncrementalTimelineSyncFileSystemView::GetLatestFileSlices(const std::string& partition,
                                                                  std::vector<FileSlice>* slices) {
    slices->clear();
    return WithPartition(partition, [&](const std::vector<FileGroup>& groups) {
        for (const auto& group : groups) {
            if (IsFileGroupReplaced(group.GetFileGroupId())) continue;
            auto slice = group.GetLatestFileSlice();
            if (!slice) continue;
            auto filtered = FilterBaseFileAfterPendingCompaction(*slice, true);
            if (filtered) slices->push_back(std::move(*filtered));
        }
    });
}

Status IncrementalTimelineSyncFileSystemView::GetLatestFileSlicesBeforeOrOn(
    const std::string& partition, const std::string& max_instant, bool include_pending_compaction,
    std::vector<FileSlice>* slices) {
    slices->clear();
    return WithPartition(partition, [&](const std::vector<FileGroup>& groups) {
        for (const auto& group : groups) {
            if (IsFileGroupReplacedBeforeOrOn(group.GetFileGroupId(), max_instant)) continue;
            auto slice = group.GetLatestFileSliceBeforeOrOn(max_instant);
            if (!slice) continue;
            if (include_pending_compaction) {
                auto filtered = FilterBaseFileAfterPendingCompaction(*slice, false);
                if (filtered) slices->push_back(std::move(*filtered));
            } else if (IsFileSliceAfterPendingCompaction(*slice)) {
                auto previous = group.GetLatestFileSliceBefore(slice->GetBaseInstantTime());
                if (previous) slices->push_back(std::move(*previous));
            } else {
                slices->push_back(std::move(*slice));
            }
        }
    });
}

Status IncrementalTimelineSyncFileSystemView::GetLatestMergedFileSlicesBeforeOrOn(
    const std::string& partition, const std::string& max_instant,
    std::vector<FileSlice>* slices) {
    slices->clear();
    return WithPartition(partition, [&](const std::vector<FileGroup>& groups) {
        for (const auto& group : groups) {
            if (IsFileGroupReplacedBeforeOrOn(group.GetFileGroupId(), max_instant)) continue;
            auto slice = group.GetLatestFileSliceBeforeOrOn(max_instant);
            if (slice) slices->push_back(FetchMergedFileSlice(group, *slice));
        }
    });
}

Status IncrementalTimelineSyncFileSystemView::GetLatestBaseFiles(
    const std::string& partition, std::vector<BaseFile>* base_files) {
    base_files->clear();
    return WithPartition(partition, [&](const std::vector<FileGroup>& groups) {
        for (const auto& group : groups) {
            if (IsFileGroupReplaced(group.GetFileGroupId())) continue;
            auto pending = PendingCompactionInstant(group.GetFileGroupId());
            for (const auto& base_file : group.GetAllBaseFiles()) {
                if (pending && *pending == base_file.commit_time) continue;
                base_files->push_back(base_file);
                break;
            }
        }
    });
}

Status IncrementalTimelineSyncFileSystemView::GetAllFileGroups(const std::string& partition,
                                                               std::vector<FileGroup>* groups) {
    groups->clear();
    return WithPartition(partition, [&](const std::vector<FileGroup>& stored) {
        for (const auto& group : stored) {
            if (!IsFileGroupReplaced(group.GetFileGroupId())) groups->push_back(group);
        }
    });
}

Status IncrementalTimelineSyncFileSystemView::GetReplacedFileGroupsBeforeOrOn(
    const std::string& max_instant, const std::string& partition,
    std::vector<FileGroup>* groups) {
    groups->clear();
    return WithPartition(partition, [&](const std::vector<FileGroup>& stored) {
        for (const auto& group : stored) {
            if (IsFileGroupReplacedBeforeOrOn(group.GetFileGroupId(), max_instant)) {
                groups->push_back(group);
            }
        }
    });
}

std::vector<PendingCompactionEntry>
IncrementalTimelineSyncFileSystemView::GetPendingCompactionOperations() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    std::vector<PendingCompactionEntry> ops;
    for (const auto& entry : pending_compaction_) ops.push_back(entry.second);
    return ops;
}

std::vector<PendingCompactionEntry>
IncrementalTimelineSyncFileSystemView::GetPendingLogCompactionOperations() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    std::vector<PendingCompactionEntry> ops;
    for (const auto& entry : pending_log_compaction_) ops.push_back(entry.second);
    return ops;
}

Timeline IncrementalTimelineSyncFileSystemView::GetTimeline() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return visible_timeline_;
}

bool IncrementalTimelineSyncFileSystemView::IsPartitionLoaded(const std::string& partition) const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return partition_to_file_groups_.count(partition) > 0;
}

std::vector<std::string> IncrementalTimelineSyncFileSystemView::GetLoadedPartitions() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    std::vector<std::string> partitions;
    for (const auto& entry : partition_to_file_groups_) partitions.push_back(entry.first);
    return partitions;
}

} // namespace quarry
