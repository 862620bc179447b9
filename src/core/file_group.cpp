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

#include "quarry/file_group.h"

#include <algorithm>

#include "quarry/file_naming.h"

namespace quarry {

//==============================================================================
// Files
//==============================================================================

Status BaseFile::FromPath(const std::string& path, int64_t size, BaseFile* base_file) {
    BaseFileName parsed;
    auto status = ParseBaseFileName(GetFileName(path), &parsed);
    if (!status.ok()) return status;

    base_file->path = path;
    base_file->file_id = parsed.file_id;
    base_file->commit_time = parsed.instant;
    base_file->size = size;
    return Status::OK();
}

Status LogFile::FromPath(const std::string& path, int64_t size, LogFile* log_file) {
    LogFileName parsed;
    auto status = ParseLogFileName(GetFileName(path), &parsed);
    if (!status.ok()) return status;

    log_file->path = path;
    log_file->file_id = parsed.file_id;
    log_file->base_instant = parsed.base_instant;
    log_file->version = parsed.version;
    log_file->write_token = parsed.write_token;
    log_file->size = size;
    return Status::OK();
}

bool LogFileOrder(const LogFile& a, const LogFile& b) {
    if (a.base_instant != b.base_instant) return a.base_instant < b.base_instant;
    if (a.version != b.version) return a.version < b.version;
    return a.write_token < b.write_token;
}

//==============================================================================
// FileSlice
//==============================================================================

FileSlice::FileSlice(FileGroupId id, std::string base_instant)
    : id_(std::move(id)), base_instant_(std::move(base_instant)) {}

void FileSlice::AddLogFile(const LogFile& log_file) {
    for (auto& existing : log_files_) {
        if (existing.path == log_file.path) {
            existing = log_file;
            return;
        }
    }
    auto pos = std::upper_bound(log_files_.begin(), log_files_.end(), log_file, LogFileOrder);
    log_files_.insert(pos, log_file);
}

int64_t FileSlice::GetTotalFileSize() const {
    int64_t total = base_file_ ? base_file_->size : 0;
    for (const auto& log : log_files_) {
        total += log.size;
    }
    return total;
}

std::string FileSlice::ToString() const {
    std::string s = "FileSlice{" + id_.ToString() + "@" + base_instant_ + ", base=";
    s += base_file_ ? base_file_->FileName() : "<none>";
    s += ", logs=[";
    for (size_t i = 0; i < log_files_.size(); ++i) {
        if (i > 0) s += ",";
        s += log_files_[i].FileName();
    }
    return s + "]}";
}

//==============================================================================
// FileGroup
//==============================================================================

FileGroup::FileGroup(FileGroupId id, Timeline timeline)
    : id_(std::move(id)), timeline_(std::move(timeline)), last_instant_(timeline_.LastInstant()) {}

FileGroup::FileGroup(const std::string& partition_path, const std::string& file_id,
                     Timeline timeline)
    : FileGroup(FileGroupId{partition_path, file_id}, std::move(timeline)) {}

void FileGroup::AddBaseFile(const BaseFile& base_file) {
    auto it = slices_.find(base_file.commit_time);
    if (it == slices_.end()) {
        it = slices_.emplace(base_file.commit_time, FileSlice(id_, base_file.commit_time)).first;
    }
    it->second.SetBaseFile(base_file);
}

void FileGroup::AddLogFile(const LogFile& log_file) {
    auto it = slices_.find(log_file.base_instant);
    if (it == slices_.end()) {
        it = slices_.emplace(log_file.base_instant, FileSlice(id_, log_file.base_instant)).first;
    }
    it->second.AddLogFile(log_file);
}

void FileGroup::AddNewFileSliceAtInstant(const std::string& base_instant) {
    if (slices_.find(base_instant) == slices_.end()) {
        slices_.emplace(base_instant, FileSlice(id_, base_instant));
    }
}

bool FileGroup::IsFileSliceCommitted(const FileSlice& slice) const {
    if (!last_instant_) {
        return false;
    }
    if (slice.GetBaseInstantTime() > last_instant_->GetRequestedTime()) {
        return false;
    }
    return timeline_.ContainsOrBeforeTimelineStarts(slice.GetBaseInstantTime());
}

std::vector<FileSlice> FileGroup::GetAllFileSlices() const {
    std::vector<FileSlice> result;
    if (timeline_.Empty()) {
        return result;
    }
    for (const auto& entry : slices_) {
        if (IsFileSliceCommitted(entry.second)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<FileSlice> FileGroup::GetAllRawFileSlices() const {
    std::vector<FileSlice> result;
    result.reserve(slices_.size());
    for (const auto& entry : slices_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<FileSlice> FileGroup::GetLatestFileSlice() const {
    auto slices = GetAllFileSlices();
    if (slices.empty()) return std::nullopt;
    return slices.front();
}

std::optional<FileSlice> FileGroup::GetLatestFileSliceIncludingInflight() const {
    if (slices_.empty()) return std::nullopt;
    return slices_.begin()->second;
}

std::optional<FileSlice> FileGroup::GetLatestFileSliceBeforeOrOn(
    const std::string& max_instant) const {
    for (const auto& slice : GetAllFileSlices()) {
        if (slice.GetBaseInstantTime() <= max_instant) {
            return slice;
        }
    }
    return std::nullopt;
}

std::optional<FileSlice> FileGroup::GetLatestFileSliceBefore(const std::string& max_instant) const {
    for (const auto& slice : GetAllFileSlices()) {
        if (slice.GetBaseInstantTime() < max_instant) {
            return slice;
        }
    }
    return std::nullopt;
}

std::vector<BaseFile> FileGroup::GetAllBaseFiles() const {
    std::vector<BaseFile> result;
    for (const auto& slice : GetAllFileSlices()) {
        if (slice.GetBaseFile()) {
            result.push_back(*slice.GetBaseFile());
        }
    }
    return result;
}

std::optional<BaseFile> FileGroup::GetLatestBaseFile() const {
    auto base_files = GetAllBaseFiles();
    if (base_files.empty()) return std::nullopt;
    return base_files.front();
}

//==============================================================================
// Builders
//==============================================================================

std::vector<FileGroup> BuildFileGroups(const std::string& partition_path,
                                       const std::vector<BaseFile>& base_files,
                                       const std::vector<LogFile>& log_files,
                                       const Timeline& timeline,
                                       const PendingCompactionLookup& pending_compaction) {
    std::map<std::string, FileGroup> groups;
    auto group_for = [&](const std::string& file_id) -> FileGroup& {
        auto it = groups.find(file_id);
        if (it == groups.end()) {
            it = groups.emplace(file_id, FileGroup(partition_path, file_id, timeline)).first;
        }
        return it->second;
    };

    for (const auto& base_file : base_files) {
        group_for(base_file.file_id).AddBaseFile(base_file);
    }
    for (const auto& log_file : log_files) {
        group_for(log_file.file_id).AddLogFile(log_file);
    }

    std::vector<FileGroup> result;
    result.reserve(groups.size());
    for (auto& entry : groups) {
        if (pending_compaction) {
            auto instant = pending_compaction(entry.second.GetFileGroupId());
            if (instant) {
                entry.second.AddNewFileSliceAtInstant(*instant);
            }
        }
        result.push_back(std::move(entry.second));
    }
    return result;
}

void ClassifyFiles(const std::vector<FileInfo>& files,
                   std::vector<BaseFile>* base_files,
                   std::vector<LogFile>* log_files) {
    for (const auto& file : files) {
        if (file.is_directory) continue;

        LogFile log_file;
        if (LogFile::FromPath(file.path, static_cast<int64_t>(file.size), &log_file).ok()) {
            log_files->push_back(std::move(log_file));
            continue;
        }
        BaseFile base_file;
        if (BaseFile::FromPath(file.path, static_cast<int64_t>(file.size), &base_file).ok()) {
            base_files->push_back(std::move(base_file));
        }
    }
}

std::vector<FileGroup> BuildFileGroups(const std::string& partition_path,
                                       const std::vector<FileInfo>& files,
                                       const Timeline& timeline,
                                       const PendingCompactionLookup& pending_compaction) {
    std::vector<BaseFile> base_files;
    std::vector<LogFile> log_files;
    ClassifyFiles(files, &base_files, &log_files);
    return BuildFileGroups(partition_path, base_files, log_files, timeline, pending_compaction);
}

} // namespace quarry
