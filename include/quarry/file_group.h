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

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "quarry/file_system.h"
#include "quarry/status.h"
#include "quarry/timeline.h"

namespace quarry {

struct BaseFile {
    std::string path;
    std::string file_id;
    std::string commit_time;
    int64_t size = 0;

    std::string FileName() const { return GetFileName(path); }

    static Status FromPath(const std::string& path, int64_t size, BaseFile* base_file);

    bool operator==(const BaseFile& other) const {
        return path == other.path && file_id == other.file_id &&
               commit_time == other.commit_time;
    }
};

struct LogFile {
    std::string path;
    std::string file_id;
    std::string base_instant;
    int version = 1;
    std::string write_token;
    int64_t size = 0;

    std::string FileName() const { return GetFileName(path); }

    static Status FromPath(const std::string& path, int64_t size, LogFile* log_file);

    bool operator==(const LogFile& other) const {
        return path == other.path && file_id == other.file_id &&
               base_instant == other.base_instant && version == other.version &&
               write_token == other.write_token;
    }
};

// Physical order of log files within a file group: base instant, version, write token.
bool LogFileOrder(const LogFile& a, const LogFile& b);

struct FileGroupId {
    std::string partition_path;
    std::string file_id;

    bool operator==(const FileGroupId& other) const {
        return partition_path == other.partition_path && file_id == other.file_id;
    }
    bool operator!=(const FileGroupId& other) const { return !(*this == other); }
    bool operator<(const FileGroupId& other) const {
        if (partition_path != other.partition_path) return partition_path < other.partition_path;
        return file_id < other.file_id;
    }

    std::string ToString() const { return partition_path + "/" + file_id; }
};

/**
 * @brief One versioned snapshot of a file group anchored at a base instant
 *
 * Holds at most one base file and the log files written on top of it, kept in
 * physical order.
 */
class FileSlice {
public:
    FileSlice() = default;
    FileSlice(FileGroupId id, std::string base_instant);

    const FileGroupId& GetFileGroupId() const { return id_; }
    const std::string& GetPartitionPath() const { return id_.partition_path; }
    const std::string& GetFileId() const { return id_.file_id; }
    const std::string& GetBaseInstantTime() const { return base_instant_; }

    const std::optional<BaseFile>& GetBaseFile() const { return base_file_; }
    void SetBaseFile(const BaseFile& base_file) { base_file_ = base_file; }
    void ClearBaseFile() { base_file_.reset(); }

    const std::vector<LogFile>& GetLogFiles() const { return log_files_; }
    void AddLogFile(const LogFile& log_file);

    bool IsEmpty() const { return !base_file_.has_value() && log_files_.empty(); }
    int64_t GetTotalFileSize() const;

    bool operator==(const FileSlice& other) const {
        return id_ == other.id_ && base_instant_ == other.base_instant_ &&
               base_file_ == other.base_file_ && log_files_ == other.log_files_;
    }
    bool operator!=(const FileSlice& other) const { return !(*this == other); }

    std::string ToString() const;

private:
    FileGroupId id_;
    std::string base_instant_;
    std::optional<BaseFile> base_file_;
    std::vector<LogFile> log_files_;
};

/**
 * @brief All slices of one file id in one partition
 *
 * Slices are keyed by base instant, newest first. A slice is committed when
 * its base instant is at or before the last instant of the group's timeline
 * and the timeline contains it (or it predates the timeline).
 */
class FileGroup {
public:
    FileGroup(FileGroupId id, Timeline timeline);
    FileGroup(const std::string& partition_path, const std::string& file_id, Timeline timeline);

    void AddBaseFile(const BaseFile& base_file);
    void AddLogFile(const LogFile& log_file);
    // Placeholder slice at a pending compaction instant.
    void AddNewFileSliceAtInstant(const std::string& base_instant);

    // Committed slices, newest first.
    std::vector<FileSlice> GetAllFileSlices() const;
    // Every slice including uncommitted ones, newest first.
    std::vector<FileSlice> GetAllRawFileSlices() const;

    std::optional<FileSlice> GetLatestFileSlice() const;
    std::optional<FileSlice> GetLatestFileSliceIncludingInflight() const;
    std::optional<FileSlice> GetLatestFileSliceBeforeOrOn(const std::string& max_instant) const;
    std::optional<FileSlice> GetLatestFileSliceBefore(const std::string& max_instant) const;
    std::optional<BaseFile> GetLatestBaseFile() const;
    std::vector<BaseFile> GetAllBaseFiles() const;

    bool IsFileSliceCommitted(const FileSlice& slice) const;

    const FileGroupId& GetFileGroupId() const { return id_; }
    const std::string& GetPartitionPath() const { return id_.partition_path; }
    const std::string& GetFileId() const { return id_.file_id; }
    const Timeline& GetTimeline() const { return timeline_; }

    bool operator==(const FileGroup& other) const {
        return id_ == other.id_ && GetAllRawFileSlices() == other.GetAllRawFileSlices();
    }

private:
    FileGroupId id_;
    Timeline timeline_;
    std::optional<Instant> last_instant_;
    std::map<std::string, FileSlice, std::greater<std::string>> slices_;
};

// Pending compaction instant for a file group, if any.
using PendingCompactionLookup =
    std::function<std::optional<std::string>(const FileGroupId&)>;

/**
 * @brief Group base and log files of one partition into file groups
 *
 * With a pending-compaction lookup, a file group under pending compaction gets
 * an (initially empty) slice at the compaction instant so that log files
 * written after the compaction was requested land in the new slice.
 * Groups are returned ordered by file id.
 */
std::vector<FileGroup> BuildFileGroups(const std::string& partition_path,
                                       const std::vector<BaseFile>& base_files,
                                       const std::vector<LogFile>& log_files,
                                       const Timeline& timeline,
                                       const PendingCompactionLookup& pending_compaction = nullptr);

// Split a raw listing into base and log files. Other files are ignored.
void ClassifyFiles(const std::vector<FileInfo>& files,
                   std::vector<BaseFile>* base_files,
                   std::vector<LogFile>* log_files);

std::vector<FileGroup> BuildFileGroups(const std::string& partition_path,
                                       const std::vector<FileInfo>& files,
                                       const Timeline& timeline,
                                       const PendingCompactionLookup& pending_compaction = nullptr);

} // namespace quarry
