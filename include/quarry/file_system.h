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

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <arrow/buffer.h>

#include "quarry/status.h"

namespace quarry {

enum class FileOpenFlags {
    kRead = 1,
    kWrite = 2,
    kCreate = 4,
    kAppend = 8,
    kTruncate = 16,
};

inline FileOpenFlags operator|(FileOpenFlags a, FileOpenFlags b) {
    return static_cast<FileOpenFlags>(static_cast<int>(a) | static_cast<int>(b));
}

inline bool HasFlag(FileOpenFlags flags, FileOpenFlags flag) {
    return (static_cast<int>(flags) & static_cast<int>(flag)) != 0;
}

struct FileInfo {
    std::string path;
    size_t size = 0;
    bool is_directory = false;
    bool is_regular_file = false;
    uint64_t modification_time = 0;

    // Last path component.
    std::string FileName() const;
};

// Handle to one open file. Handles are not thread-safe.
class FileHandle {
public:
    FileHandle(const std::string& path, FileOpenFlags flags);
    virtual ~FileHandle();

    virtual Status Read(void* buffer, size_t nr_bytes, size_t* bytes_read) = 0;
    virtual Status Write(const void* buffer, size_t nr_bytes, size_t* bytes_written) = 0;

    virtual Status Seek(size_t position) = 0;
    virtual Status GetPosition(size_t* position) const = 0;
    virtual Status GetSize(size_t* size) const = 0;

    virtual Status Sync() = 0;
    virtual Status Close() = 0;

    // Read exactly nr_bytes starting at offset; a short read is an IOError.
    Status ReadAt(size_t offset, void* buffer, size_t nr_bytes);

    const std::string& GetPath() const { return path_; }
    FileOpenFlags GetFlags() const { return flags_; }

protected:
    std::string path_;
    FileOpenFlags flags_;
};

/**
 * @brief Storage abstraction consumed by the timeline, log readers and views
 *
 * Implementations must make ListFiles return the direct children of a
 * directory (files and sub-directories) with file sizes filled in.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual Status OpenFile(const std::string& path, FileOpenFlags flags,
                           std::unique_ptr<FileHandle>* handle) = 0;

    virtual Status FileExists(const std::string& path, bool* exists) = 0;
    virtual Status GetFileInfo(const std::string& path, FileInfo* info) = 0;
    virtual Status ListFiles(const std::string& directory,
                            std::vector<FileInfo>* files) = 0;

    virtual Status CreateDirectory(const std::string& path) = 0;
    virtual Status RemoveFile(const std::string& path) = 0;
    virtual Status RemoveDirectory(const std::string& path) = 0;
    virtual Status Rename(const std::string& source, const std::string& target) = 0;

    virtual Status JoinPath(const std::string& base, const std::string& path,
                           std::string* result);

    static std::unique_ptr<FileSystem> CreateLocal();
    static std::unique_ptr<FileSystem> CreateMemory();

    virtual std::string GetName() const = 0;
};

class LocalFileSystem : public FileSystem {
public:
    LocalFileSystem() = default;
    ~LocalFileSystem() override = default;

    Status OpenFile(const std::string& path, FileOpenFlags flags,
                   std::unique_ptr<FileHandle>* handle) override;

    Status FileExists(const std::string& path, bool* exists) override;
    Status GetFileInfo(const std::string& path, FileInfo* info) override;
    Status ListFiles(const std::string& directory,
                    std::vector<FileInfo>* files) override;

    Status CreateDirectory(const std::string& path) override;
    Status RemoveFile(const std::string& path) override;
    Status RemoveDirectory(const std::string& path) override;
    Status Rename(const std::string& source, const std::string& target) override;

    std::string GetName() const override { return "LocalFileSystem"; }
};

// In-memory filesystem used by tests. Directories are implied by file paths.
class MemoryFileSystem : public FileSystem {
public:
    MemoryFileSystem() = default;
    ~MemoryFileSystem() override = default;

    Status OpenFile(const std::string& path, FileOpenFlags flags,
                   std::unique_ptr<FileHandle>* handle) override;

    Status FileExists(const std::string& path, bool* exists) override;
    Status GetFileInfo(const std::string& path, FileInfo* info) override;
    Status ListFiles(const std::string& directory,
                    std::vector<FileInfo>* files) override;

    Status CreateDirectory(const std::string& path) override;
    Status RemoveFile(const std::string& path) override;
    Status RemoveDirectory(const std::string& path) override;
    Status Rename(const std::string& source, const std::string& target) override;

    std::string GetName() const override { return "MemoryFileSystem"; }

    // Drop the last n bytes of a file. Simulates a writer that crashed mid-block.
    Status TruncateTail(const std::string& path, size_t n);

private:
    friend class MemoryFileHandle;

    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::vector<char>>> files_;
    std::unordered_set<std::string> directories_;
};

// Whole-file helpers on top of a FileSystem.
class FileOperations {
public:
    explicit FileOperations(std::shared_ptr<FileSystem> fs);

    Status ReadFile(const std::string& path, std::shared_ptr<arrow::Buffer>* buffer);
    Status ReadFile(const std::string& path, std::string* contents);

    Status WriteFile(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer);
    Status WriteFile(const std::string& path, const std::string& contents);

private:
    std::shared_ptr<FileSystem> fs_;
};

// "s3://bucket/a/b" -> "/a/b", "file:/a/b" -> "/a/b", "/a/b" -> "/a/b".
std::string GetPathWithoutSchemeAndAuthority(const std::string& path);

// Partition path of full_path relative to base_path ("" for the base itself).
std::string GetRelativePartitionPath(const std::string& base_path,
                                     const std::string& full_path);

// base_path joined with a relative partition path; "" yields base_path.
std::string ConstructAbsolutePath(const std::string& base_path,
                                  const std::string& relative_path);

std::string GetFileName(const std::string& path);
std::string GetParentPath(const std::string& path);

} // namespace quarry
