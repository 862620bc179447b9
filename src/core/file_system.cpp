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

#include "quarry/file_system.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace quarry {

std::string FileInfo::FileName() const {
    return GetFileName(path);
}

FileHandle::FileHandle(const std::string& path, FileOpenFlags flags)
    : path_(path), flags_(flags) {}

FileHandle::~FileHandle() = default;

Status FileHandle::ReadAt(size_t offset, void* buffer, size_t nr_bytes) {
    auto status = Seek(offset);
    if (!status.ok()) return status;

    size_t bytes_read = 0;
    status = Read(buffer, nr_bytes, &bytes_read);
    if (!status.ok()) return status;

    if (bytes_read != nr_bytes) {
        return Status::IOError("Short read from " + path_ + " at offset " +
                               std::to_string(offset) + ": wanted " +
                               std::to_string(nr_bytes) + ", got " +
                               std::to_string(bytes_read));
    }
    return Status::OK();
}

Status FileSystem::JoinPath(const std::string& base, const std::string& path,
                            std::string* result) {
    *result = ConstructAbsolutePath(base, path);
    return Status::OK();
}

//==============================================================================
// Local filesystem
//==============================================================================

class LocalFileHandle : public FileHandle {
public:
    LocalFileHandle(const std::string& path, FileOpenFlags flags)
        : FileHandle(path, flags) {
        std::ios::openmode mode = std::ios::binary;

        if (HasFlag(flags, FileOpenFlags::kRead)) {
            mode |= std::ios::in;
        }
        if (HasFlag(flags, FileOpenFlags::kWrite)) {
            mode |= std::ios::out;
        }
        if (HasFlag(flags, FileOpenFlags::kAppend)) {
            mode |= std::ios::app;
        }
        if (HasFlag(flags, FileOpenFlags::kTruncate)) {
            mode |= std::ios::trunc;
        }

        file_.open(path, mode);
        if (!file_.is_open()) {
            throw std::system_error(errno, std::system_category(),
                                   "Failed to open file: " + path);
        }
    }

    ~LocalFileHandle() override {
        if (file_.is_open()) {
            file_.close();
        }
    }

    Status Read(void* buffer, size_t nr_bytes, size_t* bytes_read) override {
        try {
            file_.read(static_cast<char*>(buffer), nr_bytes);
            *bytes_read = static_cast<size_t>(file_.gcount());
            if (file_.bad()) {
                return Status::IOError("Read error on " + path_);
            }
            // A short read sets eof/fail; clear so later seeks work.
            file_.clear();
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Read failed: ") + e.what());
        }
    }

    Status Write(const void* buffer, size_t nr_bytes, size_t* bytes_written) override {
        try {
            file_.write(static_cast<const char*>(buffer), nr_bytes);
            if (file_.bad()) {
                return Status::IOError("Write error on " + path_);
            }
            *bytes_written = nr_bytes;
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Write failed: ") + e.what());
        }
    }

    Status Seek(size_t position) override {
        try {
            file_.clear();
            file_.seekg(position);
            file_.seekp(position);
            if (file_.bad() || file_.fail()) {
                return Status::IOError("Seek error on " + path_);
            }
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Seek failed: ") + e.what());
        }
    }

    Status GetPosition(size_t* position) const override {
        try {
            *position = static_cast<size_t>(file_.tellg());
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Get position failed: ") + e.what());
        }
    }

    Status GetSize(size_t* size) const override {
        try {
            std::error_code ec;
            auto file_size = fs::file_size(path_, ec);
            if (ec) {
                return Status::IOError("Get size failed for " + path_ + ": " + ec.message());
            }
            *size = static_cast<size_t>(file_size);
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Get size failed: ") + e.what());
        }
    }

    Status Sync() override {
        try {
            file_.flush();
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Sync failed: ") + e.what());
        }
    }

    Status Close() override {
        try {
            if (file_.is_open()) {
                file_.close();
            }
            return Status::OK();
        } catch (const std::exception& e) {
            return Status::IOError(std::string("Close failed: ") + e.what());
        }
    }

private:
    mutable std::fstream file_;
};

Status LocalFileSystem::OpenFile(const std::string& path, FileOpenFlags flags,
                                 std::unique_ptr<FileHandle>* handle) {
    try {
        if (!HasFlag(flags, FileOpenFlags::kCreate) && !fs::exists(path)) {
            return Status::NotFound("File does not exist: " + path);
        }
        *handle = std::make_unique<LocalFileHandle>(path, flags);
        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("Failed to open file: ") + e.what());
    }
}

Status LocalFileSystem::FileExists(const std::string& path, bool* exists) {
    try {
        *exists = fs::exists(path);
        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("File exists check failed: ") + e.what());
    }
}

Status LocalFileSystem::GetFileInfo(const std::string& path, FileInfo* info) {
    try {
        if (!fs::exists(path)) {
            return Status::NotFound("File does not exist: " + path);
        }

        auto status = fs::status(path);
        info->path = path;
        info->is_directory = fs::is_directory(status);
        info->is_regular_file = fs::is_regular_file(status);

        if (info->is_regular_file) {
            info->size = fs::file_size(path);
        }

        auto time = fs::last_write_time(path);
        info->modification_time = std::chrono::duration_cast<std::chrono::seconds>(
            time.time_since_epoch()).count();

        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("Get file info failed: ") + e.what());
    }
}

Status LocalFileSystem::ListFiles(const std::string& directory,
                                  std::vector<FileInfo>* files) {
    try {
        if (!fs::exists(directory)) {
            return Status::NotFound("Directory does not exist: " + directory);
        }
        if (!fs::is_directory(directory)) {
            return Status::InvalidArgument("Not a directory: " + directory);
        }

        files->clear();
        for (const auto& entry : fs::directory_iterator(directory)) {
            FileInfo info;
            info.path = entry.path().string();
            info.is_directory = entry.is_directory();
            info.is_regular_file = entry.is_regular_file();

            if (info.is_regular_file) {
                info.size = entry.file_size();
            }

            files->push_back(info);
        }
        std::sort(files->begin(), files->end(),
                  [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });

        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("List files failed: ") + e.what());
    }
}

Status LocalFileSystem::CreateDirectory(const std::string& path) {
    try {
        if (!fs::create_directories(path)) {
            if (!fs::exists(path)) {
                return Status::IOError("Failed to create directory: " + path);
            }
        }
        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("Create directory failed: ") + e.what());
    }
}

Status LocalFileSystem::RemoveFile(const std::string& path) {
    try {
        if (!fs::remove(path)) {
            return Status::NotFound("File not found: " + path);
        }
        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("Remove file failed: ") + e.what());
    }
}

Status LocalFileSystem::RemoveDirectory(const std::string& path) {
    try {
        fs::remove_all(path);
        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("Remove directory failed: ") + e.what());
    }
}

Status LocalFileSystem::Rename(const std::string& source, const std::string& target) {
    try {
        if (!fs::exists(source)) {
            return Status::NotFound("Rename source not found: " + source);
        }
        fs::rename(source, target);
        return Status::OK();
    } catch (const std::exception& e) {
        return Status::IOError(std::string("Rename failed: ") + e.what());
    }
}

std::unique_ptr<FileSystem> FileSystem::CreateLocal() {
    return std::make_unique<LocalFileSystem>();
}

//==============================================================================
// Memory filesystem
//==============================================================================

class MemoryFileHandle : public FileHandle {
public:
    MemoryFileHandle(const std::string& path, FileOpenFlags flags,
                     std::shared_ptr<std::vector<char>> content)
        : FileHandle(path, flags), content_(std::move(content)), pos_(0) {
        if (HasFlag(flags, FileOpenFlags::kAppend)) {
            pos_ = content_->size();
        }
    }

    Status Read(void* buffer, size_t nr_bytes, size_t* bytes_read) override {
        if (pos_ >= content_->size()) {
            *bytes_read = 0;
            return Status::OK();
        }
        size_t available = content_->size() - pos_;
        size_t to_read = std::min(nr_bytes, available);

        std::memcpy(buffer, content_->data() + pos_, to_read);
        pos_ += to_read;
        *bytes_read = to_read;
        return Status::OK();
    }

    Status Write(const void* buffer, size_t nr_bytes, size_t* bytes_written) override {
        if (!HasFlag(flags_, FileOpenFlags::kWrite)) {
            return Status::InvalidArgument("File not opened for writing: " + path_);
        }

        if (HasFlag(flags_, FileOpenFlags::kAppend)) {
            pos_ = content_->size();
        }
        if (pos_ + nr_bytes > content_->size()) {
            content_->resize(pos_ + nr_bytes);
        }
        std::memcpy(content_->data() + pos_, buffer, nr_bytes);

        pos_ += nr_bytes;
        *bytes_written = nr_bytes;
        return Status::OK();
    }

    Status Seek(size_t position) override {
        if (position > content_->size()) {
            return Status::InvalidArgument("Seek beyond file size");
        }
        pos_ = position;
        return Status::OK();
    }

    Status GetPosition(size_t* position) const override {
        *position = pos_;
        return Status::OK();
    }

    Status GetSize(size_t* size) const override {
        *size = content_->size();
        return Status::OK();
    }

    Status Sync() override { return Status::OK(); }
    Status Close() override { return Status::OK(); }

private:
    std::shared_ptr<std::vector<char>> content_;
    size_t pos_;
};

Status MemoryFileSystem::OpenFile(const std::string& path, FileOpenFlags flags,
                                  std::unique_ptr<FileHandle>* handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end()) {
        if (!HasFlag(flags, FileOpenFlags::kCreate)) {
            return Status::NotFound("File not found: " + path);
        }
        it = files_.emplace(path, std::make_shared<std::vector<char>>()).first;
    } else if (HasFlag(flags, FileOpenFlags::kTruncate)) {
        it->second->clear();
    }

    *handle = std::make_unique<MemoryFileHandle>(path, flags, it->second);
    return Status::OK();
}

Status MemoryFileSystem::FileExists(const std::string& path, bool* exists) {
    std::lock_guard<std::mutex> lock(mutex_);
    *exists = files_.count(path) > 0 || directories_.count(path) > 0;
    return Status::OK();
}

Status MemoryFileSystem::GetFileInfo(const std::string& path, FileInfo* info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end()) {
        if (directories_.count(path) > 0) {
            info->path = path;
            info->size = 0;
            info->is_directory = true;
            info->is_regular_file = false;
            return Status::OK();
        }
        return Status::NotFound("File not found: " + path);
    }

    info->path = path;
    info->size = it->second->size();
    info->is_directory = false;
    info->is_regular_file = true;
    info->modification_time = 0;
    return Status::OK();
}

Status MemoryFileSystem::ListFiles(const std::string& directory,
                                   std::vector<FileInfo>* files) {
    std::lock_guard<std::mutex> lock(mutex_);
    files->clear();

    std::string prefix = directory;
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }

    std::unordered_set<std::string> seen_dirs;
    auto add_child = [&](const std::string& path, const std::vector<char>* content) {
        if (path.compare(0, prefix.size(), prefix) != 0) return;
        std::string rest = path.substr(prefix.size());
        if (rest.empty()) return;
        auto slash = rest.find('/');
        if (slash == std::string::npos && content != nullptr) {
            FileInfo info;
            info.path = path;
            info.size = content->size();
            info.is_regular_file = true;
            files->push_back(info);
            return;
        }
        std::string child = prefix + rest.substr(0, slash);
        if (seen_dirs.insert(child).second) {
            FileInfo info;
            info.path = child;
            info.is_directory = true;
            files->push_back(info);
        }
    };

    for (const auto& [path, content] : files_) {
        add_child(path, content.get());
    }
    for (const auto& dir : directories_) {
        add_child(dir, nullptr);
    }

    if (files->empty() && directories_.count(directory) == 0) {
        return Status::NotFound("Directory does not exist: " + directory);
    }

    std::sort(files->begin(), files->end(),
              [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
    return Status::OK();
}

Status MemoryFileSystem::CreateDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string current = path;
    while (!current.empty() && current != "/") {
        directories_.insert(current);
        current = GetParentPath(current);
    }
    return Status::OK();
}

Status MemoryFileSystem::RemoveFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (files_.erase(path) == 0) {
        return Status::NotFound("File not found: " + path);
    }
    return Status::OK();
}

Status MemoryFileSystem::RemoveDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string prefix = path + "/";
    for (auto it = files_.begin(); it != files_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = files_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = directories_.begin(); it != directories_.end();) {
        if (*it == path || it->compare(0, prefix.size(), prefix) == 0) {
            it = directories_.erase(it);
        } else {
            ++it;
        }
    }
    return Status::OK();
}

Status MemoryFileSystem::Rename(const std::string& source, const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(source);
    if (it == files_.end()) {
        return Status::NotFound("Rename source not found: " + source);
    }
    auto content = it->second;
    files_.erase(it);
    files_[target] = std::move(content);
    return Status::OK();
}

Status MemoryFileSystem::TruncateTail(const std::string& path, size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end()) {
        return Status::NotFound("File not found: " + path);
    }
    auto& content = *it->second;
    content.resize(n >= content.size() ? 0 : content.size() - n);
    return Status::OK();
}

std::unique_ptr<FileSystem> FileSystem::CreateMemory() {
    return std::make_unique<MemoryFileSystem>();
}

//==============================================================================
// FileOperations
//==============================================================================

FileOperations::FileOperations(std::shared_ptr<FileSystem> fs) : fs_(std::move(fs)) {}

Status FileOperations::ReadFile(const std::string& path,
                                std::shared_ptr<arrow::Buffer>* buffer) {
    std::unique_ptr<FileHandle> handle;
    auto status = fs_->OpenFile(path, FileOpenFlags::kRead, &handle);
    if (!status.ok()) return status;

    size_t file_size;
    status = handle->GetSize(&file_size);
    if (!status.ok()) return status;

    auto result = arrow::AllocateBuffer(static_cast<int64_t>(file_size));
    if (!result.ok()) {
        return Status::IOError("Failed to allocate buffer: " + result.status().ToString());
    }
    std::shared_ptr<arrow::Buffer> allocated = std::move(result).ValueUnsafe();

    if (file_size > 0) {
        status = handle->ReadAt(0, allocated->mutable_data(), file_size);
        if (!status.ok()) return status;
    }

    *buffer = std::move(allocated);
    return handle->Close();
}

Status FileOperations::ReadFile(const std::string& path, std::string* contents) {
    std::shared_ptr<arrow::Buffer> buffer;
    auto status = ReadFile(path, &buffer);
    if (!status.ok()) return status;
    contents->assign(reinterpret_cast<const char*>(buffer->data()),
                     static_cast<size_t>(buffer->size()));
    return Status::OK();
}

Status FileOperations::WriteFile(const std::string& path,
                                 const std::shared_ptr<arrow::Buffer>& buffer) {
    std::unique_ptr<FileHandle> handle;
    auto status = fs_->OpenFile(path,
                               FileOpenFlags::kWrite | FileOpenFlags::kCreate |
                               FileOpenFlags::kTruncate,
                               &handle);
    if (!status.ok()) return status;

    size_t bytes_written = 0;
    status = handle->Write(buffer->data(), static_cast<size_t>(buffer->size()), &bytes_written);
    if (!status.ok()) return status;

    if (bytes_written != static_cast<size_t>(buffer->size())) {
        return Status::IOError("Incomplete write to " + path);
    }

    status = handle->Sync();
    if (!status.ok()) return status;
    return handle->Close();
}

Status FileOperations::WriteFile(const std::string& path, const std::string& contents) {
    return WriteFile(path, std::make_shared<arrow::Buffer>(
        reinterpret_cast<const uint8_t*>(contents.data()),
        static_cast<int64_t>(contents.size())));
}

//==============================================================================
// Path helpers
//==============================================================================

std::string GetPathWithoutSchemeAndAuthority(const std::string& path) {
    auto scheme_end = path.find(':');
    auto first_slash = path.find('/');
    if (scheme_end == std::string::npos ||
        (first_slash != std::string::npos && first_slash < scheme_end)) {
        return path;
    }

    std::string rest = path.substr(scheme_end + 1);
    if (rest.compare(0, 2, "//") == 0) {
        // Skip the authority component.
        auto authority_end = rest.find('/', 2);
        if (authority_end == std::string::npos) {
            return "/";
        }
        return rest.substr(authority_end);
    }
    return rest;
}

std::string GetRelativePartitionPath(const std::string& base_path,
                                     const std::string& full_path) {
    std::string base = GetPathWithoutSchemeAndAuthority(base_path);
    std::string full = GetPathWithoutSchemeAndAuthority(full_path);
    while (base.size() > 1 && base.back() == '/') base.pop_back();
    while (full.size() > 1 && full.back() == '/') full.pop_back();

    if (full == base) {
        return "";
    }
    if (full.compare(0, base.size(), base) == 0 && full.size() > base.size() &&
        full[base.size()] == '/') {
        return full.substr(base.size() + 1);
    }
    // Already relative.
    return full;
}

std::string ConstructAbsolutePath(const std::string& base_path,
                                  const std::string& relative_path) {
    if (relative_path.empty()) {
        return base_path;
    }
    if (base_path.empty()) {
        return relative_path;
    }
    if (base_path.back() == '/') {
        return base_path + relative_path;
    }
    return base_path + "/" + relative_path;
}

std::string GetFileName(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::string GetParentPath(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

} // namespace quarry
