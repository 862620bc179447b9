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

/**
 * Log file format
 *
 * A log file is a sequence of blocks, each laid out little-endian as
 *
 *   magic "#QUARRY#"                  8 bytes
 *   block size                        u64  (version .. crc)
 *   format version                    u32
 *   block type                        u32
 *   header count                      u32
 *   (key u32, length u32, bytes)*
 *   content length                    u64
 *   content                           bytes
 *   crc32 of version .. content       u32
 *   total block length                u64  (magic .. this field)
 *
 * A block that fails any framing or checksum check turns the rest of its file
 * into a single CORRUPT block.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "quarry/file_group.h"
#include "quarry/file_system.h"
#include "quarry/log_record.h"
#include "quarry/status.h"

namespace quarry {

constexpr char kLogBlockMagic[] = "#QUARRY#";
constexpr size_t kLogBlockMagicLength = 8;
constexpr uint32_t kLogFormatVersion = 1;

enum class LogBlockType : uint32_t {
    kCommand = 0,
    kDelete = 1,
    kCorrupt = 2,
    kArrowData = 3,
};

enum class HeaderKey : uint32_t {
    kInstantTime = 0,
    kTargetInstantTime = 1,
    kSchema = 2,
    kCommandBlockType = 3,
    kCompactedBlockTimes = 4,
};

enum class CommandType : uint32_t {
    kRollback = 0,
};

const char* LogBlockTypeToString(LogBlockType type);

using LogBlockHeader = std::map<HeaderKey, std::string>;

// Where a block's content lives inside its log file.
struct BlockContentLocation {
    std::string path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

// CRC of the bytes preceding the content, and the CRC stored after it.
struct BlockChecksum {
    uint32_t prefix_crc = 0;
    uint32_t expected_crc = 0;
};

/**
 * @brief One typed block of a log file
 *
 * Content is read on demand from the file system unless it was loaded when the
 * block was parsed. The block reopens its file for a lazy read, so it stays
 * usable after the reader that produced it is closed.
 */
class LogBlock {
public:
    LogBlock(LogBlockType type, LogBlockHeader header,
             std::shared_ptr<FileSystem> fs, BlockContentLocation location,
             std::optional<BlockChecksum> checksum = std::nullopt,
             std::optional<std::string> content = std::nullopt);

    LogBlockType GetType() const { return type_; }
    const LogBlockHeader& GetHeader() const { return header_; }
    const BlockContentLocation& GetLocation() const { return location_; }

    bool HasHeader(HeaderKey key) const { return header_.count(key) > 0; }
    std::string GetHeaderValue(HeaderKey key) const;

    std::string GetInstantTime() const { return GetHeaderValue(HeaderKey::kInstantTime); }
    std::string GetTargetInstantTime() const { return GetHeaderValue(HeaderKey::kTargetInstantTime); }
    // Original instants folded into this log-compacted block; empty otherwise.
    std::vector<std::string> GetCompactedBlockTimes() const;

    bool IsDataOrDeleteBlock() const {
        return type_ == LogBlockType::kArrowData || type_ == LogBlockType::kDelete;
    }

    // NotSupported for command codes this reader does not know.
    Status GetCommandType(CommandType* command) const;

    // Raw content bytes. A lazy read verifies the checksum.
    Status GetContent(std::string* content) const;

    Status GetRecordBatch(std::shared_ptr<arrow::RecordBatch>* batch) const;
    Status GetDeleteRecords(std::vector<DeleteRecord>* deletes) const;

private:
    LogBlockType type_;
    LogBlockHeader header_;
    std::shared_ptr<FileSystem> fs_;
    BlockContentLocation location_;
    std::optional<BlockChecksum> checksum_;
    std::optional<std::string> content_;
};

/**
 * @brief Serialization of blocks into the on-disk layout
 */
class LogBlockCodec {
public:
    static Status Encode(uint32_t type_code, const LogBlockHeader& header,
                         const std::string& content, std::string* encoded);

    static Status EncodeDataBlock(LogBlockHeader header,
                                  const std::shared_ptr<arrow::RecordBatch>& batch,
                                  std::string* encoded);
    static Status EncodeDeleteBlock(const LogBlockHeader& header,
                                    const std::vector<DeleteRecord>& deletes,
                                    std::string* encoded);
    static Status EncodeRollbackBlock(const std::string& instant_time,
                                      const std::string& target_instant_time,
                                      std::string* encoded);

    static Status SerializeDeletes(const std::vector<DeleteRecord>& deletes, std::string* content);
    static Status DeserializeDeletes(const std::string& content, std::vector<DeleteRecord>* deletes);

    // zlib CRC32, continued from seed.
    static uint32_t Checksum(const char* data, size_t size, uint32_t seed = 0);
};

struct LogReaderOptions {
    // Defer content reads until a block's content is requested.
    bool read_blocks_lazily = true;
    // Iterate each file from its last block to its first.
    bool reverse = false;
};

/**
 * @brief Iterates the blocks of a single log file
 */
class LogFileReader {
public:
    static Status Open(std::shared_ptr<FileSystem> fs, const LogFile& log_file,
                       const LogReaderOptions& options, std::unique_ptr<LogFileReader>* reader);

    ~LogFileReader();

    // Next block, or nullptr at the end of the file.
    Status Next(std::shared_ptr<LogBlock>* block);

    const LogFile& GetLogFile() const { return log_file_; }
    Status Close();

private:
    LogFileReader(std::shared_ptr<FileSystem> fs, LogFile log_file, LogReaderOptions options,
                  std::unique_ptr<FileHandle> handle, uint64_t file_size);

    // Parse the block starting at pos; next_pos is where the following block starts.
    Status ReadBlockAt(uint64_t pos, std::shared_ptr<LogBlock>* block, uint64_t* next_pos);
    std::shared_ptr<LogBlock> MakeCorruptBlock(uint64_t pos);
    // CRC of [offset, offset + length) seeded with the header CRC, read in chunks.
    Status ChecksumRange(uint64_t offset, uint64_t length, uint32_t seed, uint32_t* crc);
    Status BuildReverseIndex();

    std::shared_ptr<FileSystem> fs_;
    LogFile log_file_;
    LogReaderOptions options_;
    std::unique_ptr<FileHandle> handle_;
    uint64_t file_size_;
    uint64_t pos_ = 0;
    bool done_ = false;

    std::vector<std::shared_ptr<LogBlock>> reverse_blocks_;
    bool reverse_loaded_ = false;
};

/**
 * @brief Capability interface for anything that yields log blocks in order
 */
class LogBlockSource {
public:
    virtual ~LogBlockSource() = default;

    // Next block, or nullptr when every file is exhausted.
    virtual Status Next(std::shared_ptr<LogBlock>* block) = 0;

    // File the last returned block came from; nullptr before the first block.
    virtual const LogFile* CurrentLogFile() const = 0;

    // Number of files opened so far.
    virtual size_t FilesOpened() const = 0;

    virtual Status Close() = 0;
};

/**
 * @brief Chains LogFileReaders over an ordered list of log files
 */
class LogFormatReader : public LogBlockSource {
public:
    LogFormatReader(std::shared_ptr<FileSystem> fs, std::vector<LogFile> log_files,
                    LogReaderOptions options);
    ~LogFormatReader() override;

    Status Next(std::shared_ptr<LogBlock>* block) override;
    const LogFile* CurrentLogFile() const override;
    size_t FilesOpened() const override { return files_opened_; }
    Status Close() override;

private:
    std::shared_ptr<FileSystem> fs_;
    std::vector<LogFile> log_files_;
    LogReaderOptions options_;

    size_t next_file_ = 0;
    size_t files_opened_ = 0;
    std::unique_ptr<LogFileReader> current_;
    bool closed_ = false;
};

/**
 * @brief Appends encoded blocks to a log file
 */
class LogFormatWriter {
public:
    static Status Open(std::shared_ptr<FileSystem> fs, const std::string& path,
                       std::unique_ptr<LogFormatWriter>* writer);

    ~LogFormatWriter();

    Status AppendBlock(uint32_t type_code, const LogBlockHeader& header,
                       const std::string& content);
    Status AppendDataBlock(const LogBlockHeader& header,
                           const std::shared_ptr<arrow::RecordBatch>& batch);
    Status AppendDeleteBlock(const LogBlockHeader& header,
                             const std::vector<DeleteRecord>& deletes);
    Status AppendRollbackBlock(const std::string& instant_time,
                               const std::string& target_instant_time);

    uint64_t GetCurrentSize() const { return size_; }
    const std::string& GetPath() const { return path_; }
    Status Close();

private:
    LogFormatWriter(std::string path, std::unique_ptr<FileHandle> handle, uint64_t size);
    Status AppendEncoded(const std::string& encoded);

    std::string path_;
    std::unique_ptr<FileHandle> handle_;
    uint64_t size_;
};

} // namespace quarry
