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

#include "quarry/log_format.h"

#include <algorithm>
#include <cstring>
#include <sstream>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include "quarry/arrow_serialization.h"
#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(LogReader);

namespace {

// magic + block size
constexpr uint64_t kBlockPreambleSize = kLogBlockMagicLength + sizeof(uint64_t);
// version + type + header count
constexpr uint64_t kFixedBodySize = 3 * sizeof(uint32_t);
// content length + crc
constexpr uint64_t kMinBodySize = kFixedBodySize + sizeof(uint64_t) + sizeof(uint32_t);
constexpr uint64_t kTrailerSize = sizeof(uint64_t);
constexpr uint64_t kChecksumChunkSize = 64 * 1024;

void AppendU32(std::string* buffer, uint32_t value) {
    buffer->append(reinterpret_cast<const char*>(&value), sizeof(value));
}

void AppendU64(std::string* buffer, uint64_t value) {
    buffer->append(reinterpret_cast<const char*>(&value), sizeof(value));
}

uint32_t DecodeU32(const char* data) {
    uint32_t value;
    std::memcpy(&value, data, sizeof(value));
    return value;
}

uint64_t DecodeU64(const char* data) {
    uint64_t value;
    std::memcpy(&value, data, sizeof(value));
    return value;
}

bool IsKnownHeaderKey(uint32_t key) {
    return key <= static_cast<uint32_t>(HeaderKey::kCompactedBlockTimes);
}

}  // namespace

const char* LogBlockTypeToString(LogBlockType type) {
    switch (type) {
        case LogBlockType::kCommand: return "COMMAND";
        case LogBlockType::kDelete: return "DELETE";
        case LogBlockType::kCorrupt: return "CORRUPT";
        case LogBlockType::kArrowData: return "ARROW_DATA";
    }
    return "UNKNOWN";
}

//==============================================================================
// LogBlock
//==============================================================================

LogBlock::LogBlock(LogBlockType type, LogBlockHeader header,
                   std::shared_ptr<FileSystem> fs, BlockContentLocation location,
                   std::optional<BlockChecksum> checksum,
                   std::optional<std::string> content)
    : type_(type), header_(std::move(header)), fs_(std::move(fs)),
      location_(std::move(location)), checksum_(checksum), content_(std::move(content)) {}

std::string LogBlock::GetHeaderValue(HeaderKey key) const {
    auto it = header_.find(key);
    return it == header_.end() ? std::string() : it->second;
}

std::vector<std::string> LogBlock::GetCompactedBlockTimes() const {
    std::vector<std::string> times;
    std::stringstream ss(GetHeaderValue(HeaderKey::kCompactedBlockTimes));
    std::string time;
    while (std::getline(ss, time, ',')) {
        if (!time.empty()) {
            times.push_back(time);
        }
    }
    return times;
}

Status LogBlock::GetCommandType(CommandType* command) const {
    if (type_ != LogBlockType::kCommand) {
        return Status::InvalidArgument(std::string("Not a command block: ") +
                                       LogBlockTypeToString(type_));
    }
    std::string value = GetHeaderValue(HeaderKey::kCommandBlockType);
    uint32_t code = 0;
    try {
        size_t consumed = 0;
        unsigned long parsed = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            return Status::NotSupported("Unsupported command block type: " + value);
        }
        code = static_cast<uint32_t>(parsed);
    } catch (const std::exception& e) {
        return Status::NotSupported("Unsupported command block type '" + value + "': " + e.what());
    }

    if (code != static_cast<uint32_t>(CommandType::kRollback)) {
        return Status::NotSupported("Unsupported command block type: " + std::to_string(code));
    }
    *command = CommandType::kRollback;
    return Status::OK();
}

Status LogBlock::GetContent(std::string* content) const {
    if (content_) {
        *content = *content_;
        return Status::OK();
    }

    std::unique_ptr<FileHandle> handle;
    auto status = fs_->OpenFile(location_.path, FileOpenFlags::kRead, &handle);
    if (!status.ok()) return status;

    content->assign(location_.length, '\0');
    if (location_.length > 0) {
        status = handle->ReadAt(location_.offset, &(*content)[0], location_.length);
        if (!status.ok()) return status;
    }
    status = handle->Close();
    if (!status.ok()) return status;

    if (checksum_) {
        uint32_t crc = LogBlockCodec::Checksum(content->data(), content->size(),
                                               checksum_->prefix_crc);
        if (crc != checksum_->expected_crc) {
            return Status::Corruption("Checksum mismatch for block at " + location_.path + ":" +
                                      std::to_string(location_.offset));
        }
    }
    return Status::OK();
}

Status LogBlock::GetRecordBatch(std::shared_ptr<arrow::RecordBatch>* batch) const {
    if (type_ != LogBlockType::kArrowData) {
        return Status::InvalidArgument(std::string("Not a data block: ") +
                                       LogBlockTypeToString(type_));
    }
    std::string content;
    auto status = GetContent(&content);
    if (!status.ok()) return status;
    return DeserializeArrowBatch(content, batch);
}

Status LogBlock::GetDeleteRecords(std::vector<DeleteRecord>* deletes) const {
    if (type_ != LogBlockType::kDelete) {
        return Status::InvalidArgument(std::string("Not a delete block: ") +
                                       LogBlockTypeToString(type_));
    }
    std::string content;
    auto status = GetContent(&content);
    if (!status.ok()) return status;
    return LogBlockCodec::DeserializeDeletes(content, deletes);
}

//==============================================================================
// LogBlockCodec
//==============================================================================

uint32_t LogBlockCodec::Checksum(const char* data, size_t size, uint32_t seed) {
    uLong crc = seed;
    // zlib takes uInt lengths; feed large buffers in pieces.
    while (size > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(size, 1u << 30));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

Status LogBlockCodec::Encode(uint32_t type_code, const LogBlockHeader& header,
                             const std::string& content, std::string* encoded) {
    std::string body;
    AppendU32(&body, kLogFormatVersion);
    AppendU32(&body, type_code);
    AppendU32(&body, static_cast<uint32_t>(header.size()));
    for (const auto& [key, value] : header) {
        AppendU32(&body, static_cast<uint32_t>(key));
        AppendU32(&body, static_cast<uint32_t>(value.size()));
        body.append(value);
    }
    AppendU64(&body, content.size());
    body.append(content);
    AppendU32(&body, Checksum(body.data(), body.size()));

    encoded->clear();
    encoded->reserve(kBlockPreambleSize + body.size() + kTrailerSize);
    encoded->append(kLogBlockMagic, kLogBlockMagicLength);
    AppendU64(encoded, body.size());
    encoded->append(body);
    AppendU64(encoded, kBlockPreambleSize + body.size() + kTrailerSize);
    return Status::OK();
}

Status LogBlockCodec::EncodeDataBlock(LogBlockHeader header,
                                      const std::shared_ptr<arrow::RecordBatch>& batch,
                                      std::string* encoded) {
    std::string content;
    auto status = SerializeArrowBatch(batch, &content);
    if (!status.ok()) return status;

    if (header.count(HeaderKey::kSchema) == 0) {
        header[HeaderKey::kSchema] = batch->schema()->ToString();
    }
    return Encode(static_cast<uint32_t>(LogBlockType::kArrowData), header, content, encoded);
}

Status LogBlockCodec::EncodeDeleteBlock(const LogBlockHeader& header,
                                        const std::vector<DeleteRecord>& deletes,
                                        std::string* encoded) {
    std::string content;
    auto status = SerializeDeletes(deletes, &content);
    if (!status.ok()) return status;
    return Encode(static_cast<uint32_t>(LogBlockType::kDelete), header, content, encoded);
}

Status LogBlockCodec::EncodeRollbackBlock(const std::string& instant_time,
                                          const std::string& target_instant_time,
                                          std::string* encoded) {
    LogBlockHeader header;
    header[HeaderKey::kInstantTime] = instant_time;
    header[HeaderKey::kTargetInstantTime] = target_instant_time;
    header[HeaderKey::kCommandBlockType] =
        std::to_string(static_cast<uint32_t>(CommandType::kRollback));
    return Encode(static_cast<uint32_t>(LogBlockType::kCommand), header, "", encoded);
}

Status LogBlockCodec::SerializeDeletes(const std::vector<DeleteRecord>& deletes,
                                       std::string* content) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& del : deletes) {
        j.push_back({{"recordKey", del.record_key},
                     {"partitionPath", del.partition_path},
                     {"orderingValue", del.ordering_value}});
    }
    *content = j.dump();
    return Status::OK();
}

Status LogBlockCodec::DeserializeDeletes(const std::string& content,
                                         std::vector<DeleteRecord>* deletes) {
    try {
        auto j = nlohmann::json::parse(content);
        if (!j.is_array()) {
            return Status::Corruption("Delete block content is not a JSON array");
        }
        deletes->clear();
        for (const auto& entry : j) {
            DeleteRecord del;
            del.record_key = entry.at("recordKey").get<std::string>();
            del.partition_path = entry.value("partitionPath", "");
            del.ordering_value = entry.value("orderingValue", int64_t{0});
            deletes->push_back(std::move(del));
        }
    } catch (const nlohmann::json::exception& e) {
        return Status::Corruption(std::string("Malformed delete block: ") + e.what());
    }
    return Status::OK();
}

//==============================================================================
// LogFileReader
//==============================================================================

LogFileReader::LogFileReader(std::shared_ptr<FileSystem> fs, LogFile log_file,
                             LogReaderOptions options, std::unique_ptr<FileHandle> handle,
                             uint64_t file_size)
    : fs_(std::move(fs)), log_file_(std::move(log_file)), options_(options),
      handle_(std::move(handle)), file_size_(file_size) {}

LogFileReader::~LogFileReader() {
    auto status = Close();
    if (!status.ok()) {
        QUARRY_LOG_WARN(LogReader) << "Failed to close " << log_file_.path << ": "
                                   << status.ToString();
    }
}

Status LogFileReader::Open(std::shared_ptr<FileSystem> fs, const LogFile& log_file,
                           const LogReaderOptions& options,
                           std::unique_ptr<LogFileReader>* reader) {
    std::unique_ptr<FileHandle> handle;
    auto status = fs->OpenFile(log_file.path, FileOpenFlags::kRead, &handle);
    if (!status.ok()) return status;

    size_t size = 0;
    status = handle->GetSize(&size);
    if (!status.ok()) return status;

    reader->reset(new LogFileReader(std::move(fs), log_file, options, std::move(handle), size));
    return Status::OK();
}

Status LogFileReader::Close() {
    if (handle_) {
        auto status = handle_->Close();
        handle_.reset();
        return status;
    }
    return Status::OK();
}

std::shared_ptr<LogBlock> LogFileReader::MakeCorruptBlock(uint64_t pos) {
    QUARRY_LOG_INFO(LogReader) << "Found corrupted block in " << log_file_.path << " at offset "
                               << pos << ", treating remaining " << (file_size_ - pos)
                               << " bytes as corrupt";
    BlockContentLocation location{log_file_.path, pos, file_size_ - pos};
    return std::make_shared<LogBlock>(LogBlockType::kCorrupt, LogBlockHeader{}, fs_, location);
}

Status LogFileReader::ChecksumRange(uint64_t offset, uint64_t length, uint32_t seed,
                                    uint32_t* crc) {
    std::string chunk(static_cast<size_t>(std::min(length, kChecksumChunkSize)), '\0');
    uint32_t running = seed;
    while (length > 0) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(length, chunk.size()));
        auto status = handle_->ReadAt(offset, &chunk[0], n);
        if (!status.ok()) return status;
        running = LogBlockCodec::Checksum(chunk.data(), n, running);
        offset += n;
        length -= n;
    }
    *crc = running;
    return Status::OK();
}

Status LogFileReader::ReadBlockAt(uint64_t pos, std::shared_ptr<LogBlock>* block,
                                  uint64_t* next_pos) {
    *next_pos = file_size_;
    uint64_t remaining = file_size_ - pos;
    if (remaining < kBlockPreambleSize + kMinBodySize + kTrailerSize) {
        *block = MakeCorruptBlock(pos);
        return Status::OK();
    }

    char preamble[kBlockPreambleSize];
    auto status = handle_->ReadAt(pos, preamble, sizeof(preamble));
    if (!status.ok()) return status;

    if (std::memcmp(preamble, kLogBlockMagic, kLogBlockMagicLength) != 0) {
        *block = MakeCorruptBlock(pos);
        return Status::OK();
    }

    uint64_t block_size = DecodeU64(preamble + kLogBlockMagicLength);
    if (block_size < kMinBodySize ||
        block_size > remaining - kBlockPreambleSize - kTrailerSize) {
        *block = MakeCorruptBlock(pos);
        return Status::OK();
    }

    const uint64_t body_start = pos + kBlockPreambleSize;
    const uint64_t body_end = body_start + block_size;  // exclusive, includes crc

    // Everything before the content; kept for the checksum.
    std::string prefix(kFixedBodySize, '\0');
    status = handle_->ReadAt(body_start, &prefix[0], kFixedBodySize);
    if (!status.ok()) return status;

    uint32_t type_code = DecodeU32(prefix.data() + sizeof(uint32_t));
    uint32_t header_count = DecodeU32(prefix.data() + 2 * sizeof(uint32_t));

    LogBlockHeader header;
    uint64_t cursor = body_start + kFixedBodySize;
    for (uint32_t i = 0; i < header_count; ++i) {
        if (cursor + 2 * sizeof(uint32_t) > body_end - sizeof(uint32_t)) {
            *block = MakeCorruptBlock(pos);
            return Status::OK();
        }
        char entry[2 * sizeof(uint32_t)];
        status = handle_->ReadAt(cursor, entry, sizeof(entry));
        if (!status.ok()) return status;
        prefix.append(entry, sizeof(entry));
        cursor += sizeof(entry);

        uint32_t key = DecodeU32(entry);
        uint32_t length = DecodeU32(entry + sizeof(uint32_t));
        if (cursor + length > body_end - sizeof(uint32_t)) {
            *block = MakeCorruptBlock(pos);
            return Status::OK();
        }
        std::string value(length, '\0');
        if (length > 0) {
            status = handle_->ReadAt(cursor, &value[0], length);
            if (!status.ok()) return status;
        }
        prefix.append(value);
        cursor += length;

        if (IsKnownHeaderKey(key)) {
            header[static_cast<HeaderKey>(key)] = std::move(value);
        }
    }

    if (cursor + sizeof(uint64_t) + sizeof(uint32_t) > body_end) {
        *block = MakeCorruptBlock(pos);
        return Status::OK();
    }
    char length_bytes[sizeof(uint64_t)];
    status = handle_->ReadAt(cursor, length_bytes, sizeof(length_bytes));
    if (!status.ok()) return status;
    prefix.append(length_bytes, sizeof(length_bytes));
    cursor += sizeof(length_bytes);

    uint64_t content_length = DecodeU64(length_bytes);
    if (content_length != body_end - sizeof(uint32_t) - cursor) {
        *block = MakeCorruptBlock(pos);
        return Status::OK();
    }
    const uint64_t content_offset = cursor;

    char tail[sizeof(uint32_t) + kTrailerSize];
    status = handle_->ReadAt(body_end - sizeof(uint32_t), tail, sizeof(tail));
    if (!status.ok()) return status;
    uint32_t stored_crc = DecodeU32(tail);
    uint64_t total_length = DecodeU64(tail + sizeof(uint32_t));
    if (total_length != kBlockPreambleSize + block_size + kTrailerSize) {
        *block = MakeCorruptBlock(pos);
        return Status::OK();
    }

    BlockChecksum checksum{LogBlockCodec::Checksum(prefix.data(), prefix.size()), stored_crc};

    std::optional<std::string> content;
    if (options_.read_blocks_lazily) {
        uint32_t crc = 0;
        status = ChecksumRange(content_offset, content_length, checksum.prefix_crc, &crc);
        if (!status.ok()) return status;
        if (crc != stored_crc) {
            *block = MakeCorruptBlock(pos);
            return Status::OK();
        }
    } else {
        std::string bytes(content_length, '\0');
        if (content_length > 0) {
            status = handle_->ReadAt(content_offset, &bytes[0], content_length);
            if (!status.ok()) return status;
        }
        if (LogBlockCodec::Checksum(bytes.data(), bytes.size(), checksum.prefix_crc) !=
            stored_crc) {
            *block = MakeCorruptBlock(pos);
            return Status::OK();
        }
        content = std::move(bytes);
    }

    LogBlockType type;
    switch (type_code) {
        case static_cast<uint32_t>(LogBlockType::kCommand):
            type = LogBlockType::kCommand;
            break;
        case static_cast<uint32_t>(LogBlockType::kDelete):
            type = LogBlockType::kDelete;
            break;
        case static_cast<uint32_t>(LogBlockType::kCorrupt):
            type = LogBlockType::kCorrupt;
            break;
        case static_cast<uint32_t>(LogBlockType::kArrowData):
            type = LogBlockType::kArrowData;
            break;
        default:
            return Status::NotSupported("Unsupported log block type " + std::to_string(type_code) +
                                        " in " + log_file_.path + " at offset " +
                                        std::to_string(pos));
    }

    BlockContentLocation location{log_file_.path, content_offset, content_length};
    *block = std::make_shared<LogBlock>(type, std::move(header), fs_, std::move(location),
                                        checksum, std::move(content));
    *next_pos = pos + total_length;
    return Status::OK();
}

Status LogFileReader::BuildReverseIndex() {
    uint64_t pos = 0;
    while (pos < file_size_) {
        std::shared_ptr<LogBlock> block;
        uint64_t next_pos = 0;
        auto status = ReadBlockAt(pos, &block, &next_pos);
        if (!status.ok()) return status;
        reverse_blocks_.push_back(block);
        if (block->GetType() == LogBlockType::kCorrupt && next_pos == file_size_ &&
            block->GetLocation().offset == pos) {
            break;
        }
        pos = next_pos;
    }
    std::reverse(reverse_blocks_.begin(), reverse_blocks_.end());
    reverse_loaded_ = true;
    return Status::OK();
}

Status LogFileReader::Next(std::shared_ptr<LogBlock>* block) {
    *block = nullptr;
    if (!handle_) {
        return Status::InvalidArgument("Log file reader is closed: " + log_file_.path);
    }

    if (options_.reverse) {
        if (!reverse_loaded_) {
            auto status = BuildReverseIndex();
            if (!status.ok()) return status;
        }
        if (!reverse_blocks_.empty()) {
            *block = reverse_blocks_.front();
            reverse_blocks_.erase(reverse_blocks_.begin());
        }
        return Status::OK();
    }

    if (done_ || pos_ >= file_size_) {
        return Status::OK();
    }

    uint64_t next_pos = 0;
    auto status = ReadBlockAt(pos_, block, &next_pos);
    if (!status.ok()) return status;

    if ((*block)->GetType() == LogBlockType::kCorrupt && (*block)->GetLocation().offset == pos_) {
        done_ = true;
    }
    pos_ = next_pos;
    return Status::OK();
}

//==============================================================================
// LogFormatReader
//==============================================================================

LogFormatReader::LogFormatReader(std::shared_ptr<FileSystem> fs, std::vector<LogFile> log_files,
                                 LogReaderOptions options)
    : fs_(std::move(fs)), log_files_(std::move(log_files)), options_(options) {}

LogFormatReader::~LogFormatReader() {
    auto status = Close();
    if (!status.ok()) {
        QUARRY_LOG_WARN(LogReader) << "Error closing log reader: " << status.ToString();
    }
}

Status LogFormatReader::Next(std::shared_ptr<LogBlock>* block) {
    *block = nullptr;
    if (closed_) {
        return Status::InvalidArgument("Log format reader is closed");
    }

    while (true) {
        if (!current_) {
            if (next_file_ >= log_files_.size()) {
                return Status::OK();
            }
            const LogFile& log_file = log_files_[next_file_++];
            ++files_opened_;
            QUARRY_LOG_DEBUG(LogReader) << "Opening log file " << log_file.path;
            auto status = LogFileReader::Open(fs_, log_file, options_, &current_);
            if (!status.ok()) return status;
        }

        auto status = current_->Next(block);
        if (!status.ok()) return status;
        if (*block) {
            return Status::OK();
        }

        status = current_->Close();
        current_.reset();
        if (!status.ok()) return status;
    }
}

const LogFile* LogFormatReader::CurrentLogFile() const {
    if (files_opened_ == 0) return nullptr;
    return &log_files_[files_opened_ - 1];
}

Status LogFormatReader::Close() {
    if (closed_) return Status::OK();
    closed_ = true;
    if (current_) {
        auto status = current_->Close();
        current_.reset();
        return status;
    }
    return Status::OK();
}

//==============================================================================
// LogFormatWriter
//==============================================================================

LogFormatWriter::LogFormatWriter(std::string path, std::unique_ptr<FileHandle> handle,
                                 uint64_t size)
    : path_(std::move(path)), handle_(std::move(handle)), size_(size) {}

LogFormatWriter::~LogFormatWriter() {
    auto status = Close();
    if (!status.ok()) {
        QUARRY_LOG_WARN(LogReader) << "Failed to close log writer for " << path_ << ": "
                                   << status.ToString();
    }
}

Status LogFormatWriter::Open(std::shared_ptr<FileSystem> fs, const std::string& path,
                             std::unique_ptr<LogFormatWriter>* writer) {
    auto status = fs->CreateDirectory(GetParentPath(path));
    if (!status.ok()) return status;

    std::unique_ptr<FileHandle> handle;
    status = fs->OpenFile(path,
                          FileOpenFlags::kWrite | FileOpenFlags::kCreate | FileOpenFlags::kAppend,
                          &handle);
    if (!status.ok()) return status;

    size_t size = 0;
    status = handle->GetSize(&size);
    if (!status.ok()) return status;

    writer->reset(new LogFormatWriter(path, std::move(handle), size));
    return Status::OK();
}

Status LogFormatWriter::AppendEncoded(const std::string& encoded) {
    if (!handle_) {
        return Status::InvalidArgument("Log writer is closed: " + path_);
    }
    size_t written = 0;
    auto status = handle_->Write(encoded.data(), encoded.size(), &written);
    if (!status.ok()) return status;
    if (written != encoded.size()) {
        return Status::IOError("Incomplete block write to " + path_);
    }
    size_ += written;
    return handle_->Sync();
}

Status LogFormatWriter::AppendBlock(uint32_t type_code, const LogBlockHeader& header,
                                    const std::string& content) {
    std::string encoded;
    auto status = LogBlockCodec::Encode(type_code, header, content, &encoded);
    if (!status.ok()) return status;
    return AppendEncoded(encoded);
}

Status LogFormatWriter::AppendDataBlock(const LogBlockHeader& header,
                                        const std::shared_ptr<arrow::RecordBatch>& batch) {
    std::string encoded;
    auto status = LogBlockCodec::EncodeDataBlock(header, batch, &encoded);
    if (!status.ok()) return status;
    return AppendEncoded(encoded);
}

Status LogFormatWriter::AppendDeleteBlock(const LogBlockHeader& header,
                                          const std::vector<DeleteRecord>& deletes) {
    std::string encoded;
    auto status = LogBlockCodec::EncodeDeleteBlock(header, deletes, &encoded);
    if (!status.ok()) return status;
    return AppendEncoded(encoded);
}

Status LogFormatWriter::AppendRollbackBlock(const std::string& instant_time,
                                            const std::string& target_instant_time) {
    std::string encoded;
    auto status = LogBlockCodec::EncodeRollbackBlock(instant_time, target_instant_time, &encoded);
    if (!status.ok()) return status;
    return AppendEncoded(encoded);
}

Status LogFormatWriter::Close() {
    if (!handle_) return Status::OK();
    auto status = handle_->Close();
    handle_.reset();
    return status;
}

} // namespace quarry
