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

#include "quarry/arrow_serialization.h"

#include <cstring>
#include <vector>

#include <arrow/compute/cast.h>

namespace quarry {

namespace {

// Copy bytes into an owned Arrow buffer so readers outlive the caller's memory.
Status CopyToBuffer(const void* data, size_t size, std::shared_ptr<arrow::Buffer>* out) {
    auto buffer_result = arrow::AllocateBuffer(static_cast<int64_t>(size));
    if (!buffer_result.ok()) {
        return Status::IOError("Failed to allocate buffer: " + buffer_result.status().ToString());
    }
    auto buffer = std::move(buffer_result).ValueOrDie();
    if (size > 0) {
        std::memcpy(buffer->mutable_data(), data, size);
    }
    *out = std::move(buffer);
    return Status::OK();
}

}  // namespace

Status SerializeArrowBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                          std::string* serialized_data) {
    if (!batch) {
        return Status::InvalidArgument("Null RecordBatch provided");
    }
    if (!serialized_data) {
        return Status::InvalidArgument("Null output string provided");
    }

    auto output_stream = arrow::io::BufferOutputStream::Create();
    if (!output_stream.ok()) {
        return Status::IOError("Failed to create output stream: " + output_stream.status().ToString());
    }

    auto writer_result = arrow::ipc::MakeStreamWriter(
        output_stream.ValueOrDie(),
        batch->schema());
    if (!writer_result.ok()) {
        return Status::IOError("Failed to create IPC writer: " + writer_result.status().ToString());
    }

    auto writer = writer_result.ValueOrDie();

    auto write_status = writer->WriteRecordBatch(*batch);
    if (!write_status.ok()) {
        return Status::IOError("Failed to write RecordBatch: " + write_status.ToString());
    }

    auto close_status = writer->Close();
    if (!close_status.ok()) {
        return Status::IOError("Failed to close writer: " + close_status.ToString());
    }

    auto finish_result = output_stream.ValueOrDie()->Finish();
    if (!finish_result.ok()) {
        return Status::IOError("Failed to finish stream: " + finish_result.status().ToString());
    }

    auto buffer = finish_result.ValueOrDie();
    serialized_data->assign(reinterpret_cast<const char*>(buffer->data()), buffer->size());

    return Status::OK();
}

Status DeserializeArrowBatch(const void* data, size_t size,
                           std::shared_ptr<arrow::RecordBatch>* batch) {
    if (!data) {
        return Status::InvalidArgument("Null data provided");
    }
    if (size == 0) {
        return Status::InvalidArgument("Zero-size data provided");
    }
    if (!batch) {
        return Status::InvalidArgument("Null output batch pointer provided");
    }

    std::shared_ptr<arrow::Buffer> buffer;
    auto status = CopyToBuffer(data, size, &buffer);
    if (!status.ok()) return status;

    auto input_stream = std::make_shared<arrow::io::BufferReader>(buffer);

    auto reader_result = arrow::ipc::RecordBatchStreamReader::Open(input_stream);
    if (!reader_result.ok()) {
        return Status::Corruption("Failed to create IPC reader: " + reader_result.status().ToString());
    }

    auto reader = reader_result.ValueOrDie();

    // Stream format: exactly one batch per data block
    auto read_result = reader->Next();
    if (!read_result.ok()) {
        return Status::Corruption("Failed to read RecordBatch: " + read_result.status().ToString());
    }

    *batch = read_result.ValueOrDie();

    if (!*batch) {
        return Status::Corruption("No RecordBatch found in stream");
    }

    return Status::OK();
}

Status DeserializeArrowBatch(const std::string& data,
                           std::shared_ptr<arrow::RecordBatch>* batch) {
    return DeserializeArrowBatch(data.data(), data.size(), batch);
}

Status WriteArrowFile(FileSystem* fs, const std::string& path,
                      const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return Status::InvalidArgument("Null table provided");
    }

    auto output_stream = arrow::io::BufferOutputStream::Create();
    if (!output_stream.ok()) {
        return Status::IOError("Failed to create output stream: " + output_stream.status().ToString());
    }

    auto writer_result = arrow::ipc::MakeFileWriter(output_stream.ValueOrDie(), table->schema());
    if (!writer_result.ok()) {
        return Status::IOError("Failed to create IPC file writer: " + writer_result.status().ToString());
    }
    auto writer = writer_result.ValueOrDie();

    auto write_status = writer->WriteTable(*table);
    if (!write_status.ok()) {
        return Status::IOError("Failed to write table: " + write_status.ToString());
    }
    auto close_status = writer->Close();
    if (!close_status.ok()) {
        return Status::IOError("Failed to close writer: " + close_status.ToString());
    }

    auto finish_result = output_stream.ValueOrDie()->Finish();
    if (!finish_result.ok()) {
        return Status::IOError("Failed to finish stream: " + finish_result.status().ToString());
    }
    auto buffer = finish_result.ValueOrDie();

    std::unique_ptr<FileHandle> handle;
    auto status = fs->OpenFile(path,
                               FileOpenFlags::kWrite | FileOpenFlags::kCreate |
                               FileOpenFlags::kTruncate,
                               &handle);
    if (!status.ok()) return status;

    size_t written = 0;
    status = handle->Write(buffer->data(), static_cast<size_t>(buffer->size()), &written);
    if (!status.ok()) return status;
    if (written != static_cast<size_t>(buffer->size())) {
        return Status::IOError("Incomplete write to " + path);
    }
    return handle->Close();
}

Status ReadArrowFile(FileSystem* fs, const std::string& path,
                     std::shared_ptr<arrow::Table>* table) {
    std::unique_ptr<FileHandle> handle;
    auto status = fs->OpenFile(path, FileOpenFlags::kRead, &handle);
    if (!status.ok()) return status;

    size_t size = 0;
    status = handle->GetSize(&size);
    if (!status.ok()) return status;

    std::vector<char> bytes(size);
    if (size > 0) {
        status = handle->ReadAt(0, bytes.data(), size);
        if (!status.ok()) return status;
    }
    status = handle->Close();
    if (!status.ok()) return status;

    std::shared_ptr<arrow::Buffer> buffer;
    status = CopyToBuffer(bytes.data(), bytes.size(), &buffer);
    if (!status.ok()) return status;

    auto reader_result = arrow::ipc::RecordBatchFileReader::Open(
        std::make_shared<arrow::io::BufferReader>(buffer));
    if (!reader_result.ok()) {
        return Status::Corruption("Failed to open Arrow file " + path + ": " +
                                  reader_result.status().ToString());
    }
    auto reader = reader_result.ValueOrDie();

    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    for (int i = 0; i < reader->num_record_batches(); ++i) {
        auto batch_result = reader->ReadRecordBatch(i);
        if (!batch_result.ok()) {
            return Status::Corruption("Failed to read batch " + std::to_string(i) + " of " +
                                      path + ": " + batch_result.status().ToString());
        }
        batches.push_back(batch_result.ValueOrDie());
    }

    auto table_result = arrow::Table::FromRecordBatches(reader->schema(), batches);
    if (!table_result.ok()) {
        return Status::IOError("Failed to assemble table: " + table_result.status().ToString());
    }
    *table = table_result.ValueOrDie();
    return Status::OK();
}

Status EvolveColumn(const std::shared_ptr<arrow::Array>& column,
                    const std::shared_ptr<arrow::Field>& field, int64_t num_rows,
                    std::shared_ptr<arrow::Array>* evolved) {
    if (!column) {
        auto nulls = arrow::MakeArrayOfNull(field->type(), num_rows);
        if (!nulls.ok()) {
            return Status::InternalError("Failed to build null column " + field->name() + ": " +
                                         nulls.status().ToString());
        }
        *evolved = *nulls;
        return Status::OK();
    }
    if (column->type()->Equals(field->type())) {
        *evolved = column;
        return Status::OK();
    }
    auto cast = arrow::compute::Cast(*column, field->type());
    if (!cast.ok()) {
        return Status::InvalidArgument("Cannot evolve column " + field->name() + ": " +
                                       cast.status().ToString());
    }
    *evolved = *cast;
    return Status::OK();
}

Status ProjectRecordBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                          const std::shared_ptr<arrow::Schema>& target,
                          std::shared_ptr<arrow::RecordBatch>* projected) {
    if (!target || batch->schema()->Equals(*target)) {
        *projected = batch;
        return Status::OK();
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.reserve(target->num_fields());
    for (const auto& field : target->fields()) {
        std::shared_ptr<arrow::Array> column;
        auto status = EvolveColumn(batch->GetColumnByName(field->name()), field,
                                   batch->num_rows(), &column);
        if (!status.ok()) return status;
        columns.push_back(std::move(column));
    }
    *projected = arrow::RecordBatch::Make(target, batch->num_rows(), std::move(columns));
    return Status::OK();
}

} // namespace quarry
