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
 * Arrow Serialization Utilities
 *
 * Data blocks carry one RecordBatch encoded as an Arrow IPC stream. Base files
 * are Arrow IPC files (random-access format) holding any number of batches.
 */

#pragma once

#include <memory>
#include <string>
#include <arrow/api.h>
#include <arrow/ipc/api.h>
#include <arrow/io/api.h>
#include "quarry/file_system.h"
#include "quarry/status.h"

namespace quarry {

/**
 * @brief Serialize an Arrow RecordBatch to bytes using the Arrow IPC stream format
 *
 * @param batch RecordBatch to serialize (must not be null)
 * @param serialized_data Output string to receive serialized bytes
 * @return Status OK if successful, error otherwise
 */
Status SerializeArrowBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                          std::string* serialized_data);

/**
 * @brief Deserialize an Arrow RecordBatch from Arrow IPC stream bytes
 *
 * @param data Pointer to serialized data
 * @param size Size of serialized data in bytes
 * @param batch Output pointer to receive deserialized RecordBatch
 * @return Status OK if successful, error otherwise
 */
Status DeserializeArrowBatch(const void* data, size_t size,
                           std::shared_ptr<arrow::RecordBatch>* batch);

Status DeserializeArrowBatch(const std::string& data,
                           std::shared_ptr<arrow::RecordBatch>* batch);

/**
 * @brief Write a table as an Arrow IPC file through the given FileSystem
 *
 * Used for base files. Overwrites any existing file at path.
 */
Status WriteArrowFile(FileSystem* fs, const std::string& path,
                      const std::shared_ptr<arrow::Table>& table);

/**
 * @brief Read a whole Arrow IPC file into a table
 */
Status ReadArrowFile(FileSystem* fs, const std::string& path,
                     std::shared_ptr<arrow::Table>* table);

/**
 * @brief Evolve one column to the type of a target field
 *
 * A null column becomes an all-null array of num_rows. A column of another
 * type is cast; a failed cast is InvalidArgument.
 */
Status EvolveColumn(const std::shared_ptr<arrow::Array>& column,
                    const std::shared_ptr<arrow::Field>& field, int64_t num_rows,
                    std::shared_ptr<arrow::Array>* evolved);

// Reorder, fill and cast the columns of batch to match target, by field name.
Status ProjectRecordBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                          const std::shared_ptr<arrow::Schema>& target,
                          std::shared_ptr<arrow::RecordBatch>* projected);

} // namespace quarry
