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
 * Physical file naming
 *
 *   log file:   .<fileId>_<baseInstant>.log.<version>_<writeToken>
 *   base file:  <fileId>_<writeToken>_<instant>.arrow
 *
 * File ids and write tokens never contain '_'. The names alone are enough to
 * rebuild file groups and the physical order of log files from a listing.
 */

#pragma once

#include <string>

#include "quarry/status.h"

namespace quarry {

constexpr const char* kPartitionMetafile = ".quarry_partition_metadata";
constexpr const char* kBaseFileExtension = ".arrow";
constexpr const char* kLogFileInfix = ".log.";

struct LogFileName {
    std::string file_id;
    std::string base_instant;
    int version = 1;
    std::string write_token;
};

struct BaseFileName {
    std::string file_id;
    std::string write_token;
    std::string instant;
};

std::string MakeLogFileName(const std::string& file_id, const std::string& base_instant,
                            int version, const std::string& write_token);
std::string MakeBaseFileName(const std::string& file_id, const std::string& write_token,
                             const std::string& instant);

Status ParseLogFileName(const std::string& file_name, LogFileName* parsed);
Status ParseBaseFileName(const std::string& file_name, BaseFileName* parsed);

bool IsLogFileName(const std::string& file_name);
bool IsBaseFileName(const std::string& file_name);

} // namespace quarry
