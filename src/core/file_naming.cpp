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

#include "quarry/file_naming.h"

#include <cstring>
#include <stdexcept>

namespace quarry {

std::string MakeLogFileName(const std::string& file_id, const std::string& base_instant,
                            int version, const std::string& write_token) {
    return "." + file_id + "_" + base_instant + kLogFileInfix + std::to_string(version) +
           "_" + write_token;
}

std::string MakeBaseFileName(const std::string& file_id, const std::string& write_token,
                             const std::string& instant) {
    return file_id + "_" + write_token + "_" + instant + kBaseFileExtension;
}

Status ParseLogFileName(const std::string& file_name, LogFileName* parsed) {
    if (file_name.size() < 2 || file_name[0] != '.') {
        return Status::InvalidArgument("Not a log file: " + file_name);
    }
    auto infix = file_name.find(kLogFileInfix);
    if (infix == std::string::npos) {
        return Status::InvalidArgument("Not a log file: " + file_name);
    }

    std::string head = file_name.substr(1, infix - 1);
    std::string tail = file_name.substr(infix + std::strlen(kLogFileInfix));

    auto head_sep = head.rfind('_');
    auto tail_sep = tail.find('_');
    if (head_sep == std::string::npos || head_sep == 0 || head_sep + 1 >= head.size() ||
        tail_sep == std::string::npos || tail_sep == 0 || tail_sep + 1 >= tail.size()) {
        return Status::InvalidArgument("Malformed log file name: " + file_name);
    }

    LogFileName result;
    result.file_id = head.substr(0, head_sep);
    result.base_instant = head.substr(head_sep + 1);
    result.write_token = tail.substr(tail_sep + 1);
    try {
        size_t consumed = 0;
        std::string version = tail.substr(0, tail_sep);
        result.version = std::stoi(version, &consumed);
        if (consumed != version.size()) {
            return Status::InvalidArgument("Malformed log version in " + file_name);
        }
    } catch (const std::exception& e) {
        return Status::InvalidArgument("Malformed log version in " + file_name + ": " + e.what());
    }

    *parsed = std::move(result);
    return Status::OK();
}

Status ParseBaseFileName(const std::string& file_name, BaseFileName* parsed) {
    size_t ext_len = std::strlen(kBaseFileExtension);
    if (file_name.size() <= ext_len || file_name[0] == '.' ||
        file_name.compare(file_name.size() - ext_len, ext_len, kBaseFileExtension) != 0) {
        return Status::InvalidArgument("Not a base file: " + file_name);
    }

    std::string stem = file_name.substr(0, file_name.size() - ext_len);
    auto last = stem.rfind('_');
    if (last == std::string::npos || last == 0 || last + 1 >= stem.size()) {
        return Status::InvalidArgument("Malformed base file name: " + file_name);
    }
    auto middle = stem.rfind('_', last - 1);
    if (middle == std::string::npos || middle == 0 || middle + 1 >= last) {
        return Status::InvalidArgument("Malformed base file name: " + file_name);
    }

    parsed->file_id = stem.substr(0, middle);
    parsed->write_token = stem.substr(middle + 1, last - middle - 1);
    parsed->instant = stem.substr(last + 1);
    return Status::OK();
}

bool IsLogFileName(const std::string& file_name) {
    LogFileName parsed;
    return ParseLogFileName(file_name, &parsed).ok();
}

bool IsBaseFileName(const std::string& file_name) {
    BaseFileName parsed;
    return ParseBaseFileName(file_name, &parsed).ok();
}

} // namespace quarry
