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

#include <string>

namespace quarry {

enum class StatusCode {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kIoError = 3,
    kInvalidArgument = 4,
    kAborted = 5,
    kResourceExhausted = 6,
    kNotImplemented = 7,
    kNotSupported = 8,
    kAlreadyExists = 9,
    kInternalError = 10,
};

class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code) : code_(code) {}
    Status(StatusCode code, const std::string& message)
        : code_(code), message_(message) {}

    static Status OK() { return Status(); }
    static Status NotFound(const std::string& message = "") {
        return Status(StatusCode::kNotFound, message);
    }
    static Status Corruption(const std::string& message = "") {
        return Status(StatusCode::kCorruption, message);
    }
    static Status IOError(const std::string& message = "") {
        return Status(StatusCode::kIoError, message);
    }
    static Status InvalidArgument(const std::string& message = "") {
        return Status(StatusCode::kInvalidArgument, message);
    }
    static Status Aborted(const std::string& message = "") {
        return Status(StatusCode::kAborted, message);
    }

    static Status ResourceExhausted(const std::string& message = "") {
        return Status(StatusCode::kResourceExhausted, message);
    }

    static Status NotImplemented(const std::string& message = "") {
        return Status(StatusCode::kNotImplemented, message);
    }
    // Raised for block or command types this reader does not understand.
    static Status NotSupported(const std::string& message = "") {
        return Status(StatusCode::kNotSupported, message);
    }
    static Status AlreadyExists(const std::string& message = "") {
        return Status(StatusCode::kAlreadyExists, message);
    }
    static Status InternalError(const std::string& message = "") {
        return Status(StatusCode::kInternalError, message);
    }

    bool ok() const { return code_ == StatusCode::kOk; }
    bool IsNotFound() const { return code_ == StatusCode::kNotFound; }
    bool IsCorruption() const { return code_ == StatusCode::kCorruption; }
    bool IsIOError() const { return code_ == StatusCode::kIoError; }
    bool IsInvalidArgument() const { return code_ == StatusCode::kInvalidArgument; }
    bool IsNotSupported() const { return code_ == StatusCode::kNotSupported; }
    bool IsAlreadyExists() const { return code_ == StatusCode::kAlreadyExists; }
    bool IsInternalError() const { return code_ == StatusCode::kInternalError; }
    bool IsAborted() const { return code_ == StatusCode::kAborted; }

    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    StatusCode code_;
    std::string message_;
};

inline std::string Status::ToString() const {
    std::string result;
    switch (code_) {
        case StatusCode::kOk:
            result = "OK";
            break;
        case StatusCode::kNotFound:
            result = "NotFound";
            break;
        case StatusCode::kCorruption:
            result = "Corruption";
            break;
        case StatusCode::kIoError:
            result = "IOError";
            break;
        case StatusCode::kInvalidArgument:
            result = "InvalidArgument";
            break;
        case StatusCode::kAborted:
            result = "Aborted";
            break;
        case StatusCode::kResourceExhausted:
            result = "ResourceExhausted";
            break;
        case StatusCode::kNotImplemented:
            result = "NotImplemented";
            break;
        case StatusCode::kNotSupported:
            result = "NotSupported";
            break;
        case StatusCode::kAlreadyExists:
            result = "AlreadyExists";
            break;
        case StatusCode::kInternalError:
            result = "InternalError";
            break;
    }

    if (!message_.empty()) {
        result += ": " + message_;
    }

    return result;
}

} // namespace quarry
