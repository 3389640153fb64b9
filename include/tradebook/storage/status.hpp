#pragma once

#include <cstdint>


namespace tradebook {
namespace storage {

// Status codes for storage operations
enum class Status : uint8_t {
    Ok = 0,
    NotFound,         // File does not exist
    OpenFailed,       // File exists but could not be opened
    ReadFailed,       // I/O error while reading
    WriteFailed,      // I/O error while writing the temporary file
    RenameFailed,     // Temporary file could not replace the target
    MalformedRecord   // A line does not match the expected record shape
};

// to_string for Status
static inline const char* to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok: return "Ok";
        case Status::NotFound: return "Not Found";
        case Status::OpenFailed: return "Open Failed";
        case Status::ReadFailed: return "Read Failed";
        case Status::WriteFailed: return "Write Failed";
        case Status::RenameFailed: return "Rename Failed";
        case Status::MalformedRecord: return "Malformed Record";
        default: return "Unknown Status";
    }
}

} // namespace storage
} // namespace tradebook
