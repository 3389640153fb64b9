#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "tradebook/input/line_source.hpp"
#include "tradebook/storage/status.hpp"


namespace tradebook::input {

// -----------------------------------------------------------------------------
// Batch order file
// -----------------------------------------------------------------------------
// Yields the file's lines in order until end of file. open() must succeed
// before next() yields anything.
class FileSource {
public:
    explicit FileSource(std::filesystem::path path)
        : path_(std::move(path))
    {}

    [[nodiscard]] storage::Status open() {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) return storage::Status::NotFound;
        in_.open(path_);
        if (!in_.is_open()) return storage::Status::OpenFailed;
        return storage::Status::Ok;
    }

    [[nodiscard]] bool next(std::string& line) {
        if (!in_.is_open()) return false;
        if (!std::getline(in_, line)) return false;
        ++line_no_;
        return true;
    }

    // Stream went bad (I/O error) rather than reaching end of file
    [[nodiscard]] bool failed() const noexcept { return in_.bad(); }

    [[nodiscard]] std::size_t line_number() const noexcept { return line_no_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream         in_;
    std::size_t           line_no_{0};
};

static_assert(LineSource<FileSource>);

} // namespace tradebook::input
