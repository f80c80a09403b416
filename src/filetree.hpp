#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "fd.hpp"
#include "result.hpp"

struct FileStat {
    uint64_t size = 0;
    int64_t modTimeNs = 0; // nanoseconds since the unix epoch
    bool isDirectory = false;
};

class File {
public:
    virtual ~File() = default;

    virtual Result<FileStat> stat() const = 0;

    // Returns 0 at the end of the file
    virtual Result<size_t> read(void* buffer, size_t len) = 0;

    // Absolute offset from the start of the file. Returns the new offset.
    virtual Result<uint64_t> seek(uint64_t offset) = 0;
};

// Read-only tree of named files. Names are slash-separated, relative to the root of the tree and
// must satisfy isValidName, otherwise lookups fail with no_such_file_or_directory.
// Every error is a std::error_code in the generic category, so callers can compare against
// std::errc.
class FileTree {
public:
    virtual ~FileTree() = default;

    virtual Result<FileStat> stat(const std::string& name) const = 0;
    virtual Result<std::unique_ptr<File>> open(const std::string& name) const = 0;
};

// Like Go's fs.ValidPath: no leading or trailing slash, no empty, "." or ".." elements.
// The single name "." refers to the root.
bool isValidName(std::string_view name);

bool isNotFound(const std::error_code& ec);

class DirFileTree : public FileTree {
public:
    DirFileTree(std::string root);

    const std::string& root() const;

    Result<FileStat> stat(const std::string& name) const override;
    Result<std::unique_ptr<File>> open(const std::string& name) const override;

private:
    std::string resolve(const std::string& name) const;

    std::string root_;
};

class FdFile : public File {
public:
    FdFile(Fd fd);

    Result<FileStat> stat() const override;
    Result<size_t> read(void* buffer, size_t len) override;
    Result<uint64_t> seek(uint64_t offset) override;

private:
    Fd fd_;
};
