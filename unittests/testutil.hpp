#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "filetree.hpp"
#include "http.hpp"

// SHA-256 based tag of content, computed independently of AssetServer
std::string hashTag(std::string_view content);

// A directory below the system temp directory that is removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const;

    // Creates parent directories as needed
    void write(const std::string& name, std::string_view content) const;
    // Writes to a new file and renames it over name, so open handles keep the old content.
    // The modification time is set before the rename.
    void replace(const std::string& name, std::string_view content,
        std::optional<int64_t> unixSeconds = std::nullopt) const;
    void mkdir(const std::string& name) const;
    void setModTime(const std::string& name, int64_t unixSeconds) const;

private:
    std::string path_;
};

// In-memory FileTree that counts calls and can be told to fail
class MemoryFileTree : public FileTree {
public:
    void set(const std::string& name, std::string content, int64_t modTimeNs = 1'000'000'000);
    void mkdir(const std::string& name);
    void remove(const std::string& name);

    // Errors returned by every following call (until reset with std::nullopt)
    void setStatError(std::optional<std::error_code> ec);
    void setOpenError(std::optional<std::error_code> ec);
    void setReadError(std::optional<std::error_code> ec);

    size_t numStats() const;
    size_t numOpens() const;

    Result<FileStat> stat(const std::string& name) const override;
    Result<std::unique_ptr<File>> open(const std::string& name) const override;

private:
    struct Entry {
        std::shared_ptr<const std::string> content;
        int64_t modTimeNs = 0;
        bool isDirectory = false;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::optional<std::error_code> statError_;
    std::optional<std::error_code> openError_;
    std::optional<std::error_code> readError_;
    mutable std::atomic<size_t> numStats_ { 0 };
    mutable std::atomic<size_t> numOpens_ { 0 };
};

// Request only references the string it was parsed from, so the two are kept together here.
// Not copyable or movable for the same reason.
struct TestRequest {
    TestRequest(std::string_view method, std::string_view target,
        const std::vector<std::pair<std::string, std::string>>& headers = {});

    TestRequest(const TestRequest&) = delete;
    TestRequest& operator=(const TestRequest&) = delete;

    std::string raw;
    Request request;
};
