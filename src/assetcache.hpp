#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

#include "filetree.hpp"
#include "result.hpp"

enum class AssetErrc {
    NotFound = 1, // missing, a directory or a stale tag
    Internal, // any other I/O failure. Details are logged, never returned to clients.
};

const std::error_category& assetCategory();
std::error_code make_error_code(AssetErrc e);

namespace std {
template <>
struct is_error_code_enum<AssetErrc> : true_type { };
}

struct FileInfo {
    // We assume the file is unchanged if mtime and size are the same.
    int64_t modTimeNs = 0;
    uint64_t size = 0;

    std::string tag;
    std::string contentType;

    bool matches(const FileStat& st) const;
};

// Maps a logical path to an entry that holds the most recent FileInfo for that path.
// The map lock is only taken to find or create entries. The FileInfo of an entry is swapped
// atomically as a whole, so readers never lock and never see a partially updated FileInfo.
// Entries are never removed, so references to them stay valid for the lifetime of the cache.
class FileInfoCache {
public:
    class Entry {
    public:
        // nullptr if nothing has been stored yet
        std::shared_ptr<const FileInfo> load() const;

        // Replaces the current value. With concurrent stores the last one wins.
        void store(FileInfo info);

    private:
        std::atomic<std::shared_ptr<const FileInfo>> info_;
    };

    FileInfoCache() = default;
    FileInfoCache(const FileInfoCache&) = delete;
    FileInfoCache& operator=(const FileInfoCache&) = delete;

    Entry* find(const std::string& path) const;
    Entry& getOrCreate(const std::string& path);

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

// An open file together with the FileInfo describing exactly that file. The file is positioned at
// the start.
struct Asset {
    FileInfo info;
    std::unique_ptr<File> content;
};

// Loads FileInfos from a file tree and caches them. Every instance has its own cache, so multiple
// instances over different trees never mix up their state.
// All member functions may be called concurrently.
class AssetServer {
public:
    struct Options {
        // Serve everything with "Cache-Control: no-cache" (e.g. for development)
        bool noCache = false;
    };

    explicit AssetServer(std::unique_ptr<FileTree> tree);
    AssetServer(std::unique_ptr<FileTree> tree, Options options);

    const Options& options() const;

    // Names are relative to the root of the file tree (no leading slash).
    // Fails with AssetErrc::NotFound for missing files and directories, and with
    // AssetErrc::Internal for every other error.
    Result<Asset> resolve(const std::string& name);

    // Like resolve, but doesn't open the file if the cached FileInfo is still valid.
    Result<FileInfo> lookup(const std::string& name);

    // Returns path with the tag of the file's current content inserted, e.g. for links in
    // templates. A leading slash is allowed and kept.
    Result<std::string> tag(std::string_view path);

    const FileInfoCache& cache() const;

private:
    Result<FileInfo> readInfo(const std::string& name, File& file, const FileStat& st) const;

    std::unique_ptr<FileTree> tree_;
    Options options_;
    FileInfoCache cache_;
};
