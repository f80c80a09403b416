#include "testutil.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fcntl.h>
#include <openssl/evp.h>
#include <sys/stat.h>

#include "tagcodec.hpp"

namespace fs = std::filesystem;

std::string hashTag(std::string_view content)
{
    std::array<uint8_t, EVP_MAX_MD_SIZE> digest;
    unsigned int digestSize = 0;
    if (EVP_Digest(content.data(), content.size(), digest.data(), &digestSize, EVP_sha256(),
            nullptr)
        != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return makeTag(digest.data(), digestSize);
}

TempDir::TempDir()
{
    auto tmpl = (fs::temp_directory_path() / "tagserve-test-XXXXXX").string();
    if (!::mkdtemp(tmpl.data())) {
        throw std::runtime_error("Could not create temporary directory");
    }
    path_ = tmpl;
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

const std::string& TempDir::path() const
{
    return path_;
}

void TempDir::write(const std::string& name, std::string_view content) const
{
    const auto path = fs::path(path_) / name;
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw std::runtime_error("Could not write " + path.string());
    }
}

void TempDir::replace(
    const std::string& name, std::string_view content, std::optional<int64_t> unixSeconds) const
{
    const auto tmpName = name + ".tmp";
    write(tmpName, content);
    if (unixSeconds) {
        setModTime(tmpName, *unixSeconds);
    }
    fs::rename(fs::path(path_) / tmpName, fs::path(path_) / name);
}

void TempDir::mkdir(const std::string& name) const
{
    fs::create_directories(fs::path(path_) / name);
}

void TempDir::setModTime(const std::string& name, int64_t unixSeconds) const
{
    const auto path = (fs::path(path_) / name).string();
    const ::timespec times[2] = { { static_cast<time_t>(unixSeconds), 0 },
        { static_cast<time_t>(unixSeconds), 0 } };
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        throw std::runtime_error("Could not set modification time of " + path);
    }
}

namespace {
class MemoryFile : public File {
public:
    MemoryFile(std::shared_ptr<const std::string> content, int64_t modTimeNs,
        std::optional<std::error_code> readError)
        : content_(std::move(content))
        , modTimeNs_(modTimeNs)
        , readError_(readError)
    {
    }

    Result<FileStat> stat() const override
    {
        return FileStat { content_->size(), modTimeNs_, false };
    }

    Result<size_t> read(void* buffer, size_t len) override
    {
        if (readError_) {
            return error(*readError_);
        }
        const auto n = std::min(len, content_->size() - std::min(pos_, content_->size()));
        std::memcpy(buffer, content_->data() + pos_, n);
        pos_ += n;
        return n;
    }

    Result<uint64_t> seek(uint64_t offset) override
    {
        pos_ = offset;
        return pos_;
    }

private:
    std::shared_ptr<const std::string> content_;
    int64_t modTimeNs_;
    std::optional<std::error_code> readError_;
    size_t pos_ = 0;
};
}

void MemoryFileTree::set(const std::string& name, std::string content, int64_t modTimeNs)
{
    std::lock_guard lock(mutex_);
    entries_[name] = Entry { std::make_shared<const std::string>(std::move(content)), modTimeNs };
}

void MemoryFileTree::mkdir(const std::string& name)
{
    std::lock_guard lock(mutex_);
    entries_[name] = Entry { std::make_shared<const std::string>(), 0, true };
}

void MemoryFileTree::remove(const std::string& name)
{
    std::lock_guard lock(mutex_);
    entries_.erase(name);
}

void MemoryFileTree::setStatError(std::optional<std::error_code> ec)
{
    std::lock_guard lock(mutex_);
    statError_ = ec;
}

void MemoryFileTree::setOpenError(std::optional<std::error_code> ec)
{
    std::lock_guard lock(mutex_);
    openError_ = ec;
}

void MemoryFileTree::setReadError(std::optional<std::error_code> ec)
{
    std::lock_guard lock(mutex_);
    readError_ = ec;
}

size_t MemoryFileTree::numStats() const
{
    return numStats_.load();
}

size_t MemoryFileTree::numOpens() const
{
    return numOpens_.load();
}

Result<FileStat> MemoryFileTree::stat(const std::string& name) const
{
    numStats_++;
    std::lock_guard lock(mutex_);
    if (statError_) {
        return error(*statError_);
    }
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return error(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return FileStat { it->second.content->size(), it->second.modTimeNs, it->second.isDirectory };
}

Result<std::unique_ptr<File>> MemoryFileTree::open(const std::string& name) const
{
    numOpens_++;
    std::lock_guard lock(mutex_);
    if (openError_) {
        return error(*openError_);
    }
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return error(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (it->second.isDirectory) {
        return error(std::make_error_code(std::errc::is_a_directory));
    }
    return std::unique_ptr<File>(
        std::make_unique<MemoryFile>(it->second.content, it->second.modTimeNs, readError_));
}

TestRequest::TestRequest(std::string_view method, std::string_view target,
    const std::vector<std::pair<std::string, std::string>>& headers)
{
    raw.append(method);
    raw.append(" ");
    raw.append(target);
    raw.append(" HTTP/1.1\r\nHost: localhost\r\n");
    for (const auto& [name, value] : headers) {
        raw.append(name + ": " + value + "\r\n");
    }
    raw.append("\r\n");
    auto parsed = Request::parse(raw);
    if (!parsed) {
        throw std::runtime_error("Invalid test request: " + raw);
    }
    request = std::move(*parsed);
}
