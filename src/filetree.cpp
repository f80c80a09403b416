#include "filetree.hpp"

#include <cerrno>

#include <sys/stat.h>
#include <unistd.h>

#include "string.hpp"

namespace {
FileStat toFileStat(const struct ::stat& st)
{
    FileStat fs;
    fs.size = static_cast<uint64_t>(st.st_size);
    fs.modTimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000
        + static_cast<int64_t>(st.st_mtim.tv_nsec);
    fs.isDirectory = S_ISDIR(st.st_mode);
    return fs;
}

ErrorWrapper<std::error_code> notFound()
{
    return error(std::make_error_code(std::errc::no_such_file_or_directory));
}
}

bool isValidName(std::string_view name)
{
    if (name == ".") {
        return true;
    }
    if (name.empty()) {
        return false;
    }
    for (const auto elem : split(name, '/')) {
        if (elem.empty() || elem == "." || elem == "..") {
            return false;
        }
        if (elem.find('\0') != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

bool isNotFound(const std::error_code& ec)
{
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

DirFileTree::DirFileTree(std::string root)
    : root_(std::move(root))
{
    if (root_.empty()) {
        root_ = ".";
    }
}

const std::string& DirFileTree::root() const
{
    return root_;
}

std::string DirFileTree::resolve(const std::string& name) const
{
    return name == "." ? root_ : pathJoin(root_, name);
}

Result<FileStat> DirFileTree::stat(const std::string& name) const
{
    if (!isValidName(name)) {
        return notFound();
    }
    struct ::stat st;
    if (::stat(resolve(name).c_str(), &st) != 0) {
        return errnoError();
    }
    return toFileStat(st);
}

Result<std::unique_ptr<File>> DirFileTree::open(const std::string& name) const
{
    if (!isValidName(name)) {
        return notFound();
    }
    auto fd = openReadOnly(resolve(name));
    if (!fd) {
        return error(fd.error());
    }
    return std::unique_ptr<File>(std::make_unique<FdFile>(std::move(*fd)));
}

FdFile::FdFile(Fd fd)
    : fd_(std::move(fd))
{
}

Result<FileStat> FdFile::stat() const
{
    struct ::stat st;
    if (::fstat(fd_, &st) != 0) {
        return errnoError();
    }
    return toFileStat(st);
}

Result<size_t> FdFile::read(void* buffer, size_t len)
{
    return readSome(fd_, buffer, len);
}

Result<uint64_t> FdFile::seek(uint64_t offset)
{
    const auto res = ::lseek(fd_, static_cast<::off_t>(offset), SEEK_SET);
    if (res == -1) {
        return errnoError();
    }
    return static_cast<uint64_t>(res);
}
