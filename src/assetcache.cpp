#include "assetcache.hpp"

#include <algorithm>
#include <array>
#include <mutex>

#include <openssl/evp.h>

#include "log.hpp"
#include "mimetypes.hpp"
#include "tagcodec.hpp"

namespace {
class AssetCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "asset"; }

    std::string message(int ev) const override
    {
        switch (static_cast<AssetErrc>(ev)) {
        case AssetErrc::NotFound:
            return "not found";
        case AssetErrc::Internal:
            return "internal error";
        default:
            return "unknown asset error";
        }
    }
};

template <typename T, typename F>
auto makeUnique(T* ptr, F deleter)
{
    return std::unique_ptr<T, F>(ptr, deleter);
}

// OS errors end here. Not-found errors are expected (stale links, crawlers), everything else
// means something is wrong with the server and is logged, but only as a generic error upward.
ErrorWrapper<std::error_code> translateError(
    std::string_view op, const std::string& name, const std::error_code& ec)
{
    if (ec.category() == assetCategory()) {
        return error(ec);
    }
    if (isNotFound(ec)) {
        slog::debug("Could not ", op, " '", name, "': ", ec.message());
        return error(make_error_code(AssetErrc::NotFound));
    }
    slog::error("Could not ", op, " '", name, "': ", ec.message());
    return error(make_error_code(AssetErrc::Internal));
}
}

const std::error_category& assetCategory()
{
    static AssetCategory category;
    return category;
}

std::error_code make_error_code(AssetErrc e)
{
    return std::error_code(static_cast<int>(e), assetCategory());
}

bool FileInfo::matches(const FileStat& st) const
{
    return size == st.size && modTimeNs == st.modTimeNs;
}

std::shared_ptr<const FileInfo> FileInfoCache::Entry::load() const
{
    return info_.load();
}

void FileInfoCache::Entry::store(FileInfo info)
{
    info_.store(std::make_shared<const FileInfo>(std::move(info)));
}

FileInfoCache::Entry* FileInfoCache::find(const std::string& path) const
{
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : it->second.get();
}

FileInfoCache::Entry& FileInfoCache::getOrCreate(const std::string& path)
{
    if (const auto entry = find(path)) {
        return *entry;
    }
    std::unique_lock lock(mutex_);
    // Someone else might have created it in the meantime
    auto& entry = entries_[path];
    if (!entry) {
        entry = std::make_unique<Entry>();
    }
    return *entry;
}

size_t FileInfoCache::size() const
{
    std::shared_lock lock(mutex_);
    return entries_.size();
}

AssetServer::AssetServer(std::unique_ptr<FileTree> tree)
    : AssetServer(std::move(tree), Options {})
{
}

AssetServer::AssetServer(std::unique_ptr<FileTree> tree, Options options)
    : tree_(std::move(tree))
    , options_(options)
{
}

const AssetServer::Options& AssetServer::options() const
{
    return options_;
}

const FileInfoCache& AssetServer::cache() const
{
    return cache_;
}

Result<Asset> AssetServer::resolve(const std::string& name)
{
    const auto st = tree_->stat(name);
    if (!st) {
        return translateError("stat", name, st.error());
    }
    if (st->isDirectory) {
        slog::debug("'", name, "' is a directory");
        return error(make_error_code(AssetErrc::NotFound));
    }

    auto file = tree_->open(name);
    if (!file) {
        return translateError("open", name, file.error());
    }

    // The file might have been replaced by a directory since the stat above
    const auto fst = (*file)->stat();
    if (!fst) {
        return translateError("stat", name, fst.error());
    }
    if (fst->isDirectory) {
        slog::debug("'", name, "' is a directory");
        return error(make_error_code(AssetErrc::NotFound));
    }

    auto& entry = cache_.getOrCreate(name);
    if (const auto cached = entry.load(); cached && cached->matches(*fst)) {
        return Asset { *cached, std::move(*file) };
    }

    // The info doesn't match. Reload it from the file we opened (not by name!), so the info
    // always describes the content we are going to serve.
    auto info = readInfo(name, **file, *fst);
    if (!info) {
        return error(info.error());
    }
    if (const auto res = (*file)->seek(0); !res) {
        return translateError("seek", name, res.error());
    }
    slog::debug("Loaded '", name, "': tag ", info->tag, ", ", info->size, " bytes, ",
        info->contentType);
    entry.store(*info);
    return Asset { std::move(*info), std::move(*file) };
}

Result<FileInfo> AssetServer::lookup(const std::string& name)
{
    const auto st = tree_->stat(name);
    if (!st) {
        return translateError("stat", name, st.error());
    }
    if (st->isDirectory) {
        return error(make_error_code(AssetErrc::NotFound));
    }

    // This is the path that generating many links in a single page takes
    if (const auto entry = cache_.find(name)) {
        if (const auto cached = entry->load(); cached && cached->matches(*st)) {
            return *cached;
        }
    }

    auto asset = resolve(name);
    if (!asset) {
        return error(asset.error());
    }
    return std::move(asset->info);
}

Result<std::string> AssetServer::tag(std::string_view path)
{
    auto name = path;
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }
    const auto info = lookup(std::string(name));
    if (!info) {
        return error(info.error());
    }
    return insertTag(path, info->tag);
}

Result<FileInfo> AssetServer::readInfo(
    const std::string& name, File& file, const FileStat& st) const
{
    FileInfo info;
    info.modTimeNs = st.modTimeNs;
    info.size = st.size;

    const auto ctx = makeUnique(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        slog::error("Could not initialize SHA-256 digest");
        return error(make_error_code(AssetErrc::Internal));
    }

    // Only sniff if the extension doesn't tell us already
    const auto typeByExtension = getMimeTypeByExtension(getExtension(name));
    std::string sniffBuffer;

    std::array<char, 16 * 1024> buffer;
    while (true) {
        const auto n = file.read(buffer.data(), buffer.size());
        if (!n) {
            return translateError("read", name, n.error());
        }
        if (*n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), *n) != 1) {
            slog::error("Could not update SHA-256 digest");
            return error(make_error_code(AssetErrc::Internal));
        }
        if (!typeByExtension && sniffBuffer.size() < sniffLength) {
            const auto take = std::min(*n, sniffLength - sniffBuffer.size());
            sniffBuffer.append(buffer.data(), take);
        }
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> digest;
    unsigned int digestSize = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestSize) != 1) {
        slog::error("Could not finalize SHA-256 digest");
        return error(make_error_code(AssetErrc::Internal));
    }

    info.tag = makeTag(digest.data(), digestSize);
    info.contentType = typeByExtension ? *typeByExtension : sniffContentType(sniffBuffer);
    return info;
}
