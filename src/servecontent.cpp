#include "servecontent.hpp"

#include <algorithm>
#include <string>

#include "httpdate.hpp"
#include "log.hpp"
#include "mimetypes.hpp"
#include "string.hpp"

namespace {
enum class Precondition { Pass, NotModified, Failed };

// Returns the entity tag at the start of str (including the quotes and a possible "W/" prefix)
// and the rest of the string.
std::optional<std::pair<std::string_view, std::string_view>> scanETag(std::string_view str)
{
    str = httpTrim(str);
    const size_t start = startsWith(str, "W/") ? 2 : 0;
    if (str.size() < start + 2 || str[start] != '"') {
        return std::nullopt;
    }
    for (size_t i = start + 1; i < str.size(); ++i) {
        const auto c = static_cast<unsigned char>(str[i]);
        if (c == '"') {
            return std::pair { str.substr(0, i + 1), str.substr(i + 1) };
        }
        // etagc = %x21 / %x23-7E / obs-text
        if (c < 0x21 || c == 0x7f) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool strongMatch(std::string_view a, std::string_view b)
{
    return a == b && !a.empty() && a[0] == '"';
}

bool weakMatch(std::string_view a, std::string_view b)
{
    if (startsWith(a, "W/")) {
        a.remove_prefix(2);
    }
    if (startsWith(b, "W/")) {
        b.remove_prefix(2);
    }
    return !a.empty() && a == b;
}

// list is "*" or a comma-separated list of entity tags
bool etagListMatches(std::string_view list, std::string_view etag, bool strong)
{
    list = httpTrim(list);
    if (list == "*") {
        // We only get here for files that exist
        return true;
    }
    while (!list.empty()) {
        if (list.front() == ',' || isHttpWhitespace(list.front())) {
            list.remove_prefix(1);
            continue;
        }
        const auto res = scanETag(list);
        if (!res) {
            return false;
        }
        if (strong ? strongMatch(res->first, etag) : weakMatch(res->first, etag)) {
            return true;
        }
        list = res->second;
    }
    return false;
}

// RFC7232, 6: Precedence
// modTime is in seconds (HTTP dates have no finer resolution) and 0 if unknown.
Precondition checkPreconditions(const Request& request, std::string_view etag, int64_t modTime)
{
    const auto& headers = request.headers;
    if (const auto ifMatch = headers.get("If-Match")) {
        if (!etagListMatches(*ifMatch, etag, true)) {
            return Precondition::Failed;
        }
    } else if (const auto ius = headers.get("If-Unmodified-Since"); ius && modTime > 0) {
        const auto date = parseHttpDate(*ius);
        if (date && modTime > *date) {
            return Precondition::Failed;
        }
    }

    const auto getOrHead = request.method == Method::Get || request.method == Method::Head;
    if (const auto ifNoneMatch = headers.get("If-None-Match")) {
        if (etagListMatches(*ifNoneMatch, etag, false)) {
            return getOrHead ? Precondition::NotModified : Precondition::Failed;
        }
    } else if (const auto ims = headers.get("If-Modified-Since"); ims && getOrHead) {
        const auto date = parseHttpDate(*ims);
        if (date && modTime > 0 && modTime <= *date) {
            return Precondition::NotModified;
        }
    }
    return Precondition::Pass;
}

// Whether the Range header should be honored
bool checkIfRange(const Request& request, std::string_view etag, int64_t modTime)
{
    const auto ifRange = request.headers.get("If-Range");
    if (!ifRange) {
        return true;
    }
    const auto value = httpTrim(*ifRange);
    if (startsWith(value, "\"") || startsWith(value, "W/")) {
        const auto res = scanETag(value);
        return res && httpTrim(res->second).empty() && strongMatch(res->first, etag);
    }
    // An HTTP date must be an exact match (RFC7233, 3.2)
    const auto date = parseHttpDate(value);
    return date && modTime > 0 && *date == modTime;
}

void setStatusBody(Response& response, StatusCode status)
{
    response.status = status;
    response.body = std::to_string(static_cast<int>(status)) + " "
        + std::string(getReasonPhrase(status));
    response.headers.set("Content-Type", "text/plain; charset=utf-8");
    response.headers.remove("Content-Length");
}

// Reads until len bytes were read or the end of the file is reached
Result<size_t> readFull(File& file, char* buffer, size_t len)
{
    size_t offset = 0;
    while (offset < len) {
        const auto n = file.read(buffer + offset, len - offset);
        if (!n) {
            return error(n.error());
        }
        if (*n == 0) {
            break;
        }
        offset += *n;
    }
    return offset;
}

void internalError(Response& response, std::string_view name, std::string_view op,
    const std::error_code& ec)
{
    slog::error("Could not ", op, " '", name, "': ", ec.message());
    response = statusResponse(StatusCode::InternalServerError);
}
}

RangeResult parseRange(std::string_view header, uint64_t size, ByteRange& range)
{
    header = httpTrim(header);
    if (header.empty()) {
        return RangeResult::None;
    }
    constexpr std::string_view unit = "bytes=";
    if (!startsWith(header, unit)) {
        return RangeResult::Invalid;
    }
    const auto rangeSpec = httpTrim(header.substr(unit.size()));
    if (rangeSpec.find(',') != std::string_view::npos) {
        return RangeResult::Invalid;
    }
    const auto dash = rangeSpec.find('-');
    if (dash == std::string_view::npos) {
        return RangeResult::Invalid;
    }
    const auto first = httpTrim(rangeSpec.substr(0, dash));
    const auto last = httpTrim(rangeSpec.substr(dash + 1));

    if (first.empty()) {
        // suffix-byte-range-spec: the last n bytes
        const auto n = parseInt<uint64_t>(last);
        if (!n) {
            return RangeResult::Invalid;
        }
        if (*n == 0 || size == 0) {
            return RangeResult::Unsatisfiable;
        }
        const auto length = std::min(*n, size);
        range = ByteRange { size - length, length };
        return RangeResult::Valid;
    }

    const auto start = parseInt<uint64_t>(first);
    if (!start) {
        return RangeResult::Invalid;
    }
    uint64_t end = size > 0 ? size - 1 : 0;
    if (!last.empty()) {
        const auto lastPos = parseInt<uint64_t>(last);
        if (!lastPos || *lastPos < *start) {
            return RangeResult::Invalid;
        }
        end = std::min(end, *lastPos);
    }
    if (*start >= size) {
        return RangeResult::Unsatisfiable;
    }
    range = ByteRange { *start, end - *start + 1 };
    return RangeResult::Valid;
}

void serveContent(const Request& request, Response& response, std::string_view name,
    int64_t modTimeNs, File& file, bool detectContentType)
{
    const auto st = file.stat();
    if (!st) {
        internalError(response, name, "stat", st.error());
        return;
    }
    const auto size = st->size;

    const auto modTime = modTimeNs / 1'000'000'000;
    if (modTime > 0) {
        if (const auto date = formatHttpDate(modTime)) {
            response.headers.set("Last-Modified", *date);
        }
    }

    const auto etag = std::string(response.headers.get("ETag").value_or(""));
    switch (checkPreconditions(request, etag, modTime)) {
    case Precondition::NotModified:
        // RFC7232, 4.1: Only headers relevant for caching
        response.status = StatusCode::NotModified;
        response.headers.remove("Content-Type");
        response.headers.remove("Content-Length");
        response.headers.remove("Last-Modified");
        response.body.clear();
        return;
    case Precondition::Failed:
        setStatusBody(response, StatusCode::PreconditionFailed);
        return;
    case Precondition::Pass:
        break;
    }

    if (!response.headers.contains("Content-Type")) {
        if (const auto type = getMimeTypeByExtension(getExtension(name))) {
            response.headers.set("Content-Type", *type);
        } else if (detectContentType) {
            std::string buffer(sniffLength, '\0');
            const auto n = readFull(file, buffer.data(), buffer.size());
            if (!n) {
                internalError(response, name, "read", n.error());
                return;
            }
            buffer.resize(*n);
            if (const auto res = file.seek(0); !res) {
                internalError(response, name, "seek", res.error());
                return;
            }
            response.headers.set("Content-Type", sniffContentType(buffer));
        }
    }

    response.headers.set("Accept-Ranges", "bytes");

    auto range = ByteRange { 0, size };
    const auto rangeHeader = request.headers.get("Range");
    if (rangeHeader && checkIfRange(request, etag, modTime)) {
        ByteRange requested { 0, 0 };
        switch (parseRange(*rangeHeader, size, requested)) {
        case RangeResult::Unsatisfiable:
            setStatusBody(response, StatusCode::RangeNotSatisfiable);
            response.headers.set("Content-Range", "bytes */" + std::to_string(size));
            return;
        case RangeResult::Valid:
            range = requested;
            response.status = StatusCode::PartialContent;
            response.headers.set("Content-Range",
                "bytes " + std::to_string(range.offset) + "-"
                    + std::to_string(range.offset + range.length - 1) + "/"
                    + std::to_string(size));
            break;
        case RangeResult::None:
        case RangeResult::Invalid:
            break;
        }
    }

    response.headers.set("Content-Length", std::to_string(range.length));
    if (request.method == Method::Head) {
        response.body.clear();
        return;
    }

    if (range.offset > 0) {
        if (const auto res = file.seek(range.offset); !res) {
            internalError(response, name, "seek", res.error());
            return;
        }
    }
    response.body.resize(range.length);
    const auto n = readFull(file, response.body.data(), range.length);
    if (!n) {
        internalError(response, name, "read", n.error());
        return;
    }
    if (*n != range.length) {
        // The file was truncated after it was opened
        slog::error("Short read on '", name, "': ", *n, " of ", range.length, " bytes");
        response = statusResponse(StatusCode::InternalServerError);
        return;
    }
}
