#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "filetree.hpp"
#include "http.hpp"

struct ByteRange {
    uint64_t offset;
    uint64_t length;
};

enum class RangeResult { None, Invalid, Unsatisfiable, Valid };

// Only single ranges are supported ("bytes=a-b", "bytes=a-", "bytes=-n"). Multiple ranges are
// Invalid, so they are ignored and the full content is served.
RangeResult parseRange(std::string_view header, uint64_t size, ByteRange& range);

// Fills response with the content of file, answering conditional requests (If-Match,
// If-Unmodified-Since, If-None-Match, If-Modified-Since) and single range requests (Range and
// If-Range). Uses the ETag in response.headers, if present, for the ETag-based conditions.
// A Content-Type header already in response is kept. Otherwise it is derived from the extension
// of name or, if detectContentType is true, sniffed from the content.
// modTimeNs = 0 means the modification time is unknown.
// Read errors are turned into a 500 response without details.
void serveContent(const Request& request, Response& response, std::string_view name,
    int64_t modTimeNs, File& file, bool detectContentType = true);
