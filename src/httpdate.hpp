#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// IMF-fixdate, e.g. "Sat, 23 Apr 2022 23:22:48 GMT" (RFC7231, 7.1.1.1)
std::optional<std::string> formatHttpDate(int64_t unixSeconds);

// Accepts IMF-fixdate, the obsolete RFC 850 format and asctime format as required by RFC7231.
// Returns seconds since the unix epoch.
std::optional<int64_t> parseHttpDate(std::string_view str);
