#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>

#include <arpa/inet.h>
#include <sys/stat.h>

#include <joml.hpp>

#include "string.hpp"

namespace {
std::optional<std::string> readFile(const std::string& path)
{
    auto f = std::unique_ptr<FILE, decltype(&std::fclose)>(
        std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!f) {
        slog::error("Could not open file: '", path, "'");
        return std::nullopt;
    }

    struct ::stat st;
    if (::fstat(::fileno(f.get()), &st)) {
        slog::error("Could not stat file: '", path, "'");
        return std::nullopt;
    }

    // fopen-ing a directory in read-only mode will actually not fail!
    if (!S_ISREG(st.st_mode)) {
        slog::error("'", path, "' is not a regular file");
        return std::nullopt;
    }

    std::string buf(static_cast<size_t>(st.st_size), '\0');
    if (std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) {
        slog::error("Error reading file: '", path, "'");
        return std::nullopt;
    }
    return buf;
}

std::optional<std::string> substituteEnvVars(std::string_view source)
{
    std::string ret;
    size_t cursor = 0;
    while (cursor < source.size()) {
        const auto start = source.find("${", cursor);
        ret.append(source.substr(cursor, start - cursor));
        if (start == std::string_view::npos) {
            break;
        }

        const auto end = source.find("}", start);
        if (end == std::string_view::npos) {
            slog::error("Unmatched environment variable expansion");
            return std::nullopt;
        }

        const auto arg = source.substr(start + 2, end - start - 2);
        const auto colon = arg.find(':');
        const auto var = std::string(colon == std::string_view::npos ? arg : arg.substr(0, colon));
        const auto defaultValue = colon == std::string_view::npos
            ? std::optional<std::string_view> { std::nullopt }
            : std::optional<std::string_view> { arg.substr(colon + 1) };

        const auto envValue = ::getenv(var.c_str());
        if (envValue) {
            ret.append(envValue);
        } else if (defaultValue) {
            ret.append(*defaultValue);
        } else {
            slog::error("Environment variable '", var, "' is not defined.");
            return std::nullopt;
        }

        cursor = end + 1;
    }
    return ret;
}

template <typename T>
bool loadSingle(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    if (!value.is<T>()) {
        slog::error("'", name, "' must be a ", typeName);
        return false;
    }
    dest = value.as<T>();
    return true;
}

bool load(const joml::Node& value, std::string_view name, bool& dest)
{
    return loadSingle(value, name, "boolean", dest);
}

bool load(const joml::Node& value, std::string_view name, std::string& dest)
{
    return loadSingle(value, name, "string", dest);
}

template <typename T>
bool load(const joml::Node& value, std::string_view name, std::optional<T>& dest)
{
    return load(value, name, dest.emplace());
}

template <typename T>
bool loadInteger(const joml::Node& value, std::string_view name, T& dest, int64_t min, int64_t max)
{
    int64_t i = 0;
    if (!loadSingle(value, name, "integer", i)) {
        return false;
    }
    if (i < min || i > max) {
        slog::error("'", name, "' must be in [", min, ", ", max, "]");
        return false;
    }
    dest = static_cast<T>(i);
    return true;
}

template <typename T>
bool loadInteger(
    const joml::Node& value, std::string_view name, std::optional<T>& dest, int64_t min, int64_t max)
{
    return loadInteger(value, name, dest.emplace(), min, max);
}

template <typename T>
bool loadParse(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    std::string str;
    if (!load(value, name, str)) {
        return false;
    }
    const auto parsed = T::parse(str);
    if (!parsed) {
        slog::error("'", name, "' must be a valid ", typeName);
        return false;
    }
    dest = *parsed;
    return true;
}

bool load(const joml::Node& value, std::string_view name, IpPort& dest)
{
    return loadParse(value, name, "listen address ([ip:]port)", dest);
}

bool loadLogLevel(const joml::Node& value, slog::Severity& dest)
{
    std::string str;
    if (!load(value, "log_level", str)) {
        return false;
    }
    const auto severity = slog::parseSeverity(str);
    if (!severity || *severity == slog::Severity::Fatal) {
        slog::error("'log_level' must be one of 'debug', 'info', 'warning' or 'error'");
        return false;
    }
    dest = *severity;
    return true;
}

bool loadPathPrefix(const joml::Node& value, std::string& dest)
{
    if (!load(value, "prefix", dest)) {
        return false;
    }
    if (!dest.empty() && dest[0] != '/') {
        slog::error("'prefix' must start with a slash");
        return false;
    }
    return true;
}

#define CHECK_OR_FALSE(cond)                                                                       \
    if (!(cond)) {                                                                                 \
        return false;                                                                              \
    }
}

std::optional<IpPort> IpPort::parse(std::string_view str)
{
    auto ipStr = std::string_view();
    auto portStr = std::string_view();

    const auto colon = str.find(':');
    if (colon == std::string::npos) {
        portStr = str;
    } else {
        ipStr = str.substr(0, colon);
        portStr = str.substr(colon + 1);
    }

    std::optional<uint32_t> ip;
    if (!ipStr.empty()) {
        ip = parseIpAddress(std::string(ipStr));
        if (!ip) {
            return std::nullopt;
        }
    }

    const auto port = parseInt<uint16_t>(portStr);
    if (!port) {
        return std::nullopt;
    }

    return IpPort { ip, *port };
}

// Host byte order, like INADDR_ANY
std::optional<uint32_t> parseIpAddress(const std::string& str)
{
    ::in_addr addr;
    if (::inet_aton(str.c_str(), &addr) == 0) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

// Nothing is applied unless the whole file is valid
bool Config::loadFromFile(const std::string& path)
{
    const auto source = readFile(path);
    if (!source) {
        // already logged
        return false;
    }

    const auto substSource = substituteEnvVars(*source);
    if (!substSource) {
        return false;
    }

    const auto joml = joml::parse(*substSource);
    if (!joml) {
        const auto err = joml.error();
        slog::error("Could not parse JOML config: ", err.string(), "\n",
            joml::getContextString(*substSource, err.position));
        return false;
    }

    auto copy = *this;
    bool rootFound = false;

    constexpr int64_t maxSize = 1024 * 1024 * 1024;
    for (const auto& [key, value] : *joml) {
        if (key == "root") {
            CHECK_OR_FALSE(load(value, "root", copy.root));
            rootFound = true;
        } else if (key == "no_cache") {
            CHECK_OR_FALSE(load(value, "no_cache", copy.noCache));
        } else if (key == "prefix") {
            CHECK_OR_FALSE(loadPathPrefix(value, copy.prefix));
        } else if (key == "metrics") {
            CHECK_OR_FALSE(load(value, "metrics", copy.metrics));
        } else if (key == "log_level") {
            CHECK_OR_FALSE(loadLogLevel(value, copy.logLevel));
        } else if (key == "listen") {
            IpPort ipPort;
            CHECK_OR_FALSE(load(value, "listen", ipPort));
            if (ipPort.ip) {
                copy.server.listenAddress = *ipPort.ip;
            }
            copy.server.listenPort = ipPort.port;
        } else if (key == "access_log") {
            CHECK_OR_FALSE(load(value, "access_log", copy.server.accessLog));
        } else if (key == "listen_backlog") {
            CHECK_OR_FALSE(
                loadInteger(value, "listen_backlog", copy.server.listenBacklog, 1, SOMAXCONN));
        } else if (key == "full_read_timeout_ms") {
            CHECK_OR_FALSE(loadInteger(value, "full_read_timeout_ms",
                copy.server.fullReadTimeoutMs, 1, 60 * 60 * 1000));
        } else if (key == "max_request_header_size") {
            CHECK_OR_FALSE(loadInteger(value, "max_request_header_size",
                copy.server.maxRequestHeaderSize, 64, maxSize));
        } else if (key == "max_request_body_size") {
            CHECK_OR_FALSE(loadInteger(
                value, "max_request_body_size", copy.server.maxRequestBodySize, 0, maxSize));
        } else if (key == "limit_connections") {
            CHECK_OR_FALSE(loadInteger(
                value, "limit_connections", copy.server.limitConnections, 1, 1024 * 1024));
        } else {
            slog::error("Invalid key '", key, "'");
            return false;
        }
    }

    if (!rootFound) {
        slog::error("'root' is mandatory");
        return false;
    }

    *this = copy;

    return true;
}

Config& Config::get()
{
    static Config config;
    return config;
}
