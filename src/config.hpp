#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <netinet/in.h>

#include "log.hpp"

struct IpPort {
    std::optional<uint32_t> ip;
    uint16_t port;

    static std::optional<IpPort> parse(std::string_view str);
};

std::optional<uint32_t> parseIpAddress(const std::string& str);

// Only used by the executable. Every AssetServer gets its options passed explicitly.
struct Config {
    struct Server {
        uint32_t listenAddress = INADDR_ANY;
        uint16_t listenPort = 6969;

        bool accessLog = true;

        int listenBacklog = SOMAXCONN;
        uint32_t fullReadTimeoutMs = 1000;
        // maxRequestHeaderSize is actually the max size of request line + all headers
        size_t maxRequestHeaderSize = 4096;
        // We only serve GET and HEAD, so bodies are read and discarded
        size_t maxRequestBodySize = 1024;
        std::optional<size_t> limitConnections;
    };

    std::string root;
    bool noCache = false;
    // Path prefix that is stripped before looking up files, e.g. "/static"
    std::string prefix;
    std::optional<std::string> metrics;
    slog::Severity logLevel = slog::Severity::Info;

    Server server;

    bool loadFromFile(const std::string& path);

    static Config& get();
};
