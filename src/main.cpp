#include <filesystem>
#include <iostream>

#include <clipp.hpp>
#include <cpprom/cpprom.hpp>

#include "assethandler.hpp"
#include "config.hpp"
#include "log.hpp"
#include "server.hpp"

using namespace std::literals;

template <>
struct clipp::Value<IpPort> {
    static constexpr std::string_view typeName = "[address:]port";

    static std::optional<IpPort> parse(std::string_view str) { return IpPort::parse(str); }
};

struct Args : clipp::ArgsBase {
    std::optional<IpPort> listen;
    bool debug = false;
    bool noCache = false;
    bool checkConfig = false;
    std::optional<std::string> prefix;
    std::optional<std::string> metrics;
    std::vector<std::string> tag;
    std::optional<std::string> arg = ".";

    void args()
    {
        flag(listen, "listen", 'l').valueNames("IPPORT").help("ip:port or port");
        flag(debug, "debug").help("Enable debug logging");
        flag(noCache, "no-cache").help("Serve everything with 'Cache-Control: no-cache'");
        flag(checkConfig, "check-config").help("Check the configuration and exit");
        flag(prefix, "prefix").valueNames("PATH").help("Path prefix to strip from requests");
        flag(metrics, "metrics", 'm')
            .valueNames("ENDPOINT")
            .help("Endpoint for Prometheus-compatible metrics");
        flag(tag, "tag")
            .valueNames("NAME")
            .help("Print the tagged path of NAME and exit (may be repeated)");
        positional(arg, "arg").help("Directory to serve or config file");
    }
};

RequestHandler metricsHandler(std::string endpoint, RequestHandler handler)
{
    return [endpoint = std::move(endpoint), handler = std::move(handler)](
               const Request& request) -> Response {
        if (request.url.path != endpoint) {
            return handler(request);
        }
        if (request.method != Method::Get) {
            auto resp = statusResponse(StatusCode::MethodNotAllowed);
            resp.headers.set("Allow", "GET");
            return resp;
        }
        return Response(cpprom::Registry::getDefault().serialize(), "text/plain; version=0.0.4");
    };
}

int main(int argc, char** argv)
{
    auto parser = clipp::Parser(argv[0]);
    parser.version("1.0.0");
    const Args args = parser.parse<Args>(argc, argv).value();
    slog::init(args.debug ? slog::Severity::Debug : slog::Severity::Info);

    auto& config = Config::get();
    std::error_code ec;
    if (std::filesystem::is_regular_file(args.arg.value(), ec)) {
        if (!config.loadFromFile(*args.arg)) {
            return 1;
        }
        if (!args.debug) {
            slog::setLogLevel(config.logLevel);
        }
    } else if (std::filesystem::is_directory(args.arg.value(), ec)) {
        config.root = *args.arg;
    } else {
        slog::error("Invalid argument. Must either be a config file or a directory to serve");
        return 1;
    }

    if (!std::filesystem::is_directory(config.root, ec)) {
        slog::error("'", config.root, "' is not a directory");
        return 1;
    }

    if (args.checkConfig) {
        return 0;
    }

    if (args.listen) {
        if (args.listen->ip) {
            config.server.listenAddress = *args.listen->ip;
        }
        config.server.listenPort = args.listen->port;
    }
    config.noCache = config.noCache || args.noCache;
    if (args.prefix) {
        if (!args.prefix->empty() && args.prefix->front() != '/') {
            slog::error("The prefix must start with a slash");
            return 1;
        }
        config.prefix = *args.prefix;
    }
    if (args.metrics) {
        config.metrics = args.metrics;
    }

    AssetServer assets(std::make_unique<DirFileTree>(config.root),
        AssetServer::Options { .noCache = config.noCache });

    if (!args.tag.empty()) {
        int ret = 0;
        for (const auto& name : args.tag) {
            const auto tagged = assets.tag(name);
            if (!tagged) {
                slog::error("Could not tag '", name, "': ", tagged.error().message());
                ret = 1;
                continue;
            }
            std::cout << *tagged << std::endl;
        }
        return ret;
    }

    RequestHandler handler = AssetHandler(assets);
    if (!config.prefix.empty()) {
        handler = stripPrefix(config.prefix, std::move(handler));
    }
    // The metrics endpoint is outside of the prefix
    if (config.metrics) {
        handler = metricsHandler(*config.metrics, std::move(handler));
    }

    slog::info("Serving '", config.root, "'", config.noCache ? " (no-cache)"sv : ""sv,
        config.prefix.empty() ? ""s : " below '" + config.prefix + "'");

    Server server(std::move(handler), config.server);
    server.start();
    return 0;
}
