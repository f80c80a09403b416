#include "assethandler.hpp"

#include "log.hpp"
#include "servecontent.hpp"
#include "string.hpp"
#include "tagcodec.hpp"

namespace {
constexpr std::string_view untaggedCacheControl = "public, max-age=60";
constexpr std::string_view taggedCacheControl = "public, max-age=31536000, immutable";
constexpr std::string_view noCacheCacheControl = "no-cache";

constexpr std::string_view redirectBody = R"(<html>
    <head>
        <meta charset="utf-8">
        <title>308 Permanent Redirect</title>
    </head>
    <body>
        <h1>308 Permanent Redirect</h1>
        The document has moved <a href="LOCATION">here</a>.
    </body>
</html>)";

Response notFound(const Request& request, std::string_view reason)
{
    slog::debug("'", request.url.rawPath, "': ", reason);
    return statusResponse(StatusCode::NotFound);
}

Response redirect(const Request& request, std::string location)
{
    static constexpr auto locationStart = redirectBody.find("LOCATION");
    static const auto redirectBodyPrefix = std::string(redirectBody.substr(0, locationStart));
    static const auto redirectBodySuffix
        = std::string(redirectBody.substr(locationStart + std::string_view("LOCATION").size()));

    auto resp = Response(StatusCode::PermanentRedirect);
    if (request.method == Method::Get) {
        // The location is relative and made of path characters and the query only, so it doesn't
        // need escaping
        resp.body = redirectBodyPrefix + location + redirectBodySuffix;
        resp.headers.add("Content-Type", "text/html; charset=utf-8");
    }
    resp.headers.add("Location", location);
    return resp;
}
}

AssetHandler::AssetHandler(AssetServer& server)
    : server_(server)
{
}

Response AssetHandler::operator()(const Request& request) const
{
    auto response = Response(StatusCode::Ok);
    serve(request, response);
    return response;
}

void AssetHandler::serve(const Request& request, Response& response) const
{
    if (request.method != Method::Get && request.method != Method::Head) {
        response = statusResponse(StatusCode::MethodNotAllowed);
        response.headers.set("Allow", "GET, HEAD");
        return;
    }

    const auto decoded = percentDecode(request.url.rawPath);
    if (!decoded) {
        response = notFound(request, "Malformed percent-encoding");
        return;
    }
    if (decoded->empty() || decoded->front() != '/'
        || decoded->find('\0') != std::string::npos) {
        response = notFound(request, "Invalid path");
        return;
    }

    const auto path = cleanPath(*decoded);
    if (path == "/") {
        // No index files and no directory listings
        response = notFound(request, "Root");
        return;
    }

    const auto trailingSlash = path.back() == '/';
    const auto filePath = std::string_view(path).substr(0, path.size() - (trailingSlash ? 1 : 0));
    const auto [tag, untagged] = extractTag(filePath);

    // untagged still starts with a slash, because extractTag only touches the last element
    const auto name = untagged.substr(1);
    auto asset = server_.resolve(name);
    if (!asset) {
        response = errorResponse(asset.error());
        return;
    }
    const auto& info = asset->info;

    // A stale (or made up) tag is never answered with the current content. Otherwise the old URL
    // would be cached forever with the new content.
    if (!tag.empty() && tag != info.tag) {
        response = notFound(request, "Tag mismatch (current: " + info.tag + ")");
        return;
    }

    if (trailingSlash) {
        // Relative, so it still works if an outer handler stripped a prefix from the path
        auto location = "../" + std::string(pathSplit(filePath).second);
        if (!request.url.query.empty()) {
            location.append("?");
            location.append(request.url.query);
        }
        response = redirect(request, std::move(location));
        return;
    }

    response.status = StatusCode::Ok;
    if (server_.options().noCache) {
        response.headers.set("Cache-Control", noCacheCacheControl);
    } else if (!tag.empty()) {
        response.headers.set("Cache-Control", taggedCacheControl);
    } else {
        response.headers.set("Cache-Control", untaggedCacheControl);
    }
    response.headers.set("ETag", "\"" + info.tag + "\"");
    if (!response.headers.contains("Content-Type") && !info.contentType.empty()) {
        response.headers.set("Content-Type", info.contentType);
    }

    // The content type was determined together with the tag, so never sniff again
    serveContent(request, response, name, info.modTimeNs, *asset->content, false);
}

Response errorResponse(const std::error_code& ec)
{
    if (ec == AssetErrc::NotFound || isNotFound(ec)) {
        return statusResponse(StatusCode::NotFound);
    }
    // Don't turn permission errors into 403. It would leak details about the configuration.
    return statusResponse(StatusCode::InternalServerError);
}

RequestHandler stripPrefix(std::string prefix, RequestHandler handler)
{
    return [prefix = std::move(prefix), handler = std::move(handler)](const Request& request) {
        const auto& rawPath = request.url.rawPath;
        if (!startsWith(rawPath, prefix)) {
            return notFound(request, "Outside of prefix '" + prefix + "'");
        }
        auto rest = rawPath.substr(prefix.size());
        // "/sub" must not match "/subway"
        if (!rest.empty() && rest.front() != '/' && !endsWith(prefix, "/")) {
            return notFound(request, "Outside of prefix '" + prefix + "'");
        }
        if (rest.empty() || rest.front() != '/') {
            rest.insert(0, "/");
        }
        if (!request.url.query.empty()) {
            rest.append("?");
            rest.append(request.url.query);
        }
        auto url = Url::parse(rest);
        if (!url) {
            return notFound(request, "Invalid path after stripping prefix");
        }
        auto stripped = request;
        stripped.url = std::move(*url);
        return handler(stripped);
    };
}
