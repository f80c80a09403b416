#pragma once

#include <string>
#include <system_error>

#include "assetcache.hpp"
#include "http.hpp"

// Serves GET and HEAD requests for the files of an AssetServer.
// "/style.css" is served with a short max-age. "/style.<tag>.css" is served as immutable if the
// tag is the tag of the current content of style.css and is 404 otherwise.
class AssetHandler {
public:
    AssetHandler(AssetServer& server);

    Response operator()(const Request& request) const;

    // Headers already set in response are kept, unless the request fails. In particular a
    // Content-Type set by the caller is never replaced.
    void serve(const Request& request, Response& response) const;

private:
    AssetServer& server_;
};

// 404 for not-found errors, 500 with a fixed message for everything else
Response errorResponse(const std::error_code& ec);

// Passes requests below prefix to handler with the prefix removed from the path. Everything else
// is 404.
RequestHandler stripPrefix(std::string prefix, RequestHandler handler);
