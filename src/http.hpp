#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "string.hpp"

enum class Method {
    Get,
    Head,
    Post,
    Put,
    Delete,
    Connect,
    Options,
    Trace,
    Patch,
};

std::optional<Method> parseMethod(std::string_view method);
std::string toString(Method method);

enum class StatusCode : uint32_t {
    Invalid = 0,

    Ok = 200,
    NoContent = 204,
    PartialContent = 206,

    MovedPermanently = 301,
    Found = 302,
    NotModified = 304,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,

    BadRequest = 400,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    PreconditionFailed = 412,
    RangeNotSatisfiable = 416,

    InternalServerError = 500,
    ServiceUnavailable = 503,
};

std::string_view getReasonPhrase(StatusCode status);

template <typename StringType = std::string>
class HeaderMap {
public:
    HeaderMap() = default;
    HeaderMap(std::vector<std::pair<StringType, StringType>> h);

    bool contains(std::string_view name) const;
    std::optional<std::string_view> get(std::string_view name) const;
    std::vector<std::string_view> getAll(std::string_view name) const;
    std::optional<std::string_view> operator[](std::string_view name) const; // get
    const std::vector<std::pair<StringType, StringType>>& getEntries() const;

    void add(std::string_view name, std::string_view value);
    size_t set(std::string_view name, std::string_view value);
    size_t remove(std::string_view name);

    bool parse(std::string_view str);
    void serialize(std::string& str) const;

private:
    std::optional<size_t> find(std::string_view name) const;

    std::vector<std::pair<StringType, StringType>> headers_;
};

extern template class HeaderMap<std::string_view>;
extern template class HeaderMap<std::string>;

// Only origin-form and absolute-form request targets. Everything is owned, so a Url can be copied
// around freely.
struct Url {
    std::string fullRaw;
    // Path as it appeared in the request (still percent-encoded)
    std::string rawPath;
    // rawPath with dot segments removed
    std::string path;
    std::string query;

    static std::optional<Url> parse(std::string_view urlStr);
};

struct Request {
    std::string_view requestLine; // for access log
    Method method;
    Url url;
    std::string_view version;
    HeaderMap<std::string_view> headers;
    std::string_view body;

    static std::optional<Request> parse(std::string_view requestStr);
};

struct Response {
    StatusCode status = StatusCode::Ok;
    HeaderMap<std::string> headers;
    std::string body = {};

    Response();

    Response(std::string body);

    Response(std::string body, std::string_view contentType);

    Response(StatusCode status);

    Response(StatusCode status, std::string body);

    Response(StatusCode status, std::string body, std::string_view contentType);

    void addServerHeader();

    std::string string(std::string_view httpVersion = "HTTP/1.1") const;
};

// Plain text response with a body like "404 Not Found". Used for every error, so error responses
// never contain details about the server.
Response statusResponse(StatusCode status);

using RequestHandler = std::function<Response(const Request&)>;
