#include "http.hpp"

#include <cassert>

#include "log.hpp"

std::optional<Method> parseMethod(std::string_view method)
{
    // RFC2616, 5.1.1: "The method is case-sensitive"
    if (method == "GET") {
        return Method::Get;
    } else if (method == "HEAD") {
        return Method::Head;
    } else if (method == "POST") {
        return Method::Post;
    } else if (method == "PUT") {
        return Method::Put;
    } else if (method == "DELETE") {
        return Method::Delete;
    } else if (method == "CONNECT") {
        return Method::Connect;
    } else if (method == "OPTIONS") {
        return Method::Options;
    } else if (method == "TRACE") {
        return Method::Trace;
    } else if (method == "PATCH") {
        return Method::Patch;
    }
    return std::nullopt;
}

std::string toString(Method method)
{
    switch (method) {
    case Method::Get:
        return "GET";
    case Method::Head:
        return "HEAD";
    case Method::Post:
        return "POST";
    case Method::Put:
        return "PUT";
    case Method::Delete:
        return "DELETE";
    case Method::Connect:
        return "CONNECT";
    case Method::Options:
        return "OPTIONS";
    case Method::Trace:
        return "TRACE";
    case Method::Patch:
        return "PATCH";
    default:
        return "invalid";
    }
}

std::string_view getReasonPhrase(StatusCode status)
{
    switch (status) {
    case StatusCode::Ok:
        return "OK";
    case StatusCode::NoContent:
        return "No Content";
    case StatusCode::PartialContent:
        return "Partial Content";
    case StatusCode::MovedPermanently:
        return "Moved Permanently";
    case StatusCode::Found:
        return "Found";
    case StatusCode::NotModified:
        return "Not Modified";
    case StatusCode::TemporaryRedirect:
        return "Temporary Redirect";
    case StatusCode::PermanentRedirect:
        return "Permanent Redirect";
    case StatusCode::BadRequest:
        return "Bad Request";
    case StatusCode::Forbidden:
        return "Forbidden";
    case StatusCode::NotFound:
        return "Not Found";
    case StatusCode::MethodNotAllowed:
        return "Method Not Allowed";
    case StatusCode::PreconditionFailed:
        return "Precondition Failed";
    case StatusCode::RangeNotSatisfiable:
        return "Range Not Satisfiable";
    case StatusCode::InternalServerError:
        return "Internal Server Error";
    case StatusCode::ServiceUnavailable:
        return "Service Unavailable";
    default:
        return "";
    }
}

template <typename StringType>
HeaderMap<StringType>::HeaderMap(std::vector<std::pair<StringType, StringType>> h)
    : headers_(std::move(h))
{
}

template <typename StringType>
bool HeaderMap<StringType>::contains(std::string_view name) const
{
    return find(name).has_value();
}

template <typename StringType>
std::optional<std::string_view> HeaderMap<StringType>::get(std::string_view name) const
{
    const auto idx = find(name);
    if (idx) {
        return headers_[*idx].second;
    } else {
        return std::nullopt;
    }
}

template <typename StringType>
std::vector<std::string_view> HeaderMap<StringType>::getAll(std::string_view name) const
{
    std::vector<std::string_view> values;
    for (const auto& [k, v] : headers_) {
        if (ciEqual(k, name)) {
            values.push_back(v);
        }
    }
    return values;
}

template <typename StringType>
void HeaderMap<StringType>::add(std::string_view name, std::string_view value)
{
    headers_.emplace_back(StringType(name), StringType(value));
}

template <typename StringType>
size_t HeaderMap<StringType>::set(std::string_view name, std::string_view value)
{
    const auto removed = remove(name);
    add(name, value);
    return removed;
}

template <typename StringType>
size_t HeaderMap<StringType>::remove(std::string_view name)
{
    size_t removed = 0;
    for (auto it = headers_.begin(); it != headers_.end();) {
        if (ciEqual(it->first, name)) {
            it = headers_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

template <typename StringType>
std::optional<std::string_view> HeaderMap<StringType>::operator[](std::string_view name) const
{
    return get(name);
}

template <typename StringType>
const std::vector<std::pair<StringType, StringType>>& HeaderMap<StringType>::getEntries() const
{
    return headers_;
}

template <typename StringType>
void HeaderMap<StringType>::serialize(std::string& str) const
{
    for (const auto& [name, value] : headers_) {
        str.append(name);
        str.append(": ");
        str.append(value);
        str.append("\r\n");
    }
}

template <typename StringType>
bool HeaderMap<StringType>::parse(std::string_view str)
{
    size_t cursor = 0;
    while (cursor < str.size()) {
        const auto headerLineEnd = str.find("\r\n", cursor);
        const auto line = str.substr(cursor,
            headerLineEnd == std::string_view::npos ? headerLineEnd : headerLineEnd - cursor);
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            slog::debug("No colon in header line");
            return false;
        }
        const auto name = line.substr(0, colon);
        const auto value = httpTrim(line.substr(colon + 1));
        add(name, value);
        if (headerLineEnd == std::string_view::npos) {
            break;
        }
        cursor = headerLineEnd + 2;
    }
    return true;
}

template <typename StringType>
std::optional<size_t> HeaderMap<StringType>::find(std::string_view name) const
{
    for (size_t i = 0; i < headers_.size(); ++i) {
        if (ciEqual(headers_[i].first, name)) {
            return i;
        }
    }
    return std::nullopt;
}

template class HeaderMap<std::string_view>;
template class HeaderMap<std::string>;

namespace {
std::string removeDotSegments(std::string_view input)
{
    // RFC3986, 5.2.4: Remove Dot Segments
    // This algorithm is a bit different, because of the following assert (ensured in Url::parse).
    // If we leave the trailing slashes in the input buffer, we know that after every step in the
    // loop below, inputLeft still starts with a slash.
    assert(!input.empty() && input[0] == '/');
    std::string output;
    output.reserve(input.size());
    while (!input.empty()) {
        assert(input[0] == '/');

        if (input == "/") {
            output.push_back('/');
            break;
        }

        const auto segmentLength = input.find('/', 1);
        const auto segment = input.substr(0, segmentLength);

        if (segment == "/.") {
            // do nothing
        } else if (segment == "/..") {
            // Removing trailing segment (including slash) from output buffer
            const auto lastSlash = output.rfind('/');
            if (lastSlash != std::string::npos) {
                output.resize(lastSlash);
            } else {
                assert(output.empty());
            }
        } else {
            output.append(segment);
        }

        if (segmentLength == std::string_view::npos) {
            break;
        }
        input = input.substr(segmentLength);
    }
    if (output.empty()) {
        output.push_back('/');
    }
    return output;
}

bool isSchemeChar(char ch)
{
    return isAlphaNum(ch) || ch == '+' || ch == '.' || ch == '-';
}
}

std::optional<Url> Url::parse(std::string_view urlStr)
{
    constexpr auto npos = std::string_view::npos;

    Url url;
    url.fullRaw = urlStr;

    // RFC1808, 2.4.1: The fragment is not technically part of the URL
    const auto fragmentStart = urlStr.find('#');
    if (fragmentStart != npos) {
        urlStr = urlStr.substr(0, fragmentStart);
    }

    if (urlStr.empty()) {
        return std::nullopt;
    }

    // absoluteURI has to be accepted (RFC2616, 5.1.2), but only the path matters here.
    const auto colon = urlStr.find(':');
    const auto firstSlash = urlStr.find('/');
    if (colon != npos && colon < firstSlash) {
        bool isScheme = colon > 0;
        for (size_t i = 0; i < colon; ++i) {
            if (!isSchemeChar(urlStr[i])) {
                isScheme = false;
                break;
            }
        }
        if (isScheme) {
            urlStr = urlStr.substr(colon + 1);
        }
    }

    // RFC1808, 2.4.3
    if (startsWith(urlStr, "//")) {
        const auto pathStart = urlStr.find('/', 2);
        if (pathStart == npos) {
            return std::nullopt;
        }
        urlStr = urlStr.substr(pathStart);
    }

    // RFC1808, 2.4.4
    const auto queryStart = urlStr.find('?');
    if (queryStart != npos) {
        url.query = urlStr.substr(queryStart + 1);
        urlStr = urlStr.substr(0, queryStart);
    }

    // Must be abs_path now (RFC1808, 2.2)
    if (urlStr.empty() || urlStr[0] != '/') {
        return std::nullopt;
    }
    url.rawPath = urlStr;
    url.path = removeDotSegments(urlStr);

    return url;
}

std::optional<Request> Request::parse(std::string_view requestStr)
{
    // e.g.: GET /foobar/barbar HTTP/1.1\r\nHost: example.org\r\n\r\n
    Request req;

    const auto requestLineEnd = requestStr.find("\r\n");
    if (requestLineEnd == std::string::npos) {
        slog::debug("No request line end");
        return std::nullopt;
    }
    req.requestLine = requestStr.substr(0, requestLineEnd);

    const auto methodDelim = req.requestLine.find(' ');
    if (methodDelim == std::string::npos) {
        slog::debug("No method delimiter");
        return std::nullopt;
    }
    const auto method = parseMethod(req.requestLine.substr(0, methodDelim));
    if (!method) {
        slog::debug("Invalid method");
        return std::nullopt;
    }
    req.method = *method;

    // I could skip all whitespace here to be more robust, but RFC2616 5.1 only mentions 1 SP
    const auto urlStart = methodDelim + 1;
    if (urlStart >= req.requestLine.size()) {
        slog::debug("No URL");
        return std::nullopt;
    }
    const auto urlLen = req.requestLine.substr(urlStart).find(' ');
    if (urlLen == std::string::npos) {
        slog::debug("No URL end");
        return std::nullopt;
    }
    auto url = Url::parse(req.requestLine.substr(urlStart, urlLen));
    if (!url) {
        slog::debug("Invalid URL");
        return std::nullopt;
    }
    req.url = std::move(*url);

    const auto versionStart = urlStart + urlLen + 1;
    if (versionStart > req.requestLine.size()) {
        slog::debug("No version start");
        return std::nullopt;
    }
    req.version = req.requestLine.substr(versionStart);

    if (req.version.size() != 8 || req.version.substr(0, 7) != "HTTP/1."
        || (req.version[7] != '0' && req.version[7] != '1')) {
        slog::debug("Invalid version");
        return std::nullopt;
    }

    const auto headersStart = requestLineEnd + 2;
    if (requestStr.substr(headersStart, 2) == "\r\n") {
        // No headers at all
        req.body = requestStr.substr(headersStart + 2);
        return req;
    }

    const auto headersEnd = requestStr.find("\r\n\r\n", headersStart);
    if (headersEnd == std::string_view::npos) {
        slog::debug("No headers end");
        return std::nullopt;
    }

    // +2 to terminate the last header line
    if (!req.headers.parse(requestStr.substr(headersStart, headersEnd + 2 - headersStart))) {
        return std::nullopt;
    }

    req.body = requestStr.substr(headersEnd + 4);

    return req;
}

Response::Response()
    : status(StatusCode::Invalid)
{
}

Response::Response(std::string body)
    : body(std::move(body))
{
    addServerHeader();
}

Response::Response(std::string body, std::string_view contentType)
    : body(std::move(body))
{
    addServerHeader();
    headers.add("Content-Type", contentType);
}

Response::Response(StatusCode status, std::string body)
    : status(status)
    , body(std::move(body))
{
    addServerHeader();
}

Response::Response(StatusCode status)
    : status(status)
{
    addServerHeader();
}

Response::Response(StatusCode status, std::string body, std::string_view contentType)
    : status(status)
    , body(std::move(body))
{
    addServerHeader();
    headers.add("Content-Type", contentType);
}

void Response::addServerHeader()
{
    // No version, so it doesn't tell anyone how outdated the server is.
    headers.add("Server", "tagserve");
}

std::string Response::string(std::string_view httpVersion) const
{
    std::string s;
    size_t size = 12 + 2; // status line
    for (const auto& [name, value] : headers.getEntries()) {
        size += name.size() + value.size() + 4;
    }
    size += 2 + 32; // end of headers + possibly Content-Length
    size += body.size();
    s.reserve(size);

    s.append(httpVersion);
    s.append(" ");
    s.append(std::to_string(static_cast<int>(status)));
    s.append(" ");
    s.append(getReasonPhrase(status));
    s.append("\r\n");
    headers.serialize(s);
    // 304 must not carry a body and the length of a HEAD response is set by the handler
    const auto bodyless = status == StatusCode::NotModified || status == StatusCode::NoContent;
    if (!headers.contains("Content-Length") && !bodyless) {
        s.append("Content-Length: ");
        s.append(std::to_string(body.size()));
        s.append("\r\n");
    }
    s.append("\r\n");
    s.append(body);
    return s;
}

Response statusResponse(StatusCode status)
{
    auto resp = Response(status,
        std::to_string(static_cast<int>(status)) + " " + std::string(getReasonPhrase(status)),
        "text/plain; charset=utf-8");
    resp.headers.add("X-Content-Type-Options", "nosniff");
    return resp;
}
