#include "server.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <errno.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "log.hpp"
#include "metrics.hpp"
#include "string.hpp"

namespace {
using Clock = std::chrono::steady_clock;

std::string errnoToString(int err)
{
    return std::make_error_code(static_cast<std::errc>(err)).message();
}

std::string addressToString(uint32_t hostOrderAddr)
{
    return ::inet_ntoa(::in_addr { htonl(hostOrderAddr) });
}

bool setRecvTimeout(int fd, int64_t ms)
{
    ::timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

constexpr std::string_view badRequest = "HTTP/1.1 400 Bad Request\r\nConnection: close\r\n"
                                        "Content-Length: 0\r\n\r\n";
}

Fd createTcpListenSocket(uint16_t listenPort, uint32_t listenAddr, int backlog)
{
    Fd fd { ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0) };
    if (fd == -1)
        return fd;

    sockaddr_in addr;
    ::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(listenAddr);
    addr.sin_port = htons(listenPort);

    const int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1) {
        slog::error("Could not set sockopt SO_REUSEADDR: ", errnoToString(errno));
        return Fd {};
    }

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
        slog::error("Could not bind to port ", listenPort, ": ", errnoToString(errno));
        return Fd {};
    }

    if (::listen(fd, backlog) == -1) {
        slog::error("Could not listen on socket: ", errnoToString(errno));
        return Fd {};
    }

    return fd;
}

class Server::Session {
public:
    Session(Server& server, Fd fd, ::in_addr remoteAddr)
        : server_(server)
        , fd_(std::move(fd))
        , remoteAddrStr_(::inet_ntoa(remoteAddr))
        , trackInProgressHandle_(Metrics::get().connActive.labels().trackInProgress())
    {
        // The buffer never grows, so the string_views of a parsed Request stay valid while the
        // body is received.
        buffer_.resize(
            server_.config_.maxRequestHeaderSize + server_.config_.maxRequestBodySize, '\0');
    }

    void run()
    {
        while (!server_.stopped_) {
            requestStart_ = cpprom::now();
            deadline_ = Clock::now() + std::chrono::milliseconds(server_.config_.fullReadTimeoutMs);

            const auto headerSize = readRequestHeader();
            if (!headerSize) {
                break;
            }

            const auto request = Request::parse(std::string_view(buffer_.data(), *headerSize));
            if (!request) {
                rejectRequest("INVALID REQUEST", "parse error");
                break;
            }

            const auto bodySize = readRequestBody(*request, *headerSize);
            if (!bodySize) {
                break;
            }

            if (!respond(*request, server_.handler_(*request))) {
                break;
            }

            // Keep what we might have received of a pipelined request
            const auto consumed = *headerSize + *bodySize;
            std::memmove(buffer_.data(), buffer_.data() + consumed, filled_ - consumed);
            filled_ -= consumed;
        }
        ::shutdown(fd_, SHUT_RDWR);
    }

    int fd() const { return fd_; }

private:
    // Inspired by this: https://github.com/expressjs/morgan#predefined-formats
    void accessLog(std::string_view requestLine, StatusCode responseStatus,
        size_t responseContentLength) const
    {
        if (server_.config_.accessLog) {
            slog::info(remoteAddrStr_, " \"", requestLine, "\" ", static_cast<int>(responseStatus),
                " ", responseContentLength);
        }
    }

    void rejectRequest(std::string_view logLine, std::string_view reason)
    {
        accessLog(logLine, StatusCode::BadRequest, 0);
        Metrics::get().reqErrors.labels(std::string(reason)).inc();
        send(badRequest);
    }

    // Appends at most maxLen bytes to the buffer
    bool receive(size_t maxLen)
    {
        const auto remaining
            = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now())
                  .count();
        if (remaining <= 0 || !setRecvTimeout(fd_, remaining)) {
            Metrics::get().recvErrors.labels("timeout").inc();
            slog::debug(remoteAddrStr_, ": Receive timeout");
            return false;
        }

        while (true) {
            const auto n = ::recv(fd_, buffer_.data() + filled_, maxLen, 0);
            if (n > 0) {
                filled_ += static_cast<size_t>(n);
                return true;
            } else if (n == 0) {
                // Closed by the peer (or by Server::stop)
                return false;
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                Metrics::get().recvErrors.labels("timeout").inc();
                slog::debug(remoteAddrStr_, ": Receive timeout");
                return false;
            }
            Metrics::get().recvErrors.labels(errnoToString(errno)).inc();
            slog::error("Error in recv: ", errnoToString(errno));
            return false;
        }
    }

    // Returns the size of the request line and headers including the terminating empty line
    std::optional<size_t> readRequestHeader()
    {
        const auto maxSize = server_.config_.maxRequestHeaderSize;
        while (true) {
            const auto end = std::string_view(buffer_.data(), filled_).find("\r\n\r\n");
            if (end != std::string_view::npos && end + 4 <= maxSize) {
                return end + 4;
            }
            if (filled_ >= maxSize) {
                rejectRequest("INVALID REQUEST (header size)", "header too large");
                return std::nullopt;
            }
            if (!receive(maxSize - filled_)) {
                return std::nullopt;
            }
        }
    }

    std::optional<size_t> readRequestBody(const Request& request, size_t headerSize)
    {
        if (request.headers.contains("Transfer-Encoding")) {
            rejectRequest(request.requestLine, "transfer encoding");
            return std::nullopt;
        }

        const auto contentLength = request.headers.get("Content-Length");
        if (!contentLength) {
            return 0;
        }

        const auto length = parseInt<uint64_t>(*contentLength);
        if (!length) {
            rejectRequest("INVALID REQUEST (Content-Length)", "invalid length");
            return std::nullopt;
        }
        if (*length > server_.config_.maxRequestBodySize) {
            rejectRequest("INVALID REQUEST (body size)", "body too large");
            return std::nullopt;
        }

        const auto total = headerSize + *length;
        while (filled_ < total) {
            if (!receive(total - filled_)) {
                return std::nullopt;
            }
        }
        return *length;
    }

    bool getKeepAlive(const Request& request) const
    {
        const auto connectionHeader = request.headers.get("Connection");
        if (connectionHeader) {
            if (connectionHeader->find("close") != std::string_view::npos) {
                return false;
            }
            if (connectionHeader->find("keep-alive") != std::string_view::npos) {
                return true;
            }
        }
        return request.version == "HTTP/1.1";
    }

    // Returns whether the connection should be kept open
    bool respond(const Request& request, Response&& response)
    {
        const auto keepAlive = getKeepAlive(request) && !server_.stopped_;
        if (!keepAlive) {
            response.headers.set("Connection", "close");
        }

        const auto bodySize = response.body.size();
        if (request.method == Method::Head && !response.body.empty()) {
            // Error responses and redirects are built with a body, even for HEAD
            if (!response.headers.contains("Content-Length")) {
                response.headers.set("Content-Length", std::to_string(bodySize));
            }
            response.body.clear();
        }

        const auto method = toString(request.method);
        const auto status = std::to_string(static_cast<int>(response.status));
        Metrics::get().reqsTotal.labels(method).inc();
        accessLog(request.requestLine, response.status, bodySize);

        const auto responseStr = response.string(request.version);
        if (!send(responseStr)) {
            return false;
        }

        // Only step these counters for successful sends
        Metrics::get().reqDuration.labels(method).observe(cpprom::now() - requestStart_);
        Metrics::get().respTotal.labels(method, status).inc();
        Metrics::get().respSize.labels(method, status).observe(responseStr.size());
        return keepAlive;
    }

    bool send(std::string_view data)
    {
        size_t offset = 0;
        while (offset < data.size()) {
            const auto n = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                Metrics::get().sendErrors.labels(errnoToString(errno)).inc();
                slog::error("Error in send: ", errnoToString(errno));
                return false;
            }
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    Server& server_;
    Fd fd_;
    std::string remoteAddrStr_;
    std::string buffer_;
    size_t filled_ = 0;
    Clock::time_point deadline_;
    cpprom::Gauge::TrackInProgressHandle trackInProgressHandle_;
    double requestStart_ = 0.0;
};

Server::Server(RequestHandler handler, Config::Server config)
    : listenSocket_(
        createTcpListenSocket(config.listenPort, config.listenAddress, config.listenBacklog))
    , handler_(std::move(handler))
    , config_(std::move(config))
{
    if (listenSocket_ == -1) {
        slog::fatal("Could not create listen socket: ", errnoToString(errno));
        std::exit(1);
    }
}

Server::~Server()
{
    stop();
}

uint16_t Server::port() const
{
    ::sockaddr_in addr;
    ::socklen_t len = sizeof(addr);
    if (::getsockname(listenSocket_, reinterpret_cast<::sockaddr*>(&addr), &len) == -1) {
        return config_.listenPort;
    }
    return ntohs(addr.sin_port);
}

void Server::start()
{
    slog::info("Listening on ", addressToString(config_.listenAddress), ":", port());
    while (!stopped_) {
        ::sockaddr_in addr;
        ::socklen_t addrLen = sizeof(addr);
        const auto fd
            = ::accept4(listenSocket_, reinterpret_cast<::sockaddr*>(&addr), &addrLen, SOCK_CLOEXEC);
        if (fd == -1) {
            if (stopped_) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            slog::error("Error in accept: ", errnoToString(errno));
            Metrics::get().acceptErrors.labels(errnoToString(errno)).inc();
            if (errno == EMFILE || errno == ENFILE) {
                // Give the connection threads a chance to close some fds
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }
        handleAccept(Fd { fd }, addr);
    }
    slog::info("Stopped listening");
}

void Server::stop()
{
    std::unique_lock lock(connectionsMutex_);
    if (!stopped_.exchange(true)) {
        // Makes a blocking accept return
        ::shutdown(listenSocket_, SHUT_RDWR);
        for (const auto fd : connections_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    connectionsDone_.wait(lock, [this] { return connections_.empty(); });
}

void Server::handleAccept(Fd fd, const ::sockaddr_in& addr)
{
    static auto& connAccepted = Metrics::get().connAccepted.labels();
    connAccepted.inc();

    if (!addConnection(fd)) {
        static auto& connDropped = Metrics::get().connDropped.labels();
        connDropped.inc();
        slog::info("Max concurrent connections limit reached");
        return;
    }

    std::thread([this, fd = std::move(fd), remoteAddr = addr.sin_addr]() mutable {
        Session session(*this, std::move(fd), remoteAddr);
        session.run();
        // Still open, so the fd number can not be reused before it is removed
        removeConnection(session.fd());
    }).detach();
}

bool Server::addConnection(int fd)
{
    std::lock_guard lock(connectionsMutex_);
    if (stopped_) {
        return false;
    }
    if (config_.limitConnections && connections_.size() >= *config_.limitConnections) {
        return false;
    }
    connections_.insert(fd);
    return true;
}

void Server::removeConnection(int fd)
{
    std::lock_guard lock(connectionsMutex_);
    connections_.erase(fd);
    connectionsDone_.notify_all();
}
