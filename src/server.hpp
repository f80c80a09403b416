#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <unordered_set>

#include <netinet/in.h>

#include "config.hpp"
#include "fd.hpp"
#include "http.hpp"

Fd createTcpListenSocket(uint16_t listenPort, uint32_t listenAddr, int backlog);

// Blocking HTTP/1.1 server. Every connection is handled on its own thread, so the handler may block
// (e.g. on file I/O) and is called concurrently.
class Server {
public:
    Server(RequestHandler handler, Config::Server config = Config::Server {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Accepts connections until stop() is called
    void start();

    // May be called from any thread. Closes the listen socket and all connections and waits until
    // the connection threads are done.
    void stop();

    // The port the listen socket is actually bound to (listenPort might be 0)
    uint16_t port() const;

private:
    class Session;

    void handleAccept(Fd fd, const ::sockaddr_in& addr);
    bool addConnection(int fd);
    void removeConnection(int fd);

    Fd listenSocket_;
    RequestHandler handler_;
    Config::Server config_;
    std::atomic<bool> stopped_ { false };
    std::mutex connectionsMutex_;
    std::condition_variable connectionsDone_;
    std::unordered_set<int> connections_;
};
