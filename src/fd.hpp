#pragma once

#include <string>

#include "result.hpp"

// Owns a file descriptor and closes it on destruction
class Fd {
public:
    Fd();
    explicit Fd(int fd);
    Fd(Fd&& other);
    Fd(const Fd& other) = delete;
    ~Fd();

    Fd& operator=(const Fd& other) = delete;
    Fd& operator=(Fd&& other);

    operator int() const;

    void close();
    void reset(int fd = -1); // close current fd and set new one
    int release(); // return the fd without closing

private:
    int fd_ = -1;
};

// O_RDONLY | O_CLOEXEC. Errors are errno codes in the generic category.
Result<Fd> openReadOnly(const std::string& path);

// Retried on EINTR. Returns 0 at the end of the file.
Result<size_t> readSome(int fd, void* buffer, size_t len);
