#include "fd.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

Fd::Fd()
    : fd_(-1)
{
}

Fd::Fd(int fd)
    : fd_(fd)
{
}

Fd::Fd(Fd&& other)
    : fd_(other.release())
{
}

Fd::~Fd()
{
    close();
}

Fd& Fd::operator=(Fd&& other)
{
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

Fd::operator int() const
{
    return fd_;
}

void Fd::close()
{
    if (fd_ != -1) {
        ::close(fd_);
    }
    fd_ = -1;
}

void Fd::reset(int fd)
{
    close();
    fd_ = fd;
}

int Fd::release()
{
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

Result<Fd> openReadOnly(const std::string& path)
{
    while (true) {
        Fd fd { ::open(path.c_str(), O_RDONLY | O_CLOEXEC) };
        if (fd != -1) {
            return fd;
        }
        if (errno != EINTR) {
            return errnoError();
        }
    }
}

Result<size_t> readSome(int fd, void* buffer, size_t len)
{
    while (true) {
        const auto n = ::read(fd, buffer, len);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            return errnoError();
        }
    }
}
