#include "streamdl/input_stream.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <iostream>

namespace streamdl {

FdInputStream::FdInputStream(const int &fd) : fd(fd) {
}

FdInputStream::~FdInputStream() {
    try {
        this->close();
    } catch (const std::exception &e) {
        std::cerr << "Error closing input stream: " << e.what() << std::endl;
    }
}

std::size_t FdInputStream::read(char *buffer, const std::size_t &size) {
    if (this->fd < 0) {
        throw IoError(EBADF, "stream_closed: Input stream is closed");
    }
    while (true) {
        ssize_t recvd = ::read(this->fd, buffer, size);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            throw IoError::fromErrno("read_failed", "fd=" + std::to_string(this->fd));
        }
        return static_cast<std::size_t>(recvd);
    }
}

void FdInputStream::close() {
    if (this->fd < 0) {
        return;
    }
    int old = this->fd;
    this->fd = -1;
    if (::close(old) < 0 && errno != EINTR) {
        throw IoError::fromErrno("close_failed", "fd=" + std::to_string(old));
    }
}

int FdInputStream::getFD() const {
    return this->fd;
}

std::unique_ptr<FdInputStream> FdInputStream::openFile(const std::string &path) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw IoError::fromErrno("file_open_failed", "path: " + path);
    }
    return std::make_unique<FdInputStream>(fd);
}

std::unique_ptr<FdInputStream> FdInputStream::connectTcp(const std::string &host, const std::uint16_t &port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw IoError(EINVAL, "invalid_address: Invalid IPv4 address: " + host);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw IoError::fromErrno("socket_failed");
    }
    // wrap first so the socket is closed if connect fails
    auto stream = std::make_unique<FdInputStream>(fd);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw IoError::fromErrno("connect_failed", host + ":" + std::to_string(port));
    }
    return stream;
}

}
