/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "nmoskit/core/exception.hpp"
#include "nmoskit/core/platform.hpp"

#if NMK_POSIX

    #include <cerrno>
    #include <fcntl.h>
    #include <unistd.h>

namespace nmk::posix {

/**
 * Wrapper around the POSIX pipe() function. Both ends are non-blocking.
 */
class Pipe {
  public:
    /**
     * Constructs a pipe.
     * @throws nmk::Exception if pipe() fails.
     */
    Pipe() {
        if (::pipe(fds_) == -1) {
            NMK_THROW_EXCEPTION("pipe() failed");
        }
        for (const auto fd : fds_) {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                close_fds();
                NMK_THROW_EXCEPTION("fcntl() failed");
            }
        }
    }

    ~Pipe() {
        close_fds();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    Pipe(Pipe&&) = delete;
    Pipe& operator=(Pipe&&) = delete;

    /**
     * Writes data to the pipe.
     * @param data The data to write.
     * @param size The size of the data.
     * @return The number of bytes written, or -1 on error.
     */
    ssize_t write(const void* data, const size_t size) const {
        return ::write(fds_[1], data, size);
    }

    /**
     * Reads everything currently available from the pipe and discards it.
     */
    void drain() const {
        char buffer[64];
        while (::read(fds_[0], buffer, sizeof(buffer)) > 0) {}
    }

    /**
     * @returns The read file descriptor.
     */
    [[nodiscard]] int read_fd() const {
        return fds_[0];
    }

    /**
     * @returns The write file descriptor.
     */
    [[nodiscard]] int write_fd() const {
        return fds_[1];
    }

  private:
    int fds_[2] = {-1, -1};  // read and write file descriptors

    void close_fds() {
        for (auto& fd : fds_) {
            if (fd != -1) {
                ::close(fd);
                fd = -1;
            }
        }
    }
};

}  // namespace nmk::posix

#endif
