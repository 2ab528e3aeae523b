//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited JSON transport over a readable fd (stdin) and an output stream (stdout)
//==========================================================================================================

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "logging/Logger.h"
#include "pmtrelay/StdioTransport.hpp"
#include "pmtrelay/errors/Errors.h"

namespace pmtrelay {

namespace {
bool isBlank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

[[noreturn]] void fail(const std::string& what, int err) {
    LOG_ERROR("StdioTransport: {} (errno={} msg={})", what, err, ::strerror(err));
    throw errors::TransportError("stdio transport: " + what + ": " + ::strerror(err));
}
} // namespace

class StdioTransport::Impl {
public:
    Options opts;
    std::ostream& out;
    std::mutex writeMutex;
    std::atomic<bool> closed{false};
    int wakeEventFd{-1};

    Impl(const Options& o, std::ostream& os) : opts(o), out(os) {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            fail("failed to create eventfd", errno);
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wake() {
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void writeLine(const std::string& line) {
        std::lock_guard<std::mutex> lk(writeMutex);
        out << line << '\n';
        out.flush();
        if (!out) {
            LOG_ERROR("StdioTransport: output stream failed");
            throw errors::TransportError("stdio transport: write to output failed");
        }
    }

    void handleLine(std::string line, const LineHandler& handler) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) {
            return;
        }
        std::optional<std::string> reply = handler(line);
        if (reply.has_value()) {
            writeLine(*reply);
        }
    }

    // Handles every complete line in buffer; leaves the unterminated remainder in place.
    void drainLines(std::string& buffer, const LineHandler& handler) {
        std::size_t start = 0;
        while (!closed.load()) {
            std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            std::size_t len = nl - start;
            if (len > opts.maxLineBytes) {
                tooLong(len);
            }
            handleLine(buffer.substr(start, len), handler);
            start = nl + 1;
        }
        buffer.erase(0, start);
        if (buffer.size() > opts.maxLineBytes && buffer.find('\n') == std::string::npos) {
            tooLong(buffer.size());
        }
    }

    [[noreturn]] void tooLong(std::size_t len) {
        LOG_ERROR("StdioTransport: input line of {} bytes exceeds limit of {}", len, opts.maxLineBytes);
        throw errors::TransportError("stdio transport: input line exceeds " + std::to_string(opts.maxLineBytes) +
                                     " bytes");
    }

    void drainWake() {
        uint64_t value = 0;
        ssize_t r;
        do {
            r = ::read(wakeEventFd, &value, sizeof(value));
        } while (r < 0 && errno == EINTR);
    }

    void run(const LineHandler& handler) {
        std::string buffer;
        std::array<char, 65536> tmp{};
        const int fd = opts.inputFd;

        while (!closed.load()) {
            struct pollfd pfds[2];
            pfds[0].fd = fd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
            int rc = ::poll(pfds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                fail("poll failed", errno);
            }
            if (pfds[1].revents & POLLIN) {
                drainWake();
                LOG_DEBUG("StdioTransport: woken by close");
                break;
            }
            if (pfds[0].revents & POLLNVAL) {
                fail("input descriptor is not open", EBADF);
            }
            if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            ssize_t n;
            do {
                n = ::read(fd, tmp.data(), tmp.size());
            } while (n < 0 && errno == EINTR);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                fail("read error", errno);
            }
            if (n == 0) {
                LOG_INFO("StdioTransport: EOF on input");
                if (!buffer.empty() && !closed.load()) {
                    handleLine(std::move(buffer), handler);
                    buffer.clear();
                }
                break;
            }
            buffer.append(tmp.data(), static_cast<std::size_t>(n));
            drainLines(buffer, handler);
        }
    }
};

StdioTransport::StdioTransport(const Options& opts, std::ostream& out)
    : pImpl(std::make_unique<Impl>(opts, out)) {
}

StdioTransport::~StdioTransport() = default;

void StdioTransport::Run(const LineHandler& handler) {
    FUNC_SCOPE();
    pImpl->run(handler);
}

void StdioTransport::WriteLine(const std::string& line) {
    pImpl->writeLine(line);
}

void StdioTransport::Close() {
    if (pImpl->closed.exchange(true)) {
        return;
    }
    pImpl->wake();
}

bool StdioTransport::IsClosed() const {
    return pImpl->closed.load();
}

} // namespace pmtrelay
