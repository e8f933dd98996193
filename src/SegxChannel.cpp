#include "SegxChannel.h"

#include "segx_protocol.h"

#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>

using Clock = std::chrono::steady_clock;

TcpChannel::TcpChannel(int fd) : sock(fd) {}

TcpChannel::~TcpChannel() {
    if (sock >= 0) ::close(sock);
}

void TcpChannel::close() {
    if (sock >= 0) {
        ::shutdown(sock, SHUT_RDWR);
        ::close(sock);
        sock = -1;
    }
}

bool TcpChannel::send_frame(const std::vector<uint8_t>& frame) {
    if (sock < 0 || broken) return false;
    if (frame.size() > kMaxFrameBytes) {
        std::cerr << "Refusing to send oversized frame (" << frame.size() << " bytes)\n";
        return false;
    }

    uint8_t prefix[4];
    uint32_t n = static_cast<uint32_t>(frame.size());
    prefix[0] = static_cast<uint8_t>(n >> 24);
    prefix[1] = static_cast<uint8_t>(n >> 16);
    prefix[2] = static_cast<uint8_t>(n >> 8);
    prefix[3] = static_cast<uint8_t>(n);

    if (!write_all(prefix, sizeof(prefix))) return false;
    return write_all(frame.data(), frame.size());
}

bool TcpChannel::write_all(const uint8_t* p, size_t n) {
    while (n > 0) {
        ssize_t w = ::send(sock, p, n, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            perror("send");
            broken = true;
            return false;
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

RecvStatus TcpChannel::recv_frame(std::vector<uint8_t>& out, int timeout_ms) {
    if (sock < 0 || broken) return RecvStatus::Closed;

    uint8_t prefix[4];
    RecvStatus st = read_exact(prefix, sizeof(prefix), timeout_ms, false);
    if (st != RecvStatus::Ok) return st;

    uint32_t n = (static_cast<uint32_t>(prefix[0]) << 24) | (static_cast<uint32_t>(prefix[1]) << 16) |
                 (static_cast<uint32_t>(prefix[2]) << 8) | prefix[3];
    if (n > kMaxFrameBytes) {
        // Framing is lost; nothing after this point can be trusted
        std::cerr << "Frame length " << n << " exceeds limit; dropping stream\n";
        broken = true;
        return RecvStatus::Closed;
    }

    out.resize(n);
    if (n == 0) return RecvStatus::Ok;
    return read_exact(out.data(), n, timeout_ms, true);
}

// Once part of a frame has been consumed, a timeout would desynchronize the
// stream, so a stall mid-frame is reported as Closed.
RecvStatus TcpChannel::read_exact(uint8_t* p, size_t n, int timeout_ms, bool started) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (n > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left < 0) left = 0;

        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLIN;
        int r = ::poll(&pfd, 1, static_cast<int>(left));
        if (r < 0) {
            if (errno == EINTR) continue;
            perror("poll");
            broken = true;
            return RecvStatus::Closed;
        }
        if (r == 0) {
            if (!started) return RecvStatus::Timeout;
            std::cerr << "Timed out in the middle of a frame\n";
            broken = true;
            return RecvStatus::Closed;
        }

        ssize_t got = ::recv(sock, p, n, 0);
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            perror("recv");
            broken = true;
            return RecvStatus::Closed;
        }
        if (got == 0) {
            broken = true;
            return RecvStatus::Closed;
        }
        p += got;
        n -= static_cast<size_t>(got);
        started = true;
    }
    return RecvStatus::Ok;
}

LoopbackChannel::LoopbackChannel(std::shared_ptr<LoopbackPipe> in, std::shared_ptr<LoopbackPipe> out)
    : rx(std::move(in)), tx(std::move(out)) {}

LoopbackChannel::~LoopbackChannel() {
    close();
}

bool LoopbackChannel::send_frame(const std::vector<uint8_t>& frame) {
    {
        std::lock_guard<std::mutex> lock(tx->mu);
        if (tx->closed) return false;
        tx->frames.push_back(frame);
    }
    tx->cv.notify_all();
    return true;
}

RecvStatus LoopbackChannel::recv_frame(std::vector<uint8_t>& out, int timeout_ms) {
    std::unique_lock<std::mutex> lock(rx->mu);
    bool ready = rx->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [&] { return !rx->frames.empty() || rx->closed; });
    if (!rx->frames.empty()) {
        out = std::move(rx->frames.front());
        rx->frames.pop_front();
        return RecvStatus::Ok;
    }
    if (!ready) return RecvStatus::Timeout;
    return RecvStatus::Closed;
}

void LoopbackChannel::close() {
    for (auto& pipe : { rx, tx }) {
        {
            std::lock_guard<std::mutex> lock(pipe->mu);
            pipe->closed = true;
        }
        pipe->cv.notify_all();
    }
}

std::pair<std::unique_ptr<LoopbackChannel>, std::unique_ptr<LoopbackChannel>> segx_loopback_pair() {
    auto a_to_b = std::make_shared<LoopbackPipe>();
    auto b_to_a = std::make_shared<LoopbackPipe>();
    return { std::make_unique<LoopbackChannel>(b_to_a, a_to_b),
             std::make_unique<LoopbackChannel>(a_to_b, b_to_a) };
}
