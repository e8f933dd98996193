#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

enum class RecvStatus {
    Ok,
    Timeout,
    Closed,
};

// Ordered, reliable frame transport between the two ends of one session.
class SegxChannel {
public:
    virtual ~SegxChannel() = default;

    virtual bool send_frame(const std::vector<uint8_t>& frame) = 0;
    virtual RecvStatus recv_frame(std::vector<uint8_t>& out, int timeout_ms) = 0;
    virtual void close() = 0;
};

// Length-prefixed frames over a connected stream socket. Owns the fd.
class TcpChannel : public SegxChannel {
public:
    explicit TcpChannel(int fd);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    bool send_frame(const std::vector<uint8_t>& frame) override;
    RecvStatus recv_frame(std::vector<uint8_t>& out, int timeout_ms) override;
    void close() override;

    int fd() const { return sock; }

private:
    bool write_all(const uint8_t* p, size_t n);
    RecvStatus read_exact(uint8_t* p, size_t n, int timeout_ms, bool started);

private:
    int sock = -1;
    bool broken = false;
};

struct LoopbackPipe {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<std::vector<uint8_t>> frames;
    bool closed = false;
};

// In-process endpoint; frames sent on one end arrive on its peer.
class LoopbackChannel : public SegxChannel {
public:
    LoopbackChannel(std::shared_ptr<LoopbackPipe> in, std::shared_ptr<LoopbackPipe> out);
    ~LoopbackChannel() override;

    bool send_frame(const std::vector<uint8_t>& frame) override;
    RecvStatus recv_frame(std::vector<uint8_t>& out, int timeout_ms) override;
    void close() override;

private:
    std::shared_ptr<LoopbackPipe> rx;
    std::shared_ptr<LoopbackPipe> tx;
};

std::pair<std::unique_ptr<LoopbackChannel>, std::unique_ptr<LoopbackChannel>> segx_loopback_pair();
