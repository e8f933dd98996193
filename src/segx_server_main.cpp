#include "SegSender.h"
#include "SegxChannel.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>

struct ServerArgs {
    uint16_t port = 12345;
    int backlog = 16;
    SegSenderArgs session;
};

static std::atomic<int> g_active{0};

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--port P] [--root DIR] [--segment-size BYTES] [--max-retries N]"
              << " [--ack-timeout-ms MS] [--request-timeout-ms MS] [--min-size BYTES]"
              << " [--force-error-prob P] [--seed S]\n";
}

static bool parse_args(int argc, char** argv, ServerArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (s == "--port" && need(1)) a.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--root" && need(1)) a.session.root = argv[++i];
            else if (s == "--segment-size" && need(1)) a.session.segment_size = (size_t)std::stoul(argv[++i]);
            else if (s == "--max-retries" && need(1)) a.session.max_retries = std::stoi(argv[++i]);
            else if (s == "--ack-timeout-ms" && need(1)) a.session.ack_timeout_ms = std::stoi(argv[++i]);
            else if (s == "--request-timeout-ms" && need(1)) a.session.request_timeout_ms = std::stoi(argv[++i]);
            else if (s == "--min-size" && need(1)) a.session.min_file_size = std::stoull(argv[++i]);
            else if (s == "--force-error-prob" && need(1)) a.session.force_error_prob = std::stod(argv[++i]);
            else if (s == "--seed" && need(1)) a.session.seed = (uint32_t)std::stoul(argv[++i]);
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << s << "\n";
            return false;
        }
    }

    if (a.session.segment_size < 1 || a.session.segment_size > 0xFFFF) {
        std::cerr << "--segment-size must be 1..65535\n";
        return false;
    }
    if (a.session.max_retries < 1) { std::cerr << "--max-retries must be >= 1\n"; return false; }
    if (a.session.force_error_prob &&
        !(*a.session.force_error_prob >= 0.0 && *a.session.force_error_prob <= 1.0)) {
        std::cerr << "--force-error-prob must be within [0, 1]\n";
        return false;
    }
    return true;
}

static void serve(int conn_fd, std::string peer, SegSenderArgs args) {
    ++g_active;
    args.tag = peer;

    TcpChannel chan(conn_fd);
    SegSender sender(args, chan);
    if (!sender.run()) {
        std::cerr << "[" << peer << "] session ended with "
                  << segx_error_name(sender.outcome().error) << "\n";
    }

    std::cerr << "[" << peer << "] connection closed\n";
    --g_active;
}

int main(int argc, char** argv) {
    ServerArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    std::signal(SIGPIPE, SIG_IGN);

    int listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd < 0) { perror("socket"); return 2; }

    int opt = 1;
    if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        perror("setsockopt(SO_REUSEADDR)");
        return 2;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(args.port);

    if (bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("bind");
        return 2;
    }
    if (listen(listen_fd, args.backlog) < 0) {
        perror("listen");
        return 2;
    }

    std::cerr << "Serving " << args.session.root << " on port " << args.port
              << " (segment " << args.session.segment_size << " bytes, "
              << args.session.max_retries << " attempts per segment)\n";

    uint32_t accepted = 0;
    while (true) {
        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);

        int conn_fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (conn_fd < 0) {
            if (errno == EINTR) continue;
            perror("accept");
            continue;
        }

        char peer_ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &peer.sin_addr, peer_ip, sizeof(peer_ip));
        std::string tag = std::string(peer_ip) + ":" + std::to_string(ntohs(peer.sin_port));
        std::cerr << "Accepted connection from " << tag << " (" << (g_active + 1) << " active)\n";

        // Each session gets its own seed so seeded runs stay reproducible
        SegSenderArgs session = args.session;
        if (session.seed) session.seed = *session.seed + accepted;
        ++accepted;

        std::thread(serve, conn_fd, tag, session).detach();
    }

    ::close(listen_fd);
    return 0;
}
