#include "SegReceiver.h"
#include "SegxChannel.h"
#include "segx_output.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

struct ClientArgs {
    std::string host = "127.0.0.1";
    uint16_t port = 12345;
    std::vector<std::string> files;
    std::string out_dir = "downloads";
    int connect_retries = 3;
    SegReceiverArgs session;
};

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --file NAME [--file NAME ...] [--host A.B.C.D] [--port P]"
              << " [--error-prob P] [--timeout-ms MS] [--out-dir DIR] [--connect-retries N]\n";
}

static bool parse_args(int argc, char** argv, ClientArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (s == "--host" && need(1)) a.host = argv[++i];
            else if (s == "--port" && need(1)) a.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--file" && need(1)) a.files.push_back(argv[++i]);
            else if (s == "--error-prob" && need(1)) a.session.error_prob = std::stod(argv[++i]);
            else if (s == "--timeout-ms" && need(1)) a.session.idle_timeout_ms = std::stoi(argv[++i]);
            else if (s == "--out-dir" && need(1)) a.out_dir = argv[++i];
            else if (s == "--connect-retries" && need(1)) a.connect_retries = std::stoi(argv[++i]);
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << s << "\n";
            return false;
        }
    }

    if (a.files.empty()) { std::cerr << "--file is required\n"; usage(argv[0]); return false; }
    if (!(a.session.error_prob >= 0.0 && a.session.error_prob <= 1.0)) {
        std::cerr << "--error-prob must be within [0, 1]\n";
        return false;
    }
    if (a.connect_retries < 1) { std::cerr << "--connect-retries must be >= 1\n"; return false; }
    return true;
}

// Connects with exponential backoff (2, 4, 8 ... seconds between attempts)
static int connect_with_retry(const ClientArgs& a) {
    sockaddr_in server{};
    server.sin_family = AF_INET;
    server.sin_port = htons(a.port);
    if (inet_pton(AF_INET, a.host.c_str(), &server.sin_addr) != 1) {
        std::cerr << "Invalid server IP: " << a.host << "\n";
        return -1;
    }

    for (int attempt = 1; attempt <= a.connect_retries; ++attempt) {
        int sock = ::socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) { perror("socket"); return -1; }

        if (::connect(sock, reinterpret_cast<sockaddr*>(&server), sizeof(server)) == 0) {
            std::cerr << "Connected to " << a.host << ":" << a.port << "\n";
            return sock;
        }

        int err = errno;
        ::close(sock);
        if (err != ECONNREFUSED && err != ETIMEDOUT && err != EHOSTUNREACH) {
            errno = err;
            perror("connect");
            return -1;
        }

        if (attempt == a.connect_retries) break;
        int wait_s = 1 << attempt;
        std::cerr << "Connection attempt " << attempt << " failed; retrying in "
                  << wait_s << " s\n";
        std::this_thread::sleep_for(std::chrono::seconds(wait_s));
    }

    std::cerr << "Failed to connect after " << a.connect_retries << " attempts\n";
    return -1;
}

static bool save_file(const std::string& dir, const std::string& name, const std::vector<uint8_t>& data) {
    std::string path;
    if (!segx_save_file(dir, name, data, &path)) return false;
    std::cout << "Saved file: " << path << "\n";
    return true;
}

int main(int argc, char** argv) {
    ClientArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    std::signal(SIGPIPE, SIG_IGN);

    int failures = 0;
    for (const auto& name : args.files) {
        int sock = connect_with_retry(args);
        if (sock < 0) return 2;

        TcpChannel chan(sock);
        SegReceiverArgs session = args.session;
        session.filename = name;

        SegReceiver receiver(session, chan, [](const TransferEvent& ev) {
            std::cout << segx_describe(ev) << "\n";
        });

        if (!receiver.run() || !save_file(args.out_dir, name, receiver.file())) ++failures;
    }

    return failures == 0 ? 0 : 3;
}
