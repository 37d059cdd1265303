#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <resplite/core/router.hpp>
#include <resplite/net/server.hpp>
#include <resplite/proto/decoder.hpp>

using namespace resplite;

static void usage() {
    std::cout << "Usage: resplite-server [--port N] [--max-depth N] [--max-bulk-len N] [--max-inline-len N] [--max-query-buf N]\n";
}

int main(int argc, char** argv) {
    uint16_t port = 6379;
    SessionOptions opts;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if ((a == "--port" || a == "-p") && i + 1 < argc) {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (a == "--max-depth" && i + 1 < argc) {
                opts.decoder.max_depth = static_cast<size_t>(std::stoull(argv[++i]));
            }
            else if (a == "--max-bulk-len" && i + 1 < argc) {
                opts.decoder.max_bulk_len = static_cast<size_t>(std::stoull(argv[++i]));
            }
            else if (a == "--max-inline-len" && i + 1 < argc) {
                opts.decoder.max_inline_len = static_cast<size_t>(std::stoull(argv[++i]));
            }
            else if (a == "--max-query-buf" && i + 1 < argc) {
                opts.max_query_buf = static_cast<size_t>(std::stoull(argv[++i]));
            }
            else if (a == "--help" || a == "-?") {
                usage();
                return 0;
            }
            else if (i == 1 && a.find_first_not_of("0123456789") == std::string::npos) {
                // first arg as port (e.g., "6379")
                port = static_cast<uint16_t>(std::stoi(a));
            }
            else {
                std::cerr << "unknown argument: " << a << "\n";
                usage();
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        return 1;
    }

    try {
        asio::io_context io;
        Router router;
        Server server(io, port, router, opts);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code&, int) { io.stop(); });

        std::cout << "resplite RESP server on " << server.port()
            << " (max depth " << opts.decoder.max_depth << ", max bulk " << opts.decoder.max_bulk_len << " bytes) ...\n";

        io.run();
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
