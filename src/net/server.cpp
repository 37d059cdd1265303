#include <resplite/net/server.hpp>
#include <resplite/net/session.hpp>
#include <iostream>
using asio::ip::tcp;

namespace resplite {

    Server::Server(asio::io_context& io, uint16_t port, Router& router, const SessionOptions& opts)
        : acceptor_(io, tcp::endpoint(tcp::v4(), port))
        , router_(router)
        , opts_(opts) {
        accept();
    }

    void Server::accept() {
        acceptor_.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<Session>(std::move(socket), router_, opts_)->start();
            }
            else if (ec == asio::error::operation_aborted) {
                return;
            }
            else {
                std::cerr << "accept failed: " << ec.message() << "\n";
            }
            accept();
            });
    }

} // namespace resplite
