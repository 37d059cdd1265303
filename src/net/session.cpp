#include <resplite/net/session.hpp>
#include <resplite/proto/encoder.hpp>
#include <asio/write.hpp>
#include <iostream>

using asio::ip::tcp;

namespace resplite {

    Session::Session(tcp::socket sock, Router& router, const SessionOptions& opts)
        : socket_(std::move(sock))
        , router_(router)
        , opts_(opts) {
        inbuf_.resize(8 * 1024);
    }

    void Session::start() { do_read(); }

    void Session::do_read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(inbuf_),
            [this, self](std::error_code ec, std::size_t n) {
                if (ec) {
                    if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                        std::cerr << "read failed: " << ec.message() << "\n";
                    return;
                }
                pending_.append(inbuf_.data(), n);
                if (drain_pending()) do_read();
            });
    }

    bool Session::drain_pending() {
        while (!pending_.empty()) {
            auto res = parse_resp(pending_, opts_.decoder);
            if (res.incomplete()) break;  // need more
            if (res.error) {
                // unrecoverable for this buffer: report, then drop the connection
                enqueue_write(resp_error("Protocol error: " + res.error->message()));
                closing_ = true;
                return false;
            }
            auto reply = router_.dispatch(*res.value);
            pending_.erase(0, res.consumed);
            enqueue_write(std::move(reply));
        }
        if (pending_.size() > opts_.max_query_buf) {
            enqueue_write(resp_error("Protocol error: query buffer limit exceeded"));
            closing_ = true;
            return false;
        }
        return true;
    }

    void Session::enqueue_write(std::string msg) {
        bool writing = !outq_.empty();
        outq_.push_back(std::move(msg));
        if (!writing) do_write();
    }

    void Session::do_write() {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outq_.front()),
            [this, self](std::error_code ec, std::size_t) {
                if (ec) { close(); return; }
                outq_.pop_front();
                if (!outq_.empty()) do_write();
                else if (closing_) close();
            });
    }

    void Session::close() {
        std::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

} // namespace resplite
