#pragma once
#include <asio.hpp>
#include <resplite/core/router.hpp>
#include <resplite/net/session.hpp>

namespace resplite {

	class Server {
	public:
		Server(asio::io_context& io, uint16_t port, Router& router, const SessionOptions& opts);
		uint16_t port() const { return acceptor_.local_endpoint().port(); }
	private:
		void accept();
		asio::ip::tcp::acceptor acceptor_;
		Router& router_;
		SessionOptions opts_;
	};

} // namespace resplite
