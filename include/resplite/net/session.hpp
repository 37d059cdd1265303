#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <resplite/core/router.hpp>
#include <resplite/proto/decoder.hpp>

namespace resplite {

	struct SessionOptions {
		DecoderOptions decoder;
		// unparsed bytes a client may leave pending, same default as Redis client-query-buffer-limit
		std::size_t max_query_buf = 1024u * 1024 * 1024;
	};

	class Session : public std::enable_shared_from_this<Session> {
	public:
		Session(asio::ip::tcp::socket sock, Router& router, const SessionOptions& opts);
		void start();

	private:
		void do_read();
		void do_write();
		void enqueue_write(std::string msg);
		// Decodes and answers every complete command in pending_.
		// Returns false once the connection has to be closed.
		bool drain_pending();
		void close();

		asio::ip::tcp::socket socket_;
		std::vector<char> inbuf_;
		std::string pending_;
		std::deque<std::string> outq_;
		bool closing_ = false;

		Router& router_;
		SessionOptions opts_;
	};

} // namespace resplite
