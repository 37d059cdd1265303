#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <resplite/proto/value.hpp>

namespace resplite {

	// Str is always written as a bulk string, never as a simple string, so
	// decode(encode(v)) preserves content but not the original wire bytes.
	std::string encode(const RespValue& v);
	void encode_to(std::string& out, const RespValue& v);

	// Exact length of encode(v).
	std::size_t encoded_size(const RespValue& v);

	// Reply emitters for the command layer
	std::string resp_bulk(std::string_view s);   // $len\r\n...\r\n
	std::string resp_error(std::string_view s);  // -ERR msg\r\n

} // namespace resplite
