#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <resplite/proto/errors.hpp>
#include <resplite/proto/value.hpp>

namespace resplite {

	struct DecoderOptions {
		std::size_t max_depth = 128;                  // nested arrays; top-level array is depth 1
		std::size_t max_bulk_len = 512u * 1024 * 1024; // same default as Redis proto-max-bulk-len
		std::size_t max_array_len = 1024 * 1024;
		std::size_t max_inline_len = 64 * 1024;        // simple string body, same as Redis PROTO_INLINE_MAX_SIZE
	};

	// Result of trying to decode one value from the front of a byte buffer.
	struct RespParseResult {
		std::optional<RespValue> value;  // present on success
		std::optional<DecodeError> error; // present on failure
		std::string_view rest;           // unconsumed suffix of the input (whole input on failure)
		std::size_t consumed = 0;        // how many bytes the caller may drop

		explicit operator bool() const { return value.has_value(); }
		bool incomplete() const { return error && is_incomplete(*error); }
	};

	// Decode exactly one value from the front of input.
	// Never throws for malformed input; failures are reported in error and
	// decoding is all-or-nothing.
	RespParseResult parse_resp(std::string_view input, const DecoderOptions& opts = {});
	RespParseResult parse_resp(const char* data, std::size_t len, const DecoderOptions& opts = {});

} // namespace resplite
