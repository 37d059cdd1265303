#pragma once
#include <string>
#include <system_error>

namespace resplite {

	enum class RespErrc {
		UnexpectedInput = 1,  // bytes match no production at this position
		InvalidUnicode,       // string body is not valid UTF-8
		NotEnoughData,        // input ended early; retry with more bytes
		TooDeeplyNested,      // array nesting beyond DecoderOptions::max_depth
		LengthOutOfRange,     // length prefix or inline line exceeded its limit
	};

} // namespace resplite

namespace std {
	template <>
	struct is_error_code_enum<resplite::RespErrc> : true_type {};
} // namespace std

namespace resplite {

	const std::error_category& resp_category() noexcept;
	std::error_code make_error_code(RespErrc e) noexcept;

	struct DecodeError {
		std::error_code code;
		std::string bytes;  // unconsumed input at the failing position

		std::string message() const;
	};

	// NotEnoughData is the only kind a caller should answer by reading more.
	inline bool is_incomplete(const DecodeError& e) {
		return e.code == make_error_code(RespErrc::NotEnoughData);
	}

} // namespace resplite
