#pragma once
#include <string>
#include <vector>
#include <utility>

namespace resplite {

	// One decoded RESP value. Simple and bulk strings both land in Str;
	// arrays land in List and may nest to any depth.
	struct RespValue {
		enum class Kind { Str, List };

		Kind kind = Kind::Str;
		std::string s;                 // Str (valid UTF-8)
		std::vector<RespValue> items;  // List

		static RespValue str(std::string text) {
			RespValue v;
			v.kind = Kind::Str;
			v.s = std::move(text);
			return v;
		}

		static RespValue list(std::vector<RespValue> elems = {}) {
			RespValue v;
			v.kind = Kind::List;
			v.items = std::move(elems);
			return v;
		}

		bool is_str() const { return kind == Kind::Str; }
		bool is_list() const { return kind == Kind::List; }
	};

	bool operator==(const RespValue& a, const RespValue& b);
	inline bool operator!=(const RespValue& a, const RespValue& b) { return !(a == b); }

} // namespace resplite
