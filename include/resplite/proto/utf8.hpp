#pragma once
#include <string_view>

namespace resplite {

	// Strict UTF-8: rejects overlong forms, surrogates and code points above U+10FFFF.
	bool valid_utf8(std::string_view s);

} // namespace resplite
