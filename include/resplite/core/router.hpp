#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <resplite/proto/value.hpp>

namespace resplite {

	// Maps command names (case-insensitive) to handlers returning encoded reply bytes.
	class Router {
	public:
		using Handler = std::function<std::string(const std::vector<std::string>&)>;
		Router();

		// cmd must be a List of Str: command name followed by its arguments.
		std::string dispatch(const RespValue& cmd);
		std::string dispatch(const std::vector<std::string>& args);

	private:
		std::unordered_map<std::string, Handler> h_;
	};

} // namespace resplite
