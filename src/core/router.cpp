#include <resplite/core/router.hpp>
#include <resplite/proto/encoder.hpp>
#include <algorithm>
#include <cctype>
#include <exception>

namespace resplite {

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    Router::Router() {
        h_["PING"] = [](auto const& a) {
            if (a.size() > 2) return resp_error("wrong number of arguments for 'ping' command");
            if (a.size() == 2) return resp_bulk(a[1]);
            return resp_bulk("PONG");
            };

        h_["ECHO"] = [](auto const& a) {
            if (a.size() != 2) return resp_error("wrong number of arguments for 'echo' command");
            return resp_bulk(a[1]);
            };
    }

    std::string Router::dispatch(const RespValue& cmd) {
        if (!cmd.is_list()) return resp_error("expected an array of strings");
        std::vector<std::string> args;
        args.reserve(cmd.items.size());
        for (auto& it : cmd.items) {
            if (!it.is_str()) return resp_error("expected an array of strings");
            args.push_back(it.s);
        }
        return dispatch(args);
    }

    std::string Router::dispatch(const std::vector<std::string>& args) {
        if (args.empty()) return resp_error("empty command");
        auto it = h_.find(upper(args[0]));
        if (it == h_.end()) return resp_error("unknown command '" + args[0] + "'");
        try {
            return it->second(args);
        }
        catch (const std::exception& e) {
            return resp_error(std::string("server error: ") + e.what());
        }
    }

} // namespace resplite
