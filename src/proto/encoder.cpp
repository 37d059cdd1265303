#include <resplite/proto/encoder.hpp>

namespace resplite {

    namespace {

        std::size_t digits(std::size_t n) {
            std::size_t d = 1;
            while (n >= 10) { n /= 10; ++d; }
            return d;
        }

        void put_header(std::string& out, char tag, std::size_t n) {
            out.push_back(tag);
            out += std::to_string(n);
            out += "\r\n";
        }

    } // namespace

    void encode_to(std::string& out, const RespValue& v) {
        if (v.is_str()) {
            put_header(out, '$', v.s.size());
            out += v.s;
            out += "\r\n";
            return;
        }
        put_header(out, '*', v.items.size());
        for (auto& it : v.items) encode_to(out, it);
    }

    std::string encode(const RespValue& v) {
        std::string out;
        out.reserve(encoded_size(v));
        encode_to(out, v);
        return out;
    }

    std::size_t encoded_size(const RespValue& v) {
        if (v.is_str()) return 1 + digits(v.s.size()) + 2 + v.s.size() + 2;
        std::size_t n = 1 + digits(v.items.size()) + 2;
        for (auto& it : v.items) n += encoded_size(it);
        return n;
    }

    std::string resp_bulk(std::string_view s) {
        std::string out;
        put_header(out, '$', s.size());
        out.append(s.data(), s.size());
        out += "\r\n";
        return out;
    }

    std::string resp_error(std::string_view s) {
        std::string out = "-ERR ";
        // an error line cannot carry CR or LF
        for (char c : s) out.push_back(c == '\r' || c == '\n' ? ' ' : c);
        out += "\r\n";
        return out;
    }

} // namespace resplite
