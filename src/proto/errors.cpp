#include <resplite/proto/errors.hpp>
#include <cstdio>

namespace resplite {

    namespace {

        class RespCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "resp"; }

            std::string message(int ev) const override {
                switch (static_cast<RespErrc>(ev)) {
                case RespErrc::UnexpectedInput:  return "unexpected input";
                case RespErrc::InvalidUnicode:   return "invalid unicode in string";
                case RespErrc::NotEnoughData:    return "not enough data";
                case RespErrc::TooDeeplyNested:  return "too deeply nested";
                case RespErrc::LengthOutOfRange: return "length out of range";
                }
                return "unknown resp error";
            }
        };

        // printable rendering of raw bytes, e.g. "\r\n" -> "\\r\\n"
        std::string escape(const std::string& b) {
            std::string out;
            out.reserve(b.size());
            for (unsigned char c : b) {
                switch (c) {
                case '\r': out += "\\r"; break;
                case '\n': out += "\\n"; break;
                case '\\': out += "\\\\"; break;
                default:
                    if (c >= 0x20 && c < 0x7f) { out.push_back(static_cast<char>(c)); }
                    else {
                        char hex[5];
                        std::snprintf(hex, sizeof(hex), "\\x%02x", c);
                        out += hex;
                    }
                }
            }
            return out;
        }

    } // namespace

    const std::error_category& resp_category() noexcept {
        static RespCategory cat;
        return cat;
    }

    std::error_code make_error_code(RespErrc e) noexcept {
        return { static_cast<int>(e), resp_category() };
    }

    std::string DecodeError::message() const {
        if (bytes.empty()) return code.message();
        return code.message() + " near '" + escape(bytes) + "'";
    }

} // namespace resplite
