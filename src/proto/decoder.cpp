#include <resplite/proto/decoder.hpp>
#include <resplite/proto/utf8.hpp>
#include <algorithm>
#include <utility>

namespace resplite {

    namespace {

        // Error payloads keep at most this many bytes of the remaining input.
        constexpr std::size_t kErrorContext = 256;

        RespParseResult fail(RespErrc e, std::string_view at) {
            RespParseResult r;
            r.error = DecodeError{ make_error_code(e), std::string(at.substr(0, kErrorContext)) };
            return r;
        }

        RespParseResult ok(RespValue v, std::string_view rest) {
            RespParseResult r;
            r.value = std::move(v);
            r.rest = rest;
            return r;
        }

        // Reads "<digits>\r\n" from the front of in. On success n holds the value
        // and in is advanced past the CRLF.
        std::optional<RespParseResult> read_length(std::string_view& in, std::size_t limit, std::size_t& n) {
            std::size_t acc = 0;
            std::size_t i = 0;
            for (;; ++i) {
                if (i >= in.size()) return fail(RespErrc::NotEnoughData, in);
                char c = in[i];
                if (c == '\r') {
                    if (i + 1 >= in.size()) return fail(RespErrc::NotEnoughData, in);
                    if (in[i + 1] != '\n' || i == 0) return fail(RespErrc::UnexpectedInput, in.substr(i));
                    break;
                }
                if (c < '0' || c > '9') return fail(RespErrc::UnexpectedInput, in.substr(i));
                std::size_t d = static_cast<std::size_t>(c - '0');
                if (d > limit || acc > (limit - d) / 10) return fail(RespErrc::LengthOutOfRange, in);
                acc = acc * 10 + d;
            }
            n = acc;
            in.remove_prefix(i + 2);
            return std::nullopt;
        }

        RespParseResult decode_at(std::string_view in, std::size_t depth, const DecoderOptions& opts);

        RespParseResult decode_simple(std::string_view in, const DecoderOptions& opts) {
            // in starts just after '+'; the CRLF has to start within max_inline_len bytes
            const std::size_t limit = opts.max_inline_len;
            auto window = in.substr(0, limit < in.size() ? limit + 2 : in.size());
            auto end = window.find("\r\n");
            if (end == std::string_view::npos) {
                // only a CR sitting exactly at the limit can still become a valid terminator
                if (in.size() > limit && (in.size() - limit >= 2 || in[limit] != '\r'))
                    return fail(RespErrc::LengthOutOfRange, in);
                return fail(RespErrc::NotEnoughData, in);
            }
            auto body = in.substr(0, end);
            if (!valid_utf8(body)) return fail(RespErrc::InvalidUnicode, in);
            return ok(RespValue::str(std::string(body)), in.substr(end + 2));
        }

        RespParseResult decode_bulk(std::string_view in, const DecoderOptions& opts) {
            std::size_t n = 0;
            if (auto err = read_length(in, opts.max_bulk_len, n)) return std::move(*err);

            // body + CRLF
            if (in.size() < 2 || in.size() - 2 < n) return fail(RespErrc::NotEnoughData, in);
            if (in[n] != '\r' || in[n + 1] != '\n') return fail(RespErrc::UnexpectedInput, in.substr(n));
            auto body = in.substr(0, n);
            if (!valid_utf8(body)) return fail(RespErrc::InvalidUnicode, in);
            return ok(RespValue::str(std::string(body)), in.substr(n + 2));
        }

        RespParseResult decode_array(std::string_view in, std::size_t depth, const DecoderOptions& opts) {
            if (depth > opts.max_depth) return fail(RespErrc::TooDeeplyNested, in);

            std::size_t n = 0;
            if (auto err = read_length(in, opts.max_array_len, n)) return std::move(*err);
            if (n == 0) return ok(RespValue::list(), in);

            // every element takes at least 3 bytes ("+\r\n"), so don't trust n for the reservation
            std::vector<RespValue> items;
            items.reserve(std::min(n, in.size() / 3 + 1));
            for (std::size_t i = 0; i < n; ++i) {
                // the array is declared longer than what has arrived so far
                if (in.empty()) return fail(RespErrc::NotEnoughData, in);
                auto r = decode_at(in, depth, opts);
                if (!r.value) return r;
                items.push_back(std::move(*r.value));
                in = r.rest;
            }
            return ok(RespValue::list(std::move(items)), in);
        }

        // depth = number of arrays enclosing the value at in
        RespParseResult decode_at(std::string_view in, std::size_t depth, const DecoderOptions& opts) {
            if (in.empty()) return fail(RespErrc::UnexpectedInput, in);
            switch (in[0]) {
            case '+': return decode_simple(in.substr(1), opts);
            case '$': return decode_bulk(in.substr(1), opts);
            case '*': return decode_array(in.substr(1), depth + 1, opts);
            default:  return fail(RespErrc::UnexpectedInput, in);
            }
        }

    } // namespace

    RespParseResult parse_resp(std::string_view input, const DecoderOptions& opts) {
        auto r = decode_at(input, 0, opts);
        if (r.value) {
            r.consumed = input.size() - r.rest.size();
        }
        else {
            r.rest = input;
            r.consumed = 0;
        }
        return r;
    }

    RespParseResult parse_resp(const char* data, std::size_t len, const DecoderOptions& opts) {
        return parse_resp(std::string_view{ data, len }, opts);
    }

} // namespace resplite
