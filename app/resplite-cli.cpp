#include <asio.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <cctype>
#include <resplite/proto/decoder.hpp>
#include <resplite/proto/encoder.hpp>

using asio::ip::tcp;
using namespace resplite;

// ---------- simple tokenizer: splits like a shell (supports "quoted strings")
static std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool inq = false;
    char q = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (!inq && std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
            continue;
        }
        if (!inq && (c == '"' || c == '\'')) { inq = true; q = c; continue; }
        if (inq && c == q) { inq = false; continue; }
        if (inq && c == '\\' && i + 1 < line.size()) {
            char n = line[++i];
            switch (n) {
            case 'n': cur.push_back('\n'); break;
            case 'r': cur.push_back('\r'); break;
            case 't': cur.push_back('\t'); break;
            default: cur.push_back(n); break;
            }
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static bool fill(tcp::socket& sock, std::string& buf) {
    char tmp[4096];
    asio::error_code ec;
    std::size_t n = sock.read_some(asio::buffer(tmp), ec);
    if (ec) return false;
    buf.append(tmp, tmp + n);
    return true;
}

// Error replies ("-ERR ...\r\n") are outside the value model, so they are
// split off here before the decoder sees the buffer.
static bool read_error_line(tcp::socket& sock, std::string& buf, std::string& line) {
    for (;;) {
        auto pos = buf.find("\r\n");
        if (pos != std::string::npos) {
            line.assign(buf, 1, pos - 1);
            buf.erase(0, pos + 2);
            return true;
        }
        if (!fill(sock, buf)) return false;
    }
}

static void print_val(const RespValue& v, size_t indent = 0) {
    if (v.is_str()) { std::cout << "\"" << v.s << "\"\n"; return; }
    if (v.items.empty()) { std::cout << "(empty array)\n"; return; }
    for (size_t i = 0; i < v.items.size(); ++i) {
        if (i > 0) std::cout << std::string(indent, ' ');
        std::cout << i + 1 << ") ";
        print_val(v.items[i], indent + 3);
    }
}

int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-h" || a == "--host") && i + 1 < argc) { host = argv[++i]; }
        else if ((a == "-p" || a == "--port") && i + 1 < argc) { port = static_cast<uint16_t>(std::stoi(argv[++i])); }
        else if (a == "-?" || a == "--help") {
            std::cout << "Usage: resplite-cli [-h host] [-p port]\n"; return 0;
        }
    }

    try {
        asio::io_context io;
        tcp::resolver res(io);
        auto eps = res.resolve(host, std::to_string(port));
        tcp::socket sock(io);
        asio::connect(sock, eps);

        std::cout << "Connected to " << host << ":" << port << "\n";
        std::cout << "Type commands like:  PING  |  ECHO \"hello\"\n";
        std::cout << "Ctrl+C to quit.\n";
        std::string readbuf;

        for (;;) {
            std::cout << "> ";
            std::string line;
            if (!std::getline(std::cin, line)) break;
            auto args = tokenize(line);
            if (args.empty()) continue;
            if (args.size() == 1 && (args[0] == "QUIT" || args[0] == "quit")) break;

            std::vector<RespValue> cmd;
            for (auto& a : args) cmd.push_back(RespValue::str(a));
            std::string req = encode(RespValue::list(std::move(cmd)));
            asio::write(sock, asio::buffer(req));

            bool ok = true;
            for (;;) {
                if (readbuf.empty() && !fill(sock, readbuf)) { ok = false; break; }
                if (readbuf[0] == '-') {
                    std::string err;
                    if (!read_error_line(sock, readbuf, err)) { ok = false; break; }
                    std::cout << "(error) " << err << "\n";
                    break;
                }
                auto r = parse_resp(readbuf);
                if (r.incomplete()) {
                    if (!fill(sock, readbuf)) { ok = false; break; }
                    continue;
                }
                if (r.error) {
                    std::cout << "(protocol error) " << r.error->message() << "\n";
                    ok = false;
                    break;
                }
                print_val(*r.value);
                readbuf.erase(0, r.consumed);
                break;
            }
            if (!ok) { std::cout << "(connection closed)\n"; break; }
        }

        sock.close();
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
