#include "headers/http.hpp"
#include "headers/session.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>
#include <iostream>
#include <tuple>

using json = nlohmann::json;

namespace {

    const std::string kAudioPrefix = "/audio/";
    const std::string kStaticPrefix = "/static/";

    bool startsWith(const std::string& text, const std::string& prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }

    bool endsWith(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() &&
            text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Decodes %XX escapes. Fails on a truncated or non-hex escape and on NUL.
    bool percentDecode(const std::string& in, std::string& out) {
        out.clear();
        out.reserve(in.size());
        for (std::size_t i = 0; i < in.size(); ++i) {
            char c = in[i];
            if (c == '%') {
                if (i + 2 >= in.size()) {
                    return false;
                }
                int hi = hexValue(in[i + 1]);
                int lo = hexValue(in[i + 2]);
                if (hi < 0 || lo < 0) {
                    return false;
                }
                c = static_cast<char>(hi * 16 + lo);
                i += 2;
            }
            if (c == '\0') {
                return false;
            }
            out.push_back(c);
        }
        return true;
    }

    // True when a path segment is exactly "..".
    bool climbsOut(const std::string& path) {
        std::size_t begin = 0;
        while (begin <= path.size()) {
            std::size_t end = path.find_first_of("/\\", begin);
            if (end == std::string::npos) {
                end = path.size();
            }
            if (path.compare(begin, end - begin, "..") == 0) {
                return true;
            }
            begin = end + 1;
        }
        return false;
    }

}

std::string mimeType(const std::string& path) {
    auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? "" : path.substr(dot);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (ext == ".htm" || ext == ".html") return "text/html";
    if (ext == ".css")  return "text/css";
    if (ext == ".txt")  return "text/plain";
    if (ext == ".js")   return "application/javascript";
    if (ext == ".json") return "application/json";
    if (ext == ".png")  return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif")  return "image/gif";
    if (ext == ".ico")  return "image/vnd.microsoft.icon";
    if (ext == ".svg")  return "image/svg+xml";
    if (ext == ".mp3")  return "audio/mpeg";
    if (ext == ".wav")  return "audio/wav";
    if (ext == ".ogg")  return "audio/ogg";
    return "application/octet-stream";
}

HttpConnection::HttpConnection(tcp::socket&& socket, int id, const AudioLibrary& library, const HttpSettings& settings)
    : stream_(std::move(socket)), id_(id), library_(library), settings_(settings) {
}

void HttpConnection::run() {
    auto self = shared_from_this();
    net::dispatch(stream_.get_executor(), [self]() {
        self->do_read();
        });
}

template <class Body>
void HttpConnection::send(http::response<Body>&& res) {
    res.set(http::field::server, "AudioStreamServer");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(req_.keep_alive());

    // The read deadline must not cut off a long file body.
    stream_.expires_never();

    auto response = std::make_shared<http::response<Body>>(std::move(res));
    auto self = shared_from_this();
    http::async_write(stream_, *response,
        [self, response](beast::error_code ec, std::size_t) {
            self->on_write(response->need_eof(), ec);
        });
}

void HttpConnection::do_read() {
    req_ = {};
    stream_.expires_after(settings_.read_timeout);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, req_,
        [self](beast::error_code ec, std::size_t bytes_transferred) {
            self->on_read(ec, bytes_transferred);
        });
}

void HttpConnection::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec) {
        std::cerr << "[conn " << id_ << "] HTTP read failed: " << ec.message() << std::endl;
        return;
    }

    if (websocket::is_upgrade(req_)) {
        // The session installs its own WebSocket timeouts.
        stream_.expires_never();
        std::make_shared<StreamSession>(stream_.release_socket(), id_, library_, settings_.transfer)
            ->run(std::move(req_));
        return;
    }

    handle_request();
}

http::response<http::string_body> HttpConnection::text_response(http::status status, const std::string& content_type, std::string body) const {
    http::response<http::string_body> res{ status, req_.version() };
    res.set(http::field::content_type, content_type);
    if (req_.method() == http::verb::head) {
        res.content_length(body.size());
    }
    else {
        res.body() = std::move(body);
        res.prepare_payload();
    }
    return res;
}

void HttpConnection::handle_request() {
    if (req_.method() == http::verb::options) {
        http::response<http::empty_body> res{ http::status::no_content, req_.version() };
        send(std::move(res));
        return;
    }
    if (req_.method() != http::verb::get && req_.method() != http::verb::head) {
        send(text_response(http::status::bad_request, "text/plain", "Unknown HTTP-method"));
        return;
    }

    std::string raw(req_.target().data(), req_.target().size());
    auto query = raw.find('?');
    if (query != std::string::npos) {
        raw.erase(query);
    }

    std::string target;
    if (!percentDecode(raw, target) || target.empty() || target[0] != '/' || climbsOut(target)) {
        send(text_response(http::status::bad_request, "text/plain", "Illegal request-target"));
        return;
    }

    if (target == "/ping") {
        send(text_response(http::status::ok, "text/plain", "pong"));
        return;
    }

    if (target == "/audios" || target == "/api/audio/list") {
        json body = json::array();
        try {
            if (target == "/audios") {
                for (const auto& name : library_.list()) {
                    body.push_back(name);
                }
            }
            else {
                for (const auto& entry : library_.describe(kAudioPrefix)) {
                    body.push_back({
                        {"name", entry.name},
                        {"path", entry.path},
                        {"size", entry.size},
                        {"duration", entry.duration}
                    });
                }
            }
        }
        catch (const fs::filesystem_error& e) {
            std::cerr << "[conn " << id_ << "] Failed to read audio directory: " << e.what() << std::endl;
            send(text_response(http::status::internal_server_error, "text/plain", "Failed to read audio directory"));
            return;
        }
        send(text_response(http::status::ok, "application/json", body.dump()));
        return;
    }

    if (startsWith(target, kAudioPrefix)) {
        auto path = library_.resolve(target.substr(kAudioPrefix.size()));
        if (!path) {
            send(text_response(http::status::not_found, "text/plain", "The resource '" + target + "' was not found."));
            return;
        }
        send_file(*path);
        return;
    }

    std::string relative = startsWith(target, kStaticPrefix)
        ? target.substr(kStaticPrefix.size())
        : target.substr(1);
    if (relative.empty() || endsWith(relative, "/")) {
        relative += "index.html";
    }
    send_file(settings_.static_dir / relative);
}

void HttpConnection::send_file(const fs::path& path) {
    beast::error_code ec;
    http::file_body::value_type body;
    if (fs::is_directory(path, ec)) {
        ec = beast::errc::make_error_code(beast::errc::no_such_file_or_directory);
    }
    else {
        body.open(path.string().c_str(), beast::file_mode::scan, ec);
    }

    if (ec == beast::errc::no_such_file_or_directory) {
        std::string target(req_.target().data(), req_.target().size());
        send(text_response(http::status::not_found, "text/plain", "The resource '" + target + "' was not found."));
        return;
    }
    if (ec) {
        std::cerr << "[conn " << id_ << "] Error opening " << path.string() << ": " << ec.message() << std::endl;
        send(text_response(http::status::internal_server_error, "text/plain", "An error occurred: '" + ec.message() + "'"));
        return;
    }

    auto const size = body.size();
    if (req_.method() == http::verb::head) {
        http::response<http::empty_body> res{ http::status::ok, req_.version() };
        res.set(http::field::content_type, mimeType(path.string()));
        res.content_length(size);
        send(std::move(res));
        return;
    }

    http::response<http::file_body> res{
        std::piecewise_construct,
        std::make_tuple(std::move(body)),
        std::make_tuple(http::status::ok, req_.version()) };
    res.set(http::field::content_type, mimeType(path.string()));
    res.content_length(size);
    send(std::move(res));
}

void HttpConnection::on_write(bool close, beast::error_code ec) {
    if (ec) {
        std::cerr << "[conn " << id_ << "] HTTP write failed: " << ec.message() << std::endl;
        return;
    }
    if (close) {
        do_close();
        return;
    }
    do_read();
}

void HttpConnection::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
