#include "chunkswarm/directory/DirectoryServer.hpp"

#include "chunkswarm/core/WorkerPool.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryMessages.hpp"
#include "chunkswarm/json/Json.hpp"
#include "chunkswarm/network/SocketIo.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>

namespace chunkswarm::directory {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

constexpr std::size_t kMaxLineLength = 8192;
constexpr std::size_t kMaxHeaderCount = 100;
constexpr int kListenBacklog = 128;
constexpr std::size_t kBodyReadSize = 64 * 1024;
constexpr std::string_view kGetFilePrefix = "/get_file/";
constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct ParseResult {
    bool success{false};
    bool connection_closed{false};
    HttpRequest request;
    int status{400};
    std::string error;
};

struct HttpResponse {
    int status{200};
    json::Value body;
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

bool recv_line(network::SocketHandle socket, std::string& line) {
    line.clear();
    std::uint8_t ch = 0;
    while (true) {
        std::size_t received = 0;
        if (network::recv_some(socket, &ch, 1, received) != network::IoStatus::Ok || received == 0) {
            return false;
        }
        if (ch == '\n') {
            break;
        }
        if (ch != '\r') {
            line.push_back(static_cast<char>(ch));
            if (line.size() > kMaxLineLength) {
                return false;
            }
        }
    }
    return true;
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + ch - 'a';
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + ch - 'A';
    }
    return -1;
}

std::string url_decode(std::string_view text, bool plus_as_space) {
    std::string output;
    output.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '%' && i + 2 < text.size()) {
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                output.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        output.push_back(plus_as_space && ch == '+' ? ' ' : ch);
    }
    return output;
}

std::map<std::string, std::string> parse_query(std::string_view query) {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            const auto key = url_decode(pair.substr(0, eq), true);
            const auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1), true);
            params.emplace(key, value);
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return params;
}

// Appends exactly length bytes, growing the buffer as data arrives.
bool read_body(network::SocketHandle client, std::size_t length, std::string& body) {
    std::uint8_t buffer[kBodyReadSize];
    while (length > 0) {
        const auto want = std::min(length, sizeof(buffer));
        if (network::recv_exact(client, buffer, want) != network::IoStatus::Ok) {
            return false;
        }
        body.append(reinterpret_cast<const char*>(buffer), want);
        length -= want;
    }
    return true;
}

// Decodes a Transfer-Encoding: chunked body; extensions and trailers are skipped.
bool read_chunked_body(network::SocketHandle client, std::size_t max_body_bytes, ParseResult& result) {
    auto& body = result.request.body;
    std::string line;
    while (true) {
        if (!recv_line(client, line)) {
            result.error = "Truncated chunked body";
            return false;
        }
        const auto size_text = trim(line.substr(0, line.find(';')));
        std::size_t size = 0;
        const auto parsed = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
        if (size_text.empty() || parsed.ec != std::errc{} || parsed.ptr != size_text.data() + size_text.size()) {
            result.error = "Invalid chunk size";
            return false;
        }
        if (size == 0) {
            break;
        }
        if (size > max_body_bytes - body.size()) {
            result.status = 413;
            result.error = "Request body too large";
            return false;
        }
        if (!read_body(client, size, body) || !recv_line(client, line) || !line.empty()) {
            result.error = "Truncated chunked body";
            return false;
        }
    }

    std::size_t trailers = 0;
    while (true) {
        if (!recv_line(client, line)) {
            result.error = "Truncated chunked body";
            return false;
        }
        if (line.empty()) {
            return true;
        }
        if (++trailers > kMaxHeaderCount) {
            result.status = 431;
            result.error = "Too many trailers";
            return false;
        }
    }
}

ParseResult parse_http_request(network::SocketHandle client, std::size_t max_body_bytes) {
    ParseResult result;
    std::string line;
    if (!recv_line(client, line)) {
        result.connection_closed = true;
        return result;
    }

    std::istringstream request_line(line);
    std::string target;
    std::string version;
    request_line >> result.request.method >> target >> version;
    if (result.request.method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0) {
        result.error = "Malformed request line";
        return result;
    }

    const auto question = target.find('?');
    result.request.path = url_decode(std::string_view(target).substr(0, question), false);
    if (question != std::string::npos) {
        result.request.query = parse_query(std::string_view(target).substr(question + 1));
    }

    std::size_t header_count = 0;
    while (true) {
        if (!recv_line(client, line)) {
            result.error = "Truncated request headers";
            return result;
        }
        if (line.empty()) {
            break;
        }
        if (++header_count > kMaxHeaderCount) {
            result.status = 431;
            result.error = "Too many headers";
            return result;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            result.error = "Malformed header";
            return result;
        }
        result.request.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    const auto& headers = result.request.headers;
    const auto encoding = headers.find("transfer-encoding");
    const auto length_header = headers.find("content-length");
    const bool chunked = encoding != headers.end() && to_lower(encoding->second) == "chunked";
    if (encoding != headers.end() && !chunked) {
        result.status = 501;
        result.error = "Unsupported Transfer-Encoding: " + encoding->second;
        return result;
    }

    std::optional<std::size_t> length;
    if (!chunked && length_header != headers.end()) {
        std::size_t value = 0;
        const auto& text = length_header->second;
        const auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
        if (parsed.ec != std::errc{} || parsed.ptr != text.data() + text.size()) {
            result.error = "Invalid Content-Length";
            return result;
        }
        if (value > max_body_bytes) {
            result.status = 413;
            result.error = "Request body too large";
            return result;
        }
        length = value;
    }

    if (!chunked && !length) {
        result.success = true;
        return result;
    }

    if (const auto expect = headers.find("expect");
        expect != headers.end() && to_lower(expect->second) == "100-continue"
        && network::send_all(client, std::string(kContinueResponse)) != network::IoStatus::Ok) {
        result.connection_closed = true;
        return result;
    }

    if (chunked) {
        if (!read_chunked_body(client, max_body_bytes, result)) {
            return result;
        }
    } else if (!read_body(client, *length, result.request.body)) {
        result.error = "Truncated request body";
        return result;
    }

    result.success = true;
    return result;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 413:
            return "Payload Too Large";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 501:
            return "Not Implemented";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

network::IoStatus send_response(network::SocketHandle client, const HttpResponse& response) {
    const auto body = json::serialize(response.body);
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return network::send_all(client, oss.str());
}

HttpResponse error_response(int status, const std::string& message) {
    return HttpResponse{status, encode_error(message)};
}

}  // namespace

class DirectoryServer::Impl {
public:
    Impl(DirectoryRegistry& registry, Config config)
        : registry_(registry),
          config_(std::move(config)) {
        network::ensure_socket_runtime();
    }

    ~Impl() {
        stop();
    }

    void start(const std::string& host, std::uint16_t port) {
        if (running_.load(std::memory_order_acquire)) {
            return;
        }
        listen_socket_ = network::open_listener(host, port, kListenBacklog);
        bound_port_ = network::local_port(listen_socket_);
        pool_ = std::make_unique<WorkerPool>(config_.directory_worker_threads,
                                             config_.server_max_pending_connections,
                                             "directory");
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this, listen_socket_);
        log_event(StructuredLogger::Level::Info,
                  "directory.listening",
                  {{"host", host}, {"port", std::to_string(bound_port_)}});
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        const auto socket = listen_socket_;
        listen_socket_ = network::kInvalidSocket;
        network::shutdown_socket(socket);
        network::close_socket(socket);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (pool_) {
            pool_->shutdown();
            pool_.reset();
        }
        log_event(StructuredLogger::Level::Info,
                  "directory.stopped",
                  {{"port", std::to_string(bound_port_)}, {"files", std::to_string(registry_.file_count())}});
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t listening_port() const noexcept {
        return bound_port_;
    }

private:
    DirectoryRegistry& registry_;
    Config config_;
    std::atomic<bool> running_{false};
    network::SocketHandle listen_socket_{network::kInvalidSocket};
    std::uint16_t bound_port_{0};
    std::thread accept_thread_;
    std::unique_ptr<WorkerPool> pool_;

    // Works on its own copy of the handle; only start() and stop() touch listen_socket_.
    void accept_loop(network::SocketHandle listener) {
        while (running_.load(std::memory_order_acquire)) {
            std::string remote;
            const auto client = network::accept_connection(listener, remote);
            if (client == network::kInvalidSocket) {
                if (running_.load(std::memory_order_acquire)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            if (!network::set_socket_timeouts(client, config_.server_socket_timeout)) {
                log_event(StructuredLogger::Level::Warning, "directory.connection.timeout_unset", {{"remote", remote}});
            }
            auto connection = std::make_shared<network::ScopedSocket>(client);
            const bool queued = pool_->submit([this, connection, remote]() {
                handle_client(connection->get(), remote);
            });
            if (!queued) {
                log_event(StructuredLogger::Level::Warning, "directory.connection.busy", {{"remote", remote}});
                static_cast<void>(send_response(connection->get(), error_response(503, "Server busy")));
            }
        }
    }

    void handle_client(network::SocketHandle client, const std::string& remote) {
        HttpResponse response;
        std::string method;
        std::string path;
        try {
            const auto parse = parse_http_request(client, config_.directory_max_body_bytes);
            if (parse.connection_closed) {
                return;
            }
            if (!parse.success) {
                log_event(StructuredLogger::Level::Warning,
                          "directory.request.parse_error",
                          {{"remote", remote}, {"error", parse.error}});
                response = error_response(parse.status, parse.error);
            } else {
                method = parse.request.method;
                path = parse.request.path;
                response = route(parse.request);
            }
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Error,
                      "directory.request.failed",
                      {{"remote", remote}, {"path", path}, {"error", ex.what()}});
            response = error_response(500, "Internal server error");
        }

        const auto status = send_response(client, response);
        log_event(status == network::IoStatus::Ok ? StructuredLogger::Level::Info : StructuredLogger::Level::Warning,
                  "directory.request",
                  {{"remote", remote},
                   {"method", method},
                   {"path", path},
                   {"status", std::to_string(response.status)},
                   {"send", network::io_status_to_string(status)}});
    }

    HttpResponse route(const HttpRequest& request) {
        if (request.path == "/register") {
            if (request.method != "POST") {
                return error_response(405, "Method not allowed");
            }
            return handle_register(request);
        }
        if (request.path == "/lookup") {
            if (request.method != "GET") {
                return error_response(405, "Method not allowed");
            }
            const auto it = request.query.find("file_name");
            if (it == request.query.end() || it->second.empty()) {
                return error_response(400, "Missing file_name parameter");
            }
            return handle_lookup(it->second);
        }
        if (request.path.rfind(kGetFilePrefix, 0) == 0) {
            if (request.method != "GET") {
                return error_response(405, "Method not allowed");
            }
            return handle_lookup(request.path.substr(kGetFilePrefix.size()));
        }
        if (request.path == "/files") {
            if (request.method != "GET") {
                return error_response(405, "Method not allowed");
            }
            return HttpResponse{200, encode_file_list(registry_.list_files())};
        }
        return error_response(404, "Not found");
    }

    HttpResponse handle_register(const HttpRequest& request) {
        json::Value body;
        try {
            body = json::parse(request.body);
        } catch (const json::ParseError& ex) {
            return error_response(400, std::string("Invalid JSON body: ") + ex.what());
        }

        FileDescriptor file{};
        PeerAdvertisement peer{};
        std::string error;
        if (!decode_registration(body, file, peer, error)) {
            return error_response(400, error);
        }
        const auto result = registry_.register_peer(file, peer);
        return HttpResponse{200, encode_registration_result(result, file.content_hash)};
    }

    HttpResponse handle_lookup(const std::string& file_name) {
        const auto lookup = registry_.lookup_by_name(file_name);
        if (!lookup.has_value()) {
            return error_response(404, "File not found");
        }
        return HttpResponse{200, encode_lookup(*lookup)};
    }
};

DirectoryServer::DirectoryServer(DirectoryRegistry& registry, Config config)
    : impl_(std::make_unique<Impl>(registry, std::move(config))) {}

DirectoryServer::~DirectoryServer() = default;

void DirectoryServer::start(const std::string& host, std::uint16_t port) {
    impl_->start(host, port);
}

void DirectoryServer::stop() {
    impl_->stop();
}

bool DirectoryServer::running() const noexcept {
    return impl_->running();
}

std::uint16_t DirectoryServer::listening_port() const noexcept {
    return impl_->listening_port();
}

}  // namespace chunkswarm::directory
