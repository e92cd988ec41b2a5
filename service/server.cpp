//
// Created by gregorian-rayne on 10/08/26.
//

#include "server.hpp"
#include "ars/utils/log.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/select.h>
#include <cerrno>

namespace ars::service {

    namespace {

        constexpr std::size_t READ_CHUNK_SIZE = 8192;
        constexpr std::size_t MAX_HEADER_SIZE = 64 * 1024;

        class HttpRequest {
        public:
            std::string method;
            std::string path;
            std::string version;
            std::map<std::string, std::string> headers;
            std::string body;

            /**
             * Parses the request line and header block (without the blank
             * line that terminates it).
             */
            [[nodiscard]] bool parse_head(const std::string& head) {
                std::istringstream stream(head);

                if (!(stream >> method >> path >> version)) {
                    return false;
                }

                std::string line;
                std::getline(stream, line);

                while (std::getline(stream, line)) {
                    if (!line.empty() && line.back() == '\r') {
                        line.pop_back();
                    }
                    if (line.empty()) {
                        continue;
                    }

                    if (const auto colon_pos = line.find(':'); colon_pos != std::string::npos) {
                        std::string key = line.substr(0, colon_pos);
                        std::string value = line.substr(colon_pos + 1);

                        value.erase(0, value.find_first_not_of(" \t"));
                        value.erase(value.find_last_not_of(" \t\r\n") + 1);

                        std::ranges::transform(key, key.begin(), [](const unsigned char c) {
                            return static_cast<char>(std::tolower(c));
                        });
                        headers[key] = value;
                    }
                }

                return !method.empty() && !path.empty();
            }

            /**
             * Returns the declared body length, 0 when absent, or -1 when the
             * header is not a valid number.
             */
            [[nodiscard]] long long content_length() const {
                const auto it = headers.find("content-length");
                if (it == headers.end()) {
                    return 0;
                }
                try {
                    std::size_t consumed = 0;
                    const long long length = std::stoll(it->second, &consumed);
                    return consumed == it->second.size() && length >= 0 ? length : -1;
                } catch (const std::exception&) {
                    return -1;
                }
            }
        };

        class HttpResponse {
        public:
            static std::string build(const ApiResponse& response) {
                std::ostringstream oss;
                oss << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
                oss << "Content-Type: " << response.content_type << "\r\n";
                oss << "Content-Length: " << response.body.length() << "\r\n";
                oss << "Access-Control-Allow-Origin: *\r\n";
                oss << "Connection: close\r\n\r\n";
                oss << response.body;
                return oss.str();
            }

            static std::string options() {
                std::ostringstream oss;
                oss << "HTTP/1.1 204 No Content\r\n";
                oss << "Access-Control-Allow-Origin: *\r\n";
                oss << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
                oss << "Access-Control-Allow-Headers: Content-Type\r\n";
                oss << "Connection: close\r\n\r\n";
                return oss.str();
            }

            static std::string error(const int status, const std::string& message) {
                return build(ApiResponse{status, "application/json", R"({"error": ")" + message + R"("})"});
            }
        };

        class SocketGuard {
        public:
            explicit SocketGuard(const int fd) : fd_(fd) {}

            ~SocketGuard() {
                if (fd_ >= 0) {
                    shutdown(fd_, SHUT_RDWR);
                    ::close(fd_);
                }
            }

            SocketGuard(const SocketGuard&) = delete;
            SocketGuard& operator=(const SocketGuard&) = delete;

            [[nodiscard]] int get() const { return fd_; }

        private:
            int fd_;
        };

        enum class ReadStatus {
            Ok,
            Closed,
            Malformed,
            TooLarge
        };

        bool write_all(const int fd, const std::string& data) {
            std::size_t sent = 0;
            while (sent < data.size()) {
                const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    return false;
                }
                sent += static_cast<std::size_t>(n);
            }
            return true;
        }

        /**
         * Reads the header block, then exactly Content-Length body bytes.
         */
        ReadStatus read_request(const int fd, const std::size_t max_request_size, HttpRequest& request) {
            std::string buffer;
            std::vector<char> chunk(READ_CHUNK_SIZE);
            std::size_t header_end = std::string::npos;

            while (header_end == std::string::npos) {
                const ssize_t n = ::read(fd, chunk.data(), chunk.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    return buffer.empty() ? ReadStatus::Closed : ReadStatus::Malformed;
                }
                buffer.append(chunk.data(), static_cast<std::size_t>(n));
                header_end = buffer.find("\r\n\r\n");

                if (header_end == std::string::npos && buffer.size() > MAX_HEADER_SIZE) {
                    return ReadStatus::TooLarge;
                }
            }

            if (!request.parse_head(buffer.substr(0, header_end))) {
                return ReadStatus::Malformed;
            }

            const long long declared = request.content_length();
            if (declared < 0) {
                return ReadStatus::Malformed;
            }

            const auto length = static_cast<std::size_t>(declared);
            if (length > max_request_size) {
                return ReadStatus::TooLarge;
            }

            request.body = buffer.substr(header_end + 4);
            while (request.body.size() < length) {
                const ssize_t n = ::read(fd, chunk.data(), chunk.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    return ReadStatus::Malformed;
                }
                request.body.append(chunk.data(), static_cast<std::size_t>(n));
            }
            request.body.resize(length);

            return ReadStatus::Ok;
        }

    }  // namespace

    class Server::Impl {
    public:
        int server_socket = -1;
        int bound_port = 0;

        static bool set_socket_timeout(const int socket_fd, const int timeout_sec, const bool for_recv) {
            timeval tv{};
            tv.tv_sec = timeout_sec;
            tv.tv_usec = 0;
            return setsockopt(socket_fd, SOL_SOCKET,
                              for_recv ? SO_RCVTIMEO : SO_SNDTIMEO,
                              &tv, sizeof(tv)) == 0;
        }

        static bool set_socket_nonblocking(const int socket_fd) {
            const int flags = fcntl(socket_fd, F_GETFL, 0);
            if (flags == -1) return false;
            return fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK) != -1;
        }

        Result<void> bind_and_listen(const config::ServerConfig& options) {
            server_socket = socket(AF_INET, SOCK_STREAM, 0);
            if (server_socket < 0) {
                return Result<void>::failure(Error::network_error("Failed to create socket"));
            }

            int opt = 1;
            setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
            setsockopt(server_socket, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

            if (!set_socket_nonblocking(server_socket)) {
                close_socket();
                return Result<void>::failure(Error::network_error("Failed to make socket non-blocking"));
            }

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<uint16_t>(options.port));
            if (inet_pton(AF_INET, options.host.c_str(), &addr.sin_addr) != 1) {
                close_socket();
                return Result<void>::failure(Error::network_error("Invalid listen address", options.host));
            }

            if (bind(server_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                close_socket();
                return Result<void>::failure(Error::network_error(
                    "Bind failed", options.host + ":" + std::to_string(options.port)));
            }

            if (listen(server_socket, options.max_connections) < 0) {
                close_socket();
                return Result<void>::failure(Error::network_error("Listen failed"));
            }

            // Port 0 asks the kernel for an ephemeral port
            sockaddr_in bound{};
            socklen_t bound_len = sizeof(bound);
            if (getsockname(server_socket, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
                bound_port = ntohs(bound.sin_port);
            } else {
                bound_port = options.port;
            }

            return Result<void>::success();
        }

        void close_socket() {
            if (server_socket >= 0) {
                shutdown(server_socket, SHUT_RDWR);
                ::close(server_socket);
                server_socket = -1;
            }
        }
    };

    Server::Server(config::ServerConfig options, const ScanApi& api, const bool verbose_logging)
        : impl_(std::make_unique<Impl>())
        , options_(std::move(options))
        , api_(api)
        , verbose_logging_(verbose_logging) {

        const auto threads = options_.threads > 0
            ? static_cast<unsigned int>(options_.threads)
            : std::max(2u, parallel::hardware_concurrency());

        thread_pool_ = std::make_unique<parallel::ThreadPool>(threads);
    }

    Server::~Server() {
        stop();
    }

    Result<void> Server::start() {
        if (running_) {
            return Result<void>::failure(Error::invalid_argument("Server already running"));
        }

        if (auto bound = impl_->bind_and_listen(options_); bound.is_err()) {
            return bound;
        }

        running_ = true;
        accept_loop();
        return Result<void>::success();
    }

    Result<void> Server::start_async() {
        if (running_) {
            return Result<void>::failure(Error::invalid_argument("Server is already running"));
        }

        if (auto bound = impl_->bind_and_listen(options_); bound.is_err()) {
            return bound;
        }

        running_ = true;
        server_thread_ = std::make_unique<std::thread>([this]() {
            this->accept_loop();
        });

        return Result<void>::success();
    }

    void Server::accept_loop() {
        log::info("ABAP Rule Scanner listening at " + get_url());
        log::info("Worker threads: " + std::to_string(thread_pool_->size()));

        while (running_) {
            fd_set read_fds;
            FD_ZERO(&read_fds);
            FD_SET(impl_->server_socket, &read_fds);

            timeval timeout{};
            timeout.tv_sec = options_.accept_timeout_sec;
            timeout.tv_usec = 0;

            const int activity = select(impl_->server_socket + 1, &read_fds, nullptr, nullptr, &timeout);

            if (activity < 0) {
                if (errno != EINTR && running_) {
                    log::error("select() failed on listening socket");
                }
                continue;
            }

            if (activity == 0) {
                continue;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            const int client_socket = accept(impl_->server_socket,
                                             reinterpret_cast<sockaddr*>(&client_addr),
                                             &client_len);

            if (client_socket < 0) {
                if (running_ && errno != EWOULDBLOCK && errno != EAGAIN) {
                    log::error("accept() failed");
                }
                continue;
            }

            Impl::set_socket_timeout(client_socket, options_.read_timeout_sec, true);
            Impl::set_socket_timeout(client_socket, options_.write_timeout_sec, false);

            try {
                // The future is dropped; handle_client reports its own failures.
                (void)thread_pool_->submit([this, client_socket]() {
                    this->handle_client(client_socket);
                });
            } catch (const std::runtime_error& e) {
                ::close(client_socket);
                log::error(std::string("Could not dispatch connection: ") + e.what());
            }
        }

        impl_->close_socket();
        log::info("Server stopped.");
    }

    void Server::request_stop() noexcept {
        running_.store(false);
    }

    void Server::stop() {
        running_ = false;

        if (server_thread_ && server_thread_->joinable()) {
            server_thread_->join();
        }
        server_thread_.reset();
    }

    bool Server::is_running() const {
        return running_;
    }

    int Server::port() const {
        return impl_->bound_port != 0 ? impl_->bound_port : options_.port;
    }

    std::string Server::get_url() const {
        return "http://" + options_.host + ":" + std::to_string(port());
    }

    void Server::handle_client(const int client_socket) const {
        const SocketGuard guard(client_socket);

        const auto send = [this, &guard](const std::string& response) {
            if (!write_all(guard.get(), response) && verbose_logging_) {
                log::warn("Client disconnected before the response was written");
            }
        };

        HttpRequest request;
        switch (read_request(guard.get(), options_.max_request_size, request)) {
            case ReadStatus::Closed:
                return;
            case ReadStatus::Malformed:
                send(HttpResponse::error(400, "Bad Request"));
                return;
            case ReadStatus::TooLarge:
                send(HttpResponse::error(413, "Payload Too Large"));
                return;
            case ReadStatus::Ok:
                break;
        }

        if (verbose_logging_) {
            log::info(request.method + " " + request.path);
        }

        if (request.method == "OPTIONS") {
            send(HttpResponse::options());
            return;
        }

        std::string response;
        try {
            response = HttpResponse::build(api_.handle(request.method, request.path, request.body));
        } catch (const std::exception& e) {
            log::error(std::string("Request handling exception: ") + e.what());
            response = HttpResponse::error(500, "Internal Server Error");
        }

        send(response);
    }

}  // namespace ars::service
