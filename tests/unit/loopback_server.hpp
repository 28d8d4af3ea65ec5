/**
 * @file loopback_server.hpp
 * @brief Scripted HTTP/1.1 server on 127.0.0.1 for exercising the curl client.
 */
#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

struct LoopbackRequest {
    std::string method;
    std::string target;
    // Header names are lowercased.
    std::map<std::string, std::string> headers;
};

class LoopbackConnection {
public:
    LoopbackConnection(int fd, const std::atomic<bool>& stopping) : fd_(fd), stopping_(stopping) {}

    // False once the peer has gone away or the server is stopping.
    bool send(const std::string& data) {
        std::size_t sent = 0;
        while (sent < data.size()) {
            if (stopping_) {
                return false;
            }
            const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<std::size_t>(n);
        }
        return true;
    }

    bool stopping() const { return stopping_; }

private:
    int fd_;
    const std::atomic<bool>& stopping_;
};

/**
 * @brief Accepts one connection at a time and hands each request to `handler`.
 *
 * The connection is closed when the handler returns, so every response
 * should carry `Connection: close`.
 */
class LoopbackServer {
public:
    using Handler = std::function<void(const LoopbackRequest&, LoopbackConnection&)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int opt = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, SOMAXCONN) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("Failed to listen on loopback");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this] { acceptLoop(); });
    }

    ~LoopbackServer() {
        stopping_ = true;
        // Wakes the blocked accept().
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (acceptor_.joinable()) {
            acceptor_.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    unsigned short port() const { return port_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<LoopbackRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void acceptLoop() {
        while (!stopping_) {
            const int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (stopping_) {
                    return;
                }
                continue;
            }
            serve(fd);
            ::close(fd);
        }
    }

    void serve(int fd) {
        std::string raw;
        char buffer[4096];
        while (raw.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            raw.append(buffer, static_cast<std::size_t>(n));
        }

        LoopbackRequest request = parse(raw.substr(0, raw.find("\r\n\r\n")));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        LoopbackConnection connection(fd, stopping_);
        handler_(request, connection);
    }

    static LoopbackRequest parse(const std::string& head) {
        LoopbackRequest request;
        std::size_t pos = head.find("\r\n");
        const std::string request_line = head.substr(0, pos);
        const auto first_space = request_line.find(' ');
        const auto second_space = request_line.find(' ', first_space + 1);
        request.method = request_line.substr(0, first_space);
        request.target = request_line.substr(first_space + 1, second_space - first_space - 1);

        while (pos != std::string::npos) {
            const std::size_t start = pos + 2;
            pos = head.find("\r\n", start);
            const std::string line = head.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const auto value_start = line.find_first_not_of(' ', colon + 1);
            request.headers[name] = value_start == std::string::npos ? std::string() : line.substr(value_start);
        }
        return request;
    }

    Handler handler_;
    int listen_fd_{-1};
    unsigned short port_{0};
    std::atomic<bool> stopping_{false};
    std::thread acceptor_;
    mutable std::mutex mutex_;
    std::vector<LoopbackRequest> requests_;
};
