/// @file LoopbackServer.hpp
/// Minimal HTTP/1.1 server on 127.0.0.1 for driving the libcurl transport in tests.
/// One connection at a time, one exchange per connection ("Connection: close").

#pragma once

#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace resilient_http::testing {

struct ReceivedRequest {
    std::string method;
    std::string target;
    std::vector<std::string> headers;
    std::string body;
};

/// Builds a complete response with Content-Length and "Connection: close".
inline std::string reply(int status, const std::string& reason,
                         const std::vector<std::string>& headers = {}, const std::string& body = "") {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    for (const auto& header : headers)
        out += header + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

class LoopbackServer {
public:
    /// The handler returns the raw bytes to send back, status line included.
    using Handler = std::function<std::string(const ReceivedRequest&, size_t index)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0)
            throw std::runtime_error("socket() failed");

        int on = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listenFd_, 16) != 0) {
            ::close(listenFd_);
            throw std::runtime_error("bind()/listen() failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread(&LoopbackServer::serve, this);
    }

    ~LoopbackServer() {
        // Unblocks accept()
        ::shutdown(listenFd_, SHUT_RDWR);
        if (thread_.joinable())
            thread_.join();
        ::close(listenFd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<ReceivedRequest> received() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return received_;
    }

private:
    void serve() {
        while (true) {
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0)
                return;
            handle(fd);
            ::close(fd);
        }
    }

    void handle(int fd) {
        std::string data;
        char buf[4096];
        size_t headerEnd;
        while ((headerEnd = data.find("\r\n\r\n")) == std::string::npos) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0)
                return;
            data.append(buf, static_cast<size_t>(n));
        }

        ReceivedRequest request;
        std::string head = data.substr(0, headerEnd);
        size_t lineEnd = head.find("\r\n");
        std::string requestLine = head.substr(0, lineEnd);
        size_t sp1 = requestLine.find(' ');
        size_t sp2 = requestLine.find(' ', sp1 + 1);
        request.method = requestLine.substr(0, sp1);
        request.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);

        size_t pos = lineEnd == std::string::npos ? head.size() : lineEnd + 2;
        while (pos < head.size()) {
            size_t next = head.find("\r\n", pos);
            if (next == std::string::npos)
                next = head.size();
            request.headers.push_back(head.substr(pos, next - pos));
            pos = next + 2;
        }

        size_t contentLength = 0;
        if (auto value = util::findHeader(request.headers, "Content-Length"))
            contentLength = std::strtoul(value->c_str(), nullptr, 10);

        request.body = data.substr(headerEnd + 4);
        while (request.body.size() < contentLength) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0)
                break;
            request.body.append(buf, static_cast<size_t>(n));
        }

        size_t index;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            index = received_.size();
            received_.push_back(request);
        }

        std::string response = handler_(request, index);
        size_t sent = 0;
        while (sent < response.size()) {
            ssize_t n = ::send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return;
            sent += static_cast<size_t>(n);
        }
        ::shutdown(fd, SHUT_WR);
    }

    Handler handler_;
    int listenFd_ = -1;
    int port_ = 0;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<ReceivedRequest> received_;
};

} // namespace resilient_http::testing
