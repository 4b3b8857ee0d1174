#include "support/local_http_server.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/format.h>

namespace dsfetch::test {

namespace {

void sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Status";
    }
}

std::string headerValue(const std::string& request, const std::string& name) {
    std::string lower = request;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto pos = lower.find("\r\n" + name + ":");
    if (pos == std::string::npos) {
        return {};
    }
    const auto start = request.find_first_not_of(' ', pos + name.size() + 3);
    const auto end = request.find("\r\n", start);
    return request.substr(start, end - start);
}

} // namespace

LocalHttpServer::LocalHttpServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("socket() failed");
    }
    const int reuse = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd_, 16) != 0) {
        ::close(listen_fd_);
        throw std::runtime_error("bind()/listen() failed");
    }

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { acceptLoop(); });
}

LocalHttpServer::~LocalHttpServer() {
    stopping_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    ::close(listen_fd_);
}

void LocalHttpServer::serve(const std::string& path, Resource resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    resources_[path] = std::move(resource);
}

std::string LocalHttpServer::url(const std::string& path) const {
    return fmt::format("http://127.0.0.1:{}{}", port_, path);
}

std::vector<std::string> LocalHttpServer::rangeHeaders(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = ranges_.find(path);
    return it == ranges_.end() ? std::vector<std::string>{} : it->second;
}

void LocalHttpServer::acceptLoop() {
    while (!stopping_.load()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) {
            continue;
        }
        const int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        handle(client);
        ::close(client);
    }
}

void LocalHttpServer::handle(int client) {
    std::string request;
    char buffer[4096];
    while (request.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return;
        }
        request.append(buffer, static_cast<std::size_t>(n));
    }

    const auto path_start = request.find(' ') + 1;
    const std::string path = request.substr(path_start, request.find(' ', path_start) - path_start);
    const std::string range = headerValue(request, "range");

    Resource resource;
    bool drop = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ranges_[path].push_back(range);
        const auto it = resources_.find(path);
        if (it == resources_.end()) {
            sendAll(client, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
            return;
        }
        resource = it->second;
        if (it->second.drops > 0) {
            --it->second.drops;
            drop = true;
        }
    }

    if (resource.status >= 400) {
        sendAll(client, fmt::format("HTTP/1.1 {} {}\r\nContent-Length: 0\r\nConnection: close\r\n\r\n",
                                    resource.status, reasonPhrase(resource.status)));
        return;
    }

    const std::string& body = resource.body;
    int status = 200;
    std::size_t start = 0;
    std::string extra;
    if (!range.empty() && resource.honor_range && range.compare(0, 6, "bytes=") == 0) {
        start = static_cast<std::size_t>(std::strtoull(range.c_str() + 6, nullptr, 10));
        if (start >= body.size()) {
            sendAll(client, fmt::format("HTTP/1.1 416 {}\r\nContent-Range: bytes */{}\r\n"
                                        "Content-Length: 0\r\nConnection: close\r\n\r\n",
                                        reasonPhrase(416), body.size()));
            return;
        }
        status = 206;
        extra = fmt::format("Content-Range: bytes {}-{}/{}\r\n", start, body.size() - 1, body.size());
    }

    const std::string payload = body.substr(start);
    sendAll(client, fmt::format("HTTP/1.1 {} {}\r\n{}Content-Length: {}\r\nAccept-Ranges: {}\r\n"
                                "Connection: close\r\n\r\n",
                                status, reasonPhrase(status), extra, payload.size(),
                                resource.honor_range ? "bytes" : "none"));
    if (drop) {
        sendAll(client, payload.substr(0, std::min(resource.drop_after, payload.size())));
        return;
    }
    sendAll(client, payload);
}

} // namespace dsfetch::test
