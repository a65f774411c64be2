#pragma once
#include "network/http_request.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::network::test {
//---------------------------------------------------------------------------
/// A single threaded HTTP/1.1 server on 127.0.0.1 serving one object with range support
class LocalHttpServer {
    /// The object path
    std::string _path;
    /// The object
    std::vector<uint8_t> _object;
    /// The listening socket
    int _fd = -1;
    /// The bound port
    uint16_t _port = 0;
    /// Stop flag
    std::atomic<bool> _stop{false};
    /// The server thread
    std::thread _thread;

    public:
    /// Requests served
    std::atomic<unsigned> requests{0};
    /// Closes GET connections after half of the body when set
    std::atomic<bool> truncateBodies{false};

    /// Starts serving size deterministic bytes at path
    LocalHttpServer(std::string path, uint64_t size) : _path(std::move(path)), _object(size) {
        for (uint64_t i = 0; i < size; i++)
            _object[i] = static_cast<uint8_t>((i * 31 + 7) % 251);

        _fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (_fd < 0)
            throw std::runtime_error("socket failed");
        int one = 1;
        ::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(_fd, 64) != 0)
            throw std::runtime_error("bind failed");
        socklen_t len = sizeof(addr);
        ::getsockname(_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        _port = ntohs(addr.sin_port);
        _thread = std::thread([this] { run(); });
    }
    /// Stops the server
    ~LocalHttpServer() {
        _stop = true;
        _thread.join();
        ::close(_fd);
    }

    /// The port
    [[nodiscard]] uint16_t port() const { return _port; }
    /// The object
    [[nodiscard]] const std::vector<uint8_t>& object() const { return _object; }

    private:
    /// Accept loop
    void run() {
        while (!_stop) {
            pollfd pfd{_fd, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0)
                continue;
            auto client = ::accept4(_fd, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0)
                continue;
            serve(client);
            ::close(client);
        }
    }
    /// Writes all bytes
    static void writeAll(int fd, std::string_view data) {
        while (!data.empty()) {
            auto res = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (res <= 0)
                return;
            data.remove_prefix(static_cast<size_t>(res));
        }
    }
    /// Answers one request
    void serve(int client) {
        std::string header;
        char buffer[4096];
        while (header.find("\r\n\r\n") == std::string::npos) {
            auto res = ::recv(client, buffer, sizeof(buffer), 0);
            if (res <= 0)
                return;
            header.append(buffer, static_cast<size_t>(res));
        }
        requests++;
        auto request = HttpRequest::deserialize(header);
        if (request.path != _path) {
            writeAll(client, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
            return;
        }
        if (request.method == HttpRequest::Method::HEAD) {
            writeAll(client, "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(_object.size()) + "\r\nConnection: close\r\n\r\n");
            return;
        }

        uint64_t start = 0, end = _object.empty() ? 0 : _object.size() - 1;
        std::string status = "200 OK";
        if (auto it = request.headers.find("Range"); it != request.headers.end()) {
            auto value = std::string_view(it->second).substr(6);
            auto dash = value.find('-');
            start = std::stoull(std::string(value.substr(0, dash)));
            end = std::min<uint64_t>(std::stoull(std::string(value.substr(dash + 1))), _object.size() - 1);
            status = "206 Partial Content";
        }
        auto length = end - start + 1;
        writeAll(client, "HTTP/1.1 " + status + "\r\nContent-Length: " + std::to_string(length) + "\r\nConnection: close\r\n\r\n");
        auto send = truncateBodies ? length / 2 : length;
        writeAll(client, std::string_view(reinterpret_cast<const char*>(_object.data()) + start, send));
    }
};
//---------------------------------------------------------------------------
} // namespace memrun::network::test
