/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file server.cpp
 * @brief Implementation of the multi-threaded HTTP server.
 *
 * @details
 * This file implements the listener loop, client connection management and
 * the hand-off of parsed requests to the dispatcher. It handles the raw BSD
 * socket API calls.
 */

#include "conduit/network/server.hpp"

#include "conduit/infra/id_generator.hpp"
#include "conduit/infra/logger.hpp"
#include "conduit/network/http_codec.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace conduit::network {

using infra::Logger;
using infra::LogLevel;

const char* const Server::SESSION_COOKIE = "SID";

namespace {

/// Upper bound for one request (headers and body).
const size_t MAX_REQUEST_BYTES = 1 << 20;

} // namespace

Server::Server(web::Dispatcher& dispatcher, int port, size_t threads)
    : dispatcher_(dispatcher), port_(port), server_fd_(-1), running_(false),
      scheduler_(threads == 0 ? std::thread::hardware_concurrency() : threads)
{
    dispatcher_.set_scheduler(&scheduler_);
}

Server::~Server()
{
    stop();
}

infra::Scheduler& Server::scheduler()
{
    return scheduler_;
}

/**
 * @brief Gracefully terminates the server.
 *
 * 1. Sets the running flag to false to stop new accepts.
 * 2. Closes the listener socket to unblock the `accept()` call.
 * 3. Closes all tracked client sockets to release blocked workers.
 */
void Server::stop()
{
    if (!running_) {
        return;
    }
    running_ = false;

    Logger::log(LogLevel::INFO, "Network: Shutdown signal received. Stopping server...");

    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    std::lock_guard<std::mutex> lock(client_mutex_);
    for (int sock : client_sockets_) {
        shutdown(sock, SHUT_RDWR);
        close(sock);
    }
    client_sockets_.clear();
}

void Server::run()
{
    if ((server_fd_ = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
        Logger::log(LogLevel::FATAL, "Network: Failed to create socket.");
        return;
    }

    // Allow immediate address/port reuse to facilitate quick restarts
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR | SO_REUSEPORT, &opt, sizeof(opt))) {
        Logger::log(LogLevel::ERROR, "Network: setsockopt failed.");
        return;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::log(LogLevel::FATAL, "Network: Failed to bind to port " + std::to_string(port_));
        return;
    }

    if (listen(server_fd_, 128) < 0) {
        Logger::log(LogLevel::FATAL, "Network: Failed to listen.");
        return;
    }

    running_ = true;
    Logger::log(LogLevel::INFO, "Network: Conduit listening on port " + std::to_string(port_));

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        int sock = accept(server_fd_, (struct sockaddr*)&client_addr, &len);

        if (sock >= 0) {
            if (!running_) {
                close(sock);
                break;
            }

            char* client_ip_raw = inet_ntoa(client_addr.sin_addr);
            std::string client_ip = client_ip_raw ? client_ip_raw : "unknown";
            Logger::log(LogLevel::DEBUG, "Network: New connection from " + client_ip);

            add_client(sock);
            scheduler_.enqueue([this, sock]() { this->handle_client(sock); });
        } else if (running_) {
            Logger::log(LogLevel::ERROR,
                        "Network: Accept failed (Error code: " + std::to_string(errno) + ")");
        } else {
            break;
        }
    }

    Logger::log(LogLevel::INFO, "Network: Server event loop terminated.");
}

/**
 * @brief Client routine (worker thread context).
 *
 * Reads until the request is complete, then hands it to the dispatcher.
 * The socket stays open until the completion callback has replied, which
 * for async handlers happens after this function has returned.
 */
void Server::handle_client(int sock)
{
    std::string raw;
    char buffer[8192];

    while (running_ && !HttpCodec::is_complete(raw)) {
        ssize_t read_len = recv(sock, buffer, sizeof(buffer), 0);
        if (read_len <= 0) {
            Logger::log(LogLevel::DEBUG, "Network: Client closed before sending a full request.");
            remove_client(sock);
            return;
        }
        raw.append(buffer, static_cast<size_t>(read_len));
        if (raw.size() > MAX_REQUEST_BYTES) {
            http::Response too_large;
            too_large.send_error(413);
            reply(sock, HttpCodec::serialize(too_large));
            return;
        }
    }

    std::shared_ptr<http::Request> request;
    try {
        request = HttpCodec::parse_request(raw);
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::WARN, std::string("Network: Bad request: ") + e.what());
        http::Response bad;
        bad.send_error(400);
        reply(sock, HttpCodec::serialize(bad));
        return;
    }

    auto response = std::make_shared<http::Response>();

    std::optional<std::string> sid = request->cookie(SESSION_COOKIE);
    if (sid && !sid->empty()) {
        request->set_session_id(*sid);
    } else {
        request->set_session_id(infra::IdGenerator::session_token());
        response->add_header("Set-Cookie", std::string(SESSION_COOKIE) + "=" +
                                               request->session_id() + "; Path=/; HttpOnly");
    }

    bool head_only = request->method() == http::Method::HEAD;
    dispatcher_.serve(request, response,
                      [this, sock, response, head_only](std::exception_ptr failure) {
                          if (failure) {
                              response->remove_header("Location");
                              response->send_error(500);
                          }
                          response->commit();
                          reply(sock, HttpCodec::serialize(*response, head_only));
                      });
}

void Server::reply(int sock, const std::string& payload)
{
    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = send(sock, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            Logger::log(LogLevel::DEBUG, "Network: Peer went away while writing the response.");
            break;
        }
        sent += static_cast<size_t>(n);
    }
    remove_client(sock);
}

void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
}

void Server::remove_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        // Only close if still in the list (avoids double-close)
        close(sock);
        client_sockets_.erase(it);
    }
}

} // namespace conduit::network
