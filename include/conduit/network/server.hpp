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
 * @file server.hpp
 * @brief Multi-threaded HTTP listener feeding the dispatcher.
 *
 * @details
 * This header declares the `Server` class, the network entry point of a
 * Conduit application. It handles the low-level BSD socket operations
 * (bind, listen, accept) and hands each connection to the worker pool
 * (`Scheduler`), which parses the request and runs the dispatcher.
 */

#pragma once

#include "conduit/infra/scheduler.hpp"
#include "conduit/web/dispatcher.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace conduit::network {

/**
 * @class Server
 * @brief A blocking HTTP/1.1 server, one request per connection.
 *
 * @details
 * **Operational Workflow:**
 * 1. **Accept:** The main thread blocks on `accept()`.
 * 2. **Dispatch:** The socket is submitted to the `infra::Scheduler`.
 * 3. **Process:** A worker reads and parses the request, attaches the
 *    session cookie and calls `Dispatcher::serve`.
 * 4. **Reply:** The completion callback writes the response and closes the
 *    socket. For async requests this happens on whichever worker finished
 *    the resumed pass; the accepting worker is already free by then.
 */
class Server {
  public:
    /// @brief Name of the cookie carrying the session key (used for flash state).
    static const char* const SESSION_COOKIE;

    /**
     * @brief Constructs the server and lends its scheduler to `dispatcher`.
     *
     * @param dispatcher Shared across all connections; must outlive the server.
     * @param port The TCP port number to bind to.
     * @param threads Worker threads (0 selects one per hardware thread).
     */
    Server(web::Dispatcher& dispatcher, int port, size_t threads = 0);

    /**
     * @brief Destructor. Initiates the graceful shutdown sequence.
     */
    ~Server();

    /**
     * @brief Binds, listens and runs the accept loop.
     *
     * @note This function is **blocking**. It runs until `stop()` is triggered
     * or a fatal socket error occurs.
     */
    void run();

    /**
     * @brief Signals the server to shut down.
     *
     * Closes the listening socket (unblocking `accept`) and every tracked
     * client socket.
     */
    void stop();

    infra::Scheduler& scheduler();

  private:
    /// @brief Shared front controller.
    web::Dispatcher& dispatcher_;

    /// @brief The configured listening port.
    int port_;

    /// @brief File descriptor for the main listening socket.
    int server_fd_;

    /// @brief Atomic flag controlling the lifecycle of the main acceptance loop.
    std::atomic<bool> running_;

    /// @brief Thread pool for connections, async handlers and timeouts.
    infra::Scheduler scheduler_;

    /// @brief Registry of currently connected client socket file descriptors.
    std::vector<int> client_sockets_;

    /// @brief Synchronization primitive protecting the `client_sockets_` registry.
    std::mutex client_mutex_;

    /**
     * @brief Reads one request from `socket` and dispatches it.
     *
     * @param socket The client's socket file descriptor.
     */
    void handle_client(int socket);

    /// @brief Writes the serialized response and releases the socket.
    void reply(int socket, const std::string& payload);

    void add_client(int socket);

    void remove_client(int socket);
};

} // namespace conduit::network
