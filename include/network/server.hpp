/**
 * @file server.hpp
 * @brief HTTP front end for the document RPCs
 */

#ifndef CLOUDDOC_NETWORK_SERVER_HPP
#define CLOUDDOC_NETWORK_SERVER_HPP

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/document_service.hpp"
#include "common/config.hpp"
#include "network/http.hpp"

namespace clouddoc::network {

/**
 * @brief Server statistics
 */
class ServerStats {
   public:
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> connections_active{0};
    std::atomic<uint64_t> requests_handled{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> bytes_sent{0};
};

/**
 * @brief Server status enumeration
 */
enum class ServerStatus : uint8_t { Stopped, Starting, Running, Stopping, Error };

/**
 * @brief HTTP server: an accept thread plus one worker thread per connection.
 *
 * Each connection carries a single request and is closed after the response.
 */
class Server {
   public:
    static constexpr int BACKLOG = 64;

    Server(uint16_t port, api::DocumentService& service, const config::Config& config);

    ~Server() noexcept {
        try {
            static_cast<void>(stop());
        } catch (const std::exception& e) {
            std::cerr << "Server shutdown failed: " << e.what() << "\n";
        }
        if (listen_fd_ >= 0) {
            static_cast<void>(close(listen_fd_));
        }
    }

    // Disable copy/move for server
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] static std::unique_ptr<Server> create(uint16_t port,
                                                        api::DocumentService& service,
                                                        const config::Config& config);

    /**
     * @brief Bind, listen and start accepting
     * @return false if the socket could not be set up or already running
     */
    bool start();

    /**
     * @brief Stop accepting, shut down open connections and join workers
     */
    bool stop();

    /**
     * @brief Block until the server has been stopped
     */
    void wait();

    /**
     * @brief Route one parsed request to its handler
     */
    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request);

    [[nodiscard]] const ServerStats& get_stats() const { return stats_; }
    [[nodiscard]] ServerStatus get_status() const;
    [[nodiscard]] uint16_t get_port() const { return port_; }
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] int get_listen_fd() const;
    [[nodiscard]] std::string get_status_string() const;

    /**
     * @brief Connection threads not yet joined
     */
    [[nodiscard]] size_t worker_count();

   private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void accept_connections();
    void reap_workers();
    void handle_connection(int client_fd);
    bool send_all(int client_fd, const std::string& data);

    uint16_t port_;
    int listen_fd_ = -1;
    bool running_{false};
    ServerStatus status_ = ServerStatus::Stopped;

    api::DocumentService& service_;
    const config::Config& config_;

    ServerStats stats_;
    std::thread accept_thread_;
    std::list<Worker> workers_;
    std::vector<int> client_fds_;
    std::mutex thread_mutex_;
    mutable std::mutex state_mutex_;
};

}  // namespace clouddoc::network

#endif  // CLOUDDOC_NETWORK_SERVER_HPP
