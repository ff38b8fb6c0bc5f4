/**
 * @file server.cpp
 * @brief HTTP server and request routing
 *
 * @defgroup network Network Server
 * @{
 */

#include "network/server.hpp"

#include <arpa/inet.h>   // IWYU pragma: keep
#include <netinet/in.h>  // IWYU pragma: keep
#include <sys/select.h>  // IWYU pragma: keep
#include <sys/socket.h>  // IWYU pragma: keep
#include <sys/time.h>    // IWYU pragma: keep
#include <sys/types.h>   // IWYU pragma: keep
#include <unistd.h>      // IWYU pragma: keep

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "api/wire_format.hpp"
#include "common/status.hpp"
#include "storage/document_path.hpp"

namespace clouddoc::network {

namespace {
constexpr size_t READ_CHUNK = 8192;
constexpr size_t MAX_HEAD_BYTES = 64 * 1024;
constexpr int SELECT_TIMEOUT_USEC = 100000;
constexpr int WAIT_POLL_MS = 100;
constexpr const char* HEAD_TERMINATOR = "\r\n\r\n";
constexpr size_t HEAD_TERMINATOR_LEN = 4;

/**
 * @brief /v1/projects/{project}/databases/{database}/documents:{rpc}
 */
struct Route {
    std::string project;
    std::string database;
    std::string rpc;
};

std::optional<Route> match_route(const std::string& path) {
    static const std::string PREFIX = "/v1/projects/";
    static const std::string DOCUMENTS = "documents:";
    if (path.compare(0, PREFIX.size(), PREFIX) != 0) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    size_t start = PREFIX.size();
    while (true) {
        const size_t slash = path.find('/', start);
        parts.push_back(path.substr(start, slash == std::string::npos ? slash : slash - start));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    if (parts.size() != 4 || parts[0].empty() || parts[1] != "databases" || parts[2].empty() ||
        parts[3].compare(0, DOCUMENTS.size(), DOCUMENTS) != 0) {
        return std::nullopt;
    }
    return Route{url_decode(parts[0]), url_decode(parts[2]), parts[3].substr(DOCUMENTS.size())};
}

bool is_known_rpc(const std::string& rpc) {
    return rpc == "batchGet" || rpc == "commit" || rpc == "beginTransaction" || rpc == "rollback";
}

HttpResponse error_response(const common::Status& status) {
    return HttpResponse::json_response(status.http_status(), api::encode_error(status));
}

}  // anonymous namespace

Server::Server(uint16_t port, api::DocumentService& service, const config::Config& config)
    : port_(port), service_(service), config_(config) {}

std::unique_ptr<Server> Server::create(uint16_t port, api::DocumentService& service,
                                       const config::Config& config) {
    return std::make_unique<Server>(port, service, config);
}

/**
 * @brief Start the server
 */
bool Server::start() {
    {
        const std::scoped_lock<std::mutex> lock(state_mutex_);
        if (running_) {
            return false;
        }
        status_ = ServerStatus::Starting;
    }

    const auto fail = [this](const char* what) {
        std::cerr << "Server on port " << port_ << ": " << what << "\n";
        const std::scoped_lock<std::mutex> lock(state_mutex_);
        status_ = ServerStatus::Error;
        return false;
    };

    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return fail("socket() failed");
    }

    const int opt = 1;
    static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)));

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        static_cast<void>(close(fd));
        return fail("bind() failed");
    }

    if (listen(fd, BACKLOG) < 0) {
        static_cast<void>(close(fd));
        return fail("listen() failed");
    }

    {
        const std::scoped_lock<std::mutex> lock(state_mutex_);
        listen_fd_ = fd;
        status_ = ServerStatus::Running;
        running_ = true;
    }

    const std::scoped_lock<std::mutex> lock(thread_mutex_);
    accept_thread_ = std::thread(&Server::accept_connections, this);
    return true;
}

/**
 * @brief Stop the server
 */
bool Server::stop() {
    int fd_to_close = -1;
    {
        const std::scoped_lock<std::mutex> lock(state_mutex_);
        if (!running_) {
            return true;
        }
        status_ = ServerStatus::Stopping;
        running_ = false;
        if (listen_fd_ >= 0) {
            fd_to_close = listen_fd_;
            listen_fd_ = -1;
        }
    }

    // 1. Signal all active client connections to shut down
    std::vector<int> fds;
    {
        const std::scoped_lock<std::mutex> lock(thread_mutex_);
        fds = client_fds_;
    }
    for (const int fd : fds) {
        static_cast<void>(shutdown(fd, SHUT_RDWR));
    }

    // 2. Join the accept thread
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // 3. Join all connection worker threads
    std::list<Worker> workers;
    {
        const std::scoped_lock<std::mutex> lock(thread_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }

    if (fd_to_close >= 0) {
        static_cast<void>(close(fd_to_close));
    }

    {
        const std::scoped_lock<std::mutex> lock(state_mutex_);
        status_ = ServerStatus::Stopped;
    }
    return true;
}

void Server::wait() {
    while (is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(WAIT_POLL_MS));
    }
}

bool Server::is_running() const {
    const std::scoped_lock<std::mutex> lock(state_mutex_);
    return running_;
}

ServerStatus Server::get_status() const {
    const std::scoped_lock<std::mutex> lock(state_mutex_);
    return status_;
}

int Server::get_listen_fd() const {
    const std::scoped_lock<std::mutex> lock(state_mutex_);
    return listen_fd_;
}

std::string Server::get_status_string() const {
    switch (get_status()) {
        case ServerStatus::Stopped:
            return "Stopped";
        case ServerStatus::Starting:
            return "Starting";
        case ServerStatus::Running:
            return "Running";
        case ServerStatus::Stopping:
            return "Stopping";
        case ServerStatus::Error:
            return "Error";
        default:
            return "Unknown";
    }
}

size_t Server::worker_count() {
    const std::scoped_lock<std::mutex> lock(thread_mutex_);
    return workers_.size();
}

/**
 * @brief Join and drop connection threads that have finished
 */
void Server::reap_workers() {
    const std::scoped_lock<std::mutex> lock(thread_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done.load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void Server::accept_connections() {
    while (is_running()) {
        reap_workers();

        const int fd = get_listen_fd();
        if (fd < 0) {
            break;
        }

        /* Use select with timeout to allow periodic is_running() check */
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(fd, &read_fds);
        struct timeval timeout {0, SELECT_TIMEOUT_USEC};

        const int res = select(fd + 1, &read_fds, nullptr, nullptr, &timeout);
        if (res <= 0) {
            continue; /* Timeout or error */
        }

        struct sockaddr_in client_addr {};
        socklen_t client_len = sizeof(client_addr);

        const int client_fd =
            accept(fd, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            continue;
        }

        static_cast<void>(stats_.connections_accepted.fetch_add(1));
        static_cast<void>(stats_.connections_active.fetch_add(1));

        const std::scoped_lock<std::mutex> lock(thread_mutex_);
        client_fds_.push_back(client_fd);
        Worker& worker = workers_.emplace_back();
        worker.thread = std::thread([this, client_fd, &worker]() {
            handle_connection(client_fd);
            static_cast<void>(stats_.connections_active.fetch_sub(1));

            {
                const std::scoped_lock<std::mutex> lock(thread_mutex_);
                auto it = std::remove(client_fds_.begin(), client_fds_.end(), client_fd);
                client_fds_.erase(it, client_fds_.end());
            }
            static_cast<void>(close(client_fd));
            /* Last touch of the list node; the accept loop may join and erase it after this */
            worker.done.store(true);
        });
    }
}

bool Server::send_all(int client_fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
        static_cast<void>(stats_.bytes_sent.fetch_add(static_cast<uint64_t>(n)));
    }
    return true;
}

/**
 * @brief Read one HTTP request, answer it and return; the caller closes the socket
 */
void Server::handle_connection(int client_fd) {
    std::array<char, READ_CHUNK> buffer{};
    std::string data;

    const auto receive = [&]() {
        const ssize_t n = recv(client_fd, buffer.data(), buffer.size(), 0);
        if (n > 0) {
            data.append(buffer.data(), static_cast<size_t>(n));
            static_cast<void>(stats_.bytes_received.fetch_add(static_cast<uint64_t>(n)));
        }
        return n > 0;
    };

    /* 1. Request line and headers */
    size_t head_end = std::string::npos;
    while (head_end == std::string::npos) {
        if (!receive()) {
            return;
        }
        head_end = data.find(HEAD_TERMINATOR);
        if (head_end == std::string::npos && data.size() > MAX_HEAD_BYTES) {
            static_cast<void>(send_all(client_fd,
                error_response(common::Status::invalid_argument("Request head too large"))
                    .serialize()));
            return;
        }
    }

    auto request = parse_request_head(data.substr(0, head_end));
    if (!request.has_value()) {
        static_cast<void>(send_all(
            client_fd,
            error_response(common::Status::invalid_argument("Malformed HTTP request")).serialize()));
        return;
    }

    const auto length = request->content_length();
    if (!length.has_value()) {
        static_cast<void>(send_all(
            client_fd,
            error_response(common::Status::invalid_argument("Invalid Content-Length")).serialize()));
        return;
    }
    if (*length > config_.max_request_bytes) {
        static_cast<void>(send_all(
            client_fd, error_response(common::Status::invalid_argument(
                                          "Request body exceeds " +
                                          std::to_string(config_.max_request_bytes) + " bytes"))
                           .serialize()));
        return;
    }

    /* 2. Body */
    const size_t body_start = head_end + HEAD_TERMINATOR_LEN;
    while (data.size() - body_start < *length) {
        if (!receive()) {
            return;
        }
    }
    request->body = data.substr(body_start, *length);

    /* 3. Dispatch */
    HttpResponse response;
    try {
        response = dispatch(*request);
    } catch (const std::exception& e) {
        std::cerr << request->method << " " << request->path << " failed: " << e.what() << "\n";
        response = error_response(common::Status::internal(e.what()));
    }
    if (config_.verbose) {
        std::cout << request->method << " " << request->target << " -> " << response.status
                  << "\n";
    }
    static_cast<void>(send_all(client_fd, response.serialize()));
}

HttpResponse Server::dispatch(const HttpRequest& request) {
    static_cast<void>(stats_.requests_handled.fetch_add(1));

    if (request.method == "OPTIONS") {
        HttpResponse response;
        response.status = 200;
        return response;
    }

    const auto route = match_route(request.path);
    if (!route.has_value() || !is_known_rpc(route->rpc)) {
        return error_response(common::Status::not_found("Not found: " + request.path));
    }

    if (request.method != "POST") {
        return HttpResponse::json_response(
            405, nlohmann::json{{"error",
                                 {{"code", 405},
                                  {"message", "Method " + request.method + " not allowed"},
                                  {"status", "METHOD_NOT_ALLOWED"}}}});
    }

    if (route->database != storage::DocumentPath::DEFAULT_DATABASE) {
        return error_response(
            common::Status::not_found("Database " + route->database + " not found"));
    }

    nlohmann::json body;
    if (!request.body.empty()) {
        body = nlohmann::json::parse(request.body, nullptr, false);
        if (body.is_discarded()) {
            return error_response(common::Status::invalid_argument("Invalid JSON body"));
        }
        if (!body.is_object()) {
            return error_response(
                common::Status::invalid_argument("Request body must be a JSON object"));
        }
    }

    api::ApiResponse result;
    if (route->rpc == "batchGet") {
        result = service_.batch_get(body);
    } else if (route->rpc == "commit") {
        result = service_.commit(body);
    } else if (route->rpc == "beginTransaction") {
        result = service_.begin_transaction(body);
    } else {
        result = service_.rollback(body);
    }
    return HttpResponse::json_response(result.status_code, result.body);
}

}  // namespace clouddoc::network

/** @} */ /* network */
