#include "network/server.hpp"
#include "network/http.hpp"
#include "api/document_service.hpp"
#include "common/config.hpp"
#include "storage/document_store.hpp"
#include "test_utils.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <vector>
#include <array>
#include <string>
#include <thread>
#include <chrono>
#include <cstdint>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>   // IWYU pragma: keep
#include <unistd.h>      // IWYU pragma: keep
#include <stdexcept>
#include <memory>
#include <atomic>
#include <utility>

using namespace clouddoc;
using namespace clouddoc::network;
using namespace clouddoc::tests;
using json = nlohmann::json;

namespace {

constexpr uint16_t PORT_STATUS = 18440;
constexpr uint16_t PORT_ROUND_TRIP = 18441;
constexpr uint16_t PORT_OVERSIZED = 18442;
constexpr uint16_t PORT_MALFORMED = 18443;
constexpr uint16_t PORT_MULTI = 18444;
constexpr uint16_t PORT_WAIT = 18445;
constexpr uint16_t PORT_BAD_BYTES = 18446;
constexpr uint16_t PORT_REAP = 18447;

constexpr int CONN_RETRIES = 5;
constexpr int RETRY_MS = 200;
constexpr int NUM_CLIENTS = 5;
constexpr int REAP_WAIT_MS = 500;

constexpr size_t BUF_SIZE = 1024;

const std::string BASE = "/v1/projects/demo-project/databases/(default)/documents:";
const std::string DOC = "projects/demo-project/databases/(default)/documents/cities/sf";

HttpRequest make_request(const std::string& method, const std::string& path,
                         const std::string& body) {
    HttpRequest request;
    request.method = method;
    request.target = path;
    request.path = path;
    request.version = "HTTP/1.1";
    request.body = body;
    return request;
}

int connect_with_retry(uint16_t port) {
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    static_cast<void>(inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr));

    for (int i = 0; i < CONN_RETRIES; ++i) {
        const int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock >= 0) {
            if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) { // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
                return sock;
            }
            static_cast<void>(close(sock));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(RETRY_MS));
    }
    return -1;
}

/* Send raw bytes and read until the server closes the connection */
std::string send_raw(uint16_t port, const std::string& raw) {
    const int sock = connect_with_retry(port);
    if (sock < 0) {
        throw std::runtime_error("Failed to connect to server");
    }

    size_t sent = 0;
    while (sent < raw.size()) {
        const ssize_t n = send(sock, raw.data() + sent, raw.size() - sent, 0);
        if (n <= 0) {
            break;
        }
        sent += static_cast<size_t>(n);
    }

    std::string response;
    std::array<char, BUF_SIZE> buffer{};
    while (true) {
        const ssize_t n = recv(sock, buffer.data(), buffer.size(), 0);
        if (n <= 0) {
            break;
        }
        response.append(buffer.data(), static_cast<size_t>(n));
    }
    static_cast<void>(close(sock));
    return response;
}

std::string post(uint16_t port, const std::string& rpc, const json& body) {
    const std::string payload = body.dump();
    const std::string raw = "POST " + BASE + rpc + " HTTP/1.1\r\n"
                            "Host: localhost\r\n"
                            "Content-Type: application/json\r\n"
                            "Content-Length: " + std::to_string(payload.size()) + "\r\n"
                            "\r\n" + payload;
    return send_raw(port, raw);
}

json response_body(const std::string& response) {
    const size_t start = response.find("\r\n\r\n");
    if (start == std::string::npos) {
        throw std::runtime_error("Response has no body separator");
    }
    return json::parse(response.substr(start + 4));
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

void test_Http_ParseRequestHead() {
    const auto request = parse_request_head(
        "POST /v1/projects/p/databases/(default)/documents:commit?alt=json HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length:  12\r\n");
    EXPECT_TRUE(request.has_value());
    EXPECT_STREQ(request->method, "POST");
    EXPECT_STREQ(request->path, "/v1/projects/p/databases/(default)/documents:commit");
    EXPECT_STREQ(request->version, "HTTP/1.1");
    EXPECT_TRUE(request->header("host").has_value());
    EXPECT_EQ(*request->content_length(), static_cast<size_t>(12));

    EXPECT_FALSE(parse_request_head("garbage").has_value());

    const auto bad_length = parse_request_head("POST / HTTP/1.1\r\nContent-Length: ten\r\n");
    EXPECT_TRUE(bad_length.has_value());
    EXPECT_FALSE(bad_length->content_length().has_value());

    EXPECT_STREQ(url_decode("%28default%29"), "(default)");
    EXPECT_STREQ(url_decode("100%"), "100%");
}

void test_Http_Serialize() {
    const auto response = HttpResponse::json_response(409, json{{"a", 1}});
    const std::string text = response.serialize();
    EXPECT_TRUE(starts_with(text, "HTTP/1.1 409 Conflict\r\n"));
    EXPECT_TRUE(text.find("Content-Type: application/json") != std::string::npos);
    EXPECT_TRUE(text.find("Access-Control-Allow-Origin: *") != std::string::npos);
    EXPECT_TRUE(text.find("Connection: close") != std::string::npos);
    EXPECT_EQ(response_body(text), json({{"a", 1}}));
}

void test_Server_StatusStrings() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    Server s(PORT_STATUS, service, config);

    EXPECT_EQ(s.get_status_string(), std::string("Stopped"));
    static_cast<void>(s.start());
    EXPECT_EQ(s.get_status_string(), std::string("Running"));
    EXPECT_FALSE(s.start());
    static_cast<void>(s.stop());
    EXPECT_EQ(s.get_status_string(), std::string("Stopped"));
}

void test_Server_Dispatch() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    Server s(PORT_STATUS, service, config);

    EXPECT_EQ(s.dispatch(make_request("OPTIONS", BASE + "commit", "")).status, 200);

    auto response = s.dispatch(make_request("POST", "/v1/unknown", "{}"));
    EXPECT_EQ(response.status, 404);
    response = s.dispatch(make_request("POST", BASE + "listDocuments", "{}"));
    EXPECT_EQ(response.status, 404);

    response = s.dispatch(make_request("GET", BASE + "batchGet", ""));
    EXPECT_EQ(response.status, 405);
    EXPECT_STREQ(json::parse(response.body)["error"]["status"].get<std::string>(),
                 "METHOD_NOT_ALLOWED");

    response = s.dispatch(make_request(
        "POST", "/v1/projects/demo-project/databases/other/documents:commit", "{}"));
    EXPECT_EQ(response.status, 404);
    EXPECT_STREQ(error_message(json::parse(response.body)), "Database other not found");

    response = s.dispatch(make_request("POST", BASE + "commit", "{not json"));
    EXPECT_EQ(response.status, 400);
    EXPECT_STREQ(error_message(json::parse(response.body)), "Invalid JSON body");

    response = s.dispatch(make_request("POST", BASE + "commit", "[1, 2]"));
    EXPECT_EQ(response.status, 400);
    EXPECT_STREQ(error_message(json::parse(response.body)), "Request body must be a JSON object");

    response = s.dispatch(make_request("POST", BASE + "beginTransaction", ""));
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(json::parse(response.body).contains("transaction"));

    /* Percent-encoded database segment */
    response = s.dispatch(make_request(
        "POST", "/v1/projects/demo-project/databases/%28default%29/documents:beginTransaction",
        ""));
    EXPECT_EQ(response.status, 200);

    EXPECT_GT(s.get_stats().requests_handled.load(), static_cast<uint64_t>(0));
}

void test_Server_RoundTrip() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_ROUND_TRIP, service, config);
    static_cast<void>(server->start());

    const json write = {{"update",
                         {{"name", DOC},
                          {"fields", {{"population", {{"integerValue", "870000"}}}}}}}};
    const std::string committed = post(PORT_ROUND_TRIP, "commit", json{{"writes", {write}}});
    EXPECT_TRUE(starts_with(committed, "HTTP/1.1 200"));
    EXPECT_TRUE(response_body(committed).contains("commitTime"));

    const std::string fetched = post(PORT_ROUND_TRIP, "batchGet", json{{"documents", {DOC}}});
    EXPECT_TRUE(starts_with(fetched, "HTTP/1.1 200"));
    const json entries = response_body(fetched);
    EXPECT_EQ(entries.size(), static_cast<size_t>(1));
    EXPECT_STREQ(entries[0]["found"]["fields"]["population"]["integerValue"].get<std::string>(),
                 "870000");

    const std::string rolled = post(PORT_ROUND_TRIP, "rollback", json{{"transaction", "nope"}});
    EXPECT_TRUE(starts_with(rolled, "HTTP/1.1 400"));
    EXPECT_STREQ(error_message(response_body(rolled)), "Invalid transaction ID");

    static_cast<void>(server->stop());
    EXPECT_GT(server->get_stats().bytes_received.load(), static_cast<uint64_t>(0));
    EXPECT_GT(server->get_stats().bytes_sent.load(), static_cast<uint64_t>(0));
}

void test_Server_OversizedBody() {
    storage::DocumentStore store;
    config::Config config;
    config.max_request_bytes = 64;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_OVERSIZED, service, config);
    static_cast<void>(server->start());

    const std::string response = send_raw(PORT_OVERSIZED,
                                          "POST " + BASE + "commit HTTP/1.1\r\n"
                                          "Content-Length: 1000\r\n"
                                          "\r\n");
    EXPECT_TRUE(starts_with(response, "HTTP/1.1 400"));
    EXPECT_STREQ(error_message(response_body(response)), "Request body exceeds 64 bytes");

    static_cast<void>(server->stop());
}

void test_Server_MalformedRequest() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_MALFORMED, service, config);
    static_cast<void>(server->start());

    std::string response = send_raw(PORT_MALFORMED, "NONSENSE\r\n\r\n");
    EXPECT_TRUE(starts_with(response, "HTTP/1.1 400"));
    EXPECT_STREQ(error_message(response_body(response)), "Malformed HTTP request");

    response = send_raw(PORT_MALFORMED,
                        "POST " + BASE + "commit HTTP/1.1\r\nContent-Length: -3\r\n\r\n");
    EXPECT_TRUE(starts_with(response, "HTTP/1.1 400"));
    EXPECT_STREQ(error_message(response_body(response)), "Invalid Content-Length");

    static_cast<void>(server->stop());
}

void test_Server_MultiClient() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_MULTI, service, config);
    static_cast<void>(server->start());

    std::vector<std::thread> clients;
    clients.reserve(NUM_CLIENTS);
    std::atomic<int> success_count{0};

    for (int i = 0; i < NUM_CLIENTS; ++i) {
        clients.emplace_back([&success_count]() {
            const std::string response = post(PORT_MULTI, "beginTransaction", json::object());
            if (starts_with(response, "HTTP/1.1 200") &&
                response_body(response).contains("transaction")) {
                success_count++;
            }
        });
    }

    for (auto& t : clients) { t.join(); }
    EXPECT_EQ(success_count.load(), NUM_CLIENTS);
    EXPECT_EQ(service.get_transaction_manager().active_count(), static_cast<size_t>(NUM_CLIENTS));

    static_cast<void>(server->stop());
}

void test_Server_NonUtf8Path() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_BAD_BYTES, service, config);

    /* The decoded database name is a lone 0xFF byte */
    const std::string path = "/v1/projects/demo-project/databases/%FF/documents:commit";
    const auto response = server->dispatch(make_request("POST", path, "{}"));
    EXPECT_EQ(response.status, 404);
    EXPECT_TRUE(json::accept(response.body));

    const json bad_text = {{"message", std::string("a\xFF") + "b"}};
    const auto text = HttpResponse::json_response(400, bad_text);
    EXPECT_EQ(text.status, 400);
    EXPECT_TRUE(json::accept(text.body));

    static_cast<void>(server->start());
    const std::string raw = send_raw(PORT_BAD_BYTES,
                                     "POST " + path + " HTTP/1.1\r\n"
                                     "Content-Length: 2\r\n"
                                     "\r\n{}");
    EXPECT_TRUE(starts_with(raw, "HTTP/1.1 404"));
    EXPECT_TRUE(server->is_running());

    /* The server keeps serving afterwards */
    const std::string next = post(PORT_BAD_BYTES, "beginTransaction", json::object());
    EXPECT_TRUE(starts_with(next, "HTTP/1.1 200"));
    static_cast<void>(server->stop());
}

void test_Server_ReapsWorkers() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_REAP, service, config);
    static_cast<void>(server->start());

    for (int i = 0; i < NUM_CLIENTS; ++i) {
        const std::string response = post(PORT_REAP, "beginTransaction", json::object());
        EXPECT_TRUE(starts_with(response, "HTTP/1.1 200"));
    }

    /* Finished connection threads are joined without waiting for stop() */
    std::this_thread::sleep_for(std::chrono::milliseconds(REAP_WAIT_MS));
    EXPECT_EQ(server->worker_count(), static_cast<size_t>(0));
    EXPECT_EQ(server->get_stats().connections_accepted.load(),
              static_cast<uint64_t>(NUM_CLIENTS));

    static_cast<void>(server->stop());
}

void test_Server_Wait() {
    storage::DocumentStore store;
    config::Config config;
    api::DocumentService service(store, config);
    auto server = Server::create(PORT_WAIT, service, config);
    static_cast<void>(server->start());

    std::thread stopper([&server]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(RETRY_MS));
        static_cast<void>(server->stop());
    });
    server->wait();
    EXPECT_FALSE(server->is_running());
    stopper.join();
}

} // namespace

int main() {
    std::cout << "Server Unit Tests\n";
    std::cout << "========================\n";

    RUN_TEST(Http_ParseRequestHead);
    RUN_TEST(Http_Serialize);
    RUN_TEST(Server_StatusStrings);
    RUN_TEST(Server_Dispatch);
    RUN_TEST(Server_RoundTrip);
    RUN_TEST(Server_OversizedBody);
    RUN_TEST(Server_MalformedRequest);
    RUN_TEST(Server_MultiClient);
    RUN_TEST(Server_NonUtf8Path);
    RUN_TEST(Server_ReapsWorkers);
    RUN_TEST(Server_Wait);

    std::cout << "========================\n";
    std::cout << "All tests passed: " << tests_passed << "\n";
    if (tests_failed > 0) {
        std::cout << "Tests failed: " << tests_failed << "\n";
        return 1;
    }
    return 0;
}
