/**
 * @file http.hpp
 * @brief Minimal HTTP/1.1 request/response model
 */

#ifndef CLOUDDOC_NETWORK_HTTP_HPP
#define CLOUDDOC_NETWORK_HTTP_HPP

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace clouddoc::network {

struct HttpRequest {
    std::string method;
    std::string target;  // as sent, including any query string
    std::string path;    // target without the query string
    std::string version;
    std::map<std::string, std::string> headers;  // names lower-cased
    std::string body;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

    /**
     * @brief Declared body size; 0 when absent
     * @return std::nullopt if Content-Length is not a valid number
     */
    [[nodiscard]] std::optional<size_t> content_length() const;
};

struct HttpResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    /**
     * @brief Status line, headers (CORS and Connection: close included) and body
     */
    [[nodiscard]] std::string serialize() const;

    [[nodiscard]] static HttpResponse json_response(int status, const nlohmann::json& body);
};

/**
 * @brief Parse the request line and headers (everything before the blank line)
 * @return std::nullopt on a malformed head
 */
[[nodiscard]] std::optional<HttpRequest> parse_request_head(const std::string& head);

[[nodiscard]] const char* reason_phrase(int status);

/**
 * @brief Decode %XX escapes; malformed escapes are kept verbatim
 */
[[nodiscard]] std::string url_decode(const std::string& text);

}  // namespace clouddoc::network

#endif  // CLOUDDOC_NETWORK_HTTP_HPP
