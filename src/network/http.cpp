/**
 * @file http.cpp
 * @brief HTTP/1.1 head parsing and response serialisation
 */

#include "network/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

namespace clouddoc::network {

namespace {

constexpr const char* CRLF = "\r\n";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& str) {
    const size_t start = str.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    const size_t end = str.find_last_not_of(" \t");
    return str.substr(start, end - start + 1);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // anonymous namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    const auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> HttpRequest::content_length() const {
    const auto value = header("content-length");
    if (!value.has_value()) {
        return 0;
    }
    size_t length = 0;
    const char* begin = value->data();
    const char* end = value->data() + value->size();
    const auto [ptr, ec] = std::from_chars(begin, end, length);
    if (value->empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return length;
}

std::optional<HttpRequest> parse_request_head(const std::string& head) {
    HttpRequest request;

    size_t line_end = head.find(CRLF);
    const std::string request_line = head.substr(0, line_end);

    const size_t sp1 = request_line.find(' ');
    if (sp1 == std::string::npos) {
        return std::nullopt;
    }
    const size_t sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) {
        return std::nullopt;
    }
    request.method = request_line.substr(0, sp1);
    request.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    request.version = request_line.substr(sp2 + 1);
    if (request.method.empty() || request.target.empty() ||
        request.version.compare(0, 5, "HTTP/") != 0) {
        return std::nullopt;
    }
    request.path = request.target.substr(0, request.target.find('?'));

    while (line_end != std::string::npos) {
        const size_t start = line_end + 2;
        line_end = head.find(CRLF, start);
        const std::string line = head.substr(start, line_end == std::string::npos
                                                        ? std::string::npos
                                                        : line_end - start);
        if (line.empty()) {
            continue;
        }
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        request.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return request;
}

std::string HttpResponse::serialize() const {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + CRLF;
    auto all = headers;
    all.emplace("Content-Length", std::to_string(body.size()));
    all.emplace("Connection", "close");
    all.emplace("Access-Control-Allow-Origin", "*");
    all.emplace("Access-Control-Allow-Methods", "POST, OPTIONS");
    all.emplace("Access-Control-Allow-Headers", "Content-Type, Authorization");
    for (const auto& [name, value] : all) {
        out += name + ": " + value + CRLF;
    }
    out += CRLF;
    out += body;
    return out;
}

HttpResponse HttpResponse::json_response(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.headers["Content-Type"] = "application/json";
    /* Messages can echo request bytes that are not valid UTF-8 */
    response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 409:
            return "Conflict";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        default:
            return "Unknown";
    }
}

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

}  // namespace clouddoc::network
