/**
 * @file document_path.cpp
 * @brief Document resource name parsing
 */

#include "storage/document_path.hpp"

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace clouddoc::storage {

namespace {

constexpr size_t PREFIX_SEGMENTS = 5;  // projects/{p}/databases/{d}/documents

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool is_valid_project_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    for (const char c : id) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '-') {
            return false;
        }
    }
    return true;
}

}  // anonymous namespace

std::optional<DocumentPath> DocumentPath::parse(const std::string& name) {
    const auto parts = split(name, '/');
    if (parts.size() < PREFIX_SEGMENTS + 2) {
        return std::nullopt;
    }
    if (parts[0] != "projects" || parts[2] != "databases" || parts[4] != "documents") {
        return std::nullopt;
    }
    if (!is_valid_project_id(parts[1]) || parts[3].empty()) {
        return std::nullopt;
    }

    DocumentPath path;
    path.project_id = parts[1];
    path.database = parts[3];
    for (size_t i = PREFIX_SEGMENTS; i < parts.size(); ++i) {
        if (parts[i].empty()) {
            return std::nullopt;
        }
        path.segments.push_back(parts[i]);
    }

    /* A document path alternates collection/document and ends on a document */
    if (path.segments.size() % 2 != 0) {
        return std::nullopt;
    }
    return path;
}

std::string DocumentPath::relative_path() const {
    std::string out;
    for (const auto& seg : segments) {
        if (!out.empty()) {
            out += '/';
        }
        out += seg;
    }
    return out;
}

std::string DocumentPath::to_string() const {
    return "projects/" + project_id + "/databases/" + database + "/documents/" + relative_path();
}

common::Status validate_document_name(const std::string& name) {
    const auto path = DocumentPath::parse(name);
    if (!path.has_value()) {
        return common::Status::invalid_argument("Invalid document path: " + name);
    }
    if (path->database != DocumentPath::DEFAULT_DATABASE) {
        return common::Status::not_found("Database " + path->database + " not found");
    }
    return common::Status::ok();
}

}  // namespace clouddoc::storage
