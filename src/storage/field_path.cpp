/**
 * @file field_path.cpp
 * @brief Field path parsing and nested map navigation
 */

#include "storage/field_path.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace clouddoc::storage {

FieldPath FieldPath::parse(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("Field path cannot be empty");
    }

    std::vector<std::string> segments;
    std::string current;
    bool in_backticks = false;

    for (size_t i = 0; i < path.size(); ++i) {
        const char c = path[i];
        if (c == '`') {
            in_backticks = !in_backticks;
            continue;
        }
        if (c == '.' && !in_backticks) {
            if (current.empty()) {
                throw std::invalid_argument("Invalid field path: empty segment at position " +
                                            std::to_string(i));
            }
            segments.push_back(std::move(current));
            current.clear();
            continue;
        }
        current += c;
    }

    if (in_backticks) {
        throw std::invalid_argument("Invalid field path: unclosed backtick");
    }
    if (current.empty()) {
        throw std::invalid_argument("Invalid field path: trailing dot");
    }
    segments.push_back(std::move(current));
    return FieldPath(std::move(segments));
}

std::string FieldPath::to_string() const {
    std::string out;
    for (const auto& seg : segments_) {
        if (!out.empty()) {
            out += '.';
        }
        if (seg.find('.') != std::string::npos) {
            out += '`' + seg + '`';
        } else {
            out += seg;
        }
    }
    return out;
}

const common::Value* FieldPath::lookup(const common::FieldMap& fields) const {
    const common::FieldMap* level = &fields;
    for (size_t i = 0; i < segments_.size(); ++i) {
        const auto it = level->find(segments_[i]);
        if (it == level->end()) {
            return nullptr;
        }
        if (i + 1 == segments_.size()) {
            return &it->second;
        }
        if (!it->second.is_map()) {
            return nullptr;
        }
        level = &it->second.as_map();
    }
    return nullptr;
}

void FieldPath::set(common::FieldMap& fields, common::Value value) const {
    common::FieldMap* level = &fields;
    for (size_t i = 0; i + 1 < segments_.size(); ++i) {
        auto& slot = (*level)[segments_[i]];
        if (!slot.is_map()) {
            slot = common::Value::make_map({});
        }
        level = &slot.as_map();
    }
    (*level)[segments_.back()] = std::move(value);
}

common::FieldMap apply_field_mask(const common::FieldMap& fields,
                                  const std::vector<FieldPath>& mask) {
    common::FieldMap out;
    for (const auto& path : mask) {
        const common::Value* value = path.lookup(fields);
        if (value != nullptr) {
            path.set(out, *value);
        }
    }
    return out;
}

}  // namespace clouddoc::storage
