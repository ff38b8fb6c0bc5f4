/**
 * @file wire_format.cpp
 * @brief Request parsing and response encoding
 *
 * @defgroup wire Wire Format
 * @{
 */

#include "api/wire_format.hpp"

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/codec.hpp"
#include "common/timestamp.hpp"
#include "common/value.hpp"

namespace clouddoc::api {

namespace {

using json = nlohmann::json;
using common::CodecError;
using common::ValueCodec;

std::optional<std::string> optional_string(const json& body, const char* key) {
    if (!body.contains(key) || body.at(key).is_null()) {
        return std::nullopt;
    }
    if (!body.at(key).is_string()) {
        throw CodecError(std::string(key) + " must be a string");
    }
    return body.at(key).get<std::string>();
}

std::vector<std::string> string_list(const json& list, const char* what) {
    if (!list.is_array()) {
        throw CodecError(std::string(what) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(list.size());
    for (const auto& item : list) {
        if (!item.is_string()) {
            throw CodecError(std::string(what) + " must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::vector<std::string> parse_field_mask(const json& mask, const char* what) {
    if (!mask.is_object()) {
        throw CodecError(std::string(what) + " must be an object");
    }
    if (!mask.contains("fieldPaths")) {
        return {};
    }
    return string_list(mask.at("fieldPaths"), "fieldPaths");
}

TransactionOptions parse_transaction_options(const json& options) {
    if (!options.is_object()) {
        throw CodecError("Transaction options must be an object");
    }
    TransactionOptions out;
    if (options.contains("readOnly") && !options.at("readOnly").is_null()) {
        const auto& read_only = options.at("readOnly");
        if (!read_only.is_object()) {
            throw CodecError("readOnly must be an object");
        }
        out.read_only = true;
        out.read_time = optional_string(read_only, "readTime");
    }
    if (options.contains("readWrite") && !options.at("readWrite").is_null()) {
        const auto& read_write = options.at("readWrite");
        if (!read_write.is_object()) {
            throw CodecError("readWrite must be an object");
        }
        if (out.read_only) {
            throw CodecError("Transaction options cannot be both readOnly and readWrite");
        }
        out.retry_transaction = optional_string(read_write, "retryTransaction");
    }
    return out;
}

common::Value parse_array_operand(const json& wire, const char* op) {
    if (!wire.is_object()) {
        throw CodecError(std::string(op) + " must be an object");
    }
    common::ValueArray values;
    if (wire.contains("values")) {
        const auto& items = wire.at("values");
        if (!items.is_array()) {
            throw CodecError(std::string(op) + ".values must be an array");
        }
        for (const auto& item : items) {
            values.push_back(ValueCodec::decode(item));
        }
    }
    return common::Value::make_array(std::move(values));
}

common::Value parse_numeric_operand(const json& wire, const char* op) {
    auto value = ValueCodec::decode(wire);
    if (!value.is_numeric()) {
        throw CodecError(std::string(op) + " requires a numeric value");
    }
    return value;
}

write::Precondition parse_precondition(const json& wire) {
    if (!wire.is_object()) {
        throw CodecError("currentDocument must be an object");
    }
    write::Precondition out;
    if (wire.contains("exists") && !wire.at("exists").is_null()) {
        if (!wire.at("exists").is_boolean()) {
            throw CodecError("currentDocument.exists must be a boolean");
        }
        out.exists = wire.at("exists").get<bool>();
    }
    const auto update_time = optional_string(wire, "updateTime");
    if (update_time.has_value()) {
        if (!common::Timestamp::parse(*update_time).has_value()) {
            throw CodecError("Invalid updateTime: " + *update_time);
        }
        out.update_time = *update_time;
    }
    return out;
}

std::vector<write::FieldTransform> parse_transform_list(const json& wire, const char* what) {
    if (!wire.is_array()) {
        throw CodecError(std::string(what) + " must be an array");
    }
    std::vector<write::FieldTransform> out;
    out.reserve(wire.size());
    for (const auto& item : wire) {
        out.push_back(parse_field_transform(item));
    }
    return out;
}

std::string require_string_field(const json& wire, const char* key) {
    if (!wire.contains(key) || !wire.at(key).is_string()) {
        throw CodecError(std::string(key) + " is required and must be a string");
    }
    return wire.at(key).get<std::string>();
}

}  // anonymous namespace

write::FieldTransform parse_field_transform(const json& wire) {
    static constexpr std::array<const char*, 6> OPERATIONS = {
        "setToServerValue", "increment",           "maximum",
        "minimum",          "appendMissingElements", "removeAllFromArray"};

    if (!wire.is_object()) {
        throw CodecError("Field transform must be an object");
    }

    write::FieldTransform out;
    out.field_path = require_string_field(wire, "fieldPath");

    const char* op = nullptr;
    for (const char* candidate : OPERATIONS) {
        if (wire.contains(candidate)) {
            if (op != nullptr) {
                throw CodecError("Field transform for " + out.field_path +
                                 " must specify exactly one operation");
            }
            op = candidate;
        }
    }
    if (op == nullptr) {
        throw CodecError("Field transform for " + out.field_path +
                         " must specify exactly one operation");
    }

    const std::string name(op);
    const json& operand = wire.at(op);
    if (name == "setToServerValue") {
        if (!operand.is_string() || operand.get<std::string>() != "REQUEST_TIME") {
            throw CodecError("Unsupported server value: " + operand.dump());
        }
        out.kind = write::TransformKind::SERVER_TIMESTAMP;
    } else if (name == "increment") {
        out.kind = write::TransformKind::INCREMENT;
        out.operand = parse_numeric_operand(operand, op);
    } else if (name == "maximum") {
        out.kind = write::TransformKind::MAXIMUM;
        out.operand = parse_numeric_operand(operand, op);
    } else if (name == "minimum") {
        out.kind = write::TransformKind::MINIMUM;
        out.operand = parse_numeric_operand(operand, op);
    } else if (name == "appendMissingElements") {
        out.kind = write::TransformKind::APPEND_MISSING_ELEMENTS;
        out.operand = parse_array_operand(operand, op);
    } else {
        out.kind = write::TransformKind::REMOVE_ALL_FROM_ARRAY;
        out.operand = parse_array_operand(operand, op);
    }
    return out;
}

write::Write parse_write(const json& wire) {
    if (!wire.is_object()) {
        throw CodecError("Each write must be an object");
    }

    const int kinds = static_cast<int>(wire.contains("update")) +
                      static_cast<int>(wire.contains("delete")) +
                      static_cast<int>(wire.contains("transform"));
    if (kinds != 1) {
        throw CodecError("Write must specify exactly one of update, delete, or transform");
    }

    write::Write out;
    if (wire.contains("update")) {
        const auto& update = wire.at("update");
        if (!update.is_object()) {
            throw CodecError("update must be an object");
        }
        out.kind = write::WriteKind::UPDATE;
        out.document = require_string_field(update, "name");
        if (update.contains("fields") && !update.at("fields").is_null()) {
            out.fields = ValueCodec::decode_fields(update.at("fields"));
        }
        if (wire.contains("updateMask") && !wire.at("updateMask").is_null()) {
            out.update_mask = parse_field_mask(wire.at("updateMask"), "updateMask");
        }
        if (wire.contains("updateTransforms") && !wire.at("updateTransforms").is_null()) {
            out.transforms = parse_transform_list(wire.at("updateTransforms"), "updateTransforms");
        }
    } else if (wire.contains("delete")) {
        if (!wire.at("delete").is_string()) {
            throw CodecError("delete must be a document name");
        }
        out.kind = write::WriteKind::DELETE;
        out.document = wire.at("delete").get<std::string>();
    } else {
        const auto& transform = wire.at("transform");
        if (!transform.is_object()) {
            throw CodecError("transform must be an object");
        }
        out.kind = write::WriteKind::TRANSFORM;
        out.document = require_string_field(transform, "document");
        if (transform.contains("fieldTransforms")) {
            out.transforms =
                parse_transform_list(transform.at("fieldTransforms"), "fieldTransforms");
        }
    }

    if (wire.contains("currentDocument") && !wire.at("currentDocument").is_null()) {
        out.precondition = parse_precondition(wire.at("currentDocument"));
    }
    return out;
}

BatchGetRequest parse_batch_get_request(const json& body) {
    if (!body.is_object() || !body.contains("documents") || !body.at("documents").is_array()) {
        throw CodecError("documents field is required and must be an array");
    }

    BatchGetRequest out;
    for (const auto& item : body.at("documents")) {
        if (!item.is_string()) {
            throw CodecError("Invalid document path: " + item.dump());
        }
        out.documents.push_back(item.get<std::string>());
    }

    if (body.contains("mask") && !body.at("mask").is_null()) {
        out.mask = parse_field_mask(body.at("mask"), "mask");
    }
    out.transaction = optional_string(body, "transaction");
    if (body.contains("newTransaction") && !body.at("newTransaction").is_null()) {
        out.new_transaction = parse_transaction_options(body.at("newTransaction"));
    }
    out.read_time = optional_string(body, "readTime");
    if (out.read_time.has_value() && !common::Timestamp::parse(*out.read_time).has_value()) {
        throw CodecError("Invalid readTime: " + *out.read_time);
    }
    return out;
}

CommitRequest parse_commit_request(const json& body) {
    if (!body.is_object() || !body.contains("writes") || !body.at("writes").is_array()) {
        throw CodecError("writes field is required and must be an array");
    }

    CommitRequest out;
    const auto& writes = body.at("writes");
    out.writes.reserve(writes.size());
    for (const auto& item : writes) {
        out.writes.push_back(parse_write(item));
    }
    out.transaction = optional_string(body, "transaction");
    return out;
}

BeginTransactionRequest parse_begin_transaction_request(const json& body) {
    BeginTransactionRequest out;
    if (body.is_null()) {
        return out;
    }
    if (!body.is_object()) {
        throw CodecError("Request body must be an object");
    }
    if (body.contains("options") && !body.at("options").is_null()) {
        out.options = parse_transaction_options(body.at("options"));
    }
    return out;
}

RollbackRequest parse_rollback_request(const json& body) {
    if (!body.is_object() || !body.contains("transaction") || !body.at("transaction").is_string() ||
        body.at("transaction").get<std::string>().empty()) {
        throw CodecError("transaction field is required");
    }
    return RollbackRequest{body.at("transaction").get<std::string>()};
}

json encode_document(const storage::Document& doc) {
    return json{{"name", doc.name},
                {"fields", ValueCodec::encode_fields(doc.fields)},
                {"createTime", doc.create_time.to_string()},
                {"updateTime", doc.update_time.to_string()}};
}

json encode_write_result(const write::WriteResult& result) {
    json out{{"updateTime", result.update_time.to_string()}};
    if (result.transform_results.has_value()) {
        json values = json::array();
        for (const auto& value : *result.transform_results) {
            values.push_back(ValueCodec::encode(value));
        }
        out["transformResults"] = std::move(values);
    }
    return out;
}

json encode_error(const common::Status& status) {
    return json{{"error",
                 {{"code", status.http_status()},
                  {"message", status.message()},
                  {"status", status.status_name()}}}};
}

}  // namespace clouddoc::api

/** @} */ /* wire */
