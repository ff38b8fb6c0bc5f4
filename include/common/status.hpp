/**
 * @file status.hpp
 * @brief Operation outcome with an RPC status code
 */

#ifndef CLOUDDOC_COMMON_STATUS_HPP
#define CLOUDDOC_COMMON_STATUS_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace clouddoc::common {

enum class StatusCode : uint8_t {
    OK = 0,
    INVALID_ARGUMENT,
    FAILED_PRECONDITION,
    NOT_FOUND,
    ALREADY_EXISTS,
    ABORTED,
    INTERNAL
};

/**
 * @brief Result of a validation or handler step
 */
class Status {
   private:
    StatusCode code_ = StatusCode::OK;
    std::string message_;

   public:
    Status() = default;
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] static Status ok() { return {}; }
    [[nodiscard]] static Status invalid_argument(std::string msg) {
        return {StatusCode::INVALID_ARGUMENT, std::move(msg)};
    }
    [[nodiscard]] static Status failed_precondition(std::string msg) {
        return {StatusCode::FAILED_PRECONDITION, std::move(msg)};
    }
    [[nodiscard]] static Status not_found(std::string msg) {
        return {StatusCode::NOT_FOUND, std::move(msg)};
    }
    [[nodiscard]] static Status already_exists(std::string msg) {
        return {StatusCode::ALREADY_EXISTS, std::move(msg)};
    }
    [[nodiscard]] static Status aborted(std::string msg) {
        return {StatusCode::ABORTED, std::move(msg)};
    }
    [[nodiscard]] static Status internal(std::string msg) {
        return {StatusCode::INTERNAL, std::move(msg)};
    }

    [[nodiscard]] bool is_ok() const { return code_ == StatusCode::OK; }
    [[nodiscard]] StatusCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    /**
     * @brief HTTP status the code is reported with
     */
    [[nodiscard]] int http_status() const {
        switch (code_) {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
            case StatusCode::FAILED_PRECONDITION:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::ALREADY_EXISTS:
            case StatusCode::ABORTED:
                return 409;
            case StatusCode::INTERNAL:
                return 500;
        }
        return 500;
    }

    [[nodiscard]] const char* status_name() const {
        switch (code_) {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::FAILED_PRECONDITION:
                return "FAILED_PRECONDITION";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::ALREADY_EXISTS:
                return "ALREADY_EXISTS";
            case StatusCode::ABORTED:
                return "ABORTED";
            case StatusCode::INTERNAL:
                return "INTERNAL";
        }
        return "UNKNOWN";
    }
};

}  // namespace clouddoc::common

#endif  // CLOUDDOC_COMMON_STATUS_HPP
