/**
 * @file config.cpp
 * @brief Configuration implementation
 *
 * @defgroup config Configuration
 * @{
 */

#include "common/config.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace clouddoc::config {

bool Config::load(const std::string& filename) {
    if (filename.empty()) {
        return false;
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot open config file: " << filename << "\n";
        return false;
    }

    std::string raw;
    int line_no = 0;
    while (std::getline(file, raw)) {
        ++line_no;
        const std::string line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << filename << ":" << line_no << ": expected key=value\n";
            return false;
        }

        const std::string key = trim(line.substr(0, eq_pos));
        const std::string value = trim(line.substr(eq_pos + 1));
        if (!apply_option(key, value)) {
            std::cerr << filename << ":" << line_no << ": invalid value for " << key << "\n";
            return false;
        }
    }
    config_file = filename;
    return true;
}

bool Config::apply_option(const std::string& key, const std::string& value) {
    if (value.empty()) {
        return false;
    }
    try {
        if (key == "port") {
            const int parsed = std::stoi(value);
            if (parsed < 1 || parsed > MAX_PORT) {
                return false;
            }
            port = static_cast<uint16_t>(parsed);
        } else if (key == "project_id") {
            project_id = value;
        } else if (key == "transaction_timeout_ms") {
            transaction_timeout_ms = std::stoll(value);
        } else if (key == "max_batch_get_documents") {
            max_batch_get_documents = std::stoi(value);
        } else if (key == "max_commit_writes") {
            max_commit_writes = std::stoi(value);
        } else if (key == "max_request_bytes") {
            max_request_bytes = static_cast<size_t>(std::stoull(value));
        } else if (key == "debug") {
            debug = parse_flag(value);
        } else if (key == "verbose") {
            verbose = parse_flag(value);
        } else {
            std::cerr << "Ignoring unknown config key: " << key << "\n";
        }
    } catch (const std::logic_error&) {
        return false;
    }
    return true;
}

/**
 * @brief Save configuration to file
 */
bool Config::save(const std::string& filename) const {
    if (filename.empty()) {
        return false;
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot open config file for writing: " << filename << "\n";
        return false;
    }

    file << "# cloudDoc emulator settings (key=value)\n\n";

    file << "port=" << port << "\n";
    file << "project_id=" << project_id << "\n";
    file << "transaction_timeout_ms=" << transaction_timeout_ms << "\n";
    file << "max_batch_get_documents=" << max_batch_get_documents << "\n";
    file << "max_commit_writes=" << max_commit_writes << "\n";
    file << "max_request_bytes=" << max_request_bytes << "\n";
    file << "debug=" << (debug ? "true" : "false") << "\n";
    file << "verbose=" << (verbose ? "true" : "false") << "\n";
    return static_cast<bool>(file);
}

/**
 * @brief Validate configuration
 */
bool Config::validate() const {
    if (port == 0) {
        std::cerr << "Invalid port number: " << port << "\n";
        return false;
    }

    if (project_id.empty()) {
        std::cerr << "Project id cannot be empty\n";
        return false;
    }

    if (transaction_timeout_ms < 1) {
        std::cerr << "Invalid transaction timeout: " << transaction_timeout_ms << " ms\n";
        return false;
    }

    if (max_batch_get_documents < 1) {
        std::cerr << "Invalid batchGet limit: " << max_batch_get_documents << "\n";
        return false;
    }

    if (max_commit_writes < 1) {
        std::cerr << "Invalid commit limit: " << max_commit_writes << "\n";
        return false;
    }

    if (max_request_bytes == 0) {
        std::cerr << "Invalid request size limit: " << max_request_bytes << "\n";
        return false;
    }

    return true;
}

/**
 * @brief Print configuration to stdout
 */
void Config::print() const {
    std::cout << "=== cloudDoc Configuration ===\n";
    std::cout << "Port:         " << port << "\n";
    std::cout << "Project:      " << project_id << "\n";
    std::cout << "Txn timeout:  " << transaction_timeout_ms << " ms\n";
    std::cout << "batchGet max: " << max_batch_get_documents << " documents\n";
    std::cout << "commit max:   " << max_commit_writes << " writes\n";
    std::cout << "Request max:  " << max_request_bytes << " bytes\n";
    std::cout << "Debug:        " << (debug ? "enabled" : "disabled") << "\n";
    std::cout << "Verbose:      " << (verbose ? "enabled" : "disabled") << "\n";
    std::cout << "==============================\n";
}

/**
 * @brief Trim whitespace from string
 */
std::string Config::trim(const std::string& str) {
    const size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool Config::parse_flag(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

}  // namespace clouddoc::config

/** @} */ /* config */
