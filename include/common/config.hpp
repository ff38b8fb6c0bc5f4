/**
 * @file config.hpp
 * @brief Emulator configuration
 */

#ifndef CLOUDDOC_COMMON_CONFIG_HPP
#define CLOUDDOC_COMMON_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace clouddoc::config {

/**
 * @brief Server configuration, loaded from a key=value file
 */
class Config {
   public:
    static constexpr uint16_t DEFAULT_PORT = 8080;
    static constexpr uint16_t MAX_PORT = 65535;
    static constexpr const char* DEFAULT_PROJECT_ID = "demo-project";
    static constexpr int64_t DEFAULT_TRANSACTION_TIMEOUT_MS = 60000;
    static constexpr int DEFAULT_MAX_BATCH_GET_DOCUMENTS = 100;
    static constexpr int DEFAULT_MAX_COMMIT_WRITES = 500;
    static constexpr size_t DEFAULT_MAX_REQUEST_BYTES = 10 * 1024 * 1024;

    // Configuration fields
    uint16_t port = DEFAULT_PORT;
    std::string project_id = DEFAULT_PROJECT_ID;
    std::string config_file;
    int64_t transaction_timeout_ms = DEFAULT_TRANSACTION_TIMEOUT_MS;
    int max_batch_get_documents = DEFAULT_MAX_BATCH_GET_DOCUMENTS;
    int max_commit_writes = DEFAULT_MAX_COMMIT_WRITES;
    size_t max_request_bytes = DEFAULT_MAX_REQUEST_BYTES;
    bool debug = false;
    bool verbose = false;

    Config() = default;

    /**
     * @brief Load settings from a key=value file ('#' starts a comment line)
     * @param filename Path to configuration file
     * @return false if the file cannot be read or a line is malformed
     */
    [[nodiscard]] bool load(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true on success, false on error
     */
    [[nodiscard]] bool save(const std::string& filename) const;

    /**
     * @brief Validate configuration
     * @return true if valid, false otherwise
     */
    [[nodiscard]] bool validate() const;

    /**
     * @brief Print configuration to stdout
     */
    void print() const;

   private:
    /* false when the value does not parse for that key; unknown keys are ignored */
    [[nodiscard]] bool apply_option(const std::string& key, const std::string& value);

    [[nodiscard]] static std::string trim(const std::string& str);
    [[nodiscard]] static bool parse_flag(const std::string& value);
};

}  // namespace clouddoc::config

#endif  // CLOUDDOC_COMMON_CONFIG_HPP
