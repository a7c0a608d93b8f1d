#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace kwc {

/**
 * @brief Raised when input rows lack a required column or field
 *
 * Schema problems are never recovered: the run stops and no partial
 * result is produced.
 */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& message)
        : std::runtime_error("Schema error: " + message) {}
};

/**
 * @brief One normalized (page, keyword, clicks) observation
 */
struct Record {
    std::string page;       // Canonical landing page URL
    std::string keyword;    // Case-folded search query
    int64_t clicks = 0;     // Url Clicks for this (page, query) pair
    size_t line = 0;        // 1-based source line, 0 when not read from a file
};

} // namespace kwc
