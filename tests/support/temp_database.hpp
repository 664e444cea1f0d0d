#pragma once

#include "fts/core/config.hpp"
#include "fts/core/id.hpp"

#include <filesystem>
#include <string>

namespace fts::testing {

/**
 * @brief Unique SQLite path under the temp directory, removed with its WAL files
 */
class TempDatabase {
public:
    TempDatabase()
        : path_((std::filesystem::temp_directory_path() / ("fts-test-" + generate_id() + ".db")).string()) {}

    ~TempDatabase() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path_ + suffix, ec);
        }
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    const std::string& path() const { return path_; }

    StoreConfig config() const {
        StoreConfig config;
        config.path = path_;
        return config;
    }

private:
    std::string path_;
};

} // namespace fts::testing
