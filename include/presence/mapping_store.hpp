#pragma once

#include <filesystem>
#include <istream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace presence {

class io_error: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Normalized identifier -> display name
using mapping_table = std::unordered_map<std::string, std::string>;

/**
 * @brief parse_mappings Parses "IDENTIFIER = NAME" lines
 * Blank lines and '#' comments are ignored, malformed lines are skipped
 * with a warning naming source and line number.
 */
mapping_table parse_mappings(std::istream& is, std::string const& source);

/**
 * @brief The MappingStore class
 * Owns the address -> name table backed by a mapping file. The table is
 * replaced as a whole on reload, so lookups never see a partially loaded
 * file. Safe to use from several threads.
 */
class MappingStore {
public:
    static constexpr char const* default_location = "device_mappings.txt";

    explicit MappingStore(std::filesystem::path p);
    MappingStore(MappingStore const&)            = delete;
    MappingStore& operator=(MappingStore const&) = delete;

    /**
     * @brief load Reads the mapping file, replacing the current table
     * A missing file gives an empty table.
     * @throws io_error if the file exists but cannot be read
     */
    void load();

    /**
     * @brief maybe_reload Reloads if the file modification time changed since the last load
     * Read failures are logged and keep the current table; the next call retries.
     * @return true if the table was replaced
     */
    bool maybe_reload();

    std::optional<std::string> lookup(std::string_view address) const;
    std::optional<std::string> lookup_name(std::string_view device_name) const;

    /**
     * @brief upsert Adds or updates one address in the file, then in memory
     * Comments and the order of other lines are kept. The file is replaced
     * atomically through a temporary file in the same directory, keeping
     * its line terminator, mode and symlink. Concurrent upserts are serialized.
     * @return true if an existing entry was updated, false if it was added
     * @throws std::invalid_argument on a malformed address or empty name
     * @throws io_error if the file cannot be read or written; the table is unchanged
     */
    bool upsert(std::string_view address, std::string_view name);

    mapping_table entries() const;
    size_t size() const;
    std::filesystem::path const& path() const { return path_; }

private:
    using file_time = std::optional<std::filesystem::file_time_type>;

    std::filesystem::path const path_;
    mapping_table table;
    file_time last_write;
    mutable std::mutex mtx;
    std::mutex write_mtx;
};

}  // namespace presence
