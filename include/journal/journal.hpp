#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

namespace journal {

// Append-only JSON-lines file. Every record is one self-contained object on
// its own line; a record is durable once append() returns.
class Journal {
public:
    explicit Journal(std::filesystem::path storage_path);

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    // Reads every well-formed record in file order. Lines that fail to parse
    // (for example a torn write at the tail) are skipped.
    std::vector<nlohmann::json> load() const;

    void append(const nlohmann::json& record);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return storage_path_; }
    [[nodiscard]] std::size_t skipped_on_load() const noexcept { return skipped_on_load_; }

private:
    void ensure_directory() const;

    std::filesystem::path storage_path_;
    mutable std::size_t skipped_on_load_ = 0;
    std::mutex append_mutex_;
};

} // namespace journal
