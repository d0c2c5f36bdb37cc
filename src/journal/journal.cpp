#include "journal/journal.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace journal {

Journal::Journal(std::filesystem::path storage_path)
    : storage_path_(std::move(storage_path)) {
    if (storage_path_.empty()) {
        throw std::invalid_argument("Journal storage path not set");
    }
}

std::vector<nlohmann::json> Journal::load() const {
    std::vector<nlohmann::json> records;
    skipped_on_load_ = 0;

    ensure_directory();
    std::ifstream input(storage_path_);
    if (!input.good()) {
        return records;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            auto record = nlohmann::json::parse(line);
            if (!record.is_object()) {
                throw std::runtime_error("record is not an object");
            }
            records.push_back(std::move(record));
        } catch (const std::exception& ex) {
            ++skipped_on_load_;
            std::cerr << "[Journal] Skipping unreadable record at line " << line_number
                      << " of " << storage_path_.string() << ": " << ex.what() << std::endl;
        }
    }

    return records;
}

void Journal::append(const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(append_mutex_);
    ensure_directory();

    std::ofstream output(storage_path_, std::ios::app);
    if (!output.good()) {
        throw std::runtime_error("Failed to open journal at " + storage_path_.string());
    }
    output << record.dump() << '\n';
    output.flush();
    if (!output.good()) {
        throw std::runtime_error("Failed to append to journal at " + storage_path_.string());
    }
}

void Journal::ensure_directory() const {
    const auto dir = storage_path_.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

} // namespace journal
