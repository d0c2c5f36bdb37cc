#include "ledger/engine_config.hpp"

#include "journal/util.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace ledger {

EngineConfig EngineConfig::from_env() {
    EngineConfig config;
    config.journal_path = kDefaultJournalPath;
    if (const char* path = std::getenv("LEDGER_JOURNAL_PATH")) {
        config.journal_path = journal::trim(path);
    }
    config.currency_label = journal::env_or("LEDGER_CURRENCY_LABEL", config.currency_label);

    const auto limit_text = journal::trim(journal::env_or("LEDGER_LEDGER_PAGE_LIMIT", ""));
    if (!limit_text.empty()) {
        try {
            const auto limit = std::stoll(limit_text);
            if (limit <= 0 || static_cast<unsigned long long>(limit) > kMaxPlayerLedgerPageLimit) {
                throw std::invalid_argument("must be between 1 and " + std::to_string(kMaxPlayerLedgerPageLimit));
            }
            config.player_ledger_page_limit = static_cast<std::size_t>(limit);
        } catch (const std::exception& ex) {
            std::cerr << "[Config] Ignoring LEDGER_LEDGER_PAGE_LIMIT='" << limit_text << "': " << ex.what()
                      << std::endl;
        }
    }

    std::clog << "[Config] Journal: " << (config.journal_path.empty() ? "<in-memory>" : config.journal_path)
              << ", currency: " << config.currency_label
              << ", ledger page limit: " << config.player_ledger_page_limit << std::endl;
    return config;
}

} // namespace ledger
