#pragma once

#include <cstddef>
#include <string>

namespace ledger {

struct EngineConfig {
    static constexpr const char* kDefaultJournalPath = "data/ledger_journal.jsonl";
    static constexpr std::size_t kMaxPlayerLedgerPageLimit = 1000;

    // Empty runs the engine purely in memory.
    std::string journal_path;
    std::string currency_label = "coins";
    std::size_t player_ledger_page_limit = 50;

    // Defaults overridden by LEDGER_JOURNAL_PATH, LEDGER_CURRENCY_LABEL and
    // LEDGER_LEDGER_PAGE_LIMIT. The journal goes to kDefaultJournalPath unless
    // LEDGER_JOURNAL_PATH says otherwise; set it empty to stay in memory.
    // Call load_env_file first to honour a .env file.
    static EngineConfig from_env();
};

} // namespace ledger
