// File: src/storage/journal.cpp
#include "storage/journal.hpp"
#include "storage/memory_journal.hpp"
#include "storage/sqlite_journal.hpp"
#include <stdexcept>

namespace geochron {

const char* ToString(JournalBackend backend) {
    switch (backend) {
        case JournalBackend::MEMORY: return "memory";
        case JournalBackend::SQLITE: return "sqlite";
        default: return "unknown";
    }
}

JournalBackend ParseJournalBackend(const std::string& str) {
    if (str == "memory") return JournalBackend::MEMORY;
    if (str == "sqlite") return JournalBackend::SQLITE;
    throw std::invalid_argument("Unknown JournalBackend: " + str);
}

std::unique_ptr<Journal> CreateJournal(JournalBackend backend, const std::string& sqlite_path) {
    switch (backend) {
        case JournalBackend::MEMORY:
            return std::make_unique<MemoryJournal>();
        case JournalBackend::SQLITE: {
            SqliteJournal::Config config;
            config.db_path = sqlite_path;
            return std::make_unique<SqliteJournal>(config);
        }
        default:
            throw std::invalid_argument("Unsupported journal backend");
    }
}

} // namespace geochron
