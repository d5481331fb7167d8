/**
 * @file trust_ledger.cpp
 * @brief Implementation of the trust adjustment ledger
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/trust_ledger.hpp"
#include "fedguard/update_crypto.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using json = nlohmann::json;

namespace fedguard {

namespace {

constexpr const char* BLOCK_COLUMNS =
    "block_number, block_hash, previous_hash, timestamp, agent_id, round_id, "
    "trust_before, trust_after, byzantine_after, reason, coordinator_id";

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

TrustBlock block_from_row(sqlite3_stmt* stmt) {
    TrustBlock block;
    block.block_number = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    block.block_hash = column_text(stmt, 1);
    block.previous_hash = column_text(stmt, 2);
    block.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    block.agent_id = column_text(stmt, 4);
    block.round_id = column_text(stmt, 5);
    block.trust_before = sqlite3_column_double(stmt, 6);
    block.trust_after = sqlite3_column_double(stmt, 7);
    block.byzantine_after = sqlite3_column_double(stmt, 8);
    block.reason = column_text(stmt, 9);
    block.coordinator_id = column_text(stmt, 10);
    return block;
}

bool in_unit_range(double value) {
    return value >= 0.0 && value <= 1.0;
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

TrustLedger::TrustLedger(const std::string& database_path, const std::string& coordinator_id)
    : database_path_(database_path)
    , coordinator_id_(coordinator_id)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open trust ledger database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize trust ledger schema");
    }

    // Create genesis block if the chain is empty
    bool empty;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        empty = count_blocks() == 0;
    }
    if (empty && !create_genesis_block()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to create trust ledger genesis block");
    }
}

TrustLedger::~TrustLedger() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool TrustLedger::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_chain_table = R"(
        CREATE TABLE IF NOT EXISTS trust_chain (
            block_number INTEGER PRIMARY KEY,
            block_hash TEXT NOT NULL UNIQUE,
            previous_hash TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            agent_id TEXT NOT NULL,
            round_id TEXT NOT NULL,
            trust_before REAL NOT NULL,
            trust_after REAL NOT NULL,
            byzantine_after REAL NOT NULL,
            reason TEXT NOT NULL,
            coordinator_id TEXT NOT NULL,
            CONSTRAINT valid_trust CHECK (trust_after >= 0.0 AND trust_after <= 1.0),
            CONSTRAINT valid_byzantine CHECK (byzantine_after >= 0.0 AND byzantine_after <= 1.0)
        );
        CREATE INDEX IF NOT EXISTS idx_trust_chain_agent ON trust_chain(agent_id);
        CREATE INDEX IF NOT EXISTS idx_trust_chain_round ON trust_chain(round_id);
    )";

    int rc = sqlite3_exec(db, create_chain_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Chain Operations
// ============================================================================

bool TrustLedger::record_adjustment(
    const std::string& agent_id,
    const std::string& round_id,
    double trust_before,
    double trust_after,
    double byzantine_after,
    const std::string& reason,
    uint64_t timestamp
) {
    if (!in_unit_range(trust_before) || !in_unit_range(trust_after) || !in_unit_range(byzantine_after)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    auto latest_block = read_latest_block();

    TrustBlock block;
    block.block_number = latest_block ? latest_block->block_number + 1 : 0;
    block.previous_hash = latest_block ? latest_block->block_hash : "0";
    block.timestamp = timestamp;
    block.agent_id = agent_id;
    block.round_id = round_id;
    block.trust_before = trust_before;
    block.trust_after = trust_after;
    block.byzantine_after = byzantine_after;
    block.reason = reason;
    block.coordinator_id = coordinator_id_;
    block.block_hash = calculate_block_hash(block);

    return insert_block(block);
}

std::optional<TrustBlock> TrustLedger::get_block(uint64_t block_number) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return read_block(block_number);
}

std::optional<TrustBlock> TrustLedger::get_latest_block() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return read_latest_block();
}

std::vector<TrustBlock> TrustLedger::get_agent_history(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return read_blocks("WHERE agent_id = ?", agent_id);
}

bool TrustLedger::verify_integrity() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto blocks = read_blocks("", "");
    for (size_t i = 0; i < blocks.size(); i++) {
        const auto& block = blocks[i];

        // Numbering must be contiguous from genesis
        if (block.block_number != i) {
            return false;
        }

        if (calculate_block_hash(block) != block.block_hash) {
            return false;
        }

        const std::string& expected_previous = i == 0 ? std::string("0") : blocks[i - 1].block_hash;
        if (block.previous_hash != expected_previous) {
            return false;
        }
    }

    return true;
}

size_t TrustLedger::get_chain_length() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return count_blocks();
}

std::string TrustLedger::export_json(uint64_t since_block) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    json blocks = json::array();
    for (const auto& block : read_blocks("", "")) {
        if (block.block_number < since_block) {
            continue;
        }
        blocks.push_back({
            {"block_number", block.block_number},
            {"block_hash", block.block_hash},
            {"previous_hash", block.previous_hash},
            {"timestamp", block.timestamp},
            {"agent_id", block.agent_id},
            {"round_id", block.round_id},
            {"trust_before", block.trust_before},
            {"trust_after", block.trust_after},
            {"byzantine_after", block.byzantine_after},
            {"reason", block.reason},
            {"coordinator_id", block.coordinator_id}
        });
    }
    return blocks.dump();
}

// ============================================================================
// Private Helper Functions
// ============================================================================

bool TrustLedger::insert_block(const TrustBlock& block) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string("INSERT INTO trust_chain (") + BLOCK_COLUMNS +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(block.block_number));
    sqlite3_bind_text(stmt, 2, block.block_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, block.previous_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(block.timestamp));
    sqlite3_bind_text(stmt, 5, block.agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, block.round_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 7, block.trust_before);
    sqlite3_bind_double(stmt, 8, block.trust_after);
    sqlite3_bind_double(stmt, 9, block.byzantine_after);
    sqlite3_bind_text(stmt, 10, block.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 11, block.coordinator_id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

std::optional<TrustBlock> TrustLedger::read_block(uint64_t block_number) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string("SELECT ") + BLOCK_COLUMNS + " FROM trust_chain WHERE block_number = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(block_number));

    std::optional<TrustBlock> block;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        block = block_from_row(stmt);
    }

    sqlite3_finalize(stmt);
    return block;
}

std::optional<TrustBlock> TrustLedger::read_latest_block() const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string("SELECT ") + BLOCK_COLUMNS +
                      " FROM trust_chain ORDER BY block_number DESC LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::nullopt;
    }

    std::optional<TrustBlock> block;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        block = block_from_row(stmt);
    }

    sqlite3_finalize(stmt);
    return block;
}

std::vector<TrustBlock> TrustLedger::read_blocks(
    const std::string& where_clause,
    const std::string& parameter
) const {
    std::vector<TrustBlock> blocks;

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string("SELECT ") + BLOCK_COLUMNS + " FROM trust_chain " +
                      where_clause + " ORDER BY block_number ASC";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return blocks;
    }

    if (!where_clause.empty()) {
        sqlite3_bind_text(stmt, 1, parameter.c_str(), -1, SQLITE_TRANSIENT);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        blocks.push_back(block_from_row(stmt));
    }

    sqlite3_finalize(stmt);

    return blocks;
}

size_t TrustLedger::count_blocks() const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT COUNT(*) FROM trust_chain";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);

    return count;
}

std::string TrustLedger::calculate_block_hash(const TrustBlock& block) {
    // Concatenate block data for hashing
    std::ostringstream oss;
    oss << block.block_number << ":"
        << block.previous_hash << ":"
        << block.timestamp << ":"
        << block.agent_id << ":"
        << block.round_id << ":"
        << std::fixed << std::setprecision(6) << block.trust_before << ":"
        << std::fixed << std::setprecision(6) << block.trust_after << ":"
        << std::fixed << std::setprecision(6) << block.byzantine_after << ":"
        << block.reason << ":"
        << block.coordinator_id;

    return UpdateCrypto::sha256_hex(oss.str());
}

bool TrustLedger::create_genesis_block() {
    return record_adjustment(
        "GENESIS",
        "",
        0.0,
        0.0,
        0.0,
        "Genesis block for trust adjustment ledger",
        0
    );
}

} // namespace fedguard
