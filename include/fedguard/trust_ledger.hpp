/**
 * @file trust_ledger.hpp
 * @brief Hash-chained audit ledger of trust adjustments
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every trust and Byzantine score change applied after a round is appended
 * as a block whose hash covers the previous block's hash:
 * - Tamper-evident adjustment history
 * - Chain integrity verification
 * - SQLite persistence
 * - Thread-safe operations
 */

#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>

namespace fedguard {

/**
 * @brief Ledger block recording one trust adjustment
 */
struct TrustBlock {
    uint64_t block_number;          ///< Sequential block number (0 = genesis)
    std::string block_hash;         ///< SHA-256 hash of this block
    std::string previous_hash;      ///< Hash of previous block ("0" for genesis)
    uint64_t timestamp;             ///< Adjustment time
    std::string agent_id;           ///< Agent whose scores changed
    std::string round_id;           ///< Round that caused the change
    double trust_before;            ///< Trust score before (0.0-1.0)
    double trust_after;             ///< Trust score after (0.0-1.0)
    double byzantine_after;         ///< Byzantine score after (0.0-1.0)
    std::string reason;             ///< "contribution" or "byzantine_detection"
    std::string coordinator_id;     ///< Coordinator that applied the change
};

/**
 * @brief TrustLedger - SQLite-backed hash chain of trust adjustments
 *
 * Thread-safe for concurrent access
 */
class TrustLedger {
public:
    /**
     * @brief Open (or create) a ledger
     * @param database_path Path to SQLite database file (":memory:" for transient)
     * @param coordinator_id ID recorded on appended blocks
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit TrustLedger(
        const std::string& database_path,
        const std::string& coordinator_id = ""
    );

    /**
     * @brief Destructor - closes database
     */
    ~TrustLedger();

    // Disable copy and move
    TrustLedger(const TrustLedger&) = delete;
    TrustLedger& operator=(const TrustLedger&) = delete;
    TrustLedger(TrustLedger&&) = delete;
    TrustLedger& operator=(TrustLedger&&) = delete;

    /**
     * @brief Append an adjustment block
     * @param agent_id Agent whose scores changed
     * @param round_id Round that caused the change
     * @param trust_before Trust score before the change
     * @param trust_after Trust score after the change
     * @param byzantine_after Byzantine score after the change
     * @param reason Short reason tag
     * @param timestamp Adjustment time
     * @return true if appended, false on out-of-range scores or database error
     */
    bool record_adjustment(
        const std::string& agent_id,
        const std::string& round_id,
        double trust_before,
        double trust_after,
        double byzantine_after,
        const std::string& reason,
        uint64_t timestamp
    );

    /**
     * @brief Get block by number
     * @return TrustBlock or std::nullopt if not found
     */
    std::optional<TrustBlock> get_block(uint64_t block_number) const;

    /**
     * @brief Get the most recent block
     * @return TrustBlock or std::nullopt if the chain is empty
     */
    std::optional<TrustBlock> get_latest_block() const;

    /**
     * @brief All blocks for one agent, oldest first
     */
    std::vector<TrustBlock> get_agent_history(const std::string& agent_id) const;

    /**
     * @brief Recompute every block hash and check linkage
     * @return true if the chain is intact, false if tampering detected
     */
    bool verify_integrity() const;

    /**
     * @brief Number of blocks including genesis
     */
    size_t get_chain_length() const;

    /**
     * @brief Export blocks as a JSON array
     * @param since_block First block number to export
     */
    std::string export_json(uint64_t since_block = 0) const;

private:
    /// Path to SQLite database
    std::string database_path_;

    /// Coordinator recorded on appended blocks
    std::string coordinator_id_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    bool initialize_database();

    // Callers hold db_mutex_
    bool insert_block(const TrustBlock& block);
    std::optional<TrustBlock> read_block(uint64_t block_number) const;
    std::optional<TrustBlock> read_latest_block() const;
    std::vector<TrustBlock> read_blocks(const std::string& where_clause, const std::string& parameter) const;
    size_t count_blocks() const;

    /**
     * @brief Calculate SHA-256 hash of block data
     * @return SHA-256 hash as hex string
     */
    static std::string calculate_block_hash(const TrustBlock& block);

    bool create_genesis_block();
};

} // namespace fedguard
