/**
 * @file update_crypto.hpp
 * @brief Integrity primitives for model updates
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Weight hashes, computation proofs and ledger blocks are SHA-256 digests
 * rendered as lowercase hex. Every accepted update carries an Ed25519
 * signature made with the coordinator's key, also hex encoded.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace fedguard {

using PublicKey = std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>;
using SecretKey = std::array<uint8_t, crypto_sign_SECRETKEYBYTES>;

/**
 * @brief Coordinator Ed25519 signing identity
 */
struct SignatureKeyPair {
    PublicKey public_key;
    SecretKey secret_key;
};

/**
 * @brief UpdateCrypto - libsodium wrappers used by ingestion and the ledgers
 *
 * Stateless and thread-safe once initialize() has succeeded.
 */
class UpdateCrypto {
public:
    /**
     * @brief Initialize libsodium
     * @return false if the library cannot be initialized
     */
    static bool initialize();

    // ========================================================================
    // Digests
    // ========================================================================

    /// SHA-256 of a text, 64 lowercase hex characters
    static std::string sha256_hex(const std::string& data);

    // ========================================================================
    // Update Signatures (Ed25519)
    // ========================================================================

    static SignatureKeyPair generate_signature_keypair();

    /**
     * @brief Detached Ed25519 signature
     * @return crypto_sign_BYTES bytes
     */
    static std::vector<uint8_t> sign_message(const std::string& message, const SecretKey& secret_key);

    /**
     * @brief Check a detached signature
     * @return false for a wrong-length signature, a modified message or another key
     */
    static bool verify_signature(
        const std::string& message,
        const std::vector<uint8_t>& signature,
        const PublicKey& public_key
    );

    /// Detached signature rendered as hex, the form stored on ModelUpdate
    static std::string sign_hex(const std::string& message, const SecretKey& secret_key);

    /// Verify a hex signature; malformed hex never verifies
    static bool verify_hex(const std::string& message, const std::string& signature_hex, const PublicKey& public_key);

    // ========================================================================
    // Encoding and Randomness
    // ========================================================================

    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Random identifier suffix
     * @param num_bytes Entropy in bytes; the token has 2 * num_bytes characters
     */
    static std::string random_hex(size_t num_bytes);

    /// Timing-independent equality; different lengths compare unequal
    static bool constant_time_compare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decode hex
     * @return std::nullopt on odd length or a non-hex character
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);
};

} // namespace fedguard
