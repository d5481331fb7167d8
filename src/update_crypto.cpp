/**
 * @file update_crypto.cpp
 * @brief Implementation of integrity primitives for model updates
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/update_crypto.hpp"

namespace fedguard {

namespace {

const uint8_t* as_bytes(const std::string& text) {
    return reinterpret_cast<const uint8_t*>(text.data());
}

} // anonymous namespace

bool UpdateCrypto::initialize() {
    // 1 means another caller got there first
    return sodium_init() != -1;
}

// ============================================================================
// Digests
// ============================================================================

std::string UpdateCrypto::sha256_hex(const std::string& data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), as_bytes(data), data.size());
    return bytes_to_hex(digest);
}

// ============================================================================
// Update Signatures (Ed25519)
// ============================================================================

SignatureKeyPair UpdateCrypto::generate_signature_keypair() {
    SignatureKeyPair keypair;
    crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

std::vector<uint8_t> UpdateCrypto::sign_message(const std::string& message, const SecretKey& secret_key) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);
    crypto_sign_detached(signature.data(), nullptr, as_bytes(message), message.size(), secret_key.data());
    return signature;
}

bool UpdateCrypto::verify_signature(
    const std::string& message,
    const std::vector<uint8_t>& signature,
    const PublicKey& public_key
) {
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), as_bytes(message), message.size(), public_key.data()) == 0;
}

std::string UpdateCrypto::sign_hex(const std::string& message, const SecretKey& secret_key) {
    return bytes_to_hex(sign_message(message, secret_key));
}

bool UpdateCrypto::verify_hex(const std::string& message, const std::string& signature_hex, const PublicKey& public_key) {
    auto signature = hex_to_bytes(signature_hex);
    return signature && verify_signature(message, *signature, public_key);
}

// ============================================================================
// Encoding and Randomness
// ============================================================================

std::vector<uint8_t> UpdateCrypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    if (size > 0) {
        randombytes_buf(bytes.data(), size);
    }
    return bytes;
}

std::string UpdateCrypto::random_hex(size_t num_bytes) {
    return bytes_to_hex(generate_random_bytes(num_bytes));
}

bool UpdateCrypto::constant_time_compare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    return a.size() == b.size() && sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string UpdateCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

std::optional<std::vector<uint8_t>> UpdateCrypto::hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t decoded = 0;
    const char* end = nullptr;
    int rc = sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(), nullptr, &decoded, &end);

    // Parsing stops early at the first non-hex character
    if (rc != 0 || decoded != bytes.size() || end != hex.data() + hex.size()) {
        return std::nullopt;
    }
    return bytes;
}

} // namespace fedguard
