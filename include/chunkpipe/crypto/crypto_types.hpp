#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chunkpipe::crypto {

constexpr size_t BLAKE2B_HASH_SIZE = 32;

using Blake2bHash = std::array<std::uint8_t, BLAKE2B_HASH_SIZE>;

enum class CryptoError {
    SUCCESS = 0,
    INITIALIZATION_FAILED,
    BUFFER_TOO_SMALL,
    HASH_FAILED,
    FILE_READ_ERROR,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

// Safe to call repeatedly; libsodium's own init is idempotent.
bool initialize();

}
