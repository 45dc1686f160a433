#include "chunkpipe/crypto/digest.hpp"
#include "chunkpipe/core/logger.hpp"
#include <sodium.h>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace chunkpipe::crypto {

bool initialize() {
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    return true;
}

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Blake2bHasher::~Blake2bHasher() = default;

CryptoResult Blake2bHasher::initialize() {
    if (!crypto::initialize()) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "libsodium initialization failed");
    }
    
    if (crypto_generichash_init(&impl_->state, nullptr, 0, BLAKE2B_HASH_SIZE) != 0) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "Failed to initialize BLAKE2b hasher");
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult Blake2bHasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (output.size() < BLAKE2B_HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), BLAKE2B_HASH_SIZE) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

CryptoResult Blake2bHasher::hash(std::span<const std::uint8_t> data, Blake2bHash& output) {
    if (!crypto::initialize()) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "libsodium initialization failed");
    }
    
    if (crypto_generichash(output.data(), output.size(), data.data(), data.size(), nullptr, 0) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to hash data");
    }
    
    return CryptoResult();
}

CryptoResult Blake2bHasher::hash_file(const std::filesystem::path& file_path, Blake2bHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::FILE_READ_ERROR, "Cannot open file for hashing: " + file_path.string());
    }
    
    Blake2bHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }
    
    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);
    
    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        
        if (bytes_read > 0) {
            result = hasher.update(std::span<const std::uint8_t>(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }
    
    if (file.bad()) {
        return CryptoResult(CryptoError::FILE_READ_ERROR, "Read error while hashing: " + file_path.string());
    }
    
    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string hash_to_hex(const Blake2bHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Blake2bHash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != BLAKE2B_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    Blake2bHash hash{};
    for (size_t i = 0; i < BLAKE2B_HASH_SIZE; ++i) {
        char high = hex_string[i * 2];
        char low = hex_string[i * 2 + 1];
        if (!std::isxdigit(static_cast<unsigned char>(high)) ||
            !std::isxdigit(static_cast<unsigned char>(low))) {
            return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>(std::stoul(hex_string.substr(i * 2, 2), nullptr, 16));
    }
    
    return hash;
}

}

}
