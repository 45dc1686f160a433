#pragma once

#include "crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkpipe::crypto {

// Streaming BLAKE2b-256 (libsodium crypto_generichash).
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();
    
    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    
    bool is_initialized() const { return initialized_; }
    
    static CryptoResult hash(std::span<const std::uint8_t> data, Blake2bHash& output);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Blake2bHash& output);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string hash_to_hex(const Blake2bHash& hash);
std::optional<Blake2bHash> hash_from_hex(const std::string& hex_string);

}

}
