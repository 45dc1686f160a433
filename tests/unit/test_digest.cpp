#include <gtest/gtest.h>
#include "chunkpipe/crypto/digest.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace chunkpipe::crypto;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

}

class DigestTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(initialize());
        test_file = std::filesystem::temp_directory_path() / "chunkpipe_digest_test.bin";
    }
    
    void TearDown() override {
        std::filesystem::remove(test_file);
    }
    
    std::filesystem::path test_file;
};

TEST_F(DigestTest, KnownVectors) {
    Blake2bHash hash{};
    
    ASSERT_TRUE(Blake2bHasher::hash({}, hash));
    EXPECT_EQ(hash_utils::hash_to_hex(hash),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
    
    auto abc = bytes_of("abc");
    ASSERT_TRUE(Blake2bHasher::hash(abc, hash));
    EXPECT_EQ(hash_utils::hash_to_hex(hash),
              "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
}

TEST_F(DigestTest, StreamingMatchesOneShot) {
    auto data = bytes_of("the quick brown fox jumps over the lazy dog");
    
    Blake2bHash expected{};
    ASSERT_TRUE(Blake2bHasher::hash(data, expected));
    
    Blake2bHasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(std::span<const std::uint8_t>(data.data(), 10)));
    ASSERT_TRUE(hasher.update(std::span<const std::uint8_t>(data.data() + 10, data.size() - 10)));
    
    Blake2bHash streamed{};
    ASSERT_TRUE(hasher.finalize(streamed));
    EXPECT_EQ(streamed, expected);
    EXPECT_FALSE(hasher.is_initialized());
}

TEST_F(DigestTest, UninitializedHasherRejected) {
    Blake2bHasher hasher;
    auto data = bytes_of("x");
    
    EXPECT_EQ(hasher.update(data).error, CryptoError::INVALID_STATE);
    
    Blake2bHash out{};
    EXPECT_EQ(hasher.finalize(out).error, CryptoError::INVALID_STATE);
}

TEST_F(DigestTest, SmallOutputBufferRejected) {
    Blake2bHasher hasher;
    ASSERT_TRUE(hasher.initialize());
    
    std::array<std::uint8_t, 16> small{};
    EXPECT_EQ(hasher.finalize(small).error, CryptoError::BUFFER_TOO_SMALL);
}

TEST_F(DigestTest, HashFile) {
    std::vector<std::uint8_t> data(200000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 31);
    }
    {
        std::ofstream file(test_file, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    
    Blake2bHash from_file{};
    ASSERT_TRUE(Blake2bHasher::hash_file(test_file, from_file));
    
    Blake2bHash from_memory{};
    ASSERT_TRUE(Blake2bHasher::hash(data, from_memory));
    EXPECT_EQ(from_file, from_memory);
}

TEST_F(DigestTest, HashMissingFile) {
    Blake2bHash out{};
    auto result = Blake2bHasher::hash_file("/nonexistent/chunkpipe.bin", out);
    EXPECT_EQ(result.error, CryptoError::FILE_READ_ERROR);
}

TEST_F(DigestTest, HexRoundTrip) {
    Blake2bHash hash{};
    ASSERT_TRUE(Blake2bHasher::hash(bytes_of("abc"), hash));
    
    auto hex = hash_utils::hash_to_hex(hash);
    auto parsed = hash_utils::hash_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, hash);
    
    EXPECT_FALSE(hash_utils::hash_from_hex("abcd").has_value());
    EXPECT_FALSE(hash_utils::hash_from_hex(std::string(64, 'g')).has_value());
}
