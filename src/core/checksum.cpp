/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/blob_transfer/core/checksum.h>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace kcenon::blob_transfer {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32_POLYNOMIAL : crc >> 1;
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

constexpr std::size_t FILE_READ_SIZE = 64 * 1024;

auto digest_to_hex(const unsigned char* digest, std::size_t length)
    -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data)
    -> uint32_t {
    crc ^= 0xFFFFFFFF;
    for (std::byte b : data) {
        auto index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
           digest.data());
    return digest_to_hex(digest.data(), digest.size());
}

auto checksum::sha256_file(const std::filesystem::path& path)
    -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return unexpected(
            error{error_code::internal_error, "failed to initialize SHA-256"});
    }

    std::vector<char> buffer(FILE_READ_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(
                error{error_code::internal_error, "SHA-256 update failed"});
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "failed to read file: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1) {
        return unexpected(
            error{error_code::internal_error, "SHA-256 finalization failed"});
    }

    return digest_to_hex(digest.data(), digest_length);
}

auto checksum::verify_sha256(const std::filesystem::path& path,
                             const std::string& expected) -> result<void> {
    auto actual = sha256_file(path);
    if (!actual) {
        return unexpected(actual.error());
    }

    std::string normalized = expected;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (actual.value() != normalized) {
        return unexpected(error{error_code::checksum_mismatch,
                                "SHA-256 mismatch for " + path.string() +
                                    ": expected " + normalized + ", got " +
                                    actual.value()});
    }
    return {};
}

}  // namespace kcenon::blob_transfer
