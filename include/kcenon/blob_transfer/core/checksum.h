/**
 * @file checksum.h
 * @brief Checksum utilities for block and blob integrity verification
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
#define KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/blob_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief CRC32 for staged blocks, SHA-256 (OpenSSL) for whole blobs
 */
class checksum {
public:
    /**
     * @brief CRC32 (IEEE 802.3) of data
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a CRC32 computation over another piece of data
     * @param crc Value returned by a previous call (0 to start)
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc,
                                           std::span<const std::byte> data)
        -> uint32_t;

    /**
     * @brief SHA-256 of data as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data)
        -> std::string;

    /**
     * @brief SHA-256 of a file as lowercase hex, streamed in 64 KiB reads
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Compare a file's SHA-256 with an expected hex digest
     * @return checksum_mismatch if the digests differ
     */
    [[nodiscard]] static auto verify_sha256(const std::filesystem::path& path,
                                            const std::string& expected)
        -> result<void>;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
