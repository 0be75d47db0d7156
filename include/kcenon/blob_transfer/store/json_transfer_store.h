/**
 * @file json_transfer_store.h
 * @brief Directory-backed transfer store, one JSON document per record
 *
 * Each record is written to <directory>/<id>.json. Child id lists are not
 * stored; they are rebuilt from parent links when the directory is read
 * (blocks ordered by index, blobs by first-save order).
 */

#ifndef KCENON_BLOB_TRANSFER_STORE_JSON_TRANSFER_STORE_H
#define KCENON_BLOB_TRANSFER_STORE_JSON_TRANSFER_STORE_H

#include <kcenon/blob_transfer/store/transfer_store.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace kcenon::blob_transfer {

/**
 * @brief Configuration for json_transfer_store
 */
struct json_store_config {
    std::filesystem::path directory;

    /**
     * @brief Write to a temporary file and rename, so a crash never leaves a
     *        half-written record
     */
    bool atomic_writes = true;

    json_store_config();
    explicit json_store_config(std::filesystem::path dir);
};

/**
 * @note Thread-safe. Records are cached after the directory is first read.
 */
class json_transfer_store : public transfer_store {
public:
    explicit json_transfer_store(const json_store_config& config = json_store_config{});
    ~json_transfer_store() override;

    json_transfer_store(const json_transfer_store&) = delete;
    json_transfer_store& operator=(const json_transfer_store&) = delete;

    [[nodiscard]] auto fetch(transfer_kind kind, const transfer_filter& filter = {})
        -> result<std::vector<transfer_record>> override;
    [[nodiscard]] auto save(const std::vector<transfer_record>& records)
        -> result<void> override;
    [[nodiscard]] auto remove(const transfer_id& id) -> result<void> override;
    [[nodiscard]] auto clear() -> result<void> override;

    [[nodiscard]] auto config() const -> const json_store_config&;

    /**
     * @brief Serialize one record as the JSON document written to disk
     */
    [[nodiscard]] static auto to_json(const transfer_record& record, uint64_t sequence)
        -> std::string;

    /**
     * @brief Parse a document produced by to_json
     * @return store_record_invalid on malformed input
     */
    [[nodiscard]] static auto from_json(const std::string& json)
        -> result<std::pair<transfer_record, uint64_t>>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_STORE_JSON_TRANSFER_STORE_H
