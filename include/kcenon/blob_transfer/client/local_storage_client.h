/**
 * @file local_storage_client.h
 * @brief Filesystem-backed storage client
 *
 * Treats a local directory as a blob container. Uploaded blocks are staged
 * under <root>/.staging/<blob>/ with a CRC32 each and joined into
 * <root>/<blob> on commit; the SHA-256 of every committed blob is kept in
 * <root>/.meta/<blob>.sha256 and returned by the download probe. Downloads
 * write into <destination>.part at block offsets and rename it on completion.
 */

#ifndef KCENON_BLOB_TRANSFER_CLIENT_LOCAL_STORAGE_CLIENT_H
#define KCENON_BLOB_TRANSFER_CLIENT_LOCAL_STORAGE_CLIENT_H

#include <kcenon/blob_transfer/client/storage_client.h>

#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::blob_transfer {

class local_storage_client : public storage_client {
public:
    /**
     * @brief Create a client for a container directory, creating it if needed
     */
    [[nodiscard]] static auto create(std::string restoration_id,
                                     const std::filesystem::path& container_root)
        -> result<std::shared_ptr<local_storage_client>>;

    local_storage_client(std::string restoration_id,
                         std::filesystem::path container_root);

    [[nodiscard]] auto restoration_id() const -> const std::string& override {
        return restoration_id_;
    }

    [[nodiscard]] auto endpoint() const -> std::string override;

    /**
     * @param source Local file to upload
     * @param destination Blob name inside the container
     */
    [[nodiscard]] auto create_uploader(const std::string& source,
                                       const std::string& destination,
                                       const blob_transfer_options& options)
        -> result<std::shared_ptr<blob_uploader>> override;

    /**
     * @param source Blob name inside the container
     * @param destination Local file to write
     */
    [[nodiscard]] auto create_downloader(const std::string& source,
                                         const std::string& destination,
                                         const blob_transfer_options& options)
        -> result<std::shared_ptr<blob_downloader>> override;

    [[nodiscard]] auto container_root() const -> const std::filesystem::path& {
        return root_;
    }

    /**
     * @brief Path of a committed blob
     */
    [[nodiscard]] auto blob_path(const std::string& name) const -> std::filesystem::path;

    [[nodiscard]] auto blob_exists(const std::string& name) const -> bool;

private:
    std::string restoration_id_;
    std::filesystem::path root_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CLIENT_LOCAL_STORAGE_CLIENT_H
