/**
 * @file store_writer.h
 * @brief Background writer applying store mutations in order
 */

#ifndef KCENON_BLOB_TRANSFER_STORE_STORE_WRITER_H
#define KCENON_BLOB_TRANSFER_STORE_STORE_WRITER_H

#include <kcenon/blob_transfer/store/transfer_store.h>

#include <memory>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Single background thread that applies store mutations
 *
 * Mutations are applied in enqueue order, so the last snapshot enqueued for
 * an entity is the one persisted. Failures are logged; flush() reports the
 * first failure since the previous flush.
 *
 * @code
 * store_writer writer(std::make_shared<memory_transfer_store>());
 * writer.enqueue_save({record});
 * auto flushed = writer.flush();
 * @endcode
 */
class store_writer {
public:
    explicit store_writer(std::shared_ptr<transfer_store> store);
    ~store_writer();

    store_writer(const store_writer&) = delete;
    store_writer& operator=(const store_writer&) = delete;

    void enqueue_save(std::vector<transfer_record> records);
    void enqueue_remove(const transfer_id& id);
    void enqueue_clear();

    /**
     * @brief Wait until every mutation enqueued so far has been applied
     * @return The first error since the previous flush
     */
    [[nodiscard]] auto flush() -> result<void>;

    /**
     * @brief Apply pending mutations and stop the thread; later enqueues are
     *        applied synchronously
     */
    void stop();

    [[nodiscard]] auto pending() const -> std::size_t;

    [[nodiscard]] auto store() const -> const std::shared_ptr<transfer_store>&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_STORE_STORE_WRITER_H
