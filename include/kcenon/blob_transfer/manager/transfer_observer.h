/**
 * @file transfer_observer.h
 * @brief Observer of transfer state changes
 */

#ifndef KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_OBSERVER_H
#define KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_OBSERVER_H

#include <kcenon/blob_transfer/core/transfer_types.h>

#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Receives every state change of every transfer entity
 *
 * Called from worker threads and from the thread that issued the control
 * call, never while the manager holds its lock; calling back into the
 * manager is allowed.
 */
class transfer_observer {
public:
    virtual ~transfer_observer() = default;

    /**
     * @param snapshot Entity after the change
     * @param state New state (same as snapshot.state)
     * @param progress Progress of the owning blob, when it applies
     */
    virtual void on_transfer_state_changed(const transfer_snapshot& snapshot,
                                           transfer_state state,
                                           const std::optional<transfer_progress>& progress) = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_OBSERVER_H
