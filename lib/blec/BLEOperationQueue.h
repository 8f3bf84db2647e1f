/**
 * @file BLEOperationQueue.h
 * @brief GATT operation queue for serializing BLE operations
 *
 * BLE stacks typically do not queue operations internally - attempting to
 * perform multiple GATT operations simultaneously leads to failures or
 * undefined behavior. This queue ensures operations are processed one at
 * a time in submission order, each bounded by a deadline, and each bound to
 * the connection generation that was current when it was submitted.
 *
 * Owners inherit from this class and implement executeOperation() to
 * perform the actual adapter calls.
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <queue>
#include <functional>

namespace BLEC {

/**
 * @brief Base class for GATT operation queuing
 *
 * Call process() from the owning loop to execute queued operations, and
 * complete() when the adapter reports the outcome of the current one.
 * Every operation's callback is invoked exactly once: with the adapter's
 * result, TIMEOUT, or the cancellation result.
 */
class BLEOperationQueue {
public:
    BLEOperationQueue();
    virtual ~BLEOperationQueue() = default;

    /**
     * @brief Add operation to queue
     *
     * @param op Operation to queue (timeout_ms 0 selects the queue default)
     * @return Operation id used to match the adapter's completion
     */
    uint32_t enqueue(GATTOperation op);

    /**
     * @brief Process queue - call from loop()
     *
     * Expires the current operation if its deadline passed, then starts the
     * next operation if none is in progress. Operations whose generation
     * differs from the given one resolve as CANCELLED without executing.
     *
     * @param generation Generation of the connection currently in use
     * @return true if an operation was started
     */
    bool process(uint32_t generation);

    /**
     * @brief Mark current operation complete
     *
     * Completions for an operation that already timed out or was cancelled
     * are discarded.
     *
     * @param op_id Id returned by enqueue()
     * @param result Operation result
     * @param response_data Response data (for reads)
     * @return true if the completion resolved the current operation
     */
    bool complete(uint32_t op_id, OperationResult result, const Bytes& response_data = Bytes());

    /**
     * @brief Check if operation is in progress
     */
    bool isBusy() const { return _has_current_op; }

    /**
     * @brief Get current operation (if any)
     * @return Pointer to current operation, or nullptr if none
     */
    const GATTOperation* currentOperation() const {
        return _has_current_op ? &_current_op : nullptr;
    }

    /**
     * @brief Resolve every operation not belonging to a generation
     *
     * Call this when the connection generation advances.
     *
     * @param generation The new current generation
     * @param result Result delivered to the cancelled operations
     * @return Number of operations resolved
     */
    size_t cancelStale(uint32_t generation, OperationResult result = OperationResult::CANCELLED);

    /**
     * @brief Clear entire queue, resolving every operation
     * @return Number of operations resolved
     */
    size_t clear(OperationResult result = OperationResult::CANCELLED);

    /**
     * @brief Get queue depth (excluding the operation in progress)
     */
    size_t depth() const { return _queue.size(); }

    /**
     * @brief Set default operation timeout
     * @param timeout_ms Timeout in milliseconds
     */
    void setTimeout(uint32_t timeout_ms) { _default_timeout_ms = timeout_ms; }
    uint32_t timeout() const { return _default_timeout_ms; }

protected:
    /**
     * @brief Execute a single operation - implement in subclass
     *
     * Return PENDING if the adapter call was started and complete() will be
     * called later, SUCCESS if the operation finished on submission (write
     * without response), or any other result if it could not be started.
     *
     * @param op Operation to execute
     * @return Start outcome as described above
     */
    virtual OperationResult executeOperation(const GATTOperation& op) = 0;

private:
    /**
     * @brief Check for timeout on current operation
     */
    void checkTimeout();

    /**
     * @brief Resolve the current operation and free the slot
     */
    void finishCurrent(OperationResult result, const Bytes& response_data);

    std::queue<GATTOperation> _queue;
    GATTOperation _current_op;
    bool _has_current_op = false;
    uint32_t _default_timeout_ms = Timing::OPERATION_TIMEOUT_MS;
    uint32_t _next_id = 1;
};

/**
 * @brief Helper class for building GATT operations
 */
class GATTOperationBuilder {
public:
    GATTOperationBuilder& read(const std::string& characteristic);
    GATTOperationBuilder& write(const std::string& characteristic, const Bytes& data);
    GATTOperationBuilder& writeNoResponse(const std::string& characteristic, const Bytes& data);
    GATTOperationBuilder& enableNotify(const std::string& characteristic);
    GATTOperationBuilder& disableNotify(const std::string& characteristic);
    GATTOperationBuilder& withTimeout(uint32_t timeout_ms);
    GATTOperationBuilder& withCallback(std::function<void(OperationResult, const Bytes&)> callback);

    GATTOperation build();

private:
    GATTOperation _op;
};

} // namespace BLEC
