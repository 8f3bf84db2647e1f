/**
 * @file BLEOperationQueue.cpp
 * @brief GATT operation queue implementation
 */

#include "BLEOperationQueue.h"
#include "Log.h"

namespace BLEC {

BLEOperationQueue::BLEOperationQueue() {
}

uint32_t BLEOperationQueue::enqueue(GATTOperation op) {
    op.id = _next_id++;
    if (_next_id == 0) {
        _next_id = 1;
    }
    op.queued_at = RNS::Utilities::OS::time();

    if (op.timeout_ms == 0) {
        op.timeout_ms = _default_timeout_ms;
    }

    uint32_t id = op.id;
    _queue.push(std::move(op));

    TRACE("BLEOperationQueue: Enqueued operation " + std::to_string(id) +
          ", queue depth: " + std::to_string(_queue.size()));

    return id;
}

bool BLEOperationQueue::process(uint32_t generation) {
    // Check for timeout on current operation
    if (_has_current_op) {
        checkTimeout();
        if (_has_current_op) {
            return false;  // Still busy
        }
    }

    bool started = false;

    // Operations resolved on submission free the slot immediately, so keep
    // draining until one is in flight or the queue is empty
    while (!_has_current_op && !_queue.empty()) {
        _current_op = std::move(_queue.front());
        _has_current_op = true;
        _queue.pop();

        GATTOperation& op = _current_op;

        if (op.generation != generation) {
            DEBUG("BLEOperationQueue: Operation " + std::to_string(op.id) +
                  " belongs to generation " + std::to_string(op.generation) +
                  " (current " + std::to_string(generation) + "), cancelling");
            finishCurrent(OperationResult::CANCELLED, Bytes());
            continue;
        }

        op.started_at = RNS::Utilities::OS::time();
        uint32_t id = op.id;

        TRACE("BLEOperationQueue: Starting operation " + std::to_string(id) + " " +
              operationToString(op.type) + " on " + op.characteristic);

        // Execute the operation (implemented by subclass)
        OperationResult result = executeOperation(op);

        if (result == OperationResult::PENDING) {
            started = true;
            break;
        }

        // Resolved on submission or failed to start. The subclass may already
        // have completed it re-entrantly.
        if (_has_current_op && _current_op.id == id) {
            if (result != OperationResult::SUCCESS) {
                WARNING("BLEOperationQueue: Operation " + std::to_string(id) +
                        " failed to start: " + resultToString(result));
            }
            finishCurrent(result, Bytes());
        }
        started = started || result == OperationResult::SUCCESS;
    }

    return started;
}

bool BLEOperationQueue::complete(uint32_t op_id, OperationResult result, const Bytes& response_data) {
    if (!_has_current_op) {
        DEBUG("BLEOperationQueue: Discarding completion for operation " + std::to_string(op_id) +
              " with no current operation");
        return false;
    }

    if (_current_op.id != op_id) {
        DEBUG("BLEOperationQueue: Discarding late completion for operation " +
              std::to_string(op_id) + " (current " + std::to_string(_current_op.id) + ")");
        return false;
    }

    double duration = RNS::Utilities::OS::time() - _current_op.started_at;
    TRACE("BLEOperationQueue: Operation " + std::to_string(op_id) + " completed in " +
          std::to_string(static_cast<int>(duration * 1000)) + "ms, result: " +
          resultToString(result));

    finishCurrent(result, response_data);
    return true;
}

size_t BLEOperationQueue::cancelStale(uint32_t generation, OperationResult result) {
    size_t cancelled = 0;

    // Pull the stale operations out first so callbacks can safely enqueue
    std::queue<GATTOperation> remaining;
    std::vector<GATTOperation> stale;

    while (!_queue.empty()) {
        GATTOperation op = std::move(_queue.front());
        _queue.pop();

        if (op.generation == generation) {
            remaining.push(std::move(op));
        } else {
            stale.push_back(std::move(op));
        }
    }
    _queue = std::move(remaining);

    // Current operation first: it was submitted before anything still queued
    if (_has_current_op && _current_op.generation != generation) {
        finishCurrent(result, Bytes());
        cancelled++;
    }

    for (GATTOperation& op : stale) {
        if (op.callback) {
            op.callback(result, Bytes());
        }
        cancelled++;
    }

    if (cancelled > 0) {
        DEBUG("BLEOperationQueue: Resolved " + std::to_string(cancelled) +
              " operations from superseded generations as " + resultToString(result));
    }

    return cancelled;
}

size_t BLEOperationQueue::clear(OperationResult result) {
    size_t cancelled = 0;

    // Cancel current operation
    if (_has_current_op) {
        finishCurrent(result, Bytes());
        cancelled++;
    }

    // Cancel all pending operations
    std::queue<GATTOperation> pending;
    pending.swap(_queue);
    while (!pending.empty()) {
        GATTOperation op = std::move(pending.front());
        pending.pop();

        if (op.callback) {
            op.callback(result, Bytes());
        }
        cancelled++;
    }

    TRACE("BLEOperationQueue: Cleared " + std::to_string(cancelled) + " operations");
    return cancelled;
}

void BLEOperationQueue::checkTimeout() {
    if (!_has_current_op) {
        return;
    }

    GATTOperation& op = _current_op;
    double elapsed = RNS::Utilities::OS::time() - op.started_at;
    double timeout_sec = op.timeout_ms / 1000.0;

    if (elapsed > timeout_sec) {
        WARNING("BLEOperationQueue: Operation " + std::to_string(op.id) + " " +
                operationToString(op.type) + " on " + op.characteristic +
                " timed out after " + std::to_string(static_cast<int>(elapsed * 1000)) + "ms");

        // Complete with timeout error
        finishCurrent(OperationResult::TIMEOUT, Bytes());
    }
}

void BLEOperationQueue::finishCurrent(OperationResult result, const Bytes& response_data) {
    // Free the slot before invoking the callback so it can submit again
    GATTOperation op = std::move(_current_op);
    _current_op = GATTOperation();
    _has_current_op = false;

    if (op.callback) {
        op.callback(result, response_data);
    }
}

//=============================================================================
// GATTOperationBuilder
//=============================================================================

GATTOperationBuilder& GATTOperationBuilder::read(const std::string& characteristic) {
    _op.type = OperationType::READ;
    _op.characteristic = normalizeUUID(characteristic);
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::write(const std::string& characteristic,
                                                  const Bytes& data) {
    _op.type = OperationType::WRITE;
    _op.characteristic = normalizeUUID(characteristic);
    _op.data = data;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::writeNoResponse(const std::string& characteristic,
                                                            const Bytes& data) {
    _op.type = OperationType::WRITE_NO_RESPONSE;
    _op.characteristic = normalizeUUID(characteristic);
    _op.data = data;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::enableNotify(const std::string& characteristic) {
    _op.type = OperationType::NOTIFY_ENABLE;
    _op.characteristic = normalizeUUID(characteristic);
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::disableNotify(const std::string& characteristic) {
    _op.type = OperationType::NOTIFY_DISABLE;
    _op.characteristic = normalizeUUID(characteristic);
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::withTimeout(uint32_t timeout_ms) {
    _op.timeout_ms = timeout_ms;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::withCallback(
    std::function<void(OperationResult, const Bytes&)> callback) {
    _op.callback = callback;
    return *this;
}

GATTOperation GATTOperationBuilder::build() {
    return std::move(_op);
}

} // namespace BLEC
