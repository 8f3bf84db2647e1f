/**
 * @file BLENotificationHub.cpp
 * @brief Fan-out of characteristic notifications and connection events implementation
 */

#include "BLENotificationHub.h"
#include "Log.h"

#include <chrono>

namespace BLEC {

const char* eventTypeToString(CentralEventType type) {
    switch (type) {
        case CentralEventType::DEVICE_DISCOVERED:        return "DEVICE_DISCOVERED";
        case CentralEventType::CONNECTION_STATE_CHANGED: return "CONNECTION_STATE_CHANGED";
        case CentralEventType::READY:                    return "READY";
        case CentralEventType::CONNECTION_FAILED:        return "CONNECTION_FAILED";
        case CentralEventType::NOTIFICATION:             return "NOTIFICATION";
        case CentralEventType::SCAN_COMPLETE:            return "SCAN_COMPLETE";
        default:                                         return "UNKNOWN";
    }
}

bool BLENotificationHub::Mailbox::push(const CentralEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return false;
        }
        if (events.size() >= capacity) {
            dropped++;
            return false;
        }
        events.push_back(event);
    }
    cv.notify_one();
    return true;
}

BLENotificationHub::BLENotificationHub(size_t default_capacity)
    : _default_capacity(default_capacity > 0 ? default_capacity : Limits::SUBSCRIBER_QUEUE_DEPTH) {
}

//=============================================================================
// Subscriber Management
//=============================================================================

BLENotificationHub::SubscriberId BLENotificationHub::subscribe(const std::string& characteristic,
                                                               size_t capacity) {
    std::string uuid = normalizeUUID(characteristic);
    if (uuid.empty()) {
        WARNING("BLENotificationHub: Rejecting subscription to malformed UUID '" +
                characteristic + "'");
        return INVALID_SUBSCRIBER;
    }
    return allocate(SlotKind::CHARACTERISTIC, uuid, capacity);
}

BLENotificationHub::SubscriberId BLENotificationHub::subscribeEvents(size_t capacity) {
    return allocate(SlotKind::EVENTS, std::string(), capacity);
}

bool BLENotificationHub::unsubscribe(SubscriberId id) {
    std::shared_ptr<Mailbox> mailbox;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        SubscriberSlot* slot = const_cast<SubscriberSlot*>(findSlot(id));
        if (!slot) {
            return false;
        }
        mailbox = slot->mailbox;
        slot->clear();
    }

    // Wake any reader blocked in wait()
    {
        std::lock_guard<std::mutex> lock(mailbox->mutex);
        mailbox->closed = true;
        mailbox->events.clear();
    }
    mailbox->cv.notify_all();

    TRACE("BLENotificationHub: Removed subscriber " + std::to_string(id));
    return true;
}

size_t BLENotificationHub::closeCharacteristicSubscribers() {
    std::vector<std::shared_ptr<Mailbox>> closing;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
            SubscriberSlot& slot = _slots[i];
            if (slot.in_use && slot.kind == SlotKind::CHARACTERISTIC) {
                closing.push_back(slot.mailbox);
            }
        }
    }

    size_t closed = 0;
    for (const auto& mailbox : closing) {
        {
            std::lock_guard<std::mutex> lock(mailbox->mutex);
            if (mailbox->closed) {
                continue;
            }
            mailbox->closed = true;
        }
        mailbox->cv.notify_all();
        closed++;
    }

    if (closed > 0) {
        DEBUG("BLENotificationHub: Closed " + std::to_string(closed) + " characteristic subscribers");
    }
    return closed;
}

std::set<std::string> BLENotificationHub::subscribedCharacteristics() const {
    std::set<std::string> result;
    std::lock_guard<std::mutex> lock(_mutex);
    for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
        const SubscriberSlot& slot = _slots[i];
        if (!slot.in_use || slot.kind != SlotKind::CHARACTERISTIC) {
            continue;
        }
        std::lock_guard<std::mutex> mailbox_lock(slot.mailbox->mutex);
        if (!slot.mailbox->closed) {
            result.insert(slot.characteristic);
        }
    }
    return result;
}

size_t BLENotificationHub::subscriberCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t count = 0;
    for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
        if (_slots[i].in_use) {
            count++;
        }
    }
    return count;
}

size_t BLENotificationHub::subscriberCount(const std::string& characteristic) const {
    std::string uuid = normalizeUUID(characteristic);
    std::lock_guard<std::mutex> lock(_mutex);
    size_t count = 0;
    for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
        const SubscriberSlot& slot = _slots[i];
        if (slot.in_use && slot.kind == SlotKind::CHARACTERISTIC && slot.characteristic == uuid) {
            std::lock_guard<std::mutex> mailbox_lock(slot.mailbox->mutex);
            if (!slot.mailbox->closed) {
                count++;
            }
        }
    }
    return count;
}

std::string BLENotificationHub::characteristicOf(SubscriberId id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    const SubscriberSlot* slot = findSlot(id);
    return slot ? slot->characteristic : std::string();
}

//=============================================================================
// Reading
//=============================================================================

bool BLENotificationHub::poll(SubscriberId id, CentralEvent& event_out) {
    std::shared_ptr<Mailbox> mailbox = mailboxFor(id);
    if (!mailbox) {
        return false;
    }

    bool drained_and_closed = false;
    {
        std::lock_guard<std::mutex> lock(mailbox->mutex);
        if (!mailbox->events.empty()) {
            event_out = std::move(mailbox->events.front());
            mailbox->events.pop_front();
            return true;
        }
        drained_and_closed = mailbox->closed;
    }

    // A closed subscriber has nothing more to give, release its slot
    if (drained_and_closed) {
        std::lock_guard<std::mutex> lock(_mutex);
        SubscriberSlot* slot = const_cast<SubscriberSlot*>(findSlot(id));
        if (slot) {
            slot->clear();
        }
    }
    return false;
}

bool BLENotificationHub::wait(SubscriberId id, CentralEvent& event_out, uint32_t timeout_ms) {
    std::shared_ptr<Mailbox> mailbox = mailboxFor(id);
    if (!mailbox) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(mailbox->mutex);
        mailbox->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&mailbox]() {
            return !mailbox->events.empty() || mailbox->closed;
        });
        if (!mailbox->events.empty()) {
            event_out = std::move(mailbox->events.front());
            mailbox->events.pop_front();
            return true;
        }
    }

    // Closed and drained: let poll() release the slot
    CentralEvent unused;
    return poll(id, unused);
}

bool BLENotificationHub::isOpen(SubscriberId id) const {
    std::shared_ptr<Mailbox> mailbox = mailboxFor(id);
    if (!mailbox) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mailbox->mutex);
    return !mailbox->closed;
}

size_t BLENotificationHub::pending(SubscriberId id) const {
    std::shared_ptr<Mailbox> mailbox = mailboxFor(id);
    if (!mailbox) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mailbox->mutex);
    return mailbox->events.size();
}

uint32_t BLENotificationHub::droppedCount(SubscriberId id) const {
    std::shared_ptr<Mailbox> mailbox = mailboxFor(id);
    if (!mailbox) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mailbox->mutex);
    return mailbox->dropped;
}

//=============================================================================
// Publishing
//=============================================================================

void BLENotificationHub::setGeneration(uint32_t generation) {
    std::lock_guard<std::mutex> lock(_mutex);
    _generation = generation;
}

uint32_t BLENotificationHub::generation() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _generation;
}

size_t BLENotificationHub::publishNotification(const NotificationEvent& notification) {
    std::vector<std::shared_ptr<Mailbox>> targets;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (notification.generation != _generation) {
            _stale_discarded++;
            TRACE("BLENotificationHub: Discarding notification for " + notification.characteristic +
                  " from generation " + std::to_string(notification.generation) +
                  " (current " + std::to_string(_generation) + ")");
            return 0;
        }
        for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
            const SubscriberSlot& slot = _slots[i];
            if (slot.in_use && slot.kind == SlotKind::CHARACTERISTIC &&
                slot.characteristic == notification.characteristic) {
                targets.push_back(slot.mailbox);
            }
        }
    }

    CentralEvent event;
    event.type = CentralEventType::NOTIFICATION;
    event.generation = notification.generation;
    event.notification = notification;
    return publishTo(targets, event);
}

size_t BLENotificationHub::publishEvent(const CentralEvent& event) {
    std::vector<std::shared_ptr<Mailbox>> targets;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
            const SubscriberSlot& slot = _slots[i];
            if (slot.in_use && slot.kind == SlotKind::EVENTS) {
                targets.push_back(slot.mailbox);
            }
        }
    }
    return publishTo(targets, event);
}

uint32_t BLENotificationHub::staleDiscarded() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stale_discarded;
}

//=============================================================================
// Private Methods
//=============================================================================

BLENotificationHub::SubscriberId BLENotificationHub::allocate(SlotKind kind,
                                                              const std::string& characteristic,
                                                              size_t capacity) {
    std::lock_guard<std::mutex> lock(_mutex);

    for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
        SubscriberSlot& slot = _slots[i];
        if (slot.in_use) {
            continue;
        }

        slot.in_use = true;
        slot.serial++;
        slot.kind = kind;
        slot.characteristic = characteristic;
        slot.mailbox = std::make_shared<Mailbox>();
        slot.mailbox->capacity = capacity > 0 ? capacity : _default_capacity;

        SubscriberId id = (static_cast<uint32_t>(slot.serial) << 16) |
                          static_cast<uint32_t>(i + 1);
        TRACE("BLENotificationHub: Added subscriber " + std::to_string(id) +
              (kind == SlotKind::CHARACTERISTIC ? " for " + characteristic : std::string(" for events")));
        return id;
    }

    WARNING("BLENotificationHub: Subscriber arena is full, cannot add subscriber");
    return INVALID_SUBSCRIBER;
}

std::shared_ptr<BLENotificationHub::Mailbox> BLENotificationHub::mailboxFor(SubscriberId id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    const SubscriberSlot* slot = findSlot(id);
    return slot ? slot->mailbox : nullptr;
}

const BLENotificationHub::SubscriberSlot* BLENotificationHub::findSlot(SubscriberId id) const {
    uint32_t index = id & 0xFFFF;
    uint16_t serial = static_cast<uint16_t>(id >> 16);
    if (index == 0 || index > Limits::MAX_SUBSCRIBERS) {
        return nullptr;
    }
    const SubscriberSlot& slot = _slots[index - 1];
    if (!slot.in_use || slot.serial != serial) {
        return nullptr;
    }
    return &slot;
}

size_t BLENotificationHub::publishTo(const std::vector<std::shared_ptr<Mailbox>>& targets,
                                     const CentralEvent& event) {
    size_t delivered = 0;
    for (const auto& mailbox : targets) {
        if (mailbox->push(event)) {
            delivered++;
        }
    }
    if (delivered < targets.size()) {
        DEBUG("BLENotificationHub: " + std::string(eventTypeToString(event.type)) + " delivered to " +
              std::to_string(delivered) + "/" + std::to_string(targets.size()) + " subscribers");
    }
    return delivered;
}

} // namespace BLEC
