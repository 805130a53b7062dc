#include "room.hpp"
#include <exception>
#include <iostream>

// ============================================================================
// ROOM IMPLEMENTATION - One Broadcast Domain
// ============================================================================

Room::Room(std::string id) : id_(std::move(id)) {
}

void Room::join(ParticipantPtr participant) {
    std::lock_guard<std::mutex> lock(mutex_);
    participants.insert(std::move(participant));
}

bool Room::leave(ParticipantPtr participant) {
    // erase() of an absent participant is a no-op, so leave() is idempotent
    std::lock_guard<std::mutex> lock(mutex_);
    return participants.erase(participant) > 0;
}

size_t Room::memberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participants.size();
}

std::vector<ParticipantPtr> Room::deliver(const ParticipantPtr& sender, const Frame& frame) {
    std::vector<ParticipantPtr> failed;

    /*
     * The room lock is held across the whole loop: broadcasts in one room
     * are serialized, so every recipient sees one sender's header+binary
     * pairs adjacent and in order. deliver() only queues.
     */
    std::lock_guard<std::mutex> lock(mutex_);
    if (participants.count(sender) == 0) {
        return failed;
    }

    for (const auto& participant : participants) {
        if (participant == sender) {
            continue;
        }
        try {
            participant->deliver(frame);
        } catch (const std::exception& e) {
            std::cerr << "Delivery failed in room " << id_ << ": " << e.what() << std::endl;
            failed.push_back(participant);
        }
    }
    return failed;
}

// ============================================================================
// REGISTRY IMPLEMENTATION - The Arena of Rooms
// ============================================================================

RoomRegistry::RoomRegistry(std::string label) : label_(std::move(label)) {
}

void RoomRegistry::join(const std::string& roomId, ParticipantPtr participant) {
    std::lock_guard<std::mutex> lock(mutex_);

    // One membership per connection: a second join moves it.
    auto existing = memberships_.find(participant);
    if (existing != memberships_.end()) {
        if (existing->second->id() == roomId) {
            return;
        }
        leaveLocked(participant);
    }

    auto& room = rooms_[roomId];
    if (!room) {
        room = std::make_shared<Room>(roomId);
        std::cout << "Created " << label_ << " " << roomId << std::endl;
    }
    room->join(participant);
    memberships_[participant] = room;

    std::cout << "Participant joined " << label_ << " " << roomId
              << " (" << room->memberCount() << " members)" << std::endl;
}

void RoomRegistry::leave(ParticipantPtr participant) {
    std::lock_guard<std::mutex> lock(mutex_);
    leaveLocked(participant);
}

bool RoomRegistry::leaveLocked(const ParticipantPtr& participant) {
    auto membership = memberships_.find(participant);
    if (membership == memberships_.end()) {
        return false;
    }

    std::shared_ptr<Room> room = membership->second;
    memberships_.erase(membership);
    room->leave(participant);

    size_t remaining = room->memberCount();
    std::cout << "Participant left " << label_ << " " << room->id()
              << " (" << remaining << " members)" << std::endl;

    if (remaining == 0) {
        rooms_.erase(room->id());
        std::cout << "Destroyed empty " << label_ << " " << room->id() << std::endl;
    }
    return true;
}

void RoomRegistry::broadcast(const ParticipantPtr& sender, const Frame& frame) {
    std::shared_ptr<Room> room;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto membership = memberships_.find(sender);
        if (membership == memberships_.end()) {
            return;
        }
        room = membership->second;
    }

    // The Room stays alive through our shared_ptr even if it is erased
    // from rooms_ while we are delivering.
    std::vector<ParticipantPtr> failed = room->deliver(sender, frame);
    for (const auto& participant : failed) {
        leave(participant);
    }
}

size_t RoomRegistry::roomCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

size_t RoomRegistry::memberCount(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return 0;
    }
    return it->second->memberCount();
}

bool RoomRegistry::hasRoom(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.count(roomId) > 0;
}
