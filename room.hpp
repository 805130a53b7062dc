#include "frame.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#ifndef ROOM_HPP
#define ROOM_HPP

/*
 * ============================================================================
 * ROOM REGISTRY - Who Is In Which Room
 * ============================================================================
 *
 *   Client A ──┐                      ┌──> Client B
 *              ├──> RoomRegistry ─────┤
 *   Client C ──┘   "ABCD12" -> Room   └──> Client C (not A, the sender)
 *
 * A Room appears the moment its first Participant joins and disappears the
 * moment its last one leaves. Nobody ever creates or deletes a room by name.
 *
 * Locking: the registry mutex guards the id -> Room map and the
 * participant -> Room index. Each Room guards its own member set. When both
 * are needed the registry lock is always taken first.
 * ============================================================================
 */

/*
 * Participant - anything a Room can hand a Frame to
 *
 * deliver() must not block: it queues the frame for that participant and
 * returns. Throwing from deliver() means "treat me as disconnected".
 */
class Participant {
    public:
        virtual void deliver(const Frame& frame) = 0;
    virtual ~Participant() = default;
};

typedef std::shared_ptr<Participant> ParticipantPtr;

class Room {
    public:
        explicit Room(std::string id);

        const std::string& id() const { return id_; }

        void join(ParticipantPtr participant);
        bool leave(ParticipantPtr participant);
        size_t memberCount() const;

        /*
         * deliver() - fan a frame out to everyone except the sender
         *
         * Returns the participants whose deliver() threw; the caller is
         * expected to make them leave once this room's lock is released.
         */
        std::vector<ParticipantPtr> deliver(const ParticipantPtr& sender, const Frame& frame);

    private:
        std::string id_;
        mutable std::mutex mutex_;
        std::set<ParticipantPtr> participants;
};

class RoomRegistry {
    public:
        // label only shows up in log lines ("room", "signal")
        explicit RoomRegistry(std::string label = "room");

        void join(const std::string& roomId, ParticipantPtr participant);
        void leave(ParticipantPtr participant);
        void broadcast(const ParticipantPtr& sender, const Frame& frame);

        size_t roomCount() const;
        size_t memberCount(const std::string& roomId) const;
        bool hasRoom(const std::string& roomId) const;

    private:
        bool leaveLocked(const ParticipantPtr& participant);

        std::string label_;
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<Room>> rooms_;
        std::map<ParticipantPtr, std::shared_ptr<Room>> memberships_;
};

#endif // ROOM_HPP
