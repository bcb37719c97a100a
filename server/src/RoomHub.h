#pragma once
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace BlackRoom {

    // A live connection as seen by the hub.
    class Subscriber {
    public:
        virtual ~Subscriber() = default;

        /// Queues one outbound text frame without blocking. Returns false once the
        /// connection is known dead (closed socket, failed write, overflowing queue).
        virtual bool Deliver(std::shared_ptr<const std::string> frame) = 0;

        virtual std::string Describe() const = 0;
    };

    using SubscriberPtr = std::shared_ptr<Subscriber>;

    // ---------------------------------------------------------------------------
    // RoomHub: room name -> live subscribers.
    //
    // Lock order is always m_RoomMutex, then the channel's own mutex. Fan-out holds
    // the channel mutex for the whole delivery loop, so membership never changes
    // under an iteration and two broadcasts to one room reach every subscriber in
    // call order. Delivery only enqueues, nothing here waits on a socket or on storage.
    // ---------------------------------------------------------------------------
    class RoomHub {
    public:
        /// Adds the connection and sends it {type:"presence", room, count}.
        void Subscribe(const std::string& room, const SubscriberPtr& subscriber);

        /// Removes the connection and sends the new count to everyone left. No-op if absent.
        void Unsubscribe(const std::string& room, const SubscriberPtr& subscriber);

        /// Best-effort fan-out. Dead connections are pruned and the remaining
        /// subscribers get a fresh presence count. Never throws.
        /// Returns the number of successful deliveries.
        size_t Broadcast(const std::string& room, const nlohmann::json& event);
        size_t BroadcastFrame(const std::string& room, std::shared_ptr<const std::string> frame);

        /// Drops every subscription without presence updates (shutdown). Returns how many were held.
        size_t Clear();

        size_t SubscriberCount(const std::string& room) const;
        size_t RoomCount() const;
        size_t ConnectionCount() const;
        /// Channels currently allocated, empty or not. Equals RoomCount() whenever the hub is idle.
        size_t ChannelCount() const;

        static std::string PresenceEvent(const std::string& room, size_t count);

    private:
        struct RoomChannel {
            mutable std::mutex mutex;
            std::set<SubscriberPtr> members;
        };

        // Must be called with channel.mutex held.
        static size_t DeliverLocked(const std::string& room, RoomChannel& channel,
            const std::shared_ptr<const std::string>& frame, size_t& pruned);
        static void AnnouncePresenceLocked(const std::string& room, RoomChannel& channel);
        void EraseIfEmpty(const std::string& room, const std::shared_ptr<RoomChannel>& channel);

        mutable std::shared_mutex m_RoomMutex;
        std::unordered_map<std::string, std::shared_ptr<RoomChannel>> m_Rooms;
    };

} // namespace BlackRoom
