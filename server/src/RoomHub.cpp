#include "RoomHub.h"
#include "Logger.h"
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace BlackRoom {

    std::string RoomHub::PresenceEvent(const std::string& room, size_t count) {
        json j;
        j["type"] = "presence";
        j["room"] = room;
        j["count"] = count;
        return j.dump();
    }

    size_t RoomHub::DeliverLocked(const std::string& room, RoomChannel& channel,
        const std::shared_ptr<const std::string>& frame, size_t& pruned)
    {
        size_t delivered = 0;
        std::vector<SubscriberPtr> dead;
        for (const auto& s : channel.members) {
            bool ok = false;
            try {
                ok = s->Deliver(frame);
            }
            catch (const std::exception& e) {
                LOG_NETWORK("deliver to " + s->Describe() + " threw: " + e.what());
            }
            if (ok) ++delivered;
            else dead.push_back(s);
        }
        for (const auto& s : dead) {
            channel.members.erase(s);
            RelayTrace::log("step=prune room=" + room + " conn=" + s->Describe());
        }
        pruned += dead.size();
        return delivered;
    }

    void RoomHub::AnnouncePresenceLocked(const std::string& room, RoomChannel& channel) {
        // Each pass can prune again; the set only shrinks, so this terminates.
        size_t pruned = 0;
        do {
            pruned = 0;
            auto frame = std::make_shared<const std::string>(PresenceEvent(room, channel.members.size()));
            DeliverLocked(room, channel, frame, pruned);
        } while (pruned > 0 && !channel.members.empty());
    }

    void RoomHub::Subscribe(const std::string& room, const SubscriberPtr& subscriber) {
        if (!subscriber) return;
        std::unique_lock lock(m_RoomMutex);
        auto it = m_Rooms.find(room);
        if (it == m_Rooms.end())
            it = m_Rooms.emplace(room, std::make_shared<RoomChannel>()).first;

        RoomChannel& channel = *it->second;
        {
            std::lock_guard channelLock(channel.mutex);
            channel.members.insert(subscriber);
            const size_t count = channel.members.size();
            RelayTrace::log("step=subscribe room=" + room + " conn=" + subscriber->Describe()
                + " count=" + std::to_string(count));

            bool ok = false;
            try {
                ok = subscriber->Deliver(std::make_shared<const std::string>(PresenceEvent(room, count)));
            }
            catch (const std::exception& e) {
                LOG_NETWORK("presence to " + subscriber->Describe() + " threw: " + e.what());
            }
            if (ok) return;
            channel.members.erase(subscriber);
            RelayTrace::log("step=prune room=" + room + " conn=" + subscriber->Describe());
            if (!channel.members.empty()) return;
        }
        m_Rooms.erase(it);
    }

    void RoomHub::Unsubscribe(const std::string& room, const SubscriberPtr& subscriber) {
        if (!subscriber) return;
        std::unique_lock lock(m_RoomMutex);
        auto it = m_Rooms.find(room);
        if (it == m_Rooms.end()) return;

        RoomChannel& channel = *it->second;
        {
            std::lock_guard channelLock(channel.mutex);
            // A broadcast may already have pruned this connection and left the channel empty.
            if (channel.members.erase(subscriber) > 0) {
                RelayTrace::log("step=unsubscribe room=" + room + " conn=" + subscriber->Describe()
                    + " count=" + std::to_string(channel.members.size()));
                if (!channel.members.empty())
                    AnnouncePresenceLocked(room, channel);
            }
            if (!channel.members.empty()) return;
        }
        m_Rooms.erase(it);
    }

    void RoomHub::EraseIfEmpty(const std::string& room, const std::shared_ptr<RoomChannel>& channel) {
        std::unique_lock lock(m_RoomMutex);
        auto it = m_Rooms.find(room);
        if (it == m_Rooms.end() || it->second != channel) return;
        {
            std::lock_guard channelLock(channel->mutex);
            if (!channel->members.empty()) return;
        }
        m_Rooms.erase(it);
    }

    size_t RoomHub::BroadcastFrame(const std::string& room, std::shared_ptr<const std::string> frame) {
        std::shared_ptr<RoomChannel> channel;
        size_t delivered = 0;
        bool emptied = false;
        {
            std::shared_lock lock(m_RoomMutex);
            auto it = m_Rooms.find(room);
            if (it == m_Rooms.end()) return 0;
            channel = it->second;

            std::lock_guard channelLock(channel->mutex);
            size_t pruned = 0;
            delivered = DeliverLocked(room, *channel, frame, pruned);
            if (pruned > 0 && !channel->members.empty())
                AnnouncePresenceLocked(room, *channel);
            emptied = channel->members.empty();
            if (RelayTrace::enabled())
                RelayTrace::log("step=broadcast room=" + room + " delivered=" + std::to_string(delivered)
                    + " pruned=" + std::to_string(pruned));
        }
        // The shared lock cannot be upgraded; re-check under the exclusive one.
        if (emptied) EraseIfEmpty(room, channel);
        return delivered;
    }

    size_t RoomHub::Broadcast(const std::string& room, const json& event) {
        std::shared_ptr<const std::string> frame;
        try {
            frame = std::make_shared<const std::string>(event.dump());
        }
        catch (const json::exception& e) {
            LOG_ERROR(std::string("broadcast event not serializable: ") + e.what());
            return 0;
        }
        return BroadcastFrame(room, std::move(frame));
    }

    size_t RoomHub::Clear() {
        std::unordered_map<std::string, std::shared_ptr<RoomChannel>> rooms;
        {
            std::unique_lock lock(m_RoomMutex);
            rooms.swap(m_Rooms);
        }
        size_t n = 0;
        for (const auto& [name, channel] : rooms) {
            std::lock_guard channelLock(channel->mutex);
            n += channel->members.size();
        }
        return n;
    }

    size_t RoomHub::SubscriberCount(const std::string& room) const {
        std::shared_lock lock(m_RoomMutex);
        auto it = m_Rooms.find(room);
        if (it == m_Rooms.end()) return 0;
        std::lock_guard channelLock(it->second->mutex);
        return it->second->members.size();
    }

    size_t RoomHub::RoomCount() const {
        std::shared_lock lock(m_RoomMutex);
        size_t n = 0;
        for (const auto& [name, channel] : m_Rooms) {
            std::lock_guard channelLock(channel->mutex);
            if (!channel->members.empty()) ++n;
        }
        return n;
    }

    size_t RoomHub::ChannelCount() const {
        std::shared_lock lock(m_RoomMutex);
        return m_Rooms.size();
    }

    size_t RoomHub::ConnectionCount() const {
        std::shared_lock lock(m_RoomMutex);
        size_t n = 0;
        for (const auto& [name, channel] : m_Rooms) {
            std::lock_guard channelLock(channel->mutex);
            n += channel->members.size();
        }
        return n;
    }

} // namespace BlackRoom
