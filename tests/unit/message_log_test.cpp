#include "Database.h"
#include "IdentityResolver.h"
#include "MessageLog.h"
#include "RoomDirectory.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using namespace BlackRoom;

    std::string FreshDatabasePath(const std::string& test_name) {
        const auto dir = std::filesystem::temp_directory_path() / "blackroom_message_log_tests" / test_name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return (dir / "relay.sqlite3").string();
    }

    void TestAppendStoresSenderSnapshot() {
        Database db(FreshDatabasePath("append"));
        IdentityResolver ids(db);
        RoomDirectory rooms(db);
        MessageLog log(db);

        SenderInfo sender;
        sender.ip = "192.168.1.7";
        sender.userAgent = "curl/8";
        const auto dev = ids.Resolve(std::string("fp-1"), std::string("alice"), sender);
        const auto room = rooms.Ensure("alpha");

        const auto msg = log.Append(room, dev.id, ContentKind::Text, std::string("hello"), std::nullopt, sender);
        assert(msg.id > 0);
        assert(msg.roomId == room.id);
        assert(msg.deviceId == dev.id);
        assert(!msg.createdAt.empty());

        const auto history = log.History("alpha", 10);
        assert(history.size() == 1);
        const auto& e = history[0];
        assert(e.message.id == msg.id);
        assert(e.room == "alpha");
        assert(e.deviceLabel == std::string("alice"));
        assert(e.message.kind == ContentKind::Text);
        assert(e.message.content == std::string("hello"));
        assert(!e.message.fileRef);
        assert(e.message.ipAtSend == std::string("192.168.1.7"));
        assert(e.message.uaAtSend == std::string("curl/8"));
        assert(e.message.createdAt == msg.createdAt);
    }

    void TestHistoryReturnsMostRecentOldestFirst() {
        Database db(FreshDatabasePath("order"));
        RoomDirectory rooms(db);
        MessageLog log(db);

        const auto room = rooms.Ensure("alpha");
        std::vector<int64_t> ids;
        for (int i = 0; i < 5; ++i)
            ids.push_back(log.Append(room, std::nullopt, ContentKind::Text, "m" + std::to_string(i), std::nullopt, SenderInfo{}).id);

        const auto last3 = log.History("alpha", 3);
        assert(last3.size() == 3);
        assert(last3[0].message.id == ids[2]);
        assert(last3[1].message.id == ids[3]);
        assert(last3[2].message.id == ids[4]);
        assert(last3[2].message.content == std::string("m4"));
        assert(!last3[0].deviceLabel);
        assert(!last3[0].message.deviceId);
        for (size_t i = 1; i < last3.size(); ++i)
            assert(last3[i - 1].message.createdAt <= last3[i].message.createdAt);

        assert(log.History("alpha", 100).size() == 5);
        assert(log.History("alpha", 0).empty());
    }

    void TestUnknownRoomAndRoomIsolation() {
        Database db(FreshDatabasePath("isolation"));
        RoomDirectory rooms(db);
        MessageLog log(db);

        const auto alpha = rooms.Ensure("alpha");
        const auto beta = rooms.Ensure("beta");
        log.Append(alpha, std::nullopt, ContentKind::Voice, std::nullopt, std::string("abc.webm"), SenderInfo{});
        log.Append(beta, std::nullopt, ContentKind::System, std::string("joined"), std::nullopt, SenderInfo{});

        assert(log.History("nowhere", 10).empty());

        const auto a = log.History("alpha", 10);
        assert(a.size() == 1);
        assert(a[0].message.kind == ContentKind::Voice);
        assert(a[0].message.fileRef == std::string("abc.webm"));
        assert(!a[0].message.content);

        const auto b = log.History("beta", 10);
        assert(b.size() == 1 && b[0].message.kind == ContentKind::System);
    }

} // namespace

int main() {
    TestAppendStoresSenderSnapshot();
    TestHistoryReturnsMostRecentOldestFirst();
    TestUnknownRoomAndRoomIsolation();

    std::cout << "blackroom_unit_message_log: pass\n";
    return 0;
}
