#include "Database.h"
#include "RoomDirectory.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

    using BlackRoom::Database;
    using BlackRoom::RoomDirectory;

    std::string FreshDatabasePath(const std::string& test_name) {
        const auto dir = std::filesystem::temp_directory_path() / "blackroom_room_directory_tests" / test_name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return (dir / "relay.sqlite3").string();
    }

    void TestEnsureIsIdempotent() {
        Database db(FreshDatabasePath("idempotent"));
        RoomDirectory rooms(db);

        assert(!rooms.Find("alpha").has_value());
        const auto alpha = rooms.Ensure("alpha");
        assert(alpha.id > 0);
        assert(alpha.name == "alpha");
        assert(!alpha.createdAt.empty());

        const auto again = rooms.Ensure("alpha");
        assert(again.id == alpha.id);
        assert(again.createdAt == alpha.createdAt);

        const auto beta = rooms.Ensure("beta");
        assert(beta.id != alpha.id);

        const auto found = rooms.Find("beta");
        assert(found && found->id == beta.id);
    }

    void TestConcurrentEnsureCreatesOneRow() {
        Database db(FreshDatabasePath("concurrent"));
        RoomDirectory rooms(db);

        constexpr int kThreads = 8;
        std::vector<int64_t> ids(kThreads, 0);
        std::vector<std::thread> threads;
        for (int i = 0; i < kThreads; ++i)
            threads.emplace_back([&rooms, &ids, i] { ids[i] = rooms.Ensure("lobby").id; });
        for (auto& t : threads) t.join();

        const std::set<int64_t> distinct(ids.begin(), ids.end());
        assert(distinct.size() == 1);
    }

    void TestRoomsSurviveReopen() {
        const std::string path = FreshDatabasePath("reopen");
        int64_t id = 0;
        {
            Database db(path);
            id = RoomDirectory(db).Ensure("persistent").id;
        }
        Database db(path);
        const auto found = RoomDirectory(db).Find("persistent");
        assert(found && found->id == id);
    }

} // namespace

int main() {
    TestEnsureIsIdempotent();
    TestConcurrentEnsureCreatesOneRow();
    TestRoomsSurviveReopen();

    std::cout << "blackroom_unit_room_directory: pass\n";
    return 0;
}
