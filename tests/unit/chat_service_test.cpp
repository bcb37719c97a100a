#include "ChatService.h"
#include "Database.h"
#include "Errors.h"
#include "RoomHub.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

    using namespace BlackRoom;
    using json = nlohmann::json;

    class RecordingSubscriber : public Subscriber {
    public:
        bool Deliver(std::shared_ptr<const std::string> frame) override {
            std::lock_guard lock(m_Mutex);
            m_Frames.push_back(json::parse(*frame));
            return true;
        }
        std::string Describe() const override { return "recorder"; }

        std::vector<json> Messages() const {
            std::lock_guard lock(m_Mutex);
            std::vector<json> out;
            for (const auto& f : m_Frames)
                if (f.at("type") == "msg") out.push_back(f);
            return out;
        }

    private:
        mutable std::mutex m_Mutex;
        std::vector<json> m_Frames;
    };

    ServerConfig TestConfig(const std::string& test_name) {
        const auto dir = std::filesystem::temp_directory_path() / "blackroom_chat_service_tests" / test_name;
        std::filesystem::remove_all(dir);
        ServerConfig cfg;
        cfg.databasePath = (dir / "relay.sqlite3").string();
        cfg.dataDir = (dir / "data").string();
        return cfg;
    }

    void TestMalformedFramesAreDropped() {
        const ServerConfig cfg = TestConfig("malformed");
        Database db(cfg.databasePath);
        RoomHub hub;
        ChatService chat(cfg, db, hub);
        auto rec = std::make_shared<RecordingSubscriber>();
        hub.Subscribe("alpha", rec);

        assert(!chat.IngestFrame("alpha", "not json"));
        assert(!chat.IngestFrame("alpha", "[1, 2, 3]"));
        assert(!chat.IngestFrame("alpha", R"({"content":"no type"})"));
        assert(!chat.IngestFrame("alpha", R"({"type":"typing"})"));
        assert(!chat.IngestFrame("alpha", R"({"type":"msg","content_type":"sticker","content":"x"})"));
        assert(!chat.IngestFrame("alpha", R"({"type":"msg","content":42})"));
        assert(!chat.IngestFrame("alpha", R"({"type":"msg","fingerprint":{"nested":true}})"));

        assert(rec->Messages().empty());
        assert(chat.Log().History("alpha", 10).empty());
    }

    void TestValidFrameIsStoredAndBroadcast() {
        const ServerConfig cfg = TestConfig("valid");
        Database db(cfg.databasePath);
        RoomHub hub;
        ChatService chat(cfg, db, hub);
        auto rec = std::make_shared<RecordingSubscriber>();
        hub.Subscribe("alpha", rec);

        assert(chat.IngestFrame("alpha", R"({"type":"msg","content":"hi","fingerprint":"fp-ws","label":"ws-user"})"));

        const auto msgs = rec->Messages();
        assert(msgs.size() == 1);
        const json& e = msgs[0];
        assert(e.at("room") == "alpha");
        assert(e.at("content_type") == "text");
        assert(e.at("content") == "hi");
        assert(e.at("file_ref").is_null());
        assert(e.at("device").at("label") == "ws-user");
        assert(e.at("device").at("ip").is_null());
        assert(e.at("device").at("id").get<int64_t>() > 0);
        assert(e.at("id").get<int64_t>() > 0);
        assert(e.at("ts").is_string());
        assert(!e.contains("mime"));

        const auto history = chat.Log().History("alpha", 10);
        assert(history.size() == 1);
        assert(!history[0].message.ipAtSend);
        assert(history[0].deviceLabel == std::string("ws-user"));

        // Missing content_type means text; no content at all is still a message.
        assert(chat.IngestFrame("alpha", R"({"type":"msg","content_type":null})"));
        assert(chat.IngestFrame("alpha", R"({"type":"msg","content_type":"voice","file_ref":"k.webm"})"));
        assert(rec->Messages().size() == 3);
        assert(rec->Messages().back().at("content_type") == "voice");
    }

    void TestIngestCreatesRoomAndCarriesSender() {
        const ServerConfig cfg = TestConfig("ingest");
        Database db(cfg.databasePath);
        RoomHub hub;
        ChatService chat(cfg, db, hub);
        auto rec = std::make_shared<RecordingSubscriber>();
        hub.Subscribe("fresh-room", rec);

        assert(!chat.Rooms().Find("fresh-room"));

        IngestRequest req;
        req.room = "fresh-room";
        req.kind = ContentKind::Image;
        req.content = "cat.png";
        req.fileRef = "abc.png";
        req.fingerprint = "fp-http";
        req.mime = "image/png";
        req.sender.ip = "10.1.1.1";
        req.sender.userAgent = "browser";

        const IngestResult r = chat.Ingest(req);
        assert(chat.Rooms().Find("fresh-room").has_value());
        assert(r.room.name == "fresh-room");
        assert(r.message.roomId == r.room.id);
        assert(r.message.deviceId == r.device.id);
        assert(r.event.at("device").at("ip") == "10.1.1.1");
        assert(r.event.at("mime") == "image/png");
        assert(r.event.at("content_type") == "image");

        const auto msgs = rec->Messages();
        assert(msgs.size() == 1 && msgs[0] == r.event);

        // Stores exist under the data directory.
        assert(std::filesystem::is_directory(cfg.AudioDir()));
        assert(std::filesystem::is_directory(cfg.FilesDir()));
    }

    void TestStorageFailureIsNotBroadcast() {
        const ServerConfig cfg = TestConfig("storage_failure");
        Database db(cfg.databasePath);
        RoomHub hub;
        ChatService chat(cfg, db, hub);
        auto rec = std::make_shared<RecordingSubscriber>();
        hub.Subscribe("alpha", rec);

        db.Exec("DROP TABLE messages;");

        IngestRequest req;
        req.room = "alpha";
        req.content = "lost";
        bool threw = false;
        try {
            chat.Ingest(req);
        }
        catch (const StorageError&) {
            threw = true;
        }
        assert(threw);
        assert(rec->Messages().empty());

        // The streaming path surfaces the same error to its caller.
        threw = false;
        try {
            chat.IngestFrame("alpha", R"({"type":"msg","content":"lost too"})");
        }
        catch (const StorageError&) {
            threw = true;
        }
        assert(threw);
        assert(rec->Messages().empty());
    }

    void TestOptionalString() {
        const json j = { { "s", "x" }, { "n", nullptr }, { "i", 1 } };
        assert(OptionalString(j, "s") == std::string("x"));
        assert(!OptionalString(j, "n"));
        assert(!OptionalString(j, "absent"));
        bool threw = false;
        try {
            OptionalString(j, "i");
        }
        catch (const SchemaError&) {
            threw = true;
        }
        assert(threw);
    }

} // namespace

int main() {
    TestMalformedFramesAreDropped();
    TestValidFrameIsStoredAndBroadcast();
    TestIngestCreatesRoomAndCarriesSender();
    TestStorageFailureIsNotBroadcast();
    TestOptionalString();

    std::cout << "blackroom_unit_chat_service: pass\n";
    return 0;
}
