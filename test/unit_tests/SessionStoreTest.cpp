#include "SessionStore.hpp"

#include "TestHeaders.hpp"

using namespace tether;

namespace {
SessionRecord makeRecord(const string& id, SessionStatus status) {
  SessionRecord record;
  record.id = id;
  record.status = status;
  record.startedAt = "2026-01-01T00:00:00Z";
  return record;
}
}  // namespace

TEST_CASE("Session records survive a JSON round trip", "[SessionStore]") {
  SessionRecord record = makeRecord("s1", SessionStatus::FAILED);
  record.permissionProfile = PermissionProfile::YOLO;
  record.processId = 1234;
  record.completedAt = "2026-01-01T00:01:00Z";
  record.exitCode = 2;
  record.outputLog = "tail";
  record.outputBytes = 99999;
  record.lastOutputSeq = 17;
  record.lastInputSeq = 4;
  record.multiplexName = "tw-s1";

  SessionRecord copy = sessionRecordFromJson(sessionRecordToJson(record));
  REQUIRE(copy.id == "s1");
  REQUIRE(copy.status == SessionStatus::FAILED);
  REQUIRE(copy.permissionProfile == PermissionProfile::YOLO);
  REQUIRE(*copy.processId == 1234);
  REQUIRE(*copy.exitCode == 2);
  REQUIRE(copy.outputBytes == 99999);
  REQUIRE(copy.lastOutputSeq == 17);
  REQUIRE(copy.lastInputSeq == 4);
  REQUIRE(*copy.multiplexName == "tw-s1");
  REQUIRE(!copy.workerId);
  REQUIRE(!copy.parentSessionId);
}

TEST_CASE("Malformed records are rejected", "[SessionStore]") {
  REQUIRE_THROWS_AS(sessionRecordFromJson(json::object()), std::runtime_error);
  json j = {{"id", "s1"}, {"status", "sleeping"}};
  REQUIRE_THROWS_AS(sessionRecordFromJson(j), std::runtime_error);
}

TEST_CASE("JsonSessionStore operations", "[SessionStore]") {
  TempDir dir;
  string path = dir.path + "/state/sessions.json";

  SECTION("In memory") {
    JsonSessionStore store("");
    store.put(makeRecord("a", SessionStatus::RUNNING));
    store.put(makeRecord("b", SessionStatus::COMPLETED));
    REQUIRE(store.get("a"));
    REQUIRE(!store.get("missing"));
    REQUIRE(store.listByStatus(SessionStatus::RUNNING).size() == 1);
  }

  SECTION("Records are shared through the file") {
    JsonSessionStore writer(path);
    writer.put(makeRecord("a", SessionStatus::RUNNING));

    JsonSessionStore reader(path);
    auto record = reader.get("a");
    REQUIRE(record);
    REQUIRE(record->status == SessionStatus::RUNNING);

    REQUIRE(reader.update("a", [](SessionRecord* r) {
      r->status = SessionStatus::KILLED;
      r->exitCode = -1;
    }));
    REQUIRE(writer.get("a")->status == SessionStatus::KILLED);
    REQUIRE(writer.listByStatus(SessionStatus::RUNNING).empty());
  }

  SECTION("Update of a missing record fails") {
    JsonSessionStore store(path);
    bool called = false;
    REQUIRE(!store.update("nope", [&called](SessionRecord*) { called = true; }));
    REQUIRE(!called);
  }

  SECTION("Corrupt files are reported") {
    fs::create_directories(dir.path + "/state");
    {
      ofstream out(path);
      out << "{not json";
    }
    JsonSessionStore store(path);
    REQUIRE_THROWS_AS(store.get("a"), std::runtime_error);
  }
}
