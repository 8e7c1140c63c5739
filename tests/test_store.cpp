// Copyright 2026 The repsync Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <repsync.h>

#include <sqlite3.h>

#include <filesystem>
#include <fstream>

using namespace repsync;

namespace {

struct TempDir {
    std::filesystem::path path;
    TempDir()
        : path(std::filesystem::temp_directory_path() / ("repsync-store-" + generate_id())) {
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::string file(const char* name) const { return (path / name).string(); }
};

std::unique_ptr<RecordStore> open(StoreBackend backend, const std::string& path) {
    if (backend == StoreBackend::Sqlite) return std::make_unique<SqliteStore>(path);
    return std::make_unique<KeyValueStore>(path);
}

ExerciseLogEntry entry(const Id& id, const Id& session, Timestamp at, std::int32_t set = 1) {
    ExerciseLogEntry e;
    e.id = id;
    e.session_id = session;
    e.exercise_name = "Row";
    e.set_number = set;
    e.reps = 10;
    e.weight = 50.0;
    e.created_at = at;
    return e;
}

TemplateExercise exercise(const Id& id, const Id& tmpl, std::int32_t order) {
    TemplateExercise e;
    e.id = id;
    e.template_id = tmpl;
    e.order_index = order;
    e.name = "Exercise " + id;
    return e;
}

ProgramTemplate tmpl(const Id& id, const std::string& name, std::optional<std::int32_t> day) {
    ProgramTemplate t;
    t.id = id;
    t.owner_id = "u-1";
    t.name = name;
    t.day_of_week = day;
    return t;
}

} // namespace

TEST_CASE("store: put, get and replace by identity") {
    TempDir dir;
    for (auto backend : {StoreBackend::Sqlite, StoreBackend::KeyValue}) {
        CAPTURE(static_cast<int>(backend));
        auto store = open(backend, dir.file(backend == StoreBackend::Sqlite ? "a.db" : "a.kv"));
        CHECK(store->backend() == backend);

        WorkoutSession s;
        s.id = "s-1";
        s.template_id = "t-1";
        s.started_at = 100;
        s.last_resumed_at = 100;
        store->put(s);
        store->save();

        auto got = get_as<WorkoutSession>(*store, RecordKind::Session, "s-1");
        REQUIRE(got);
        CHECK(*got == s);

        s.status = SessionStatus::Completed;
        s.completed_at = 500;
        s.last_resumed_at.reset();
        store->put(s);
        store->save();
        CHECK(*get_as<WorkoutSession>(*store, RecordKind::Session, "s-1") == s);
        CHECK(store->query(RecordKind::Session).size() == 1);

        CHECK_FALSE(store->get(RecordKind::Session, "missing"));
        CHECK_FALSE(store->get(RecordKind::QueueItem, "not-a-number"));
    }
}

TEST_CASE("store: natural ordering and parent filter") {
    TempDir dir;
    for (auto backend : {StoreBackend::Sqlite, StoreBackend::KeyValue}) {
        CAPTURE(static_cast<int>(backend));
        auto store = open(backend, dir.file(backend == StoreBackend::Sqlite ? "b.db" : "b.kv"));

        store->put(entry("e-3", "s-1", 300, 3));
        store->put(entry("e-1", "s-1", 100, 1));
        store->put(entry("x-1", "s-2", 150, 1));
        store->put(entry("e-2", "s-1", 200, 2));

        store->put(exercise("c", "t-1", 2));
        store->put(exercise("a", "t-1", 0));
        store->put(exercise("b", "t-1", 1));
        store->put(exercise("z", "t-2", 0));

        store->put(tmpl("t-3", "Legs", 3));
        store->put(tmpl("t-1", "Push", 1));
        store->put(tmpl("t-9", "Anytime", std::nullopt));
        store->put(tmpl("t-2", "Pull", 1));
        store->save();

        Query q;
        q.parent = "s-1";
        auto log = query_as<ExerciseLogEntry>(*store, RecordKind::LogEntry, q);
        REQUIRE(log.size() == 3);
        CHECK(log[0].id == "e-1");
        CHECK(log[1].id == "e-2");
        CHECK(log[2].id == "e-3");

        q.parent = "t-1";
        auto exs = query_as<TemplateExercise>(*store, RecordKind::TemplateExercise, q);
        REQUIRE(exs.size() == 3);
        CHECK(exs[0].id == "a");
        CHECK(exs[1].id == "b");
        CHECK(exs[2].id == "c");

        auto ts = query_as<ProgramTemplate>(*store, RecordKind::Template);
        REQUIRE(ts.size() == 4);
        CHECK(ts[0].id == "t-9");  // no day sorts first
        CHECK(ts[1].id == "t-2");  // day 1, "Pull" < "Push"
        CHECK(ts[2].id == "t-1");
        CHECK(ts[3].id == "t-3");

        q.parent = "s-1";
        CHECK(store->query(RecordKind::Template, q).empty());

        Query heavy;
        heavy.where = [](const Record& r) {
            return std::get<ExerciseLogEntry>(r).set_number >= 2;
        };
        CHECK(store->query(RecordKind::LogEntry, heavy).size() == 2);
    }
}

TEST_CASE("store: remove and re-parent") {
    TempDir dir;
    for (auto backend : {StoreBackend::Sqlite, StoreBackend::KeyValue}) {
        CAPTURE(static_cast<int>(backend));
        auto store = open(backend, dir.file(backend == StoreBackend::Sqlite ? "c.db" : "c.kv"));

        store->put(exercise("a", "t-1", 0));
        store->put(exercise("b", "t-1", 1));
        store->save();

        // Moving an exercise to another template updates the parent lookup.
        store->put(exercise("b", "t-2", 0));
        store->remove(RecordKind::TemplateExercise, "a");
        store->remove(RecordKind::TemplateExercise, "never-existed");
        store->save();

        Query q;
        q.parent = "t-1";
        CHECK(store->query(RecordKind::TemplateExercise, q).empty());
        q.parent = "t-2";
        CHECK(store->query(RecordKind::TemplateExercise, q).size() == 1);
        CHECK(store->query(RecordKind::TemplateExercise).size() == 1);
    }
}

TEST_CASE("store: saved writes survive reopen, unsaved ones do not") {
    TempDir dir;
    for (auto backend : {StoreBackend::Sqlite, StoreBackend::KeyValue}) {
        CAPTURE(static_cast<int>(backend));
        auto path = dir.file(backend == StoreBackend::Sqlite ? "d.db" : "d.kv");
        {
            auto store = open(backend, path);
            store->put(entry("kept", "s-1", 1));
            store->save();
            store->put(entry("lost", "s-1", 2));
        }
        auto store = open(backend, path);
        CHECK(store->get(RecordKind::LogEntry, "kept"));
        CHECK_FALSE(store->get(RecordKind::LogEntry, "lost"));
    }
}

TEST_CASE("store: templates are stored without their exercises") {
    SqliteStore store(":memory:");
    auto t = tmpl("t-1", "Push", 1);
    t.exercises = {exercise("a", "t-1", 0)};
    store.put(t);
    store.save();
    auto got = get_as<ProgramTemplate>(store, RecordKind::Template, "t-1");
    REQUIRE(got);
    CHECK(got->exercises.empty());
    CHECK(store.query(RecordKind::TemplateExercise).empty());
}

TEST_CASE("store: queue items keyed by sequence") {
    SqliteStore store(":memory:");
    OutboundQueueItem q;
    q.seq = 7;
    q.event_type = "fetch_program";
    q.payload = serialize(Event{FetchProgramMsg{}});
    store.put(q);
    store.save();
    auto got = get_as<OutboundQueueItem>(store, RecordKind::QueueItem, "7");
    REQUIRE(got);
    CHECK(*got == q);
    store.remove(RecordKind::QueueItem, "7");
    store.save();
    CHECK(store.query(RecordKind::QueueItem).empty());
}

TEST_CASE("sqlite store: schema version mismatch") {
    TempDir dir;
    auto path = dir.file("schema.db");
    { SqliteStore store(path); }

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    REQUIRE(sqlite3_exec(db,
        "UPDATE _repsync_meta SET value='99' WHERE key='schema_version'",
        nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    try {
        SqliteStore store(path);
        FAIL("expected SchemaMismatch");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::SchemaMismatch);
    }
}

TEST_CASE("sqlite store: unopenable path") {
    TempDir dir;
    auto path = (dir.path / "no-such-dir" / "x.db").string();
    try {
        SqliteStore store(path);
        FAIL("expected StoreError");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::StoreError);
    }
}

TEST_CASE("key-value store: corrupt file") {
    TempDir dir;
    auto path = dir.file("bad.kv");
    {
        std::ofstream out(path, std::ios::binary);
        out << "not a store";
    }
    try {
        KeyValueStore store(path);
        FAIL("expected StoreError");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::StoreError);
    }
}

TEST_CASE("open_record_store: structured backend when available") {
    TempDir dir;
    auto store = open_record_store({dir.file("main.db"), "", false});
    CHECK(store->backend() == StoreBackend::Sqlite);
}

TEST_CASE("open_record_store: falls back to key-value") {
    TempDir dir;
    StoreConfig config;
    config.path = (dir.path / "missing" / "main.db").string();
    config.fallback_path = dir.file("fallback.kv");

    auto store = open_record_store(config);
    CHECK(store->backend() == StoreBackend::KeyValue);

    // The degraded store still persists.
    store->put(entry("e-1", "s-1", 1));
    store->save();
    store.reset();
    store = open_record_store(config);
    CHECK(store->get(RecordKind::LogEntry, "e-1"));
}

TEST_CASE("open_record_store: forced fallback") {
    TempDir dir;
    StoreConfig config;
    config.path = dir.file("main.db");
    config.force_fallback = true;
    auto store = open_record_store(config);
    CHECK(store->backend() == StoreBackend::KeyValue);
    CHECK_FALSE(std::filesystem::exists(config.path));
}

TEST_CASE("open_record_store: both backends unavailable") {
    TempDir dir;
    StoreConfig config;
    config.path = (dir.path / "missing" / "main.db").string();
    config.fallback_path = (dir.path / "missing" / "main.kv").string();
    try {
        open_record_store(config);
        FAIL("expected StoreUnavailable");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::StoreUnavailable);
        CHECK(std::string(e.what()).find("reinstall") != std::string::npos);
    }
}

TEST_CASE("sqlite store: rejected commit rolls back the pending writes") {
    TempDir dir;
    auto path = dir.file("busy.db");
    SqliteStore store(path);
    store.put(entry("kept", "s-1", 1));
    store.save();

    // A reader holding its shared lock keeps the commit from finishing.
    sqlite3* reader = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &reader) == SQLITE_OK);
    REQUIRE(sqlite3_exec(reader, "BEGIN; SELECT count(*) FROM exercise_logs;",
                         nullptr, nullptr, nullptr) == SQLITE_OK);

    store.put(entry("rejected", "s-1", 2));
    try {
        store.save();
        FAIL("expected StoreError");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::StoreError);
    }
    sqlite3_exec(reader, "COMMIT", nullptr, nullptr, nullptr);
    sqlite3_close(reader);

    CHECK_FALSE(store.get(RecordKind::LogEntry, "rejected"));
    store.put(entry("later", "s-1", 3));
    store.save();

    SqliteStore reopened(path);
    CHECK(reopened.get(RecordKind::LogEntry, "kept"));
    CHECK(reopened.get(RecordKind::LogEntry, "later"));
    CHECK_FALSE(reopened.get(RecordKind::LogEntry, "rejected"));
}

TEST_CASE("key-value store: rejected commit rolls back the pending writes") {
    TempDir dir;
    auto sub = dir.path / "kv";
    std::filesystem::create_directories(sub);
    auto path = (sub / "store.kv").string();

    KeyValueStore store(path);
    store.put(entry("kept", "s-1", 1));
    store.put(tmpl("t-1", "Push", 1));
    store.put(exercise("a", "t-1", 0));
    store.save();

    // The directory vanishing makes the write fail.
    std::filesystem::remove_all(sub);
    store.put(entry("rejected", "s-1", 2));
    store.put(exercise("a", "t-2", 0));
    store.remove(RecordKind::Template, "t-1");
    try {
        store.save();
        FAIL("expected StoreError");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::StoreError);
    }

    // Back to the last saved state, indexes included.
    CHECK_FALSE(store.get(RecordKind::LogEntry, "rejected"));
    CHECK(store.query(RecordKind::LogEntry).size() == 1);
    CHECK(store.get(RecordKind::Template, "t-1"));
    Query q;
    q.parent = "t-1";
    CHECK(store.query(RecordKind::TemplateExercise, q).size() == 1);
    q.parent = "t-2";
    CHECK(store.query(RecordKind::TemplateExercise, q).empty());

    std::filesystem::create_directories(sub);
    store.put(entry("later", "s-1", 3));
    store.save();

    KeyValueStore reopened(path);
    CHECK(reopened.get(RecordKind::LogEntry, "kept"));
    CHECK(reopened.get(RecordKind::LogEntry, "later"));
    CHECK_FALSE(reopened.get(RecordKind::LogEntry, "rejected"));
    CHECK(reopened.query(RecordKind::LogEntry).size() == 2);
}

TEST_CASE("key-value store: indexes across many writes and a reopen") {
    TempDir dir;
    auto path = dir.file("many.kv");
    {
        KeyValueStore store(path);
        for (int i = 0; i < 500; ++i) {
            store.put(entry("e-" + std::to_string(i), i % 2 ? "s-odd" : "s-even", i));
        }
        store.remove(RecordKind::LogEntry, "e-0");
        store.save();
    }
    KeyValueStore store(path);
    CHECK(store.query(RecordKind::LogEntry).size() == 499);
    Query q;
    q.parent = "s-even";
    auto even = store.query(RecordKind::LogEntry, q);
    REQUIRE(even.size() == 249);
    CHECK(std::get<ExerciseLogEntry>(even.front()).id == "e-2");
    q.parent = "s-odd";
    CHECK(store.query(RecordKind::LogEntry, q).size() == 250);
}
