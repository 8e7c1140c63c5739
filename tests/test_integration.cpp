// Copyright 2026 The repsync Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <repsync.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <sstream>

using namespace repsync;

namespace {

struct TempDir {
    std::filesystem::path path;
    TempDir()
        : path(std::filesystem::temp_directory_path() / ("repsync-it-" + generate_id())) {
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::string file(const char* name) const { return (path / name).string(); }
};

ProgramTemplate push_day() {
    ProgramTemplate t;
    t.id = "t-push";
    t.owner_id = "u-1";
    t.name = "Push Day";
    t.day_of_week = 1;
    t.updated_at = 1;
    for (std::int32_t i = 0; i < 2; ++i) {
        TemplateExercise e;
        e.id = "t-push-" + std::to_string(i);
        e.template_id = t.id;
        e.order_index = i;
        e.name = i == 0 ? "Bench Press" : "Overhead Press";
        e.target_sets = 2;
        t.exercises.push_back(e);
    }
    return t;
}

/// Routes the default logger into a string for the lifetime of the object.
struct LogCapture {
    std::ostringstream out;
    std::shared_ptr<spdlog::logger> previous = spdlog::default_logger();

    LogCapture() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
    }
    ~LogCapture() { spdlog::set_default_logger(previous); }

    std::string text() {
        spdlog::default_logger()->flush();
        return out.str();
    }
};

/// A phone and a watch on one in-process link, each with its own store.
/// Members are destroyed engines first, then stores, then the link.
struct Devices {
    TempDir dir;
    MemoryLink link;
    std::unique_ptr<RecordStore> phone_store;
    std::unique_ptr<RecordStore> watch_store;
    std::unique_ptr<Primary> phone;
    std::unique_ptr<Companion> watch;

    std::atomic<int> sets_seen{0};
    std::atomic<int> completions{0};
    std::atomic<int> completable{0};
    std::atomic<int> started{0};

    explicit Devices(bool link_up, bool phone_auto_flush = true) {
        link.set_reachable(link_up);
        phone_store = std::make_unique<SqliteStore>(dir.file("phone.db"));
        open_watch_store();
        start_phone(phone_auto_flush);
        start_watch();
    }

    ~Devices() {
        watch.reset();
        phone.reset();
    }

    void open_watch_store() {
        watch_store = std::make_unique<SqliteStore>(dir.file("watch.db"));
    }

    void start_phone(bool auto_flush) {
        PrimaryConfig config;
        config.auto_flush = auto_flush;
        config.on_set_logged = [this](const ExerciseLogEntry&) { ++sets_seen; };
        config.on_session_completed = [this](const Id&) { ++completions; };
        phone = std::make_unique<Primary>(*phone_store, link.primary_end(), config);
    }

    void start_watch() {
        CompanionConfig config;
        config.on_completable = [this](const Id&) { ++completable; };
        config.on_session_started = [this](const WorkoutSession&) { ++started; };
        watch = std::make_unique<Companion>(*watch_store, link.companion_end(), config);
    }

    /// Simulate the watch app being killed and relaunched.
    void restart_watch() {
        watch.reset();
        watch_store.reset();
        open_watch_store();
        start_watch();
    }

    void settle() {
        for (int i = 0; i < 2; ++i) {
            watch->drain();
            phone->drain();
        }
    }
};

} // namespace

TEST_CASE("integration: watch pulls the catalog") {
    Devices d(true);
    d.phone->save_template(push_day());

    CHECK(d.watch->request_program_sync());
    auto templates = d.watch->templates();
    REQUIRE(templates.size() == 1);
    CHECK(templates == d.phone->catalog());
    CHECK(templates[0].exercises.size() == 2);
}

TEST_CASE("integration: catalog request while offline is answered later") {
    Devices d(false);
    d.phone->save_template(push_day());

    CHECK_FALSE(d.watch->request_program_sync());
    CHECK(d.link.deferred_pending(MemoryLink::Side::Primary) == 1);

    d.link.set_reachable(true);
    d.settle();
    CHECK(d.watch->templates() == d.phone->catalog());
}

TEST_CASE("integration: publish while offline arrives when the link returns") {
    Devices d(false);
    d.phone->save_template(push_day());
    CHECK_FALSE(d.phone->publish_templates());
    CHECK(d.watch->templates().empty());

    d.link.set_reachable(true);
    d.settle();
    CHECK(d.watch->templates().size() == 1);
}

TEST_CASE("integration: sets logged offline are delivered once, in order") {
    Devices d(true);
    d.phone->save_template(push_day());
    REQUIRE(d.watch->request_program_sync());

    d.link.set_reachable(false);
    auto session = d.watch->begin_workout("t-push");
    d.watch->log_set(session.id, "Bench Press", 0, 1, 10, 60.0);
    d.watch->log_set(session.id, "Bench Press", 0, 2, 9, 60.0);
    d.watch->log_set(session.id, "Overhead Press", 1, 1, 8, 40.0);
    d.settle();

    CHECK(d.watch->pending_count() == 4);
    CHECK(d.watch->session_log(session.id).size() == 3);
    CHECK(d.phone->session_log(session.id).empty());

    d.link.set_reachable(true);
    d.settle();

    auto log = d.phone->session_log(session.id);
    REQUIRE(log.size() == 3);
    CHECK(log[0].set_number == 1);
    CHECK(log[1].set_number == 2);
    CHECK(log[2].exercise_order_index == 1);
    CHECK(log == d.watch->session_log(session.id));
    CHECK(d.watch->pending_count() == 0);
    CHECK(d.sets_seen == 3);
    CHECK(d.watch->last_flush_attempt().has_value());

    auto again = d.watch->flush();
    CHECK(again.attempted == 0);
    CHECK(d.phone->session_log(session.id).size() == 3);
    CHECK(d.phone->session(session.id)->template_id == Id{"t-push"});
}

TEST_CASE("integration: phone-started workout is followed live") {
    Devices d(true);
    d.phone->save_template(push_day());

    auto session = d.phone->start_workout("t-push");
    d.settle();
    CHECK(d.started == 1);
    auto active = d.watch->active_session();
    REQUIRE(active);
    CHECK(active->id == session.id);
    CHECK(d.watch->session_exercises(session.id).size() == 2);

    d.watch->log_set(session.id, "Bench Press", 0, 1, 10, 60.0);
    d.settle();
    CHECK(d.phone->session_log(session.id).size() == 1);
    CHECK(d.watch->pending_count() == 0);
    CHECK(d.watch->resume(session.id) == ResumePoint{0, 1, false});
}

TEST_CASE("integration: request_sync recovers a missed workout start") {
    Devices d(false, false);
    d.phone->save_template(push_day());

    auto session = d.phone->start_workout("t-push");
    d.settle();
    CHECK(d.phone->pending_count() == 1);
    CHECK_FALSE(d.watch->active_session());

    d.link.set_reachable(true);
    d.settle();
    CHECK(d.phone->pending_count() == 1);

    CHECK(d.watch->request_session_sync());
    d.settle();
    auto active = d.watch->active_session();
    REQUIRE(active);
    CHECK(active->id == session.id);
    // The request also flushed the phone's queue; the duplicate start is harmless.
    CHECK(d.phone->pending_count() == 0);
    CHECK(d.started == 1);
}

TEST_CASE("integration: request_sync with nothing active") {
    Devices d(true);
    CHECK_FALSE(d.watch->request_session_sync());
}

TEST_CASE("integration: finishing a workout") {
    Devices d(true);
    d.phone->save_template(push_day());
    REQUIRE(d.watch->request_program_sync());

    auto session = d.watch->begin_workout("t-push");
    for (std::int32_t ex = 0; ex < 2; ++ex) {
        for (std::int32_t set = 1; set <= 2; ++set) {
            d.watch->log_set(session.id, "x", ex, set, 5, 20.0);
        }
    }
    d.settle();
    CHECK(d.completable >= 1);
    CHECK(d.watch->resume(session.id).fully_logged);
    CHECK(d.watch->session(session.id)->status == SessionStatus::Active);

    CHECK(d.watch->finish_workout(session.id));
    d.settle();
    CHECK(d.phone->session(session.id)->status == SessionStatus::Completed);
    CHECK(d.completions == 1);

    CHECK_FALSE(d.watch->finish_workout(session.id));
    CHECK_THROWS_AS(d.watch->log_set(session.id, "x", 0, 3, 5, 20.0), Error);
    CHECK_FALSE(d.watch->active_session());
}

TEST_CASE("integration: watch restart resumes from its own log") {
    Devices d(true);
    d.phone->save_template(push_day());
    REQUIRE(d.watch->request_program_sync());

    d.link.set_reachable(false);
    auto session = d.watch->begin_workout("t-push");
    d.watch->log_set(session.id, "Bench Press", 0, 1, 10, 60.0);
    d.settle();

    d.restart_watch();
    CHECK(d.watch->pending_count() == 2);
    CHECK(d.watch->resume(session.id) == ResumePoint{0, 1, false});

    d.watch->log_set(session.id, "Bench Press", 0, 2, 10, 60.0);
    CHECK(d.watch->resume(session.id) == ResumePoint{1, 0, false});

    d.link.set_reachable(true);
    d.settle();
    CHECK(d.watch->pending_count() == 0);
    CHECK(d.phone->session_log(session.id).size() == 2);
}

TEST_CASE("integration: timer bookkeeping") {
    std::atomic<Timestamp> now{1'000'000};
    TempDir dir;
    MemoryLink link;
    SqliteStore store(dir.file("watch.db"));
    CompanionConfig config;
    config.clock = [&] { return now.load(); };
    {
        Companion watch(store, link.companion_end(), config);
        auto t = push_day();
        watch.handle_event(ProgramSyncMsg{{t}});
        auto s = watch.begin_workout(t.id);

        now += 60'000;
        watch.pause_session(s.id);
        now += 600'000;
        watch.resume_session(s.id);
        now += 30'000;
        REQUIRE(watch.finish_workout(s.id));

        auto done = watch.session(s.id);
        CHECK(done->active_seconds == 90);
        CHECK(done->completed_at == now.load());
        CHECK_THROWS_AS(watch.pause_session(s.id), Error);
    }
}

TEST_CASE("integration: malformed records in a push are skipped") {
    Devices d(true);
    std::vector<MergeDiagnostic> diagnostics;
    d.watch.reset();
    CompanionConfig config;
    config.on_merge_error = [&](const MergeDiagnostic& m) { diagnostics.push_back(m); };
    d.watch = std::make_unique<Companion>(*d.watch_store, d.link.companion_end(), config);

    auto good = push_day();
    auto bad = push_day();
    bad.id = "t-bad";
    bad.owner_id.clear();
    d.watch->handle_event(ProgramSyncMsg{{good, bad}});

    CHECK(d.watch->templates().size() == 1);
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].id == "t-bad");
}

TEST_CASE("integration: events sent to the wrong role are rejected") {
    Devices d(true);
    try {
        d.phone->handle_event(ProgramSyncMsg{});
        FAIL("expected InvalidState");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::InvalidState);
    }
    CHECK_THROWS_AS(d.watch->handle_event(FetchProgramMsg{}), Error);
    CHECK_THROWS_AS(d.watch->handle_event(WorkoutUpdateMsg{}), Error);
}

TEST_CASE("integration: unknown template") {
    Devices d(true);
    try {
        d.phone->start_workout("nope");
        FAIL("expected NotFound");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::NotFound);
    }
    CHECK_THROWS_AS(d.watch->begin_workout("nope"), Error);
    CHECK_THROWS_AS(d.watch->resume("nope"), Error);

    auto bad = push_day();
    bad.name.clear();
    CHECK_THROWS_AS(d.phone->save_template(bad), Error);
}

TEST_CASE("integration: exercise edit reaches the watch") {
    Devices d(true);
    d.phone->save_template(push_day());
    REQUIRE(d.watch->request_program_sync());

    auto ex = d.phone->catalog()[0].exercises[1];
    ex.target_reps = "3-5";
    d.phone->update_exercise(ex);
    d.settle();
    CHECK(d.watch->templates()[0].exercises[1].target_reps == "3-5");
}

TEST_CASE("integration: degraded store keeps the offline queue") {
    TempDir dir;
    MemoryLink link;
    StoreConfig config;
    config.path = (dir.path / "missing" / "watch.db").string();
    config.fallback_path = dir.file("watch.kv");

    Id session_id;
    {
        auto store = open_record_store(config);
        REQUIRE(store->backend() == StoreBackend::KeyValue);
        Companion watch(*store, link.companion_end());
        session_id = generate_id();
        watch.log_set(session_id, "Row", 0, 1, 12, 30.0);
        watch.drain();
        CHECK(watch.pending_count() == 1);
    }

    auto store = open_record_store(config);
    Companion watch(*store, link.companion_end());
    CHECK(watch.pending_count() == 1);
    CHECK(watch.session_log(session_id).size() == 1);
    // No exercise list for an ad-hoc session, so nothing is left to log.
    auto p = watch.resume(session_id);
    CHECK(p.set_index == 1);
    CHECK(p.fully_logged);
}

TEST_CASE("integration: a set that overtakes its workout start") {
    Devices d(true);
    d.phone->save_template(push_day());
    REQUIRE(d.watch->request_program_sync());

    // The start fails and is queued; the set behind it goes straight through.
    d.link.fail_next_sends(MemoryLink::Side::Companion, 1);
    auto session = d.watch->begin_workout("t-push");
    d.watch->log_set(session.id, "Bench Press", 0, 1, 10, 60.0);
    d.settle();
    CHECK(d.watch->pending_count() == 1);
    CHECK(d.phone->session_log(session.id).size() == 1);

    CHECK(d.watch->flush().delivered == 1);
    d.settle();
    auto on_phone = d.phone->session(session.id);
    REQUIRE(on_phone);
    CHECK(on_phone->template_id == Id{"t-push"});
    CHECK(on_phone->started_at == session.started_at);
    CHECK(on_phone == d.watch->session(session.id));
}

TEST_CASE("integration: watch logs before the phone's start arrives") {
    Devices d(true);
    d.phone->save_template(push_day());

    d.link.fail_next_sends(MemoryLink::Side::Primary, 1);
    auto session = d.phone->start_workout("t-push");
    d.settle();
    CHECK(d.phone->pending_count() == 1);

    d.watch->log_set(session.id, "Bench Press", 0, 1, 10, 60.0);
    d.settle();
    CHECK(d.completable == 0);
    CHECK(d.watch->session_exercises(session.id).empty());

    CHECK(d.phone->flush().delivered == 1);
    d.settle();
    auto on_watch = d.watch->session(session.id);
    REQUIRE(on_watch);
    CHECK(on_watch->template_id == Id{"t-push"});
    CHECK(on_watch->started_at == session.started_at);
    CHECK(d.watch->session_exercises(session.id).size() == 2);
    CHECK(d.watch->resume(session.id) == ResumePoint{0, 1, false});
    CHECK(d.completable == 0);
}

TEST_CASE("integration: a rejected deferred event is logged") {
    Devices d(true);
    LogCapture capture;
    // A companion never accepts fetch_program.
    d.link.primary_end().send_deferred(FetchProgramMsg{});
    d.settle();
    auto text = capture.text();
    CHECK(text.find("deferred fetch_program rejected") != std::string::npos);
}

TEST_CASE("integration: reachability flapping while logging") {
    Devices d(true);
    d.phone->save_template(push_day());
    REQUIRE(d.watch->request_program_sync());
    auto session = d.watch->begin_workout("t-push");
    d.settle();

    for (std::int32_t set = 1; set <= 6; ++set) {
        d.link.set_reachable(set % 2 == 0);
        d.watch->log_set(session.id, "Bench Press", 0, set, 10, 60.0);
    }
    d.link.set_reachable(false);
    d.link.set_reachable(true);
    d.settle();

    CHECK(d.watch->pending_count() == 0);
    std::vector<std::int32_t> sets;
    for (const auto& e : d.phone->session_log(session.id)) sets.push_back(e.set_number);
    std::sort(sets.begin(), sets.end());
    CHECK(sets == std::vector<std::int32_t>{1, 2, 3, 4, 5, 6});
    CHECK(d.sets_seen == 6);
}
