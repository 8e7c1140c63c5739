// Copyright 2026 The repsync Authors
// SPDX-License-Identifier: Apache-2.0
#include <repsync.h>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <string>

using namespace repsync;

static ProgramTemplate upper_body() {
    ProgramTemplate t;
    t.id = generate_id();
    t.owner_id = "demo-user";
    t.name = "Upper Body";
    t.day_of_week = 1;
    t.updated_at = now_ms();

    const char* names[] = {"Bench Press", "Barbell Row", "Overhead Press"};
    for (std::int32_t i = 0; i < 3; ++i) {
        TemplateExercise e;
        e.id = generate_id();
        e.template_id = t.id;
        e.order_index = i;
        e.name = names[i];
        e.target_sets = 2;
        t.exercises.push_back(e);
    }
    return t;
}

static void print_log(const char* who, const std::vector<ExerciseLogEntry>& log) {
    std::printf("  %s has %zu sets\n", who, log.size());
    for (const auto& e : log) {
        std::printf("    %-15s set %d: %d x %.1f\n", e.exercise_name.c_str(),
                    e.set_number, e.reps, e.weight);
    }
}

int main() {
    spdlog::set_level(spdlog::level::info);

    // Two in-memory stores joined by an in-process link.
    SqliteStore phone_store(":memory:");
    SqliteStore watch_store(":memory:");
    MemoryLink link;
    link.set_reachable(true);

    Primary phone(phone_store, link.primary_end());
    Companion watch(watch_store, link.companion_end());

    // 1. The phone owns the program; the watch pulls it.
    std::printf("=== Program sync ===\n");
    auto tmpl = upper_body();
    phone.save_template(tmpl);
    bool synced = watch.request_program_sync();
    std::printf("  watch synced=%d, templates=%zu\n\n", synced, watch.templates().size());

    // 2. Start on the phone; the watch follows.
    std::printf("=== Start workout ===\n");
    auto session = phone.start_workout(tmpl.id);
    phone.drain();
    auto active = watch.active_session();
    std::printf("  watch active session matches: %d\n\n",
                active && active->id == session.id);

    // 3. Log sets while the watch is out of range.
    std::printf("=== Offline logging ===\n");
    link.set_reachable(false);
    const auto& exercises = tmpl.exercises;
    for (std::int32_t ex = 0; ex < 2; ++ex) {
        for (std::int32_t set = 1; set <= 2; ++set) {
            watch.log_set(session.id, exercises[static_cast<std::size_t>(ex)].name,
                          ex, set, 10 - set, 40.0 + 10 * ex);
        }
    }
    watch.drain();
    auto where = watch.resume(session.id);
    std::printf("  pending on watch: %zu, resume at exercise %d set %d\n",
                watch.pending_count(), where.exercise_index, where.set_index + 1);
    print_log("phone", phone.session_log(session.id));

    // 4. Back in range: the queue drains on its own.
    std::printf("\n=== Reconnect ===\n");
    link.set_reachable(true);
    watch.drain();
    phone.drain();
    std::printf("  pending on watch: %zu\n", watch.pending_count());
    print_log("phone", phone.session_log(session.id));

    // 5. Finish on the watch.
    std::printf("\n=== Finish ===\n");
    watch.log_set(session.id, exercises[2].name, 2, 1, 8, 30.0);
    watch.log_set(session.id, exercises[2].name, 2, 2, 8, 30.0);
    watch.finish_workout(session.id);
    watch.drain();
    phone.drain();
    auto done = phone.session(session.id);
    std::printf("  phone sees session completed: %d\n",
                done && done->status == SessionStatus::Completed);

    return 0;
}
