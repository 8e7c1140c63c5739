// Copyright 2026 The repsync Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <repsync.h>

using namespace repsync;

namespace {

std::vector<TemplateExercise> exercises(std::initializer_list<std::int32_t> sets) {
    std::vector<TemplateExercise> out;
    std::int32_t i = 0;
    for (auto s : sets) {
        TemplateExercise e;
        e.id = "ex-" + std::to_string(i);
        e.template_id = "t-1";
        e.order_index = i++;
        e.name = e.id;
        e.target_sets = s;
        out.push_back(e);
    }
    return out;
}

std::vector<ExerciseLogEntry> log_of(
        std::initializer_list<std::pair<std::int32_t, std::int32_t>> sets) {
    std::vector<ExerciseLogEntry> out;
    Timestamp t = 0;
    for (auto [exercise, set] : sets) {
        ExerciseLogEntry e;
        e.id = "e-" + std::to_string(t);
        e.session_id = "s-1";
        e.exercise_order_index = exercise;
        e.set_number = set;
        e.created_at = ++t;
        out.push_back(e);
    }
    return out;
}

WorkoutSession active() {
    WorkoutSession s;
    s.id = "s-1";
    s.template_id = "t-1";
    return s;
}

} // namespace

TEST_CASE("resume: empty log starts at the beginning") {
    auto p = resume_point(active(), exercises({3, 3}), {});
    CHECK(p == ResumePoint{0, 0, false});
}

TEST_CASE("resume: mid-exercise continues with the next set") {
    auto p = resume_point(active(), exercises({3, 3}), log_of({{0, 1}, {0, 2}}));
    CHECK(p == ResumePoint{0, 2, false});
}

TEST_CASE("resume: finished exercise moves to the next one") {
    auto p = resume_point(active(), exercises({3, 3}), log_of({{0, 1}, {0, 2}, {0, 3}}));
    CHECK(p == ResumePoint{1, 0, false});
}

TEST_CASE("resume: last set of the last exercise is fully logged") {
    auto p = resume_point(active(), exercises({1, 2}),
                          log_of({{0, 1}, {1, 1}, {1, 2}}));
    CHECK(p.exercise_index == 2);
    CHECK(p.set_index == 0);
    CHECK(p.fully_logged);
}

TEST_CASE("resume: extra sets beyond the target still advance") {
    auto p = resume_point(active(), exercises({2, 3}), log_of({{0, 1}, {0, 2}, {0, 3}}));
    CHECK(p == ResumePoint{1, 0, false});
}

TEST_CASE("resume: only the newest entry matters") {
    // Skipping back to an earlier exercise resumes there.
    auto p = resume_point(active(), exercises({3, 3}), log_of({{1, 1}, {0, 1}}));
    CHECK(p == ResumePoint{0, 1, false});
}

TEST_CASE("resume: completed session") {
    auto s = active();
    s.status = SessionStatus::Completed;
    auto p = resume_point(s, exercises({3, 3}), log_of({{0, 1}}));
    CHECK(p.fully_logged);
    CHECK(p.exercise_index == 2);
}

TEST_CASE("resume: entry beyond the exercise list") {
    auto p = resume_point(active(), exercises({3}), log_of({{4, 1}}));
    CHECK(p.fully_logged);
}

TEST_CASE("resume: no exercises at all") {
    auto p = resume_point(active(), {}, {});
    CHECK(p.fully_logged);
}
