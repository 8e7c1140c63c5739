// Copyright 2026 The repsync Authors
// SPDX-License-Identifier: Apache-2.0
#include "repsync.h"

#include <algorithm>
#include <array>
#include <bit>
#include <charconv>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <thread>
#include <tuple>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace repsync::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw Error(ErrorCode::StoreError, msg);
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::StoreError, sqlite3_errmsg(db));
    }
    return StmtGuard(stmt);
}

/// Step a statement expecting SQLITE_DONE, or throw.
inline void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::StoreError, sqlite3_errmsg(db));
    }
}

inline void bind_text(sqlite3_stmt* stmt, int i, const std::string& v) {
    sqlite3_bind_text(stmt, i, v.data(), static_cast<int>(v.size()),
                      SQLITE_TRANSIENT);
}

inline void bind_opt_text(sqlite3_stmt* stmt, int i,
                          const std::optional<std::string>& v) {
    if (v) bind_text(stmt, i, *v);
    else sqlite3_bind_null(stmt, i);
}

inline void bind_opt_int64(sqlite3_stmt* stmt, int i,
                           const std::optional<std::int64_t>& v) {
    if (v) sqlite3_bind_int64(stmt, i, *v);
    else sqlite3_bind_null(stmt, i);
}

inline std::string column_string(sqlite3_stmt* stmt, int i) {
    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
    if (!text) return {};
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, i)));
}

inline bool column_null(sqlite3_stmt* stmt, int i) {
    return sqlite3_column_type(stmt, i) == SQLITE_NULL;
}

} // namespace repsync::detail

// ── types.cpp ───────────────────────────────────────────────────
namespace repsync {

Timestamp now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
}

Id generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::array<std::uint8_t, 16> b;
    for (std::size_t i = 0; i < b.size(); i += 8) {
        auto v = rng();
        std::memcpy(b.data() + i, &v, 8);
    }
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3f) | 0x80);

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < b.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[b[i] >> 4]);
        out.push_back(hex[b[i] & 0x0f]);
    }
    return out;
}

RecordKind record_kind(const Record& r) {
    return std::visit([](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, WorkoutSession>) return RecordKind::Session;
        else if constexpr (std::is_same_v<T, ExerciseLogEntry>) return RecordKind::LogEntry;
        else if constexpr (std::is_same_v<T, ProgramTemplate>) return RecordKind::Template;
        else if constexpr (std::is_same_v<T, TemplateExercise>) return RecordKind::TemplateExercise;
        else return RecordKind::QueueItem;
    }, r);
}

Id record_id(const Record& r) {
    return std::visit([](const auto& v) -> Id {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, OutboundQueueItem>) return std::to_string(v.seq);
        else return v.id;
    }, r);
}

Id record_parent(const Record& r) {
    return std::visit([](const auto& v) -> Id {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ExerciseLogEntry>) return v.session_id;
        else if constexpr (std::is_same_v<T, TemplateExercise>) return v.template_id;
        else return {};
    }, r);
}

const char* kind_name(RecordKind kind) {
    switch (kind) {
    case RecordKind::Session:          return "session";
    case RecordKind::LogEntry:         return "log_entry";
    case RecordKind::Template:         return "template";
    case RecordKind::TemplateExercise: return "template_exercise";
    case RecordKind::QueueItem:        return "queue_item";
    }
    return "unknown";
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:               return "Ok";
    case ErrorCode::StoreError:       return "StoreError";
    case ErrorCode::SchemaMismatch:   return "SchemaMismatch";
    case ErrorCode::StoreUnavailable: return "StoreUnavailable";
    case ErrorCode::ProtocolError:    return "ProtocolError";
    case ErrorCode::Unreachable:      return "Unreachable";
    case ErrorCode::NotActivated:     return "NotActivated";
    case ErrorCode::Timeout:          return "Timeout";
    case ErrorCode::PeerError:        return "PeerError";
    case ErrorCode::MergeError:       return "MergeError";
    case ErrorCode::InvalidState:     return "InvalidState";
    case ErrorCode::NotFound:         return "NotFound";
    }
    return "Unknown";
}

} // namespace repsync

// ── protocol.cpp ────────────────────────────────────────────────
namespace repsync {

namespace {

// ── Little-endian encoding helpers ──────────────────────────────────

void put_u8(Bytes& buf, std::uint8_t v) {
    buf.push_back(v);
}

void put_u32(Bytes& buf, std::uint32_t v) {
    buf.push_back(static_cast<std::uint8_t>(v));
    buf.push_back(static_cast<std::uint8_t>(v >> 8));
    buf.push_back(static_cast<std::uint8_t>(v >> 16));
    buf.push_back(static_cast<std::uint8_t>(v >> 24));
}

void put_i32(Bytes& buf, std::int32_t v) {
    put_u32(buf, static_cast<std::uint32_t>(v));
}

void put_i64(Bytes& buf, std::int64_t v) {
    auto u = static_cast<std::uint64_t>(v);
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<std::uint8_t>(u >> (i * 8)));
    }
}

void put_f64(Bytes& buf, double v) {
    put_i64(buf, std::bit_cast<std::int64_t>(v));
}

void put_bytes(Bytes& buf, const void* data, std::uint32_t len) {
    put_u32(buf, len);
    auto* p = static_cast<const std::uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

void put_string(Bytes& buf, const std::string& s) {
    put_bytes(buf, s.data(), static_cast<std::uint32_t>(s.size()));
}

/// Presence byte, then the value if present.
template <typename T, typename Put>
void put_optional(Bytes& buf, const std::optional<T>& v, Put put) {
    put_u8(buf, v ? 1 : 0);
    if (v) put(buf, *v);
}

// ── Reader for deserialization ──────────────────────────────────────

class Reader {
public:
    Reader(std::span<const std::uint8_t> buf)
        : data_(buf.data()), size_(buf.size()), pos_(0) {}

    std::uint8_t read_u8() {
        check(1);
        return data_[pos_++];
    }

    bool read_bool() {
        auto v = read_u8();
        if (v > 1) {
            throw Error(ErrorCode::ProtocolError, "invalid boolean byte");
        }
        return v == 1;
    }

    std::uint32_t read_u32() {
        check(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
            v |= static_cast<std::uint32_t>(data_[pos_++]) << (i * 8);
        return v;
    }

    std::int32_t read_i32() {
        return static_cast<std::int32_t>(read_u32());
    }

    std::int64_t read_i64() {
        check(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
            v |= static_cast<std::uint64_t>(data_[pos_++]) << (i * 8);
        return static_cast<std::int64_t>(v);
    }

    double read_f64() {
        return std::bit_cast<double>(read_i64());
    }

    std::string read_string() {
        auto len = read_u32();
        check(len);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return s;
    }

    Bytes read_bytes() {
        auto len = read_u32();
        check(len);
        Bytes b(data_ + pos_, data_ + pos_ + len);
        pos_ += len;
        return b;
    }

    template <typename Read>
    auto read_optional(Read read) -> std::optional<decltype(read(*this))> {
        if (!read_bool()) return std::nullopt;
        return read(*this);
    }

    bool at_end() const { return pos_ >= size_; }

private:
    void check(std::size_t n) {
        if (n > size_ - pos_) {
            throw Error(ErrorCode::ProtocolError, "unexpected end of message");
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

// ── Field groups shared by events and records ───────────────────────

void put_exercise(Bytes& buf, const TemplateExercise& e) {
    put_string(buf, e.id);
    put_string(buf, e.template_id);
    put_i32(buf, e.order_index);
    put_string(buf, e.name);
    put_string(buf, e.exercise_key);
    put_i32(buf, e.target_sets);
    put_string(buf, e.target_reps);
    put_optional(buf, e.target_weight, put_f64);
    put_string(buf, e.notes);
}

TemplateExercise read_exercise(Reader& r) {
    TemplateExercise e;
    e.id = r.read_string();
    e.template_id = r.read_string();
    e.order_index = r.read_i32();
    e.name = r.read_string();
    e.exercise_key = r.read_string();
    e.target_sets = r.read_i32();
    e.target_reps = r.read_string();
    e.target_weight = r.read_optional([](Reader& x) { return x.read_f64(); });
    e.notes = r.read_string();
    return e;
}

void put_exercises(Bytes& buf, const std::vector<TemplateExercise>& v) {
    put_u32(buf, static_cast<std::uint32_t>(v.size()));
    for (const auto& e : v) put_exercise(buf, e);
}

std::vector<TemplateExercise> read_exercises(Reader& r) {
    auto n = r.read_u32();
    std::vector<TemplateExercise> v;
    for (std::uint32_t i = 0; i < n; ++i) v.push_back(read_exercise(r));
    return v;
}

void put_template(Bytes& buf, const ProgramTemplate& t) {
    put_string(buf, t.id);
    put_string(buf, t.owner_id);
    put_string(buf, t.name);
    put_optional(buf, t.day_of_week, put_i32);
    put_i64(buf, t.updated_at);
    put_exercises(buf, t.exercises);
}

ProgramTemplate read_template(Reader& r) {
    ProgramTemplate t;
    t.id = r.read_string();
    t.owner_id = r.read_string();
    t.name = r.read_string();
    t.day_of_week = r.read_optional([](Reader& x) { return x.read_i32(); });
    t.updated_at = r.read_i64();
    t.exercises = read_exercises(r);
    return t;
}

std::optional<Timestamp> read_opt_i64(Reader& r) {
    return r.read_optional([](Reader& x) { return x.read_i64(); });
}

} // namespace

const char* event_name(const Event& event) {
    return std::visit([](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, WorkoutStartMsg>) return "workout_start";
        else if constexpr (std::is_same_v<T, WorkoutUpdateMsg>) return "workout_update";
        else if constexpr (std::is_same_v<T, WorkoutCompleteMsg>) return "workout_complete";
        else if constexpr (std::is_same_v<T, ProgramSyncMsg>) return "program_sync";
        else if constexpr (std::is_same_v<T, FetchProgramMsg>) return "fetch_program";
        else if constexpr (std::is_same_v<T, RequestSyncMsg>) return "request_sync";
        else return "exercise_update";
    }, event);
}

// ── serialize ───────────────────────────────────────────────────────

Bytes serialize(const Event& event) {
    Bytes buf;
    // Reserve space for the 4-byte length prefix.
    buf.resize(4);

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, WorkoutStartMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::WorkoutStart));
            put_string(buf, m.session_id);
            put_string(buf, m.template_id);
            put_string(buf, m.template_name);
            put_i64(buf, m.started_at);
            put_exercises(buf, m.exercises);
        }
        else if constexpr (std::is_same_v<T, WorkoutUpdateMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::WorkoutUpdate));
            put_string(buf, m.entry_id);
            put_string(buf, m.session_id);
            put_string(buf, m.exercise_name);
            put_i32(buf, m.exercise_order_index);
            put_i32(buf, m.set_number);
            put_i32(buf, m.reps);
            put_f64(buf, m.weight);
            put_i64(buf, m.timestamp);
        }
        else if constexpr (std::is_same_v<T, WorkoutCompleteMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::WorkoutComplete));
            put_string(buf, m.session_id);
            put_i64(buf, m.completed_at);
            put_i64(buf, m.active_seconds);
        }
        else if constexpr (std::is_same_v<T, ProgramSyncMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::ProgramSync));
            put_u32(buf, static_cast<std::uint32_t>(m.templates.size()));
            for (const auto& t : m.templates) put_template(buf, t);
        }
        else if constexpr (std::is_same_v<T, FetchProgramMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::FetchProgram));
        }
        else if constexpr (std::is_same_v<T, RequestSyncMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::RequestSync));
        }
        else if constexpr (std::is_same_v<T, ExerciseUpdateMsg>) {
            put_u8(buf, static_cast<std::uint8_t>(EventTag::ExerciseUpdate));
            put_exercise(buf, m.exercise);
        }
    }, event);

    // Patch the length prefix: total_length = tag + payload (excludes the 4 prefix bytes).
    std::uint32_t total = static_cast<std::uint32_t>(buf.size() - 4);
    buf[0] = static_cast<std::uint8_t>(total);
    buf[1] = static_cast<std::uint8_t>(total >> 8);
    buf[2] = static_cast<std::uint8_t>(total >> 16);
    buf[3] = static_cast<std::uint8_t>(total >> 24);

    return buf;
}

// ── deserialize ─────────────────────────────────────────────────────

Event deserialize(std::span<const std::uint8_t> buf) {
    if (buf.size() < 5) {
        throw Error(ErrorCode::ProtocolError, "message too short");
    }

    Reader r(buf);
    auto total_len = r.read_u32();
    if (total_len != buf.size() - 4) {
        throw Error(ErrorCode::ProtocolError, "length prefix mismatch");
    }

    auto tag = static_cast<EventTag>(r.read_u8());

    switch (tag) {
    case EventTag::WorkoutStart: {
        WorkoutStartMsg m;
        m.session_id = r.read_string();
        m.template_id = r.read_string();
        m.template_name = r.read_string();
        m.started_at = r.read_i64();
        m.exercises = read_exercises(r);
        return m;
    }
    case EventTag::WorkoutUpdate: {
        WorkoutUpdateMsg m;
        m.entry_id = r.read_string();
        m.session_id = r.read_string();
        m.exercise_name = r.read_string();
        m.exercise_order_index = r.read_i32();
        m.set_number = r.read_i32();
        m.reps = r.read_i32();
        m.weight = r.read_f64();
        m.timestamp = r.read_i64();
        return m;
    }
    case EventTag::WorkoutComplete: {
        WorkoutCompleteMsg m;
        m.session_id = r.read_string();
        m.completed_at = r.read_i64();
        m.active_seconds = r.read_i64();
        return m;
    }
    case EventTag::ProgramSync: {
        ProgramSyncMsg m;
        auto n = r.read_u32();
        for (std::uint32_t i = 0; i < n; ++i) {
            m.templates.push_back(read_template(r));
        }
        return m;
    }
    case EventTag::FetchProgram:
        return FetchProgramMsg{};
    case EventTag::RequestSync:
        return RequestSyncMsg{};
    case EventTag::ExerciseUpdate: {
        ExerciseUpdateMsg m;
        m.exercise = read_exercise(r);
        return m;
    }
    default:
        throw Error(ErrorCode::ProtocolError,
                    "unknown event tag: " +
                    std::to_string(static_cast<int>(tag)));
    }
}

// ── records ─────────────────────────────────────────────────────────

Bytes encode_record(const Record& record) {
    Bytes buf;
    put_u8(buf, static_cast<std::uint8_t>(record_kind(record)));

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, WorkoutSession>) {
            put_string(buf, v.id);
            put_u8(buf, static_cast<std::uint8_t>(v.status));
            put_optional(buf, v.template_id, put_string);
            put_i64(buf, v.started_at);
            put_optional(buf, v.last_resumed_at, put_i64);
            put_i64(buf, v.active_seconds);
            put_optional(buf, v.completed_at, put_i64);
        }
        else if constexpr (std::is_same_v<T, ExerciseLogEntry>) {
            put_string(buf, v.id);
            put_string(buf, v.session_id);
            put_string(buf, v.exercise_name);
            put_i32(buf, v.exercise_order_index);
            put_i32(buf, v.set_number);
            put_f64(buf, v.weight);
            put_i32(buf, v.reps);
            put_u8(buf, v.completed ? 1 : 0);
            put_i64(buf, v.created_at);
        }
        else if constexpr (std::is_same_v<T, ProgramTemplate>) {
            put_template(buf, v);
        }
        else if constexpr (std::is_same_v<T, TemplateExercise>) {
            put_exercise(buf, v);
        }
        else if constexpr (std::is_same_v<T, OutboundQueueItem>) {
            put_i64(buf, v.seq);
            put_string(buf, v.event_type);
            put_bytes(buf, v.payload.data(), static_cast<std::uint32_t>(v.payload.size()));
            put_i64(buf, v.enqueued_at);
            put_i32(buf, v.attempts);
            put_optional(buf, v.last_attempt_at, put_i64);
        }
    }, record);

    return buf;
}

Record decode_record(std::span<const std::uint8_t> buf) {
    Reader r(buf);
    auto kind = static_cast<RecordKind>(r.read_u8());

    switch (kind) {
    case RecordKind::Session: {
        WorkoutSession s;
        s.id = r.read_string();
        auto status = r.read_u8();
        if (status != static_cast<std::uint8_t>(SessionStatus::Active) &&
            status != static_cast<std::uint8_t>(SessionStatus::Completed)) {
            throw Error(ErrorCode::ProtocolError,
                        "invalid session status: " + std::to_string(status));
        }
        s.status = static_cast<SessionStatus>(status);
        s.template_id = r.read_optional([](Reader& x) { return x.read_string(); });
        s.started_at = r.read_i64();
        s.last_resumed_at = read_opt_i64(r);
        s.active_seconds = r.read_i64();
        s.completed_at = read_opt_i64(r);
        return s;
    }
    case RecordKind::LogEntry: {
        ExerciseLogEntry e;
        e.id = r.read_string();
        e.session_id = r.read_string();
        e.exercise_name = r.read_string();
        e.exercise_order_index = r.read_i32();
        e.set_number = r.read_i32();
        e.weight = r.read_f64();
        e.reps = r.read_i32();
        e.completed = r.read_bool();
        e.created_at = r.read_i64();
        return e;
    }
    case RecordKind::Template:
        return read_template(r);
    case RecordKind::TemplateExercise:
        return read_exercise(r);
    case RecordKind::QueueItem: {
        OutboundQueueItem q;
        q.seq = r.read_i64();
        q.event_type = r.read_string();
        q.payload = r.read_bytes();
        q.enqueued_at = r.read_i64();
        q.attempts = r.read_i32();
        q.last_attempt_at = read_opt_i64(r);
        return q;
    }
    default:
        throw Error(ErrorCode::ProtocolError,
                    "unknown record kind: " +
                    std::to_string(static_cast<int>(kind)));
    }
}

} // namespace repsync

// ── sqlite_store.cpp ────────────────────────────────────────────
namespace repsync {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSchemaSql = R"(
CREATE TABLE IF NOT EXISTS _repsync_meta (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS workout_sessions (
    id              TEXT PRIMARY KEY,
    status          INTEGER NOT NULL,
    template_id     TEXT,
    started_at      INTEGER NOT NULL,
    last_resumed_at INTEGER,
    active_seconds  INTEGER NOT NULL DEFAULT 0,
    completed_at    INTEGER
);
CREATE TABLE IF NOT EXISTS exercise_logs (
    id                   TEXT PRIMARY KEY,
    session_id           TEXT NOT NULL,
    exercise_name        TEXT NOT NULL,
    exercise_order_index INTEGER NOT NULL,
    set_number           INTEGER NOT NULL,
    weight               REAL NOT NULL,
    reps                 INTEGER NOT NULL,
    completed            INTEGER NOT NULL,
    created_at           INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS exercise_logs_session ON exercise_logs(session_id);
CREATE TABLE IF NOT EXISTS program_templates (
    id          TEXT PRIMARY KEY,
    owner_id    TEXT NOT NULL,
    name        TEXT NOT NULL,
    day_of_week INTEGER,
    updated_at  INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS template_exercises (
    id            TEXT PRIMARY KEY,
    template_id   TEXT NOT NULL,
    order_index   INTEGER NOT NULL,
    name          TEXT NOT NULL,
    exercise_key  TEXT NOT NULL,
    target_sets   INTEGER NOT NULL,
    target_reps   TEXT NOT NULL,
    target_weight REAL,
    notes         TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS template_exercises_template ON template_exercises(template_id);
CREATE TABLE IF NOT EXISTS outbound_queue (
    seq             INTEGER PRIMARY KEY,
    event_type      TEXT NOT NULL,
    payload         BLOB NOT NULL,
    enqueued_at     INTEGER NOT NULL,
    attempts        INTEGER NOT NULL DEFAULT 0,
    last_attempt_at INTEGER
);
)";

/// Per-kind table layout. Column order in `select` matches read_row().
struct TableInfo {
    const char* table;
    const char* key;
    const char* parent;  ///< nullptr when the kind has no parent
    const char* select;
    const char* order_by;
};

const TableInfo& table_for(RecordKind kind) {
    static const TableInfo sessions{
        "workout_sessions", "id", nullptr,
        "SELECT id, status, template_id, started_at, last_resumed_at, "
        "active_seconds, completed_at FROM workout_sessions",
        "started_at, rowid"};
    static const TableInfo logs{
        "exercise_logs", "id", "session_id",
        "SELECT id, session_id, exercise_name, exercise_order_index, "
        "set_number, weight, reps, completed, created_at FROM exercise_logs",
        "created_at, rowid"};
    static const TableInfo templates{
        "program_templates", "id", nullptr,
        "SELECT id, owner_id, name, day_of_week, updated_at FROM program_templates",
        "COALESCE(day_of_week, 0), name, id"};
    static const TableInfo exercises{
        "template_exercises", "id", "template_id",
        "SELECT id, template_id, order_index, name, exercise_key, target_sets, "
        "target_reps, target_weight, notes FROM template_exercises",
        "order_index, rowid"};
    static const TableInfo queue{
        "outbound_queue", "seq", nullptr,
        "SELECT seq, event_type, payload, enqueued_at, attempts, "
        "last_attempt_at FROM outbound_queue",
        "seq"};

    switch (kind) {
    case RecordKind::Session:          return sessions;
    case RecordKind::LogEntry:         return logs;
    case RecordKind::Template:         return templates;
    case RecordKind::TemplateExercise: return exercises;
    case RecordKind::QueueItem:        return queue;
    }
    throw Error(ErrorCode::InvalidState,
                "unknown record kind: " + std::to_string(static_cast<int>(kind)));
}

std::optional<Seq> parse_seq(const Id& id) {
    Seq v = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), v);
    if (ec != std::errc() || end != id.data() + id.size()) return std::nullopt;
    return v;
}

void ensure_schema(sqlite3* db) {
    detail::exec(db, kSchemaSql);

    auto sel = detail::prepare(db,
        "SELECT value FROM _repsync_meta WHERE key='schema_version'");
    if (sqlite3_step(sel.get()) == SQLITE_ROW) {
        auto stored = detail::column_string(sel.get(), 0);
        if (stored != std::to_string(kSchemaVersion)) {
            throw Error(ErrorCode::SchemaMismatch,
                        "schema version " + stored + " on disk, expected " +
                        std::to_string(kSchemaVersion));
        }
        return;
    }

    auto ins = detail::prepare(db,
        "INSERT INTO _repsync_meta (key, value) VALUES ('schema_version', ?)");
    detail::bind_text(ins.get(), 1, std::to_string(kSchemaVersion));
    detail::step_done(db, ins.get());
}

} // namespace

struct SqliteStore::Impl {
    sqlite3*    db = nullptr;
    std::string path;

    ~Impl() {
        if (!db) return;
        if (!sqlite3_get_autocommit(db)) {
            SPDLOG_WARN("sqlite store {}: discarding uncommitted writes", path);
            int rc = sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
            if (rc != SQLITE_OK) {
                SPDLOG_ERROR("sqlite store {}: rollback failed: {}",
                             path, sqlite3_errstr(rc));
            }
        }
        sqlite3_close(db);
    }

    void begin() {
        if (sqlite3_get_autocommit(db)) detail::exec(db, "BEGIN IMMEDIATE");
    }

    void upsert(const WorkoutSession& s) {
        auto stmt = detail::prepare(db,
            "INSERT INTO workout_sessions (id, status, template_id, started_at, "
            "last_resumed_at, active_seconds, completed_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET status=excluded.status, "
            "template_id=excluded.template_id, started_at=excluded.started_at, "
            "last_resumed_at=excluded.last_resumed_at, "
            "active_seconds=excluded.active_seconds, "
            "completed_at=excluded.completed_at");
        auto* st = stmt.get();
        detail::bind_text(st, 1, s.id);
        sqlite3_bind_int(st, 2, static_cast<int>(s.status));
        detail::bind_opt_text(st, 3, s.template_id);
        sqlite3_bind_int64(st, 4, s.started_at);
        detail::bind_opt_int64(st, 5, s.last_resumed_at);
        sqlite3_bind_int64(st, 6, s.active_seconds);
        detail::bind_opt_int64(st, 7, s.completed_at);
        detail::step_done(db, st);
    }

    void upsert(const ExerciseLogEntry& e) {
        auto stmt = detail::prepare(db,
            "INSERT INTO exercise_logs (id, session_id, exercise_name, "
            "exercise_order_index, set_number, weight, reps, completed, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET session_id=excluded.session_id, "
            "exercise_name=excluded.exercise_name, "
            "exercise_order_index=excluded.exercise_order_index, "
            "set_number=excluded.set_number, weight=excluded.weight, "
            "reps=excluded.reps, completed=excluded.completed, "
            "created_at=excluded.created_at");
        auto* st = stmt.get();
        detail::bind_text(st, 1, e.id);
        detail::bind_text(st, 2, e.session_id);
        detail::bind_text(st, 3, e.exercise_name);
        sqlite3_bind_int(st, 4, e.exercise_order_index);
        sqlite3_bind_int(st, 5, e.set_number);
        sqlite3_bind_double(st, 6, e.weight);
        sqlite3_bind_int(st, 7, e.reps);
        sqlite3_bind_int(st, 8, e.completed ? 1 : 0);
        sqlite3_bind_int64(st, 9, e.created_at);
        detail::step_done(db, st);
    }

    // Exercises live in their own table; the template row ignores them.
    void upsert(const ProgramTemplate& t) {
        auto stmt = detail::prepare(db,
            "INSERT INTO program_templates (id, owner_id, name, day_of_week, updated_at) "
            "VALUES (?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET owner_id=excluded.owner_id, "
            "name=excluded.name, day_of_week=excluded.day_of_week, "
            "updated_at=excluded.updated_at");
        auto* st = stmt.get();
        detail::bind_text(st, 1, t.id);
        detail::bind_text(st, 2, t.owner_id);
        detail::bind_text(st, 3, t.name);
        if (t.day_of_week) sqlite3_bind_int(st, 4, *t.day_of_week);
        else sqlite3_bind_null(st, 4);
        sqlite3_bind_int64(st, 5, t.updated_at);
        detail::step_done(db, st);
    }

    void upsert(const TemplateExercise& e) {
        auto stmt = detail::prepare(db,
            "INSERT INTO template_exercises (id, template_id, order_index, name, "
            "exercise_key, target_sets, target_reps, target_weight, notes) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET template_id=excluded.template_id, "
            "order_index=excluded.order_index, name=excluded.name, "
            "exercise_key=excluded.exercise_key, target_sets=excluded.target_sets, "
            "target_reps=excluded.target_reps, target_weight=excluded.target_weight, "
            "notes=excluded.notes");
        auto* st = stmt.get();
        detail::bind_text(st, 1, e.id);
        detail::bind_text(st, 2, e.template_id);
        sqlite3_bind_int(st, 3, e.order_index);
        detail::bind_text(st, 4, e.name);
        detail::bind_text(st, 5, e.exercise_key);
        sqlite3_bind_int(st, 6, e.target_sets);
        detail::bind_text(st, 7, e.target_reps);
        if (e.target_weight) sqlite3_bind_double(st, 8, *e.target_weight);
        else sqlite3_bind_null(st, 8);
        detail::bind_text(st, 9, e.notes);
        detail::step_done(db, st);
    }

    void upsert(const OutboundQueueItem& q) {
        auto stmt = detail::prepare(db,
            "INSERT INTO outbound_queue (seq, event_type, payload, enqueued_at, "
            "attempts, last_attempt_at) VALUES (?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(seq) DO UPDATE SET event_type=excluded.event_type, "
            "payload=excluded.payload, enqueued_at=excluded.enqueued_at, "
            "attempts=excluded.attempts, last_attempt_at=excluded.last_attempt_at");
        auto* st = stmt.get();
        sqlite3_bind_int64(st, 1, q.seq);
        detail::bind_text(st, 2, q.event_type);
        sqlite3_bind_blob(st, 3, q.payload.data(),
                          static_cast<int>(q.payload.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(st, 4, q.enqueued_at);
        sqlite3_bind_int(st, 5, q.attempts);
        detail::bind_opt_int64(st, 6, q.last_attempt_at);
        detail::step_done(db, st);
    }

    static std::optional<std::int64_t> opt_int64(sqlite3_stmt* st, int i) {
        if (detail::column_null(st, i)) return std::nullopt;
        return sqlite3_column_int64(st, i);
    }

    static Record read_row(RecordKind kind, sqlite3_stmt* st) {
        switch (kind) {
        case RecordKind::Session: {
            WorkoutSession s;
            s.id = detail::column_string(st, 0);
            s.status = static_cast<SessionStatus>(sqlite3_column_int(st, 1));
            if (!detail::column_null(st, 2)) s.template_id = detail::column_string(st, 2);
            s.started_at = sqlite3_column_int64(st, 3);
            s.last_resumed_at = opt_int64(st, 4);
            s.active_seconds = sqlite3_column_int64(st, 5);
            s.completed_at = opt_int64(st, 6);
            return s;
        }
        case RecordKind::LogEntry: {
            ExerciseLogEntry e;
            e.id = detail::column_string(st, 0);
            e.session_id = detail::column_string(st, 1);
            e.exercise_name = detail::column_string(st, 2);
            e.exercise_order_index = sqlite3_column_int(st, 3);
            e.set_number = sqlite3_column_int(st, 4);
            e.weight = sqlite3_column_double(st, 5);
            e.reps = sqlite3_column_int(st, 6);
            e.completed = sqlite3_column_int(st, 7) != 0;
            e.created_at = sqlite3_column_int64(st, 8);
            return e;
        }
        case RecordKind::Template: {
            ProgramTemplate t;
            t.id = detail::column_string(st, 0);
            t.owner_id = detail::column_string(st, 1);
            t.name = detail::column_string(st, 2);
            if (!detail::column_null(st, 3)) t.day_of_week = sqlite3_column_int(st, 3);
            t.updated_at = sqlite3_column_int64(st, 4);
            return t;
        }
        case RecordKind::TemplateExercise: {
            TemplateExercise e;
            e.id = detail::column_string(st, 0);
            e.template_id = detail::column_string(st, 1);
            e.order_index = sqlite3_column_int(st, 2);
            e.name = detail::column_string(st, 3);
            e.exercise_key = detail::column_string(st, 4);
            e.target_sets = sqlite3_column_int(st, 5);
            e.target_reps = detail::column_string(st, 6);
            if (!detail::column_null(st, 7)) e.target_weight = sqlite3_column_double(st, 7);
            e.notes = detail::column_string(st, 8);
            return e;
        }
        case RecordKind::QueueItem: {
            OutboundQueueItem q;
            q.seq = sqlite3_column_int64(st, 0);
            q.event_type = detail::column_string(st, 1);
            auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(st, 2));
            auto len = static_cast<std::size_t>(sqlite3_column_bytes(st, 2));
            if (blob) q.payload.assign(blob, blob + len);
            q.enqueued_at = sqlite3_column_int64(st, 3);
            q.attempts = sqlite3_column_int(st, 4);
            q.last_attempt_at = opt_int64(st, 5);
            return q;
        }
        }
        throw Error(ErrorCode::InvalidState, "unknown record kind");
    }

    /// Bind the key of (kind, id). Returns false if `id` can never match.
    static bool bind_key(RecordKind kind, sqlite3_stmt* st, const Id& id) {
        if (kind == RecordKind::QueueItem) {
            auto seq = parse_seq(id);
            if (!seq) return false;
            sqlite3_bind_int64(st, 1, *seq);
            return true;
        }
        detail::bind_text(st, 1, id);
        return true;
    }
};

SqliteStore::SqliteStore(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = path;
    int rc = sqlite3_open_v2(path.c_str(), &impl_->db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        throw Error(ErrorCode::StoreError, "cannot open " + path + ": " + msg);
    }
    sqlite3_busy_timeout(impl_->db, 1000);
    ensure_schema(impl_->db);
    SPDLOG_INFO("sqlite store opened at {}", path);
}

SqliteStore::~SqliteStore() = default;

void SqliteStore::put(const Record& record) {
    impl_->begin();
    std::visit([&](const auto& r) { impl_->upsert(r); }, record);
}

std::optional<Record> SqliteStore::get(RecordKind kind, const Id& id) {
    const auto& t = table_for(kind);
    auto stmt = detail::prepare(impl_->db,
        std::string(t.select) + " WHERE " + t.key + " = ?");
    if (!Impl::bind_key(kind, stmt.get(), id)) return std::nullopt;

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return Impl::read_row(kind, stmt.get());
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::StoreError, sqlite3_errmsg(impl_->db));
    }
    return std::nullopt;
}

std::vector<Record> SqliteStore::query(RecordKind kind, const Query& q) {
    const auto& t = table_for(kind);
    if (q.parent && !t.parent) return {};

    std::string sql = t.select;
    if (q.parent) sql += std::string(" WHERE ") + t.parent + " = ?";
    sql += std::string(" ORDER BY ") + t.order_by;

    auto stmt = detail::prepare(impl_->db, sql);
    if (q.parent) detail::bind_text(stmt.get(), 1, *q.parent);

    std::vector<Record> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto rec = Impl::read_row(kind, stmt.get());
        if (!q.where || q.where(rec)) out.push_back(std::move(rec));
    }
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::StoreError, sqlite3_errmsg(impl_->db));
    }
    return out;
}

void SqliteStore::remove(RecordKind kind, const Id& id) {
    const auto& t = table_for(kind);
    auto stmt = detail::prepare(impl_->db,
        std::string("DELETE FROM ") + t.table + " WHERE " + t.key + " = ?");
    if (!Impl::bind_key(kind, stmt.get(), id)) return;
    impl_->begin();
    detail::step_done(impl_->db, stmt.get());
}

void SqliteStore::save() {
    auto* db = impl_->db;
    if (sqlite3_get_autocommit(db)) return;

    char* err = nullptr;
    int rc = sqlite3_exec(db, "COMMIT", nullptr, nullptr, &err);
    if (rc == SQLITE_OK) return;

    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    if (!sqlite3_get_autocommit(db)) {
        int rb = sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        if (rb != SQLITE_OK) {
            SPDLOG_ERROR("sqlite store {}: rollback after failed commit: {}",
                         impl_->path, sqlite3_errstr(rb));
        }
    }
    throw Error(ErrorCode::StoreError, "commit failed: " + msg);
}

} // namespace repsync

// ── kv_store.cpp ────────────────────────────────────────────────
namespace repsync {

namespace {

constexpr std::array<std::uint8_t, 4> kKvMagic{'R', 'S', 'K', 'V'};
constexpr std::uint32_t kKvVersion = 1;

/// Natural order of a kind, matching the ORDER BY of the sqlite tables.
bool natural_less(const Record& a, const Record& b) {
    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b);
        if constexpr (std::is_same_v<T, WorkoutSession>) {
            return x.started_at < y.started_at;
        } else if constexpr (std::is_same_v<T, ExerciseLogEntry>) {
            return x.created_at < y.created_at;
        } else if constexpr (std::is_same_v<T, ProgramTemplate>) {
            auto xd = x.day_of_week.value_or(0);
            auto yd = y.day_of_week.value_or(0);
            return std::tie(xd, x.name, x.id) < std::tie(yd, y.name, y.id);
        } else if constexpr (std::is_same_v<T, TemplateExercise>) {
            return x.order_index < y.order_index;
        } else {
            return x.seq < y.seq;
        }
    }, a);
}

} // namespace

struct KeyValueStore::Impl {
    std::string path;
    std::map<std::string, Bytes> records;
    // "all/<kind>" lists every id of a kind; "idx/<kind>/<parent>" the
    // children of one parent. Both keep insertion order and are encoded
    // only when the file is written.
    std::map<std::string, std::vector<Id>> indexes;

    // Values as of the last save for every key touched since; nullopt if
    // the key was absent. Restored when a save fails.
    std::map<std::string, std::optional<Bytes>> undo_records;
    std::map<std::string, std::optional<std::vector<Id>>> undo_indexes;

    bool dirty() const { return !undo_records.empty() || !undo_indexes.empty(); }

    static std::string kind_prefix(RecordKind kind) {
        return std::to_string(static_cast<int>(kind));
    }

    static std::string record_key(RecordKind kind, const Id& id) {
        return "rec/" + kind_prefix(kind) + "/" + id;
    }

    static std::string all_key(RecordKind kind) {
        return "all/" + kind_prefix(kind);
    }

    static std::string parent_key(RecordKind kind, const Id& parent) {
        return "idx/" + kind_prefix(kind) + "/" + parent;
    }

    template <typename Map, typename Undo>
    static void touch(const Map& live, Undo& undo, const std::string& key) {
        if (undo.count(key)) return;
        auto it = live.find(key);
        if (it == live.end()) undo.emplace(key, std::nullopt);
        else undo.emplace(key, it->second);
    }

    void set_record(const std::string& key, Bytes value) {
        touch(records, undo_records, key);
        records[key] = std::move(value);
    }

    void erase_record(const std::string& key) {
        touch(records, undo_records, key);
        records.erase(key);
    }

    const std::vector<Id>* find_index(const std::string& key) const {
        auto it = indexes.find(key);
        return it == indexes.end() ? nullptr : &it->second;
    }

    void index_add(const std::string& key, const Id& id) {
        touch(indexes, undo_indexes, key);
        indexes[key].push_back(id);
    }

    void index_remove(const std::string& key, const Id& id) {
        auto it = indexes.find(key);
        if (it == indexes.end()) return;
        touch(indexes, undo_indexes, key);
        std::erase(it->second, id);
        if (it->second.empty()) indexes.erase(it);
    }

    void commit() {
        undo_records.clear();
        undo_indexes.clear();
    }

    void rollback() {
        for (auto& [key, value] : undo_records) {
            if (value) records[key] = std::move(*value);
            else records.erase(key);
        }
        for (auto& [key, ids] : undo_indexes) {
            if (ids) indexes[key] = std::move(*ids);
            else indexes.erase(key);
        }
        commit();
    }

    std::optional<Record> load_record(RecordKind kind, const Id& id) const {
        auto it = records.find(record_key(kind, id));
        if (it == records.end()) return std::nullopt;
        return decode_record(it->second);
    }

    void load() {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) return;

        std::ifstream in(path, std::ios::binary);
        if (!in) throw Error(ErrorCode::StoreError, "cannot read " + path);
        Bytes buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        try {
            if (buf.size() < kKvMagic.size() ||
                !std::equal(kKvMagic.begin(), kKvMagic.end(), buf.begin())) {
                throw Error(ErrorCode::ProtocolError, "bad magic");
            }
            Reader r(std::span<const std::uint8_t>(buf).subspan(kKvMagic.size()));
            auto version = r.read_u32();
            if (version != kKvVersion) {
                throw Error(ErrorCode::SchemaMismatch,
                            "key-value file version " + std::to_string(version));
            }
            auto n = r.read_u32();
            for (std::uint32_t i = 0; i < n; ++i) {
                auto key = r.read_string();
                auto value = r.read_bytes();
                if (key.starts_with("rec/")) {
                    records[key] = std::move(value);
                    continue;
                }
                Reader ir(value);
                auto count = ir.read_u32();
                auto& ids = indexes[key];
                for (std::uint32_t j = 0; j < count; ++j) ids.push_back(ir.read_string());
            }
        } catch (const Error& e) {
            if (e.code() == ErrorCode::SchemaMismatch) throw;
            throw Error(ErrorCode::StoreError,
                        "corrupt key-value store " + path + ": " + e.what());
        }
    }

    void write_file() const {
        Bytes buf(kKvMagic.begin(), kKvMagic.end());
        put_u32(buf, kKvVersion);
        put_u32(buf, static_cast<std::uint32_t>(records.size() + indexes.size()));
        for (const auto& [key, value] : records) {
            put_string(buf, key);
            put_bytes(buf, value.data(), static_cast<std::uint32_t>(value.size()));
        }
        for (const auto& [key, ids] : indexes) {
            Bytes value;
            put_u32(value, static_cast<std::uint32_t>(ids.size()));
            for (const auto& id : ids) put_string(value, id);
            put_string(buf, key);
            put_bytes(buf, value.data(), static_cast<std::uint32_t>(value.size()));
        }

        // Replace the file in one rename so a crash leaves old or new, never half.
        std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw Error(ErrorCode::StoreError, "cannot write " + tmp);
            out.write(reinterpret_cast<const char*>(buf.data()),
                      static_cast<std::streamsize>(buf.size()));
            out.flush();
            if (!out) throw Error(ErrorCode::StoreError, "write failed: " + tmp);
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            throw Error(ErrorCode::StoreError,
                        "cannot replace " + path + ": " + ec.message());
        }
    }
};

KeyValueStore::KeyValueStore(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = path;

    std::error_code ec;
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty() && !std::filesystem::is_directory(dir, ec)) {
        throw Error(ErrorCode::StoreError,
                    "directory does not exist: " + dir.string());
    }
    impl_->load();
    SPDLOG_INFO("key-value store opened at {} ({} records)", path,
                impl_->records.size());
}

KeyValueStore::~KeyValueStore() {
    if (impl_ && impl_->dirty()) {
        SPDLOG_WARN("key-value store {}: discarding unsaved writes", impl_->path);
    }
}

void KeyValueStore::put(const Record& record) {
    auto kind = record_kind(record);
    auto id = record_id(record);
    auto parent = record_parent(record);

    auto previous = impl_->load_record(kind, id);
    if (!previous) {
        impl_->index_add(Impl::all_key(kind), id);
        if (!parent.empty()) impl_->index_add(Impl::parent_key(kind, parent), id);
    } else {
        auto old_parent = record_parent(*previous);
        if (old_parent != parent) {
            if (!old_parent.empty())
                impl_->index_remove(Impl::parent_key(kind, old_parent), id);
            if (!parent.empty())
                impl_->index_add(Impl::parent_key(kind, parent), id);
        }
    }

    if (auto* t = std::get_if<ProgramTemplate>(&record); t && !t->exercises.empty()) {
        auto stripped = *t;
        stripped.exercises.clear();
        impl_->set_record(Impl::record_key(kind, id), encode_record(stripped));
    } else {
        impl_->set_record(Impl::record_key(kind, id), encode_record(record));
    }
}

std::optional<Record> KeyValueStore::get(RecordKind kind, const Id& id) {
    return impl_->load_record(kind, id);
}

std::vector<Record> KeyValueStore::query(RecordKind kind, const Query& q) {
    const auto* ids = impl_->find_index(q.parent ? Impl::parent_key(kind, *q.parent)
                                                 : Impl::all_key(kind));
    std::vector<Record> out;
    if (!ids) return out;
    for (const auto& id : *ids) {
        auto rec = impl_->load_record(kind, id);
        if (!rec) continue;
        if (q.where && !q.where(*rec)) continue;
        out.push_back(std::move(*rec));
    }
    std::stable_sort(out.begin(), out.end(), natural_less);
    return out;
}

void KeyValueStore::remove(RecordKind kind, const Id& id) {
    auto previous = impl_->load_record(kind, id);
    if (!previous) return;

    impl_->index_remove(Impl::all_key(kind), id);
    auto parent = record_parent(*previous);
    if (!parent.empty()) impl_->index_remove(Impl::parent_key(kind, parent), id);
    impl_->erase_record(Impl::record_key(kind, id));
}

void KeyValueStore::save() {
    if (!impl_->dirty()) return;
    try {
        impl_->write_file();
    } catch (const Error& e) {
        SPDLOG_ERROR("key-value store {}: save failed, rolling back: {}",
                     impl_->path, e.what());
        impl_->rollback();
        throw;
    }
    impl_->commit();
}

// ── open_record_store ───────────────────────────────────────────────

std::unique_ptr<RecordStore> open_record_store(const StoreConfig& config) {
    std::string fallback = config.fallback_path.empty()
        ? config.path + ".kv" : config.fallback_path;
    std::string reason = "structured store disabled";

    if (!config.force_fallback) {
        try {
            return std::make_unique<SqliteStore>(config.path);
        } catch (const Error& e) {
            reason = e.what();
        }
        SPDLOG_WARN("structured store unavailable ({}); running in degraded "
                    "mode on key-value store {}", reason, fallback);
    }

    try {
        return std::make_unique<KeyValueStore>(fallback);
    } catch (const Error& e) {
        SPDLOG_ERROR("no local storage available: {}; {}", reason, e.what());
        throw Error(ErrorCode::StoreUnavailable,
                    "no local storage available (" + reason + "; " + e.what() +
                    "). Reset the app data or reinstall to recover.");
    }
}

} // namespace repsync

// ── memory_link.cpp ─────────────────────────────────────────────
namespace repsync {

namespace {

std::size_t index_of(MemoryLink::Side side) {
    return static_cast<std::size_t>(side);
}

MemoryLink::Side other(MemoryLink::Side side) {
    return side == MemoryLink::Side::Primary ? MemoryLink::Side::Companion
                                             : MemoryLink::Side::Primary;
}

const char* side_name(MemoryLink::Side side) {
    return side == MemoryLink::Side::Primary ? "primary" : "companion";
}

} // namespace

struct MemoryLink::Impl {
    class Endpoint;

    mutable std::mutex mu;
    bool reachable = false;
    std::array<std::unique_ptr<Endpoint>, 2> ends;
    std::array<std::deque<Bytes>, 2> deferred;   ///< by receiving side
    std::array<std::size_t, 2> fail_next{};
    std::array<bool, 2> fail_activation{};
    std::array<std::size_t, 2> delivered{};

    Impl();
    ~Impl();

    /// Both ends activated and the link up. Caller holds mu.
    bool connected_locked() const;

    void notify_reachability();
    std::size_t deliver_deferred();
};

class MemoryLink::Impl::Endpoint : public Transport {
public:
    Endpoint(Impl& link, Side side) : link_(link), side_(side) {}

    ActivationState activation_state() const override {
        std::lock_guard lock(link_.mu);
        return state_;
    }

    void activate() override {
        {
            std::lock_guard lock(link_.mu);
            state_ = link_.fail_activation[index_of(side_)]
                ? ActivationState::Failed : ActivationState::Activated;
        }
        if (activation_state() == ActivationState::Failed) {
            SPDLOG_WARN("{} transport activation failed", side_name(side_));
            return;
        }
        link_.notify_reachability();
        link_.deliver_deferred();
    }

    bool is_reachable() const override {
        std::lock_guard lock(link_.mu);
        return link_.connected_locked();
    }

    SendResult send_immediate(const Event& event,
                              std::chrono::milliseconds timeout) override {
        InboundHandler handler;
        {
            std::lock_guard lock(link_.mu);
            if (state_ != ActivationState::Activated) {
                return {ErrorCode::NotActivated, "transport session not activated", {}};
            }
            if (!link_.connected_locked()) {
                return {ErrorCode::Unreachable, "peer not reachable", {}};
            }
            auto& fails = link_.fail_next[index_of(side_)];
            if (fails > 0) {
                --fails;
                return {ErrorCode::PeerError, "send failed", {}};
            }
            handler = link_.ends[index_of(other(side_))]->inbound_;
        }
        if (!handler) return {ErrorCode::PeerError, "peer has no receiver", {}};

        Event received;
        try {
            received = deserialize(serialize(event));
        } catch (const Error& e) {
            return {ErrorCode::ProtocolError, e.what(), {}};
        }

        std::future<Reply> fut;
        try {
            fut = handler(received, Delivery::Immediate);
        } catch (const std::exception& e) {
            return {ErrorCode::PeerError, e.what(), {}};
        }
        if (!fut.valid()) return {ErrorCode::PeerError, "peer dropped the event", {}};

        if (fut.wait_for(timeout) != std::future_status::ready) {
            return {ErrorCode::Timeout,
                    "no acknowledgment within " + std::to_string(timeout.count()) + " ms",
                    {}};
        }

        SendResult result;
        try {
            auto reply = fut.get();
            if (reply) result.reply = deserialize(serialize(*reply));
        } catch (const std::exception& e) {
            return {ErrorCode::PeerError, e.what(), {}};
        }

        std::lock_guard lock(link_.mu);
        ++link_.delivered[index_of(side_)];
        return result;
    }

    void send_deferred(const Event& event) override {
        auto bytes = serialize(event);
        bool deliver_now;
        {
            std::lock_guard lock(link_.mu);
            link_.deferred[index_of(other(side_))].push_back(std::move(bytes));
            deliver_now = link_.connected_locked();
        }
        SPDLOG_DEBUG("{} deferred {}", side_name(side_), event_name(event));
        if (deliver_now) link_.deliver_deferred();
    }

    void set_inbound_handler(InboundHandler handler) override {
        std::lock_guard lock(link_.mu);
        inbound_ = std::move(handler);
    }

    void set_reachability_handler(ReachabilityHandler handler) override {
        std::lock_guard lock(link_.mu);
        on_reachability_ = std::move(handler);
    }

private:
    friend struct MemoryLink::Impl;

    Impl& link_;
    Side side_;
    ActivationState state_ = ActivationState::NotActivated;
    InboundHandler inbound_;
    ReachabilityHandler on_reachability_;
};

MemoryLink::Impl::Impl() {
    ends[0] = std::make_unique<Endpoint>(*this, Side::Primary);
    ends[1] = std::make_unique<Endpoint>(*this, Side::Companion);
}

MemoryLink::Impl::~Impl() = default;

bool MemoryLink::Impl::connected_locked() const {
    return reachable &&
           ends[0]->state_ == ActivationState::Activated &&
           ends[1]->state_ == ActivationState::Activated;
}

void MemoryLink::Impl::notify_reachability() {
    std::array<ReachabilityHandler, 2> handlers;
    bool up;
    {
        std::lock_guard lock(mu);
        up = connected_locked();
        for (std::size_t i = 0; i < 2; ++i) handlers[i] = ends[i]->on_reachability_;
    }
    for (auto& h : handlers) {
        if (h) h(up);
    }
}

std::size_t MemoryLink::Impl::deliver_deferred() {
    std::size_t count = 0;
    for (std::size_t to = 0; to < 2; ++to) {
        std::deque<Bytes> batch;
        InboundHandler handler;
        {
            std::lock_guard lock(mu);
            if (!connected_locked() || !ends[to]->inbound_) continue;
            batch.swap(deferred[to]);
            handler = ends[to]->inbound_;
        }
        for (const auto& bytes : batch) {
            try {
                // Store-and-forward: the reply, if any, has nowhere to go.
                auto fut = handler(deserialize(bytes), Delivery::Deferred);
                (void)fut;
                ++count;
            } catch (const std::exception& e) {
                SPDLOG_WARN("deferred delivery to {} failed: {}",
                            side_name(static_cast<Side>(to)), e.what());
            }
        }
    }
    return count;
}

MemoryLink::MemoryLink() : impl_(std::make_unique<Impl>()) {}
MemoryLink::~MemoryLink() = default;

Transport& MemoryLink::primary_end() { return *impl_->ends[0]; }
Transport& MemoryLink::companion_end() { return *impl_->ends[1]; }
Transport& MemoryLink::end(Side side) { return *impl_->ends[index_of(side)]; }

void MemoryLink::set_reachable(bool reachable) {
    {
        std::lock_guard lock(impl_->mu);
        if (impl_->reachable == reachable) return;
        impl_->reachable = reachable;
    }
    SPDLOG_INFO("link {}", reachable ? "up" : "down");
    impl_->notify_reachability();
    if (reachable) impl_->deliver_deferred();
}

bool MemoryLink::reachable() const {
    std::lock_guard lock(impl_->mu);
    return impl_->reachable;
}

void MemoryLink::fail_activation(Side side, bool fail) {
    std::lock_guard lock(impl_->mu);
    impl_->fail_activation[index_of(side)] = fail;
}

void MemoryLink::fail_next_sends(Side side, std::size_t count) {
    std::lock_guard lock(impl_->mu);
    impl_->fail_next[index_of(side)] = count;
}

std::size_t MemoryLink::deliver_deferred() {
    return impl_->deliver_deferred();
}

std::size_t MemoryLink::deferred_pending(Side to) const {
    std::lock_guard lock(impl_->mu);
    return impl_->deferred[index_of(to)].size();
}

std::size_t MemoryLink::immediate_delivered(Side from) const {
    std::lock_guard lock(impl_->mu);
    return impl_->delivered[index_of(from)];
}

} // namespace repsync

// ── executor.cpp ────────────────────────────────────────────────
namespace repsync {

struct SerialExecutor::Impl {
    mutable std::mutex mu;
    std::condition_variable work_cv;
    std::condition_variable idle_cv;
    std::deque<std::function<void()>> tasks;
    std::size_t outstanding = 0;  ///< queued plus running
    bool stopping = false;
    std::thread worker;

    void run() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock lock(mu);
                work_cv.wait(lock, [&] { return stopping || !tasks.empty(); });
                if (tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            try {
                task();
            } catch (const std::exception& e) {
                SPDLOG_ERROR("executor task failed: {}", e.what());
            }
            {
                std::lock_guard lock(mu);
                --outstanding;
            }
            idle_cv.notify_all();
        }
    }
};

SerialExecutor::SerialExecutor() : impl_(std::make_unique<Impl>()) {
    impl_->worker = std::thread([impl = impl_.get()] { impl->run(); });
}

SerialExecutor::~SerialExecutor() {
    {
        std::lock_guard lock(impl_->mu);
        impl_->stopping = true;
    }
    impl_->work_cv.notify_all();
    if (impl_->worker.joinable()) impl_->worker.join();
}

void SerialExecutor::post(std::function<void()> task) {
    {
        std::lock_guard lock(impl_->mu);
        impl_->tasks.push_back(std::move(task));
        ++impl_->outstanding;
    }
    impl_->work_cv.notify_one();
}

void SerialExecutor::drain() {
    if (on_worker_thread()) {
        throw Error(ErrorCode::InvalidState, "drain() called from an executor task");
    }
    std::unique_lock lock(impl_->mu);
    impl_->idle_cv.wait(lock, [&] { return impl_->outstanding == 0; });
}

bool SerialExecutor::idle() const {
    std::lock_guard lock(impl_->mu);
    return impl_->outstanding == 0;
}

bool SerialExecutor::on_worker_thread() const {
    return std::this_thread::get_id() == impl_->worker.get_id();
}

} // namespace repsync

// ── reachability.cpp ────────────────────────────────────────────
namespace repsync {

ReachabilityMonitor::ReachabilityMonitor(std::function<void()> on_reachable)
    : on_reachable_(std::move(on_reachable)) {}

bool ReachabilityMonitor::update(bool online) {
    bool was = online_.exchange(online);
    if (was || !online) return false;
    SPDLOG_DEBUG("peer became reachable");
    if (on_reachable_) on_reachable_();
    return true;
}

} // namespace repsync

// ── queue.cpp ───────────────────────────────────────────────────
namespace repsync {

struct OutboundQueue::Impl {
    RecordStore& store;
    Transport&   transport;
    QueueConfig  config;

    std::atomic<bool> flushing{false};
    Seq next_seq = 1;

    mutable std::mutex attempt_mu;
    std::optional<Timestamp> last_attempt;

    Impl(RecordStore& s, Transport& t, QueueConfig c)
        : store(s), transport(t), config(std::move(c)) {}

    Timestamp now() const { return config.clock ? config.clock() : now_ms(); }

    void on_writer(const std::function<void()>& fn) {
        if (config.writer) config.writer(fn);
        else fn();
    }

    std::vector<OutboundQueueItem> load() {
        return query_as<OutboundQueueItem>(store, RecordKind::QueueItem);
    }
};

OutboundQueue::OutboundQueue(RecordStore& store, Transport& transport, QueueConfig config)
    : impl_(std::make_unique<Impl>(store, transport, std::move(config))) {
    // Runs before any concurrent use, so it reads the store directly.
    auto items = impl_->load();
    for (const auto& item : items) {
        impl_->next_seq = std::max(impl_->next_seq, item.seq + 1);
        if (item.last_attempt_at &&
            (!impl_->last_attempt || *item.last_attempt_at > *impl_->last_attempt)) {
            impl_->last_attempt = item.last_attempt_at;
        }
    }
    if (!items.empty()) {
        SPDLOG_INFO("outbound queue restored with {} pending events", items.size());
    }
}

OutboundQueue::~OutboundQueue() = default;

Seq OutboundQueue::enqueue(const Event& event) {
    OutboundQueueItem item;
    item.event_type = event_name(event);
    item.payload = serialize(event);
    item.enqueued_at = impl_->now();

    impl_->on_writer([&] {
        item.seq = impl_->next_seq++;
        impl_->store.put(item);
        impl_->store.save();
    });
    SPDLOG_DEBUG("queued {} as seq={}", item.event_type, item.seq);
    return item.seq;
}

FlushReport OutboundQueue::flush() {
    FlushReport report;
    bool expected = false;
    if (!impl_->flushing.compare_exchange_strong(expected, true)) {
        SPDLOG_DEBUG("flush already in progress");
        report.busy = true;
        return report;
    }
    struct Reset {
        std::atomic<bool>& flag;
        ~Reset() { flag.store(false); }
    } reset{impl_->flushing};

    std::vector<OutboundQueueItem> items;
    impl_->on_writer([&] { items = impl_->load(); });

    if (!impl_->transport.is_reachable()) {
        report.remaining = items.size();
        return report;
    }

    for (auto& item : items) {
        Event event;
        try {
            event = deserialize(item.payload);
        } catch (const Error& e) {
            SPDLOG_ERROR("queued seq={} ({}) cannot be decoded: {}",
                         item.seq, item.event_type, e.what());
            ++report.undecodable;
            ++report.remaining;
            continue;
        }

        ++report.attempted;
        auto when = impl_->now();
        {
            std::lock_guard lock(impl_->attempt_mu);
            impl_->last_attempt = when;
        }

        auto result = impl_->transport.send_immediate(event, impl_->config.send_timeout);
        if (result.ok()) {
            impl_->on_writer([&] {
                impl_->store.remove(RecordKind::QueueItem, std::to_string(item.seq));
                impl_->store.save();
            });
            ++report.delivered;
            if (impl_->config.on_delivered) impl_->config.on_delivered(item.seq, event);
            continue;
        }

        SPDLOG_INFO("flush of seq={} ({}) failed: {}: {}", item.seq,
                    item.event_type, error_code_name(result.code), result.detail);
        ++item.attempts;
        item.last_attempt_at = when;
        impl_->on_writer([&] {
            impl_->store.put(item);
            impl_->store.save();
        });
        ++report.failed;
        ++report.remaining;
    }

    if (report.attempted > 0) {
        SPDLOG_INFO("flush: {} delivered, {} failed, {} remaining",
                    report.delivered, report.failed, report.remaining);
    }
    return report;
}

std::vector<OutboundQueueItem> OutboundQueue::pending() {
    std::vector<OutboundQueueItem> items;
    impl_->on_writer([&] { items = impl_->load(); });
    return items;
}

std::size_t OutboundQueue::size() {
    return pending().size();
}

std::optional<Timestamp> OutboundQueue::last_attempt_at() const {
    std::lock_guard lock(impl_->attempt_mu);
    return impl_->last_attempt;
}

std::size_t OutboundQueue::clear() {
    std::size_t n = 0;
    impl_->on_writer([&] {
        auto items = impl_->load();
        for (const auto& item : items) {
            impl_->store.remove(RecordKind::QueueItem, std::to_string(item.seq));
        }
        impl_->store.save();
        n = items.size();
    });
    if (n > 0) SPDLOG_WARN("dropped {} pending outbound events", n);
    return n;
}

} // namespace repsync

// ── merge.cpp ───────────────────────────────────────────────────
namespace repsync {

namespace {

std::optional<std::string> validate(const ProgramTemplate& t) {
    if (t.id.empty()) return "missing id";
    if (t.name.empty()) return "missing name";
    if (t.owner_id.empty()) return "missing owner";
    if (t.day_of_week && (*t.day_of_week < 1 || *t.day_of_week > 7)) {
        return "day of week " + std::to_string(*t.day_of_week) + " out of range";
    }
    return std::nullopt;
}

std::optional<std::string> validate(const TemplateExercise& e) {
    if (e.id.empty()) return "missing id";
    if (e.template_id.empty()) return "missing template reference";
    if (e.name.empty()) return "missing name";
    if (e.order_index < 0) return "negative order index";
    if (e.target_sets < 1) return "target sets must be at least 1";
    return std::nullopt;
}

std::optional<std::string> validate(const ExerciseLogEntry& e) {
    if (e.id.empty()) return "missing id";
    if (e.session_id.empty()) return "missing session reference";
    if (e.exercise_order_index < 0) return "negative exercise index";
    if (e.set_number < 1) return "set number must be at least 1";
    return std::nullopt;
}

} // namespace

MergeReport& MergeReport::operator+=(const MergeReport& o) {
    applied += o.applied;
    unchanged += o.unchanged;
    skipped += o.skipped;
    diagnostics.insert(diagnostics.end(), o.diagnostics.begin(), o.diagnostics.end());
    return *this;
}

MergeEngine::MergeEngine(RecordStore& store, MergeConfig config)
    : store_(store), config_(std::move(config)) {}

void MergeEngine::skip(RecordKind kind, const Id& id, std::string reason,
                       MergeReport& report) {
    SPDLOG_WARN("merge: skipping {} '{}': {}", kind_name(kind), id, reason);
    MergeDiagnostic d{kind, id, std::move(reason)};
    if (config_.on_merge_error) config_.on_merge_error(d);
    report.diagnostics.push_back(std::move(d));
    ++report.skipped;
}

void MergeEngine::upsert_exercise(const TemplateExercise& ex, MergeReport& report) {
    if (auto why = validate(ex)) {
        skip(RecordKind::TemplateExercise, ex.id, *why, report);
        return;
    }
    auto existing = get_as<TemplateExercise>(store_, RecordKind::TemplateExercise, ex.id);
    if (existing && *existing == ex) {
        ++report.unchanged;
        return;
    }
    store_.put(ex);
    ++report.applied;
}

MergeReport MergeEngine::apply_template_batch(const std::vector<ProgramTemplate>& templates) {
    MergeReport report;
    for (const auto& t : templates) {
        if (auto why = validate(t)) {
            skip(RecordKind::Template, t.id, *why, report);
            continue;
        }

        ProgramTemplate row = t;
        row.exercises.clear();
        auto existing = get_as<ProgramTemplate>(store_, RecordKind::Template, t.id);
        if (existing && *existing == row) {
            ++report.unchanged;
        } else {
            store_.put(row);
            ++report.applied;
        }

        for (auto ex : t.exercises) {
            if (ex.template_id.empty()) ex.template_id = t.id;
            if (ex.template_id != t.id) {
                skip(RecordKind::TemplateExercise, ex.id,
                     "listed under template " + t.id + " but references " +
                     ex.template_id, report);
                continue;
            }
            upsert_exercise(ex, report);
        }
    }
    store_.save();
    SPDLOG_INFO("merged {} templates: {} applied, {} unchanged, {} skipped",
                templates.size(), report.applied, report.unchanged, report.skipped);
    return report;
}

MergeReport MergeEngine::apply_exercise_update(const TemplateExercise& exercise) {
    MergeReport report;
    upsert_exercise(exercise, report);
    store_.save();
    return report;
}

MergeReport MergeEngine::apply_workout_start(const WorkoutStartMsg& msg) {
    MergeReport report;
    if (msg.session_id.empty()) {
        skip(RecordKind::Session, msg.session_id, "missing session id", report);
        return report;
    }

    if (auto existing = get_as<WorkoutSession>(store_, RecordKind::Session, msg.session_id)) {
        // A set or completion may have arrived first and left a placeholder.
        // The start event owns the template and start time; status stays.
        auto s = *existing;
        if (!msg.template_id.empty() && !s.template_id) s.template_id = msg.template_id;
        if (s.status == SessionStatus::Active && s.last_resumed_at == s.started_at) {
            s.last_resumed_at = msg.started_at;
        }
        s.started_at = msg.started_at;
        if (s == *existing) {
            ++report.unchanged;
        } else {
            store_.put(s);
            ++report.applied;
            SPDLOG_DEBUG("merge: session '{}' adopted its start event", msg.session_id);
        }
    } else {
        WorkoutSession s;
        s.id = msg.session_id;
        s.status = SessionStatus::Active;
        if (!msg.template_id.empty()) s.template_id = msg.template_id;
        s.started_at = msg.started_at;
        s.last_resumed_at = msg.started_at;
        store_.put(s);
        ++report.applied;
    }

    if (!msg.template_id.empty() &&
        !store_.get(RecordKind::Template, msg.template_id)) {
        // Placeholder so the session's exercises have a parent to list under.
        ProgramTemplate stub;
        stub.id = msg.template_id;
        stub.name = msg.template_name.empty() ? "Workout" : msg.template_name;
        stub.updated_at = msg.started_at;
        store_.put(stub);
        ++report.applied;
    }

    const Id& parent = msg.template_id.empty() ? msg.session_id : msg.template_id;
    for (auto ex : msg.exercises) {
        if (ex.template_id.empty()) ex.template_id = parent;
        upsert_exercise(ex, report);
    }

    store_.save();
    return report;
}

MergeReport MergeEngine::apply_log_entry(const ExerciseLogEntry& entry) {
    MergeReport report;
    if (auto why = validate(entry)) {
        skip(RecordKind::LogEntry, entry.id, *why, report);
        return report;
    }

    if (auto existing = get_as<ExerciseLogEntry>(store_, RecordKind::LogEntry, entry.id)) {
        if (!(*existing == entry)) {
            SPDLOG_WARN("merge: log entry '{}' already recorded with different "
                        "values; keeping the first", entry.id);
        }
        ++report.unchanged;
        return report;
    }

    if (!store_.get(RecordKind::Session, entry.session_id)) {
        WorkoutSession s;
        s.id = entry.session_id;
        s.started_at = entry.created_at;
        s.last_resumed_at = entry.created_at;
        store_.put(s);
        SPDLOG_DEBUG("merge: created session '{}' for orphan set", entry.session_id);
    }

    store_.put(entry);
    ++report.applied;
    store_.save();
    return report;
}

MergeReport MergeEngine::apply_workout_complete(const WorkoutCompleteMsg& msg) {
    MergeReport report;
    if (msg.session_id.empty()) {
        skip(RecordKind::Session, msg.session_id, "missing session id", report);
        return report;
    }

    auto existing = get_as<WorkoutSession>(store_, RecordKind::Session, msg.session_id);
    if (existing && existing->status == SessionStatus::Completed) {
        ++report.unchanged;
        return report;
    }

    WorkoutSession s;
    if (existing) {
        s = *existing;
    } else {
        s.id = msg.session_id;
        s.started_at = msg.completed_at;
    }
    s.status = SessionStatus::Completed;
    s.completed_at = msg.completed_at;
    s.last_resumed_at.reset();
    s.active_seconds = std::max(s.active_seconds, msg.active_seconds);
    store_.put(s);
    ++report.applied;
    store_.save();
    return report;
}

std::vector<ProgramTemplate> MergeEngine::catalog() {
    auto templates = query_as<ProgramTemplate>(store_, RecordKind::Template);
    for (auto& t : templates) t.exercises = exercises_of(t.id);
    return templates;
}

std::vector<TemplateExercise> MergeEngine::exercises_of(const Id& parent) {
    Query q;
    q.parent = parent;
    return query_as<TemplateExercise>(store_, RecordKind::TemplateExercise, q);
}

} // namespace repsync

// ── resume.cpp ──────────────────────────────────────────────────
namespace repsync {

ResumePoint resume_point(const WorkoutSession& session,
                         const std::vector<TemplateExercise>& exercises,
                         const std::vector<ExerciseLogEntry>& log) {
    const auto count = static_cast<std::int32_t>(exercises.size());
    ResumePoint p;

    if (session.status == SessionStatus::Completed) {
        p.exercise_index = count;
        p.fully_logged = true;
        return p;
    }

    if (!log.empty()) {
        const auto& last = log.back();
        p.exercise_index = last.exercise_order_index;
        p.set_index = last.set_number;
        if (p.exercise_index >= 0 && p.exercise_index < count &&
            p.set_index >= exercises[static_cast<std::size_t>(p.exercise_index)].target_sets) {
            ++p.exercise_index;
            p.set_index = 0;
        }
    }

    p.fully_logged = p.exercise_index < 0 || p.exercise_index >= count;
    return p;
}

} // namespace repsync

// ── engine_core.cpp ─────────────────────────────────────────────
namespace repsync::detail {

struct CoreOptions {
    const char* role;
    std::chrono::milliseconds send_timeout;
    Clock clock;
    bool auto_flush;
    MergeConfig merge;
};

/// State and threads shared by both device roles.
///
/// `writer` is the only context that touches the store. `sender` runs every
/// network send and hops to `writer` for store work; writer tasks never
/// wait on the network or on `sender`.
class EngineCore {
public:
    using Handler = std::function<Reply(const Event&, Delivery)>;

    EngineCore(RecordStore& s, Transport& t, CoreOptions options)
        : store(s),
          transport(t),
          role(options.role),
          send_timeout(options.send_timeout),
          clock(std::move(options.clock)),
          auto_flush(options.auto_flush),
          merge(s, std::move(options.merge)),
          queue(s, t, QueueConfig{
              options.send_timeout, clock, nullptr,
              [this](const std::function<void()>& fn) { on_writer(fn); }}),
          monitor([this] { if (auto_flush) schedule_flush(); }) {}

    ~EngineCore() {
        stopping = true;
        transport.set_inbound_handler(nullptr);
        transport.set_reachability_handler(nullptr);
        drain();
    }

    EngineCore(const EngineCore&) = delete;
    EngineCore& operator=(const EngineCore&) = delete;

    /// Install the role's event handler and start watching reachability.
    void attach(Handler handler) {
        transport.set_inbound_handler(
            [this, handler = std::move(handler)](const Event& event, Delivery how) {
                return writer.submit([this, handler, event, how]() -> Reply {
                    if (how == Delivery::Immediate) return handler(event, how);
                    // Nobody waits on a deferred event's future.
                    try {
                        return handler(event, how);
                    } catch (const std::exception& e) {
                        SPDLOG_ERROR("{}: deferred {} rejected: {}", role,
                                     event_name(event), e.what());
                        throw;
                    }
                });
            });
        transport.set_reachability_handler([this](bool up) {
            if (stopping) return;
            writer.post([this, up] { monitor.update(up); });
        });

        if (transport.activation_state() == ActivationState::NotActivated) {
            transport.activate();
        }
        if (transport.activation_state() != ActivationState::Activated) {
            SPDLOG_WARN("{}: transport not activated; events will queue", role);
        }
        writer.post([this] { monitor.update(transport.is_reachable()); });
    }

    Timestamp now() const { return clock ? clock() : now_ms(); }

    /// Run `fn` on the writer and return its result.
    template <typename F>
    auto on_writer(F&& fn) -> std::invoke_result_t<F&> {
        if (writer.on_worker_thread()) return fn();
        return writer.submit(std::forward<F>(fn)).get();
    }

    template <typename F>
    auto on_sender(F&& fn) -> std::invoke_result_t<F&> {
        if (sender.on_worker_thread()) return fn();
        return sender.submit(std::forward<F>(fn)).get();
    }

    /// Deliver `event` on the sender: immediately if the peer is reachable,
    /// otherwise (or on failure) into the outbound queue.
    void send(Event event) {
        if (stopping) {
            SPDLOG_ERROR("{}: dropping {} during shutdown", role, event_name(event));
            return;
        }
        sender.post([this, event = std::move(event)] { deliver(event); });
    }

    bool deliver(const Event& event) {
        if (transport.is_reachable()) {
            auto r = transport.send_immediate(event, send_timeout);
            if (r.ok()) {
                SPDLOG_DEBUG("{}: {} delivered", role, event_name(event));
                return true;
            }
            SPDLOG_INFO("{}: {} not delivered ({}: {}); queueing", role,
                        event_name(event), error_code_name(r.code), r.detail);
        }
        queue.enqueue(event);
        return false;
    }

    void schedule_flush() {
        if (stopping || flush_scheduled.exchange(true)) return;
        sender.post([this] {
            flush_scheduled = false;
            queue.flush();
        });
    }

    void drain() {
        do {
            sender.drain();
            writer.drain();
        } while (!sender.idle() || !writer.idle());
    }

    /// Mark a session completed locally, accumulating the open interval.
    /// Returns the event to announce, or nullopt if it was already completed.
    std::optional<WorkoutCompleteMsg> complete_locally(const Id& session_id) {
        auto s = get_as<WorkoutSession>(store, RecordKind::Session, session_id);
        if (!s) throw Error(ErrorCode::NotFound, "no session " + session_id);
        if (s->status == SessionStatus::Completed) return std::nullopt;

        auto t = now();
        if (s->last_resumed_at) s->active_seconds += (t - *s->last_resumed_at) / 1000;
        s->last_resumed_at.reset();
        s->status = SessionStatus::Completed;
        s->completed_at = t;
        store.put(*s);
        store.save();
        SPDLOG_INFO("{}: session {} completed ({} s active)", role,
                    session_id, s->active_seconds);
        return WorkoutCompleteMsg{session_id, t, s->active_seconds};
    }

    /// Most recently started session that is still active.
    std::optional<WorkoutSession> active_session() {
        auto sessions = query_as<WorkoutSession>(store, RecordKind::Session);
        for (auto it = sessions.rbegin(); it != sessions.rend(); ++it) {
            if (it->status == SessionStatus::Active) return *it;
        }
        return std::nullopt;
    }

    std::vector<ExerciseLogEntry> session_log(const Id& session_id) {
        Query q;
        q.parent = session_id;
        return query_as<ExerciseLogEntry>(store, RecordKind::LogEntry, q);
    }

    std::vector<TemplateExercise> session_exercises(const WorkoutSession& s) {
        return merge.exercises_of(s.template_id.value_or(s.id));
    }

    WorkoutStartMsg start_message(const WorkoutSession& s) {
        WorkoutStartMsg m;
        m.session_id = s.id;
        m.template_id = s.template_id.value_or("");
        if (s.template_id) {
            if (auto t = get_as<ProgramTemplate>(store, RecordKind::Template, *s.template_id)) {
                m.template_name = t->name;
            }
        }
        m.started_at = s.started_at;
        m.exercises = session_exercises(s);
        return m;
    }

    /// New active session from a stored template.
    std::pair<WorkoutSession, WorkoutStartMsg> start_from_template(const Id& template_id) {
        if (!store.get(RecordKind::Template, template_id)) {
            throw Error(ErrorCode::NotFound, "no template " + template_id);
        }
        WorkoutSession s;
        s.id = generate_id();
        s.template_id = template_id;
        s.started_at = now();
        s.last_resumed_at = s.started_at;
        store.put(s);
        store.save();
        SPDLOG_INFO("{}: started session {} from template {}", role, s.id, template_id);
        return {s, start_message(s)};
    }

    RecordStore& store;
    Transport&   transport;
    std::string  role;
    std::chrono::milliseconds send_timeout;
    Clock        clock;
    bool         auto_flush;

    MergeEngine         merge;
    OutboundQueue       queue;
    ReachabilityMonitor monitor;
    std::atomic<bool>   flush_scheduled{false};
    std::atomic<bool>   stopping{false};

    // Declared last: destroyed (and joined) before the state they use.
    SerialExecutor writer;
    SerialExecutor sender;
};

} // namespace repsync::detail

// ── primary.cpp ─────────────────────────────────────────────────
namespace repsync {

struct Primary::Impl {
    PrimaryConfig      config;
    detail::EngineCore core;

    Impl(RecordStore& store, Transport& transport, PrimaryConfig c)
        : config(std::move(c)),
          core(store, transport, detail::CoreOptions{
              "primary", config.send_timeout, config.clock,
              config.auto_flush, MergeConfig{config.on_merge_error}}) {}

    /// Push the catalog. Runs on the sender.
    bool publish() {
        auto templates = core.on_writer([&] { return core.merge.catalog(); });
        Event event = ProgramSyncMsg{std::move(templates)};
        if (core.transport.is_reachable()) {
            auto r = core.transport.send_immediate(event, core.send_timeout);
            if (r.ok()) {
                SPDLOG_INFO("primary: catalog pushed");
                return true;
            }
            SPDLOG_INFO("primary: catalog push failed ({}: {}); deferring",
                        error_code_name(r.code), r.detail);
        }
        core.transport.send_deferred(event);
        return false;
    }

    /// Apply one inbound event. Runs on the writer.
    Reply handle(const Event& event, Delivery how) {
        return std::visit([&](const auto& m) -> Reply {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, WorkoutUpdateMsg>) {
                ExerciseLogEntry e;
                e.id = m.entry_id;
                e.session_id = m.session_id;
                e.exercise_name = m.exercise_name;
                e.exercise_order_index = m.exercise_order_index;
                e.set_number = m.set_number;
                e.weight = m.weight;
                e.reps = m.reps;
                e.created_at = m.timestamp;
                auto report = core.merge.apply_log_entry(e);
                if (report.applied > 0 && config.on_set_logged) config.on_set_logged(e);
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, WorkoutStartMsg>) {
                // Templates are ours; only adopt the session.
                WorkoutStartMsg session_only = m;
                session_only.exercises.clear();
                core.merge.apply_workout_start(session_only);
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, WorkoutCompleteMsg>) {
                auto report = core.merge.apply_workout_complete(m);
                if (report.applied > 0 && config.on_session_completed) {
                    config.on_session_completed(m.session_id);
                }
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, FetchProgramMsg>) {
                if (how == Delivery::Immediate) {
                    return ProgramSyncMsg{core.merge.catalog()};
                }
                if (!core.stopping) core.sender.post([this] { publish(); });
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, RequestSyncMsg>) {
                core.schedule_flush();
                auto active = core.active_session();
                if (!active) return std::nullopt;
                auto start = core.start_message(*active);
                if (how == Delivery::Immediate) return start;
                core.send(std::move(start));
                return std::nullopt;
            }
            else {
                throw Error(ErrorCode::InvalidState,
                            std::string("primary does not accept ") + event_name(event));
            }
        }, event);
    }
};

Primary::Primary(RecordStore& store, Transport& transport, PrimaryConfig config)
    : impl_(std::make_unique<Impl>(store, transport, std::move(config))) {
    impl_->core.attach([impl = impl_.get()](const Event& event, Delivery how) {
        return impl->handle(event, how);
    });
}

Primary::~Primary() = default;

MergeReport Primary::save_template(const ProgramTemplate& tmpl) {
    auto report = impl_->core.on_writer([&] {
        return impl_->core.merge.apply_template_batch({tmpl});
    });
    if (report.skipped > 0) {
        throw Error(ErrorCode::MergeError, report.diagnostics.front().reason);
    }
    return report;
}

MergeReport Primary::update_exercise(const TemplateExercise& exercise) {
    auto report = impl_->core.on_writer([&] {
        return impl_->core.merge.apply_exercise_update(exercise);
    });
    if (report.skipped > 0) {
        throw Error(ErrorCode::MergeError, report.diagnostics.front().reason);
    }
    if (report.applied > 0) impl_->core.send(ExerciseUpdateMsg{exercise});
    return report;
}

bool Primary::publish_templates() {
    return impl_->core.on_sender([&] { return impl_->publish(); });
}

WorkoutSession Primary::start_workout(const Id& template_id) {
    auto [session, start] = impl_->core.on_writer([&] {
        return impl_->core.start_from_template(template_id);
    });
    impl_->core.send(std::move(start));
    return session;
}

bool Primary::finish_workout(const Id& session_id) {
    auto done = impl_->core.on_writer([&] {
        return impl_->core.complete_locally(session_id);
    });
    if (!done) return false;
    impl_->core.send(*done);
    return true;
}

std::vector<ProgramTemplate> Primary::catalog() {
    return impl_->core.on_writer([&] { return impl_->core.merge.catalog(); });
}

std::optional<WorkoutSession> Primary::session(const Id& session_id) {
    return impl_->core.on_writer([&] {
        return get_as<WorkoutSession>(impl_->core.store, RecordKind::Session, session_id);
    });
}

std::optional<WorkoutSession> Primary::active_session() {
    return impl_->core.on_writer([&] { return impl_->core.active_session(); });
}

std::vector<ExerciseLogEntry> Primary::session_log(const Id& session_id) {
    return impl_->core.on_writer([&] { return impl_->core.session_log(session_id); });
}

FlushReport Primary::flush() {
    return impl_->core.queue.flush();
}

std::size_t Primary::pending_count() {
    return impl_->core.queue.size();
}

void Primary::drain() {
    impl_->core.drain();
}

Reply Primary::handle_event(const Event& event, Delivery how) {
    return impl_->core.on_writer([&] { return impl_->handle(event, how); });
}

} // namespace repsync

// ── companion.cpp ───────────────────────────────────────────────
namespace repsync {

struct Companion::Impl {
    CompanionConfig    config;
    detail::EngineCore core;

    Impl(RecordStore& store, Transport& transport, CompanionConfig c)
        : config(std::move(c)),
          core(store, transport, detail::CoreOptions{
              "companion", config.send_timeout, config.clock,
              config.auto_flush, MergeConfig{config.on_merge_error}}) {}

    WorkoutSession require_session(const Id& session_id) {
        auto s = get_as<WorkoutSession>(core.store, RecordKind::Session, session_id);
        if (!s) throw Error(ErrorCode::NotFound, "no session " + session_id);
        return *s;
    }

    /// Resume point of `s`; reports completable sessions. Runs on the writer.
    ResumePoint check_resume(const WorkoutSession& s) {
        auto exercises = core.session_exercises(s);
        auto p = resume_point(s, exercises, core.session_log(s.id));
        // Without exercises (start event not here yet) there is nothing to complete.
        if (p.fully_logged && s.status == SessionStatus::Active && !exercises.empty()) {
            SPDLOG_DEBUG("companion: session {} fully logged", s.id);
            if (config.on_completable) config.on_completable(s.id);
        }
        return p;
    }

    void apply_templates(const ProgramSyncMsg& m) {
        auto report = core.merge.apply_template_batch(m.templates);
        if (config.on_templates_synced) config.on_templates_synced(report);
    }

    void apply_start(const WorkoutStartMsg& m) {
        bool known = core.store.get(RecordKind::Session, m.session_id).has_value();
        core.merge.apply_workout_start(m);
        if (known || !config.on_session_started) return;
        if (auto s = get_as<WorkoutSession>(core.store, RecordKind::Session, m.session_id)) {
            config.on_session_started(*s);
        }
    }

    /// Apply one inbound event. Runs on the writer.
    Reply handle(const Event& event, Delivery) {
        return std::visit([&](const auto& m) -> Reply {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, ProgramSyncMsg>) {
                apply_templates(m);
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, ExerciseUpdateMsg>) {
                core.merge.apply_exercise_update(m.exercise);
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, WorkoutStartMsg>) {
                apply_start(m);
                return std::nullopt;
            }
            else if constexpr (std::is_same_v<T, WorkoutCompleteMsg>) {
                core.merge.apply_workout_complete(m);
                return std::nullopt;
            }
            else {
                throw Error(ErrorCode::InvalidState,
                            std::string("companion does not accept ") + event_name(event));
            }
        }, event);
    }
};

Companion::Companion(RecordStore& store, Transport& transport, CompanionConfig config)
    : impl_(std::make_unique<Impl>(store, transport, std::move(config))) {
    impl_->core.attach([impl = impl_.get()](const Event& event, Delivery how) {
        return impl->handle(event, how);
    });
}

Companion::~Companion() = default;

ExerciseLogEntry Companion::log_set(const Id& session_id,
                                    const std::string& exercise_name,
                                    std::int32_t exercise_order_index,
                                    std::int32_t set_number,
                                    std::int32_t reps,
                                    double weight) {
    auto& core = impl_->core;
    auto entry = core.on_writer([&] {
        if (exercise_order_index < 0 || set_number < 1) {
            throw Error(ErrorCode::InvalidState,
                        "invalid set position " + std::to_string(exercise_order_index) +
                        "/" + std::to_string(set_number));
        }

        auto t = core.now();
        auto s = get_as<WorkoutSession>(core.store, RecordKind::Session, session_id);
        if (!s) {
            // The start event may still be in flight; log against a local session.
            WorkoutSession created;
            created.id = session_id;
            created.started_at = t;
            created.last_resumed_at = t;
            core.store.put(created);
            s = created;
        } else if (s->status == SessionStatus::Completed) {
            throw Error(ErrorCode::InvalidState, "session " + session_id + " is completed");
        }

        ExerciseLogEntry e;
        e.id = generate_id();
        e.session_id = session_id;
        e.exercise_name = exercise_name;
        e.exercise_order_index = exercise_order_index;
        e.set_number = set_number;
        e.weight = weight;
        e.reps = reps;
        e.created_at = t;
        core.store.put(e);
        core.store.save();
        SPDLOG_DEBUG("companion: logged {} set {} in session {}",
                     exercise_name, set_number, session_id);

        impl_->check_resume(*s);
        return e;
    });

    core.send(WorkoutUpdateMsg{entry.id, entry.session_id, entry.exercise_name,
                               entry.exercise_order_index, entry.set_number,
                               entry.reps, entry.weight, entry.created_at});
    return entry;
}

WorkoutSession Companion::begin_workout(const Id& template_id) {
    auto [session, start] = impl_->core.on_writer([&] {
        return impl_->core.start_from_template(template_id);
    });
    impl_->core.send(std::move(start));
    return session;
}

bool Companion::finish_workout(const Id& session_id) {
    auto done = impl_->core.on_writer([&] {
        return impl_->core.complete_locally(session_id);
    });
    if (!done) return false;
    impl_->core.send(*done);
    return true;
}

void Companion::pause_session(const Id& session_id) {
    impl_->core.on_writer([&] {
        auto s = impl_->require_session(session_id);
        if (s.status == SessionStatus::Completed) {
            throw Error(ErrorCode::InvalidState, "session " + session_id + " is completed");
        }
        if (!s.last_resumed_at) return;
        s.active_seconds += (impl_->core.now() - *s.last_resumed_at) / 1000;
        s.last_resumed_at.reset();
        impl_->core.store.put(s);
        impl_->core.store.save();
    });
}

void Companion::resume_session(const Id& session_id) {
    impl_->core.on_writer([&] {
        auto s = impl_->require_session(session_id);
        if (s.status == SessionStatus::Completed) {
            throw Error(ErrorCode::InvalidState, "session " + session_id + " is completed");
        }
        if (s.last_resumed_at) return;
        s.last_resumed_at = impl_->core.now();
        impl_->core.store.put(s);
        impl_->core.store.save();
    });
}

ResumePoint Companion::resume(const Id& session_id) {
    return impl_->core.on_writer([&] {
        return impl_->check_resume(impl_->require_session(session_id));
    });
}

std::optional<WorkoutSession> Companion::active_session() {
    return impl_->core.on_writer([&] { return impl_->core.active_session(); });
}

std::optional<WorkoutSession> Companion::session(const Id& session_id) {
    return impl_->core.on_writer([&] {
        return get_as<WorkoutSession>(impl_->core.store, RecordKind::Session, session_id);
    });
}

std::vector<ExerciseLogEntry> Companion::session_log(const Id& session_id) {
    return impl_->core.on_writer([&] { return impl_->core.session_log(session_id); });
}

std::vector<TemplateExercise> Companion::session_exercises(const Id& session_id) {
    return impl_->core.on_writer([&] {
        return impl_->core.session_exercises(impl_->require_session(session_id));
    });
}

std::vector<ProgramTemplate> Companion::templates() {
    return impl_->core.on_writer([&] { return impl_->core.merge.catalog(); });
}

bool Companion::request_program_sync() {
    auto& core = impl_->core;
    return core.on_sender([&] {
        if (core.transport.is_reachable()) {
            auto r = core.transport.send_immediate(FetchProgramMsg{}, core.send_timeout);
            if (r.ok() && r.reply && std::holds_alternative<ProgramSyncMsg>(*r.reply)) {
                const auto& sync = std::get<ProgramSyncMsg>(*r.reply);
                core.on_writer([&] { impl_->apply_templates(sync); });
                return true;
            }
            SPDLOG_INFO("companion: fetch_program not answered ({}: {}); deferring",
                        error_code_name(r.code), r.detail);
        }
        core.transport.send_deferred(FetchProgramMsg{});
        return false;
    });
}

bool Companion::request_session_sync() {
    auto& core = impl_->core;
    return core.on_sender([&] {
        if (!core.transport.is_reachable()) return false;
        auto r = core.transport.send_immediate(RequestSyncMsg{}, core.send_timeout);
        if (!r.ok()) {
            SPDLOG_INFO("companion: request_sync failed ({}: {})",
                        error_code_name(r.code), r.detail);
            return false;
        }
        if (!r.reply || !std::holds_alternative<WorkoutStartMsg>(*r.reply)) return false;
        const auto& start = std::get<WorkoutStartMsg>(*r.reply);
        core.on_writer([&] { impl_->apply_start(start); });
        return true;
    });
}

FlushReport Companion::flush() {
    return impl_->core.queue.flush();
}

std::size_t Companion::pending_count() {
    return impl_->core.queue.size();
}

std::size_t Companion::clear_pending() {
    return impl_->core.queue.clear();
}

std::optional<Timestamp> Companion::last_flush_attempt() {
    return impl_->core.queue.last_attempt_at();
}

void Companion::drain() {
    impl_->core.drain();
}

Reply Companion::handle_event(const Event& event, Delivery how) {
    return impl_->core.on_writer([&] { return impl_->handle(event, how); });
}

} // namespace repsync
