// Copyright 2026 The repsync Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace repsync {

/// Opaque, globally unique record identity (UUID string for records we mint).
using Id = std::string;

/// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

/// Position of an item in the offline outbound queue (enqueue order).
using Seq = std::int64_t;

/// A raw byte buffer (encoded event or record).
using Bytes = std::vector<std::uint8_t>;

/// Source of the current time. nullptr means the system clock.
using Clock = std::function<Timestamp()>;

/// Current system time in milliseconds since the epoch.
Timestamp now_ms();

/// Generate a random RFC 4122 version-4 UUID string.
Id generate_id();

enum class SessionStatus : std::uint8_t {
    Active    = 1,
    Completed = 2,
};

struct WorkoutSession {
    Id                       id;
    SessionStatus            status = SessionStatus::Active;
    std::optional<Id>        template_id;
    Timestamp                started_at = 0;
    std::optional<Timestamp> last_resumed_at;
    std::int64_t             active_seconds = 0;  ///< accumulated while resumed
    std::optional<Timestamp> completed_at;

    bool operator==(const WorkoutSession&) const = default;
};

/// One completed set. Append-only: never edited once written.
struct ExerciseLogEntry {
    Id           id;
    Id           session_id;
    std::string  exercise_name;
    std::int32_t exercise_order_index = 0;  ///< position in the session's exercise list
    std::int32_t set_number = 1;            ///< 1-based, per exercise
    double       weight = 0.0;
    std::int32_t reps = 0;
    bool         completed = true;
    Timestamp    created_at = 0;

    bool operator==(const ExerciseLogEntry&) const = default;
};

struct TemplateExercise {
    Id                    id;
    Id                    template_id;
    std::int32_t          order_index = 0;
    std::string           name;
    std::string           exercise_key;
    std::int32_t          target_sets = 3;
    std::string           target_reps = "8-10";
    std::optional<double> target_weight;
    std::string           notes;

    bool operator==(const TemplateExercise&) const = default;
};

struct ProgramTemplate {
    Id                            id;
    std::string                   owner_id;
    std::string                   name;
    std::optional<std::int32_t>   day_of_week;  ///< 1 = Monday ... 7 = Sunday
    Timestamp                     updated_at = 0;
    /// Ordered by order_index. Stores keep exercises as separate records;
    /// this is filled in by catalog readers and carried on the wire.
    std::vector<TemplateExercise> exercises;

    bool operator==(const ProgramTemplate&) const = default;
};

struct OutboundQueueItem {
    Seq                      seq = 0;
    std::string              event_type;
    Bytes                    payload;  ///< serialize()d Event
    Timestamp                enqueued_at = 0;
    std::int32_t             attempts = 0;
    std::optional<Timestamp> last_attempt_at;

    bool operator==(const OutboundQueueItem&) const = default;
};

/// The kinds of record a RecordStore holds.
enum class RecordKind : std::uint8_t {
    Session          = 1,
    LogEntry         = 2,
    Template         = 3,
    TemplateExercise = 4,
    QueueItem        = 5,
};

using Record = std::variant<
    WorkoutSession,
    ExerciseLogEntry,
    ProgramTemplate,
    TemplateExercise,
    OutboundQueueItem
>;

RecordKind record_kind(const Record& r);

/// Identity of a record within its kind (queue items use their sequence).
Id record_id(const Record& r);

/// Parent key used by Query::parent: session id for log entries, template
/// id for template exercises, empty for everything else.
Id record_parent(const Record& r);

const char* kind_name(RecordKind kind);

} // namespace repsync

// ── error.h ─────────────────────────────────────────────────────
namespace repsync {

/// Error codes reported by repsync operations.
enum class ErrorCode : int {
    Ok = 0,
    StoreError,        ///< The storage backend rejected an operation or commit.
    SchemaMismatch,    ///< The stored schema version differs from ours.
    StoreUnavailable,  ///< Neither storage backend could be opened.
    ProtocolError,     ///< Malformed or unexpected wire bytes.
    Unreachable,       ///< The peer cannot be reached right now.
    NotActivated,      ///< The transport session is not activated.
    Timeout,           ///< The peer did not acknowledge in time.
    PeerError,         ///< The peer failed to handle the event.
    MergeError,        ///< An incoming record is malformed.
    InvalidState,      ///< Operation not valid in the current state.
    NotFound,          ///< A referenced record does not exist.
};

const char* error_code_name(ErrorCode code);

/// Exception thrown by repsync operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace repsync

// ── protocol.h ──────────────────────────────────────────────────
namespace repsync {

inline constexpr std::uint32_t kProtocolVersion = 1;

// ── Events ──────────────────────────────────────────────────────────

/// A workout began. Carries the ordered exercise list so the receiver can
/// follow along without the full catalog.
struct WorkoutStartMsg {
    Id                            session_id;
    Id                            template_id;  ///< empty for a quick workout
    std::string                   template_name;
    Timestamp                     started_at = 0;
    std::vector<TemplateExercise> exercises;
};

/// One set was logged on the companion.
struct WorkoutUpdateMsg {
    Id           entry_id;
    Id           session_id;
    std::string  exercise_name;
    std::int32_t exercise_order_index = 0;
    std::int32_t set_number = 1;
    std::int32_t reps = 0;
    double       weight = 0.0;
    Timestamp    timestamp = 0;
};

/// A session was finalized.
struct WorkoutCompleteMsg {
    Id           session_id;
    Timestamp    completed_at = 0;
    std::int64_t active_seconds = 0;
};

/// Push of a full template batch (primary to companion).
struct ProgramSyncMsg {
    std::vector<ProgramTemplate> templates;
};

/// Pull request for the whole catalog. Answered with a ProgramSyncMsg.
struct FetchProgramMsg {};

/// Ask the primary to resend workout_start for its active session.
struct RequestSyncMsg {};

/// A single template exercise changed on the primary.
struct ExerciseUpdateMsg {
    TemplateExercise exercise;
};

using Event = std::variant<
    WorkoutStartMsg,
    WorkoutUpdateMsg,
    WorkoutCompleteMsg,
    ProgramSyncMsg,
    FetchProgramMsg,
    RequestSyncMsg,
    ExerciseUpdateMsg
>;

// ── Wire format tags ────────────────────────────────────────────────

enum class EventTag : std::uint8_t {
    WorkoutStart    = 0x01,
    WorkoutUpdate   = 0x02,
    WorkoutComplete = 0x03,
    ProgramSync     = 0x04,
    FetchProgram    = 0x05,
    RequestSync     = 0x06,
    ExerciseUpdate  = 0x07,
};

/// Wire name of an event ("workout_update", "program_sync", ...).
const char* event_name(const Event& event);

// ── Serialization ───────────────────────────────────────────────────

/// Serialize an Event to a length-prefixed byte buffer.
/// Format: [4-byte total_length LE][1-byte tag][payload...]
Bytes serialize(const Event& event);

/// Deserialize a byte buffer (including the 4-byte length prefix) into an Event.
Event deserialize(std::span<const std::uint8_t> buf);

/// Encode a record for the flat key-value backend: [1-byte kind][fields...]
Bytes encode_record(const Record& record);

/// Decode a record produced by encode_record.
Record decode_record(std::span<const std::uint8_t> buf);

} // namespace repsync

// ── store.h ─────────────────────────────────────────────────────
namespace repsync {

using RecordFilter = std::function<bool(const Record&)>;

struct Query {
    /// Restrict to children of this parent (see record_parent()).
    std::optional<Id> parent;
    /// Optional predicate applied to each candidate.
    RecordFilter where = nullptr;
};

enum class StoreBackend : std::uint8_t {
    Sqlite   = 1,
    KeyValue = 2,
};

/// Local persistent storage for one device.
///
/// Not thread-safe: a store has a single writer. Mutations open a
/// transaction on first use; save() commits it. Writes that are never
/// saved are rolled back when the store is destroyed.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /// Insert or replace by (kind, id).
    virtual void put(const Record& record) = 0;

    virtual std::optional<Record> get(RecordKind kind, const Id& id) = 0;

    /// Records of one kind in their natural order: log entries by creation
    /// time, template exercises by order index, queue items by sequence,
    /// sessions by start time, templates by (day of week, name).
    virtual std::vector<Record> query(RecordKind kind, const Query& q = {}) = 0;

    virtual void remove(RecordKind kind, const Id& id) = 0;

    /// Commit pending writes. Throws Error(StoreError) if the medium
    /// rejects the commit.
    virtual void save() = 0;

    virtual StoreBackend backend() const = 0;
};

/// Structured backend on SQLite.
class SqliteStore : public RecordStore {
public:
    /// Opens (creating if needed) the database at `path`.
    /// Throws Error(StoreError) or Error(SchemaMismatch).
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    void put(const Record& record) override;
    std::optional<Record> get(RecordKind kind, const Id& id) override;
    std::vector<Record> query(RecordKind kind, const Query& q = {}) override;
    void remove(RecordKind kind, const Id& id) override;
    void save() override;
    StoreBackend backend() const override { return StoreBackend::Sqlite; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Flat key-value backend: exact-key lookups only, written atomically to a
/// single file on save().
class KeyValueStore : public RecordStore {
public:
    /// Loads `path` if it exists. Throws Error(StoreError) if the file is
    /// corrupt or cannot be written.
    explicit KeyValueStore(const std::string& path);
    ~KeyValueStore() override;

    KeyValueStore(const KeyValueStore&) = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    void put(const Record& record) override;
    std::optional<Record> get(RecordKind kind, const Id& id) override;
    std::vector<Record> query(RecordKind kind, const Query& q = {}) override;
    void remove(RecordKind kind, const Id& id) override;
    void save() override;
    StoreBackend backend() const override { return StoreBackend::KeyValue; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

struct StoreConfig {
    /// SQLite database path.
    std::string path;
    /// Key-value fallback file. Empty means `path + ".kv"`.
    std::string fallback_path;
    /// Skip the structured backend and open the fallback directly.
    bool force_fallback = false;
};

/// Open the structured store, falling back to the key-value store if it
/// fails. Throws Error(StoreUnavailable) if both fail.
std::unique_ptr<RecordStore> open_record_store(const StoreConfig& config);

// ── Typed helpers ───────────────────────────────────────────────────

template <typename T>
std::optional<T> get_as(RecordStore& store, RecordKind kind, const Id& id) {
    auto r = store.get(kind, id);
    if (!r) return std::nullopt;
    return std::get<T>(std::move(*r));
}

template <typename T>
std::vector<T> query_as(RecordStore& store, RecordKind kind, const Query& q = {}) {
    std::vector<T> out;
    for (auto& r : store.query(kind, q)) {
        out.push_back(std::get<T>(std::move(r)));
    }
    return out;
}

} // namespace repsync

// ── transport.h ─────────────────────────────────────────────────
namespace repsync {

enum class ActivationState : std::uint8_t {
    NotActivated = 0,
    Activating   = 1,
    Activated    = 2,
    Failed       = 3,
};

/// How an inbound event arrived.
enum class Delivery : std::uint8_t {
    Immediate = 1,  ///< sender is waiting; the reply is returned to it
    Deferred  = 2,  ///< store-and-forward; any reply is dropped
};

/// Optional reply payload carried by an acknowledgment.
using Reply = std::optional<Event>;

/// Outcome of send_immediate. Transport failures are values, never thrown.
struct SendResult {
    ErrorCode   code = ErrorCode::Ok;
    std::string detail;
    Reply       reply;

    bool ok() const { return code == ErrorCode::Ok; }
};

/// Handles one inbound event. The future resolves to the reply once the
/// receiver has applied the event, or holds the exception it failed with.
using InboundHandler =
    std::function<std::future<Reply>(const Event& event, Delivery how)>;

using ReachabilityHandler = std::function<void(bool reachable)>;

/// Link to the peer device.
class Transport {
public:
    virtual ~Transport() = default;

    virtual ActivationState activation_state() const = 0;
    virtual void activate() = 0;

    /// Peer is currently connectable.
    virtual bool is_reachable() const = 0;

    /// Deliver now and wait for the acknowledgment, at most `timeout`.
    virtual SendResult send_immediate(const Event& event,
                                      std::chrono::milliseconds timeout) = 0;

    /// Hand off for delivery whenever the peer is next reachable. Always
    /// accepted; no acknowledgment and no ordering guarantee.
    virtual void send_deferred(const Event& event) = 0;

    virtual void set_inbound_handler(InboundHandler handler) = 0;
    virtual void set_reachability_handler(ReachabilityHandler handler) = 0;
};

/// An in-process pair of connected transports. Events cross the link in
/// their serialized form.
class MemoryLink {
public:
    enum class Side : std::uint8_t { Primary = 0, Companion = 1 };

    MemoryLink();
    ~MemoryLink();

    MemoryLink(const MemoryLink&) = delete;
    MemoryLink& operator=(const MemoryLink&) = delete;

    Transport& primary_end();
    Transport& companion_end();
    Transport& end(Side side);

    /// Change reachability. Notifies both ends' reachability handlers and,
    /// when the link comes up, delivers buffered deferred events.
    void set_reachable(bool reachable);
    bool reachable() const;

    /// Make activate() on `side` end in ActivationState::Failed.
    void fail_activation(Side side, bool fail);

    /// The next `count` immediate sends from `side` fail with PeerError.
    void fail_next_sends(Side side, std::size_t count);

    /// Deliver buffered deferred events whose receiver is reachable.
    /// Returns the number delivered.
    std::size_t deliver_deferred();

    /// Deferred events buffered for delivery to `side`.
    std::size_t deferred_pending(Side to) const;

    /// Successful immediate sends originating from `side`.
    std::size_t immediate_delivered(Side from) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace repsync

// ── executor.h ──────────────────────────────────────────────────
namespace repsync {

/// Single worker thread draining a FIFO of tasks. Everything that touches
/// a device's RecordStore runs here.
class SerialExecutor {
public:
    SerialExecutor();
    /// Runs the tasks already queued, then joins the worker.
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /// Queue a task. Exceptions escaping it are logged.
    void post(std::function<void()> task);

    /// Queue a task and get its result (or exception) through a future.
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        post([task] { (*task)(); });
        return fut;
    }

    /// Block until no task is queued or running. Not callable from a task.
    void drain();

    /// No task is queued or running.
    bool idle() const;

    bool on_worker_thread() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace repsync

// ── reachability.h ──────────────────────────────────────────────
namespace repsync {

/// Turns a stream of online/offline observations into a single-fire
/// "became reachable" signal.
class ReachabilityMonitor {
public:
    explicit ReachabilityMonitor(std::function<void()> on_reachable);

    /// Record an observation. Fires on_reachable only on an offline to
    /// online transition; returns true if it fired.
    bool update(bool online);

    bool online() const { return online_.load(); }

private:
    std::function<void()> on_reachable_;
    std::atomic<bool>     online_{false};
};

} // namespace repsync

// ── queue.h ─────────────────────────────────────────────────────
namespace repsync {

struct QueueConfig {
    /// Bound on each send_immediate attempt.
    std::chrono::milliseconds send_timeout{2000};
    Clock clock = nullptr;
    /// Called after an item is acknowledged and removed.
    std::function<void(Seq, const Event&)> on_delivered = nullptr;
    /// Runs store work on the store's single writer and waits for it.
    /// nullptr runs it inline on the calling thread.
    std::function<void(const std::function<void()>&)> writer = nullptr;
};

struct FlushReport {
    bool        busy = false;    ///< another flush was running; nothing done
    std::size_t attempted = 0;
    std::size_t delivered = 0;
    std::size_t failed = 0;      ///< sends that failed (items stay pending)
    std::size_t undecodable = 0; ///< payloads that could not be decoded
    std::size_t remaining = 0;   ///< items still pending after the pass
};

/// Durable, ordered list of not-yet-acknowledged outbound events.
///
/// Does NOT own the store or transport. Store access goes through
/// QueueConfig::writer; sends happen on the thread calling flush(), which
/// is guarded against concurrent entry.
class OutboundQueue {
public:
    OutboundQueue(RecordStore& store, Transport& transport, QueueConfig config = {});
    ~OutboundQueue();

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    /// Persist an event at the back of the queue. Never touches the network.
    Seq enqueue(const Event& event);

    /// Attempt every pending item in enqueue order. An item is removed only
    /// when acknowledged; failures stay pending and the pass continues.
    FlushReport flush();

    std::vector<OutboundQueueItem> pending();
    std::size_t size();

    /// Time of the most recent send attempt, if any.
    std::optional<Timestamp> last_attempt_at() const;

    /// Drop every pending item. Returns how many were dropped.
    std::size_t clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace repsync

// ── merge.h ─────────────────────────────────────────────────────
namespace repsync {

struct MergeDiagnostic {
    RecordKind  kind;
    Id          id;      ///< may be empty when the identity itself is missing
    std::string reason;
};

struct MergeReport {
    std::size_t applied = 0;    ///< inserted or modified
    std::size_t unchanged = 0;  ///< already stored with identical values
    std::size_t skipped = 0;    ///< malformed, see diagnostics
    std::vector<MergeDiagnostic> diagnostics;

    MergeReport& operator+=(const MergeReport& o);
};

struct MergeConfig {
    /// Called once per skipped record.
    std::function<void(const MergeDiagnostic&)> on_merge_error = nullptr;
};

/// Applies incoming records to a RecordStore by stable identity.
///
/// Templates and template exercises are upserted (last writer by arrival
/// wins). Log entries are append-only: insert if absent, never modified.
/// Session status only moves forward. Each apply_* call commits once.
class MergeEngine {
public:
    explicit MergeEngine(RecordStore& store, MergeConfig config = {});

    MergeReport apply_template_batch(const std::vector<ProgramTemplate>& templates);
    MergeReport apply_exercise_update(const TemplateExercise& exercise);
    MergeReport apply_workout_start(const WorkoutStartMsg& msg);
    MergeReport apply_log_entry(const ExerciseLogEntry& entry);
    MergeReport apply_workout_complete(const WorkoutCompleteMsg& msg);

    /// All templates with their exercises, in natural order.
    std::vector<ProgramTemplate> catalog();

    /// Exercises under a template (or quick-workout session) by order index.
    std::vector<TemplateExercise> exercises_of(const Id& parent);

private:
    void upsert_exercise(const TemplateExercise& ex, MergeReport& report);
    void skip(RecordKind kind, const Id& id, std::string reason, MergeReport& report);

    RecordStore& store_;
    MergeConfig  config_;
};

} // namespace repsync

// ── resume.h ────────────────────────────────────────────────────
namespace repsync {

struct ResumePoint {
    std::int32_t exercise_index = 0;  ///< position in the ordered exercise list
    std::int32_t set_index = 0;       ///< 0-based; the next set is set_index + 1
    /// Every exercise has been logged (or the session is completed). While
    /// the session is still active this is a prompt to complete it.
    bool fully_logged = false;

    bool operator==(const ResumePoint&) const = default;
};

/// Where to continue `session`, derived from its log alone.
/// `log` must be in creation order; `exercises` in order-index order.
ResumePoint resume_point(const WorkoutSession& session,
                         const std::vector<TemplateExercise>& exercises,
                         const std::vector<ExerciseLogEntry>& log);

} // namespace repsync

// ── primary.h ───────────────────────────────────────────────────
namespace repsync {

struct PrimaryConfig {
    std::chrono::milliseconds send_timeout{2000};
    Clock clock = nullptr;
    /// Flush the outbound queue whenever the link comes back.
    bool auto_flush = true;

    std::function<void(const MergeDiagnostic&)> on_merge_error = nullptr;
    /// A set logged on the companion arrived for the first time.
    std::function<void(const ExerciseLogEntry&)> on_set_logged = nullptr;
    std::function<void(const Id& session_id)> on_session_completed = nullptr;
};

/// The device that owns program templates and long-term history (phone).
///
/// Does NOT own the store or transport; both must outlive the Primary.
/// Every store access runs on an internal serial executor.
class Primary {
public:
    Primary(RecordStore& store, Transport& transport, PrimaryConfig config = {});
    ~Primary();

    Primary(const Primary&) = delete;
    Primary& operator=(const Primary&) = delete;

    /// Apply a locally created or edited template. Throws Error(MergeError)
    /// if it is malformed. Does not push; see publish_templates().
    MergeReport save_template(const ProgramTemplate& tmpl);

    /// Apply a local edit of one exercise and push it to the companion.
    MergeReport update_exercise(const TemplateExercise& exercise);

    /// Push the whole catalog: immediately when reachable, otherwise (or on
    /// failure) through the store-and-forward channel. Returns true if it
    /// was acknowledged immediately.
    bool publish_templates();

    /// Start a workout from a template and announce it to the companion.
    /// Throws Error(NotFound) if the template is unknown.
    WorkoutSession start_workout(const Id& template_id);

    /// Complete a session. Returns false if it was already completed.
    bool finish_workout(const Id& session_id);

    std::vector<ProgramTemplate> catalog();
    std::optional<WorkoutSession> session(const Id& session_id);
    std::optional<WorkoutSession> active_session();
    std::vector<ExerciseLogEntry> session_log(const Id& session_id);

    FlushReport flush();
    std::size_t pending_count();

    /// Wait until every queued task has run.
    void drain();

    /// Process an inbound event as the link would (used for replay/tests).
    Reply handle_event(const Event& event, Delivery how = Delivery::Immediate);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace repsync

// ── companion.h ─────────────────────────────────────────────────
namespace repsync {

struct CompanionConfig {
    std::chrono::milliseconds send_timeout{2000};
    Clock clock = nullptr;
    /// Flush the outbound queue whenever the link comes back. false leaves
    /// items pending until flush() is called.
    bool auto_flush = true;

    std::function<void(const MergeDiagnostic&)> on_merge_error = nullptr;
    std::function<void(const WorkoutSession&)> on_session_started = nullptr;
    std::function<void(const MergeReport&)> on_templates_synced = nullptr;
    /// Every exercise of an active session has been logged.
    std::function<void(const Id& session_id)> on_completable = nullptr;
};

/// The device that owns live set logging during a workout (watch).
///
/// Does NOT own the store or transport; both must outlive the Companion.
/// Every store access runs on an internal serial executor.
class Companion {
public:
    Companion(RecordStore& store, Transport& transport, CompanionConfig config = {});
    ~Companion();

    Companion(const Companion&) = delete;
    Companion& operator=(const Companion&) = delete;

    /// Record a completed set. The entry is committed locally before this
    /// returns; delivery to the primary (or queueing) follows on the
    /// executor. Throws Error(InvalidState) if the session is completed.
    ExerciseLogEntry log_set(const Id& session_id,
                             const std::string& exercise_name,
                             std::int32_t exercise_order_index,
                             std::int32_t set_number,
                             std::int32_t reps,
                             double weight);

    /// Start a workout on the companion from a locally known template.
    /// Throws Error(NotFound) if the template is unknown.
    WorkoutSession begin_workout(const Id& template_id);

    /// Complete a session. Returns false if it was already completed.
    bool finish_workout(const Id& session_id);

    /// Timer bookkeeping: pause accumulates the resumed interval.
    void pause_session(const Id& session_id);
    void resume_session(const Id& session_id);

    /// Where to continue, from the local log alone. Throws Error(NotFound).
    ResumePoint resume(const Id& session_id);

    std::optional<WorkoutSession> active_session();
    std::optional<WorkoutSession> session(const Id& session_id);
    std::vector<ExerciseLogEntry> session_log(const Id& session_id);
    std::vector<TemplateExercise> session_exercises(const Id& session_id);
    std::vector<ProgramTemplate> templates();

    /// Ask the primary for its catalog. Returns true if it was received and
    /// applied immediately; otherwise the request went store-and-forward.
    bool request_program_sync();

    /// Ask the primary to resend its active workout. Returns true if a
    /// workout_start came back and was applied.
    bool request_session_sync();

    FlushReport flush();
    std::size_t pending_count();
    std::size_t clear_pending();
    std::optional<Timestamp> last_flush_attempt();

    /// Wait until every queued task has run.
    void drain();

    /// Process an inbound event as the link would (used for replay/tests).
    Reply handle_event(const Event& event, Delivery how = Delivery::Immediate);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace repsync
