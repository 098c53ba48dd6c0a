/*
===============================================================================
 session::Store Unit Tests
===============================================================================

Covered Requirements:
---------------------
S1. Snapshots are immutable; every effective write publishes a new one
S2. toggle_set_complete twice restores the original state
S3. reorder_set(a, b) then reorder_set(b, a) restores the order
S4. Full sync replaces the state wholesale (last sync wins)
S5. Participant join is deduplicated, leave of an absent id is a no-op
S6. set_add ordering and duplicates
S7. exercise_update set_order renumbers 1..N
S8. Writes without an active session are ignored
S9. Model helpers, colors and unit conversions
S10. Server events equal to the current value are no-ops
S11. Snapshot reads on other threads never see a torn state
===============================================================================
*/

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "repsync/core/session/store.hpp"
#include "repsync/core/session/helper.hpp"
#include "repsync/core/session/colors.hpp"
#include "common/test_check.hpp"

using namespace repsync::core;
using namespace repsync::core::session;


namespace {

ExerciseSet make_set(std::string id, std::int64_t order, bool complete = false) {
    ExerciseSet s;
    s.id = std::move(id);
    s.order = order;
    s.complete = complete;
    s.metrics.reps = std::int64_t{10};
    return s;
}

Exercise make_exercise(std::string id, std::vector<std::string> set_ids) {
    Exercise e;
    e.id = std::move(id);
    e.meta.push_back(ExerciseMeta{"bench", "Bench Press", ExerciseType::WeightReps});
    std::int64_t order = 0;
    for (auto& sid : set_ids) {
        e.sets.push_back(make_set(std::move(sid), ++order));
    }
    return e;
}

SessionState make_state(std::int64_t version) {
    SessionState st;
    st.session_id = "sess-1";
    st.account_id = "acc-1";
    st.version = version;
    st.items.push_back(make_exercise("e1", {"s1", "s2", "s3"}));
    st.items[0].order = 1;
    return st;
}

SessionDocument make_document() {
    SessionDocument doc;
    doc.id = "sess-1";
    doc.owner_id = "acc-1";
    doc.status = SessionStatus::Active;
    return doc;
}

std::vector<std::string> set_ids(const Store& store, std::string_view exercise_id) {
    std::vector<std::string> out;
    for (const auto& s : store.state()->find_exercise(exercise_id)->sets) {
        out.push_back(s.id);
    }
    return out;
}

} // namespace


// -----------------------------------------------------------------------------
// S1: Snapshots
// -----------------------------------------------------------------------------
void test_snapshots() {
    std::cout << "[TEST] S1: snapshots are immutable, writes publish\n";
    Store store;
    TEST_CHECK(!store.active());
    TEST_CHECK(store.version() == 0);

    std::vector<std::int64_t> versions;
    (void)store.observe_state().subscribe([&](const Store::StatePtr& s) {
        versions.push_back(s ? s->version : -1);
    });

    store.load(make_document(), make_state(5));
    auto before = store.state();

    TEST_CHECK(store.toggle_set_complete("e1", "s1"));
    auto after = store.state();

    TEST_CHECK(before != after);
    TEST_CHECK(!before->items[0].sets[0].complete);
    TEST_CHECK(after->items[0].sets[0].complete);
    TEST_CHECK(after->version == 6);
    TEST_CHECK((versions == std::vector<std::int64_t>{-1, 5, 6}));

    // No-op: nothing published, version untouched
    TEST_CHECK(!store.toggle_set_complete("e1", "missing"));
    TEST_CHECK(!store.toggle_set_complete("missing", "s1"));
    TEST_CHECK(store.version() == 6);
    TEST_CHECK(versions.size() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S2: Toggle is an involution
// -----------------------------------------------------------------------------
void test_toggle_twice() {
    std::cout << "[TEST] S2: toggle twice restores the state\n";
    Store store;
    store.load(make_document(), make_state(1));
    const SessionState original = *store.state();

    TEST_CHECK(store.toggle_set_complete("e1", "s2"));
    TEST_CHECK(store.toggle_set_complete("e1", "s2"));

    SessionState now = *store.state();
    TEST_CHECK(now.version == original.version + 2);
    now.version = original.version;
    TEST_CHECK(now == original);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S3: Reorder round-trip
// -----------------------------------------------------------------------------
void test_reorder_round_trip() {
    std::cout << "[TEST] S3: reorder round-trip\n";
    Store store;
    store.load(make_document(), make_state(1));

    TEST_CHECK(store.reorder_set("e1", "s1", "s3"));
    TEST_CHECK((set_ids(store, "e1") == std::vector<std::string>{"s3", "s2", "s1"}));
    // Order fields travel with their sets until renumbered
    TEST_CHECK(store.state()->items[0].sets[0].order == 3);

    TEST_CHECK(store.reorder_set("e1", "s3", "s1"));
    TEST_CHECK((set_ids(store, "e1") == std::vector<std::string>{"s1", "s2", "s3"}));

    // Adjacent sets: same result as remove + reinsert
    TEST_CHECK(store.reorder_set("e1", "s2", "s3"));
    TEST_CHECK((set_ids(store, "e1") == std::vector<std::string>{"s1", "s3", "s2"}));

    TEST_CHECK(!store.reorder_set("e1", "s1", "s1"));
    TEST_CHECK(!store.reorder_set("e1", "s1", "missing"));

    TEST_CHECK(store.renumber_sets("e1"));
    const auto& sets = store.state()->items[0].sets;
    TEST_CHECK(sets[0].order == 1 && sets[1].order == 2 && sets[2].order == 3);
    TEST_CHECK(sets[1].id == "s3");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S4: Full sync
// -----------------------------------------------------------------------------
void test_sync_replaces() {
    std::cout << "[TEST] S4: full sync replaces the state\n";
    Store store;
    store.load(make_document(), make_state(10));

    TEST_CHECK(store.toggle_set_complete("e1", "s1"));
    TEST_CHECK(store.version() == 11);

    // The server's view wins, including a lower version
    SessionState server = make_state(9);
    server.items.push_back(make_exercise("e2", {"t1"}));
    store.apply_sync(server);

    TEST_CHECK(store.version() == 9);
    TEST_CHECK(store.state()->items.size() == 2);
    TEST_CHECK(!store.state()->items[0].sets[0].complete);
    TEST_CHECK(store.document()->id == "sess-1");

    // Sync response also replaces the document
    SessionDocument doc = make_document();
    doc.name = std::string("Leg day");
    store.apply_sync_response(doc, make_state(20));
    TEST_CHECK(store.document()->name.value() == "Leg day");
    TEST_CHECK(store.version() == 20);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S5: Participants
// -----------------------------------------------------------------------------
void test_participants() {
    std::cout << "[TEST] S5: participant join / leave / cursor\n";
    Store store;
    store.load(make_document(), make_state(1));

    TEST_CHECK(store.apply_participant_join("acc-2"));
    TEST_CHECK(!store.apply_participant_join("acc-2"));
    TEST_CHECK(store.document()->participants.size() == 1);
    TEST_CHECK(store.document()->participants[0].color == participant_color("acc-2"));
    TEST_CHECK(store.version() == 2);

    TEST_CHECK(store.apply_cursor("acc-2", Cursor{"e1", "s2"}));
    TEST_CHECK(store.document()->participants[0].cursor.value().exercise_set_id == "s2");
    TEST_CHECK(!store.apply_cursor("acc-9", Cursor{"e1", "s2"}));

    TEST_CHECK(!store.apply_participant_leave("acc-9"));
    TEST_CHECK(store.apply_participant_leave("acc-2"));
    TEST_CHECK(store.document()->participants.empty());
    TEST_CHECK(store.version() == 4);

    TEST_CHECK(store.apply_session_update(std::string("Renamed"), lcr::optional<SessionStatus>{SessionStatus::Complete}));
    TEST_CHECK(store.document()->name.value() == "Renamed");
    TEST_CHECK(store.document()->status == SessionStatus::Complete);
    TEST_CHECK(!store.apply_session_update({}, {}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S6: Sets
// -----------------------------------------------------------------------------
void test_set_events() {
    std::cout << "[TEST] S6: set add / update / delete / complete\n";
    Store store;
    store.load(make_document(), make_state(1));

    TEST_CHECK(store.apply_set_add("e1", make_set("s4", 0)));
    TEST_CHECK(store.state()->items[0].sets.back().order == 4);
    TEST_CHECK(!store.apply_set_add("e1", make_set("s4", 0)));
    TEST_CHECK(!store.apply_set_add("missing", make_set("s5", 0)));

    ExerciseSet replaced = make_set("s2", 2, true);
    replaced.type = SetType::Drop;
    replaced.metrics = Metrics{};
    replaced.metrics.weight = Weight{135.0, WeightUnit::Lb};
    TEST_CHECK(store.apply_set_update("e1", replaced));
    TEST_CHECK(*store.state()->items[0].find_set("s2") == replaced);

    TEST_CHECK(store.apply_set_complete("e1", "s1", true));
    TEST_CHECK(!store.apply_set_complete("e1", "s1", true)); // explicit flag, not a toggle
    TEST_CHECK(store.state()->items[0].find_set("s1")->complete);

    TEST_CHECK(store.apply_set_delete("e1", "s3"));
    TEST_CHECK(!store.apply_set_delete("e1", "s3"));
    TEST_CHECK((set_ids(store, "e1") == std::vector<std::string>{"s1", "s2", "s4"}));

    Metrics m;
    m.reps = std::int64_t{12};
    TEST_CHECK(store.update_metrics("e1", "s1", m));
    TEST_CHECK(store.state()->items[0].find_set("s1")->metrics.reps.value() == 12);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S7: Exercises
// -----------------------------------------------------------------------------
void test_exercise_events() {
    std::cout << "[TEST] S7: exercise add / update / delete\n";
    Store store;
    store.load(make_document(), make_state(1));

    TEST_CHECK(store.add_exercise(make_exercise("e2", {})));
    TEST_CHECK(store.apply_exercise_add(make_exercise("e3", {"x1"})));
    TEST_CHECK(store.state()->items.size() == 3);
    TEST_CHECK(store.state()->items[1].order == 2);
    TEST_CHECK(store.state()->items[2].order == 3);
    TEST_CHECK(store.state()->items[2].sets.size() == 1);

    std::vector<std::string> order{"s3", "s1"};
    TEST_CHECK(store.apply_exercise_update("e1", Duration{90}, order));
    const Exercise* e1 = store.state()->find_exercise("e1");
    TEST_CHECK(e1->rest.value().seconds == 90);
    TEST_CHECK(e1->sets[0].id == "s3" && e1->sets[0].order == 1);
    TEST_CHECK(e1->sets[1].id == "s1" && e1->sets[1].order == 2);
    TEST_CHECK(e1->sets[2].id == "s2" && e1->sets[2].order == 3);

    TEST_CHECK(!store.apply_exercise_update("e1", {}, {}));
    TEST_CHECK(!store.apply_exercise_update("missing", Duration{30}, {}));

    TEST_CHECK(store.apply_exercise_delete("e2"));
    TEST_CHECK(!store.apply_exercise_delete("e2"));
    TEST_CHECK(store.state()->items.size() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S8: No active session
// -----------------------------------------------------------------------------
void test_inactive_store() {
    std::cout << "[TEST] S8: writes without a session are ignored\n";
    Store store;

    TEST_CHECK(!store.add_exercise(make_exercise("e1", {})));
    TEST_CHECK(!store.apply_participant_join("acc-2"));
    TEST_CHECK(!store.toggle_set_complete("e1", "s1"));
    TEST_CHECK(store.state() == nullptr);
    TEST_CHECK(store.document() == nullptr);

    store.begin_offline("sess-9", "acc-1");
    TEST_CHECK(store.active());
    TEST_CHECK(store.version() == 0);
    TEST_CHECK(store.state()->items.empty());
    TEST_CHECK(store.document()->status == SessionStatus::Draft);
    TEST_CHECK(store.document()->owner_id == "acc-1");

    TEST_CHECK(store.add_exercise(make_exercise("e1", {"s1"})));
    TEST_CHECK(store.version() == 1);

    store.reset();
    TEST_CHECK(!store.active());
    TEST_CHECK(store.observe_document().get() == nullptr);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S9: Helpers
// -----------------------------------------------------------------------------
void test_helpers() {
    std::cout << "[TEST] S9: helpers, colors, units\n";

    SessionState st = make_state(1);
    st.items.push_back(make_exercise("e0", {"a1"}));
    st.items[1].order = 0;
    st.items[1].sets[0].complete = true;

    TEST_CHECK(helper::is_complete(st.items[1]));
    TEST_CHECK(helper::is_complete(make_exercise("empty", {})));
    TEST_CHECK(helper::next_incomplete_exercise(st)->id == "e1");

    st.items[0].sets[0].complete = true;
    TEST_CHECK(helper::next_incomplete_set(st.items[0])->id == "s2");

    auto ordered = helper::ordered_items(st);
    TEST_CHECK(ordered[0]->id == "e0" && ordered[1]->id == "e1");

    // Colors are deterministic and drawn from the palette
    const std::string c = participant_color("acc-42");
    TEST_CHECK(c == participant_color("acc-42"));
    bool in_palette = false;
    for (auto p : PARTICIPANT_PALETTE) {
        in_palette = in_palette || (p == c);
    }
    TEST_CHECK(in_palette);

    TEST_CHECK((Weight{10.0, WeightUnit::Lb}.to_kg() > 4.53 && Weight{10.0, WeightUnit::Lb}.to_kg() < 4.54));
    TEST_CHECK((Distance{2.0, DistanceUnit::Km}.to_meters() == 2000.0));

    const MetricMask mask = metrics_for(ExerciseType::DistanceTime);
    TEST_CHECK(!mask.reps && !mask.weight && mask.duration && mask.distance);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S10: Echoed events
// -----------------------------------------------------------------------------
void test_echo_keeps_version() {
    std::cout << "[TEST] S10: echoed server events leave the version untouched\n";
    Store store;
    store.load(make_document(), make_state(3));

    std::size_t published = 0;
    (void)store.observe_state().subscribe([&](const Store::StatePtr&) { ++published; });
    TEST_CHECK(published == 1);

    TEST_CHECK(store.toggle_set_complete("e1", "s2"));
    TEST_CHECK(store.version() == 4);
    TEST_CHECK(published == 2);

    // The server echoes the same change back
    TEST_CHECK(!store.apply_set_complete("e1", "s2", true));
    TEST_CHECK(store.version() == 4);
    TEST_CHECK(published == 2);

    const ExerciseSet same = *store.state()->items[0].find_set("s2");
    TEST_CHECK(!store.apply_set_update("e1", same));
    TEST_CHECK(store.version() == 4);

    ExerciseSet heavier = same;
    heavier.metrics.weight = Weight{100.0, WeightUnit::Kg};
    TEST_CHECK(store.apply_set_update("e1", heavier));
    TEST_CHECK(store.version() == 5);
    TEST_CHECK(published == 3);

    // A real change coming from the server still applies
    TEST_CHECK(store.apply_set_complete("e1", "s2", false));
    TEST_CHECK(store.version() == 6);
    TEST_CHECK(!store.state()->items[0].find_set("s2")->complete);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S11: Concurrent readers
// -----------------------------------------------------------------------------
void test_concurrent_snapshots() {
    std::cout << "[TEST] S11: snapshots stay consistent under concurrent writes\n";
    Store store;
    store.load(make_document(), make_state(0));

    constexpr int WRITES = 500;
    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::atomic<int> regressed{0};
    std::atomic<std::size_t> reads{0};

    // Every add_exercise bumps the version once, so version + 1 == items.size()
    auto reader = [&] {
        std::int64_t last = -1;
        while (!done.load(std::memory_order_acquire)) {
            auto snap = store.state();
            if (!snap) {
                inconsistent.fetch_add(1);
                continue;
            }
            if (static_cast<std::int64_t>(snap->items.size()) != snap->version + 1) {
                inconsistent.fetch_add(1);
            }
            if (snap->version < last) {
                regressed.fetch_add(1);
            }
            last = snap->version;
            reads.fetch_add(1, std::memory_order_relaxed);
        }
    };

    std::thread r1(reader);
    std::thread r2(reader);
    std::thread writer([&] {
        for (int i = 0; i < WRITES; ++i) {
            (void)store.add_exercise(make_exercise("x" + std::to_string(i), {"s1"}));
        }
        done.store(true, std::memory_order_release);
    });

    writer.join();
    r1.join();
    r2.join();

    TEST_CHECK(inconsistent.load() == 0);
    TEST_CHECK(regressed.load() == 0);
    TEST_CHECK(store.version() == WRITES);
    TEST_CHECK(store.state()->items.size() == static_cast<std::size_t>(WRITES) + 1);
    TEST_CHECK(store.state()->items.back().order == WRITES + 1);
    std::cout << "  reads: " << reads.load() << "\n";

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_snapshots();
    test_toggle_twice();
    test_reorder_round_trip();
    test_sync_replaces();
    test_participants();
    test_set_events();
    test_exercise_events();
    test_inactive_store();
    test_helpers();
    test_echo_keeps_version();
    test_concurrent_snapshots();

    std::cout << "\n[STORE TESTS PASSED]\n";
    return 0;
}
