#include <iostream>
#include <string>
#include <vector>

#include "repsync/core/observable.hpp"
#include "common/test_check.hpp"

using namespace repsync::core;


void test_replay_and_changes() {
    std::cout << "[TEST] Observable replays the current value, then changes..." << std::endl;

    Observable<int> value{1};
    std::vector<int> seen;
    auto token = value.subscribe([&](const int& v) { seen.push_back(v); });

    TEST_CHECK(value.set(2));
    TEST_CHECK(!value.set(2)); // unchanged: no notification
    TEST_CHECK(value.set(3));

    TEST_CHECK((seen == std::vector<int>{1, 2, 3}));
    TEST_CHECK(value.get() == 3);

    value.unsubscribe(token);
    TEST_CHECK(value.set(4));
    TEST_CHECK(seen.size() == 3);
    TEST_CHECK(value.subscriber_count() == 0);

    std::cout << "[TEST] OK" << std::endl;
}

void test_nested_set_is_ordered() {
    std::cout << "[TEST] Observable delivers nested set() after the current round..." << std::endl;

    Observable<std::string> value{"idle"};
    std::vector<std::string> first;
    std::vector<std::string> second;

    (void)value.subscribe([&](const std::string& v) {
        first.push_back(v);
        if (v == "connecting") {
            (void)value.set("connected");
        }
    });
    (void)value.subscribe([&](const std::string& v) { second.push_back(v); });

    TEST_CHECK(value.set("connecting"));

    // Every subscriber sees "connecting" before "connected"
    TEST_CHECK((first == std::vector<std::string>{"idle", "connecting", "connected"}));
    TEST_CHECK((second == std::vector<std::string>{"idle", "connecting", "connected"}));
    TEST_CHECK(value.get() == "connected");

    std::cout << "[TEST] OK" << std::endl;
}

void test_unsubscribe_from_callback() {
    std::cout << "[TEST] Observable unsubscribe from inside a callback..." << std::endl;

    Observable<int> value{0};
    int calls = 0;
    Observable<int>::Token token = 0;
    token = value.subscribe([&](const int& v) {
        ++calls;
        if (v == 1) {
            value.unsubscribe(token);
        }
    });

    TEST_CHECK(value.set(1));
    TEST_CHECK(value.set(2));
    TEST_CHECK(calls == 2);

    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_replay_and_changes();
    test_nested_set_is_ordered();
    test_unsubscribe_from_callback();

    std::cout << "\n[OBSERVABLE TESTS PASSED]" << std::endl;
    return 0;
}
