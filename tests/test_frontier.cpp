#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "core/Frontier.hpp"

using namespace WebCrawl;

TEST_CASE("Frontier admits each URL once") {
    Frontier frontier(10);
    CHECK(frontier.Admit("https://a", AdmitMode::NonBlocking) == AdmitResult::Admitted);
    CHECK(frontier.Admit("https://a", AdmitMode::NonBlocking) == AdmitResult::Duplicate);
    CHECK(frontier.Admit("https://a", AdmitMode::Blocking) == AdmitResult::Duplicate);
    CHECK(frontier.PendingCount() == 1);
    CHECK(frontier.SeenCount() == 1);
}

TEST_CASE("Frontier drops discovered URLs when full and remembers them") {
    Frontier frontier(1);
    CHECK(frontier.Admit("https://a", AdmitMode::NonBlocking) == AdmitResult::Admitted);
    CHECK(frontier.Admit("https://b", AdmitMode::NonBlocking) == AdmitResult::Dropped);
    CHECK(frontier.SeenCount() == 2);

    auto next = frontier.Next();
    REQUIRE(next.has_value());
    CHECK(*next == "https://a");
    frontier.Finish();

    // Dropped URLs stay seen.
    CHECK(frontier.Admit("https://b", AdmitMode::NonBlocking) == AdmitResult::Duplicate);
}

TEST_CASE("Frontier blocking admit waits for room") {
    Frontier frontier(1);
    REQUIRE(frontier.Admit("https://a", AdmitMode::Blocking) == AdmitResult::Admitted);

    std::atomic<bool> done{false};
    AdmitResult result = AdmitResult::Closed;
    std::thread producer([&] {
        result = frontier.Admit("https://b", AdmitMode::Blocking);
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(done.load());

    auto first = frontier.Next();
    producer.join();
    REQUIRE(first.has_value());
    CHECK(result == AdmitResult::Admitted);
    CHECK(frontier.PendingCount() == 1);
}

TEST_CASE("Frontier close releases blocked producers and consumers") {
    SECTION("producer") {
        Frontier frontier(1);
        REQUIRE(frontier.Admit("https://a", AdmitMode::Blocking) == AdmitResult::Admitted);
        AdmitResult result = AdmitResult::Admitted;
        std::thread producer([&] { result = frontier.Admit("https://b", AdmitMode::Blocking); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        frontier.Close();
        producer.join();
        CHECK(result == AdmitResult::Closed);
    }
    SECTION("consumer") {
        Frontier frontier(4);
        std::optional<std::string> got = std::string("sentinel");
        std::thread consumer([&] { got = frontier.Next(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        frontier.Close();
        consumer.join();
        CHECK_FALSE(got.has_value());
        CHECK(frontier.IsClosed());
    }
}

TEST_CASE("Frontier is idle only with nothing queued and nothing in flight") {
    Frontier frontier(4);
    CHECK(frontier.IsIdle());

    frontier.Admit("https://a", AdmitMode::NonBlocking);
    CHECK_FALSE(frontier.IsIdle());

    auto url = frontier.Next();
    REQUIRE(url.has_value());
    CHECK(frontier.PendingCount() == 0);
    CHECK(frontier.ActiveCount() == 1);
    CHECK_FALSE(frontier.IsIdle());

    frontier.Admit("https://b", AdmitMode::NonBlocking);
    frontier.Finish();
    CHECK_FALSE(frontier.IsIdle());

    frontier.Next();
    frontier.Finish();
    CHECK(frontier.IsIdle());
}

TEST_CASE("Frontier deduplicates under concurrent admission") {
    Frontier frontier(1000);
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                if (frontier.Admit("https://example.com/" + std::to_string(i), AdmitMode::NonBlocking) == AdmitResult::Admitted) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(admitted.load() == 100);
    CHECK(frontier.SeenCount() == 100);
    CHECK(frontier.PendingCount() == 100);
}
