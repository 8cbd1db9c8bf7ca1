#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>
#include "swarmfetch/seed/seed_manager.h"
#include "swarmfetch/tracker/client.h"
#include "test_support.h"

using namespace swarmfetch;
using namespace swarmfetch::test;

namespace {

SwarmDescriptor seed_descriptor(const TempDir& dir, const std::string& name, uint32_t salt = 1) {
    write_file(dir.file(name), make_payload(2048, salt));
    return DescriptorBuilder::build(dir.file(name), 2048);
}

bool wait_for(const std::function<bool()>& cond, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

} // anonymous namespace

TEST_CASE("Seeding Is Idempotent Per Content Hash", "[seed][idempotent]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedConfig config;
    SeedManager seeder(config, &engine);

    auto desc = seed_descriptor(dir, "a.bin");
    REQUIRE(seeder.start_seeding(desc, dir.file("a.bin")));
    REQUIRE(seeder.start_seeding(desc, dir.file("a.bin")));

    REQUIRE(engine.sessions_created() == 1);
    REQUIRE(engine.served_count(desc.content_hash) == 1);
    REQUIRE(seeder.active_count() == 1);
    REQUIRE(seeder.is_seeding(desc.content_hash));
}

TEST_CASE("Concurrent Starts Create One Engine Session", "[seed][idempotent]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);
    auto desc = seed_descriptor(dir, "c.bin");

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() { seeder.start_seeding(desc, dir.file("c.bin")); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(engine.sessions_created() == 1);
    REQUIRE(seeder.active_count() == 1);
}

TEST_CASE("Stop All Leaves No Seed Tasks", "[seed][stop]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);

    auto a = seed_descriptor(dir, "a.bin", 1);
    auto b = seed_descriptor(dir, "b.bin", 2);
    REQUIRE(seeder.start_seeding(a, dir.file("a.bin")));
    REQUIRE(seeder.start_seeding(b, dir.file("b.bin"), 0));
    REQUIRE(seeder.active_count() == 2);
    REQUIRE(engine.open_sessions() == 2);

    REQUIRE(seeder.stop_all() == 2);
    REQUIRE(seeder.active_count() == 0);
    REQUIRE(engine.open_sessions() == 0);
    REQUIRE(seeder.stop_all() == 0);
}

TEST_CASE("Stop One Seed", "[seed][stop]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);

    auto a = seed_descriptor(dir, "a.bin", 1);
    auto b = seed_descriptor(dir, "b.bin", 2);
    seeder.start_seeding(a, dir.file("a.bin"));
    seeder.start_seeding(b, dir.file("b.bin"));

    REQUIRE(seeder.stop_seeding(a.content_hash));
    REQUIRE_FALSE(seeder.stop_seeding(a.content_hash));
    REQUIRE_FALSE(seeder.is_seeding(a.content_hash));
    REQUIRE(seeder.is_seeding(b.content_hash));
    REQUIRE(engine.open_sessions() == 1);
}

TEST_CASE("Seed Expires After Its Duration", "[seed][expiry]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);

    auto shortlived = seed_descriptor(dir, "s.bin", 1);
    auto unbounded = seed_descriptor(dir, "u.bin", 2);
    REQUIRE(seeder.start_seeding(shortlived, dir.file("s.bin"), 1));
    REQUIRE(seeder.start_seeding(unbounded, dir.file("u.bin"), 0));

    REQUIRE(wait_for([&]() { return !seeder.is_seeding(shortlived.content_hash); }));
    REQUIRE(seeder.is_seeding(unbounded.content_hash));
    REQUIRE(engine.open_sessions() == 1);

    // Explicit stop after expiry is a no-op
    REQUIRE_FALSE(seeder.stop_seeding(shortlived.content_hash));
}

TEST_CASE("Restart Refreshes The Seed Timer", "[seed][expiry]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);
    auto desc = seed_descriptor(dir, "r.bin");

    REQUIRE(seeder.start_seeding(desc, dir.file("r.bin"), 1));
    REQUIRE(seeder.start_seeding(desc, dir.file("r.bin"), 0));
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    REQUIRE(seeder.is_seeding(desc.content_hash));

    auto status = seeder.status();
    REQUIRE(status.size() == 1);
    REQUIRE(status[0].duration_sec == 0);
    REQUIRE_FALSE(status[0].remaining_sec.has_value());
    REQUIRE(status[0].file_path == dir.file("r.bin"));
}

TEST_CASE("Seed Status Reports Remaining Time", "[seed][status]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedConfig config;
    config.duration_sec = 600;
    SeedManager seeder(config, &engine);
    auto desc = seed_descriptor(dir, "st.bin");

    REQUIRE(seeder.start_seeding(desc, dir.file("st.bin")));
    auto status = seeder.status();
    REQUIRE(status.size() == 1);
    REQUIRE(status[0].content_hash == desc.content_hash);
    REQUIRE(status[0].duration_sec == 600);
    REQUIRE(status[0].remaining_sec.has_value());
    REQUIRE(*status[0].remaining_sec <= 600);
    REQUIRE(*status[0].remaining_sec >= 590);
}

TEST_CASE("Seed Status Reports Upload Activity", "[seed][status]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);
    auto desc = seed_descriptor(dir, "up.bin");

    REQUIRE(seeder.start_seeding(desc, dir.file("up.bin")));
    auto idle = seeder.status();
    REQUIRE(idle.size() == 1);
    REQUIRE(idle[0].peers_connected == 0);
    REQUIRE(idle[0].bytes_uploaded == 0);
    REQUIRE(idle[0].upload_rate_bps == 0.0);

    ServeStats stats;
    stats.peers_connected = 3;
    stats.bytes_uploaded = 1024 * 1024;
    engine.set_serve_stats(desc.content_hash, stats);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto busy = seeder.status();
    REQUIRE(busy.size() == 1);
    REQUIRE(busy[0].peers_connected == 3);
    REQUIRE(busy[0].bytes_uploaded == 1024 * 1024);
    REQUIRE(busy[0].upload_rate_bps > 0.0);
    // At least 100 ms have passed, so the average is bounded
    REQUIRE(busy[0].upload_rate_bps <= 1024.0 * 1024.0 * 10.0);
}

TEST_CASE("Seeding Announces To The Tracker", "[seed][tracker]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    auto transport = std::make_unique<ScriptedTransport>();
    auto* t = transport.get();
    t->on("POST", "/api/v1/announce", http_response(200));
    TrackingClient tracker(TrackerConfig{}, std::move(transport));

    SeedManager seeder(SeedConfig{}, &engine);
    seeder.set_tracking_client(&tracker);
    auto desc = seed_descriptor(dir, "an.bin");

    REQUIRE(seeder.start_seeding(desc, dir.file("an.bin")));
    REQUIRE(seeder.stop_seeding(desc.content_hash));

    auto calls = t->calls();
    REQUIRE(calls.size() == 2);
    REQUIRE(nlohmann::json::parse(calls[0].body)["event"] == "started");
    REQUIRE(nlohmann::json::parse(calls[1].body)["event"] == "stopped");
}

TEST_CASE("Seeding Without An Engine Fails", "[seed][errors]") {
    TempDir dir;
    SeedManager seeder(SeedConfig{}, nullptr);
    auto desc = seed_descriptor(dir, "n.bin");
    REQUIRE_FALSE(seeder.start_seeding(desc, dir.file("n.bin")));
    REQUIRE(seeder.active_count() == 0);
}

TEST_CASE("Wait Until Idle Returns On Stop Request", "[seed][wait]") {
    TempDir dir;
    FakeSwarmEngine engine(dir.file("work"), "");
    SeedManager seeder(SeedConfig{}, &engine);
    auto desc = seed_descriptor(dir, "w.bin");
    seeder.start_seeding(desc, dir.file("w.bin"), 0);

    std::atomic<bool> stop{false};
    std::thread stopper([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop = true;
    });
    seeder.wait_until_idle([&]() { return stop.load(); });
    stopper.join();
    REQUIRE(seeder.active_count() == 1);

    // Returns immediately once nothing is seeding
    seeder.stop_all();
    seeder.wait_until_idle(nullptr);
}
