#include <catch2/catch_test_macros.hpp>
#include "fake_command_server.hpp"
#include "../src/tiered_cache.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

TieredCacheOptions test_options() {
    TieredCacheOptions opts;
    opts.memory.max_entries = 100;
    opts.memory.default_ttl = 5000ms;
    opts.memory.enable_auto_cleanup = false;
    opts.remote.key_prefix = "test:";
    opts.remote.default_ttl_seconds = 60;
    opts.max_stale_age = 500ms;
    return opts;
}

struct Post {
    std::string title;
    int views = 0;
};

void to_json(nlohmann::json& j, const Post& p) {
    j = nlohmann::json{{"title", p.title}, {"views", p.views}};
}

void from_json(const nlohmann::json& j, Post& p) {
    j.at("title").get_to(p.title);
    j.at("views").get_to(p.views);
}

}

TEST_CASE("Tiered cache in memory-only mode", "[tiered_cache]") {
    TieredCache cache(test_options());
    cache.initialize();

    REQUIRE_FALSE(cache.is_redis_configured());
    REQUIRE_FALSE(cache.is_redis_available());

    SECTION("Typed round trip") {
        cache.set("post:1", Post{"Hello", 3});
        auto post = cache.get<Post>("post:1");
        REQUIRE(post.has_value());
        REQUIRE(post->title == "Hello");
        REQUIRE(post->views == 3);
    }

    SECTION("Missing keys report origin") {
        auto result = cache.get_with_meta<std::string>("missing");
        REQUIRE_FALSE(result.hit);
        REQUIRE_FALSE(result.value.has_value());
        REQUIRE(result.source == CacheSource::Origin);
    }

    SECTION("Memory hits report their source") {
        cache.set("greeting", std::string("hi"));
        auto result = cache.get_with_meta<std::string>("greeting");
        REQUIRE(result.hit);
        REQUIRE(result.source == CacheSource::Memory);
        REQUIRE(*result.value == "hi");
    }

    SECTION("Values of the wrong shape read as absent") {
        cache.set("number", 42);
        REQUIRE_FALSE(cache.get<Post>("number").has_value());
        REQUIRE(cache.get<int>("number") == 42);
    }

    SECTION("Invalidation counts memory only") {
        cache.set("a", 1, CacheSetOptions{std::nullopt, {"group"}});
        cache.set("b", 2, CacheSetOptions{std::nullopt, {"group"}});
        REQUIRE(cache.invalidate_by_tag("group") == 2);
        REQUIRE(cache.invalidate_by_pattern("^a") == 0);
    }

    SECTION("Stats carry no remote section") {
        cache.set("a", 1);
        cache.get<int>("a");
        cache.get<int>("b");

        auto stats = cache.get_stats();
        REQUIRE_FALSE(stats.redis.has_value());
        REQUIRE(stats.total_hits == 1);
        REQUIRE(stats.total_misses == 1);

        nlohmann::json j = stats;
        REQUIRE(j["redis"].is_null());
        REQUIRE(j["memory"]["size"] == 1);
    }
}

TEST_CASE("Tiered cache with a remote tier", "[tiered_cache]") {
    auto server = std::make_shared<FakeCommandServer>();
    TieredCache cache(test_options(), server);
    cache.initialize();

    REQUIRE(cache.is_redis_configured());
    REQUIRE(cache.is_redis_available());

    SECTION("Writes reach both tiers") {
        cache.set("post:1", Post{"Hello", 3}, CacheSetOptions{2500ms, {"posts"}});
        cache.flush();

        REQUIRE(cache.memory().has("post:1"));
        REQUIRE(server->strings.count("test:post:1") == 1);
        REQUIRE(server->sets["test:tag:posts"].count("test:post:1") == 1);

        // Millisecond TTLs are truncated to whole seconds for the remote tier
        auto set_cmd = server->commands[1];
        REQUIRE(set_cmd.front() == "SET");
        REQUIRE(set_cmd.back() == "2");
    }

    SECTION("Sub-second TTLs keep at least one second remotely") {
        cache.set("short", 1, CacheSetOptions{200ms, {}});
        cache.flush();
        REQUIRE(server->commands[1].back() == "1");
    }

    SECTION("Remote hits repopulate memory with their tags") {
        cache.set("post:1", Post{"Hello", 3}, CacheSetOptions{std::nullopt, {"posts"}});
        cache.flush();
        cache.memory().clear();

        auto result = cache.get_with_meta<Post>("post:1");
        REQUIRE(result.hit);
        REQUIRE(result.source == CacheSource::Redis);
        REQUIRE(result.value->title == "Hello");

        REQUIRE(cache.get_with_meta<Post>("post:1").source == CacheSource::Memory);
        REQUIRE(cache.memory().invalidate_by_tag("posts") == 1);
    }

    SECTION("Plain get falls through to the remote tier") {
        cache.set("k", std::string("v"));
        cache.flush();
        cache.memory().clear();

        REQUIRE(cache.get<std::string>("k") == std::string("v"));
        REQUIRE(cache.memory().has("k"));
    }

    SECTION("Removal reaches both tiers") {
        cache.set("k", 1);
        cache.flush();
        cache.remove("k");

        REQUIRE_FALSE(cache.memory().has("k"));
        REQUIRE(server->strings.count("test:k") == 0);
    }

    SECTION("Tag invalidation sums both tiers") {
        cache.set("post:1", 1, CacheSetOptions{std::nullopt, {"posts"}});
        cache.set("post:2", 2, CacheSetOptions{std::nullopt, {"posts"}});
        cache.set("user:1", 3, CacheSetOptions{std::nullopt, {"users"}});
        cache.flush();

        REQUIRE(cache.invalidate_by_tag("posts") == 4);
        REQUIRE_FALSE(cache.get<int>("post:1").has_value());
        REQUIRE(cache.get<int>("user:1") == 3);
        REQUIRE(server->strings.count("test:user:1") == 1);
    }

    SECTION("Pattern invalidation translates to a remote glob") {
        cache.set("posts:123:content", 1);
        cache.set("posts:123:metadata", 2);
        cache.set("posts:456:content", 3);
        cache.set("users:789:profile", 4);
        cache.flush();

        REQUIRE(cache.invalidate_by_pattern("^posts:123:") == 4);
        REQUIRE(server->strings.count("test:posts:456:content") == 1);
        REQUIRE(server->count("KEYS") == 1);
    }

    SECTION("Patterns without a glob form are matched against remote keys") {
        cache.set("posts:1", 1);
        cache.set("posts:draft", 2);
        cache.flush();

        REQUIRE(cache.invalidate_by_pattern("^posts:\\d+$") == 2);
        REQUIRE(server->count("KEYS") == 1);
        REQUIRE(server->strings.count("test:posts:1") == 0);
        REQUIRE(server->strings.count("test:posts:draft") == 1);
    }

    SECTION("Optional characters do not read back from the remote tier") {
        cache.set("user:1", 7);
        cache.set("user:", 8);
        cache.set("user:12", 9);
        cache.flush();

        REQUIRE(cache.invalidate_by_pattern("^user:1?$") == 4);
        REQUIRE_FALSE(cache.get<int>("user:1").has_value());
        REQUIRE_FALSE(cache.get<int>("user:").has_value());
        REQUIRE(cache.get<int>("user:12") == 9);
    }

    SECTION("Unanchored patterns leave tag sets alone") {
        cache.set("posts:1", 1, CacheSetOptions{std::nullopt, {"posts"}});
        cache.set("users:1", 2, CacheSetOptions{std::nullopt, {"posts"}});
        cache.flush();

        REQUIRE(cache.invalidate_by_pattern("posts") == 2);
        REQUIRE(server->sets.count("test:tag:posts") == 1);

        // One memory member left, two remote members listed
        REQUIRE(cache.invalidate_by_tag("posts") == 3);
        REQUIRE_FALSE(cache.get<int>("users:1").has_value());
    }

    SECTION("Clear empties both tiers") {
        cache.set("a", 1);
        cache.set("b", 2, CacheSetOptions{std::nullopt, {"letters"}});
        cache.flush();

        cache.clear();
        REQUIRE(cache.memory().size() == 0);
        REQUIRE(server->strings.empty());
        REQUIRE(server->sets.empty());
    }

    SECTION("Stats sum both tiers") {
        cache.set("a", 1);
        cache.flush();
        cache.memory().clear();

        cache.get<int>("a");        // remote hit
        cache.get<int>("a");        // memory hit
        cache.get<int>("missing");  // miss in both

        auto stats = cache.get_stats();
        REQUIRE(stats.redis.has_value());
        REQUIRE(stats.redis->hits == 1);
        REQUIRE(stats.memory.hits == 1);
        REQUIRE(stats.total_hits == 2);
        REQUIRE(stats.total_misses == 3);
    }
}

// Remote store whose writes take a while to land
class SlowSetServer : public FakeCommandServer {
public:
    nlohmann::json execute(const std::vector<std::string>& cmd,
                           std::chrono::milliseconds timeout) override {
        if (cmd.front() == "SET") {
            std::this_thread::sleep_for(delay);
        }
        return FakeCommandServer::execute(cmd, timeout);
    }

    std::chrono::milliseconds delay{50};
};

TEST_CASE("Tiered cache orders remote writes against deletes", "[tiered_cache]") {
    auto server = std::make_shared<SlowSetServer>();
    TieredCache cache(test_options(), server);
    cache.initialize();

    SECTION("Set then remove") {
        cache.set("k", 1);
        cache.remove("k");

        cache.flush();
        REQUIRE_FALSE(cache.get<int>("k").has_value());
        REQUIRE(server->strings.count("test:k") == 0);
    }

    SECTION("Set then clear") {
        cache.set("a", 1);
        cache.set("b", 2);
        cache.clear();

        cache.flush();
        REQUIRE_FALSE(cache.get<int>("a").has_value());
        REQUIRE_FALSE(cache.get<int>("b").has_value());
        REQUIRE(server->strings.empty());
    }

    SECTION("Set then tag invalidation") {
        cache.set("post:1", 1, CacheSetOptions{std::nullopt, {"posts"}});
        REQUIRE(cache.invalidate_by_tag("posts") == 2);

        cache.flush();
        REQUIRE_FALSE(cache.get<int>("post:1").has_value());
    }

    SECTION("Set then pattern invalidation") {
        cache.set("post:1", 1);
        REQUIRE(cache.invalidate_by_pattern("^post:") == 2);

        cache.flush();
        REQUIRE_FALSE(cache.get<int>("post:1").has_value());
    }

    SECTION("Later writes win remotely") {
        server->delay = 10ms;
        for (int v = 1; v <= 5; ++v) {
            cache.set("k", v);
        }
        cache.flush();
        cache.memory().clear();

        REQUIRE(cache.get<int>("k") == 5);
    }
}

TEST_CASE("Tiered cache degrades when the remote tier is down", "[tiered_cache]") {
    auto server = std::make_shared<FakeCommandServer>();
    server->fail_all = true;

    TieredCache cache(test_options(), server);
    cache.initialize();

    REQUIRE(cache.is_redis_configured());
    REQUIRE_FALSE(cache.is_redis_available());

    cache.set("key", std::string("value"));
    cache.flush();
    REQUIRE(cache.get<std::string>("key") == std::string("value"));
    REQUIRE(cache.invalidate_by_tag("none") == 0);
    cache.clear();

    // Only the failed probe reached the server
    REQUIRE(server->commands.size() == 1);
    REQUIRE(cache.get_stats().redis->errors == 1);
}

TEST_CASE("Tiered cache remote failures after connecting", "[tiered_cache]") {
    auto server = std::make_shared<FakeCommandServer>();
    TieredCache cache(test_options(), server);
    cache.initialize();

    server->fail_all = true;
    cache.set("key", 1);
    cache.flush();

    REQUIRE(cache.get<int>("key") == 1);
    REQUIRE(cache.get_stats().redis->errors >= 1);
}

TEST_CASE("Tiered cache get_or_fetch", "[tiered_cache]") {
    TieredCache cache(test_options());
    std::atomic<int> calls{0};

    SECTION("Miss fetches, hit serves from cache") {
        auto fetcher = [&calls]() { calls++; return std::string("fresh"); };

        auto first = cache.get_or_fetch("k", fetcher);
        REQUIRE(first.value == "fresh");
        REQUIRE_FALSE(first.cached);
        REQUIRE_FALSE(first.stale);

        auto second = cache.get_or_fetch("k", fetcher);
        REQUIRE(second.value == "fresh");
        REQUIRE(second.cached);
        REQUIRE(calls.load() == 1);
    }

    SECTION("Force refresh bypasses the cache") {
        cache.set("k", 1);
        auto result = cache.get_or_fetch("k", [&calls]() { calls++; return 2; },
                                         FetchOptions{std::nullopt, {}, true});
        REQUIRE(result.value == 2);
        REQUIRE_FALSE(result.cached);
        REQUIRE(cache.get<int>("k") == 2);
    }

    SECTION("Fetched values carry tags") {
        cache.get_or_fetch("post:1", []() { return 1; }, FetchOptions{std::nullopt, {"posts"}, false});
        REQUIRE(cache.invalidate_by_tag("posts") == 1);
    }

    SECTION("Stale values are served while refreshing") {
        FetchOptions opts{100ms, {}, false};
        cache.get_or_fetch("k", [&calls]() { return ++calls; }, opts);

        std::this_thread::sleep_for(150ms);

        auto stale = cache.get_or_fetch("k", [&calls]() { return ++calls; }, opts);
        REQUIRE(stale.value == 1);
        REQUIRE(stale.cached);
        REQUIRE(stale.stale);

        cache.flush();

        auto refreshed = cache.get_or_fetch("k", [&calls]() { return ++calls; }, opts);
        REQUIRE(refreshed.value == 2);
        REQUIRE(refreshed.cached);
        REQUIRE_FALSE(refreshed.stale);
        REQUIRE(calls.load() == 2);
    }

    SECTION("Entries older than the stale window are fetched synchronously") {
        FetchOptions opts{100ms, {}, false};
        cache.get_or_fetch("k", [&calls]() { return ++calls; }, opts);

        std::this_thread::sleep_for(700ms);

        auto result = cache.get_or_fetch("k", [&calls]() { return ++calls; }, opts);
        REQUIRE(result.value == 2);
        REQUIRE_FALSE(result.cached);
        REQUIRE_FALSE(result.stale);
    }

    SECTION("Fetch errors propagate on a miss") {
        REQUIRE_THROWS_AS(cache.get_or_fetch("k", []() -> int { throw std::runtime_error("origin down"); }),
                          std::runtime_error);
        REQUIRE_FALSE(cache.get<int>("k").has_value());
    }

    SECTION("Background refresh errors are swallowed") {
        FetchOptions opts{100ms, {}, false};
        cache.get_or_fetch("k", []() { return 1; }, opts);
        std::this_thread::sleep_for(150ms);

        auto stale = cache.get_or_fetch("k", []() -> int { throw std::runtime_error("origin down"); }, opts);
        REQUIRE(stale.value == 1);
        REQUIRE(stale.stale);

        cache.flush();

        auto again = cache.get_or_fetch("k", []() { return 5; }, opts);
        REQUIRE(again.value == 1);
        REQUIRE(again.stale);
    }
}

TEST_CASE("Tiered cache with stale-while-revalidate disabled", "[tiered_cache]") {
    auto opts = test_options();
    opts.stale_while_revalidate = false;
    TieredCache cache(opts);

    int calls = 0;
    FetchOptions fetch{100ms, {}, false};
    cache.get_or_fetch("k", [&calls]() { return ++calls; }, fetch);

    std::this_thread::sleep_for(150ms);

    auto result = cache.get_or_fetch("k", [&calls]() { return ++calls; }, fetch);
    REQUIRE(result.value == 2);
    REQUIRE_FALSE(result.cached);
    REQUIRE_FALSE(result.stale);
}
