#include <catch2/catch.hpp>
#include "render/image_render_cache.hpp"

using namespace paneltalk;

namespace {

MessageKey key(MessageId id) { return MessageKey{1, id}; }

ImageGrid grid(const std::string& line) { return ImageGrid{line}; }

} // anonymous namespace

TEST_CASE("Cache hit returns stored grid", "[image_cache]") {
    ImageRenderCache cache(4);
    cache.put(key(1), "p1", grid("@@"));

    auto hit = cache.get(key(1), "p1");
    REQUIRE(hit.has_value());
    REQUIRE(*hit == grid("@@"));
    REQUIRE_FALSE(cache.get(key(2), "p1").has_value());
}

TEST_CASE("Replaced payload invalidates the entry", "[image_cache]") {
    ImageRenderCache cache(4);
    cache.put(key(1), "old", grid("@@"));

    REQUIRE_FALSE(cache.get(key(1), "new").has_value());
    REQUIRE_FALSE(cache.contains(key(1)));
    REQUIRE(cache.size() == 0);
}

TEST_CASE("Least recently used entry is evicted", "[image_cache]") {
    ImageRenderCache cache(2);
    cache.put(key(1), "p", grid("a"));
    cache.put(key(2), "p", grid("b"));

    // 访问 1，使 2 成为最久未用
    REQUIRE(cache.get(key(1), "p").has_value());
    cache.put(key(3), "p", grid("c"));

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.contains(key(1)));
    REQUIRE_FALSE(cache.contains(key(2)));
    REQUIRE(cache.contains(key(3)));
}

TEST_CASE("Visible entries are never evicted", "[image_cache]") {
    ImageRenderCache cache(1);
    cache.setVisible({key(1), key(2)});
    cache.put(key(1), "p", grid("a"));
    cache.put(key(2), "p", grid("b"));

    // 容量不足时暂时超出上限
    REQUIRE(cache.size() == 2);

    cache.setVisible({key(2)});
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.contains(key(2)));
}

TEST_CASE("Same message id in different chats is distinct", "[image_cache]") {
    ImageRenderCache cache(4);
    cache.put(MessageKey{1, 7}, "p", grid("a"));
    cache.put(MessageKey{2, 7}, "p", grid("b"));

    REQUIRE(*cache.get(MessageKey{1, 7}, "p") == grid("a"));
    REQUIRE(*cache.get(MessageKey{2, 7}, "p") == grid("b"));
}

TEST_CASE("Capacity is at least one", "[image_cache]") {
    ImageRenderCache cache(0);
    REQUIRE(cache.capacity() == 1);

    cache.put(key(1), "p", grid("a"));
    cache.erase(key(1));
    cache.erase(key(1));
    REQUIRE(cache.size() == 0);
}
