#include <imagine/types/cursor.h>
#include <imagine/types/scene.h>

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace imagine::test {

using IntScene = Scene<int(int)>;

TEST_CASE("Scene without a guard applies everywhere", "[scene]") {
    auto scene = std::make_shared<IntScene>(nullptr, IntScene::guard_type{}, 7);

    REQUIRE(scene->is_unconditional());
    REQUIRE(scene->applies(0));
    REQUIRE(scene->applies(-100));
    REQUIRE(scene->value() == 7);
    REQUIRE(scene->parent() == nullptr);
}

TEST_CASE("Scene::find returns the first applicable scene from the head", "[scene]") {
    IntScene::ptr root = std::make_shared<IntScene>(nullptr, [](int x) { return x == 1; }, 10);
    IntScene::ptr middle = std::make_shared<IntScene>(root, [](int x) { return x == 2; }, 20);
    IntScene::ptr head = std::make_shared<IntScene>(middle, [](int x) { return x == 1; }, 30);

    REQUIRE(IntScene::find(head.get(), 1)->value() == 30);
    REQUIRE(IntScene::find(head.get(), 2)->value() == 20);
    REQUIRE(IntScene::find(head.get(), 3) == nullptr);
    REQUIRE(IntScene::find(nullptr, 1) == nullptr);
    REQUIRE(IntScene::length(head.get()) == 3);
    REQUIRE(IntScene::length(nullptr) == 0);
}

TEST_CASE("Scene::with_parent copies guard and value without touching the original", "[scene]") {
    IntScene::ptr base = std::make_shared<IntScene>(nullptr, IntScene::guard_type{}, 0);
    IntScene::ptr original = std::make_shared<IntScene>(nullptr, [](int x) { return x == 5; }, 9);

    auto copy = original->with_parent(base);

    REQUIRE(copy != original);
    REQUIRE(copy->parent() == base);
    REQUIRE(original->parent() == nullptr);
    REQUIRE(copy->value() == 9);
    REQUIRE(copy->applies(5));
    REQUIRE_FALSE(copy->applies(4));
    // The copy falls through to the new parent
    REQUIRE(IntScene::find(copy.get(), 4)->value() == 0);
}

TEST_CASE("resolve falls back to the body when nothing applies", "[scene]") {
    IntScene::ptr head = std::make_shared<IntScene>(nullptr, [](int x) { return x == 1; }, 100);
    auto body = [](int x) { return -x; };

    REQUIRE(resolve(head.get(), body, 1) == 100);
    REQUIRE(resolve(head.get(), body, 2) == -2);
    REQUIRE(resolve(static_cast<const IntScene *>(nullptr), body, 1) == -1);
}

TEST_CASE("Scene guards see reference arguments by value", "[scene]") {
    using StringScene = Scene<std::size_t(const std::string &)>;
    StringScene::ptr head =
        std::make_shared<StringScene>(nullptr, [](const std::string &s) { return s == "imagined"; }, 42);
    auto body = [](const std::string &s) { return s.size(); };

    const std::string imagined{"imagined"};
    const std::string real{"real"};
    REQUIRE(resolve(head.get(), body, imagined) == 42);
    REQUIRE(resolve(head.get(), body, real) == 4);
}

TEST_CASE("Cursor installs and restores heads with history", "[cursor]") {
    Cursor<int(int)> cursor{"f"};
    REQUIRE(cursor.name() == "f");
    REQUIRE(cursor.depth() == 0);
    REQUIRE(cursor.active() == nullptr);
    REQUIRE(cursor.top_owner() == nullptr);

    IntScene::ptr first = std::make_shared<IntScene>(nullptr, IntScene::guard_type{}, 1);
    IntScene::ptr second = std::make_shared<IntScene>(first, IntScene::guard_type{}, 2);

    cursor.install(first, nullptr);
    cursor.install(second, nullptr);
    REQUIRE(cursor.depth() == 2);
    REQUIRE(cursor.active() == second);
    REQUIRE(cursor.active_length() == 2);
    REQUIRE(cursor.looking_back(0) == second);
    REQUIRE(cursor.looking_back(1) == first);
    REQUIRE(cursor.looking_back(2) == nullptr);
    REQUIRE(cursor.looking_back(10) == nullptr);

    cursor.restore(first);
    REQUIRE(cursor.depth() == 1);
    REQUIRE(cursor.active() == first);
    cursor.restore(nullptr);
    REQUIRE(cursor.depth() == 0);
    REQUIRE(cursor.active() == nullptr);
}

TEST_CASE("Cursors without a name get a generated one", "[cursor]") {
    Cursor<int(int)> a{""};
    Cursor<int(int)> b{""};
    REQUIRE(a.id() != b.id());
    REQUIRE(a.name() != b.name());
    REQUIRE(a.name().starts_with("imagined_"));
}

} // namespace imagine::test
