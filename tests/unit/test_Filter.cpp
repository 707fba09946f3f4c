#include <gtest/gtest.h>
#include "engine/Filter.hpp"

#include <stdexcept>

using namespace trashy::engine;
using trashy::types::TrashedItem;

namespace {

constexpr std::time_t NOW = 1'700'000'000;

TrashedItem item(const std::string& id, const std::string& path, const std::time_t ageSeconds) {
    TrashedItem it;
    it.id = id;
    it.original_path = path;
    it.deleted_at = NOW - ageSeconds;
    it.payload_path = "/nonexistent/trash/files/" + id;
    return it;
}

}

TEST(FilterTest, EmptyFilterMatchesEverythingAndConstrainsNothing) {
    const ListFilter f;
    EXPECT_FALSE(f.constrains());
    EXPECT_TRUE(Matcher(f, NOW).matches(item("a", "/x/a", 10)));
}

TEST(FilterTest, OrderAloneIsNotAConstraint) {
    ListFilter f;
    f.order = Order::Path;
    EXPECT_FALSE(f.constrains());
    f.limit = 3;
    EXPECT_TRUE(f.constrains());
}

TEST(FilterTest, GlobWithoutSlashMatchesFileName) {
    ListFilter f;
    f.patterns = {"*.log"};
    const Matcher m(f, NOW);
    EXPECT_TRUE(m.matches(item("a", "/var/tmp/app.log", 0)));
    EXPECT_FALSE(m.matches(item("b", "/var/tmp.log/app.txt", 0)));
}

TEST(FilterTest, GlobWithSlashMatchesFullPath) {
    ListFilter f;
    f.patterns = {"/home/*/notes.txt"};
    const Matcher m(f, NOW);
    EXPECT_TRUE(m.matches(item("a", "/home/u/notes.txt", 0)));
    EXPECT_FALSE(m.matches(item("b", "/srv/u/notes.txt", 0)));
}

TEST(FilterTest, AnyPatternSelects) {
    ListFilter f;
    f.patterns = {"a.txt", "b.txt"};
    const Matcher m(f, NOW);
    EXPECT_TRUE(m.matches(item("a", "/x/b.txt", 0)));
    EXPECT_FALSE(m.matches(item("c", "/x/c.txt", 0)));
}

TEST(FilterTest, RegexSubstringAndExactModes) {
    ListFilter f;
    f.patterns = {R"(/src/.*\.o$)"};
    f.mode = MatchMode::Regex;
    EXPECT_TRUE(Matcher(f, NOW).matches(item("a", "/home/u/src/main.o", 0)));
    EXPECT_FALSE(Matcher(f, NOW).matches(item("b", "/home/u/src/main.c", 0)));

    f.patterns = {"u/src"};
    f.mode = MatchMode::Substring;
    EXPECT_TRUE(Matcher(f, NOW).matches(item("a", "/home/u/src/main.o", 0)));

    f.patterns = {"main.o"};
    f.mode = MatchMode::Exact;
    EXPECT_TRUE(Matcher(f, NOW).matches(item("a", "/home/u/src/main.o", 0)));
    f.patterns = {"main"};
    EXPECT_FALSE(Matcher(f, NOW).matches(item("a", "/home/u/src/main.o", 0)));
}

TEST(FilterTest, InvalidRegexIsAnArgumentError) {
    ListFilter f;
    f.patterns = {"(unclosed"};
    f.mode = MatchMode::Regex;
    EXPECT_THROW((void)Matcher(f, NOW), std::invalid_argument);
}

TEST(FilterTest, AgeBounds) {
    ListFilter f;
    f.older_than = std::chrono::hours(1);
    f.newer_than = std::chrono::hours(24);
    const Matcher m(f, NOW);
    EXPECT_FALSE(m.matches(item("a", "/x/a", 60)));
    EXPECT_TRUE(m.matches(item("b", "/x/b", 2 * 3600)));
    EXPECT_FALSE(m.matches(item("c", "/x/c", 48 * 3600)));
}

TEST(FilterTest, UnderSelectsDescendantsOnly) {
    ListFilter f;
    f.under = "/home/u/src";
    const Matcher m(f, NOW);
    EXPECT_TRUE(m.matches(item("a", "/home/u/src/x/y", 0)));
    EXPECT_FALSE(m.matches(item("b", "/home/u/srcfoo", 0)));
    EXPECT_FALSE(m.matches(item("c", "/home/u/src", 0)));
}

TEST(FilterTest, SizeBoundsExcludeUnsizablePayloads) {
    ListFilter f;
    f.min_size = 1;
    EXPECT_FALSE(Matcher(f, NOW).matches(item("a", "/x/a", 0)));
}

TEST(FilterTest, SortOrders) {
    std::vector<TrashedItem> items{
        item("b", "/z/b", 100),
        item("a", "/a/a", 10),
        item("c", "/m/c", 1000),
    };

    sortItems(items, Order::NewestFirst);
    EXPECT_EQ(items[0].id, "a");
    EXPECT_EQ(items[2].id, "c");

    sortItems(items, Order::OldestFirst);
    EXPECT_EQ(items[0].id, "c");
    EXPECT_EQ(items[2].id, "a");

    sortItems(items, Order::Path);
    EXPECT_EQ(items[0].original_path, "/a/a");
    EXPECT_EQ(items[2].original_path, "/z/b");
}

TEST(FilterTest, SameSecondTiesFollowTrashOrder) {
    std::vector<TrashedItem> items{item("f", "/x/f", 5), item("f.1", "/x/f", 5)};
    sortItems(items, Order::NewestFirst);
    EXPECT_EQ(items[0].id, "f.1");
}

TEST(FilterTest, SameSecondTiesCompareSuffixesNumerically) {
    std::vector<TrashedItem> items{item("f.9", "/x/f", 5), item("f.10", "/x/f", 5), item("f", "/x/f", 5),
                                   item("f.2", "/x/f", 5)};

    sortItems(items, Order::NewestFirst);
    EXPECT_EQ(items[0].id, "f.10");
    EXPECT_EQ(items[1].id, "f.9");
    EXPECT_EQ(items[3].id, "f");

    sortItems(items, Order::OldestFirst);
    EXPECT_EQ(items[0].id, "f");
    EXPECT_EQ(items[1].id, "f.2");
    EXPECT_EQ(items[3].id, "f.10");
}
