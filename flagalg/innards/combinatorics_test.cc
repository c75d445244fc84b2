#include <flagalg/innards/combinatorics.hh>

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <vector>

using namespace flagalg::innards;

using std::set;
using std::vector;

TEST_CASE("counting functions")
{
    CHECK(binomial(5, 2) == 10);
    CHECK(binomial(4, 0) == 1);
    CHECK(binomial(2, 3) == 0);
    CHECK(falling_factorial(5, 2) == 20);
    CHECK(falling_factorial(3, 0) == 1);
    CHECK(factorial(4) == 24);
    CHECK(factorial(0) == 1);
    CHECK(vertex_range(2, 4) == vector<int>{2, 3, 4});
    CHECK(vertex_range(1, 0).empty());
}

TEST_CASE("enumerations")
{
    auto items = vertex_range(1, 5);

    SECTION("combinations")
    {
        vector<vector<int>> seen;
        CHECK(for_each_combination(items, 2, [&](const vector<int> & c) -> bool {
            seen.push_back(c);
            return true;
        }));
        CHECK(seen.size() == 10);
        CHECK(seen.front() == vector<int>{1, 2});
        CHECK(seen.back() == vector<int>{4, 5});
    }

    SECTION("arrangements")
    {
        set<vector<int>> seen;
        for_each_arrangement(vertex_range(1, 4), 2, [&](const vector<int> & a) -> bool {
            seen.insert(a);
            return true;
        });
        CHECK(seen.size() == 12);
        CHECK(seen.contains(vector<int>{2, 1}));
        CHECK(! seen.contains(vector<int>{2, 2}));
    }

    SECTION("arrangements start with the identity")
    {
        vector<int> first;
        for_each_arrangement(vertex_range(1, 3), 3, [&](const vector<int> & a) -> bool {
            first = a;
            return false;
        });
        CHECK(first == vector<int>{1, 2, 3});
    }

    SECTION("tuples")
    {
        int count = 0;
        bool saw_repeat = false;
        for_each_tuple(vertex_range(1, 3), 2, [&](const vector<int> & t) -> bool {
            ++count;
            saw_repeat = saw_repeat || t[0] == t[1];
            return true;
        });
        CHECK(count == 9);
        CHECK(saw_repeat);
    }

    SECTION("multisets")
    {
        set<vector<int>> seen;
        for_each_multiset(vertex_range(1, 3), 2, [&](const vector<int> & m) -> bool {
            seen.insert(m);
            return true;
        });
        CHECK(seen.size() == 6);
        CHECK(seen.contains(vector<int>{1, 1}));
        CHECK(! seen.contains(vector<int>{2, 1}));
    }

    SECTION("empty selections")
    {
        int count = 0;
        auto f = [&](const vector<int> & v) -> bool {
            CHECK(v.empty());
            ++count;
            return true;
        };
        for_each_combination(items, 0, f);
        for_each_arrangement(items, 0, f);
        for_each_tuple({}, 0, f);
        for_each_multiset(items, 0, f);
        CHECK(count == 4);
    }

    SECTION("early exit")
    {
        int count = 0;
        CHECK(! for_each_combination(items, 3, [&](const vector<int> &) -> bool {
            return ++count < 4;
        }));
        CHECK(count == 4);
    }
}
