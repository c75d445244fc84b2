#include <flagalg/flag_products.hh>
#include <flagalg/generate.hh>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

using namespace flagalg;

using std::make_tuple;
using std::string;
using std::vector;

namespace
{
    auto g3(const string & s) -> Graph3
    {
        auto g = string_to_graph(s);
        REQUIRE(g);
        return *g;
    }

    auto index_of(const vector<Graph3> & flags, const string & s) -> int
    {
        auto f = std::find(flags.begin(), flags.end(), g3(s));
        REQUIRE(f != flags.end());
        return int(f - flags.begin());
    }

    auto sum_of_entries(const RationalMatrix & m) -> Rational
    {
        Rational result;
        m.for_each_nonzero([&](int, int, const Rational & x) { result += x; });
        return result;
    }
}

TEST_CASE("products in a single edge")
{
    auto type = g3("1:");
    auto flags = generate_flags(3, type, Constraints{});
    REQUIRE(flags.size() == 2);
    int empty = index_of(flags, "3:"), edge = index_of(flags, "3:123");

    SECTION("by direct enumeration")
    {
        auto d = slow_flag_products(g3("5:123"), 1, 3, {type}, {flags});
        CHECK(d.at(make_tuple(0, empty, empty)) == Rational{4, 5});
        CHECK(d.at(make_tuple(0, edge, empty)) == Rational{1, 10});
        CHECK(d.at(make_tuple(0, empty, edge)) == Rational{1, 10});
        CHECK(! d.contains(make_tuple(0, edge, edge)));
    }

    SECTION("as a matrix")
    {
        auto d = flag_products({g3("5:123")}, type, flags);
        REQUIRE(d.size() == 1);
        CHECK(d[0](empty, empty) == Rational{4, 5});
        CHECK(d[0](edge, empty) == Rational{1, 10});
        CHECK(d[0](empty, edge) == Rational{1, 10});
        CHECK(d[0](edge, edge).is_zero());
        CHECK(d[0].is_symmetric());
        CHECK(sum_of_entries(d[0]) == Rational{1});
    }
}

TEST_CASE("products on two type vertices")
{
    auto type = g3("2:");
    auto flags = generate_flags(3, type, Constraints{});
    int empty = index_of(flags, "3:"), edge = index_of(flags, "3:123");

    auto d = flag_products({g3("4:"), g3("4:123"), g3("4:123124")}, type, flags);
    REQUIRE(d.size() == 3);

    CHECK(d[0](empty, empty) == Rational{1});
    CHECK(sum_of_entries(d[0]) == Rational{1});

    CHECK(d[1](empty, empty) == Rational{1, 2});
    CHECK(d[1](empty, edge) == Rational{1, 4});
    CHECK(d[1](edge, edge).is_zero());

    CHECK(d[2](empty, empty) == Rational{1, 6});
    CHECK(d[2](empty, edge) == Rational{1, 3});
    CHECK(d[2](edge, edge) == Rational{1, 6});
}

TEST_CASE("fast and slow products agree")
{
    auto graphs = generate_graphs(5, Constraints{});

    for (auto & [s, m] : vector<std::pair<int, int>>{{1, 3}, {3, 4}}) {
        auto types = generate_graphs(s, Constraints{});
        vector<vector<Graph3>> flags;
        for (auto & t : types)
            flags.push_back(generate_flags(m, t, Constraints{}));

        for (int ti = 0; ti < int(types.size()); ++ti) {
            auto fast = flag_products(graphs, types[ti], flags[ti]);
            REQUIRE(fast.size() == graphs.size());

            for (int gi = 0; gi < int(graphs.size()); ++gi) {
                auto slow = slow_flag_products(graphs[gi], s, m, types, flags);
                for (int a = 0; a < int(flags[ti].size()); ++a)
                    for (int b = 0; b < int(flags[ti].size()); ++b) {
                        auto k = make_tuple(ti, a, b);
                        CHECK(fast[gi](a, b) == (slow.contains(k) ? slow.at(k) : Rational{0}));
                    }
            }
        }
    }
}

TEST_CASE("threaded products")
{
    auto graphs = generate_graphs(5, Constraints{});
    auto type = g3("1:");
    auto flags = generate_flags(3, type, Constraints{});

    auto one = flag_products(graphs, type, flags, 1);
    auto many = flag_products(graphs, type, flags, 4);
    auto detected = flag_products(graphs, type, flags, 0);
    CHECK(one == many);
    CHECK(one == detected);

    for (auto & d : one) {
        CHECK(d.is_symmetric());
        CHECK(sum_of_entries(d) == Rational{1});
    }

    CHECK(flag_products({}, type, flags, 4).empty());
}

TEST_CASE("missing flags")
{
    auto type = g3("1:");
    vector<Graph3> flags{g3("3:")};

    CHECK_THROWS_AS(flag_products({g3("5:123")}, type, flags), FlagNotFound);
    CHECK_THROWS_AS(flag_products({g3("5:"), g3("5:123"), g3("5:")}, type, flags, 2), FlagNotFound);
    CHECK_THROWS_AS(slow_flag_products(g3("5:123"), 1, 3, {type}, {flags}), FlagNotFound);
    CHECK_NOTHROW(flag_products({g3("5:")}, type, flags));
}
