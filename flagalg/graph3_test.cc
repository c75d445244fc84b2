#include <flagalg/graph3.hh>
#include <flagalg/innards/combinatorics.hh>

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <string>
#include <vector>

using namespace flagalg;

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

    auto canonical_string(const string & s, int type_order = 0) -> string
    {
        return graph_to_string(canonical_form(g3(s), type_order));
    }
}

TEST_CASE("parse and print")
{
    CHECK(graph_to_string(g3("4:123124")) == "4:123124");
    CHECK(graph_to_string(g3("4:321")) == "4:321");
    CHECK(graph_to_string(g3("0:")) == "0:");
    CHECK(g3("5:123345").number_of_edges() == 2);
    CHECK(g3("5:").order() == 5);

    CHECK(! string_to_graph(""));
    CHECK(! string_to_graph("4"));
    CHECK(! string_to_graph("4;123"));
    CHECK(! string_to_graph("4:12"));
    CHECK(! string_to_graph("4:125"));
    CHECK(! string_to_graph("4:120"));
    CHECK(! string_to_graph("x:"));
}

TEST_CASE("construction checks vertices")
{
    CHECK_THROWS_AS(Graph3(3, {{1, 2, 4}}), InvalidGraph);
    CHECK_THROWS_AS(Graph3(3, {{0, 1, 2}}), InvalidGraph);
    CHECK_THROWS_AS(Graph3(-1), InvalidGraph);
    CHECK_NOTHROW(Graph3(3, {{1, 1, 2}}));
}

TEST_CASE("equality is by content")
{
    Graph3 a{4, {{3, 2, 1}, {4, 1, 2}}}, b{4, {{1, 2, 4}, {1, 2, 3}}};
    CHECK(a == b);
    CHECK(std::hash<Graph3>{}(a) == std::hash<Graph3>{}(b));
    CHECK(! (a == Graph3{5, {{1, 2, 3}, {1, 2, 4}}}));
    CHECK(! (a == g3("4:123134")));
    CHECK(g3("3:") == Graph3{3});
}

TEST_CASE("degrees and relabelling")
{
    CHECK(degrees(g3("4:123124")) == vector<int>{2, 2, 1, 1});
    CHECK(degrees(g3("3:")) == vector<int>{0, 0, 0});

    CHECK(graph_to_string(relabel(g3("4:123"), {4, 3, 2, 1})) == "4:432");
    CHECK(relabel(g3("4:123"), {4, 3, 2, 1}) == g3("4:234"));
    CHECK_THROWS_AS(relabel(g3("4:123"), {1, 2, 3}), InvalidGraph);
}

TEST_CASE("splitting and induced subgraphs")
{
    SECTION("split a vertex in one edge")
    {
        auto s = split_vertex(g3("3:123"), 1);
        CHECK(s.order() == 4);
        CHECK(s == g3("4:123234"));
    }

    SECTION("induced on distinct vertices")
    {
        CHECK(induced_subgraph(g3("5:123345"), {3, 4, 5}) == g3("3:123"));
        CHECK(induced_subgraph(g3("5:123345"), {5, 4, 3}) == g3("3:123"));
        CHECK(induced_subgraph(g3("5:123345"), {1, 2}) == g3("2:"));
        CHECK(induced_subgraph(g3("5:123345"), {}) == g3("0:"));
    }

    SECTION("induced with a repeated vertex")
    {
        CHECK(induced_subgraph(g3("3:123"), {1, 1, 2}) == g3("3:"));
        CHECK(induced_subgraph(g3("3:123"), {1, 1, 2, 3}) == g3("4:134234"));
        CHECK(induced_subgraph(g3("3:123"), {1, 1, 1, 2}) == g3("4:"));
    }

    SECTION("degenerate edges")
    {
        Graph3 d{3, {{1, 1, 2}, {1, 2, 3}}};
        CHECK(d.degenerate());
        CHECK(! delete_improper_edges(d).degenerate());
        CHECK(delete_improper_edges(d) == g3("3:123"));
    }
}

TEST_CASE("canonical form")
{
    CHECK(canonical_string("4:234") == "4:123");
    CHECK(canonical_string("4:134124") == "4:123124");
    CHECK(canonical_string("5:") == "5:");
    CHECK(canonical_string("4:321") == "4:123");

    SECTION("type vertices stay put")
    {
        CHECK(canonical_string("4:234", 1) == "4:234");
        CHECK(canonical_string("4:124", 2) == "4:123");
        CHECK(canonical_string("4:134", 2) == "4:134");
        CHECK(canonical_string("3:123", 3) == "3:123");
    }

    SECTION("every relabelling has the same canonical form")
    {
        auto g = g3("5:123124345");
        auto expected = canonical_form(g);
        innards::for_each_arrangement(innards::vertex_range(1, 5), 5, [&](const vector<int> & perm) -> bool {
            CHECK(canonical_form(relabel(g, perm)) == expected);
            return true;
        });
        CHECK(canonical_form(expected) == expected);
    }
}

TEST_CASE("densities")
{
    CHECK(edge_density(g3("4:123124")) == Rational{1, 2});
    CHECK(edge_density(g3("5:123")) == Rational{1, 10});
    CHECK(edge_density(g3("2:")) == Rational{0});

    CHECK(subgraph_density(g3("5:123"), g3("3:123")) == Rational{1, 10});
    CHECK(subgraph_density(g3("4:123124"), g3("3:")) == Rational{1, 2});
    CHECK(subgraph_density(g3("4:123124"), g3("4:134234")) == Rational{1});
    CHECK(subgraph_density(g3("3:123"), g3("4:")) == Rational{0});
}

TEST_CASE("asymptotic flag densities")
{
    auto g = g3("3:123");

    CHECK(asymptotic_flag_density_fixed(g, g3("2:"), g3("3:123"), {1, 2}) == Rational{1, 3});
    CHECK(asymptotic_flag_density_fixed(g, g3("2:"), g3("3:"), {1, 2}) == Rational{2, 3});
    CHECK(asymptotic_flag_density_fixed(g, g3("2:"), g3("3:"), {1, 1}) == Rational{1});
    CHECK(asymptotic_flag_density_fixed(g, g3("1:"), g3("3:123"), {1}) == Rational{2, 9});
    CHECK(asymptotic_flag_density_fixed(g, g3("0:"), g3("2:"), {}) == Rational{1});

    // type vertices that don't induce the type give nothing
    CHECK(asymptotic_flag_density_fixed(g, g3("3:"), g3("4:"), {1, 2, 3}) == Rational{0});

    CHECK_THROWS_AS(asymptotic_flag_density_fixed(g, g3("2:"), g3("3:"), {1}), InvalidGraph);
}
