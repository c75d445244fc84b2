#include <flagalg/configuration.hh>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace flagalg;

using std::pair;
using std::string;
using std::vector;

TEST_CASE("forbidden edge numbers from the command line")
{
    CHECK(parse_forbidden_edge_number("4:3") == pair{4, 3});
    CHECK(parse_forbidden_edge_number("12:40") == pair{12, 40});

    CHECK_THROWS_AS(parse_forbidden_edge_number("4"), InvalidConfiguration);
    CHECK_THROWS_AS(parse_forbidden_edge_number("a:3"), InvalidConfiguration);
    CHECK_THROWS_AS(parse_forbidden_edge_number("4:"), InvalidConfiguration);
    CHECK_THROWS_AS(parse_forbidden_edge_number("4:0"), InvalidConfiguration);
    CHECK_THROWS_AS(parse_forbidden_edge_number("-4:3"), InvalidConfiguration);
    CHECK_THROWS_AS(parse_forbidden_edge_number("4:3x"), InvalidConfiguration);
}

TEST_CASE("graphs from the command line")
{
    CHECK(parse_graph_option("--blowup", "3:123") == Graph3{3, {{1, 2, 3}}});
    CHECK_THROWS_AS(parse_graph_option("--blowup", "3:124"), InvalidConfiguration);
    CHECK_THROWS_AS(parse_graph_option("--forbid", "nonsense"), InvalidConfiguration);
}

TEST_CASE("building constraints")
{
    auto c = make_constraints({"4:3", "5:7"}, {"4:123124134"}, {"4:", "5:123"});
    CHECK(c.forbidden_edge_numbers.size() == 2);
    CHECK(c.forbidden_edge_numbers.at(4) == 3);
    CHECK(c.forbidden_edge_numbers.at(5) == 7);
    CHECK(c.forbidden_graphs == vector<Graph3>{Graph3{4, {{1, 2, 3}, {1, 2, 4}, {1, 3, 4}}}});
    CHECK(c.forbidden_induced_graphs.size() == 2);

    auto none = make_constraints({}, {}, {});
    CHECK(none.forbidden_edge_numbers.empty());
    CHECK(none.forbidden_graphs.empty());
    CHECK(none.forbidden_induced_graphs.empty());

    CHECK_THROWS_AS(make_constraints({"4:3", "4:2"}, {}, {}), InvalidConfiguration);
    CHECK_THROWS_AS(make_constraints({}, {"4:12"}, {}), InvalidConfiguration);
    CHECK_THROWS_AS(make_constraints({}, {}, {"x"}), InvalidConfiguration);
}
