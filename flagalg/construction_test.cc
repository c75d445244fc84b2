#include <flagalg/construction.hh>
#include <flagalg/generate.hh>

#include <catch2/catch_test_macros.hpp>

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
}

TEST_CASE("blow-up densities")
{
    BlowupConstruction edge{g3("3:123")};

    CHECK(edge.edge_density() == Rational{2, 9});
    CHECK(edge.subgraph_density(g3("3:")) == Rational{7, 9});
    CHECK(edge.subgraph_density(g3("4:123124")) == Rational{4, 9});
    CHECK(edge.subgraph_density(g3("4:134124")) == Rational{4, 9});
    CHECK(edge.subgraph_density(g3("4:123")).is_zero());

    BlowupConstruction nothing{g3("2:")};
    CHECK(nothing.edge_density().is_zero());
    CHECK(nothing.subgraph_density(g3("3:")) == Rational{1});

    BlowupConstruction k4{g3("4:123124134234")};
    CHECK(k4.edge_density() == Rational{3, 8});
}

TEST_CASE("blow-up induced subgraphs")
{
    BlowupConstruction edge{g3("3:123")};

    SECTION("on three vertices")
    {
        auto sharp = edge.induced_subgraphs(3);
        REQUIRE(sharp.size() == 2);
        CHECK(sharp[0].graph == g3("3:"));
        CHECK(sharp[0].density == Rational{7, 9});
        CHECK(sharp[1].graph == g3("3:123"));
        CHECK(sharp[1].density == Rational{2, 9});
    }

    SECTION("on four vertices")
    {
        auto sharp = edge.induced_subgraphs(4);
        REQUIRE(sharp.size() == 2);
        CHECK(graph_to_string(sharp[0].graph) == "4:");
        CHECK(sharp[0].density == Rational{5, 9});
        CHECK(graph_to_string(sharp[1].graph) == "4:123124");
        CHECK(sharp[1].density == Rational{4, 9});
    }

    SECTION("densities add up")
    {
        Rational total;
        for (auto & sg : edge.induced_subgraphs(5)) {
            CHECK(canonical_form(sg.graph) == sg.graph);
            CHECK(edge.subgraph_density(sg.graph) == sg.density);
            total += sg.density;
        }
        CHECK(total == Rational{1});
    }
}

TEST_CASE("blow-up zero eigenvectors")
{
    BlowupConstruction edge{g3("3:123")};

    SECTION("empty type")
    {
        auto flags = generate_flags(2, g3("0:"), Constraints{});
        REQUIRE(flags.size() == 1);
        auto z = edge.zero_eigenvectors(g3("0:"), flags, RationalMatrix::identity(1));
        CHECK(z == RationalMatrix::identity(1));
    }

    SECTION("one vertex type")
    {
        auto flags = generate_flags(3, g3("1:"), Constraints{});
        auto z = edge.zero_eigenvectors(g3("1:"), flags, RationalMatrix::identity(2));
        REQUIRE(z.rows() == 1);
        CHECK(z.cols() == 2);

        vector<Rational> densities;
        for (auto & f : flags)
            densities.push_back(asymptotic_flag_density_fixed(g3("3:123"), g3("1:"), f, {1}));
        CHECK(z(0, 0) * densities[1] == z(0, 1) * densities[0]);
    }

    SECTION("two vertex type")
    {
        auto flags = generate_flags(3, g3("2:"), Constraints{});
        auto z = edge.zero_eigenvectors(g3("2:"), flags, RationalMatrix::identity(2));
        CHECK(z == RationalMatrix::identity(2));
    }

    SECTION("in terms of a smaller basis")
    {
        auto flags = generate_flags(3, g3("1:"), Constraints{});
        auto basis = RationalMatrix::from_rows({{1, 1}}, 2);
        auto z = edge.zero_eigenvectors(g3("1:"), flags, basis);
        CHECK(z == RationalMatrix::identity(1));

        auto none = edge.zero_eigenvectors(g3("1:"), flags, RationalMatrix{0, 2});
        CHECK(none.rows() == 0);
        CHECK(none.cols() == 0);

        CHECK_THROWS_AS(edge.zero_eigenvectors(g3("1:"), flags, RationalMatrix::identity(3)), MatrixShapeError);
    }
}
