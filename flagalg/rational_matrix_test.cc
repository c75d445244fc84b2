#include <flagalg/rational_matrix.hh>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace flagalg;

using std::vector;

namespace
{
    auto matrix(const vector<vector<Rational>> & rows) -> RationalMatrix
    {
        return RationalMatrix::from_rows(rows, rows.empty() ? 0 : int(rows.front().size()));
    }

    auto dot_rows(const RationalMatrix & m, int a, int b) -> Rational
    {
        Rational result;
        for (int c = 0; c < m.cols(); ++c)
            result += m(a, c) * m(b, c);
        return result;
    }
}

TEST_CASE("rational arithmetic")
{
    Rational half{1, 2}, third{1, 3};
    CHECK(half + third == Rational{5, 6});
    CHECK(half - third == Rational{1, 6});
    CHECK(half * third == Rational{1, 6});
    CHECK(half / third == Rational{3, 2});
    CHECK(Rational{2, -4} == -half);
    CHECK(third < half);
    CHECK(Rational{6, 4}.to_string() == "3/2");
    CHECK(Rational{-5}.to_string() == "-5");
    CHECK(half.to_decimal_string(10) == "0.5");
    CHECK(half.to_double() == 0.5);
    CHECK(abs(-half) == half);
    CHECK(abs(half) == half);
    CHECK_THROWS_AS(Rational(1, 0), InvalidRational);
}

TEST_CASE("rational parsing")
{
    CHECK(Rational::from_string("3/4") == Rational{3, 4});
    CHECK(Rational::from_string("-6/8") == Rational{-3, 4});
    CHECK(Rational::from_string("7") == Rational{7});
    CHECK(! Rational::from_string(""));
    CHECK(! Rational::from_string("1/0"));
    CHECK(! Rational::from_string("1/"));
    CHECK(! Rational::from_string("x"));
    CHECK(! Rational::from_string("1/-2"));
    CHECK(! Rational::from_string("-"));
    CHECK(! Rational::from_string("1 2"));
    CHECK(! Rational::from_string(" 7"));
    CHECK(! Rational::from_string("7 "));
    CHECK(! Rational::from_string("3\t/4"));
    CHECK(! Rational::from_string("3/ 4"));
    CHECK(! Rational::from_string("+3"));
}

TEST_CASE("matrix products and transposes")
{
    auto a = matrix({{1, 2}, {3, 4}, {5, 6}});
    auto b = matrix({{1, 0, 1}, {0, 1, Rational{1, 2}}});

    auto ab = a * b;
    CHECK(ab == matrix({{1, 2, 2}, {3, 4, 5}, {5, 6, 8}}));
    CHECK(a.transpose() == matrix({{1, 3, 5}, {2, 4, 6}}));
    CHECK_THROWS_AS(a * a, MatrixShapeError);
    CHECK_THROWS_AS(RationalMatrix(-1, 2), MatrixShapeError);
    CHECK(RationalMatrix::identity(2) * b == b);
}

TEST_CASE("echelon form, rank and kernel")
{
    auto m = matrix({{1, 2, 3}, {2, 4, 6}, {1, 0, 1}});

    CHECK(m.rank() == 2);
    CHECK(m.echelon_form() == matrix({{1, 0, 1}, {0, 1, 1}, {0, 0, 0}}));

    auto k = m.right_kernel_basis();
    CHECK(k.rows() == 1);
    CHECK(k.cols() == 3);
    CHECK((m * k.transpose()).is_zero());

    CHECK(RationalMatrix{2, 3}.rank() == 0);
    CHECK(RationalMatrix{2, 3}.right_kernel_basis().rows() == 3);
    CHECK(RationalMatrix::identity(3).right_kernel_basis().rows() == 0);
    CHECK(RationalMatrix::identity(3).right_kernel_basis().cols() == 3);
    CHECK(RationalMatrix{0, 4}.right_kernel_basis() == RationalMatrix::identity(4));
    CHECK(RationalMatrix{0, 4}.rank() == 0);
}

TEST_CASE("rank and kernel are exact")
{
    // tiny and huge entries that a floating point threshold would lose
    auto m = matrix({{1, Rational{1, 1000000000}, 0, 0},
        {2, Rational{2, 1000000000}, Rational{1, 1000000000}, 0},
        {1000000000, 1, 0, 1}});

    CHECK(m.rank() == 3);
    auto k = m.right_kernel_basis();
    CHECK(k.rows() == 1);
    CHECK((m * k.transpose()).is_zero());
    CHECK(! k.is_zero());

    auto dependent = matrix({{Rational{1, 3}, Rational{2, 7}}, {Rational{7, 3}, 2}});
    CHECK(dependent.rank() == 1);
    auto dk = dependent.right_kernel_basis();
    REQUIRE(dk.rows() == 1);
    CHECK(dk(0, 0) * Rational{1, 3} + dk(0, 1) * Rational{2, 7} == 0);
    CHECK(! dk.is_zero());

    auto wide = matrix({{1, 2, 3, 4}, {2, 4, 6, 8}});
    CHECK(wide.rank() == 1);
    CHECK(wide.right_kernel_basis().rows() == 3);
    CHECK(wide.right_kernel_basis().rank() == 3);
}

TEST_CASE("gram schmidt")
{
    auto m = matrix({{1, 1, 0}, {1, 0, 1}, {2, 1, 1}, {0, 0, 1}});
    auto g = m.gram_schmidt();

    // the third row is the sum of the first two, so goes away
    CHECK(g.rows() == 3);
    CHECK(g.row(0) == m.row(0));
    for (int a = 0; a < g.rows(); ++a)
        for (int b = a + 1; b < g.rows(); ++b)
            CHECK(dot_rows(g, a, b).is_zero());

    CHECK(g.rank() == m.rank());
}

TEST_CASE("subdivisions and blocks")
{
    auto a = matrix({{1, 2}, {3, 4}});
    auto b = matrix({{5}});

    auto d = block_diagonal({a, b});
    CHECK(d.rows() == 3);
    CHECK(d.cols() == 3);
    CHECK(d.row_subdivisions() == vector<int>{2});
    CHECK(d.column_subdivisions() == vector<int>{2});
    CHECK(d.subdivision(0, 0) == a);
    CHECK(d.subdivision(1, 1) == b);
    CHECK(d.subdivision(0, 1).is_zero());
    CHECK(d.row_block_sizes() == vector<int>{2, 1});

    auto c = block_column({a, matrix({{7, 8}})});
    CHECK(c.rows() == 3);
    CHECK(c.row_subdivisions() == vector<int>{2});
    CHECK(c.column_subdivisions().empty());
    CHECK(c.subdivision(1, 0) == matrix({{7, 8}}));
    CHECK_THROWS_AS(c.subdivision(2, 0), MatrixShapeError);

    auto with_empty = block_diagonal({RationalMatrix{0, 2}, b});
    CHECK(with_empty.rows() == 1);
    CHECK(with_empty.cols() == 3);
    CHECK(with_empty.subdivision(0, 0).rows() == 0);
    CHECK(with_empty.subdivision(1, 1) == b);

    auto s = a;
    CHECK_THROWS_AS(s.subdivide({3}, {}), MatrixShapeError);
    CHECK(s == a);
    s.subdivide({1}, {1});
    CHECK(! (s == a));
    CHECK(s.transpose().row_subdivisions() == vector<int>{1});
}
