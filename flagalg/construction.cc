#include <flagalg/construction.hh>
#include <flagalg/innards/combinatorics.hh>

#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

using namespace flagalg;
using namespace flagalg::innards;

using std::function;
using std::set;
using std::unordered_map;
using std::vector;

namespace
{
    /**
     * Number of ways of ordering a multiset of parts, given as a
     * non-decreasing sequence.
     */
    auto arrangements_of(const vector<int> & parts) -> unsigned long
    {
        unsigned long result = factorial(int(parts.size()));
        for (decltype(parts.size()) i = 0; i < parts.size();) {
            auto j = i;
            while (j < parts.size() && parts[j] == parts[i])
                ++j;
            result /= factorial(int(j - i));
            i = j;
        }
        return result;
    }

    /**
     * Call f with the canonical graph induced on every multiset of k parts,
     * and the number of ordered k-tuples of parts giving that multiset.
     */
    auto for_each_weighted_subgraph(const Graph3 & g, int k,
        const function<auto(const Graph3 &, unsigned long)->void> & f) -> void
    {
        for_each_multiset(vertex_range(1, g.order()), k, [&](const vector<int> & parts) -> bool {
            f(canonical_form(induced_subgraph(g, parts)), arrangements_of(parts));
            return true;
        });
    }

    auto power(unsigned long base, int exponent) -> unsigned long
    {
        unsigned long result = 1;
        for (int i = 0; i < exponent; ++i)
            result *= base;
        return result;
    }
}

BlowupConstruction::BlowupConstruction(Graph3 g) :
    _graph(std::move(g))
{
}

auto BlowupConstruction::induced_subgraphs(int n) const -> vector<SharpGraph>
{
    vector<Graph3> found;
    vector<unsigned long> counts;
    unordered_map<Graph3, int> index_of;

    for_each_weighted_subgraph(_graph, n, [&](const Graph3 & ig, unsigned long factor) {
        auto [i, inserted] = index_of.emplace(ig, int(found.size()));
        if (inserted) {
            found.push_back(ig);
            counts.push_back(factor);
        }
        else
            counts[i->second] += factor;
    });

    Rational total{power(_graph.order(), n)};
    vector<SharpGraph> result;
    for (decltype(found.size()) i = 0; i < found.size(); ++i)
        result.push_back(SharpGraph{found[i], Rational{counts[i]} / total});

    std::stable_sort(result.begin(), result.end(), [](const SharpGraph & a, const SharpGraph & b) {
        return a.graph.number_of_edges() < b.graph.number_of_edges();
    });

    return result;
}

auto BlowupConstruction::zero_eigenvectors(const Graph3 & type, const vector<Graph3> & flags,
    const RationalMatrix & basis) const -> RationalMatrix
{
    if (basis.cols() != int(flags.size()))
        throw MatrixShapeError{"basis has " + std::to_string(basis.cols()) + " columns but there are "
            + std::to_string(flags.size()) + " flags"};

    set<vector<Rational>> distinct_rows;
    for_each_tuple(vertex_range(1, _graph.order()), type.order(), [&](const vector<int> & tv) -> bool {
        vector<Rational> row;
        row.reserve(flags.size());
        for (auto & f : flags)
            row.push_back(asymptotic_flag_density_fixed(_graph, type, f, tv));
        distinct_rows.insert(std::move(row));
        return true;
    });

    auto m = RationalMatrix::from_rows(vector<vector<Rational>>(distinct_rows.begin(), distinct_rows.end()),
                 flags.size()) * basis.transpose();

    int rank = m.rank();
    if (0 == rank)
        return RationalMatrix{0, basis.rows()};

    return m.echelon_form().row_range(0, rank);
}

auto BlowupConstruction::edge_density() const -> Rational
{
    return subgraph_density(Graph3{3, {Edge{1, 2, 3}}});
}

auto BlowupConstruction::subgraph_density(const Graph3 & h) const -> Rational
{
    auto target = canonical_form(h);
    unsigned long found = 0;

    for_each_weighted_subgraph(_graph, h.order(), [&](const Graph3 & ig, unsigned long factor) {
        if (ig == target)
            found += factor;
    });

    auto total = power(_graph.order(), h.order());
    if (0 == total)
        return Rational{0};
    return Rational{found} / Rational{total};
}
