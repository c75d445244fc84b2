#include <flagalg/constraints.hh>
#include <flagalg/innards/combinatorics.hh>

#include <boost/dynamic_bitset.hpp>

using namespace flagalg;
using namespace flagalg::innards;

using boost::dynamic_bitset;

using std::map;
using std::vector;

namespace
{
    /**
     * Which vertex triples are edges, indexed by the sorted triple. Only
     * proper edges are recorded.
     */
    class EdgeTable
    {
    private:
        int _n;
        dynamic_bitset<> _bits;

        auto index(int a, int b, int c) const -> dynamic_bitset<>::size_type
        {
            if (a > b) std::swap(a, b);
            if (b > c) std::swap(b, c);
            if (a > b) std::swap(a, b);
            return ((a - 1) * _n + (b - 1)) * _n + (c - 1);
        }

    public:
        explicit EdgeTable(const Graph3 & g) :
            _n(g.order()),
            _bits(g.order() * g.order() * g.order())
        {
            for (auto & e : g.edges())
                if (e[0] != e[1] && e[1] != e[2] && e[0] != e[2])
                    _bits.set(index(e[0], e[1], e[2]));
        }

        auto adjacent(int a, int b, int c) const -> bool
        {
            return _bits.test(index(a, b, c));
        }
    };

    /**
     * Every k-subset of 1..n, or every k-subset containing n.
     */
    auto for_each_vertex_set(int n, int k, bool must_have_highest, const SelectionCallback & f) -> bool
    {
        if (k > n || k < 1)
            return true;

        if (! must_have_highest)
            return for_each_combination(vertex_range(1, n), k, f);

        return for_each_combination(vertex_range(1, n - 1), k - 1, [&](const vector<int> & rest) -> bool {
            auto vertices = rest;
            vertices.push_back(n);
            return f(vertices);
        });
    }
}

auto flagalg::has_forbidden_edge_numbers(const Graph3 & g, const map<int, int> & forbidden_edge_numbers,
    bool must_have_highest) -> bool
{
    int n = g.order();
    vector<bool> in_set(n + 1, false);

    for (auto & [k, max_edges] : forbidden_edge_numbers) {
        bool ok = for_each_vertex_set(n, k, must_have_highest, [&](const vector<int> & vertices) -> bool {
            std::fill(in_set.begin(), in_set.end(), false);
            for (auto & v : vertices)
                in_set[v] = true;

            int spanned = 0;
            for (auto & e : g.edges())
                if (in_set[e[0]] && in_set[e[1]] && in_set[e[2]])
                    ++spanned;

            return spanned < max_edges;
        });

        if (! ok)
            return true;
    }

    return false;
}

auto flagalg::has_forbidden_graphs(const Graph3 & g, const vector<Graph3> & forbidden,
    bool must_have_highest, bool induced) -> bool
{
    if (forbidden.empty())
        return false;

    EdgeTable table{g};

    for (auto & h : forbidden) {
        bool ok;
        if (induced) {
            auto target = canonical_form(h);
            ok = for_each_vertex_set(g.order(), h.order(), must_have_highest, [&](const vector<int> & vertices) -> bool {
                auto sub = induced_subgraph(g, vertices);
                return sub.number_of_edges() != target.number_of_edges() || ! (canonical_form(sub) == target);
            });
        }
        else {
            ok = for_each_vertex_set(g.order(), h.order(), must_have_highest, [&](const vector<int> & vertices) -> bool {
                return for_each_arrangement(vertices, h.order(), [&](const vector<int> & image) -> bool {
                    for (auto & e : h.edges())
                        if (! table.adjacent(image[e[0] - 1], image[e[1] - 1], image[e[2] - 1]))
                            return true;
                    return false;
                });
            });
        }

        if (! ok)
            return true;
    }

    return false;
}

auto flagalg::violates_constraints(const Graph3 & g, const Constraints & constraints, bool must_have_highest) -> bool
{
    return has_forbidden_edge_numbers(g, constraints.forbidden_edge_numbers, must_have_highest)
        || has_forbidden_graphs(g, constraints.forbidden_graphs, must_have_highest, false)
        || has_forbidden_graphs(g, constraints.forbidden_induced_graphs, must_have_highest, true);
}
