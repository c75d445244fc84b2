#include <flagalg/graph3.hh>
#include <flagalg/innards/combinatorics.hh>

#include <algorithm>
#include <numeric>
#include <utility>

using namespace flagalg;
using namespace flagalg::innards;

using std::move;
using std::nullopt;
using std::optional;
using std::size_t;
using std::sort;
using std::string;
using std::string_view;
using std::to_string;
using std::vector;

InvalidGraph::InvalidGraph(const string & message) noexcept :
    _what("Invalid 3-graph: " + message)
{
}

auto InvalidGraph::what() const noexcept -> const char *
{
    return _what.c_str();
}

namespace
{
    template <class T>
    inline void hash_combine(size_t & seed, const T & v)
    {
        std::hash<T> hasher;
        seed ^= hasher(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }

    auto sorted_edge(int a, int b, int c) -> Edge
    {
        if (a > b) std::swap(a, b);
        if (b > c) std::swap(b, c);
        if (a > b) std::swap(a, b);
        return Edge{a, b, c};
    }

    auto normalise(vector<Edge> & edges) -> void
    {
        for (auto & e : edges)
            e = sorted_edge(e[0], e[1], e[2]);
        sort(edges.begin(), edges.end());
    }

    auto is_normalised(const vector<Edge> & edges) -> bool
    {
        for (decltype(edges.size()) i = 0; i < edges.size(); ++i) {
            auto & e = edges[i];
            if (e[0] > e[1] || e[1] > e[2])
                return false;
            if (i > 0 && edges[i] < edges[i - 1])
                return false;
        }
        return true;
    }
}

Graph3::Graph3(int n, vector<Edge> edges) :
    _n(n),
    _edges(move(edges))
{
    if (n < 0)
        throw InvalidGraph{"negative order " + to_string(n)};

    for (auto & e : _edges)
        for (auto & v : e)
            if (v < 1 || v > n)
                throw InvalidGraph{"vertex " + to_string(v) + " is not in 1.." + to_string(n)};

    _normalised = is_normalised(_edges);
}

auto Graph3::normalised_edges() const -> vector<Edge>
{
    auto result = _edges;
    if (! _normalised)
        normalise(result);
    return result;
}

auto Graph3::degenerate() const -> bool
{
    return std::any_of(_edges.begin(), _edges.end(), [](const Edge & e) {
        return e[0] == e[1] || e[1] == e[2] || e[0] == e[2];
    });
}

auto Graph3::operator==(const Graph3 & other) const -> bool
{
    if (_n != other._n || _edges.size() != other._edges.size())
        return false;
    if (_normalised && other._normalised)
        return _edges == other._edges;
    return normalised_edges() == other.normalised_edges();
}

auto Graph3::hash() const -> size_t
{
    size_t result = 0;
    hash_combine(result, _n);
    for (auto & e : normalised_edges())
        for (auto & v : e)
            hash_combine(result, v);
    return result;
}

auto flagalg::string_to_graph(string_view s) -> optional<Graph3>
{
    if (s.size() < 2 || s[1] != ':')
        return nullopt;

    auto digit = [](char c) -> int {
        return (c >= '0' && c <= '9') ? c - '0' : -1;
    };

    int n = digit(s[0]);
    if (n < 0)
        return nullopt;

    auto e = s.size() - 2;
    if (e % 3 != 0)
        return nullopt;

    vector<Edge> edges;
    for (decltype(e) i = 0; i < e / 3; ++i) {
        Edge edge;
        for (int j = 0; j < 3; ++j) {
            int x = digit(s[3 * i + j + 2]);
            if (x < 1 || x > n)
                return nullopt;
            edge[j] = x;
        }
        edges.push_back(edge);
    }

    return Graph3{n, move(edges)};
}

auto flagalg::graph_to_string(const Graph3 & g) -> string
{
    string result = to_string(g.order()) + ":";
    for (auto & e : g.edges())
        for (auto & v : e)
            result += to_string(v);
    return result;
}

auto flagalg::degrees(const Graph3 & g) -> vector<int>
{
    vector<int> result(g.order(), 0);
    for (auto & e : g.edges())
        for (int x = 1; x <= g.order(); ++x)
            if (e[0] == x || e[1] == x || e[2] == x)
                ++result[x - 1];
    return result;
}

auto flagalg::relabel(const Graph3 & g, const vector<int> & perm) -> Graph3
{
    if (int(perm.size()) != g.order())
        throw InvalidGraph{"relabelling of size " + to_string(perm.size()) + " for a graph of order " + to_string(g.order())};

    vector<Edge> edges;
    edges.reserve(g.edges().size());
    for (auto & e : g.edges())
        edges.push_back(Edge{perm[e[0] - 1], perm[e[1] - 1], perm[e[2] - 1]});
    return Graph3{g.order(), move(edges)};
}

auto flagalg::split_vertex(const Graph3 & g, int x) -> Graph3
{
    int y = g.order() + 1;
    vector<Edge> edges = g.edges();

    for (auto & e : g.edges()) {
        vector<int> others;
        for (auto & v : e)
            if (v != x)
                others.push_back(v);

        switch (3 - others.size()) {
        case 1:
            edges.push_back(Edge{others[0], others[1], y});
            break;
        case 2:
            edges.push_back(Edge{others[0], x, y});
            edges.push_back(Edge{others[0], y, y});
            break;
        case 3:
            edges.push_back(Edge{x, x, y});
            edges.push_back(Edge{x, y, y});
            edges.push_back(Edge{y, y, y});
            break;
        }
    }

    return Graph3{y, move(edges)};
}

auto flagalg::delete_improper_edges(const Graph3 & g) -> Graph3
{
    vector<Edge> edges;
    for (auto & e : g.edges())
        if (e[0] != e[1] && e[1] != e[2] && e[0] != e[2])
            edges.push_back(e);
    return Graph3{g.order(), move(edges)};
}

auto flagalg::induced_subgraph(const Graph3 & g, const vector<int> & vertices) -> Graph3
{
    Graph3 h = g;
    vector<int> chosen;
    for (auto & x : vertices) {
        if (chosen.end() == std::find(chosen.begin(), chosen.end(), x))
            chosen.push_back(x);
        else {
            h = split_vertex(h, x);
            chosen.push_back(h.order());
        }
    }

    vector<int> position(h.order() + 1, 0);
    for (decltype(chosen.size()) i = 0; i < chosen.size(); ++i)
        position[chosen[i]] = i + 1;

    vector<Edge> edges;
    for (auto & e : h.edges())
        if (position[e[0]] && position[e[1]] && position[e[2]])
            edges.push_back(Edge{position[e[0]], position[e[1]], position[e[2]]});
    normalise(edges);

    return delete_improper_edges(Graph3{int(chosen.size()), move(edges)});
}

auto flagalg::canonical_form(const Graph3 & g, int type_order) -> Graph3
{
    int n = g.order();
    auto best = g.normalised_edges();
    if (type_order >= n - 1 || best.empty())
        return Graph3{n, move(best)};

    vector<int> perm(n + 1);
    std::iota(perm.begin(), perm.end(), 0);

    vector<Edge> candidate(best.size());
    while (std::next_permutation(perm.begin() + type_order + 1, perm.end())) {
        for (decltype(best.size()) i = 0; i < best.size(); ++i) {
            auto & e = g.edges()[i];
            candidate[i] = sorted_edge(perm[e[0]], perm[e[1]], perm[e[2]]);
        }
        sort(candidate.begin(), candidate.end());
        if (candidate < best)
            best = candidate;
    }

    return Graph3{n, move(best)};
}

auto flagalg::edge_density(const Graph3 & g) -> Rational
{
    auto total = binomial(g.order(), 3);
    if (0 == total)
        return Rational{0};
    return Rational{static_cast<unsigned long>(g.number_of_edges())} / Rational{total};
}

auto flagalg::subgraph_density(const Graph3 & g, const Graph3 & h) -> Rational
{
    auto target = canonical_form(h);
    unsigned long found = 0, total = 0;

    for_each_combination(vertex_range(1, g.order()), h.order(), [&](const vector<int> & hv) -> bool {
        if (target == canonical_form(induced_subgraph(g, hv)))
            ++found;
        ++total;
        return true;
    });

    if (0 == total)
        return Rational{0};
    return Rational{found} / Rational{total};
}

auto flagalg::asymptotic_flag_density_fixed(const Graph3 & g, const Graph3 & t, const Graph3 & f,
    const vector<int> & tv) -> Rational
{
    int s = t.order(), m = f.order();
    if (int(tv.size()) != s)
        throw InvalidGraph{"type placement has " + to_string(tv.size()) + " vertices, expected " + to_string(s)};

    unsigned long count = 0, total = 0;
    bool type_matches = induced_subgraph(g, tv) == t;

    for_each_tuple(vertex_range(1, g.order()), m - s, [&](const vector<int> & pf) -> bool {
        ++total;
        if (type_matches) {
            auto p = tv;
            p.insert(p.end(), pf.begin(), pf.end());
            if (f == canonical_form(induced_subgraph(g, p), s))
                ++count;
        }
        return true;
    });

    if (0 == total)
        return Rational{0};
    return Rational{count} / Rational{total};
}
