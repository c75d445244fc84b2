#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_GRAPH3_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_GRAPH3_HH 1

#include <flagalg/rational.hh>

#include <array>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flagalg
{
    /**
     * Thrown if we try to build a graph with a negative order, or with an
     * edge that mentions a vertex outside 1..n.
     */
    class InvalidGraph : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit InvalidGraph(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    using Edge = std::array<int, 3>;

    /**
     * A 3-graph on the vertices 1..n. Edges are kept in the order they were
     * given, so that the string notation round-trips, but identity is by
     * content: two graphs are equal if they have the same order and the same
     * multiset of edges, ignoring the order of vertices within an edge.
     *
     * Edges may repeat a vertex. Such degenerate edges only arise while
     * realising blow-ups, and are removed by delete_improper_edges().
     */
    class Graph3
    {
    private:
        int _n = 0;
        std::vector<Edge> _edges;
        bool _normalised = true;

    public:
        Graph3() = default;

        /**
         * \throw InvalidGraph
         */
        explicit Graph3(int n, std::vector<Edge> edges = {});

        auto order() const -> int
        {
            return _n;
        }

        auto edges() const -> const std::vector<Edge> &
        {
            return _edges;
        }

        auto number_of_edges() const -> int
        {
            return int(_edges.size());
        }

        /**
         * Each edge with its vertices sorted, and the edges sorted.
         */
        auto normalised_edges() const -> std::vector<Edge>;

        /**
         * Do we contain an edge that repeats a vertex?
         */
        auto degenerate() const -> bool;

        auto operator==(const Graph3 &) const -> bool;

        auto hash() const -> std::size_t;
    };

    /**
     * Parse the "n:abcdef..." notation. Returns nullopt if the string is
     * malformed, or if a vertex is out of range.
     */
    auto string_to_graph(std::string_view) -> std::optional<Graph3>;

    auto graph_to_string(const Graph3 &) -> std::string;

    /**
     * The number of edges containing each vertex 1..n, as a zero-indexed
     * list.
     */
    auto degrees(const Graph3 &) -> std::vector<int>;

    /**
     * Rename every vertex v to perm[v - 1]. The type (if any) is not
     * special: callers wanting to preserve it must fix it themselves.
     */
    auto relabel(const Graph3 &, const std::vector<int> & perm) -> Graph3;

    /**
     * Add a new vertex n + 1 that is a copy of x, including copies of edges
     * that would contain x more than once.
     */
    auto split_vertex(const Graph3 &, int x) -> Graph3;

    /**
     * Drop every edge which does not have three distinct vertices.
     */
    auto delete_improper_edges(const Graph3 &) -> Graph3;

    /**
     * The graph induced on an ordered list of vertices, with vertex
     * vertices[i] becoming i + 1. Repeated vertices are realised by
     * splitting, and the improper edges this creates are deleted.
     */
    auto induced_subgraph(const Graph3 &, const std::vector<int> & vertices) -> Graph3;

    /**
     * The lexicographically smallest normalised edge list obtainable by
     * permuting vertices type_order + 1..n, keeping 1..type_order fixed.
     * Ties go to the earliest permutation in lexicographic order.
     */
    auto canonical_form(const Graph3 &, int type_order = 0) -> Graph3;

    /**
     * Number of edges over n choose 3, or zero if n < 3.
     */
    auto edge_density(const Graph3 &) -> Rational;

    /**
     * The proportion of h.order()-sets of vertices of g that induce a graph
     * isomorphic to h.
     */
    auto subgraph_density(const Graph3 & g, const Graph3 & h) -> Rational;

    /**
     * With the type t pinned to the (possibly repeating) vertices tv of g,
     * the probability that choosing the remaining f.order() - t.order()
     * vertices uniformly with repetition yields the flag f. The flag f must be
     * in canonical form relative to t.
     */
    auto asymptotic_flag_density_fixed(const Graph3 & g, const Graph3 & t, const Graph3 & f,
        const std::vector<int> & tv) -> Rational;
}

template <>
struct std::hash<flagalg::Graph3>
{
    auto operator()(const flagalg::Graph3 & g) const -> std::size_t
    {
        return g.hash();
    }
};

#endif
