#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_CONSTRUCTION_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_CONSTRUCTION_HH 1

#include <flagalg/graph3.hh>
#include <flagalg/rational.hh>
#include <flagalg/rational_matrix.hh>

#include <vector>

namespace flagalg
{
    /**
     * A graph occurring in a construction, together with the limiting
     * proportion of vertex sets of its order that induce it.
     */
    struct SharpGraph
    {
        Graph3 graph;
        Rational density;
    };

    /**
     * A sequence of graphs that is believed to be extremal. A construction
     * tells us which small graphs it contains, and which directions in each
     * type's flag space must be zero eigenvectors of any tight certificate.
     */
    class Construction
    {
    public:
        virtual ~Construction() = default;

        /**
         * The canonical n-vertex graphs with non-zero density in the
         * construction, ordered by number of edges.
         */
        virtual auto induced_subgraphs(int n) const -> std::vector<SharpGraph> = 0;

        /**
         * A matrix whose rows span the zero eigenvectors for the given type,
         * expressed in terms of the rows of basis (so it has basis.rows()
         * columns). May have no rows.
         */
        virtual auto zero_eigenvectors(const Graph3 & type, const std::vector<Graph3> & flags,
            const RationalMatrix & basis) const -> RationalMatrix = 0;

        virtual auto edge_density() const -> Rational = 0;

        virtual auto subgraph_density(const Graph3 & h) const -> Rational = 0;
    };

    /**
     * The balanced blow-up of a graph: each vertex becomes a part of equal
     * size, and every triple of vertices from three parts forming an edge is
     * an edge. Triples with two or more vertices in one part are edges
     * exactly when the graph has a degenerate edge repeating that vertex.
     */
    class BlowupConstruction final : public Construction
    {
    private:
        Graph3 _graph;

    public:
        explicit BlowupConstruction(Graph3 g);

        auto graph() const -> const Graph3 &
        {
            return _graph;
        }

        virtual auto induced_subgraphs(int n) const -> std::vector<SharpGraph> override;

        virtual auto zero_eigenvectors(const Graph3 & type, const std::vector<Graph3> & flags,
            const RationalMatrix & basis) const -> RationalMatrix override;

        virtual auto edge_density() const -> Rational override;

        virtual auto subgraph_density(const Graph3 & h) const -> Rational override;
    };
}

#endif
