#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_GENERATE_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_GENERATE_HH 1

#include <flagalg/constraints.hh>
#include <flagalg/graph3.hh>

#include <vector>

namespace flagalg
{
    /**
     * Every flag of the given type on n vertices that satisfies the
     * constraints, one per isomorphism class (relative to the type), each in
     * canonical form. Vertices 1..type.order() of every flag carry the type.
     *
     * The flags are built one vertex at a time. A flag on k vertices is
     * obtained from one on k - 1 vertices by adding vertex k together with
     * some of the edges through it; only vertex sets containing vertex k
     * need their constraints re-checking.
     *
     * Returns an empty list if n is less than the order of the type.
     */
    auto generate_flags(int n, const Graph3 & type, const Constraints & constraints) -> std::vector<Graph3>;

    /**
     * Every 3-graph on n vertices satisfying the constraints, up to
     * isomorphism.
     */
    auto generate_graphs(int n, const Constraints & constraints) -> std::vector<Graph3>;
}

#endif
