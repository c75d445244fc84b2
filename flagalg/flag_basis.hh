#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_FLAG_BASIS_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_FLAG_BASIS_HH 1

#include <flagalg/graph3.hh>
#include <flagalg/rational_matrix.hh>

#include <vector>

namespace flagalg
{
    /**
     * Groups of indices into flags, such that two flags are in the same
     * group exactly when relabelling the type vertices takes one to the
     * other. Every index appears in exactly one group. Groups are listed in
     * increasing order of their first index, and each group is increasing.
     */
    auto flag_orbits(const Graph3 & type, const std::vector<Graph3> & flags) -> std::vector<std::vector<int>>;

    /**
     * A change of basis for the flags of a type, split into an invariant
     * block (one row per orbit, the orbit's indicator vector) and an
     * anti-invariant block (first member minus each other member, for each
     * orbit). The result is subdivided after the invariant block, unless
     * every orbit is a singleton, in which case there is no anti-invariant
     * block and no subdivision.
     *
     * If orthogonalize is set, the anti-invariant rows are orthogonalised
     * among themselves.
     */
    auto flag_basis(const Graph3 & type, const std::vector<Graph3> & flags, bool orthogonalize = true) -> RationalMatrix;
}

#endif
