#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_CONSTRAINTS_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_CONSTRAINTS_HH 1

#include <flagalg/graph3.hh>

#include <map>
#include <vector>

namespace flagalg
{
    /**
     * What a generated graph may not contain. Passed by reference into every
     * generating or filtering call, never shared globally.
     */
    struct Constraints
    {
        /// An entry (k, v) says that no k vertices may span v or more edges.
        std::map<int, int> forbidden_edge_numbers;

        /// Forbidden as (not necessarily induced) subgraphs.
        std::vector<Graph3> forbidden_graphs;

        /// Forbidden as induced subgraphs.
        std::vector<Graph3> forbidden_induced_graphs;
    };

    /**
     * Does some set of k vertices span too many edges? If must_have_highest
     * is set, only vertex sets containing the highest numbered vertex are
     * considered.
     */
    auto has_forbidden_edge_numbers(const Graph3 & g, const std::map<int, int> & forbidden_edge_numbers,
        bool must_have_highest) -> bool;

    /**
     * Does g contain a copy of any of the given graphs, as a subgraph or, if
     * induced is set, as an induced subgraph? If must_have_highest is set,
     * only copies using the highest numbered vertex are considered.
     */
    auto has_forbidden_graphs(const Graph3 & g, const std::vector<Graph3> & forbidden,
        bool must_have_highest, bool induced) -> bool;

    /**
     * Check all three kinds of constraint.
     */
    auto violates_constraints(const Graph3 & g, const Constraints & constraints, bool must_have_highest) -> bool;
}

#endif
