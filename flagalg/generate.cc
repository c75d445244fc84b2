#include <flagalg/generate.hh>
#include <flagalg/innards/combinatorics.hh>

#include <algorithm>
#include <unordered_set>
#include <utility>

using namespace flagalg;
using namespace flagalg::innards;

using std::pair;
using std::unordered_set;
using std::vector;

namespace
{
    auto extend_by_one_vertex(const vector<Graph3> & smaller_graphs, int n, int type_order,
        const Constraints & constraints) -> vector<Graph3>
    {
        int max_ne = binomial(n - 1, 2);
        int max_e = n * max_ne / 3;

        vector<pair<int, int>> possible_nbrs;
        for_each_combination(vertex_range(1, n - 1), 2, [&](const vector<int> & p) -> bool {
            possible_nbrs.emplace_back(p[0], p[1]);
            return true;
        });

        vector<int> nbr_indices;
        for (int i = 0; i < int(possible_nbrs.size()); ++i)
            nbr_indices.push_back(i);

        vector<Graph3> result;
        unordered_set<Graph3> seen;

        for (auto & sg : smaller_graphs) {
            int pe = sg.number_of_edges();
            auto ds = degrees(sg);

            // The new vertex is a non-type vertex of highest degree
            int maxd = 0;
            for (int v = type_order; v < int(ds.size()); ++v)
                maxd = std::max(maxd, ds[v]);

            for (int ne = maxd; ne <= max_ne && pe + ne <= max_e; ++ne) {
                for_each_combination(nbr_indices, ne, [&](const vector<int> & nb) -> bool {
                    auto edges = sg.edges();
                    for (auto & i : nb)
                        edges.push_back(Edge{possible_nbrs[i].first, possible_nbrs[i].second, n});
                    Graph3 ng{n, std::move(edges)};

                    if (violates_constraints(ng, constraints, true))
                        return true;

                    auto cg = canonical_form(ng, type_order);
                    if (seen.insert(cg).second)
                        result.push_back(std::move(cg));
                    return true;
                });
            }
        }

        return result;
    }
}

auto flagalg::generate_flags(int n, const Graph3 & type, const Constraints & constraints) -> vector<Graph3>
{
    int s = type.order();
    if (n < s)
        return {};

    vector<Graph3> level{type};
    for (int k = s + 1; k <= n; ++k)
        level = extend_by_one_vertex(level, k, s, constraints);

    return level;
}

auto flagalg::generate_graphs(int n, const Constraints & constraints) -> vector<Graph3>
{
    return generate_flags(n, Graph3{}, constraints);
}
