#include <flagalg/flag_basis.hh>
#include <flagalg/innards/combinatorics.hh>

#include <algorithm>
#include <map>
#include <string>

using namespace flagalg;
using namespace flagalg::innards;

using std::map;
using std::string;
using std::vector;

auto flagalg::flag_orbits(const Graph3 & type, const vector<Graph3> & flags) -> vector<vector<int>>
{
    int s = type.order();

    vector<vector<int>> type_relabellings;
    for_each_arrangement(vertex_range(1, s), s, [&](const vector<int> & perm) -> bool {
        type_relabellings.push_back(perm);
        return true;
    });

    map<string, vector<int>> orbits_by_smallest;
    for (int i = 0; i < int(flags.size()); ++i) {
        auto & fg = flags[i];
        string smallest = graph_to_string(fg);

        for (auto & perm : type_relabellings) {
            auto perm_plus = perm;
            for (int v = s + 1; v <= fg.order(); ++v)
                perm_plus.push_back(v);

            auto candidate = graph_to_string(canonical_form(relabel(fg, perm_plus), s));
            if (candidate < smallest)
                smallest = candidate;
        }

        orbits_by_smallest[smallest].push_back(i);
    }

    vector<vector<int>> result;
    for (auto & [_, orbit] : orbits_by_smallest)
        result.push_back(orbit);
    std::sort(result.begin(), result.end());
    return result;
}

auto flagalg::flag_basis(const Graph3 & type, const vector<Graph3> & flags, bool orthogonalize) -> RationalMatrix
{
    auto orbits = flag_orbits(type, flags);
    int num_flags = flags.size(), num_orbits = orbits.size();

    RationalMatrix invariant{num_orbits, num_flags};
    for (int row = 0; row < num_orbits; ++row)
        for (auto & j : orbits[row])
            invariant(row, j) = 1;

    if (num_orbits == num_flags)
        return invariant;

    RationalMatrix anti_invariant{num_flags - num_orbits, num_flags};
    int row = 0;
    for (auto & orbit : orbits)
        for (auto j = orbit.begin() + 1; j != orbit.end(); ++j) {
            anti_invariant(row, orbit.front()) = 1;
            anti_invariant(row, *j) = -1;
            ++row;
        }

    if (orthogonalize)
        anti_invariant = anti_invariant.gram_schmidt();

    return block_column({invariant, anti_invariant});
}
