#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_INNARDS_COMBINATORICS_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_INNARDS_COMBINATORICS_HH 1

#include <functional>
#include <vector>

namespace flagalg::innards
{
    /**
     * Callbacks return false to stop the enumeration early, in which case the
     * enumerating function also returns false.
     */
    using SelectionCallback = std::function<auto(const std::vector<int> &)->bool>;

    /**
     * Every k-subset of items, preserving the order of items, in
     * lexicographic order of positions.
     */
    auto for_each_combination(const std::vector<int> & items, int k, const SelectionCallback &) -> bool;

    /**
     * Every ordered selection of k distinct elements of items, in
     * lexicographic order of positions.
     */
    auto for_each_arrangement(const std::vector<int> & items, int k, const SelectionCallback &) -> bool;

    /**
     * Every sequence of length k drawn from items with repetition.
     */
    auto for_each_tuple(const std::vector<int> & items, int k, const SelectionCallback &) -> bool;

    /**
     * Every multiset of size k drawn from items, as a non-decreasing sequence
     * of positions mapped back to items.
     */
    auto for_each_multiset(const std::vector<int> & items, int k, const SelectionCallback &) -> bool;

    auto binomial(int n, int k) -> unsigned long;

    auto falling_factorial(int n, int k) -> unsigned long;

    auto factorial(int n) -> unsigned long;

    /**
     * The vertices first, first + 1, ..., last.
     */
    auto vertex_range(int first, int last) -> std::vector<int>;
}

#endif
