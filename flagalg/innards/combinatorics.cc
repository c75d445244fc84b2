#include <flagalg/innards/combinatorics.hh>

#include <numeric>

using namespace flagalg::innards;

using std::vector;

namespace
{
    auto arrange(const vector<int> & items, int k, vector<int> & current, vector<bool> & used, const SelectionCallback & f) -> bool
    {
        if (int(current.size()) == k)
            return f(current);

        for (decltype(items.size()) i = 0; i < items.size(); ++i) {
            if (used[i])
                continue;
            used[i] = true;
            current.push_back(items[i]);
            bool keep_going = arrange(items, k, current, used, f);
            current.pop_back();
            used[i] = false;
            if (! keep_going)
                return false;
        }

        return true;
    }
}

auto flagalg::innards::for_each_combination(const vector<int> & items, int k, const SelectionCallback & f) -> bool
{
    int n = items.size();
    if (k < 0 || k > n)
        return true;

    vector<int> positions(k), current(k);
    std::iota(positions.begin(), positions.end(), 0);

    while (true) {
        for (int i = 0; i < k; ++i)
            current[i] = items[positions[i]];
        if (! f(current))
            return false;

        int i = k - 1;
        while (i >= 0 && positions[i] == n - k + i)
            --i;
        if (i < 0)
            return true;

        ++positions[i];
        for (int j = i + 1; j < k; ++j)
            positions[j] = positions[j - 1] + 1;
    }
}

auto flagalg::innards::for_each_arrangement(const vector<int> & items, int k, const SelectionCallback & f) -> bool
{
    if (k < 0 || k > int(items.size()))
        return true;

    vector<int> current;
    vector<bool> used(items.size(), false);
    return arrange(items, k, current, used, f);
}

auto flagalg::innards::for_each_tuple(const vector<int> & items, int k, const SelectionCallback & f) -> bool
{
    if (k < 0 || (items.empty() && k > 0))
        return true;

    vector<int> positions(k, 0), current(k);
    int n = items.size();

    while (true) {
        for (int i = 0; i < k; ++i)
            current[i] = items[positions[i]];
        if (! f(current))
            return false;

        int i = k - 1;
        while (i >= 0 && positions[i] == n - 1)
            positions[i--] = 0;
        if (i < 0)
            return true;
        ++positions[i];
    }
}

auto flagalg::innards::for_each_multiset(const vector<int> & items, int k, const SelectionCallback & f) -> bool
{
    if (k < 0 || (items.empty() && k > 0))
        return true;

    vector<int> positions(k, 0), current(k);
    int n = items.size();

    while (true) {
        for (int i = 0; i < k; ++i)
            current[i] = items[positions[i]];
        if (! f(current))
            return false;

        int i = k - 1;
        while (i >= 0 && positions[i] == n - 1)
            --i;
        if (i < 0)
            return true;

        ++positions[i];
        for (int j = i + 1; j < k; ++j)
            positions[j] = positions[i];
    }
}

auto flagalg::innards::binomial(int n, int k) -> unsigned long
{
    if (k < 0 || k > n)
        return 0;

    unsigned long result = 1;
    for (int i = 1; i <= k; ++i)
        result = result * (n - k + i) / i;
    return result;
}

auto flagalg::innards::falling_factorial(int n, int k) -> unsigned long
{
    if (k < 0 || k > n)
        return 0;

    unsigned long result = 1;
    for (int i = 0; i < k; ++i)
        result *= (n - i);
    return result;
}

auto flagalg::innards::factorial(int n) -> unsigned long
{
    return falling_factorial(n, n);
}

auto flagalg::innards::vertex_range(int first, int last) -> vector<int>
{
    vector<int> result;
    for (int v = first; v <= last; ++v)
        result.push_back(v);
    return result;
}
