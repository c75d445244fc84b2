#include <flagalg/flag_products.hh>
#include <flagalg/innards/combinatorics.hh>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <unordered_map>
#include <utility>

using namespace flagalg;
using namespace flagalg::innards;

using std::atomic;
using std::exception_ptr;
using std::make_tuple;
using std::pair;
using std::string;
using std::thread;
using std::unordered_map;
using std::vector;

FlagNotFound::FlagNotFound(const string & message) noexcept :
    _what("Flag not found: " + message)
{
}

auto FlagNotFound::what() const noexcept -> const char *
{
    return _what.c_str();
}

namespace
{
    auto how_many_threads(unsigned n) -> unsigned
    {
        if (0 == n)
            n = thread::hardware_concurrency();
        return std::max(n, 1u);
    }

    auto non_type_vertices(int n, const vector<int> & tv) -> vector<int>
    {
        vector<int> result;
        for (int v = 1; v <= n; ++v)
            if (tv.end() == std::find(tv.begin(), tv.end(), v))
                result.push_back(v);
        return result;
    }

    auto find_flag(const vector<Graph3> & flags, const Graph3 & fg) -> int
    {
        auto f = std::find(flags.begin(), flags.end(), fg);
        if (f == flags.end())
            throw FlagNotFound{graph_to_string(fg)};
        return f - flags.begin();
    }

    auto total_choices(int n, int s, int m) -> unsigned long
    {
        return falling_factorial(n, s) * binomial(n - s, m - s) * binomial(n - m, m - s);
    }

    auto product_matrix(const Graph3 & g, const Graph3 & type, const vector<Graph3> & flags,
        const unordered_map<Graph3, int> & flag_indices) -> RationalMatrix
    {
        int num_flags = flags.size();
        RationalMatrix result{num_flags, num_flags};
        if (0 == num_flags)
            return result;

        int n = g.order(), s = type.order(), m = flags.front().order();
        auto total = total_choices(n, s, m);
        if (0 == total)
            return result;

        vector<unsigned long> counts(num_flags * num_flags, 0);
        vector<pair<unsigned long, int>> halves;

        for_each_arrangement(vertex_range(1, n), s, [&](const vector<int> & tv) -> bool {
            if (! (induced_subgraph(g, tv) == type))
                return true;

            halves.clear();
            for_each_combination(non_type_vertices(n, tv), m - s, [&](const vector<int> & extra) -> bool {
                auto vertices = tv;
                vertices.insert(vertices.end(), extra.begin(), extra.end());
                auto fg = canonical_form(induced_subgraph(g, vertices), s);
                auto f = flag_indices.find(fg);
                if (f == flag_indices.end())
                    throw FlagNotFound{graph_to_string(fg) + " in " + graph_to_string(g)};

                unsigned long mask = 0;
                for (auto & v : extra)
                    mask |= 1ul << v;
                halves.emplace_back(mask, f->second);
                return true;
            });

            for (auto & [mask_a, a] : halves)
                for (auto & [mask_b, b] : halves)
                    if (0 == (mask_a & mask_b))
                        ++counts[a * num_flags + b];

            return true;
        });

        Rational divisor{total};
        for (int a = 0; a < num_flags; ++a)
            for (int b = 0; b < num_flags; ++b)
                if (0 != counts[a * num_flags + b])
                    result(a, b) = Rational{counts[a * num_flags + b]} / divisor;

        return result;
    }
}

auto flagalg::slow_flag_products(const Graph3 & g, int s, int m, const vector<Graph3> & types,
    const vector<vector<Graph3>> & flags) -> PairDensities
{
    int n = g.order();
    std::map<std::tuple<int, int, int>, unsigned long> counts;

    for_each_arrangement(vertex_range(1, n), s, [&](const vector<int> & tv) -> bool {
        auto tg = induced_subgraph(g, tv);
        auto t = std::find(types.begin(), types.end(), tg);
        if (t == types.end())
            return true;
        int tindex = t - types.begin();

        auto non_typ_verts = non_type_vertices(n, tv);
        for_each_combination(non_typ_verts, m - s, [&](const vector<int> & fav) -> bool {
            auto va = tv;
            va.insert(va.end(), fav.begin(), fav.end());
            int faindex = find_flag(flags[tindex], canonical_form(induced_subgraph(g, va), s));

            vector<int> remaining_verts;
            for (auto & x : non_typ_verts)
                if (fav.end() == std::find(fav.begin(), fav.end(), x))
                    remaining_verts.push_back(x);

            for_each_combination(remaining_verts, m - s, [&](const vector<int> & fbv) -> bool {
                auto vb = tv;
                vb.insert(vb.end(), fbv.begin(), fbv.end());
                int fbindex = find_flag(flags[tindex], canonical_form(induced_subgraph(g, vb), s));
                ++counts[make_tuple(tindex, faindex, fbindex)];
                return true;
            });

            return true;
        });

        return true;
    });

    PairDensities result;
    Rational total{total_choices(n, s, m)};
    for (auto & [key, count] : counts)
        result.emplace(key, Rational{count} / total);
    return result;
}

auto flagalg::flag_products(const vector<Graph3> & graphs, const Graph3 & type,
    const vector<Graph3> & flags, unsigned n_threads) -> vector<RationalMatrix>
{
    unordered_map<Graph3, int> flag_indices;
    for (int i = 0; i < int(flags.size()); ++i)
        flag_indices.emplace(flags[i], i);

    vector<RationalMatrix> result(graphs.size());
    atomic<int> next_graph{0};

    auto work = [&]() {
        for (int gi = next_graph++; gi < int(graphs.size()); gi = next_graph++)
            result[gi] = product_matrix(graphs[gi], type, flags, flag_indices);
    };

    unsigned threads_wanted = std::min<unsigned>(how_many_threads(n_threads), std::max<int>(graphs.size(), 1));
    if (1 == threads_wanted) {
        work();
        return result;
    }

    vector<thread> threads;
    vector<exception_ptr> failures(threads_wanted);
    for (unsigned t = 0; t < threads_wanted; ++t)
        threads.emplace_back([&, t]() {
            try {
                work();
            }
            catch (...) {
                failures[t] = std::current_exception();
                next_graph = int(graphs.size());
            }
        });

    for (auto & t : threads)
        t.join();

    for (auto & f : failures)
        if (f)
            std::rethrow_exception(f);

    return result;
}
