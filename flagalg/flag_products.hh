#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_FLAG_PRODUCTS_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_FLAG_PRODUCTS_HH 1

#include <flagalg/graph3.hh>
#include <flagalg/rational.hh>
#include <flagalg/rational_matrix.hh>

#include <exception>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace flagalg
{
    /**
     * Thrown if a large graph contains a flag which is not in the flag list,
     * which happens if the large graph violates the constraints the flags
     * were generated under.
     */
    class FlagNotFound : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit FlagNotFound(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    /// (type index, first flag index, second flag index) -> density
    using PairDensities = std::map<std::tuple<int, int, int>, Rational>;

    /**
     * For a large graph g, every ordered choice of s type vertices is
     * extended by two disjoint sets of m - s further vertices, giving a pair
     * of flags. Returns, for each (type, flag, flag) triple that occurs, the
     * proportion of all such choices that produce it.
     *
     * This enumerates everything directly, and is kept as a reference for
     * checking flag_products().
     */
    auto slow_flag_products(const Graph3 & g, int s, int m, const std::vector<Graph3> & types,
        const std::vector<std::vector<Graph3>> & flags) -> PairDensities;

    /**
     * The same densities as slow_flag_products() for a single type, as one
     * symmetric flags.size() square matrix per large graph. Large graphs are
     * shared out between n_threads workers (0 to auto-detect).
     */
    auto flag_products(const std::vector<Graph3> & graphs, const Graph3 & type,
        const std::vector<Graph3> & flags, unsigned n_threads = 1) -> std::vector<RationalMatrix>;
}

#endif
