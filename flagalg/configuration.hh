#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_CONFIGURATION_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_CONFIGURATION_HH 1

#include <flagalg/constraints.hh>
#include <flagalg/graph3.hh>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace flagalg
{
    /**
     * Thrown if a command line argument or constraint description can't be
     * understood.
     */
    class InvalidConfiguration : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit InvalidConfiguration(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    /**
     * Parse "k:v", meaning no k vertices may span v or more edges.
     *
     * \throw InvalidConfiguration
     */
    auto parse_forbidden_edge_number(const std::string &) -> std::pair<int, int>;

    /**
     * Parse a graph in "n:abcdef..." notation, where what says which option
     * it came from, for the error message.
     *
     * \throw InvalidConfiguration
     */
    auto parse_graph_option(const std::string & what, const std::string &) -> Graph3;

    /**
     * \throw InvalidConfiguration
     */
    auto make_constraints(const std::vector<std::string> & forbidden_edge_numbers,
        const std::vector<std::string> & forbidden_graphs,
        const std::vector<std::string> & forbidden_induced_graphs) -> Constraints;
}

#endif
