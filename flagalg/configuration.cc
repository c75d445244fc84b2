#include <flagalg/configuration.hh>

#include <charconv>

using namespace flagalg;

using std::pair;
using std::string;
using std::vector;

InvalidConfiguration::InvalidConfiguration(const string & message) noexcept :
    _what(message)
{
}

auto InvalidConfiguration::what() const noexcept -> const char *
{
    return _what.c_str();
}

namespace
{
    auto parse_positive(const string & s, const string & whole) -> int
    {
        int result = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
        if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() || result < 1)
            throw InvalidConfiguration{"Invalid forbidden edge number '" + whole + "', expected k:v with positive k and v"};
        return result;
    }
}

auto flagalg::parse_forbidden_edge_number(const string & s) -> pair<int, int>
{
    auto p = s.find(':');
    if (p == string::npos)
        throw InvalidConfiguration{"Invalid forbidden edge number '" + s + "', expected k:v"};

    return pair{parse_positive(s.substr(0, p), s), parse_positive(s.substr(p + 1), s)};
}

auto flagalg::parse_graph_option(const string & what, const string & s) -> Graph3
{
    auto g = string_to_graph(s);
    if (! g)
        throw InvalidConfiguration{"Invalid graph '" + s + "' for " + what + ", expected n:abcdef..."};
    return *g;
}

auto flagalg::make_constraints(const vector<string> & forbidden_edge_numbers,
    const vector<string> & forbidden_graphs,
    const vector<string> & forbidden_induced_graphs) -> Constraints
{
    Constraints result;

    for (auto & s : forbidden_edge_numbers) {
        auto [k, v] = parse_forbidden_edge_number(s);
        if (! result.forbidden_edge_numbers.emplace(k, v).second)
            throw InvalidConfiguration{"Duplicate forbidden edge number for " + std::to_string(k) + " vertices"};
    }

    for (auto & s : forbidden_graphs)
        result.forbidden_graphs.push_back(parse_graph_option("--forbid", s));

    for (auto & s : forbidden_induced_graphs)
        result.forbidden_induced_graphs.push_back(parse_graph_option("--forbid-induced", s));

    return result;
}
