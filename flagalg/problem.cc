#include <flagalg/flag_basis.hh>
#include <flagalg/flag_products.hh>
#include <flagalg/formats/compact_matrix.hh>
#include <flagalg/formats/file_error.hh>
#include <flagalg/generate.hh>
#include <flagalg/problem.hh>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

using namespace flagalg;

using json = nlohmann::json;

using std::ifstream;
using std::nullopt;
using std::ofstream;
using std::string;
using std::stringstream;
using std::to_string;
using std::vector;

ProblemError::ProblemError(const string & message) noexcept :
    _what("Problem error: " + message)
{
}

auto ProblemError::what() const noexcept -> const char *
{
    return _what.c_str();
}

namespace
{
    template <typename T_, typename F_>
    auto join(const vector<T_> & items, F_ && f) -> string
    {
        stringstream result;
        bool first = true;
        for (auto & i : items) {
            if (! first)
                result << " ";
            result << f(i);
            first = false;
        }
        return result.str();
    }

    auto check_densities_match(const Problem & problem, const ProductDensities & densities) -> void
    {
        if (densities.size() != problem.graphs.size())
            throw ProblemError{"have product densities for " + to_string(densities.size()) + " graphs, but there are "
                + to_string(problem.graphs.size()) + " graphs"};

        for (decltype(densities.size()) gi = 0; gi < densities.size(); ++gi) {
            if (densities[gi].size() != problem.types.size())
                throw ProblemError{"graph " + to_string(gi + 1) + " has product densities for " + to_string(densities[gi].size())
                    + " types, but there are " + to_string(problem.types.size()) + " types"};
            for (decltype(problem.types.size()) ti = 0; ti < problem.types.size(); ++ti)
                if (densities[gi][ti].rows() != problem.flag_bases[ti].rows())
                    throw ProblemError{"product densities for graph " + to_string(gi + 1) + " and type " + to_string(ti + 1)
                        + " do not match the flag basis"};
        }
    }
}

auto flagalg::generate_problem(const ProblemParams & params) -> Problem
{
    if (params.n < 0)
        throw ProblemError{"negative number of vertices " + to_string(params.n)};

    Problem result;
    result.n = params.n;

    result.graphs = generate_graphs(params.n, params.constraints);
    result.extra_stats.emplace_back("graphs = " + to_string(result.graphs.size()));

    for (auto & g : result.graphs)
        result.graph_densities.push_back(params.density_graph ? subgraph_density(g, *params.density_graph) : edge_density(g));

    for (int s = params.n % 2; s < params.n - 1; s += 2) {
        auto these_types = generate_graphs(s, params.constraints);
        int m = (params.n + s) / 2;

        vector<int> flag_counts;
        for (auto & tg : these_types) {
            result.flags.push_back(generate_flags(m, tg, params.constraints));
            flag_counts.push_back(result.flags.back().size());
        }

        result.extra_stats.emplace_back("types_of_order_" + to_string(s) + " = " + to_string(these_types.size()));
        result.extra_stats.emplace_back("flags_of_order_" + to_string(m) + " = " + join(flag_counts, [](int c) { return c; }));
        result.types.insert(result.types.end(), these_types.begin(), these_types.end());
    }

    for (auto & f : result.flags)
        result.flag_bases.push_back(RationalMatrix::identity(f.size()));

    return result;
}

auto flagalg::use_invariant_anti_invariant_bases(const Problem & problem, bool orthogonalize) -> Problem
{
    Problem result = problem;
    for (decltype(result.types.size()) ti = 0; ti < result.types.size(); ++ti)
        result.flag_bases[ti] = flag_basis(result.types[ti], result.flags[ti], orthogonalize);

    result.extra_stats.emplace_back("invariant_block_sizes = " + join(invariant_block_sizes(result), [](int c) { return c; }));
    result.extra_stats.emplace_back("anti_invariant_block_sizes = " + join(anti_invariant_block_sizes(result), [](int c) { return c; }));
    return result;
}

auto flagalg::certify_construction(const Problem & problem, const Construction & construction) -> ConstructionCertificate
{
    ConstructionCertificate result;

    result.sharp_graphs = construction.induced_subgraphs(problem.n);
    int missing = 0;
    for (auto & sg : result.sharp_graphs) {
        auto g = std::find(problem.graphs.begin(), problem.graphs.end(), sg.graph);
        if (g == problem.graphs.end()) {
            result.sharp_graph_indices.push_back(nullopt);
            ++missing;
        }
        else
            result.sharp_graph_indices.push_back(int(g - problem.graphs.begin()));
    }

    result.extra_stats.emplace_back("construction_graphs = " + to_string(result.sharp_graphs.size()));
    if (missing != 0)
        result.extra_stats.emplace_back("construction_graphs_not_admissible = " + to_string(missing));

    for (decltype(problem.types.size()) ti = 0; ti < problem.types.size(); ++ti) {
        auto & basis = problem.flag_bases[ti];
        int num_blocks = basis.row_block_sizes().size();

        vector<RationalMatrix> blocks;
        for (int i = 0; i < num_blocks; ++i)
            blocks.push_back(construction.zero_eigenvectors(problem.types[ti], problem.flags[ti], basis.subdivision(i, 0)));

        result.zero_eigenvectors.push_back(block_diagonal(blocks));
    }

    result.extra_stats.emplace_back("zero_eigenvectors = " + join(result.zero_eigenvectors,
                                        [](const RationalMatrix & z) { return z.rows(); }));

    return result;
}

auto flagalg::reduce_bases(const Problem & problem, const ConstructionCertificate & certificate) -> Problem
{
    if (certificate.zero_eigenvectors.size() != problem.types.size())
        throw ProblemError{"have zero eigenvectors for " + to_string(certificate.zero_eigenvectors.size())
            + " types, but there are " + to_string(problem.types.size()) + " types"};

    Problem result = problem;

    for (decltype(problem.types.size()) ti = 0; ti < problem.types.size(); ++ti) {
        auto & z = certificate.zero_eigenvectors[ti];
        auto & basis = problem.flag_bases[ti];
        auto sizes = basis.row_block_sizes();

        if (z.column_block_sizes() != sizes)
            throw ProblemError{"zero eigenvectors for type " + to_string(ti + 1) + " do not match its flag basis"};

        vector<RationalMatrix> blocks;
        vector<int> new_subdivisions;
        int rows_so_far = 0;

        for (int i = 0; i < int(sizes.size()); ++i) {
            auto zi = z.subdivision(i, i);
            if (0 == zi.rows())
                blocks.push_back(RationalMatrix::identity(sizes[i]));
            else {
                int nzev = zi.rank();
                auto m = zi.stack(zi.right_kernel_basis()).gram_schmidt();
                blocks.push_back(m.row_range(nzev, m.rows() - nzev));
            }

            if (i != 0)
                new_subdivisions.push_back(rows_so_far);
            rows_so_far += blocks.back().rows();
        }

        auto new_basis = block_diagonal(blocks) * basis;
        new_basis.subdivide(new_subdivisions, {});
        result.flag_bases[ti] = new_basis;
    }

    result.extra_stats.emplace_back("reduced_invariant_block_sizes = " + join(invariant_block_sizes(result), [](int c) { return c; }));
    result.extra_stats.emplace_back("reduced_anti_invariant_block_sizes = " + join(anti_invariant_block_sizes(result), [](int c) { return c; }));
    return result;
}

auto flagalg::calculate_product_densities(const Problem & problem, unsigned n_threads) -> ProductDensities
{
    ProductDensities result(problem.graphs.size(), vector<RationalMatrix>(problem.types.size()));

    for (decltype(problem.types.size()) ti = 0; ti < problem.types.size(); ++ti) {
        auto & basis = problem.flag_bases[ti];
        auto basis_transpose = basis.transpose();

        auto raw = flag_products(problem.graphs, problem.types[ti], problem.flags[ti], n_threads);
        for (decltype(raw.size()) gi = 0; gi < raw.size(); ++gi) {
            auto nd = basis * raw[gi] * basis_transpose;
            nd.subdivide(basis.row_subdivisions(), basis.row_subdivisions());
            result[gi][ti] = std::move(nd);
        }
    }

    return result;
}

auto flagalg::invariant_block_sizes(const Problem & problem) -> vector<int>
{
    vector<int> result;
    for (auto & b : problem.flag_bases)
        result.push_back(b.row_subdivisions().empty() ? b.rows() : b.row_subdivisions().front());
    return result;
}

auto flagalg::anti_invariant_block_sizes(const Problem & problem) -> vector<int>
{
    vector<int> result;
    for (auto & b : problem.flag_bases)
        result.push_back(b.row_subdivisions().empty() ? 0 : b.rows() - b.row_subdivisions().front());
    return result;
}

auto flagalg::make_sdp_input(const Problem & problem, const ProductDensities & densities) -> SDPInput
{
    check_densities_match(problem, densities);

    SDPInput result;
    result.graph_densities = problem.graph_densities;
    result.invariant_block_sizes = invariant_block_sizes(problem);
    result.anti_invariant_block_sizes = anti_invariant_block_sizes(problem);
    result.product_densities = densities;
    return result;
}

auto flagalg::write_sdp_input_file(const Problem & problem, const ProductDensities & densities, const string & filename) -> void
{
    write_sdp_input_file(filename, make_sdp_input(problem, densities));
}

auto flagalg::read_dual_matrices(const Problem & problem, const string & filename) -> vector<DualMatrix>
{
    return read_sdp_solution_file(filename, invariant_block_sizes(problem), anti_invariant_block_sizes(problem));
}

auto flagalg::find_sharps(const Problem & problem, const ProductDensities & densities,
    const vector<DualMatrix> & duals, double tolerance) -> SharpsResult
{
    if (problem.graphs.empty())
        throw ProblemError{"no graphs to find sharp graphs among"};
    check_densities_match(problem, densities);
    if (duals.size() != problem.types.size())
        throw ProblemError{"have dual matrices for " + to_string(duals.size()) + " types, but there are "
            + to_string(problem.types.size()) + " types"};

    SharpsResult result;
    for (auto & d : problem.graph_densities)
        result.bounds.push_back(d.to_double());

    for (decltype(problem.types.size()) ti = 0; ti < problem.types.size(); ++ti) {
        auto & q = duals[ti];
        if (int(q.size()) != problem.flag_bases[ti].rows())
            throw ProblemError{"dual matrix for type " + to_string(ti + 1) + " does not match the flag basis"};

        for (decltype(problem.graphs.size()) gi = 0; gi < problem.graphs.size(); ++gi)
            densities[gi][ti].for_each_nonzero([&](int j, int k, const Rational & d) {
                if (j <= k)
                    result.bounds[gi] += d.to_double() * q[j][k] * (j == k ? 1.0 : 2.0);
            });
    }

    result.bound = *std::max_element(result.bounds.begin(), result.bounds.end());
    for (int gi = 0; gi < int(result.bounds.size()); ++gi)
        if (std::abs(result.bounds[gi] - result.bound) < tolerance)
            result.sharp_indices.push_back(gi);

    return result;
}

auto flagalg::product_densities_to_json(const Problem & problem, const ProductDensities & densities) -> json
{
    check_densities_match(problem, densities);

    json graphs = json::array(), types = json::array(), block_sizes = json::array(), matrices = json::array();
    for (auto & g : problem.graphs)
        graphs.push_back(graph_to_string(g));
    for (auto & t : problem.types)
        types.push_back(graph_to_string(t));
    for (auto & b : problem.flag_bases)
        block_sizes.push_back(b.row_block_sizes());

    for (auto & per_graph : densities) {
        json row = json::array();
        for (auto & d : per_graph)
            row.push_back(sparse_symm_matrix_to_compact_repr(d));
        matrices.push_back(row);
    }

    return json{
        {"n", problem.n},
        {"graphs", graphs},
        {"types", types},
        {"basis_block_sizes", block_sizes},
        {"product_densities", matrices}};
}

auto flagalg::product_densities_from_json(const Problem & problem, const json & j) -> ProductDensities
{
    try {
        if (j.at("n").get<int>() != problem.n)
            throw ProblemError{"densities were saved for n = " + to_string(j.at("n").get<int>())};

        vector<string> graphs, types;
        for (auto & g : problem.graphs)
            graphs.push_back(graph_to_string(g));
        for (auto & t : problem.types)
            types.push_back(graph_to_string(t));

        if (j.at("graphs").get<vector<string>>() != graphs)
            throw ProblemError{"densities were saved for different graphs"};
        if (j.at("types").get<vector<string>>() != types)
            throw ProblemError{"densities were saved for different types"};

        vector<vector<int>> block_sizes;
        for (auto & b : problem.flag_bases)
            block_sizes.push_back(b.row_block_sizes());
        if (j.at("basis_block_sizes").get<vector<vector<int>>>() != block_sizes)
            throw ProblemError{"densities were saved for different flag bases"};

        ProductDensities result;
        for (auto & per_graph : j.at("product_densities")) {
            result.emplace_back();
            for (auto & d : per_graph)
                result.back().push_back(sparse_symm_matrix_from_compact_repr(d));
        }

        check_densities_match(problem, result);
        return result;
    }
    catch (const json::exception & e) {
        throw CompactReprError{e.what()};
    }
}

auto flagalg::save_product_densities(const Problem & problem, const ProductDensities & densities, const string & filename) -> void
{
    auto j = product_densities_to_json(problem, densities);

    ofstream out{filename};
    if (! out)
        throw FileError{filename, "unable to open file for writing", false};
    out << j.dump() << std::endl;
    if (! out)
        throw FileError{filename, "error writing file", true};
}

auto flagalg::load_product_densities(const Problem & problem, const string & filename) -> ProductDensities
{
    ifstream in{filename};
    if (! in)
        throw FileError{filename, "unable to open file", false};

    json j;
    try {
        j = json::parse(in);
    }
    catch (const json::parse_error & e) {
        throw FileError{filename, e.what(), true};
    }

    return product_densities_from_json(problem, j);
}
