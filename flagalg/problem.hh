#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_PROBLEM_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_PROBLEM_HH 1

#include <flagalg/constraints.hh>
#include <flagalg/construction.hh>
#include <flagalg/formats/sdp.hh>
#include <flagalg/graph3.hh>
#include <flagalg/rational.hh>
#include <flagalg/rational_matrix.hh>

#include <nlohmann/json.hpp>

#include <exception>
#include <list>
#include <optional>
#include <string>
#include <vector>

namespace flagalg
{
    /**
     * Thrown if the stages of building a problem are combined inconsistently,
     * for example if product densities were computed for a different set of
     * graphs or bases.
     */
    class ProblemError : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit ProblemError(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    struct ProblemParams
    {
        /// Order of the graphs whose densities bound the objective.
        int n = 0;

        /// What the graphs may not contain.
        Constraints constraints;

        /// Maximise the density of this graph, rather than the edge density.
        std::optional<Graph3> density_graph;
    };

    /**
     * One snapshot of a flag algebra problem. Stages of the pipeline take a
     * problem and give back a new one, rather than modifying it.
     */
    struct Problem
    {
        int n = 0;

        /// Every admissible graph on n vertices.
        std::vector<Graph3> graphs;

        /// The objective coefficient for each graph.
        std::vector<Rational> graph_densities;

        /// Admissible types, of every order s < n - 1 with the same parity
        /// as n.
        std::vector<Graph3> types;

        /// For each type of order s, its flags on (n + s) / 2 vertices.
        std::vector<std::vector<Graph3>> flags;

        /// For each type, rows are combinations of flags. Subdivided into
        /// an invariant block and an anti-invariant block, unless there is
        /// only one block.
        std::vector<RationalMatrix> flag_bases;

        /// Extra stats, to output
        std::list<std::string> extra_stats;
    };

    /**
     * What a construction tells us about a problem.
     */
    struct ConstructionCertificate
    {
        /// The graphs in the construction with their densities.
        std::vector<SharpGraph> sharp_graphs;

        /// For each sharp graph, its index in the problem's graphs, or
        /// nullopt if the construction contains a graph the problem forbids.
        std::vector<std::optional<int>> sharp_graph_indices;

        /// For each type, block diagonal with one block for each row block
        /// of the flag basis. Each block's rows are zero eigenvectors written
        /// in terms of that basis block.
        std::vector<RationalMatrix> zero_eigenvectors;

        /// Extra stats, to output
        std::list<std::string> extra_stats;
    };

    /**
     * Indexed by graph then by type. Each is B D B^T for the type's basis B
     * and the raw flag product matrix D, subdivided like B's rows.
     */
    using ProductDensities = std::vector<std::vector<RationalMatrix>>;

    struct SharpsResult
    {
        /// The bound implied for each graph.
        std::vector<double> bounds;

        /// The largest of these.
        double bound = 0.0;

        /// Graphs whose bound is within the tolerance of the largest.
        std::vector<int> sharp_indices;
    };

    /**
     * Generate graphs, types and flags, with identity flag bases.
     */
    auto generate_problem(const ProblemParams & params) -> Problem;

    /**
     * Replace every flag basis by the invariant and anti-invariant basis of
     * its type.
     */
    auto use_invariant_anti_invariant_bases(const Problem & problem, bool orthogonalize = true) -> Problem;

    /**
     * Ask a construction for its sharp graphs, and for zero eigenvectors for
     * every type and every block of its flag basis.
     */
    auto certify_construction(const Problem & problem, const Construction & construction) -> ConstructionCertificate;

    /**
     * Shrink each flag basis by projecting out the zero eigenvectors. Within
     * each block, the zero eigenvectors are extended to a basis by their
     * kernel, orthogonalised, and then the zero eigenvectors themselves are
     * removed. A block with no zero eigenvectors is kept as it is.
     *
     * \throw ProblemError if the certificate does not match the bases.
     */
    auto reduce_bases(const Problem & problem, const ConstructionCertificate & certificate) -> Problem;

    /**
     * Flag products of every type in every graph, in terms of the flag
     * bases. Graphs are shared out between n_threads workers (0 to
     * auto-detect).
     */
    auto calculate_product_densities(const Problem & problem, unsigned n_threads = 1) -> ProductDensities;

    /**
     * Sizes of the invariant block of each basis, which is everything if the
     * basis is not subdivided.
     */
    auto invariant_block_sizes(const Problem & problem) -> std::vector<int>;

    /**
     * Sizes of the anti-invariant block of each basis, which is zero if the
     * basis is not subdivided.
     */
    auto anti_invariant_block_sizes(const Problem & problem) -> std::vector<int>;

    /**
     * \throw ProblemError if the densities do not match the problem.
     */
    auto make_sdp_input(const Problem & problem, const ProductDensities & densities) -> SDPInput;

    /**
     * \throw FileError
     * \throw ProblemError
     */
    auto write_sdp_input_file(const Problem & problem, const ProductDensities & densities,
        const std::string & filename) -> void;

    /**
     * One dual matrix for each type, from a solution file.
     *
     * \throw FileError
     */
    auto read_dual_matrices(const Problem & problem, const std::string & filename) -> std::vector<DualMatrix>;

    /**
     * The bound each graph gives when combined with the dual matrices, and
     * the graphs where this is within the tolerance of the maximum.
     *
     * \throw ProblemError if there are no graphs, or the shapes don't match.
     */
    auto find_sharps(const Problem & problem, const ProductDensities & densities,
        const std::vector<DualMatrix> & duals, double tolerance = 1e-5) -> SharpsResult;

    /**
     * Product densities as JSON, each matrix in the compact representation,
     * labelled by graph and type so that they can be checked on loading.
     */
    auto product_densities_to_json(const Problem & problem, const ProductDensities & densities) -> nlohmann::json;

    /**
     * \throw ProblemError if the densities were saved for a different
     * problem.
     * \throw CompactReprError
     */
    auto product_densities_from_json(const Problem & problem, const nlohmann::json &) -> ProductDensities;

    /**
     * \throw FileError
     */
    auto save_product_densities(const Problem & problem, const ProductDensities & densities,
        const std::string & filename) -> void;

    /**
     * \throw FileError
     * \throw ProblemError
     * \throw CompactReprError
     */
    auto load_product_densities(const Problem & problem, const std::string & filename) -> ProductDensities;
}

#endif
