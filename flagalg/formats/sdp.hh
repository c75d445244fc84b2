#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_FORMATS_SDP_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_FORMATS_SDP_HH 1

#include <flagalg/rational.hh>
#include <flagalg/rational_matrix.hh>

#include <iosfwd>
#include <string>
#include <vector>

namespace flagalg
{
    /**
     * Everything needed to write out the semidefinite program. For each type
     * there is an invariant block and an anti-invariant block, either of
     * which may be empty.
     */
    struct SDPInput
    {
        /// The objective coefficient for each graph.
        std::vector<Rational> graph_densities;

        /// Per type.
        std::vector<int> invariant_block_sizes, anti_invariant_block_sizes;

        /// Indexed by graph then by type. Each is block diagonal, with the
        /// invariant block first.
        std::vector<std::vector<RationalMatrix>> product_densities;
    };

    /**
     * A dense symmetric floating point matrix, as read back from the solver.
     */
    using DualMatrix = std::vector<std::vector<double>>;

    /**
     * Write in the sparse block-diagonal format. Block 1 is the 1x1 bound
     * variable, blocks 2t + 2 and 2t + 3 are the invariant and anti-invariant
     * parts of type t, and the final two blocks are diagonal slacks. Empty
     * blocks are written with size 1 and no entries.
     *
     * \throw MatrixShapeError if a product density matrix has entries outside
     * its two blocks.
     */
    auto write_sdp_input(std::ostream &, const SDPInput &) -> void;

    /**
     * \throw FileError
     */
    auto write_sdp_input_file(const std::string & filename, const SDPInput &) -> void;

    /**
     * Read the primal matrix (the lines whose first token is "2") from a
     * solution, giving one dual matrix per type of size invariant plus
     * anti-invariant block size. Entries which fall inside a size 1
     * placeholder block are ignored, as are the bound and slack blocks.
     *
     * \throw FileError
     */
    auto read_sdp_solution(std::istream &, const std::string & filename,
        const std::vector<int> & invariant_block_sizes,
        const std::vector<int> & anti_invariant_block_sizes) -> std::vector<DualMatrix>;

    /**
     * \throw FileError
     */
    auto read_sdp_solution_file(const std::string & filename,
        const std::vector<int> & invariant_block_sizes,
        const std::vector<int> & anti_invariant_block_sizes) -> std::vector<DualMatrix>;
}

#endif
