#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_FORMATS_COMPACT_MATRIX_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_FORMATS_COMPACT_MATRIX_HH 1

#include <flagalg/rational_matrix.hh>

#include <nlohmann/json.hpp>

#include <exception>
#include <string>

namespace flagalg
{
    /**
     * Thrown if a compact matrix representation is malformed.
     */
    class CompactReprError : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit CompactReprError(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    /**
     * A symmetric matrix as a JSON object with keys "n" (the dimension),
     * "blocks" (the subdivisions, which must be the same for rows and
     * columns) and "entries" (an object mapping "i,j" to an exact rational
     * string, for each nonzero entry with i <= j).
     *
     * \throw MatrixShapeError if the matrix is not symmetric, or its row and
     * column subdivisions differ.
     */
    auto sparse_symm_matrix_to_compact_repr(const RationalMatrix &) -> nlohmann::json;

    /**
     * \throw CompactReprError
     */
    auto sparse_symm_matrix_from_compact_repr(const nlohmann::json &) -> RationalMatrix;
}

#endif
