#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_RATIONAL_MATRIX_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_RATIONAL_MATRIX_HH 1

#include <flagalg/rational.hh>

#include <Eigen/Core>

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace Eigen
{
    /**
     * Exact arithmetic, so every precision and epsilon is zero.
     */
    template <>
    struct NumTraits<flagalg::Rational> : GenericNumTraits<flagalg::Rational>
    {
        using Real = flagalg::Rational;
        using NonInteger = flagalg::Rational;
        using Nested = flagalg::Rational;
        using Literal = flagalg::Rational;

        enum
        {
            IsComplex = 0,
            IsInteger = 0,
            IsSigned = 1,
            RequireInitialization = 1,
            ReadCost = 6,
            AddCost = 150,
            MulCost = 100
        };

        static inline auto epsilon() -> Real
        {
            return Real{0};
        }

        static inline auto dummy_precision() -> Real
        {
            return Real{0};
        }

        static inline auto digits10() -> int
        {
            return 0;
        }
    };
}

namespace flagalg
{
    /**
     * Thrown if two matrices of incompatible shapes are combined, or an index
     * is out of range.
     */
    class MatrixShapeError : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit MatrixShapeError(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    class RationalMatrix;

    /**
     * Block diagonal matrix, subdivided along the block boundaries.
     */
    auto block_diagonal(const std::vector<RationalMatrix> & blocks) -> RationalMatrix;

    /**
     * Blocks stacked vertically, with row subdivisions between them. All
     * blocks must have the same number of columns.
     */
    auto block_column(const std::vector<RationalMatrix> & blocks) -> RationalMatrix;

    /**
     * A dense Eigen matrix of exact rationals, with optional row and column
     * subdivisions. A subdivision list holds the indices at which a new block
     * starts, so {3} on a matrix with 5 rows gives blocks of 3 and 2 rows.
     *
     * Indices start at 0.
     */
    class RationalMatrix
    {
    public:
        using Entries = Eigen::Matrix<Rational, Eigen::Dynamic, Eigen::Dynamic>;

    private:
        Entries _entries;
        std::vector<int> _row_subdivisions, _column_subdivisions;

        friend auto block_diagonal(const std::vector<RationalMatrix> & blocks) -> RationalMatrix;

    public:
        RationalMatrix() = default;

        RationalMatrix(int rows, int cols);

        explicit RationalMatrix(Entries entries);

        static auto identity(int n) -> RationalMatrix;

        /**
         * Build from a list of rows, each of which must have cols entries.
         */
        static auto from_rows(const std::vector<std::vector<Rational>> & rows, int cols) -> RationalMatrix;

        auto rows() const -> int
        {
            return int(_entries.rows());
        }

        auto cols() const -> int
        {
            return int(_entries.cols());
        }

        auto operator()(int r, int c) -> Rational &
        {
            return _entries(r, c);
        }

        auto operator()(int r, int c) const -> const Rational &
        {
            return _entries(r, c);
        }

        auto row(int r) const -> std::vector<Rational>;

        auto operator==(const RationalMatrix &) const -> bool;

        auto operator*(const RationalMatrix &) const -> RationalMatrix;

        auto transpose() const -> RationalMatrix;

        /**
         * This matrix with other placed underneath. Subdivisions are dropped.
         */
        auto stack(const RationalMatrix & other) const -> RationalMatrix;

        /**
         * Rows [first, first + count), with no subdivisions.
         */
        auto row_range(int first, int count) const -> RationalMatrix;

        auto subdivide(std::vector<int> row_subdivisions, std::vector<int> column_subdivisions) -> void;

        auto row_subdivisions() const -> const std::vector<int> &
        {
            return _row_subdivisions;
        }

        auto column_subdivisions() const -> const std::vector<int> &
        {
            return _column_subdivisions;
        }

        auto row_block_sizes() const -> std::vector<int>;

        auto column_block_sizes() const -> std::vector<int>;

        /**
         * The (i, j) block, according to our subdivisions.
         */
        auto subdivision(int i, int j) const -> RationalMatrix;

        /**
         * Reduced row echelon form.
         */
        auto echelon_form() const -> RationalMatrix;

        auto rank() const -> int;

        /**
         * A matrix whose rows are a basis for { x : M x = 0 }.
         */
        auto right_kernel_basis() const -> RationalMatrix;

        /**
         * Orthogonalise our rows in order, without normalising. Rows which
         * become zero are dropped.
         */
        auto gram_schmidt() const -> RationalMatrix;

        auto is_zero() const -> bool;

        auto is_symmetric() const -> bool;

        auto for_each_nonzero(const std::function<auto(int, int, const Rational &)->void> &) const -> void;
    };
}

#endif
