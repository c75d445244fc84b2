#include <flagalg/rational_matrix.hh>

#include <Eigen/LU>

#include <utility>

using namespace flagalg;

using std::function;
using std::move;
using std::string;
using std::to_string;
using std::vector;

MatrixShapeError::MatrixShapeError(const string & message) noexcept :
    _what("Matrix shape error: " + message)
{
}

auto MatrixShapeError::what() const noexcept -> const char *
{
    return _what.c_str();
}

namespace
{
    using Entries = RationalMatrix::Entries;
    using RowVector = Eigen::Matrix<Rational, 1, Eigen::Dynamic>;

    auto shape_of(const RationalMatrix & m) -> string
    {
        return to_string(m.rows()) + "x" + to_string(m.cols());
    }

    auto block_sizes(const vector<int> & subdivisions, int total) -> vector<int>
    {
        vector<int> result;
        int previous = 0;
        for (auto & s : subdivisions) {
            result.push_back(s - previous);
            previous = s;
        }
        result.push_back(total - previous);
        return result;
    }

    auto block_start(const vector<int> & subdivisions, int i) -> int
    {
        return 0 == i ? 0 : subdivisions.at(i - 1);
    }

    auto checked_zero(int rows, int cols) -> Entries
    {
        if (rows < 0 || cols < 0)
            throw MatrixShapeError{"negative dimension " + to_string(rows) + "x" + to_string(cols)};
        return Entries::Zero(rows, cols);
    }

    auto exact_lu(const Entries & m) -> Eigen::FullPivLU<Entries>
    {
        Eigen::FullPivLU<Entries> lu{m};
        lu.setThreshold(Rational{0});
        return lu;
    }
}

RationalMatrix::RationalMatrix(int rows, int cols) :
    _entries(checked_zero(rows, cols))
{
}

RationalMatrix::RationalMatrix(Entries entries) :
    _entries(move(entries))
{
}

auto RationalMatrix::identity(int n) -> RationalMatrix
{
    RationalMatrix result{n, n};
    result._entries.setIdentity();
    return result;
}

auto RationalMatrix::from_rows(const vector<vector<Rational>> & rows, int cols) -> RationalMatrix
{
    RationalMatrix result{int(rows.size()), cols};
    for (int r = 0; r < result.rows(); ++r) {
        if (int(rows[r].size()) != cols)
            throw MatrixShapeError{"row " + to_string(r) + " has " + to_string(rows[r].size()) + " entries, expected " + to_string(cols)};
        for (int c = 0; c < cols; ++c)
            result(r, c) = rows[r][c];
    }
    return result;
}

auto RationalMatrix::row(int r) const -> vector<Rational>
{
    vector<Rational> result(cols());
    for (int c = 0; c < cols(); ++c)
        result[c] = _entries(r, c);
    return result;
}

auto RationalMatrix::operator==(const RationalMatrix & other) const -> bool
{
    return rows() == other.rows() && cols() == other.cols() && _entries == other._entries
        && _row_subdivisions == other._row_subdivisions && _column_subdivisions == other._column_subdivisions;
}

auto RationalMatrix::operator*(const RationalMatrix & other) const -> RationalMatrix
{
    if (cols() != other.rows())
        throw MatrixShapeError{"cannot multiply " + shape_of(*this) + " by " + shape_of(other)};

    return RationalMatrix{Entries(_entries * other._entries)};
}

auto RationalMatrix::transpose() const -> RationalMatrix
{
    RationalMatrix result{Entries(_entries.transpose())};
    result._row_subdivisions = _column_subdivisions;
    result._column_subdivisions = _row_subdivisions;
    return result;
}

auto RationalMatrix::stack(const RationalMatrix & other) const -> RationalMatrix
{
    if (cols() != other.cols())
        throw MatrixShapeError{"cannot stack " + shape_of(*this) + " on " + shape_of(other)};

    RationalMatrix result{rows() + other.rows(), cols()};
    result._entries.topRows(rows()) = _entries;
    result._entries.bottomRows(other.rows()) = other._entries;
    return result;
}

auto RationalMatrix::row_range(int first, int count) const -> RationalMatrix
{
    if (first < 0 || count < 0 || first + count > rows())
        throw MatrixShapeError{"rows " + to_string(first) + "+" + to_string(count) + " out of range for " + shape_of(*this)};

    return RationalMatrix{Entries(_entries.middleRows(first, count))};
}

auto RationalMatrix::subdivide(vector<int> row_subdivisions, vector<int> column_subdivisions) -> void
{
    auto check = [&](const vector<int> & s, int limit) {
        int previous = 0;
        for (auto & x : s) {
            if (x < previous || x > limit)
                throw MatrixShapeError{"bad subdivision " + to_string(x) + " for " + shape_of(*this)};
            previous = x;
        }
    };

    check(row_subdivisions, rows());
    check(column_subdivisions, cols());
    _row_subdivisions = move(row_subdivisions);
    _column_subdivisions = move(column_subdivisions);
}

auto RationalMatrix::row_block_sizes() const -> vector<int>
{
    return block_sizes(_row_subdivisions, rows());
}

auto RationalMatrix::column_block_sizes() const -> vector<int>
{
    return block_sizes(_column_subdivisions, cols());
}

auto RationalMatrix::subdivision(int i, int j) const -> RationalMatrix
{
    auto row_sizes = row_block_sizes(), col_sizes = column_block_sizes();
    if (i < 0 || j < 0 || i >= int(row_sizes.size()) || j >= int(col_sizes.size()))
        throw MatrixShapeError{"no block (" + to_string(i) + ", " + to_string(j) + ") in " + shape_of(*this)};

    int r0 = block_start(_row_subdivisions, i), c0 = block_start(_column_subdivisions, j);
    return RationalMatrix{Entries(_entries.block(r0, c0, row_sizes[i], col_sizes[j]))};
}

auto RationalMatrix::echelon_form() const -> RationalMatrix
{
    Entries e = _entries;

    int pivot_row = 0;
    for (int c = 0; c < cols() && pivot_row < rows(); ++c) {
        int found = -1;
        for (int r = pivot_row; r < rows(); ++r)
            if (! e(r, c).is_zero()) {
                found = r;
                break;
            }

        if (-1 == found)
            continue;

        if (found != pivot_row)
            e.row(found).swap(e.row(pivot_row));

        Rational pivot = e(pivot_row, c);
        e.row(pivot_row) /= pivot;

        for (int r = 0; r < rows(); ++r) {
            if (r == pivot_row || e(r, c).is_zero())
                continue;
            Rational factor = e(r, c);
            e.row(r) -= factor * e.row(pivot_row);
        }

        ++pivot_row;
    }

    return RationalMatrix{move(e)};
}

auto RationalMatrix::rank() const -> int
{
    if (0 == rows() || 0 == cols())
        return 0;

    return int(exact_lu(_entries).rank());
}

auto RationalMatrix::right_kernel_basis() const -> RationalMatrix
{
    if (0 == rows())
        return identity(cols());
    if (0 == cols())
        return RationalMatrix{};

    auto lu = exact_lu(_entries);
    if (lu.rank() == cols())
        return RationalMatrix{0, cols()};

    // Eigen gives the kernel basis as columns
    Entries kernel = lu.kernel();
    return RationalMatrix{Entries(kernel.transpose())};
}

auto RationalMatrix::gram_schmidt() const -> RationalMatrix
{
    Entries done(rows(), cols());
    vector<Rational> done_norms;

    for (int r = 0; r < rows(); ++r) {
        RowVector v = _entries.row(r);
        for (int k = 0; k < int(done_norms.size()); ++k) {
            Rational mu = v.dot(done.row(k));
            if (! mu.is_zero())
                v -= (mu / done_norms[k]) * done.row(k);
        }

        Rational norm = v.squaredNorm();
        if (! norm.is_zero()) {
            done.row(Eigen::Index(done_norms.size())) = v;
            done_norms.push_back(move(norm));
        }
    }

    return RationalMatrix{Entries(done.topRows(Eigen::Index(done_norms.size())))};
}

auto RationalMatrix::is_zero() const -> bool
{
    // a zero precision makes this an exact test
    return _entries.isZero(Rational{0});
}

auto RationalMatrix::is_symmetric() const -> bool
{
    return rows() == cols() && _entries == _entries.transpose();
}

auto RationalMatrix::for_each_nonzero(const function<auto(int, int, const Rational &)->void> & f) const -> void
{
    for (int i = 0; i < rows(); ++i)
        for (int j = 0; j < cols(); ++j)
            if (! _entries(i, j).is_zero())
                f(i, j, _entries(i, j));
}

auto flagalg::block_diagonal(const vector<RationalMatrix> & blocks) -> RationalMatrix
{
    int rows = 0, cols = 0;
    vector<int> row_subdivisions, column_subdivisions;
    for (decltype(blocks.size()) b = 0; b < blocks.size(); ++b) {
        if (b != 0) {
            row_subdivisions.push_back(rows);
            column_subdivisions.push_back(cols);
        }
        rows += blocks[b].rows();
        cols += blocks[b].cols();
    }

    RationalMatrix result{rows, cols};
    int r0 = 0, c0 = 0;
    for (auto & b : blocks) {
        result._entries.block(r0, c0, b.rows(), b.cols()) = b._entries;
        r0 += b.rows();
        c0 += b.cols();
    }

    result.subdivide(row_subdivisions, column_subdivisions);
    return result;
}

auto flagalg::block_column(const vector<RationalMatrix> & blocks) -> RationalMatrix
{
    if (blocks.empty())
        return RationalMatrix{};

    RationalMatrix result = blocks.front().row_range(0, blocks.front().rows());
    vector<int> row_subdivisions;
    for (decltype(blocks.size()) b = 1; b < blocks.size(); ++b) {
        row_subdivisions.push_back(result.rows());
        result = result.stack(blocks[b]);
    }

    result.subdivide(row_subdivisions, {});
    return result;
}
