#include <flagalg/formats/compact_matrix.hh>

#include <charconv>
#include <vector>

using namespace flagalg;

using json = nlohmann::json;

using std::string;
using std::to_string;
using std::vector;

CompactReprError::CompactReprError(const string & message) noexcept :
    _what("Bad compact matrix representation: " + message)
{
}

auto CompactReprError::what() const noexcept -> const char *
{
    return _what.c_str();
}

namespace
{
    auto parse_index(const string & s, const string & key) -> int
    {
        int result = -1;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
        if (ec != std::errc{} || ptr != s.data() + s.size() || result < 0)
            throw CompactReprError{"bad entry key '" + key + "'"};
        return result;
    }
}

auto flagalg::sparse_symm_matrix_to_compact_repr(const RationalMatrix & m) -> json
{
    if (! m.is_symmetric())
        throw MatrixShapeError{"compact representation needs a symmetric matrix, not " + to_string(m.rows()) + "x" + to_string(m.cols())};
    if (m.row_subdivisions() != m.column_subdivisions())
        throw MatrixShapeError{"compact representation needs the same row and column subdivisions"};

    json entries = json::object();
    m.for_each_nonzero([&](int i, int j, const Rational & x) {
        if (i <= j)
            entries[to_string(i) + "," + to_string(j)] = x.to_string();
    });

    return json{
        {"n", m.rows()},
        {"blocks", m.row_subdivisions()},
        {"entries", entries}};
}

auto flagalg::sparse_symm_matrix_from_compact_repr(const json & j) -> RationalMatrix
{
    if (! j.is_object())
        throw CompactReprError{"not an object"};
    if (! j.contains("n") || ! j["n"].is_number_integer() || j["n"].get<int>() < 0)
        throw CompactReprError{"missing or bad 'n'"};
    if (! j.contains("blocks") || ! j["blocks"].is_array())
        throw CompactReprError{"missing or bad 'blocks'"};
    if (! j.contains("entries") || ! j["entries"].is_object())
        throw CompactReprError{"missing or bad 'entries'"};

    int n = j["n"].get<int>();
    RationalMatrix result{n, n};

    for (auto & [key, value] : j["entries"].items()) {
        auto comma = key.find(',');
        if (comma == string::npos)
            throw CompactReprError{"bad entry key '" + key + "'"};
        int r = parse_index(key.substr(0, comma), key), c = parse_index(key.substr(comma + 1), key);
        if (r > c || c >= n)
            throw CompactReprError{"entry key '" + key + "' is not in the upper triangle of a " + to_string(n) + "x" + to_string(n) + " matrix"};

        if (! value.is_string())
            throw CompactReprError{"entry '" + key + "' is not a string"};
        auto x = Rational::from_string(value.get<string>());
        if (! x)
            throw CompactReprError{"entry '" + key + "' has bad value '" + value.get<string>() + "'"};

        result(r, c) = *x;
        result(c, r) = *x;
    }

    vector<int> blocks;
    for (auto & b : j["blocks"]) {
        if (! b.is_number_integer())
            throw CompactReprError{"non-integer block boundary"};
        blocks.push_back(b.get<int>());
    }

    try {
        result.subdivide(blocks, blocks);
    }
    catch (const MatrixShapeError & e) {
        throw CompactReprError{e.what()};
    }

    return result;
}
