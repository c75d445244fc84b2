#include <flagalg/formats/file_error.hh>
#include <flagalg/formats/sdp.hh>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace flagalg;

using std::getline;
using std::ifstream;
using std::istream;
using std::istringstream;
using std::ofstream;
using std::ostream;
using std::string;
using std::to_string;
using std::vector;

namespace
{
    const int decimal_digits = 64;

    auto written_size(int block_size) -> int
    {
        return 0 == block_size ? 1 : block_size;
    }

    auto parse_int(const string & s, const string & filename, const string & line) -> int
    {
        try {
            std::size_t used = 0;
            int result = std::stoi(s, &used);
            if (used != s.size())
                throw FileError{filename, "cannot parse line '" + line + "'", true};
            return result;
        }
        catch (const std::logic_error &) {
            throw FileError{filename, "cannot parse line '" + line + "'", true};
        }
    }

    auto parse_double(const string & s, const string & filename, const string & line) -> double
    {
        try {
            return std::stod(s);
        }
        catch (const std::logic_error &) {
            throw FileError{filename, "cannot parse line '" + line + "'", true};
        }
    }
}

auto flagalg::write_sdp_input(ostream & f, const SDPInput & input) -> void
{
    int num_graphs = input.graph_densities.size();
    int num_types = input.invariant_block_sizes.size();

    if (int(input.anti_invariant_block_sizes.size()) != num_types)
        throw MatrixShapeError{"have " + to_string(num_types) + " invariant block sizes but "
            + to_string(input.anti_invariant_block_sizes.size()) + " anti-invariant block sizes"};
    if (int(input.product_densities.size()) != num_graphs)
        throw MatrixShapeError{"have " + to_string(num_graphs) + " graphs but product densities for "
            + to_string(input.product_densities.size())};

    f << (num_graphs + 1) << "\n";
    f << (2 * num_types + 3) << "\n";
    f << "1 ";
    for (int t = 0; t < num_types; ++t)
        f << written_size(input.invariant_block_sizes[t]) << " " << written_size(input.anti_invariant_block_sizes[t]) << " ";
    f << "-" << num_graphs << " -1\n";

    for (int i = 0; i < num_graphs; ++i)
        f << "0.0 ";
    f << "1.0\n";

    f << "0 1 1 1 -1.0\n";

    for (int i = 0; i < num_graphs; ++i) {
        f << (i + 1) << " 1 1 1 -1.0\n";
        f << (i + 1) << " " << (2 * num_types + 2) << " " << (i + 1) << " " << (i + 1) << " 1.0\n";
    }

    for (int i = 0; i < num_graphs; ++i) {
        auto & d = input.graph_densities[i];
        if (! d.is_zero())
            f << (i + 1) << " " << (2 * num_types + 3) << " 1 1 " << d.to_decimal_string(decimal_digits) << "\n";
    }

    f << (num_graphs + 1) << " " << (2 * num_types + 3) << " 1 1 1.0\n";

    for (int i = 0; i < num_graphs; ++i) {
        if (int(input.product_densities[i].size()) != num_types)
            throw MatrixShapeError{"graph " + to_string(i + 1) + " has product densities for "
                + to_string(input.product_densities[i].size()) + " types, expected " + to_string(num_types)};

        for (int t = 0; t < num_types; ++t) {
            auto & d = input.product_densities[i][t];
            int inv = input.invariant_block_sizes[t];
            int size = inv + input.anti_invariant_block_sizes[t];
            if (d.rows() != size || d.cols() != size)
                throw MatrixShapeError{"product density matrix for graph " + to_string(i + 1) + " and type "
                    + to_string(t + 1) + " should be " + to_string(size) + "x" + to_string(size)};

            d.for_each_nonzero([&](int row, int col, const Rational & value) {
                if (row > col)
                    return;

                int block = 2 * t + 2;
                if (row >= inv) {
                    block = 2 * t + 3;
                    row -= inv;
                    col -= inv;
                }
                else if (col >= inv)
                    throw MatrixShapeError{"product density matrix for graph " + to_string(i + 1) + " and type "
                        + to_string(t + 1) + " is not block diagonal"};

                f << (i + 1) << " " << block << " " << (row + 1) << " " << (col + 1) << " "
                  << value.to_decimal_string(decimal_digits) << "\n";
            });
        }
    }
}

auto flagalg::write_sdp_input_file(const string & filename, const SDPInput & input) -> void
{
    ofstream f{filename};
    if (! f)
        throw FileError{filename, "unable to open file for writing", false};

    write_sdp_input(f, input);

    f.flush();
    if (! f)
        throw FileError{filename, "error writing file", true};
}

auto flagalg::read_sdp_solution(istream & infile, const string & filename,
    const vector<int> & invariant_block_sizes,
    const vector<int> & anti_invariant_block_sizes) -> vector<DualMatrix>
{
    int num_types = invariant_block_sizes.size();
    vector<DualMatrix> result;
    for (int t = 0; t < num_types; ++t) {
        int size = invariant_block_sizes[t] + anti_invariant_block_sizes[t];
        result.emplace_back(size, vector<double>(size, 0.0));
    }

    string line;
    while (getline(infile, line)) {
        istringstream tokens{line};
        vector<string> words;
        string word;
        while (tokens >> word)
            words.push_back(word);

        if (words.empty() || words[0] != "2")
            continue;
        if (words.size() < 5)
            throw FileError{filename, "cannot parse line '" + line + "'", true};

        int ti = parse_int(words[1], filename, line) - 2;
        if (ti < 0 || ti >= 2 * num_types)
            continue;

        int j = parse_int(words[2], filename, line) - 1;
        int k = parse_int(words[3], filename, line) - 1;
        double value = parse_double(words[4], filename, line);

        int t = ti / 2, limit;
        if (ti % 2) {
            j += invariant_block_sizes[t];
            k += invariant_block_sizes[t];
            limit = invariant_block_sizes[t] + anti_invariant_block_sizes[t];
        }
        else
            limit = invariant_block_sizes[t];

        // placeholder entries for an empty block
        if (j < 0 || k < 0 || j >= limit || k >= limit)
            continue;

        result[t][j][k] = value;
        result[t][k][j] = value;
    }

    if (! infile.eof())
        throw FileError{filename, "error reading file", true};

    return result;
}

auto flagalg::read_sdp_solution_file(const string & filename,
    const vector<int> & invariant_block_sizes,
    const vector<int> & anti_invariant_block_sizes) -> vector<DualMatrix>
{
    ifstream infile{filename};
    if (! infile)
        throw FileError{filename, "unable to open file", false};

    return read_sdp_solution(infile, filename, invariant_block_sizes, anti_invariant_block_sizes);
}
