#include <flagalg/sdp_solver.hh>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace flagalg;

using std::ofstream;
using std::string;

namespace fs = std::filesystem;

namespace
{
    auto make_script(const string & name, const string & body) -> string
    {
        auto path = fs::temp_directory_path() / ("flagalg-" + name + "-" + std::to_string(getpid()) + ".sh");
        {
            ofstream f{path};
            f << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(path, fs::perms::owner_all);
        return path.string();
    }

    auto run(const string & program, std::chrono::seconds timeout = std::chrono::seconds{10}) -> SDPSolverResult
    {
        SDPSolverParams params;
        params.program = program;
        params.timeout = timeout;
        CSDPSolver solver{params};
        return solver.solve("in.dat-s", "out.sol");
    }
}

TEST_CASE("objective lines")
{
    CHECK(parse_objective_line("Primal objective value: -2.8571428e-01") == -(-2.8571428e-01));
    CHECK(parse_objective_line("Primal objective value: 0.5 ") == -0.5);
    CHECK(! parse_objective_line("Dual objective value: -2.8571428e-01"));
    CHECK(! parse_objective_line("Primal objective value: nothing"));
    CHECK(! parse_objective_line(""));
}

TEST_CASE("running a solver")
{
    SECTION("no objective")
    {
        auto result = run("true");
        CHECK(result.exit_status == 0);
        CHECK(! result.timed_out);
        CHECK(! result.objective);
        CHECK(result.extra_stats.front() == "solver_program = true");
    }

    SECTION("failure")
    {
        CHECK(run("false").exit_status == 1);
        CHECK(run("/nonexistent/flagalg-solver").exit_status == 127);
    }

    SECTION("objective and arguments")
    {
        auto script = make_script("objective",
            "[ \"$1\" = in.dat-s ] && [ \"$2\" = out.sol ] || exit 3\n"
            "echo 'Success: SDP solved'\n"
            "echo 'Primal objective value: -2.5000000e-01'\n"
            "echo 'Dual objective value: -2.5000000e-01'");
        auto result = run(script);
        fs::remove(script);

        CHECK(result.exit_status == 0);
        REQUIRE(result.objective);
        CHECK(*result.objective == 0.25);
    }

    SECTION("timeout")
    {
        auto script = make_script("timeout", "echo 'Primal objective value: -1.0'\nexec sleep 30");
        auto result = run(script, std::chrono::seconds{1});
        fs::remove(script);

        CHECK(result.timed_out);
        CHECK(! result.objective);
        CHECK(result.exit_status == 128 + 9);
        CHECK(result.extra_stats.back() == "solver_timed_out = true");
    }
}
