#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_UTILS_JSON_UTILS_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_UTILS_JSON_UTILS_HH 1

#include <flagalg/problem.hh>
#include <flagalg/sdp_solver.hh>

#include <nlohmann/json.hpp>

#include <chrono>
#include <list>
#include <optional>
#include <string>

namespace flagalg::utils
{
    /// Build commandline as a single string
    auto commandline_to_json(int argc, char ** argv) -> nlohmann::json;

    /// Parse "key = value" extra_stats into structured JSON
    auto extra_stats_to_json(const std::list<std::string> & extra_stats) -> nlohmann::json;

    /// Everything we learned from a run, for --json-output
    auto make_run_json(
        int argc,
        char ** argv,
        const Problem & problem,
        const std::optional<ConstructionCertificate> & certificate,
        const std::optional<SDPSolverResult> & solver_result,
        const std::optional<SharpsResult> & sharps,
        const std::chrono::milliseconds & overall_time,
        const std::string & status) -> nlohmann::json;

    /// Write json to a file, adding a .json suffix if there isn't one
    auto write_json_file(const nlohmann::json & j, std::string filename) -> void;
}

#endif
