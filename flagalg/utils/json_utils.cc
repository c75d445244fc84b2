#include <flagalg/formats/file_error.hh>
#include <flagalg/utils/json_utils.hh>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

using namespace std::chrono;

using json = nlohmann::json;

namespace flagalg::utils
{
    auto commandline_to_json(int argc, char ** argv) -> json
    {
        std::ostringstream cmd;
        for (int i = 0; i < argc; ++i) {
            if (i > 0) cmd << " ";
            cmd << argv[i];
        }
        return cmd.str();
    }

    auto extra_stats_to_json(const std::list<std::string> & extra_stats) -> json
    {
        json j = json::object();

        static const std::set<std::string> numeric_keys = {"graphs", "construction_graphs",
            "construction_graphs_not_admissible", "solver_exit_status"};

        for (const auto & stat : extra_stats) {
            auto pos = stat.find('=');
            if (pos == std::string::npos) continue;

            std::string key = stat.substr(0, pos);
            std::string value = stat.substr(pos + 1);

            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));

            if (numeric_keys.contains(key) || key.starts_with("types_of_order_"))
                j[key] = std::stoll(value);
            else
                j[key] = value;
        }
        return j;
    }

    auto make_run_json(
        int argc,
        char ** argv,
        const Problem & problem,
        const std::optional<ConstructionCertificate> & certificate,
        const std::optional<SDPSolverResult> & solver_result,
        const std::optional<SharpsResult> & sharps,
        const milliseconds & overall_time,
        const std::string & status) -> json
    {
        json j;

        j["commandline"] = commandline_to_json(argc, argv);

        auto finished_at = system_clock::to_time_t(system_clock::now());
        std::ostringstream ts;
        ts << std::put_time(std::localtime(&finished_at), "%F %T");
        j["finished_at"] = ts.str();
        j["status"] = status;

        j["n"] = problem.n;
        j["runtime"] = overall_time.count();

        json types = json::array();
        for (decltype(problem.types.size()) ti = 0; ti < problem.types.size(); ++ti)
            types.push_back({{"type", graph_to_string(problem.types[ti])},
                {"flags", problem.flags[ti].size()},
                {"basis_block_sizes", problem.flag_bases[ti].row_block_sizes()}});
        j["types"] = types;

        if (! problem.extra_stats.empty()) j.update(extra_stats_to_json(problem.extra_stats));

        if (certificate) {
            json construction = json::array();
            for (auto & sg : certificate->sharp_graphs)
                construction.push_back({{"graph", graph_to_string(sg.graph)}, {"density", sg.density.to_string()}});
            j["construction"] = construction;
            if (! certificate->extra_stats.empty()) j.update(extra_stats_to_json(certificate->extra_stats));
        }

        if (solver_result) {
            if (solver_result->objective)
                j["objective"] = *solver_result->objective;
            if (! solver_result->extra_stats.empty()) j.update(extra_stats_to_json(solver_result->extra_stats));
        }

        if (sharps) {
            j["bound"] = sharps->bound;
            json sharp_graphs = json::array();
            for (auto gi : sharps->sharp_indices)
                sharp_graphs.push_back({{"graph", graph_to_string(problem.graphs[gi])}, {"bound", sharps->bounds[gi]}});
            j["sharp_graphs"] = sharp_graphs;
        }

        return j;
    }

    auto write_json_file(const json & j, std::string filename) -> void
    {
        if (! filename.ends_with(".json"))
            filename += ".json";
        std::ofstream out(filename);
        if (! out)
            throw FileError{filename, "unable to open file for writing", false};
        out << j.dump(4) << std::endl;
    }
}
