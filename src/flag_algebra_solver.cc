#include <flagalg/configuration.hh>
#include <flagalg/construction.hh>
#include <flagalg/formats/file_error.hh>
#include <flagalg/problem.hh>
#include <flagalg/sdp_solver.hh>
#include <flagalg/utils/json_utils.hh>

#include <cxxopts.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

using namespace flagalg;

using std::cerr;
using std::cout;
using std::endl;
using std::exception;
using std::localtime;
using std::optional;
using std::put_time;
using std::string;
using std::vector;

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::steady_clock;
using std::chrono::system_clock;

auto main(int argc, char * argv[]) -> int
{
    try {
        cxxopts::Options options("Glasgow Flag Algebra Solver", "Get started by using option --help");

        options.add_options("Program options")
            ("help", "Display help information")
            ("n", "Number of vertices in the graphs used for the bound", cxxopts::value<int>())
            ("threads", "Compute product densities using this many threads (0 to auto-detect)", cxxopts::value<unsigned>())
            ("json-output", "Write a summary of the run to this file, as JSON", cxxopts::value<string>());

        vector<string> forbidden_edge_numbers, forbidden_graphs, forbidden_induced_graphs;
        options.add_options("Problem options")
            ("forbid-edge-number", "Forbid k vertices from spanning v or more edges, in the form k:v",
                cxxopts::value<vector<string>>(forbidden_edge_numbers))
            ("forbid", "Forbid this graph as a subgraph, in the form n:abcdef...",
                cxxopts::value<vector<string>>(forbidden_graphs))
            ("forbid-induced", "Forbid this graph as an induced subgraph",
                cxxopts::value<vector<string>>(forbidden_induced_graphs))
            ("density-graph", "Maximise the density of this graph, rather than the edge density", cxxopts::value<string>());

        options.add_options("Basis options")
            ("no-inv-anti-inv", "Do not split flag bases into invariant and anti-invariant parts")
            ("no-orthogonalize", "Do not orthogonalise the anti-invariant part")
            ("blowup", "Use the balanced blow-up of this graph as the construction", cxxopts::value<string>());

        options.add_options("Product density options")
            ("save-densities", "Save product densities to this file", cxxopts::value<string>())
            ("load-densities", "Load product densities from this file, rather than computing them", cxxopts::value<string>());

        options.add_options("SDP solver options")
            ("sdp-file", "Write the SDP to this file", cxxopts::value<string>()->default_value("sdp.dat-s"))
            ("solution-file", "Have the solver write its solution to this file", cxxopts::value<string>()->default_value("sdp.out"))
            ("no-solve", "Write the SDP, but do not run the solver")
            ("csdp", "Run this program as the solver", cxxopts::value<string>()->default_value("csdp"))
            ("timeout", "Kill the solver after this many seconds", cxxopts::value<int>())
            ("show-output", "Show the solver's output")
            ("tolerance", "Report graphs whose bound is within this of the maximum as sharp", cxxopts::value<double>()->default_value("0.00001"));

        auto options_vars = options.parse(argc, argv);

        /* --help? Show a message, and exit. */
        if (options_vars.count("help")) {
            cout << options.help() << endl;
            return EXIT_SUCCESS;
        }

        /* No size specified? Show a message and exit. */
        if (! options_vars.count("n")) {
            cout << "Usage: " << argv[0] << " --n N [options]" << endl;
            return EXIT_FAILURE;
        }

        /* Figure out what our options should be. */
        ProblemParams params;
        params.n = options_vars["n"].as<int>();
        params.constraints = make_constraints(forbidden_edge_numbers, forbidden_graphs, forbidden_induced_graphs);
        if (options_vars.count("density-graph"))
            params.density_graph = parse_graph_option("--density-graph", options_vars["density-graph"].as<string>());

        unsigned n_threads = options_vars.count("threads") ? options_vars["threads"].as<unsigned>() : 1;

        optional<BlowupConstruction> construction;
        if (options_vars.count("blowup"))
            construction.emplace(parse_graph_option("--blowup", options_vars["blowup"].as<string>()));

        SDPSolverParams solver_params;
        solver_params.program = options_vars["csdp"].as<string>();
        solver_params.show_output = options_vars.count("show-output");
        if (options_vars.count("timeout"))
            solver_params.timeout = seconds{options_vars["timeout"].as<int>()};

        char hostname_buf[255];
        if (0 == gethostname(hostname_buf, 255))
            cout << "hostname = " << string(hostname_buf) << endl;

        cout << "commandline =";
        for (int i = 0; i < argc; ++i)
            cout << " " << argv[i];
        cout << endl;

        auto started_at = system_clock::to_time_t(system_clock::now());
        cout << "started_at = " << put_time(localtime(&started_at), "%F %T") << endl;

        /* Start the clock */
        auto start_time = steady_clock::now();

        auto problem = generate_problem(params);
        if (! options_vars.count("no-inv-anti-inv"))
            problem = use_invariant_anti_invariant_bases(problem, ! options_vars.count("no-orthogonalize"));

        cout << "generation_time = " << duration_cast<milliseconds>(steady_clock::now() - start_time).count() << endl;
        for (const auto & s : problem.extra_stats)
            cout << s << endl;

        optional<ConstructionCertificate> certificate;
        if (construction) {
            cout << "construction_edge_density = " << construction->edge_density() << endl;
            if (params.density_graph)
                cout << "construction_graph_density = " << construction->subgraph_density(*params.density_graph) << endl;

            certificate = certify_construction(problem, *construction);
            for (const auto & s : certificate->extra_stats)
                cout << s << endl;
            for (auto & sg : certificate->sharp_graphs)
                cout << "construction_graph = " << graph_to_string(sg.graph) << " " << sg.density
                     << " (" << sg.density.to_double() << ")" << endl;

            auto stats_before = problem.extra_stats.size();
            problem = reduce_bases(problem, *certificate);
            for (auto s = std::next(problem.extra_stats.begin(), stats_before); s != problem.extra_stats.end(); ++s)
                cout << *s << endl;
        }

        auto densities_start_time = steady_clock::now();
        ProductDensities densities;
        if (options_vars.count("load-densities"))
            densities = load_product_densities(problem, options_vars["load-densities"].as<string>());
        else
            densities = calculate_product_densities(problem, n_threads);
        cout << "product_densities_time = " << duration_cast<milliseconds>(steady_clock::now() - densities_start_time).count() << endl;

        if (options_vars.count("save-densities"))
            save_product_densities(problem, densities, options_vars["save-densities"].as<string>());

        auto sdp_file = options_vars["sdp-file"].as<string>(), solution_file = options_vars["solution-file"].as<string>();
        write_sdp_input_file(problem, densities, sdp_file);
        cout << "sdp_file = " << sdp_file << endl;

        string status = "written";
        optional<SDPSolverResult> solver_result;
        optional<SharpsResult> sharps;

        if (! options_vars.count("no-solve")) {
            CSDPSolver solver{solver_params};
            solver_result = solver.solve(sdp_file, solution_file);
            for (const auto & s : solver_result->extra_stats)
                cout << s << endl;

            if (! solver_result->objective) {
                status = "solver_failed";
                cout << "objective = none" << endl;
            }
            else {
                status = "solved";
                cout << "objective = " << std::setprecision(17) << *solver_result->objective << endl;

                auto duals = read_dual_matrices(problem, solution_file);
                sharps = find_sharps(problem, densities, duals, options_vars["tolerance"].as<double>());
                cout << "bound = " << sharps->bound << endl;
                cout << "sharp_graphs = " << sharps->sharp_indices.size() << endl;
                for (auto gi : sharps->sharp_indices)
                    cout << "sharp_graph = " << (gi + 1) << " " << graph_to_string(problem.graphs[gi])
                         << " " << sharps->bounds[gi] << endl;
            }
        }

        /* Stop the clock. */
        auto overall_time = duration_cast<milliseconds>(steady_clock::now() - start_time);

        cout << "status = " << status << endl;
        cout << "runtime = " << overall_time.count() << endl;

        if (options_vars.count("json-output"))
            utils::write_json_file(
                utils::make_run_json(argc, argv, problem, certificate, solver_result, sharps, overall_time, status),
                options_vars["json-output"].as<string>());

        return "solver_failed" == status ? EXIT_FAILURE : EXIT_SUCCESS;
    }
    catch (const FileError & e) {
        cerr << "Error: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    catch (const cxxopts::exceptions::exception & e) {
        cerr << "Error: " << e.what() << endl;
        cerr << "Try " << argv[0] << " --help" << endl;
        return EXIT_FAILURE;
    }
    catch (const exception & e) {
        cerr << "Error: " << e.what() << endl;
        return EXIT_FAILURE;
    }
}
