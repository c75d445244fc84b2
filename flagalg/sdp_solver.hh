#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_SDP_SOLVER_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_SDP_SOLVER_HH 1

#include <chrono>
#include <exception>
#include <list>
#include <optional>
#include <string>

namespace flagalg
{
    /**
     * Thrown if we couldn't launch or talk to the external solver at all. A
     * solver that runs and then fails is reported through SDPSolverResult
     * instead.
     */
    class SolverFailedUs : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit SolverFailedUs(const std::string & message) noexcept;

        auto what() const noexcept -> const char * override;
    };

    struct SDPSolverParams
    {
        /// Program to run, looked up on $PATH if it has no slash.
        std::string program = "csdp";

        /// Kill the solver if it runs for longer than this.
        std::chrono::seconds timeout = std::chrono::hours{24 * 7};

        /// Echo every line the solver prints to stdout.
        bool show_output = false;
    };

    struct SDPSolverResult
    {
        /// The solver's exit status, or 128 plus the signal number if it was
        /// killed.
        int exit_status = -1;

        /// Did we kill it for running out of time?
        bool timed_out = false;

        /// The negated primal objective value, if the solver reported one.
        /// Unset means the solve did not complete.
        std::optional<double> objective;

        /// Extra stats, for printing.
        std::list<std::string> extra_stats;
    };

    /**
     * Something that reads an SDP input file and writes a solution file.
     */
    class SDPSolver
    {
    public:
        virtual ~SDPSolver() = default;

        virtual auto solve(const std::string & input_filename, const std::string & output_filename) -> SDPSolverResult = 0;
    };

    /**
     * Runs CSDP as a subprocess, scraping its objective value from stdout.
     */
    class CSDPSolver final : public SDPSolver
    {
    private:
        SDPSolverParams _params;

    public:
        explicit CSDPSolver(SDPSolverParams params);

        /**
         * \throw SolverFailedUs
         */
        virtual auto solve(const std::string & input_filename, const std::string & output_filename) -> SDPSolverResult override;
    };

    /**
     * If a line of solver output reports the primal objective value, return
     * it negated (we minimise the negation of the bound).
     */
    auto parse_objective_line(const std::string & line) -> std::optional<double>;
}

#endif
