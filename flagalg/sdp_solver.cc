#include <flagalg/sdp_solver.hh>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace flagalg;

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

using std::cout;
using std::istringstream;
using std::nullopt;
using std::optional;
using std::string;
using std::to_string;
using std::vector;

SolverFailedUs::SolverFailedUs(const string & message) noexcept :
    _what("Running the SDP solver failed: " + message)
{
}

auto SolverFailedUs::what() const noexcept -> const char *
{
    return _what.c_str();
}

auto flagalg::parse_objective_line(const string & line) -> optional<double>
{
    if (string::npos == line.find("Primal objective value:"))
        return nullopt;

    istringstream words{line};
    string word, last;
    while (words >> word)
        last = word;

    try {
        std::size_t used = 0;
        double value = std::stod(last, &used);
        if (used != last.size())
            return nullopt;
        return -value;
    }
    catch (const std::logic_error &) {
        return nullopt;
    }
}

CSDPSolver::CSDPSolver(SDPSolverParams params) :
    _params(std::move(params))
{
}

auto CSDPSolver::solve(const string & input_filename, const string & output_filename) -> SDPSolverResult
{
    SDPSolverResult result;

    int stdout_pipefd[2];
    if (0 != pipe2(stdout_pipefd, O_CLOEXEC))
        throw SolverFailedUs{"couldn't make stdout pipes"};

    pid_t child_pid = fork();

    if (0 == child_pid) {
        dup2(stdout_pipefd[1], STDOUT_FILENO);
        dup2(stdout_pipefd[1], STDERR_FILENO);
        execlp(_params.program.c_str(), _params.program.c_str(), input_filename.c_str(), output_filename.c_str(),
            static_cast<char *>(nullptr));
        _exit(127);
    }

    if (-1 == child_pid) {
        close(stdout_pipefd[0]);
        close(stdout_pipefd[1]);
        throw SolverFailedUs{"fork failed"};
    }

    close(stdout_pipefd[1]);

    auto reap = [&]() -> int {
        int wstatus = 0;
        while (-1 == waitpid(child_pid, &wstatus, 0))
            if (EINTR != errno)
                throw SolverFailedUs{"waitpid failed"};
        return wstatus;
    };

    auto deadline = steady_clock::now() + _params.timeout;
    string pending;
    vector<char> buf(4096);

    auto handle_line = [&](string line) {
        if (! line.empty() && '\r' == line.back())
            line.pop_back();
        if (auto objective = parse_objective_line(line))
            result.objective = objective;
        if (_params.show_output)
            cout << line << std::endl;
    };

    while (true) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fd{stdout_pipefd[0], POLLIN, 0};
        int ready = poll(&fd, 1, int(std::min<long long>(remaining, 60 * 1000)));
        if (-1 == ready) {
            if (EINTR == errno)
                continue;
            kill(child_pid, SIGKILL);
            close(stdout_pipefd[0]);
            reap();
            throw SolverFailedUs{"poll failed"};
        }
        if (0 == ready)
            continue;

        ssize_t read_size = read(stdout_pipefd[0], buf.data(), buf.size());
        if (-1 == read_size) {
            if (EINTR == errno)
                continue;
            kill(child_pid, SIGKILL);
            close(stdout_pipefd[0]);
            reap();
            throw SolverFailedUs{"read failed"};
        }
        else if (0 == read_size)
            break;

        pending.append(buf.data(), read_size);
        for (auto nl = pending.find('\n'); nl != string::npos; nl = pending.find('\n')) {
            handle_line(pending.substr(0, nl));
            pending.erase(0, nl + 1);
        }
    }

    if (! pending.empty())
        handle_line(pending);

    if (result.timed_out) {
        kill(child_pid, SIGKILL);
        result.objective = nullopt;
    }

    close(stdout_pipefd[0]);
    int wstatus = reap();

    if (WIFEXITED(wstatus))
        result.exit_status = WEXITSTATUS(wstatus);
    else if (WIFSIGNALED(wstatus))
        result.exit_status = 128 + WTERMSIG(wstatus);

    result.extra_stats.emplace_back("solver_program = " + _params.program);
    result.extra_stats.emplace_back("solver_exit_status = " + to_string(result.exit_status));
    if (result.timed_out)
        result.extra_stats.emplace_back("solver_timed_out = true");

    return result;
}
