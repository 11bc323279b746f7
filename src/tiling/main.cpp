#include "tile_csp/tiling/parser.hpp"
#include "tile_csp/tiling/render.hpp"
#include "tile_csp/tiling/tiling_solver.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
tile_csp::tiling::TilingSolver* g_current_solver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-f] [-t SEC] [-n NODES] <input_file>\n";
    std::cerr << "  -s        Print solver statistics to stderr\n";
    std::cerr << "  -v        Verbose mode (print presolve/search progress)\n";
    std::cerr << "  -f        Every footprint must receive a tile\n";
    std::cerr << "  -t SEC    Timeout in seconds\n";
    std::cerr << "  -n NODES  Node limit (prints \"Search aborted\" when reached)\n";
    std::cerr << "\n";
    std::cerr << "Large landscapes can take many nodes; bound the search with -n or -t, e.g.\n";
    std::cerr << "  " << program << " -s -n 200000 -t 60 landscape.txt\n";
}

bool g_print_stats = false;

void print_stats(const tile_csp::SolverStats& s) {
    if (!g_print_stats) return;
    std::cerr << "% Stats: nodes=" << s.node_count
              << " fails=" << s.fail_count
              << " max_depth=" << s.max_depth
              << " revisions=" << s.revise_count
              << " pruned=" << s.prune_count
              << "\n";
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    int timeout_sec = 0;
    bool require_tiles = false;
    tile_csp::tiling::TilingOptions options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "-f") == 0) {
            require_tiles = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            options.node_limit = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Setup timeout
    if (timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(timeout_sec);
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto problem = tile_csp::tiling::parse_file(filename);
        problem->allow_untiled = !require_tiles;

        tile_csp::tiling::TilingSolver solver(*problem, options);
        g_current_solver = &solver;
        auto result = solver.solve();
        g_current_solver = nullptr;
        print_stats(result.stats);

        switch (result.status) {
            case tile_csp::tiling::TilingStatus::Solved:
                std::cout << "Solution found!\n";
                std::cout << tile_csp::tiling::render_solution(solver.problem(), result);
                break;
            case tile_csp::tiling::TilingStatus::NoSolution:
                std::cout << "No solution found\n";
                break;
            case tile_csp::tiling::TilingStatus::InvalidProblem:
                std::cout << "Invalid problem: " << result.message << "\n";
                return 1;
            case tile_csp::tiling::TilingStatus::Aborted:
                std::cout << "Search aborted\n";
                break;
        }
    } catch (const tile_csp::tiling::ConfigurationError& e) {
        std::cout << "Invalid problem: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
