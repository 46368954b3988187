#include <omp.h>
#include <chrono>
#include "sudoku_driver.h"

using namespace std;

// Solves a batch of puzzles in parallel. Each puzzle is an independent,
// single-threaded solve with its own board and counters.
int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts, true)) {
        print_usage(cerr, argv[0], true);
        return 2;
    }
    if (opts.help) {
        print_usage(cout, argv[0], true);
        return 0;
    }
    if (opts.threads > 0) omp_set_num_threads(opts.threads);

    vector<Puzzle> puzzles;
    if (!load_puzzles(opts, puzzles)) return 2;

    // build the shared topology before any thread touches it
    topology();

    int count = (int)puzzles.size();
    vector<SolveResult> results(count);
    vector<double> elapsed_ms(count, 0.0);

    auto start = chrono::high_resolution_clock::now();

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < count; i++) {
        auto t0 = chrono::high_resolution_clock::now();
        solve_puzzle(puzzles[i], opts.algorithm, results[i]);
        auto t1 = chrono::high_resolution_clock::now();
        elapsed_ms[i] = chrono::duration<double, std::milli>(t1 - t0).count();
    }

    auto end = chrono::high_resolution_clock::now();
    chrono::duration<double, std::milli> elapsed = end - start;

    for (int i = 0; i < count; i++) {
        report_progress(opts, i + 1, results[i]);
        report_stats(opts, i + 1, results[i], elapsed_ms[i]);
    }
    if (opts.stats) {
        cerr << "Total: " << elapsed.count() << " ms on " << omp_get_max_threads() << " threads\n";
    }

    return write_results(opts, results);
}
