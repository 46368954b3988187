#include <chrono>
#include "sudoku_driver.h"

using namespace std;

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts, false)) {
        print_usage(cerr, argv[0], false);
        return 2;
    }
    if (opts.help) {
        print_usage(cout, argv[0], false);
        return 0;
    }

    vector<Puzzle> puzzles;
    if (!load_puzzles(opts, puzzles)) return 2;

    vector<SolveResult> results(puzzles.size());
    double total_ms = 0;

    for (size_t i = 0; i < puzzles.size(); i++) {
        auto start = chrono::high_resolution_clock::now();
        solve_puzzle(puzzles[i], opts.algorithm, results[i]);
        auto end = chrono::high_resolution_clock::now();
        chrono::duration<double, std::milli> elapsed = end - start;
        total_ms += elapsed.count();

        report_progress(opts, (int)i + 1, results[i]);
        report_stats(opts, (int)i + 1, results[i], elapsed.count());
    }

    if (opts.stats) cerr << "Total: " << total_ms << " ms\n";

    return write_results(opts, results);
}
