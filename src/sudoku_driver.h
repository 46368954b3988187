#ifndef SUDOKU_DRIVER_H
#define SUDOKU_DRIVER_H

#include <fstream>
#include <iostream>
#include <vector>
#include "sudoku_backtracking.h"
#include "sudoku_io.h"
#include "sudoku_options.h"
#include "sudoku_search.h"

inline void solve_puzzle(const Puzzle& puzzle, Algorithm algorithm, SolveResult& result) {
    if (algorithm == ALGO_BACKTRACK) {
        solve_backtracking(puzzle.grid, result);
    } else {
        solve_cp(puzzle.grid, result);
    }
}

// Puzzles come from -p, -i or stdin, in that order of preference.
inline bool load_puzzles(const Options& opts, std::vector<Puzzle>& puzzles) {
    if (!opts.puzzle.empty()) {
        Puzzle p;
        if (!parse_grid(opts.puzzle, p.grid)) {
            std::cerr << "Error: puzzle must have exactly " << NUM_CELLS << " cells\n";
            return false;
        }
        puzzles.push_back(p);
        return true;
    }

    bool complete;
    if (opts.input.empty()) {
        complete = read_puzzles(std::cin, puzzles);
    } else {
        std::ifstream in(opts.input.c_str());
        if (!in) {
            std::cerr << "Error: cannot open " << opts.input << "\n";
            return false;
        }
        complete = read_puzzles(in, puzzles);
    }

    if (!complete) {
        std::cerr << "Error: input ends with an incomplete grid\n";
        return false;
    }
    if (puzzles.empty()) {
        std::cerr << "Error: no puzzles in input\n";
        return false;
    }
    return true;
}

inline void report_progress(const Options& opts, int index, const SolveResult& result) {
    if (opts.quiet) return;
    if (result.solved) {
        std::cerr << "Solved Grid " << index << "\n";
    } else {
        std::cerr << "Unable to find solution to Grid " << index << "\n";
    }
}

inline void report_stats(const Options& opts, int index, const SolveResult& result, double elapsed_ms) {
    if (!opts.stats) return;
    std::cerr << "Grid " << index
              << ": assignments=" << result.stats.assignments
              << " backtracks=" << result.stats.backtracks
              << " contradictions=" << result.stats.contradictions
              << " time=" << elapsed_ms << " ms\n";
}

// Writes every result in input order. Returns the process exit code:
// 0 when all puzzles were solved, 1 otherwise.
inline int write_results(std::ostream& out, const Options& opts, const std::vector<SolveResult>& results) {
    int solved = 0;
    for (size_t i = 0; i < results.size(); i++) {
        int index = (int)i + 1;
        if (!results[i].solved) {
            write_failure(out, index);
            continue;
        }
        if (opts.pretty) {
            write_grid_header(out, index);
            print_grid(out, results[i].grid);
            out << "\n";
        } else {
            write_solution(out, index, results[i].grid);
        }
        solved++;
    }
    out.flush();

    if (!opts.quiet) {
        std::cerr << "Successfully solved " << solved << " out of " << results.size() << " puzzles\n";
    }
    return solved == (int)results.size() ? 0 : 1;
}

// Same, to the -o file or stdout. Exit code 2 when the file cannot be written.
inline int write_results(const Options& opts, const std::vector<SolveResult>& results) {
    if (opts.output.empty()) return write_results(std::cout, opts, results);

    std::ofstream file(opts.output.c_str());
    if (!file) {
        std::cerr << "Error: cannot write " << opts.output << "\n";
        return 2;
    }
    return write_results(file, opts, results);
}

#endif
