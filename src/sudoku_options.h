#ifndef SUDOKU_OPTIONS_H
#define SUDOKU_OPTIONS_H

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

enum Algorithm {
    ALGO_CP,         // propagation + MRV search
    ALGO_BACKTRACK   // plain backtracking baseline
};

struct Options {
    std::string input;    // empty: stdin
    std::string output;   // empty: stdout
    std::string puzzle;   // inline puzzle, overrides input
    Algorithm algorithm = ALGO_CP;
    bool stats = false;
    bool quiet = false;
    bool pretty = false;  // boxed grids instead of digit rows
    bool help = false;
    int threads = 0;      // 0: OpenMP default
};

inline void print_usage(std::ostream& out, const char* prog, bool with_threads) {
    out << "Usage: " << prog << " [-i <input>] [-o <output>] [-p <puzzle>] [-a cp|bt] [-s] [-q] [-g]";
    if (with_threads) out << " [-t <threads>]";
    out << "\n"
        << "  -i  read puzzles from file (default: stdin)\n"
        << "  -o  write solutions to file (default: stdout)\n"
        << "  -p  solve one 81-character puzzle, '0' or '.' for blanks\n"
        << "  -a  cp: constraint propagation + search (default), bt: plain backtracking\n"
        << "  -s  print assignments, backtracks and time per puzzle\n"
        << "  -q  no progress messages\n"
        << "  -g  print solutions as labelled boxed grids\n";
    if (with_threads) out << "  -t  number of OpenMP threads\n";
}

// Errors go to stderr; false means the program should exit with usage.
inline bool parse_options(int argc, char* argv[], Options& opts, bool with_threads) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool takes_value = !strcmp(arg, "-i") || !strcmp(arg, "-o") || !strcmp(arg, "-p") ||
                           !strcmp(arg, "-a") || (with_threads && !strcmp(arg, "-t"));

        if (takes_value && i + 1 >= argc) {
            std::cerr << "Error: option " << arg << " needs a value\n";
            return false;
        }

        if (!strcmp(arg, "-i")) {
            opts.input = argv[++i];
        } else if (!strcmp(arg, "-o")) {
            opts.output = argv[++i];
        } else if (!strcmp(arg, "-p")) {
            opts.puzzle = argv[++i];
        } else if (!strcmp(arg, "-a")) {
            std::string algo = argv[++i];
            if (algo == "cp") {
                opts.algorithm = ALGO_CP;
            } else if (algo == "bt") {
                opts.algorithm = ALGO_BACKTRACK;
            } else {
                std::cerr << "Error: unknown algorithm '" << algo << "'\n";
                return false;
            }
        } else if (with_threads && !strcmp(arg, "-t")) {
            opts.threads = atoi(argv[++i]);
            if (opts.threads <= 0) {
                std::cerr << "Error: thread count must be positive\n";
                return false;
            }
        } else if (!strcmp(arg, "-s")) {
            opts.stats = true;
        } else if (!strcmp(arg, "-q")) {
            opts.quiet = true;
        } else if (!strcmp(arg, "-g")) {
            opts.pretty = true;
        } else if (!strcmp(arg, "-h")) {
            opts.help = true;
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

#endif
