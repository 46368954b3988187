#include <catch2/catch.hpp>
#include "sudoku_driver.h"
#include "test_puzzles.h"
#include <sstream>
#include <string>
#include <vector>

// ============================================================================
// load_puzzles
// ============================================================================

TEST_CASE("load_puzzles takes an inline puzzle", "[driver][load]") {
    Options opts;
    std::vector<Puzzle> puzzles;

    SECTION("valid") {
        opts.puzzle = EASY_PUZZLE;
        REQUIRE(load_puzzles(opts, puzzles));
        REQUIRE(puzzles.size() == 1);
        REQUIRE(format_grid(puzzles[0].grid) == EASY_PUZZLE);
    }
    SECTION("too short") {
        opts.puzzle = "530070000";
        REQUIRE_FALSE(load_puzzles(opts, puzzles));
        REQUIRE(puzzles.empty());
    }
}

TEST_CASE("load_puzzles reports a missing input file", "[driver][load]") {
    Options opts;
    opts.input = "/nonexistent/puzzles.txt";
    std::vector<Puzzle> puzzles;

    REQUIRE_FALSE(load_puzzles(opts, puzzles));
}

// ============================================================================
// solve_puzzle / write_results
// ============================================================================

TEST_CASE("solve_puzzle dispatches on the algorithm", "[driver][solve]") {
    Puzzle p = load_puzzle(EASY_PUZZLE);
    SolveResult cp;
    SolveResult bt;
    solve_puzzle(p, ALGO_CP, cp);
    solve_puzzle(p, ALGO_BACKTRACK, bt);

    REQUIRE(cp.solved);
    REQUIRE(bt.solved);
    REQUIRE(cp.stats.backtracks == 0);
    REQUIRE(bt.stats.backtracks == 4157);
}

TEST_CASE("write_results exit codes", "[driver][write]") {
    Options opts;
    opts.quiet = true;

    std::vector<SolveResult> results(2);
    solve_puzzle(load_puzzle(EASY_PUZZLE), ALGO_CP, results[0]);

    SECTION("all solved") {
        solve_puzzle(load_puzzle(ONE_BLANK_PUZZLE), ALGO_CP, results[1]);
        std::ostringstream out;
        REQUIRE(write_results(out, opts, results) == 0);
        REQUIRE(out.str().find("Grid 02\n534678912\n") != std::string::npos);
    }
    SECTION("one unsolvable") {
        solve_puzzle(load_puzzle(DEAD_END_PUZZLE), ALGO_CP, results[1]);
        std::ostringstream out;
        REQUIRE(write_results(out, opts, results) == 1);
        REQUIRE(out.str().find("Grid 01\n534678912\n") != std::string::npos);
        REQUIRE(out.str().find("Grid 02\nNo solution found.\n") != std::string::npos);
    }
    SECTION("unwritable output file") {
        solve_puzzle(load_puzzle(ONE_BLANK_PUZZLE), ALGO_CP, results[1]);
        opts.output = "/nonexistent/solutions.txt";
        REQUIRE(write_results(opts, results) == 2);
    }
}

TEST_CASE("write_results prints boxed grids with -g", "[driver][write]") {
    Options opts;
    opts.quiet = true;
    opts.pretty = true;

    std::vector<SolveResult> results(1);
    solve_puzzle(load_puzzle(EASY_PUZZLE), ALGO_CP, results[0]);

    std::ostringstream out;
    REQUIRE(write_results(out, opts, results) == 0);
    REQUIRE(out.str().find("Grid 01\n") == 0);
    REQUIRE(out.str().find("A | 5 3 4 | 6 7 8 | 9 1 2 |") != std::string::npos);
}
