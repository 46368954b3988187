#include <catch2/catch.hpp>
#include "sudoku_backtracking.h"
#include "sudoku_search.h"
#include "test_puzzles.h"

TEST_CASE("Backtracking solves the easy puzzle", "[backtracking]") {
    Puzzle p = load_puzzle(EASY_PUZZLE);
    SolveResult result;
    solve_backtracking(p.grid, result);

    REQUIRE(result.solved);
    REQUIRE(format_grid(result.grid) == EASY_SOLUTION);
    // first empty cell, digits in ascending order
    REQUIRE(result.stats.assignments == 4208);
    REQUIRE(result.stats.backtracks == 4157);
}

TEST_CASE("Backtracking agrees with the CP engine", "[backtracking]") {
    Puzzle p = load_puzzle(EASY_PUZZLE);
    SolveResult bt;
    SolveResult cp;
    solve_backtracking(p.grid, bt);
    solve_cp(p.grid, cp);

    REQUIRE(bt.solved);
    REQUIRE(cp.solved);
    REQUIRE(format_grid(bt.grid) == format_grid(cp.grid));
}

TEST_CASE("Backtracking fills a single blank with one assignment", "[backtracking]") {
    Puzzle p = load_puzzle(ONE_BLANK_PUZZLE);
    SolveResult result;
    solve_backtracking(p.grid, result);

    REQUIRE(result.solved);
    REQUIRE(result.stats.assignments == 1);
    REQUIRE(result.stats.backtracks == 0);
}

TEST_CASE("Backtracking solves a blank grid", "[backtracking]") {
    Puzzle p = blank_puzzle();
    SolveResult result;
    solve_backtracking(p.grid, result);

    REQUIRE(result.solved);
    REQUIRE(is_valid_solution(result.grid));
    REQUIRE(format_grid(result.grid).substr(0, 18) == "123456789456789123");
    REQUIRE(result.stats.assignments == 391);
    REQUIRE(result.stats.backtracks == 310);
}

TEST_CASE("Backtracking rejects duplicate clues before searching", "[backtracking]") {
    Puzzle p = load_puzzle(DUPLICATE_ROW_PUZZLE);
    SolveResult result;
    solve_backtracking(p.grid, result);

    REQUIRE_FALSE(result.solved);
    REQUIRE(result.stats.assignments == 0);
    REQUIRE(result.stats.contradictions == 1);
}
