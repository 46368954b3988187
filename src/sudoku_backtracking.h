#ifndef SUDOKU_BACKTRACKING_H
#define SUDOKU_BACKTRACKING_H

#include "sudoku_common.h"

// Plain backtracking without propagation, kept as a baseline for the CP
// engine's counters.
struct BacktrackState {
    int grid[N][N];
    unsigned short rowMask[N];
    unsigned short colMask[N];
    unsigned short boxMask[N];

    static int getBox(int row, int col) {
        return (row / SQRT_N) * SQRT_N + (col / SQRT_N);
    }

    // Returns false when the clues already repeat a digit in some unit.
    bool init(const int input_grid[N][N]) {
        memset(grid, 0, sizeof(grid));
        memset(rowMask, 0, sizeof(rowMask));
        memset(colMask, 0, sizeof(colMask));
        memset(boxMask, 0, sizeof(boxMask));

        for (int i = 0; i < N; i++) {
            for (int j = 0; j < N; j++) {
                int v = input_grid[i][j];
                if (v < 1 || v > N) continue;
                if (!is_allowed(i, j, v)) return false;
                place(i, j, v);
            }
        }
        return true;
    }

    bool is_allowed(int row, int col, int val) const {
        unsigned short bit = digit_bit(val);
        return !((rowMask[row] | colMask[col] | boxMask[getBox(row, col)]) & bit);
    }

    void place(int row, int col, int val) {
        unsigned short bit = digit_bit(val);
        grid[row][col] = val;
        rowMask[row] |= bit;
        colMask[col] |= bit;
        boxMask[getBox(row, col)] |= bit;
    }

    void unplace(int row, int col) {
        unsigned short bit = digit_bit(grid[row][col]);
        grid[row][col] = 0;
        rowMask[row] ^= bit;
        colMask[col] ^= bit;
        boxMask[getBox(row, col)] ^= bit;
    }
};

// First empty cell in row-major order, digits 1..9 in turn. One assignment
// per digit placed, one backtrack per digit taken back.
inline bool solve_recursive(BacktrackState& state, SolveStats& stats) {
    for (int row = 0; row < N; row++) {
        for (int col = 0; col < N; col++) {
            if (state.grid[row][col] != 0) continue;

            for (int val = 1; val <= N; val++) {
                if (!state.is_allowed(row, col, val)) continue;

                state.place(row, col, val);
                stats.assignments++;

                if (solve_recursive(state, stats)) return true;

                state.unplace(row, col);
                stats.backtracks++;
            }
            return false;
        }
    }
    return true;
}

inline void solve_backtracking(const int grid[N][N], SolveResult& result) {
    result.solved = false;
    result.stats = SolveStats();

    BacktrackState state;
    if (!state.init(grid)) {
        result.stats.contradictions++;
        return;
    }
    if (!solve_recursive(state, result.stats)) return;

    memcpy(result.grid, state.grid, sizeof(state.grid));
    result.solved = true;
}

#endif
