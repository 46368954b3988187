#ifndef SUDOKU_COMMON_H
#define SUDOKU_COMMON_H

#include <cstring>

const int N = 9;
const int SQRT_N = 3;
const int NUM_CELLS = N * N;
const int NUM_UNITS = 3 * N;
const int NUM_PEERS = 20;

// bit (d - 1) set <=> digit d still possible
const unsigned short ALL_DIGITS = (1 << N) - 1;

inline unsigned short digit_bit(int digit) {
    return (unsigned short)(1 << (digit - 1));
}

inline int bit_count(unsigned short mask) {
    return __builtin_popcount(mask);
}

inline bool is_single(unsigned short mask) {
    return mask != 0 && (mask & (mask - 1)) == 0;
}

// Lowest digit in the mask, 0 when empty.
inline int mask_to_digit(unsigned short mask) {
    if (mask == 0) return 0;
    return __builtin_ctz(mask) + 1;
}

struct SolveStats {
    long long assignments = 0;
    long long backtracks = 0;
    long long contradictions = 0;
};

// Outcome of one solve call. grid is meaningful only when solved is set.
struct SolveResult {
    bool solved = false;
    int grid[N][N];
    SolveStats stats;

    SolveResult() { memset(grid, 0, sizeof(grid)); }
};

// Digits present in the row, column and box of (r, c), excluding (r, c) itself.
inline int get_used(const int grid[N][N], int r, int c) {
    int used = 0;
    for (int k = 0; k < N; k++) {
        if (k != c && grid[r][k] >= 1 && grid[r][k] <= N) used |= (1 << (grid[r][k] - 1));
        if (k != r && grid[k][c] >= 1 && grid[k][c] <= N) used |= (1 << (grid[k][c] - 1));
    }
    int br = (r / SQRT_N) * SQRT_N;
    int bc = (c / SQRT_N) * SQRT_N;
    for (int i = 0; i < SQRT_N; i++) {
        for (int j = 0; j < SQRT_N; j++) {
            if (br + i == r && bc + j == c) continue;
            int val = grid[br + i][bc + j];
            if (val >= 1 && val <= N) used |= (1 << (val - 1));
        }
    }
    return used;
}

// Every row, column and box holds 1..9 exactly once.
inline bool is_valid_solution(const int grid[N][N]) {
    for (int i = 0; i < N; i++) {
        for (int j = 0; j < N; j++) {
            int val = grid[i][j];
            if (val < 1 || val > N) return false;
            if (get_used(grid, i, j) & (1 << (val - 1))) return false;
        }
    }
    return true;
}

inline bool preserves_clues(const int puzzle[N][N], const int grid[N][N]) {
    for (int i = 0; i < N; i++) {
        for (int j = 0; j < N; j++) {
            int clue = puzzle[i][j];
            if (clue >= 1 && clue <= N && grid[i][j] != clue) return false;
        }
    }
    return true;
}

#endif
