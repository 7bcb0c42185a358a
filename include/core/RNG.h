#pragma once
#include <cstdint>
#include <random>

// Global RNG for reproducibility across all components.
// Defined once per executable (main.cpp or the test driver).
extern std::mt19937_64 GLOBAL_RNG;

void reseedRNG(uint64_t seed);

// uniform(lo, hi) drawn from GLOBAL_RNG
inline double uniformReal(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(GLOBAL_RNG);
}
