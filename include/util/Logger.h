#pragma once

#include <iostream>
#include <string>
#include <utility>

// =============================================================================
// Simple Logging System for the LIK Swarm
//
// Provides toggleable console output for watching the engine work.
// Population churn and auto-loop switches are the interesting bits; the
// physics category is chatty and meant for short debugging sessions.
// =============================================================================

namespace Log {

    // Global logging enable flag - toggled via UI
    inline bool enabled = false;

    // Log categories for fine-grained control
    inline bool showPopulation = true;
    inline bool showModulator = true;
    inline bool showResonance = false;
    inline bool showPhysics = false;

    // Core logging function
    template<typename... Args>
    inline void print(Args&&... args) {
        if (!enabled) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    // Category-specific logging helpers
    template<typename... Args>
    inline void population(Args&&... args) {
        if (!enabled || !showPopulation) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void modulator(Args&&... args) {
        if (!enabled || !showModulator) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void resonance(Args&&... args) {
        if (!enabled || !showResonance) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void physics(Args&&... args) {
        if (!enabled || !showPhysics) return;
        (std::cout << ... << std::forward<Args>(args));
    }

} // namespace Log
