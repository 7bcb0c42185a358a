// =============================================================================
// LIK Swarm
//
// A generative particle swarm. LIKs are born, drift, attract their own colors,
// push away strangers, and die; nearby look-alikes are joined by resonance
// lines. Every knob in the panel can be put on auto loop.
//
// Press buttons, turn knobs, watch it breathe. Have fun!
// =============================================================================

#include "core/Simulation.h"
#include "core/RNG.h"
#include "visualization/PolyscopeRenderer.h"

// Global RNG for reproducibility across all components
std::mt19937_64 GLOBAL_RNG;

void reseedRNG(uint64_t seed) {
    GLOBAL_RNG.seed(seed);
}

int main() {
    // Default configuration - tuned for a nice visual demo
    SimulationConfig config;
    config.integratorBackend = IntegratorBackend::BATCHED;
    config.autoLoopEnabled = true;

    reseedRNG(config.seed);

    // Create and run the simulation
    Simulation sim(config);
    PolyscopeRenderer renderer(&sim);
    renderer.initialize();
    renderer.renderLoop();

    return 0;
}
