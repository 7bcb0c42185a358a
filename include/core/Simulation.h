#pragma once

#include <memory>
#include <vector>

#include "core/Lik.h"
#include "config/SimulationConfig.h"
#include "config/ParameterRegistry.h"
#include "modulation/ParameterModulator.h"
#include "physics/SwarmIntegrator.h"
#include "population/PopulationManager.h"
#include "resonance/ResonanceCache.h"

struct BackgroundRgba {
    Rgb8 rgb;
    double alpha;
};

// =============================================================================
// Simulation - one step per rendered frame
//
// Phases within step(), strictly ordered:
//   1. auto-loop writes config
//   2. population cull/spawn
//   3. global drift update
//   4. throttled hue refresh
//   5. force pass + integration
//   6. resonance scan (on cadence only; shrinking the store just drops
//      pairs that point past its end)
// The config is owned by the caller and must outlive the Simulation.
// =============================================================================
class Simulation {
public:
    explicit Simulation(SimulationConfig& config);

    // Clear particles, drift, pairs and the frame counter.
    void reset();

    void step(double dt);

    void togglePause() { paused = !paused; }
    void setPaused(bool p) { paused = p; }
    bool isPaused() const { return paused; }

    // Scatter the physics and visual parameters across their useful ranges.
    void randomizeAll();

    std::vector<Lik>& getLiks() { return liks; }
    const std::vector<Lik>& getLiks() const { return liks; }
    const std::vector<ResonancePair>& getResonancePairs() const { return resonance.getPairs(); }
    const ResonanceCache& getResonanceCache() const { return resonance; }
    const Vec3& getGlobalDrift() const { return globalDrift; }
    int getFrame() const { return frame; }

    SimulationConfig& getConfig() { return cfg; }
    ParameterRegistry& getRegistry() { return registry; }
    ParameterModulator& getModulator() { return modulator; }
    const SwarmIntegrator& getIntegrator() const { return *integrator; }

    BackgroundRgba backgroundRgba() const;

    // Spawn origin for new LIKs.
    void setOrigin(const Vec3& o) { origin = o; }

private:
    SimulationConfig& cfg;
    ParameterRegistry registry;
    ParameterModulator modulator;
    PopulationManager population;
    ResonanceCache resonance;

    std::unique_ptr<SwarmIntegrator> integrator;
    IntegratorBackend activeBackend;
    int activeWorkers;

    std::vector<Lik> liks;
    Vec3 globalDrift{ 0.0 };
    Vec3 origin{ 0.0 };
    int frame = 0;
    bool paused = false;

    void updateGlobalDrift();
    void refreshColors();
    void syncIntegrator();
};
