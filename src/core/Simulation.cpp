#include "core/Simulation.h"
#include "core/RNG.h"
#include "color/ColorMath.h"
#include "util/Logger.h"

#include <algorithm>
#include <cmath>

// Population bounds live in the config as slider doubles.
static size_t toCount(double value) {
    return static_cast<size_t>(std::max(0.0, std::round(value)));
}

Simulation::Simulation(SimulationConfig& config)
    : cfg(config),
    registry(config),
    modulator(registry),
    population(config),
    resonance(config.resonanceCadence),
    activeBackend(config.integratorBackend),
    activeWorkers(config.integratorWorkers)
{
    integrator = makeSwarmIntegrator(activeBackend, activeWorkers);
}

void Simulation::reset() {
    liks.clear();
    resonance.invalidate();
    globalDrift = Vec3(0.0);
    frame = 0;
    syncIntegrator();
}

void Simulation::syncIntegrator() {
    if (integrator && activeBackend == cfg.integratorBackend
        && activeWorkers == cfg.integratorWorkers) {
        return;
    }
    activeBackend = cfg.integratorBackend;
    activeWorkers = cfg.integratorWorkers;
    integrator = makeSwarmIntegrator(activeBackend, activeWorkers);
    Log::print("[SIM] using ", integrator->name(), " integrator\n");
}

void Simulation::step(double dt) {
    if (paused) return;

    // 1. Auto-loop
    modulator.update(dt, frame);

    // 2. Population
    PopulationDelta delta = population.ensure(liks, frame,
        toCount(cfg.minLikCount), toCount(cfg.maxLikCount), origin);
    if (delta.culled || delta.truncated) {
        resonance.dropOutOfRange(liks.size());
    }

    // 3. Shared drift
    updateGlobalDrift();

    // 4. Colors
    if (cfg.hueRefreshInterval > 0 && frame % cfg.hueRefreshInterval == 0) {
        refreshColors();
    }

    // 5. Physics, on a parameter snapshot taken after the auto-loop wrote
    syncIntegrator();
    integrator->advance(liks, dt, globalDrift, IntegratorParams::fromConfig(cfg));

    // 6. Resonance lines
    resonance.setCadence(cfg.resonanceCadence);
    resonance.update(liks, frame, cfg.maxResonanceDist, cfg.resonanceThreshold);

    frame++;
}

void Simulation::updateGlobalDrift() {
    const double strength = cfg.globalDriftStrength;
    const double momentum = cfg.globalDriftMomentum;

    globalDrift.x = globalDrift.x * momentum + uniformReal(-0.5, 0.5) * strength;
    globalDrift.y = globalDrift.y * momentum + uniformReal(-0.5, 0.5) * strength;
    globalDrift.z = globalDrift.z * momentum + uniformReal(-0.5, 0.5) * strength;
}

void Simulation::refreshColors() {
    for (auto& l : liks) {
        l.updateColor(frame, cfg.paletteSaturation, cfg.paletteLightness);
    }
}

void Simulation::randomizeAll() {
    auto r = [](double lo, double span) { return lo + uniformReal(0.0, 1.0) * span; };
    auto ri = [&r](double lo, double span) { return std::floor(r(lo, span)); };

    registry.set(ParamKey::MaxLikCount, ri(200, 800));
    registry.set(ParamKey::MinLikCount, ri(50, 200));
    registry.set(ParamKey::MaxLikLifespan, ri(1000, 4000));
    registry.set(ParamKey::UniverseRadius, ri(500, 1500));
    registry.set(ParamKey::AttractionStrength, r(0.0001, 0.0099));
    registry.set(ParamKey::AttractionSimilarityThreshold, r(0.5, 0.5));
    registry.set(ParamKey::RepulsionStrength, r(0.0001, 0.0199));
    registry.set(ParamKey::BaseMigrationSpeed, r(0.0001, 0.0099));
    registry.set(ParamKey::PersonalSpaceRadius, ri(20, 200));
    registry.set(ParamKey::PersonalSpaceRepulsion, r(0.1, 0.9));
    registry.set(ParamKey::PaletteSaturation, ri(20, 80));
    registry.set(ParamKey::PaletteLightness, ri(20, 60));
    registry.set(ParamKey::RgbShiftAmount, r(0.0, 10.0));
    registry.set(ParamKey::RgbShiftAngleDeg, ri(0, 360));
    registry.set(ParamKey::RgbShiftJitter, r(0.0, 0.5));
    registry.set(ParamKey::RgbShiftMode, std::string(uniformReal(0.0, 1.0) < 0.5 ? "add" : "subtract"));
    registry.set(ParamKey::LineDrawSampleCount, ri(5, 95));
    registry.set(ParamKey::ResonanceThickness, r(0.5, 4.5));
    registry.set(ParamKey::MaxLineThicknessChaos, r(0.0, 1.0));
    registry.set(ParamKey::ResonanceAlpha, r(0.05, 0.5));
    registry.set(ParamKey::MaxResonanceDist, ri(100, 700));
    registry.set(ParamKey::GlobalDriftStrength, r(0.0, 0.2));
    registry.set(ParamKey::GlobalDriftMomentum, r(0.9, 0.099));
    registry.set(ParamKey::AnimationSpeed, r(0.5, 3.0));

    Log::print("[SIM] randomized all parameters\n");
}

BackgroundRgba Simulation::backgroundRgba() const {
    return BackgroundRgba{ ColorMath::hexToRgb(cfg.backgroundColor), cfg.trailAlpha };
}
