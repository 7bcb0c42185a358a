#pragma once
#include <cstdint>
#include <string>

// =============================================================================
// SimulationConfig - All the knobs and dials for the LIK swarm
//
// Every configurable parameter lives here as a typed field. The engine reads
// these fields directly; the ParameterRegistry exposes the user-facing ones by
// key (with bounds and steps) for the control panel and the auto-loop.
// Parameters are organized into logical groups:
//   - Global: random seed, integrator backend
//   - Field geometry: population bounds, lifespan, universe size
//   - Swarm behavior: the pairwise force model
//   - Interaction: global drift, animation speed
//   - Resonance lines / line distortion: what the renderer draws between LIKs
//   - Palette / LIK rendering / RGB shift: visual-only knobs
//   - Auto loop: parameter modulation
//   - Engine tuning: constants fixed at build-time defaults
// =============================================================================

enum class IntegratorBackend {
    SCALAR,
    BATCHED
};

struct SimulationConfig {

    // -------------------------------------------------------------------------
    // Global Simulation Parameters
    // -------------------------------------------------------------------------
    uint64_t seed = 1;                 // RNG seed for reproducibility
    IntegratorBackend integratorBackend = IntegratorBackend::SCALAR;
    int integratorWorkers = 4;         // Threads used by the batched backend

    // -------------------------------------------------------------------------
    // Canvas
    // -------------------------------------------------------------------------
    std::string backgroundColor = "#000000";
    std::string compositeOperation = "lighter";

    // -------------------------------------------------------------------------
    // Field Geometry
    // -------------------------------------------------------------------------
    double maxLikCount = 300;          // Upper population bound
    double minLikCount = 100;          // Lower population bound
    double maxLikLifespan = 1800;      // Frames; actual lifespan is 50-100% of this
    double universeRadius = 1000;      // Containment sphere around the origin

    // -------------------------------------------------------------------------
    // Swarm Behavior
    // These parameters define the pairwise force model.
    // -------------------------------------------------------------------------
    double attractionStrength = 0.005;
    double attractionSimilarityThreshold = 0.7;  // Above: attract, else repel
    double repulsionStrength = 0.005;
    double baseMigrationSpeed = 0.002;           // Per-LIK random walk amplitude
    double personalSpaceRadius = 50;
    double personalSpaceRepulsion = 0.5;

    // -------------------------------------------------------------------------
    // Interaction
    // -------------------------------------------------------------------------
    double globalDriftStrength = 0.1;
    double globalDriftMomentum = 0.99;
    double animationSpeed = 1.0;       // Scales the frame dt
    double cameraMovementSpeed = 5.0;

    // -------------------------------------------------------------------------
    // Resonance Lines
    // -------------------------------------------------------------------------
    double lineDrawSampleCount = 10;
    double resonanceThickness = 1.5;
    double maxLineThicknessChaos = 0.5;
    double resonanceAlpha = 0.15;
    double maxResonanceDist = 200;
    double resonanceThreshold = 0.0;   // Min hue similarity for a line

    // -------------------------------------------------------------------------
    // Line Distortion (renderer only)
    // -------------------------------------------------------------------------
    double curveWiggleFactor = 0.5;
    double pulsationSpeed = 0.1;
    double lineTargetPull = 0.5;

    // -------------------------------------------------------------------------
    // Palette
    // -------------------------------------------------------------------------
    double paletteSaturation = 50;     // Percent
    double paletteLightness = 50;      // Percent

    // -------------------------------------------------------------------------
    // LIK Rendering
    // -------------------------------------------------------------------------
    bool renderLiks = true;
    double likBaseSize = 5.0;
    double minLikRenderSize = 1.0;
    double trailAlpha = 0.9;

    // -------------------------------------------------------------------------
    // RGB Shift (renderer only)
    // -------------------------------------------------------------------------
    bool rgbShiftLiks = true;
    bool rgbShiftLines = true;
    double rgbShiftAmount = 6.0;
    double rgbShiftAngleDeg = 45;
    double rgbShiftJitter = 0.15;
    std::string rgbShiftMode = "add";

    // -------------------------------------------------------------------------
    // Auto Loop
    // -------------------------------------------------------------------------
    bool autoLoopEnabled = false;
    double autoLoopSpeed = 2.0;
    double autoLoopLimes = 0.2;        // Fraction inset from each UI bound
    double autoLoopJitter = 0.15;

    // -------------------------------------------------------------------------
    // Engine Tuning
    // Not exposed in the control panel.
    // -------------------------------------------------------------------------
    double pairEpsilon = 1e-9;         // Squared distance below which pairs are skipped
    double dampingMomentum = 0.98;     // Velocity retained per step
    int hueRefreshInterval = 15;       // Frames between hue/RGB recomputes
    int resonanceCadence = 10;         // Frames between resonance scans
    double spawnProbability = 0.05;    // Per-frame chance of growth toward max
    double spawnJitter = 25.0;         // Half-width of the spawn cube
    double frameRate = 60.0;           // Host frame rate used to derive dt
};
