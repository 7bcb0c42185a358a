#pragma once
#include <memory>
#include <vector>

#include "core/Types.h"
#include "core/Lik.h"
#include "config/SimulationConfig.h"

// Typed snapshot of the force-model parameters, captured once per step so
// the force pass never observes a half-written config.
struct IntegratorParams {
    double personalSpaceRadius = 50.0;
    double personalSpaceRepulsion = 0.5;
    double attractionStrength = 0.005;
    double attractionSimilarityThreshold = 0.7;
    double repulsionStrength = 0.005;
    double baseMigrationSpeed = 0.002;
    double dampingMomentum = 0.98;
    double universeRadius = 1000.0;
    double epsilon = 1e-9;          // squared-distance guard

    static IntegratorParams fromConfig(const SimulationConfig& cfg);
};

// Force exerted on particle i by particle j. Particle j receives the exact
// negation of both terms.
struct PairForce {
    Vec3 personalSpace{ 0.0 };
    Vec3 hue{ 0.0 };
    bool interacted = false;   // false when the pair was skipped as coincident

    Vec3 total() const { return personalSpace + hue; }
};

PairForce computePairForce(const Vec3& posI, double hueI,
    const Vec3& posJ, double hueJ,
    const IntegratorParams& params);

// Rescale position onto the sphere when outside it. Returns true if clipped.
bool containPosition(Vec3& position, double universeRadius);

// =============================================================================
// SwarmIntegrator - advances every LIK by one step
//
// Strategies differ only in how the pairwise sums are evaluated; noise,
// drift, damping and containment are shared.
// =============================================================================
class SwarmIntegrator {
public:
    virtual ~SwarmIntegrator() = default;

    // Mutates positions and velocities in place. dt is accepted for
    // interface symmetry; the force model is per-step.
    void advance(std::vector<Lik>& liks, double dt, const Vec3& drift,
        const IntegratorParams& params);

    virtual const char* name() const = 0;

protected:
    // Fill forces[i] with the net pairwise force on liks[i].
    virtual void accumulatePairForces(const std::vector<Lik>& liks,
        const IntegratorParams& params,
        std::vector<Vec3>& forces) = 0;

private:
    std::vector<Vec3> forces;   // scratch, reused across steps
};

std::unique_ptr<SwarmIntegrator> makeSwarmIntegrator(IntegratorBackend backend, int workers);
