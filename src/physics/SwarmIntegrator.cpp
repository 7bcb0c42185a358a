#include "physics/SwarmIntegrator.h"
#include "physics/ScalarSwarmIntegrator.h"
#include "physics/BatchedSwarmIntegrator.h"
#include "color/ColorMath.h"
#include "core/RNG.h"
#include "util/Logger.h"

#include <cmath>

IntegratorParams IntegratorParams::fromConfig(const SimulationConfig& cfg) {
    IntegratorParams p;
    p.personalSpaceRadius = cfg.personalSpaceRadius;
    p.personalSpaceRepulsion = cfg.personalSpaceRepulsion;
    p.attractionStrength = cfg.attractionStrength;
    p.attractionSimilarityThreshold = cfg.attractionSimilarityThreshold;
    p.repulsionStrength = cfg.repulsionStrength;
    p.baseMigrationSpeed = cfg.baseMigrationSpeed;
    p.dampingMomentum = cfg.dampingMomentum;
    p.universeRadius = cfg.universeRadius;
    p.epsilon = cfg.pairEpsilon;
    return p;
}

//
// ================================
//        PAIRWISE FORCE MODEL
// ================================
//
PairForce computePairForce(const Vec3& posI, double hueI,
    const Vec3& posJ, double hueJ,
    const IntegratorParams& params)
{
    PairForce out;

    Vec3 delta = posJ - posI;
    double d2 = glm::dot(delta, delta);
    if (d2 < params.epsilon) {
        // Coincident: no force, and no reciprocal below.
        return out;
    }
    out.interacted = true;

    double dist = std::sqrt(d2);
    double invD2 = 1.0 / d2;

    // Personal-space repulsion, pushes i away from j
    if (dist < params.personalSpaceRadius) {
        double m = params.personalSpaceRepulsion * (params.personalSpaceRadius - dist) / dist;
        out.personalSpace = -delta * m;
    }

    double similarity = ColorMath::hueSimilarity(hueI, hueJ);
    if (similarity > params.attractionSimilarityThreshold) {
        out.hue = delta * (params.attractionStrength * similarity * invD2);
    }
    else {
        out.hue = -delta * (params.repulsionStrength * (1.0 - similarity) * invD2);
    }

    return out;
}

bool containPosition(Vec3& position, double universeRadius) {
    double r2 = glm::dot(position, position);
    if (r2 <= universeRadius * universeRadius) return false;

    double r = std::sqrt(r2);
    position *= universeRadius / r;
    return true;
}

//
// ================================
//     SHARED INTEGRATION STEP
// ================================
//
void SwarmIntegrator::advance(std::vector<Lik>& liks, double /*dt*/, const Vec3& drift,
    const IntegratorParams& params)
{
    const size_t n = liks.size();
    if (n == 0) return;

    forces.assign(n, Vec3(0.0));
    accumulatePairForces(liks, params, forces);

    // Noise is drawn serially in particle order so every strategy consumes
    // GLOBAL_RNG identically.
    const double mig = params.baseMigrationSpeed;
    int clipped = 0;

    for (size_t i = 0; i < n; ++i) {
        Vec3 noise(uniformReal(-0.5, 0.5) * mig,
            uniformReal(-0.5, 0.5) * mig,
            uniformReal(-0.5, 0.5) * mig);

        Vec3 net = forces[i] + noise + drift;

        Lik& lik = liks[i];
        Vec3 vel = (lik.getVelocity() + net) * params.dampingMomentum;
        Vec3 pos = lik.getPosition() + vel;

        // Only position is clipped; velocity keeps pushing against the wall.
        if (containPosition(pos, params.universeRadius)) {
            ++clipped;
        }

        lik.setVelocity(vel);
        lik.setPosition(pos);
    }

    if (clipped > 0) {
        Log::physics("[PHYSICS] ", name(), ": ", clipped, " of ", n,
            " LIKs clipped to the universe sphere\n");
    }
}

std::unique_ptr<SwarmIntegrator> makeSwarmIntegrator(IntegratorBackend backend, int workers) {
    switch (backend) {
    case IntegratorBackend::BATCHED:
        return std::make_unique<BatchedSwarmIntegrator>(workers);
    case IntegratorBackend::SCALAR:
    default:
        return std::make_unique<ScalarSwarmIntegrator>();
    }
}
