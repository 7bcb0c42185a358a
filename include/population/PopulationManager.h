#pragma once
#include <cstddef>
#include <vector>

#include "core/Types.h"
#include "core/Lik.h"
#include "config/SimulationConfig.h"

// What one ensure() call changed.
struct PopulationDelta {
    size_t culled = 0;
    size_t spawned = 0;
    size_t truncated = 0;
};

// =============================================================================
// PopulationManager - keeps the particle store within [minCount, maxCount]
//
// Order per call:
//   1. cull every LIK whose age has reached its lifespan
//   2. spawn until minCount is reached
//   3. if above maxCount, drop the newest-created excess
//   4. otherwise, if nothing was spawned in 2 and below maxCount, spawn one
//      with spawnProbability
// The store is append-ordered, so "newest" is always the tail.
// =============================================================================
class PopulationManager {
public:
    explicit PopulationManager(const SimulationConfig& cfg);

    PopulationDelta ensure(std::vector<Lik>& liks, int frame,
        size_t minCount, size_t maxCount, const Vec3& origin);

    // Append one freshly initialized LIK.
    void spawn(std::vector<Lik>& liks, int frame, const Vec3& origin);

private:
    const SimulationConfig& config;
};
