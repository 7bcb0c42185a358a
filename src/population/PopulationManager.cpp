#include "population/PopulationManager.h"
#include "core/RNG.h"
#include "util/Logger.h"

#include <algorithm>

PopulationManager::PopulationManager(const SimulationConfig& cfg)
    : config(cfg)
{
}

void PopulationManager::spawn(std::vector<Lik>& liks, int frame, const Vec3& origin) {
    Lik lik;
    lik.initialize(frame, config, origin);
    liks.push_back(lik);
}

PopulationDelta PopulationManager::ensure(std::vector<Lik>& liks, int frame,
    size_t minCount, size_t maxCount, const Vec3& origin)
{
    PopulationDelta delta;

    // 1. Cull
    size_t before = liks.size();
    liks.erase(std::remove_if(liks.begin(), liks.end(),
        [frame](const Lik& l) { return l.isDead(frame); }),
        liks.end());
    delta.culled = before - liks.size();

    // 2. Fill to the floor
    while (liks.size() < minCount) {
        spawn(liks, frame, origin);
        delta.spawned++;
    }

    // 3/4. Trim to the ceiling, or grow toward it gradually. Trimming also
    // covers minCount > maxCount, which the auto-loop can produce briefly.
    // A call that just filled to the floor does not also roll for growth.
    if (liks.size() > maxCount) {
        delta.truncated = liks.size() - maxCount;
        liks.resize(maxCount);
    }
    else if (delta.spawned == 0 && liks.size() < maxCount
        && uniformReal(0.0, 1.0) < config.spawnProbability) {
        spawn(liks, frame, origin);
        delta.spawned++;
    }

    if (delta.culled || delta.truncated || delta.spawned > 1) {
        Log::population("[POPULATION] frame ", frame,
            ": culled ", delta.culled,
            ", spawned ", delta.spawned,
            ", truncated ", delta.truncated,
            " -> ", liks.size(), " LIKs\n");
    }

    return delta;
}
