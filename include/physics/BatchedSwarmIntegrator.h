#pragma once
#include <vector>
#include "physics/SwarmIntegrator.h"

// Alternate strategy over the same force model: positions and hues are
// packed into structure-of-arrays buffers and each row (one particle's sum
// over all others) is evaluated independently, so rows can be split across
// worker threads. Summation order differs from the scalar strategy; results
// agree within floating tolerance.
class BatchedSwarmIntegrator : public SwarmIntegrator {
public:
    explicit BatchedSwarmIntegrator(int workers = 1);

    const char* name() const override { return "batched"; }
    int getWorkerCount() const { return workerCount; }

protected:
    void accumulatePairForces(const std::vector<Lik>& liks,
        const IntegratorParams& params,
        std::vector<Vec3>& forces) override;

private:
    int workerCount;

    // SoA scratch, reused across steps
    std::vector<double> xs;
    std::vector<double> ys;
    std::vector<double> zs;
    std::vector<double> hues;

    void accumulateRows(size_t begin, size_t end,
        const IntegratorParams& params,
        std::vector<Vec3>& forces) const;
};
