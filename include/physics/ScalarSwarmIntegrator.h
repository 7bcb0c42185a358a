#pragma once
#include "physics/SwarmIntegrator.h"

// Reference strategy: symmetrized i<j double loop. One pair evaluation
// updates both particles.
class ScalarSwarmIntegrator : public SwarmIntegrator {
public:
    const char* name() const override { return "scalar"; }

protected:
    void accumulatePairForces(const std::vector<Lik>& liks,
        const IntegratorParams& params,
        std::vector<Vec3>& forces) override;
};
