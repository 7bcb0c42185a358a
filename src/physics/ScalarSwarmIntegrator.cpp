#include "physics/ScalarSwarmIntegrator.h"

void ScalarSwarmIntegrator::accumulatePairForces(const std::vector<Lik>& liks,
    const IntegratorParams& params,
    std::vector<Vec3>& forces)
{
    const size_t n = liks.size();

    for (size_t i = 0; i + 1 < n; ++i) {
        const Vec3& pi = liks[i].getPosition();
        const double hi = liks[i].getHue();
        Vec3 fi = forces[i];

        for (size_t j = i + 1; j < n; ++j) {
            PairForce pf = computePairForce(pi, hi,
                liks[j].getPosition(), liks[j].getHue(), params);
            if (!pf.interacted) continue;

            Vec3 f = pf.total();
            fi += f;
            forces[j] -= f;
        }

        forces[i] = fi;
    }
}
