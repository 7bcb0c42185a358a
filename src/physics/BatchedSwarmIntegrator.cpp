#include "physics/BatchedSwarmIntegrator.h"
#include "util/ThreadJoiner.h"

#include <algorithm>
#include <thread>

// Below this many particles per worker the thread start-up costs more than
// the rows it would take.
static constexpr size_t kMinRowsPerWorker = 64;

BatchedSwarmIntegrator::BatchedSwarmIntegrator(int workers)
    : workerCount(std::max(1, workers))
{
}

void BatchedSwarmIntegrator::accumulatePairForces(const std::vector<Lik>& liks,
    const IntegratorParams& params,
    std::vector<Vec3>& forces)
{
    const size_t n = liks.size();

    xs.resize(n);
    ys.resize(n);
    zs.resize(n);
    hues.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const Vec3& p = liks[i].getPosition();
        xs[i] = p.x;
        ys[i] = p.y;
        zs[i] = p.z;
        hues[i] = liks[i].getHue();
    }

    size_t workers = std::min<size_t>(static_cast<size_t>(workerCount),
        std::max<size_t>(1, n / kMinRowsPerWorker));

    if (workers <= 1) {
        accumulateRows(0, n, params, forces);
        return;
    }

    // Rows are disjoint, so each worker writes only its own slice of forces.
    // If a thread fails to start, the joiner waits for the ones already
    // running before the std::system_error leaves this scope.
    std::vector<std::thread> pool;
    pool.reserve(workers);
    ThreadJoiner joiner(pool);
    size_t chunk = (n + workers - 1) / workers;

    for (size_t w = 0; w < workers; ++w) {
        size_t begin = w * chunk;
        size_t end = std::min(n, begin + chunk);
        if (begin >= end) break;
        pool.emplace_back([this, begin, end, &params, &forces]() {
            accumulateRows(begin, end, params, forces);
        });
    }

    joiner.joinAll();
}

void BatchedSwarmIntegrator::accumulateRows(size_t begin, size_t end,
    const IntegratorParams& params,
    std::vector<Vec3>& forces) const
{
    const size_t n = xs.size();

    for (size_t i = begin; i < end; ++i) {
        const Vec3 pi(xs[i], ys[i], zs[i]);
        const double hi = hues[i];
        Vec3 acc(0.0);

        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            PairForce pf = computePairForce(pi, hi, Vec3(xs[j], ys[j], zs[j]), hues[j], params);
            if (pf.interacted) {
                acc += pf.total();
            }
        }

        forces[i] += acc;
    }
}
