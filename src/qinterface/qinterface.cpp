//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
// (C) The qasp contributors 2026. All rights reserved.
//
// This is an answer set search for normal logic programs, compiling the stable
// model condition to a reversible oracle and amplifying it on a multithreaded,
// universal quantum register simulation.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#include "qinterface.hpp"

#include <algorithm>

namespace Qasp {

QInterface::QInterface(bitLenInt n, qasp_rand_gen_ptr rgp)
    : qubitCount(n)
    , maxQPower(pow2(qubitCount))
    , rand_generator(rgp)
{
    if (n > (bitsInCap - 1U)) {
        throw std::invalid_argument("QInterface qubit count exceeds the permutation capacity of bitCapInt!");
    }

    if (!rand_generator) {
        rand_generator = std::make_shared<qasp_rand_gen>();
        rand_generator->seed(std::random_device{}());
    }
}

void QInterface::MultiShotMeasureMask(
    const std::vector<bitCapInt>& qPowers, unsigned shots, unsigned long long* shotsArray)
{
    if (!shots) {
        return;
    }

    std::vector<bitLenInt> bitMap(qPowers.size());
    std::transform(qPowers.begin(), qPowers.end(), bitMap.begin(), [](const bitCapInt& p) { return log2(p); });

    ThrowIfQbIdArrayIsBad(bitMap, qubitCount,
        "QInterface::MultiShotMeasureMask parameter qPowers array values must be within allocated qubit bounds!");

    const bitCapIntOcl maskMaxQPower = pow2Ocl((bitLenInt)qPowers.size());
    std::vector<real1> maskProbsVec((size_t)maskMaxQPower);
    ProbBitsAll(bitMap, &(maskProbsVec[0]));
    std::discrete_distribution<bitCapIntOcl> dist(maskProbsVec.begin(), maskProbsVec.end());

    // Each worker gets its own generator, seeded from ours, so runs replay under a fixed seed.
    std::vector<std::mt19937_64> genVec;
    const unsigned numThreads = GetConcurrencyLevel();
    genVec.reserve(numThreads);
    for (unsigned i = 0U; i < numThreads; ++i) {
        genVec.emplace_back((*rand_generator)());
    }

    par_for(0, shots, [&](const bitCapIntOcl& shot, const unsigned& cpu) {
        std::discrete_distribution<bitCapIntOcl> d(dist.param());
        shotsArray[shot] = (unsigned long long)d(genVec[cpu]);
    });
}

std::map<bitCapInt, int> QInterface::MultiShotMeasureMask(const std::vector<bitCapInt>& qPowers, unsigned shots)
{
    std::vector<unsigned long long> shotsVec(shots);
    MultiShotMeasureMask(qPowers, shots, shotsVec.data());

    std::map<bitCapInt, int> results;
    for (const unsigned long long& s : shotsVec) {
        ++(results[(bitCapInt)s]);
    }

    return results;
}

} // namespace Qasp
