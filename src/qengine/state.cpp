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

#include "qengine_cpu.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace Qasp {

/**
 * Initialize a coherent unit with qBitCount number of bits, to initState unsigned integer permutation state.
 * The global phase factor defaults to 1.
 */
QEngineCPU::QEngineCPU(
    bitLenInt qBitCount, const bitCapInt& initState, qasp_rand_gen_ptr rgp, const complex& phaseFac)
    : QInterface(qBitCount, rgp)
    , maxQPowerOcl((bitCapIntOcl)maxQPower)
    , maxQubits(-1)
{
#if ENABLE_ENV_VARS
    if (getenv("QASP_MAX_CPU_QB")) {
        maxQubits = std::stoi(std::string(getenv("QASP_MAX_CPU_QB")));
    }
#endif

    if ((maxQubits >= 0) && ((int64_t)qBitCount > maxQubits)) {
        throw std::invalid_argument(
            "Cannot instantiate a QEngineCPU with greater capacity than environment variable QASP_MAX_CPU_QB.");
    }

    if (bi_compare(initState, maxQPower) >= 0) {
        throw std::invalid_argument("QEngineCPU initial permutation is out-of-bounds!");
    }

    stateVec = AllocStateVec(maxQPowerOcl);
    SetPermutation(initState, phaseFac);
}

void QEngineCPU::SetPermutation(const bitCapInt& perm, const complex& phaseFac)
{
    if (bi_compare(perm, maxQPower) >= 0) {
        throw std::invalid_argument("QEngineCPU::SetPermutation argument is out-of-bounds!");
    }

    stateVec->clear();
    stateVec->write((bitCapIntOcl)perm, (phaseFac == CMPLX_DEFAULT_ARG) ? ONE_CMPLX : phaseFac);
}

complex QEngineCPU::GetAmplitude(const bitCapInt& perm)
{
    if (bi_compare(perm, maxQPower) >= 0) {
        throw std::invalid_argument("QEngineCPU::GetAmplitude argument out-of-bounds!");
    }

    return stateVec->read((bitCapIntOcl)perm);
}

void QEngineCPU::Apply2x2(bitCapIntOcl offset1, bitCapIntOcl offset2, const complex* matrix, const bitLenInt bitCount,
    const bitCapIntOcl* qPowsSorted)
{
    if ((offset1 >= maxQPowerOcl) || (offset2 >= maxQPowerOcl)) {
        throw std::invalid_argument(
            "QEngineCPU::Apply2x2 offset1 and offset2 parameters must be within allocated qubit bounds!");
    }

    for (bitLenInt i = 0U; i < bitCount; ++i) {
        if (qPowsSorted[i] >= maxQPowerOcl) {
            throw std::invalid_argument(
                "QEngineCPU::Apply2x2 parameter qPowsSorted array values must be within allocated qubit bounds!");
        }
        if (i && (qPowsSorted[i - 1U] == qPowsSorted[i])) {
            throw std::invalid_argument("QEngineCPU::Apply2x2 parameter qPowsSorted array values cannot be "
                                        "duplicated (for control and target qubits)!");
        }
    }

    const std::vector<bitCapIntOcl> qPowersSorted(qPowsSorted, qPowsSorted + bitCount);
    const complex mtrx0 = matrix[0U];
    const complex mtrx1 = matrix[1U];
    const complex mtrx2 = matrix[2U];
    const complex mtrx3 = matrix[3U];

    ParallelFunc fn;
    if (IS_NORM_0(mtrx1) && IS_NORM_0(mtrx2)) {
        fn = [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
            stateVec->write2(lcv + offset1, mtrx0 * stateVec->read(lcv + offset1), lcv + offset2,
                mtrx3 * stateVec->read(lcv + offset2));
        };
    } else if (IS_NORM_0(mtrx0) && IS_NORM_0(mtrx3)) {
        fn = [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
            const complex Y0 = stateVec->read(lcv + offset1);
            stateVec->write2(lcv + offset1, mtrx1 * stateVec->read(lcv + offset2), lcv + offset2, mtrx2 * Y0);
        };
    } else {
        fn = [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
            const complex Y0 = stateVec->read(lcv + offset1);
            const complex Y1 = stateVec->read(lcv + offset2);
            stateVec->write2(lcv + offset1, (mtrx0 * Y0) + (mtrx1 * Y1), lcv + offset2, (mtrx2 * Y0) + (mtrx3 * Y1));
        };
    }

    par_for_mask(0U, maxQPowerOcl, qPowersSorted, fn);
}

void QEngineCPU::Mtrx(const complex* mtrx, bitLenInt qubit)
{
    if (qubit >= qubitCount) {
        throw std::invalid_argument("QEngineCPU::Mtrx qubit index parameter must be within allocated qubit bounds!");
    }

    const bitCapIntOcl qPowers[1U]{ pow2Ocl(qubit) };
    Apply2x2(0U, qPowers[0U], mtrx, 1U, qPowers);
}

void QEngineCPU::UCMtrx(
    const std::vector<bitLenInt>& controls, const complex* mtrx, bitLenInt target, const bitCapInt& controlPerm)
{
    if (controls.empty()) {
        Mtrx(mtrx, target);
        return;
    }

    std::vector<bitLenInt> allBits(controls);
    allBits.push_back(target);
    ThrowIfQbIdArrayIsBad(allBits, qubitCount,
        "QEngineCPU::UCMtrx parameter controls and target must be within allocated qubit bounds!");

    std::unique_ptr<bitCapIntOcl[]> qPowersSorted(new bitCapIntOcl[controls.size() + 1U]);
    const bitCapIntOcl targetMask = pow2Ocl(target);
    bitCapIntOcl fullMask = 0U;
    for (size_t i = 0U; i < controls.size(); ++i) {
        qPowersSorted[i] = pow2Ocl(controls[i]);
        if (bi_and_1(controlPerm >> i)) {
            fullMask |= qPowersSorted[i];
        }
    }
    const bitCapIntOcl controlMask = fullMask;
    qPowersSorted[controls.size()] = targetMask;
    fullMask |= targetMask;
    std::sort(qPowersSorted.get(), qPowersSorted.get() + controls.size() + 1U);
    Apply2x2(controlMask, fullMask, mtrx, (bitLenInt)(controls.size() + 1U), qPowersSorted.get());
}

/// PSEUDO-QUANTUM Direct measure of bit probability to be in |1> state
real1_f QEngineCPU::Prob(bitLenInt qubit)
{
    if (qubit >= qubitCount) {
        throw std::invalid_argument("QEngineCPU::Prob qubit index parameter must be within allocated qubit bounds!");
    }

    const bitCapIntOcl qPower = pow2Ocl(qubit);
    const unsigned numCores = GetConcurrencyLevel();
    std::unique_ptr<real1[]> oneChanceBuff(new real1[numCores]());

    par_for_skip(0U, maxQPowerOcl, qPower, 1U, [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
        oneChanceBuff[cpu] += norm(stateVec->read(lcv | qPower));
    });

    real1 oneChance = ZERO_R1;
    for (unsigned i = 0U; i < numCores; ++i) {
        oneChance += oneChanceBuff[i];
    }

    return clampProb((real1_f)oneChance);
}

void QEngineCPU::ProbBitsAll(const std::vector<bitLenInt>& bits, real1* probsArray)
{
    ThrowIfQbIdArrayIsBad(
        bits, qubitCount, "QEngineCPU::ProbBitsAll parameter bits must be within allocated qubit bounds!");

    const bitCapIntOcl outSize = pow2Ocl((bitLenInt)bits.size());
    std::fill(probsArray, probsArray + outSize, ZERO_R1);

    std::vector<bitCapIntOcl> bitPowers(bits.size());
    std::transform(bits.begin(), bits.end(), bitPowers.begin(), pow2Ocl);

    for (bitCapIntOcl lcv = 0U; lcv < maxQPowerOcl; ++lcv) {
        bitCapIntOcl retIndex = 0U;
        for (size_t p = 0U; p < bitPowers.size(); ++p) {
            if (lcv & bitPowers[p]) {
                retIndex |= pow2Ocl((bitLenInt)p);
            }
        }
        probsArray[retIndex] += norm(stateVec->read(lcv));
    }
}
} // namespace Qasp
