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

#pragma once

#include "qinterface.hpp"
#include "statevector.hpp"

namespace Qasp {

class QEngineCPU;
typedef std::shared_ptr<QEngineCPU> QEngineCPUPtr;

/**
 * General purpose QEngineCPU implementation
 *
 * A dense state vector held in host memory, with gate kernels spread across cores by ParallelFor.
 */
class QEngineCPU : public QInterface {
protected:
    StateVectorPtr stateVec;
    bitCapIntOcl maxQPowerOcl;
    int64_t maxQubits;

    StateVectorPtr AllocStateVec(bitCapIntOcl elemCount) { return std::make_shared<StateVectorArray>(elemCount); }

    void SetQubitCount(bitLenInt qb)
    {
        QInterface::SetQubitCount(qb);
        maxQPowerOcl = (bitCapIntOcl)maxQPower;
    }

    /**
     * Apply a 2x2 matrix to every pair of amplitudes that differ only in the target qubit, restricted to the
     * permutations where the "qPowsSorted" bits (controls and target, ascending) match "offset1" and "offset2."
     */
    void Apply2x2(bitCapIntOcl offset1, bitCapIntOcl offset2, const complex* mtrx, bitLenInt bitCount,
        const bitCapIntOcl* qPowsSorted);

public:
    QEngineCPU(bitLenInt qBitCount, const bitCapInt& initState, qasp_rand_gen_ptr rgp = nullptr,
        const complex& phaseFac = CMPLX_DEFAULT_ARG);

    void SetPermutation(const bitCapInt& perm, const complex& phaseFac = CMPLX_DEFAULT_ARG);
    complex GetAmplitude(const bitCapInt& perm);

    void Mtrx(const complex* mtrx, bitLenInt qubitIndex);
    void UCMtrx(
        const std::vector<bitLenInt>& controls, const complex* mtrx, bitLenInt target, const bitCapInt& controlPerm);

    real1_f Prob(bitLenInt qubitIndex);
    void ProbBitsAll(const std::vector<bitLenInt>& bits, real1* probsArray);
};
} // namespace Qasp
