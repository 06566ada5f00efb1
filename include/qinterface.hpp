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

#include "common/parallel_for.hpp"

#include <map>
#include <random>

namespace Qasp {

class QInterface;
typedef std::shared_ptr<QInterface> QInterfacePtr;

/**
 * A "Qasp::QInterface" is an abstract interface exposing qubit permutation
 * state vector with methods to operate on it as by gates.
 *
 * Only the gate set that oracle and diffusion circuits need is exposed: single
 * qubit 2x2 operators, with any number of mixed polarity controls, plus
 * probability queries and (non-collapsing) multi-shot sampling.
 */
class QInterface : public ParallelFor {
protected:
    bitLenInt qubitCount;
    bitCapInt maxQPower;
    qasp_rand_gen_ptr rand_generator;

    virtual void SetQubitCount(bitLenInt qb)
    {
        qubitCount = qb;
        maxQPower = pow2(qubitCount);
    }

    static inline real1_f clampProb(real1_f toClamp)
    {
        if (toClamp < ZERO_R1_F) {
            toClamp = ZERO_R1_F;
        }
        if (toClamp > ONE_R1_F) {
            toClamp = ONE_R1_F;
        }
        return toClamp;
    }

public:
    QInterface(bitLenInt n, qasp_rand_gen_ptr rgp = nullptr);

    virtual ~QInterface()
    {
        // Virtual destructor for inheritance
    }

    /** Get the count of bits in this register */
    bitLenInt GetQubitCount() { return qubitCount; }

    /** Get the maximum number of basis states, namely \f$ 2^n \f$ for \f$ n \f$ qubits*/
    bitCapInt GetMaxQPower() { return maxQPower; }

    /** Set to a specific permutation of all qubits */
    virtual void SetPermutation(const bitCapInt& perm, const complex& phaseFac = CMPLX_DEFAULT_ARG) = 0;

    /** Get the representational amplitude of a full permutation
     *
     * \warning PSEUDO-QUANTUM
     */
    virtual complex GetAmplitude(const bitCapInt& perm) = 0;

    /**
     * Apply an arbitrary single bit unitary transformation.
     */
    virtual void Mtrx(const complex* mtrx, bitLenInt qubitIndex) = 0;

    /**
     * Apply a single bit transformation, conditional on the control qubits matching "controlPerm."
     *
     * Bit i of "controlPerm" is the required value of "controls[i]."
     */
    virtual void UCMtrx(const std::vector<bitLenInt>& controls, const complex* mtrx, bitLenInt target,
        const bitCapInt& controlPerm) = 0;

    /**
     * Apply an arbitrary single bit unitary transformation, with arbitrary control bits.
     */
    virtual void MCMtrx(const std::vector<bitLenInt>& controls, const complex* mtrx, bitLenInt target)
    {
        UCMtrx(controls, mtrx, target, pow2Mask((bitLenInt)controls.size()));
    }

    /**
     * Apply a single bit transformation that only effects phase.
     */
    virtual void Phase(const complex topLeft, const complex bottomRight, bitLenInt qubitIndex)
    {
        if (IS_NORM_0(ONE_CMPLX - topLeft) && IS_NORM_0(topLeft - bottomRight)) {
            return;
        }

        const complex mtrx[4U]{ topLeft, ZERO_CMPLX, ZERO_CMPLX, bottomRight };
        Mtrx(mtrx, qubitIndex);
    }

    /**
     * Apply a single bit transformation that reverses bit probability and might effect phase.
     */
    virtual void Invert(const complex topRight, const complex bottomLeft, bitLenInt qubitIndex)
    {
        const complex mtrx[4U]{ ZERO_CMPLX, topRight, bottomLeft, ZERO_CMPLX };
        Mtrx(mtrx, qubitIndex);
    }

    /**
     * Apply a single bit transformation that only effects phase, with arbitrary control bits.
     */
    virtual void MCPhase(const std::vector<bitLenInt>& controls, complex topLeft, complex bottomRight, bitLenInt target)
    {
        if (IS_NORM_0(ONE_CMPLX - topLeft) && IS_NORM_0(ONE_CMPLX - bottomRight)) {
            return;
        }

        const complex mtrx[4U]{ topLeft, ZERO_CMPLX, ZERO_CMPLX, bottomRight };
        MCMtrx(controls, mtrx, target);
    }

    /**
     * Hadamard gate
     *
     * Applies a Hadamard gate on qubit at "qubit."
     */
    virtual void H(bitLenInt qubit)
    {
        QASP_CONST complex C_SQRT1_2 = complex(SQRT1_2_R1, ZERO_R1);
        QASP_CONST complex C_SQRT1_2_NEG = complex(-SQRT1_2_R1, ZERO_R1);
        QASP_CONST complex mtrx[4]{ C_SQRT1_2, C_SQRT1_2, C_SQRT1_2, C_SQRT1_2_NEG };
        Mtrx(mtrx, qubit);
    }

    /**
     * X gate
     *
     * Applies the Pauli "X" operator to the qubit at "qubit." The Pauli "X" operator is equivalent to a logical "NOT."
     */
    virtual void X(bitLenInt qubit) { Invert(ONE_CMPLX, ONE_CMPLX, qubit); }

    /**
     * Z gate
     *
     * Applies the Pauli "Z" operator to the qubit at "qubitIndex." The Pauli "Z" operator reverses the phase of |1>
     * and leaves |0> unchanged.
     */
    virtual void Z(bitLenInt qubit) { Phase(ONE_CMPLX, -ONE_CMPLX, qubit); }

    /** Controlled NOT gate on any number of controls */
    virtual void MCX(const std::vector<bitLenInt>& controls, bitLenInt target)
    {
        QASP_CONST complex mtrx[4U]{ ZERO_CMPLX, ONE_CMPLX, ONE_CMPLX, ZERO_CMPLX };
        MCMtrx(controls, mtrx, target);
    }

    /** Apply a Hadamard gate to every qubit in [start, start + length) */
    virtual void H(bitLenInt start, bitLenInt length)
    {
        for (bitLenInt i = 0U; i < length; ++i) {
            H(start + i);
        }
    }

    /**
     * Direct measure of bit probability to be in |1> state
     *
     * \warning PSEUDO-QUANTUM
     */
    virtual real1_f Prob(bitLenInt qubitIndex) = 0;

    /**
     * Direct measure of full permutation probability
     *
     * \warning PSEUDO-QUANTUM
     */
    virtual real1_f ProbAll(const bitCapInt& fullRegister) { return clampProb((real1_f)norm(GetAmplitude(fullRegister))); }

    /**
     * Direct measure of listed permutation probability
     *
     * The probabilities of all permutations of the listed bits, with bit i of each index taken from bits[i], are
     * written to "probsArray," of length \f$ 2^{bits.size()} \f$.
     *
     * \warning PSEUDO-QUANTUM
     */
    virtual void ProbBitsAll(const std::vector<bitLenInt>& bits, real1* probsArray) = 0;

    /**
     * Statistical measure of masked permutation probability, without collapse
     *
     * "qPowers" holds single bit powers of 2. Result bit i of each shot is the measured value of qPowers[i].
     */
    virtual void MultiShotMeasureMask(const std::vector<bitCapInt>& qPowers, unsigned shots, unsigned long long* shotsArray);

    /**
     * Statistical measure of masked permutation probability, without collapse, as a histogram of results
     */
    virtual std::map<bitCapInt, int> MultiShotMeasureMask(const std::vector<bitCapInt>& qPowers, unsigned shots);
};
} // namespace Qasp
