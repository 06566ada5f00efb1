//////////////////////////////////////////////////////////////////////////////////////
//
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

#include "boolcircuit.hpp"
#include "qcircuit.hpp"

namespace Qasp {

/**
 * Enumerated list of oracle conventions
 */
enum OracleConvention {
    /// |x> -> (-1)^f(x) |x>
    PHASE_ORACLE = 0,
    /// |x>|0>|y> -> |x>|0>|y XOR f(x)>, on a dedicated output qubit
    BIT_FLIP_ORACLE
};

/**
 * Qubit allocation of a synthesized oracle
 *
 * Atom qubits come first, atom i on qubit i, then the optional auxiliary search qubit, then the ancillas, then the
 * output qubit of a bit-flip oracle.
 */
struct OracleLayout {
    bitLenInt atomCount;
    bool hasAux;
    bitLenInt auxQubit;
    bitLenInt ancillaStart;
    bitLenInt ancillaCount;
    bool hasOutput;
    bitLenInt outputQubit;
    bitLenInt qubitCount;

    /** The register amplitude amplification acts on: atoms, plus the auxiliary qubit if present */
    std::vector<bitLenInt> SearchQubits() const
    {
        std::vector<bitLenInt> toRet;
        for (bitLenInt i = 0U; i < atomCount; ++i) {
            toRet.push_back(i);
        }
        if (hasAux) {
            toRet.push_back(auxQubit);
        }

        return toRet;
    }
};

struct Oracle;
typedef std::shared_ptr<Oracle> OraclePtr;

/**
 * Reversible marking circuit: compute, mark, uncompute. Every ancilla returns to |0> for every basis input.
 */
struct Oracle {
    QCircuitPtr circuit;
    OracleLayout layout;
    OracleConvention convention;
};

/**
 * Compiles a marking function into a clean reversible oracle.
 *
 * Each reachable gate gets one ancilla: an AND gate is a multiply controlled NOT, with per-control polarity, onto its
 * ancilla, and an OR gate is stored complemented, as the AND of its negated fan-in. The marking step is controlled
 * directly on the fan-in of a top-level AND, so the root needs no ancilla of its own.
 */
class OracleSynthesizer {
protected:
    OracleConvention convention;
    bitLenInt maxQubits;
    bool isAugmented;

public:
    /**
     * "maxQubits" bounds the total register, atoms included. With "augment," states are marked only when the
     * auxiliary search qubit is also |1>, so at most half of the doubled search space is marked.
     */
    OracleSynthesizer(OracleConvention conv, bitLenInt maxQb, bool augment)
        : convention(conv)
        , maxQubits(maxQb)
        , isAugmented(augment)
    {
    }

    /**
     * Synthesize the oracle for "f." Throws SynthesisResourceError if the register would exceed the qubit budget,
     * and std::invalid_argument if "f" is constant false.
     */
    OraclePtr Synthesize(const BoolCircuit& f);
};

} // namespace Qasp
