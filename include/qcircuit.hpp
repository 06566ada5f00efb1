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

#include <algorithm>
#include <iostream>
#include <iterator>
#include <list>
#include <set>

#define amp_leq_0(x) (norm(x) <= FP_NORM_EPSILON)

namespace Qasp {

/**
 * Single gate in `QCircuit` definition
 *
 * A gate acts on "target" with one 2x2 payload per permutation of "controls." Bit i of a payload key is the
 * required value of the i-th control, counting controls in ascending qubit order. Permutations with no payload act
 * as identity, so a single payload keyed by any permutation expresses a mixed polarity multi-controlled gate.
 */
struct QCircuitGate;
typedef std::shared_ptr<QCircuitGate> QCircuitGatePtr;

struct QCircuitGate {
    bitLenInt target;
    std::map<bitCapInt, std::shared_ptr<complex>> payloads;
    std::set<bitLenInt> controls;

    /**
     * Identity gate constructor
     */
    QCircuitGate()
        : target(0)
        , payloads()
        , controls()
    {
        Clear();
    }

    /**
     * Single-qubit gate constructor
     */
    QCircuitGate(bitLenInt trgt, const complex matrix[])
        : target(trgt)
    {
        payloads[ZERO_BCI] = std::shared_ptr<complex>(new complex[4], std::default_delete<complex[]>());
        std::copy(matrix, matrix + 4, payloads[ZERO_BCI].get());
    }

    /**
     * Controlled gate constructor
     */
    QCircuitGate(bitLenInt trgt, const complex matrix[], const std::set<bitLenInt>& ctrls, const bitCapInt& perm)
        : target(trgt)
        , controls(ctrls)
    {
        if (controls.find(target) != controls.end()) {
            throw std::invalid_argument("QCircuitGate target cannot also be a control!");
        }

        const std::shared_ptr<complex>& p = payloads[perm] =
            std::shared_ptr<complex>(new complex[4], std::default_delete<complex[]>());
        std::copy(matrix, matrix + 4, p.get());
    }

    /**
     * Uniformly controlled gate constructor (that only accepts control qubits is ascending order)
     */
    QCircuitGate(
        bitLenInt trgt, const std::map<bitCapInt, std::shared_ptr<complex>>& pylds, const std::set<bitLenInt>& ctrls)
        : target(trgt)
        , controls(ctrls)
    {
        for (const auto& payload : pylds) {
            payloads[payload.first] = std::shared_ptr<complex>(new complex[4], std::default_delete<complex[]>());
            std::copy(payload.second.get(), payload.second.get() + 4, payloads[payload.first].get());
        }
    }

    QCircuitGatePtr Clone() { return std::make_shared<QCircuitGate>(target, payloads, controls); }

    /**
     * Can I combine myself with gate `other`?
     */
    bool CanCombine(QCircuitGatePtr other) { return (target == other->target) && (controls == other->controls); }

    /**
     * Set this gate to the identity operator.
     */
    void Clear()
    {
        controls.clear();
        payloads.clear();

        payloads[ZERO_BCI] = std::shared_ptr<complex>(new complex[4], std::default_delete<complex[]>());
        complex* p = payloads[ZERO_BCI].get();
        p[0] = ONE_CMPLX;
        p[1] = ZERO_CMPLX;
        p[2] = ZERO_CMPLX;
        p[3] = ONE_CMPLX;
    }

    /**
     * Combine myself with gate `other`, which acts after me
     */
    void Combine(QCircuitGatePtr other)
    {
        for (const auto& payload : other->payloads) {
            const auto& pit = payloads.find(payload.first);
            if (pit == payloads.end()) {
                const std::shared_ptr<complex>& p = payloads[payload.first] =
                    std::shared_ptr<complex>(new complex[4], std::default_delete<complex[]>());
                std::copy(payload.second.get(), payload.second.get() + 4U, p.get());

                continue;
            }

            complex* p = pit->second.get();
            complex out[4];
            mul2x2(payload.second.get(), p, out);
            if (amp_leq_0(out[1]) && amp_leq_0(out[2]) && amp_leq_0(ONE_CMPLX - out[0]) &&
                amp_leq_0(ONE_CMPLX - out[3])) {
                payloads.erase(pit);

                continue;
            }

            std::copy(out, out + 4U, p);
        }

        if (!payloads.size()) {
            Clear();
        }
    }

    /**
     * Check if I can combine with gate `other`, and do so, if possible
     */
    bool TryCombine(QCircuitGatePtr other)
    {
        if (!CanCombine(other)) {
            return false;
        }
        Combine(other);

        return true;
    }

    /**
     * Am I an identity gate?
     */
    bool IsIdentity()
    {
        if (controls.size()) {
            return false;
        }

        if (payloads.size() != 1U) {
            return false;
        }

        complex* p = payloads.begin()->second.get();
        return amp_leq_0(p[1]) && amp_leq_0(p[2]) && amp_leq_0(ONE_CMPLX - p[0]) && amp_leq_0(ONE_CMPLX - p[3]);
    }

    /**
     * Am I a phase gate?
     */
    bool IsPhase()
    {
        for (const auto& payload : payloads) {
            complex* p = payload.second.get();
            if ((norm(p[1]) > FP_NORM_EPSILON) || (norm(p[2]) > FP_NORM_EPSILON)) {
                return false;
            }
        }

        return true;
    }

    /**
     * Am I a Pauli X plus a phase gate?
     */
    bool IsInvert()
    {
        for (const auto& payload : payloads) {
            complex* p = payload.second.get();
            if ((norm(p[0]) > FP_NORM_EPSILON) || (norm(p[3]) > FP_NORM_EPSILON)) {
                return false;
            }
        }

        return true;
    }

    /**
     * Do I act on qubit "q," as target or control?
     */
    bool Touches(bitLenInt q) { return (q == target) || (controls.find(q) != controls.end()); }

    /**
     * Convert my set of qubit indices to a vector
     */
    std::vector<bitLenInt> GetControlsVector() { return std::vector<bitLenInt>(controls.begin(), controls.end()); }
};

std::ostream& operator<<(std::ostream& os, const QCircuitGatePtr g);
std::istream& operator>>(std::istream& os, QCircuitGatePtr& g);

/**
 * Define and optimize a circuit, before running on a `QInterface`.
 */
class QCircuit;
typedef std::shared_ptr<QCircuit> QCircuitPtr;

class QCircuit {
protected:
    bool isCollapsed;
    bitLenInt qubitCount;
    std::list<QCircuitGatePtr> gates;

public:
    /**
     * Default constructor
     */
    QCircuit(bool collapse = true)
        : isCollapsed(collapse)
        , qubitCount(0)
        , gates()
    {
        // Intentionally left blank
    }

    /**
     * Manual constructor
     */
    QCircuit(bitLenInt qbCount, const std::list<QCircuitGatePtr>& g, bool collapse = true)
        : isCollapsed(collapse)
        , qubitCount(qbCount)
    {
        for (const QCircuitGatePtr& gate : g) {
            gates.push_back(gate->Clone());
        }
    }

    QCircuitPtr Clone() { return std::make_shared<QCircuit>(qubitCount, gates, isCollapsed); }

    /**
     * The adjoint circuit: gates in reverse order, each payload conjugate-transposed
     */
    QCircuitPtr Inverse()
    {
        QCircuitPtr clone = Clone();
        for (QCircuitGatePtr& gate : clone->gates) {
            for (auto& p : gate->payloads) {
                const complex* m = p.second.get();
                complex inv[4U]{ conj(m[0U]), conj(m[2U]), conj(m[1U]), conj(m[3U]) };
                std::copy(inv, inv + 4U, p.second.get());
            }
        }
        clone->gates.reverse();

        return clone;
    }

    /**
     * Get the (automatically calculated) count of qubits in this circuit, so far.
     */
    bitLenInt GetQubitCount() { return qubitCount; }

    /**
     * Set the count of qubits in this circuit, so far.
     */
    void SetQubitCount(bitLenInt n) { qubitCount = n; }

    /**
     * Return the raw list of gates.
     */
    std::list<QCircuitGatePtr> GetGateList() { return gates; }

    /**
     * Set the raw list of gates.
     */
    void SetGateList(std::list<QCircuitGatePtr> gl) { gates = gl; }

    /**
     * Count the gates in the sequence.
     */
    size_t GetGateCount() { return gates.size(); }

    /**
     * Append circuit (with identical qubit index mappings) at the end of this circuit.
     */
    void Append(QCircuitPtr circuit)
    {
        if (circuit->qubitCount > qubitCount) {
            qubitCount = circuit->qubitCount;
        }
        for (const QCircuitGatePtr& g : circuit->gates) {
            gates.push_back(g->Clone());
        }
    }

    /**
     * Combine circuit (with identical qubit index mappings) at the end of this circuit, by acting all additional
     * gates in sequence.
     */
    void Combine(QCircuitPtr circuit)
    {
        if (circuit->qubitCount > qubitCount) {
            qubitCount = circuit->qubitCount;
        }
        for (const QCircuitGatePtr& g : circuit->gates) {
            AppendGate(g->Clone());
        }
    }

    /**
     * Add a gate to the gate sequence.
     *
     * Returns true if the gate was absorbed into an existing gate.
     */
    bool AppendGate(QCircuitGatePtr nGate);

    /** Append a Hadamard gate. */
    void H(bitLenInt q)
    {
        QASP_CONST complex C_SQRT1_2 = complex(SQRT1_2_R1, ZERO_R1);
        QASP_CONST complex C_SQRT1_2_NEG = complex(-SQRT1_2_R1, ZERO_R1);
        QASP_CONST complex m[4]{ C_SQRT1_2, C_SQRT1_2, C_SQRT1_2, C_SQRT1_2_NEG };
        AppendGate(std::make_shared<QCircuitGate>(q, m));
    }

    /** Append a Pauli X gate. */
    void X(bitLenInt q)
    {
        QASP_CONST complex m[4]{ ZERO_CMPLX, ONE_CMPLX, ONE_CMPLX, ZERO_CMPLX };
        AppendGate(std::make_shared<QCircuitGate>(q, m));
    }

    /** Append a Pauli Z gate. */
    void Z(bitLenInt q)
    {
        const complex m[4]{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, -ONE_CMPLX };
        AppendGate(std::make_shared<QCircuitGate>(q, m));
    }

    /**
     * Append a NOT on "target," conditional on "controls" matching "perm" (bit i for the i-th lowest control).
     */
    void UCX(const std::set<bitLenInt>& controls, const bitCapInt& perm, bitLenInt target)
    {
        QASP_CONST complex m[4]{ ZERO_CMPLX, ONE_CMPLX, ONE_CMPLX, ZERO_CMPLX };
        UCMtrx(controls, m, target, perm);
    }

    /**
     * Append a Z on "target," conditional on "controls" matching "perm" (bit i for the i-th lowest control).
     */
    void UCZ(const std::set<bitLenInt>& controls, const bitCapInt& perm, bitLenInt target)
    {
        const complex m[4]{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, -ONE_CMPLX };
        UCMtrx(controls, m, target, perm);
    }

    /**
     * Append an arbitrary 2x2 operator on "target," conditional on "controls" matching "perm."
     */
    void UCMtrx(const std::set<bitLenInt>& controls, const complex* m, bitLenInt target, const bitCapInt& perm)
    {
        AppendGate(controls.empty() ? std::make_shared<QCircuitGate>(target, m)
                                    : std::make_shared<QCircuitGate>(target, m, controls, perm));
    }

    /**
     * Run this circuit.
     */
    void Run(QInterfacePtr qsim);
};

std::ostream& operator<<(std::ostream& os, const QCircuitPtr g);
std::istream& operator>>(std::istream& os, QCircuitPtr& g);
} // namespace Qasp
