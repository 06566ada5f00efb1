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

#include "oracle.hpp"
#include "errors.hpp"

namespace Qasp {

namespace {

// Control qubits, each with the value it must hold.
typedef std::map<bitLenInt, bool> ControlMap;

void ControlsOf(const ControlMap& required, std::set<bitLenInt>* controls, bitCapInt* perm)
{
    controls->clear();
    *perm = ZERO_BCI;
    bitLenInt i = 0U;
    for (const auto& c : required) {
        controls->insert(c.first);
        if (c.second) {
            bi_or_ip(perm, pow2(i));
        }
        ++i;
    }
}

} // namespace

OraclePtr OracleSynthesizer::Synthesize(const BoolCircuit& f)
{
    bool constValue;
    if (f.IsConstant(&constValue) && !constValue) {
        throw std::invalid_argument("OracleSynthesizer::Synthesize() marking function is constant false!");
    }

    const size_t atomCount = f.GetInputCount();
    const BoolEdge root = f.GetRoot();
    const size_t rootNode = BoolCircuit::NodeOf(root);
    const bool isRootAnd = !BoolCircuit::IsComplement(root) && (f.GetNode(rootNode).type == BoolCircuit::NODE_AND);

    std::vector<size_t> gates = f.ReachableGates();
    if (isRootAnd) {
        gates.pop_back();
    }

    const size_t totalQubits =
        atomCount + (isAugmented ? 1U : 0U) + gates.size() + ((convention == BIT_FLIP_ORACLE) ? 1U : 0U);
    if ((totalQubits > maxQubits) || (totalQubits >= bitsInCap)) {
        throw SynthesisResourceError("OracleSynthesizer::Synthesize() needs " + std::to_string(totalQubits) +
            " qubits (" + std::to_string(atomCount) + " atoms, " + std::to_string(gates.size()) +
            " ancillas), exceeding the budget of " + std::to_string((size_t)maxQubits) + "!");
    }

    OraclePtr oracle = std::make_shared<Oracle>();
    oracle->convention = convention;
    OracleLayout& layout = oracle->layout;
    layout.atomCount = (bitLenInt)atomCount;
    layout.hasAux = isAugmented;
    layout.auxQubit = (bitLenInt)atomCount;
    layout.ancillaStart = (bitLenInt)(atomCount + (isAugmented ? 1U : 0U));
    layout.ancillaCount = (bitLenInt)gates.size();
    layout.hasOutput = (convention == BIT_FLIP_ORACLE);
    layout.outputQubit = (bitLenInt)(layout.ancillaStart + layout.ancillaCount);
    layout.qubitCount = (bitLenInt)totalQubits;

    // Qubit holding each node, and whether it holds the complement of the node's value.
    std::map<size_t, bitLenInt> qubitOf;
    std::map<size_t, bool> isStoredNegated;
    for (size_t i = 0U; i < atomCount; ++i) {
        qubitOf[i + 1U] = (bitLenInt)i;
        isStoredNegated[i + 1U] = false;
    }

    // The value a node's qubit must hold for edge "e" to be true.
    const auto require = [&qubitOf, &isStoredNegated](const BoolEdge& e, ControlMap* required) {
        const size_t node = BoolCircuit::NodeOf(e);
        (*required)[qubitOf.at(node)] = !BoolCircuit::IsComplement(e) != isStoredNegated.at(node);
    };

    QCircuitPtr compute = std::make_shared<QCircuit>();
    std::set<bitLenInt> controls;
    bitCapInt perm;
    for (size_t g = 0U; g < gates.size(); ++g) {
        const size_t node = gates[g];
        const BoolCircuit::Node& gate = f.GetNode(node);
        const bool isOr = (gate.type == BoolCircuit::NODE_OR);

        ControlMap required;
        for (const BoolEdge& e : gate.fanin) {
            require(isOr ? BoolCircuit::Not(e) : e, &required);
        }

        const bitLenInt target = (bitLenInt)(layout.ancillaStart + g);
        ControlsOf(required, &controls, &perm);
        compute->UCX(controls, perm, target);

        qubitOf[node] = target;
        isStoredNegated[node] = isOr;
    }

    ControlMap marking;
    if (isRootAnd) {
        for (const BoolEdge& e : f.GetNode(rootNode).fanin) {
            require(e, &marking);
        }
    } else if (rootNode) {
        require(root, &marking);
    }
    if (isAugmented) {
        marking[layout.auxQubit] = true;
    }

    QCircuitPtr mark = std::make_shared<QCircuit>();
    if (convention == BIT_FLIP_ORACLE) {
        ControlsOf(marking, &controls, &perm);
        mark->UCX(controls, perm, layout.outputQubit);
    } else if (marking.empty()) {
        // Every state is marked, so the flip is a global phase.
        if (layout.qubitCount) {
            const complex negI[4]{ -ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, -ONE_CMPLX };
            mark->UCMtrx(std::set<bitLenInt>(), negI, 0U, ZERO_BCI);
        }
    } else {
        // Phase flip on the last control, conditional on the others.
        const auto last = std::prev(marking.end());
        const bitLenInt target = last->first;
        const bool targetValue = last->second;
        marking.erase(last);

        const complex flipOne[4]{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, -ONE_CMPLX };
        const complex flipZero[4]{ -ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, ONE_CMPLX };
        ControlsOf(marking, &controls, &perm);
        mark->UCMtrx(controls, targetValue ? flipOne : flipZero, target, perm);
    }

    QCircuitPtr circuit = compute->Clone();
    circuit->Append(mark);
    circuit->Append(compute->Inverse());
    circuit->SetQubitCount(layout.qubitCount);
    oracle->circuit = circuit;

    return oracle;
}

} // namespace Qasp
