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

#include "program.hpp"

#include <map>
#include <utility>

namespace Qasp {

/**
 * Reference to a node, with a complement flag in the low bit
 */
typedef size_t BoolEdge;

class BoolCircuit;
typedef std::shared_ptr<BoolCircuit> BoolCircuitPtr;

/**
 * AND/OR/NOT gate graph over a fixed number of input bits
 *
 * NOT is carried on edges. Node 0 is constant false, nodes 1 through n are the inputs, and every gate node is created
 * after its fan-in, so node order is a topological order. Structurally identical gates are shared.
 */
class BoolCircuit {
public:
    enum NodeType { NODE_CONST = 0, NODE_INPUT, NODE_AND, NODE_OR };

    struct Node {
        NodeType type;
        std::vector<BoolEdge> fanin;
    };

    static constexpr BoolEdge FALSE_EDGE = 0U;
    static constexpr BoolEdge TRUE_EDGE = 1U;

    static BoolEdge Not(const BoolEdge& e) { return e ^ 1U; }
    static size_t NodeOf(const BoolEdge& e) { return e >> 1U; }
    static bool IsComplement(const BoolEdge& e) { return e & 1U; }
    static BoolEdge MakeEdge(size_t node, bool complement) { return (node << 1U) | (complement ? 1U : 0U); }

protected:
    size_t inputCount;
    std::vector<Node> nodes;
    std::map<std::pair<NodeType, std::vector<BoolEdge>>, size_t> uniqueTable;
    BoolEdge root;

    BoolEdge MakeGate(NodeType type, std::vector<BoolEdge> fanin);

public:
    explicit BoolCircuit(size_t inputs);

    size_t GetInputCount() const { return inputCount; }
    size_t GetNodeCount() const { return nodes.size(); }
    const Node& GetNode(size_t n) const { return nodes[n]; }

    /** Edge for input bit "i," which is atom i */
    BoolEdge Input(size_t i) const;

    /** Conjunction; constants fold, nested conjunctions flatten, and x AND NOT x is false. */
    BoolEdge And(const std::vector<BoolEdge>& fanin) { return MakeGate(NODE_AND, fanin); }

    /** Disjunction; constants fold, nested disjunctions flatten, and x OR NOT x is true. */
    BoolEdge Or(const std::vector<BoolEdge>& fanin) { return MakeGate(NODE_OR, fanin); }

    void SetRoot(const BoolEdge& r) { root = r; }
    BoolEdge GetRoot() const { return root; }

    /** Is the root a constant? If so, and "value" is not null, write the constant to it. */
    bool IsConstant(bool* value = NULL) const;

    /** Evaluate "e" on an assignment of the inputs. */
    bool Evaluate(const BoolEdge& e, const Assignment& x) const;

    /** Evaluate the root on an assignment of the inputs. */
    bool Evaluate(const Assignment& x) const { return Evaluate(root, x); }

    /** Gate nodes reachable from the root, in topological order (fan-in first). */
    std::vector<size_t> ReachableGates() const;
};

} // namespace Qasp
