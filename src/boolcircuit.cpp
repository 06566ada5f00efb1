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

#include "boolcircuit.hpp"

#include <algorithm>

namespace Qasp {

constexpr BoolEdge BoolCircuit::FALSE_EDGE;
constexpr BoolEdge BoolCircuit::TRUE_EDGE;

BoolCircuit::BoolCircuit(size_t inputs)
    : inputCount(inputs)
    , root(TRUE_EDGE)
{
    nodes.reserve(inputs + 1U);
    nodes.push_back({ NODE_CONST, {} });
    for (size_t i = 0U; i < inputs; ++i) {
        nodes.push_back({ NODE_INPUT, {} });
    }
}

BoolEdge BoolCircuit::Input(size_t i) const
{
    if (i >= inputCount) {
        throw std::invalid_argument("BoolCircuit::Input() index out of range!");
    }

    return MakeEdge(i + 1U, false);
}

BoolEdge BoolCircuit::MakeGate(NodeType type, std::vector<BoolEdge> fanin)
{
    // For AND, "absorbing" is false and "neutral" is true; OR is the dual.
    const BoolEdge absorbing = (type == NODE_AND) ? FALSE_EDGE : TRUE_EDGE;
    const BoolEdge neutral = Not(absorbing);

    std::vector<BoolEdge> flat;
    flat.reserve(fanin.size());
    for (const BoolEdge& e : fanin) {
        if (e == absorbing) {
            return absorbing;
        }
        if (e == neutral) {
            continue;
        }
        const Node& n = nodes[NodeOf(e)];
        if (!IsComplement(e) && (n.type == type)) {
            flat.insert(flat.end(), n.fanin.begin(), n.fanin.end());
            continue;
        }
        flat.push_back(e);
    }

    std::sort(flat.begin(), flat.end());
    flat.erase(std::unique(flat.begin(), flat.end()), flat.end());

    // Complementary edges are adjacent after sorting.
    for (size_t i = 1U; i < flat.size(); ++i) {
        if (NodeOf(flat[i - 1U]) == NodeOf(flat[i])) {
            return absorbing;
        }
    }

    if (flat.empty()) {
        return neutral;
    }
    if (flat.size() == 1U) {
        return flat[0U];
    }

    const auto key = std::make_pair(type, flat);
    const auto it = uniqueTable.find(key);
    if (it != uniqueTable.end()) {
        return MakeEdge(it->second, false);
    }

    const size_t id = nodes.size();
    nodes.push_back({ type, flat });
    uniqueTable[key] = id;

    return MakeEdge(id, false);
}

bool BoolCircuit::IsConstant(bool* value) const
{
    if (NodeOf(root) != 0U) {
        return false;
    }
    if (value) {
        *value = IsComplement(root);
    }

    return true;
}

bool BoolCircuit::Evaluate(const BoolEdge& e, const Assignment& x) const
{
    if (x.size() != inputCount) {
        throw std::invalid_argument("BoolCircuit::Evaluate() assignment size does not match the input count!");
    }

    const size_t top = NodeOf(e);
    std::vector<bool> values(top + 1U, false);
    for (size_t n = 1U; n <= top; ++n) {
        const Node& node = nodes[n];
        switch (node.type) {
        case NODE_CONST:
            values[n] = false;
            break;
        case NODE_INPUT:
            values[n] = x[n - 1U];
            break;
        case NODE_AND:
            values[n] = std::all_of(node.fanin.begin(), node.fanin.end(),
                [&values](const BoolEdge& f) { return values[NodeOf(f)] != IsComplement(f); });
            break;
        case NODE_OR:
            values[n] = std::any_of(node.fanin.begin(), node.fanin.end(),
                [&values](const BoolEdge& f) { return values[NodeOf(f)] != IsComplement(f); });
            break;
        }
    }

    return values[top] != IsComplement(e);
}

std::vector<size_t> BoolCircuit::ReachableGates() const
{
    std::vector<bool> isReached(nodes.size(), false);
    isReached[NodeOf(root)] = true;
    // Fan-in always has a lower index, so one descending sweep marks everything reachable.
    for (size_t n = nodes.size(); n-- > 0U;) {
        if (!isReached[n]) {
            continue;
        }
        for (const BoolEdge& f : nodes[n].fanin) {
            isReached[NodeOf(f)] = true;
        }
    }

    std::vector<size_t> toRet;
    for (size_t n = inputCount + 1U; n < nodes.size(); ++n) {
        if (isReached[n]) {
            toRet.push_back(n);
        }
    }

    return toRet;
}

} // namespace Qasp
