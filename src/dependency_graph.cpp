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

#include "dependency_graph.hpp"

#include <algorithm>

namespace Qasp {

constexpr size_t DependencyGraph::NO_SCC;

DependencyGraph::DependencyGraph(size_t atomCount, const std::vector<Rule>& rules)
    : successors(atomCount)
    , index(atomCount, NO_SCC)
    , sccOf(atomCount, NO_SCC)
    , count(0U)
{
    for (const Rule& rule : rules) {
        if (rule.kind != RULE_NORMAL) {
            continue;
        }
        std::vector<AtomId>& succ = successors[rule.head[0U]];
        succ.insert(succ.end(), rule.positive.begin(), rule.positive.end());
    }
    for (std::vector<AtomId>& succ : successors) {
        std::sort(succ.begin(), succ.end());
        succ.erase(std::unique(succ.begin(), succ.end()), succ.end());
    }

    for (AtomId a = 0U; a < atomCount; ++a) {
        VisitDfs(a);
    }
}

void DependencyGraph::VisitDfs(AtomId atom)
{
    if (index[atom] != NO_SCC) {
        return;
    }

    callStack.clear();
    nodeStack.clear();
    callStack.push_back({ atom, 0U, 0U });
    while (!callStack.empty()) {
        Call c = callStack.back();
        callStack.pop_back();
        if (Recurse(c)) {
            continue;
        }

        if (c.min < index[c.node]) {
            // Not a root: propagate the low link to the caller.
            index[c.node] = c.min;
            if (!callStack.empty() && (c.min < callStack.back().min)) {
                callStack.back().min = c.min;
            }
            continue;
        }

        AtomSet scc;
        AtomId succVertex;
        do {
            succVertex = nodeStack.back();
            nodeStack.pop_back();
            // Finished nodes get an index no live low link can undercut.
            index[succVertex] = (size_t)-2;
            scc.push_back(succVertex);
        } while (succVertex != c.node);

        const std::vector<AtomId>& succ = successors[c.node];
        const bool isSelfLoop = std::binary_search(succ.begin(), succ.end(), c.node);
        if ((scc.size() > 1U) || isSelfLoop) {
            std::sort(scc.begin(), scc.end());
            for (const AtomId& a : scc) {
                sccOf[a] = sccs.size();
            }
            sccs.push_back(scc);
        }
    }
}

bool DependencyGraph::Recurse(Call& c)
{
    if (index[c.node] == NO_SCC) {
        nodeStack.push_back(c.node);
        c.min = count++;
        index[c.node] = c.min;
    }

    const std::vector<AtomId>& succ = successors[c.node];
    for (; c.next < succ.size(); ++c.next) {
        const AtomId s = succ[c.next];
        if (index[s] == NO_SCC) {
            callStack.push_back({ c.node, c.min, c.next + 1U });
            callStack.push_back({ s, 0U, 0U });
            return true;
        }
        if (index[s] < c.min) {
            c.min = index[s];
        }
    }

    return false;
}

bool DependencyGraph::IsStronglyConnected(const AtomSet& nodes) const
{
    // Forward and backward reachability from the first node, inside "nodes" only.
    for (int dir = 0; dir < 2; ++dir) {
        std::vector<bool> isSeen(nodes.size(), false);
        std::vector<size_t> stack{ 0U };
        isSeen[0U] = true;
        size_t seenCount = 1U;
        while (!stack.empty()) {
            const size_t i = stack.back();
            stack.pop_back();
            for (size_t j = 0U; j < nodes.size(); ++j) {
                if (isSeen[j]) {
                    continue;
                }
                const std::vector<AtomId>& succ = successors[dir ? nodes[j] : nodes[i]];
                const AtomId to = dir ? nodes[i] : nodes[j];
                if (!std::binary_search(succ.begin(), succ.end(), to)) {
                    continue;
                }
                isSeen[j] = true;
                ++seenCount;
                stack.push_back(j);
            }
        }
        if (seenCount != nodes.size()) {
            return false;
        }
    }

    if (nodes.size() == 1U) {
        const std::vector<AtomId>& succ = successors[nodes[0U]];
        return std::binary_search(succ.begin(), succ.end(), nodes[0U]);
    }

    return true;
}

std::vector<AtomSet> DependencyGraph::Loops(size_t maxSccSize) const
{
    std::vector<AtomSet> toRet;
    for (const AtomSet& scc : sccs) {
        if (scc.size() > maxSccSize) {
            throw SynthesisResourceError("DependencyGraph::Loops() positive dependency component of " +
                std::to_string(scc.size()) + " atoms exceeds the loop enumeration limit of " +
                std::to_string(maxSccSize) + "!");
        }

        const bitCapIntOcl maxPerm = pow2Ocl((bitLenInt)scc.size());
        for (bitCapIntOcl perm = 1U; perm < maxPerm; ++perm) {
            AtomSet loop;
            for (size_t i = 0U; i < scc.size(); ++i) {
                if ((perm >> i) & 1U) {
                    loop.push_back(scc[i]);
                }
            }
            if (IsStronglyConnected(loop)) {
                toRet.push_back(loop);
            }
        }
    }

    return toRet;
}

} // namespace Qasp
