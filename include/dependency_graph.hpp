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

namespace Qasp {

typedef std::vector<AtomId> AtomSet;

/**
 * Positive atom dependency graph of a normal program
 *
 * There is an edge h -> b for every rule with head h and b in its positive body. Strongly connected components are
 * found once, on construction, with an iterative Tarjan search.
 */
class DependencyGraph {
public:
    static constexpr size_t NO_SCC = (size_t)-1;

protected:
    struct Call {
        AtomId node;
        size_t min;
        size_t next;
    };

    std::vector<std::vector<AtomId>> successors;
    std::vector<size_t> index;
    std::vector<size_t> sccOf;
    std::vector<AtomSet> sccs;
    std::vector<Call> callStack;
    std::vector<AtomId> nodeStack;
    size_t count;

    void VisitDfs(AtomId atom);
    bool Recurse(Call& c);
    bool IsStronglyConnected(const AtomSet& nodes) const;

public:
    /**
     * Build the graph over "atomCount" atoms from the normal rules in "rules."
     */
    DependencyGraph(size_t atomCount, const std::vector<Rule>& rules);

    /** Nontrivial components: more than one atom, or one atom depending on itself. */
    const std::vector<AtomSet>& GetSccs() const { return sccs; }

    /** Index of the nontrivial component holding "atom," or NO_SCC. */
    size_t GetScc(AtomId atom) const { return sccOf[atom]; }

    /** A program with no positive cycles: completion alone characterizes its stable models. */
    bool IsTight() const { return sccs.empty(); }

    /**
     * Every loop: each nonempty atom set whose induced positive subgraph is strongly connected. Components larger
     * than "maxSccSize" raise SynthesisResourceError, since their loop count grows exponentially.
     */
    std::vector<AtomSet> Loops(size_t maxSccSize) const;
};

} // namespace Qasp
