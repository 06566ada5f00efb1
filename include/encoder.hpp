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
#include "dependency_graph.hpp"

namespace Qasp {

/**
 * Encoder settings; defaults may be overridden by environment variables.
 */
struct EncoderOptions {
    /// Largest positive dependency component whose loops are enumerated (QASP_MAX_LOOP_SCC)
    size_t maxLoopScc;
    /// Fix atoms decided by facts and unsupported atoms before encoding
    bool doPropagate;

    EncoderOptions();
};

/**
 * Compiles a normal program into a marking function: a gate graph over one input bit per atom, true exactly on the
 * assignments that are stable models.
 *
 * The function is the conjunction of the Clark completion (each rule as a clause, plus one support clause per
 * atom), the constraints, and one Lin-Zhao loop formula per loop of the positive dependency graph.
 */
class StableModelEncoder {
protected:
    enum TruthValue { VALUE_FREE = 0, VALUE_TRUE, VALUE_FALSE };

    EncoderOptions options;
    std::vector<TruthValue> values;
    size_t loopCount;
    size_t decidedCount;
    bool isConflict;

    TruthValue BodyValue(const Rule& rule) const;
    void Propagate(const Program& program);
    BoolEdge Literal(const BoolCircuitPtr& circuit, AtomId atom, bool negated) const;
    BoolEdge Body(const BoolCircuitPtr& circuit, const Rule& rule) const;

public:
    StableModelEncoder(const EncoderOptions& opts = EncoderOptions())
        : options(opts)
        , loopCount(0U)
        , decidedCount(0U)
        , isConflict(false)
    {
    }

    /**
     * Encode "program." Throws UnsupportedConstructError for rules outside normal programs, and
     * SynthesisResourceError if a positive dependency component is too large for loop enumeration.
     */
    BoolCircuitPtr Encode(const Program& program);

    /** Loop formulas in the last encoding */
    size_t GetLoopCount() const { return loopCount; }

    /** Atoms fixed by propagation in the last encoding */
    size_t GetDecidedCount() const { return decidedCount; }
};

} // namespace Qasp
