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

#include "encoder.hpp"

#include <cstdlib>
#include <string>

namespace Qasp {

EncoderOptions::EncoderOptions()
    : maxLoopScc(16U)
    , doPropagate(true)
{
#if ENABLE_ENV_VARS
    if (getenv("QASP_MAX_LOOP_SCC")) {
        maxLoopScc = (size_t)std::stoi(std::string(getenv("QASP_MAX_LOOP_SCC")));
    }
#endif
}

StableModelEncoder::TruthValue StableModelEncoder::BodyValue(const Rule& rule) const
{
    bool isTrue = true;
    for (const AtomId& a : rule.positive) {
        if (values[a] == VALUE_FALSE) {
            return VALUE_FALSE;
        }
        isTrue &= (values[a] == VALUE_TRUE);
    }
    for (const AtomId& a : rule.negative) {
        if (values[a] == VALUE_TRUE) {
            return VALUE_FALSE;
        }
        isTrue &= (values[a] == VALUE_FALSE);
    }

    return isTrue ? VALUE_TRUE : VALUE_FREE;
}

void StableModelEncoder::Propagate(const Program& program)
{
    const std::vector<Rule>& rules = program.GetRules();
    std::vector<std::vector<size_t>> rulesOf(program.GetAtomCount());
    for (size_t r = 0U; r < rules.size(); ++r) {
        if (rules[r].kind == RULE_NORMAL) {
            rulesOf[rules[r].head[0U]].push_back(r);
        }
    }

    // Every stable model satisfies each rule and supports each true atom, so these deductions hold in all of them.
    bool isChanged = true;
    while (isChanged && !isConflict) {
        isChanged = false;
        for (AtomId a = 0U; a < rulesOf.size(); ++a) {
            bool isSupported = false;
            bool isDerived = false;
            for (const size_t& r : rulesOf[a]) {
                const TruthValue body = BodyValue(rules[r]);
                isSupported |= (body != VALUE_FALSE);
                isDerived |= (body == VALUE_TRUE);
            }

            TruthValue nValue = VALUE_FREE;
            if (isDerived) {
                nValue = VALUE_TRUE;
            } else if (!isSupported) {
                nValue = VALUE_FALSE;
            }

            if ((nValue == VALUE_FREE) || (nValue == values[a])) {
                continue;
            }
            if (values[a] != VALUE_FREE) {
                isConflict = true;
                break;
            }
            values[a] = nValue;
            isChanged = true;
        }
    }

    for (const Rule& rule : rules) {
        if ((rule.kind == RULE_CONSTRAINT) && (BodyValue(rule) == VALUE_TRUE)) {
            isConflict = true;
        }
    }
}

BoolEdge StableModelEncoder::Literal(const BoolCircuitPtr& circuit, AtomId atom, bool negated) const
{
    BoolEdge e;
    switch (values[atom]) {
    case VALUE_TRUE:
        e = BoolCircuit::TRUE_EDGE;
        break;
    case VALUE_FALSE:
        e = BoolCircuit::FALSE_EDGE;
        break;
    default:
        e = circuit->Input(atom);
        break;
    }

    return negated ? BoolCircuit::Not(e) : e;
}

BoolEdge StableModelEncoder::Body(const BoolCircuitPtr& circuit, const Rule& rule) const
{
    std::vector<BoolEdge> lits;
    lits.reserve(rule.positive.size() + rule.negative.size());
    for (const AtomId& a : rule.positive) {
        lits.push_back(Literal(circuit, a, false));
    }
    for (const AtomId& a : rule.negative) {
        lits.push_back(Literal(circuit, a, true));
    }

    return circuit->And(lits);
}

BoolCircuitPtr StableModelEncoder::Encode(const Program& program)
{
    program.RequireNormal();

    const size_t n = program.GetAtomCount();
    const std::vector<Rule>& rules = program.GetRules();
    BoolCircuitPtr circuit = std::make_shared<BoolCircuit>(n);

    values.assign(n, VALUE_FREE);
    isConflict = false;
    loopCount = 0U;
    decidedCount = 0U;

    if (options.doPropagate) {
        Propagate(program);
    }
    if (isConflict) {
        circuit->SetRoot(BoolCircuit::FALSE_EDGE);
        return circuit;
    }

    std::vector<BoolEdge> conjuncts;

    // Decided atoms enter as unit literals; everywhere else they are constants.
    for (AtomId a = 0U; a < n; ++a) {
        if (values[a] != VALUE_FREE) {
            conjuncts.push_back(values[a] == VALUE_TRUE ? circuit->Input(a) : BoolCircuit::Not(circuit->Input(a)));
            ++decidedCount;
        }
    }

    // Completion: each rule as "body -> head," then "atom -> some body" per atom.
    std::vector<BoolEdge> bodies(rules.size(), BoolCircuit::FALSE_EDGE);
    std::vector<std::vector<BoolEdge>> supports(n);
    for (size_t r = 0U; r < rules.size(); ++r) {
        const Rule& rule = rules[r];
        bodies[r] = Body(circuit, rule);

        switch (rule.kind) {
        case RULE_NORMAL:
            conjuncts.push_back(circuit->Or({ Literal(circuit, rule.head[0U], false), BoolCircuit::Not(bodies[r]) }));
            supports[rule.head[0U]].push_back(bodies[r]);
            break;
        case RULE_CONSTRAINT:
            conjuncts.push_back(BoolCircuit::Not(bodies[r]));
            break;
        case RULE_DISJUNCTIVE:
        case RULE_CHOICE:
        case RULE_AGGREGATE:
            throw UnsupportedConstructError(std::string("StableModelEncoder::Encode() cannot encode a ") +
                RuleKindName(rule.kind) + " rule!");
        }
    }
    for (AtomId a = 0U; a < n; ++a) {
        std::vector<BoolEdge> clause(supports[a]);
        clause.push_back(Literal(circuit, a, true));
        conjuncts.push_back(circuit->Or(clause));
    }

    // Loop formulas over the program left after propagation: free heads, live bodies, free positive atoms.
    std::vector<Rule> residual;
    for (const Rule& rule : rules) {
        if ((rule.kind != RULE_NORMAL) || (values[rule.head[0U]] != VALUE_FREE) ||
            (BodyValue(rule) == VALUE_FALSE)) {
            continue;
        }
        Rule r = rule;
        r.positive.clear();
        for (const AtomId& a : rule.positive) {
            if (values[a] == VALUE_FREE) {
                r.positive.push_back(a);
            }
        }
        residual.push_back(r);
    }

    const DependencyGraph graph(n, residual);
    const std::vector<AtomSet> loops = graph.Loops(options.maxLoopScc);
    loopCount = loops.size();
    for (const AtomSet& loop : loops) {
        std::vector<bool> isInLoop(n, false);
        std::vector<BoolEdge> noneTrue;
        for (const AtomId& a : loop) {
            isInLoop[a] = true;
            noneTrue.push_back(Literal(circuit, a, true));
        }

        std::vector<BoolEdge> formula{ circuit->And(noneTrue) };
        for (size_t r = 0U; r < rules.size(); ++r) {
            const Rule& rule = rules[r];
            if ((rule.kind != RULE_NORMAL) || !isInLoop[rule.head[0U]]) {
                continue;
            }
            bool isExternal = true;
            for (const AtomId& a : rule.positive) {
                if (isInLoop[a]) {
                    isExternal = false;
                    break;
                }
            }
            if (isExternal) {
                formula.push_back(bodies[r]);
            }
        }
        conjuncts.push_back(circuit->Or(formula));
    }

    circuit->SetRoot(circuit->And(conjuncts));

    return circuit;
}

} // namespace Qasp
