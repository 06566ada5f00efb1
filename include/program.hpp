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

#include "common/qasp_functions.hpp"
#include "errors.hpp"

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace Qasp {

typedef size_t AtomId;

/**
 * Candidate assignment: entry i is the truth value of atom i.
 */
typedef std::vector<bool> Assignment;

/**
 * Enumerated list of rule shapes
 *
 * Only RULE_NORMAL and RULE_CONSTRAINT are normal logic program rules. The other kinds are carried as data so that
 * every consumer must decide, by exhaustive switch, what to do with them.
 */
enum RuleKind {
    /// "h :- B." with exactly one head atom
    RULE_NORMAL = 0,
    /// ":- B." with no head
    RULE_CONSTRAINT,
    /// "h1 | h2 :- B."
    RULE_DISJUNCTIVE,
    /// "{h1; h2} :- B."
    RULE_CHOICE,
    /// Any rule with a "#count", "#sum", ... element
    RULE_AGGREGATE
};

const char* RuleKindName(RuleKind kind);

/**
 * Literal as it arrives from outside, before atoms are numbered
 */
struct InputLiteral {
    std::string atom;
    bool negated;

    InputLiteral(const std::string& a = "", bool neg = false)
        : atom(a)
        , negated(neg)
    {
    }
};

/**
 * Rule as it arrives from outside: (head, positive body, negative body)
 */
struct RuleInput {
    RuleKind kind;
    std::vector<InputLiteral> head;
    std::vector<std::string> positive;
    std::vector<std::string> negative;

    RuleInput()
        : kind(RULE_NORMAL)
    {
    }

    RuleInput(RuleKind k, const std::vector<InputLiteral>& h, const std::vector<std::string>& pos,
        const std::vector<std::string>& neg)
        : kind(k)
        , head(h)
        , positive(pos)
        , negative(neg)
    {
    }

    /** "h :- pos, not neg." */
    static RuleInput Normal(
        const std::string& h, const std::vector<std::string>& pos = {}, const std::vector<std::string>& neg = {})
    {
        return RuleInput(RULE_NORMAL, { InputLiteral(h) }, pos, neg);
    }

    /** ":- pos, not neg." */
    static RuleInput Constraint(const std::vector<std::string>& pos, const std::vector<std::string>& neg = {})
    {
        return RuleInput(RULE_CONSTRAINT, {}, pos, neg);
    }
};

/**
 * Rule over numbered atoms
 */
struct Rule {
    RuleKind kind;
    std::vector<AtomId> head;
    std::vector<AtomId> positive;
    std::vector<AtomId> negative;

    /** Is the body true under "x"? */
    bool IsBodyTrue(const Assignment& x) const
    {
        for (const AtomId& a : positive) {
            if (!x[a]) {
                return false;
            }
        }
        for (const AtomId& a : negative) {
            if (x[a]) {
                return false;
            }
        }

        return true;
    }
};

class Program;
typedef std::shared_ptr<Program> ProgramPtr;

/**
 * Immutable ground program with a fixed, totally ordered atom universe
 *
 * Atom i is bit i of every register permutation encoding an assignment.
 */
class Program {
protected:
    std::vector<std::string> atoms;
    std::map<std::string, AtomId> atomIds;
    std::vector<Rule> rules;

    Program() {}

    AtomId Intern(const std::string& name);

public:
    /**
     * Validate "input" and number its atoms.
     *
     * Atoms are numbered in order of first appearance, unless "atomOrder" is given, in which case it fixes the
     * numbering, every atom in the rules must be declared in it, and declared atoms that no rule mentions still
     * occupy a register bit. Throws MalformedProgramError on violation.
     */
    static ProgramPtr Build(const std::vector<RuleInput>& input, const std::vector<std::string>& atomOrder = {});

    size_t GetAtomCount() const { return atoms.size(); }
    const std::vector<std::string>& GetAtoms() const { return atoms; }
    const std::string& GetAtomName(AtomId a) const { return atoms.at(a); }
    const std::vector<Rule>& GetRules() const { return rules; }

    /** Look up an atom index by name; returns false if the atom is not in the universe. */
    bool FindAtom(const std::string& name, AtomId* id) const;

    /**
     * Throw UnsupportedConstructError if any rule is not a normal rule or constraint.
     */
    void RequireNormal() const;

    /**
     * Classical check of the Gelfond-Lifschitz condition: "x" is the least model of the reduct of the program by
     * "x," and it satisfies every constraint.
     */
    bool IsStableModel(const Assignment& x) const;

    /**
     * Enumerate every stable model by exhaustive classical check. Intended for small programs only.
     */
    std::vector<Assignment> StableModels(bitLenInt maxAtoms = 20U) const;

    /** Read atom i from bit i of "perm." */
    Assignment Decode(const bitCapInt& perm) const;

    /** Set bit i of the result for every true atom i. */
    bitCapInt Encode(const Assignment& x) const;

    /** Render the true atoms of "x" as "{a, b}". */
    std::string Format(const Assignment& x) const;
};

std::ostream& operator<<(std::ostream& os, const Program& p);

/**
 * Read a ground program in the usual text syntax.
 *
 * Statements end in '.', and '%' starts a comment running to end of line. Recognized forms are "a.", "a :- b, not
 * c.", and ":- a, not b.". Disjunctive heads ("a | b"), choice heads ("{a; b}"), and "#aggregate" elements are
 * recognized and tagged with their rule kind. Throws MalformedProgramError on syntax errors.
 */
ProgramPtr ParseProgram(std::istream& in, const std::vector<std::string>& atomOrder = {});
ProgramPtr ParseProgram(const std::string& text, const std::vector<std::string>& atomOrder = {});

} // namespace Qasp
