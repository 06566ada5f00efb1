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

#include "program.hpp"

#include <set>
#include <sstream>

namespace Qasp {

const char* RuleKindName(RuleKind kind)
{
    switch (kind) {
    case RULE_NORMAL:
        return "normal";
    case RULE_CONSTRAINT:
        return "constraint";
    case RULE_DISJUNCTIVE:
        return "disjunctive";
    case RULE_CHOICE:
        return "choice";
    case RULE_AGGREGATE:
        return "aggregate";
    }

    return "unknown";
}

AtomId Program::Intern(const std::string& name)
{
    const auto it = atomIds.find(name);
    if (it != atomIds.end()) {
        return it->second;
    }

    const AtomId id = atoms.size();
    atoms.push_back(name);
    atomIds[name] = id;

    return id;
}

ProgramPtr Program::Build(const std::vector<RuleInput>& input, const std::vector<std::string>& atomOrder)
{
    ProgramPtr toRet(new Program());

    for (const std::string& name : atomOrder) {
        if (name.empty()) {
            throw MalformedProgramError("Program::Build() declared atom order contains an empty atom name!");
        }
        if (toRet->atomIds.find(name) != toRet->atomIds.end()) {
            throw MalformedProgramError("Program::Build() declared atom order repeats atom \"" + name + "\"!");
        }
        toRet->Intern(name);
    }
    const bool isDeclared = !atomOrder.empty();

    const auto resolve = [&toRet, isDeclared](const std::string& name, size_t ruleIndex) {
        if (name.empty()) {
            throw MalformedProgramError(
                "Program::Build() rule " + std::to_string(ruleIndex) + " references an empty atom name!");
        }
        if (isDeclared) {
            const auto it = toRet->atomIds.find(name);
            if (it == toRet->atomIds.end()) {
                throw MalformedProgramError("Program::Build() rule " + std::to_string(ruleIndex) +
                    " references undeclared atom \"" + name + "\"!");
            }
            return it->second;
        }
        return toRet->Intern(name);
    };

    toRet->rules.reserve(input.size());
    for (size_t i = 0U; i < input.size(); ++i) {
        const RuleInput& in = input[i];

        size_t minHead, maxHead;
        switch (in.kind) {
        case RULE_NORMAL:
            minHead = 1U;
            maxHead = 1U;
            break;
        case RULE_CONSTRAINT:
            minHead = 0U;
            maxHead = 0U;
            break;
        case RULE_DISJUNCTIVE:
            minHead = 2U;
            maxHead = (size_t)-1;
            break;
        case RULE_CHOICE:
            minHead = 1U;
            maxHead = (size_t)-1;
            break;
        case RULE_AGGREGATE:
            minHead = 0U;
            maxHead = (size_t)-1;
            break;
        default:
            throw MalformedProgramError("Program::Build() rule " + std::to_string(i) + " has an unknown rule kind!");
        }

        if ((in.head.size() < minHead) || (in.head.size() > maxHead)) {
            throw MalformedProgramError("Program::Build() rule " + std::to_string(i) + " has " +
                std::to_string(in.head.size()) + " head atoms, which is invalid for a " + RuleKindName(in.kind) +
                " rule!");
        }

        Rule rule;
        rule.kind = in.kind;
        for (const InputLiteral& h : in.head) {
            if (h.negated) {
                throw MalformedProgramError(
                    "Program::Build() rule " + std::to_string(i) + " has a negated head atom \"" + h.atom + "\"!");
            }
            rule.head.push_back(resolve(h.atom, i));
        }
        for (const std::string& p : in.positive) {
            rule.positive.push_back(resolve(p, i));
        }
        for (const std::string& n : in.negative) {
            rule.negative.push_back(resolve(n, i));
        }

        toRet->rules.push_back(rule);
    }

    return toRet;
}

bool Program::FindAtom(const std::string& name, AtomId* id) const
{
    const auto it = atomIds.find(name);
    if (it == atomIds.end()) {
        return false;
    }
    if (id) {
        *id = it->second;
    }

    return true;
}

void Program::RequireNormal() const
{
    for (size_t i = 0U; i < rules.size(); ++i) {
        switch (rules[i].kind) {
        case RULE_NORMAL:
        case RULE_CONSTRAINT:
            break;
        case RULE_DISJUNCTIVE:
        case RULE_CHOICE:
        case RULE_AGGREGATE:
            throw UnsupportedConstructError("Rule " + std::to_string(i) + " is a " + RuleKindName(rules[i].kind) +
                " rule; only normal rules and constraints are supported!");
        }
    }
}

bool Program::IsStableModel(const Assignment& x) const
{
    RequireNormal();

    if (x.size() != atoms.size()) {
        throw std::invalid_argument("Program::IsStableModel() assignment size does not match the atom count!");
    }

    for (const Rule& rule : rules) {
        if ((rule.kind == RULE_CONSTRAINT) && rule.IsBodyTrue(x)) {
            return false;
        }
    }

    // Least model of the reduct: drop rules whose negative body "x" falsifies, then forward chain.
    Assignment least(atoms.size(), false);
    bool isChanged = true;
    while (isChanged) {
        isChanged = false;
        for (const Rule& rule : rules) {
            if (rule.kind != RULE_NORMAL) {
                continue;
            }
            const AtomId h = rule.head[0U];
            if (least[h]) {
                continue;
            }

            bool isApplicable = true;
            for (const AtomId& n : rule.negative) {
                if (x[n]) {
                    isApplicable = false;
                    break;
                }
            }
            for (size_t p = 0U; isApplicable && (p < rule.positive.size()); ++p) {
                isApplicable = least[rule.positive[p]];
            }

            if (isApplicable) {
                least[h] = true;
                isChanged = true;
            }
        }
    }

    return least == x;
}

std::vector<Assignment> Program::StableModels(bitLenInt maxAtoms) const
{
    RequireNormal();

    if (atoms.size() > maxAtoms) {
        throw std::invalid_argument("Program::StableModels() atom count exceeds the enumeration limit!");
    }

    std::vector<Assignment> toRet;
    const bitCapInt maxPerm = pow2((bitLenInt)atoms.size());
    for (bitCapInt perm = ZERO_BCI; bi_compare(perm, maxPerm) < 0; bi_increment(&perm, 1U)) {
        const Assignment x = Decode(perm);
        if (IsStableModel(x)) {
            toRet.push_back(x);
        }
    }

    return toRet;
}

Assignment Program::Decode(const bitCapInt& perm) const
{
    Assignment x(atoms.size(), false);
    for (size_t i = 0U; (i < atoms.size()) && (i < bitsInCap); ++i) {
        x[i] = bi_and_1(perm >> i);
    }

    return x;
}

bitCapInt Program::Encode(const Assignment& x) const
{
    if (x.size() > bitsInCap) {
        throw std::invalid_argument("Program::Encode() assignment is wider than bitCapInt!");
    }

    bitCapInt perm = ZERO_BCI;
    for (size_t i = 0U; i < x.size(); ++i) {
        if (x[i]) {
            bi_or_ip(&perm, pow2((bitLenInt)i));
        }
    }

    return perm;
}

std::string Program::Format(const Assignment& x) const
{
    std::stringstream ss;
    ss << "{";
    bool isFirst = true;
    for (size_t i = 0U; (i < x.size()) && (i < atoms.size()); ++i) {
        if (!x[i]) {
            continue;
        }
        if (!isFirst) {
            ss << ", ";
        }
        ss << atoms[i];
        isFirst = false;
    }
    ss << "}";

    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Program& p)
{
    const std::vector<std::string>& names = p.GetAtoms();
    for (const Rule& rule : p.GetRules()) {
        const char* sep = (rule.kind == RULE_DISJUNCTIVE) ? " | " : "; ";
        if (rule.kind == RULE_CHOICE) {
            os << "{";
        }
        for (size_t i = 0U; i < rule.head.size(); ++i) {
            os << (i ? sep : "") << names[rule.head[i]];
        }
        if (rule.kind == RULE_CHOICE) {
            os << "}";
        }

        if (rule.positive.empty() && rule.negative.empty() && (rule.kind != RULE_CONSTRAINT)) {
            os << "." << std::endl;
            continue;
        }

        os << (rule.head.empty() && (rule.kind != RULE_CHOICE) ? ":- " : " :- ");
        bool isFirst = true;
        for (const AtomId& a : rule.positive) {
            os << (isFirst ? "" : ", ") << names[a];
            isFirst = false;
        }
        for (const AtomId& a : rule.negative) {
            os << (isFirst ? "" : ", ") << "not " << names[a];
            isFirst = false;
        }
        os << "." << std::endl;
    }

    return os;
}

} // namespace Qasp
