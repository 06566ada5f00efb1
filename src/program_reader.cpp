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

#include <cctype>
#include <sstream>

namespace Qasp {

namespace {

std::string Trim(const std::string& s)
{
    size_t b = 0U;
    size_t e = s.size();
    while ((b < e) && std::isspace((unsigned char)s[b])) {
        ++b;
    }
    while ((e > b) && std::isspace((unsigned char)s[e - 1U])) {
        --e;
    }

    return s.substr(b, e - b);
}

// Split on any of "seps" outside parentheses and braces.
std::vector<std::string> SplitTopLevel(const std::string& s, const std::string& seps)
{
    std::vector<std::string> toRet;
    int depth = 0;
    std::string cur;
    for (const char& c : s) {
        if ((c == '(') || (c == '{')) {
            ++depth;
        } else if ((c == ')') || (c == '}')) {
            --depth;
        }

        if (!depth && (seps.find(c) != std::string::npos)) {
            toRet.push_back(Trim(cur));
            cur.clear();
            continue;
        }
        cur += c;
    }
    toRet.push_back(Trim(cur));

    return toRet;
}

void CheckAtom(const std::string& atom, size_t statement)
{
    if (atom.empty()) {
        throw MalformedProgramError("ParseProgram() statement " + std::to_string(statement) + " has an empty atom!");
    }

    if (!std::islower((unsigned char)atom[0U]) && (atom[0U] != '_')) {
        throw MalformedProgramError("ParseProgram() statement " + std::to_string(statement) + " atom \"" + atom +
            "\" must start with a lowercase letter or underscore!");
    }

    int depth = 0;
    for (const char& c : atom) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        } else if (!depth && !std::isalnum((unsigned char)c) && (c != '_') && (c != '\'')) {
            throw MalformedProgramError("ParseProgram() statement " + std::to_string(statement) + " atom \"" + atom +
                "\" contains invalid character '" + std::string(1U, c) + "'!");
        }
        if (depth < 0) {
            break;
        }
    }

    if (depth) {
        throw MalformedProgramError(
            "ParseProgram() statement " + std::to_string(statement) + " atom \"" + atom + "\" has unbalanced parentheses!");
    }
}

bool StartsWithNot(const std::string& lit)
{
    return (lit.size() > 4U) && (lit.compare(0U, 3U, "not") == 0) && std::isspace((unsigned char)lit[3U]);
}

RuleInput ParseStatement(const std::string& statement, size_t index)
{
    RuleInput rule;

    std::string headText = statement;
    std::string bodyText;
    bool hasBody = false;
    const size_t arrow = statement.find(":-");
    if (arrow != std::string::npos) {
        headText = Trim(statement.substr(0U, arrow));
        bodyText = Trim(statement.substr(arrow + 2U));
        hasBody = true;
    }

    bool isAggregate = (statement.find('#') != std::string::npos);

    if (hasBody) {
        for (const std::string& lit : SplitTopLevel(bodyText, ",")) {
            if (lit.empty()) {
                if (bodyText.empty()) {
                    break;
                }
                throw MalformedProgramError(
                    "ParseProgram() statement " + std::to_string(index) + " has an empty body literal!");
            }
            if (lit[0U] == '#') {
                isAggregate = true;
                continue;
            }
            if (StartsWithNot(lit)) {
                const std::string atom = Trim(lit.substr(4U));
                if (StartsWithNot(atom)) {
                    throw MalformedProgramError(
                        "ParseProgram() statement " + std::to_string(index) + " has a doubly negated literal!");
                }
                CheckAtom(atom, index);
                rule.negative.push_back(atom);
                continue;
            }
            CheckAtom(lit, index);
            rule.positive.push_back(lit);
        }
    }

    if (headText.empty()) {
        rule.kind = isAggregate ? RULE_AGGREGATE : RULE_CONSTRAINT;
        return rule;
    }

    if (headText[0U] == '#') {
        // An aggregate head contributes no plain atoms.
        rule.kind = RULE_AGGREGATE;
        return rule;
    }

    if (headText[0U] == '{') {
        const size_t close = headText.rfind('}');
        if (close == std::string::npos) {
            throw MalformedProgramError(
                "ParseProgram() statement " + std::to_string(index) + " has an unterminated choice head!");
        }
        for (const std::string& atom : SplitTopLevel(headText.substr(1U, close - 1U), ";,")) {
            CheckAtom(atom, index);
            rule.head.push_back(InputLiteral(atom));
        }
        rule.kind = isAggregate ? RULE_AGGREGATE : RULE_CHOICE;
        return rule;
    }

    const std::vector<std::string> heads = SplitTopLevel(headText, "|;");
    for (const std::string& h : heads) {
        if (StartsWithNot(h)) {
            const std::string atom = Trim(h.substr(4U));
            CheckAtom(atom, index);
            rule.head.push_back(InputLiteral(atom, true));
            continue;
        }
        CheckAtom(h, index);
        rule.head.push_back(InputLiteral(h));
    }

    if (isAggregate) {
        rule.kind = RULE_AGGREGATE;
    } else if (heads.size() > 1U) {
        rule.kind = RULE_DISJUNCTIVE;
    } else {
        rule.kind = RULE_NORMAL;
    }

    return rule;
}

} // namespace

ProgramPtr ParseProgram(std::istream& in, const std::vector<std::string>& atomOrder)
{
    // Strip comments, keeping statement text across lines.
    std::string text;
    std::string line;
    while (std::getline(in, line)) {
        const size_t comment = line.find('%');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        text += line;
        text += '\n';
    }

    std::vector<RuleInput> rules;
    std::string cur;
    int depth = 0;
    for (const char& c : text) {
        if ((c == '(') || (c == '{')) {
            ++depth;
        } else if ((c == ')') || (c == '}')) {
            --depth;
        }

        if (!depth && (c == '.')) {
            const std::string statement = Trim(cur);
            cur.clear();
            if (statement.empty()) {
                throw MalformedProgramError(
                    "ParseProgram() statement " + std::to_string(rules.size()) + " is empty!");
            }
            rules.push_back(ParseStatement(statement, rules.size()));
            continue;
        }
        cur += c;
    }

    if (!Trim(cur).empty()) {
        throw MalformedProgramError("ParseProgram() final statement is missing its terminating '.'!");
    }

    return Program::Build(rules, atomOrder);
}

ProgramPtr ParseProgram(const std::string& text, const std::vector<std::string>& atomOrder)
{
    std::istringstream in(text);
    return ParseProgram(in, atomOrder);
}

} // namespace Qasp
