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

#include <stdexcept>
#include <string>

namespace Qasp {

/**
 * Bad program input: empty atom name, negated head, or a rule shape that contradicts its kind.
 */
class MalformedProgramError : public std::invalid_argument {
public:
    explicit MalformedProgramError(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

/**
 * The program uses a construct outside normal logic programs (disjunction, choice, aggregates).
 */
class UnsupportedConstructError : public std::domain_error {
public:
    explicit UnsupportedConstructError(const std::string& what)
        : std::domain_error(what)
    {
    }
};

/**
 * The oracle (or the formula behind it) needs more qubits than the configured budget.
 */
class SynthesisResourceError : public std::runtime_error {
public:
    explicit SynthesisResourceError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * The backend failed, timed out, or returned malformed samples for one round.
 */
class BackendExecutionError : public std::runtime_error {
public:
    explicit BackendExecutionError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * The round's backend execution did not finish within the per-round timeout.
 */
class BackendTimeoutError : public BackendExecutionError {
public:
    explicit BackendTimeoutError(const std::string& what)
        : BackendExecutionError(what)
    {
    }
};

} // namespace Qasp
