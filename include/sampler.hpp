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

#include "backend.hpp"
#include "errors.hpp"
#include "program.hpp"

#include <chrono>
#include <future>

namespace Qasp {

/**
 * One-shot sampling front end over a backend
 *
 * Each call dispatches at most one backend execution and blocks until it completes, fails, or times out. A timed out
 * execution is abandoned rather than interrupted. The next call first waits for it, within its own timeout, so two
 * executions never overlap; if it is still running at that call's deadline, the call times out without dispatching.
 */
class Sampler {
protected:
    BackendPtr backend;
    std::chrono::milliseconds timeout;
    std::future<std::vector<bitCapInt>> pending;
    size_t callCount;

    static std::vector<bitCapInt> Dispatch(
        BackendPtr backend, QCircuitPtr circuit, std::vector<bitLenInt> measured);

public:
    /**
     * A "timeoutMs" of 0 or less waits for every execution synchronously.
     */
    Sampler(BackendPtr b, int64_t timeoutMs = 0)
        : backend(b)
        , timeout(timeoutMs > 0 ? timeoutMs : 0)
        , callCount(0U)
    {
        if (!backend) {
            throw std::invalid_argument("Sampler requires a backend!");
        }
    }

    ~Sampler()
    {
        if (pending.valid()) {
            pending.wait();
        }
    }

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    /**
     * Run "circuit" once and return the measured bits of "measured," bit i for "measured[i]."
     *
     * Throws BackendTimeoutError if the round's deadline passes, and BackendExecutionError if the backend throws or
     * returns a malformed sample.
     */
    bitCapInt Sample(QCircuitPtr circuit, const std::vector<bitLenInt>& measured);

    /**
     * Decode a sample into a candidate assignment of "program," whose atoms are the low bits of the sample.
     */
    static Assignment Decode(const Program& program, const bitCapInt& sample)
    {
        return program.Decode(sample & pow2Mask((bitLenInt)program.GetAtomCount()));
    }

    /** Backend executions dispatched so far */
    size_t GetCallCount() const { return callCount; }
};

} // namespace Qasp
