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

#include "qcircuit.hpp"

namespace Qasp {

class Backend;
typedef std::shared_ptr<Backend> BackendPtr;

/**
 * Executes circuits and returns measurement samples.
 *
 * Every run starts from |0...0> on "circuit->GetQubitCount()" qubits. Bit i of each returned sample is the measured
 * value of qubit "measured[i]," so samples are little-endian in the order of "measured." Implementations report
 * failure by throwing.
 */
class Backend {
public:
    virtual ~Backend()
    {
        // Virtual destructor for inheritance
    }

    virtual std::vector<bitCapInt> Execute(
        QCircuitPtr circuit, const std::vector<bitLenInt>& measured, unsigned shots) = 0;
};

/**
 * Backend on the local multithreaded state vector simulator
 */
class SimulatorBackend : public Backend {
protected:
    qasp_rand_gen_ptr rand_generator;

public:
    /**
     * "rgp" drives measurement sampling. Do not share it with a caller that draws from it while a backend call may
     * still be running.
     */
    SimulatorBackend(qasp_rand_gen_ptr rgp = nullptr);

    std::vector<bitCapInt> Execute(QCircuitPtr circuit, const std::vector<bitLenInt>& measured, unsigned shots);
};

} // namespace Qasp
