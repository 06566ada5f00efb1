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

#include "backend.hpp"
#include "qengine_cpu.hpp"

namespace Qasp {

SimulatorBackend::SimulatorBackend(qasp_rand_gen_ptr rgp)
    : rand_generator(rgp)
{
    if (!rand_generator) {
        rand_generator = std::make_shared<qasp_rand_gen>();
        rand_generator->seed(std::random_device{}());
    }
}

std::vector<bitCapInt> SimulatorBackend::Execute(
    QCircuitPtr circuit, const std::vector<bitLenInt>& measured, unsigned shots)
{
    const bitLenInt qubitCount = circuit->GetQubitCount();
    ThrowIfQbIdArrayIsBad(measured, qubitCount,
        "SimulatorBackend::Execute() measured qubits must be within the circuit's qubit bounds!");

    QInterfacePtr qsim = std::make_shared<QEngineCPU>(qubitCount, ZERO_BCI, rand_generator);
    circuit->Run(qsim);

    std::vector<bitCapInt> qPowers(measured.size());
    std::transform(measured.begin(), measured.end(), qPowers.begin(), pow2);

    std::vector<unsigned long long> shotsArray(shots);
    qsim->MultiShotMeasureMask(qPowers, shots, shotsArray.data());

    return std::vector<bitCapInt>(shotsArray.begin(), shotsArray.end());
}

} // namespace Qasp
