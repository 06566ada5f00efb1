//////////////////////////////////////////////////////////////////////////////////////
//
// (C) The qasp contributors 2026. All rights reserved.
//
// This example demonstrates Grover's search for a stable model of a logic program, when the number of stable models
// is known. Given the count, the optimal iteration count is fixed, and we can watch the chance of a match grow with
// each iteration.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

// "qasp.hpp" pulls in all headers needed to read a program and search it.
#include "qasp.hpp"
#include "qengine_cpu.hpp"

#include <iomanip> // For setw
#include <iostream> // For cout

using namespace Qasp;

int main()
{
    ProgramPtr program = ParseProgram("p :- not q.\n"
                                      "q :- not p.\n"
                                      "r :- p.\n"
                                      "r :- q.\n");

    // We "know" the number of stable models. (Here, we count them classically.)
    const std::vector<Assignment> models = program->StableModels();
    const bitCapInt modelCount = models.size();
    const bitLenInt atomCount = (bitLenInt)program->GetAtomCount();

    BoolCircuitPtr marking = StableModelEncoder().Encode(*program);
    OraclePtr oracle = OracleSynthesizer(PHASE_ORACLE, 24U, false).Synthesize(*marking);
    const bitCapInt iterations = GroverSearch::OptimalIterations(modelCount, atomCount);

    std::cout << (int)atomCount << " atoms, " << modelCount << " stable models, " << (int)oracle->layout.qubitCount
              << " qubits, " << iterations << " iterations" << std::endl;

    // Apply the iterations one at a time, and watch the chance of a match.
    QInterfacePtr qReg = std::make_shared<QEngineCPU>(oracle->layout.qubitCount, ZERO_BCI);
    qReg->H(0, atomCount);

    QCircuitPtr step = oracle->circuit->Clone();
    GroverSearch::Diffusion(step, oracle->layout.SearchQubits());

    std::cout << "Iterations:" << std::endl;
    for (bitCapInt i = ZERO_BCI; i < iterations; ++i) {
        step->Run(qReg);

        real1_f chance = ZERO_R1_F;
        for (const Assignment& model : models) {
            chance += qReg->ProbAll(program->Encode(model));
        }
        std::cout << "\t" << std::setw(2) << i << "> chance of match:" << chance << std::endl;
    }

    // The search does the same, then verifies what it measures.
    GroverSearch search(std::make_shared<SimulatorBackend>());
    const SearchResult result = search.RunKnownCount(*program, modelCount);

    std::cout << "Status: " << result.status << " after " << result.rounds << " rounds" << std::endl;
    if (result.status == SEARCH_SUCCESS) {
        std::cout << "Stable model: " << program->Format(result.model) << std::endl;
    }

    return (result.status == SEARCH_SUCCESS) ? 0 : 1;
}
