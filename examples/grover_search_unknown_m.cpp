//////////////////////////////////////////////////////////////////////////////////////
//
// (C) The qasp contributors 2026. All rights reserved.
//
// This example demonstrates Grover's search for a stable model of a logic program, when the number of stable models
// is not known in advance. The iteration count of each round is drawn at random from an exponentially growing range,
// and every measured candidate is checked classically before it is accepted.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

// "qasp.hpp" pulls in all headers needed to read a program and search it.
#include "qasp.hpp"

#include <iostream> // For cout

using namespace Qasp;

int main()
{
    // Two stable models, {p, r} and {q, r}, and we theoretically don't know that.
    ProgramPtr program = ParseProgram("p :- not q.\n"
                                      "q :- not p.\n"
                                      "r :- p.\n"
                                      "r :- q.\n");

    std::cout << "Program:" << std::endl << *program;

    // A fixed seed makes the run repeatable.
    qasp_rand_gen_ptr rng = std::make_shared<qasp_rand_gen>();
    rng->seed(42U);
    qasp_rand_gen_ptr backendRng = std::make_shared<qasp_rand_gen>();
    backendRng->seed(43U);

    SearchOptions options;
    options.isVerbose = true;

    GroverSearch search(std::make_shared<SimulatorBackend>(backendRng), rng, options);
    const SearchResult result = search.Run(*program);

    std::cout << "Status: " << result.status << " (" << result.reason << ")" << std::endl;
    if (result.status == SEARCH_SUCCESS) {
        std::cout << "Stable model: " << program->Format(result.model) << std::endl;
    }
    std::cout << "Rounds: " << result.rounds << ", iterations: " << result.iterations << " of " << result.budget
              << std::endl;

    // For comparison, the classical answer:
    std::cout << "All stable models:";
    for (const Assignment& model : program->StableModels()) {
        std::cout << " " << program->Format(model);
    }
    std::cout << std::endl;

    return (result.status == SEARCH_SUCCESS) ? 0 : 1;
}
