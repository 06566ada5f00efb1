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

#include "sampler.hpp"

namespace Qasp {

std::vector<bitCapInt> Sampler::Dispatch(BackendPtr backend, QCircuitPtr circuit, std::vector<bitLenInt> measured)
{
    try {
        return backend->Execute(circuit, measured, 1U);
    } catch (const BackendExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        throw BackendExecutionError(std::string("Backend execution failed: ") + e.what());
    } catch (...) {
        throw BackendExecutionError("Backend execution failed with a non-standard exception!");
    }
}

bitCapInt Sampler::Sample(QCircuitPtr circuit, const std::vector<bitLenInt>& measured)
{
    const std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;

    if (pending.valid()) {
        if (pending.wait_until(deadline) != std::future_status::ready) {
            throw BackendTimeoutError("Sampler::Sample() backend is still running a timed out execution after " +
                std::to_string(timeout.count()) + " ms!");
        }
        // The abandoned execution's round was already counted as failed; discard its outcome.
        pending = std::future<std::vector<bitCapInt>>();
    }

    ++callCount;

    std::vector<bitCapInt> results;
    if (timeout.count() <= 0) {
        results = Dispatch(backend, circuit, measured);
    } else {
        std::future<std::vector<bitCapInt>> job = std::async(std::launch::async, Dispatch, backend, circuit, measured);
        if (job.wait_until(deadline) != std::future_status::ready) {
            pending = std::move(job);
            throw BackendTimeoutError(
                "Sampler::Sample() backend execution timed out after " + std::to_string(timeout.count()) + " ms!");
        }
        results = job.get();
    }

    if (results.size() != 1U) {
        throw BackendExecutionError(
            "Sampler::Sample() backend returned " + std::to_string(results.size()) + " samples for one shot!");
    }
    if ((measured.size() < bitsInCap) && (bi_compare(results[0U], pow2((bitLenInt)measured.size())) >= 0)) {
        throw BackendExecutionError("Sampler::Sample() backend returned a sample wider than the measured register!");
    }

    return results[0U];
}

} // namespace Qasp
