//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
// (C) The qasp contributors 2026. All rights reserved.
//
// This is an answer set search for normal logic programs, compiling the stable
// model condition to a reversible oracle and amplifying it on a multithreaded,
// universal quantum register simulation.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#include "common/parallel_for.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#if ENABLE_PTHREAD
#include <atomic>
#include <future>
#include <thread>

#define DECLARE_ATOMIC_BITCAPINT() std::atomic<bitCapIntOcl> idx;
#define ATOMIC_ASYNC(...)                                                                                              \
    std::async(std::launch::async, [__VA_ARGS__]()
#define ATOMIC_INC() i = idx++;
#endif

namespace Qasp {

ParallelFor::ParallelFor()
#if ENABLE_ENV_VARS
    : pStride(getenv("QASP_PSTRIDEPOW")
              ? ((bitCapIntOcl)1U << (bitCapIntOcl)std::stoi(std::string(getenv("QASP_PSTRIDEPOW"))))
              : ((bitCapIntOcl)1U << (bitLenInt)PSTRIDEPOW))
#else
    : pStride((bitCapIntOcl)1U << (bitLenInt)PSTRIDEPOW)
#endif
#if ENABLE_PTHREAD
    , numCores(std::thread::hardware_concurrency())
#else
    , numCores(1)
#endif
{
    if (!numCores) {
        numCores = 1U;
    }
}

void ParallelFor::par_for(const bitCapIntOcl begin, const bitCapIntOcl end, ParallelFunc fn)
{
    par_for_inc(
        begin, end - begin, [](const bitCapIntOcl& i) { return i; }, fn);
}

void ParallelFor::par_for_skip(const bitCapIntOcl begin, const bitCapIntOcl end, const bitCapIntOcl skipMask,
    const bitLenInt maskWidth, ParallelFunc fn)
{
    /*
     * Add maskWidth bits by shifting the incrementor up that number of
     * bits, filling with 0's.
     *
     * For example, if the skipMask is 0x8, then the lowMask will be 0x7
     * and the high mask will be ~(0x7 + 0x8) ==> ~0xf, shifted by the
     * number of extra bits to add.
     */

    if ((skipMask << maskWidth) >= end) {
        // Skipping trailing bits is just a shorter loop.
        par_for(begin, skipMask, fn);
        return;
    }

    const bitCapIntOcl lowMask = skipMask - 1U;
    const bitCapIntOcl highMask = ~lowMask;

    IncrementFunc incFn;
    if (!lowMask) {
        incFn = [maskWidth](const bitCapIntOcl& i) { return (i << maskWidth); };
    } else {
        incFn = [lowMask, highMask, maskWidth](
                    const bitCapIntOcl& i) { return ((i & lowMask) | ((i & highMask) << maskWidth)); };
    }

    par_for_inc(begin, (end - begin) >> maskWidth, incFn, fn);
}

void ParallelFor::par_for_mask(
    const bitCapIntOcl begin, const bitCapIntOcl end, const std::vector<bitCapIntOcl>& maskArray, ParallelFunc fn)
{
    const bitLenInt maskLen = (bitLenInt)maskArray.size();
    /* Pre-calculate the masks to simplify the increment function later. */
    std::unique_ptr<bitCapIntOcl[][2]> masks(new bitCapIntOcl[maskLen][2]);

    bool onlyLow = true;
    for (bitLenInt i = 0; i < maskLen; ++i) {
        masks[i][0U] = maskArray[i] - 1U; // low mask
        masks[i][1U] = (~(masks[i][0U] + maskArray[i])); // high mask
        if (maskArray[maskLen - i - 1U] != (end >> (i + 1U))) {
            onlyLow = false;
        }
    }

    if (onlyLow) {
        par_for(begin, end >> maskLen, fn);
        return;
    }

    IncrementFunc incFn = [&masks, maskLen](const bitCapIntOcl& iConst) {
        /* Push i apart, one mask at a time. */
        bitCapIntOcl i = iConst;
        for (bitLenInt m = 0U; m < maskLen; ++m) {
            i = ((i << 1U) & masks[m][1U]) | (i & masks[m][0U]);
        }
        return i;
    };

    par_for_inc(begin, (end - begin) >> maskLen, incFn, fn);
}

#if ENABLE_PTHREAD
/*
 * Iterate through the permutations a maximum of end-begin times, allowing the
 * caller to control the incrementation offset through 'inc'.
 */
void ParallelFor::par_for_inc(
    const bitCapIntOcl begin, const bitCapIntOcl itemCount, IncrementFunc inc, ParallelFunc fn)
{
    const bitCapIntOcl Stride = pStride;
    unsigned threads = (unsigned)(itemCount / pStride);
    if (threads > numCores) {
        threads = numCores;
    }

    if (threads <= 1U) {
        const bitCapIntOcl maxLcv = begin + itemCount;
        for (bitCapIntOcl j = begin; j < maxLcv; ++j) {
            fn(inc(j), 0U);
        }
        return;
    }

    DECLARE_ATOMIC_BITCAPINT();
    idx = 0U;
    std::vector<std::future<void>> futures;
    futures.reserve(threads);
    for (unsigned cpu = 0U; cpu != threads; ++cpu) {
        futures.emplace_back(ATOMIC_ASYNC(cpu, &idx, &begin, &itemCount, &Stride, inc, fn) {
            for (;;) {
                bitCapIntOcl i;
                ATOMIC_INC();
                const bitCapIntOcl l = i * Stride;
                if (l >= itemCount) {
                    break;
                }
                const bitCapIntOcl maxJ = ((l + Stride) < itemCount) ? Stride : (itemCount - l);
                for (bitCapIntOcl j = 0U; j < maxJ; ++j) {
                    fn(inc(begin + j + l), cpu);
                }
            }
        }));
    }

    for (unsigned cpu = 0U; cpu != threads; ++cpu) {
        futures[cpu].get();
    }
}
#else
/*
 * Iterate through the permutations a maximum of end-begin times, allowing the
 * caller to control the incrementation offset through 'inc'.
 */
void ParallelFor::par_for_inc(
    const bitCapIntOcl begin, const bitCapIntOcl itemCount, IncrementFunc inc, ParallelFunc fn)
{
    const bitCapIntOcl maxLcv = begin + itemCount;
    for (bitCapIntOcl j = begin; j < maxLcv; ++j) {
        fn(inc(j), 0U);
    }
}
#endif
} // namespace Qasp
