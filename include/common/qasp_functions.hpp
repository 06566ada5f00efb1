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

#pragma once

#include "qasp_types.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#define _bi_compare(left, right)                                                                                       \
    if (left > right) {                                                                                                \
        return 1;                                                                                                      \
    }                                                                                                                  \
    if (left < right) {                                                                                                \
        return -1;                                                                                                     \
    }                                                                                                                  \
                                                                                                                       \
    return 0;

inline void bi_not_ip(bitCapInt* left) { *left = ~(*left); }
inline void bi_and_ip(bitCapInt* left, const bitCapInt& right) { *left &= right; }
inline void bi_or_ip(bitCapInt* left, const bitCapInt& right) { *left |= right; }
inline void bi_xor_ip(bitCapInt* left, const bitCapInt& right) { *left ^= right; }
inline double bi_to_double(const bitCapInt& in) { return (double)in; }

inline void bi_increment(bitCapInt* pBigInt, const bitCapInt& value) { *pBigInt += value; }
inline void bi_decrement(bitCapInt* pBigInt, const bitCapInt& value) { *pBigInt -= value; }

inline int bi_and_1(const bitCapInt& left) { return left & 1; }

inline int bi_compare(const bitCapInt& left, const bitCapInt& right) { _bi_compare(left, right) }
inline int bi_compare_0(const bitCapInt& left) { return (int)(bool)left; }

namespace Qasp {

inline bitLenInt log2Ocl(bitCapIntOcl n)
{
#if defined(__GNUC__) || defined(__clang__)
    return (bitLenInt)(bitsInByte * sizeof(unsigned long long) - __builtin_clzll((unsigned long long)n) - 1U);
#else
    bitLenInt pow = 0U;
    bitCapIntOcl p = n >> 1U;
    while (p) {
        p >>= 1U;
        ++pow;
    }
    return pow;
#endif
}

inline bitLenInt popCountOcl(bitCapIntOcl n)
{
#if defined(__GNUC__) || defined(__clang__)
    return (bitLenInt)__builtin_popcountll((unsigned long long)n);
#else
    bitLenInt popCount;
    for (popCount = 0U; n; ++popCount) {
        n &= n - 1U;
    }
    return popCount;
#endif
}

inline bitLenInt log2(const bitCapInt& n) { return log2Ocl((bitCapIntOcl)n); }

inline bitCapInt pow2(const bitLenInt& p) { return ONE_BCI << p; }
inline bitCapIntOcl pow2Ocl(const bitLenInt& p) { return (bitCapIntOcl)1U << p; }
inline bitCapInt pow2Mask(const bitLenInt& p)
{
    bitCapInt toRet = ONE_BCI << p;
    bi_decrement(&toRet, 1U);
    return toRet;
}
inline bitCapIntOcl pow2MaskOcl(const bitLenInt& p) { return ((bitCapIntOcl)1U << p) - 1U; }
inline bitCapIntOcl bitSliceOcl(const bitLenInt& bit, const bitCapIntOcl& source)
{
    return ((bitCapIntOcl)1U << bit) & source;
}
inline bitCapIntOcl bitRegMaskOcl(const bitLenInt& start, const bitLenInt& length)
{
    return (((bitCapIntOcl)1U << length) - 1U) << start;
}
// Source: https://www.exploringbinary.com/ten-ways-to-check-if-an-integer-is-a-power-of-two-in-c/
inline bool isPowerOfTwoOcl(const bitCapIntOcl& x) { return x && !(x & (x - 1U)); }
inline bool isBadPermRange(const bitCapIntOcl& start, const bitCapIntOcl& length, const bitCapIntOcl& maxQPowerOcl)
{
    return ((start + length) > maxQPowerOcl) || ((bitCapIntOcl)(start + length) < start);
}
inline void ThrowIfQbIdArrayIsBad(
    const std::vector<bitLenInt>& controls, const bitLenInt& qubitCount, std::string message)
{
    std::set<bitLenInt> dupes;
    for (size_t i = 0U; i < controls.size(); ++i) {
        if (controls[i] >= qubitCount) {
            throw std::invalid_argument(message);
        }

        if (dupes.find(controls[i]) == dupes.end()) {
            dupes.insert(controls[i]);
        } else {
            throw std::invalid_argument(message + " (Found duplicate qubit indices!)");
        }
    }
}

void mul2x2(const complex* left, const complex* right, complex* out);
} // namespace Qasp
