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

#define _USE_MATH_DEFINES

#include "config.h"

#include <complex>
#include <cstdint>
#include <functional>
#include <limits>
#include <math.h>
#include <memory>
#include <random>

#define IS_NORM_0(c) (norm(c) <= FP_NORM_EPSILON)
#define IS_SAME(c1, c2) (IS_NORM_0((c1) - (c2)))
#define IS_OPPOSITE(c1, c2) (IS_NORM_0((c1) + (c2)))

#if QBCAPPOW < 8
#define bitLenInt uint8_t
#elif QBCAPPOW < 16
#define bitLenInt uint16_t
#else
#define bitLenInt uint32_t
#endif

#if UINTPOW < 5
#define bitCapIntOcl uint16_t
#elif UINTPOW < 6
#define bitCapIntOcl uint32_t
#else
#define bitCapIntOcl uint64_t
#endif

#if QBCAPPOW < 6
#define bitCapInt uint32_t
#else
#define bitCapInt uint64_t
#endif

#if FPPOW < 6
namespace Qasp {
typedef float real1;
typedef float real1_f;
typedef float real1_s;
#else
namespace Qasp {
typedef double real1;
typedef double real1_f;
typedef double real1_s;
#endif

typedef std::complex<real1> complex;
const bitCapInt ONE_BCI = 1U;
const bitCapInt ZERO_BCI = 0U;
constexpr bitLenInt bitsInCap = ((bitLenInt)1U) << ((bitLenInt)QBCAPPOW);

typedef std::shared_ptr<complex> BitOp;

// Called once per value between begin and end.
typedef std::function<void(const bitCapIntOcl&, const unsigned& cpu)> ParallelFunc;
typedef std::function<bitCapIntOcl(const bitCapIntOcl&)> IncrementFunc;

class StateVector;

typedef std::shared_ptr<StateVector> StateVectorPtr;

#define bitsInByte 8U
#define qasp_rand_gen std::mt19937_64
#define qasp_rand_gen_ptr std::shared_ptr<qasp_rand_gen>
#define QASP_ALIGN_SIZE 64U

#if FPPOW < 6
#define QASP_CONST constexpr
#define ZERO_R1 0.0f
#define ZERO_R1_F 0.0f
#define ONE_R1 1.0f
#define ONE_R1_F 1.0f
constexpr real1 PI_R1 = (real1)M_PI;
constexpr real1 SQRT2_R1 = (real1)M_SQRT2;
constexpr real1 SQRT1_2_R1 = (real1)M_SQRT1_2;
#define REAL1_DEFAULT_ARG -999.0f
// Half the probability in any single permutation of 48 maximally superposed qubits
#define REAL1_EPSILON 1.7763568394002505e-15f
#else
#define QASP_CONST constexpr
#define ZERO_R1 0.0
#define ZERO_R1_F 0.0
#define ONE_R1 1.0
#define ONE_R1_F 1.0
#define PI_R1 M_PI
#define SQRT2_R1 M_SQRT2
#define SQRT1_2_R1 M_SQRT1_2
#define REAL1_DEFAULT_ARG -999.0
// Half the probability in any single permutation of 96 maximally superposed qubits
#define REAL1_EPSILON 6.310887241768095e-30
#endif

QASP_CONST complex ONE_CMPLX = complex(ONE_R1, ZERO_R1);
QASP_CONST complex ZERO_CMPLX = complex(ZERO_R1, ZERO_R1);
QASP_CONST complex I_CMPLX = complex(ZERO_R1, ONE_R1);
QASP_CONST complex CMPLX_DEFAULT_ARG = complex(REAL1_DEFAULT_ARG, REAL1_DEFAULT_ARG);
QASP_CONST real1 FP_NORM_EPSILON = (real1)(std::numeric_limits<real1>::epsilon() / 2);
constexpr real1_f FP_NORM_EPSILON_F = std::numeric_limits<real1_f>::epsilon() / 2;
} // namespace Qasp
