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

#include "common/parallel_for.hpp"

#include <cstdlib>
#include <new>

namespace Qasp {

// This is an amplitude buffer, subclassed per storage strategy.
class StateVector : public ParallelFor {
protected:
    bitCapIntOcl capacity;

public:
    StateVector(bitCapIntOcl cap)
        : capacity(cap)
    {
    }
    virtual ~StateVector()
    {
        // Intentionally left blank.
    }

    bitCapIntOcl size() { return capacity; }

    virtual complex read(const bitCapIntOcl& i) = 0;
    virtual void write(const bitCapIntOcl& i, const complex& c) = 0;
    /// Write the two amplitudes of a 2x2 tensor slice.
    virtual void write2(const bitCapIntOcl& i1, const complex& c1, const bitCapIntOcl& i2, const complex& c2) = 0;
    virtual void clear() = 0;
};

class StateVectorArray : public StateVector {
public:
    std::unique_ptr<complex[], void (*)(complex*)> amplitudes;

protected:
    std::unique_ptr<complex[], void (*)(complex*)> Alloc(bitCapIntOcl elemCount)
    {
        // elemCount is always a power of two, but might be smaller than QASP_ALIGN_SIZE
        size_t allocSize = sizeof(complex) * elemCount;
        if (allocSize < QASP_ALIGN_SIZE) {
            allocSize = QASP_ALIGN_SIZE;
        }
        complex* toRet = (complex*)aligned_alloc(QASP_ALIGN_SIZE, allocSize);
        if (!toRet) {
            throw std::bad_alloc();
        }
        return std::unique_ptr<complex[], void (*)(complex*)>(toRet, [](complex* c) { free(c); });
    }

public:
    StateVectorArray(bitCapIntOcl cap)
        : StateVector(cap)
        , amplitudes(Alloc(capacity))
    {
        // Intentionally left blank.
    }

    complex read(const bitCapIntOcl& i) { return amplitudes.get()[i]; };

    void write(const bitCapIntOcl& i, const complex& c) { amplitudes.get()[i] = c; };

    void write2(const bitCapIntOcl& i1, const complex& c1, const bitCapIntOcl& i2, const complex& c2)
    {
        amplitudes.get()[i1] = c1;
        amplitudes.get()[i2] = c2;
    };

    void clear()
    {
        par_for(0, capacity, [&](const bitCapIntOcl& lcv, const unsigned& cpu) { amplitudes[lcv] = ZERO_CMPLX; });
    }
};

} // namespace Qasp
