/** \copyright
 * Copyright (c) 2026, Balazs Racz
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file sam_pio_test_helper.hxx
 *
 * Helpers for unittesting code that uses the PIO pin handles on the host.
 * The registers of the fake ports are plain RAM; a write-only register reads
 * back the value last written to it.
 *
 * @author Balazs Racz
 * @date 13 Oct 2026
 */

#ifndef _UTILS_SAM_PIO_TEST_HELPER_HXX_
#define _UTILS_SAM_PIO_TEST_HELPER_HXX_

#include <array>
#include <utility>

#include "freertos_drivers/sam/SamPio.hxx"
#include "utils/test_main.hxx"

namespace sampio
{

/// Port definition with the register overlay in RAM. Every test that splits
/// a port needs a type of its own, since a port can only be taken once:
///
///   DECLARE_FAKE_PIO_PORT(TestPort, 'A');
///
///   TEST(Foo, Bar)
///   {
///       auto parts = split_fake_port<TestPort>();
///       ...
///   }
///
/// @param T is the derived class (the fake port type itself).
/// @param NAME is the port letter.
template <class T, char NAME> struct FakePioPort
{
    static constexpr char name()
    {
        return NAME;
    }

    static SamPioRegisters *regs()
    {
        return &registers_;
    }

    /// Sets the registers to their values after a hardware reset: every pin
    /// is a PIO controlled input with the pull-up enabled and peripheral A
    /// selected.
    static void reset()
    {
        volatile uint32_t *r =
            reinterpret_cast<volatile uint32_t *>(&registers_);
        for (unsigned i = 0; i < sizeof(registers_) / 4; ++i)
        {
            r[i] = 0;
        }
        registers_.PIO_PSR = 0xFFFFFFFFu;
    }

    /// Backing store of the registers.
    static SamPioRegisters registers_;
};

template <class T, char NAME> SamPioRegisters FakePioPort<T, NAME>::registers_;

/// Declares a new fake port type.
#define DECLARE_FAKE_PIO_PORT(type, letter)                                    \
    struct type : public ::sampio::FakePioPort<type, letter>                   \
    {                                                                          \
    }

/// Copy of every register of a port, one entry per 32-bit word.
typedef std::array<uint32_t, sizeof(SamPioRegisters) / 4> PioRegisterDump;

/// Index of a register in a PioRegisterDump.
#define PIO_DUMP_INDEX(reg) (offsetof(::sampio::SamPioRegisters, reg) / 4)

/// Reads a register of a port as a plain value. gtest's assertions do not
/// take volatile operands.
#define PIO_REG(port, reg) ((uint32_t)port::regs()->reg)

/// @return the current contents of all registers of PORT.
template <class PORT> PioRegisterDump dump_registers()
{
    PioRegisterDump ret;
    const volatile uint32_t *r =
        reinterpret_cast<const volatile uint32_t *>(PORT::regs());
    for (unsigned i = 0; i < ret.size(); ++i)
    {
        ret[i] = r[i];
    }
    return ret;
}

/// Resets the registers of a fake port, then takes and splits it.
/// @return the parts of PORT.
template <class PORT> PioParts<PORT> split_fake_port()
{
    PORT::reset();
    return PioPeripheral<PORT>::take().split();
}

/// Calls fn with a reference to every reset pin handle of parts, in pin
/// number order.
template <class PORT, class F, size_t... I>
void for_each_reset_pin(PioParts<PORT> *parts, F fn, std::index_sequence<I...>)
{
    int dummy[] = {(fn(parts->template pin<I>()), 0)...};
    (void)dummy;
}

template <class PORT, class F>
void for_each_reset_pin(PioParts<PORT> *parts, F fn)
{
    for_each_reset_pin(parts, fn, std::make_index_sequence<PIO_PIN_COUNT>());
}

} // namespace sampio

#endif // _UTILS_SAM_PIO_TEST_HELPER_HXX_
