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
 * \file SamPioModes.hxx
 *
 * Type tags describing which role a PIO pin is currently configured for.
 *
 * @author Balazs Racz
 * @date 12 Oct 2026
 */

#ifndef _FREERTOS_DRIVERS_SAM_SAMPIOMODES_HXX_
#define _FREERTOS_DRIVERS_SAM_SAMPIOMODES_HXX_

#include <stdint.h>
#include <type_traits>

namespace sampio
{

/// Floating input (no pull resistor).
struct Floating
{
};
/// Input with the weak pull-up active.
struct PullUp
{
};
/// Input with the weak pull-down active.
struct PullDown
{
};

/// Pin is a PIO controlled input.
/// @param MODE is one of Floating, PullUp, PullDown.
template <class MODE> struct Input
{
};

/// Output sub-mode that was not specified further.
struct PushPull
{
};

/// Pin is a PIO controlled output.
/// @param MODE is the output sub-mode.
template <class MODE = PushPull> struct Output
{
};

/// Pin is assigned to peripheral A.
struct PeripheralA
{
};
/// Pin is assigned to peripheral B.
struct PeripheralB
{
};
/// Pin is assigned to peripheral C.
struct PeripheralC
{
};
/// Pin is assigned to peripheral D.
struct PeripheralD
{
};

/// Maps a peripheral tag to the two bits that select it. The bit for a pin
/// goes into ABCDSR[0] (select 1) and ABCDSR[1] (select 2) respectively.
template <class MODE> struct PeripheralCode;

template <> struct PeripheralCode<PeripheralA>
{
    /// @return true if the pin's bit in ABCDSR[0] has to be set.
    static constexpr bool select1()
    {
        return false;
    }
    /// @return true if the pin's bit in ABCDSR[1] has to be set.
    static constexpr bool select2()
    {
        return false;
    }
    /// @return the peripheral letter.
    static constexpr char name()
    {
        return 'A';
    }
};

template <> struct PeripheralCode<PeripheralB>
{
    static constexpr bool select1()
    {
        return false;
    }
    static constexpr bool select2()
    {
        return true;
    }
    static constexpr char name()
    {
        return 'B';
    }
};

template <> struct PeripheralCode<PeripheralC>
{
    static constexpr bool select1()
    {
        return true;
    }
    static constexpr bool select2()
    {
        return false;
    }
    static constexpr char name()
    {
        return 'C';
    }
};

template <> struct PeripheralCode<PeripheralD>
{
    static constexpr bool select1()
    {
        return true;
    }
    static constexpr bool select2()
    {
        return true;
    }
    static constexpr char name()
    {
        return 'D';
    }
};

/// true_type if MODE is one of the peripheral tags.
template <class MODE> struct IsPeripheral : public std::false_type
{
};
template <> struct IsPeripheral<PeripheralA> : public std::true_type
{
};
template <> struct IsPeripheral<PeripheralB> : public std::true_type
{
};
template <> struct IsPeripheral<PeripheralC> : public std::true_type
{
};
template <> struct IsPeripheral<PeripheralD> : public std::true_type
{
};

/// true_type if MODE is any Output<>.
template <class MODE> struct IsOutput : public std::false_type
{
};
template <class SUB> struct IsOutput<Output<SUB>> : public std::true_type
{
};

/// true_type for the modes from which a pin may be turned into an output:
/// the reset state and any peripheral.
template <class MODE>
struct CanBecomeOutput
    : public std::integral_constant<bool,
          std::is_same<MODE, Input<Floating>>::value ||
              IsPeripheral<MODE>::value>
{
};

} // namespace sampio

#endif // _FREERTOS_DRIVERS_SAM_SAMPIOMODES_HXX_
