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
 * \file SamPio.hxx
 *
 * Typed pin handles for the PIO controllers of the Atmel SAM4S.
 *
 * The mode of every pin is part of the type of its handle. Changing the mode
 * consumes the handle and returns one of the new type, so an operation that
 * is not valid in the current mode (e.g. driving a pin that belongs to a
 * peripheral) does not compile.
 *
 * Usage:
 *
 *   auto parts = sampio::PioPeripheral<sampio::PioA>::take().split();
 *   auto tx = std::move(parts.pin<9>())
 *       .into_peripheral<sampio::PeripheralA>(
 *           parts.pdr, parts.abcdsr1, parts.abcdsr2);
 *   auto led = std::move(parts.pin<19>()).into_output(parts.oer);
 *   led.set();
 *
 * @author Balazs Racz
 * @date 12 Oct 2026
 */

#ifndef _FREERTOS_DRIVERS_SAM_SAMPIO_HXX_
#define _FREERTOS_DRIVERS_SAM_SAMPIO_HXX_

#include <stddef.h>
#include <stdint.h>
#include <tuple>
#include <type_traits>
#include <utility>

#include "freertos_drivers/sam/SamPioModes.hxx"
#include "freertos_drivers/sam/SamPioRegisters.hxx"
#include "freertos_drivers/sam/SamPioTokens.hxx"
#include "utils/logging.h"
#include "utils/macros.h"

namespace sampio
{

/// Number of pins of one PIO controller.
static constexpr unsigned PIO_PIN_COUNT = 32;

template <class PORT> class PioPeripheral;

/// Output pin handle whose pin number is a runtime value instead of part of
/// the type. Handles for different pins of the same port and mode have the
/// same type and can be kept in one array. Can only be created by erasing a
/// typed output handle.
///
/// @param PORT is the port definition (e.g. PioA).
/// @param MODE is the output mode the pin was in when it was erased.
template <class PORT, class MODE> class PioErasedPin
{
public:
    static_assert(IsOutput<MODE>::value, "Only output pins can be erased.");

    typedef PORT Port;
    typedef MODE Mode;

    /// Takes over the pin from another handle, which becomes unusable.
    PioErasedPin(PioErasedPin &&other)
        : pin_(other.pin_)
        , owned_(other.owned_)
    {
        other.owned_ = false;
    }

    /// @return the pin number within the port (0..31).
    unsigned pin_num() const
    {
        return pin_;
    }

    /// @return the bit of this pin in the port registers.
    uint32_t pin_mask() const
    {
        return 1u << pin_;
    }

    /// Drives the pin high.
    void set()
    {
        HASSERT(owned_);
        PORT::regs()->PIO_SODR = pin_mask();
    }

    /// Drives the pin low.
    void clr()
    {
        HASSERT(owned_);
        PORT::regs()->PIO_CODR = pin_mask();
    }

    /// Drives the pin.
    /// @param value true for high, false for low.
    void write(bool value)
    {
        if (value)
        {
            set();
        }
        else
        {
            clr();
        }
    }

    /// @return false if the pin was moved to another handle.
    bool is_owned() const
    {
        return owned_;
    }

private:
    template <class P, unsigned N, class M> friend class PioPin;

    explicit PioErasedPin(unsigned pin)
        : pin_(pin)
        , owned_(true)
    {
        DASSERT(pin < PIO_PIN_COUNT);
    }

    DISALLOW_COPY_AND_ASSIGN(PioErasedPin);

    /// Pin number within the port.
    uint8_t pin_;
    /// true while this object is the owner of the pin.
    bool owned_;
};

/// Handle for one pin of a PIO controller, with the pin's current mode in its
/// type. There is at most one handle for every pin at any time. Handles come
/// from @ref PioPeripheral::split in mode Input<Floating>, which is the mode
/// the hardware leaves reset in.
///
/// Mode changes are called on an rvalue (std::move(pin).into_...). The
/// source handle is consumed and must not be used afterwards.
///
/// @param PORT is the port definition (e.g. PioA).
/// @param NUM is the pin number within the port (0..31).
/// @param MODE is the current mode tag.
template <class PORT, unsigned NUM, class MODE> class PioPin
{
public:
    static_assert(NUM < PIO_PIN_COUNT, "PIO pin number out of range.");

    typedef PORT Port;
    typedef MODE Mode;

    /// Takes over the pin from another handle, which becomes unusable.
    PioPin(PioPin &&other)
        : owned_(other.owned_)
    {
        other.owned_ = false;
    }

    /// @return the pin number within the port (0..31).
    static constexpr unsigned pin_num()
    {
        return NUM;
    }

    /// @return the bit of this pin in the port registers.
    static constexpr uint32_t pin_mask()
    {
        return 1u << NUM;
    }

    /// @return false if the pin was moved to another handle or converted to
    /// another mode.
    bool is_owned() const
    {
        return owned_;
    }

    /// Hands the pin over to one of the four peripherals. Only available in
    /// the reset mode.
    ///
    /// @param PERIPH is one of PeripheralA .. PeripheralD.
    /// @param pdr is the token of the PIO disable register.
    /// @param abcdsr1 is the token of peripheral select register 1.
    /// @param abcdsr2 is the token of peripheral select register 2.
    ///
    /// @return the handle of the pin in the peripheral mode.
    template <class PERIPH, class U = MODE>
    typename std::enable_if<std::is_same<U, Input<Floating>>::value &&
            IsPeripheral<PERIPH>::value,
        PioPin<PORT, NUM, PERIPH>>::type
    into_peripheral(PioPdrToken<PORT> &pdr, PioAbcdsr1Token<PORT> &abcdsr1,
        PioAbcdsr2Token<PORT> &abcdsr2) &&
    {
        static_assert(std::is_same<U, MODE>::value, "Do not specify U.");
        HASSERT(pdr.is_owned());
        HASSERT(abcdsr1.is_owned());
        HASSERT(abcdsr2.is_owned());
        consume();
        pdr.write(pin_mask());
        abcdsr1.modify(
            pin_mask(), PeripheralCode<PERIPH>::select1() ? pin_mask() : 0);
        abcdsr2.modify(
            pin_mask(), PeripheralCode<PERIPH>::select2() ? pin_mask() : 0);
        LOG(VERBOSE, "PIO%c%u -> peripheral %c", PORT::name(), NUM,
            PeripheralCode<PERIPH>::name());
        return PioPin<PORT, NUM, PERIPH>();
    }

    /// Turns the pin into an output. Only available in the reset mode or in
    /// a peripheral mode. Neither the output level nor the PIO enable state
    /// is touched.
    ///
    /// @param oer is the token of the output enable register.
    ///
    /// @return the handle of the pin in output mode.
    template <class U = MODE>
    typename std::enable_if<CanBecomeOutput<U>::value,
        PioPin<PORT, NUM, Output<>>>::type
    into_output(PioOerToken<PORT> &oer) &&
    {
        static_assert(std::is_same<U, MODE>::value, "Do not specify U.");
        HASSERT(oer.is_owned());
        consume();
        oer.write(pin_mask());
        LOG(VERBOSE, "PIO%c%u -> output", PORT::name(), NUM);
        return PioPin<PORT, NUM, Output<>>();
    }

    /// Moves the pin number from the type into the handle. Only available for
    /// outputs.
    ///
    /// @return a handle driving the same pin.
    template <class U = MODE>
    typename std::enable_if<IsOutput<U>::value, PioErasedPin<PORT, U>>::type
    erase() &&
    {
        static_assert(std::is_same<U, MODE>::value, "Do not specify U.");
        consume();
        return PioErasedPin<PORT, U>(NUM);
    }

    /// Drives the pin high. Only available for outputs.
    template <class U = MODE>
    typename std::enable_if<IsOutput<U>::value>::type set()
    {
        HASSERT(owned_);
        PORT::regs()->PIO_SODR = pin_mask();
    }

    /// Drives the pin low. Only available for outputs.
    template <class U = MODE>
    typename std::enable_if<IsOutput<U>::value>::type clr()
    {
        HASSERT(owned_);
        PORT::regs()->PIO_CODR = pin_mask();
    }

    /// Drives the pin. Only available for outputs.
    /// @param value true for high, false for low.
    template <class U = MODE>
    typename std::enable_if<IsOutput<U>::value>::type write(bool value)
    {
        if (value)
        {
            set();
        }
        else
        {
            clr();
        }
    }

private:
    template <class P, unsigned N, class M> friend class PioPin;
    friend class PioParts<PORT>;

    PioPin()
        : owned_(true)
    {
    }

    /// Marks the handle as consumed by a mode change.
    void consume()
    {
        HASSERT(owned_);
        owned_ = false;
    }

    DISALLOW_COPY_AND_ASSIGN(PioPin);

    /// true while this object is the owner of the pin.
    bool owned_;
};

/// Computes the type holding the reset-mode handles of all pins of a port.
template <class PORT, class SEQ> struct PioResetPins;

template <class PORT, size_t... I>
struct PioResetPins<PORT, std::index_sequence<I...>>
{
    typedef std::tuple<PioPin<PORT, I, Input<Floating>>...> type;
};

/// The pieces a PIO controller is split into: one token for each shared
/// control register and one handle for each pin. The members may be moved
/// out independently of each other.
///
/// @param PORT is the port definition (e.g. PioA).
template <class PORT> class PioParts
{
public:
    /// Handle type of pin N right after the split.
    template <unsigned N> using ResetPin = PioPin<PORT, N, Input<Floating>>;

    PioParts(PioParts &&) = default;

    /// @return the handle of pin N. Move it out to change its mode.
    template <unsigned N> ResetPin<N> &pin()
    {
        static_assert(N < PIO_PIN_COUNT, "PIO pin number out of range.");
        return std::get<N>(pins_);
    }

    PioPerToken<PORT> per;         ///< PIO enable register.
    PioPdrToken<PORT> pdr;         ///< PIO disable register.
    PioAbcdsr1Token<PORT> abcdsr1; ///< Peripheral select register 1.
    PioAbcdsr2Token<PORT> abcdsr2; ///< Peripheral select register 2.
    PioOerToken<PORT> oer;         ///< Output enable register.
    PioOdrToken<PORT> odr;         ///< Output disable register.

private:
    friend class PioPeripheral<PORT>;

    typedef typename PioResetPins<PORT,
        std::make_index_sequence<PIO_PIN_COUNT>>::type PinTuple;

    PioParts()
        : PioParts(std::make_index_sequence<PIO_PIN_COUNT>())
    {
    }

    template <size_t... I>
    explicit PioParts(std::index_sequence<I...>)
        : per()
        , pdr()
        , abcdsr1()
        , abcdsr2()
        , oer()
        , odr()
        , pins_(PioPin<PORT, I, Input<Floating>>()...)
    {
    }

    /// One handle per pin, in pin number order.
    PinTuple pins_;
};

/// Exclusive handle for a whole PIO controller. There is only one per port
/// for the lifetime of the program.
///
/// @param PORT is the port definition (e.g. PioA).
template <class PORT> class PioPeripheral
{
public:
    /// Hands out the handle of this port. Must be called at most once.
    /// @return the one and only handle of PORT.
    static PioPeripheral take()
    {
        HASSERT(!taken_);
        taken_ = true;
        return PioPeripheral();
    }

    /// Takes over the port from another handle, which becomes unusable.
    PioPeripheral(PioPeripheral &&other)
        : owned_(other.owned_)
    {
        other.owned_ = false;
    }

    /// Splits the port into register tokens and pin handles. Assumes that
    /// the port is in its hardware reset state; no register is written.
    ///
    /// @return the pieces of the port.
    PioParts<PORT> split() &&
    {
        HASSERT(owned_);
        owned_ = false;
        LOG(VERBOSE, "PIO%c split", PORT::name());
        return PioParts<PORT>();
    }

private:
    PioPeripheral()
        : owned_(true)
    {
    }

    DISALLOW_COPY_AND_ASSIGN(PioPeripheral);

    /// Set after take() was called.
    static bool taken_;

    /// true while this object is the owner of the port.
    bool owned_;
};

template <class PORT> bool PioPeripheral<PORT>::taken_ = false;

} // namespace sampio

#endif // _FREERTOS_DRIVERS_SAM_SAMPIO_HXX_
