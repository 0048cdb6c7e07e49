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
 * \file SamPioTokens.hxx
 *
 * Ownership tokens for the port-wide control registers of a PIO controller.
 *
 * Every one of these registers holds one bit for each of the 32 pins of the
 * port. Only the pin handles can write them, each with the bit of its own
 * pin, and only while holding the token. There is exactly one token per
 * register, handed out by splitting the port. Whoever holds the token decides
 * which pin gets reconfigured next.
 *
 * @author Balazs Racz
 * @date 12 Oct 2026
 */

#ifndef _FREERTOS_DRIVERS_SAM_SAMPIOTOKENS_HXX_
#define _FREERTOS_DRIVERS_SAM_SAMPIOTOKENS_HXX_

#include "freertos_drivers/sam/SamPioRegisters.hxx"
#include "os/OS.hxx"
#include "utils/constants.hxx"
#include "utils/macros.h"

/// Nonzero if the read-modify-write of the peripheral select registers has to
/// be done under a mutex.
DECLARE_CONST(sam_pio_select_locking);

namespace sampio
{

template <class PORT> class PioParts;
template <class PORT, unsigned NUM, class MODE> class PioPin;

/// Token for a register where writing a 1 bit performs an action on that pin
/// and writing 0 bits has no effect (PER, PDR, OER, ODR). These registers are
/// never read and never need a read-modify-write.
///
/// @param PORT is the port definition (e.g. PioA).
/// @param REG selects the register within the overlay.
template <class PORT, volatile uint32_t SamPioRegisters::*REG>
class PioWriteToken
{
public:
    /// Takes over the ownership of the register from another token. The
    /// other token becomes unusable.
    PioWriteToken(PioWriteToken &&other)
        : owned_(other.owned_)
    {
        other.owned_ = false;
    }

    /// @return false if the ownership was moved to another token.
    bool is_owned() const
    {
        return owned_;
    }

private:
    friend class PioParts<PORT>;
    template <class P, unsigned N, class M> friend class PioPin;

    PioWriteToken()
        : owned_(true)
    {
    }

    /// Writes a bit mask to the register.
    /// @param mask has a 1 for every pin the action applies to.
    void write(uint32_t mask)
    {
        HASSERT(owned_);
        PORT::regs()->*REG = mask;
    }

    DISALLOW_COPY_AND_ASSIGN(PioWriteToken);

    /// true while this object is the owner of the register.
    bool owned_;
};

/// Token for one of the two peripheral select registers ABCDSR[0] and
/// ABCDSR[1]. These are plain read-write registers, so changing the bit of
/// one pin needs a read-modify-write of the whole register.
///
/// @param PORT is the port definition (e.g. PioA).
/// @param INDEX is 0 for ABCDSR[0] (select 1) or 1 for ABCDSR[1] (select 2).
template <class PORT, unsigned INDEX> class PioSelectToken
{
public:
    static_assert(INDEX < 2, "There are two peripheral select registers.");

    /// Takes over the ownership of the register from another token. The
    /// other token becomes unusable.
    PioSelectToken(PioSelectToken &&other)
        : owned_(other.owned_)
    {
        other.owned_ = false;
    }

    /// @return false if the ownership was moved to another token.
    bool is_owned() const
    {
        return owned_;
    }

private:
    friend class PioParts<PORT>;
    template <class P, unsigned N, class M> friend class PioPin;

    PioSelectToken()
        : owned_(true)
    {
    }

    /// Changes some bits of the register and leaves every other bit as it
    /// was. Bits in clear_mask are cleared first, then the bits in set_mask
    /// are set.
    /// @param clear_mask bits to clear.
    /// @param set_mask bits to set.
    void modify(uint32_t clear_mask, uint32_t set_mask)
    {
        HASSERT(owned_);
        if (config_sam_pio_select_locking())
        {
            OSMutexLock locker(&lock_);
            apply(clear_mask, set_mask);
        }
        else
        {
            apply(clear_mask, set_mask);
        }
    }

    /// Performs the read-modify-write.
    void apply(uint32_t clear_mask, uint32_t set_mask)
    {
        volatile uint32_t *r = &PORT::regs()->PIO_ABCDSR[INDEX];
        *r = (*r & ~clear_mask) | set_mask;
    }

    DISALLOW_COPY_AND_ASSIGN(PioSelectToken);

    /// Serializes the read-modify-write cycles of this register.
    static os_mutex_t lock_;

    /// true while this object is the owner of the register.
    bool owned_;
};

template <class PORT, unsigned INDEX>
os_mutex_t PioSelectToken<PORT, INDEX>::lock_ = OS_MUTEX_INITIALIZER;

/// PIO enable register (gives the pin back to the PIO controller).
template <class PORT>
using PioPerToken = PioWriteToken<PORT, &SamPioRegisters::PIO_PER>;
/// PIO disable register (hands the pin over to the peripheral multiplexer).
template <class PORT>
using PioPdrToken = PioWriteToken<PORT, &SamPioRegisters::PIO_PDR>;
/// Output enable register.
template <class PORT>
using PioOerToken = PioWriteToken<PORT, &SamPioRegisters::PIO_OER>;
/// Output disable register.
template <class PORT>
using PioOdrToken = PioWriteToken<PORT, &SamPioRegisters::PIO_ODR>;
/// Peripheral select register 1 (ABCDSR[0]).
template <class PORT> using PioAbcdsr1Token = PioSelectToken<PORT, 0>;
/// Peripheral select register 2 (ABCDSR[1]).
template <class PORT> using PioAbcdsr2Token = PioSelectToken<PORT, 1>;

} // namespace sampio

#endif // _FREERTOS_DRIVERS_SAM_SAMPIOTOKENS_HXX_
