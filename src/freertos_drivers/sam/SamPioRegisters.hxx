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
 * \file SamPioRegisters.hxx
 *
 * Register overlay of the PIO controller of the Atmel SAM4S microcontrollers,
 * and the port definitions of PIOA, PIOB and PIOC.
 *
 * @author Balazs Racz
 * @date 12 Oct 2026
 */

#ifndef _FREERTOS_DRIVERS_SAM_SAMPIOREGISTERS_HXX_
#define _FREERTOS_DRIVERS_SAM_SAMPIOREGISTERS_HXX_

#include <stddef.h>
#include <stdint.h>

namespace sampio
{

/// Memory layout of one PIO controller (SAM4S datasheet, chapter "Parallel
/// Input/Output Controller"). Only the registers up to the output write
/// protection are listed; the driver does not access anything beyond
/// them. Write-only registers (the "enable" / "disable" / "set" / "clear"
/// ones) affect exactly the bits written as 1.
struct SamPioRegisters
{
    volatile uint32_t PIO_PER;       ///< 0x00 PIO enable
    volatile uint32_t PIO_PDR;       ///< 0x04 PIO disable
    volatile uint32_t PIO_PSR;       ///< 0x08 PIO status
    volatile uint32_t reserved0;     ///< 0x0C
    volatile uint32_t PIO_OER;       ///< 0x10 output enable
    volatile uint32_t PIO_ODR;       ///< 0x14 output disable
    volatile uint32_t PIO_OSR;       ///< 0x18 output status
    volatile uint32_t reserved1;     ///< 0x1C
    volatile uint32_t PIO_IFER;      ///< 0x20 glitch input filter enable
    volatile uint32_t PIO_IFDR;      ///< 0x24 glitch input filter disable
    volatile uint32_t PIO_IFSR;      ///< 0x28 glitch input filter status
    volatile uint32_t reserved2;     ///< 0x2C
    volatile uint32_t PIO_SODR;      ///< 0x30 set output data
    volatile uint32_t PIO_CODR;      ///< 0x34 clear output data
    volatile uint32_t PIO_ODSR;      ///< 0x38 output data status
    volatile uint32_t PIO_PDSR;      ///< 0x3C pin data status
    volatile uint32_t PIO_IER;       ///< 0x40 interrupt enable
    volatile uint32_t PIO_IDR;       ///< 0x44 interrupt disable
    volatile uint32_t PIO_IMR;       ///< 0x48 interrupt mask
    volatile uint32_t PIO_ISR;       ///< 0x4C interrupt status
    volatile uint32_t PIO_MDER;      ///< 0x50 multi-driver enable
    volatile uint32_t PIO_MDDR;      ///< 0x54 multi-driver disable
    volatile uint32_t PIO_MDSR;      ///< 0x58 multi-driver status
    volatile uint32_t reserved3;     ///< 0x5C
    volatile uint32_t PIO_PUDR;      ///< 0x60 pull-up disable
    volatile uint32_t PIO_PUER;      ///< 0x64 pull-up enable
    volatile uint32_t PIO_PUSR;      ///< 0x68 pad pull-up status
    volatile uint32_t reserved4;     ///< 0x6C
    volatile uint32_t PIO_ABCDSR[2]; ///< 0x70 peripheral select 1 and 2
    volatile uint32_t reserved5[2];  ///< 0x78
    volatile uint32_t PIO_IFSCDR;    ///< 0x80 input filter slow clock disable
    volatile uint32_t PIO_IFSCER;    ///< 0x84 input filter slow clock enable
    volatile uint32_t PIO_IFSCSR;    ///< 0x88 input filter slow clock status
    volatile uint32_t PIO_SCDR;      ///< 0x8C slow clock divider debouncing
    volatile uint32_t PIO_PPDDR;     ///< 0x90 pad pull-down disable
    volatile uint32_t PIO_PPDER;     ///< 0x94 pad pull-down enable
    volatile uint32_t PIO_PPDSR;     ///< 0x98 pad pull-down status
    volatile uint32_t reserved6;     ///< 0x9C
    volatile uint32_t PIO_OWER;      ///< 0xA0 output write enable
    volatile uint32_t PIO_OWDR;      ///< 0xA4 output write disable
    volatile uint32_t PIO_OWSR;      ///< 0xA8 output write status
};

static_assert(offsetof(SamPioRegisters, PIO_OER) == 0x10, "PIO layout");
static_assert(offsetof(SamPioRegisters, PIO_SODR) == 0x30, "PIO layout");
static_assert(offsetof(SamPioRegisters, PIO_CODR) == 0x34, "PIO layout");
static_assert(offsetof(SamPioRegisters, PIO_ABCDSR) == 0x70, "PIO layout");
static_assert(offsetof(SamPioRegisters, PIO_OWSR) == 0xA8, "PIO layout");

/// Port definition of a PIO controller at a fixed address. This is the
/// template argument PORT of all the pin and token classes. Any class with the
/// same static members can stand in for it; the unittests use that to place
/// the registers in RAM.
///
/// @param BASE is the physical base address of the PIO controller.
/// @param NAME is the port letter, used in log messages.
template <uint32_t BASE, char NAME> struct SamPioPort
{
    /// @return the port letter.
    static constexpr char name()
    {
        return NAME;
    }

    /// @return the register overlay of this port.
    static SamPioRegisters *regs()
    {
        return reinterpret_cast<SamPioRegisters *>(BASE);
    }
};

/// PIO controller A.
typedef SamPioPort<0x400E0E00u, 'A'> PioA;
/// PIO controller B.
typedef SamPioPort<0x400E1000u, 'B'> PioB;
/// PIO controller C.
typedef SamPioPort<0x400E1200u, 'C'> PioC;

} // namespace sampio

#endif // _FREERTOS_DRIVERS_SAM_SAMPIOREGISTERS_HXX_
