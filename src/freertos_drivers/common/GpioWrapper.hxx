/** \copyright
 * Copyright (c) 2015, Balazs Racz
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are  permitted provided that the following conditions are met:
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
 * \file GpioWrapper.hxx
 *
 * Templated helper class to wrap a typed output pin handle into an
 * implementation of the os-unspecific gpio class.
 *
 * @author Balazs Racz
 * @date 5 Jul 2015
 */

#ifndef _FREERTOS_DRIVERS_COMMON_GPIOWRAPPER_HXX_
#define _FREERTOS_DRIVERS_COMMON_GPIOWRAPPER_HXX_

#include <utility>

#include "os/Gpio.hxx"
#include "utils/macros.h"

/// Creates an implementation of an os-independent Gpio object from a
/// hardware-specific output pin handle. The wrapper takes over the handle, so
/// the pin is driven only through the wrapper afterwards. PIN may be any
/// handle type with set() and clr(), e.g. a sampio::PioPin in an output mode
/// or a sampio::PioErasedPin.
///
/// Usage:
///
///   GpioWrapper<decltype(led)> led_gpio(std::move(led));
///   blinker.start(&led_gpio);
template <class PIN> class GpioWrapper : public Gpio
{
public:
    /// @param pin is the output pin handle to take over.
    explicit GpioWrapper(PIN &&pin)
        : pin_(std::move(pin))
    {
    }

    void write(Value new_state) override
    {
        if (new_state == SET)
        {
            pin_.set();
        }
        else
        {
            pin_.clr();
        }
    }

    void set() override
    {
        pin_.set();
    }

    void clr() override
    {
        pin_.clr();
    }

    /// @return the wrapped pin handle.
    PIN *pin()
    {
        return &pin_;
    }

private:
    DISALLOW_COPY_AND_ASSIGN(GpioWrapper);

    /// Output pin handle owned by this wrapper.
    PIN pin_;
};

#endif // _FREERTOS_DRIVERS_COMMON_GPIOWRAPPER_HXX_
