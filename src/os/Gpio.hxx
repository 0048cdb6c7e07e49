/** \copyright
 * Copyright (c) 2015, Stuart W Baker
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
 * \file Gpio.hxx
 *
 * OS-independent interface of a digital output pin.
 *
 * @author Stuart Baker
 * @date 1 July 2015
 */

#ifndef _OS_GPIO_HXX_
#define _OS_GPIO_HXX_

/// OS-independent abstraction for a digital output pin. Libraries that need
/// to drive a pin without knowing its concrete type take a Gpio pointer. The
/// pin-specific implementations live in the drivers; see @ref GpioWrapper for
/// turning a typed output pin handle into an instance of this class.
class Gpio
{
public:
    /// Values representing the voltage on a GPIO pin.
    enum Value : bool
    {
        CLR = false, ///< GPIO is clear, in other words, driven to '0'
        SET = true   ///< GPIO is set, in other words, driven to '1'
    };

    /// Drives the output pin to a given value.
    /// @param new_state @ref SET drives high, @ref CLR drives low.
    virtual void write(Value new_state)
    {
        if (new_state == SET)
        {
            set();
        }
        else
        {
            clr();
        }
    }

    /// Drives the GPIO to '1'.
    virtual void set() = 0;

    /// Drives the GPIO to '0'.
    virtual void clr() = 0;

protected:
    virtual ~Gpio()
    {
    }
};

#endif /* _OS_GPIO_HXX_ */
