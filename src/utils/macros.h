/** \copyright
 * Copyright (c) 2013, Balazs Racz
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
 * \file macros.h
 * Assertion and class declaration helpers.
 *
 * @author Balazs Racz
 * @date 19 July 2013
 */

#ifndef _UTILS_MACROS_H_
#define _UTILS_MACROS_H_

#include <stdlib.h>

#ifdef __FreeRTOS__

/**
   Hard assertion facility. These checks remain in production code. They
   guard programming errors after which the program cannot continue in a
   meaningful way, such as using a pin handle after its pin was converted
   into a different mode: the handle no longer matches the hardware, and a
   write through it would corrupt the pin configuration. The target stops in
   abort(), where the debugger shows the failing frame.
 */
#define HASSERT(x)                                                             \
    do                                                                         \
    {                                                                          \
        if (!(x))                                                              \
            abort();                                                           \
    } while (0)

#else

#include <stdio.h>

/// Hard assertion facility. Prints the failed expression and its location to
/// stderr and aborts, regardless of NDEBUG.
#define HASSERT(x)                                                             \
    do                                                                         \
    {                                                                          \
        if (!(x))                                                              \
        {                                                                      \
            fprintf(stderr, "%s:%d: Assertion failed: %s\n", __FILE__,        \
                __LINE__, #x);                                                 \
            abort();                                                           \
        }                                                                      \
    } while (0)

#endif

#ifdef NDEBUG
/// Debug assertion facility. Compiled out when NDEBUG is defined.
#define DASSERT(x)
#else
/// Debug assertion facility. Compiled out when NDEBUG is defined.
#define DASSERT(x) HASSERT(x)
#endif

/**
   Removes default copy-constructor and assignment added by C++.

   This macro should be used in the private part of all classes that are not
   meant to be copied (which is almost all classes), to avoid bugs resulting
   from unintended passing of the objects by value.
 */
#define DISALLOW_COPY_AND_ASSIGN(TypeName)                                     \
    TypeName(const TypeName &);                                                \
    void operator=(const TypeName &)

#endif // _UTILS_MACROS_H_
