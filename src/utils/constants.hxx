/** \copyright
 * Copyright (c) 2014, Balazs Racz
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
 * \file constants.hxx
 *
 * Utility to specify linking-time constants and overrides for them.
 *
 * A constant is declared in a header with DECLARE_CONST(name), gets its
 * default value in exactly one .cxx file with DEFAULT_CONST(name, value), and
 * may be overridden by the application in any one translation unit with
 * OVERRIDE_CONST(name, value). The value is read with config_name().
 *
 * @author Balazs Racz
 * @date 30 Apr 2014
 */

#ifndef _UTILS_CONSTANTS_HXX_
#define _UTILS_CONSTANTS_HXX_

#include <stddef.h>

#ifdef __cplusplus
#define EXTERNC extern "C" {
#define EXTERNCEND }
#else
#define EXTERNC
#define EXTERNCEND
#endif

#ifdef __FreeRTOS__

// On the target the value of the constant is the address of a linker symbol,
// which costs no RAM or flash and folds into the instruction stream.

#define DECLARE_CONST(name)                                                    \
    EXTERNC extern char _sym_##name;                                           \
    EXTERNCEND                                                                 \
    typedef unsigned char                                                      \
        _do_not_add_declare_and_default_const_to_the_same_file_for_##name;     \
    static inline ptrdiff_t config_##name(void)                                \
    {                                                                          \
        return (ptrdiff_t)(&_sym_##name);                                      \
    }

#define DEFAULT_CONST(name, value)                                             \
    typedef signed char                                                        \
        _do_not_add_declare_and_default_const_to_the_same_file_for_##name;     \
    asm(".global _sym_" #name " \n");                                          \
    asm(".weak _sym_" #name " \n");                                            \
    asm(".set _sym_" #name ", " #value " \n");

#define OVERRIDE_CONST(name, value)                                            \
    asm(".global _sym_" #name " \n");                                          \
    asm(".set _sym_" #name ", " #value " \n");

#else

// Hosted builds are position independent, where absolute symbols cannot be
// referenced. The constants are weak variables instead.

#define DECLARE_CONST(name)                                                    \
    EXTERNC extern const int _sym_##name;                                      \
    EXTERNCEND                                                                 \
    typedef unsigned char                                                      \
        _do_not_add_declare_and_default_const_to_the_same_file_for_##name;     \
    static inline int config_##name(void)                                      \
    {                                                                          \
        return _sym_##name;                                                    \
    }

#define DEFAULT_CONST(name, value)                                             \
    typedef signed char                                                        \
        _do_not_add_declare_and_default_const_to_the_same_file_for_##name;     \
    EXTERNC extern const int _sym_##name;                                      \
    extern const int __attribute__((weak)) _sym_##name = value;            \
    EXTERNCEND

#define OVERRIDE_CONST(name, value)                                            \
    EXTERNC extern const int _sym_##name;                                      \
    extern const int _sym_##name = value;                                      \
    EXTERNCEND

#endif // __FreeRTOS__

#endif // _UTILS_CONSTANTS_HXX_
