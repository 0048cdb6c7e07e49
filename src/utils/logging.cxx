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
 * \file logging.cxx
 * Formatting half of the logging facility.
 *
 * @author Balazs Racz
 * @date 3 August 2013
 */

#include "utils/logging.h"

#include <stdarg.h>
#include <stdio.h>

#include "os/OS.hxx"

#ifdef __linux__
/// Buffer the log lines are formatted into.
static char logbuffer[4096];
#else
/// Buffer the log lines are formatted into.
static char logbuffer[256];
#endif

/// Protects logbuffer.
static os_mutex_t g_log_mutex = OS_MUTEX_INITIALIZER;

void log_printf(const char *format, ...)
{
    OSMutexLock locker(&g_log_mutex);
    va_list ap;
    va_start(ap, format);
    int ret = vsnprintf(logbuffer, sizeof(logbuffer), format, ap);
    va_end(ap);
    if (ret < 0)
    {
        return;
    }
    if (ret >= (int)sizeof(logbuffer))
    {
        // Truncated; vsnprintf left room for the terminator.
        ret = sizeof(logbuffer) - 1;
    }
    log_output(logbuffer, ret);
}

#ifdef __FreeRTOS__

/// Drops the log lines unless the application has an output device.
__attribute__((weak)) void log_output(char *buf, int size)
{
}

#else

/// Prints the log lines to stderr unless the application overrides it.
__attribute__((weak)) void log_output(char *buf, int size)
{
    if (size <= 0)
    {
        return;
    }
    fwrite(buf, size, 1, stderr);
    fwrite("\n", 1, 1, stderr);
}

#endif // __FreeRTOS__
