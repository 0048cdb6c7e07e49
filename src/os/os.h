/** \copyright
 * Copyright (c) 2012, Stuart W Baker
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
 * \file os.h
 * C language abstraction of the one OS primitive the PIO driver needs: a
 * statically initialized mutex, over FreeRTOS or pthreads.
 *
 * @author Stuart W. Baker
 * @date 28 May 2012
 */

#ifndef _os_h_
#define _os_h_

#include <stdlib.h>

#include "sampio_features.h"

#if SAMPIO_FEATURE_MUTEX_FREERTOS
#include <FreeRTOS.h>
#include <task.h>
#include <semphr.h>
#elif SAMPIO_FEATURE_MUTEX_PTHREAD
#include <pthread.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

/** Entry point to application.
 * @param argc number of arguments
 * @param argv list of arguments
 * @return 0 upon success.
 */
int appl_main(int argc, char *argv[]);

#if SAMPIO_FEATURE_MUTEX_FREERTOS
/** Mutex handle. The semaphore is created on first use, because static
 * initialization runs before the scheduler. */
typedef struct
{
    SemaphoreHandle_t sem; /**< FreeRTOS mutex, NULL until first locked */
} os_mutex_t;

/** Static initializer for mutexes */
#define OS_MUTEX_INITIALIZER {NULL}
#elif SAMPIO_FEATURE_MUTEX_PTHREAD
typedef pthread_mutex_t os_mutex_t; /**< mutex handle */

/** Static initializer for mutexes */
#define OS_MUTEX_INITIALIZER PTHREAD_MUTEX_INITIALIZER
#else
/** Mutex handle for a single-threaded runtime. Only catches recursive
 * locking, which would be a deadlock anywhere else. */
typedef struct
{
    char locked; /**< nonzero while held */
} os_mutex_t;

/** Static initializer for mutexes */
#define OS_MUTEX_INITIALIZER {0}
#endif

/** Lock a mutex.
 * @param mutex address of mutex handle to lock
 * @return 0 upon succes or error number upon failure
 */
static inline int os_mutex_lock(os_mutex_t *mutex)
{
#if SAMPIO_FEATURE_MUTEX_FREERTOS
    if (mutex->sem == NULL)
    {
        vTaskSuspendAll();
        if (mutex->sem == NULL)
        {
            mutex->sem = xSemaphoreCreateMutex();
        }
        xTaskResumeAll();
    }
    return xSemaphoreTake(mutex->sem, portMAX_DELAY) == pdTRUE ? 0 : 1;
#elif SAMPIO_FEATURE_MUTEX_PTHREAD
    return pthread_mutex_lock(mutex);
#else
    if (mutex->locked)
    {
        abort();
    }
    mutex->locked = 1;
    return 0;
#endif
}

/** Unlock a mutex.
 * @param mutex address of mutex handle to unlock
 * @return 0 upon succes or error number upon failure
 */
static inline int os_mutex_unlock(os_mutex_t *mutex)
{
#if SAMPIO_FEATURE_MUTEX_FREERTOS
    return xSemaphoreGive(mutex->sem) == pdTRUE ? 0 : 1;
#elif SAMPIO_FEATURE_MUTEX_PTHREAD
    return pthread_mutex_unlock(mutex);
#else
    mutex->locked = 0;
    return 0;
#endif
}

#ifdef __cplusplus
}
#endif

#endif /* _os_h_ */
