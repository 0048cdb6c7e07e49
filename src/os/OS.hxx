/** \copyright
 * Copyright (c) 2012, Stuart W Baker
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
 * \file OS.hxx
 * C++ wrappers over the C OS abstraction.
 *
 * @author Stuart W. Baker
 * @date 28 May 2012
 */

#ifndef _os_hxx_
#define _os_hxx_

#include "os/os.h"
#include "utils/macros.h"

/// Holds a mutex locked for the lifetime of the object. Leaving the scope in
/// any way (return, break, continue) unlocks it.
///
/// Usage:
///
///   static os_mutex_t lock_ = OS_MUTEX_INITIALIZER;
///   ...
///   {
///       OSMutexLock locker(&lock_);
///       // critical section
///   }
class OSMutexLock
{
public:
    /// Blocks until the mutex is acquired.
    /// @param mutex is the mutex to lock.
    explicit OSMutexLock(os_mutex_t *mutex)
        : mutex_(mutex)
    {
        HASSERT(os_mutex_lock(mutex_) == 0);
    }

    ~OSMutexLock()
    {
        os_mutex_unlock(mutex_);
    }

private:
    DISALLOW_COPY_AND_ASSIGN(OSMutexLock);

    /// Mutex being held.
    os_mutex_t *mutex_;
};

/// Rejects a locker without a variable name, i.e. OSMutexLock(&lock_); which
/// would construct a temporary and unlock right away.
#define OSMutexLock(l) int error_omitted_mutex_lock_variable[-1]

#endif /* _os_hxx_ */
