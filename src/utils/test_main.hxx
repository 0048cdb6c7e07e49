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
 * \file test_main.hxx
 *
 * Include this file into your unittest to define the necessary symbols and
 * main function.
 *
 * @author Balazs Racz
 * @date 3 Nov 2013
 */

#ifdef _UTILS_TEST_MAIN_HXX_
#error Only ever include test_main into the main unittest file.
#else
#define _UTILS_TEST_MAIN_HXX_

#include <stdio.h>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "os/os.h"
#include "utils/logging.h"
#include "utils/macros.h"

int appl_main(int argc, char *argv[])
{
    testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}

/// Hosted entry point. The target build gets main() from the OS startup code.
int main(int argc, char *argv[])
{
    return appl_main(argc, argv);
}

/// Set to true to suppress printing the log lines to stderr.
bool mute_log_output = false;
/// Set to true to append every log line to captured_log_output.
bool capture_log_output = false;
/// Log lines collected while capture_log_output is true, each terminated by a
/// newline.
std::string captured_log_output;

extern "C" {

void log_output(char* buf, int size) {
    if (size <= 0) return;
    if (capture_log_output) {
        captured_log_output.append(buf, size);
        captured_log_output.push_back('\n');
    }
    if (mute_log_output) return;
    fwrite(buf, size, 1, stderr);
    fwrite("\n", 1, 1, stderr);
}

}

/** Collects the log output for the lifetime of this object.
 *
 * Usage:
 * {
 *    LogCapture capture;
 *    ... code that logs ...
 *    EXPECT_THAT(capture.output(), HasSubstr("..."));
 * }
 */
class LogCapture
{
public:
    LogCapture()
    {
        captured_log_output.clear();
        capture_log_output = true;
    }

    ~LogCapture()
    {
        capture_log_output = false;
        captured_log_output.clear();
    }

    /// @return everything logged since the construction of this object.
    const std::string &output()
    {
        return captured_log_output;
    }

private:
    DISALLOW_COPY_AND_ASSIGN(LogCapture);
};

#endif // _UTILS_TEST_MAIN_HXX_
