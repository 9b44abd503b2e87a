/*
 * Copyright (c) 2012 Stanford University
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR(S) DISCLAIM ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL AUTHORS BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 */

#include <signal.h>

#include <iostream>

using namespace std;

int Pointer_selfTest(void);
int FilePathFilter_selfTest(void);
int GitAttr_selfTest(void);
int ScanRange_selfTest(void);
int LfsStorage_selfTest(void);
int LfsConfig_selfTest(void);
int ObjectVerifier_selfTest(void);
int PointerChecker_selfTest(void);
int Quarantine_selfTest(void);
int Fsck_selfTest(void);
int GitScanner_selfTest(void);

int
main(int argc, const char *argv[])
{
    int result = 0;

    // A git child exiting early must not take the test down
    signal(SIGPIPE, SIG_IGN);

    result += Pointer_selfTest();
    result += FilePathFilter_selfTest();
    result += GitAttr_selfTest();
    result += ScanRange_selfTest();
    result += LfsStorage_selfTest();
    result += LfsConfig_selfTest();
    result += ObjectVerifier_selfTest();
    result += PointerChecker_selfTest();
    result += Quarantine_selfTest();
    result += Fsck_selfTest();
    result += GitScanner_selfTest();

    if (result == 0) {
        cout << "All tests passed!" << endl;
    } else {
        cout << -result << " errors occurred." << endl;
    }

    return result == 0 ? 0 : 1;
}
