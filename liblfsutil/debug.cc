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

#include <assert.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <time.h>

#include <unistd.h>
#include <sys/time.h>

#ifdef HAVE_EXECINFO
#include <execinfo.h>
#endif /* HAVE_EXECINFO */

#include <string>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <exception>

#include <lfsutil/debug.h>
#include <lfsutil/mutex.h>
#include <lfsutil/lfsfile.h>

using namespace std;

/********************************************************************
 *
 *
 * Logging
 *
 *
 ********************************************************************/

static fstream logStream;
static Mutex lock_log;

#ifdef DEBUG
static int logLevel = LEVEL_DBG;
#else
static int logLevel = LEVEL_MSG;
#endif

#define MAX_LOG         1024

void
lfs_set_loglevel(int level)
{
    lock_log.lock();
    logLevel = level;
    lock_log.unlock();
}

/*
 * Formats the log entries and append them to the log.  Messages are written to
 * stderr if they are urgent enough, or if tracing raised the log level.  This
 * function must not log, throw exceptions, or use our ASSERT, PANIC,
 * NOT_IMPLEMENTED macros.
 */
void
lfs_log(int level, const char *fmt, ...)
{
    va_list ap;
    char buf[MAX_LOG];
    size_t off;
    struct timespec ts;

    if (level > logLevel)
        return;

    clock_gettime(CLOCK_REALTIME, &ts);
    off = strftime(buf, 32, "%Y-%m-%d %H:%M:%S ", localtime(&ts.tv_sec));

    switch (level) {
        case LEVEL_SYS:
            break;
        case LEVEL_ERR:
            strncat(buf, "ERROR: ", MAX_LOG - off - 1);
            break;
        case LEVEL_MSG:
            strncat(buf, "MESSAGE: ", MAX_LOG - off - 1);
            break;
        case LEVEL_LOG:
            strncat(buf, "LOG: ", MAX_LOG - off - 1);
            break;
        case LEVEL_DBG:
            strncat(buf, "DEBUG: ", MAX_LOG - off - 1);
            break;
        case LEVEL_VRB:
            strncat(buf, "VERBOSE: ", MAX_LOG - off - 1);
            break;
    }

    off = strlen(buf);

    va_start(ap, fmt);
    vsnprintf(buf + off, MAX_LOG - off, fmt, ap);
    va_end(ap);

    lock_log.lock();

    if (level <= LEVEL_ERR) {
        cerr << buf + off;
    } else if (logLevel > LEVEL_MSG) {
        // Tracing enabled
        cerr << buf;
    }

    if (logStream.is_open()) {
        logStream.write(buf, strlen(buf));
        logStream.flush();
    }

    lock_log.unlock();
}

static void
lfs_terminate()
{
#ifdef HAVE_EXECINFO
    const size_t MAX_FRAMES = 128;
    int num;
    void *array[MAX_FRAMES];
    char **names;
#endif /* HAVE_EXECINFO */

    try {
        throw;
    } catch (const std::exception &e) {
        lfs_log(LEVEL_SYS, "Caught unhandled exception: %s\n", e.what());
    } catch (...) {
        lfs_log(LEVEL_SYS, "Caught unhandled exception: (unknown type)\n");
    }

#ifdef HAVE_EXECINFO
    num = backtrace(array, MAX_FRAMES);
    names = backtrace_symbols(array, num);
    lfs_log(LEVEL_SYS, "Backtrace:\n");
    for (int i = 0; i < num; i++) {
        if (names != NULL)
            lfs_log(LEVEL_SYS, "[%d] %s\n", i, names[i]);
        else
            lfs_log(LEVEL_SYS, "[%d] [0x%p]\n", i, array[i]);
    }
    free(names);
#else
    lfs_log(LEVEL_SYS, "Backtrace not support not included in this build\n");
#endif /* HAVE_EXECINFO */

    abort();
}

int
lfs_open_log(const string &logPath)
{
    if (logPath == "")
        return -1;

    set_terminate(lfs_terminate);

    string logDir = LfsFile_Dirname(logPath);
    if (logDir != logPath && !LfsFile_Exists(logDir)) {
        if (LfsFile_MkDirAll(logDir) < 0)
            return -1;
    }

    logStream.open(logPath.c_str(), fstream::out | fstream::app);
    if (logStream.fail()) {
        fprintf(stderr, "Could not open logfile: %s\n", logPath.c_str());
        return -1;
    }

    return 0;
}

void
lfs_close_log()
{
    lock_log.lock();
    if (logStream.is_open())
        logStream.close();
    lock_log.unlock();
}

