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

#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>
#include <errno.h>

#include <string>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/systemexception.h>

using namespace std;

static volatile sig_atomic_t cancelRequested = 0;

/*
 * Accepts either an errno value or a negated one as returned by the
 * LfsFile_* helpers.
 */
string
LfsUtil_SystemError(int status)
{
    if (status < 0)
        status = -status;

    return strerror(status);
}

string
LfsUtil_MkTempDir(const string &prefix)
{
    const char *tmpdir = getenv("TMPDIR");
    string tmpl = string(tmpdir ? tmpdir : "/tmp") + "/" + prefix + "XXXXXX";
    char *buf = strdup(tmpl.c_str());

    if (buf == NULL)
        throw SystemException(ENOMEM, "strdup");

    if (mkdtemp(buf) == NULL) {
        int err = errno;
        free(buf);
        throw SystemException(err, "mkdtemp(" + tmpl + ")");
    }

    string rval = buf;
    free(buf);

    return rval;
}

static void
LfsCancelHandler(int sig)
{
    cancelRequested = 1;
}

void
LfsCancel_InstallHandlers()
{
    struct sigaction sa;

    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = LfsCancelHandler;
    sigemptyset(&sa.sa_mask);

    if (sigaction(SIGINT, &sa, NULL) < 0)
        throw SystemException(errno, "sigaction(SIGINT)");
    if (sigaction(SIGTERM, &sa, NULL) < 0)
        throw SystemException(errno, "sigaction(SIGTERM)");
}

void
LfsCancel_Request()
{
    cancelRequested = 1;
}

bool
LfsCancel_Requested()
{
    return cancelRequested != 0;
}

void
LfsCancel_Reset()
{
    cancelRequested = 0;
}
