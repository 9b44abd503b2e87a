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

#include <string>
#include <vector>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/runtimeexception.h>
#include <lfs/catfile.h>

using namespace std;

static vector<string>
catFileArgs(bool withContents)
{
    vector<string> args;

    args.push_back("cat-file");
    args.push_back(withContents ? "--batch" : "--batch-check");

    return args;
}

CatFile::CatFile(const string &dir, bool withContents)
    : withContents(withContents), proc(dir, catFileArgs(withContents)),
      running(false)
{
    proc.start();
    running = true;
}

CatFile::~CatFile()
{
}

bool
CatFile::get(const string &rev, string &sha, string &type, int64_t &size,
             string &data)
{
    string line;
    uint64_t len;

    if (rev.find('\n') != rev.npos)
        throw RuntimeException(LFSEC_INVALIDARGS, "Bad object name");

    proc.write(rev + "\n");
    if (!proc.readLine(line)) {
        if (LfsCancel_Requested())
            throw RuntimeException(LFSEC_INTERRUPTED, "Interrupted");
        throw RuntimeException(LFSEC_GITFAILED,
                               proc.command() + " exited unexpectedly");
    }

    // "<sha> <type> <size>" or "<rev> missing"
    vector<string> fields = LfsStr_Split(line, ' ');
    if (fields.size() == 2 && fields[1] == "missing")
        return false;
    if (fields.size() != 3 || !LfsStr_ToUInt64(fields[2], len))
        throw RuntimeException(LFSEC_SCANFAILED,
                               "Unexpected cat-file output: " + line);

    sha = fields[0];
    type = fields[1];
    size = (int64_t)len;
    data.clear();

    if (withContents) {
        string nl;
        proc.readExact(len, data);
        proc.readExact(1, nl);
        if (nl != "\n")
            throw RuntimeException(LFSEC_SCANFAILED,
                                   "Unexpected cat-file output after " + sha);
    }

    return true;
}

void
CatFile::close()
{
    if (!running)
        return;

    running = false;
    proc.closeStdin();
    proc.wait();
}
