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

#include <string>
#include <vector>

#include <lfsutil/debug.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/systemexception.h>
#include <lfs/finding.h>
#include <lfs/lfsstorage.h>
#include <lfs/quarantine.h>

using namespace std;

Quarantine::Quarantine(const LfsStorage &storage)
    : storage(storage)
{
}

Quarantine::~Quarantine()
{
}

size_t
Quarantine::relocate(VerificationRun &run)
{
    vector<string> oids = run.getCorruptOids();
    string badDir = storage.quarantineDir();
    int status;

    run.print("objects: repair: moving corrupt objects to " + badDir);

    status = LfsFile_MkDirAll(badDir);
    if (status < 0)
        throw SystemException(-status, "mkdir(" + badDir + ")");

    for (size_t i = 0; i < oids.size(); i++) {
        string from = storage.objectPath(oids[i]);
        string to = LfsFile_Join(badDir, oids[i]);

        status = LfsFile_Rename(from, to);
        if (status < 0)
            throw SystemException(-status, "rename(" + from + ", " + to + ")");
        LOG("quarantined %s", oids[i].c_str());
    }

    return oids.size();
}
