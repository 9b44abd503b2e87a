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
#include <ostream>

#include <lfsutil/debug.h>
#include <lfs/finding.h>
#include <lfs/lfsstorage.h>
#include <lfs/scanrange.h>
#include <lfs/scanner.h>
#include <lfs/objectverifier.h>
#include <lfs/pointerchecker.h>
#include <lfs/quarantine.h>
#include <lfs/fsck.h>

using namespace std;

int
Fsck_Run(const FsckOptions &opts, const ScanRange &range, ScanSource &source,
         LfsStorage &storage, ostream &out)
{
    bool objects = opts.objects;
    bool pointers = opts.pointers;
    LfsStorageLock::sp lock;

    if (!objects && !pointers) {
        objects = true;
        pointers = true;
    }

    // Dry runs never write, so they do not need the store to themselves
    if (!opts.dryRun)
        lock = storage.lock();

    VerificationRun run(out, opts.dryRun);

    if (objects) {
        PointerFeed::sp feed = source.objectFeed(range);
        ObjectVerifier verifier(storage, run, opts.jobs);
        verifier.verify(*feed);
    }

    if (pointers) {
        PointerFeed::sp feed = source.pointerFeed(range);
        PointerChecker checker(run);
        checker.check(*feed);
    }

    if (run.isOk()) {
        run.print("Git LFS fsck OK");
        return FSCK_EXIT_OK;
    }

    if (opts.dryRun || run.getCorruptOids().empty())
        return FSCK_EXIT_CORRUPT;

    Quarantine quarantine(storage);
    size_t moved = quarantine.relocate(run);
    LOG("fsck: moved %zu objects to %s", moved,
        storage.quarantineDir().c_str());

    return FSCK_EXIT_CORRUPT;
}
