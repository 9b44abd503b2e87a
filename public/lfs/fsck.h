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

#ifndef __LFS_FSCK_H__
#define __LFS_FSCK_H__

#include <ostream>

#include <lfs/lfsstorage.h>
#include <lfs/scanrange.h>
#include <lfs/scanner.h>

#define FSCK_EXIT_OK            0
#define FSCK_EXIT_CORRUPT       1
#define FSCK_EXIT_FATAL         2

struct FsckOptions
{
    FsckOptions() : dryRun(false), objects(false), pointers(false), jobs(1) { }
    bool dryRun;
    bool objects;
    bool pointers;
    int jobs;
};

/*
 * Check the store and the pointers in range.  Returns FSCK_EXIT_OK or
 * FSCK_EXIT_CORRUPT; fatal errors are thrown.
 */
int Fsck_Run(const FsckOptions &opts, const ScanRange &range,
             ScanSource &source, LfsStorage &storage, std::ostream &out);

#endif /* __LFS_FSCK_H__ */
