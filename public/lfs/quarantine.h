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

#ifndef __LFS_QUARANTINE_H__
#define __LFS_QUARANTINE_H__

#include <string>
#include <vector>

#include <lfs/finding.h>
#include <lfs/lfsstorage.h>

class Quarantine
{
public:
    Quarantine(const LfsStorage &storage);
    ~Quarantine();
    /*
     * Move every corrupt object of the run into the quarantine directory.
     * The first failure throws SystemException and stops the repair.
     * Returns the number of objects moved.
     */
    size_t relocate(VerificationRun &run);
private:
    const LfsStorage &storage;
};

#endif /* __LFS_QUARANTINE_H__ */
