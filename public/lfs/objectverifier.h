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

#ifndef __LFS_OBJECTVERIFIER_H__
#define __LFS_OBJECTVERIFIER_H__

#include <string>

#include <lfs/finding.h>
#include <lfs/lfsstorage.h>
#include <lfs/scanner.h>

/*
 * Recomputes the content hash of every stored object a feed names.
 */
class ObjectVerifier
{
public:
    ObjectVerifier(const LfsStorage &storage, VerificationRun &run,
                   int jobs = 1);
    ~ObjectVerifier();

    /*
     * Drain the feed, reporting each finding to the run as it is found.
     * With more than one job objects are hashed on a worker pool.  A read
     * error or scan failure is rethrown once after all workers stopped.
     */
    void verify(PointerFeed &feed);

    /*
     * Check one object.  Returns true and fills finding if it is missing
     * or corrupt.  Throws SystemException if it cannot be read.
     */
    bool checkObject(const WrappedPointer &p, Finding &finding) const;
private:
    void verifySequential(PointerFeed &feed);
    void verifyParallel(PointerFeed &feed);

    const LfsStorage &storage;
    VerificationRun &run;
    int jobs;
};

#endif /* __LFS_OBJECTVERIFIER_H__ */
