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

#ifndef __LFS_POINTERCHECKER_H__
#define __LFS_POINTERCHECKER_H__

#include <lfs/finding.h>
#include <lfs/scanner.h>

/*
 * Flags pointers that are not in canonical form and tree entries that
 * should have been pointers.  Object contents are not looked at.
 */
class PointerChecker
{
public:
    PointerChecker(VerificationRun &run);
    ~PointerChecker();
    void check(PointerFeed &feed);
    static bool checkItem(const ScanItem &item, Finding &finding);
private:
    VerificationRun &run;
};

#endif /* __LFS_POINTERCHECKER_H__ */
