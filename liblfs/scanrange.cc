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
#include <lfsutil/lfsstr.h>
#include <lfsutil/runtimeexception.h>
#include <lfs/git.h>
#include <lfs/scanrange.h>

using namespace std;

ScanRange
ScanRange_Resolve(const vector<string> &args, RefResolver &resolver)
{
    ScanRange range;

    if (args.size() > 1)
        throw RuntimeException(LFSEC_INVALIDARGS,
                               "Expected at most one ref argument");

    if (args.size() == 0) {
        range.useIndex = true;
        range.end = resolver.currentRef();
        DLOG("fsck: scanning %s and the index", range.end.c_str());
        return range;
    }

    string before, after;
    vector<string> exprs;
    if (LfsStr_SplitFirst(args[0], "..", before, after)) {
        if (!before.empty())
            exprs.push_back(before);
        if (!after.empty())
            exprs.push_back(after);
        if (exprs.empty())
            throw RuntimeException(LFSEC_BADREF,
                                   "Invalid ref argument: " + args[0]);
    } else {
        exprs.push_back(args[0]);
    }

    vector<string> refs = resolver.resolveRefs(exprs);
    if (refs.size() != exprs.size())
        throw RuntimeException(LFSEC_BADREF,
                               "Could not resolve " + args[0]);

    if (refs.size() == 2) {
        range.start = refs[0];
        range.end = refs[1];
    } else {
        range.end = refs[0];
    }

    DLOG("fsck: scanning %s..%s", range.start.c_str(), range.end.c_str());
    return range;
}
