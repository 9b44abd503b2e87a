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

#include <lfsutil/debug.h>
#include <lfs/finding.h>
#include <lfs/scanner.h>
#include <lfs/pointerchecker.h>

using namespace std;

PointerChecker::PointerChecker(VerificationRun &run)
    : run(run)
{
}

PointerChecker::~PointerChecker()
{
}

bool
PointerChecker::checkItem(const ScanItem &item, Finding &finding)
{
    if (item.kind == ScanItem::SCANERROR) {
        finding = Finding::unexpectedGitObject(item.error.path,
                                               item.error.treeOid);
        return true;
    }

    DLOG("Examining %s (%s)", item.pointer.oid.c_str(),
         item.pointer.name.c_str());
    if (!item.pointer.canonical) {
        finding = Finding::nonCanonicalPointer(item.pointer.oid,
                                               item.pointer.blobOid);
        return true;
    }

    return false;
}

void
PointerChecker::check(PointerFeed &feed)
{
    ScanItem item;
    Finding finding;

    while (feed.next(item)) {
        if (checkItem(item, finding))
            run.report(finding);
    }
}
