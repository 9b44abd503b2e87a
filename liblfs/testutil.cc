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

#include <stdio.h>
#include <errno.h>
#include <ftw.h>

#include <string>
#include <vector>

#include <lfsutil/debug.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/lfscrypt.h>
#include <lfsutil/runtimeexception.h>
#include <lfsutil/systemexception.h>
#include <lfs/pointer.h>
#include <lfs/lfsstorage.h>
#include <lfs/scanner.h>

#include "testutil.h"

using namespace std;

string
TestUtil_WriteObject(const LfsStorage &storage, const string &content)
{
    string oid = LfsCrypt_HashString(content).hex();
    string path = storage.objectPath(oid);
    int status;

    status = LfsFile_MkDirAll(LfsFile_Dirname(path));
    if (status < 0)
        throw SystemException(-status, "mkdir(" + path + ")");
    if (!LfsFile_WriteFile(content, path))
        throw SystemException(errno, "write(" + path + ")");

    return oid;
}

static int
removeEntry(const char *path, const struct stat *sb, int flag,
            struct FTW *ftw)
{
    return remove(path);
}

void
TestUtil_RemoveTree(const string &path)
{
    if (!LfsFile_Exists(path))
        return;

    if (nftw(path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS) < 0)
        throw SystemException(errno, "nftw(" + path + ")");
}

size_t
TestUtil_Count(const string &text, const string &needle)
{
    size_t n = 0;
    size_t pos = text.find(needle);

    while (pos != text.npos) {
        n++;
        pos = text.find(needle, pos + needle.size());
    }

    return n;
}

WrappedPointer
TestUtil_Pointer(const string &name, const string &content, bool canonical)
{
    WrappedPointer p;

    p.name = name;
    p.oid = LfsCrypt_HashString(content).hex();
    p.size = content.size();
    p.blobOid = LfsCrypt_HashString(name).hex().substr(0, 40);
    p.canonical = canonical;

    return p;
}

ScanItem
TestUtil_Item(const WrappedPointer &p)
{
    ScanItem item;

    item.kind = ScanItem::POINTER;
    item.pointer = p;

    return item;
}

ScanItem
TestUtil_ErrorItem(const string &path, const string &treeOid)
{
    ScanItem item;

    item.kind = ScanItem::SCANERROR;
    item.error.path = path;
    item.error.treeOid = treeOid;

    return item;
}

VectorFeed::VectorFeed(const vector<ScanItem> &items, int failAt)
    : items(items), pos(0), failAt(failAt)
{
}

VectorFeed::~VectorFeed()
{
}

bool
VectorFeed::next(ScanItem &item)
{
    if (failAt >= 0 && pos == (size_t)failAt)
        throw RuntimeException(LFSEC_SCANFAILED, "scan failed");
    if (pos >= items.size())
        return false;

    item = items[pos++];
    return true;
}

VectorScanSource::VectorScanSource()
    : objectItems(), pointerItems(), objectFailAt(-1), objectFeeds(0),
      pointerFeeds(0)
{
}

VectorScanSource::~VectorScanSource()
{
}

PointerFeed::sp
VectorScanSource::objectFeed(const ScanRange &range)
{
    objectFeeds++;
    return PointerFeed::sp(new VectorFeed(objectItems, objectFailAt));
}

PointerFeed::sp
VectorScanSource::pointerFeed(const ScanRange &range)
{
    pointerFeeds++;
    return PointerFeed::sp(new VectorFeed(pointerItems));
}
