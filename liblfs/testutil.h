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

#ifndef __LFS_TESTUTIL_H__
#define __LFS_TESTUTIL_H__

#include <string>
#include <vector>

#include <lfs/lfsstorage.h>
#include <lfs/scanner.h>

/// Store content under its hash, returns the oid
std::string TestUtil_WriteObject(const LfsStorage &storage,
                                 const std::string &content);
void TestUtil_RemoveTree(const std::string &path);
size_t TestUtil_Count(const std::string &text, const std::string &needle);

WrappedPointer TestUtil_Pointer(const std::string &name,
                                const std::string &content,
                                bool canonical = true);
ScanItem TestUtil_Item(const WrappedPointer &p);
ScanItem TestUtil_ErrorItem(const std::string &path,
                            const std::string &treeOid);

/*
 * Feed over a fixed list.  If failAt is set, next() throws once that many
 * items were returned.
 */
class VectorFeed : public PointerFeed
{
public:
    VectorFeed(const std::vector<ScanItem> &items, int failAt = -1);
    virtual ~VectorFeed();
    virtual bool next(ScanItem &item);
private:
    std::vector<ScanItem> items;
    size_t pos;
    int failAt;
};

class VectorScanSource : public ScanSource
{
public:
    VectorScanSource();
    virtual ~VectorScanSource();
    virtual PointerFeed::sp objectFeed(const ScanRange &range);
    virtual PointerFeed::sp pointerFeed(const ScanRange &range);

    std::vector<ScanItem> objectItems;
    std::vector<ScanItem> pointerItems;
    int objectFailAt;
    int objectFeeds;
    int pointerFeeds;
};

#endif /* __LFS_TESTUTIL_H__ */
