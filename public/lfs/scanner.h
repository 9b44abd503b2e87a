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

#ifndef __LFS_SCANNER_H__
#define __LFS_SCANNER_H__

#include <stdint.h>

#include <string>
#include <vector>
#include <deque>
#include <set>
#include <tr1/memory>

#include <lfs/filepathfilter.h>
#include <lfs/scanrange.h>

/*
 * A pointer found in history together with where it was found.
 */
struct WrappedPointer
{
    WrappedPointer() : name(), blobOid(), oid(), size(0), canonical(true) { }
    std::string name;
    std::string blobOid;
    std::string oid;
    int64_t size;
    bool canonical;
};

/*
 * A tree entry that should have been a pointer but was not.
 */
struct PointerScanError
{
    std::string treeOid;
    std::string path;
};

struct ScanItem
{
    enum Kind { POINTER, SCANERROR };
    ScanItem() : kind(POINTER), pointer(), error() { }
    Kind kind;
    WrappedPointer pointer;
    PointerScanError error;
};

/*
 * A finite, non-restartable sequence of scan results.  Failures other than
 * PointerScanError are thrown from next().
 */
class PointerFeed
{
public:
    typedef std::tr1::shared_ptr<PointerFeed> sp;
    virtual ~PointerFeed() { }
    /// Returns false when the sequence is exhausted
    virtual bool next(ScanItem &item) = 0;
};

/*
 * Feeds drained one after the other.
 */
class ChainFeed : public PointerFeed
{
public:
    ChainFeed();
    virtual ~ChainFeed();
    void add(PointerFeed::sp feed);
    virtual bool next(ScanItem &item);
private:
    std::deque<PointerFeed::sp> feeds;
};

class GitScanner
{
public:
    GitScanner(const std::string &dir);
    GitScanner(const std::string &dir, const FilePathFilter &filter);
    ~GitScanner();

    PointerFeed::sp scanRef(const std::string &end);
    PointerFeed::sp scanRefRange(const std::string &start,
                                 const std::string &end);
    PointerFeed::sp scanIndex(const std::string &ref);
    PointerFeed::sp scanRefByTree(const std::string &end);
    PointerFeed::sp scanRefRangeByTree(const std::string &start,
                                       const std::string &end);
private:
    std::string dir;
    FilePathFilter filter;
};

/*
 * The two feeds an integrity check consumes.
 */
class ScanSource
{
public:
    virtual ~ScanSource() { }
    /// Pointers by blob over the range and, if requested, the index
    virtual PointerFeed::sp objectFeed(const ScanRange &range) = 0;
    /// Pointers and scan errors by tree over the range
    virtual PointerFeed::sp pointerFeed(const ScanRange &range) = 0;
};

class GitScanSource : public ScanSource
{
public:
    GitScanSource(const std::string &dir, const FilePathFilter &fetchFilter);
    virtual ~GitScanSource();
    virtual PointerFeed::sp objectFeed(const ScanRange &range);
    virtual PointerFeed::sp pointerFeed(const ScanRange &range);
private:
    std::string dir;
    FilePathFilter fetchFilter;
};

#endif /* __LFS_SCANNER_H__ */
