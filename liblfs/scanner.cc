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

#include <stdint.h>

#include <string>
#include <vector>
#include <deque>
#include <set>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/runtimeexception.h>
#include <lfs/pointer.h>
#include <lfs/gitprocess.h>
#include <lfs/catfile.h>
#include <lfs/gitattr.h>
#include <lfs/scanner.h>

using namespace std;

static void
checkCancel()
{
    if (LfsCancel_Requested())
        throw RuntimeException(LFSEC_INTERRUPTED, "Interrupted");
}

static bool
decodeBlob(const string &data, const string &name, const string &sha,
           WrappedPointer &wp)
{
    Pointer p;
    bool canonical;

    if (!Pointer::decode(data, p, canonical))
        return false;

    wp.name = name;
    wp.blobOid = sha;
    wp.oid = p.oid;
    wp.size = p.size;
    wp.canonical = canonical;

    return true;
}

static bool
isNullSha(const string &sha)
{
    return sha.find_first_not_of('0') == sha.npos;
}

static vector<string>
revListArgs(bool objects, const string &start, const string &end)
{
    vector<string> args;

    args.push_back("rev-list");
    if (objects)
        args.push_back("--objects");
    args.push_back(end);
    if (!start.empty())
        args.push_back("^" + start);
    args.push_back("--");

    return args;
}

/*
 * Pointers reachable from a commit range, one per blob.
 */
class RevListFeed : public PointerFeed
{
public:
    RevListFeed(const string &dir, const string &start, const string &end,
                const FilePathFilter &filter)
        : dir(dir), revList(dir, revListArgs(true, start, end)),
          check(), batch(), filter(filter), started(false), done(false)
    {
    }
    virtual ~RevListFeed() { }
    virtual bool next(ScanItem &item) {
        string line;

        if (done)
            return false;
        if (!started) {
            revList.start();
            revList.closeStdin();
            check.reset(new CatFile(dir, false));
            batch.reset(new CatFile(dir, true));
            started = true;
        }

        while (1) {
            checkCancel();

            if (!revList.readLine(line)) {
                done = true;
                revList.wait();
                check->close();
                batch->close();
                return false;
            }

            // Commits have no name and the root tree an empty one
            size_t sp = line.find(' ');
            if (sp == line.npos)
                continue;
            string sha = line.substr(0, sp);
            string name = line.substr(sp + 1);
            if (name.empty() || !filter.allows(name))
                continue;

            string osha, type, data;
            int64_t size;
            if (!check->get(sha, osha, type, size, data))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Missing object " + sha);
            if (type != "blob" || size == 0 || size >= LFS_POINTER_MAXSIZE)
                continue;

            if (!batch->get(sha, osha, type, size, data))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Missing object " + sha);
            if (!decodeBlob(data, name, sha, item.pointer))
                continue;

            item.kind = ScanItem::POINTER;
            return true;
        }
    }
private:
    string dir;
    GitProcess revList;
    CatFile::sp check;
    CatFile::sp batch;
    FilePathFilter filter;
    bool started;
    bool done;
};

static vector<string>
diffIndexArgs(const string &ref)
{
    vector<string> args;

    args.push_back("diff-index");
    args.push_back("-z");
    args.push_back("--cached");
    args.push_back("--no-renames");
    args.push_back("--ignore-submodules");
    args.push_back(ref);
    args.push_back("--");

    return args;
}

/*
 * Pointers staged in the index that differ from a ref.
 */
class IndexFeed : public PointerFeed
{
public:
    IndexFeed(const string &dir, const string &ref,
              const FilePathFilter &filter)
        : dir(dir), diffIndex(dir, diffIndexArgs(ref)), batch(),
          filter(filter), started(false), done(false)
    {
    }
    virtual ~IndexFeed() { }
    virtual bool next(ScanItem &item) {
        string header, path;

        if (done)
            return false;
        if (!started) {
            diffIndex.start();
            diffIndex.closeStdin();
            batch.reset(new CatFile(dir, true));
            started = true;
        }

        while (1) {
            checkCancel();

            if (!diffIndex.readLine(header, '\0')) {
                done = true;
                diffIndex.wait();
                batch->close();
                return false;
            }
            if (!diffIndex.readLine(path, '\0'))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Truncated diff-index output");

            // ":<srcmode> <dstmode> <srcsha> <dstsha> <status>"
            vector<string> fields = LfsStr_Split(header, ' ');
            if (fields.size() != 5 || !LfsStr_StartsWith(fields[0], ":"))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Unexpected diff-index output: " +
                                       header);

            const string &dstMode = fields[1];
            const string &dstSha = fields[3];
            if (isNullSha(dstSha) || fields[4] == "D" ||
                dstMode == "160000")
                continue;
            if (!filter.allows(path))
                continue;

            string osha, type, data;
            int64_t size;
            if (!batch->get(dstSha, osha, type, size, data))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Missing object " + dstSha);
            if (type != "blob" || size == 0 || size >= LFS_POINTER_MAXSIZE)
                continue;
            if (!decodeBlob(data, path, dstSha, item.pointer))
                continue;

            item.kind = ScanItem::POINTER;
            return true;
        }
    }
private:
    string dir;
    GitProcess diffIndex;
    CatFile::sp batch;
    FilePathFilter filter;
    bool started;
    bool done;
};

struct TreeEntry
{
    string mode;
    string type;
    string sha;
    int64_t size;
    string path;
};

static vector<string>
lsTreeArgs(const string &commit)
{
    vector<string> args;

    args.push_back("ls-tree");
    args.push_back("-r");
    args.push_back("-l");
    args.push_back("-z");
    args.push_back("--full-tree");
    args.push_back(commit);

    return args;
}

/*
 * Every pointer and every should-have-been-a-pointer entry in the trees of
 * a commit range.  Each (object, path) pair is reported once.
 */
class TreeFeed : public PointerFeed
{
public:
    TreeFeed(const string &dir, const string &start, const string &end,
             const FilePathFilter &filter)
        : dir(dir), revList(dir, revListArgs(false, start, end)), batch(),
          filter(filter), pending(), seen(), started(false), done(false)
    {
    }
    virtual ~TreeFeed() { }
    virtual bool next(ScanItem &item) {
        string commit;

        if (!started) {
            revList.start();
            revList.closeStdin();
            batch.reset(new CatFile(dir, true));
            started = true;
        }

        while (pending.empty()) {
            if (done)
                return false;

            checkCancel();

            if (!revList.readLine(commit)) {
                done = true;
                revList.wait();
                batch->close();
                return false;
            }

            scanCommit(LfsStr_Trim(commit));
        }

        item = pending.front();
        pending.pop_front();
        return true;
    }
private:
    void listTree(const string &commit, vector<TreeEntry> &entries) {
        GitProcess lsTree(dir, lsTreeArgs(commit));
        string rec;

        lsTree.start();
        lsTree.closeStdin();
        while (lsTree.readLine(rec, '\0')) {
            // "<mode> <type> <sha> <size>\t<path>", size is padded
            string meta, path;
            if (!LfsStr_SplitFirst(rec, "\t", meta, path))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Unexpected ls-tree output: " + rec);

            vector<string> raw = LfsStr_Split(meta, ' ');
            vector<string> fields;
            for (size_t i = 0; i < raw.size(); i++) {
                if (!raw[i].empty())
                    fields.push_back(raw[i]);
            }
            if (fields.size() != 4)
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Unexpected ls-tree output: " + rec);

            TreeEntry e;
            uint64_t size;
            e.mode = fields[0];
            e.type = fields[1];
            e.sha = fields[2];
            e.size = LfsStr_ToUInt64(fields[3], size) ? (int64_t)size : -1;
            e.path = path;
            entries.push_back(e);
        }
        lsTree.wait();
    }
    void scanCommit(const string &commit) {
        vector<TreeEntry> entries;
        GitAttr attr;
        string osha, type, data;
        int64_t size;

        DLOG("scanning tree of %s", commit.c_str());
        listTree(commit, entries);

        for (size_t i = 0; i < entries.size(); i++) {
            const TreeEntry &e = entries[i];
            if (e.type != "blob" ||
                LfsFile_Basename(e.path) != ".gitattributes")
                continue;
            if (!batch->get(e.sha, osha, type, size, data))
                throw RuntimeException(LFSEC_SCANFAILED,
                                       "Missing object " + e.sha);
            attr.addFile(LfsFile_Dirname(e.path), data);
        }

        for (size_t i = 0; i < entries.size(); i++) {
            const TreeEntry &e = entries[i];

            if (!filter.allows(e.path))
                continue;
            if (!seen.insert(e.sha + '\0' + e.path).second)
                continue;

            bool lfsPath = attr.isLfsPath(e.path);
            ScanItem item;

            if (e.type == "blob" && e.size > 0 &&
                e.size < LFS_POINTER_MAXSIZE) {
                if (!batch->get(e.sha, osha, type, size, data))
                    throw RuntimeException(LFSEC_SCANFAILED,
                                           "Missing object " + e.sha);
                if (decodeBlob(data, e.path, e.sha, item.pointer)) {
                    item.kind = ScanItem::POINTER;
                    pending.push_back(item);
                    continue;
                }
            }

            // Empty files are never converted to pointers
            if (e.type == "blob" && e.size == 0)
                continue;

            if (lfsPath) {
                item.kind = ScanItem::SCANERROR;
                item.error.treeOid = e.sha;
                item.error.path = e.path;
                pending.push_back(item);
            }
        }
    }

    string dir;
    GitProcess revList;
    CatFile::sp batch;
    FilePathFilter filter;
    deque<ScanItem> pending;
    set<string> seen;
    bool started;
    bool done;
};

ChainFeed::ChainFeed()
    : feeds()
{
}

ChainFeed::~ChainFeed()
{
}

void
ChainFeed::add(PointerFeed::sp feed)
{
    feeds.push_back(feed);
}

bool
ChainFeed::next(ScanItem &item)
{
    while (!feeds.empty()) {
        if (feeds.front()->next(item))
            return true;
        feeds.pop_front();
    }

    return false;
}

GitScanner::GitScanner(const string &dir)
    : dir(dir), filter()
{
}

GitScanner::GitScanner(const string &dir, const FilePathFilter &filter)
    : dir(dir), filter(filter)
{
}

GitScanner::~GitScanner()
{
}

PointerFeed::sp
GitScanner::scanRef(const string &end)
{
    return scanRefRange("", end);
}

PointerFeed::sp
GitScanner::scanRefRange(const string &start, const string &end)
{
    return PointerFeed::sp(new RevListFeed(dir, start, end, filter));
}

PointerFeed::sp
GitScanner::scanIndex(const string &ref)
{
    return PointerFeed::sp(new IndexFeed(dir, ref, filter));
}

PointerFeed::sp
GitScanner::scanRefByTree(const string &end)
{
    return scanRefRangeByTree("", end);
}

PointerFeed::sp
GitScanner::scanRefRangeByTree(const string &start, const string &end)
{
    return PointerFeed::sp(new TreeFeed(dir, start, end, filter));
}

GitScanSource::GitScanSource(const string &dir,
                             const FilePathFilter &fetchFilter)
    : dir(dir), fetchFilter(fetchFilter)
{
}

GitScanSource::~GitScanSource()
{
}

PointerFeed::sp
GitScanSource::objectFeed(const ScanRange &range)
{
    GitScanner scanner(dir, fetchFilter);
    ChainFeed *chain = new ChainFeed();
    PointerFeed::sp rval(chain);

    if (range.start.empty())
        chain->add(scanner.scanRef(range.end));
    else
        chain->add(scanner.scanRefRange(range.start, range.end));

    if (range.useIndex)
        chain->add(scanner.scanIndex(range.end));

    return rval;
}

PointerFeed::sp
GitScanSource::pointerFeed(const ScanRange &range)
{
    GitScanner scanner(dir);

    if (range.start.empty())
        return scanner.scanRefByTree(range.end);

    return scanner.scanRefRangeByTree(range.start, range.end);
}
