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
#include <stdio.h>
#include <string.h>

#include <unistd.h>
#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>

#include <map>
#include <string>
#include <vector>
#include <sstream>
#include <iostream>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/lfscrypt.h>
#include <lfsutil/runtimeexception.h>
#include <lfsutil/systemexception.h>
#include <lfs/git.h>
#include <lfs/scanrange.h>
#include <lfs/scanner.h>
#include <lfs/lfsconfig.h>
#include <lfs/lfsstorage.h>
#include <lfs/finding.h>
#include <lfs/objectverifier.h>
#include <lfs/pointerchecker.h>
#include <lfs/quarantine.h>
#include <lfs/fsck.h>

#include "testutil.h"

using namespace std;

#define SHA_HEAD        "1111111111111111111111111111111111111111"
#define SHA_A           "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
#define SHA_B           "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"

class FakeRefResolver : public RefResolver
{
public:
    FakeRefResolver() {
        refs["HEAD"] = SHA_HEAD;
        refs["a"] = SHA_A;
        refs["b"] = SHA_B;
    }
    virtual ~FakeRefResolver() { }
    virtual string currentRef() {
        return SHA_HEAD;
    }
    virtual vector<string> resolveRefs(const vector<string> &exprs) {
        vector<string> rval;
        for (size_t i = 0; i < exprs.size(); i++) {
            map<string, string>::iterator it = refs.find(exprs[i]);
            if (it == refs.end())
                throw RuntimeException(LFSEC_BADREF, "bad ref " + exprs[i]);
            rval.push_back(it->second);
        }
        return rval;
    }
private:
    map<string, string> refs;
};

static ScanRange
resolve(const char *a0 = NULL, const char *a1 = NULL)
{
    FakeRefResolver resolver;
    vector<string> args;

    if (a0) args.push_back(a0);
    if (a1) args.push_back(a1);

    return ScanRange_Resolve(args, resolver);
}

static bool
resolveFails(LfsErrorCode code, const char *a0, const char *a1 = NULL)
{
    try {
        resolve(a0, a1);
    } catch (RuntimeException &e) {
        return e.getCode() == code;
    }
    return false;
}

int
ScanRange_selfTest(void)
{
    ScanRange r;

    cout << "Testing ScanRange ..." << endl;

    r = resolve();
    ASSERT(r.useIndex);
    ASSERT(r.start == "");
    ASSERT(r.end == SHA_HEAD);

    r = resolve("a..b");
    ASSERT(!r.useIndex);
    ASSERT(r.start == SHA_A);
    ASSERT(r.end == SHA_B);

    r = resolve("a");
    ASSERT(r.start == "");
    ASSERT(r.end == SHA_A);

    // A range with one side missing degenerates to a single endpoint
    r = resolve("a..");
    ASSERT(r.start == "");
    ASSERT(r.end == SHA_A);
    r = resolve("..b");
    ASSERT(r.start == "");
    ASSERT(r.end == SHA_B);

    ASSERT(resolveFails(LFSEC_INVALIDARGS, "a", "b"));
    ASSERT(resolveFails(LFSEC_BADREF, "nope"));
    ASSERT(resolveFails(LFSEC_BADREF, "a..nope"));
    ASSERT(resolveFails(LFSEC_BADREF, ".."));

    return 0;
}

/// The lock is a dangling symlink, so stat() cannot see it
static bool
lockHeld(const LfsStorage &storage)
{
    struct stat sb;
    string path = storage.getRootPath() + LFS_PATH_LOCK;

    return lstat(path.c_str(), &sb) == 0 && S_ISLNK(sb.st_mode);
}

int
LfsStorage_selfTest(void)
{
    string tmp = LfsUtil_MkTempDir("liblfs-test.");
    LfsStorage storage(tmp + "/lfs/");
    string oid = LfsCrypt_HashString("x").hex();

    cout << "Testing LfsStorage ..." << endl;

    ASSERT(storage.getRootPath() == tmp + "/lfs");
    ASSERT(storage.objectPath(oid) == tmp + "/lfs/objects/" +
           oid.substr(0, 2) + "/" + oid.substr(2, 2) + "/" + oid);
    ASSERT(storage.quarantineDir() == tmp + "/lfs/bad");
    ASSERT(storage.logPath() == tmp + "/lfs/logs/lfs.log");

    bool thrown = false;
    try {
        storage.objectPath("../../etc/passwd");
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_INVALIDARGS);
    }
    ASSERT(thrown);

    // No store yet, nothing to lock
    ASSERT(!storage.lock());

    ASSERT(LfsFile_MkDirAll(storage.getRootPath()) == 0);
    {
        LfsStorageLock::sp l = storage.lock();
        ASSERT(l);
        ASSERT(lockHeld(storage));

        thrown = false;
        try {
            storage.lock();
        } catch (RuntimeException &e) {
            thrown = (e.getCode() == LFSEC_LOCKED);
        }
        ASSERT(thrown);
    }

    ASSERT(!lockHeld(storage));

    // Released with the last reference
    LfsStorageLock::sp again = storage.lock();
    ASSERT(again);
    again.reset();

    TestUtil_RemoveTree(tmp);
    return 0;
}

int
LfsConfig_selfTest(void)
{
    string tmp = LfsUtil_MkTempDir("liblfs-test.");
    string ini = tmp + "/lfsconfig";
    LfsConfig config;

    cout << "Testing LfsConfig ..." << endl;

    config.setGitDir("/repo/.git");
    ASSERT(config.storageDir() == "/repo/.git/lfs");
    ASSERT(config.fsckJobs() == 1);
    ASSERT(config.fetchExclude().empty());

    ASSERT(LfsFile_WriteFile("[lfs]\n"
                             "    fetchexclude = media/*, *.psd\n"
                             "    storage = store\n"
                             "[LFS \"fsck\"]\n"
                             "    Jobs = 3\n", ini));
    config.loadFile(ini);
    ASSERT(config.has("lfs.fetchexclude"));
    ASSERT(config.fetchExclude().size() == 2);
    ASSERT(config.fetchExclude()[1] == "*.psd");
    ASSERT(config.fsckJobs() == 3);
    ASSERT(config.storageDir() == "/repo/.git/store");

    // git config wins
    vector<pair<string, string> > entries;
    entries.push_back(make_pair(string("lfs.fsck.jobs"), string("5")));
    entries.push_back(make_pair(string("lfs.storage"), string("/abs/lfs")));
    config.loadEntries(entries);
    ASSERT(config.fsckJobs() == 5);
    ASSERT(config.storageDir() == "/abs/lfs");

    config.set("lfs.fsck.jobs", "many");
    bool thrown = false;
    try {
        config.fsckJobs();
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_BADCONFIG);
    }
    ASSERT(thrown);

    ASSERT(LfsFile_WriteFile("[lfs\nstorage = x\n", ini));
    thrown = false;
    try {
        config.loadFile(ini);
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_BADCONFIG);
    }
    ASSERT(thrown);

    TestUtil_RemoveTree(tmp);
    return 0;
}

/*
 * Object verification is run sequentially and on a pool; the results must
 * not differ.
 */
static int
verifierTest(int jobs)
{
    string tmp = LfsUtil_MkTempDir("liblfs-test.");
    LfsStorage storage(tmp + "/lfs");
    vector<ScanItem> items;

    // Good
    TestUtil_WriteObject(storage, "good object");
    items.push_back(TestUtil_Item(TestUtil_Pointer("good.bin",
                                                   "good object")));

    // One flipped bit
    string flipped = "flipped object";
    WrappedPointer fp = TestUtil_Pointer("flip.bin", flipped);
    TestUtil_WriteObject(storage, flipped);
    flipped[3] ^= 0x01;
    ASSERT(LfsFile_WriteFile(flipped, storage.objectPath(fp.oid)));
    items.push_back(TestUtil_Item(fp));

    // Truncated
    string whole(100000, 'z');
    WrappedPointer tp = TestUtil_Pointer("trunc.bin", whole);
    TestUtil_WriteObject(storage, whole);
    ASSERT(truncate(storage.objectPath(tp.oid).c_str(), 50000) == 0);
    items.push_back(TestUtil_Item(tp));

    // Empty and absent is fine, absent otherwise is not
    items.push_back(TestUtil_Item(TestUtil_Pointer("empty.bin", "")));
    WrappedPointer mp = TestUtil_Pointer("missing.bin", "never stored");
    items.push_back(TestUtil_Item(mp));

    // The same corrupt object under a second name
    fp.name = "flip-copy.bin";
    items.push_back(TestUtil_Item(fp));

    // Many good objects to keep the workers busy
    for (int i = 0; i < 40; i++) {
        char name[32];
        snprintf(name, sizeof(name), "many-%d", i);
        TestUtil_WriteObject(storage, name);
        items.push_back(TestUtil_Item(TestUtil_Pointer(name, name)));
    }

    ostringstream out;
    VerificationRun run(out, false);
    ObjectVerifier verifier(storage, run, jobs);
    VectorFeed feed(items);
    verifier.verify(feed);

    vector<Finding> findings = run.getFindings();
    vector<string> corrupt = run.getCorruptOids();
    string text = out.str();

    ASSERT(!run.isOk());
    ASSERT(findings.size() == 4);
    ASSERT(corrupt.size() == 3);
    ASSERT(TestUtil_Count(text, "\n") == 4);
    ASSERT(TestUtil_Count(text, "objects: corruptObject: flip.bin (" +
                          fp.oid + ") is corrupt\n") == 1);
    ASSERT(TestUtil_Count(text, "objects: corruptObject: flip-copy.bin (" +
                          fp.oid + ") is corrupt\n") == 1);
    ASSERT(TestUtil_Count(text, "objects: corruptObject: trunc.bin (" +
                          tp.oid + ") is corrupt\n") == 1);
    ASSERT(TestUtil_Count(text, "objects: openError: missing.bin (" +
                          mp.oid + ") could not be checked: " +
                          strerror(ENOENT) + "\n") == 1);
    ASSERT(TestUtil_Count(text, "empty.bin") == 0);
    ASSERT(TestUtil_Count(text, "good.bin") == 0);

    for (size_t i = 0; i < findings.size(); i++) {
        ASSERT(findings[i].isObjectFinding());
        ASSERT(findings[i].blobOid == "");
        ASSERT(findings[i].treeOid == "");
    }

    // A read error is fatal
    WrappedPointer dp = TestUtil_Pointer("dir.bin", "a directory");
    ASSERT(LfsFile_MkDirAll(storage.objectPath(dp.oid)) == 0);
    items.push_back(TestUtil_Item(dp));

    ostringstream out2;
    VerificationRun run2(out2, false);
    ObjectVerifier verifier2(storage, run2, jobs);
    VectorFeed feed2(items);
    bool thrown = false;
    try {
        verifier2.verify(feed2);
    } catch (SystemException &e) {
        thrown = (e.getErrno() == EISDIR);
    }
    ASSERT(thrown);

    // So is a scan failure
    ostringstream out3;
    VerificationRun run3(out3, false);
    ObjectVerifier verifier3(storage, run3, jobs);
    VectorFeed feed3(items, 10);
    thrown = false;
    try {
        verifier3.verify(feed3);
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_SCANFAILED);
    }
    ASSERT(thrown);

    TestUtil_RemoveTree(tmp);
    return 0;
}

int
ObjectVerifier_selfTest(void)
{
    cout << "Testing ObjectVerifier ..." << endl;

    verifierTest(1);
    verifierTest(4);

    return 0;
}

int
PointerChecker_selfTest(void)
{
    vector<ScanItem> items;
    ostringstream out;
    VerificationRun run(out, true);
    PointerChecker checker(run);
    string treeOid = "0123456789012345678901234567890123456789";

    cout << "Testing PointerChecker ..." << endl;

    WrappedPointer good = TestUtil_Pointer("good.bin", "good");
    WrappedPointer bad = TestUtil_Pointer("bad.bin", "bad", false);
    items.push_back(TestUtil_Item(good));
    items.push_back(TestUtil_Item(bad));
    items.push_back(TestUtil_ErrorItem("data.bin", treeOid));

    VectorFeed feed(items);
    checker.check(feed);

    vector<Finding> findings = run.getFindings();
    ASSERT(findings.size() == 2);
    ASSERT(findings[0].kind == Finding::NonCanonicalPointer);
    ASSERT(findings[0].oid == bad.oid);
    ASSERT(findings[0].blobOid == bad.blobOid);
    ASSERT(findings[1].kind == Finding::UnexpectedGitObject);
    ASSERT(findings[1].treeOid == treeOid);
    ASSERT(findings[1].path == "data.bin");
    ASSERT(run.getCorruptOids().empty());

    ASSERT(out.str() ==
           "pointer: nonCanonicalPointer: Pointer for " + bad.oid +
           " (blob " + bad.blobOid + ") was not canonical\n"
           "pointer: unexpectedGitObject: \"data.bin\" (treeish " + treeOid +
           ") should have been a pointer but was not\n");

    // Canonicality is independent of whether the content exists
    Finding f;
    ASSERT(!PointerChecker::checkItem(TestUtil_Item(good), f));

    VectorFeed failing(items, 1);
    bool thrown = false;
    try {
        checker.check(failing);
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_SCANFAILED);
    }
    ASSERT(thrown);

    return 0;
}

int
Quarantine_selfTest(void)
{
    string tmp = LfsUtil_MkTempDir("liblfs-test.");
    LfsStorage storage(tmp + "/lfs");
    ostringstream out;
    VerificationRun run(out, false);

    cout << "Testing Quarantine ..." << endl;

    string a = TestUtil_WriteObject(storage, "object a");
    string b = TestUtil_WriteObject(storage, "object b");
    run.report(Finding::corruptObject("a.bin", a));
    run.report(Finding::corruptObject("b.bin", b));
    run.report(Finding::corruptObject("a2.bin", a));

    Quarantine q(storage);
    ASSERT(q.relocate(run) == 2);
    ASSERT(!LfsFile_Exists(storage.objectPath(a)));
    ASSERT(!LfsFile_Exists(storage.objectPath(b)));
    ASSERT(LfsFile_Exists(storage.quarantineDir() + "/" + a));
    ASSERT(LfsFile_Exists(storage.quarantineDir() + "/" + b));
    ASSERT(TestUtil_Count(out.str(),
                          "objects: repair: moving corrupt objects to " +
                          storage.quarantineDir() + "\n") == 1);

    // Moving an object that is already quarantined is an error
    bool thrown = false;
    try {
        q.relocate(run);
    } catch (SystemException &e) {
        thrown = (e.getErrno() == ENOENT);
    }
    ASSERT(thrown);

    // A plain file where the quarantine directory belongs
    string badDir = storage.quarantineDir();
    TestUtil_RemoveTree(badDir);
    ASSERT(LfsFile_WriteFile("not a directory", badDir));
    ostringstream out2;
    VerificationRun run2(out2, false);
    string c = TestUtil_WriteObject(storage, "object c");
    run2.report(Finding::corruptObject("c.bin", c));
    thrown = false;
    try {
        q.relocate(run2);
    } catch (SystemException &e) {
        thrown = (e.getErrno() == ENOTDIR);
    }
    ASSERT(thrown);
    ASSERT(LfsFile_Exists(storage.objectPath(c)));

    TestUtil_RemoveTree(tmp);
    return 0;
}

static int
runFsck(VectorScanSource &source, LfsStorage &storage, bool dryRun,
        bool objects, bool pointers, string &output)
{
    FsckOptions opts;
    ScanRange range;
    ostringstream out;

    opts.dryRun = dryRun;
    opts.objects = objects;
    opts.pointers = pointers;
    range.end = SHA_HEAD;

    int status = Fsck_Run(opts, range, source, storage, out);
    output = out.str();
    return status;
}

int
Fsck_selfTest(void)
{
    string tmp = LfsUtil_MkTempDir("liblfs-test.");
    LfsStorage storage(tmp + "/lfs");
    string output;

    cout << "Testing Fsck ..." << endl;

    WrappedPointer good = TestUtil_Pointer("good.bin", "fine");
    WrappedPointer bad = TestUtil_Pointer("bad.bin", "will break");
    TestUtil_WriteObject(storage, "fine");
    TestUtil_WriteObject(storage, "will break");
    string badPath = storage.objectPath(bad.oid);

    // Clean, twice
    {
        VectorScanSource source;
        source.objectItems.push_back(TestUtil_Item(good));
        source.pointerItems.push_back(TestUtil_Item(good));
        ASSERT(runFsck(source, storage, false, false, false, output) ==
               FSCK_EXIT_OK);
        ASSERT(output == "Git LFS fsck OK\n");
        ASSERT(source.objectFeeds == 1 && source.pointerFeeds == 1);
        ASSERT(runFsck(source, storage, false, false, false, output) ==
               FSCK_EXIT_OK);
        ASSERT(!LfsFile_Exists(storage.quarantineDir()));
        ASSERT(!lockHeld(storage));
    }

    // Truncate one object
    ASSERT(truncate(badPath.c_str(), 4) == 0);

    // Dry run reports but does not move
    {
        VectorScanSource source;
        source.objectItems.push_back(TestUtil_Item(good));
        source.objectItems.push_back(TestUtil_Item(bad));
        ASSERT(runFsck(source, storage, true, false, false, output) ==
               FSCK_EXIT_CORRUPT);
        ASSERT(TestUtil_Count(output, "corruptObject: bad.bin") == 1);
        ASSERT(TestUtil_Count(output, "Git LFS fsck OK") == 0);
        ASSERT(LfsFile_Exists(badPath));
        ASSERT(!LfsFile_Exists(storage.quarantineDir()));
    }

    // Pointer problems alone never move anything
    {
        VectorScanSource source;
        WrappedPointer nc = good;
        nc.canonical = false;
        source.objectItems.push_back(TestUtil_Item(good));
        source.pointerItems.push_back(TestUtil_Item(nc));
        ASSERT(runFsck(source, storage, false, false, false, output) ==
               FSCK_EXIT_CORRUPT);
        ASSERT(TestUtil_Count(output, "nonCanonicalPointer") == 1);
        ASSERT(TestUtil_Count(output, "repair") == 0);
        ASSERT(!LfsFile_Exists(storage.quarantineDir()));
    }

    // Only the requested pass runs
    {
        VectorScanSource source;
        source.objectItems.push_back(TestUtil_Item(bad));
        source.pointerItems.push_back(TestUtil_ErrorItem("data.bin", SHA_A));
        ASSERT(runFsck(source, storage, true, false, true, output) ==
               FSCK_EXIT_CORRUPT);
        ASSERT(source.objectFeeds == 0 && source.pointerFeeds == 1);
        ASSERT(TestUtil_Count(output, "unexpectedGitObject") == 1);
        ASSERT(TestUtil_Count(output, "corruptObject") == 0);

        VectorScanSource source2;
        source2.pointerItems.push_back(TestUtil_ErrorItem("data.bin", SHA_A));
        source2.objectItems.push_back(TestUtil_Item(good));
        ASSERT(runFsck(source2, storage, true, true, false, output) ==
               FSCK_EXIT_OK);
        ASSERT(source2.objectFeeds == 1 && source2.pointerFeeds == 0);
    }

    // A held lock stops a repairing run but not a dry run
    {
        VectorScanSource source;
        source.objectItems.push_back(TestUtil_Item(good));
        LfsStorageLock::sp held = storage.lock();
        bool thrown = false;
        try {
            runFsck(source, storage, false, false, false, output);
        } catch (RuntimeException &e) {
            thrown = (e.getCode() == LFSEC_LOCKED);
        }
        ASSERT(thrown);
        ASSERT(source.objectFeeds == 0);
        ASSERT(runFsck(source, storage, true, false, false, output) ==
               FSCK_EXIT_OK);
    }

    // A scan failure aborts before any repair
    {
        VectorScanSource source;
        source.objectItems.push_back(TestUtil_Item(bad));
        source.objectItems.push_back(TestUtil_Item(good));
        source.objectFailAt = 1;
        bool thrown = false;
        try {
            runFsck(source, storage, false, false, false, output);
        } catch (RuntimeException &e) {
            thrown = (e.getCode() == LFSEC_SCANFAILED);
        }
        ASSERT(thrown);
        ASSERT(LfsFile_Exists(badPath));
        ASSERT(!LfsFile_Exists(storage.quarantineDir()));
    }

    // Repair
    {
        VectorScanSource source;
        source.objectItems.push_back(TestUtil_Item(good));
        source.objectItems.push_back(TestUtil_Item(bad));
        source.pointerItems.push_back(TestUtil_Item(good));
        ASSERT(runFsck(source, storage, false, false, false, output) ==
               FSCK_EXIT_CORRUPT);
        ASSERT(TestUtil_Count(output, "objects: corruptObject: bad.bin (" +
                              bad.oid + ") is corrupt\n") == 1);
        ASSERT(TestUtil_Count(output,
                              "objects: repair: moving corrupt objects to " +
                              storage.quarantineDir() + "\n") == 1);
        ASSERT(!LfsFile_Exists(badPath));
        ASSERT(LfsFile_Exists(storage.quarantineDir() + "/" + bad.oid));
        ASSERT(LfsFile_Exists(storage.objectPath(good.oid)));
        ASSERT(!lockHeld(storage));

        // The moved object now reads as missing
        ASSERT(runFsck(source, storage, true, true, false, output) ==
               FSCK_EXIT_CORRUPT);
        ASSERT(TestUtil_Count(output, "openError: bad.bin") == 1);
    }

    TestUtil_RemoveTree(tmp);
    return 0;
}
