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
#include <stdlib.h>

#include <unistd.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <string>
#include <vector>
#include <sstream>
#include <iostream>
#include <exception>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/lfscrypt.h>
#include <lfsutil/runtimeexception.h>
#include <lfs/pointer.h>
#include <lfs/gitprocess.h>
#include <lfs/git.h>
#include <lfs/scanrange.h>
#include <lfs/scanner.h>
#include <lfs/lfsconfig.h>
#include <lfs/lfsstorage.h>
#include <lfs/fsck.h>

#include "testutil.h"

using namespace std;

static string
git(const string &dir, const string &cmdline)
{
    return LfsStr_Trim(GitProcess::run(dir, LfsStr_Split(cmdline, ' ')));
}

static void
commit(const string &dir, const string &msg)
{
    git(dir, "add -A");
    git(dir, "-c user.name=Tester -c user.email=tester@example.com "
             "-c commit.gpgsign=false commit -q -m " + msg);
}

static string
pointerFor(const string &content)
{
    Pointer p(LfsCrypt_HashString(content).hex(), content.size());
    return p.encode();
}

static void
writeFile(const string &dir, const string &path, const string &blob)
{
    ASSERT(LfsFile_WriteFile(blob, LfsFile_Join(dir, path)));
}

static vector<ScanItem>
drain(PointerFeed::sp feed)
{
    vector<ScanItem> rval;
    ScanItem item;

    while (feed->next(item))
        rval.push_back(item);

    return rval;
}

static const ScanItem *
findItem(const vector<ScanItem> &items, const string &path)
{
    for (size_t i = 0; i < items.size(); i++) {
        const string &name = items[i].kind == ScanItem::POINTER
                ? items[i].pointer.name : items[i].error.path;
        if (name == path)
            return &items[i];
    }

    return NULL;
}

static size_t
countKind(const vector<ScanItem> &items, ScanItem::Kind kind)
{
    size_t n = 0;

    for (size_t i = 0; i < items.size(); i++) {
        if (items[i].kind == kind)
            n++;
    }

    return n;
}

/*
 * Run a default fsck (both passes, HEAD and the index) over dir in a child
 * process.  Returns its exit status, or -1 if it did not finish in time.
 */
static int
fsckWithDeadline(const string &dir, const string &storageDir, int seconds)
{
    pid_t pid;

    cout.flush();
    pid = fork();
    ASSERT(pid >= 0);
    if (pid == 0) {
        int rval;
        try {
            GitRefResolver resolver(dir);
            ScanRange range = ScanRange_Resolve(vector<string>(), resolver);
            GitScanSource source(dir, FilePathFilter());
            LfsStorage storage(storageDir);
            FsckOptions opts;
            ostringstream out;

            opts.dryRun = true;
            rval = Fsck_Run(opts, range, source, storage, out);
        } catch (std::exception &e) {
            cerr << "fsck failed: " << e.what() << endl;
            rval = FSCK_EXIT_FATAL;
        }
        _exit(rval);
    }

    for (int i = 0; i < seconds * 10; i++) {
        int status;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid)
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        ASSERT(r == 0);
        usleep(100000);
    }

    kill(pid, SIGKILL);
    waitpid(pid, NULL, 0);
    return -1;
}

static LfsErrorCode
waitError(const string &dir, const vector<string> &args)
{
    GitProcess proc(dir, args);

    proc.start();
    proc.closeStdin();
    try {
        proc.wait();
    } catch (RuntimeException &e) {
        return e.getCode();
    }

    ASSERT(false);
    return LFSEC_INVALIDARGS;
}

/*
 * Scans a scratch repository holding:
 *   a.bin        canonical pointer
 *   b.bin        pointer with CRLF line endings
 *   data.bin     raw content at a path that should be a pointer
 *   empty.bin    empty file at a pointer path
 *   media/c.bin  canonical pointer
 *   readme.txt   ordinary file
 */
int
GitScanner_selfTest(void)
{
    cout << "Testing GitScanner ..." << endl;

    if (!Git_IsAvailable()) {
        cout << "git not found, skipping" << endl;
        return 0;
    }

    // Keep the user's filters and hooks out of the scratch repository
    setenv("GIT_CONFIG_GLOBAL", "/dev/null", 1);
    setenv("GIT_CONFIG_NOSYSTEM", "1", 1);

    string tmp = LfsUtil_MkTempDir("liblfs-git.");
    git(tmp, "init -q");

    string bLf = pointerFor("bbb");
    string bCrlf;
    for (size_t i = 0; i < bLf.size(); i++) {
        if (bLf[i] == '\n')
            bCrlf += '\r';
        bCrlf += bLf[i];
    }

    writeFile(tmp, ".gitattributes",
              "*.bin filter=lfs diff=lfs merge=lfs -text\n");
    writeFile(tmp, "a.bin", pointerFor("aaa"));
    writeFile(tmp, "b.bin", bCrlf);
    writeFile(tmp, "data.bin", "raw content that was never cleaned\n");
    writeFile(tmp, "empty.bin", "");
    writeFile(tmp, "readme.txt", "hello\n");
    ASSERT(LfsFile_MkDir(tmp + "/media") == 0);
    writeFile(tmp, "media/c.bin", pointerFor("ccc"));
    commit(tmp, "first");
    string c1 = git(tmp, "rev-parse HEAD");

    // Co-processes must not keep each other's pipes open, or draining one
    // waits forever.  The store is empty, so a.bin cannot be opened.
    ASSERT(fsckWithDeadline(tmp, tmp + "/.git/lfs", 60) ==
           FSCK_EXIT_CORRUPT);

    // A git failure during an interrupted run is the interruption
    vector<string> badRef = LfsStr_Split("rev-parse --verify -q nope", ' ');
    ASSERT(waitError(tmp, badRef) == LFSEC_GITFAILED);
    LfsCancel_Request();
    LfsErrorCode code = waitError(tmp, badRef);
    LfsCancel_Reset();
    ASSERT(code == LFSEC_INTERRUPTED);

    // By blob
    vector<ScanItem> items = drain(GitScanner(tmp).scanRef(c1));
    ASSERT(items.size() == 3);
    ASSERT(countKind(items, ScanItem::SCANERROR) == 0);
    const ScanItem *a = findItem(items, "a.bin");
    ASSERT(a != NULL);
    ASSERT(a->pointer.oid == LfsCrypt_HashString("aaa").hex());
    ASSERT(a->pointer.size == 3);
    ASSERT(a->pointer.canonical);
    ASSERT(a->pointer.blobOid == git(tmp, "rev-parse HEAD:a.bin"));
    const ScanItem *b = findItem(items, "b.bin");
    ASSERT(b != NULL);
    ASSERT(!b->pointer.canonical);
    ASSERT(findItem(items, "media/c.bin") != NULL);

    vector<string> exclude;
    exclude.push_back("media");
    FilePathFilter noMedia(vector<string>(), exclude);
    items = drain(GitScanner(tmp, noMedia).scanRef(c1));
    ASSERT(items.size() == 2);
    ASSERT(findItem(items, "media/c.bin") == NULL);

    // By tree
    items = drain(GitScanner(tmp).scanRefByTree(c1));
    ASSERT(items.size() == 4);
    ASSERT(countKind(items, ScanItem::SCANERROR) == 1);
    const ScanItem *d = findItem(items, "data.bin");
    ASSERT(d != NULL);
    ASSERT(d->kind == ScanItem::SCANERROR);
    ASSERT(d->error.treeOid == git(tmp, "rev-parse HEAD:data.bin"));
    ASSERT(findItem(items, "empty.bin") == NULL);
    ASSERT(findItem(items, "readme.txt") == NULL);

    // Second commit changes a.bin and adds d.bin
    writeFile(tmp, "a.bin", pointerFor("aaa2"));
    writeFile(tmp, "d.bin", pointerFor("ddd"));
    commit(tmp, "second");
    string c2 = git(tmp, "rev-parse HEAD");

    items = drain(GitScanner(tmp).scanRefRange(c1, c2));
    ASSERT(items.size() == 2);
    ASSERT(findItem(items, "a.bin") != NULL);
    ASSERT(findItem(items, "a.bin")->pointer.oid ==
           LfsCrypt_HashString("aaa2").hex());
    ASSERT(findItem(items, "d.bin") != NULL);

    items = drain(GitScanner(tmp).scanRefRangeByTree(c1, c2));
    ASSERT(items.size() == 5);
    ASSERT(countKind(items, ScanItem::POINTER) == 4);

    // Both commits, an unchanged entry is reported once
    items = drain(GitScanner(tmp).scanRefByTree(c2));
    ASSERT(items.size() == 6);
    ASSERT(countKind(items, ScanItem::SCANERROR) == 1);

    // Staged but not committed
    writeFile(tmp, "e.bin", pointerFor("eee"));
    git(tmp, "add e.bin");
    items = drain(GitScanner(tmp).scanIndex(c2));
    ASSERT(items.size() == 1);
    ASSERT(items[0].pointer.name == "e.bin");
    ASSERT(items[0].pointer.oid == LfsCrypt_HashString("eee").hex());

    // Ref resolution
    GitRefResolver resolver(tmp);
    ASSERT(resolver.currentRef() == c2);
    vector<string> args;
    args.push_back(c1.substr(0, 12) + "..HEAD");
    ScanRange range = ScanRange_Resolve(args, resolver);
    ASSERT(range.start == c1);
    ASSERT(range.end == c2);
    ASSERT(!range.useIndex);
    args.clear();
    args.push_back("no-such-branch");
    bool thrown = false;
    try {
        ScanRange_Resolve(args, resolver);
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_BADREF);
    }
    ASSERT(thrown);

    // Configuration from the work tree and git
    writeFile(tmp, ".lfsconfig", "[lfs]\n\tfetchexclude = media\n");
    LfsConfig config;
    config.load(tmp);
    ASSERT(config.getGitDir() == Git_GitDir(tmp));
    ASSERT(config.getWorkTree() == LfsFile_RealPath(tmp));
    ASSERT(config.fetchExclude().size() == 1);
    ASSERT(config.fetchExclude()[0] == "media");
    ASSERT(config.storageDir() == config.getGitDir() + "/lfs");

    // End to end over the real scanner
    LfsStorage storage(config.storageDir());
    const char *contents[] = { "aaa", "aaa2", "bbb", "ccc", "ddd", "eee" };
    for (size_t i = 0; i < sizeof(contents) / sizeof(contents[0]); i++)
        TestUtil_WriteObject(storage, contents[i]);

    args.clear();
    range = ScanRange_Resolve(args, resolver);
    ASSERT(range.useIndex);

    FsckOptions opts;
    ostringstream out;
    GitScanSource everything(tmp, FilePathFilter());
    opts.dryRun = true;
    ASSERT(Fsck_Run(opts, range, everything, storage, out) ==
           FSCK_EXIT_CORRUPT);
    ASSERT(TestUtil_Count(out.str(), "\n") == 2);
    ASSERT(TestUtil_Count(out.str(), "pointer: nonCanonicalPointer: "
                          "Pointer for " + LfsCrypt_HashString("bbb").hex()) ==
           1);
    ASSERT(TestUtil_Count(out.str(), "pointer: unexpectedGitObject: "
                          "\"data.bin\"") == 1);

    string cOid = LfsCrypt_HashString("ccc").hex();
    ASSERT(LfsFile_WriteFile("cxc", storage.objectPath(cOid)));

    // Excluded paths are not verified
    ostringstream out2;
    GitScanSource filtered(tmp, FilePathFilter(vector<string>(),
                                               config.fetchExclude()));
    opts.dryRun = false;
    opts.objects = true;
    ASSERT(Fsck_Run(opts, range, filtered, storage, out2) == FSCK_EXIT_OK);

    ostringstream out3;
    ASSERT(Fsck_Run(opts, range, everything, storage, out3) ==
           FSCK_EXIT_CORRUPT);
    ASSERT(TestUtil_Count(out3.str(), "objects: corruptObject: media/c.bin (" +
                          cOid + ") is corrupt") == 1);
    ASSERT(LfsFile_Exists(storage.quarantineDir() + "/" + cOid));
    ASSERT(!LfsFile_Exists(storage.objectPath(cOid)));

    // Cancellation stops a scan between items
    PointerFeed::sp feed = GitScanner(tmp).scanRefByTree(c2);
    LfsCancel_Request();
    thrown = false;
    try {
        drain(feed);
    } catch (RuntimeException &e) {
        thrown = (e.getCode() == LFSEC_INTERRUPTED);
    }
    LfsCancel_Reset();
    ASSERT(thrown);

    TestUtil_RemoveTree(tmp);
    return 0;
}
