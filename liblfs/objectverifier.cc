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
#include <fcntl.h>
#include <errno.h>

#include <string>
#include <vector>
#include <deque>
#include <tr1/memory>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfscrypt.h>
#include <lfsutil/objecthash.h>
#include <lfsutil/mutex.h>
#include <lfsutil/thread.h>
#include <lfsutil/runtimeexception.h>
#include <lfsutil/systemexception.h>
#include <lfs/finding.h>
#include <lfs/lfsstorage.h>
#include <lfs/scanner.h>
#include <lfs/objectverifier.h>

#include "tuneables.h"

using namespace std;

ObjectVerifier::ObjectVerifier(const LfsStorage &storage, VerificationRun &run,
                               int jobs)
    : storage(storage), run(run), jobs(jobs)
{
    if (this->jobs < 1)
        this->jobs = 1;
    if (this->jobs > VERIFY_MAX_JOBS)
        this->jobs = VERIFY_MAX_JOBS;
}

ObjectVerifier::~ObjectVerifier()
{
}

bool
ObjectVerifier::checkObject(const WrappedPointer &p, Finding &finding) const
{
    string path = storage.objectPath(p.oid);
    ObjectHash hash;
    int fd;
    int status;

    DLOG("Examining %s (%s)", p.name.c_str(), path.c_str());

    fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        int err = errno;

        // Empty payloads have no object file
        if (err == ENOENT && p.size == 0)
            return false;

        finding = Finding::openError(p.name, p.oid, LfsUtil_SystemError(err));
        return true;
    }

    status = LfsCrypt_HashFd(fd, hash);
    close(fd);
    if (status < 0)
        throw SystemException(-status, "read(" + path + ")");

    if (hash.hex() == p.oid)
        return false;

    finding = Finding::corruptObject(p.name, p.oid);
    return true;
}

static void
unexpectedItem(const ScanItem &item)
{
    throw RuntimeException(LFSEC_SCANFAILED,
                           "Unexpected scan error for " + item.error.path);
}

void
ObjectVerifier::verifySequential(PointerFeed &feed)
{
    ScanItem item;
    Finding finding;

    while (feed.next(item)) {
        if (item.kind != ScanItem::POINTER)
            unexpectedItem(item);
        if (checkObject(item.pointer, finding))
            run.report(finding);
    }
}

/********************************************************************
 *
 *
 * Worker Pool
 *
 *
 ********************************************************************/

/*
 * Bounded queue between the scanning thread and the hashing workers.  The
 * first failure stops everyone; later failures are dropped since the run is
 * already being aborted with the first one.
 */
class VerifyQueue
{
public:
    VerifyQueue(size_t limit)
        : lock(), notEmpty(), notFull(), queue(), limit(limit),
          closed(false), failed(false), sysError(), rtError()
    {
    }
    /// Returns false if the pool has failed
    bool push(const WrappedPointer &p) {
        MutexLocker l(lock);
        while (queue.size() >= limit && !failed)
            notFull.wait(lock);
        if (failed)
            return false;
        queue.push_back(p);
        notEmpty.signal();
        return true;
    }
    /// Returns false when there is no more work
    bool pop(WrappedPointer &p) {
        MutexLocker l(lock);
        while (queue.empty() && !closed && !failed)
            notEmpty.wait(lock);
        if (failed || queue.empty())
            return false;
        p = queue.front();
        queue.pop_front();
        notFull.signal();
        return true;
    }
    void close() {
        MutexLocker l(lock);
        closed = true;
        notEmpty.broadcast();
    }
    void fail(const SystemException &e) {
        MutexLocker l(lock);
        if (!failed)
            sysError.reset(new SystemException(e));
        setFailed();
    }
    void fail(const RuntimeException &e) {
        MutexLocker l(lock);
        if (!failed)
            rtError.reset(new RuntimeException(e));
        setFailed();
    }
    bool hasFailed() {
        MutexLocker l(lock);
        return failed;
    }
    void rethrow() {
        MutexLocker l(lock);
        if (sysError)
            throw *sysError;
        if (rtError)
            throw *rtError;
    }
private:
    void setFailed() {
        failed = true;
        queue.clear();
        notEmpty.broadcast();
        notFull.broadcast();
    }

    Mutex lock;
    CondVar notEmpty;
    CondVar notFull;
    deque<WrappedPointer> queue;
    size_t limit;
    bool closed;
    bool failed;
    tr1::shared_ptr<SystemException> sysError;
    tr1::shared_ptr<RuntimeException> rtError;
};

class VerifyWorker : public Thread
{
public:
    VerifyWorker(const ObjectVerifier &verifier, VerificationRun &run,
                 VerifyQueue &queue)
        : Thread("verify"), verifier(verifier), vrun(run), queue(queue)
    {
    }
    virtual ~VerifyWorker() { }
    virtual void run() {
        WrappedPointer p;
        Finding finding;

        while (queue.pop(p)) {
            try {
                if (verifier.checkObject(p, finding) && !queue.hasFailed())
                    vrun.report(finding);
            } catch (SystemException &e) {
                queue.fail(e);
            } catch (RuntimeException &e) {
                queue.fail(e);
            } catch (std::exception &e) {
                queue.fail(RuntimeException(LFSEC_SCANFAILED, e.what()));
            }
        }
    }
private:
    const ObjectVerifier &verifier;
    VerificationRun &vrun;
    VerifyQueue &queue;
};

void
ObjectVerifier::verifyParallel(PointerFeed &feed)
{
    VerifyQueue queue(jobs * VERIFY_QUEUE_PER_JOB);
    vector<tr1::shared_ptr<VerifyWorker> > workers;
    ScanItem item;

    DLOG("verifying objects with %d workers", jobs);

    try {
        for (int i = 0; i < jobs; i++) {
            tr1::shared_ptr<VerifyWorker> w(new VerifyWorker(*this, run,
                                                             queue));
            w->start();
            workers.push_back(w);
        }

        while (feed.next(item)) {
            if (item.kind != ScanItem::POINTER)
                unexpectedItem(item);
            if (!queue.push(item.pointer))
                break;
        }
    } catch (SystemException &e) {
        queue.fail(e);
    } catch (RuntimeException &e) {
        queue.fail(e);
    } catch (std::exception &e) {
        queue.fail(RuntimeException(LFSEC_SCANFAILED, e.what()));
    }

    queue.close();
    for (size_t i = 0; i < workers.size(); i++)
        workers[i]->join();

    queue.rethrow();
}

void
ObjectVerifier::verify(PointerFeed &feed)
{
    if (jobs == 1)
        verifySequential(feed);
    else
        verifyParallel(feed);
}
