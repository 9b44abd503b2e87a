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

#ifndef __LFS_MUTEX_H__
#define __LFS_MUTEX_H__

#if defined(__APPLE__) || defined(__linux__) || defined(__FreeBSD__) \
    || defined(__NetBSD__)
#include <pthread.h>
#else
#error "UNSUPPORTED OS"
#endif

class CondVar;

class Mutex
{
public:
    Mutex();
    virtual ~Mutex();
    void lock();
    void unlock();
    bool tryLock();
private:
    Mutex(const Mutex &);
    Mutex &operator=(const Mutex &);
    pthread_mutex_t lockHandle;
    friend class CondVar;
};

/*
 * Holds a Mutex for the lifetime of the scope.
 */
class MutexLocker
{
public:
    explicit MutexLocker(Mutex &m) : m(m) { m.lock(); }
    ~MutexLocker() { m.unlock(); }
private:
    MutexLocker(const MutexLocker &);
    MutexLocker &operator=(const MutexLocker &);
    Mutex &m;
};

/*
 * Condition variable bound to a Mutex held by the caller.
 */
class CondVar
{
public:
    CondVar();
    ~CondVar();
    void wait(Mutex &m);
    void signal();
    void broadcast();
private:
    CondVar(const CondVar &);
    CondVar &operator=(const CondVar &);
    pthread_cond_t condHandle;
};

#endif /* __LFS_MUTEX_H__ */

