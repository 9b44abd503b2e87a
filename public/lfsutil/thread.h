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
/*
 * Thread Include
 * Copyright (c) 2005-2007 Ali Mashtizadeh
 * All rights reserved.
 */

#ifndef __LFS_THREAD_H__
#define __LFS_THREAD_H__

#include <stdint.h>

#if defined(__APPLE__) || defined(__linux__) || defined(__FreeBSD__) \
    || defined(__NetBSD__)
#include <unistd.h>
#include <limits.h>
#include <pthread.h>
#else
#error "UNSUPPORTED OS"
#endif

#include <string>

enum ThreadState { NotStarted, Running, Finished };

class Thread
{
public:
    Thread();
    Thread(const std::string &name);
    virtual ~Thread();
    std::string getName();
    void setName(const std::string &name);
    void start();
    virtual void run() = 0;
    void join();
    ThreadState getState();
private:
    Thread(const Thread &);
    Thread &operator=(const Thread &);
    ThreadState cstate;
    std::string tname;
    pthread_t tid;
};

#endif /* __LFS_THREAD_H__ */
