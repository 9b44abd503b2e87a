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
 * Thread Class
 * Copyright (c) 2005-2008 Ali Mashtizadeh
 * All rights reserved.
 */

#include <stdint.h>

#include <limits.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/types.h>

#include <string>

#include <lfsutil/debug.h>
#include <lfsutil/thread.h>
#include <lfsutil/systemexception.h>

using namespace std;

static void *EntryWrapper(void *arg);

Thread::Thread()
{
    cstate = NotStarted;
    tname = "";
}

Thread::Thread(const string &name)
{
    cstate = NotStarted;
    tname = name;
}

/*
 * Threads must be joined before they are destroyed.
 */
Thread::~Thread()
{
    ASSERT(cstate != Running);
}

string
Thread::getName()
{
    return tname;
}

void
Thread::setName(const string &name)
{
    tname = name;
}

ThreadState
Thread::getState()
{
    return cstate;
}

void
Thread::start()
{
    int ret = pthread_create(&tid, NULL, EntryWrapper, (void *)this);
    if (ret != 0)
        throw SystemException(ret, "pthread_create(" + tname + ")");

    cstate = Running;
}

void
Thread::join()
{
    if (cstate != Running)
        return;

    int ret = pthread_join(tid, NULL);
    if (ret != 0)
        throw SystemException(ret, "pthread_join(" + tname + ")");

    cstate = Finished;
}

static void *
EntryWrapper(void *arg)
{
    Thread *t = (Thread *)arg;

    t->run();

    return NULL;
}
