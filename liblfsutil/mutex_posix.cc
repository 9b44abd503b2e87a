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

#include <errno.h>
#include <pthread.h>

#include <lfsutil/mutex.h>
#include <lfsutil/systemexception.h>

/*
 * Mutex
 */
Mutex::Mutex()
{
    int status = pthread_mutex_init(&lockHandle, NULL);
    if (status != 0)
        throw SystemException(status, "pthread_mutex_init");
}

Mutex::~Mutex()
{
    pthread_mutex_destroy(&lockHandle);
}

void Mutex::lock()
{
    pthread_mutex_lock(&lockHandle);
}

void Mutex::unlock()
{
    pthread_mutex_unlock(&lockHandle);
}

bool Mutex::tryLock()
{
    return (pthread_mutex_trylock(&lockHandle) == 0);
}

/*
 * CondVar
 */
CondVar::CondVar()
{
    int status = pthread_cond_init(&condHandle, NULL);
    if (status != 0)
        throw SystemException(status, "pthread_cond_init");
}

CondVar::~CondVar()
{
    pthread_cond_destroy(&condHandle);
}

void CondVar::wait(Mutex &m)
{
    pthread_cond_wait(&condHandle, &m.lockHandle);
}

void CondVar::signal()
{
    pthread_cond_signal(&condHandle);
}

void CondVar::broadcast()
{
    pthread_cond_broadcast(&condHandle);
}

