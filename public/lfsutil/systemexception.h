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

#ifndef __LFS_SYSTEMEXCEPTION_H__
#define __LFS_SYSTEMEXCEPTION_H__

#include <errno.h>
#include <string.h>

#include <string>
#include <exception>

/*
 * A failed system call.  Carries errno and a short description of what was
 * being attempted, usually the call and the path involved.
 */
class SystemException : public std::exception
{
public:
    SystemException() {
        errnum = errno;
        errorString = strerror(errnum);
    }
    SystemException(int err, const std::string &context) {
        errnum = err;
        errorString = context + ": " + strerror(err);
    }
    virtual ~SystemException() throw()
    {
    }
    virtual int getErrno() const throw()
    {
        return errnum;
    }
    virtual const char* what() const throw()
    {
        return errorString.c_str();
    }
private:
    std::string errorString;
    int errnum;
};

#endif /* __LFS_SYSTEMEXCEPTION_H__ */

