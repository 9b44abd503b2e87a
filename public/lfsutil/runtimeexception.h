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

#ifndef __LFS_RUNTIMEEXCEPTION_H__
#define __LFS_RUNTIMEEXCEPTION_H__

#include <string>
#include <exception>

enum LfsErrorCode {
    LFSEC_INVALIDARGS,
    LFSEC_NOTAREPO,
    LFSEC_BADREF,
    LFSEC_GITFAILED,
    LFSEC_SCANFAILED,
    LFSEC_BADCONFIG,
    LFSEC_LOCKED,
    LFSEC_INTERRUPTED
};

class RuntimeException : public std::exception
{
public:
    RuntimeException(LfsErrorCode code, const std::string &msg) {
        errorString = msg;
        errorCode = code;
    }
    RuntimeException(LfsErrorCode code, const char *msg) {
        errorString = msg;
        errorCode = code;
    }
    virtual ~RuntimeException() throw()
    {
    }
    virtual LfsErrorCode getCode() const throw()
    {
        return errorCode;
    }
    virtual const char* what() const throw()
    {
        return errorString.c_str();
    }
private:
    std::string errorString;
    LfsErrorCode errorCode;
};

#endif /* __LFS_RUNTIMEEXCEPTION_H__ */

