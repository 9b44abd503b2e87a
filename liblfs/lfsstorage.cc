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

#include <string>

#include <lfsutil/debug.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/objecthash.h>
#include <lfsutil/runtimeexception.h>
#include <lfsutil/systemexception.h>
#include <lfs/lfsstorage.h>

using namespace std;

/********************************************************************
 *
 *
 * LfsStorageLock
 *
 *
 ********************************************************************/

LfsStorageLock::LfsStorageLock(const string &filename)
    : lockFile(filename)
{
}

LfsStorageLock::~LfsStorageLock()
{
    if (lockFile.size() > 0) {
        int status = LfsFile_Delete(lockFile);
        if (status < 0)
            WARNING("Cannot remove lock %s: %s", lockFile.c_str(),
                    strerror(-status));
    }
}

/********************************************************************
 *
 *
 * LfsStorage
 *
 *
 ********************************************************************/

LfsStorage::LfsStorage(const string &root)
    : rootPath(root)
{
    while (rootPath.size() > 1 && rootPath[rootPath.size() - 1] == '/')
        rootPath.erase(rootPath.size() - 1);
}

LfsStorage::~LfsStorage()
{
}

string
LfsStorage::getRootPath() const
{
    return rootPath;
}

string
LfsStorage::objectPath(const string &oid) const
{
    string rval = rootPath;

    if (!ObjectHash::isValidHex(oid))
        throw RuntimeException(LFSEC_INVALIDARGS, "Invalid oid '" + oid + "'");

    rval += LFS_PATH_OBJS;
    rval += oid.substr(0,2);
    rval += "/";
    rval += oid.substr(2,2);
    rval += "/";
    rval += oid;

    return rval;
}

string
LfsStorage::quarantineDir() const
{
    return rootPath + LFS_PATH_BAD;
}

string
LfsStorage::logPath() const
{
    return rootPath + LFS_PATH_LOG;
}

/*
 * The lock is a symlink naming the owner's pid.  It is released when the
 * last reference to the returned object goes away.  Returns an empty
 * pointer if the store does not exist yet.
 */
LfsStorageLock::sp
LfsStorage::lock()
{
    string lfPath = rootPath + LFS_PATH_LOCK;
    char pnum_str[64];

    // Without a store there is nothing to protect
    if (!LfsFile_IsDirectory(rootPath))
        return LfsStorageLock::sp();

    snprintf(pnum_str, sizeof(pnum_str), "%u", (unsigned)getpid());

    if (symlink(pnum_str, lfPath.c_str()) < 0) {
        if (errno == EEXIST) {
            ssize_t n = readlink(lfPath.c_str(), pnum_str, 63);
            pnum_str[n < 0 ? 0 : n] = '\0';
            throw RuntimeException(LFSEC_LOCKED,
                    "Store at " + rootPath + " is locked by pid " +
                    string(pnum_str) + " (remove " + lfPath +
                    " if that process is gone)");
        }
        throw SystemException(errno, "symlink(" + lfPath + ")");
    }

    DLOG("locked %s", lfPath.c_str());
    return LfsStorageLock::sp(new LfsStorageLock(lfPath));
}
