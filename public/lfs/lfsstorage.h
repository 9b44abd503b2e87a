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

#ifndef __LFS_LFSSTORAGE_H__
#define __LFS_LFSSTORAGE_H__

#include <string>
#include <tr1/memory>

#define LFS_PATH_OBJS           "/objects/"
#define LFS_PATH_BAD            "/bad"
#define LFS_PATH_LOCK           "/fsck.lock"
#define LFS_PATH_LOG            "/logs/lfs.log"

class LfsStorageLock
{
public:
    typedef std::tr1::shared_ptr<LfsStorageLock> sp;
    LfsStorageLock(const std::string &filename);
    ~LfsStorageLock();
private:
    std::string lockFile;
};

/*
 * Layout of the local object store.
 */
class LfsStorage
{
public:
    LfsStorage(const std::string &root);
    ~LfsStorage();

    std::string getRootPath() const;
    /// <root>/objects/aa/bb/<oid>, throws LFSEC_INVALIDARGS for a bad oid
    std::string objectPath(const std::string &oid) const;
    std::string quarantineDir() const;
    std::string logPath() const;
    /// Throws LFSEC_LOCKED if another process holds the lock
    LfsStorageLock::sp lock();
private:
    std::string rootPath;
};

#endif /* __LFS_LFSSTORAGE_H__ */
