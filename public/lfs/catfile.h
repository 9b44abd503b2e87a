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

#ifndef __LFS_CATFILE_H__
#define __LFS_CATFILE_H__

#include <stdint.h>

#include <string>
#include <tr1/memory>

#include <lfs/gitprocess.h>

/*
 * Long lived "git cat-file --batch" or "--batch-check" co-process.
 */
class CatFile
{
public:
    typedef std::tr1::shared_ptr<CatFile> sp;
    CatFile(const std::string &dir, bool withContents);
    ~CatFile();

    /*
     * Look up an object.  Returns false if git reports it missing.  With
     * contents, data holds the object; otherwise data is left empty.
     */
    bool get(const std::string &rev, std::string &sha, std::string &type,
             int64_t &size, std::string &data);
    void close();
private:
    bool withContents;
    GitProcess proc;
    bool running;
};

#endif /* __LFS_CATFILE_H__ */
