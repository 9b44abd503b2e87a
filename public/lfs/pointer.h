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

#ifndef __LFS_POINTER_H__
#define __LFS_POINTER_H__

#include <stdint.h>

#include <string>
#include <vector>

#define LFS_POINTER_VERSION     "https://git-lfs.github.com/spec/v1"
#define LFS_POINTER_VERSION_ALIAS1 "https://hawser.github.com/spec/v1"
#define LFS_POINTER_VERSION_ALIAS2 "http://git-media.io/v/2"
#define LFS_POINTER_OIDTYPE     "sha256"
/* Blobs this large or larger are never pointers */
#define LFS_POINTER_MAXSIZE     1024

struct PointerExtension
{
    PointerExtension() : priority(0) { }
    PointerExtension(const std::string &name, int priority,
                     const std::string &oid)
        : name(name), priority(priority), oid(oid) { }
    std::string name;
    int priority;
    std::string oid;
};

/*
 * A pointer record: the small text file committed to git in place of the
 * content it names.
 */
class Pointer
{
public:
    Pointer();
    Pointer(const std::string &oid, int64_t size);
    ~Pointer();

    std::string encode() const;
    /*
     * Decode a blob.  Returns false if the blob is not a pointer.  On
     * success canonical is set to whether blob is byte for byte the
     * canonical encoding.
     */
    static bool decode(const std::string &blob, Pointer &p, bool &canonical);

    std::string oid;
    int64_t size;
    std::vector<PointerExtension> extensions;
};

#endif /* __LFS_POINTER_H__ */
