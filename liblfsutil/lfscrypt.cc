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
#include <string.h>

#include <unistd.h>
#include <errno.h>

#include <string>

#include <openssl/evp.h>

#include "tuneables.h"

#include <lfsutil/debug.h>
#include <lfsutil/lfscrypt.h>
#include <lfsutil/systemexception.h>

using namespace std;

/*
 * EVP digest context that is released on every exit path.
 */
class Sha256Ctx
{
public:
    Sha256Ctx() {
        ctx = EVP_MD_CTX_new();
        if (ctx == NULL)
            throw SystemException(ENOMEM, "EVP_MD_CTX_new");
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), NULL) != 1) {
            EVP_MD_CTX_free(ctx);
            throw SystemException(EINVAL, "EVP_DigestInit_ex");
        }
    }
    ~Sha256Ctx() {
        EVP_MD_CTX_free(ctx);
    }
    void update(const void *data, size_t len) {
        EVP_DigestUpdate(ctx, data, len);
    }
    void finish(ObjectHash &hash) {
        unsigned int len = 0;
        EVP_DigestFinal_ex(ctx, hash.hash, &len);
        ASSERT(len == ObjectHash::SIZE);
    }
private:
    Sha256Ctx(const Sha256Ctx &);
    Sha256Ctx &operator=(const Sha256Ctx &);
    EVP_MD_CTX *ctx;
};

ObjectHash
LfsCrypt_HashString(const string &str)
{
    return LfsCrypt_HashBlob((const uint8_t *)str.data(), str.size());
}

/*
 * Compute SHA 256 hash for a buffer.
 */
ObjectHash
LfsCrypt_HashBlob(const uint8_t *data, size_t len)
{
    Sha256Ctx state;
    ObjectHash hash;

    state.update(data, len);
    state.finish(hash);

    return hash;
}

/*
 * Compute SHA 256 hash of everything readable from fd.  The file length is
 * not trusted: a store object may have been truncated or extended, so we
 * read until EOF.
 */
int
LfsCrypt_HashFd(int fd, ObjectHash &hash, uint64_t *bytesRead)
{
    char buf[HASHFILE_BUFSZ];
    uint64_t total = 0;
    Sha256Ctx state;

    while (1) {
        ssize_t n = read(fd, buf, HASHFILE_BUFSZ);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return -errno;
        }
        if (n == 0)
            break;

        state.update(buf, n);
        total += n;
    }

    state.finish(hash);
    if (bytesRead != NULL)
        *bytesRead = total;

    return 0;
}

