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

#ifndef __LFS_LFSCRYPT_H__
#define __LFS_LFSCRYPT_H__

#include <stdint.h>

#include <string>

#include "objecthash.h"

ObjectHash LfsCrypt_HashString(const std::string &str);
ObjectHash LfsCrypt_HashBlob(const uint8_t *data, size_t len);
/// Hashes an open descriptor until EOF. Returns 0 or -errno.
int LfsCrypt_HashFd(int fd, ObjectHash &hash, uint64_t *bytesRead = NULL);

#endif /* __LFS_LFSCRYPT_H__ */

