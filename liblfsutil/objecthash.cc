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

#include <string>

#include <lfsutil/debug.h>
#include <lfsutil/objecthash.h>
#include <lfsutil/runtimeexception.h>

static const char hexdigits[] = "0123456789abcdef";

static int
hexdigit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

ObjectHash::ObjectHash()
{
    clear();
}

bool
ObjectHash::isValidHex(const std::string &hex)
{
    if (hex.size() != STR_SIZE)
        return false;

    for (size_t i = 0; i < hex.size(); i++) {
        if (hexdigit(hex[i]) < 0)
            return false;
    }

    return true;
}

ObjectHash
ObjectHash::fromHex(const std::string &hex)
{
    ObjectHash rval;

    if (!isValidHex(hex))
        throw RuntimeException(LFSEC_INVALIDARGS,
                               "Invalid object hash '" + hex + "'");

    for (size_t i = 0; i < SIZE; i++) {
        rval.hash[i] = hexdigit(hex[i*2]) * 16 + hexdigit(hex[i*2+1]);
    }

    ASSERT(rval.hex() == hex);
    return rval;
}

void
ObjectHash::clear()
{
    memset(hash, 0, SIZE);
}

bool
ObjectHash::isEmpty() const
{
    for (size_t i = 0; i < SIZE; i++) {
        if (hash[i] != 0)
            return false;
    }
    return true;
}

std::string
ObjectHash::hex() const
{
    std::string rval(STR_SIZE, '0');

    for (size_t i = 0; i < SIZE; i++) {
        rval[i*2] = hexdigits[hash[i] >> 4];
        rval[i*2+1] = hexdigits[hash[i] & 0x0F];
    }

    return rval;
}

