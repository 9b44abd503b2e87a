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

#include <string>
#include <vector>
#include <sstream>

#include <lfsutil/debug.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/objecthash.h>
#include <lfs/pointer.h>

using namespace std;

Pointer::Pointer()
    : oid(), size(0), extensions()
{
}

Pointer::Pointer(const string &oid, int64_t size)
    : oid(oid), size(size), extensions()
{
}

Pointer::~Pointer()
{
}

string
Pointer::encode() const
{
    ostringstream ss;

    ss << "version " << LFS_POINTER_VERSION << "\n";
    for (size_t i = 0; i < extensions.size(); i++) {
        ss << "ext-" << extensions[i].priority << "-" << extensions[i].name
           << " " << LFS_POINTER_OIDTYPE << ":" << extensions[i].oid << "\n";
    }
    ss << "oid " << LFS_POINTER_OIDTYPE << ":" << oid << "\n";
    ss << "size " << size << "\n";

    return ss.str();
}

static bool
isKnownVersion(const string &version)
{
    return version == LFS_POINTER_VERSION ||
           version == LFS_POINTER_VERSION_ALIAS1 ||
           version == LFS_POINTER_VERSION_ALIAS2;
}

/*
 * Parse "sha256:<hex>".  Only lowercase hex of the right length passes,
 * so an oid can never name a path outside the store.
 */
static bool
parseOid(const string &value, string &oid)
{
    string type, hex;

    if (!LfsStr_SplitFirst(value, ":", type, hex))
        return false;
    if (type != LFS_POINTER_OIDTYPE)
        return false;
    if (!ObjectHash::isValidHex(hex))
        return false;

    oid = hex;
    return true;
}

/*
 * Parse "ext-<priority>-<name>".
 */
static bool
parseExtensionKey(const string &key, int &priority, string &name)
{
    string rest, prio;
    uint64_t val;

    if (!LfsStr_StartsWith(key, "ext-"))
        return false;

    rest = key.substr(4);
    if (!LfsStr_SplitFirst(rest, "-", prio, name))
        return false;
    if (name.empty() || !LfsStr_ToUInt64(prio, val) || val > 9)
        return false;

    priority = (int)val;
    return true;
}

bool
Pointer::decode(const string &blob, Pointer &p, bool &canonical)
{
    vector<string> lines;
    vector<string> raw;
    size_t idx = 0;
    Pointer rval;
    uint64_t size;

    if (blob.size() >= LFS_POINTER_MAXSIZE)
        return false;
    if (blob.find("git-lfs") == blob.npos &&
        blob.find("hawser") == blob.npos &&
        blob.find("git-media") == blob.npos)
        return false;

    raw = LfsStr_Split(LfsStr_Trim(blob), '\n');
    for (size_t i = 0; i < raw.size(); i++) {
        string line = raw[i];
        if (!line.empty() && line[line.size() - 1] == '\r')
            line.erase(line.size() - 1);
        if (LfsStr_Trim(line).empty())
            continue;
        lines.push_back(line);
    }

    vector<string> keys, values;
    for (size_t i = 0; i < lines.size(); i++) {
        string key, value;
        if (!LfsStr_SplitFirst(lines[i], " ", key, value))
            return false;
        keys.push_back(key);
        values.push_back(value);
    }

    if (idx >= keys.size() || keys[idx] != "version" ||
        !isKnownVersion(values[idx]))
        return false;
    idx++;

    while (idx < keys.size() && LfsStr_StartsWith(keys[idx], "ext-")) {
        PointerExtension ext;

        if (!parseExtensionKey(keys[idx], ext.priority, ext.name))
            return false;
        if (ext.priority != (int)rval.extensions.size())
            return false;
        if (!parseOid(values[idx], ext.oid))
            return false;

        rval.extensions.push_back(ext);
        idx++;
    }

    if (idx >= keys.size() || keys[idx] != "oid" ||
        !parseOid(values[idx], rval.oid))
        return false;
    idx++;

    if (idx >= keys.size() || keys[idx] != "size" ||
        !LfsStr_ToUInt64(values[idx], size) || size > (uint64_t)INT64_MAX)
        return false;
    rval.size = (int64_t)size;
    idx++;

    if (idx != keys.size())
        return false;

    p = rval;
    canonical = (p.encode() == blob);

    return true;
}
