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

#include <vector>
#include <string>

#include <lfsutil/debug.h>
#include <lfsutil/lfsstr.h>

using namespace std;

vector<string>
LfsStr_Split(const string &str, char sep)
{
    size_t pos = 0;
    vector<string> rval;

    while (pos < str.length()) {
        size_t end = str.find(sep, pos);
        if (end == str.npos) {
            rval.push_back(str.substr(pos));
            break;
        }

        rval.push_back(str.substr(pos, end - pos));
        pos = end + 1;
    }

    return rval;
}

string
LfsStr_Join(const vector<string> &str, char sep)
{
    string rval = "";

    if (str.size() == 0)
        return rval;

    rval = str[0];
    for (size_t i = 1; i < str.size(); i++) {
        rval += sep;
        rval += str[i];
    }

    return rval;
}

bool
LfsStr_SplitFirst(const string &str, const string &sep,
                  string &before, string &after)
{
    size_t pos = str.find(sep);
    if (pos == str.npos)
        return false;

    before = str.substr(0, pos);
    after = str.substr(pos + sep.length());
    return true;
}

bool
LfsStr_StartsWith(const string &str, const string &part)
{
    if (str.length() < part.length())
        return false;

    return str.compare(0, part.length(), part) == 0;
}

bool
LfsStr_EndsWith(const string &str, const string &part)
{
    if (str.length() < part.length())
        return false;

    return str.compare(str.length() - part.length(), part.length(), part) == 0;
}

string
LfsStr_Trim(const string &str)
{
    const char *ws = " \t\r\n\v\f";
    size_t start = str.find_first_not_of(ws);

    if (start == str.npos)
        return "";

    size_t end = str.find_last_not_of(ws);
    return str.substr(start, end - start + 1);
}

bool
LfsStr_ToUInt64(const string &str, uint64_t &val)
{
    uint64_t rval = 0;

    if (str.length() == 0)
        return false;

    for (size_t i = 0; i < str.length(); i++) {
        char c = str[i];
        if (c < '0' || c > '9')
            return false;
        if (rval > (UINT64_MAX - (c - '0')) / 10)
            return false;
        rval = rval * 10 + (c - '0');
    }

    val = rval;
    return true;
}

