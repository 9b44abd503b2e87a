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

#include <fnmatch.h>

#include <string>
#include <vector>

#include <lfsutil/debug.h>
#include <lfsutil/lfsstr.h>
#include <lfs/filepathfilter.h>

using namespace std;

FilePathFilter::FilePathFilter()
    : include(), exclude()
{
}

FilePathFilter::FilePathFilter(const vector<string> &include,
                               const vector<string> &exclude)
    : include(include), exclude(exclude)
{
}

FilePathFilter::~FilePathFilter()
{
}

vector<string>
FilePathFilter::parseList(const string &list)
{
    vector<string> parts = LfsStr_Split(list, ',');
    vector<string> rval;

    for (size_t i = 0; i < parts.size(); i++) {
        string p = LfsStr_Trim(parts[i]);
        if (!p.empty())
            rval.push_back(p);
    }

    return rval;
}

/*
 * A pattern without a slash matches any single path component.  A pattern
 * with a slash is anchored at the root and matches the path itself or any
 * directory above it.  "**" crosses directory boundaries.
 */
bool
FilePathFilter::matches(const string &pattern, const string &path)
{
    string pat = pattern;

    while (pat.size() > 1 && pat[pat.size() - 1] == '/')
        pat.erase(pat.size() - 1);
    if (LfsStr_StartsWith(pat, "./"))
        pat = pat.substr(2);
    if (pat.empty())
        return false;

    if (pat.find('/') == pat.npos) {
        vector<string> comps = LfsStr_Split(path, '/');
        for (size_t i = 0; i < comps.size(); i++) {
            if (fnmatch(pat.c_str(), comps[i].c_str(), 0) == 0)
                return true;
        }
        return false;
    }

    if (pat[0] == '/')
        pat = pat.substr(1);

    int flags = (pat.find("**") == pat.npos) ? FNM_PATHNAME : 0;
    string prefix = path;
    while (!prefix.empty()) {
        if (fnmatch(pat.c_str(), prefix.c_str(), flags) == 0)
            return true;

        size_t slash = prefix.rfind('/');
        if (slash == prefix.npos)
            break;
        prefix = prefix.substr(0, slash);
    }

    return false;
}

bool
FilePathFilter::allows(const string &path) const
{
    bool included = include.empty();

    for (size_t i = 0; !included && i < include.size(); i++) {
        if (matches(include[i], path))
            included = true;
    }
    if (!included)
        return false;

    for (size_t i = 0; i < exclude.size(); i++) {
        if (matches(exclude[i], path))
            return false;
    }

    return true;
}

bool
FilePathFilter::isEmpty() const
{
    return include.empty() && exclude.empty();
}
