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
#include <algorithm>

#include <lfsutil/debug.h>
#include <lfsutil/lfsstr.h>
#include <lfs/gitattr.h>

using namespace std;

GitAttr::GitAttr()
    : rules()
{
}

GitAttr::~GitAttr()
{
}

static size_t
pathDepth(const string &dir)
{
    if (dir.empty())
        return 0;

    return count(dir.begin(), dir.end(), '/') + 1;
}

void
GitAttr::addFile(const string &dir, const string &contents)
{
    vector<Rule> fileRules;
    vector<string> lines = LfsStr_Split(contents, '\n');

    for (size_t i = 0; i < lines.size(); i++) {
        string line = LfsStr_Trim(lines[i]);

        if (line.empty() || line[0] == '#')
            continue;
        // Macro definitions do not name paths
        if (LfsStr_StartsWith(line, "[attr]"))
            continue;

        for (size_t j = 0; j < line.size(); j++) {
            if (line[j] == '\t')
                line[j] = ' ';
        }

        vector<string> tokens;
        vector<string> raw = LfsStr_Split(line, ' ');
        for (size_t j = 0; j < raw.size(); j++) {
            if (!raw[j].empty())
                tokens.push_back(raw[j]);
        }
        if (tokens.size() < 2)
            continue;

        Rule r;
        bool mentionsFilter = false;
        r.dir = dir;
        r.pattern = tokens[0];
        r.lfs = false;

        for (size_t j = 1; j < tokens.size(); j++) {
            const string &t = tokens[j];
            if (t == "filter=lfs") {
                r.lfs = true;
                mentionsFilter = true;
            } else if (t == "filter" || t == "-filter" || t == "!filter" ||
                       LfsStr_StartsWith(t, "filter=")) {
                r.lfs = false;
                mentionsFilter = true;
            }
        }

        // Attributes never apply to directories
        if (!mentionsFilter || LfsStr_EndsWith(r.pattern, "/"))
            continue;

        fileRules.push_back(r);
    }

    /*
     * Keep rules ordered from the shallowest file to the deepest so that
     * the last match is the most specific one.
     */
    vector<Rule>::iterator it = rules.begin();
    while (it != rules.end() && pathDepth(it->dir) <= pathDepth(dir))
        ++it;
    rules.insert(it, fileRules.begin(), fileRules.end());
}

bool
GitAttr::ruleMatches(const Rule &rule, const string &path)
{
    string rel = path;
    string pat = rule.pattern;

    if (!rule.dir.empty()) {
        if (!LfsStr_StartsWith(path, rule.dir + "/"))
            return false;
        rel = path.substr(rule.dir.size() + 1);
    }

    if (pat.find('/') == pat.npos) {
        size_t slash = rel.rfind('/');
        string base = (slash == rel.npos) ? rel : rel.substr(slash + 1);
        return fnmatch(pat.c_str(), base.c_str(), 0) == 0;
    }

    if (pat[0] == '/')
        pat = pat.substr(1);

    int flags = (pat.find("**") == pat.npos) ? FNM_PATHNAME : 0;
    return fnmatch(pat.c_str(), rel.c_str(), flags) == 0;
}

bool
GitAttr::isLfsPath(const string &path) const
{
    for (size_t i = rules.size(); i > 0; i--) {
        if (ruleMatches(rules[i - 1], path))
            return rules[i - 1].lfs;
    }

    return false;
}

bool
GitAttr::isEmpty() const
{
    return rules.empty();
}

void
GitAttr::clear()
{
    rules.clear();
}
