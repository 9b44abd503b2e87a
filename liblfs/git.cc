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

#include <string>
#include <vector>
#include <utility>

#include <lfsutil/debug.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/runtimeexception.h>
#include <lfsutil/systemexception.h>
#include <lfs/gitprocess.h>
#include <lfs/git.h>

using namespace std;

static vector<string>
makeArgs(const char *a0, const char *a1 = NULL, const char *a2 = NULL,
         const char *a3 = NULL)
{
    vector<string> args;

    args.push_back(a0);
    if (a1) args.push_back(a1);
    if (a2) args.push_back(a2);
    if (a3) args.push_back(a3);

    return args;
}

string
Git_GitDir(const string &dir)
{
    string out;

    if (GitProcess::tryRun(dir, makeArgs("rev-parse", "--absolute-git-dir"),
                           out) != 0)
        throw RuntimeException(LFSEC_NOTAREPO, "Not in a git repository");

    return LfsStr_Trim(out);
}

string
Git_WorkTree(const string &dir)
{
    string out;

    if (GitProcess::tryRun(dir, makeArgs("rev-parse", "--show-toplevel"),
                           out) != 0)
        return "";

    return LfsStr_Trim(out);
}

/*
 * Every configured key in git's precedence order.  Entries are
 * "key\nvalue" separated by NUL; a key with no value has no newline.
 */
vector<pair<string, string> >
Git_ConfigList(const string &dir)
{
    vector<pair<string, string> > rval;
    string out = GitProcess::run(dir, makeArgs("config", "-l", "-z"));
    vector<string> entries = LfsStr_Split(out, '\0');

    for (size_t i = 0; i < entries.size(); i++) {
        string key, value;

        if (entries[i].empty())
            continue;
        if (!LfsStr_SplitFirst(entries[i], "\n", key, value)) {
            key = entries[i];
            value = "true";
        }
        rval.push_back(make_pair(key, value));
    }

    return rval;
}

bool
Git_IsAvailable()
{
    string out;

    try {
        return GitProcess::tryRun(".", makeArgs("--version"), out) == 0;
    } catch (SystemException &e) {
        WARNING("Cannot run git: %s", e.what());
        return false;
    }
}

GitRefResolver::GitRefResolver(const string &dir)
    : dir(dir)
{
}

GitRefResolver::~GitRefResolver()
{
}

string
GitRefResolver::resolve(const string &expr)
{
    string out;

    if (expr.empty() || expr[0] == '-')
        throw RuntimeException(LFSEC_BADREF,
                               "Invalid ref argument: " + expr);

    if (GitProcess::tryRun(dir, makeArgs("rev-parse", "--verify", "-q",
                                         (expr + "^{commit}").c_str()),
                           out) != 0)
        throw RuntimeException(LFSEC_BADREF,
                               "Invalid ref argument: " + expr);

    return LfsStr_Trim(out);
}

string
GitRefResolver::currentRef()
{
    return resolve("HEAD");
}

vector<string>
GitRefResolver::resolveRefs(const vector<string> &exprs)
{
    vector<string> rval;

    for (size_t i = 0; i < exprs.size(); i++)
        rval.push_back(resolve(exprs[i]));

    return rval;
}
