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

#ifndef __LFS_GIT_H__
#define __LFS_GIT_H__

#include <string>
#include <vector>
#include <utility>

std::string Git_GitDir(const std::string &dir);
/// Empty for a bare repository
std::string Git_WorkTree(const std::string &dir);
std::vector<std::pair<std::string, std::string> >
Git_ConfigList(const std::string &dir);
bool Git_IsAvailable();

/*
 * Turns user supplied ref expressions into commit hashes.
 */
class RefResolver
{
public:
    virtual ~RefResolver() { }
    /// Commit checked out in the work tree
    virtual std::string currentRef() = 0;
    /// Resolve each expression to a commit hash, in order
    virtual std::vector<std::string> resolveRefs(
                const std::vector<std::string> &exprs) = 0;
};

class GitRefResolver : public RefResolver
{
public:
    GitRefResolver(const std::string &dir);
    virtual ~GitRefResolver();
    virtual std::string currentRef();
    virtual std::vector<std::string> resolveRefs(
                const std::vector<std::string> &exprs);
private:
    std::string resolve(const std::string &expr);
    std::string dir;
};

#endif /* __LFS_GIT_H__ */
