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

#ifndef __LFS_GITATTR_H__
#define __LFS_GITATTR_H__

#include <string>
#include <vector>

/*
 * The "filter" attribute from the .gitattributes files of one tree.
 */
class GitAttr
{
public:
    GitAttr();
    ~GitAttr();

    /*
     * Add the contents of dir/.gitattributes, dir is "" for the root.
     * Files may be added in any order.
     */
    void addFile(const std::string &dir, const std::string &contents);
    /// True if the path is expected to hold a pointer (filter=lfs)
    bool isLfsPath(const std::string &path) const;
    bool isEmpty() const;
    void clear();
private:
    struct Rule {
        std::string dir;
        std::string pattern;
        bool lfs;
    };
    static bool ruleMatches(const Rule &rule, const std::string &path);
    std::vector<Rule> rules;
};

#endif /* __LFS_GITATTR_H__ */
