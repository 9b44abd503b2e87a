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

#ifndef __LFS_FILEPATHFILTER_H__
#define __LFS_FILEPATHFILTER_H__

#include <string>
#include <vector>

/*
 * Include/exclude filter over repository relative paths.
 */
class FilePathFilter
{
public:
    FilePathFilter();
    FilePathFilter(const std::vector<std::string> &include,
                   const std::vector<std::string> &exclude);
    ~FilePathFilter();

    /// Parse a comma separated pattern list as stored in git config
    static std::vector<std::string> parseList(const std::string &list);

    bool allows(const std::string &path) const;
    bool isEmpty() const;

    static bool matches(const std::string &pattern, const std::string &path);
private:
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

#endif /* __LFS_FILEPATHFILTER_H__ */
