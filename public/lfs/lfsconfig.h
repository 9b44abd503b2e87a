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

#ifndef __LFS_LFSCONFIG_H__
#define __LFS_LFSCONFIG_H__

#include <string>
#include <vector>
#include <utility>

#include <boost/property_tree/ptree.hpp>

#include <lfs/filepathfilter.h>

/*
 * Settings from .lfsconfig and git config.  Keys use git's
 * "section.name" form with lowercase section and name.
 */
class LfsConfig
{
public:
    LfsConfig();
    ~LfsConfig();

    /// Load everything for the repository containing dir
    void load(const std::string &dir);
    /// Merge an INI file, throws LFSEC_BADCONFIG if it cannot be parsed
    void loadFile(const std::string &path);
    void loadEntries(const std::vector<std::pair<std::string, std::string> >
                     &entries);
    void set(const std::string &key, const std::string &value);

    bool has(const std::string &key) const;
    std::string get(const std::string &key,
                    const std::string &defaultValue = "") const;
    /// Throws LFSEC_BADCONFIG if the value is not a non-negative integer
    int getInt(const std::string &key, int defaultValue) const;

    std::string getGitDir() const;
    std::string getWorkTree() const;
    void setGitDir(const std::string &path);

    /// lfs.storage, relative to the git dir, default <gitdir>/lfs
    std::string storageDir() const;
    std::vector<std::string> fetchExclude() const;
    int fsckJobs() const;
private:
    boost::property_tree::ptree config;
    std::string gitDir;
    std::string workTree;
};

#endif /* __LFS_LFSCONFIG_H__ */
