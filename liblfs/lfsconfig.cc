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
#include <ctype.h>

#include <string>
#include <vector>
#include <utility>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include <lfsutil/debug.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/lfsfile.h>
#include <lfsutil/runtimeexception.h>
#include <lfs/git.h>
#include <lfs/lfsconfig.h>

using namespace std;

static string
lowercase(const string &str)
{
    string rval = str;

    for (size_t i = 0; i < rval.size(); i++)
        rval[i] = tolower((unsigned char)rval[i]);

    return rval;
}

LfsConfig::LfsConfig()
    : config(), gitDir(), workTree()
{
}

LfsConfig::~LfsConfig()
{
}

void
LfsConfig::load(const string &dir)
{
    gitDir = Git_GitDir(dir);
    workTree = Git_WorkTree(dir);

    if (!workTree.empty()) {
        string path = LfsFile_Join(workTree, ".lfsconfig");
        if (LfsFile_Exists(path))
            loadFile(path);
    }

    // git config takes precedence over .lfsconfig
    loadEntries(Git_ConfigList(dir));
}

/*
 * Sections are flattened to git's key form: [lfs] fetchexclude becomes
 * lfs.fetchexclude and [lfs "sub"] url becomes lfs.sub.url.
 */
void
LfsConfig::loadFile(const string &path)
{
    boost::property_tree::ptree file;

    try {
        boost::property_tree::ini_parser::read_ini(path, file);
    } catch (boost::property_tree::ini_parser_error &e) {
        throw RuntimeException(LFSEC_BADCONFIG,
                               "Cannot parse " + path + ": " + e.message());
    }

    boost::property_tree::ptree::const_iterator s;
    for (s = file.begin(); s != file.end(); ++s) {
        string section = LfsStr_Trim(s->first);
        string name, sub;

        if (LfsStr_SplitFirst(section, " ", name, sub)) {
            sub = LfsStr_Trim(sub);
            if (sub.size() >= 2 && sub[0] == '"' && sub[sub.size() - 1] == '"')
                sub = sub.substr(1, sub.size() - 2);
            section = lowercase(name) + "." + sub;
        } else {
            section = lowercase(section);
        }

        boost::property_tree::ptree::const_iterator k;
        for (k = s->second.begin(); k != s->second.end(); ++k) {
            set(section + "." + lowercase(k->first), k->second.data());
        }
    }
}

void
LfsConfig::loadEntries(const vector<pair<string, string> > &entries)
{
    for (size_t i = 0; i < entries.size(); i++)
        set(entries[i].first, entries[i].second);
}

void
LfsConfig::set(const string &key, const string &value)
{
    config.put(key, value);
}

bool
LfsConfig::has(const string &key) const
{
    return config.get_optional<string>(key).is_initialized();
}

string
LfsConfig::get(const string &key, const string &defaultValue) const
{
    return config.get<string>(key, defaultValue);
}

int
LfsConfig::getInt(const string &key, int defaultValue) const
{
    uint64_t val;

    if (!has(key))
        return defaultValue;

    string str = LfsStr_Trim(get(key));
    if (!LfsStr_ToUInt64(str, val) || val > 0x7fffffff)
        throw RuntimeException(LFSEC_BADCONFIG,
                               "Bad value for " + key + ": '" + str + "'");

    return (int)val;
}

string
LfsConfig::getGitDir() const
{
    return gitDir;
}

string
LfsConfig::getWorkTree() const
{
    return workTree;
}

void
LfsConfig::setGitDir(const string &path)
{
    gitDir = path;
}

string
LfsConfig::storageDir() const
{
    string storage = get("lfs.storage");

    if (storage.empty())
        return LfsFile_Join(gitDir, "lfs");
    if (storage[0] == '/')
        return storage;

    return LfsFile_Join(gitDir, storage);
}

vector<string>
LfsConfig::fetchExclude() const
{
    return FilePathFilter::parseList(get("lfs.fetchexclude"));
}

int
LfsConfig::fsckJobs() const
{
    return getInt("lfs.fsck.jobs", 1);
}
