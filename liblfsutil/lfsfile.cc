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
#include <stdlib.h>
#include <string.h>

#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>

#include <string>

#include <lfsutil/debug.h>
#include <lfsutil/lfsfile.h>

using namespace std;

/*
 * Check if a file exists.
 */
bool
LfsFile_Exists(const string &path)
{
    struct stat sb;

    if (stat(path.c_str(), &sb) == 0)
        return true;

    return false;
}

/*
 * Check if a file is a directory.
 */
bool
LfsFile_IsDirectory(const string &path)
{
    struct stat sb;

    if (stat(path.c_str(), &sb) < 0)
        return false;

    return S_ISDIR(sb.st_mode);
}

int
LfsFile_MkDir(const string &path)
{
    if (mkdir(path.c_str(), 0755) < 0)
        return -errno;

    return 0;
}

/*
 * Create a directory and any missing parents.  An existing directory is not
 * an error, an existing file in the way is.
 */
int
LfsFile_MkDirAll(const string &path)
{
    if (path == "" || LfsFile_IsDirectory(path))
        return 0;

    string parent = LfsFile_Dirname(path);
    if (parent != path && parent != "") {
        int status = LfsFile_MkDirAll(parent);
        if (status < 0)
            return status;
    }

    if (mkdir(path.c_str(), 0755) < 0) {
        if (errno != EEXIST)
            return -errno;
        return LfsFile_IsDirectory(path) ? 0 : -ENOTDIR;
    }

    return 0;
}

/*
 * Return the full path given a relative path.
 */
string
LfsFile_RealPath(const string &path)
{
    char *tmp;
    string rval = "";

    tmp = realpath(path.c_str(), NULL);
    if (tmp) {
        rval = tmp;
        free(tmp);
    }

    return rval;
}

/*
 * Read a whole file into memory.
 */
bool
LfsFile_ReadFile(const string &path, string &blob)
{
    FILE *f;
    char buf[4096];
    size_t len;

    f = fopen(path.c_str(), "rb");
    if (f == NULL)
        return false;

    blob.clear();
    while ((len = fread(buf, 1, sizeof(buf), f)) > 0) {
        blob.append(buf, len);
    }

    bool ok = !ferror(f);
    fclose(f);

    return ok;
}

/*
 * Write an in memory blob to a file.
 */
bool
LfsFile_WriteFile(const string &blob, const string &path)
{
    FILE *f;
    size_t bytesWritten = 1;

    f = fopen(path.c_str(), "wb");
    if (f == NULL) {
        return false;
    }

    if (blob.size() > 0)
        bytesWritten = fwrite(blob.data(), blob.size(), 1, f);
    if (fclose(f) != 0)
        return false;

    return (bytesWritten == 1);
}

/*
 * Delete a file.
 */
int
LfsFile_Delete(const string &path)
{
    if (unlink(path.c_str()) < 0)
        return -errno;

    return 0;
}

/*
 * Rename a file.  Both paths must be on the same file system.
 */
int
LfsFile_Rename(const string &from, const string &to)
{
    if (rename(from.c_str(), to.c_str()) < 0)
        return -errno;

    return 0;
}

string
LfsFile_Basename(const string &path)
{
    size_t ix = path.rfind('/');
    if (ix == string::npos) {
        return path;
    }
    return path.substr(ix+1);
}

string
LfsFile_Dirname(const string &path)
{
    size_t ix = path.rfind('/');
    if (ix == string::npos) {
        return "";
    }
    if (ix == 0) {
        return "/";
    }
    return path.substr(0, ix);
}

string
LfsFile_Join(const string &dir, const string &name)
{
    if (dir == "")
        return name;
    if (dir[dir.size() - 1] == '/')
        return dir + name;
    return dir + "/" + name;
}

