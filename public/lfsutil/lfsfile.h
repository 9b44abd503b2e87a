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

#ifndef __LFS_LFSFILE_H__
#define __LFS_LFSFILE_H__

#include <stdint.h>

#include <string>

bool LfsFile_Exists(const std::string &path);
bool LfsFile_IsDirectory(const std::string &path);
int LfsFile_MkDir(const std::string &path);
int LfsFile_MkDirAll(const std::string &path);
std::string LfsFile_RealPath(const std::string &path);
bool LfsFile_ReadFile(const std::string &path, std::string &blob);
bool LfsFile_WriteFile(const std::string &blob, const std::string &path);
int LfsFile_Delete(const std::string &path);
int LfsFile_Rename(const std::string &from, const std::string &to);

std::string LfsFile_Basename(const std::string &path);
std::string LfsFile_Dirname(const std::string &path);
std::string LfsFile_Join(const std::string &dir, const std::string &name);

#endif /* __LFS_LFSFILE_H__ */

