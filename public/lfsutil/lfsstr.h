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

#ifndef __LFS_LFSSTR_H__
#define __LFS_LFSSTR_H__

#include <stdint.h>

#include <string>
#include <vector>

std::vector<std::string> LfsStr_Split(const std::string &str, char sep);
std::string LfsStr_Join(const std::vector<std::string> &str, char sep);
/// Splits at the first occurrence of sep; false if sep does not occur
bool LfsStr_SplitFirst(const std::string &str, const std::string &sep,
                       std::string &before, std::string &after);

bool LfsStr_StartsWith(const std::string &str, const std::string &part);
bool LfsStr_EndsWith(const std::string &str, const std::string &part);
std::string LfsStr_Trim(const std::string &str);

/// Strict decimal parse, no sign, no surrounding space
bool LfsStr_ToUInt64(const std::string &str, uint64_t &val);

#endif /* __LFS_LFSSTR_H__ */

