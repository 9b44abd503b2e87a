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

#ifndef __LFS_LFSUTIL_H__
#define __LFS_LFSUTIL_H__

#include <stdint.h>

#include <string>

std::string LfsUtil_SystemError(int status);
std::string LfsUtil_MkTempDir(const std::string &prefix);

/*
 * Process wide cancellation, set from SIGINT/SIGTERM and polled by
 * long running scans.
 */
void LfsCancel_InstallHandlers();
void LfsCancel_Request();
bool LfsCancel_Requested();
void LfsCancel_Reset();

#endif /* __LFS_LFSUTIL_H__ */
