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

#ifndef __LFS_SCANRANGE_H__
#define __LFS_SCANRANGE_H__

#include <string>
#include <vector>

#include <lfs/git.h>

/*
 * The part of history to examine.  An empty start means "from the root
 * commit".  useIndex adds the staged index.
 */
struct ScanRange
{
    ScanRange() : start(), end(), useIndex(false) { }
    std::string start;
    std::string end;
    bool useIndex;
};

/// Throws LFSEC_INVALIDARGS or LFSEC_BADREF
ScanRange ScanRange_Resolve(const std::vector<std::string> &args,
                            RefResolver &resolver);

#endif /* __LFS_SCANRANGE_H__ */
