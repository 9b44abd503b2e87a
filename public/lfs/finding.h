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

#ifndef __LFS_FINDING_H__
#define __LFS_FINDING_H__

#include <string>
#include <vector>
#include <set>
#include <ostream>

#include <lfsutil/mutex.h>

/*
 * One integrity problem.  Fields that do not apply to the kind are empty.
 */
struct Finding
{
    enum Kind {
        CorruptObject,
        OpenError,
        NonCanonicalPointer,
        UnexpectedGitObject
    };

    Kind kind;
    std::string blobOid;
    std::string treeOid;
    std::string oid;
    std::string path;
    std::string message;

    const char *kindName() const;
    /// True for the kinds that put an object in the repair set
    bool isObjectFinding() const;
    /// The diagnostic line, e.g. "objects: corruptObject: <message>"
    std::string line() const;

    static Finding corruptObject(const std::string &name,
                                 const std::string &oid);
    static Finding openError(const std::string &name,
                             const std::string &oid,
                             const std::string &reason);
    static Finding nonCanonicalPointer(const std::string &oid,
                                       const std::string &blobOid);
    static Finding unexpectedGitObject(const std::string &path,
                                       const std::string &treeOid);
};

/*
 * Results of a single fsck invocation.  Safe to report into from several
 * threads; each diagnostic is written as one line.
 */
class VerificationRun
{
public:
    VerificationRun(std::ostream &out, bool dryRun);
    ~VerificationRun();

    void report(const Finding &finding);
    void print(const std::string &line);

    bool isOk();
    bool isDryRun() const;
    std::vector<std::string> getCorruptOids();
    std::vector<Finding> getFindings();
private:
    Mutex lock;
    std::ostream &out;
    bool dryRun;
    std::vector<std::string> corruptOids;
    std::set<std::string> corruptSet;
    std::vector<Finding> findings;
};

#endif /* __LFS_FINDING_H__ */
