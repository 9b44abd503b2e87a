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

#include <string>
#include <vector>
#include <set>
#include <ostream>

#include <lfsutil/debug.h>
#include <lfsutil/mutex.h>
#include <lfs/finding.h>

using namespace std;

const char *
Finding::kindName() const
{
    switch (kind) {
        case CorruptObject:
            return "corruptObject";
        case OpenError:
            return "openError";
        case NonCanonicalPointer:
            return "nonCanonicalPointer";
        case UnexpectedGitObject:
            return "unexpectedGitObject";
    }

    NOT_IMPLEMENTED(false);
    return "";
}

bool
Finding::isObjectFinding() const
{
    return kind == CorruptObject || kind == OpenError;
}

string
Finding::line() const
{
    string category = isObjectFinding() ? "objects" : "pointer";

    return category + ": " + kindName() + ": " + message;
}

Finding
Finding::corruptObject(const string &name, const string &oid)
{
    Finding f;

    f.kind = CorruptObject;
    f.oid = oid;
    f.path = name;
    f.message = name + " (" + oid + ") is corrupt";

    return f;
}

Finding
Finding::openError(const string &name, const string &oid,
                   const string &reason)
{
    Finding f;

    f.kind = OpenError;
    f.oid = oid;
    f.path = name;
    f.message = name + " (" + oid + ") could not be checked: " + reason;

    return f;
}

Finding
Finding::nonCanonicalPointer(const string &oid, const string &blobOid)
{
    Finding f;

    f.kind = NonCanonicalPointer;
    f.oid = oid;
    f.blobOid = blobOid;
    f.message = "Pointer for " + oid + " (blob " + blobOid +
                ") was not canonical";

    return f;
}

Finding
Finding::unexpectedGitObject(const string &path, const string &treeOid)
{
    Finding f;

    f.kind = UnexpectedGitObject;
    f.treeOid = treeOid;
    f.path = path;
    f.message = "\"" + path + "\" (treeish " + treeOid +
                ") should have been a pointer but was not";

    return f;
}

VerificationRun::VerificationRun(ostream &out, bool dryRun)
    : lock(), out(out), dryRun(dryRun), corruptOids(), corruptSet(),
      findings()
{
}

VerificationRun::~VerificationRun()
{
}

void
VerificationRun::report(const Finding &finding)
{
    MutexLocker l(lock);

    findings.push_back(finding);
    if (finding.isObjectFinding() && corruptSet.insert(finding.oid).second)
        corruptOids.push_back(finding.oid);

    out << finding.line() << "\n";
    out.flush();
    LOG("fsck: %s", finding.line().c_str());
}

void
VerificationRun::print(const string &line)
{
    MutexLocker l(lock);

    out << line << "\n";
    out.flush();
}

bool
VerificationRun::isOk()
{
    MutexLocker l(lock);

    return findings.empty();
}

bool
VerificationRun::isDryRun() const
{
    return dryRun;
}

vector<string>
VerificationRun::getCorruptOids()
{
    MutexLocker l(lock);

    return corruptOids;
}

vector<Finding>
VerificationRun::getFindings()
{
    MutexLocker l(lock);

    return findings;
}
