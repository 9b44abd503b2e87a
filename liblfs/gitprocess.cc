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
#include <fcntl.h>
#include <signal.h>
#include <errno.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <string>
#include <vector>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfsstr.h>
#include <lfsutil/runtimeexception.h>
#include <lfsutil/systemexception.h>
#include <lfs/gitprocess.h>

#include "tuneables.h"

using namespace std;

#define D_READ  0
#define D_WRITE 1

/*
 * Our ends of every pipe must stay out of other git children, or a sibling
 * holds a co-process's stdin open and it never sees EOF.
 */
static void
setCloseOnExec(int fd)
{
    int flags = fcntl(fd, F_GETFD);

    if (flags < 0 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0)
        throw SystemException(errno, "fcntl(FD_CLOEXEC)");
}

/// dup2 onto itself keeps FD_CLOEXEC, so clear it by hand
static int
moveFd(int fd, int target)
{
    if (fd == target) {
        int flags = fcntl(fd, F_GETFD);
        if (flags < 0)
            return -1;
        return fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC);
    }

    return dup2(fd, target);
}

/// Git exits early when we are interrupted, report the interruption
static void
throwGitFailed(const string &msg)
{
    if (LfsCancel_Requested())
        throw RuntimeException(LFSEC_INTERRUPTED, "Interrupted");

    throw RuntimeException(LFSEC_GITFAILED, msg);
}

GitProcess::GitProcess(const string &dir, const vector<string> &args)
    : dir(dir), args(args), childPid(-1), fdToChild(-1), fdFromChild(-1),
      fdErr(-1), rbuf(), rpos(0), eof(false)
{
}

/*
 * A process that was never waited for is killed.  This happens when a scan
 * is abandoned after an error.
 */
GitProcess::~GitProcess()
{
    if (fdToChild != -1)
        close(fdToChild);
    if (fdFromChild != -1)
        close(fdFromChild);
    if (childPid > 0) {
        int status;
        kill(childPid, SIGTERM);
        while (waitpid(childPid, &status, 0) < 0 && errno == EINTR)
            ;
    }
    if (fdErr != -1)
        close(fdErr);
}

string
GitProcess::command() const
{
    return "git " + LfsStr_Join(args, ' ');
}

void
GitProcess::start()
{
    int pipe_to_child[2], pipe_from_child[2];
    char errTemplate[] = "/tmp/lfs-git-stderr.XXXXXX";

    DLOG("git -C %s %s", dir.c_str(), LfsStr_Join(args, ' ').c_str());

    fdErr = mkstemp(errTemplate);
    if (fdErr < 0)
        throw SystemException(errno, "mkstemp");
    unlink(errTemplate);
    setCloseOnExec(fdErr);

    if (pipe(pipe_to_child) < 0)
        throw SystemException(errno, "pipe");
    if (pipe(pipe_from_child) < 0) {
        int err = errno;
        close(pipe_to_child[D_READ]);
        close(pipe_to_child[D_WRITE]);
        throw SystemException(err, "pipe");
    }
    try {
        for (int i = 0; i < 2; i++) {
            setCloseOnExec(pipe_to_child[i]);
            setCloseOnExec(pipe_from_child[i]);
        }
    } catch (SystemException &e) {
        close(pipe_to_child[D_READ]);
        close(pipe_to_child[D_WRITE]);
        close(pipe_from_child[D_READ]);
        close(pipe_from_child[D_WRITE]);
        throw;
    }

    // Build argv before forking, the child must not allocate
    vector<const char *> argv;
    argv.push_back("git");
    argv.push_back("-C");
    argv.push_back(dir.c_str());
    for (size_t i = 0; i < args.size(); i++)
        argv.push_back(args[i].c_str());
    argv.push_back(NULL);

    childPid = fork();
    if (childPid < 0) {
        int err = errno;
        close(pipe_to_child[D_READ]);
        close(pipe_to_child[D_WRITE]);
        close(pipe_from_child[D_READ]);
        close(pipe_from_child[D_WRITE]);
        throw SystemException(err, "fork");
    }
    else if (childPid == 0) {
        // This is the child process
        close(pipe_to_child[D_WRITE]);
        close(pipe_from_child[D_READ]);

        // dup pipes into stdin/out, spool stderr
        if (moveFd(pipe_to_child[D_READ], STDIN_FILENO) < 0 ||
            moveFd(pipe_from_child[D_WRITE], STDOUT_FILENO) < 0 ||
            moveFd(fdErr, STDERR_FILENO) < 0) {
            _exit(127);
        }
        if (pipe_to_child[D_READ] != STDIN_FILENO)
            close(pipe_to_child[D_READ]);
        if (pipe_from_child[D_WRITE] != STDOUT_FILENO)
            close(pipe_from_child[D_WRITE]);
        if (fdErr != STDERR_FILENO)
            close(fdErr);

        signal(SIGPIPE, SIG_DFL);
        execvp("git", (char * const *)&argv[0]);
        fprintf(stderr, "execvp git: %s\n", strerror(errno));
        _exit(127);
    }

    // This is the parent
    close(pipe_to_child[D_READ]);
    close(pipe_from_child[D_WRITE]);

    fdToChild = pipe_to_child[D_WRITE];
    fdFromChild = pipe_from_child[D_READ];
}

bool
GitProcess::fill()
{
    char buf[PIPE_BUFSZ];

    if (eof)
        return false;

    if (rpos > 0) {
        rbuf.erase(0, rpos);
        rpos = 0;
    }

    while (1) {
        ssize_t n = read(fdFromChild, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw SystemException(errno, "read(" + command() + ")");
        }
        if (n == 0) {
            eof = true;
            return false;
        }
        rbuf.append(buf, n);
        return true;
    }
}

bool
GitProcess::readLine(string &line, char delim)
{
    while (1) {
        size_t end = rbuf.find(delim, rpos);
        if (end != rbuf.npos) {
            line = rbuf.substr(rpos, end - rpos);
            rpos = end + 1;
            return true;
        }
        if (!fill())
            break;
    }

    if (rpos < rbuf.size()) {
        line = rbuf.substr(rpos);
        rpos = rbuf.size();
        return true;
    }

    return false;
}

void
GitProcess::readExact(size_t len, string &buf)
{
    while (rbuf.size() - rpos < len) {
        if (!fill())
            throwGitFailed("Short read from " + command());
    }

    buf = rbuf.substr(rpos, len);
    rpos += len;
}

void
GitProcess::write(const string &data)
{
    size_t off = 0;

    while (off < data.size()) {
        ssize_t n = ::write(fdToChild, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw SystemException(errno, "write(" + command() + ")");
        }
        off += n;
    }
}

void
GitProcess::closeStdin()
{
    if (fdToChild != -1) {
        close(fdToChild);
        fdToChild = -1;
    }
}

string
GitProcess::errorOutput()
{
    string rval;
    char buf[4096];
    ssize_t n;

    if (fdErr == -1 || lseek(fdErr, 0, SEEK_SET) < 0)
        return rval;

    while ((n = read(fdErr, buf, sizeof(buf))) > 0)
        rval.append(buf, n);

    return LfsStr_Trim(rval);
}

void
GitProcess::reap(int &status)
{
    closeStdin();
    if (fdFromChild != -1) {
        close(fdFromChild);
        fdFromChild = -1;
    }

    while (waitpid(childPid, &status, 0) < 0) {
        if (errno != EINTR)
            throw SystemException(errno, "waitpid");
    }
    childPid = -1;
}

int
GitProcess::finish()
{
    int status;

    // Drain the output so git does not die of SIGPIPE
    while (fill())
        rpos = rbuf.size();

    reap(status);

    if (WIFEXITED(status))
        return WEXITSTATUS(status);

    return -1;
}

void
GitProcess::wait()
{
    int status = finish();

    if (status != 0) {
        string err = errorOutput();
        LOG("%s exited with %d: %s", command().c_str(), status, err.c_str());
        throwGitFailed(command() + " failed" +
                       (err.empty() ? "" : ": " + err));
    }
}

string
GitProcess::run(const string &dir, const vector<string> &args)
{
    GitProcess proc(dir, args);
    string rval;

    proc.start();
    proc.closeStdin();
    while (proc.fill())
        ;
    rval = proc.rbuf;
    proc.wait();

    return rval;
}

int
GitProcess::tryRun(const string &dir, const vector<string> &args, string &out)
{
    GitProcess proc(dir, args);

    proc.start();
    proc.closeStdin();
    while (proc.fill())
        ;
    out = proc.rbuf;

    return proc.finish();
}
