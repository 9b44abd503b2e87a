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

#ifndef __LFS_GITPROCESS_H__
#define __LFS_GITPROCESS_H__

#include <stdint.h>
#include <sys/types.h>

#include <string>
#include <vector>

/*
 * A git subprocess with pipes to its stdin and stdout.  Stderr is spooled to
 * an unlinked temporary file and attached to the error raised when git exits
 * unsuccessfully.
 */
class GitProcess
{
public:
    GitProcess(const std::string &dir, const std::vector<std::string> &args);
    ~GitProcess();

    void start();
    /// Returns false at end of output
    bool readLine(std::string &line, char delim = '\n');
    /// Throws LFSEC_GITFAILED if the output ends first
    void readExact(size_t len, std::string &buf);
    void write(const std::string &data);
    void closeStdin();
    /// Throws LFSEC_GITFAILED unless git exits with status 0
    void wait();
    /// Returns the exit status, -1 if git was killed by a signal
    int finish();
    std::string errorOutput();
    std::string command() const;

    /// Run to completion and return stdout
    static std::string run(const std::string &dir,
                           const std::vector<std::string> &args);
    /// Run to completion and return the exit status
    static int tryRun(const std::string &dir,
                      const std::vector<std::string> &args,
                      std::string &out);
private:
    GitProcess(const GitProcess &);
    GitProcess &operator=(const GitProcess &);
    bool fill();
    void reap(int &status);

    std::string dir;
    std::vector<std::string> args;
    pid_t childPid;
    int fdToChild;
    int fdFromChild;
    int fdErr;
    std::string rbuf;
    size_t rpos;
    bool eof;
};

#endif /* __LFS_GITPROCESS_H__ */
