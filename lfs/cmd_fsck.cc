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

#include <getopt.h>

#include <string>
#include <vector>
#include <iostream>
#include <exception>

#include <lfsutil/debug.h>
#include <lfsutil/lfsutil.h>
#include <lfsutil/lfsstr.h>
#include <lfs/git.h>
#include <lfs/lfsconfig.h>
#include <lfs/lfsstorage.h>
#include <lfs/filepathfilter.h>
#include <lfs/scanrange.h>
#include <lfs/scanner.h>
#include <lfs/fsck.h>

using namespace std;

void
usage_fsck(void)
{
    cout << "lfs fsck [OPTIONS] [<ref> | <ref1>..<ref2>]" << endl;
    cout << endl;
    cout << "Check the large objects referenced by the given commits, or by"
         << endl;
    cout << "HEAD and the index when no ref is given, and the pointers that"
         << endl;
    cout << "name them.  Corrupt objects are moved to <storage>/bad." << endl;
    cout << endl;
    cout << "Options:" << endl;
    cout << "    -d, --dry-run  Report problems but do not move objects" << endl;
    cout << "    --objects      Check object contents" << endl;
    cout << "    --pointers     Check pointer canonicality" << endl;
    cout << "    -j, --jobs N   Hash objects on N threads" << endl;
    cout << endl;
    cout << "Exit status is 0 if all is well, 1 if problems were found and"
         << endl;
    cout << "2 on error." << endl;
}

#define OPT_OBJECTS     1000
#define OPT_POINTERS    1001

int
cmd_fsck(int argc, char * const argv[])
{
    int ch;
    bool jobsSet = false;
    uint64_t jobs = 1;
    FsckOptions opts;

    struct option longopts[] = {
        { "dry-run",    no_argument,        NULL,   'd' },
        { "objects",    no_argument,        NULL,   OPT_OBJECTS },
        { "pointers",   no_argument,        NULL,   OPT_POINTERS },
        { "jobs",       required_argument,  NULL,   'j' },
        { NULL,         0,                  NULL,   0   }
    };

    while ((ch = getopt_long(argc, argv, "dj:", longopts, NULL)) != -1) {
        switch (ch) {
            case 'd':
                opts.dryRun = true;
                break;
            case OPT_OBJECTS:
                opts.objects = true;
                break;
            case OPT_POINTERS:
                opts.pointers = true;
                break;
            case 'j':
                if (!LfsStr_ToUInt64(optarg, jobs) || jobs == 0 ||
                    jobs > 1024) {
                    cerr << "Invalid job count '" << optarg << "'" << endl;
                    return FSCK_EXIT_FATAL;
                }
                jobsSet = true;
                break;
            default:
                printf("Usage: lfs fsck [OPTIONS] [<ref> | <ref1>..<ref2>]\n");
                return FSCK_EXIT_FATAL;
        }
    }
    argc -= optind;
    argv += optind;

    vector<string> args;
    for (int i = 0; i < argc; i++)
        args.push_back(argv[i]);

    try {
        LfsCancel_InstallHandlers();

        LfsConfig config;
        config.load(".");

        LfsStorage storage(config.storageDir());
        bool trace = (getenv("LFS_TRACE") != NULL);
#ifdef DEBUG
        trace = true;
#endif
        if (trace && lfs_open_log(storage.logPath()) < 0)
            WARNING("Cannot open log %s", storage.logPath().c_str());

        opts.jobs = jobsSet ? (int)jobs : config.fsckJobs();

        GitRefResolver resolver(".");
        ScanRange range = ScanRange_Resolve(args, resolver);

        FilePathFilter fetchFilter(vector<string>(), config.fetchExclude());
        GitScanSource source(".", fetchFilter);

        LOG("fsck: store %s, range %s..%s%s",
            storage.getRootPath().c_str(), range.start.c_str(),
            range.end.c_str(), range.useIndex ? " + index" : "");

        return Fsck_Run(opts, range, source, storage, cout);
    } catch (std::exception &e) {
        cout.flush();
        cerr << "Error: " << e.what() << endl;
        LOG("fsck: %s", e.what());
        return FSCK_EXIT_FATAL;
    }
}
