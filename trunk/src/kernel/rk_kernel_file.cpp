//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_kernel_file.hpp>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
using namespace std;

#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>

#define RK_FILE_READ_CHUNK 4096

RkFileReader::RkFileReader()
{
    fd_ = -1;
}

RkFileReader::~RkFileReader()
{
    close();
}

rk_error_t RkFileReader::open(const string& path)
{
    if (fd_ >= 0) {
        return rk_error_new(ERROR_SYSTEM_FILE_OPENE, "reopen %s, opened %s", path.c_str(), path_.c_str());
    }

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return rk_error_new(ERROR_SYSTEM_FILE_OPENE, "open %s, errno=%d", path.c_str(), errno);
    }

    fd_ = fd;
    path_ = path;

    return rk_success;
}

void RkFileReader::close()
{
    if (fd_ < 0) {
        return;
    }

    if (::close(fd_) < 0) {
        rk_warn("close %s, errno=%d", path_.c_str(), errno);
    }

    fd_ = -1;
    path_ = "";
}

bool RkFileReader::is_open()
{
    return fd_ >= 0;
}

rk_error_t RkFileReader::read_fully(string& content)
{
    if (fd_ < 0) {
        return rk_error_new(ERROR_SYSTEM_FILE_READ, "read closed file");
    }

    char buf[RK_FILE_READ_CHUNK];
    while (true) {
        ssize_t nn = ::read(fd_, buf, sizeof(buf));
        if (nn < 0 && errno == EINTR) {
            continue;
        }
        if (nn < 0) {
            return rk_error_new(ERROR_SYSTEM_FILE_READ, "read %s at %d, errno=%d", path_.c_str(), (int)content.size(), errno);
        }
        if (nn == 0) {
            break;
        }
        content.append(buf, (size_t)nn);
    }

    return rk_success;
}
