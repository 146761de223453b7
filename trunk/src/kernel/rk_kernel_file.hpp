//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_KERNEL_FILE_HPP
#define RK_KERNEL_FILE_HPP

#include <rk_core.hpp>

#include <string>

// The reader of a local file, for example, the config file.
// The fd is closed when reader destroyed.
class RkFileReader
{
private:
    std::string path_;
    int fd_;
public:
    RkFileReader();
    virtual ~RkFileReader();
public:
    // Open the file for reading, fail if already opened.
    virtual rk_error_t open(const std::string& path);
    // Close the file, the reader can be opened again.
    virtual void close();
    virtual bool is_open();
    // Read from current position to EOF, append to the content.
    virtual rk_error_t read_fully(std::string& content);
};

#endif
