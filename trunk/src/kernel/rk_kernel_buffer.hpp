//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_KERNEL_BUFFER_HPP
#define RK_KERNEL_BUFFER_HPP

#include <rk_core.hpp>

#include <sys/types.h>
#include <string>

// The cursor over bytes to read or write the integers in network order,
// which is big-endian, for the RTMP payload and AMF0 values.
// @remark The bytes are not owned by buffer.
// @remark User should check by require() before read or write, which asserts the size.
class RkBuffer
{
private:
    char* bytes_;
    int size_;
    // The offset of next byte to read or write.
    int pos_;
public:
    RkBuffer(char* b, int nn);
    ~RkBuffer();
public:
    // The current bytes, that is the bytes at pos().
    char* head();
    int size();
    int pos();
    // The bytes after pos(), size() minus pos().
    int left();
    bool empty();
    // Whether there are required_size bytes left, false for negative size.
    bool require(int required_size);
    // Move the pos forward, or backward for negative size.
    void skip(int size);
public:
    int8_t read_1bytes();
    int16_t read_2bytes();
    int32_t read_3bytes();
    int32_t read_4bytes();
    int64_t read_8bytes();
    std::string read_string(int len);
public:
    void write_1bytes(int8_t value);
    void write_2bytes(int16_t value);
    void write_3bytes(int32_t value);
    void write_4bytes(int32_t value);
    void write_8bytes(int64_t value);
    void write_string(const std::string& value);
private:
    // Read or write the nn bytes integer in big-endian.
    uint64_t read_be(int nn);
    void write_be(uint64_t value, int nn);
};

#endif
