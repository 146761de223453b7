//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_kernel_buffer.hpp>

#include <string.h>

using namespace std;

RkBuffer::RkBuffer(char* b, int nn)
{
    bytes_ = b;
    size_ = nn;
    pos_ = 0;
}

RkBuffer::~RkBuffer()
{
}

char* RkBuffer::head()
{
    return bytes_ + pos_;
}

int RkBuffer::size()
{
    return size_;
}

int RkBuffer::pos()
{
    return pos_;
}

int RkBuffer::left()
{
    return size_ - pos_;
}

bool RkBuffer::empty()
{
    return !bytes_ || pos_ >= size_;
}

bool RkBuffer::require(int required_size)
{
    return required_size >= 0 && required_size <= size_ - pos_;
}

void RkBuffer::skip(int size)
{
    rk_assert(bytes_);
    rk_assert(pos_ + size >= 0 && pos_ + size <= size_);

    pos_ += size;
}

uint64_t RkBuffer::read_be(int nn)
{
    rk_assert(require(nn));

    uint64_t value = 0;
    for (int i = 0; i < nn; i++) {
        value = (value << 8) | (uint8_t)bytes_[pos_++];
    }

    return value;
}

void RkBuffer::write_be(uint64_t value, int nn)
{
    rk_assert(require(nn));

    for (int i = nn - 1; i >= 0; i--) {
        bytes_[pos_++] = (char)(value >> (i * 8));
    }
}

int8_t RkBuffer::read_1bytes()
{
    return (int8_t)read_be(1);
}

int16_t RkBuffer::read_2bytes()
{
    return (int16_t)read_be(2);
}

int32_t RkBuffer::read_3bytes()
{
    return (int32_t)read_be(3);
}

int32_t RkBuffer::read_4bytes()
{
    return (int32_t)read_be(4);
}

int64_t RkBuffer::read_8bytes()
{
    return (int64_t)read_be(8);
}

string RkBuffer::read_string(int len)
{
    rk_assert(require(len));

    string value(bytes_ + pos_, len);
    pos_ += len;

    return value;
}

void RkBuffer::write_1bytes(int8_t value)
{
    write_be((uint8_t)value, 1);
}

void RkBuffer::write_2bytes(int16_t value)
{
    write_be((uint16_t)value, 2);
}

void RkBuffer::write_3bytes(int32_t value)
{
    write_be((uint32_t)value & 0xffffff, 3);
}

void RkBuffer::write_4bytes(int32_t value)
{
    write_be((uint32_t)value, 4);
}

void RkBuffer::write_8bytes(int64_t value)
{
    write_be((uint64_t)value, 8);
}

void RkBuffer::write_string(const string& value)
{
    if (value.empty()) {
        return;
    }

    rk_assert(require((int)value.length()));

    memcpy(bytes_ + pos_, value.data(), value.length());
    pos_ += (int)value.length();
}
