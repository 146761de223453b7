//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_kernel_utility.hpp>

#include <unistd.h>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <math.h>
#include <float.h>
#include <sys/time.h>

#include <vector>
using namespace std;

#include <rk_kernel_log.hpp>
#include <rk_kernel_error.hpp>

string rk_float2str(double value)
{
    char tmp[32];
    snprintf(tmp, sizeof(tmp), "%.2f", value);
    return tmp;
}

string rk_string_replace(string str, string old_str, string new_str)
{
    std::string ret = str;

    if (old_str == new_str || old_str.empty()) {
        return ret;
    }

    size_t pos = 0;
    while ((pos = ret.find(old_str, pos)) != std::string::npos) {
        ret = ret.replace(pos, old_str.length(), new_str);
        pos += new_str.length();
    }

    return ret;
}

string rk_string_remove(string str, string remove_chars)
{
    std::string ret = str;

    for (int i = 0; i < (int)remove_chars.length(); i++) {
        char ch = remove_chars.at(i);

        for (std::string::iterator it = ret.begin(); it != ret.end();) {
            if (ch == *it) {
                it = ret.erase(it);
            } else {
                ++it;
            }
        }
    }

    return ret;
}

bool rk_string_starts_with(string str, string flag)
{
    return str.find(flag) == 0;
}

string rk_string_to_upper(string str)
{
    std::string ret = str;

    for (int i = 0; i < (int)ret.length(); i++) {
        char ch = ret.at(i);
        if (ch >= 'a' && ch <= 'z') {
            ret[i] = ch - 'a' + 'A';
        }
    }

    return ret;
}

string rk_getenv(const string& key)
{
    string ekey = key;
    if (rk_string_starts_with(key, "$")) {
        ekey = key.substr(1);
    } else {
        ekey = "RK_" + rk_string_to_upper(rk_string_replace(key, ".", "_"));
    }

    if (ekey.empty()) {
        return "";
    }

    char* value = ::getenv(ekey.c_str());
    if (value) {
        return value;
    }

    return "";
}

long rk_random()
{
    static bool _random_initialized = false;
    if (!_random_initialized) {
        _random_initialized = true;

        timeval tv;
        gettimeofday(&tv, NULL);
        ::srandom((unsigned long)((tv.tv_sec * 1000000 + tv.tv_usec) | (::getpid()<<13)));
    }

    return random();
}

string rk_random_str(int len)
{
    static string random_table = "01234567890123456789012345678901234567890123456789abcdefghijklmnopqrstuvwxyz";

    string ret;
    ret.reserve(len);
    for (int i = 0; i < len; ++i) {
        ret.append(1, random_table[rk_random() % random_table.size()]);
    }

    return ret;
}

static int rk_hex_to_num(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

int rk_hex_to_data(uint8_t* data, const char* p, int size)
{
    if (!p || size <= 0 || (size % 2) == 1) {
        return -1;
    }

    for (int i = 0; i < size / 2; i++) {
        int high = rk_hex_to_num(p[i * 2]);
        int low = rk_hex_to_num(p[i * 2 + 1]);
        if (high < 0 || low < 0) {
            return -1;
        }

        data[i] = (uint8_t)((high << 4) | low);
    }

    return size / 2;
}

string rk_string_dumps_hex(const char* str, int length)
{
    if (!str || length <= 0) {
        return "";
    }

    string ret;
    ret.reserve(length * 3);

    char tmp[4];
    for (int i = 0; i < length; i++) {
        snprintf(tmp, sizeof(tmp), "%02x", (uint8_t)str[i]);
        if (i > 0) {
            ret.append(" ");
        }
        ret.append(tmp, 2);
    }

    return ret;
}

uint32_t rk_number_to_uint32(double v)
{
    if (isnan(v) || v <= 0) {
        return 0;
    }

    if (v >= (double)UINT32_MAX) {
        return UINT32_MAX;
    }

    return (uint32_t)v;
}

float rk_number_to_float(double v)
{
    if (isnan(v)) {
        return (float)v;
    }

    if (v > FLT_MAX) {
        return (float)HUGE_VAL;
    }
    if (v < -FLT_MAX) {
        return (float)-HUGE_VAL;
    }

    return (float)v;
}
