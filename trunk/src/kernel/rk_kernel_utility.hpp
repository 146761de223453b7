//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_KERNEL_UTILITY_HPP
#define RK_KERNEL_UTILITY_HPP

#include <rk_core.hpp>

#include <string>
#include <vector>

// Basic compare function.
#define rk_min(a, b) (((a) < (b))? (a) : (b))
#define rk_max(a, b) (((a) < (b))? (b) : (a))

// Parse the float value to string, precise is 2.
extern std::string rk_float2str(double value);

// Replace old_str to new_str of str
extern std::string rk_string_replace(std::string str, std::string old_str, std::string new_str);
// Remove char in remove_chars of str
extern std::string rk_string_remove(std::string str, std::string remove_chars);
// Whether string starts with
extern bool rk_string_starts_with(std::string str, std::string flag);
// Convert the string to upper case, for example, "rtmp.chunk_size" to "RTMP.CHUNK_SIZE".
extern std::string rk_string_to_upper(std::string str);

// Get the environment variable of key, the key is converted to env name,
// for example, "rtmp.chunk_size" reads the env RK_RTMP_CHUNK_SIZE.
// @remark If key starts with '$', the rest is used as env name directly.
extern std::string rk_getenv(const std::string& key);

// Generate random value, seeded by time and pid.
extern long rk_random();
// Generate random string in [0-9a-z] with len bytes.
extern std::string rk_random_str(int len);

// Convert hex string to data, for example, p=config='139056E5A0'
// The output data in hex {0x13, 0x90, 0x56, 0xe5, 0xa0} as such.
// @return the number of bytes, or -1 for invalid hex string.
extern int rk_hex_to_data(uint8_t* data, const char* p, int size);

// Dumps the bytes in hex string, for example, "00 00 02 0b".
extern std::string rk_string_dumps_hex(const char* str, int length);

// Narrow the AMF0 number to uint32, which saturates: NaN and negative to 0,
// larger than UINT32_MAX to UINT32_MAX, and drop the fraction.
extern uint32_t rk_number_to_uint32(double v);
// Narrow the AMF0 number to float, out of range values become +inf or -inf.
extern float rk_number_to_float(double v);

#endif
