//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_UTEST_CONFIG_HPP
#define RK_UTEST_CONFIG_HPP

/*
#include <rk_utest_config.hpp>
*/
#include <rk_utest.hpp>

#include <map>
#include <string>

#include <rk_app_config.hpp>

class MockRkConfig : public RkConfig
{
public:
    MockRkConfig();
    virtual ~MockRkConfig();
private:
    std::map<std::string, std::string> included_files;
public:
    // Parse and check the config from string.
    virtual rk_error_t parse(std::string buf);
    virtual rk_error_t mock_include(const std::string file_name, const std::string content);
protected:
    virtual rk_error_t build_buffer(std::string src, rk_internal::RkConfigBuffer** pbuffer);
};

// Set the env of config key, for example, rtmp.chunk_size for RK_RTMP_CHUNK_SIZE,
// which is unset when destroyed.
class IRkSetEnvConfig
{
private:
    std::string key;
public:
    IRkSetEnvConfig(const std::string& k, const std::string& v, bool overwrite) {
        key = k;
        rk_setenv(k, v, overwrite);
    }
    virtual ~IRkSetEnvConfig() {
        rk_unsetenv(key);
    }
private:
    // Adds, changes environment variables, which may starts with $.
    int rk_setenv(const std::string& key, const std::string& value, bool overwrite);
    // Deletes environment variables, which may starts with $.
    int rk_unsetenv(const std::string& key);
};

#define RkSetEnvConfig(instance, key, value) \
    IRkSetEnvConfig _RK_free_##instance(key, value, true)

#endif

