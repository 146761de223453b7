//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_core.hpp>

using namespace std;

RkContextId::RkContextId()
{
}

RkContextId::RkContextId(const RkContextId& cp)
{
    v_ = cp.v_;
}

RkContextId& RkContextId::operator=(const RkContextId& cp)
{
    v_ = cp.v_;
    return *this;
}

RkContextId::~RkContextId()
{
}

const char* RkContextId::c_str() const
{
    return v_.c_str();
}

bool RkContextId::empty() const
{
    return v_.empty();
}

int RkContextId::compare(const RkContextId& to) const
{
    return v_.compare(to.v_);
}

RkContextId& RkContextId::set_value(const std::string& v)
{
    v_ = v;
    return *this;
}
