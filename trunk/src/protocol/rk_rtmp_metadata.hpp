//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_RTMP_METADATA_HPP
#define RK_RTMP_METADATA_HPP

#include <rk_core.hpp>

#include <string>

class RkAmf0Any;
class RkAmf0Object;

// A value which may be absent.
template<typename T>
class RkOptional
{
private:
    bool has_value_;
    T value_;
public:
    RkOptional() : has_value_(false), value_() {
    }
    RkOptional(const T& v) : has_value_(true), value_(v) {
    }
public:
    bool has_value() const {
        return has_value_;
    }
    // @remark assert the value is present.
    const T& value() const {
        rk_assert(has_value_);
        return value_;
    }
    void set(const T& v) {
        has_value_ = true;
        value_ = v;
    }
    void reset() {
        has_value_ = false;
        value_ = T();
    }
    bool operator==(const RkOptional<T>& o) const {
        if (has_value_ != o.has_value_) {
            return false;
        }
        return !has_value_ || value_ == o.value_;
    }
    bool operator!=(const RkOptional<T>& o) const {
        return !(*this == o);
    }
};

// The metadata of stream, advertised by the encoder in onMetaData.
// Each field is absent when the encoder doesn't advertise it.
class RkStreamMetadata
{
public:
    // The video resolution in pixels.
    RkOptional<uint32_t> video_width;
    RkOptional<uint32_t> video_height;
    // The codec id, for example, 7 for AVC, or the fourcc as number.
    RkOptional<double> video_codec;
    RkOptional<float> video_frame_rate;
    RkOptional<uint32_t> video_bitrate_kbps;
    // The codec id, for example, 10 for AAC.
    RkOptional<double> audio_codec;
    RkOptional<uint32_t> audio_bitrate_kbps;
    RkOptional<uint32_t> audio_sample_rate;
    RkOptional<uint32_t> audio_channels;
    RkOptional<bool> audio_is_stereo;
    // For example, "obs-output module (libobs version 29.1.3)".
    RkOptional<std::string> encoder;
public:
    RkStreamMetadata();
    virtual ~RkStreamMetadata();
public:
    // Reset all fields to absent.
    virtual void clear();
    // Load the fields from AMF0 object or ECMA array, the previous fields are reset.
    // The wrongly typed properties are ignored, as are the unknown ones.
    // @remark Never fail, any other AMF0 value yields an empty metadata.
    virtual void from_properties(RkAmf0Any* properties);
    // Dump the present fields to a new AMF0 object, user must free it.
    virtual RkAmf0Object* to_properties();
    // The number of present fields.
    virtual int count();
public:
    bool operator==(const RkStreamMetadata& o) const;
};

#endif
