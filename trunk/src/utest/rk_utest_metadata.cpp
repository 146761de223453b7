//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//
#include <rk_utest.hpp>

#include <float.h>
#include <math.h>
#include <stdint.h>
#include <string>
using namespace std;

#include <rk_core_autofree.hpp>
#include <rk_kernel_error.hpp>
#include <rk_protocol_amf0.hpp>
#include <rk_rtmp_metadata.hpp>

VOID TEST(ProtocolMetadataTest, Optional)
{
    RkOptional<uint32_t> a;
    EXPECT_FALSE(a.has_value());

    RkOptional<uint32_t> b(0);
    EXPECT_TRUE(b.has_value());
    EXPECT_EQ(0, (int)b.value());

    // The absent never equals to any present one, even zero.
    EXPECT_TRUE(a != b);

    a.set(0);
    EXPECT_TRUE(a == b);

    a.reset();
    EXPECT_FALSE(a.has_value());
    EXPECT_TRUE(a == RkOptional<uint32_t>());
}

VOID TEST(ProtocolMetadataTest, FromObsProperties)
{
    RkAmf0Object* obj = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, obj);
    obj->set("duration", RkAmf0Any::number(0));
    obj->set("fileSize", RkAmf0Any::number(0));
    obj->set("width", RkAmf0Any::number(1280));
    obj->set("height", RkAmf0Any::number(720));
    obj->set("videocodecid", RkAmf0Any::number(7));
    obj->set("videodatarate", RkAmf0Any::number(2500));
    obj->set("framerate", RkAmf0Any::number(29.97));
    obj->set("audiocodecid", RkAmf0Any::number(10));
    obj->set("audiodatarate", RkAmf0Any::number(160));
    obj->set("audiosamplerate", RkAmf0Any::number(48000));
    obj->set("audiosamplesize", RkAmf0Any::number(16));
    obj->set("audiochannels", RkAmf0Any::number(2));
    obj->set("stereo", RkAmf0Any::boolean(true));
    obj->set("2.1", RkAmf0Any::boolean(false));
    obj->set("encoder", RkAmf0Any::str("obs-output module (libobs version 29.1.3)"));

    RkStreamMetadata meta;
    meta.from_properties(obj);
    EXPECT_EQ(11, meta.count());

    EXPECT_EQ(1280, (int)meta.video_width.value());
    EXPECT_EQ(720, (int)meta.video_height.value());
    EXPECT_EQ(7, meta.video_codec.value());
    EXPECT_EQ(2500, (int)meta.video_bitrate_kbps.value());
    EXPECT_FLOAT_EQ(29.97f, meta.video_frame_rate.value());
    EXPECT_EQ(10, meta.audio_codec.value());
    EXPECT_EQ(160, (int)meta.audio_bitrate_kbps.value());
    EXPECT_EQ(48000, (int)meta.audio_sample_rate.value());
    EXPECT_EQ(2, (int)meta.audio_channels.value());
    EXPECT_TRUE(meta.audio_is_stereo.value());
    EXPECT_STREQ("obs-output module (libobs version 29.1.3)", meta.encoder.value().c_str());
}

VOID TEST(ProtocolMetadataTest, ToAndFromProperties)
{
    RkStreamMetadata meta;
    meta.video_width.set(1920);
    meta.video_height.set(1080);
    meta.video_codec.set(1635148593); // avc1
    meta.video_frame_rate.set(60);
    meta.audio_sample_rate.set(44100);
    meta.audio_is_stereo.set(false);
    meta.encoder.set("Lavf59.27.100");

    RkAmf0Object* obj = meta.to_properties();
    RkAutoFree(RkAmf0Object, obj);

    // Only the present fields.
    EXPECT_EQ(7, obj->count());
    EXPECT_TRUE(rk_utest_find_property(obj, "videodatarate") == NULL);
    EXPECT_TRUE(rk_utest_find_property(obj, "audiochannels") == NULL);

    RkAmf0Any* prop = rk_utest_find_property(obj, "width");
    ASSERT_TRUE(prop && prop->is_number());
    EXPECT_EQ(1920, prop->to_number());

    prop = rk_utest_find_property(obj, "stereo");
    ASSERT_TRUE(prop && prop->is_boolean());
    EXPECT_FALSE(prop->to_boolean());

    prop = rk_utest_find_property(obj, "encoder");
    ASSERT_TRUE(prop && prop->is_string());
    EXPECT_STREQ("Lavf59.27.100", prop->to_str().c_str());

    RkStreamMetadata cp;
    cp.from_properties(obj);
    EXPECT_EQ(7, cp.count());
    EXPECT_TRUE(cp == meta);
}

VOID TEST(ProtocolMetadataTest, EmptyMetadata)
{
    RkStreamMetadata meta;
    EXPECT_EQ(0, meta.count());

    RkAmf0Object* obj = meta.to_properties();
    RkAutoFree(RkAmf0Object, obj);
    EXPECT_EQ(0, obj->count());

    RkStreamMetadata cp;
    cp.encoder.set("dirty");
    cp.from_properties(obj);
    EXPECT_EQ(0, cp.count());
    EXPECT_TRUE(cp == meta);
}

VOID TEST(ProtocolMetadataTest, MismatchedKind)
{
    RkAmf0Object* obj = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, obj);

    // The stereo must be boolean, and the others are still parsed.
    obj->set("stereo", RkAmf0Any::number(1));
    obj->set("width", RkAmf0Any::str("1280"));
    obj->set("encoder", RkAmf0Any::number(3));
    obj->set("framerate", RkAmf0Any::null());
    obj->set("audiochannels", RkAmf0Any::boolean(true));
    obj->set("height", RkAmf0Any::number(720));
    obj->set("audiosamplerate", RkAmf0Any::number(44100));

    RkStreamMetadata meta;
    meta.from_properties(obj);

    EXPECT_FALSE(meta.audio_is_stereo.has_value());
    EXPECT_FALSE(meta.video_width.has_value());
    EXPECT_FALSE(meta.encoder.has_value());
    EXPECT_FALSE(meta.video_frame_rate.has_value());
    EXPECT_FALSE(meta.audio_channels.has_value());

    EXPECT_EQ(2, meta.count());
    EXPECT_EQ(720, (int)meta.video_height.value());
    EXPECT_EQ(44100, (int)meta.audio_sample_rate.value());
}

VOID TEST(ProtocolMetadataTest, UnknownKeys)
{
    RkAmf0Object* obj = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, obj);
    obj->set("Width", RkAmf0Any::number(1280));
    obj->set("videokeyframe_frequency", RkAmf0Any::number(2));
    obj->set("metadatacreator", RkAmf0Any::str("rtmpkit"));

    RkStreamMetadata meta;
    meta.from_properties(obj);
    EXPECT_EQ(0, meta.count());

    // The unknown keys are dropped when dumped.
    meta.audio_codec.set(10);
    RkAmf0Object* dumped = meta.to_properties();
    RkAutoFree(RkAmf0Object, dumped);
    ASSERT_EQ(1, dumped->count());
    EXPECT_STREQ("audiocodecid", dumped->key_at(0).c_str());
}

VOID TEST(ProtocolMetadataTest, Narrowing)
{
    RkAmf0Object* obj = RkAmf0Any::object();
    RkAutoFree(RkAmf0Object, obj);
    obj->set("width", RkAmf0Any::number(-1));
    obj->set("height", RkAmf0Any::number(1e12));
    obj->set("videodatarate", RkAmf0Any::number(2499.9));
    obj->set("audiodatarate", RkAmf0Any::number(NAN));
    obj->set("framerate", RkAmf0Any::number(1e300));

    RkStreamMetadata meta;
    meta.from_properties(obj);
    EXPECT_EQ(5, meta.count());

    EXPECT_EQ(0, (int)meta.video_width.value());
    EXPECT_EQ(UINT32_MAX, meta.video_height.value());
    EXPECT_EQ(2499, (int)meta.video_bitrate_kbps.value());
    EXPECT_EQ(0, (int)meta.audio_bitrate_kbps.value());
    EXPECT_GT(meta.video_frame_rate.value(), FLT_MAX);
}

VOID TEST(ProtocolMetadataTest, NotObject)
{
    RkStreamMetadata meta;
    meta.video_width.set(640);

    if (true) {
        RkAmf0Any* any = RkAmf0Any::number(1280);
        RkAutoFree(RkAmf0Any, any);
        meta.from_properties(any);
        EXPECT_EQ(0, meta.count());
    }

    if (true) {
        RkAmf0StrictArray* arr = RkAmf0Any::strict_array();
        RkAutoFree(RkAmf0StrictArray, arr);
        arr->append(RkAmf0Any::number(1280));
        meta.from_properties(arr);
        EXPECT_EQ(0, meta.count());
    }

    meta.from_properties(NULL);
    EXPECT_EQ(0, meta.count());
}

VOID TEST(ProtocolMetadataTest, EcmaArray)
{
    RkAmf0EcmaArray* arr = RkAmf0Any::ecma_array();
    RkAutoFree(RkAmf0EcmaArray, arr);
    arr->set("width", RkAmf0Any::number(854));
    arr->set("height", RkAmf0Any::number(480));
    arr->set("stereo", RkAmf0Any::boolean(false));

    RkStreamMetadata meta;
    meta.from_properties(arr);
    EXPECT_EQ(3, meta.count());
    EXPECT_EQ(854, (int)meta.video_width.value());
    EXPECT_EQ(480, (int)meta.video_height.value());
    EXPECT_FALSE(meta.audio_is_stereo.value());
}

VOID TEST(ProtocolMetadataTest, Equality)
{
    RkStreamMetadata a, b;
    EXPECT_TRUE(a == b);

    a.encoder.set("obs");
    EXPECT_FALSE(a == b);

    b.encoder.set("obs");
    EXPECT_TRUE(a == b);

    b.audio_channels.set(2);
    EXPECT_FALSE(a == b);

    b.clear();
    a.clear();
    EXPECT_TRUE(a == b);
    EXPECT_EQ(0, a.count());
}
