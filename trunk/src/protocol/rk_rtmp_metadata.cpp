//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#include <rk_rtmp_metadata.hpp>

using namespace std;

#include <rk_kernel_log.hpp>
#include <rk_kernel_utility.hpp>
#include <rk_protocol_amf0.hpp>

// The AMF0 kind of the property for a metadata field.
enum RkMetadataFieldKind
{
    RkMetadataFieldNumber = 0,
    RkMetadataFieldBoolean,
    RkMetadataFieldString,
};

template<RkOptional<uint32_t> RkStreamMetadata::*F>
void rk_metadata_load_u32(RkStreamMetadata* m, RkAmf0Any* v)
{
    (m->*F).set(rk_number_to_uint32(v->to_number()));
}

template<RkOptional<uint32_t> RkStreamMetadata::*F>
RkAmf0Any* rk_metadata_dump_u32(RkStreamMetadata* m)
{
    return RkAmf0Any::number((double)(m->*F).value());
}

template<RkOptional<float> RkStreamMetadata::*F>
void rk_metadata_load_float(RkStreamMetadata* m, RkAmf0Any* v)
{
    (m->*F).set(rk_number_to_float(v->to_number()));
}

template<RkOptional<float> RkStreamMetadata::*F>
RkAmf0Any* rk_metadata_dump_float(RkStreamMetadata* m)
{
    return RkAmf0Any::number((double)(m->*F).value());
}

template<RkOptional<double> RkStreamMetadata::*F>
void rk_metadata_load_number(RkStreamMetadata* m, RkAmf0Any* v)
{
    (m->*F).set(v->to_number());
}

template<RkOptional<double> RkStreamMetadata::*F>
RkAmf0Any* rk_metadata_dump_number(RkStreamMetadata* m)
{
    return RkAmf0Any::number((m->*F).value());
}

template<RkOptional<bool> RkStreamMetadata::*F>
void rk_metadata_load_boolean(RkStreamMetadata* m, RkAmf0Any* v)
{
    (m->*F).set(v->to_boolean());
}

template<RkOptional<bool> RkStreamMetadata::*F>
RkAmf0Any* rk_metadata_dump_boolean(RkStreamMetadata* m)
{
    return RkAmf0Any::boolean((m->*F).value());
}

template<RkOptional<std::string> RkStreamMetadata::*F>
void rk_metadata_load_string(RkStreamMetadata* m, RkAmf0Any* v)
{
    (m->*F).set(v->to_str());
}

template<RkOptional<std::string> RkStreamMetadata::*F>
RkAmf0Any* rk_metadata_dump_string(RkStreamMetadata* m)
{
    return RkAmf0Any::str((m->*F).value().c_str());
}

template<typename T, RkOptional<T> RkStreamMetadata::*F>
bool rk_metadata_present(const RkStreamMetadata* m)
{
    return (m->*F).has_value();
}

template<typename T, RkOptional<T> RkStreamMetadata::*F>
void rk_metadata_reset(RkStreamMetadata* m)
{
    (m->*F).reset();
}

template<typename T, RkOptional<T> RkStreamMetadata::*F>
bool rk_metadata_equals(const RkStreamMetadata* a, const RkStreamMetadata* b)
{
    return (a->*F) == (b->*F);
}

// The field of metadata, mapping to a property of onMetaData.
struct RkMetadataField
{
    const char* key;
    RkMetadataFieldKind kind;
    // Load the field from the property, which is the kind.
    void (*load)(RkStreamMetadata* m, RkAmf0Any* v);
    // Create the property from the field, which must be present.
    RkAmf0Any* (*dump)(RkStreamMetadata* m);
    bool (*present)(const RkStreamMetadata* m);
    void (*reset)(RkStreamMetadata* m);
    bool (*equals)(const RkStreamMetadata* a, const RkStreamMetadata* b);
};

#define RK_METADATA_FIELD(key, kind, type, codec, field) \
    { key, kind, \
      rk_metadata_load_##codec<&RkStreamMetadata::field>, \
      rk_metadata_dump_##codec<&RkStreamMetadata::field>, \
      rk_metadata_present<type, &RkStreamMetadata::field>, \
      rk_metadata_reset<type, &RkStreamMetadata::field>, \
      rk_metadata_equals<type, &RkStreamMetadata::field> }

static RkMetadataField _rk_metadata_fields[] = {
    RK_METADATA_FIELD("width", RkMetadataFieldNumber, uint32_t, u32, video_width),
    RK_METADATA_FIELD("height", RkMetadataFieldNumber, uint32_t, u32, video_height),
    RK_METADATA_FIELD("videocodecid", RkMetadataFieldNumber, double, number, video_codec),
    RK_METADATA_FIELD("videodatarate", RkMetadataFieldNumber, uint32_t, u32, video_bitrate_kbps),
    RK_METADATA_FIELD("framerate", RkMetadataFieldNumber, float, float, video_frame_rate),
    RK_METADATA_FIELD("audiocodecid", RkMetadataFieldNumber, double, number, audio_codec),
    RK_METADATA_FIELD("audiodatarate", RkMetadataFieldNumber, uint32_t, u32, audio_bitrate_kbps),
    RK_METADATA_FIELD("audiosamplerate", RkMetadataFieldNumber, uint32_t, u32, audio_sample_rate),
    RK_METADATA_FIELD("audiochannels", RkMetadataFieldNumber, uint32_t, u32, audio_channels),
    RK_METADATA_FIELD("stereo", RkMetadataFieldBoolean, bool, boolean, audio_is_stereo),
    RK_METADATA_FIELD("encoder", RkMetadataFieldString, std::string, string, encoder),
};

static const int _rk_nb_metadata_fields = (int)(sizeof(_rk_metadata_fields) / sizeof(RkMetadataField));

static RkMetadataField* rk_metadata_field_find(const string& key)
{
    for (int i = 0; i < _rk_nb_metadata_fields; i++) {
        RkMetadataField* field = &_rk_metadata_fields[i];
        if (key == field->key) {
            return field;
        }
    }
    return NULL;
}

static bool rk_metadata_kind_matches(RkMetadataFieldKind kind, RkAmf0Any* v)
{
    switch (kind) {
        case RkMetadataFieldNumber: return v->is_number();
        case RkMetadataFieldBoolean: return v->is_boolean();
        case RkMetadataFieldString: return v->is_string();
    }
    return false;
}

static void rk_metadata_load_property(RkStreamMetadata* m, const string& key, RkAmf0Any* v)
{
    RkMetadataField* field = rk_metadata_field_find(key);
    if (!field) {
        rk_verbose("metadata ignore unknown property %s", key.c_str());
        return;
    }

    if (!v || !rk_metadata_kind_matches(field->kind, v)) {
        rk_verbose("metadata ignore property %s of invalid type", key.c_str());
        return;
    }

    field->load(m, v);
}

RkStreamMetadata::RkStreamMetadata()
{
}

RkStreamMetadata::~RkStreamMetadata()
{
}

void RkStreamMetadata::clear()
{
    for (int i = 0; i < _rk_nb_metadata_fields; i++) {
        _rk_metadata_fields[i].reset(this);
    }
}

void RkStreamMetadata::from_properties(RkAmf0Any* properties)
{
    clear();

    if (!properties || (!properties->is_object() && !properties->is_ecma_array())) {
        rk_verbose("metadata ignore properties of invalid type");
        return;
    }

    RkAmf0Map* props = properties->to_map();
    for (int i = 0; i < props->count(); i++) {
        rk_metadata_load_property(this, props->key_at(i), props->value_at(i));
    }
}

RkAmf0Object* RkStreamMetadata::to_properties()
{
    RkAmf0Object* obj = RkAmf0Any::object();

    for (int i = 0; i < _rk_nb_metadata_fields; i++) {
        RkMetadataField* field = &_rk_metadata_fields[i];
        if (field->present(this)) {
            obj->set(field->key, field->dump(this));
        }
    }

    return obj;
}

int RkStreamMetadata::count()
{
    int nn = 0;
    for (int i = 0; i < _rk_nb_metadata_fields; i++) {
        if (_rk_metadata_fields[i].present(this)) {
            nn++;
        }
    }
    return nn;
}

bool RkStreamMetadata::operator==(const RkStreamMetadata& o) const
{
    for (int i = 0; i < _rk_nb_metadata_fields; i++) {
        if (!_rk_metadata_fields[i].equals(this, &o)) {
            return false;
        }
    }
    return true;
}
