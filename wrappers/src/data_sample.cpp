#include "../include/data_sample.hpp"
#include <new>
#include <utility>

ua_value::ua_value() {
    UA_Variant_init(&variant_);
}

ua_value::ua_value(const UA_Variant& _variant) {
    UA_Variant_init(&variant_);
    if (UA_Variant_copy(&_variant, &variant_) != UA_STATUSCODE_GOOD)
        throw std::bad_alloc();
}

ua_value::ua_value(const ua_value& _other) : ua_value(_other.variant_) {
}

ua_value::ua_value(ua_value&& _other) noexcept {
    variant_ = _other.variant_;
    UA_Variant_init(&_other.variant_);
}

ua_value& ua_value::operator= (const ua_value& _other) {
    if (this != &_other) {
        ua_value copy(_other);
        std::swap(variant_, copy.variant_);
    }
    return *this;
}

ua_value& ua_value::operator= (ua_value&& _other) noexcept {
    if (this != &_other) {
        UA_Variant_clear(&variant_);
        variant_ = _other.variant_;
        UA_Variant_init(&_other.variant_);
    }
    return *this;
}

ua_value::~ua_value() {
    UA_Variant_clear(&variant_);
}

ua_value
ua_value::from_scalar(const void* _value, const UA_DataType* _type) {
    ua_value value;
    if (UA_Variant_setScalarCopy(&value.variant_, _value, _type) != UA_STATUSCODE_GOOD)
        throw std::bad_alloc();
    return value;
}

ua_value
ua_value::from_string(const std::string& _text) {
    UA_String text;
    text.length = _text.size();
    text.data = (UA_Byte*) const_cast<char*>(_text.data());
    return from_scalar(&text, &UA_TYPES[UA_TYPES_STRING]);
}

const UA_Variant*
ua_value::get_variant() const {
    return &variant_;
}

bool
ua_value::is_empty() const {
    return UA_Variant_isEmpty(&variant_);
}

bool
ua_value::has_scalar_type(const UA_DataType* _type) const {
    return UA_Variant_hasScalarType(&variant_, _type);
}

const void*
ua_value::get_data() const {
    return variant_.data;
}

bool ua_value::operator== (const ua_value& _other) const {
    return UA_order(&variant_, &_other.variant_, &UA_TYPES[UA_TYPES_VARIANT]) == UA_ORDER_EQ;
}

bool ua_value::operator!= (const ua_value& _other) const {
    return !(*this == _other);
}

data_sample::data_sample() {
    UA_DataValue_init(&data_value_);
}

data_sample::data_sample(const UA_DataValue& _data_value) {
    UA_DataValue_init(&data_value_);
    if (assign(_data_value) != UA_STATUSCODE_GOOD)
        throw std::bad_alloc();
}

data_sample::data_sample(const data_sample& _other) : data_sample(_other.data_value_) {
}

data_sample::data_sample(data_sample&& _other) noexcept {
    data_value_ = _other.data_value_;
    UA_DataValue_init(&_other.data_value_);
}

data_sample& data_sample::operator= (const data_sample& _other) {
    if (this != &_other) {
        data_sample copy(_other);
        std::swap(data_value_, copy.data_value_);
    }
    return *this;
}

data_sample& data_sample::operator= (data_sample&& _other) noexcept {
    if (this != &_other) {
        UA_DataValue_clear(&data_value_);
        data_value_ = _other.data_value_;
        UA_DataValue_init(&_other.data_value_);
    }
    return *this;
}

data_sample::~data_sample() {
    UA_DataValue_clear(&data_value_);
}

UA_StatusCode
data_sample::assign(const UA_DataValue& _data_value) {
    UA_DataValue_clear(&data_value_);
    return UA_DataValue_copy(&_data_value, &data_value_);
}

ua_value
data_sample::get_value() const {
    if (!data_value_.hasValue)
        return ua_value();
    return ua_value(data_value_.value);
}

UA_StatusCode
data_sample::get_status() const {
    return data_value_.hasStatus ? data_value_.status : UA_STATUSCODE_GOOD;
}

bool
data_sample::has_source_timestamp() const {
    return data_value_.hasSourceTimestamp;
}

UA_DateTime
data_sample::get_source_timestamp() const {
    return data_value_.sourceTimestamp;
}

bool
data_sample::has_server_timestamp() const {
    return data_value_.hasServerTimestamp;
}

UA_DateTime
data_sample::get_server_timestamp() const {
    return data_value_.serverTimestamp;
}
