#include "../include/value_coercer.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <new>

static std::string
to_std_string(const UA_String& _string) {
    if (_string.length == 0)
        return std::string();
    return std::string((const char*) _string.data, _string.length);
}

static std::string
format_floating(double _value, bool _single_precision) {
    if (std::isnan(_value))
        return "nan";
    if (std::isinf(_value))
        return _value < 0 ? "-inf" : "inf";
    int max_digits = _single_precision ? std::numeric_limits<float>::max_digits10 : std::numeric_limits<double>::max_digits10;
    char buffer[64];
    // Shortest text that parses back to the same value
    for (int precision = 1; precision <= max_digits; precision++) {
        snprintf(buffer, sizeof(buffer), "%.*g", precision, _value);
        if (_single_precision ? std::strtof(buffer, NULL) == (float) _value : std::strtod(buffer, NULL) == _value)
            break;
    }
    return std::string(buffer);
}

std::string
value_coercer::stringify(const UA_Variant& _variant) {
    if (UA_Variant_isEmpty(&_variant))
        return std::string();
    const void* data = _variant.data;
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_BOOLEAN]))
        return *(const UA_Boolean*) data ? "true" : "false";
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_SBYTE]))
        return std::to_string(*(const UA_SByte*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_BYTE]))
        return std::to_string(*(const UA_Byte*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_INT16]))
        return std::to_string(*(const UA_Int16*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_UINT16]))
        return std::to_string(*(const UA_UInt16*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_INT32]))
        return std::to_string(*(const UA_Int32*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_UINT32]))
        return std::to_string(*(const UA_UInt32*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_INT64]))
        return std::to_string(*(const UA_Int64*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_UINT64]))
        return std::to_string(*(const UA_UInt64*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_FLOAT]))
        return format_floating(*(const UA_Float*) data, true);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_DOUBLE]))
        return format_floating(*(const UA_Double*) data, false);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_STRING]))
        return to_std_string(*(const UA_String*) data);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_LOCALIZEDTEXT]))
        return to_std_string(((const UA_LocalizedText*) data)->text);
    if (UA_Variant_hasScalarType(&_variant, &UA_TYPES[UA_TYPES_QUALIFIEDNAME]))
        return to_std_string(((const UA_QualifiedName*) data)->name);

    /* Arrays and structured scalars */
    UA_String output;
    UA_String_init(&output);
    UA_StatusCode status = UA_print(&_variant, &UA_TYPES[UA_TYPES_VARIANT], &output);
    if (status != UA_STATUSCODE_GOOD)
        throw std::bad_alloc();
    std::string text = to_std_string(output);
    UA_String_clear(&output);
    return text;
}

long long
value_coercer::parse_integer(const std::string& _text, long long _min, long long _max, const char* _type_name) {
    size_t digits_begin = (!_text.empty() && (_text[0] == '+' || _text[0] == '-')) ? 1 : 0;
    if (digits_begin == _text.size())
        throw conversion_error(_text, _type_name);
    for (size_t i = digits_begin; i < _text.size(); i++) {
        if (!std::isdigit((unsigned char) _text[i]))
            throw conversion_error(_text, _type_name);
    }
    errno = 0;
    long long value = std::strtoll(_text.c_str(), NULL, 10);
    if (errno == ERANGE || value < _min || value > _max)
        throw conversion_error(_text, _type_name);
    return value;
}

double
value_coercer::parse_floating(const std::string& _text, bool _single_precision, const char* _type_name) {
    size_t begin = 0;
    size_t end = _text.size();
    while (begin < end && std::isspace((unsigned char) _text[begin]))
        begin++;
    while (end > begin && std::isspace((unsigned char) _text[end - 1]))
        end--;
    if (begin == end)
        throw conversion_error(_text, _type_name);
    std::string trimmed = _text.substr(begin, end - begin);
    char* parsed_end = NULL;
    double value = _single_precision ? std::strtof(trimmed.c_str(), &parsed_end) : std::strtod(trimmed.c_str(), &parsed_end);
    if (parsed_end != trimmed.c_str() + trimmed.size())
        throw conversion_error(_text, _type_name);
    return value;
}

template<>
std::string
value_coercer::parse<std::string>(const std::string& _text) {
    return _text;
}

template<>
UA_Int16
value_coercer::parse<UA_Int16>(const std::string& _text) {
    return (UA_Int16) parse_integer(_text, UA_INT16_MIN, UA_INT16_MAX, "Int16");
}

template<>
UA_Int32
value_coercer::parse<UA_Int32>(const std::string& _text) {
    return (UA_Int32) parse_integer(_text, UA_INT32_MIN, UA_INT32_MAX, "Int32");
}

template<>
UA_Float
value_coercer::parse<UA_Float>(const std::string& _text) {
    return (UA_Float) parse_floating(_text, true, "Float");
}

template<>
UA_Double
value_coercer::parse<UA_Double>(const std::string& _text) {
    return parse_floating(_text, false, "Double");
}

template<>
UA_Boolean
value_coercer::parse<UA_Boolean>(const std::string& _text) {
    std::string lowered(_text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char _c) { return (char) std::tolower(_c); });
    return lowered == "true" || lowered == "1";
}
