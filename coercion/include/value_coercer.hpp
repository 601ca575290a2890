/**
 * @file value_coercer.hpp
 * @brief Converts variant values to text and text to primitive types.
 *
 * Typed reads go through text: the read value is stringified, then parsed into the target type.
 * Integers accept an optional sign followed by decimal digits only and are range checked.
 * Floating point values ignore surrounding whitespace and accept inf and nan.
 * Booleans are true for "true" (any case) or "1" and false for anything else.
 */
#ifndef VALUE_COERCER_HPP
#define VALUE_COERCER_HPP

#include <open62541/types.h>
#include <string>

#include "accessor_error.hpp"

class value_coercer {
public:
    /**
     * @brief Renders a variant as text. An empty variant yields an empty string.
     * 
     * @param _variant the variant.
     * @return std::string the text.
     */
    static std::string
    stringify(const UA_Variant& _variant);

    /**
     * @brief Parses text into the target type.
     * 
     * @tparam T one of std::string, UA_Int16, UA_Int32, UA_Float, UA_Double, UA_Boolean.
     * @param _text the text.
     * @return T the parsed value.
     * @throws conversion_error if the text is no valid T.
     */
    template<typename T>
    static T
    parse(const std::string& _text);

private:
    static long long
    parse_integer(const std::string& _text, long long _min, long long _max, const char* _type_name);

    static double
    parse_floating(const std::string& _text, bool _single_precision, const char* _type_name);
};

template<> std::string value_coercer::parse<std::string>(const std::string& _text);
template<> UA_Int16 value_coercer::parse<UA_Int16>(const std::string& _text);
template<> UA_Int32 value_coercer::parse<UA_Int32>(const std::string& _text);
template<> UA_Float value_coercer::parse<UA_Float>(const std::string& _text);
template<> UA_Double value_coercer::parse<UA_Double>(const std::string& _text);
template<> UA_Boolean value_coercer::parse<UA_Boolean>(const std::string& _text);

#endif // VALUE_COERCER_HPP
