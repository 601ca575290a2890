/**
 * @file data_sample.hpp
 * @brief Owning holders for variant values and timestamped read results.
 */
#ifndef DATA_SAMPLE_HPP
#define DATA_SAMPLE_HPP

#include <open62541/types.h>
#include <string>

/**
 * @brief Owns a deep copy of a UA_Variant.
 */
class ua_value {
private:
    UA_Variant variant_; /**< the owned variant. */
public:
    /**
     * @brief Constructs an empty value.
     * 
     */
    ua_value();

    /**
     * @brief Constructs a value by deep copying the given variant.
     * 
     * @param _variant the variant to copy.
     */
    explicit ua_value(const UA_Variant& _variant);

    ua_value(const ua_value& _other);

    ua_value(ua_value&& _other) noexcept;

    ua_value& operator= (const ua_value& _other);

    ua_value& operator= (ua_value&& _other) noexcept;

    ~ua_value();

    /**
     * @brief Creates a value holding a copy of a scalar.
     * 
     * @param _value the pointer to the scalar memory.
     * @param _type the data type of the scalar.
     * @return ua_value the type tagged value.
     */
    static ua_value
    from_scalar(const void* _value, const UA_DataType* _type);

    /**
     * @brief Creates a value holding a String scalar.
     * 
     * @param _text the string content.
     * @return ua_value the type tagged value.
     */
    static ua_value
    from_string(const std::string& _text);

    const UA_Variant*
    get_variant() const;

    bool
    is_empty() const;

    /**
     * @brief Returns whether the value is a scalar of the given type.
     * 
     * @param _type the data type to compare against.
     */
    bool
    has_scalar_type(const UA_DataType* _type) const;

    /**
     * @brief Returns the scalar data, only valid if has_scalar_type() holds for the expected type.
     * 
     * @return const void* the pointer to the scalar memory.
     */
    const void*
    get_data() const;

    /**
     * @brief Compares type and content with another value.
     */
    bool operator== (const ua_value& _other) const;

    bool operator!= (const ua_value& _other) const;
};

/**
 * @brief Owns a copy of a UA_DataValue returned by a read, i.e. value, status and timestamps.
 */
class data_sample {
private:
    UA_DataValue data_value_; /**< the owned data value. */
public:
    data_sample();

    /**
     * @brief Constructs a sample by deep copying the given data value.
     * 
     * @param _data_value the data value to copy.
     */
    explicit data_sample(const UA_DataValue& _data_value);

    data_sample(const data_sample& _other);

    data_sample(data_sample&& _other) noexcept;

    data_sample& operator= (const data_sample& _other);

    data_sample& operator= (data_sample&& _other) noexcept;

    ~data_sample();

    /**
     * @brief Replaces the content by a deep copy of the given data value.
     * 
     * @param _data_value the data value to copy.
     * @return UA_StatusCode the status code of the copy.
     */
    UA_StatusCode
    assign(const UA_DataValue& _data_value);

    /**
     * @brief Returns the value, an empty value if the server returned none.
     * 
     * @return ua_value the value.
     */
    ua_value
    get_value() const;

    /**
     * @brief Returns the status of the read, UA_STATUSCODE_GOOD if the server omitted it.
     * 
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    get_status() const;

    bool
    has_source_timestamp() const;

    UA_DateTime
    get_source_timestamp() const;

    bool
    has_server_timestamp() const;

    UA_DateTime
    get_server_timestamp() const;
};

#endif // DATA_SAMPLE_HPP
