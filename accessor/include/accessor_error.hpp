/**
 * @file accessor_error.hpp
 * @brief Exceptions raised by the variable accessor.
 */
#ifndef ACCESSOR_ERROR_HPP
#define ACCESSOR_ERROR_HPP

#include <open62541/types.h>
#include <stdexcept>
#include <string>

/**
 * @brief A failed connect, read or write. Carries the status code reported by the stack.
 */
class accessor_error : public std::runtime_error {
private:
    UA_StatusCode status_code_; /**< the status code of the failed request. */
public:
    accessor_error(const std::string& _message, UA_StatusCode _status_code) :
        std::runtime_error(_message + " (" + UA_StatusCode_name(_status_code) + ")"), status_code_(_status_code) {
    }

    UA_StatusCode get_status_code() const {
        return status_code_;
    }
};

/**
 * @brief A value whose text cannot be parsed into the requested type.
 */
class conversion_error : public std::invalid_argument {
private:
    std::string text_; /**< the unparsable text. */
    std::string target_type_; /**< the requested type name. */
public:
    conversion_error(const std::string& _text, const std::string& _target_type) :
        std::invalid_argument("Cannot convert \"" + _text + "\" to " + _target_type), text_(_text), target_type_(_target_type) {
    }

    const std::string& get_text() const {
        return text_;
    }

    const std::string& get_target_type() const {
        return target_type_;
    }
};

#endif // ACCESSOR_ERROR_HPP
