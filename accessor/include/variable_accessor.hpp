/**
 * @file variable_accessor.hpp
 * @brief Synchronous read/write access to the variables of one OPC UA server.
 *
 * @details
 * The accessor is a synchronous facade over an asynchronous core: every public call posts a
 * single request to a request_dispatcher and blocks the calling thread until its future resolves.
 * Variable names are addressed in the fixed namespace VARIABLE_NAMESPACE_INDEX with a string
 * identifier equal to the name, in the read and the write path alike.
 *
 * Requests on one accessor never overlap: they run one after another on the dispatcher's
 * worker thread. Callers sharing an accessor between threads are serialized, there is no
 * cancellation and no per-call timeout beyond the client's request timeout.
 *
 * Failures of connect, read and write are raised as accessor_error. Typed reads raise
 * conversion_error when the read text does not parse. shutdown() never raises.
 */
#ifndef VARIABLE_ACCESSOR_HPP
#define VARIABLE_ACCESSOR_HPP

#include <open62541/types.h>
#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "types.hpp"
#include "node_address.hpp"
#include "data_sample.hpp"
#include "ua_session.hpp"
#include "request_dispatcher.hpp"
#include "value_coercer.hpp"
#include "accessor_error.hpp"
#include "accessor_config.hpp"

using namespace opcua_driver;

class variable_accessor {
private:
    std::unique_ptr<ua_session> session_; /**< the client handle, only touched on the dispatcher's worker thread. */
    std::string endpoint_url_; /**< the endpoint url, empty for pre-built sessions. */
    request_dispatcher dispatcher_; /**< the dispatcher running the requests. */
    std::atomic<bool> shut_down_; /**< flag to indicate whether shutdown() already ran. */

    /**
     * @brief Builds the node address of a variable.
     *
     * @param _variable_name the variable name.
     * @return node_address the address.
     * @throws accessor_error if the name is empty.
     */
    node_address
    make_address(const std::string& _variable_name) const;

    /**
     * @brief Posts a request and blocks until it completes. Exceptions thrown by the request
     * are rethrown nested in an accessor_error describing _what.
     *
     * @tparam Result the result type of the request.
     * @param _request the request.
     * @param _what the description of the request for error messages.
     * @return Result the result of the request.
     */
    template<typename Result>
    Result
    dispatch_and_wait(std::function<Result()> _request, const std::string& _what) {
        std::future<Result> result = dispatcher_.dispatch<Result>(std::move(_request));
        try {
            return result.get();
        } catch (const std::exception& e) {
            std::throw_with_nested(accessor_error(_what + " failed: " + e.what(), UA_STATUSCODE_BADINTERNALERROR));
        }
    }

    /**
     * @brief Connects the session to the endpoint, blocking until done.
     *
     * @throws accessor_error if the connection cannot be established.
     */
    void
    connect();

public:
    /**
     * @brief Connects to opc.tcp://<host>:<port>, blocking until the session is activated.
     *
     * @param _host the server host name or address.
     * @param _port the server port.
     * @throws std::invalid_argument if the port is outside 1..65535.
     * @throws accessor_error if the connection cannot be established.
     */
    variable_accessor(std::string _host, UA_Int64 _port);

    /**
     * @brief Connects to the endpoint of the configuration using its timeout and log level.
     *
     * @param _config the configuration.
     * @throws accessor_error if the connection cannot be established.
     */
    explicit variable_accessor(const accessor_config& _config);

    /**
     * @brief Takes over an already connected session.
     *
     * @param _session the session.
     * @throws std::invalid_argument if the session is null.
     */
    explicit variable_accessor(std::unique_ptr<ua_session> _session);

    /**
     * @brief Shuts down if not done yet.
     *
     */
    ~variable_accessor();

    variable_accessor(const variable_accessor&) = delete;
    variable_accessor& operator= (const variable_accessor&) = delete;

    /**
     * @brief Reads a variable with status and source/server timestamps.
     *
     * @param _variable_name the variable name.
     * @return data_sample the read sample.
     * @throws accessor_error if the connection is down, the node does not exist or the read fails.
     */
    data_sample
    read_sample(const std::string& _variable_name);

    /**
     * @brief Reads the raw value of a variable.
     *
     * @param _variable_name the variable name.
     * @return ua_value the value.
     * @throws accessor_error if the connection is down, the node does not exist or the read fails.
     */
    ua_value
    read(const std::string& _variable_name);

    /**
     * @brief Reads a variable and converts its text into T.
     *
     * @tparam T one of std::string, UA_Int16, UA_Int32, UA_Float, UA_Double, UA_Boolean.
     * @param _variable_name the variable name.
     * @return T the converted value.
     * @throws accessor_error if the read fails.
     * @throws conversion_error if the value's text is no valid T.
     */
    template<typename T>
    T
    read_as(const std::string& _variable_name) {
        return value_coercer::parse<T>(read_string(_variable_name));
    }

    /**
     * @brief Reads a variable as text, an empty value yields an empty string.
     */
    std::string
    read_string(const std::string& _variable_name);

    UA_Int16
    read_short(const std::string& _variable_name);

    UA_Int32
    read_int(const std::string& _variable_name);

    UA_Float
    read_float(const std::string& _variable_name);

    UA_Double
    read_double(const std::string& _variable_name);

    /**
     * @brief Reads a variable as boolean: true for "true" (any case) or "1", false otherwise.
     */
    UA_Boolean
    read_bool(const std::string& _variable_name);

    /**
     * @brief Writes a type tagged value into a variable.
     *
     * @param _variable_name the variable name.
     * @param _value the value.
     * @throws accessor_error if the connection is down or the server rejects the write.
     */
    void
    write(const std::string& _variable_name, const ua_value& _value);

    void
    write(const std::string& _variable_name, UA_Boolean _value);

    void
    write(const std::string& _variable_name, UA_Int16 _value);

    void
    write(const std::string& _variable_name, UA_Int32 _value);

    void
    write(const std::string& _variable_name, UA_Int64 _value);

    void
    write(const std::string& _variable_name, UA_Float _value);

    void
    write(const std::string& _variable_name, UA_Double _value);

    void
    write(const std::string& _variable_name, const std::string& _value);

    void
    write(const std::string& _variable_name, const char* _value);

    /**
     * @brief Returns whether the session is activated. Blocks like any other request,
     * false once shut down.
     */
    bool
    is_connected();

    /**
     * @brief Returns the endpoint url, empty if the accessor was built from a session.
     */
    std::string
    get_endpoint_url() const;

    /**
     * @brief Disconnects and stops the dispatcher, blocking until done. Disconnect failures are
     * logged and never raised. Only the first call disconnects, also when several threads call
     * it at once. Reads and writes afterwards fail.
     *
     */
    void
    shutdown();
};

#endif // VARIABLE_ACCESSOR_HPP
