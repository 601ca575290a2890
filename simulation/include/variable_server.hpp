/**
 * @file variable_server.hpp
 * @brief In-process OPC UA server hosting string-identified variables in the variable namespace.
 *
 * Variables are added below the objects folder with node id ns=VARIABLE_NAMESPACE_INDEX;s=<name>,
 * readable and writable with any scalar type. The server iterates on its own thread.
 */
#ifndef VARIABLE_SERVER_HPP
#define VARIABLE_SERVER_HPP

#include <open62541/server.h>
#include <atomic>
#include <string>
#include <thread>

#include "types.hpp"
#include "data_sample.hpp"
#include "information_node_inserter.hpp"
#include "information_node_writer.hpp"

using namespace opcua_driver;

class variable_server {
private:
    UA_Server* server_; /**< the OPC UA server pointer. */
    port_t port_; /**< the listening port. */
    std::atomic<bool> running_; /**< flag to indicate whether the server thread should run. */
    std::thread server_iterate_thread_; /**< the server iteration thread. */
    information_node_inserter inserter_; /**< the inserter adding the variable nodes. */
    information_node_writer writer_; /**< the writer setting variable values locally. */
public:
    /**
     * @brief Constructs a server listening on the given port and registers the variable namespace.
     * Check is_ready() before use.
     * 
     * @param _port the port.
     */
    variable_server(port_t _port);

    /**
     * @brief Stops and deletes the server.
     * 
     */
    ~variable_server();

    variable_server(const variable_server&) = delete;
    variable_server& operator= (const variable_server&) = delete;

    /**
     * @brief Returns whether the server was set up and the variable namespace has the expected index.
     */
    bool
    is_ready() const;

    /**
     * @brief Adds a variable node. Variables should be added before start().
     * 
     * @param _variable_name the variable name used as string identifier and browse name.
     * @param _initial_value the initial scalar value.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    add_variable(const std::string& _variable_name, const ua_value& _initial_value);

    /**
     * @brief Sets the value of a variable locally.
     * 
     * @param _variable_name the variable name.
     * @param _value the value.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    set_value(const std::string& _variable_name, const ua_value& _value);

    /**
     * @brief Reads the value of a variable locally.
     * 
     * @param _variable_name the variable name.
     * @param _value the value read.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    get_value(const std::string& _variable_name, ua_value& _value);

    /**
     * @brief Starts up the server and its iterate thread.
     * 
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    start();

    /**
     * @brief Stops the iterate thread and shuts the server down.
     * 
     */
    void
    stop();

    /**
     * @brief Returns opc.tcp://localhost:<port>.
     */
    std::string
    get_endpoint_url() const;
};

#endif // VARIABLE_SERVER_HPP
