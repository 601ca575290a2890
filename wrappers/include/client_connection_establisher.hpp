/**
 * @file client_connection_establisher.hpp
 * @brief Utilities to create configured clients and connect them to OPC UA endpoints.
 */
#ifndef CLIENT_CONNECTION_ESTABLISHER_HPP
#define CLIENT_CONNECTION_ESTABLISHER_HPP

#include <open62541/client_highlevel.h>
#include <string>

#include "types.hpp"

/**
 * @brief Helper class creating and connecting an OPC UA client.
 *
 * On success a new UA_Client instance is assigned to the caller-provided pointer.
 * On failure the pointer is set to nullptr.
 */
class client_connection_establisher {
private:
    opcua_driver::timeout_ms_t timeout_ms_; /**< the request timeout, 0 keeps the stack default. */
    UA_LogLevel log_level_; /**< the minimum level of the client logger. */
public:
    /** 
     * @brief Constructs a connection establisher.
     *
     * @param _timeout_ms the request timeout in milliseconds, 0 keeps the stack default.
     * @param _log_level the minimum level logged by the created client.
     */
    client_connection_establisher(opcua_driver::timeout_ms_t _timeout_ms = 0, UA_LogLevel _log_level = UA_LOGLEVEL_INFO);

    /**
     * @brief Destructor (does not close any externally managed client).
     */
    ~client_connection_establisher();

    /**
     * @brief Fills a zeroed client config: filtered logger, stack defaults, security mode None and
     * the request timeout. On failure the config is cleared.
     * 
     * @param _client_config the config, memset to 0 by the caller.
     * @return UA_StatusCode the status of setting the defaults.
     */
    UA_StatusCode
    configure_client(UA_ClientConfig& _client_config);

    /**
     * @brief Establishes a connection to a server with a new client. You must ensure that the pointer is deleted and is null.
     * 
     * @param _client the client pointer where the new created one's adress is stored.
     * @param _server_endpoint the server endpoint.
     * @return UA_StatusCode the connect status, _client is set to nullptr unless it is good.
     */
    UA_StatusCode
    establish_connection(UA_Client*& _client, std::string _server_endpoint);
};

#endif // CLIENT_CONNECTION_ESTABLISHER_HPP
