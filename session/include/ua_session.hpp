/**
 * @file ua_session.hpp
 * @brief Interface of a client handle issuing single-node services against one server.
 */
#ifndef UA_SESSION_HPP
#define UA_SESSION_HPP

#include <open62541/types.h>
#include <string>

#include "data_sample.hpp"

/**
 * @brief A connection to an OPC UA server. Implementations are not thread-safe, callers
 * must not issue overlapping calls.
 */
class ua_session {
public:
    virtual ~ua_session() = default;

    /**
     * @brief Connects to the server and activates a session.
     * 
     * @param _endpoint_url the endpoint url, e.g. opc.tcp://localhost:4840.
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode connect(const std::string& _endpoint_url) = 0;

    /**
     * @brief Closes the session and the connection.
     * 
     * @return UA_StatusCode the status code.
     */
    virtual UA_StatusCode disconnect() = 0;

    /**
     * @brief Returns whether a session is activated.
     */
    virtual bool is_connected() const = 0;

    /**
     * @brief Reads the current value of a node including its timestamps.
     * 
     * @param _node_id the node id.
     * @param _sample the sample receiving the result.
     * @return UA_StatusCode the status code, bad if the service or the node read failed.
     */
    virtual UA_StatusCode read(const UA_NodeId& _node_id, data_sample& _sample) = 0;

    /**
     * @brief Writes the value of a node.
     * 
     * @param _node_id the node id.
     * @param _value the type tagged value.
     * @return UA_StatusCode the status code, bad if the service or the node write failed.
     */
    virtual UA_StatusCode write(const UA_NodeId& _node_id, const UA_Variant& _value) = 0;
};

#endif // UA_SESSION_HPP
