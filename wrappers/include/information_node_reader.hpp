/**
 * @file information_node_reader.hpp
 * @brief Reads variable values with their timestamps from a remote OPC UA host.
 */
#ifndef INFORMATION_NODE_READER_HPP
#define INFORMATION_NODE_READER_HPP

#include <open62541/client_highlevel.h>

#include "data_sample.hpp"

/**
 * @brief Issues Read service calls for the Value attribute of a single node.
 */
class information_node_reader {
private:
    UA_Double max_age_; /**< the maximum age of a cached value the server may return. */
public:
    /**
     * @brief Constructs a new information node reader object.
     * 
     * @param _max_age the max age in milliseconds, 0 requests the current value.
     */
    information_node_reader(UA_Double _max_age = 0.0);

    /**
     * @brief Destroys the information node reader object.
     * 
     */
    ~information_node_reader();

    /**
     * @brief Reads the value of an information node of a remote OPC UA host, requesting
     * source and server timestamps.
     * 
     * @param _client the client.
     * @param _node_id the node id.
     * @param _sample the sample receiving value, status and timestamps.
     * @return UA_StatusCode the service result, or the node's read status if the service succeeded.
     */
    UA_StatusCode
    read_information_node(UA_Client* _client, const UA_NodeId& _node_id, data_sample& _sample);
};

#endif // INFORMATION_NODE_READER_HPP
