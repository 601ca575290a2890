/**
 * @file information_node_writer.hpp
 * @brief Write values into existing variable nodes, locally on a server or remotely through a client.
 */
#ifndef INFORMATION_NODE_WRITER_HPP
#define INFORMATION_NODE_WRITER_HPP

#include <open62541/client_highlevel.h>
#include <open62541/server.h>

class information_node_writer {
    private:
    public:
        /**
         * @brief Constructs a new information node writer object.
         * 
         */
        information_node_writer();

        /**
         * @brief Destroys the information node writer object.
         * 
         */
        ~information_node_writer();

        /**
         * @brief Write a value into a variable node of the own server address space.
         * @param _server the server.
         * @param _node_id the target node id.
         * @param _value the value.
         * @return UA_StatusCode the status code.
         */
        UA_StatusCode write_value(UA_Server* _server, const UA_NodeId& _node_id, const UA_Variant& _value);

        /**
         * @brief Write a value into a variable node of a remote OPC UA host. Only the value is
         * sent, neither status nor timestamps.
         * @param _client the client.
         * @param _node_id the target node id.
         * @param _value the value.
         * @return UA_StatusCode the service result, or the node's write result if the service succeeded.
         */
        UA_StatusCode write_value(UA_Client* _client, const UA_NodeId& _node_id, const UA_Variant& _value);
};

#endif // INFORMATION_NODE_WRITER_HPP
