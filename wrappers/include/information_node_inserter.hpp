/**
 * @file information_node_inserter.hpp
 * @brief Adds writable scalar variable nodes to the server address space.
 */
#ifndef INFORMATION_NODE_INSERTER_HPP
#define INFORMATION_NODE_INSERTER_HPP

#include <open62541/server.h>
#include <string>

/**
 * @brief Convenience wrapper for inserting variable nodes below the objects folder.
 */
class information_node_inserter {
private:
public:
    /**
     * @brief Constructs a new information node inserter object.
     * 
     */
    information_node_inserter();

    /**
     * @brief Destroys the information node inserter object.
     * 
     */
    ~information_node_inserter();

    /**
     * @brief Adds a readable and writable scalar node to the address space. The browse name
     * shares the namespace of the node id.
     * 
     * @param _server the server.
     * @param _node_id the node id of the scalar node.
     * @param _browse_name the browse name.
     * @param _value the initial value, must be a scalar.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    add_scalar_node(UA_Server* _server, const UA_NodeId& _node_id, std::string _browse_name, const UA_Variant& _value);
};


#endif // INFORMATION_NODE_INSERTER_HPP
