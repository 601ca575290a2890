/**
 * @file node_address.hpp
 * @brief Maps variable names onto node ids in the fixed variable namespace.
 */
#ifndef NODE_ADDRESS_HPP
#define NODE_ADDRESS_HPP

#include <open62541/types.h>
#include <string>

#include "types.hpp"

#define VARIABLE_NAMESPACE_INDEX 2

using namespace opcua_driver;

struct node_address {
    private:
        namespace_index_t namespace_index_; /**< the namespace index, always VARIABLE_NAMESPACE_INDEX. */
        std::string identifier_; /**< the string identifier, equal to the variable name. */
    public:
        /**
         * @brief Constructs the address of a variable.
         * 
         * @param _variable_name the variable name used as string identifier.
         */
        explicit node_address(std::string _variable_name) : namespace_index_(VARIABLE_NAMESPACE_INDEX), identifier_(_variable_name) {
        }

        ~node_address() {
        }

        namespace_index_t get_namespace_index() const {
            return namespace_index_;
        }

        const std::string& get_identifier() const {
            return identifier_;
        }

        /**
         * @brief Returns a node id referencing the identifier of this address.
         * The node id does not own its string, it is valid as long as this address lives.
         * 
         * @return UA_NodeId the string node id.
         */
        UA_NodeId to_node_id() const {
            return UA_NODEID_STRING(namespace_index_, const_cast<char*>(identifier_.c_str()));
        }

        /**
         * @brief Returns the textual node id, e.g. ns=2;s=Temperature.
         * 
         * @return std::string the textual node id.
         */
        std::string to_string() const {
            return "ns=" + std::to_string(namespace_index_) + ";s=" + identifier_;
        }

        bool operator== (const node_address& _node_address) const {
            return namespace_index_ == _node_address.namespace_index_ && identifier_ == _node_address.identifier_;
        }

        bool operator!= (const node_address& _node_address) const {
            return !(*this == _node_address);
        }
};

#endif // NODE_ADDRESS_HPP
