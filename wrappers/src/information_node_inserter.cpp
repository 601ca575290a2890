#include "../include/information_node_inserter.hpp"

information_node_inserter::information_node_inserter() {
}

information_node_inserter::~information_node_inserter() {
}

UA_StatusCode
information_node_inserter::add_scalar_node(UA_Server* _server, const UA_NodeId& _node_id, std::string _browse_name, const UA_Variant& _value) {
    if (_value.type == NULL || !UA_Variant_isScalar(&_value))
        return UA_STATUSCODE_BADTYPEMISMATCH;
    /* Define the attribute and value of the variable node */
    UA_VariableAttributes variable_attributes = UA_VariableAttributes_default;
    variable_attributes.value = _value;
    variable_attributes.description = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(_browse_name.c_str()));
    variable_attributes.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(_browse_name.c_str()));
    // BaseDataType so that a write may change the value's type
    variable_attributes.dataType = UA_NODEID_NUMERIC(0, UA_NS0ID_BASEDATATYPE);
    variable_attributes.valueRank = UA_VALUERANK_SCALAR;
    variable_attributes.accessLevel = UA_ACCESSLEVELMASK_READ | UA_ACCESSLEVELMASK_WRITE;

    /* Define where the node shall be added with which browsename */
    UA_NodeId parent_node_id = UA_NODEID_NUMERIC(0, UA_NS0ID_OBJECTSFOLDER);
    UA_NodeId reference_type_id = UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES);
    UA_QualifiedName browse_name = UA_QUALIFIEDNAME(_node_id.namespaceIndex, const_cast<char*>(_browse_name.c_str()));
    UA_NodeId type_definition = UA_NODEID_NUMERIC(0, UA_NS0ID_BASEDATAVARIABLETYPE);

    /* Add the variable node to the information model */
    return UA_Server_addVariableNode(_server, _node_id,
        parent_node_id, reference_type_id, browse_name,
        type_definition, variable_attributes, NULL, NULL);
}
