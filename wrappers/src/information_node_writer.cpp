#include "../include/information_node_writer.hpp"

information_node_writer::information_node_writer() {
}

information_node_writer::~information_node_writer() {
}

UA_StatusCode
information_node_writer::write_value(UA_Server* _server, const UA_NodeId& _node_id, const UA_Variant& _value) {
    return UA_Server_writeValue(_server, _node_id, _value);
}

UA_StatusCode
information_node_writer::write_value(UA_Client* _client, const UA_NodeId& _node_id, const UA_Variant& _value) {
    if (_client == nullptr)
        return UA_STATUSCODE_BADCONNECTIONCLOSED;
    UA_WriteValue node_write;
    UA_WriteValue_init(&node_write);
    node_write.nodeId = _node_id;
    node_write.attributeId = UA_ATTRIBUTEID_VALUE;
    node_write.value.value = _value;
    node_write.value.hasValue = true;

    UA_WriteRequest request;
    UA_WriteRequest_init(&request);
    request.nodesToWrite = &node_write;
    request.nodesToWriteSize = 1;

    UA_WriteResponse response = UA_Client_Service_write(_client, request);
    UA_StatusCode status_code = response.responseHeader.serviceResult;
    if (status_code == UA_STATUSCODE_GOOD && response.resultsSize != 1)
        status_code = UA_STATUSCODE_BADUNEXPECTEDERROR;
    if (status_code == UA_STATUSCODE_GOOD)
        status_code = response.results[0];
    UA_WriteResponse_clear(&response);
    return status_code;
}
