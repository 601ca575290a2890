#include "../include/information_node_reader.hpp"

information_node_reader::information_node_reader(UA_Double _max_age) : max_age_(_max_age) {
}

information_node_reader::~information_node_reader() {
}

UA_StatusCode
information_node_reader::read_information_node(UA_Client* _client, const UA_NodeId& _node_id, data_sample& _sample) {
    if (_client == nullptr)
        return UA_STATUSCODE_BADCONNECTIONCLOSED;
    UA_ReadValueId read_value_id;
    UA_ReadValueId_init(&read_value_id);
    read_value_id.nodeId = _node_id;
    read_value_id.attributeId = UA_ATTRIBUTEID_VALUE;

    UA_ReadRequest request;
    UA_ReadRequest_init(&request);
    request.maxAge = max_age_;
    request.timestampsToReturn = UA_TIMESTAMPSTORETURN_BOTH;
    request.nodesToRead = &read_value_id;
    request.nodesToReadSize = 1;

    UA_ReadResponse response = UA_Client_Service_read(_client, request);
    UA_StatusCode status_code = response.responseHeader.serviceResult;
    if (status_code == UA_STATUSCODE_GOOD && response.resultsSize != 1)
        status_code = UA_STATUSCODE_BADUNEXPECTEDERROR;
    if (status_code == UA_STATUSCODE_GOOD) {
        status_code = _sample.assign(response.results[0]);
        if (status_code == UA_STATUSCODE_GOOD)
            status_code = _sample.get_status();
    }
    UA_ReadResponse_clear(&response);
    return status_code;
}
