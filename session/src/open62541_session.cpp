#include "../include/open62541_session.hpp"
#include <open62541/plugin/log_stdout.h>
#include "client_connection_establisher.hpp"

open62541_session::open62541_session(opcua_driver::timeout_ms_t _timeout_ms, UA_LogLevel _log_level) : client_(nullptr), timeout_ms_(_timeout_ms), log_level_(_log_level) {
}

open62541_session::~open62541_session() {
    if (client_ != nullptr)
        UA_Client_delete(client_);
}

UA_StatusCode
open62541_session::connect(const std::string& _endpoint_url) {
    if (client_ != nullptr) {
        UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Replacing the existing client", __FUNCTION__);
        UA_Client_delete(client_);
        client_ = nullptr;
    }
    return client_connection_establisher(timeout_ms_, log_level_).establish_connection(client_, _endpoint_url);
}

UA_StatusCode
open62541_session::disconnect() {
    if (client_ == nullptr)
        return UA_STATUSCODE_GOOD;
    UA_StatusCode status = UA_Client_disconnect(client_);
    UA_Client_delete(client_);
    client_ = nullptr;
    return status;
}

bool
open62541_session::is_connected() const {
    if (client_ == nullptr)
        return false;
    UA_SessionState session_state;
    UA_Client_getState(client_, NULL, &session_state, NULL);
    return session_state == UA_SESSIONSTATE_ACTIVATED;
}

UA_StatusCode
open62541_session::read(const UA_NodeId& _node_id, data_sample& _sample) {
    return reader_.read_information_node(client_, _node_id, _sample);
}

UA_StatusCode
open62541_session::write(const UA_NodeId& _node_id, const UA_Variant& _value) {
    return writer_.write_value(client_, _node_id, _value);
}
