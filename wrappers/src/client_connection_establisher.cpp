#include "../include/client_connection_establisher.hpp"
#include <open62541/client_config_default.h>
#include <open62541/plugin/log_stdout.h>
#include <string.h>
#include "../include/filtered_logger.hpp"

client_connection_establisher::client_connection_establisher(opcua_driver::timeout_ms_t _timeout_ms, UA_LogLevel _log_level) : timeout_ms_(_timeout_ms), log_level_(_log_level) {
}

client_connection_establisher::~client_connection_establisher() {
}

UA_StatusCode
client_connection_establisher::configure_client(UA_ClientConfig& _client_config) {
    // The logger must be in place before the defaults are set, the event loop keeps a reference to it
    _client_config.logging = filtered_logger().create_filtered_logger(log_level_);
    UA_StatusCode status = UA_ClientConfig_setDefault(&_client_config);
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Error setting up the client config (%s)", __FUNCTION__, UA_StatusCode_name(status));
        UA_ClientConfig_clear(&_client_config);
        return status;
    }
    _client_config.securityMode = UA_MESSAGESECURITYMODE_NONE;
    if (timeout_ms_ > 0)
        _client_config.timeout = timeout_ms_;
    return UA_STATUSCODE_GOOD;
}

UA_StatusCode
client_connection_establisher::establish_connection(UA_Client*& _client, std::string _server_endpoint) {
    if (_client != nullptr)
        UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: If passed client pointer is not deleted then memory leaks will occur!", __FUNCTION__);
    UA_ClientConfig client_config;
    memset(&client_config, 0, sizeof(UA_ClientConfig));
    UA_StatusCode status = configure_client(client_config);
    if (status != UA_STATUSCODE_GOOD) {
        _client = nullptr;
        return status;
    }

    _client = UA_Client_newWithConfig(&client_config);
    if (_client == nullptr) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Could not create the client", __FUNCTION__);
        UA_ClientConfig_clear(&client_config);
        return UA_STATUSCODE_BADOUTOFMEMORY;
    }

    status = UA_Client_connect(_client, _server_endpoint.c_str());
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Connection attempt to %s failed (%s)", __FUNCTION__, _server_endpoint.c_str(), UA_StatusCode_name(status));
        UA_Client_delete(_client);
        _client = nullptr;
    }
    return status;
}
