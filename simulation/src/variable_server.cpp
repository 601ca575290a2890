#include "../include/variable_server.hpp"

#include <open62541/plugin/log_stdout.h>
#include <open62541/server_config_default.h>

#include "node_address.hpp"

#define VARIABLE_NAMESPACE_URI "urn:opcua_driver:variables"

variable_server::variable_server(port_t _port) : server_(UA_Server_new()), port_(_port), running_(false) {
    if (server_ == nullptr) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Could not create the server", __FUNCTION__);
        return;
    }
    UA_ServerConfig* server_config = UA_Server_getConfig(server_);
    UA_StatusCode status = UA_ServerConfig_setMinimal(server_config, port_, NULL);
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Error with setting up the server (%s)", __FUNCTION__, UA_StatusCode_name(status));
        UA_Server_delete(server_);
        server_ = nullptr;
        return;
    }
    UA_UInt16 namespace_index = UA_Server_addNamespace(server_, VARIABLE_NAMESPACE_URI);
    if (namespace_index != VARIABLE_NAMESPACE_INDEX) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Variable namespace got index %u instead of %u", __FUNCTION__, namespace_index, VARIABLE_NAMESPACE_INDEX);
        UA_Server_delete(server_);
        server_ = nullptr;
    }
}

variable_server::~variable_server() {
    stop();
    if (server_ != nullptr)
        UA_Server_delete(server_);
}

bool
variable_server::is_ready() const {
    return server_ != nullptr;
}

UA_StatusCode
variable_server::add_variable(const std::string& _variable_name, const ua_value& _initial_value) {
    if (server_ == nullptr)
        return UA_STATUSCODE_BADINTERNALERROR;
    node_address address(_variable_name);
    UA_StatusCode status = inserter_.add_scalar_node(server_, address.to_node_id(), _variable_name, *_initial_value.get_variant());
    if (status != UA_STATUSCODE_GOOD)
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Could not add %s (%s)", __FUNCTION__, address.to_string().c_str(), UA_StatusCode_name(status));
    return status;
}

UA_StatusCode
variable_server::set_value(const std::string& _variable_name, const ua_value& _value) {
    if (server_ == nullptr)
        return UA_STATUSCODE_BADINTERNALERROR;
    node_address address(_variable_name);
    return writer_.write_value(server_, address.to_node_id(), *_value.get_variant());
}

UA_StatusCode
variable_server::get_value(const std::string& _variable_name, ua_value& _value) {
    if (server_ == nullptr)
        return UA_STATUSCODE_BADINTERNALERROR;
    node_address address(_variable_name);
    UA_Variant variant;
    UA_Variant_init(&variant);
    UA_StatusCode status = UA_Server_readValue(server_, address.to_node_id(), &variant);
    if (status == UA_STATUSCODE_GOOD)
        _value = ua_value(variant);
    UA_Variant_clear(&variant);
    return status;
}

UA_StatusCode
variable_server::start() {
    if (server_ == nullptr)
        return UA_STATUSCODE_BADINTERNALERROR;
    if (running_.load())
        return UA_STATUSCODE_GOOD;
    UA_StatusCode status = UA_Server_run_startup(server_);
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Error at server startup (%s)", __FUNCTION__, UA_StatusCode_name(status));
        return status;
    }
    running_.store(true);
    /* Start the server eventloop */
    server_iterate_thread_ = std::thread([this]() {
        while(running_.load()) {
            UA_Server_run_iterate(server_, true);
        }
    });
    UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Serving variables at %s", __FUNCTION__, get_endpoint_url().c_str());
    return UA_STATUSCODE_GOOD;
}

void
variable_server::stop() {
    if (!running_.load())
        return;
    running_.store(false);
    if (server_iterate_thread_.joinable())
        server_iterate_thread_.join();
    UA_Server_run_shutdown(server_);
}

std::string
variable_server::get_endpoint_url() const {
    return "opc.tcp://localhost:" + std::to_string(port_);
}
