#include "../include/variable_accessor.hpp"

#include <open62541/plugin/log_stdout.h>
#include <stdexcept>

#include "open62541_session.hpp"

variable_accessor::variable_accessor(std::string _host, UA_Int64 _port) : variable_accessor(accessor_config(_host, _port)) {
}

variable_accessor::variable_accessor(const accessor_config& _config) :
        session_(std::make_unique<open62541_session>(_config.get_timeout_ms(), _config.get_log_level())), endpoint_url_(_config.get_endpoint_url()), shut_down_(false) {
    connect();
}

variable_accessor::variable_accessor(std::unique_ptr<ua_session> _session) : session_(std::move(_session)), shut_down_(false) {
    if (session_ == nullptr)
        throw std::invalid_argument("session must not be null");
}

variable_accessor::~variable_accessor() {
    shutdown();
}

node_address
variable_accessor::make_address(const std::string& _variable_name) const {
    if (_variable_name.empty())
        throw accessor_error("The variable name must not be empty", UA_STATUSCODE_BADNODEIDINVALID);
    return node_address(_variable_name);
}

void
variable_accessor::connect() {
    ua_session* session = session_.get();
    std::string endpoint_url = endpoint_url_;
    UA_StatusCode status = dispatch_and_wait<UA_StatusCode>([session, endpoint_url]() {
        return session->connect(endpoint_url);
    }, "Connecting to " + endpoint_url_);
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Could not connect to %s (%s)", __FUNCTION__, endpoint_url_.c_str(), UA_StatusCode_name(status));
        throw accessor_error("Could not connect to " + endpoint_url_, status);
    }
    UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Connected to %s", __FUNCTION__, endpoint_url_.c_str());
}

data_sample
variable_accessor::read_sample(const std::string& _variable_name) {
    node_address address = make_address(_variable_name);
    if (shut_down_)
        throw accessor_error("Reading " + address.to_string() + " failed, the accessor is shut down", UA_STATUSCODE_BADCONNECTIONCLOSED);
    ua_session* session = session_.get();
    data_sample sample;
    UA_StatusCode status = dispatch_and_wait<UA_StatusCode>([session, &address, &sample]() -> UA_StatusCode {
        if (!session->is_connected())
            return UA_STATUSCODE_BADCONNECTIONCLOSED;
        return session->read(address.to_node_id(), sample);
    }, "Reading " + address.to_string());
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Reading %s failed (%s)", __FUNCTION__, address.to_string().c_str(), UA_StatusCode_name(status));
        throw accessor_error("Reading " + address.to_string() + " failed", status);
    }
    return sample;
}

ua_value
variable_accessor::read(const std::string& _variable_name) {
    return read_sample(_variable_name).get_value();
}

std::string
variable_accessor::read_string(const std::string& _variable_name) {
    ua_value value = read(_variable_name);
    return value_coercer::stringify(*value.get_variant());
}

UA_Int16
variable_accessor::read_short(const std::string& _variable_name) {
    return read_as<UA_Int16>(_variable_name);
}

UA_Int32
variable_accessor::read_int(const std::string& _variable_name) {
    return read_as<UA_Int32>(_variable_name);
}

UA_Float
variable_accessor::read_float(const std::string& _variable_name) {
    return read_as<UA_Float>(_variable_name);
}

UA_Double
variable_accessor::read_double(const std::string& _variable_name) {
    return read_as<UA_Double>(_variable_name);
}

UA_Boolean
variable_accessor::read_bool(const std::string& _variable_name) {
    return read_as<UA_Boolean>(_variable_name);
}

void
variable_accessor::write(const std::string& _variable_name, const ua_value& _value) {
    node_address address = make_address(_variable_name);
    if (shut_down_)
        throw accessor_error("Writing " + address.to_string() + " failed, the accessor is shut down", UA_STATUSCODE_BADCONNECTIONCLOSED);
    ua_session* session = session_.get();
    UA_StatusCode status = dispatch_and_wait<UA_StatusCode>([session, &address, &_value]() -> UA_StatusCode {
        if (!session->is_connected())
            return UA_STATUSCODE_BADCONNECTIONCLOSED;
        return session->write(address.to_node_id(), *_value.get_variant());
    }, "Writing " + address.to_string());
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Writing %s failed (%s)", __FUNCTION__, address.to_string().c_str(), UA_StatusCode_name(status));
        throw accessor_error("Writing " + address.to_string() + " failed", status);
    }
}

void
variable_accessor::write(const std::string& _variable_name, UA_Boolean _value) {
    write(_variable_name, ua_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_BOOLEAN]));
}

void
variable_accessor::write(const std::string& _variable_name, UA_Int16 _value) {
    write(_variable_name, ua_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_INT16]));
}

void
variable_accessor::write(const std::string& _variable_name, UA_Int32 _value) {
    write(_variable_name, ua_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_INT32]));
}

void
variable_accessor::write(const std::string& _variable_name, UA_Int64 _value) {
    write(_variable_name, ua_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_INT64]));
}

void
variable_accessor::write(const std::string& _variable_name, UA_Float _value) {
    write(_variable_name, ua_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_FLOAT]));
}

void
variable_accessor::write(const std::string& _variable_name, UA_Double _value) {
    write(_variable_name, ua_value::from_scalar(&_value, &UA_TYPES[UA_TYPES_DOUBLE]));
}

void
variable_accessor::write(const std::string& _variable_name, const std::string& _value) {
    write(_variable_name, ua_value::from_string(_value));
}

void
variable_accessor::write(const std::string& _variable_name, const char* _value) {
    write(_variable_name, ua_value::from_string(_value != nullptr ? std::string(_value) : std::string()));
}

bool
variable_accessor::is_connected() {
    if (shut_down_)
        return false;
    ua_session* session = session_.get();
    return dispatch_and_wait<bool>([session]() {
        return session->is_connected();
    }, "Querying the connection state");
}

std::string
variable_accessor::get_endpoint_url() const {
    return endpoint_url_;
}

void
variable_accessor::shutdown() {
    if (shut_down_.exchange(true))
        return;
    ua_session* session = session_.get();
    try {
        std::future<UA_StatusCode> result = dispatcher_.dispatch<UA_StatusCode>([session]() {
            return session->disconnect();
        });
        UA_StatusCode status = result.get();
        if (status != UA_STATUSCODE_GOOD)
            UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Error while disconnecting (%s)", __FUNCTION__, UA_StatusCode_name(status));
    } catch (const std::exception& e) {
        UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Error while disconnecting: %s", __FUNCTION__, e.what());
    }
    dispatcher_.stop();
    UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Connection to the OPC UA server closed", __FUNCTION__);
}
