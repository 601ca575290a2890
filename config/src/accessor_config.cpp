#include "../include/accessor_config.hpp"

#include <jsoncpp/json/json.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "filtered_logger.hpp"

#define HOST_KEY "host"
#define PORT_KEY "port"
#define TIMEOUT_KEY "timeout_ms"
#define LOG_LEVEL_KEY "log_level"

accessor_config::accessor_config(std::string _host, UA_Int64 _port, timeout_ms_t _timeout_ms, UA_LogLevel _log_level) :
    host_(_host), port_(0), timeout_ms_(_timeout_ms), log_level_(_log_level) {
    if (host_.empty())
        throw std::invalid_argument("The host must not be empty");
    if (_port < 1 || _port > UA_UINT16_MAX) {
        std::string error_string = "The port " + std::to_string(_port) + " is not in 1.." + std::to_string(UA_UINT16_MAX);
        throw std::invalid_argument(error_string);
    }
    port_ = (port_t) _port;
}

static accessor_config
parse_config(std::istream& _input, const std::string& _source) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, _input, &root, &errors)) {
        std::string error_string = "Could not parse " + _source + ": " + errors;
        throw std::invalid_argument(error_string);
    }
    if (!root.isObject()) {
        std::string error_string = _source + " must contain a JSON object";
        throw std::invalid_argument(error_string);
    }
    if (!root.isMember(HOST_KEY) || !root[HOST_KEY].isString() || root[HOST_KEY].asString().empty()) {
        std::string error_string = "There is no valid " HOST_KEY " in " + _source;
        throw std::invalid_argument(error_string);
    }
    if (!root.isMember(PORT_KEY) || !root[PORT_KEY].isIntegral() || root[PORT_KEY].asInt64() < 1 || root[PORT_KEY].asInt64() > UA_UINT16_MAX) {
        std::string error_string = "There is no valid " PORT_KEY " in " + _source;
        throw std::invalid_argument(error_string);
    }
    timeout_ms_t timeout_ms = 0;
    if (root.isMember(TIMEOUT_KEY)) {
        if (!root[TIMEOUT_KEY].isIntegral() || root[TIMEOUT_KEY].asInt64() < 0 || root[TIMEOUT_KEY].asInt64() > UA_UINT32_MAX) {
            std::string error_string = "The " TIMEOUT_KEY " in " + _source + " must be a non-negative integer";
            throw std::invalid_argument(error_string);
        }
        timeout_ms = (timeout_ms_t) root[TIMEOUT_KEY].asUInt();
    }
    UA_LogLevel log_level = UA_LOGLEVEL_INFO;
    if (root.isMember(LOG_LEVEL_KEY)) {
        if (!root[LOG_LEVEL_KEY].isString() || !filtered_logger::parse_log_level(root[LOG_LEVEL_KEY].asString(), log_level)) {
            std::string error_string = "The " LOG_LEVEL_KEY " in " + _source + " is not one of trace, debug, info, warning, error, fatal";
            throw std::invalid_argument(error_string);
        }
    }
    return accessor_config(root[HOST_KEY].asString(), root[PORT_KEY].asInt64(), timeout_ms, log_level);
}

accessor_config
accessor_config::from_file(const std::string& _config_path) {
    std::ifstream ifs_config(_config_path);
    if (!ifs_config.is_open()) {
        std::string error_string = "Could not open the config file " + _config_path;
        throw std::invalid_argument(error_string);
    }
    return parse_config(ifs_config, _config_path);
}

accessor_config
accessor_config::from_json(const std::string& _json) {
    std::istringstream iss_config(_json);
    return parse_config(iss_config, "the config");
}
