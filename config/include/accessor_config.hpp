/**
 * @file accessor_config.hpp
 * @brief Connection settings of a variable accessor, loadable from a JSON file.
 *
 * Expected layout:
 * {
 *     "host": "localhost",
 *     "port": 4840,
 *     "timeout_ms": 0,
 *     "log_level": "info"
 * }
 * host and port are required. timeout_ms defaults to 0, which keeps the stack default.
 * log_level is one of trace, debug, info, warning, error, fatal and defaults to info.
 */
#ifndef ACCESSOR_CONFIG_HPP
#define ACCESSOR_CONFIG_HPP

#include <open62541/plugin/log.h>
#include <string>

#include "types.hpp"

using namespace opcua_driver;

struct accessor_config {
    private:
        std::string host_; /**< the server host name or address. */
        port_t port_; /**< the server port. */
        timeout_ms_t timeout_ms_; /**< the request timeout, 0 keeps the stack default. */
        UA_LogLevel log_level_; /**< the minimum level logged by the client. */
    public:
        /**
         * @brief Constructs a configuration.
         * 
         * @param _host the server host name or address.
         * @param _port the server port, 1..65535.
         * @param _timeout_ms the request timeout, 0 keeps the stack default.
         * @param _log_level the minimum level logged by the client.
         * @throws std::invalid_argument if the host is empty or the port is out of range.
         */
        accessor_config(std::string _host, UA_Int64 _port, timeout_ms_t _timeout_ms = 0, UA_LogLevel _log_level = UA_LOGLEVEL_INFO);

        /**
         * @brief Loads a configuration from a JSON file.
         * 
         * @param _config_path the path of the JSON file.
         * @return accessor_config the configuration.
         * @throws std::invalid_argument if the file cannot be parsed or a key is missing or invalid.
         */
        static accessor_config
        from_file(const std::string& _config_path);

        /**
         * @brief Parses a configuration from JSON text.
         * 
         * @param _json the JSON document.
         * @return accessor_config the configuration.
         * @throws std::invalid_argument if the text cannot be parsed or a key is missing or invalid.
         */
        static accessor_config
        from_json(const std::string& _json);

        std::string get_host() const {
            return host_;
        }

        port_t get_port() const {
            return port_;
        }

        timeout_ms_t get_timeout_ms() const {
            return timeout_ms_;
        }

        UA_LogLevel get_log_level() const {
            return log_level_;
        }

        /**
         * @brief Returns the endpoint url opc.tcp://<host>:<port>.
         * 
         * @return std::string the endpoint url.
         */
        std::string get_endpoint_url() const {
            return "opc.tcp://" + host_ + ":" + std::to_string(port_);
        }
};

#endif // ACCESSOR_CONFIG_HPP
