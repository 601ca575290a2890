/**
 * @file open62541_session.hpp
 * @brief ua_session backed by an open62541 client.
 */
#ifndef OPEN62541_SESSION_HPP
#define OPEN62541_SESSION_HPP

#include <open62541/client.h>

#include "ua_session.hpp"
#include "types.hpp"
#include "information_node_reader.hpp"
#include "information_node_writer.hpp"

class open62541_session : public ua_session {
private:
    UA_Client* client_; /**< the owned client, nullptr while disconnected. */
    opcua_driver::timeout_ms_t timeout_ms_; /**< the request timeout, 0 keeps the stack default. */
    UA_LogLevel log_level_; /**< the minimum log level of the client. */
    information_node_reader reader_; /**< the reader issuing read services. */
    information_node_writer writer_; /**< the writer issuing write services. */
public:
    /**
     * @brief Constructs a disconnected session.
     * 
     * @param _timeout_ms the request timeout in milliseconds, 0 keeps the stack default.
     * @param _log_level the minimum log level of the client.
     */
    open62541_session(opcua_driver::timeout_ms_t _timeout_ms = 0, UA_LogLevel _log_level = UA_LOGLEVEL_INFO);

    /**
     * @brief Deletes the client, closing the connection if still open.
     * 
     */
    ~open62541_session() override;

    open62541_session(const open62541_session&) = delete;
    open62541_session& operator= (const open62541_session&) = delete;

    UA_StatusCode connect(const std::string& _endpoint_url) override;

    UA_StatusCode disconnect() override;

    bool is_connected() const override;

    UA_StatusCode read(const UA_NodeId& _node_id, data_sample& _sample) override;

    UA_StatusCode write(const UA_NodeId& _node_id, const UA_Variant& _value) override;
};

#endif // OPEN62541_SESSION_HPP
