#include <signal.h>
#include <stdlib.h>
#include <thread>
#include <chrono>
#include <open62541/plugin/log_stdout.h>

#include "variable_server.hpp"

static volatile UA_Boolean running = true;
static void stop_handler(int sig) {
    UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "received ctrl-c");
    running = false;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, stop_handler);
    signal(SIGTERM, stop_handler);

    long port = argc > 1 ? strtol(argv[1], NULL, 10) : 4840;
    if (port < 1 || port > UA_UINT16_MAX) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "Usage: %s [<port 1..65535>]", argv[0]);
        return EXIT_FAILURE;
    }
    variable_server server((port_t) port);
    if (!server.is_ready())
        return EXIT_FAILURE;

    UA_Double temperature = 21.5;
    UA_Int32 counter = 0;
    UA_Boolean flag = true;
    // add_variable logs its failures
    UA_StatusCode status = server.add_variable("Temperature", ua_value::from_scalar(&temperature, &UA_TYPES[UA_TYPES_DOUBLE]));
    status |= server.add_variable("Counter", ua_value::from_scalar(&counter, &UA_TYPES[UA_TYPES_INT32]));
    status |= server.add_variable("Flag", ua_value::from_scalar(&flag, &UA_TYPES[UA_TYPES_BOOLEAN]));
    status |= server.add_variable("Label", ua_value::from_string("42"));
    if (status != UA_STATUSCODE_GOOD)
        return EXIT_FAILURE;
    if (server.start() != UA_STATUSCODE_GOOD)
        return EXIT_FAILURE;

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    server.stop();
    return EXIT_SUCCESS;
}
