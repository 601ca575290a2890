#include <string>
#include "testframe.hpp"
#include "variable_server.hpp"
#include "variable_accessor.hpp"

#define TEST_SERVER_PORT 48410
#define UNUSED_PORT 48411

int main(int argc, char* argv[]) {
    variable_server server(TEST_SERVER_PORT);
    assertm(server.is_ready(), "The variable namespace must get index 2");
    UA_Double temperature = 21.5;
    UA_Int32 counter = 0;
    UA_Boolean flag = false;
    assertm(server.add_variable("Temperature", ua_value::from_scalar(&temperature, &UA_TYPES[UA_TYPES_DOUBLE])) == UA_STATUSCODE_GOOD, "Failed");
    assertm(server.add_variable("Counter", ua_value::from_scalar(&counter, &UA_TYPES[UA_TYPES_INT32])) == UA_STATUSCODE_GOOD, "Failed");
    assertm(server.add_variable("Flag", ua_value::from_scalar(&flag, &UA_TYPES[UA_TYPES_BOOLEAN])) == UA_STATUSCODE_GOOD, "Failed");
    assertm(server.add_variable("Label", ua_value::from_string("42")) == UA_STATUSCODE_GOOD, "Failed");
    assertm(server.add_variable("Word", ua_value::from_string("abc")) == UA_STATUSCODE_GOOD, "Failed");
    assertm(server.add_variable("Counter", ua_value::from_string("again")) == UA_STATUSCODE_BADNODEIDEXISTS, "Adding a variable twice fails");
    assertm(server.start() == UA_STATUSCODE_GOOD, "Failed");

    {
        variable_accessor accessor(accessor_config("localhost", TEST_SERVER_PORT, 2000, UA_LOGLEVEL_WARNING));
        assertm(accessor.is_connected(), "Failed");
        assertm(accessor.get_endpoint_url() == server.get_endpoint_url(), "Failed");

        /* initial values */
        assertm(accessor.read_double("Temperature") == 21.5, "Failed");
        assertm(accessor.read("Temperature").has_scalar_type(&UA_TYPES[UA_TYPES_DOUBLE]), "Failed");
        assertm(accessor.read_as<UA_Int32>("Label") == 42, "Failed");
        assertm(throws<conversion_error>([&accessor]() { accessor.read_int("Word"); }), "Failed");

        /* timestamps are requested */
        data_sample sample = accessor.read_sample("Temperature");
        assertm(sample.has_server_timestamp(), "Both timestamps are requested");

        /* write then read */
        accessor.write("Counter", 17);
        assertm(accessor.read_int("Counter") == 17, "Failed");
        ua_value counter_value;
        assertm(server.get_value("Counter", counter_value) == UA_STATUSCODE_GOOD, "Failed");
        assertm(counter_value.has_scalar_type(&UA_TYPES[UA_TYPES_INT32]), "Failed");
        assertm(*(const UA_Int32*) counter_value.get_data() == 17, "The write reached ns=2;s=Counter");

        /* server side changes are visible to reads */
        UA_Int32 server_counter = 99;
        assertm(server.set_value("Counter", ua_value::from_scalar(&server_counter, &UA_TYPES[UA_TYPES_INT32])) == UA_STATUSCODE_GOOD, "Failed");
        assertm(accessor.read_int("Counter") == 99, "Failed");
        assertm(server.set_value("Missing", ua_value::from_string("x")) != UA_STATUSCODE_GOOD, "Failed");

        accessor.write("Temperature", 23.25);
        assertm(accessor.read_double("Temperature") == 23.25, "Failed");
        accessor.write("Temperature", 1.5f);
        assertm(accessor.read_float("Temperature") == 1.5f, "Failed");
        accessor.write("Counter", (UA_Int16) -3);
        assertm(accessor.read_short("Counter") == -3, "Failed");
        accessor.write("Flag", true);
        assertm(accessor.read_bool("Flag"), "Failed");
        accessor.write("Label", std::string("hello"));
        assertm(accessor.read_string("Label") == "hello", "Failed");

        /* unknown nodes */
        try {
            accessor.read("Missing");
            assertm(false, "Expected an accessor error");
        } catch (const accessor_error& e) {
            assertm(e.get_status_code() == UA_STATUSCODE_BADNODEIDUNKNOWN, "Failed");
        }
        assertm(throws<accessor_error>([&accessor]() { accessor.write("Missing", 1); }), "Failed");

        accessor.shutdown();
        assertm(!accessor.is_connected(), "Failed");
        assertm(throws<accessor_error>([&accessor]() { accessor.read("Counter"); }), "Failed");
    }

    /* host and port constructor */
    {
        variable_accessor accessor("localhost", TEST_SERVER_PORT);
        assertm(accessor.read_string("Label") == "hello", "Failed");
    }

    /* nothing listens on the port */
    try {
        variable_accessor accessor(accessor_config("localhost", UNUSED_PORT, 1000, UA_LOGLEVEL_FATAL));
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        assertm(e.get_status_code() != UA_STATUSCODE_GOOD, "Failed");
    }

    server.stop();
    return 0;
}
