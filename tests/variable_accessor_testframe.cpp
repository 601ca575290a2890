#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include <string>
#include "testframe.hpp"
#include "fake_session.hpp"
#include "variable_accessor.hpp"

static void test_addressing_is_identical_for_read_and_write() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=Temperature", ua_value::from_string("20"));
    variable_accessor accessor{std::move(owned_session)};
    accessor.read("Temperature");
    accessor.write("Temperature", 25.0);
    assertm(session->read_node_ids_.size() == 1, "Failed");
    assertm(session->write_node_ids_.size() == 1, "Failed");
    assertm(session->read_node_ids_[0] == "ns=2;s=Temperature", "Read addresses namespace 2 with the name as identifier");
    assertm(session->write_node_ids_[0] == "ns=2;s=Temperature", "Write addresses namespace 2 with the name as identifier");
    assertm(session->read_node_ids_[0] == session->write_node_ids_[0], "Failed");
}

static void test_write_then_read_returns_written_value() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=Speed", ua_value());
    session->set("ns=2;s=Name", ua_value());
    session->set("ns=2;s=Enabled", ua_value());
    variable_accessor accessor{std::move(owned_session)};

    accessor.write("Speed", (UA_Int16) 1200);
    ua_value speed = accessor.read("Speed");
    assertm(speed.has_scalar_type(&UA_TYPES[UA_TYPES_INT16]), "The value keeps its type tag");
    assertm(*(const UA_Int16*) speed.get_data() == 1200, "Failed");
    assertm(accessor.read_short("Speed") == 1200, "Failed");

    accessor.write("Name", "kettle");
    assertm(accessor.read("Name").has_scalar_type(&UA_TYPES[UA_TYPES_STRING]), "Failed");
    assertm(accessor.read_string("Name") == "kettle", "Failed");

    session->set("ns=2;s=Total", ua_value());
    accessor.write("Total", (UA_Int64) 5000000000LL);
    ua_value total = accessor.read("Total");
    assertm(total.has_scalar_type(&UA_TYPES[UA_TYPES_INT64]), "64 bit integers are written as Int64");
    assertm(*(const UA_Int64*) total.get_data() == 5000000000LL, "Failed");
    assertm(accessor.read_string("Total") == "5000000000", "Failed");
    assertm(throws<conversion_error>([&accessor]() { accessor.read_int("Total"); }), "Out of Int32 range");

    accessor.write("Enabled", true);
    assertm(accessor.read("Enabled").has_scalar_type(&UA_TYPES[UA_TYPES_BOOLEAN]), "Failed");
    assertm(accessor.read_bool("Enabled"), "Failed");

    UA_Double setpoint = 21.5;
    ua_value written = ua_value::from_scalar(&setpoint, &UA_TYPES[UA_TYPES_DOUBLE]);
    accessor.write("Speed", written);
    assertm(accessor.read("Speed") == written, "Failed");
    assertm(accessor.read_double("Speed") == 21.5, "Failed");
    assertm(accessor.read_float("Speed") == 21.5f, "Failed");
}

static void test_typed_reads() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=x", ua_value::from_string("42"));
    session->set("ns=2;s=y", ua_value::from_string("abc"));
    session->set("ns=2;s=empty", ua_value());
    variable_accessor accessor{std::move(owned_session)};

    assertm(accessor.read_as<UA_Int32>("x") == 42, "Failed");
    assertm(accessor.read_int("x") == 42, "Failed");
    assertm(accessor.read_as<UA_Double>("x") == 42.0, "Failed");
    assertm(accessor.read_as<std::string>("x") == "42", "Failed");
    assertm(throws<conversion_error>([&accessor]() { accessor.read_as<UA_Int32>("y"); }), "Conversion failures propagate");
    assertm(throws<conversion_error>([&accessor]() { accessor.read_short("y"); }), "Failed");
    assertm(throws<conversion_error>([&accessor]() { accessor.read_double("y"); }), "Failed");
    assertm(accessor.read_string("empty") == "", "An empty value reads as empty string");
    assertm(throws<conversion_error>([&accessor]() { accessor.read_int("empty"); }), "Failed");
    assertm(!accessor.read_bool("empty"), "Failed");
}

static void test_boolean_reads() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=a", ua_value::from_string("true"));
    session->set("ns=2;s=b", ua_value::from_string("1"));
    session->set("ns=2;s=c", ua_value::from_string("false"));
    session->set("ns=2;s=d", ua_value::from_string("on"));
    session->set("ns=2;s=e", ua_value::from_string("True"));
    UA_Int32 one = 1;
    session->set("ns=2;s=f", ua_value::from_scalar(&one, &UA_TYPES[UA_TYPES_INT32]));
    variable_accessor accessor{std::move(owned_session)};

    assertm(accessor.read_as<UA_Boolean>("a"), "Failed");
    assertm(accessor.read_bool("b"), "Failed");
    assertm(!accessor.read_bool("c"), "Failed");
    assertm(!accessor.read_bool("d"), "Failed");
    assertm(accessor.read_bool("e"), "Failed");
    assertm(accessor.read_bool("f"), "Integer 1 reads as true");
}

static void test_read_and_write_failures_propagate() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=ReadOnly", ua_value::from_string("x"));
    variable_accessor accessor{std::move(owned_session)};

    try {
        accessor.read("Missing");
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        assertm(e.get_status_code() == UA_STATUSCODE_BADNODEIDUNKNOWN, "Failed");
    }
    try {
        accessor.write("Missing", 1);
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        assertm(e.get_status_code() == UA_STATUSCODE_BADNODEIDUNKNOWN, "Failed");
    }

    session->write_status_ = UA_STATUSCODE_BADNOTWRITABLE;
    try {
        accessor.write("ReadOnly", "y");
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        assertm(e.get_status_code() == UA_STATUSCODE_BADNOTWRITABLE, "Server side rejection propagates");
    }
    assertm(accessor.read_string("ReadOnly") == "x", "Failed");

    try {
        accessor.read("");
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        assertm(e.get_status_code() == UA_STATUSCODE_BADNODEIDINVALID, "Failed");
    }
    assertm(session->read_node_ids_.size() == 2, "An empty name is rejected before a request is issued");

    session->throw_on_read_ = true;
    try {
        accessor.read("ReadOnly");
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        bool has_cause = false;
        try {
            std::rethrow_if_nested(e);
        } catch (const std::runtime_error& cause) {
            has_cause = std::string(cause.what()) == "decoding failed";
        }
        assertm(has_cause, "The original failure is carried as nested exception");
    }
    session->throw_on_read_ = false;

    session->connected_ = false;
    try {
        accessor.read("ReadOnly");
        assertm(false, "Expected an accessor error");
    } catch (const accessor_error& e) {
        assertm(e.get_status_code() == UA_STATUSCODE_BADCONNECTIONCLOSED, "A down connection fails the read");
    }
    assertm(throws<accessor_error>([&accessor]() { accessor.write("ReadOnly", 2.5f); }), "Failed");
    assertm(!accessor.is_connected(), "Failed");
}

static void test_shutdown_never_raises() {
    std::unique_ptr<fake_session> owned_failing = std::make_unique<fake_session>();
    fake_session* failing = owned_failing.get();
    failing->disconnect_status_ = UA_STATUSCODE_BADCOMMUNICATIONERROR;
    variable_accessor accessor{std::move(owned_failing)};
    accessor.shutdown();
    assertm(failing->disconnect_calls_ == 1, "Failed");
    accessor.shutdown();
    assertm(failing->disconnect_calls_ == 1, "Shutdown runs once");
    assertm(!accessor.is_connected(), "Failed");
    assertm(throws<accessor_error>([&accessor]() { accessor.read("x"); }), "Reads after shutdown fail");
    assertm(throws<accessor_error>([&accessor]() { accessor.write("x", 1); }), "Writes after shutdown fail");

    std::unique_ptr<fake_session> owned_throwing = std::make_unique<fake_session>();
    fake_session* throwing = owned_throwing.get();
    throwing->throw_on_disconnect_ = true;
    {
        variable_accessor throwing_accessor{std::move(owned_throwing)};
        throwing_accessor.shutdown();
    }

    std::unique_ptr<fake_session> owned_implicit = std::make_unique<fake_session>();
    fake_session* implicit = owned_implicit.get();
    implicit->throw_on_disconnect_ = true;
    {
        variable_accessor implicit_accessor{std::move(owned_implicit)};
    }
}

static void test_concurrent_reads_and_shutdowns() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=Level", ua_value::from_string("3"));
    variable_accessor accessor{std::move(owned_session)};
    std::atomic<int> succeeded(0);
    std::atomic<int> failed(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&accessor, &succeeded, &failed]() {
            for (int j = 0; j < 100; j++) {
                try {
                    if (accessor.read_int("Level") == 3)
                        succeeded++;
                } catch (const accessor_error& e) {
                    failed++;
                }
            }
        });
    }
    for (int i = 0; i < 3; i++) {
        threads.emplace_back([&accessor]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            accessor.shutdown();
        });
    }
    for (std::thread& thread : threads)
        thread.join();
    assertm(succeeded + failed == 400, "Every read either returns the value or fails with accessor_error");
    assertm(session->disconnect_calls_ == 1, "Concurrent shutdowns disconnect once");
    assertm(!accessor.is_connected(), "Failed");
}

static void test_port_out_of_range_is_rejected() {
    assertm(throws<std::invalid_argument>([]() { variable_accessor accessor("localhost", 70000); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { variable_accessor accessor("localhost", 0); }), "Failed");
}

static void test_null_session_is_rejected() {
    assertm(throws<std::invalid_argument>([]() { variable_accessor accessor{std::unique_ptr<ua_session>()}; }), "Failed");
}

static void test_sample_carries_timestamps() {
    std::unique_ptr<fake_session> owned_session = std::make_unique<fake_session>();
    fake_session* session = owned_session.get();
    session->set("ns=2;s=Pressure", ua_value::from_string("1.013"));
    variable_accessor accessor{std::move(owned_session)};
    data_sample sample = accessor.read_sample("Pressure");
    assertm(sample.get_status() == UA_STATUSCODE_GOOD, "Failed");
    assertm(sample.has_source_timestamp(), "Failed");
    assertm(sample.get_source_timestamp() > 0, "Failed");
    assertm(!sample.has_server_timestamp(), "Failed");
    assertm(value_coercer::stringify(*sample.get_value().get_variant()) == "1.013", "Failed");
    assertm(accessor.get_endpoint_url().empty(), "Pre-built sessions have no endpoint url");
}

int main(int argc, char* argv[]) {
    test_addressing_is_identical_for_read_and_write();
    test_write_then_read_returns_written_value();
    test_typed_reads();
    test_boolean_reads();
    test_read_and_write_failures_propagate();
    test_shutdown_never_raises();
    test_concurrent_reads_and_shutdowns();
    test_port_out_of_range_is_rejected();
    test_null_session_is_rejected();
    test_sample_carries_timestamps();
    return 0;
}
