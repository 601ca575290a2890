#include <cstdio>
#include <fstream>
#include <stdexcept>
#include "testframe.hpp"
#include "accessor_config.hpp"

int main(int argc, char* argv[]) {
    accessor_config full = accessor_config::from_json(R"({"host": "plc-7", "port": 4841, "timeout_ms": 2500, "log_level": "error"})");
    assertm(full.get_host() == "plc-7", "Failed");
    assertm(full.get_port() == 4841, "Failed");
    assertm(full.get_timeout_ms() == 2500, "Failed");
    assertm(full.get_log_level() == UA_LOGLEVEL_ERROR, "Failed");
    assertm(full.get_endpoint_url() == "opc.tcp://plc-7:4841", "Failed");

    accessor_config minimal = accessor_config::from_json(R"({"host": "localhost", "port": 4840})");
    assertm(minimal.get_timeout_ms() == 0, "The stack default timeout is kept");
    assertm(minimal.get_log_level() == UA_LOGLEVEL_INFO, "Failed");
    assertm(minimal.get_endpoint_url() == "opc.tcp://localhost:4840", "Failed");

    assertm(accessor_config("10.0.0.1", 48010).get_endpoint_url() == "opc.tcp://10.0.0.1:48010", "Failed");
    assertm(accessor_config("10.0.0.1", 65535).get_port() == 65535, "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config("localhost", 70000); }), "Ports above 65535 are not narrowed");
    assertm(throws<std::invalid_argument>([]() { accessor_config("localhost", 0); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config("localhost", -1); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config("", 4840); }), "Failed");

    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json("{"); }), "Malformed JSON");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json("[]"); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"port": 4840})"); }), "Missing host");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "", "port": 4840})"); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "localhost"})"); }), "Missing port");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "localhost", "port": "4840"})"); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "localhost", "port": 70000})"); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "localhost", "port": 0})"); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "localhost", "port": 4840, "timeout_ms": -1})"); }), "Failed");
    assertm(throws<std::invalid_argument>([]() { accessor_config::from_json(R"({"host": "localhost", "port": 4840, "log_level": "loud"})"); }), "Failed");

    const char* path = "accessor_config_testframe.json";
    {
        std::ofstream ofs_config(path);
        ofs_config << R"({"host": "127.0.0.1", "port": 4850, "log_level": "debug"})";
    }
    accessor_config from_file = accessor_config::from_file(path);
    assertm(from_file.get_endpoint_url() == "opc.tcp://127.0.0.1:4850", "Failed");
    assertm(from_file.get_log_level() == UA_LOGLEVEL_DEBUG, "Failed");
    std::remove(path);
    assertm(throws<std::invalid_argument>([path]() { accessor_config::from_file(path); }), "Missing file");
    return 0;
}
