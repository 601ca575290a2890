#include <stdlib.h>
#include <iostream>
#include <open62541/plugin/log_stdout.h>

#include "variable_accessor.hpp"

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <config_file> <variable_name> [<new_string_value>]" << std::endl;
        return 0;
    }
    try {
        variable_accessor accessor(accessor_config::from_file(argv[1]));
        std::string variable_name = argv[2];
        if (argc > 3)
            accessor.write(variable_name, std::string(argv[3]));
        data_sample sample = accessor.read_sample(variable_name);
        std::cout << node_address(variable_name).to_string() << " = " << value_coercer::stringify(*sample.get_value().get_variant()) << std::endl;
        if (sample.has_source_timestamp()) {
            UA_DateTimeStruct source = UA_DateTime_toStruct(sample.get_source_timestamp());
            std::cout << "Source timestamp: " << source.year << "-" << source.month << "-" << source.day << " "
                      << source.hour << ":" << source.min << ":" << source.sec << "." << source.milliSec << std::endl;
        }
        accessor.shutdown();
    } catch (const std::exception& e) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
