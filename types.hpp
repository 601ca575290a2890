#ifndef TYPES_HPP
#define TYPES_HPP

#include <open62541/types.h>

namespace opcua_driver {
    typedef UA_UInt16 port_t;
    typedef UA_UInt16 namespace_index_t;
    typedef UA_UInt32 timeout_ms_t;
};
#endif // TYPES_HPP
