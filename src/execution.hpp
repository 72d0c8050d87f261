#pragma once

#include "types.hpp"

#include <string>

namespace execmetrics {

struct Execution {
    std::string id;
    std::string instrumentId;
    Side side;
    Qty quantity;
    Price price;
    Timestamp timestamp;
    std::string venue; // Optional, empty when unknown
    std::string phase; // Trading phase at fill time, empty when unknown
};

} // namespace execmetrics
