#pragma once

#include <string>
#include <vector>

// Outcome of one measurement step. bits[i] is the observed value of
// qubit targets[i].
struct MeasurementRecord {
    std::vector<int> targets;
    std::vector<int> bits;
};

struct ExecutionLog {
    int shot = 0;
    int step = 0;
    std::string category;
    std::string message;
};
