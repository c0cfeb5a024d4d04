#ifndef OUTPUT_WRITER_H
#define OUTPUT_WRITER_H

#include "Study.h"
#include <string>
#include <vector>

namespace pq {

// Result packet schema identifier
constexpr const char* SCHEMA_VERSION = "pq.v1";

// Write study results to files
class OutputWriter {
public:
    // Write ranked scenarios to CSV file
    static void write_csv(const std::string& filepath, const std::vector<ScenarioResult>& scenarios);

    // Write the machine-readable result packet to JSON file
    static void write_report(const std::string& filepath, const StudyResults& results);

    // Result packet as a JSON string (what write_report writes)
    static std::string render_report(const StudyResults& results);
};

} // namespace pq

#endif // OUTPUT_WRITER_H
