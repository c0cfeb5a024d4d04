#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "Types.h"
#include <string>

namespace pq {

// Load study configuration from YAML file
class ConfigLoader {
public:
    // Load configuration from file, missing keys take defaults
    static AnalysisConfig load(const std::string& filepath);

    // Load configuration from YAML text
    static AnalysisConfig load_from_string(const std::string& yaml_text);

    // Configuration with every default applied
    static AnalysisConfig defaults();

    // Validate configuration
    static bool validate(const AnalysisConfig& config, std::string& error_message);
};

} // namespace pq

#endif // CONFIG_LOADER_H
