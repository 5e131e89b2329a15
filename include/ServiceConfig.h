#pragma once

#include <cstddef>
#include <string>

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    size_t threadCount = 8;

    std::string artifactDir = "artifacts";
    std::string modelVersion = "v2";

    std::string auditLogPath = "prediction_logs.csv";
    bool auditEnabled = true;

    // Suppresses the per-request monitoring line.
    bool quiet = false;
    bool showHelp = false;

    /**
     * @brief Builds config from CLI flags and an optional --config file.
     * @post Flags given on the command line win over file values.
     * @throws Helios::ConfigurationException on unknown flags or invalid values.
     */
    static ServiceConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads a loose `key: value` file (YAML- or JSON-ish) over `base`.
     * @throws Helios::ConfigurationException on unreadable files or bad values.
     */
    static ServiceConfig fromFile(const std::string& configPath, const ServiceConfig& base);

    /// @throws Helios::ConfigurationException on invalid values.
    void validate() const;

    static std::string usage(const std::string& program);
};
