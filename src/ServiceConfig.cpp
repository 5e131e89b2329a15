#include "ServiceConfig.h"

#include "CommonUtils.h"
#include "HeliosExceptions.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Helios::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Helios::HeliosException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Helios::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue, int maxValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue || parsed > maxValue) {
        throw Helios::ConfigurationException("Value for " + key + " must be in [" + std::to_string(minValue) + ", " +
                                             std::to_string(maxValue) + "]");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Helios::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string stripStructuralTokens(std::string line) {
    line = CommonUtils::trim(line);
    if (!line.empty() && line.back() == ',') line.pop_back();
    if (line == "{" || line == "}") return "";
    return CommonUtils::trim(line);
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(ServiceConfig& config, const std::string& key, const std::string& value) {
    if (key == "host") {
        config.host = value;
    } else if (key == "port") {
        config.port = parseIntStrict(value, key, 1, 65535);
    } else if (key == "threads" || key == "thread_count") {
        config.threadCount = static_cast<size_t>(parseIntStrict(value, key, 1, 1024));
    } else if (key == "artifact_dir") {
        config.artifactDir = value;
    } else if (key == "model_version") {
        config.modelVersion = value;
    } else if (key == "audit_log") {
        config.auditLogPath = value;
    } else if (key == "audit_enabled") {
        config.auditEnabled = parseBoolStrict(value, key);
    } else if (key == "quiet") {
        config.quiet = parseBoolStrict(value, key);
    } else {
        throw Helios::ConfigurationException("Unknown config key: " + key);
    }
}

std::string requireValue(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw Helios::ConfigurationException(flag + " expects a value");
    }
    return argv[++i];
}
} // namespace

ServiceConfig ServiceConfig::fromArgs(int argc, char* argv[]) {
    ServiceConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            config = fromFile(requireValue(argc, argv, i, arg), config);
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--host") {
            config.host = requireValue(argc, argv, i, arg);
        } else if (arg == "--port") {
            config.port = parseIntStrict(requireValue(argc, argv, i, arg), arg, 1, 65535);
        } else if (arg == "--threads") {
            config.threadCount = static_cast<size_t>(parseIntStrict(requireValue(argc, argv, i, arg), arg, 1, 1024));
        } else if (arg == "--artifact-dir") {
            config.artifactDir = requireValue(argc, argv, i, arg);
        } else if (arg == "--model-version") {
            config.modelVersion = requireValue(argc, argv, i, arg);
        } else if (arg == "--audit-log") {
            config.auditLogPath = requireValue(argc, argv, i, arg);
        } else if (arg == "--no-audit") {
            config.auditEnabled = false;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else {
            throw Helios::ConfigurationException("Unknown argument: " + arg);
        }
    }

    config.validate();
    return config;
}

ServiceConfig ServiceConfig::fromFile(const std::string& configPath, const ServiceConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Helios::ConfigurationException("Could not open config file: " + configPath);

    ServiceConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = stripStructuralTokens(line);
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Helios::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                 ": expected 'key: value'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Helios::HeliosException& ex) {
            throw Helios::ConfigurationException("Config parse error at line " + std::to_string(lineNo) + ": '" +
                                                 line + "' -> " + ex.what());
        }
    }

    config.validate();
    return config;
}

void ServiceConfig::validate() const {
    if (host.empty()) {
        throw Helios::ConfigurationException("host cannot be empty");
    }
    if (port < 1 || port > 65535) {
        throw Helios::ConfigurationException("port must be in [1, 65535]");
    }
    if (threadCount == 0) {
        throw Helios::ConfigurationException("threads must be >= 1");
    }
    if (artifactDir.empty()) {
        throw Helios::ConfigurationException("artifact_dir cannot be empty");
    }
    if (modelVersion.empty()) {
        throw Helios::ConfigurationException("model_version cannot be empty");
    }
    if (auditEnabled && auditLogPath.empty()) {
        throw Helios::ConfigurationException("audit_log cannot be empty while auditing is enabled");
    }
}

std::string ServiceConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --config <file>          key: value config file (flags override it)\n"
        << "  --host <addr>            Bind address (default: 0.0.0.0)\n"
        << "  --port <n>               Listen port (default: 8000)\n"
        << "  --threads <n>            Worker threads (default: 8)\n"
        << "  --artifact-dir <dir>     Directory holding scaler_<v>.bin / model_<v>.bin (default: artifacts)\n"
        << "  --model-version <tag>    Artifact version to load (default: v2)\n"
        << "  --audit-log <file>       Prediction audit CSV (default: prediction_logs.csv)\n"
        << "  --no-audit               Disable the prediction audit log\n"
        << "  --quiet                  Suppress per-request monitoring lines\n"
        << "  --help                   Show this help message\n";
    return out.str();
}
