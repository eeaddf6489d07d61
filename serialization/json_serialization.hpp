#ifndef ANIMATIC_SERIALIZATION_JSON_SERIALIZATION_HPP
#define ANIMATIC_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

namespace animatic::json {

constexpr const char* REPORT_FORMAT = "animatic-report";
constexpr const char* REPORT_VERSION = "0.1.0";

// Envelope written around every measurement report.
// `kind` names the measurement ("flatness"), `data` holds its payload.
struct Report {
    std::string version = REPORT_VERSION;
    std::string kind;
    std::string generated_at;
    std::string source;
    nlohmann::json stats = nlohmann::json::object();
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["format"] = REPORT_FORMAT;
        j["version"] = version;
        j["kind"] = kind;
        if (!generated_at.empty()) j["generated_at"] = generated_at;
        if (!source.empty()) j["source"] = source;
        if (!stats.empty()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    static Report from_json(const nlohmann::json& j) {
        if (!j.is_object() || j.value("format", "") != REPORT_FORMAT) {
            throw std::runtime_error("Not an animatic report");
        }
        Report report;
        report.version = j.value("version", "unknown");
        report.kind = j.value("kind", "");
        report.generated_at = j.value("generated_at", "");
        report.source = j.value("source", "");
        report.stats = j.value("stats", nlohmann::json::object());
        report.data = j.value("data", nlohmann::json());
        return report;
    }
};

// UTC, ISO 8601
inline std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

inline void write_report(const std::string& path, const Report& report) {
    write_json_file(path, report.to_json());
}

inline Report read_report(const std::string& path) {
    return Report::from_json(read_json_file(path));
}

}  // namespace animatic::json

#endif // ANIMATIC_SERIALIZATION_JSON_SERIALIZATION_HPP
