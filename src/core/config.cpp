#include "mpu/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace mpu {
namespace {

using json = nlohmann::json;

template<typename T>
void read_field(const json& doc, const char* name, T& target) {
    auto it = doc.find(name);
    if (it != doc.end()) {
        target = it->get<T>();
    }
}

bool is_known_level(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

} // namespace

Result<void> UploadConfig::validate() const {
    if (part_size == 0) {
        return Err<void>(ErrorCode::ConfigError, "part_size must be > 0");
    }
    if (multipart_threshold == 0) {
        return Err<void>(ErrorCode::ConfigError, "multipart_threshold must be > 0");
    }
    if (max_concurrent_parts == 0) {
        return Err<void>(ErrorCode::ConfigError, "max_concurrent_parts must be > 0");
    }
    if (!is_known_level(log_level)) {
        return Err<void>(ErrorCode::ConfigError, "Unknown log_level: " + log_level);
    }
    return Ok();
}

Result<UploadConfig> parse_config(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<UploadConfig>(ErrorCode::ConfigError, std::string("Invalid config JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        return Err<UploadConfig>(ErrorCode::ConfigError, "Config root must be a JSON object");
    }

    UploadConfig config;
    try {
        read_field(doc, "multipart_threshold", config.multipart_threshold);
        read_field(doc, "part_size", config.part_size);
        read_field(doc, "max_concurrent_parts", config.max_concurrent_parts);
        read_field(doc, "max_part_retries", config.max_part_retries);
        read_field(doc, "worker_threads", config.worker_threads);
        read_field(doc, "log_level", config.log_level);

        std::int64_t delay_ms = config.retry_base_delay.count();
        read_field(doc, "retry_base_delay_ms", delay_ms);
        if (delay_ms < 0) {
            return Err<UploadConfig>(ErrorCode::ConfigError, "retry_base_delay_ms must be >= 0");
        }
        config.retry_base_delay = std::chrono::milliseconds(delay_ms);
    } catch (const json::exception& e) {
        return Err<UploadConfig>(ErrorCode::ConfigError, std::string("Invalid config value: ") + e.what());
    }

    if (auto valid = config.validate(); valid.is_error()) {
        return Err<UploadConfig>(valid.error());
    }
    return Ok(config);
}

Result<UploadConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploadConfig>(ErrorCode::ConfigError, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

void apply_log_level(const UploadConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

} // namespace mpu
