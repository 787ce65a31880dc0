#include "rup/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace rup {
namespace {

using json = nlohmann::json;

std::chrono::milliseconds read_ms(const json& doc, const char* key, std::chrono::milliseconds fallback) {
    if (!doc.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(doc.at(key).get<std::int64_t>());
}

} // namespace

Result<void> validate(const UploaderConfig& config) {
    if (config.chunk_size == 0) {
        return Err<void>(ErrorKind::InvalidInput, "chunk_size must be > 0");
    }
    if (config.max_concurrent_uploads == 0) {
        return Err<void>(ErrorKind::InvalidInput, "max_concurrent_uploads must be > 0");
    }
    if (config.backoff_base.count() < 0 || config.completed_grace.count() < 0 ||
        config.auto_retry_delay.count() < 0) {
        return Err<void>(ErrorKind::InvalidInput, "durations must not be negative");
    }
    if (config.request_timeout.count() <= 0) {
        return Err<void>(ErrorKind::InvalidInput, "request_timeout must be > 0");
    }
    return Ok();
}

Result<UploaderConfig> parse_config(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<UploaderConfig>(ErrorKind::InvalidInput, "config is not a JSON object");
    }

    UploaderConfig config;
    try {
        config.chunk_size = doc.value("chunk_size", config.chunk_size);
        config.max_concurrent_uploads = doc.value("max_concurrent_uploads", config.max_concurrent_uploads);
        config.single_shot_threshold = doc.value("single_shot_threshold", config.single_shot_threshold);
        config.max_retries = doc.value("max_retries", config.max_retries);
        config.listing_limit = doc.value("listing_limit", config.listing_limit);
        config.backoff_base = read_ms(doc, "backoff_base_ms", config.backoff_base);
        config.completed_grace = read_ms(doc, "completed_grace_ms", config.completed_grace);
        config.auto_retry = doc.value("auto_retry", config.auto_retry);
        config.auto_retry_delay = read_ms(doc, "auto_retry_delay_ms", config.auto_retry_delay);
        config.max_auto_retries = doc.value("max_auto_retries", config.max_auto_retries);
        config.request_timeout = read_ms(doc, "request_timeout_ms", config.request_timeout);
        config.endpoint = doc.value("endpoint", config.endpoint);
        config.state_dir = doc.value("state_dir", config.state_dir.string());
    } catch (const json::exception& e) {
        return Err<UploaderConfig>(ErrorKind::InvalidInput, std::string("invalid config value: ") + e.what());
    }

    if (auto valid = validate(config); valid.is_error()) {
        return Err<UploaderConfig>(valid.error());
    }
    return Ok(config);
}

Result<UploaderConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploaderConfig>(ErrorKind::InvalidInput, "cannot open config file: " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return parse_config(contents.str());
}

} // namespace rup
