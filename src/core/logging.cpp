// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "kcenon/blob_transfer/core/logging.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

namespace kcenon::blob_transfer {

namespace {

auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto current_timestamp(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) {
        gmtime_s(&tm_buf, &time_t_val);
    } else {
        localtime_s(&tm_buf, &time_t_val);
    }
#else
    if (utc) {
        gmtime_r(&time_t_val, &tm_buf);
    } else {
        localtime_r(&time_t_val, &tm_buf);
    }
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

// Replace every regex match with the result of a masking function
template <typename MaskFn>
auto replace_matches(const std::string& input, const std::regex& pattern,
                     MaskFn mask_fn) -> std::string {
    std::string result;
    std::sregex_iterator it(input.begin(), input.end(), pattern);
    std::sregex_iterator end;

    std::size_t last_pos = 0;
    for (; it != end; ++it) {
        auto pos = static_cast<std::size_t>(it->position());
        result += input.substr(last_pos, pos - last_pos);
        result += mask_fn(it->str());
        last_pos = pos + static_cast<std::size_t>(it->length());
    }
    result += input.substr(last_pos);
    return result;
}

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::critical;
        default: return kcenon::logger::log_level::info;
    }
}
#endif

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    if (!config_.mask_paths && !config_.mask_endpoints) {
        return input;
    }

    std::string result = input;

    if (config_.mask_endpoints) {
        static const std::regex endpoint_pattern(R"([a-zA-Z][a-zA-Z0-9+.-]*://[^\s/'"]+)");
        result = replace_matches(result, endpoint_pattern,
            [this](const std::string& match) { return mask_endpoint(match); });
    }

    if (config_.mask_paths) {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");
        result = replace_matches(result, path_pattern,
            [this](const std::string& match) { return mask_path(match); });
    }

    return result;
}

auto sensitive_info_masker::mask_path(const std::string& path) const
    -> std::string {
    if (!config_.mask_paths || path.empty()) {
        return path;
    }

    auto last_sep = path.find_last_of("/\\");
    if (last_sep == std::string::npos) {
        return path;
    }

    return std::string(last_sep, config_.mask_char) + "/" +
           path.substr(last_sep + 1);
}

auto sensitive_info_masker::mask_endpoint(const std::string& endpoint) const
    -> std::string {
    if (!config_.mask_endpoints || endpoint.empty()) {
        return endpoint;
    }

    auto scheme_end = endpoint.find("://");
    auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto host = endpoint.substr(host_start);
    if (host.size() <= config_.visible_chars) {
        return endpoint;
    }

    return endpoint.substr(0, host_start) + host.substr(0, config_.visible_chars) +
           std::string(host.size() - config_.visible_chars, config_.mask_char);
}

// ============================================================================
// transfer_log_context / log_record
// ============================================================================

auto transfer_log_context::to_json(const sensitive_info_masker* masker) const
    -> std::string {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    auto add_field = [&](const char* name, const std::string& value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    };
    auto add_number = [&](const char* name, auto value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":" << value;
        first = false;
    };

    if (!transfer_id.empty()) add_field("transfer_id", transfer_id);
    if (!kind.empty()) add_field("kind", kind);
    if (!state.empty()) add_field("state", state);
    if (!restoration_id.empty()) add_field("restoration_id", restoration_id);
    if (source) {
        add_field("source", masker ? masker->mask(*source) : *source);
    }
    if (destination) {
        add_field("destination", masker ? masker->mask(*destination) : *destination);
    }
    if (bytes_transferred) add_number("bytes_transferred", *bytes_transferred);
    if (total_bytes) add_number("total_bytes", *total_bytes);
    if (block_index) add_number("block_index", *block_index);
    if (total_blocks) add_number("total_blocks", *total_blocks);
    if (error_code) add_number("error_code", *error_code);
    if (error_message) {
        add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
    }

    oss << "}";
    return oss.str();
}

auto log_record::to_json(const sensitive_info_masker* masker) const
    -> std::string {
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << timestamp << "\"";
    oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
    oss << ",\"category\":\"" << category << "\"";
    oss << ",\"message\":\""
        << escape_json_string(masker ? masker->mask(message) : message) << "\"";

    if (context) {
        auto ctx_json = context->to_json(masker);
        if (ctx_json.size() > 2) {
            oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
        }
    }

    if (file) {
        std::string source_file = file;
        if (masker) {
            source_file = masker->mask_path(source_file);
        }
        oss << ",\"source\":{\"file\":\"" << escape_json_string(source_file) << "\"";
        if (line > 0) {
            oss << ",\"line\":" << line;
        }
        if (function) {
            oss << ",\"function\":\"" << function << "\"";
        }
        oss << "}";
    }

    oss << "}";
    return oss.str();
}

auto log_record::to_text(const sensitive_info_masker* masker) const
    -> std::string {
    std::ostringstream oss;
    oss << timestamp << " [" << log_level_to_string(level) << "] [" << category
        << "] " << (masker ? masker->mask(message) : message);
    if (context) {
        oss << " " << context->to_json(masker);
    }
    return oss.str();
}

// ============================================================================
// transfer_logger
// ============================================================================

void transfer_logger::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    auto result = kcenon::logger::logger_builder()
        .with_async(true)
        .with_min_level(to_logger_level(min_level_.load()))
        .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
        .build();

    if (result) {
        logger_ = std::move(result.value());
    }
#endif
}

void transfer_logger::shutdown() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
        logger_->stop();
        logger_.reset();
    }
#endif
    initialized_ = false;
}

void transfer_logger::set_level(log_level level) {
    min_level_.store(level);
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->set_min_level(to_logger_level(level));
    }
#endif
}

void transfer_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    output_format_ = format;
}

auto transfer_logger::get_output_format() const -> log_output_format {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return output_format_;
}

void transfer_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    masker_.set_config(config);
}

auto transfer_logger::get_masking_config() const -> masking_config {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return masker_.get_config();
}

void transfer_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void transfer_logger::log(log_level level,
                          std::string_view category,
                          std::string_view message,
                          const transfer_log_context* context,
                          const char* file,
                          int line,
                          const char* function) {
    if (!is_enabled(level)) return;

    log_record record;
    record.level = level;
    record.category = std::string(category);
    record.message = std::string(message);
    if (context) {
        record.context = *context;
    }
    record.file = file;
    record.line = line;
    record.function = function;

    log_output_format format;
    sensitive_info_masker current_masker;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = output_format_;
        current_masker = masker_;
    }
    record.timestamp = current_timestamp(format == log_output_format::json);

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(record);
        }
    }

    if (console_output_.load()) {
        write(record, current_masker, format);
    }
}

void transfer_logger::write(const log_record& record,
                            const sensitive_info_masker& masker,
                            log_output_format format) {
    auto line = format == log_output_format::json ? record.to_json(&masker)
                                                  : record.to_text(&masker);

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        if (record.file && record.line > 0 && record.function) {
            logger_->log(to_logger_level(record.level), line, record.file,
                         record.line, record.function);
        } else {
            logger_->log(to_logger_level(record.level), line);
        }
        return;
    }
#endif

    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line << "\n";
}

void transfer_logger::flush() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
    }
#endif
    std::cerr.flush();
}

auto get_logger() -> transfer_logger& {
    static transfer_logger instance;
    return instance;
}

auto make_log_context(const transfer_id& id) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = id.to_string();
    return ctx;
}

}  // namespace kcenon::blob_transfer
