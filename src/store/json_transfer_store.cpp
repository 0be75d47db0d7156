/**
 * @file json_transfer_store.cpp
 * @brief Directory-backed transfer store implementation
 */

#include "kcenon/blob_transfer/store/json_transfer_store.h"

#include "kcenon/blob_transfer/core/logging.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <shared_mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

namespace kcenon::blob_transfer {

json_store_config::json_store_config()
    : directory(std::filesystem::temp_directory_path() / "blob_transfer_store") {}

json_store_config::json_store_config(std::filesystem::path dir)
    : directory(std::move(dir)) {}

// ============================================================================
// JSON serialization helpers
// ============================================================================

namespace {

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                      << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_json_string(const std::string& s) -> std::string {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            out += s[i];
            continue;
        }
        switch (s[i + 1]) {
            case '"': out += '"'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '/': out += '/'; ++i; break;
            case 'b': out += '\b'; ++i; break;
            case 'f': out += '\f'; ++i; break;
            case 'n': out += '\n'; ++i; break;
            case 'r': out += '\r'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case 'u':
                if (i + 5 < s.size()) {
                    auto code = std::stoi(s.substr(i + 2, 4), nullptr, 16);
                    out += static_cast<char>(code);
                    i += 5;
                }
                break;
            default: out += s[i]; break;
        }
    }
    return out;
}

auto time_point_to_int64(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

/**
 * @brief Top-level fields of a flat JSON object; string values stay escaped
 */
using json_fields = std::unordered_map<std::string, std::string>;

void skip_whitespace(const std::string& json, std::size_t& pos) {
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\n' ||
                                 json[pos] == '\t' || json[pos] == '\r')) {
        ++pos;
    }
}

/**
 * @brief Read a quoted string starting at pos; pos ends past the closing quote
 */
auto read_quoted(const std::string& json, std::size_t& pos) -> std::string {
    auto start = ++pos;
    while (pos < json.size() && json[pos] != '"') {
        pos += json[pos] == '\\' ? 2 : 1;
    }
    if (pos >= json.size()) {
        throw std::invalid_argument("unterminated string");
    }
    auto value = json.substr(start, pos - start);
    ++pos;
    return value;
}

/**
 * @brief Scan "key": value pairs in document order
 *
 * Keys are only read where a key may start (after '{' or ','), so a string
 * value spelled like a field name is never taken for that field.
 */
auto parse_json_fields(const std::string& json) -> json_fields {
    json_fields fields;
    std::size_t pos = 0;

    skip_whitespace(json, pos);
    if (pos >= json.size() || json[pos] != '{') {
        throw std::invalid_argument("expected a JSON object");
    }
    ++pos;
    skip_whitespace(json, pos);
    if (pos < json.size() && json[pos] == '}') {
        return fields;
    }

    while (true) {
        skip_whitespace(json, pos);
        if (pos >= json.size() || json[pos] != '"') {
            throw std::invalid_argument("expected a field name");
        }
        auto key = read_quoted(json, pos);

        skip_whitespace(json, pos);
        if (pos >= json.size() || json[pos] != ':') {
            throw std::invalid_argument("expected ':' after " + key);
        }
        ++pos;
        skip_whitespace(json, pos);
        if (pos >= json.size()) {
            throw std::invalid_argument("missing value for " + key);
        }

        std::string value;
        if (json[pos] == '"') {
            value = read_quoted(json, pos);
        } else {
            auto start = pos;
            while (pos < json.size() && json[pos] != ',' && json[pos] != '}' &&
                   json[pos] != ' ' && json[pos] != '\n' && json[pos] != '\t' &&
                   json[pos] != '\r') {
                ++pos;
            }
            value = json.substr(start, pos - start);
        }
        fields.insert_or_assign(std::move(key), std::move(value));

        skip_whitespace(json, pos);
        if (pos >= json.size()) {
            throw std::invalid_argument("unterminated object");
        }
        if (json[pos] == '}') {
            return fields;
        }
        if (json[pos] != ',') {
            throw std::invalid_argument("expected ',' between fields");
        }
        ++pos;
    }
}

/**
 * @brief Typed accessors; every one throws std::invalid_argument when the key
 *        is missing so from_json can reject the record in one place
 */
auto require_value(const json_fields& json, const std::string& key) -> const std::string& {
    auto it = json.find(key);
    if (it == json.end()) {
        throw std::invalid_argument("missing field " + key);
    }
    return it->second;
}

auto get_string(const json_fields& json, const std::string& key) -> std::string {
    return unescape_json_string(require_value(json, key));
}

auto get_u64(const json_fields& json, const std::string& key) -> uint64_t {
    return std::stoull(require_value(json, key));
}

auto get_bool(const json_fields& json, const std::string& key) -> bool {
    const auto& value = require_value(json, key);
    if (value == "true") return true;
    if (value == "false") return false;
    throw std::invalid_argument("invalid boolean " + key);
}

auto get_id(const json_fields& json, const std::string& key) -> transfer_id {
    auto parsed = transfer_id::from_string(require_value(json, key));
    if (!parsed) {
        throw std::invalid_argument("invalid id in " + key);
    }
    return *parsed;
}

void write_base(std::ostringstream& oss, const transfer_base& base,
                transfer_kind kind, uint64_t sequence) {
    oss << "  \"id\": \"" << base.id.to_string() << "\",\n";
    oss << "  \"kind\": \"" << to_string(kind) << "\",\n";
    oss << "  \"sequence\": " << sequence << ",\n";
    oss << "  \"state\": \"" << to_string(base.state) << "\",\n";
    oss << "  \"restoration_id\": \"" << escape_json_string(base.restoration_id)
        << "\",\n";
    oss << "  \"parent\": \"" << (base.parent ? base.parent->to_string() : "")
        << "\",\n";
    oss << "  \"error_message\": \"" << escape_json_string(base.error_message)
        << "\",\n";
    oss << "  \"created_at\": " << time_point_to_int64(base.created_at);
}

void read_base(const json_fields& json, transfer_base& base) {
    base.id = get_id(json, "id");
    auto state = parse_transfer_state(get_string(json, "state"));
    if (!state) {
        throw std::invalid_argument("invalid state");
    }
    base.state = *state;
    base.restoration_id = get_string(json, "restoration_id");
    auto parent = require_value(json, "parent");
    if (!parent.empty()) {
        base.parent = transfer_id::from_string(parent);
        if (!base.parent) {
            throw std::invalid_argument("invalid parent id");
        }
    }
    base.error_message = get_string(json, "error_message");
    base.created_at = int64_to_time_point(std::stoll(require_value(json, "created_at")));
}

auto read_type(const json_fields& json) -> transfer_type {
    auto type = parse_transfer_type(get_string(json, "type"));
    if (!type) {
        throw std::invalid_argument("invalid transfer type");
    }
    return *type;
}

auto get_record_path(const std::filesystem::path& dir, const transfer_id& id)
    -> std::filesystem::path {
    return dir / (id.to_string() + ".json");
}

}  // namespace

auto json_transfer_store::to_json(const transfer_record& record, uint64_t sequence)
    -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    write_base(oss, base_of(record), kind_of(record), sequence);

    std::visit(
        overloaded{
            [&](const block_transfer& b) {
                oss << ",\n  \"start_range\": " << b.start_range;
                oss << ",\n  \"end_range\": " << b.end_range;
                oss << ",\n  \"block_id\": \"" << escape_json_string(b.block_id) << "\"";
                oss << ",\n  \"index\": " << b.index;
                oss << ",\n  \"bytes_transferred\": " << b.bytes_transferred;
            },
            [&](const blob_transfer& b) {
                oss << ",\n  \"type\": \"" << to_string(b.type) << "\"";
                oss << ",\n  \"source\": \"" << escape_json_string(b.source) << "\"";
                oss << ",\n  \"destination\": \"" << escape_json_string(b.destination)
                    << "\"";
                oss << ",\n  \"total_bytes\": " << b.total_bytes_to_transfer;
                oss << ",\n  \"bytes_transferred\": " << b.bytes_transferred;
                oss << ",\n  \"total_blocks\": " << b.total_blocks;
                oss << ",\n  \"initial_call_complete\": "
                    << (b.initial_call_complete ? "true" : "false");
                oss << ",\n  \"block_size\": " << b.options.block_size;
                oss << ",\n  \"overwrite\": " << (b.options.overwrite ? "true" : "false");
                oss << ",\n  \"verify_checksum\": "
                    << (b.options.verify_checksum ? "true" : "false");
                oss << ",\n  \"content_type\": \""
                    << escape_json_string(b.options.content_type) << "\"";
                oss << ",\n  \"checksum\": \"" << escape_json_string(b.checksum) << "\"";
            },
            [&](const multi_blob_transfer& m) {
                oss << ",\n  \"type\": \"" << to_string(m.type) << "\"";
                oss << ",\n  \"source\": \"" << escape_json_string(m.source) << "\"";
                oss << ",\n  \"destination\": \"" << escape_json_string(m.destination)
                    << "\"";
            }},
        record);

    oss << "\n}\n";
    return oss.str();
}

auto json_transfer_store::from_json(const std::string& json)
    -> result<std::pair<transfer_record, uint64_t>> {
    try {
        auto fields = parse_json_fields(json);
        auto kind = parse_transfer_kind(get_string(fields, "kind"));
        if (!kind) {
            return unexpected(error(error_code::store_record_invalid, "unknown kind"));
        }
        auto sequence = get_u64(fields, "sequence");

        switch (*kind) {
            case transfer_kind::block: {
                block_transfer b;
                read_base(fields, b);
                b.start_range = get_u64(fields, "start_range");
                b.end_range = get_u64(fields, "end_range");
                b.block_id = get_string(fields, "block_id");
                b.index = static_cast<uint32_t>(get_u64(fields, "index"));
                b.bytes_transferred = get_u64(fields, "bytes_transferred");
                return std::make_pair(transfer_record{std::move(b)}, sequence);
            }
            case transfer_kind::blob: {
                blob_transfer b;
                read_base(fields, b);
                b.type = read_type(fields);
                b.source = get_string(fields, "source");
                b.destination = get_string(fields, "destination");
                b.total_bytes_to_transfer = get_u64(fields, "total_bytes");
                b.bytes_transferred = get_u64(fields, "bytes_transferred");
                b.total_blocks = static_cast<uint32_t>(get_u64(fields, "total_blocks"));
                b.initial_call_complete = get_bool(fields, "initial_call_complete");
                b.options.block_size = get_u64(fields, "block_size");
                b.options.overwrite = get_bool(fields, "overwrite");
                b.options.verify_checksum = get_bool(fields, "verify_checksum");
                b.options.content_type = get_string(fields, "content_type");
                b.checksum = get_string(fields, "checksum");
                return std::make_pair(transfer_record{std::move(b)}, sequence);
            }
            case transfer_kind::multi_blob: {
                multi_blob_transfer m;
                read_base(fields, m);
                m.type = read_type(fields);
                m.source = get_string(fields, "source");
                m.destination = get_string(fields, "destination");
                return std::make_pair(transfer_record{std::move(m)}, sequence);
            }
        }
    } catch (const std::exception& e) {
        return unexpected(error(error_code::store_record_invalid, e.what()));
    }
    return unexpected(error(error_code::store_record_invalid, "unknown kind"));
}

// ============================================================================
// json_transfer_store::impl
// ============================================================================

class json_transfer_store::impl {
public:
    explicit impl(const json_store_config& cfg) : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            BT_LOG_ERROR(log_category::store,
                         "Failed to create store directory " +
                             config_.directory.string() + ": " + ec.message());
        }
    }

    auto fetch(transfer_kind kind, const transfer_filter& filter)
        -> result<std::vector<transfer_record>> {
        auto loaded = ensure_loaded();
        if (!loaded) {
            return unexpected(loaded.error());
        }

        std::shared_lock lock(mutex_);
        std::vector<const entry*> matches;
        for (const auto& [id, e] : cache_) {
            if (kind_of(e.record) == kind && (!filter || filter(e.record))) {
                matches.push_back(&e);
            }
        }
        std::sort(matches.begin(), matches.end(), [](const entry* a, const entry* b) {
            return a->sequence < b->sequence;
        });

        std::vector<transfer_record> out;
        out.reserve(matches.size());
        for (const auto* e : matches) {
            out.push_back(e->record);
        }
        return out;
    }

    auto save(const std::vector<transfer_record>& records) -> result<void> {
        auto loaded = ensure_loaded();
        if (!loaded) {
            return loaded;
        }

        std::unique_lock lock(mutex_);
        for (const auto& record : records) {
            const auto& id = base_of(record).id;
            auto it = cache_.find(id);
            uint64_t sequence = it != cache_.end() ? it->second.sequence : next_sequence_++;

            auto written = write_record(record, sequence);
            if (!written) {
                return written;
            }
            cache_[id] = entry{sequence, record};
        }

        BT_LOG_TRACE(log_category::store,
                     "Persisted " + std::to_string(records.size()) + " record(s)");
        return {};
    }

    auto remove(const transfer_id& id) -> result<void> {
        auto loaded = ensure_loaded();
        if (!loaded) {
            return loaded;
        }

        std::unique_lock lock(mutex_);
        if (!cache_.contains(id)) {
            return {};
        }

        auto doomed = collect_cascade(cache_, id, [](const entry& e) {
            return base_of(e.record).parent;
        });

        BT_LOG_DEBUG(log_category::store,
                     "Removing " + std::to_string(doomed.size()) +
                         " record(s) under " + id.to_string());

        for (const auto& victim : doomed) {
            cache_.erase(victim);
            auto path = get_record_path(config_.directory, victim);
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                BT_LOG_ERROR(log_category::store,
                             "Failed to delete record file: " + path.string() + " (" +
                                 ec.message() + ")");
                return unexpected(error(error_code::store_error,
                                        "failed to delete record: " + ec.message()));
            }
        }
        detach_from_parents(doomed);
        return {};
    }

    auto clear() -> result<void> {
        std::unique_lock lock(mutex_);
        cache_.clear();
        loaded_ = true;

        std::error_code ec;
        std::vector<std::filesystem::path> files;
        for (const auto& file : std::filesystem::directory_iterator(config_.directory, ec)) {
            if (file.path().extension() == ".json") {
                files.push_back(file.path());
            }
        }
        for (const auto& path : files) {
            std::error_code remove_ec;
            std::filesystem::remove(path, remove_ec);
            if (remove_ec) {
                ec = remove_ec;
            }
        }
        if (ec) {
            return unexpected(error(error_code::store_error,
                                    "failed to clear store: " + ec.message()));
        }
        return {};
    }

    auto config() const -> const json_store_config& { return config_; }

private:
    struct entry {
        uint64_t sequence = 0;
        transfer_record record;
    };

    auto write_record(const transfer_record& record, uint64_t sequence) -> result<void> {
        auto path = get_record_path(config_.directory, base_of(record).id);
        auto target = path;
        if (config_.atomic_writes) {
            target += ".tmp";
        }

        {
            std::ofstream file(target, std::ios::trunc);
            if (!file) {
                BT_LOG_ERROR(log_category::store,
                             "Failed to open record file for writing: " + target.string());
                return unexpected(error(error_code::store_error,
                                        "failed to open record file for writing"));
            }
            file << json_transfer_store::to_json(record, sequence);
            if (!file) {
                BT_LOG_ERROR(log_category::store,
                             "Failed to write record file: " + target.string());
                return unexpected(error(error_code::store_error,
                                        "failed to write record file"));
            }
        }

        if (config_.atomic_writes) {
            std::error_code ec;
            std::filesystem::rename(target, path, ec);
            if (ec) {
                return unexpected(error(error_code::store_error,
                                        "failed to replace record file: " + ec.message()));
            }
        }
        return {};
    }

    /**
     * @brief Read every record file once and rebuild child lists
     */
    auto ensure_loaded() -> result<void> {
        {
            std::shared_lock lock(mutex_);
            if (loaded_) {
                return {};
            }
        }

        std::unique_lock lock(mutex_);
        if (loaded_) {
            return {};
        }

        std::error_code ec;
        std::filesystem::directory_iterator it(config_.directory, ec);
        if (ec) {
            BT_LOG_ERROR(log_category::store,
                         "Failed to read store directory " + config_.directory.string() +
                             ": " + ec.message());
            return unexpected(error(error_code::store_error, ec.message()));
        }

        std::unordered_map<transfer_id, entry> loaded;
        for (const auto& file : it) {
            if (file.path().extension() != ".json") {
                continue;
            }
            std::ifstream in(file.path());
            if (!in) {
                return unexpected(error(error_code::store_error,
                                        "failed to open " + file.path().string()));
            }
            std::ostringstream oss;
            oss << in.rdbuf();

            auto parsed = json_transfer_store::from_json(oss.str());
            if (!parsed) {
                BT_LOG_ERROR(log_category::store,
                             "Malformed record " + file.path().filename().string() + ": " +
                                 parsed.error().message);
                return unexpected(error(error_code::store_corrupted,
                                        "malformed record " +
                                            file.path().filename().string() + ": " +
                                            parsed.error().message));
            }
            auto [record, sequence] = std::move(parsed).value();
            next_sequence_ = std::max(next_sequence_, sequence + 1);
            auto id = base_of(record).id;
            loaded.emplace(id, entry{sequence, std::move(record)});
        }

        rebuild_children(loaded);
        cache_ = std::move(loaded);
        loaded_ = true;

        BT_LOG_DEBUG(log_category::store,
                     "Loaded " + std::to_string(cache_.size()) + " record(s) from " +
                         config_.directory.string());
        return {};
    }

    static void rebuild_children(std::unordered_map<transfer_id, entry>& records) {
        struct child {
            uint64_t order;
            transfer_id id;
        };
        std::unordered_map<transfer_id, std::vector<child>> children;
        for (const auto& [id, e] : records) {
            const auto& parent = base_of(e.record).parent;
            if (!parent) {
                continue;
            }
            uint64_t order = e.sequence;
            if (const auto* block = std::get_if<block_transfer>(&e.record)) {
                order = block->index;
            }
            children[*parent].push_back(child{order, id});
        }

        for (auto& [parent_id, list] : children) {
            auto it = records.find(parent_id);
            if (it == records.end()) {
                continue;
            }
            std::sort(list.begin(), list.end(),
                      [](const child& a, const child& b) { return a.order < b.order; });
            std::vector<transfer_id> ids;
            ids.reserve(list.size());
            for (const auto& c : list) {
                ids.push_back(c.id);
            }
            std::visit(overloaded{
                           [](block_transfer&) {},
                           [&](blob_transfer& b) { b.blocks = std::move(ids); },
                           [&](multi_blob_transfer& m) { m.blobs = std::move(ids); }},
                       it->second.record);
        }
    }

    void detach_from_parents(const std::vector<transfer_id>& removed) {
        for (auto& [id, e] : cache_) {
            std::visit(overloaded{
                           [](block_transfer&) {},
                           [&](blob_transfer& b) {
                               std::erase_if(b.blocks, [&](const transfer_id& c) {
                                   return std::find(removed.begin(), removed.end(), c) !=
                                          removed.end();
                               });
                           },
                           [&](multi_blob_transfer& m) {
                               std::erase_if(m.blobs, [&](const transfer_id& c) {
                                   return std::find(removed.begin(), removed.end(), c) !=
                                          removed.end();
                               });
                           }},
                       e.record);
        }
    }

    json_store_config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<transfer_id, entry> cache_;
    uint64_t next_sequence_ = 0;
    bool loaded_ = false;
};

// ============================================================================
// json_transfer_store
// ============================================================================

json_transfer_store::json_transfer_store(const json_store_config& config)
    : impl_(std::make_unique<impl>(config)) {}

json_transfer_store::~json_transfer_store() = default;

auto json_transfer_store::fetch(transfer_kind kind, const transfer_filter& filter)
    -> result<std::vector<transfer_record>> {
    return impl_->fetch(kind, filter);
}

auto json_transfer_store::save(const std::vector<transfer_record>& records)
    -> result<void> {
    return impl_->save(records);
}

auto json_transfer_store::remove(const transfer_id& id) -> result<void> {
    return impl_->remove(id);
}

auto json_transfer_store::clear() -> result<void> {
    return impl_->clear();
}

auto json_transfer_store::config() const -> const json_store_config& {
    return impl_->config();
}

}  // namespace kcenon::blob_transfer
