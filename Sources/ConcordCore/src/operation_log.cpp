#include "concord/operation_log.hpp"
#include "concord/log.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace concord {

using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// operation_type names
// ============================================================================

std::string to_string(operation_type type) {
    switch (type) {
        case operation_type::insert: return "INSERT";
        case operation_type::update: return "UPDATE";
        case operation_type::remove: return "DELETE";
    }
    return "UNKNOWN";
}

std::optional<operation_type> operation_type_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "INSERT") return operation_type::insert;
    if (upper == "UPDATE") return operation_type::update;
    if (upper == "DELETE" || upper == "REMOVE") return operation_type::remove;
    return std::nullopt;
}

// ============================================================================
// JSON serialization helpers for column values
// ============================================================================

static json value_to_json(const column_value_t& value) {
    return std::visit([](auto&& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            // Encode as hex string
            std::ostringstream hex;
            for (auto byte : v) {
                hex << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte);
            }
            return json{{"blob", hex.str()}};
        } else {
            return v;
        }
    }, value);
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::vector<uint8_t> hex_to_blob(const std::string& hex_str) {
    if (hex_str.size() % 2 != 0) {
        throw std::invalid_argument("Blob hex has odd length");
    }
    std::vector<uint8_t> data;
    data.reserve(hex_str.size() / 2);
    for (size_t i = 0; i < hex_str.size(); i += 2) {
        int high = hex_digit(hex_str[i]);
        int low = hex_digit(hex_str[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Blob hex has a non-hex digit");
        }
        data.push_back(static_cast<uint8_t>(high * 16 + low));
    }
    return data;
}

static column_value_t json_to_value(const json& j) {
    if (j.is_null()) {
        return nullptr;
    } else if (j.is_boolean()) {
        return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
    } else if (j.is_number_integer()) {
        return j.get<int64_t>();
    } else if (j.is_number_float()) {
        return j.get<double>();
    } else if (j.is_string()) {
        return j.get<std::string>();
    } else if (j.is_object() && j.contains("blob") && j["blob"].is_string()) {
        return hex_to_blob(j["blob"].get<std::string>());
    }
    // Nested structures are stored as their JSON text
    return j.dump();
}

static json record_to_json_object(const record_t& record) {
    json j = json::object();
    for (const auto& [name, value] : record) {
        j[name] = value_to_json(value);
    }
    return j;
}

static record_t record_from_json_object(const json& j) {
    record_t record;
    for (auto& [key, value] : j.items()) {
        record[key] = json_to_value(value);
    }
    return record;
}

std::string record_to_json(const record_t& record) {
    return record_to_json_object(record).dump();
}

std::optional<record_t> record_from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) return std::nullopt;
        return record_from_json_object(j);
    } catch (const std::exception& e) {
        LOG_DEBUG("oplog", "Record JSON rejected: %s", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// operation implementation
// ============================================================================

std::string operation::to_json() const {
    json j;
    j["id"] = id;
    j["operation_type"] = to_string(type);
    j["table_name"] = table_name;
    j["record_data"] = record_to_json_object(record_data);
    j["old_data"] = old_data ? record_to_json_object(*old_data) : json(nullptr);
    j["timestamp"] = to_epoch_millis(timestamp);
    return j.dump();
}

std::optional<operation> operation::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) return std::nullopt;

        auto type = operation_type_from_string(j.at("operation_type").get<std::string>());
        if (!type) return std::nullopt;

        operation op;
        op.id = j.at("id").get<int64_t>();
        op.type = *type;
        op.table_name = j.at("table_name").get<std::string>();
        if (j.contains("record_data") && j["record_data"].is_object()) {
            op.record_data = record_from_json_object(j["record_data"]);
        }
        if (j.contains("old_data") && j["old_data"].is_object()) {
            op.old_data = record_from_json_object(j["old_data"]);
        }
        op.timestamp = from_epoch_millis(j.value("timestamp", int64_t{0}));
        return op;
    } catch (const std::exception& e) {
        LOG_DEBUG("oplog", "Operation JSON rejected: %s", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// operation_log implementation
// ============================================================================

operation_log::operation_log(std::string journal_path) : journal_path_(std::move(journal_path)) {
    auto parent = fs::path(journal_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("oplog", "Cannot create journal directory %s: %s", parent.c_str(), ec.message().c_str());
        }
    }
    load();
}

void operation_log::load() {
    std::ifstream in(journal_path_);
    if (!in) {
        LOG_DEBUG("oplog", "No journal at %s - starting empty", journal_path_.c_str());
        return;
    }

    std::string line;
    size_t line_number = 0;
    bool damaged = false;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) continue;
        auto op = operation::from_json(line);
        if (!op) {
            // Typically a torn final write from a crash
            LOG_WARN("oplog", "Skipping unreadable journal line %zu in %s", line_number, journal_path_.c_str());
            damaged = true;
            continue;
        }
        next_id_ = std::max(next_id_, op->id + 1);
        operations_.push_back(std::move(*op));
    }
    in.close();

    // Rewrite so later appends do not land on the end of a torn line
    if (damaged) {
        try {
            rewrite(operations_);
        } catch (const std::system_error& e) {
            LOG_ERROR("oplog", "Failed to repair journal %s: %s", journal_path_.c_str(), e.what());
        }
    }
    LOG_DEBUG("oplog", "Loaded %zu pending operations from %s", operations_.size(), journal_path_.c_str());
}

void operation_log::append_line(const std::string& line) {
    int fd = ::open(journal_path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + journal_path_);
    }

    std::string data = line + "\n";
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw std::system_error(err, std::generic_category(), "write " + journal_path_);
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "fsync " + journal_path_);
    }
    ::close(fd);
}

void operation_log::rewrite(const std::vector<operation>& operations) {
    std::string temp_path = journal_path_ + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "open " + temp_path);
        }
        for (const auto& op : operations) {
            out << op.to_json() << '\n';
        }
        out.flush();
        if (!out) {
            throw std::system_error(EIO, std::generic_category(), "write " + temp_path);
        }
    }

    int fd = ::open(temp_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }

    if (::rename(temp_path.c_str(), journal_path_.c_str()) != 0) {
        throw std::system_error(errno, std::generic_category(), "rename " + temp_path);
    }
}

bool operation_log::track(operation_type type, const std::string& table, const record_t& data) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        operation op;
        op.id = next_id_;
        op.type = type;
        op.table_name = table;
        if (type == operation_type::remove) {
            op.old_data = data;
        } else {
            op.record_data = data;
        }
        op.timestamp = std::chrono::system_clock::now();

        append_line(op.to_json());

        ++next_id_;
        operations_.push_back(std::move(op));
        LOG_DEBUG("oplog", "Logged %s on %s (pending: %zu)", to_string(type).c_str(), table.c_str(), operations_.size());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("oplog", "Failed to log %s on %s: %s", to_string(type).c_str(), table.c_str(), e.what());
        return false;
    }
}

std::vector<operation> operation_log::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

size_t operation_log::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.size();
}

void operation_log::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    rewrite({});
    size_t count = operations_.size();
    operations_.clear();
    LOG_DEBUG("oplog", "Cleared %zu pending operations", count);
}

void operation_log::acknowledge(int64_t up_to_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<operation> remaining;
    for (const auto& op : operations_) {
        if (op.id > up_to_id) remaining.push_back(op);
    }
    rewrite(remaining);

    size_t count = operations_.size() - remaining.size();
    operations_ = std::move(remaining);
    LOG_INFO("oplog", "Cleared %zu synced operations (%zu still pending)", count, operations_.size());
}

void operation_log::replace(const std::vector<operation>& updated) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<operation> rewritten = operations_;
    size_t count = 0;
    for (const auto& op : updated) {
        auto it = std::find_if(rewritten.begin(), rewritten.end(),
                               [&](const operation& pending) { return pending.id == op.id; });
        if (it == rewritten.end()) continue;
        *it = op;
        ++count;
    }
    if (count == 0) return;

    rewrite(rewritten);
    operations_ = std::move(rewritten);
    LOG_DEBUG("oplog", "Rewrote %zu pending operations", count);
}

} // namespace concord
