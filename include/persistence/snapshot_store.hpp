#pragma once

/**
 * SnapshotStore - versioned on-disk economy snapshots
 *
 * Document: {"version": 1, "saved_at": ns, "state": {...}}
 *
 * save() writes "<path>.tmp", flushes, then renames over <path>, so a
 * reader never sees a half-written snapshot. load() throws SnapshotError
 * on unreadable files, bad JSON or a version it does not understand.
 */

#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace econ {
namespace persistence {

constexpr int SNAPSHOT_VERSION = 1;

class SnapshotStore {
public:
    explicit SnapshotStore(std::string path, logging::AsyncLogger* logger = nullptr)
        : path_(std::move(path)), logger_(logger) {}

    const std::string& path() const { return path_; }

    void save(const nlohmann::json& state, Timestamp saved_at) const {
        nlohmann::json doc = {{"version", SNAPSHOT_VERSION}, {"saved_at", saved_at}, {"state", state}};
        std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                throw SnapshotError("cannot write snapshot '" + tmp + "'");
            }
            out << doc.dump(2);
            out.flush();
            if (!out) {
                throw SnapshotError("short write on snapshot '" + tmp + "'");
            }
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            std::remove(tmp.c_str());
            throw SnapshotError("cannot replace snapshot '" + path_ + "'");
        }
        ECON_LOGF_INFO(logger_, logging::LogCategory::Persistence, "snapshot saved to %s", path_.c_str());
    }

    // Returns the "state" object
    nlohmann::json load() const {
        std::ifstream in(path_);
        if (!in) {
            throw SnapshotError("cannot open snapshot '" + path_ + "'");
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        nlohmann::json state = parse(buffer.str());
        ECON_LOGF_INFO(logger_, logging::LogCategory::Persistence, "snapshot loaded from %s", path_.c_str());
        return state;
    }

    bool exists() const {
        std::ifstream in(path_);
        return static_cast<bool>(in);
    }

    // Validates the envelope and returns the "state" object
    static nlohmann::json parse(const std::string& text) {
        nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            throw SnapshotError("snapshot is not valid JSON");
        }
        auto version = doc.find("version");
        if (version == doc.end() || !version->is_number_integer()) {
            throw SnapshotError("snapshot has no version");
        }
        if (version->get<int>() != SNAPSHOT_VERSION) {
            throw SnapshotError("unsupported snapshot version " + std::to_string(version->get<int>()));
        }
        auto state = doc.find("state");
        if (state == doc.end() || !state->is_object()) {
            throw SnapshotError("snapshot has no state");
        }
        return *state;
    }

private:
    std::string path_;
    logging::AsyncLogger* logger_;
};

} // namespace persistence
} // namespace econ
