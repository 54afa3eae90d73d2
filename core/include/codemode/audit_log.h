#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace codemode {

// Append-only JSONL audit sink with a tamper-evident hash chain:
//   chain_hash = SHA256(chain_prev || canonical(record))
// where record is the line without its chain fields. Opening an existing
// file continues the chain from its last line.
class AuditLog {
public:
    // Empty path writes to stderr (chain still computed, not resumable).
    explicit AuditLog(const std::string& path = "");

    // Throws std::runtime_error if the line cannot be written.
    // payload is borrowed; may be nullptr.
    void event(const std::string& name, json_object* payload);

    const std::string& path() const { return path_; }
    std::string last_hash() const;

private:
    mutable std::mutex mu_;
    std::string path_;
    std::ofstream file_;
    std::ostream* out_{nullptr};
    std::string chain_prev_;
    uint64_t seq_{0};
};

struct ChainCheck {
    bool ok{false};
    size_t lines{0};
    std::string error;
};

// Recomputes every link of an audit file written by AuditLog.
ChainCheck verify_audit_chain(const std::string& path);

} // namespace codemode
