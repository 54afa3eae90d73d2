#include "codemode/audit_log.h"
#include "codemode/crypto.h"
#include "codemode/json.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace codemode {

namespace {

const std::string GENESIS_HASH(64, '0');

std::string iso_now_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
        << std::setfill('0') << ms << "Z";
    return oss.str();
}

struct ChainTail {
    std::string hash;
    uint64_t seq{0};
};

// Last chain link of an existing audit file, if any.
ChainTail read_tail(const std::string& path) {
    ChainTail tail{GENESIS_HASH, 0};
    std::ifstream in(path);
    if (!in) return tail;
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    if (last.empty()) return tail;
    json::Doc d = json::parse(last);
    if (!d) return tail;
    if (auto h = json::get_string(d.root, "chain_hash")) tail.hash = *h;
    if (auto s = json::get_int(d.root, "seq")) tail.seq = (uint64_t)*s;
    return tail;
}

} // namespace

AuditLog::AuditLog(const std::string& path)
    : path_(path), chain_prev_(GENESIS_HASH) {
    if (path_.empty()) {
        out_ = &std::cerr;
        return;
    }
    ChainTail tail = read_tail(path_);
    chain_prev_ = tail.hash;
    seq_ = tail.seq;
    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_) throw std::runtime_error("cannot open audit log: " + path_);
    out_ = &file_;
}

void AuditLog::event(const std::string& name, json_object* payload) {
    std::lock_guard<std::mutex> lk(mu_);

    json::Doc rec = json::new_object();
    json::put_string(rec.root, "event", name);
    json_object_object_add(rec.root, "payload", payload ? json_object_get(payload) : nullptr);
    json_object_object_add(rec.root, "seq", json_object_new_int64((int64_t)(seq_ + 1)));
    json::put_string(rec.root, "ts", iso_now_ms());

    Sha256 h;
    h.update(chain_prev_);
    h.update(json::canonical(rec.root));
    std::string chain_hash = h.finish_hex();

    json::put_string(rec.root, "chain_prev", chain_prev_);
    json::put_string(rec.root, "chain_hash", chain_hash);

    (*out_) << json::canonical(rec.root) << "\n";
    out_->flush();
    if (!out_->good()) {
        out_->clear();
        throw std::runtime_error("audit log write failed" + (path_.empty() ? std::string() : ": " + path_));
    }

    chain_prev_ = chain_hash;
    seq_++;
}

std::string AuditLog::last_hash() const {
    std::lock_guard<std::mutex> lk(mu_);
    return chain_prev_;
}

ChainCheck verify_audit_chain(const std::string& path) {
    ChainCheck res;
    std::ifstream in(path);
    if (!in) {
        res.error = "cannot open: " + path;
        return res;
    }
    std::string prev = GENESIS_HASH;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        json::Doc d = json::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) {
            res.error = "line " + std::to_string(lineno) + ": not a JSON object";
            return res;
        }
        auto got_prev = json::get_string(d.root, "chain_prev");
        auto got_hash = json::get_string(d.root, "chain_hash");
        if (!got_prev || !got_hash) {
            res.error = "line " + std::to_string(lineno) + ": missing chain fields";
            return res;
        }
        if (*got_prev != prev) {
            res.error = "line " + std::to_string(lineno) + ": chain_prev does not match previous hash";
            return res;
        }
        json_object_object_del(d.root, "chain_prev");
        json_object_object_del(d.root, "chain_hash");
        Sha256 h;
        h.update(prev);
        h.update(json::canonical(d.root));
        std::string want = h.finish_hex();
        if (want != *got_hash) {
            res.error = "line " + std::to_string(lineno) + ": chain_hash mismatch";
            return res;
        }
        prev = want;
        res.lines++;
    }
    res.ok = true;
    return res;
}

} // namespace codemode
