#include "../include/private_analytics/storage.hpp"
#include "../include/private_analytics/errors.hpp"
#include "../include/private_analytics/logging.hpp"

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/util/delimited_message_util.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>
#include <utility>

namespace private_analytics {

namespace {

bool writeAll(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(rc);
    }
    return true;
}

} // namespace

FileBudgetStore::FileBudgetStore(std::string path) : _path{std::move(path)} {}

boost::optional<proto::PrivacyBudgetState> FileBudgetStore::load() {
    std::ifstream input(this->_path, std::ios::binary);
    if (!input) return boost::none;

    // an unreadable state must never be mistaken for a fresh budget
    proto::PrivacyBudgetState state;
    if (!state.ParseFromIstream(&input))
        throw StorageFailure("persisted budget state at " + this->_path + " is unreadable");
    return state;
}

// write to a sibling file, fsync it, then rename over the committed copy
bool FileBudgetStore::commit(const proto::PrivacyBudgetState& state) {
    std::string serialized;
    if (!state.SerializeToString(&serialized)) return false;

    std::string temporary = this->_path + ".tmp";
    int fd = ::open(temporary.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        logMessage(LogLevel::Error, "budget-store", std::string("open failed: ") + std::strerror(errno));
        return false;
    }

    bool ok = writeAll(fd, serialized) && ::fsync(fd) == 0;
    if (::close(fd) != 0) ok = false;
    if (!ok || std::rename(temporary.c_str(), this->_path.c_str()) != 0) {
        logMessage(LogLevel::Error, "budget-store", "budget state commit failed");
        std::remove(temporary.c_str());
        return false;
    }
    return true;
}

FileAuditStore::FileAuditStore(std::string path) : _path{std::move(path)} {}

bool FileAuditStore::append(const proto::AuditLogEntry& entry) {
    std::lock_guard<std::mutex> lock(this->_mutex);

    std::string framed;
    {
        google::protobuf::io::StringOutputStream stream(&framed);
        if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(entry, &stream))
            return false;
    }

    int fd = ::open(this->_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
    if (fd < 0) return false;
    bool ok = writeAll(fd, framed) && ::fsync(fd) == 0;
    if (::close(fd) != 0) ok = false;
    return ok;
}

std::vector<proto::AuditLogEntry> FileAuditStore::entries() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    std::vector<proto::AuditLogEntry> entries;

    int fd = ::open(this->_path.c_str(), O_RDONLY);
    if (fd < 0) return entries;

    {
        google::protobuf::io::FileInputStream stream(fd);
        bool clean_eof = false;
        while (true) {
            proto::AuditLogEntry entry;
            if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(&entry, &stream, &clean_eof))
                break;
            entries.push_back(entry);
        }
        if (!clean_eof)
            logMessage(LogLevel::Warning, "audit-store", "audit log ends with a truncated entry");
    }
    ::close(fd);
    return entries;
}

boost::optional<proto::PrivacyBudgetState> MemoryBudgetStore::load() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_state;
}

bool MemoryBudgetStore::commit(const proto::PrivacyBudgetState& state) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    if (this->_fail_commits) return false;
    this->_state = state;
    ++this->_commit_count;
    return true;
}

void MemoryBudgetStore::set_fail_commits(bool state) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_fail_commits = state;
}

std::size_t MemoryBudgetStore::get_commit_count() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_commit_count;
}

bool MemoryAuditStore::append(const proto::AuditLogEntry& entry) {
    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_entries.push_back(entry);
    return true;
}

std::vector<proto::AuditLogEntry> MemoryAuditStore::entries() {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_entries;
}

} // namespace private_analytics
