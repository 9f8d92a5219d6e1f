#include "SessionStore.hpp"

#include <sys/file.h>

namespace tether {
namespace {
template <typename T>
void putOptional(json* j, const char* key, const optional<T>& value) {
  if (value) {
    (*j)[key] = *value;
  } else {
    (*j)[key] = nullptr;
  }
}

template <typename T>
optional<T> getOptional(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullopt;
  }
  return it->template get<T>();
}
}  // namespace

json sessionRecordToJson(const SessionRecord& record) {
  json j;
  j["id"] = record.id;
  j["status"] = sessionStatusToString(record.status);
  j["permissionProfile"] = permissionProfileToString(record.permissionProfile);
  putOptional(&j, "processId", record.processId);
  j["startedAt"] = record.startedAt;
  putOptional(&j, "completedAt", record.completedAt);
  putOptional(&j, "exitCode", record.exitCode);
  j["outputLog"] = record.outputLog;
  j["outputBytes"] = record.outputBytes;
  j["lastOutputSeq"] = record.lastOutputSeq;
  j["lastInputSeq"] = record.lastInputSeq;
  putOptional(&j, "workerId", record.workerId);
  putOptional(&j, "multiplexName", record.multiplexName);
  putOptional(&j, "parentSessionId", record.parentSessionId);
  return j;
}

SessionRecord sessionRecordFromJson(const json& j) {
  SessionRecord record;
  try {
    record.id = j.at("id").get<string>();
    record.status = sessionStatusFromString(j.at("status").get<string>());
    record.permissionProfile = permissionProfileFromString(
        jsonValueOr<string>(j, "permissionProfile", "interactive"));
    record.processId = getOptional<int64_t>(j, "processId");
    record.startedAt = jsonValueOr<string>(j, "startedAt", "");
    record.completedAt = getOptional<string>(j, "completedAt");
    record.exitCode = getOptional<int>(j, "exitCode");
    record.outputLog = jsonValueOr<string>(j, "outputLog", "");
    record.outputBytes = jsonValueOr<int64_t>(j, "outputBytes", 0);
    record.lastOutputSeq = jsonValueOr<int64_t>(j, "lastOutputSeq", 0);
    record.lastInputSeq = jsonValueOr<int64_t>(j, "lastInputSeq", 0);
    record.workerId = getOptional<string>(j, "workerId");
    record.multiplexName = getOptional<string>(j, "multiplexName");
    record.parentSessionId = getOptional<string>(j, "parentSessionId");
  } catch (const json::exception& je) {
    throw std::runtime_error(string("Malformed session record: ") + je.what());
  }
  return record;
}

JsonSessionStore::FileLock::FileLock(const string& lockPath) : fd(-1) {
  if (lockPath.empty()) {
    return;
  }
  fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot open lock file " + lockPath + ": " +
                             strerror(errno));
  }
  while (::flock(fd, LOCK_EX) < 0) {
    if (errno != EINTR) {
      auto localErrno = errno;
      ::close(fd);
      throw std::runtime_error(string("Cannot lock session store: ") +
                               strerror(localErrno));
    }
  }
}

JsonSessionStore::FileLock::~FileLock() {
  if (fd >= 0) {
    ::flock(fd, LOCK_UN);
    ::close(fd);
  }
}

JsonSessionStore::JsonSessionStore(const string& _path) : path(_path) {
  if (!path.empty()) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
      fs::create_directories(parent);
    }
    LOG(INFO) << "Session records are stored in " << path;
  }
}

map<string, SessionRecord> JsonSessionStore::load() {
  if (path.empty()) {
    return memoryRecords;
  }
  map<string, SessionRecord> records;
  ifstream in(path);
  if (!in) {
    return records;
  }
  json j;
  try {
    in >> j;
  } catch (const json::exception& je) {
    throw std::runtime_error("Corrupt session store " + path + ": " +
                             je.what());
  }
  for (const auto& item : j.value("sessions", json::array())) {
    SessionRecord record = sessionRecordFromJson(item);
    records[record.id] = record;
  }
  return records;
}

void JsonSessionStore::save(const map<string, SessionRecord>& records) {
  if (path.empty()) {
    memoryRecords = records;
    return;
  }
  json j;
  j["sessions"] = json::array();
  for (const auto& it : records) {
    j["sessions"].push_back(sessionRecordToJson(it.second));
  }
  string tmpPath = path + ".tmp";
  {
    ofstream out(tmpPath, ios::out | ios::trunc);
    // Output tails can end in a split UTF-8 sequence
    out << j.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!out) {
      throw std::runtime_error("Cannot write session store " + tmpPath);
    }
  }
  if (::rename(tmpPath.c_str(), path.c_str()) < 0) {
    throw std::runtime_error("Cannot replace session store " + path + ": " +
                             strerror(errno));
  }
}

optional<SessionRecord> JsonSessionStore::get(const string& id) {
  lock_guard<mutex> guard(storeMutex);
  FileLock fileLock(path.empty() ? "" : path + ".lock");
  auto records = load();
  auto it = records.find(id);
  if (it == records.end()) {
    return nullopt;
  }
  return it->second;
}

vector<SessionRecord> JsonSessionStore::listByStatus(SessionStatus status) {
  lock_guard<mutex> guard(storeMutex);
  FileLock fileLock(path.empty() ? "" : path + ".lock");
  vector<SessionRecord> result;
  for (const auto& it : load()) {
    if (it.second.status == status) {
      result.push_back(it.second);
    }
  }
  return result;
}

void JsonSessionStore::put(const SessionRecord& record) {
  lock_guard<mutex> guard(storeMutex);
  FileLock fileLock(path.empty() ? "" : path + ".lock");
  auto records = load();
  records[record.id] = record;
  save(records);
}

bool JsonSessionStore::update(const string& id,
                              const function<void(SessionRecord*)>& mutator) {
  lock_guard<mutex> guard(storeMutex);
  FileLock fileLock(path.empty() ? "" : path + ".lock");
  auto records = load();
  auto it = records.find(id);
  if (it == records.end()) {
    return false;
  }
  mutator(&it->second);
  save(records);
  return true;
}
}  // namespace tether
