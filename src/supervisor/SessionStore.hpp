#ifndef __TETHER_SESSION_STORE__
#define __TETHER_SESSION_STORE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionTypes.hpp"

namespace tether {
/**
 * @brief Persistent record store shared by the supervisor and the router.
 */
class SessionStore {
 public:
  virtual ~SessionStore() {}

  virtual optional<SessionRecord> get(const string& id) = 0;
  virtual vector<SessionRecord> listByStatus(SessionStatus status) = 0;
  /** @brief Inserts or replaces a record. */
  virtual void put(const SessionRecord& record) = 0;
  /**
   * @brief Applies a mutation to an existing record atomically.
   * @return false when no record has that id.
   */
  virtual bool update(const string& id,
                      const function<void(SessionRecord*)>& mutator) = 0;
};

json sessionRecordToJson(const SessionRecord& record);
/** @throws std::runtime_error on missing or malformed fields. */
SessionRecord sessionRecordFromJson(const json& j);

/**
 * @brief SessionStore kept in a JSON file.
 *
 * Every operation takes an advisory lock on the file and reloads it, so both
 * daemons can share one file. An empty path keeps the records in memory.
 */
class JsonSessionStore : public SessionStore {
 public:
  explicit JsonSessionStore(const string& _path);
  virtual ~JsonSessionStore() {}

  virtual optional<SessionRecord> get(const string& id);
  virtual vector<SessionRecord> listByStatus(SessionStatus status);
  virtual void put(const SessionRecord& record);
  virtual bool update(const string& id,
                      const function<void(SessionRecord*)>& mutator);

 protected:
  class FileLock {
   public:
    explicit FileLock(const string& lockPath);
    ~FileLock();

   private:
    int fd;
  };

  map<string, SessionRecord> load();
  void save(const map<string, SessionRecord>& records);

  string path;
  mutex storeMutex;
  map<string, SessionRecord> memoryRecords;
};
}  // namespace tether

#endif  // __TETHER_SESSION_STORE__
