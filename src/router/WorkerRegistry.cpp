#include "WorkerRegistry.hpp"

namespace tether {
shared_ptr<PacketChannel> WorkerRegistry::registerWorker(
    const WorkerRegister& registration, shared_ptr<PacketChannel> channel) {
  lock_guard<mutex> guard(registryMutex);
  shared_ptr<PacketChannel> replaced;
  auto it = workers.find(registration.id());
  if (it != workers.end() && it->second.channel != channel) {
    replaced = it->second.channel;
  }

  WorkerInfo info;
  info.id = registration.id();
  info.name = registration.name();
  info.hostname = registration.hostname();
  info.maxSessions = registration.max_sessions();
  info.channel = channel;
  info.activeSessions = set<string>(registration.active_sessions().begin(),
                                    registration.active_sessions().end());
  info.lastSeen = Clock::now();
  workers[info.id] = info;
  LOG(INFO) << "Worker " << info.id << " (" << info.name << "@"
            << info.hostname << ") registered with "
            << info.activeSessions.size() << " active sessions"
            << (replaced ? ", replacing its old connection" : "");
  return replaced;
}

void WorkerRegistry::heartbeat(const string& workerId,
                               const WorkerHeartbeat& heartbeat) {
  lock_guard<mutex> guard(registryMutex);
  auto it = workers.find(workerId);
  if (it == workers.end()) {
    LOG(WARNING) << "Heartbeat from unregistered worker " << workerId;
    return;
  }
  it->second.activeSessions = set<string>(
      heartbeat.active_sessions().begin(), heartbeat.active_sessions().end());
  it->second.lastSeen = Clock::now();
}

void WorkerRegistry::removeWorker(const string& workerId,
                                  shared_ptr<PacketChannel> channel) {
  lock_guard<mutex> guard(registryMutex);
  auto it = workers.find(workerId);
  if (it != workers.end() && it->second.channel == channel) {
    LOG(INFO) << "Worker " << workerId << " disconnected";
    workers.erase(it);
  }
}

optional<WorkerInfo> WorkerRegistry::getWorker(const string& workerId) {
  lock_guard<mutex> guard(registryMutex);
  auto it = workers.find(workerId);
  if (it == workers.end()) {
    return nullopt;
  }
  return it->second;
}

bool WorkerRegistry::isLive(const string& workerId) {
  auto worker = getWorker(workerId);
  return worker && worker->channel && !worker->channel->isDead();
}

vector<WorkerInfo> WorkerRegistry::listWorkers() {
  lock_guard<mutex> guard(registryMutex);
  vector<WorkerInfo> result;
  for (const auto& it : workers) {
    result.push_back(it.second);
  }
  return result;
}

vector<shared_ptr<PacketChannel>> WorkerRegistry::pruneStale(
    int64_t maxSilenceMs) {
  lock_guard<mutex> guard(registryMutex);
  vector<shared_ptr<PacketChannel>> dropped;
  for (auto it = workers.begin(); it != workers.end();) {
    if (millisSince(it->second.lastSeen) > maxSilenceMs ||
        it->second.channel->isDead()) {
      LOG(INFO) << "Pruning stale worker " << it->first;
      dropped.push_back(it->second.channel);
      it = workers.erase(it);
    } else {
      ++it;
    }
  }
  return dropped;
}
}  // namespace tether
