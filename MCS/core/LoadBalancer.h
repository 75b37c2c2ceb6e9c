#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <cstddef>

#include "utils.h"

struct ClientStats {
    int id;
    std::size_t load;
    std::size_t errors;
    bool healthy;
};

// Per-client in-flight chunk counters plus a consecutive-error count used
// to steer new work away from failing connections.
class LoadBalancer {
public:
    explicit LoadBalancer(std::size_t unhealthyThreshold = 3);

    // Least loaded healthy client, ties to the lowest id. Falls back to all
    // candidates when none is healthy. False only for an empty list.
    bool selectClient(const std::vector<ClientEntry>& clients, ClientEntry& out) const;

    void increment(int clientId);
    void decrement(int clientId);
    std::size_t load(int clientId) const;

    void recordError(int clientId);
    void resetErrors(int clientId);
    bool isHealthy(int clientId) const;

    // Healthy subset in input order; the full list if none is healthy.
    std::vector<ClientEntry> healthyClients(const std::vector<ClientEntry>& clients) const;

    std::vector<ClientStats> snapshot() const;
    std::string formatStats() const;

private:
    struct Counters {
        std::atomic<std::size_t> load{ 0 };
        std::atomic<std::size_t> errors{ 0 };
    };

    Counters& countersFor(int clientId);
    Counters* find(int clientId) const;

private:
    std::size_t threshold;
    mutable std::mutex mtx; // guards the map shape only
    std::map<int, std::unique_ptr<Counters>> counters;
};

// Holds one unit of load on a client for its lifetime.
class LoadGuard {
public:
    LoadGuard(LoadBalancer& lb, int clientId);
    ~LoadGuard();

    LoadGuard(const LoadGuard&) = delete;
    LoadGuard& operator=(const LoadGuard&) = delete;

private:
    LoadBalancer& balancer;
    int id;
};
