#include "LoadBalancer.h"

#include <sstream>

LoadBalancer::LoadBalancer(std::size_t unhealthyThreshold)
    : threshold(unhealthyThreshold == 0 ? 1 : unhealthyThreshold) {
}

LoadBalancer::Counters& LoadBalancer::countersFor(int clientId) {
    std::lock_guard<std::mutex> lock(mtx);

    auto& slot = counters[clientId];
    if (!slot)
        slot = std::make_unique<Counters>();
    return *slot;
}

LoadBalancer::Counters* LoadBalancer::find(int clientId) const {
    std::lock_guard<std::mutex> lock(mtx);

    auto it = counters.find(clientId);
    return it == counters.end() ? nullptr : it->second.get();
}

bool LoadBalancer::selectClient(const std::vector<ClientEntry>& clients, ClientEntry& out) const {
    if (clients.empty())
        return false;

    auto pick = [&](bool healthyOnly) {
        const ClientEntry* best = nullptr;
        std::size_t bestLoad = 0;

        for (const auto& entry : clients) {
            if (healthyOnly && !isHealthy(entry.id))
                continue;

            std::size_t l = load(entry.id);
            if (!best || l < bestLoad || (l == bestLoad && entry.id < best->id)) {
                best = &entry;
                bestLoad = l;
            }
        }
        return best;
    };

    const ClientEntry* chosen = pick(true);
    if (!chosen)
        chosen = pick(false);

    out = *chosen;
    return true;
}

void LoadBalancer::increment(int clientId) {
    countersFor(clientId).load.fetch_add(1, std::memory_order_relaxed);
}

void LoadBalancer::decrement(int clientId) {
    Counters* c = find(clientId);
    if (!c)
        return;

    std::size_t current = c->load.load(std::memory_order_relaxed);
    while (current > 0 &&
        !c->load.compare_exchange_weak(current, current - 1, std::memory_order_relaxed)) {
    }
}

std::size_t LoadBalancer::load(int clientId) const {
    const Counters* c = find(clientId);
    return c ? c->load.load(std::memory_order_relaxed) : 0;
}

void LoadBalancer::recordError(int clientId) {
    countersFor(clientId).errors.fetch_add(1, std::memory_order_relaxed);
}

void LoadBalancer::resetErrors(int clientId) {
    Counters* c = find(clientId);
    if (c)
        c->errors.store(0, std::memory_order_relaxed);
}

bool LoadBalancer::isHealthy(int clientId) const {
    const Counters* c = find(clientId);
    return !c || c->errors.load(std::memory_order_relaxed) < threshold;
}

std::vector<ClientEntry> LoadBalancer::healthyClients(const std::vector<ClientEntry>& clients) const {
    std::vector<ClientEntry> healthy;
    for (const auto& entry : clients) {
        if (isHealthy(entry.id))
            healthy.push_back(entry);
    }

    if (healthy.empty())
        return clients;
    return healthy;
}

std::vector<ClientStats> LoadBalancer::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);

    std::vector<ClientStats> out;
    out.reserve(counters.size());
    for (const auto& kv : counters) {
        const std::size_t errors = kv.second->errors.load(std::memory_order_relaxed);
        out.push_back({
            kv.first,
            kv.second->load.load(std::memory_order_relaxed),
            errors,
            errors < threshold
            });
    }
    return out;
}

std::string LoadBalancer::formatStats() const {
    auto stats = snapshot();
    if (stats.empty())
        return "Client load: no clients used yet";

    std::ostringstream os;
    os << "Client load:";
    for (const auto& s : stats) {
        os << " [" << s.id << "] load=" << s.load
            << " errors=" << s.errors
            << (s.healthy ? "" : " (unhealthy)");
    }
    return os.str();
}

LoadGuard::LoadGuard(LoadBalancer& lb, int clientId)
    : balancer(lb), id(clientId) {
    balancer.increment(id);
}

LoadGuard::~LoadGuard() {
    balancer.decrement(id);
}
