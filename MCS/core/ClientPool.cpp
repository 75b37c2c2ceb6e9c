#include "ClientPool.h"
#include "../net/HttpClient.h"

ClientPool::ClientPool(const std::vector<std::string>& serverUrls, std::size_t connectionsPerServer) {
    const std::size_t perServer = connectionsPerServer == 0 ? 1 : connectionsPerServer;

    clients.reserve(serverUrls.size() * perServer);
    for (const auto& url : serverUrls) {
        for (std::size_t i = 0; i < perServer; ++i)
            clients.push_back(std::make_unique<HttpClient>(url));
    }
}

std::vector<ClientEntry> ClientPool::listAvailableClients() const {
    std::vector<ClientEntry> out;
    out.reserve(clients.size());

    for (std::size_t i = 0; i < clients.size(); ++i)
        out.push_back({ clients[i].get(), static_cast<int>(i) });

    return out;
}
