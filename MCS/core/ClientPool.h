#pragma once
#include <vector>
#include <memory>
#include <string>
#include <cstddef>

#include "../net/IClient.h"

// Owns one HttpClient per (server, connection slot). Ids are assigned in
// construction order, starting at 0.
class ClientPool : public ClientSource {
public:
    ClientPool(const std::vector<std::string>& serverUrls, std::size_t connectionsPerServer);

    ClientPool(const ClientPool&) = delete;
    ClientPool& operator=(const ClientPool&) = delete;

    std::vector<ClientEntry> listAvailableClients() const override;
    std::size_t size() const { return clients.size(); }

private:
    std::vector<std::unique_ptr<IClient>> clients;
};
