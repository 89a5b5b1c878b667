#pragma once

#include <memory>
#include <utility>

#include "strata/client/ClientMetrics.hpp"
#include "strata/client/conf/ClientConfig.hpp"

namespace sta::client {

/**
 * @brief Configuration and metrics shared by the streams and transports of one client.
 *
 * Cheap to copy: copies share the same metrics.
 */
class BlockStoreContext {
public:
    explicit BlockStoreContext(ClientConfig config) :
        inner_(std::make_shared<ContextSharedData>(ContextSharedData {
            .config = std::move(config),
            .metrics = std::make_shared<ClientMetrics>(),
        })) {}

    const ClientConfig& config() const {
        return inner_->config;
    }

    ClientMetrics& metrics() const {
        return *inner_->metrics;
    }

private:
    struct ContextSharedData {
        ClientConfig config;
        std::shared_ptr<ClientMetrics> metrics;
    };

    std::shared_ptr<ContextSharedData> inner_;
};

} // namespace sta::client
