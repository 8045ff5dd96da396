#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "pstrat/core/events.hpp"
#include "pstrat/core/gateway.hpp"

namespace pstrat::apps {

// Simulated broker: every accepted limit order fills in full at its limit
// price. Order updates and fills are buffered until the runner collects
// them with drainEvents() and feeds them back through the dispatcher.
class PaperGateway : public core::BrokerGateway {
public:
    static constexpr const char* kGatewayName = "PAPER";

    explicit PaperGateway(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    void addContract(core::ContractData contract);
    void setClock(std::uint64_t tsNs);

    std::optional<core::ContractData> getContract(const std::string& instrument) const override;
    std::optional<core::OrderData> getOrder(const std::string& orderId) const override;
    void subscribe(const core::SubscribeRequest& req, const std::string& gateway) override;
    std::string sendOrder(const core::OrderRequest& req, const std::string& gateway) override;
    void cancelOrder(const core::CancelRequest& req, const std::string& gateway) override;

    // Moves every buffered event into out, in the order they happened
    std::size_t drainEvents(std::vector<core::EngineEvent>& out);

    std::size_t orderCount() const;
    std::size_t tradeCount() const;

private:
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::map<std::string, core::ContractData> contracts_{};
    std::map<std::string, core::OrderData> orders_{};
    std::set<std::string> subscribed_{};
    std::vector<core::EngineEvent> pending_{};
    std::uint64_t nowNs_{0};
    std::uint64_t orderSeq_{0};
    std::uint64_t tradeSeq_{0};
};

} // namespace pstrat::apps
