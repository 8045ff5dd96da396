#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pstrat/core/events.hpp"
#include "pstrat/core/market_data.hpp"
#include "pstrat/core/order.hpp"

namespace pstrat::core {

// Broker-side collaborator: contract metadata, market-data subscription and
// order routing. Order status and fills come back asynchronously through
// StrategyEngine::processOrder / processTrade.
class BrokerGateway {
public:
    virtual ~BrokerGateway() = default;

    virtual std::optional<ContractData> getContract(const std::string& instrument) const = 0;
    virtual std::optional<OrderData> getOrder(const std::string& orderId) const = 0;

    virtual void subscribe(const SubscribeRequest& req, const std::string& gateway) = 0;

    // Returns the order id, or an empty string when submission was rejected
    virtual std::string sendOrder(const OrderRequest& req, const std::string& gateway) = 0;
    virtual void cancelOrder(const CancelRequest& req, const std::string& gateway) = 0;

    // Split policy for lock/net position accounting. The default keeps the
    // request whole.
    virtual std::vector<OrderRequest> convertOrderRequest(const OrderRequest& req,
                                                          const std::string& gateway,
                                                          bool lock,
                                                          bool net) {
        (void)gateway; (void)lock; (void)net;
        return {req};
    }

    // Bookkeeping hook called for every accepted child request
    virtual void updateOrderRequest(const OrderRequest& req,
                                    const std::string& orderId,
                                    const std::string& gateway) {
        (void)req; (void)orderId; (void)gateway;
    }

    virtual std::vector<BarData> queryHistory(const HistoryRequest& req, const std::string& gateway) {
        (void)req; (void)gateway;
        return {};
    }
};

// Presentation-side collaborator. May be called from the init worker thread.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onLog(const LogEvent& ev) = 0;
    virtual void onStrategyUpdate(const StrategySnapshot& snapshot) = 0;
};

} // namespace pstrat::core
