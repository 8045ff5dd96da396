#include "paper_gateway.hpp"

#include <utility>

namespace pstrat::apps {

PaperGateway::PaperGateway(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void PaperGateway::addContract(core::ContractData contract) {
    std::lock_guard<std::mutex> lock(mutex_);
    contract.gateway = kGatewayName;
    contracts_[contract.instrument] = std::move(contract);
}

void PaperGateway::setClock(std::uint64_t tsNs) {
    std::lock_guard<std::mutex> lock(mutex_);
    nowNs_ = tsNs;
}

std::optional<core::ContractData> PaperGateway::getContract(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contracts_.find(instrument);
    if (it == contracts_.end()) return std::nullopt;
    return it->second;
}

std::optional<core::OrderData> PaperGateway::getOrder(const std::string& orderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(orderId);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

void PaperGateway::subscribe(const core::SubscribeRequest& req, const std::string& gateway) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribed_.insert(req.instrument);
    }
    logger_->info("{} subscribed {}", gateway, req.instrument);
}

std::string PaperGateway::sendOrder(const core::OrderRequest& req, const std::string& gateway) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (contracts_.count(req.instrument) == 0 || req.volume <= 0) {
        logger_->warn("{} rejected order for {} volume {}", gateway, req.instrument, req.volume);
        return {};
    }

    core::OrderData order{};
    order.orderId = std::string(kGatewayName) + "." + std::to_string(++orderSeq_);
    order.instrument = req.instrument;
    order.symbol = req.symbol;
    order.venue = req.venue;
    order.gateway = gateway;
    order.direction = req.direction;
    order.offset = req.offset;
    order.type = req.type;
    order.price = req.price;
    order.volume = req.volume;
    order.reference = req.reference;
    order.tsNs = nowNs_;
    order.status = core::OrderStatus::NotTraded;
    pending_.emplace_back(order);

    core::TradeData trade{};
    trade.tradeId = std::string(kGatewayName) + ".T" + std::to_string(++tradeSeq_);
    trade.orderId = order.orderId;
    trade.instrument = order.instrument;
    trade.gateway = gateway;
    trade.direction = order.direction;
    trade.offset = order.offset;
    trade.price = order.price;
    trade.volume = order.volume;
    trade.tsNs = nowNs_;

    order.traded = order.volume;
    order.status = core::OrderStatus::AllTraded;
    pending_.emplace_back(order);
    pending_.emplace_back(trade);

    orders_[order.orderId] = order;
    return order.orderId;
}

void PaperGateway::cancelOrder(const core::CancelRequest& req, const std::string& gateway) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(req.orderId);
    if (it == orders_.end() || !it->second.isActive()) {
        logger_->debug("{} cancel ignored for {}", gateway, req.orderId);
        return;
    }
    it->second.status = core::OrderStatus::Cancelled;
    it->second.tsNs = nowNs_;
    pending_.emplace_back(it->second);
}

std::size_t PaperGateway::drainEvents(std::vector<core::EngineEvent>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t n = pending_.size();
    for (auto& ev : pending_) out.push_back(std::move(ev));
    pending_.clear();
    return n;
}

std::size_t PaperGateway::orderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_.size();
}

std::size_t PaperGateway::tradeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(tradeSeq_);
}

} // namespace pstrat::apps
