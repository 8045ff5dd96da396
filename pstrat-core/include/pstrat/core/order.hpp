#pragma once

#include <cstdint>
#include <string>

namespace pstrat::core {

enum class Direction : std::uint8_t { Long, Short };
enum class Offset : std::uint8_t { None, Open, Close, CloseToday, CloseYesterday };
enum class OrderType : std::uint8_t { Limit, Market };
enum class OrderStatus : std::uint8_t { Submitting, NotTraded, PartTraded, AllTraded, Cancelled, Rejected };

const char* toString(Direction d) noexcept;
const char* toString(Offset o) noexcept;
const char* toString(OrderStatus s) noexcept;

struct OrderRequest {
    std::string instrument;          // opaque instrument key
    std::string symbol;              // venue-local symbol from contract metadata
    std::string venue;
    Direction direction{Direction::Long};
    Offset offset{Offset::None};
    OrderType type{OrderType::Limit};
    double price{};
    int volume{};                    // lots
    std::string reference;           // correlation tag, "<app>_<strategy>"
};

struct CancelRequest {
    std::string orderId;
    std::string instrument;
    std::string symbol;
    std::string venue;
};

// Last known state of an order as reported by the broker.
struct OrderData {
    std::string orderId;
    std::string instrument;
    std::string symbol;
    std::string venue;
    std::string gateway;
    Direction direction{Direction::Long};
    Offset offset{Offset::None};
    OrderType type{OrderType::Limit};
    double price{};
    int volume{};
    int traded{};
    OrderStatus status{OrderStatus::Submitting};
    std::string reference;
    std::uint64_t tsNs{};

    bool isActive() const noexcept {
        return status == OrderStatus::Submitting
            || status == OrderStatus::NotTraded
            || status == OrderStatus::PartTraded;
    }

    CancelRequest cancelRequest() const { return CancelRequest{orderId, instrument, symbol, venue}; }
};

} // namespace pstrat::core
