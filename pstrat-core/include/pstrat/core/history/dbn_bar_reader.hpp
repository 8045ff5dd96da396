#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <databento/dbn.hpp>
#include <databento/dbn_file_store.hpp>
#include <databento/record.hpp>

namespace pstrat::core::history {

// One OHLCV record with prices already converted from DBN fixed point
struct OhlcvBar {
    std::uint64_t tsNs{0};
    std::uint32_t instrumentId{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

// Sequential reader over a local OHLCV file (.dbn or .dbn.zst). Records of
// other schemas are skipped; reading stops at the first bar past the window
// end since DBN files are written in event-time order.
class DbnBarReader {
public:
    DbnBarReader() = default;

    DbnBarReader(const DbnBarReader&) = delete;
    DbnBarReader& operator=(const DbnBarReader&) = delete;

    // On failure returns false and keeps the reason in lastError()
    bool open(const std::string& path, std::uint64_t startNs, std::uint64_t endNs);
    void close();

    // Next bar inside [startNs, endNs]; false at end of data
    bool nextBar(OhlcvBar& out);

    const std::string& dataset() const noexcept { return dataset_; }
    bool isOpen() const noexcept { return static_cast<bool>(store_); }
    std::size_t skipped() const noexcept { return skipped_; }
    const std::string& lastError() const noexcept { return lastError_; }

private:
    std::unique_ptr<databento::DbnFileStore> store_;
    std::string dataset_{};
    std::uint64_t startNs_{0};
    std::uint64_t endNs_{0};
    std::size_t skipped_{0};
    std::string lastError_{};
};

} // namespace pstrat::core::history
