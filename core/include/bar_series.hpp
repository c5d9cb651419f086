#pragma once

#include "datatypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace core {

    // Columnar OHLCV data: one ordered timestamp index plus named numeric columns.
    // A series may be built with fields missing; validate() rejects it before use.
    class BarSeries {
    public:
        BarSeries() = default;
        explicit BarSeries(std::vector<Timestamp> timestamps);

        static BarSeries fromCandles(const TimeSeries<Candle>& candles);

        std::size_t size() const { return timestamps_.size(); }
        bool empty() const { return timestamps_.empty(); }

        const std::vector<Timestamp>& timestamps() const { return timestamps_; }
        const Timestamp& timestampAt(std::size_t index) const;

        bool hasField(const std::string& name) const;
        // Throws DataException if the column is absent
        const TimeSeries<double>& field(const std::string& name) const;
        // Throws DataException if the column length differs from the index length
        void setField(const std::string& name, TimeSeries<double> values);
        std::vector<std::string> fieldNames() const;

        // Throws DataException on a missing required field, a column/index length
        // mismatch, a non-ascending or duplicate timestamp, or a non-finite value.
        void validate() const;

    private:
        std::vector<Timestamp> timestamps_;
        std::map<std::string, TimeSeries<double>> columns_;
    };

} // namespace core
