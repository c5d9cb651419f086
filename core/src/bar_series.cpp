#include "bar_series.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace core {

    BarSeries::BarSeries(std::vector<Timestamp> timestamps)
        : timestamps_(std::move(timestamps)) {}

    BarSeries BarSeries::fromCandles(const TimeSeries<Candle>& candles) {
        std::vector<Timestamp> index;
        TimeSeries<double> open, high, low, close, volume;
        index.reserve(candles.size());
        open.reserve(candles.size());
        high.reserve(candles.size());
        low.reserve(candles.size());
        close.reserve(candles.size());
        volume.reserve(candles.size());

        for (const auto& candle : candles) {
            index.push_back(candle.timestamp);
            open.push_back(candle.open);
            high.push_back(candle.high);
            low.push_back(candle.low);
            close.push_back(candle.close);
            volume.push_back(candle.volume);
        }

        BarSeries series(std::move(index));
        series.setField("open", std::move(open));
        series.setField("high", std::move(high));
        series.setField("low", std::move(low));
        series.setField("close", std::move(close));
        series.setField("volume", std::move(volume));
        return series;
    }

    const Timestamp& BarSeries::timestampAt(std::size_t index) const {
        if (index >= timestamps_.size()) {
            throw DataException(fmt::format("Bar index {} out of range (series has {} bars)", index, timestamps_.size()));
        }
        return timestamps_[index];
    }

    bool BarSeries::hasField(const std::string& name) const {
        return columns_.find(name) != columns_.end();
    }

    const TimeSeries<double>& BarSeries::field(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            throw DataException(fmt::format("Bar series is missing required field '{}'", name));
        }
        return it->second;
    }

    void BarSeries::setField(const std::string& name, TimeSeries<double> values) {
        if (values.size() != timestamps_.size()) {
            throw DataException(fmt::format("Field '{}' has {} values but the series index has {} bars",
                                            name, values.size(), timestamps_.size()));
        }
        columns_[name] = std::move(values);
    }

    std::vector<std::string> BarSeries::fieldNames() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (const auto& pair : columns_) {
            names.push_back(pair.first);
        }
        return names;
    }

    void BarSeries::validate() const {
        for (const auto& name : requiredFields()) {
            const auto& column = field(name); // Throws on a missing field
            if (column.size() != timestamps_.size()) {
                throw DataException(fmt::format("Field '{}' length {} does not match index length {}",
                                                name, column.size(), timestamps_.size()));
            }
            for (std::size_t i = 0; i < column.size(); ++i) {
                if (!std::isfinite(column[i])) {
                    throw DataException(fmt::format("Field '{}' has a non-finite value at bar {} ({})",
                                                    name, i, utils::timestampToDateString(timestamps_[i])));
                }
            }
        }

        for (std::size_t i = 1; i < timestamps_.size(); ++i) {
            if (!(timestamps_[i - 1] < timestamps_[i])) {
                throw DataException(fmt::format("Timestamps must be strictly ascending: bar {} ({}) does not follow bar {} ({})",
                                                i, utils::timestampToString(timestamps_[i]),
                                                i - 1, utils::timestampToString(timestamps_[i - 1])));
            }
        }
    }

} // namespace core
