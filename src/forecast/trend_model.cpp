#include "forecast/trend_model.hpp"

namespace augur::forecast {

TrendModel fit_trend(const PricePoint* points, size_t count) {
    TrendModel model{};
    if (!points || count == 0) return model;

    const int64_t n = static_cast<int64_t>(count);
    int64_t sum_time = 0;
    int64_t sum_price = 0;
    for (size_t i = 0; i < count; ++i) {
        sum_time += static_cast<int64_t>(points[i].time_index);
        sum_price += static_cast<int64_t>(points[i].price);
    }
    const int64_t mean_time = sum_time / n;
    const int64_t mean_price = sum_price / n;

    int64_t covariance = 0;
    int64_t time_variance = 0;
    int64_t total_variance = 0;
    for (size_t i = 0; i < count; ++i) {
        const int64_t dt = static_cast<int64_t>(points[i].time_index) - mean_time;
        const int64_t dp = static_cast<int64_t>(points[i].price) - mean_price;
        covariance += dt * dp;
        time_variance += dt * dt;
        total_variance += dp * dp;
    }

    model.slope = (time_variance != 0) ? covariance / time_variance : 0;
    model.intercept = mean_price - model.slope * mean_time;

    int64_t residual_variance = 0;
    for (size_t i = 0; i < count; ++i) {
        const int64_t error = static_cast<int64_t>(points[i].price) - predict(model, points[i].time_index);
        residual_variance += error * error;
    }

    if (total_variance > 0) {
        const int64_t ratio = (total_variance - residual_variance) * 100 / total_variance;
        if (ratio <= 0) {
            model.confidence = 0;
        } else if (static_cast<uint64_t>(ratio) > core::kMaxConfidence) {
            model.confidence = core::kMaxConfidence;
        } else {
            model.confidence = static_cast<uint64_t>(ratio);
        }
    }
    return model;
}

int64_t predict(const TrendModel& model, uint64_t time_index) {
    return model.slope * static_cast<int64_t>(time_index) + model.intercept;
}

} // namespace augur::forecast
