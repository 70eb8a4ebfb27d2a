#include "forecast/price_history.hpp"

namespace augur::forecast {

namespace {

constexpr std::array<PricePoint, kEthUsdHistoryLength> kEthUsdHistory = {{
    {1, 3200},  {2, 3215},  {3, 3189},  {4, 3221},  {5, 3254},
    {6, 3278},  {7, 3242},  {8, 3291},  {9, 3315},  {10, 3287},
    {11, 3324}, {12, 3352}, {13, 3389}, {14, 3412}, {15, 3398},
    {16, 3436}, {17, 3462}, {18, 3489}, {19, 3453}, {20, 3507},
    {21, 3534}, {22, 3561}, {23, 3528}, {24, 3582}, {25, 3615},
    {26, 3648}, {27, 3621}, {28, 3674}, {29, 3702}, {30, 3735},
}};

} // namespace

const std::array<PricePoint, kEthUsdHistoryLength>& eth_usd_history() {
    return kEthUsdHistory;
}

std::vector<PricePoint> default_series() {
    return std::vector<PricePoint>(kEthUsdHistory.begin(), kEthUsdHistory.end());
}

AugurStatus validate_series(const PricePoint* points, size_t count) {
    if (!points || count < 2) return AUGUR_ERR_INVALID;
    for (size_t i = 1; i < count; ++i) {
        if (points[i].time_index <= points[i - 1].time_index) return AUGUR_ERR_INVALID;
    }
    return AUGUR_OK;
}

} // namespace augur::forecast
