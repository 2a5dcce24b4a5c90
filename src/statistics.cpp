#include "lir/statistics.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>
#include <stdexcept>
#include <string>

namespace lir {

namespace {

constexpr double EPS = 1e-15;
constexpr double FPMIN = std::numeric_limits<double>::min() / EPS;
constexpr int MAX_ITERATIONS = 2000;

void require_probability(double p, const char* name) {
    if (!(p > 0.0 && p < 1.0)) {
        throw std::invalid_argument(std::string(name) + " must be in (0, 1), got " + std::to_string(p));
    }
}

// Série de P(a, x), valable pour x < a + 1
double gamma_p_series(double a, double x) {
    double ap = a;
    double del = 1.0 / a;
    double sum = del;
    for (int n = 0; n < MAX_ITERATIONS; ++n) {
        ap += 1.0;
        del *= x / ap;
        sum += del;
        if (std::fabs(del) < std::fabs(sum) * EPS) break;
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

// Fraction continue de Q(a, x) (Lentz), valable pour x >= a + 1
double gamma_q_fraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / FPMIN;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= MAX_ITERATIONS; ++i) {
        const double an = -i * (i - a);
        b += 2.0;
        d = an * d + b;
        if (std::fabs(d) < FPMIN) d = FPMIN;
        c = b + an / c;
        if (std::fabs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::fabs(del - 1.0) < EPS) break;
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}

// Q(a, x) = 1 - P(a, x), gamma incomplète régularisée supérieure
double gamma_q(double a, double x) {
    if (x <= 0.0) return 1.0;
    if (x < a + 1.0) return 1.0 - gamma_p_series(a, x);
    return gamma_q_fraction(a, x);
}

double beta_fraction(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::fabs(d) < FPMIN) d = FPMIN;
    d = 1.0 / d;
    double h = d;
    for (int m = 1; m <= MAX_ITERATIONS; ++m) {
        const int m2 = 2 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::fabs(d) < FPMIN) d = FPMIN;
        c = 1.0 + aa / c;
        if (std::fabs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        h *= d * c;
        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::fabs(d) < FPMIN) d = FPMIN;
        c = 1.0 + aa / c;
        if (std::fabs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::fabs(del - 1.0) < EPS) break;
    }
    return h;
}

// I_x(a, b), bêta incomplète régularisée
double incomplete_beta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;
    const double bt = std::exp(std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                               a * std::log(x) + b * std::log(1.0 - x));
    if (x < (a + 1.0) / (a + b + 2.0)) return bt * beta_fraction(a, b, x) / a;
    return 1.0 - bt * beta_fraction(b, a, 1.0 - x) / b;
}

double student_t_cdf(double t, double df) {
    const double tail = 0.5 * incomplete_beta(df / 2.0, 0.5, df / (df + t * t));
    return t > 0.0 ? 1.0 - tail : tail;
}

double sample_mean(std::span<const double> data) {
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double sample_std(std::span<const double> data, double mean) {
    if (data.size() < 2) return 0.0;
    double sq = 0.0;
    for (double x : data) sq += (x - mean) * (x - mean);
    return std::sqrt(sq / static_cast<double>(data.size() - 1));
}

double skewness(std::span<const double> data, double mean, double sd) {
    const double n = static_cast<double>(data.size());
    if (data.size() < 3 || sd == 0.0) return 0.0;
    double sum_cubed = 0.0;
    for (double x : data) sum_cubed += std::pow(x - mean, 3);
    return n / ((n - 1.0) * (n - 2.0)) * sum_cubed / std::pow(sd, 3);
}

double excess_kurtosis(std::span<const double> data, double mean, double sd) {
    const double n = static_cast<double>(data.size());
    if (data.size() < 4 || sd == 0.0) return 0.0;
    double sum_fourth = 0.0;
    for (double x : data) sum_fourth += std::pow(x - mean, 4);
    const double term1 = n * (n + 1.0) / ((n - 1.0) * (n - 2.0) * (n - 3.0));
    const double term3 = 3.0 * (n - 1.0) * (n - 1.0) / ((n - 2.0) * (n - 3.0));
    return term1 * sum_fourth / std::pow(sd, 4) - term3;
}

} // namespace

double normal_quantile(double p) {
    require_probability(p, "p");

    // Approximation rationnelle d'Acklam, affinée par un pas de Halley
    static constexpr double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
                                   1.383577518672690e+02, -3.066479806614716e+01, 2.506628277459239e+00};
    static constexpr double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
                                   6.680131188771972e+01, -1.328068155288572e+01};
    static constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                                   -2.549671010331892e+00, 4.374664141464968e+00, 2.938163982698783e+00};
    static constexpr double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
                                   3.754408661907416e+00};
    constexpr double P_LOW = 0.02425;

    double x;
    if (p < P_LOW) {
        const double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (p <= 1.0 - P_LOW) {
        const double q = p - 0.5;
        const double r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        const double q = std::sqrt(-2.0 * std::log(1.0 - p));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    const double e = 0.5 * std::erfc(-x / std::numbers::sqrt2) - p;
    const double u = e * std::sqrt(2.0 * std::numbers::pi) * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

double student_t_quantile(double p, double df) {
    require_probability(p, "p");
    if (df <= 0.0) {
        throw std::invalid_argument("degrees of freedom must be positive");
    }
    if (p == 0.5) return 0.0;
    if (p < 0.5) return -student_t_quantile(1.0 - p, df);

    // Dichotomie sur la fonction de répartition
    double lo = 0.0;
    double hi = 1.0;
    while (student_t_cdf(hi, df) < p) {
        lo = hi;
        hi *= 2.0;
    }
    for (int i = 0; i < 200 && hi - lo > 1e-12 * hi; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (student_t_cdf(mid, df) < p) lo = mid;
        else hi = mid;
    }
    return 0.5 * (lo + hi);
}

double chi_square_survival(double x, double df) {
    if (df <= 0.0) {
        throw std::invalid_argument("degrees of freedom must be positive");
    }
    return gamma_q(df / 2.0, x / 2.0);
}

std::pair<double, double> pearson_chi_square(std::span<const double> observed,
                                             std::span<const double> expected) {
    if (observed.size() != expected.size() || observed.size() < 2) {
        throw std::invalid_argument("chi-square test needs at least two aligned categories");
    }
    double statistic = 0.0;
    for (size_t i = 0; i < observed.size(); ++i) {
        if (expected[i] <= 0.0) {
            throw std::invalid_argument("expected frequencies must be positive");
        }
        const double diff = observed[i] - expected[i];
        statistic += diff * diff / expected[i];
    }
    const double df = static_cast<double>(observed.size() - 1);
    return {statistic, chi_square_survival(statistic, df)};
}

ConfidenceInterval wilson_confidence_interval(int successes, int total, double level) {
    if (total <= 0) {
        throw std::invalid_argument("total must be positive");
    }
    if (successes < 0 || successes > total) {
        throw std::invalid_argument("successes must be between 0 and total");
    }
    require_probability(level, "confidence level");

    const double n = static_cast<double>(total);
    const double p_hat = successes / n;
    const double z = normal_quantile((1.0 + level) / 2.0);
    const double z2 = z * z;

    const double denominator = 1.0 + z2 / n;
    const double center = (p_hat + z2 / (2.0 * n)) / denominator;
    const double margin = z * std::sqrt((p_hat * (1.0 - p_hat) + z2 / (4.0 * n)) / n) / denominator;

    // Bornes exactes aux extrémités
    const double lower = successes == 0 ? 0.0 : std::max(0.0, center - margin);
    const double upper = successes == total ? 1.0 : std::min(1.0, center + margin);
    return {lower, upper, level};
}

ConfidenceInterval mean_confidence_interval(std::span<const double> data, double level) {
    require_probability(level, "confidence level");
    if (data.size() < 2) {
        const double value = data.empty() ? 0.0 : data.front();
        return {value, value, level};
    }
    const double n = static_cast<double>(data.size());
    const double mean = sample_mean(data);
    const double t = student_t_quantile(1.0 - (1.0 - level) / 2.0, n - 1.0);
    const double margin = t * sample_std(data, mean) / std::sqrt(n);
    return {mean - margin, mean + margin, level};
}

std::map<int, double> calculate_percentiles(std::span<const double> data, const std::vector<int>& percentiles) {
    std::map<int, double> result;
    std::vector<double> sorted(data.begin(), data.end());
    std::sort(sorted.begin(), sorted.end());

    for (int p : percentiles) {
        if (p < 0 || p > 100) {
            throw std::invalid_argument("percentile must be in [0, 100], got " + std::to_string(p));
        }
        if (sorted.empty()) {
            result[p] = 0.0;
            continue;
        }
        const double pos = p / 100.0 * static_cast<double>(sorted.size() - 1);
        const size_t lo = static_cast<size_t>(std::floor(pos));
        const size_t hi = static_cast<size_t>(std::ceil(pos));
        result[p] = sorted[lo] + (pos - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
    }
    return result;
}

DistributionStats calculate_distribution_stats(std::span<const double> data, const std::vector<int>& percentiles) {
    if (data.empty()) {
        throw std::invalid_argument("Cannot calculate distribution statistics for empty data");
    }

    DistributionStats stats;
    stats.mean = sample_mean(data);
    stats.std_dev = sample_std(data, stats.mean);
    stats.variance = stats.std_dev * stats.std_dev;
    stats.skewness = skewness(data, stats.mean, stats.std_dev);
    stats.kurtosis = excess_kurtosis(data, stats.mean, stats.std_dev);

    const auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
    stats.min = *min_it;
    stats.max = *max_it;

    stats.percentiles = calculate_percentiles(data, percentiles);
    const auto quartiles = calculate_percentiles(data, {25, 75});
    stats.iqr = quartiles.at(75) - quartiles.at(25);
    return stats;
}

RiskMetrics calculate_risk_metrics(std::span<const SessionResult> results) {
    RiskMetrics metrics;
    if (results.empty()) return metrics;

    const double n = static_cast<double>(results.size());
    const double starting = results.front().starting_bankroll;

    int losses = 0;
    int half_losses = 0;
    int ruins = 0;
    std::vector<double> drawdowns;
    drawdowns.reserve(results.size());
    for (const auto& r : results) {
        if (r.session_profit < 0.0) ++losses;
        if (starting > 0.0 && r.session_profit <= -0.5 * starting) ++half_losses;
        if (starting > 0.0 && r.session_profit <= -starting) ++ruins;
        drawdowns.push_back(r.max_drawdown);
    }

    metrics.prob_any_loss = losses / n;
    metrics.prob_loss_50pct = half_losses / n;
    metrics.prob_loss_100pct = ruins / n;
    metrics.max_drawdown_mean = sample_mean(drawdowns);
    metrics.max_drawdown_std = sample_std(drawdowns, metrics.max_drawdown_mean);
    return metrics;
}

DetailedStatistics calculate_statistics(const AggregateStatistics& aggregate,
                                        std::span<const SessionResult> results,
                                        double confidence_level) {
    if (aggregate.total_sessions <= 0) {
        throw std::invalid_argument("Cannot calculate statistics with zero sessions");
    }
    if (aggregate.session_profits.empty()) {
        throw std::invalid_argument("No session profit data available for statistics calculation");
    }

    DetailedStatistics detailed;
    detailed.session_win_rate = aggregate.session_win_rate;
    detailed.session_win_rate_ci =
        wilson_confidence_interval(aggregate.winning_sessions, aggregate.total_sessions, confidence_level);
    detailed.ev_per_hand = aggregate.expected_value_per_hand;
    detailed.session_profit_distribution = calculate_distribution_stats(aggregate.session_profits);
    detailed.main_game_ev = aggregate.main_ev_per_hand;
    detailed.bonus_ev = aggregate.bonus_ev_per_hand;
    detailed.total_sessions = aggregate.total_sessions;
    detailed.total_hands = aggregate.total_hands;

    if (!results.empty()) {
        std::vector<double> per_session_ev;
        per_session_ev.reserve(results.size());
        for (const auto& r : results) {
            per_session_ev.push_back(r.hands_played > 0 ? r.session_profit / r.hands_played : 0.0);
        }
        detailed.ev_per_hand_ci = mean_confidence_interval(per_session_ev, confidence_level);
        detailed.risk_metrics = calculate_risk_metrics(results);
    } else {
        // Profit de session ramené au nombre moyen de mains
        ConfidenceInterval ci = mean_confidence_interval(aggregate.session_profits, confidence_level);
        const double avg_hands = static_cast<double>(aggregate.total_hands) / aggregate.total_sessions;
        if (avg_hands > 0.0) {
            ci.lower /= avg_hands;
            ci.upper /= avg_hands;
        }
        detailed.ev_per_hand_ci = ci;

        const auto losses = std::count_if(aggregate.session_profits.begin(), aggregate.session_profits.end(),
                                          [](double p) { return p < 0.0; });
        detailed.risk_metrics.prob_any_loss =
            static_cast<double>(losses) / static_cast<double>(aggregate.session_profits.size());
    }
    return detailed;
}

DetailedStatistics calculate_statistics_from_results(std::span<const SessionResult> results,
                                                     double confidence_level) {
    if (results.empty()) {
        throw std::invalid_argument("Cannot calculate statistics from empty results list");
    }
    return calculate_statistics(aggregate_results(results), results, confidence_level);
}

} // namespace lir
