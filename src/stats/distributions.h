/**
 * @file distributions.h
 * @brief DagStat v1.0 - Distribution Functions
 *
 * Scalar CDFs and quantiles needed for inference on regression
 * coefficients:
 *   - Standard normal: cdf, quantile (Acklam rational approximation)
 *   - Student t: cdf, pdf, quantile (Newton refinement)
 *   - F: cdf
 *
 * The incomplete beta function uses the Lentz continued fraction
 * (Numerical Recipes, 6.4).
 */
#ifndef DAGSTAT_DISTRIBUTIONS_H
#define DAGSTAT_DISTRIBUTIONS_H

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace dagstat {
namespace stats {

inline double beta_cf(double a, double b, double x) {
    const int max_iter = 200;
    const double eps = 1e-12;
    const double fpmin = 1e-300;

    double qab = a + b, qap = a + 1.0, qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < fpmin) d = fpmin;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= max_iter; ++m) {
        int m2 = 2 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < eps) break;
    }
    return h;
}

// Regularized incomplete beta I_x(a, b)
inline double beta_inc(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;
    double bt = std::exp(std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                         a * std::log(x) + b * std::log(1.0 - x));
    if (x < (a + 1.0) / (a + b + 2.0)) return bt * beta_cf(a, b, x) / a;
    return 1.0 - bt * beta_cf(b, a, 1.0 - x) / b;
}

inline double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

inline double normal_quantile(double p) {
    if (p <= 0.0) return -INFINITY;
    if (p >= 1.0) return INFINITY;

    const double a1 = -39.6968302866538, a2 = 220.946098424521, a3 = -275.928510446969;
    const double a4 = 138.357751867269, a5 = -30.6647980661472, a6 = 2.50662827745924;
    const double b1 = -54.4760987982241, b2 = 161.585836858041, b3 = -155.698979859887;
    const double b4 = 66.8013118877197, b5 = -13.2806815528857;
    const double c1 = -7.78489400243029e-03, c2 = -0.322396458041136, c3 = -2.40075827716184;
    const double c4 = -2.54973253934373, c5 = 4.37466414146497, c6 = 2.93816398269878;
    const double d1 = 7.78469570904146e-03, d2 = 0.32246712907004, d3 = 2.445134137143;
    const double d4 = 3.75440866190742;
    const double p_low = 0.02425, p_high = 1 - 0.02425;

    double q, r;
    if (p < p_low) {
        q = std::sqrt(-2 * std::log(p));
        return (((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
               ((((d1 * q + d2) * q + d3) * q + d4) * q + 1);
    } else if (p <= p_high) {
        q = p - 0.5;
        r = q * q;
        return (((((a1 * r + a2) * r + a3) * r + a4) * r + a5) * r + a6) * q /
               (((((b1 * r + b2) * r + b3) * r + b4) * r + b5) * r + 1);
    }
    q = std::sqrt(-2 * std::log(1 - p));
    return -(((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
            ((((d1 * q + d2) * q + d3) * q + d4) * q + 1);
}

inline double t_pdf(double t, int df) {
    double v = static_cast<double>(df);
    return std::exp(std::lgamma((v + 1.0) / 2.0) - std::lgamma(v / 2.0)) /
           std::sqrt(v * M_PI) * std::pow(1.0 + t * t / v, -(v + 1.0) / 2.0);
}

inline double t_cdf(double t, int df) {
    if (df <= 0) return normal_cdf(t);
    double v = static_cast<double>(df);
    double x = v / (v + t * t);
    double tail = 0.5 * beta_inc(v / 2.0, 0.5, x);
    return t >= 0 ? 1.0 - tail : tail;
}

inline double t_quantile(double p, int df) {
    double t = normal_quantile(p);
    if (df <= 0 || !std::isfinite(t)) return t;
    for (int i = 0; i < 20; ++i) {
        double pdf = t_pdf(t, df);
        if (pdf < 1e-300) break;
        double delta = (t_cdf(t, df) - p) / pdf;
        t -= delta;
        if (std::abs(delta) < 1e-12) break;
    }
    return t;
}

inline double f_cdf(double f, int df1, int df2) {
    if (f <= 0.0) return 0.0;
    double x = df1 * f / (df1 * f + df2);
    return beta_inc(df1 / 2.0, df2 / 2.0, x);
}

// Two-sided p-value for a t statistic
inline double t_two_sided_pvalue(double t, int df) {
    double tail = std::min(t_cdf(-std::abs(t), df), 0.5);
    return std::min(1.0, 2.0 * tail);
}

} // namespace stats
} // namespace dagstat

#endif // DAGSTAT_DISTRIBUTIONS_H
