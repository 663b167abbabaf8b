/**
 * @file distributions.cpp
 * @brief Implementation of distribution functions and the Student-t fit.
 *
 * Incomplete beta and gamma functions use the continued-fraction
 * (modified Lentz) and series evaluations from Numerical Recipes.
 */

#include "stats/distributions.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace riskcore
{
    namespace stats
    {

        namespace
        {
            constexpr double PI = 3.14159265358979323846;
            constexpr double EPS = 1e-14;
            constexpr double FPMIN = 1e-300;
            constexpr int MAX_ITER = 500;

            constexpr double MIN_DF = 0.5;
            constexpr double MAX_DF = 1000.0;

            double guard(double v)
            {
                return std::fabs(v) < FPMIN ? FPMIN : v;
            }

            /**
             * @brief Continued fraction for the incomplete beta function.
             */
            double beta_continued_fraction(double a, double b, double x)
            {
                const double qab = a + b;
                const double qap = a + 1.0;
                const double qam = a - 1.0;

                double c = 1.0;
                double d = 1.0 / guard(1.0 - qab * x / qap);
                double h = d;

                for (int m = 1; m <= MAX_ITER; ++m)
                {
                    const double md = static_cast<double>(m);
                    const double m2 = 2.0 * md;

                    double aa = md * (b - md) * x / ((qam + m2) * (a + m2));
                    d = 1.0 / guard(1.0 + aa * d);
                    c = guard(1.0 + aa / c);
                    h *= d * c;

                    aa = -(a + md) * (qab + md) * x / ((a + m2) * (qap + m2));
                    d = 1.0 / guard(1.0 + aa * d);
                    c = guard(1.0 + aa / c);
                    double del = d * c;
                    h *= del;

                    if (std::fabs(del - 1.0) < EPS)
                    {
                        break;
                    }
                }
                return h;
            }

            /**
             * @brief EM estimate of location and scale for a fixed df.
             */
            void fit_location_scale(const std::vector<double> &values, double df,
                                    double &loc, double &scale)
            {
                const double n = static_cast<double>(values.size());

                double mu = std::accumulate(values.begin(), values.end(), 0.0) / n;
                double sigma2 = 0.0;
                for (double x : values)
                {
                    sigma2 += (x - mu) * (x - mu);
                }
                sigma2 /= n;

                for (int iter = 0; iter < MAX_ITER && sigma2 > 0.0; ++iter)
                {
                    double sum_w = 0.0;
                    double sum_wx = 0.0;
                    for (double x : values)
                    {
                        double z2 = (x - mu) * (x - mu) / sigma2;
                        double w = (df + 1.0) / (df + z2);
                        sum_w += w;
                        sum_wx += w * x;
                    }
                    double mu_new = sum_wx / sum_w;

                    double sigma2_new = 0.0;
                    for (double x : values)
                    {
                        double z2 = (x - mu) * (x - mu) / sigma2;
                        double w = (df + 1.0) / (df + z2);
                        sigma2_new += w * (x - mu_new) * (x - mu_new);
                    }
                    sigma2_new /= n;

                    bool converged = std::fabs(mu_new - mu) <= 1e-12 * (1.0 + std::fabs(mu)) &&
                                     std::fabs(sigma2_new - sigma2) <= 1e-10 * sigma2;
                    mu = mu_new;
                    sigma2 = sigma2_new;
                    if (converged)
                    {
                        break;
                    }
                }

                loc = mu;
                scale = std::sqrt(std::max(sigma2, 0.0));
            }

            double profile_log_likelihood(const std::vector<double> &values, double df,
                                          double &loc, double &scale)
            {
                fit_location_scale(values, df, loc, scale);
                return student_t_log_likelihood(values, df, loc, scale);
            }
        } // anonymous namespace

        // ===================================================================
        // Normal
        // ===================================================================

        double normal_pdf(double x)
        {
            static const double INV_SQRT_2PI = 0.3989422804014327;
            return INV_SQRT_2PI * std::exp(-0.5 * x * x);
        }

        double normal_cdf(double x)
        {
            return 0.5 * std::erfc(-x / std::sqrt(2.0));
        }

        double inverse_normal_cdf(double p)
        {
            if (!(p > 0.0 && p < 1.0))
            {
                throw InvalidParameterError(
                    "Probability must be in (0, 1), got: " + std::to_string(p));
            }

            // Acklam's rational approximation
            static const double a[] = {
                -3.969683028665376e+01, 2.209460984245205e+02,
                -2.759285104469687e+02, 1.383577518672690e+02,
                -3.066479806614716e+01, 2.506628277459239e+00};
            static const double b[] = {
                -5.447609879822406e+01, 1.615858368580409e+02,
                -1.556989798598866e+02, 6.680131188771972e+01,
                -1.328068155288572e+01};
            static const double c[] = {
                -7.784894002430293e-03, -3.223964580411365e-01,
                -2.400758277161838e+00, -2.549732539343734e+00,
                4.374664141464968e+00, 2.938163982698783e+00};
            static const double d[] = {
                7.784695709041462e-03, 3.224671290700398e-01,
                2.445134137142996e+00, 3.754408661907416e+00};

            static const double P_LOW = 0.02425;
            static const double P_HIGH = 1.0 - P_LOW;

            double x;
            if (p < P_LOW)
            {
                double q = std::sqrt(-2.0 * std::log(p));
                x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) / ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
            }
            else if (p <= P_HIGH)
            {
                double q = p - 0.5;
                double r = q * q;
                x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q / (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
            }
            else
            {
                double q = std::sqrt(-2.0 * std::log(1.0 - p));
                x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) / ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
            }

            // One Halley step brings the result to full double precision
            double e = normal_cdf(x) - p;
            double u = e * std::sqrt(2.0 * PI) * std::exp(0.5 * x * x);
            x = x - u / (1.0 + 0.5 * x * u);

            return x;
        }

        // ===================================================================
        // Student-t
        // ===================================================================

        double student_t_pdf(double x, double df)
        {
            double log_norm = std::lgamma(0.5 * (df + 1.0)) - std::lgamma(0.5 * df) - 0.5 * std::log(df * PI);
            return std::exp(log_norm - 0.5 * (df + 1.0) * std::log1p(x * x / df));
        }

        double student_t_cdf(double x, double df)
        {
            double xb = df / (df + x * x);
            double tail = 0.5 * regularized_incomplete_beta(0.5 * df, 0.5, xb);
            return x >= 0.0 ? 1.0 - tail : tail;
        }

        double student_t_quantile(double p, double df)
        {
            if (!(p > 0.0 && p < 1.0))
            {
                throw InvalidParameterError(
                    "Probability must be in (0, 1), got: " + std::to_string(p));
            }
            if (!(df > 0.0))
            {
                throw InvalidParameterError(
                    "Expected positive value for parameter 'df', got: " + std::to_string(df));
            }

            if (p == 0.5)
            {
                return 0.0;
            }
            if (p < 0.5)
            {
                return -student_t_quantile(1.0 - p, df);
            }

            // Bracket the root on the positive half-line
            double lo = 0.0;
            double hi = std::max(1.0, inverse_normal_cdf(p));
            for (int i = 0; i < 2000 && student_t_cdf(hi, df) < p; ++i)
            {
                lo = hi;
                hi *= 2.0;
            }

            double x = std::min(std::max(inverse_normal_cdf(p), lo), hi);
            if (x <= lo || x >= hi)
            {
                x = 0.5 * (lo + hi);
            }

            for (int iter = 0; iter < MAX_ITER; ++iter)
            {
                double f = student_t_cdf(x, df) - p;
                if (f == 0.0)
                {
                    break;
                }
                if (f < 0.0)
                {
                    lo = x;
                }
                else
                {
                    hi = x;
                }

                double slope = student_t_pdf(x, df);
                double next = slope > 0.0 ? x - f / slope : 0.5 * (lo + hi);
                if (!std::isfinite(next) || next <= lo || next >= hi)
                {
                    next = 0.5 * (lo + hi);
                }
                if (std::fabs(next - x) <= 1e-13 * (1.0 + std::fabs(x)))
                {
                    x = next;
                    break;
                }
                x = next;
            }

            return x;
        }

        double student_t_log_likelihood(const std::vector<double> &values,
                                        double df, double loc, double scale)
        {
            if (!(scale > 0.0))
            {
                return -std::numeric_limits<double>::infinity();
            }
            double log_norm = std::lgamma(0.5 * (df + 1.0)) - std::lgamma(0.5 * df) - 0.5 * std::log(df * PI) - std::log(scale);
            double ll = 0.0;
            for (double x : values)
            {
                double z = (x - loc) / scale;
                ll += log_norm - 0.5 * (df + 1.0) * std::log1p(z * z / df);
            }
            return ll;
        }

        StudentTFit fit_student_t(const std::vector<double> &values)
        {
            if (values.size() < 2)
            {
                throw InsufficientDataError(
                    "Student-t fit needs at least 2 observations, got: " + std::to_string(values.size()));
            }

            double loc = 0.0;
            double scale = 0.0;
            fit_location_scale(values, MAX_DF, loc, scale);
            if (!(scale > 0.0))
            {
                return StudentTFit{MAX_DF, loc, 0.0};
            }

            // Coarse grid in log(df)
            const int GRID = 40;
            const double log_lo = std::log(MIN_DF);
            const double log_hi = std::log(MAX_DF);
            const double step = (log_hi - log_lo) / static_cast<double>(GRID - 1);

            int best = 0;
            double best_ll = -std::numeric_limits<double>::infinity();
            for (int i = 0; i < GRID; ++i)
            {
                double df = std::exp(log_lo + step * static_cast<double>(i));
                double l, s;
                double ll = profile_log_likelihood(values, df, l, s);
                if (ll > best_ll)
                {
                    best_ll = ll;
                    best = i;
                }
            }

            // Golden-section refinement around the best grid point
            const double INV_PHI = 0.6180339887498949;
            double a = log_lo + step * static_cast<double>(std::max(best - 1, 0));
            double b = log_lo + step * static_cast<double>(std::min(best + 1, GRID - 1));
            double c = b - INV_PHI * (b - a);
            double d = a + INV_PHI * (b - a);
            double lc, sc, ld, sd;
            double fc = profile_log_likelihood(values, std::exp(c), lc, sc);
            double fd = profile_log_likelihood(values, std::exp(d), ld, sd);

            for (int iter = 0; iter < 60 && (b - a) > 1e-6; ++iter)
            {
                if (fc > fd)
                {
                    b = d;
                    d = c;
                    fd = fc;
                    c = b - INV_PHI * (b - a);
                    fc = profile_log_likelihood(values, std::exp(c), lc, sc);
                }
                else
                {
                    a = c;
                    c = d;
                    fc = fd;
                    d = a + INV_PHI * (b - a);
                    fd = profile_log_likelihood(values, std::exp(d), ld, sd);
                }
            }

            double df = std::exp(0.5 * (a + b));
            double ll = profile_log_likelihood(values, df, loc, scale);

            double grid_df = std::exp(log_lo + step * static_cast<double>(best));
            if (best_ll > ll)
            {
                df = grid_df;
                profile_log_likelihood(values, df, loc, scale);
            }

            return StudentTFit{df, loc, scale};
        }

        // ===================================================================
        // Gamma / chi-squared
        // ===================================================================

        double regularized_incomplete_beta(double a, double b, double x)
        {
            if (x <= 0.0)
            {
                return 0.0;
            }
            if (x >= 1.0)
            {
                return 1.0;
            }

            double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) + a * std::log(x) + b * std::log1p(-x);
            double front = std::exp(log_front);

            if (x < (a + 1.0) / (a + b + 2.0))
            {
                return front * beta_continued_fraction(a, b, x) / a;
            }
            return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
        }

        double regularized_lower_gamma(double a, double x)
        {
            if (x <= 0.0)
            {
                return 0.0;
            }

            double log_front = -x + a * std::log(x) - std::lgamma(a);

            if (x < a + 1.0)
            {
                // Series representation
                double ap = a;
                double del = 1.0 / a;
                double sum = del;
                for (int n = 0; n < MAX_ITER; ++n)
                {
                    ap += 1.0;
                    del *= x / ap;
                    sum += del;
                    if (std::fabs(del) < std::fabs(sum) * EPS)
                    {
                        break;
                    }
                }
                return std::min(1.0, sum * std::exp(log_front));
            }

            // Continued fraction for the upper tail
            double bcf = x + 1.0 - a;
            double c = 1.0 / FPMIN;
            double d = 1.0 / bcf;
            double h = d;
            for (int i = 1; i <= MAX_ITER; ++i)
            {
                double an = -static_cast<double>(i) * (static_cast<double>(i) - a);
                bcf += 2.0;
                d = 1.0 / guard(an * d + bcf);
                c = guard(bcf + an / c);
                double del = d * c;
                h *= del;
                if (std::fabs(del - 1.0) < EPS)
                {
                    break;
                }
            }
            return std::max(0.0, 1.0 - std::exp(log_front) * h);
        }

        double chi_squared_cdf(double x, double k)
        {
            if (x <= 0.0)
            {
                return 0.0;
            }
            return regularized_lower_gamma(0.5 * k, 0.5 * x);
        }

    } // namespace stats
} // namespace riskcore
