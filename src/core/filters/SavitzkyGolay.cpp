#include "SavitzkyGolay.hpp"
#include <stdexcept>

namespace filters {

SavitzkyGolay::SavitzkyGolay(int window, int polyorder)
    : window_(window), polyorder_(polyorder), half_(window / 2) {
  if (window_ < 1 || window_ % 2 == 0)
    throw std::invalid_argument("savgol window must be a positive odd integer");
  if (polyorder_ < 0 || polyorder_ >= window_)
    throw std::invalid_argument("savgol polyorder must be less than window");

  // Row 0 of the least-squares pseudo-inverse gives the constant term of the
  // fitted polynomial, i.e. its value at the window centre.
  Eigen::MatrixXd V = vandermonde(static_cast<double>(half_));
  Eigen::MatrixXd pinv = V.colPivHouseholderQr().solve(
      Eigen::MatrixXd::Identity(window_, window_));
  kernel_ = pinv.row(0);
}

Eigen::MatrixXd SavitzkyGolay::vandermonde(double centre) const {
  Eigen::MatrixXd V(window_, polyorder_ + 1);
  for (int n = 0; n < window_; ++n) {
    const double x = n - centre;
    double p = 1.0;
    for (int k = 0; k <= polyorder_; ++k) {
      V(n, k) = p;
      p *= x;
    }
  }
  return V;
}

// Fit one polynomial to y[first, first+window) and evaluate it on
// [eval_from, eval_to).
void SavitzkyGolay::fit_edge(const std::vector<double> &y, std::size_t first,
                             std::size_t eval_from, std::size_t eval_to,
                             std::vector<double> &out) const {
  Eigen::MatrixXd V = vandermonde(0.0);
  Eigen::VectorXd rhs(window_);
  for (int n = 0; n < window_; ++n)
    rhs(n) = y[first + n];
  Eigen::VectorXd coeffs = V.colPivHouseholderQr().solve(rhs);

  for (std::size_t i = eval_from; i < eval_to; ++i) {
    const double x = static_cast<double>(i - first);
    double acc = 0.0, p = 1.0;
    for (int k = 0; k <= polyorder_; ++k) {
      acc += coeffs(k) * p;
      p *= x;
    }
    out[i] = acc;
  }
}

std::vector<double> SavitzkyGolay::apply(const std::vector<double> &y) const {
  const std::size_t n = y.size();
  const std::size_t w = static_cast<std::size_t>(window_);
  if (n < w)
    return y;

  std::vector<double> out(n);
  const std::size_t h = static_cast<std::size_t>(half_);
  for (std::size_t i = h; i + h < n; ++i) {
    double acc = 0.0;
    for (std::size_t k = 0; k < w; ++k)
      acc += kernel_(static_cast<Eigen::Index>(k)) * y[i - h + k];
    out[i] = acc;
  }
  if (h > 0) {
    fit_edge(y, 0, 0, h, out);
    fit_edge(y, n - w, n - h, n, out);
  }
  return out;
}

} // namespace filters
