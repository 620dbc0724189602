#pragma once
#include <Eigen/Dense>
#include <vector>

namespace filters {

// Savitzky-Golay smoothing of a uniformly sampled series.
//
// Interior points take the value of a least-squares polynomial of order
// `polyorder` fitted to the `window` samples centred on them. The first and
// last window/2 samples are evaluated on the polynomial fitted to the first
// (last) full window. Series shorter than one window are returned unchanged.
class SavitzkyGolay {
public:
  SavitzkyGolay(int window = 3, int polyorder = 2);

  std::vector<double> apply(const std::vector<double> &y) const;

  int window() const { return window_; }
  int polyorder() const { return polyorder_; }

private:
  int window_;
  int polyorder_;
  int half_;
  Eigen::RowVectorXd kernel_; // centre-point weights

  // Vandermonde matrix for x = 0..window-1 shifted by `centre`.
  Eigen::MatrixXd vandermonde(double centre) const;
  void fit_edge(const std::vector<double> &y, std::size_t first,
                std::size_t eval_from, std::size_t eval_to,
                std::vector<double> &out) const;
};

} // namespace filters
