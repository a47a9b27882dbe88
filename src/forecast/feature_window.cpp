#include "forecast/feature_window.hpp"

#include <stdexcept>

namespace boiler_twin::forecast {

FeatureWindow::FeatureWindow(const std::size_t length, const FeatureRow& fill) : rows_(length, fill) {
  if (length == 0) {
    throw std::invalid_argument("feature window length must be greater than 0");
  }
}

void FeatureWindow::slide(const FeatureRow& row) noexcept {
  rows_[head_] = row;
  head_ = (head_ + 1) % rows_.size();
}

std::size_t FeatureWindow::length() const noexcept { return rows_.size(); }

const FeatureRow& FeatureWindow::row(const std::size_t index) const noexcept {
  return rows_[(head_ + index) % rows_.size()];
}

const FeatureRow& FeatureWindow::newest() const noexcept { return row(rows_.size() - 1); }

}  // namespace boiler_twin::forecast
