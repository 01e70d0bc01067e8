#include "progress_bar.hpp"
#include <fmt/format.h>
#include <algorithm>

// U+2588 FULL BLOCK
static const char* BAR_FILL = "\xe2\x96\x88";

ProgressBar::ProgressBar(std::string desc, size_t total, int width)
    : desc_(std::move(desc)), total_(total), width_(std::max(width, 1)) {}

void ProgressBar::update(size_t delta) {
    n_ = std::min(total_, n_ + delta);
}

std::string ProgressBar::render() const {
    double frac = total_ > 0 ? static_cast<double>(n_) / static_cast<double>(total_) : 0.0;
    int filled = static_cast<int>(frac * width_);

    std::string bar;
    for (int i = 0; i < filled; i++) bar += BAR_FILL;
    bar.append(static_cast<size_t>(width_ - filled), ' ');

    return fmt::format("{}: {:3.0f}%|{}| {}/{} [{}]",
                       desc_, frac * 100.0, bar, n_, total_, postfix_);
}
