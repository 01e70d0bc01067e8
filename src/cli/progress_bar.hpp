#pragma once

#include <string>
#include <cstddef>
#include <core/constants.hpp>

// Text progress bar: "{desc}: {pct}%|{bar}| {n}/{total} [{postfix}]".
// Rendering only; the owner decides where and when to draw it.
class ProgressBar {
public:
    ProgressBar(std::string desc, size_t total, int width = DEFAULT_BAR_WIDTH);

    // Advance by delta, clamped to total.
    void update(size_t delta);
    void set_postfix(const std::string& postfix) { postfix_ = postfix; }
    void close() { closed_ = true; }

    const std::string& desc() const { return desc_; }
    size_t n() const { return n_; }
    size_t total() const { return total_; }
    bool closed() const { return closed_; }

    std::string render() const;

private:
    std::string desc_;
    size_t total_;
    size_t n_ = 0;
    int width_;
    std::string postfix_;
    bool closed_ = false;
};
